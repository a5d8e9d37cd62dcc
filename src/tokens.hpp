#ifndef TOKENS_HPP
#define TOKENS_HPP

#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

// A run starting with a letter or digit
struct Word {
    std::string text;
    bool operator==(const Word&) const = default;
};

// A dictionary proper name, may span several words and the separators between them
struct ProperWord {
    std::string text;
    bool operator==(const ProperWord&) const = default;
};

// Anything else: punctuation, whitespace, symbols
struct NonWord {
    std::string text;
    bool operator==(const NonWord&) const = default;
};

using Token = std::variant<Word, ProperWord, NonWord>;

inline const std::string& token_text(const Token& token) {
    return std::visit([](const auto& t) -> const std::string& { return t.text; }, token);
}

// Word and ProperWord
inline bool is_word_like(const Token& token) {
    return !std::holds_alternative<NonWord>(token);
}

inline std::string_view token_kind_name(const Token& token) {
    return std::visit([](const auto& t) -> std::string_view {
        using T = std::decay_t<decltype(t)>;
        if constexpr(std::is_same_v<T, Word>) {
            return "word";
        } else if constexpr(std::is_same_v<T, ProperWord>) {
            return "proper-word";
        } else {
            return "non-word";
        }
    }, token);
}

class Sentence {
    std::vector<Token> tokens_;

public:
    Sentence() = default;

    void push(Token token) {
        tokens_.push_back(std::move(token));
    }

    const std::vector<Token>& tokens() const {
        return tokens_;
    }

    auto begin() const {
        return tokens_.begin();
    }

    auto end() const {
        return tokens_.end();
    }

    std::size_t size() const {
        return tokens_.size();
    }

    bool empty() const {
        return tokens_.empty();
    }

    // Concatenated token texts, this is exactly the source text of the sentence
    std::string text() const;
};

class Document {
    std::vector<Sentence> sentences_;

public:
    Document() = default;

    void push(Sentence sentence) {
        sentences_.push_back(std::move(sentence));
    }

    const std::vector<Sentence>& sentences() const {
        return sentences_;
    }

    std::size_t size() const {
        return sentences_.size();
    }

    bool empty() const {
        return sentences_.empty();
    }

    // Every Word and ProperWord token, in document order
    std::vector<std::reference_wrapper<const Token>> all_words() const;

    std::vector<std::string> all_words_as_text() const;
};

template<>
struct fmt::formatter<Token> {
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const Token& token, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}({:?})", token_kind_name(token), token_text(token));
    }
};

#endif
