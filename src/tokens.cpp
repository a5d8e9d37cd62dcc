#include "tokens.hpp"

std::string Sentence::text() const {
    std::string text;
    for(const auto& token : tokens_) {
        text += token_text(token);
    }
    return text;
}

std::vector<std::reference_wrapper<const Token>> Document::all_words() const {
    std::vector<std::reference_wrapper<const Token>> words;
    for(const auto& sentence : sentences_) {
        for(const auto& token : sentence) {
            if(is_word_like(token)) {
                words.push_back(std::cref(token));
            }
        }
    }
    return words;
}

std::vector<std::string> Document::all_words_as_text() const {
    std::vector<std::string> words;
    for(const auto& token : all_words()) {
        words.push_back(token_text(token));
    }
    return words;
}
