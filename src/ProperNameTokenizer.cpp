#include "ProperNameTokenizer.hpp"

#include <algorithm>
#include <utility>
#include <variant>

#include <libassert/assert.hpp>
#include <spdlog/spdlog.h>

#include "dictionary_loader.hpp"
#include "unicode.hpp"

ProperNameTokenizer::ProperNameTokenizer() : ProperNameTokenizer(default_dictionary()) {}

ProperNameTokenizer::ProperNameTokenizer(const string_set& proper_names, const std::string& locale_name)
    : DocumentTokenizer(locale_name), names(proper_names) {
    spdlog::debug("Proper name dictionary: {} names under {} keys", names.name_count(), names.key_count());
}

ProperNameTokenizer::ProperNameTokenizer(
    const string_set& proper_names,
    std::shared_ptr<const SegmenterFactory> segmenters
) : DocumentTokenizer(std::move(segmenters)), names(proper_names) {
    spdlog::debug("Proper name dictionary: {} names under {} keys", names.name_count(), names.key_count());
}

std::optional<std::string_view> ProperNameTokenizer::match_proper_name(
    std::string_view key,
    std::string_view sentence,
    std::size_t first,
    BoundarySegmenter& words
) const {
    // a prefix match isn't enough, "Princip" must not match the start of "Principe"
    for(const auto& candidate : names.candidates_for_key(key)) {
        if(sentence.substr(first).starts_with(candidate) && words.is_boundary(first + candidate.size())) {
            return candidate;
        }
    }
    return std::nullopt;
}

Sentence ProperNameTokenizer::parse_sentence(std::string_view text) const {
    Sentence sentence;
    auto words = segmenter_factory().make_word_segmenter();
    words->set_text(text);
    std::size_t first = words->first();
    auto last = words->next();
    while(last) {
        DEBUG_ASSERT(*last > first);
        auto segment = text.substr(first, *last - first);
        std::optional<std::string_view> proper_name;
        // proper names are words, a punctuation or whitespace segment never starts one
        if(starts_with_letter_or_digit(segment) && names.contains_key(segment)) {
            proper_name = match_proper_name(segment, text, first, *words);
        }
        if(proper_name) {
            sentence.push(ProperWord{std::string(*proper_name)});
            // the match ends on a boundary, segments inside it are skipped
            first += proper_name->size();
            last = words->following(first);
        } else {
            sentence.push(classify(segment));
            first = *last;
            last = words->next();
        }
    }
    DEBUG_ASSERT(first == text.size(), "Tokens don't cover the sentence");
    return sentence;
}

std::vector<std::string> all_proper_names(const Document& document) {
    string_set distinct;
    for(const auto& sentence : document.sentences()) {
        for(const auto& token : sentence) {
            if(const auto* proper_word = std::get_if<ProperWord>(&token)) {
                distinct.insert(proper_word->text);
            }
        }
    }
    std::vector<std::string> proper_names(distinct.begin(), distinct.end());
    std::ranges::sort(proper_names);
    return proper_names;
}
