#include "DocumentTokenizer.hpp"

#include <libassert/assert.hpp>
#include <spdlog/spdlog.h>

#include "unicode.hpp"

DocumentTokenizer::DocumentTokenizer(const std::string& locale_name)
    : DocumentTokenizer(std::make_shared<IcuSegmenterFactory>(locale_name)) {}

DocumentTokenizer::DocumentTokenizer(std::shared_ptr<const SegmenterFactory> segmenters)
    : segmenters(std::move(segmenters)) {
    ASSERT(this->segmenters != nullptr);
}

Document DocumentTokenizer::parse_document(std::string_view text) const {
    Document document;
    auto sentences = segmenters->make_sentence_segmenter();
    sentences->set_text(text);
    std::size_t first = sentences->first();
    while(auto last = sentences->next()) {
        ASSERT(*last > first, "Sentence boundaries went backwards");
        document.push(parse_sentence(text.substr(first, *last - first)));
        first = *last;
    }
    spdlog::debug("Parsed {} sentences from {} bytes", document.size(), text.size());
    return document;
}

Sentence DocumentTokenizer::parse_sentence(std::string_view text) const {
    Sentence sentence;
    auto words = segmenters->make_word_segmenter();
    words->set_text(text);
    std::size_t first = words->first();
    while(auto last = words->next()) {
        DEBUG_ASSERT(*last > first);
        sentence.push(classify(text.substr(first, *last - first)));
        first = *last;
    }
    return sentence;
}

Token DocumentTokenizer::classify(std::string_view segment) {
    if(starts_with_letter_or_digit(segment)) {
        return Word{std::string(segment)};
    } else {
        return NonWord{std::string(segment)};
    }
}
