#ifndef DOCUMENTTOKENIZER_HPP
#define DOCUMENTTOKENIZER_HPP

#include <memory>
#include <string>
#include <string_view>

#include "BoundarySegmenter.hpp"
#include "constants.hpp"
#include "tokens.hpp"

// Splits a document into sentences and each sentence into Word/NonWord tokens.
// Parsing keeps no state between calls, a tokenizer may be shared between threads.
class DocumentTokenizer {
    std::shared_ptr<const SegmenterFactory> segmenters;

public:
    explicit DocumentTokenizer(const std::string& locale_name = std::string(default_locale));
    explicit DocumentTokenizer(std::shared_ptr<const SegmenterFactory> segmenters);
    virtual ~DocumentTokenizer() = default;

    Document parse_document(std::string_view text) const;

    virtual Sentence parse_sentence(std::string_view text) const;

protected:
    const SegmenterFactory& segmenter_factory() const {
        return *segmenters;
    }

    // Word if the segment starts with a letter or digit, NonWord otherwise
    static Token classify(std::string_view segment);
};

#endif
