#ifndef PROPERNAMETOKENIZER_HPP
#define PROPERNAMETOKENIZER_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "DocumentTokenizer.hpp"
#include "ProperNameDictionary.hpp"
#include "utils.hpp"

// DocumentTokenizer that collapses dictionary proper names ("Gavrilo Princip") into a
// single ProperWord token. A name only matches when it ends exactly on a word boundary
// and the longest matching name wins.
class ProperNameTokenizer : public DocumentTokenizer {
    ProperNameDictionary names;

public:
    // Uses default_dictionary()
    ProperNameTokenizer();
    explicit ProperNameTokenizer(const string_set& proper_names, const std::string& locale_name = std::string(default_locale));
    ProperNameTokenizer(const string_set& proper_names, std::shared_ptr<const SegmenterFactory> segmenters);

    Sentence parse_sentence(std::string_view text) const override;

    // Longest candidate under key that appears verbatim in sentence at first and ends on a
    // boundary of words, which must be positioned on sentence
    std::optional<std::string_view> match_proper_name(
        std::string_view key,
        std::string_view sentence,
        std::size_t first,
        BoundarySegmenter& words
    ) const;

    const ProperNameDictionary& dictionary() const {
        return names;
    }
};

// Distinct ProperWord texts in the document, sorted
std::vector<std::string> all_proper_names(const Document& document);

#endif
