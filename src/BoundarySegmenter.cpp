#include "BoundarySegmenter.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <spdlog/spdlog.h>
#include <unicode/utypes.h>

namespace {
    void check_icu(UErrorCode status, std::string_view what) {
        if(U_FAILURE(status)) {
            throw std::runtime_error(fmt::format("{} failed: {}", what, u_errorName(status)));
        }
    }

    std::optional<std::size_t> to_offset(int32_t boundary) {
        if(boundary == icu::BreakIterator::DONE) {
            return std::nullopt;
        }
        DEBUG_ASSERT(boundary >= 0);
        return std::size_t(boundary);
    }

    std::unique_ptr<BoundarySegmenter> clone_segmenter(const icu::BreakIterator& prototype) {
        std::unique_ptr<icu::BreakIterator> iterator(prototype.clone());
        if(!iterator) {
            throw std::runtime_error("Failed to clone ICU break iterator");
        }
        return std::make_unique<IcuBoundarySegmenter>(std::move(iterator));
    }
}

IcuBoundarySegmenter::IcuBoundarySegmenter(std::unique_ptr<icu::BreakIterator> iterator)
    : iterator(std::move(iterator)) {
    ASSERT(this->iterator != nullptr);
}

void IcuBoundarySegmenter::set_text(std::string_view str) {
    if(str.size() > std::size_t(std::numeric_limits<int32_t>::max())) {
        throw std::runtime_error(fmt::format("Text of {} bytes is too large to segment", str.size()));
    }
    UErrorCode status = U_ZERO_ERROR;
    // native indices of a UTF-8 UText are byte offsets, which is what all callers work in
    text.adoptInstead(utext_openUTF8(nullptr, str.data(), int64_t(str.size()), &status));
    check_icu(status, "utext_openUTF8");
    iterator->setText(text.getAlias(), status);
    check_icu(status, "BreakIterator::setText");
    length = str.size();
}

std::size_t IcuBoundarySegmenter::first() {
    auto boundary = iterator->first();
    DEBUG_ASSERT(boundary == 0);
    return std::size_t(boundary);
}

std::optional<std::size_t> IcuBoundarySegmenter::next() {
    return to_offset(iterator->next());
}

std::optional<std::size_t> IcuBoundarySegmenter::following(std::size_t offset) {
    if(offset >= length) {
        return std::nullopt;
    }
    return to_offset(iterator->following(int32_t(offset)));
}

bool IcuBoundarySegmenter::is_boundary(std::size_t offset) {
    if(offset > length) {
        return false;
    }
    // isBoundary repositions the iterator, put it back where the caller left it
    auto current = iterator->current();
    bool result = iterator->isBoundary(int32_t(offset));
    iterator->isBoundary(current);
    return result;
}

IcuSegmenterFactory::IcuSegmenterFactory(const std::string& locale_name)
    : locale(icu::Locale::createCanonical(locale_name.c_str())) {
    if(locale.isBogus()) {
        throw std::runtime_error(fmt::format("Invalid locale \"{}\"", locale_name));
    }
    UErrorCode status = U_ZERO_ERROR;
    sentence_prototype.reset(icu::BreakIterator::createSentenceInstance(locale, status));
    check_icu(status, "BreakIterator::createSentenceInstance");
    word_prototype.reset(icu::BreakIterator::createWordInstance(locale, status));
    check_icu(status, "BreakIterator::createWordInstance");
    spdlog::debug("Created ICU break iterators for locale {}", locale.getName());
}

std::unique_ptr<BoundarySegmenter> IcuSegmenterFactory::make_sentence_segmenter() const {
    return clone_segmenter(*sentence_prototype);
}

std::unique_ptr<BoundarySegmenter> IcuSegmenterFactory::make_word_segmenter() const {
    return clone_segmenter(*word_prototype);
}
