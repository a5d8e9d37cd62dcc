#ifndef BOUNDARYSEGMENTER_HPP
#define BOUNDARYSEGMENTER_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/utext.h>

// Forward-only cursor over the boundaries of a text. Offsets are byte offsets into the
// UTF-8 text handed to set_text, consecutive boundaries delimit one segment.
// A segmenter refers to the text it was given, the caller keeps that text alive.
class BoundarySegmenter {
public:
    virtual ~BoundarySegmenter() = default;

    virtual void set_text(std::string_view text) = 0;

    // Moves the cursor to the start of the text and returns that offset (always 0)
    virtual std::size_t first() = 0;

    // Advances to the next boundary, std::nullopt once the end of the text was passed
    virtual std::optional<std::size_t> next() = 0;

    // Moves the cursor to the first boundary strictly after offset
    virtual std::optional<std::size_t> following(std::size_t offset) = 0;

    // Does not move the cursor. Offsets past the end of the text are never boundaries.
    virtual bool is_boundary(std::size_t offset) = 0;
};

// Segmenters carry cursor state, every parse gets fresh ones from a factory
class SegmenterFactory {
public:
    virtual ~SegmenterFactory() = default;

    virtual std::unique_ptr<BoundarySegmenter> make_sentence_segmenter() const = 0;
    virtual std::unique_ptr<BoundarySegmenter> make_word_segmenter() const = 0;
};

class IcuBoundarySegmenter final : public BoundarySegmenter {
    std::unique_ptr<icu::BreakIterator> iterator;
    icu::LocalUTextPointer text;
    std::size_t length = 0;

public:
    IcuBoundarySegmenter(std::unique_ptr<icu::BreakIterator> iterator);

    void set_text(std::string_view str) override;
    std::size_t first() override;
    std::optional<std::size_t> next() override;
    std::optional<std::size_t> following(std::size_t offset) override;
    bool is_boundary(std::size_t offset) override;
};

class IcuSegmenterFactory final : public SegmenterFactory {
    icu::Locale locale;
    std::unique_ptr<icu::BreakIterator> sentence_prototype;
    std::unique_ptr<icu::BreakIterator> word_prototype;

public:
    IcuSegmenterFactory(const std::string& locale_name);

    std::unique_ptr<BoundarySegmenter> make_sentence_segmenter() const override;
    std::unique_ptr<BoundarySegmenter> make_word_segmenter() const override;
};

#endif
