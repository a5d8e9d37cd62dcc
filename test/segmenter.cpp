#include <optional>
#include <string_view>
#include <vector>

#include "BoundarySegmenter.hpp"

#include <libassert/assert-gtest.hpp>

using namespace std::literals;

using offsets = std::vector<std::size_t>;

static offsets boundaries(BoundarySegmenter& segmenter, std::string_view text) {
    segmenter.set_text(text);
    offsets result{segmenter.first()};
    while(auto offset = segmenter.next()) {
        result.push_back(*offset);
    }
    return result;
}

TEST(Segmenter, Words) {
    IcuSegmenterFactory factory("en_US");
    auto words = factory.make_word_segmenter();
    offsets hello_world{0, 5, 6, 11};
    ASSERT(boundaries(*words, "hello world") == hello_world);
    offsets fired{0, 5, 6};
    ASSERT(boundaries(*words, "fired.") == fired);
    offsets princip_1914{0, 7, 8, 9, 13};
    ASSERT(boundaries(*words, "Princip, 1914") == princip_1914);
}

TEST(Segmenter, Utf8ByteOffsets) {
    IcuSegmenterFactory factory("en_US");
    auto words = factory.make_word_segmenter();
    // "Café" and "Ödön" are 5 and 6 bytes long
    offsets cafe_odon{0, 5, 6, 12};
    ASSERT(boundaries(*words, "Café Ödön") == cafe_odon);
}

TEST(Segmenter, Sentences) {
    IcuSegmenterFactory factory("en_US");
    auto sentences = factory.make_sentence_segmenter();
    offsets one_two{0, 5, 9};
    ASSERT(boundaries(*sentences, "One. Two.") == one_two);
    offsets is_it{0, 7, 13};
    ASSERT(boundaries(*sentences, "Is it? It is!") == is_it);
}

TEST(Segmenter, Empty) {
    IcuSegmenterFactory factory("en_US");
    auto words = factory.make_word_segmenter();
    offsets only_start{0};
    ASSERT(boundaries(*words, "") == only_start);
    EXPECT(words->is_boundary(0));
    EXPECT(!words->is_boundary(1));
    EXPECT(words->following(0) == std::nullopt);
}

TEST(Segmenter, IsBoundaryKeepsCursor) {
    IcuSegmenterFactory factory("en_US");
    auto words = factory.make_word_segmenter();
    words->set_text("Gavrilo Principe");
    ASSERT(words->first() == 0);
    ASSERT(words->next() == 7);
    EXPECT(!words->is_boundary(15));
    EXPECT(words->is_boundary(16));
    EXPECT(words->is_boundary(8));
    EXPECT(!words->is_boundary(17));
    EXPECT(words->next() == 8);
    EXPECT(words->next() == 16);
    EXPECT(words->next() == std::nullopt);
}

TEST(Segmenter, Following) {
    IcuSegmenterFactory factory("en_US");
    auto words = factory.make_word_segmenter();
    words->set_text("hello world");
    EXPECT(words->following(0) == 5);
    EXPECT(words->following(5) == 6);
    EXPECT(words->following(7) == 11);
    EXPECT(words->following(11) == std::nullopt);
    // the cursor continues from where following left it
    words->following(5);
    EXPECT(words->next() == 11);
}

TEST(Segmenter, IndependentInstances) {
    IcuSegmenterFactory factory("en_US");
    auto a = factory.make_word_segmenter();
    auto b = factory.make_word_segmenter();
    a->set_text("hello world");
    b->set_text("one two three");
    a->first();
    b->first();
    EXPECT(a->next() == 5);
    EXPECT(b->next() == 3);
    EXPECT(a->next() == 6);
}
