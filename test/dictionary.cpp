#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ProperNameDictionary.hpp"
#include "ProperNameTokenizer.hpp"
#include "dictionary_loader.hpp"

#include <libassert/assert-gtest.hpp>

using namespace std::literals;

static std::vector<std::string> candidates(const ProperNameDictionary& dictionary, std::string_view key) {
    auto span = dictionary.candidates_for_key(key);
    return std::vector<std::string>(span.begin(), span.end());
}

TEST(Dictionary, Keys) {
    EXPECT(ProperNameDictionary::key_of("Gavrilo Princip") == "Gavrilo");
    EXPECT(ProperNameDictionary::key_of("Sarajevo") == "Sarajevo");
    EXPECT(ProperNameDictionary::key_of("Kingdom of Serbia") == "Kingdom");
    EXPECT(ProperNameDictionary::key_of("Austria-Hungary") == "Austria-Hungary");
}

TEST(Dictionary, LongestFirst) {
    ProperNameDictionary dictionary(std::vector<std::string>{"Franz", "Franz Joseph I", "Franz Ferdinand", "Sarajevo"});
    std::vector<std::string> franz{"Franz Ferdinand", "Franz Joseph I", "Franz"};
    ASSERT(candidates(dictionary, "Franz") == franz);
    EXPECT(dictionary.key_count() == 2);
    EXPECT(dictionary.name_count() == 4);
    EXPECT(dictionary.contains_key("Sarajevo"));
    EXPECT(!dictionary.contains_key("Ferdinand"));
    EXPECT(dictionary.candidates_for_key("Ferdinand").empty());
}

TEST(Dictionary, SameLengthNamesAreKept) {
    ProperNameDictionary dictionary(std::vector<std::string>{"Anna Karenina", "Anna", "Anna Pavlovna"});
    std::vector<std::string> anna{"Anna Karenina", "Anna Pavlovna", "Anna"};
    ASSERT(candidates(dictionary, "Anna") == anna);
    EXPECT(dictionary.name_count() == 3);
}

TEST(Dictionary, DuplicatesCollapse) {
    ProperNameDictionary dictionary(std::vector<std::string>{"Black Hand", "Black Hand", "Black"});
    EXPECT(dictionary.name_count() == 2);
    EXPECT(dictionary.candidates_for_key("Black").size() == 2);
}

TEST(Dictionary, EmptyNamesSkipped) {
    ProperNameDictionary dictionary(std::vector<std::string>{"", " ", "Serbia"});
    EXPECT(dictionary.key_count() == 1);
    EXPECT(dictionary.name_count() == 1);
}

TEST(DictionaryLoader, Stream) {
    std::istringstream stream("  Gavrilo Princip \r\n\nSarajevo\n\t\nSarajevo\nBlack Hand");
    auto names = load_dictionary(stream);
    EXPECT(names.size() == 3);
    EXPECT(names.contains("Gavrilo Princip"));
    EXPECT(names.contains("Sarajevo"));
    EXPECT(names.contains("Black Hand"));
}

TEST(DictionaryLoader, MissingFile) {
    EXPECT_THROW(load_dictionary(std::filesystem::path("this/dictionary/does/not/exist.txt")), std::runtime_error);
}

TEST(DictionaryLoader, BundledFile) {
    auto names = load_dictionary(std::filesystem::path(PNTOK_DEFAULT_DICTIONARY));
    EXPECT(names.contains("Gavrilo Princip"));
    EXPECT(names.contains("Nedeljko Čabrinović"));
}

TEST(DictionaryLoader, DefaultFallback) {
    auto names = load_dictionary_or_empty(std::filesystem::path("this/dictionary/does/not/exist.txt"));
    EXPECT(names.empty());
    ProperNameTokenizer tokenizer(names);
    EXPECT(tokenizer.dictionary().name_count() == 0);
    auto document = tokenizer.parse_document("Gavrilo Princip shot Franz Ferdinand in Sarajevo.");
    EXPECT(document.size() == 1);
    EXPECT(all_proper_names(document).empty());
    EXPECT(document.all_words().size() == 7);
}

TEST(DictionaryLoader, FallbackReadsExistingFile) {
    auto names = load_dictionary_or_empty(std::filesystem::path(PNTOK_DEFAULT_DICTIONARY));
    EXPECT(names.contains("Gavrilo Princip"));
}

TEST(DictionaryLoader, DefaultIsLoadedOnce) {
    const auto& first = default_dictionary();
    const auto& second = default_dictionary();
    EXPECT(&first == &second);
    ProperNameTokenizer a;
    ProperNameTokenizer b;
    EXPECT(a.dictionary().name_count() == b.dictionary().name_count());
    EXPECT(a.dictionary().key_count() == b.dictionary().key_count());
    EXPECT(a.dictionary().name_count() == first.size());
}
