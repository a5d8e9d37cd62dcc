#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#include <string_view>

using namespace std::literals;

// Locale.US was what every consumer of this tokenizer historically assumed
constexpr std::string_view default_locale = "en_US"sv;

#ifndef PNTOK_DEFAULT_DICTIONARY
 #define PNTOK_DEFAULT_DICTIONARY "NER.txt"
#endif

constexpr std::string_view default_dictionary_path = PNTOK_DEFAULT_DICTIONARY;
constexpr const char* dictionary_path_env = "PNTOK_DICTIONARY";

// separates the key (first word) of a proper name from the rest of it
constexpr char proper_name_key_delimiter = ' ';

constexpr std::string_view trimmed_characters = " \t\n\r\v\f"sv;

#endif
