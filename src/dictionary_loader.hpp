#ifndef DICTIONARY_LOADER_HPP
#define DICTIONARY_LOADER_HPP

#include <filesystem>
#include <istream>

#include "utils.hpp"

// One proper name per line, surrounding whitespace trimmed, blank lines skipped
string_set load_dictionary(std::istream& stream);

// Throws std::runtime_error if the file can't be read
string_set load_dictionary(const std::filesystem::path& path);

// Never throws, logs a warning and returns an empty set if path can't be read
string_set load_dictionary_or_empty(const std::filesystem::path& path);

// Loaded once per process from $PNTOK_DICTIONARY, or the bundled NER.txt otherwise.
// Never throws, falls back to an empty dictionary (with a warning) on failure.
const string_set& default_dictionary();

#endif
