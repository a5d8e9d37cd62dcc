#include "dictionary_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include "constants.hpp"

string_set load_dictionary(std::istream& stream) {
    string_set names;
    std::string line;
    while(std::getline(stream, line)) {
        auto name = trim(line);
        if(name.empty()) {
            continue;
        }
        names.emplace(name);
    }
    if(stream.bad()) {
        throw std::runtime_error("Error while reading dictionary");
    }
    return names;
}

string_set load_dictionary(const std::filesystem::path& path) {
    std::ifstream file(path);
    if(!file) {
        throw std::runtime_error(fmt::format("Unable to open dictionary {}", path));
    }
    try {
        auto names = load_dictionary(file);
        spdlog::debug("Loaded {} proper names from {}", names.size(), path);
        return names;
    } catch(const std::runtime_error& e) {
        throw std::runtime_error(fmt::format("{}: {}", path, e.what()));
    }
}

static std::filesystem::path default_dictionary_location() {
    if(const char* path = std::getenv(dictionary_path_env); path && *path) {
        return path;
    }
    return std::filesystem::path(default_dictionary_path);
}

string_set load_dictionary_or_empty(const std::filesystem::path& path) {
    try {
        return load_dictionary(path);
    } catch(const std::exception& e) {
        spdlog::warn("Failed to load dictionary, no proper names will be recognized: {}", e.what());
        return string_set{};
    }
}

const string_set& default_dictionary() {
    static const string_set names = load_dictionary_or_empty(default_dictionary_location());
    return names;
}
