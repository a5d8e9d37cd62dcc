#ifndef PROPERNAMEDICTIONARY_HPP
#define PROPERNAMEDICTIONARY_HPP

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "utils.hpp"

// Proper names indexed by their first word. Candidates under a key are ordered longest
// first so that the first one to match is the longest match. Names of equal length keep
// the order they were inserted in.
class ProperNameDictionary {
    string_map<std::vector<std::string>> names_by_key;
    std::size_t total_names = 0;

public:
    ProperNameDictionary() = default;

    template<typename R>
    explicit ProperNameDictionary(const R& names) {
        for(const auto& name : names) {
            insert(name);
        }
    }

    // Text before the first space, trimmed
    static std::string_view key_of(std::string_view name);

    std::span<const std::string> candidates_for_key(std::string_view key) const;

    bool contains_key(std::string_view key) const {
        return names_by_key.contains(key);
    }

    std::size_t key_count() const {
        return names_by_key.size();
    }

    std::size_t name_count() const {
        return total_names;
    }

private:
    void insert(std::string_view name);
};

#endif
