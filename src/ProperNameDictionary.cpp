#include "ProperNameDictionary.hpp"

#include <algorithm>

#include <libassert/assert.hpp>

std::string_view ProperNameDictionary::key_of(std::string_view name) {
    return trim(name.substr(0, name.find(proper_name_key_delimiter)));
}

std::span<const std::string> ProperNameDictionary::candidates_for_key(std::string_view key) const {
    if(auto it = names_by_key.find(key); it != names_by_key.end()) {
        return it->second;
    } else {
        return {};
    }
}

void ProperNameDictionary::insert(std::string_view name) {
    auto key = key_of(name);
    if(key.empty()) {
        return;
    }
    auto& candidates = names_by_key[std::string(key)];
    if(std::ranges::find(candidates, name) != candidates.end()) {
        return;
    }
    // insert after every name at least as long, keeps equal lengths in insertion order
    auto position = std::ranges::find_if(candidates, [&](const std::string& candidate) {
        return candidate.size() < name.size();
    });
    candidates.emplace(position, name);
    total_names++;
    DEBUG_ASSERT(
        std::ranges::is_sorted(candidates, std::ranges::greater{}, [](const std::string& c) { return c.size(); }),
        "Proper name candidates out of order"
    );
}
