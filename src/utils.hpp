#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <string_view>

#include <ankerl/unordered_dense.h>

#include "constants.hpp"

struct string_hash {
    using is_transparent = void; // enable heterogeneous overloads
    using is_avalanching = void; // mark class as high quality avalanching hash

    [[nodiscard]] auto operator()(std::string_view str) const noexcept -> uint64_t {
        return ankerl::unordered_dense::hash<std::string_view>{}(str);
    }
};

using string_set = ankerl::unordered_dense::set<std::string, string_hash, std::equal_to<>>;
template<typename T> using string_map = ankerl::unordered_dense::map<std::string, T, string_hash, std::equal_to<>>;

inline std::string_view trim(std::string_view str) {
    auto start = str.find_first_not_of(trimmed_characters);
    if(start == std::string_view::npos) {
        return {};
    }
    auto end = str.find_last_not_of(trimmed_characters);
    return str.substr(start, end - start + 1);
}

#endif
