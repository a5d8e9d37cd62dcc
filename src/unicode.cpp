#include "unicode.hpp"

#include <algorithm>
#include <cstdint>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

bool starts_with_letter_or_digit(std::string_view str) {
    if(str.empty()) {
        return false;
    }
    int32_t i = 0;
    UChar32 codepoint;
    // only the first code point matters, no need to look past a maximal UTF-8 sequence
    U8_NEXT(str.data(), i, int32_t(std::min<std::size_t>(str.size(), U8_MAX_LENGTH)), codepoint);
    if(codepoint < 0) {
        return false;
    }
    return u_isalnum(codepoint);
}
