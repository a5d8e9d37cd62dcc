#ifndef UNICODE_HPP
#define UNICODE_HPP

#include <string_view>

// Character class of the first code point of a UTF-8 string, ill-formed input is neither
bool starts_with_letter_or_digit(std::string_view str);

#endif
