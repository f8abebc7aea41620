#ifndef RICHTEXT_CHARS_HPP
#define RICHTEXT_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"
#include "ulight/impl/lang/html_chars.hpp"

namespace richtext {

using ulight::is_ascii_digit;
using ulight::is_ascii_hex_digit;
using ulight::is_html_whitespace;
using ulight::to_ascii_lower;

/// @brief Returns true if `c` is a blank character.
/// This matches the C locale definition,
/// and includes vertical tabs,
/// unlike `is_ascii_whitespace`.
[[nodiscard]]
constexpr bool is_ascii_blank(char8_t c)
{
    return is_html_whitespace(c) || c == u8'\v';
}

/// @brief Returns the value of the hexadecimal digit `c`,
/// which shall satisfy `is_ascii_hex_digit(c)`.
[[nodiscard]]
constexpr int hex_digit_value(char8_t c)
{
    return is_ascii_digit(c) ? c - u8'0' : to_ascii_lower(c) - u8'a' + 10;
}

} // namespace richtext

#endif
