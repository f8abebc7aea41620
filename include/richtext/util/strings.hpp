#ifndef RICHTEXT_STRINGS_HPP
#define RICHTEXT_STRINGS_HPP

#include <cstddef>
#include <initializer_list>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "richtext/util/chars.hpp"

namespace richtext {

// see is_ascii_blank
inline constexpr std::u8string_view all_ascii_blank8 = u8"\t\n\f\r\v ";

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::span<const char8_t> text)
{
    return { text.data(), text.size() };
}

[[nodiscard]]
constexpr std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

[[nodiscard]]
constexpr bool contains(std::u8string_view str, char8_t c)
{
    return str.find(c) != std::u8string_view::npos;
}

template <typename Alloc>
constexpr void append(std::vector<char8_t, Alloc>& out, std::u8string_view str)
{
    out.insert(out.end(), str.begin(), str.end());
}

/// @brief Returns `true` if `str` is a possibly empty string comprised
/// entirely of blank ASCII characters (`is_ascii_blank`).
[[nodiscard]]
constexpr bool is_ascii_blank(std::u8string_view str)
{
    for (const char8_t c : str) { // NOLINT(readability-use-anyofallof)
        if (!is_ascii_blank(c)) {
            return false;
        }
    }
    return true;
}

[[nodiscard]]
constexpr std::size_t length_blank_left(std::u8string_view str)
{
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!is_ascii_blank(str[i])) {
            return i;
        }
    }
    return str.length();
}

[[nodiscard]]
constexpr std::size_t length_blank_right(std::u8string_view str)
{
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (!is_ascii_blank(str[str.length() - i - 1])) {
            return i;
        }
    }
    return str.length();
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank_left(std::u8string_view str)
{
    return str.substr(length_blank_left(str));
}

[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank_right(std::u8string_view str)
{
    return str.substr(0, str.length() - length_blank_right(str));
}

/// @brief Equivalent to `trim_ascii_blank_right(trim_ascii_blank_left(str))`.
[[nodiscard]]
constexpr std::u8string_view trim_ascii_blank(std::u8string_view str)
{
    return trim_ascii_blank_right(trim_ascii_blank_left(str));
}

/// @brief Concatenates `parts` into a new string.
[[nodiscard]]
inline std::pmr::u8string
joined(std::initializer_list<std::u8string_view> parts, std::pmr::memory_resource* memory)
{
    std::pmr::u8string result { memory };
    for (const std::u8string_view part : parts) {
        result += part;
    }
    return result;
}

} // namespace richtext

#endif
