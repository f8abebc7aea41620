#ifndef RICHTEXT_UNICODE_HPP
#define RICHTEXT_UNICODE_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>

#include "ulight/impl/unicode.hpp"

namespace richtext::utf8 {

using ulight::utf8::decode_and_length_or_replacement;
using ulight::utf8::is_valid;

/// @brief Decodes `str` into UTF-32, replacing illegal code units with U+FFFD.
[[nodiscard]]
inline std::pmr::u32string to_utf32(std::u8string_view str, std::pmr::memory_resource* memory)
{
    std::pmr::u32string result { memory };
    result.reserve(str.size());
    while (!str.empty()) {
        const auto [code_point, length] = decode_and_length_or_replacement(str);
        result.push_back(code_point);
        str.remove_prefix(std::size_t(length));
    }
    return result;
}

} // namespace richtext::utf8

#endif
