#ifndef RICHTEXT_SOURCE_POSITION_HPP
#define RICHTEXT_SOURCE_POSITION_HPP

#include <compare>
#include <cstddef>
#include <string_view>

#include "richtext/util/assert.hpp"

#include "richtext/fwd.hpp"

namespace richtext {

/// Represents a position in a markup source.
struct Source_Position {
    /// Line number.
    std::size_t line;
    /// Column number.
    std::size_t column;
    /// First index in the source that is part of the syntactical element.
    std::size_t begin;

    [[nodiscard]]
    friend constexpr auto operator<=>(Source_Position, Source_Position)
        = default;

    [[nodiscard]]
    constexpr Source_Position to_right(std::size_t offset) const
    {
        return { .line = line, .column = column + offset, .begin = begin + offset };
    }
};

constexpr void advance(Source_Position& pos, char8_t c)
{
    switch (c) {
    case '\r': pos.column = 0; break;
    case '\n':
        pos.column = 0;
        pos.line += 1;
        break;
    default: pos.column += 1;
    }
    pos.begin += 1;
}

constexpr void advance(Source_Position& pos, std::u8string_view str)
{
    for (const char8_t c : str) {
        advance(pos, c);
    }
}

/// Represents a range of characters in a markup source.
struct Source_Span : Source_Position {
    std::size_t length;

    [[nodiscard]]
    friend constexpr auto operator<=>(Source_Span, Source_Span)
        = default;

    /// @brief Returns a span with the same properties except that the length is `l`.
    [[nodiscard]]
    constexpr Source_Span with_length(std::size_t l) const
    {
        return { Source_Position { *this }, l }; // NOLINT(cppcoreguidelines-slicing)
    }

    [[nodiscard]]
    constexpr bool empty() const
    {
        return length == 0;
    }

    /// @brief Returns the one-past-the-end position in the source.
    [[nodiscard]]
    constexpr std::size_t end() const
    {
        return begin + length;
    }

    [[nodiscard]]
    constexpr bool contains(std::size_t pos) const
    {
        return pos >= begin && pos < end();
    }
};

} // namespace richtext

#endif
