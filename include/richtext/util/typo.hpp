#ifndef RICHTEXT_TYPO_HPP
#define RICHTEXT_TYPO_HPP

#include <compare>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>

namespace richtext {

template <typename T>
struct Distant {
    T value {};
    std::size_t distance = std::size_t(-1);

    [[nodiscard]]
    constexpr operator bool() const
    {
        return distance != std::size_t(-1);
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Distant& x, const Distant& y)
        = default;

    [[nodiscard]]
    friend constexpr std::strong_ordering operator<=>(const Distant& x, const Distant& y) noexcept
    {
        return x.distance <=> y.distance;
    }
};

/// @brief Searches for the given `needle` in the `haystack` based on Levenshtein distance,
/// measured in code points.
/// There may be multiple equally good matches,
/// in which case earlier elements are preferred over later elements in the `haystack`.
/// The `value` of the result is the index of the match within the `haystack`.
[[nodiscard]]
Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
);

/// @brief Like `closest_match`, but only yields a result if the distance
/// is nonzero and at most `max_distance`.
/// This is useful for "did you mean" suggestions, where an exact match is not a typo.
[[nodiscard]]
Distant<std::u8string_view> find_typo_correction(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::size_t max_distance,
    std::pmr::memory_resource* memory
);

} // namespace richtext

#endif
