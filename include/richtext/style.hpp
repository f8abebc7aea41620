#ifndef RICHTEXT_STYLE_HPP
#define RICHTEXT_STYLE_HPP

#include <cstdint>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "richtext/fwd.hpp"

namespace richtext {

/// @brief An 8-bit RGBA color.
struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    /// @brief Parses `#rgb`, `#rrggbb`, or `#rrggbbaa`.
    /// The hexadecimal digits are case-insensitive.
    [[nodiscard]]
    static std::optional<Color> parse_hex(std::u8string_view str);

    /// @brief Converts from HSL.
    /// @param h The hue in degrees. Values outside `[0, 360)` wrap around.
    /// @param s The saturation, clamped to `[0, 1]`.
    /// @param l The lightness, clamped to `[0, 1]`.
    /// @param a The alpha, clamped to `[0, 1]`.
    [[nodiscard]]
    static Color from_hsl(double h, double s, double l, double a = 1);

    [[nodiscard]]
    friend constexpr bool operator==(Color, Color)
        = default;
};

/// @brief The presentation of text.
/// Every attribute is optional so that styles can be layered on top of each other.
struct Style {
    std::optional<Color> color;
    std::optional<Color> background;
    /// @brief The font family, if any.
    std::optional<std::pmr::u8string> font;
    std::optional<float> font_size;
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<bool> underline;
    std::optional<bool> strikethrough;
    /// @brief Arbitrary names that renderers or applications may attach behavior to,
    /// such as animations.
    /// Contains no duplicates.
    std::pmr::vector<std::pmr::u8string> markers;

    [[nodiscard]]
    friend bool operator==(const Style&, const Style&)
        = default;

    /// @brief Layers `overlay` on top of this style.
    /// Every attribute that is set in `overlay` replaces the attribute in `*this`,
    /// and the markers of `overlay` which are not yet present are appended.
    void apply(const Style& overlay);

    [[nodiscard]]
    bool has_marker(std::u8string_view name) const;

    /// @brief Appends `name` to the markers unless already present.
    /// @return `true` if the marker was added.
    bool add_marker(std::u8string_view name);

    /// @brief Returns `true` if no attribute is set and there are no markers.
    [[nodiscard]]
    bool is_empty() const;
};

} // namespace richtext

#endif
