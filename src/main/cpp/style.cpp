#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "richtext/util/chars.hpp"

#include "richtext/style.hpp"

namespace richtext {
namespace {

[[nodiscard]]
constexpr std::uint8_t hex_pair_value(char8_t high, char8_t low)
{
    return std::uint8_t((hex_digit_value(high) << 4) | hex_digit_value(low));
}

[[nodiscard]]
std::uint8_t unit_to_byte(double x)
{
    return std::uint8_t(std::lround(std::clamp(x, 0.0, 1.0) * 255));
}

[[nodiscard]]
double hue_to_rgb(double p, double q, double t)
{
    if (t < 0) {
        t += 1;
    }
    if (t > 1) {
        t -= 1;
    }
    if (t < 1.0 / 6) {
        return p + ((q - p) * 6 * t);
    }
    if (t < 1.0 / 2) {
        return q;
    }
    if (t < 2.0 / 3) {
        return p + ((q - p) * (2.0 / 3 - t) * 6);
    }
    return p;
}

} // namespace

std::optional<Color> Color::parse_hex(std::u8string_view str)
{
    if (!str.starts_with(u8'#')) {
        return {};
    }
    str.remove_prefix(1);
    if (!std::ranges::all_of(str, [](char8_t c) { return is_ascii_hex_digit(c); })) {
        return {};
    }

    switch (str.length()) {
    case 3: {
        return Color { .r = hex_pair_value(str[0], str[0]),
                       .g = hex_pair_value(str[1], str[1]),
                       .b = hex_pair_value(str[2], str[2]) };
    }
    case 6: {
        return Color { .r = hex_pair_value(str[0], str[1]),
                       .g = hex_pair_value(str[2], str[3]),
                       .b = hex_pair_value(str[4], str[5]) };
    }
    case 8: {
        return Color { .r = hex_pair_value(str[0], str[1]),
                       .g = hex_pair_value(str[2], str[3]),
                       .b = hex_pair_value(str[4], str[5]),
                       .a = hex_pair_value(str[6], str[7]) };
    }
    default: return {};
    }
}

Color Color::from_hsl(double h, double s, double l, double a)
{
    h = std::fmod(h, 360.0);
    if (h < 0) {
        h += 360;
    }
    h /= 360;
    s = std::clamp(s, 0.0, 1.0);
    l = std::clamp(l, 0.0, 1.0);

    if (s == 0) {
        const std::uint8_t gray = unit_to_byte(l);
        return { .r = gray, .g = gray, .b = gray, .a = unit_to_byte(a) };
    }

    const double q = l < 0.5 ? l * (1 + s) : l + s - (l * s);
    const double p = (2 * l) - q;
    return { .r = unit_to_byte(hue_to_rgb(p, q, h + (1.0 / 3))),
             .g = unit_to_byte(hue_to_rgb(p, q, h)),
             .b = unit_to_byte(hue_to_rgb(p, q, h - (1.0 / 3))),
             .a = unit_to_byte(a) };
}

void Style::apply(const Style& overlay)
{
    const auto overwrite = [](auto& target, const auto& source) {
        if (source) {
            target = source;
        }
    };
    overwrite(color, overlay.color);
    overwrite(background, overlay.background);
    overwrite(font, overlay.font);
    overwrite(font_size, overlay.font_size);
    overwrite(bold, overlay.bold);
    overwrite(italic, overlay.italic);
    overwrite(underline, overlay.underline);
    overwrite(strikethrough, overlay.strikethrough);

    for (const std::pmr::u8string& marker : overlay.markers) {
        add_marker(marker);
    }
}

bool Style::has_marker(std::u8string_view name) const
{
    return std::ranges::find(markers, name) != markers.end();
}

bool Style::add_marker(std::u8string_view name)
{
    if (has_marker(name)) {
        return false;
    }
    markers.emplace_back(name);
    return true;
}

bool Style::is_empty() const
{
    return !color && !background && !font && !font_size && !bold && !italic && !underline
        && !strikethrough && markers.empty();
}

} // namespace richtext
