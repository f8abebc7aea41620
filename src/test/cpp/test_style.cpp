#include <optional>
#include <string_view>

#include <gtest/gtest.h>

#include "richtext/style.hpp"

using namespace std::string_view_literals;

namespace richtext {
namespace {

TEST(Color, parse_hex)
{
    EXPECT_EQ(Color::parse_hex(u8"#ff8000"), (Color { 255, 128, 0, 255 }));
    EXPECT_EQ(Color::parse_hex(u8"#FF8000"), (Color { 255, 128, 0, 255 }));
    EXPECT_EQ(Color::parse_hex(u8"#f80"), (Color { 255, 136, 0, 255 }));
    EXPECT_EQ(Color::parse_hex(u8"#01020304"), (Color { 1, 2, 3, 4 }));
}

TEST(Color, parse_hex_invalid)
{
    EXPECT_FALSE(Color::parse_hex(u8""));
    EXPECT_FALSE(Color::parse_hex(u8"#"));
    EXPECT_FALSE(Color::parse_hex(u8"ff8000"));
    EXPECT_FALSE(Color::parse_hex(u8"#ff80"));
    EXPECT_FALSE(Color::parse_hex(u8"#gg0000"));
    EXPECT_FALSE(Color::parse_hex(u8"#ff8000 "));
}

TEST(Color, from_hsl)
{
    EXPECT_EQ(Color::from_hsl(0, 1, 0.5), (Color { 255, 0, 0, 255 }));
    EXPECT_EQ(Color::from_hsl(120, 1, 0.5), (Color { 0, 255, 0, 255 }));
    EXPECT_EQ(Color::from_hsl(240, 1, 0.5), (Color { 0, 0, 255, 255 }));
    EXPECT_EQ(Color::from_hsl(360 + 240, 1, 0.5), (Color { 0, 0, 255, 255 }));
    EXPECT_EQ(Color::from_hsl(-120, 1, 0.5), (Color { 0, 0, 255, 255 }));
    EXPECT_EQ(Color::from_hsl(0, 0, 1), (Color { 255, 255, 255, 255 }));
    EXPECT_EQ(Color::from_hsl(0, 0, 0, 0), (Color { 0, 0, 0, 0 }));
}

TEST(Style, apply_overrides_set_attributes)
{
    Style base;
    base.color = Color { 1, 2, 3 };
    base.bold = true;
    base.font_size = 12;

    Style overlay;
    overlay.color = Color { 4, 5, 6 };
    overlay.bold = false;

    base.apply(overlay);
    EXPECT_EQ(base.color, (Color { 4, 5, 6 }));
    EXPECT_EQ(base.bold, false);
    EXPECT_EQ(base.font_size, 12);
    EXPECT_FALSE(base.italic);
}

TEST(Style, apply_unions_markers)
{
    Style base;
    base.add_marker(u8"rainbow");
    base.add_marker(u8"shake");

    Style overlay;
    overlay.add_marker(u8"wave");
    overlay.add_marker(u8"rainbow");

    base.apply(overlay);
    ASSERT_EQ(base.markers.size(), 3);
    EXPECT_EQ(base.markers[0], u8"rainbow"sv);
    EXPECT_EQ(base.markers[1], u8"shake"sv);
    EXPECT_EQ(base.markers[2], u8"wave"sv);
}

TEST(Style, add_marker)
{
    Style style;
    EXPECT_TRUE(style.is_empty());
    EXPECT_TRUE(style.add_marker(u8"wave"));
    EXPECT_FALSE(style.add_marker(u8"wave"));
    EXPECT_TRUE(style.has_marker(u8"wave"));
    EXPECT_FALSE(style.has_marker(u8"rainbow"));
    EXPECT_FALSE(style.is_empty());
}

TEST(Style, apply_empty_is_identity)
{
    Style style;
    style.font = std::pmr::u8string { u8"Comic Sans" };
    style.underline = true;
    const Style copy = style;

    style.apply(Style {});
    EXPECT_EQ(style, copy);
}

} // namespace
} // namespace richtext
