#include <memory_resource>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "richtext/util/chars.hpp"
#include "richtext/util/strings.hpp"
#include "richtext/util/unicode.hpp"

namespace richtext {
namespace {

using namespace std::literals;

TEST(Chars, is_ascii_blank)
{
    for (const char8_t c : all_ascii_blank8) {
        EXPECT_TRUE(is_ascii_blank(c));
    }
    EXPECT_FALSE(is_ascii_blank(u8'a'));
    EXPECT_FALSE(is_ascii_blank(u8'['));
}

TEST(Chars, hex_digit_value)
{
    EXPECT_EQ(hex_digit_value(u8'0'), 0);
    EXPECT_EQ(hex_digit_value(u8'9'), 9);
    EXPECT_EQ(hex_digit_value(u8'a'), 10);
    EXPECT_EQ(hex_digit_value(u8'F'), 15);
}

TEST(Strings, trim_ascii_blank)
{
    EXPECT_EQ(trim_ascii_blank(u8""sv), u8""sv);
    EXPECT_EQ(trim_ascii_blank(u8"   "sv), u8""sv);
    EXPECT_EQ(trim_ascii_blank(u8" \t lg \n"sv), u8"lg"sv);
    EXPECT_EQ(trim_ascii_blank(u8"big red"sv), u8"big red"sv);
    EXPECT_EQ(trim_ascii_blank_left(u8"  x "sv), u8"x "sv);
    EXPECT_EQ(trim_ascii_blank_right(u8"  x "sv), u8"  x"sv);
}

TEST(Strings, is_ascii_blank)
{
    EXPECT_TRUE(is_ascii_blank(u8""sv));
    EXPECT_TRUE(is_ascii_blank(u8" \t\r\n\v\f"sv));
    EXPECT_FALSE(is_ascii_blank(u8" x "sv));
}

TEST(Strings, joined)
{
    std::pmr::monotonic_buffer_resource memory;
    EXPECT_EQ(joined({ u8"a"sv, u8""sv, u8"bc"sv }, &memory), u8"abc"sv);
    EXPECT_EQ(joined({}, &memory), u8""sv);
}

TEST(Unicode, to_utf32)
{
    std::pmr::monotonic_buffer_resource memory;
    EXPECT_EQ(utf8::to_utf32(u8"für", &memory), U"für"sv);
}

} // namespace
} // namespace richtext
