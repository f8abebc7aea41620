#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "richtext/util/result.hpp"

#include "richtext/compile.hpp"
#include "richtext/render.hpp"
#include "richtext/spans.hpp"
#include "richtext/style.hpp"

using namespace std::string_view_literals;

namespace richtext {
namespace {

[[nodiscard]]
std::u8string_view as_view(std::span<const char8_t> span)
{
    return { span.data(), span.size() };
}

struct Render_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<char8_t> out { &memory };
    std::pmr::vector<Styled_Span> spans { &memory };

    void add_span(std::u8string_view text, const Style& style = {})
    {
        spans.push_back({ .text = std::pmr::u8string { text, &memory }, .style = style });
    }
};

TEST_F(Render_Test, plain)
{
    Style bold;
    bold.bold = true;
    add_span(u8"Hello ");
    add_span(u8"World", bold);

    render_plain(out, spans);
    EXPECT_EQ(as_view(out), u8"Hello World"sv);
}

TEST_F(Render_Test, ansi_unstyled)
{
    add_span(u8"Hello");
    render_ansi(out, spans);
    EXPECT_EQ(as_view(out), u8"Hello"sv);
}

TEST_F(Render_Test, ansi_styled)
{
    Style style;
    style.bold = true;
    style.underline = true;
    style.color = Color { 255, 0, 16 };
    add_span(u8"a");

    Style background;
    background.background = Color { 1, 2, 3 };
    background.italic = false;
    background.font_size = 40;
    add_span(u8"b", style);
    add_span(u8"c", background);

    render_ansi(out, spans);
    EXPECT_EQ(
        as_view(out),
        u8"a"
        u8"\x1B[1;4;38;2;255;0;16mb\033[0m"
        u8"\x1B[48;2;1;2;3mc\033[0m"sv
    );
}

TEST_F(Render_Test, ansi_drops_control_characters)
{
    Style style;
    style.bold = true;
    add_span(u8"a\x1B[31mb" u8"\x07" u8"c\r\n\td\x7F" u8"\xC2\x9B" u8"2Je\u00FC");
    add_span(u8"\x1B]0;title\x07", style);

    render_ansi(out, spans);
    EXPECT_EQ(as_view(out), u8"a[31mbc\n\td2Je\u00FC\x1B[1m]0;title\033[0m"sv);
}

TEST_F(Render_Test, ansi_all_flags)
{
    Style style;
    style.bold = true;
    style.italic = true;
    style.underline = true;
    style.strikethrough = true;
    add_span(u8"x", style);

    render_ansi(out, spans);
    EXPECT_EQ(as_view(out), u8"\x1B[1;3;4;9mx\033[0m"sv);
}

TEST_F(Render_Test, ansi_skips_empty_spans)
{
    Style style;
    style.bold = true;
    add_span(u8"", style);

    render_ansi(out, spans);
    EXPECT_TRUE(out.empty());
}

TEST_F(Render_Test, dump_segments)
{
    const Result<std::pmr::vector<Segment>, Malformed_Markup> segments
        = compile(u8"Say \"hi\"\n[lg,fancy]World", &memory);
    ASSERT_TRUE(segments);

    dump_segments(out, *segments);
    EXPECT_EQ(as_view(out), u8"\"Say \\\"hi\\\"\\n\" []\n\"World\" [lg, fancy]\n"sv);
}

TEST(Render_Format, names)
{
    EXPECT_EQ(render_format_name(Render_Format::ansi), u8"ansi"sv);
    EXPECT_EQ(render_format_name(Render_Format::plain), u8"plain"sv);
    EXPECT_EQ(render_format_name(Render_Format::segments), u8"segments"sv);
}

} // namespace
} // namespace richtext
