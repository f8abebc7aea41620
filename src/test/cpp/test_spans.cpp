#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "richtext/util/result.hpp"

#include "richtext/collecting_logger.hpp"
#include "richtext/compile.hpp"
#include "richtext/diagnostic.hpp"
#include "richtext/spans.hpp"
#include "richtext/style.hpp"
#include "richtext/style_registry.hpp"

using namespace std::string_view_literals;

namespace richtext {
namespace {

struct Spans_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Style_Registry registry { &memory };
    std::pmr::vector<Styled_Span> spans { &memory };

    Spans_Test()
    {
        Style default_style;
        default_style.color = Color { 255, 255, 255 };
        default_style.font_size = 12;
        registry.set_default(default_style);

        Style lg;
        lg.font_size = 40;
        registry.insert(u8"lg", lg);

        Style fancy;
        fancy.italic = true;
        fancy.color = Color { 255, 0, 0 };
        fancy.add_marker(u8"rainbow");
        registry.insert(u8"fancy", fancy);

        Style blue;
        blue.color = Color { 0, 0, 255 };
        registry.insert(u8"blue", blue);
    }

    void build(std::u8string_view markup)
    {
        const Result<std::pmr::vector<Segment>, Malformed_Markup> segments
            = compile(markup, &memory, logger);
        ASSERT_TRUE(segments);
        build_spans(spans, *segments, registry, logger);
    }
};

TEST_F(Spans_Test, untagged_text_uses_default)
{
    build(u8"Hello");
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans[0].text, u8"Hello"sv);
    EXPECT_EQ(spans[0].style, registry.get_default());
}

TEST_F(Spans_Test, tags_are_layered)
{
    build(u8"[lg]Hello [lg,fancy]World");
    ASSERT_EQ(spans.size(), 2);

    EXPECT_EQ(spans[0].text, u8"Hello "sv);
    EXPECT_EQ(spans[0].style.font_size, 40);
    EXPECT_EQ(spans[0].style.color, (Color { 255, 255, 255 }));
    EXPECT_FALSE(spans[0].style.has_marker(u8"rainbow"));

    EXPECT_EQ(spans[1].text, u8"World"sv);
    EXPECT_EQ(spans[1].style.font_size, 40);
    EXPECT_EQ(spans[1].style.italic, true);
    EXPECT_EQ(spans[1].style.color, (Color { 255, 0, 0 }));
    EXPECT_TRUE(spans[1].style.has_marker(u8"rainbow"));

    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Spans_Test, later_tags_take_precedence)
{
    build(u8"[fancy,blue]x[blue,fancy]y");
    ASSERT_EQ(spans.size(), 2);
    EXPECT_EQ(spans[0].style.color, (Color { 0, 0, 255 }));
    EXPECT_EQ(spans[1].style.color, (Color { 255, 0, 0 }));
}

TEST_F(Spans_Test, unknown_tag_falls_back_to_default)
{
    build(u8"[nope]x");
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans[0].style, registry.get_default());
    ASSERT_EQ(logger.count(diagnostic::style_tag_unknown), 1);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::warning);
    EXPECT_EQ(logger.diagnostics[0].location.begin, 1);
    EXPECT_EQ(logger.diagnostics[0].location.length, 4);
}

TEST_F(Spans_Test, unknown_tag_suggestion)
{
    build(u8"[fancyy]x");
    ASSERT_EQ(logger.count(diagnostic::style_tag_unknown), 1);
    EXPECT_NE(logger.diagnostics[0].message.find(u8"Did you mean \"fancy\"?"), std::u8string::npos);
}

TEST_F(Spans_Test, unknown_tag_warned_once)
{
    build(u8"[nope]x[nope,lg]y[nope]z");
    ASSERT_EQ(spans.size(), 3);
    EXPECT_EQ(spans[1].style.font_size, 40);
    EXPECT_EQ(logger.count(diagnostic::style_tag_unknown), 1);
}

} // namespace
} // namespace richtext
