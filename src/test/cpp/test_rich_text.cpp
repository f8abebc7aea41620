#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "richtext/collecting_logger.hpp"
#include "richtext/diagnostic.hpp"
#include "richtext/rich_text.hpp"
#include "richtext/spans.hpp"
#include "richtext/style.hpp"
#include "richtext/style_registry.hpp"

using namespace std::string_view_literals;

namespace richtext {
namespace {

struct Rich_Text_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Style_Registry registry { &memory };

    Rich_Text_Test()
    {
        Style lg;
        lg.font_size = 40;
        registry.insert(u8"lg", lg);
    }
};

TEST_F(Rich_Text_Test, spans)
{
    Rich_Text text { u8"[lg]Hello [nope]World", &memory };
    EXPECT_EQ(text.get_markup(), u8"[lg]Hello [nope]World"sv);

    const std::span<const Styled_Span> spans = text.get_spans(registry, logger);
    ASSERT_EQ(spans.size(), 2);
    EXPECT_EQ(spans[0].text, u8"Hello "sv);
    EXPECT_EQ(spans[0].style.font_size, 40);
    EXPECT_EQ(spans[1].text, u8"World"sv);
    EXPECT_EQ(spans[1].style, registry.get_default());
    EXPECT_EQ(logger.count(diagnostic::style_tag_unknown), 1);
}

TEST_F(Rich_Text_Test, cached)
{
    Rich_Text text { u8"[nope]x", &memory };
    EXPECT_TRUE(text.is_stale(registry));

    const std::span<const Styled_Span> first = text.get_spans(registry, logger);
    EXPECT_FALSE(text.is_stale(registry));
    const std::span<const Styled_Span> second = text.get_spans(registry, logger);

    EXPECT_EQ(first.data(), second.data());
    // Diagnostics are only logged when the spans are built.
    EXPECT_EQ(logger.count(diagnostic::style_tag_unknown), 1);
}

TEST_F(Rich_Text_Test, rebuilt_when_markup_changes)
{
    Rich_Text text { u8"x", &memory };
    ASSERT_EQ(text.get_spans(registry, logger).size(), 1);

    text.set_markup(u8"[lg]a[]b");
    EXPECT_TRUE(text.is_stale(registry));
    const std::span<const Styled_Span> spans = text.get_spans(registry, logger);
    ASSERT_EQ(spans.size(), 2);
    EXPECT_EQ(spans[0].style.font_size, 40);
    EXPECT_EQ(spans[1].text, u8"b"sv);
}

TEST_F(Rich_Text_Test, rebuilt_when_registry_changes)
{
    Rich_Text text { u8"[lg]x", &memory };
    ASSERT_EQ(text.get_spans(registry, logger)[0].style.font_size, 40);

    Style lg;
    lg.font_size = 50;
    registry.insert(u8"lg", lg);
    EXPECT_TRUE(text.is_stale(registry));
    EXPECT_EQ(text.get_spans(registry, logger)[0].style.font_size, 50);
}

TEST_F(Rich_Text_Test, rebuilt_for_other_registry)
{
    Rich_Text text { u8"[lg]x", &memory };
    ASSERT_EQ(text.get_spans(registry, logger)[0].style.font_size, 40);

    Style_Registry other { &memory };
    EXPECT_TRUE(text.is_stale(other));
    EXPECT_FALSE(text.get_spans(other, logger)[0].style.font_size);
}

TEST_F(Rich_Text_Test, rebuilt_for_registry_replaced_in_place)
{
    std::optional<Style_Registry> local;
    local.emplace(&memory);
    Style lg;
    lg.font_size = 40;
    local->insert(u8"lg", lg);

    Rich_Text text { u8"[lg]x", &memory };
    ASSERT_EQ(text.get_spans(*local, logger)[0].style.font_size, 40);

    // Same address and the same number of mutations as before.
    local.emplace(&memory);
    lg.font_size = 50;
    local->insert(u8"lg", lg);
    EXPECT_TRUE(text.is_stale(*local));
    EXPECT_EQ(text.get_spans(*local, logger)[0].style.font_size, 50);
}

TEST_F(Rich_Text_Test, malformed_markup)
{
    Style default_style;
    default_style.bold = true;
    registry.set_default(default_style);

    Rich_Text text { u8"Hello [lg", &memory };
    const std::span<const Styled_Span> spans = text.get_spans(registry, logger);
    ASSERT_EQ(spans.size(), 1);
    EXPECT_TRUE(spans[0].text.empty());
    EXPECT_EQ(spans[0].style, default_style);
    EXPECT_TRUE(logger.was_logged(diagnostic::markup_unterminated));
}

TEST_F(Rich_Text_Test, plain_text)
{
    const Rich_Text text { u8"[lg]a[[b]]c", &memory };
    const std::optional<std::pmr::u8string> plain = text.get_plain_text();
    ASSERT_TRUE(plain);
    EXPECT_EQ(*plain, u8"a[b]c"sv);

    const Rich_Text malformed { u8"a[", &memory };
    EXPECT_FALSE(malformed.get_plain_text());
}

TEST_F(Rich_Text_Test, empty_markup)
{
    Rich_Text text { {}, &memory };
    const std::span<const Styled_Span> spans = text.get_spans(registry, logger);
    ASSERT_EQ(spans.size(), 1);
    EXPECT_TRUE(spans[0].text.empty());
    EXPECT_EQ(spans[0].style, registry.get_default());
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Rich_Text_Test, directive_without_text)
{
    Rich_Text text { u8"[lg]", &memory };
    const std::span<const Styled_Span> spans = text.get_spans(registry, logger);
    ASSERT_EQ(spans.size(), 1);
    EXPECT_TRUE(spans[0].text.empty());
    EXPECT_EQ(spans[0].style, registry.get_default());
    EXPECT_TRUE(logger.nothing_logged());
}

} // namespace
} // namespace richtext
