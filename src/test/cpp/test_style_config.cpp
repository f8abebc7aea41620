#include <memory_resource>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "richtext/util/result.hpp"

#include "richtext/collecting_logger.hpp"
#include "richtext/diagnostic.hpp"
#include "richtext/style.hpp"
#include "richtext/style_config.hpp"
#include "richtext/style_registry.hpp"

using namespace std::string_view_literals;

namespace richtext {
namespace {

struct Style_Config_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Style_Registry registry { &memory };

    [[nodiscard]]
    Result<void, Style_Config_Error> load(std::u8string_view json)
    {
        return load_style_config(registry, json, logger, &memory);
    }
};

TEST_F(Style_Config_Test, full_example)
{
    constexpr std::u8string_view json = u8R"({
    // Comments are allowed.
    "default": { "color": "#ffffff" },
    "styles": {
        "lg": { "font_size": 40 },
        "red": { "color": { "h": 0, "s": 1, "l": 0.5 } },
        "rainbow": { "color": "#f00", "markers": ["rainbow", "wave"] },
        "code": {
            "font": "monospace",
            "background": "#00000080",
            "bold": true,
            "italic": false,
            "underline": true,
            "strikethrough": false
        }
    }
})";
    ASSERT_TRUE(load(json));
    EXPECT_TRUE(logger.nothing_logged());

    EXPECT_EQ(registry.size(), 4);
    EXPECT_EQ(registry.get_default().color, (Color { 255, 255, 255 }));

    const Style* const lg = registry.find(u8"lg");
    ASSERT_NE(lg, nullptr);
    EXPECT_EQ(lg->font_size, 40);

    const Style* const red = registry.find(u8"red");
    ASSERT_NE(red, nullptr);
    EXPECT_EQ(red->color, (Color { 255, 0, 0 }));

    const Style* const rainbow = registry.find(u8"rainbow");
    ASSERT_NE(rainbow, nullptr);
    EXPECT_EQ(rainbow->color, (Color { 255, 0, 0 }));
    EXPECT_TRUE(rainbow->has_marker(u8"rainbow"));
    EXPECT_TRUE(rainbow->has_marker(u8"wave"));

    const Style* const code = registry.find(u8"code");
    ASSERT_NE(code, nullptr);
    ASSERT_TRUE(code->font);
    EXPECT_EQ(*code->font, u8"monospace"sv);
    EXPECT_EQ(code->background, (Color { 0, 0, 0, 128 }));
    EXPECT_EQ(code->bold, true);
    EXPECT_EQ(code->italic, false);
    EXPECT_EQ(code->underline, true);
    EXPECT_EQ(code->strikethrough, false);
}

TEST_F(Style_Config_Test, hsl_with_alpha)
{
    ASSERT_TRUE(load(u8R"({ "styles": { "x": { "color": { "h": 0, "s": 0, "l": 0, "a": 0 } } } })"));
    EXPECT_EQ(registry.find(u8"x")->color, (Color { 0, 0, 0, 0 }));
}

TEST_F(Style_Config_Test, invalid_json)
{
    const Result<void, Style_Config_Error> result = load(u8"{ \"styles\": ");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Style_Config_Error::invalid_json);
    EXPECT_TRUE(logger.was_logged(diagnostic::config_json));
}

TEST_F(Style_Config_Test, root_not_object)
{
    const Result<void, Style_Config_Error> result = load(u8"[]");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Style_Config_Error::invalid_type);
    EXPECT_TRUE(logger.was_logged(diagnostic::config_type));
}

TEST_F(Style_Config_Test, wrong_property_type)
{
    const Result<void, Style_Config_Error> result
        = load(u8R"({ "styles": { "x": { "bold": "yes" } } })");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Style_Config_Error::invalid_type);
    EXPECT_TRUE(logger.was_logged(diagnostic::config_type));
}

TEST_F(Style_Config_Test, invalid_color)
{
    const Result<void, Style_Config_Error> result
        = load(u8R"({ "styles": { "x": { "color": "#12345" } } })");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Style_Config_Error::invalid_color);
    EXPECT_TRUE(logger.was_logged(diagnostic::config_color));
}

TEST_F(Style_Config_Test, incomplete_hsl)
{
    const Result<void, Style_Config_Error> result
        = load(u8R"({ "styles": { "x": { "color": { "h": 0, "s": 1 } } } })");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Style_Config_Error::invalid_color);
}

TEST_F(Style_Config_Test, invalid_font_size)
{
    const Result<void, Style_Config_Error> result
        = load(u8R"({ "styles": { "x": { "font_size": -1 } } })");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), Style_Config_Error::invalid_font_size);
    EXPECT_TRUE(logger.was_logged(diagnostic::config_font_size));
}

TEST_F(Style_Config_Test, registry_unchanged_on_error)
{
    Style existing;
    existing.italic = true;
    registry.insert(u8"a", existing);

    const Result<void, Style_Config_Error> result = load(u8R"({
        "default": { "bold": true },
        "styles": {
            "a": { "bold": true },
            "b": { "bold": true },
            "c": { "color": "red" }
        }
    })");
    ASSERT_FALSE(result);
    EXPECT_EQ(registry.size(), 1);
    EXPECT_EQ(*registry.find(u8"a"), existing);
    EXPECT_TRUE(registry.get_default().is_empty());
}

TEST_F(Style_Config_Test, unknown_property_is_ignored)
{
    ASSERT_TRUE(load(u8R"({ "styles": { "x": { "colour": "#fff", "bold": true } } })"));
    const Style* const x = registry.find(u8"x");
    ASSERT_NE(x, nullptr);
    EXPECT_EQ(x->bold, true);
    EXPECT_FALSE(x->color);

    ASSERT_EQ(logger.count(diagnostic::config_property_unknown), 1);
    EXPECT_EQ(logger.diagnostics[0].severity, Severity::warning);
    EXPECT_NE(logger.diagnostics[0].message.find(u8"\"color\""), std::u8string::npos);
}

TEST_F(Style_Config_Test, replaces_existing_styles)
{
    Style existing;
    existing.italic = true;
    registry.insert(u8"x", existing);

    ASSERT_TRUE(load(u8R"({ "styles": { "x": { "bold": true } } })"));
    EXPECT_EQ(registry.find(u8"x")->bold, true);
    EXPECT_FALSE(registry.find(u8"x")->italic);
}

TEST(Style_Config, error_name)
{
    EXPECT_EQ(style_config_error_name(Style_Config_Error::invalid_color), u8"invalid_color"sv);
}

} // namespace
} // namespace richtext
