#include <cmath>
#include <initializer_list>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "richtext/util/assert.hpp"
#include "richtext/util/result.hpp"
#include "richtext/util/strings.hpp"
#include "richtext/util/typo.hpp"

#include "richtext/diagnostic.hpp"
#include "richtext/json.hpp"
#include "richtext/logger.hpp"
#include "richtext/settings.hpp"
#include "richtext/style.hpp"
#include "richtext/style_config.hpp"
#include "richtext/style_registry.hpp"

using namespace std::string_view_literals;

namespace richtext {

std::u8string_view style_config_error_name(Style_Config_Error error)
{
    using enum Style_Config_Error;
    switch (error) {
        RICHTEXT_ENUM_STRING_CASE8(invalid_json);
        RICHTEXT_ENUM_STRING_CASE8(invalid_type);
        RICHTEXT_ENUM_STRING_CASE8(invalid_color);
        RICHTEXT_ENUM_STRING_CASE8(invalid_font_size);
    }
    RICHTEXT_ASSERT_UNREACHABLE(u8"Invalid Style_Config_Error.");
}

namespace {

constexpr std::u8string_view style_properties[] {
    u8"background", u8"bold",   u8"color",         u8"font",      u8"font_size",
    u8"italic",     u8"markers", u8"strikethrough", u8"underline",
};

constexpr std::u8string_view root_properties[] { u8"default", u8"styles" };

struct Named_Style {
    std::pmr::u8string name;
    Style style;
};

struct [[nodiscard]] Style_Config_Loader {
private:
    Logger& m_logger;
    std::pmr::memory_resource* const m_memory;

public:
    std::optional<Style> default_style;
    std::pmr::vector<Named_Style> styles;

    Style_Config_Loader(Logger& logger, std::pmr::memory_resource* memory)
        : m_logger { logger }
        , m_memory { memory }
        , styles { memory }
    {
    }

    Result<void, Style_Config_Error> load(std::u8string_view json_source)
    {
        const std::optional<json::Value> root = json::load(json_source, m_memory);
        if (!root) {
            m_logger.try_log(
                Severity::error, diagnostic::config_json, {},
                u8"The style configuration is not valid JSON."sv
            );
            return Style_Config_Error::invalid_json;
        }
        const json::Object* const root_object = root->as_object();
        if (!root_object) {
            return type_error(u8"The style configuration"sv, u8"an object"sv, *root);
        }

        for (const json::Member& member : *root_object) {
            if (member.key == u8"default"sv) {
                Style style;
                if (auto r = load_style(style, member.key, member.value); !r) {
                    return r;
                }
                default_style = std::move(style);
            }
            else if (member.key == u8"styles"sv) {
                if (auto r = load_styles(member.value); !r) {
                    return r;
                }
            }
            else {
                warn_unknown_property(member.key, root_properties);
            }
        }
        return {};
    }

    void commit(Style_Registry& registry) const
    {
        if (default_style) {
            registry.set_default(*default_style);
        }
        for (const Named_Style& s : styles) {
            registry.insert(s.name, s.style);
        }
    }

private:
    Result<void, Style_Config_Error> load_styles(const json::Value& value)
    {
        const json::Object* const object = value.as_object();
        if (!object) {
            return type_error(u8"\"styles\""sv, u8"an object"sv, value);
        }
        for (const json::Member& member : *object) {
            Style style;
            if (auto r = load_style(style, member.key, member.value); !r) {
                return r;
            }
            styles.push_back({ .name = std::pmr::u8string { member.key, m_memory },
                               .style = std::move(style) });
        }
        return {};
    }

    Result<void, Style_Config_Error>
    load_style(Style& out, std::u8string_view name, const json::Value& value)
    {
        const json::Object* const object = value.as_object();
        if (!object) {
            const std::pmr::u8string subject = joined({ u8"The style \""sv, name, u8"\""sv }, m_memory);
            return type_error(subject, u8"an object"sv, value);
        }

        for (const json::Member& member : *object) {
            const std::u8string_view key = member.key;
            const json::Value& property = member.value;

            if (key == u8"color"sv || key == u8"background"sv) {
                Result<Color, Style_Config_Error> color = load_color(name, key, property);
                if (!color) {
                    return color.error();
                }
                (key == u8"color"sv ? out.color : out.background) = *color;
            }
            else if (key == u8"font"sv) {
                const json::String* const font = property.as_string();
                if (!font) {
                    return property_type_error(name, key, u8"a string"sv, property);
                }
                out.font = *font;
            }
            else if (key == u8"font_size"sv) {
                const json::Number* const size = property.as_number();
                if (!size) {
                    return property_type_error(name, key, u8"a number"sv, property);
                }
                if (!std::isfinite(*size) || *size <= 0) {
                    log_error(
                        diagnostic::config_font_size,
                        { u8"The font size of the style \""sv, name,
                          u8"\" has to be a positive number."sv }
                    );
                    return Style_Config_Error::invalid_font_size;
                }
                out.font_size = float(*size);
            }
            else if (key == u8"bold"sv || key == u8"italic"sv || key == u8"underline"sv
                     || key == u8"strikethrough"sv) {
                const bool* const flag = property.as_boolean();
                if (!flag) {
                    return property_type_error(name, key, u8"a boolean"sv, property);
                }
                std::optional<bool>& target = key == u8"bold"sv ? out.bold
                    : key == u8"italic"sv                       ? out.italic
                    : key == u8"underline"sv                    ? out.underline
                                                                : out.strikethrough;
                target = *flag;
            }
            else if (key == u8"markers"sv) {
                const json::Array* const markers = property.as_array();
                if (!markers) {
                    return property_type_error(name, key, u8"an array"sv, property);
                }
                for (const json::Value& marker : *markers) {
                    const json::String* const marker_name = marker.as_string();
                    if (!marker_name) {
                        return property_type_error(name, key, u8"an array of strings"sv, property);
                    }
                    out.add_marker(*marker_name);
                }
            }
            else {
                warn_unknown_property(key, style_properties);
            }
        }
        return {};
    }

    Result<Color, Style_Config_Error>
    load_color(std::u8string_view style_name, std::u8string_view key, const json::Value& value)
    {
        if (const json::String* const hex = value.as_string()) {
            if (std::optional<Color> result = Color::parse_hex(*hex)) {
                return *result;
            }
            log_error(
                diagnostic::config_color,
                { u8"\""sv, *hex, u8"\" in the style \""sv, style_name,
                  u8"\" is not a valid color. Expected #rgb, #rrggbb, or #rrggbbaa."sv }
            );
            return Style_Config_Error::invalid_color;
        }

        if (const json::Object* const hsl = value.as_object()) {
            const json::Number* const h = hsl->find_number(u8"h");
            const json::Number* const s = hsl->find_number(u8"s");
            const json::Number* const l = hsl->find_number(u8"l");
            const json::Number* const a = hsl->find_number(u8"a");
            const bool alpha_ok = a || !hsl->find(u8"a");
            if (!h || !s || !l || !alpha_ok) {
                log_error(
                    diagnostic::config_color,
                    { u8"The property \""sv, key, u8"\" of the style \""sv, style_name,
                      u8"\" needs the numbers \"h\", \"s\", and \"l\", and optionally \"a\"."sv }
                );
                return Style_Config_Error::invalid_color;
            }
            return Color::from_hsl(*h, *s, *l, a ? *a : 1.0);
        }

        return property_type_error(style_name, key, u8"a string or an object"sv, value);
    }

    void log_error(std::u8string_view id, std::initializer_list<std::u8string_view> message_parts)
    {
        if (m_logger.can_log(Severity::error)) {
            const std::pmr::u8string message = joined(message_parts, m_memory);
            m_logger.try_log(Severity::error, id, {}, message);
        }
    }

    Style_Config_Error type_error(
        std::u8string_view subject,
        std::u8string_view expected,
        const json::Value& actual
    )
    {
        log_error(
            diagnostic::config_type,
            { subject, u8" has to be "sv, expected, u8", but is "sv, json::type_name(actual),
              u8"."sv }
        );
        return Style_Config_Error::invalid_type;
    }

    Style_Config_Error property_type_error(
        std::u8string_view style_name,
        std::u8string_view key,
        std::u8string_view expected,
        const json::Value& actual
    )
    {
        const std::pmr::u8string subject = joined(
            { u8"The property \""sv, key, u8"\" of the style \""sv, style_name, u8"\""sv },
            m_memory
        );
        return type_error(subject, expected, actual);
    }

    void warn_unknown_property(std::u8string_view key, std::span<const std::u8string_view> known)
    {
        if (!m_logger.can_log(Severity::warning)) {
            return;
        }
        const Distant<std::u8string_view> correction
            = find_typo_correction(known, key, max_typo_distance, m_memory);
        const std::pmr::u8string message = correction
            ? joined({ u8"Unknown property \""sv, key, u8"\" is ignored. Did you mean \""sv,
                       correction.value, u8"\"?"sv },
                     m_memory)
            : joined({ u8"Unknown property \""sv, key, u8"\" is ignored."sv }, m_memory);
        m_logger.try_log(Severity::warning, diagnostic::config_property_unknown, {}, message);
    }
};

} // namespace

Result<void, Style_Config_Error> load_style_config(
    Style_Registry& registry,
    std::u8string_view json_source,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    Style_Config_Loader loader { logger, memory };
    if (auto r = loader.load(json_source); !r) {
        return r;
    }
    loader.commit(registry);
    return {};
}

} // namespace richtext
