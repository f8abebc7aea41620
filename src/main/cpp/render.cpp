#include <charconv>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

#include "richtext/util/ansi.hpp"
#include "richtext/util/assert.hpp"
#include "richtext/util/strings.hpp"

#include "richtext/compile.hpp"
#include "richtext/render.hpp"
#include "richtext/spans.hpp"
#include "richtext/style.hpp"

using namespace std::string_view_literals;

namespace richtext {

std::u8string_view render_format_name(Render_Format format)
{
    using enum Render_Format;
    switch (format) {
        RICHTEXT_ENUM_STRING_CASE8(ansi);
        RICHTEXT_ENUM_STRING_CASE8(plain);
        RICHTEXT_ENUM_STRING_CASE8(segments);
    }
    RICHTEXT_ASSERT_UNREACHABLE(u8"Invalid Render_Format.");
}

namespace {

void append_byte(std::pmr::vector<char8_t>& out, std::uint8_t x)
{
    char buffer[3];
    const std::to_chars_result r = std::to_chars(std::begin(buffer), std::end(buffer), x);
    RICHTEXT_ASSERT(r.ec == std::errc {});
    append(out, as_u8string_view(std::string_view { buffer, r.ptr }));
}

struct SGR_Builder {
    std::pmr::vector<char8_t>& out;
    bool first = true;

    void parameter(std::u8string_view p)
    {
        append(out, first ? ansi::csi : u8";"sv);
        first = false;
        append(out, p);
    }

    void rgb(std::u8string_view prefix, Color color)
    {
        parameter(prefix);
        for (const std::uint8_t channel : { color.r, color.g, color.b }) {
            out.push_back(u8';');
            append_byte(out, channel);
        }
    }

    // Returns true if any parameter was written.
    bool finish()
    {
        if (!first) {
            out.push_back(ansi::sgr_end);
        }
        return !first;
    }
};

// Appends text, but drops control characters other than line feed and tab,
// so that text cannot emit escape sequences of its own.
// C1 controls (U+0080 to U+009F) are dropped as well.
void append_without_controls(std::pmr::vector<char8_t>& out, std::u8string_view text)
{
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char8_t c = text[i];
        if (c == u8'\n' || c == u8'\t') {
            out.push_back(c);
            continue;
        }
        if (c < 0x20 || c == 0x7F) {
            continue;
        }
        if (c == 0xC2 && i + 1 < text.size() && text[i + 1] >= 0x80 && text[i + 1] <= 0x9F) {
            ++i;
            continue;
        }
        out.push_back(c);
    }
}

void append_quoted(std::pmr::vector<char8_t>& out, std::u8string_view text)
{
    out.push_back(u8'"');
    for (const char8_t c : text) {
        switch (c) {
        case u8'"': append(out, u8"\\\""sv); break;
        case u8'\\': append(out, u8"\\\\"sv); break;
        case u8'\n': append(out, u8"\\n"sv); break;
        case u8'\r': append(out, u8"\\r"sv); break;
        case u8'\t': append(out, u8"\\t"sv); break;
        default: out.push_back(c); break;
        }
    }
    out.push_back(u8'"');
}

} // namespace

void render_plain(std::pmr::vector<char8_t>& out, std::span<const Styled_Span> spans)
{
    for (const Styled_Span& span : spans) {
        append(out, span.text);
    }
}

void render_ansi(std::pmr::vector<char8_t>& out, std::span<const Styled_Span> spans)
{
    for (const Styled_Span& span : spans) {
        if (span.text.empty()) {
            continue;
        }
        const Style& style = span.style;
        SGR_Builder sgr { out };
        if (style.bold.value_or(false)) {
            sgr.parameter(ansi::sgr_bold);
        }
        if (style.italic.value_or(false)) {
            sgr.parameter(ansi::sgr_italic);
        }
        if (style.underline.value_or(false)) {
            sgr.parameter(ansi::sgr_underline);
        }
        if (style.strikethrough.value_or(false)) {
            sgr.parameter(ansi::sgr_strikethrough);
        }
        if (style.color) {
            sgr.rgb(ansi::sgr_foreground_rgb, *style.color);
        }
        if (style.background) {
            sgr.rgb(ansi::sgr_background_rgb, *style.background);
        }
        const bool styled = sgr.finish();
        append_without_controls(out, span.text);
        if (styled) {
            append(out, ansi::reset);
        }
    }
}

void dump_segments(std::pmr::vector<char8_t>& out, std::span<const Segment> segments)
{
    for (const Segment& segment : segments) {
        append_quoted(out, segment.text);
        append(out, u8" ["sv);
        bool first = true;
        for (const Tag& tag : segment.tags) {
            if (!first) {
                append(out, u8", "sv);
            }
            first = false;
            append(out, tag.name);
        }
        append(out, u8"]\n"sv);
    }
}

} // namespace richtext
