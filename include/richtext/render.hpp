#ifndef RICHTEXT_RENDER_HPP
#define RICHTEXT_RENDER_HPP

#include <span>
#include <string_view>
#include <vector>

#include "richtext/fwd.hpp"

namespace richtext {

enum struct Render_Format : Default_Underlying {
    /// @brief Text with ANSI escape sequences (SGR) for every styled span.
    ansi,
    /// @brief Text only, without any styling.
    plain,
    /// @brief One line per compiled segment, listing its active tags.
    segments,
};

/// @brief Returns the name of the format, i.e. `"ansi"`, `"plain"`, or `"segments"`.
[[nodiscard]]
std::u8string_view render_format_name(Render_Format format);

/// @brief Appends the text of every span to `out`, ignoring styles.
void render_plain(std::pmr::vector<char8_t>& out, std::span<const Styled_Span> spans);

/// @brief Appends the text of every span to `out`,
/// where each span is preceded by an SGR sequence expressing its style and followed by a reset.
/// Only the foreground and background colors,
/// as well as bold, italic, underline, and strikethrough are expressed.
/// Spans without any of those attributes are appended as is.
void render_ansi(std::pmr::vector<char8_t>& out, std::span<const Styled_Span> spans);

/// @brief Appends one line per segment to `out`, in the form `"text" [tag, tag]`.
/// Within the quoted text, `"`, `\`, and line breaks are escaped.
void dump_segments(std::pmr::vector<char8_t>& out, std::span<const Segment> segments);

} // namespace richtext

#endif
