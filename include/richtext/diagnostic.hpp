#ifndef RICHTEXT_DIAGNOSTIC_HPP
#define RICHTEXT_DIAGNOSTIC_HPP

#include <string_view>

#include "richtext/util/severity.hpp"
#include "richtext/util/source_position.hpp"

#include "richtext/fwd.hpp"

namespace richtext {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The span of source text that is responsible for this diagnostic.
    /// An empty span refers to the source as a whole rather than any particular position.
    Source_Span location;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// MARKUP DIAGNOSTICS ==============================================================================

/// @brief A directive was opened with `[`, but there is no matching `]`.
inline constexpr std::u8string_view markup_unterminated = u8"markup.unterminated";

/// @brief A directive contains an empty tag name,
/// such as in `[a,,b]` or `[a,]`.
inline constexpr std::u8string_view markup_tag_empty = u8"markup.tag.empty";

/// @brief A directive contains the same tag name more than once, like `[a,a]`.
inline constexpr std::u8string_view markup_tag_duplicate = u8"markup.tag.duplicate";

// STYLE DIAGNOSTICS ===============================================================================

/// @brief A tag was used in markup, but no style is registered under that name.
/// The default style is used instead.
inline constexpr std::u8string_view style_tag_unknown = u8"style.tag.unknown";

// STYLE CONFIGURATION DIAGNOSTICS =================================================================

/// @brief The style configuration is not valid JSON.
inline constexpr std::u8string_view config_json = u8"style-config.json";

/// @brief A value in the style configuration has the wrong type,
/// like a number where a string was expected.
inline constexpr std::u8string_view config_type = u8"style-config.type";

/// @brief A property in the style configuration is not known, and was ignored.
inline constexpr std::u8string_view config_property_unknown = u8"style-config.property.unknown";

/// @brief A color in the style configuration could not be parsed.
inline constexpr std::u8string_view config_color = u8"style-config.color";

/// @brief A font size in the style configuration is not a positive number.
inline constexpr std::u8string_view config_font_size = u8"style-config.font-size";

// COMMAND-LINE DIAGNOSTICS ========================================================================

/// @brief A file could not be read or written.
inline constexpr std::u8string_view file_io = u8"file.io";

} // namespace diagnostic

} // namespace richtext

#endif
