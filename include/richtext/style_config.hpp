#ifndef RICHTEXT_STYLE_CONFIG_HPP
#define RICHTEXT_STYLE_CONFIG_HPP

#include <memory_resource>
#include <string_view>

#include "richtext/util/result.hpp"

#include "richtext/fwd.hpp"
#include "richtext/logger.hpp"

namespace richtext {

#define RICHTEXT_STYLE_CONFIG_ERROR_ENUM_DATA(F)                                                   \
    F(invalid_json)                                                                                \
    F(invalid_type)                                                                                \
    F(invalid_color)                                                                               \
    F(invalid_font_size)

#define RICHTEXT_STYLE_CONFIG_ERROR_ENUMERATOR(id) id,

enum struct Style_Config_Error : Default_Underlying {
    RICHTEXT_STYLE_CONFIG_ERROR_ENUM_DATA(RICHTEXT_STYLE_CONFIG_ERROR_ENUMERATOR)
};

[[nodiscard]]
std::u8string_view style_config_error_name(Style_Config_Error error);

/// @brief Loads styles from JSON into `registry`.
/// The JSON may contain comments, and has the form:
/// ```json
/// {
///     "default": { "color": "#ffffff" },
///     "styles": {
///         "lg": { "font_size": 40 },
///         "red": { "color": { "h": 0, "s": 0.9, "l": 0.7 } }
///     }
/// }
/// ```
/// Existing styles with the same names are replaced.
/// Unknown properties are ignored with a warning.
///
/// If an error is returned, it has also been logged, and `registry` is left unchanged.
[[nodiscard]]
Result<void, Style_Config_Error> load_style_config(
    Style_Registry& registry,
    std::u8string_view json_source,
    Logger& logger,
    std::pmr::memory_resource* memory
);

} // namespace richtext

#endif
