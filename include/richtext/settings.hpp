#ifndef RICHTEXT_SETTINGS_HPP
#define RICHTEXT_SETTINGS_HPP

#include <cstddef>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define RICHTEXT_DEBUG 1
#define RICHTEXT_IF_DEBUG(...) __VA_ARGS__
#define RICHTEXT_IF_NOT_DEBUG(...)
#else // release builds
#define RICHTEXT_IF_DEBUG(...)
#define RICHTEXT_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifdef ULIGHT_CLANG
#define RICHTEXT_CLANG 1
#endif

#ifdef ULIGHT_GCC
#define RICHTEXT_GCC 1
#endif

#ifdef ULIGHT_EXCEPTIONS
#define RICHTEXT_EXCEPTIONS ULIGHT_EXCEPTIONS
#endif

namespace richtext {

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = RICHTEXT_IF_DEBUG(true) RICHTEXT_IF_NOT_DEBUG(false);

/// @brief The maximum Levenshtein distance at which an unknown name
/// is still considered a typo of a known name.
inline constexpr std::size_t max_typo_distance = 2;

} // namespace richtext

#endif
