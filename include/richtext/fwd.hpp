#ifndef RICHTEXT_FWD_HPP
#define RICHTEXT_FWD_HPP

#include "richtext/settings.hpp"

RICHTEXT_IF_DEBUG() // silence unused warning for settings.hpp

namespace richtext {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define RICHTEXT_ENUM_STRING_CASE8(...)                                                            \
    case __VA_ARGS__: return u8## #__VA_ARGS__

template <typename>
struct Annotation_Span;
template <typename, typename>
struct Basic_Annotated_String;
template <typename>
struct Basic_Transparent_String_View_Equals;
template <typename>
struct Basic_Transparent_String_View_Hash;
struct Collecting_Logger;
struct Color;
struct Diagnostic;
enum struct Diagnostic_Highlight : Default_Underlying;
struct Error_Tag;
struct Ignorant_Logger;
enum struct IO_Error_Code : Default_Underlying;
struct Logger;
struct Malformed_Markup;
enum struct Render_Format : Default_Underlying;
template <typename, typename>
struct Result;
struct Rich_Text;
struct Segment;
enum struct Severity : Default_Underlying;
enum struct Sign_Policy : Default_Underlying;
struct Source_Position;
struct Source_Span;
struct Style;
enum struct Style_Config_Error : Default_Underlying;
struct Style_Registry;
struct Styled_Span;
struct Success_Tag;
struct Tag;
struct Token;
enum struct Token_Kind : Default_Underlying;

template <typename T>
using Annotated_String8 = Basic_Annotated_String<char8_t, T>;

using Diagnostic_String = Annotated_String8<Diagnostic_Highlight>;

using Transparent_String_View_Equals8 = Basic_Transparent_String_View_Equals<char8_t>;
using Transparent_String_View_Hash8 = Basic_Transparent_String_View_Hash<char8_t>;

} // namespace richtext

#endif
