#ifndef RICHTEXT_ASSERT_HPP
#define RICHTEXT_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace richtext {

using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;

#define RICHTEXT_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define RICHTEXT_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define RICHTEXT_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)
#define RICHTEXT_DEBUG_ASSERT_UNREACHABLE(...) ULIGHT_DEBUG_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace richtext

#endif
