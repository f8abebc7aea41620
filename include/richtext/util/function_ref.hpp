#ifndef RICHTEXT_FUNCTION_REF_HPP
#define RICHTEXT_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace richtext {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace richtext

#endif
