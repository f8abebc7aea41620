#ifndef RICHTEXT_DIAGNOSTIC_HIGHLIGHT_HPP
#define RICHTEXT_DIAGNOSTIC_HIGHLIGHT_HPP

#include "richtext/fwd.hpp"

namespace richtext {

enum struct Diagnostic_Highlight : Default_Underlying {
    text,
    error_text,
    code_position,
    error,
    warning,
    note,
    diagnostic_id,
    line_number,
    punctuation,
    position_indicator,
    code_citation,
    tag,
    escape,
    internal,
};

} // namespace richtext

#endif
