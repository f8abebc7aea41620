#ifndef RICHTEXT_PRINT_HPP
#define RICHTEXT_PRINT_HPP

#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>

#include "richtext/util/annotated_string.hpp"
#include "richtext/util/io.hpp"
#include "richtext/util/source_position.hpp"

#include "richtext/diagnostic_highlight.hpp"
#include "richtext/fwd.hpp"

namespace richtext {

/// @brief Returns the line that contains the given index.
/// @param source the source string
/// @param index the index within the source string, in range `[0, source.size()]`
/// @return A line which contains the given `index`.
[[nodiscard]]
std::u8string_view find_line(std::u8string_view source, std::size_t index);

/// @brief Prints the location of the file nicely formatted.
/// @param out the string to write to
/// @param file the file
void print_location_of_file(Diagnostic_String& out, std::u8string_view file);

/// @brief Prints a position within a file, consisting of the file name and line/column.
/// @param out the string to write to
/// @param file the file
/// @param pos the position within the file
/// @param colon_suffix if `true`, appends a `:` to the string as part of the same token
void print_file_position(
    Diagnostic_String& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colon_suffix = true
);

/// @brief Prints the contents of the affected line within `source` as well as position indicators
/// which show the span which is affected by some diagnostic.
/// @param out the string to write to
/// @param source the markup source
/// @param pos the position within the source
void print_affected_line(Diagnostic_String& out, std::u8string_view source, const Source_Span& pos);

/// @brief Prints a diagnostic as `SEVERITY: file:line:column: message [id]`,
/// followed by the affected line if the diagnostic location is not empty.
void print_diagnostic(
    Diagnostic_String& out,
    std::u8string_view file,
    std::u8string_view source,
    const Diagnostic& diagnostic
);

void print_io_error(Diagnostic_String& out, std::u8string_view file, IO_Error_Code error);

void dump_code_string(std::pmr::vector<char8_t>& out, const Diagnostic_String& string, bool colors);

std::ostream& print_code_string(std::ostream& out, const Diagnostic_String& string, bool colors);

void print_code_string_stdout(const Diagnostic_String&);
void print_code_string_stderr(const Diagnostic_String&);

} // namespace richtext

#endif
