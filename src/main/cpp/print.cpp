#include <algorithm>
#include <cstddef>
#include <iostream>
#include <string_view>
#include <vector>

#include "richtext/util/annotated_string.hpp"
#include "richtext/util/ansi.hpp"
#include "richtext/util/assert.hpp"
#include "richtext/util/io.hpp"
#include "richtext/util/severity.hpp"
#include "richtext/util/source_position.hpp"
#include "richtext/util/strings.hpp"
#include "richtext/util/tty.hpp"

#include "richtext/diagnostic.hpp"
#include "richtext/diagnostic_highlight.hpp"
#include "richtext/print.hpp"

namespace richtext {

namespace {

[[nodiscard]]
std::u8string_view diagnostic_highlight_ansi_sequence(Diagnostic_Highlight type)
{
    switch (type) {
        using enum Diagnostic_Highlight;

    case text:
    case code_citation:
    case punctuation: return ansi::reset;

    case code_position:
    case diagnostic_id:
    case internal: return ansi::h_black;

    case error_text:
    case error: return ansi::h_red;

    case warning:
    case line_number: return ansi::h_yellow;

    case note: return ansi::h_white;

    case position_indicator: return ansi::h_green;

    case tag: return ansi::h_blue;

    case escape: return ansi::h_magenta;
    }
    RICHTEXT_ASSERT_UNREACHABLE(u8"Unknown diagnostic highlight.");
}

[[nodiscard]]
Diagnostic_Highlight severity_highlight(Severity severity)
{
    return severity >= Severity::error ? Diagnostic_Highlight::error
        : severity >= Severity::soft_warning ? Diagnostic_Highlight::warning
                                             : Diagnostic_Highlight::note;
}

[[nodiscard]]
std::size_t count_decimal_digits(std::size_t x)
{
    std::size_t result = 1;
    for (; x >= 10; x /= 10) {
        ++result;
    }
    return result;
}

} // namespace

void print_file_position(
    Diagnostic_String& out,
    std::u8string_view file,
    const Source_Position& pos,
    bool colon_suffix
)
{
    auto builder = out.build(Diagnostic_Highlight::code_position);
    builder.append(file)
        .append(u8':')
        .append_integer(pos.line + 1)
        .append(u8':')
        .append_integer(pos.column + 1);
    if (colon_suffix) {
        builder.append(u8':');
    }
}

void print_affected_line(Diagnostic_String& out, std::u8string_view source, const Source_Span& pos)
{
    RICHTEXT_ASSERT(!pos.empty());

    // Multi-line spans only have their first line cited.
    const std::u8string_view cited_code = find_line(source, pos.begin);

    const std::size_t line_digits = count_decimal_digits(pos.line + 1);
    constexpr std::size_t pad_max = 6;
    const std::size_t pad_length = pad_max - std::min(line_digits, std::size_t { pad_max - 1 });
    out.append(pad_length, u8' ');
    out.append_integer(pos.line + 1, Diagnostic_Highlight::line_number);
    out.append(u8' ');
    out.append(u8'|', Diagnostic_Highlight::punctuation);
    out.append(u8' ');
    if (!cited_code.empty()) {
        out.append(cited_code, Diagnostic_Highlight::code_citation);
    }
    out.append(u8'\n');

    const std::size_t align_length = std::max(pad_max, line_digits + 1);
    out.append(align_length, u8' ');
    out.append(u8' ');
    out.append(u8'|', Diagnostic_Highlight::punctuation);
    out.append(u8' ');
    out.append(pos.column, u8' ');
    {
        const std::size_t available
            = cited_code.length() > pos.column ? cited_code.length() - pos.column : 1;
        const std::size_t indicator_length = std::min(pos.length, available);
        auto position = out.build(Diagnostic_Highlight::position_indicator);
        position.append(u8'^');
        if (indicator_length > 1) {
            position.append(indicator_length - 1, u8'~');
        }
    }
    out.append(u8'\n');
}

std::u8string_view find_line(std::u8string_view source, std::size_t index)
{
    RICHTEXT_ASSERT(index <= source.size());
    if (source.empty()) {
        return {};
    }

    if (index == source.size() || (source[index] == u8'\n' && index != 0)) {
        // Special case for EOF positions, which may be past the end of a line,
        // and even past the end of the whole source, but only by a single character.
        // For such positions, we yield the currently ended line.
        --index;
    }

    std::size_t begin = index == 0 ? std::u8string_view::npos : source.rfind(u8'\n', index - 1);
    begin = begin != std::u8string_view::npos ? begin + 1 : 0;

    const std::size_t end = std::min(source.find(u8'\n', index), source.size());

    return source.substr(begin, end - begin);
}

void print_location_of_file(Diagnostic_String& out, std::u8string_view file)
{
    out.build(Diagnostic_Highlight::code_position).append(file).append(u8':');
}

void print_diagnostic(
    Diagnostic_String& out,
    std::u8string_view file,
    std::u8string_view source,
    const Diagnostic& diagnostic
)
{
    out.append(severity_tag(diagnostic.severity), severity_highlight(diagnostic.severity));
    out.append(u8": ");
    if (diagnostic.location.empty()) {
        print_location_of_file(out, file);
    }
    else {
        print_file_position(out, file, diagnostic.location);
    }
    out.append(u8' ');
    if (!diagnostic.message.empty()) {
        out.append(diagnostic.message, Diagnostic_Highlight::text);
    }
    out.append(u8' ');
    out.build(Diagnostic_Highlight::diagnostic_id)
        .append(u8'[')
        .append(diagnostic.id)
        .append(u8']');
    out.append(u8'\n');
    if (!diagnostic.location.empty()) {
        print_affected_line(out, source, diagnostic.location);
    }
}

void dump_code_string(std::pmr::vector<char8_t>& out, const Diagnostic_String& string, bool colors)
{
    const std::u8string_view text = string.get_text();
    if (!colors) {
        append(out, text);
        return;
    }

    std::size_t previous_end = 0;
    for (const Annotation_Span<Diagnostic_Highlight> span : string) {
        RICHTEXT_ASSERT(span.begin >= previous_end);
        if (previous_end != span.begin) {
            append(out, text.substr(previous_end, span.begin - previous_end));
        }
        append(out, diagnostic_highlight_ansi_sequence(span.value));
        append(out, text.substr(span.begin, span.length));
        append(out, ansi::reset);
        previous_end = span.end();
    }
    if (previous_end != text.size()) {
        append(out, text.substr(previous_end));
    }
}

namespace {

[[nodiscard]]
std::u8string_view to_prose(IO_Error_Code e)
{
    using enum IO_Error_Code;
    switch (e) {
    case cannot_open: //
        return u8"Failed to open file.";
    case read_error: //
        return u8"I/O error occurred when reading from file.";
    case write_error: //
        return u8"I/O error occurred when writing to file.";
    case corrupted: //
        return u8"Data in the file is corrupted (not properly encoded).";
    }
    RICHTEXT_ASSERT_UNREACHABLE(u8"invalid error code");
}

} // namespace

void print_io_error(Diagnostic_String& out, std::u8string_view file, IO_Error_Code error)
{
    print_location_of_file(out, file);
    out.append(u8' ');
    out.append(to_prose(error), Diagnostic_Highlight::text);
    out.append(u8'\n');
}

std::ostream& print_code_string(std::ostream& out, const Diagnostic_String& string, bool colors)
{
    std::pmr::vector<char8_t> buffer;
    dump_code_string(buffer, string, colors);
    return out << as_string_view(as_u8string_view(buffer));
}

void print_code_string_stdout(const Diagnostic_String& string)
{
    print_code_string(std::cout, string, is_stdout_tty);
}

void print_code_string_stderr(const Diagnostic_String& string)
{
    print_code_string(std::cerr, string, is_stderr_tty);
}

} // namespace richtext
