#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "richtext/util/annotated_string.hpp"
#include "richtext/util/io.hpp"
#include "richtext/util/result.hpp"
#include "richtext/util/strings.hpp"
#include "richtext/util/tty.hpp"

#include "richtext/compile.hpp"
#include "richtext/fwd.hpp"
#include "richtext/logger.hpp"
#include "richtext/print.hpp"
#include "richtext/render.hpp"
#include "richtext/spans.hpp"
#include "richtext/style_config.hpp"
#include "richtext/style_registry.hpp"

namespace richtext {
namespace {

/// @brief Prints diagnostics for a single file to stderr.
struct Stderr_Logger final : Logger {
    const std::u8string_view file_name;
    const std::u8string_view file_source;
    Diagnostic_String out;
    bool any_errors = false;

    [[nodiscard]]
    Stderr_Logger(
        Severity min_severity,
        std::u8string_view file_name,
        std::u8string_view file_source,
        std::pmr::memory_resource* memory
    )
        : Logger { min_severity }
        , file_name { file_name }
        , file_source { file_source }
        , out { memory }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        any_errors |= diagnostic.severity >= Severity::error;

        print_diagnostic(out, file_name, file_source, diagnostic);
        print_code_string_stderr(out);
        out.clear();
    }
};

void print_io_error_stderr(
    std::u8string_view file,
    IO_Error_Code error,
    std::pmr::memory_resource* memory
)
{
    Diagnostic_String out { memory };
    print_io_error(out, file, error);
    print_code_string_stderr(out);
}

int main(int argc, const char* const* const argv)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "min", Severity::min },
        { "trace", Severity::trace },
        { "debug", Severity::debug },
        { "info", Severity::info },
        { "soft_warning", Severity::soft_warning },
        { "warning", Severity::warning },
        { "error", Severity::error },
        { "fatal", Severity::fatal },
        { "none", Severity::none },
    };
    static const std::unordered_map<std::string, Render_Format> format_arg_map = [] {
        std::unordered_map<std::string, Render_Format> result;
        for (const Render_Format format :
             { Render_Format::ansi, Render_Format::plain, Render_Format::segments }) {
            result.emplace(as_string_view(render_format_name(format)), format);
        }
        return result;
    }();

    args::ArgumentParser parser { "Compiles tagged markup like \"[lg]Hello [lg,fancy]World\" "
                                  "into styled text." };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::Positional<std::string> input_arg {
        parser,
        "input",
        "Input markup file",
        args::Options::Required,
    };
    args::ValueFlag<std::string> styles_arg {
        parser,
        "styles",
        "JSON file containing the style of every tag",
        { 's', "styles" },
    };
    args::MapFlag<std::string, Render_Format> format_arg {
        parser,
        "format",
        "Output format (default: ansi if stdout is a terminal, otherwise plain)",
        { 'f', "format" },
        format_arg_map,
    };
    args::ValueFlag<std::string> output_arg {
        parser,
        "output",
        "Output file (default: stdout)",
        { 'o', "output" },
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::info,
    };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };

    if (argc <= 1) {
        parser.Help(std::cout);
        return EXIT_FAILURE;
    }
    if (!parser.ParseCLI(argc, argv) || parser.GetError() != args::Error::None) {
        std::cerr << parser.GetErrorMsg() << '\n';
        return EXIT_FAILURE;
    }
    if (help_arg.Matched()) {
        parser.Help(std::cout);
        return EXIT_SUCCESS;
    }

    std::pmr::unsynchronized_pool_resource memory;
    const Severity min_severity = severity_arg.Get();

    const std::string in_path = input_arg.Get();
    const std::u8string_view in_path_u8 = as_u8string_view(in_path);
    const Result<std::pmr::vector<char8_t>, IO_Error_Code> in_text
        = load_utf8_file(in_path_u8, &memory);
    if (!in_text) {
        print_io_error_stderr(in_path_u8, in_text.error(), &memory);
        return EXIT_FAILURE;
    }
    const std::u8string_view in_source = as_u8string_view(*in_text);

    Style_Registry registry { &memory };
    if (styles_arg) {
        const std::string styles_path = styles_arg.Get();
        const std::u8string_view styles_path_u8 = as_u8string_view(styles_path);
        const Result<std::pmr::vector<char8_t>, IO_Error_Code> styles_text
            = load_utf8_file(styles_path_u8, &memory);
        if (!styles_text) {
            print_io_error_stderr(styles_path_u8, styles_text.error(), &memory);
            return EXIT_FAILURE;
        }
        const std::u8string_view styles_source = as_u8string_view(*styles_text);
        Stderr_Logger styles_logger { min_severity, styles_path_u8, styles_source, &memory };
        if (!load_style_config(registry, styles_source, styles_logger, &memory)) {
            return EXIT_FAILURE;
        }
    }

    const Render_Format format = format_arg
        ? format_arg.Get()
        : is_stdout_tty ? Render_Format::ansi
                        : Render_Format::plain;

    Stderr_Logger logger { min_severity, in_path_u8, in_source, &memory };
    std::pmr::vector<Segment> segments { &memory };
    if (!compile(segments, in_source, logger)) {
        return EXIT_FAILURE;
    }

    std::pmr::vector<char8_t> output { &memory };
    if (format == Render_Format::segments) {
        dump_segments(output, segments);
    }
    else {
        std::pmr::vector<Styled_Span> spans { &memory };
        build_spans(spans, segments, registry, logger);
        if (format == Render_Format::ansi) {
            render_ansi(output, spans);
        }
        else {
            render_plain(output, spans);
        }
    }

    if (output_arg) {
        const std::string out_path = output_arg.Get();
        const std::u8string_view out_path_u8 = as_u8string_view(out_path);
        if (const Result<void, IO_Error_Code> r = bytes_to_file(output, out_path_u8); !r) {
            print_io_error_stderr(out_path_u8, r.error(), &memory);
            return EXIT_FAILURE;
        }
    }
    else if (std::fwrite(output.data(), 1, output.size(), stdout) != output.size()) {
        print_io_error_stderr(u8"<stdout>", IO_Error_Code::write_error, &memory);
        return EXIT_FAILURE;
    }

    return logger.any_errors ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace richtext

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char* const* argv)
{
    return richtext::main(argc, argv);
}
