#ifndef RICHTEXT_COLLECTING_LOGGER_HPP
#define RICHTEXT_COLLECTING_LOGGER_HPP

#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "richtext/util/severity.hpp"
#include "richtext/util/source_position.hpp"

#include "richtext/diagnostic.hpp"
#include "richtext/logger.hpp"

namespace richtext {

struct Collected_Diagnostic {
    Severity severity;
    std::pmr::u8string id;
    Source_Span location;
    std::pmr::u8string message;

    [[nodiscard]]
    Collected_Diagnostic(const Diagnostic& d, std::pmr::memory_resource* const memory)
        : severity { d.severity }
        , id { d.id, memory }
        , location { d.location }
        , message { d.message, memory }
    {
    }
};

/// @brief A `Logger` which stores every diagnostic it receives.
struct Collecting_Logger final : Logger {
    std::pmr::vector<Collected_Diagnostic> diagnostics;

    [[nodiscard]]
    explicit Collecting_Logger(
        std::pmr::memory_resource* const memory,
        Severity min_severity = Severity::min
    )
        : Logger { min_severity }
        , diagnostics { memory }
    {
    }

    void operator()(const Diagnostic diagnostic) final
    {
        std::pmr::memory_resource* const memory = diagnostics.get_allocator().resource();
        diagnostics.emplace_back(diagnostic, memory);
    }

    [[nodiscard]]
    bool nothing_logged() const
    {
        return diagnostics.empty();
    }

    [[nodiscard]]
    bool was_logged(const std::u8string_view id) const
    {
        return std::ranges::find(diagnostics, id, &Collected_Diagnostic::id) != diagnostics.end();
    }

    [[nodiscard]]
    std::size_t count(const std::u8string_view id) const
    {
        return std::size_t(std::ranges::count(diagnostics, id, &Collected_Diagnostic::id));
    }

    [[nodiscard]]
    bool any_at_least(const Severity severity) const
    {
        return std::ranges::any_of(diagnostics, [&](const Collected_Diagnostic& d) {
            return d.severity >= severity;
        });
    }
};

} // namespace richtext

#endif
