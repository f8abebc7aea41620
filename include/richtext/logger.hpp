#ifndef RICHTEXT_LOGGER_HPP
#define RICHTEXT_LOGGER_HPP

#include <string_view>

#include "richtext/util/assert.hpp"
#include "richtext/util/severity.hpp"
#include "richtext/util/source_position.hpp"

#include "richtext/diagnostic.hpp"
#include "richtext/fwd.hpp"

namespace richtext {

/// @brief Receives diagnostics from the compiler, span builder, and configuration loader.
/// Diagnostics below the minimum severity should not be passed to `operator()`;
/// callers check `can_log` first so that no message is built needlessly.
struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        RICHTEXT_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Logs the diagnostic if its severity is at least the minimum severity.
    void try_log(
        Severity severity,
        std::u8string_view id,
        const Source_Span& location,
        std::u8string_view message
    )
    {
        if (can_log(severity)) {
            (*this)(Diagnostic { severity, id, location, message });
        }
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace richtext

#endif
