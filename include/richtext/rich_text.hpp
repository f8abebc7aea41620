#ifndef RICHTEXT_RICH_TEXT_HPP
#define RICHTEXT_RICH_TEXT_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "richtext/fwd.hpp"
#include "richtext/logger.hpp"
#include "richtext/spans.hpp"

namespace richtext {

/// @brief Markup together with a cache of the styled spans it produces.
/// The spans are rebuilt lazily,
/// once the markup changes or the `Style_Registry` has been mutated.
struct Rich_Text {
private:
    std::pmr::u8string m_markup;
    std::pmr::vector<Styled_Span> m_spans;
    // Generation of the registry which m_spans were built with.
    std::size_t m_cached_generation = 0;
    bool m_dirty = true;

public:
    [[nodiscard]]
    explicit Rich_Text(
        std::u8string_view markup = {},
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    )
        : m_markup { markup, memory }
        , m_spans { memory }
    {
    }

    [[nodiscard]]
    std::u8string_view get_markup() const
    {
        return m_markup;
    }

    void set_markup(std::u8string_view markup)
    {
        m_markup = markup;
        m_dirty = true;
    }

    /// @brief Returns the styled spans of the markup,
    /// rebuilding them if they are out of date with respect to the markup or `registry`.
    ///
    /// If the markup is malformed, the error is logged,
    /// and the result is a single empty span with the default style.
    /// The same span is the result for markup without text, such as `""` or `"[lg]"`,
    /// so the result is never empty.
    /// Diagnostics are only logged when the spans are rebuilt.
    [[nodiscard]]
    std::span<const Styled_Span>
    get_spans(const Style_Registry& registry, Logger& logger = ignorant_logger);

    /// @brief Returns `true` if the next call to `get_spans` with `registry`
    /// would rebuild the spans.
    [[nodiscard]]
    bool is_stale(const Style_Registry& registry) const;

    /// @brief Returns the markup without directives and with escape sequences decoded,
    /// or nothing if the markup is malformed.
    [[nodiscard]]
    std::optional<std::pmr::u8string> get_plain_text() const;
};

} // namespace richtext

#endif
