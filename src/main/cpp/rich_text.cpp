#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "richtext/util/result.hpp"

#include "richtext/compile.hpp"
#include "richtext/logger.hpp"
#include "richtext/rich_text.hpp"
#include "richtext/spans.hpp"
#include "richtext/style_registry.hpp"

namespace richtext {

bool Rich_Text::is_stale(const Style_Registry& registry) const
{
    return m_dirty || m_cached_generation != registry.get_generation();
}

std::span<const Styled_Span> Rich_Text::get_spans(const Style_Registry& registry, Logger& logger)
{
    if (!is_stale(registry)) {
        return m_spans;
    }
    std::pmr::memory_resource* const memory = m_spans.get_allocator().resource();

    m_spans.clear();
    std::pmr::vector<Segment> segments { memory };
    if (const Result<void, Malformed_Markup> r = compile(segments, m_markup, logger)) {
        build_spans(m_spans, segments, registry, logger);
    }
    // Malformed markup, as well as markup without any text, is shown as empty default text.
    if (m_spans.empty()) {
        m_spans.push_back(
            Styled_Span { .text = std::pmr::u8string { memory }, .style = registry.get_default() }
        );
    }

    m_cached_generation = registry.get_generation();
    m_dirty = false;
    return m_spans;
}

std::optional<std::pmr::u8string> Rich_Text::get_plain_text() const
{
    std::pmr::memory_resource* const memory = m_markup.get_allocator().resource();
    std::pmr::vector<Segment> segments { memory };
    if (!compile(segments, m_markup)) {
        return {};
    }
    std::pmr::u8string result { memory };
    concatenate_text(result, segments);
    return result;
}

} // namespace richtext
