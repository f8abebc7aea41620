#include <algorithm>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "richtext/util/strings.hpp"
#include "richtext/util/typo.hpp"

#include "richtext/compile.hpp"
#include "richtext/diagnostic.hpp"
#include "richtext/logger.hpp"
#include "richtext/settings.hpp"
#include "richtext/spans.hpp"
#include "richtext/style.hpp"
#include "richtext/style_registry.hpp"

using namespace std::string_view_literals;

namespace richtext {
namespace {

void warn_unknown_tag(
    const Tag& tag,
    const Style_Registry& registry,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    if (!logger.can_log(Severity::warning)) {
        return;
    }
    std::pmr::vector<std::u8string_view> names { memory };
    registry.tag_names(names);

    const Distant<std::u8string_view> correction
        = find_typo_correction(names, tag.name, max_typo_distance, memory);
    const std::pmr::u8string message = correction
        ? joined({ u8"No style is registered for the tag \""sv, tag.name,
                   u8"\". Did you mean \""sv, correction.value, u8"\"?"sv },
                 memory)
        : joined({ u8"No style is registered for the tag \""sv, tag.name,
                   u8"\". The default style is used instead."sv },
                 memory);
    logger.try_log(Severity::warning, diagnostic::style_tag_unknown, tag.location, message);
}

} // namespace

void build_spans(
    std::pmr::vector<Styled_Span>& out,
    std::span<const Segment> segments,
    const Style_Registry& registry,
    Logger& logger
)
{
    std::pmr::memory_resource* const memory = out.get_allocator().resource();
    std::pmr::vector<std::u8string_view> warned_tags { memory };

    for (const Segment& segment : segments) {
        Style style = registry.get_default();
        for (const Tag& tag : segment.tags) {
            if (const Style* const tag_style = registry.find(tag.name)) {
                style.apply(*tag_style);
                continue;
            }
            if (std::ranges::find(warned_tags, tag.name) == warned_tags.end()) {
                warned_tags.push_back(tag.name);
                warn_unknown_tag(tag, registry, logger, memory);
            }
        }
        out.push_back(
            Styled_Span { .text = std::pmr::u8string { segment.text, memory },
                          .style = std::move(style) }
        );
    }
}

} // namespace richtext
