#ifndef RICHTEXT_SPANS_HPP
#define RICHTEXT_SPANS_HPP

#include <memory_resource>
#include <span>
#include <string>
#include <vector>

#include "richtext/fwd.hpp"
#include "richtext/logger.hpp"
#include "richtext/style.hpp"

namespace richtext {

/// @brief Text with its resolved style.
struct Styled_Span {
    std::pmr::u8string text;
    Style style;

    [[nodiscard]]
    friend bool operator==(const Styled_Span&, const Styled_Span&)
        = default;
};

/// @brief Resolves the tags of every segment into a style,
/// and appends one `Styled_Span` per segment to `out`.
///
/// The style of a segment is the default style of the `registry`,
/// with the style of every tag layered on top in directive order.
/// Tags which are not registered contribute nothing,
/// and a `style.tag.unknown` warning is logged once per unknown name,
/// with a suggestion if a registered name is similar.
void build_spans(
    std::pmr::vector<Styled_Span>& out,
    std::span<const Segment> segments,
    const Style_Registry& registry,
    Logger& logger = ignorant_logger
);

} // namespace richtext

#endif
