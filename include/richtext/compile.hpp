#ifndef RICHTEXT_COMPILE_HPP
#define RICHTEXT_COMPILE_HPP

#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "richtext/util/result.hpp"
#include "richtext/util/source_position.hpp"

#include "richtext/fwd.hpp"
#include "richtext/logger.hpp"

namespace richtext {

/// @brief A tag name within a directive, such as `lg` in `[lg,fancy]`.
struct Tag {
    /// @brief The name, trimmed of surrounding blanks. Never empty.
    std::pmr::u8string name;
    /// @brief The location of the name within the markup.
    Source_Span location;

    [[nodiscard]]
    friend bool operator==(const Tag&, const Tag&)
        = default;
};

/// @brief A run of literal text, paired with the tags that were active for that text.
struct Segment {
    /// @brief The text, with escape sequences already decoded. Never empty.
    std::pmr::u8string text;
    /// @brief The tags of the most recent directive, in directive order and without duplicates.
    /// Later tags take precedence over earlier ones when styles are layered.
    std::pmr::vector<Tag> tags;
    /// @brief The location of the text within the markup, including escape sequences.
    Source_Span location;

    [[nodiscard]]
    friend bool operator==(const Segment&, const Segment&)
        = default;

    [[nodiscard]]
    bool has_tag(std::u8string_view name) const;
};

/// @brief The error produced when markup cannot be compiled.
struct Malformed_Markup {
    /// @brief The location of the offending `[`.
    /// `location.begin` is the byte offset in the markup.
    Source_Span location;

    [[nodiscard]]
    friend constexpr bool operator==(const Malformed_Markup&, const Malformed_Markup&)
        = default;
};

/// @brief Compiles markup such as `"[lg]Hello [lg,fancy]World"` into segments,
/// here `("Hello ", {lg})` and `("World", {lg, fancy})`.
///
/// Each directive replaces the set of active tags, and `[]` clears it.
/// The sequence `[[` denotes a literal `[`, and `]]` a literal `]`.
/// Empty text produces no segment, so empty markup produces no segments at all.
///
/// If the markup contains a `[` without matching `]`,
/// a `markup.unterminated` error is logged,
/// nothing is appended to `out`, and the location of the `[` is returned.
///
/// This function has no side effects other than logging,
/// and is safe to call concurrently.
/// @param out Where the segments are appended to.
/// The memory resource of `out` is used for all segment strings.
/// @param markup The markup.
/// @param logger Receives diagnostics about empty or duplicate tag names and malformed markup.
[[nodiscard]]
Result<void, Malformed_Markup> compile(
    std::pmr::vector<Segment>& out,
    std::u8string_view markup,
    Logger& logger = ignorant_logger
);

/// @brief Like the other overload, but returns a new vector allocated with `memory`.
[[nodiscard]]
Result<std::pmr::vector<Segment>, Malformed_Markup> compile(
    std::u8string_view markup,
    std::pmr::memory_resource* memory,
    Logger& logger = ignorant_logger
);

/// @brief Appends the text of every segment to `out`.
/// For successfully compiled markup, the result is the markup with all directives removed
/// and all escape sequences decoded.
void concatenate_text(std::pmr::u8string& out, std::span<const Segment> segments);

} // namespace richtext

#endif
