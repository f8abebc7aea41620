#include <algorithm>
#include <concepts>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "richtext/util/assert.hpp"
#include "richtext/util/result.hpp"
#include "richtext/util/source_position.hpp"
#include "richtext/util/strings.hpp"

#include "richtext/compile.hpp"
#include "richtext/diagnostic.hpp"
#include "richtext/fwd.hpp"
#include "richtext/lex.hpp"
#include "richtext/logger.hpp"

using namespace std::string_view_literals;

namespace richtext {

bool Segment::has_tag(std::u8string_view name) const
{
    return std::ranges::find(tags, name, &Tag::name) != tags.end();
}

namespace {

struct [[nodiscard]] Compiler {
private:
    std::pmr::vector<Segment>& m_out;
    const std::u8string_view m_source;
    const std::span<const Token> m_tokens;
    Logger& m_logger;
    std::pmr::memory_resource* const m_memory;

    std::size_t m_index = 0;
    std::pmr::vector<Tag> m_active_tags;
    std::pmr::u8string m_text;
    Source_Span m_text_location {};

public:
    Compiler(
        std::pmr::vector<Segment>& out,
        std::u8string_view source,
        std::span<const Token> tokens,
        Logger& logger
    )
        : m_out { out }
        , m_source { source }
        , m_tokens { tokens }
        , m_logger { logger }
        , m_memory { out.get_allocator().resource() }
        , m_active_tags { m_memory }
        , m_text { m_memory }
    {
    }

    void operator()()
    {
        while (m_index < m_tokens.size()) {
            const Token& token = m_tokens[m_index++];
            switch (token.kind) {
            case Token_Kind::text: {
                append_text(token, source_of(token));
                break;
            }
            case Token_Kind::escape: {
                // "[[" and "]]" both stand for their first character.
                append_text(token, source_of(token).substr(0, 1));
                break;
            }
            case Token_Kind::bracket_left: {
                flush();
                m_active_tags = consume_directive();
                break;
            }
            default: {
                RICHTEXT_ASSERT_UNREACHABLE(u8"Unexpected token outside of directive.");
            }
            }
        }
        flush();
    }

private:
    [[nodiscard]]
    std::u8string_view source_of(const Token& token) const
    {
        return m_source.substr(token.location.begin, token.location.length);
    }

    void append_text(const Token& token, std::u8string_view text)
    {
        if (m_text.empty()) {
            m_text_location = token.location;
        }
        else {
            m_text_location.length = token.location.end() - m_text_location.begin;
        }
        m_text += text;
    }

    void flush()
    {
        if (m_text.empty()) {
            return;
        }
        m_out.push_back(
            Segment { .text = std::exchange(m_text, std::pmr::u8string { m_memory }),
                      .tags = std::pmr::vector<Tag> { m_active_tags, m_memory },
                      .location = m_text_location }
        );
    }

    /// @brief Consumes the tokens following `[` up to and including `]`,
    /// and returns the tags of the directive.
    [[nodiscard]]
    std::pmr::vector<Tag> consume_directive()
    {
        std::pmr::vector<Tag> result { m_memory };
        std::optional<Source_Span> last_comma;
        bool slot_has_name = false;

        while (m_index < m_tokens.size()) {
            const Token& token = m_tokens[m_index++];
            switch (token.kind) {
            case Token_Kind::whitespace: break;

            case Token_Kind::tag_name: {
                RICHTEXT_ASSERT(!slot_has_name);
                slot_has_name = true;
                add_tag(result, token);
                break;
            }

            case Token_Kind::comma: {
                if (!slot_has_name) {
                    warn_empty_name(token.location);
                }
                last_comma = token.location;
                slot_has_name = false;
                break;
            }

            case Token_Kind::bracket_right: {
                // "[]" and "[ ]" are empty directives, not directives with an empty name.
                if (!slot_has_name && last_comma) {
                    warn_empty_name(*last_comma);
                }
                return result;
            }

            default: {
                RICHTEXT_ASSERT_UNREACHABLE(u8"Unexpected token inside of directive.");
            }
            }
        }
        RICHTEXT_ASSERT_UNREACHABLE(u8"Directive was not terminated, but lexing succeeded.");
    }

    void add_tag(std::pmr::vector<Tag>& tags, const Token& token)
    {
        const std::u8string_view name = source_of(token);
        RICHTEXT_DEBUG_ASSERT(trim_ascii_blank(name) == name);

        if (std::ranges::find(tags, name, &Tag::name) != tags.end()) {
            if (m_logger.can_log(Severity::soft_warning)) {
                const std::pmr::u8string message = joined(
                    { u8"The tag \""sv, name, u8"\" appears more than once in this directive."sv },
                    m_memory
                );
                m_logger.try_log(
                    Severity::soft_warning, diagnostic::markup_tag_duplicate, token.location,
                    message
                );
            }
            return;
        }
        tags.push_back(Tag { .name = std::pmr::u8string { name, m_memory },
                             .location = token.location });
    }

    void warn_empty_name(const Source_Span& location)
    {
        m_logger.try_log(
            Severity::soft_warning, diagnostic::markup_tag_empty, location,
            u8"Empty tag name in directive. It is ignored."sv
        );
    }
};

} // namespace

Result<void, Malformed_Markup>
compile(std::pmr::vector<Segment>& out, std::u8string_view markup, Logger& logger)
{
    std::pmr::memory_resource* const memory = out.get_allocator().resource();

    std::optional<Source_Span> first_error;
    const std::convertible_to<Lex_Error_Consumer> auto on_error
        = [&](std::u8string_view id, const Source_Span& location, std::u8string_view message) {
              if (!first_error) {
                  first_error = location;
              }
              logger.try_log(Severity::error, id, location, message);
          };

    std::pmr::vector<Token> tokens { memory };
    if (!lex(tokens, markup, on_error)) {
        RICHTEXT_ASSERT(first_error);
        return Malformed_Markup { *first_error };
    }

    Compiler { out, markup, tokens, logger }();
    return {};
}

Result<std::pmr::vector<Segment>, Malformed_Markup>
compile(std::u8string_view markup, std::pmr::memory_resource* memory, Logger& logger)
{
    std::pmr::vector<Segment> result { memory };
    if (auto r = compile(result, markup, logger); !r) {
        return r.error();
    }
    return result;
}

void concatenate_text(std::pmr::u8string& out, std::span<const Segment> segments)
{
    for (const Segment& segment : segments) {
        out += segment.text;
    }
}

} // namespace richtext
