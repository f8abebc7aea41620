#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

#include "richtext/util/assert.hpp"
#include "richtext/util/chars.hpp"
#include "richtext/util/strings.hpp"

#include "richtext/diagnostic.hpp"
#include "richtext/fwd.hpp"
#include "richtext/lex.hpp"

using namespace std::string_view_literals;

namespace richtext {
namespace {

#define RICHTEXT_TOKEN_KIND_FIRST_CHAR(id, name, first)                                            \
    case Token_Kind::id: return u8##first;

[[nodiscard]] [[maybe_unused]]
// workaround for https://github.com/llvm/llvm-project/issues/42943
char8_t token_kind_first_char(const Token_Kind kind)
{
    switch (kind) {
        RICHTEXT_TOKEN_KIND_ENUM_DATA(RICHTEXT_TOKEN_KIND_FIRST_CHAR) // NOLINT(bugprone-branch-clone)
    }
    RICHTEXT_ASSERT_UNREACHABLE(u8"Invalid token kind.");
}

struct [[nodiscard]] Lexer {
private:
    std::pmr::vector<Token>& m_out;
    const std::u8string_view m_source;
    const Lex_Error_Consumer m_on_error;

    Source_Position m_pos {};
    bool m_success = true;

public:
    [[nodiscard]]
    Lexer(std::pmr::vector<Token>& out, std::u8string_view source, Lex_Error_Consumer on_error)
        : m_out { out }
        , m_source { source }
        , m_on_error { on_error }
    {
    }

    bool operator()()
    {
        while (!eof()) {
            if (!expect_escape() && !expect_directive()) {
                consume_text();
            }
        }
        return m_success;
    }

private:
    void emit(const Token_Kind kind, const std::size_t length)
    {
        if constexpr (is_debug_build) {
            RICHTEXT_ASSERT(length != 0);
            if (const char8_t expected_first = token_kind_first_char(kind)) {
                const char8_t actual_first = peek();
                RICHTEXT_ASSERT(expected_first == actual_first);
            }
            RICHTEXT_ASSERT(m_pos.begin + length <= m_source.length());
        }
        m_out.push_back({ kind, Source_Span { m_pos, length } });
    }

    void emit_and_advance(const Token_Kind kind, const std::size_t length)
    {
        emit(kind, length);
        advance_by(length);
    }

    void error(const Source_Span& pos, std::u8string_view message)
    {
        if (m_on_error) {
            m_on_error(diagnostic::markup_unterminated, pos, message);
        }
        m_success = false;
    }

    void advance_by(std::size_t n)
    {
        RICHTEXT_DEBUG_ASSERT(m_pos.begin + n <= m_source.size());
        advance(m_pos, m_source.substr(m_pos.begin, n));
    }

    [[nodiscard]]
    std::u8string_view peek_all() const
    {
        RICHTEXT_DEBUG_ASSERT(m_pos.begin <= m_source.size());
        return m_source.substr(m_pos.begin);
    }

    [[nodiscard]]
    char8_t peek() const
    {
        RICHTEXT_ASSERT(!eof());
        return m_source[m_pos.begin];
    }

    [[nodiscard]]
    bool peek(char8_t c) const
    {
        return !eof() && m_source[m_pos.begin] == c;
    }

    [[nodiscard]]
    bool eof() const
    {
        return m_pos.begin == m_source.length();
    }

    [[nodiscard]]
    bool expect_escape()
    {
        const std::u8string_view remainder = peek_all();
        if (remainder.starts_with(u8"[["sv) || remainder.starts_with(u8"]]"sv)) {
            emit_and_advance(Token_Kind::escape, 2);
            return true;
        }
        return false;
    }

    void consume_text()
    {
        const std::u8string_view remainder = peek_all();
        RICHTEXT_ASSERT(!remainder.empty());

        // A lone ']' is literal text.
        // We only stop at ']' if it could begin an escape sequence.
        std::size_t length = 1;
        for (; length < remainder.length(); ++length) {
            const char8_t c = remainder[length];
            if (c == u8'[' || (c == u8']' && remainder.substr(length).starts_with(u8"]]"sv))) {
                break;
            }
        }
        emit_and_advance(Token_Kind::text, length);
    }

    [[nodiscard]]
    bool expect_directive()
    {
        if (!peek(u8'[')) {
            return false;
        }
        const Source_Position initial_pos = m_pos;
        emit_and_advance(Token_Kind::bracket_left, 1);

        while (!eof()) {
            const char8_t c = peek();
            if (c == u8']') {
                emit_and_advance(Token_Kind::bracket_right, 1);
                return true;
            }
            if (c == u8',') {
                emit_and_advance(Token_Kind::comma, 1);
                continue;
            }
            if (is_ascii_blank(c)) {
                emit_and_advance(Token_Kind::whitespace, length_blank_left(peek_all()));
                continue;
            }
            consume_tag_name();
        }

        error(
            Source_Span { initial_pos, 1 },
            u8"No matching ']'. This directive is unterminated."sv
        );
        return true;
    }

    void consume_tag_name()
    {
        const std::u8string_view remainder = peek_all();
        std::size_t length = 0;
        while (length < remainder.length() && remainder[length] != u8']'
               && remainder[length] != u8',') {
            ++length;
        }
        const std::size_t trailing_blanks = length_blank_right(remainder.substr(0, length));
        RICHTEXT_ASSERT(trailing_blanks < length);
        emit_and_advance(Token_Kind::tag_name, length - trailing_blanks);
    }
};

} // namespace

std::u8string_view token_kind_name(const Token_Kind kind)
{
#define RICHTEXT_TOKEN_KIND_SWITCH_CASE(id, name, first)                                           \
    case Token_Kind::id: return u8##name##sv;

    switch (kind) {
        RICHTEXT_TOKEN_KIND_ENUM_DATA(RICHTEXT_TOKEN_KIND_SWITCH_CASE)
    }
    RICHTEXT_ASSERT_UNREACHABLE(u8"Invalid token kind.");
}

bool lex(std::pmr::vector<Token>& out, std::u8string_view source, Lex_Error_Consumer on_error)
{
    return Lexer { out, source, on_error }();
}

} // namespace richtext
