#ifndef RICHTEXT_LEX_HPP
#define RICHTEXT_LEX_HPP

#include <memory_resource>
#include <string_view>
#include <vector>

#include "richtext/util/function_ref.hpp"
#include "richtext/util/source_position.hpp"

#include "richtext/fwd.hpp"

namespace richtext {

#define RICHTEXT_TOKEN_KIND_ENUM_DATA(F)                                                           \
    F(bracket_left, "BRACKET-LEFT", '[')                                                           \
    F(bracket_right, "BRACKET-RIGHT", ']')                                                         \
    F(comma, "COMMA", ',')                                                                         \
    F(escape, "ESCAPE", '\0')                                                                      \
    F(tag_name, "TAG-NAME", '\0')                                                                  \
    F(text, "TEXT", '\0')                                                                          \
    F(whitespace, "WHITESPACE", '\0')

#define RICHTEXT_TOKEN_KIND_ENUMERATOR(id, name, first) id,

enum struct Token_Kind : Default_Underlying {
    RICHTEXT_TOKEN_KIND_ENUM_DATA(RICHTEXT_TOKEN_KIND_ENUMERATOR)
};

/// @brief Returns the upper-case name of the token kind, like `"TAG-NAME"`.
[[nodiscard]]
std::u8string_view token_kind_name(Token_Kind kind);

struct Token {
    Token_Kind kind;
    Source_Span location;

    [[nodiscard]]
    friend constexpr bool operator==(const Token&, const Token&)
        = default;
};

using Lex_Error_Consumer = Function_Ref<
    void(std::u8string_view id, const Source_Span& location, std::u8string_view message)>;

/// @brief Splits markup into tokens.
/// The tokens are contiguous and cover the whole `source`,
/// even if lexing fails.
///
/// Outside of directives, `[[` and `]]` are `escape` tokens,
/// and `]` on its own is `text`.
/// Within directives, every run of characters other than `]` and `,`
/// becomes a `tag_name` token,
/// except for leading and trailing blanks, which are `whitespace` tokens.
/// @param out Where the tokens are appended to.
/// @param source The markup.
/// @param on_error Invoked for every error, such as unterminated directives.
/// May be empty.
/// @return `true` if no error was reported.
bool lex(std::pmr::vector<Token>& out, std::u8string_view source, Lex_Error_Consumer on_error);

} // namespace richtext

#endif
