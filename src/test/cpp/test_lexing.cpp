#include <concepts>
#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "richtext/util/source_position.hpp"

#include "richtext/diagnostic.hpp"
#include "richtext/lex.hpp"

using namespace std::string_view_literals;

namespace richtext {
namespace {

struct Text_Token {
    Token_Kind kind;
    std::u8string_view text;

    [[nodiscard]]
    friend bool operator==(const Text_Token&, const Text_Token&)
        = default;
};

struct Lex_Error {
    std::u8string_view id;
    Source_Span location;
};

struct Lex_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<Token> tokens { &memory };
    std::pmr::vector<Lex_Error> errors { &memory };

    [[nodiscard]]
    bool lex_markup(std::u8string_view source)
    {
        const std::convertible_to<Lex_Error_Consumer> auto consumer
            = [&](std::u8string_view id, const Source_Span& location, std::u8string_view) {
                  errors.push_back({ id, location });
              };
        return lex(tokens, source, consumer);
    }

    [[nodiscard]]
    std::vector<Text_Token> text_tokens(std::u8string_view source) const
    {
        std::vector<Text_Token> result;
        for (const Token& token : tokens) {
            result.push_back(
                { token.kind, source.substr(token.location.begin, token.location.length) }
            );
        }
        return result;
    }

    // Tokens have to be contiguous and cover the whole source.
    void expect_contiguous(std::u8string_view source) const
    {
        std::size_t pos = 0;
        for (const Token& token : tokens) {
            EXPECT_EQ(token.location.begin, pos);
            EXPECT_NE(token.location.length, 0);
            pos += token.location.length;
        }
        EXPECT_EQ(pos, source.length());
    }
};

TEST_F(Lex_Test, empty)
{
    EXPECT_TRUE(lex_markup(u8""));
    EXPECT_TRUE(tokens.empty());
    EXPECT_TRUE(errors.empty());
}

TEST_F(Lex_Test, text_only)
{
    constexpr std::u8string_view source = u8"Hello, world!";
    ASSERT_TRUE(lex_markup(source));
    const std::vector<Text_Token> expected { { Token_Kind::text, source } };
    EXPECT_EQ(text_tokens(source), expected);
}

TEST_F(Lex_Test, directive)
{
    constexpr std::u8string_view source = u8"a[ lg , fancy]b";
    ASSERT_TRUE(lex_markup(source));
    expect_contiguous(source);

    using enum Token_Kind;
    const std::vector<Text_Token> expected {
        { text, u8"a" },          { bracket_left, u8"[" }, { whitespace, u8" " },
        { tag_name, u8"lg" },     { whitespace, u8" " },   { comma, u8"," },
        { whitespace, u8" " },    { tag_name, u8"fancy" }, { bracket_right, u8"]" },
        { text, u8"b" },
    };
    EXPECT_EQ(text_tokens(source), expected);
}

TEST_F(Lex_Test, escapes)
{
    constexpr std::u8string_view source = u8"[[x]]]y]";
    ASSERT_TRUE(lex_markup(source));
    expect_contiguous(source);

    using enum Token_Kind;
    const std::vector<Text_Token> expected {
        { escape, u8"[[" },
        { text, u8"x" },
        { escape, u8"]]" },
        { text, u8"]y]" },
    };
    EXPECT_EQ(text_tokens(source), expected);
}

TEST_F(Lex_Test, empty_directive)
{
    constexpr std::u8string_view source = u8"[]";
    ASSERT_TRUE(lex_markup(source));

    using enum Token_Kind;
    const std::vector<Text_Token> expected {
        { bracket_left, u8"[" },
        { bracket_right, u8"]" },
    };
    EXPECT_EQ(text_tokens(source), expected);
}

TEST_F(Lex_Test, unterminated_directive)
{
    constexpr std::u8string_view source = u8"ab\n[cd";
    EXPECT_FALSE(lex_markup(source));
    expect_contiguous(source);

    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].id, diagnostic::markup_unterminated);
    EXPECT_EQ(errors[0].location.begin, 3);
    EXPECT_EQ(errors[0].location.length, 1);
    EXPECT_EQ(errors[0].location.line, 1);
    EXPECT_EQ(errors[0].location.column, 0);
}

TEST(Lex, token_kind_name)
{
    EXPECT_EQ(token_kind_name(Token_Kind::tag_name), u8"TAG-NAME"sv);
    EXPECT_EQ(token_kind_name(Token_Kind::bracket_left), u8"BRACKET-LEFT"sv);
}

} // namespace
} // namespace richtext
