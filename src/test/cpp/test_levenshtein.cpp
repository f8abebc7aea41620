#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "richtext/util/levenshtein.hpp"

namespace richtext {
namespace {

[[nodiscard]]
std::size_t distance(std::u8string_view x, std::u8string_view y)
{
    std::vector<std::size_t> matrix((x.size() + 1) * (y.size() + 1));
    return levenshtein_distance(x, y, std::span { matrix });
}

TEST(Levenshtein, empty)
{
    EXPECT_EQ(distance(u8"", u8""), 0);
}

TEST(Levenshtein, create)
{
    EXPECT_EQ(distance(u8"", u8"abcdefg"), 7);
    EXPECT_EQ(distance(u8"abcdefg", u8""), 7);
}

TEST(Levenshtein, zero_distance)
{
    EXPECT_EQ(distance(u8"abcdefg", u8"abcdefg"), 0);
}

TEST(Levenshtein, pure_prepend)
{
    EXPECT_EQ(distance(u8"abc", u8"12345abc"), 5);
}

TEST(Levenshtein, substitution)
{
    EXPECT_EQ(distance(u8"kitten", u8"sitting"), 3);
    EXPECT_EQ(distance(u8"flaw", u8"lawn"), 2);
}

} // namespace
} // namespace richtext
