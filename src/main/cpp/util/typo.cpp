#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "richtext/util/levenshtein.hpp"
#include "richtext/util/typo.hpp"
#include "richtext/util/unicode.hpp"

namespace richtext {

Distant<std::size_t> closest_match(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::pmr::memory_resource* memory
)
{
    const std::pmr::u32string needle32 = utf8::to_utf32(needle, memory);
    std::pmr::vector<std::size_t> matrix_data { memory };

    Distant<std::size_t> best_match;

    for (std::size_t i = 0; i < haystack.size(); ++i) {
        const std::pmr::u32string hay32 = utf8::to_utf32(haystack[i], memory);
        matrix_data.resize((hay32.size() + 1) * (needle32.size() + 1));

        const std::size_t distance
            = levenshtein_distance(hay32, needle32, std::span { matrix_data });
        if (distance < best_match.distance) {
            best_match.value = i;
            best_match.distance = distance;
        }
    }

    return best_match;
}

Distant<std::u8string_view> find_typo_correction(
    std::span<const std::u8string_view> haystack,
    std::u8string_view needle,
    std::size_t max_distance,
    std::pmr::memory_resource* memory
)
{
    const Distant<std::size_t> match = closest_match(haystack, needle, memory);
    if (!match || match.distance == 0 || match.distance > max_distance) {
        return {};
    }
    return { .value = haystack[match.value], .distance = match.distance };
}

} // namespace richtext
