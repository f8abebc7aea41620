#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "richtext/util/assert.hpp"

#include "richtext/style.hpp"
#include "richtext/style_registry.hpp"

namespace richtext {
namespace {

std::atomic<std::size_t> generation_counter = 0;

[[nodiscard]]
std::size_t next_generation() noexcept
{
    return ++generation_counter;
}

} // namespace

Style_Registry::Style_Registry(std::pmr::memory_resource* memory)
    : m_styles { memory }
    , m_generation { next_generation() }
{
    m_styles.emplace(std::pmr::u8string { memory }, Style {});
}

bool Style_Registry::insert(std::u8string_view tag, const Style& style)
{
    m_generation = next_generation();
    if (const auto it = m_styles.find(tag); it != m_styles.end()) {
        it->second = style;
        return false;
    }
    m_styles.emplace(std::pmr::u8string { tag, get_memory() }, style);
    return true;
}

bool Style_Registry::erase(std::u8string_view tag)
{
    if (tag.empty()) {
        set_default(Style {});
        return true;
    }
    const auto it = m_styles.find(tag);
    if (it == m_styles.end()) {
        return false;
    }
    m_styles.erase(it);
    m_generation = next_generation();
    return true;
}

const Style* Style_Registry::find(std::u8string_view tag) const
{
    const auto it = m_styles.find(tag);
    return it == m_styles.end() ? nullptr : &it->second;
}

const Style& Style_Registry::find_or_default(std::u8string_view tag) const
{
    const Style* const result = find(tag);
    return result ? *result : get_default();
}

const Style& Style_Registry::get_default() const
{
    const Style* const result = find(u8"");
    RICHTEXT_ASSERT(result);
    return *result;
}

void Style_Registry::set_default(const Style& style)
{
    insert(u8"", style);
}

void Style_Registry::tag_names(std::pmr::vector<std::u8string_view>& out) const
{
    const auto old_size = out.size();
    for (const auto& [name, style] : m_styles) {
        if (!name.empty()) {
            out.push_back(name);
        }
    }
    std::ranges::sort(out.begin() + std::ptrdiff_t(old_size), out.end());
}

void Style_Registry::clear()
{
    m_styles.clear();
    m_styles.emplace(std::pmr::u8string { get_memory() }, Style {});
    m_generation = next_generation();
}

} // namespace richtext
