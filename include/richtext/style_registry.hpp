#ifndef RICHTEXT_STYLE_REGISTRY_HPP
#define RICHTEXT_STYLE_REGISTRY_HPP

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "richtext/util/transparent_comparison.hpp"

#include "richtext/fwd.hpp"
#include "richtext/style.hpp"

namespace richtext {

/// @brief Maps tag names to styles.
/// The default style is always present and registered under the empty name.
///
/// Every registry starts with a fresh generation, and every mutation replaces it with another.
/// Generations are drawn from a process-wide counter, so no two registry states share one,
/// even if a registry is destroyed and another is created at the same address.
/// This allows caches such as `Rich_Text` to detect that their styles are outdated.
struct Style_Registry {
private:
    std::pmr::unordered_map<
        std::pmr::u8string,
        Style,
        Transparent_String_View_Hash8,
        Transparent_String_View_Equals8>
        m_styles;
    std::size_t m_generation;

public:
    [[nodiscard]]
    explicit Style_Registry(std::pmr::memory_resource* memory = std::pmr::get_default_resource());

    /// @brief Inserts or replaces the style registered for `tag`.
    /// If `tag` is empty, the default style is replaced.
    /// @return `true` if `tag` was not registered before.
    bool insert(std::u8string_view tag, const Style& style);

    /// @brief Removes `tag` from the registry.
    /// Erasing the empty name resets the default style to an empty style instead.
    /// @return `true` if anything changed.
    bool erase(std::u8string_view tag);

    /// @brief Returns the style registered for `tag`, or null if there is none.
    [[nodiscard]]
    const Style* find(std::u8string_view tag) const;

    /// @brief Returns the style registered for `tag`, or the default style if there is none.
    [[nodiscard]]
    const Style& find_or_default(std::u8string_view tag) const;

    [[nodiscard]]
    const Style& get_default() const;

    void set_default(const Style& style);

    /// @brief Returns `true` if `tag` is registered.
    /// The empty name is always registered.
    [[nodiscard]]
    bool contains(std::u8string_view tag) const
    {
        return find(tag) != nullptr;
    }

    /// @brief Returns the number of registered tags, not counting the default style.
    [[nodiscard]]
    std::size_t size() const
    {
        return m_styles.size() - 1;
    }

    /// @brief Appends the names of all registered tags except the default style to `out`,
    /// in lexicographical order.
    void tag_names(std::pmr::vector<std::u8string_view>& out) const;

    [[nodiscard]]
    std::size_t get_generation() const
    {
        return m_generation;
    }

    /// @brief Removes every tag and resets the default style.
    void clear();

    [[nodiscard]]
    std::pmr::memory_resource* get_memory() const
    {
        return m_styles.get_allocator().resource();
    }
};

} // namespace richtext

#endif
