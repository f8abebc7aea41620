#ifndef RICHTEXT_JSON_HPP
#define RICHTEXT_JSON_HPP

#include <algorithm>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace richtext::json {

struct Value;
struct Member;

struct Null {
    [[nodiscard]]
    friend constexpr bool operator==(Null, Null)
        = default;
};
inline constexpr Null null;

using String = std::pmr::u8string;
using Number = double;

struct Array : std::pmr::vector<Value> {
    explicit Array(
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    ) noexcept;

    [[nodiscard]]
    friend constexpr bool operator==(const Array&, const Array&)
        = default;
};

struct Object : std::pmr::vector<Member> {
    explicit Object(
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    ) noexcept;

    [[nodiscard]]
    friend constexpr bool operator==(const Object&, const Object&)
        = default;

    [[nodiscard]]
    constexpr const Member* find(std::u8string_view key) const noexcept;

    [[nodiscard]]
    constexpr const Number* find_number(std::u8string_view key) const noexcept
    {
        return find_alternative<Number>(key);
    }

private:
    template <typename T>
    [[nodiscard]]
    constexpr const T* find_alternative(std::u8string_view key) const noexcept;
};

using Value_Variant = std::variant<Null, bool, Number, String, Array, Object>;

struct Value : Value_Variant {
    using Value_Variant::variant;

    [[nodiscard]]
    bool operator==(const Value&) const
        = default;

    [[nodiscard]]
    const bool* as_boolean() const noexcept
    {
        return std::get_if<bool>(this);
    }
    [[nodiscard]]
    const Number* as_number() const noexcept
    {
        return std::get_if<Number>(this);
    }
    [[nodiscard]]
    const String* as_string() const noexcept
    {
        return std::get_if<String>(this);
    }
    [[nodiscard]]
    const Object* as_object() const noexcept
    {
        return std::get_if<Object>(this);
    }
    [[nodiscard]]
    const Array* as_array() const noexcept
    {
        return std::get_if<Array>(this);
    }
};

struct Member {
    String key;
    Value value;

    [[nodiscard]]
    friend constexpr bool operator==(const Member&, const Member&)
        = default;
};

inline Array::Array(std::pmr::memory_resource* memory) noexcept
    : std::pmr::vector<Value> { memory }
{
}

inline Object::Object(std::pmr::memory_resource* memory) noexcept
    : std::pmr::vector<Member> { memory }
{
}

constexpr const Member* Object::find(std::u8string_view key) const noexcept
{
    const auto it = std::ranges::find(*this, key, &Member::key);
    return it == end() ? nullptr : &*it;
}

template <typename T>
constexpr const T* Object::find_alternative(std::u8string_view key) const noexcept
{
    const Member* const member = find(key);
    return member ? std::get_if<T>(&member->value) : nullptr;
}

/// @brief Parses JSON, where comments are permitted.
/// Every string and container of the result is allocated with `memory`.
/// @return The parsed value, or nothing if `source` is not valid JSON.
[[nodiscard]]
std::optional<json::Value> load(std::u8string_view source, std::pmr::memory_resource* memory);

/// @brief Returns the name of the type of `value`, like `"object"`.
[[nodiscard]]
std::u8string_view type_name(const Value& value);

} // namespace richtext::json

#endif
