#ifndef RICHTEXT_RESULT_HPP
#define RICHTEXT_RESULT_HPP

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "richtext/util/assert.hpp"

#include "richtext/fwd.hpp"

namespace richtext {

struct Success_Tag { };
inline constexpr Success_Tag success_tag;

struct Error_Tag { };
inline constexpr Error_Tag error_tag;

/// @brief Either a value of type `T` or an error of type `E`.
/// Unlike `std::optional`, the failure case carries information.
template <typename T, typename E>
struct [[nodiscard]] Result {
    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> m_data;

public:
    [[nodiscard]]
    constexpr Result(const T& value)
        requires(!std::is_same_v<T, E>)
        : m_data { std::in_place_index<0>, value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        requires(!std::is_same_v<T, E>)
        : m_data { std::in_place_index<0>, std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        requires(!std::is_same_v<T, E>)
        : m_data { std::in_place_index<1>, error }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Success_Tag, Args&&... args)
        : m_data { std::in_place_index<0>, std::forward<Args>(args)... }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Error_Tag, Args&&... args)
        : m_data { std::in_place_index<1>, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        RICHTEXT_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr const T& value() const&
    {
        RICHTEXT_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr T&& value() &&
    {
        RICHTEXT_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_data));
    }

    [[nodiscard]]
    constexpr const E& error() const
    {
        RICHTEXT_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        return value();
    }

    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        return value();
    }

    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        return std::move(*this).value();
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        return &value();
    }

    [[nodiscard]]
    constexpr const T* operator->() const
    {
        return &value();
    }
};

template <typename E>
struct [[nodiscard]] Result<void, E> {
    using value_type = void;
    using error_type = E;

private:
    std::optional<E> m_error;

public:
    [[nodiscard]]
    constexpr Result() noexcept
        = default;

    [[nodiscard]]
    constexpr Result(Success_Tag) noexcept
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_error { error }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return !m_error.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr const E& error() const
    {
        RICHTEXT_ASSERT(!has_value());
        return *m_error;
    }
};

} // namespace richtext

#endif
