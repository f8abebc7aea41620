#ifndef RICHTEXT_ANNOTATED_STRING_HPP
#define RICHTEXT_ANNOTATED_STRING_HPP

#include <charconv>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "richtext/util/annotation_span.hpp"
#include "richtext/util/assert.hpp"

#include "richtext/fwd.hpp"

namespace richtext {

enum struct Sign_Policy : Default_Underlying {
    /// @brief Print only `-`, never `+`.
    negative_only,
    /// @brief Print `+` for positive numbers, including zero.
    always,
};

/// @brief A string of text where some ranges of characters are annotated with a value of type `T`,
/// such as a highlight type.
template <typename Char, typename T>
struct Basic_Annotated_String {
public:
    using span_type = Annotation_Span<T>;
    using iterator = span_type*;
    using const_iterator = const span_type*;
    using char_type = Char;
    using string_view_type = std::basic_string_view<Char>;

private:
    std::pmr::vector<Char> m_text;
    std::pmr::vector<span_type> m_spans;

public:
    [[nodiscard]]
    constexpr explicit Basic_Annotated_String(
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    )
        : m_text { memory }
        , m_spans { memory }
    {
    }

    [[nodiscard]]
    constexpr std::size_t get_text_length() const
    {
        return m_text.size();
    }

    [[nodiscard]]
    constexpr std::size_t get_span_count() const
    {
        return m_spans.size();
    }

    [[nodiscard]]
    constexpr string_view_type get_text() const
    {
        return { m_text.data(), m_text.size() };
    }

    [[nodiscard]]
    constexpr string_view_type get_text(const span_type& span) const
    {
        return get_text().substr(span.begin, span.length);
    }

    constexpr void clear() noexcept
    {
        m_text.clear();
        m_spans.clear();
    }

    /// @brief Appends a raw range of text to the string.
    /// This is typically useful for e.g. whitespace between pieces of code.
    constexpr void append(string_view_type text)
    {
        m_text.insert(m_text.end(), text.begin(), text.end());
    }

    /// @brief Appends a raw character of text to the string.
    constexpr void append(char_type c)
    {
        m_text.push_back(c);
    }

    /// @brief Appends a raw character of text multiple times to the string.
    constexpr void append(std::size_t amount, char_type c)
    {
        m_text.insert(m_text.end(), amount, c);
    }

    constexpr void append(string_view_type text, T value)
    {
        RICHTEXT_ASSERT(!text.empty());
        m_spans.push_back({ .begin = m_text.size(), .length = text.size(), .value = value });
        m_text.insert(m_text.end(), text.begin(), text.end());
    }

    constexpr void append(char_type c, T value)
    {
        m_spans.push_back({ .begin = m_text.size(), .length = 1, .value = value });
        m_text.push_back(c);
    }

    template <std::integral Integer>
    void append_integer(Integer x, Sign_Policy signs = Sign_Policy::negative_only)
    {
        append_digits(x, signs == Sign_Policy::always && x >= 0);
    }

    template <std::integral Integer>
    void append_integer(Integer x, T value, Sign_Policy signs = Sign_Policy::negative_only)
    {
        append_digits(x, signs == Sign_Policy::always && x >= 0, &value);
    }

private:
    template <std::integral Integer>
    void append_digits(Integer x, bool plus, const T* value = nullptr)
    {
        char buffer[64];
        const auto [end, ec] = std::to_chars(buffer, std::end(buffer), x);
        RICHTEXT_ASSERT(ec == std::errc {});

        const std::size_t begin = m_text.size();
        if (plus) {
            m_text.push_back(Char('+'));
        }
        for (const char* p = buffer; p != end; ++p) {
            m_text.push_back(Char(*p));
        }
        if (value) {
            m_spans.push_back({ .begin = begin, .length = m_text.size() - begin, .value = *value });
        }
    }

public:
    struct Scoped_Builder;

    /// @brief Starts building a single span out of multiple parts which will be fused
    /// together.
    /// For example:
    /// ```
    /// string.build(Diagnostic_Highlight::code_position)
    ///     .append(file)
    ///     .append(':')
    ///     .append_integer(line);
    /// ```
    /// @param value the annotation of the appended span as a whole
    constexpr Scoped_Builder build(T value) &
    {
        return { *this, std::move(value) };
    }

    [[nodiscard]]
    constexpr iterator begin()
    {
        return m_spans.data();
    }

    [[nodiscard]]
    constexpr iterator end()
    {
        return m_spans.data() + std::ptrdiff_t(m_spans.size());
    }

    [[nodiscard]]
    constexpr const_iterator begin() const
    {
        return m_spans.data();
    }

    [[nodiscard]]
    constexpr const_iterator end() const
    {
        return m_spans.data() + std::ptrdiff_t(m_spans.size());
    }
};

template <typename Char, typename T>
struct [[nodiscard]] Basic_Annotated_String<Char, T>::Scoped_Builder {
private:
    using owner_type = Basic_Annotated_String<Char, T>;
    using char_type = owner_type::char_type;
    using string_view_type = owner_type::string_view_type;

    owner_type& m_self;
    std::size_t m_initial_size;
    T m_value;

public:
    constexpr Scoped_Builder(owner_type& self, T value)
        : m_self { self }
        , m_initial_size { self.m_text.size() }
        , m_value { std::move(value) }
    {
    }

    constexpr ~Scoped_Builder() noexcept(false)
    {
        RICHTEXT_ASSERT(m_self.m_text.size() >= m_initial_size);
        const std::size_t length = m_self.m_text.size() - m_initial_size;
        if (length != 0) {
            m_self.m_spans.push_back(
                { .begin = m_initial_size, .length = length, .value = m_value }
            );
        }
    }

    Scoped_Builder(const Scoped_Builder&) = delete;
    Scoped_Builder& operator=(const Scoped_Builder&) = delete;

    constexpr Scoped_Builder& append(char_type c)
    {
        m_self.append(c);
        return *this;
    }

    constexpr Scoped_Builder& append(std::size_t n, char_type c)
    {
        m_self.append(n, c);
        return *this;
    }

    constexpr Scoped_Builder& append(string_view_type text)
    {
        m_self.append(text);
        return *this;
    }

    template <std::integral Integer>
    Scoped_Builder& append_integer(Integer x, Sign_Policy signs = Sign_Policy::negative_only)
    {
        m_self.append_integer(x, signs);
        return *this;
    }
};

} // namespace richtext

#endif
