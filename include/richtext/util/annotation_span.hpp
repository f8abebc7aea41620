#ifndef RICHTEXT_ANNOTATION_SPAN_HPP
#define RICHTEXT_ANNOTATION_SPAN_HPP

#include <cstddef>

#include "richtext/fwd.hpp"

namespace richtext {

template <typename T>
struct Annotation_Span {
    std::size_t begin;
    std::size_t length;
    T value;

    [[nodiscard]]
    constexpr std::size_t end() const
    {
        return begin + length;
    }
};

} // namespace richtext

#endif
