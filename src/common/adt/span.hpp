#ifndef GRAFT_COMMON_ADT_SPAN_HPP
#define GRAFT_COMMON_ADT_SPAN_HPP

#include "common/assert.hpp"
#include "common/defs.hpp"
#include "common/type_traits.hpp"

#include <iterator>

namespace graft {

template<typename T>
class Span;

namespace detail {

template<typename T>
struct IsSpan : std::false_type {};

template<typename T>
struct IsSpan<Span<T>> : std::true_type {};

template<typename T>
using disable_if_span = std::enable_if_t<!IsSpan<remove_cvref_t<T>>::value>;

} // namespace detail

/// A pointer + length pair (with debug mode bounds checking) for unowned arrays.
/// Similar to std::span, which is not yet available.
template<typename T>
class Span {
public:
    using value_type = T;
    using size_type = std::size_t;
    using pointer = T*;
    using reference = T&;
    using iterator = pointer;
    using const_iterator = pointer;

    /// Constructs an empty span.
    constexpr Span() noexcept = default;

    /// Constructs a span from a pointer + length pair.
    constexpr Span(pointer ptr, size_type count) noexcept
        : data_(ptr)
        , size_(count) {}

    /// Construct a span from a container that supports data() and size().
    template<typename Container, detail::disable_if_span<Container>* = nullptr>
    constexpr Span(Container&& cont)
        : data_(std::data(cont))
        , size_(std::size(cont)) {
        static_assert(
            std::is_same_v<const std::remove_pointer_t<decltype(std::data(cont))>, const T>,
            "Container value type must match the span's type.");
    }

    /// Constructs a span over an initializer list. The list must outlive the span,
    /// which is only the case when the span is used as a function argument.
    template<typename U = T, std::enable_if_t<std::is_const_v<U>>* = nullptr>
    constexpr Span(std::initializer_list<std::remove_const_t<T>> list) noexcept
        : data_(list.begin())
        , size_(list.size()) {}

    /// Conversion non-const -> const.
    template<typename U, std::enable_if_t<std::is_same_v<T, const U>>* = nullptr>
    constexpr Span(const Span<U>& other) noexcept
        : data_(other.data_)
        , size_(other.size_) {}

    constexpr Span(const Span& other) noexcept = default;
    constexpr Span& operator=(const Span& other) = default;

    constexpr const_iterator begin() const { return data_; }
    constexpr const_iterator end() const { return data_ + size_; }

    /// Returns a reference to the first element.
    constexpr T& front() const noexcept {
        GRAFT_DEBUG_ASSERT(size_ > 0, "Span::front(): span is empty.");
        return data_[0];
    }

    /// Returns a reference to the last element.
    constexpr T& back() const noexcept {
        GRAFT_DEBUG_ASSERT(size_ > 0, "Span::back(): span is empty.");
        return data_[size_ - 1];
    }

    /// Returns a reference to the element at `index`.
    constexpr T& operator[](size_t index) const noexcept {
        GRAFT_DEBUG_ASSERT(index < size_, "Span::operator[](): index is out of bounds.");
        return data_[index];
    }

    constexpr T* data() const noexcept { return data_; }
    constexpr size_t size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

private:
    template<typename U>
    friend class Span;

private:
    T* data_ = nullptr;
    size_t size_ = 0;
};

} // namespace graft

#endif // GRAFT_COMMON_ADT_SPAN_HPP
