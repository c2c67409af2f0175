#pragma once

#include <result-core/assert.hh>
#include <result-core/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

/// Non-owning view over a contiguous sequence of T (pointer + runtime size).
/// Used to hand an arbitrary number of results to the uniform rc::combine overloads.
/// Trivially copyable; the viewed data must outlive the span.
template <class T>
struct rc::span
{
    // construction
public:
    constexpr span() = default;

    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        RC_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Only for const element types: allows foo({a, b, c}) for foo(span<X const>).
    /// WARNING: the initializer_list dies at the end of the full expression, never store such a span.
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Views any container providing .data() and .size() (rc::span, std::vector, std::array, ...).
    template <class Container>
        requires(!std::is_same_v<std::remove_cvref_t<Container>, span>) && requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        RC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
