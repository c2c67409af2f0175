#pragma once

#include <result-core/fwd.hh>
#include <result-core/macros.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   forward_like<Owner>(member) - forward a member with the value category of its owner
//
// Object lifetime:
//   storage_for<T>              - uninitialized storage with size and alignment of T
//
// Callable utilities:
//   identity_function           - callable that returns its argument
//

namespace rc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   T b = rc::move(a);
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

/// Perfect forwarding for template arguments
/// Usage:
///   template <class F>
///   void call(F&& f) { rc::forward<F>(f)(); }
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

namespace impl
{
template <class Owner, class M>
using forward_like_t = std::conditional_t<std::is_lvalue_reference_v<Owner>,
                                          std::conditional_t<std::is_const_v<std::remove_reference_t<Owner>>, M const&, M&>,
                                          std::conditional_t<std::is_const_v<std::remove_reference_t<Owner>>, M const&&, M&&>>;
}

/// Forwards a member (or any owned object) with the value category and constness of its owner
/// Lets a single template handle const&, & and && owners when moving payloads out of rvalues
/// Usage:
///   template <class Self>
///   static auto take(Self&& self) { return rc::forward_like<Self>(self._member); }
template <class Owner, class M>
[[nodiscard]] RC_FORCE_INLINE constexpr impl::forward_like_t<Owner, std::remove_reference_t<M>> forward_like(M&& member) noexcept
{
    return static_cast<impl::forward_like_t<Owner, std::remove_reference_t<M>>>(member);
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Uninitialized storage for exactly one T
/// The object lifetime is managed by the owner via placement new and explicit destructor calls.
/// Trivially copyable and destructible when T is, so owners keep their triviality.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    storage_for(storage_for const&)
        requires std::is_trivially_copy_constructible_v<T>
    = default;
    storage_for(storage_for&&)
        requires std::is_trivially_move_constructible_v<T>
    = default;
    storage_for& operator=(storage_for const&)
        requires std::is_trivially_copy_assignable_v<T>
    = default;
    storage_for& operator=(storage_for&&)
        requires std::is_trivially_move_assignable_v<T>
    = default;
    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;

    // owners do the real work for non-trivial T, these only keep the union usable
    storage_for(storage_for const&)
        requires(!std::is_trivially_copy_constructible_v<T>)
    {
    }
    storage_for(storage_for&&)
        requires(!std::is_trivially_move_constructible_v<T>)
    {
    }
    storage_for& operator=(storage_for const&)
        requires(!std::is_trivially_copy_assignable_v<T>)
    {
        return *this;
    }
    storage_for& operator=(storage_for&&)
        requires(!std::is_trivially_move_assignable_v<T>)
    {
        return *this;
    }
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

// =========================================================================================================
// Callable utilities
// =========================================================================================================

/// Callable that returns its argument with perfect forwarding
/// Usage:
///   res.map(rc::identity_function{}) == res
struct identity_function
{
    template <class T>
    constexpr T&& operator()(T&& arg) const noexcept
    {
        return forward<T>(arg);
    }
};

} // namespace rc
