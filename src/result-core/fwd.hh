#pragma once

#include <cstddef>
#include <cstdint>


namespace rc
{

//
// Primitives
//

// signed size type
// Sizes and indices are signed so that "size - 1" and relative offsets never silently wrap around.
// We only target 64-bit platforms, so the lost bit of range is irrelevant.
using isize = int64_t;

// pointer
using nullptr_t = std::nullptr_t;

//
// Object lifetime
//

// tag for the placement new overload declared below
// avoids including <new> in every header that needs to start an object lifetime in raw storage
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

//
// Views
//

template <class T>
struct span;

//
// Sum types
//

struct nullopt_t;
template <class T>
struct optional;

template <class E>
struct as_error_t;
template <class T, class E>
struct result;

} // namespace rc

// placement new without <new>
// usage: new (rc::placement_new, ptr) T(args...);
[[nodiscard]] inline void* operator new(std::size_t, rc::placement_new_t, void* buffer) noexcept
{
    return buffer;
}
// only called if a constructor in a placement new expression throws
inline void operator delete(void*, rc::placement_new_t, void*) noexcept {}
