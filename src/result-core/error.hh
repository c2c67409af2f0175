#pragma once

#include <result-core/fwd.hh>
#include <result-core/utility.hh>

#include <type_traits>

/// Marks a payload as the error of a result.
/// Needed so that result<int, int>{rc::error(3)} is distinguishable from result<int, int>{3}.
/// Usually created via rc::error(...) and immediately consumed by a result constructor.
template <class E>
struct rc::as_error_t
{
    E value;
};

namespace rc
{
/// Wraps a value as an error for constructing or returning an rc::result.
/// Usage:
///   rc::result<int, std::string> parse(std::string_view s)
///   {
///       if (s.empty())
///           return rc::error("empty input");
///       ...
///   }
template <class E>
[[nodiscard]] constexpr as_error_t<std::decay_t<E>> error(E&& value)
{
    return as_error_t<std::decay_t<E>>{rc::forward<E>(value)};
}

namespace impl
{
template <class T>
constexpr bool is_as_error = false;
template <class E>
constexpr bool is_as_error<as_error_t<E>> = true;

template <class T>
constexpr bool is_result = false;
template <class T, class E>
constexpr bool is_result<rc::result<T, E>> = true;
} // namespace impl
} // namespace rc
