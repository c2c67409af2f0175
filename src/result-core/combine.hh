#pragma once

#include <result-core/fwd.hh>
#include <result-core/impl/combine_core.hh>
#include <result-core/result.hh>
#include <result-core/span.hh>
#include <result-core/utility.hh>

#include <initializer_list>

// =========================================================================================================
// Combining independent results
// =========================================================================================================
//
// combine(r1, ..., rN, f)        - f(v1, ..., vN) -> R,             returns result<R, E>
// flat_combine(r1, ..., rN, f)   - f(v1, ..., vN) -> result<R, E>,  returns that result
// combine(results, f)            - f(std::vector<T>) -> R,          for any number of result<T, E>
// flat_combine(results, f)       - f(std::vector<T>) -> result<R, E>
//
// All inputs share the error type E, value types may differ for the fixed-arity forms (2 to 5 inputs).
// Inputs are inspected in argument order and the FIRST error is returned; f is then never called.
// Only if every input holds a value is f called, with the values in argument order.
// Errors are not accumulated.
//
// Usage:
//   rc::result<int, std::string> width = parse_int(w);
//   rc::result<int, std::string> height = parse_int(h);
//   auto area = rc::combine(width, height, [](int w, int h) { return w * h; });
//
//   auto sum = rc::combine(std::vector{a, b, c, d}, [](std::vector<int> values) { ... });
//
// The results are only read; f receives const references to their values (fixed arity)
// or a vector of copies (uniform forms).

namespace rc
{
// =========================================================================================================
// combine - transform returns a plain value
// =========================================================================================================

template <class T1, class T2, class E, class F>
[[nodiscard]] auto combine(result<T1, E> const& r1, result<T2, E> const& r2, F&& transform)
{
    return impl::combine_fixed(rc::forward<F>(transform), r1, r2);
}

template <class T1, class T2, class T3, class E, class F>
[[nodiscard]] auto combine(result<T1, E> const& r1, result<T2, E> const& r2, result<T3, E> const& r3, F&& transform)
{
    return impl::combine_fixed(rc::forward<F>(transform), r1, r2, r3);
}

template <class T1, class T2, class T3, class T4, class E, class F>
[[nodiscard]] auto combine(
    result<T1, E> const& r1, result<T2, E> const& r2, result<T3, E> const& r3, result<T4, E> const& r4, F&& transform)
{
    return impl::combine_fixed(rc::forward<F>(transform), r1, r2, r3, r4);
}

template <class T1, class T2, class T3, class T4, class T5, class E, class F>
[[nodiscard]] auto combine(result<T1, E> const& r1,
                           result<T2, E> const& r2,
                           result<T3, E> const& r3,
                           result<T4, E> const& r4,
                           result<T5, E> const& r5,
                           F&& transform)
{
    return impl::combine_fixed(rc::forward<F>(transform), r1, r2, r3, r4, r5);
}

/// Uniform form over a contiguous range of result<T, E> (rc::span, std::vector, std::array, ...).
/// An empty range counts as "all succeeded": f receives an empty vector.
template <class Results, class F>
    requires impl::result_range<Results>
[[nodiscard]] auto combine(Results const& results, F&& transform)
{
    using result_t = std::remove_cvref_t<decltype(*results.data())>;
    return impl::combine_uniform(rc::span<result_t const>(results), rc::forward<F>(transform));
}

/// Uniform form for braced lists: rc::combine({a, b, c}, f).
template <class T, class E, class F>
[[nodiscard]] auto combine(std::initializer_list<result<T, E>> results, F&& transform)
{
    return impl::combine_uniform(rc::span<result<T, E> const>(results.begin(), static_cast<isize>(results.size())),
                                 rc::forward<F>(transform));
}

// =========================================================================================================
// flat_combine - transform returns a result itself
// =========================================================================================================

template <class T1, class T2, class E, class F>
[[nodiscard]] auto flat_combine(result<T1, E> const& r1, result<T2, E> const& r2, F&& transform)
{
    return impl::flat_combine_fixed(rc::forward<F>(transform), r1, r2);
}

template <class T1, class T2, class T3, class E, class F>
[[nodiscard]] auto flat_combine(result<T1, E> const& r1, result<T2, E> const& r2, result<T3, E> const& r3, F&& transform)
{
    return impl::flat_combine_fixed(rc::forward<F>(transform), r1, r2, r3);
}

template <class T1, class T2, class T3, class T4, class E, class F>
[[nodiscard]] auto flat_combine(
    result<T1, E> const& r1, result<T2, E> const& r2, result<T3, E> const& r3, result<T4, E> const& r4, F&& transform)
{
    return impl::flat_combine_fixed(rc::forward<F>(transform), r1, r2, r3, r4);
}

template <class T1, class T2, class T3, class T4, class T5, class E, class F>
[[nodiscard]] auto flat_combine(result<T1, E> const& r1,
                                result<T2, E> const& r2,
                                result<T3, E> const& r3,
                                result<T4, E> const& r4,
                                result<T5, E> const& r5,
                                F&& transform)
{
    return impl::flat_combine_fixed(rc::forward<F>(transform), r1, r2, r3, r4, r5);
}

template <class Results, class F>
    requires impl::result_range<Results>
[[nodiscard]] auto flat_combine(Results const& results, F&& transform)
{
    using result_t = std::remove_cvref_t<decltype(*results.data())>;
    return impl::flat_combine_uniform(rc::span<result_t const>(results), rc::forward<F>(transform));
}

template <class T, class E, class F>
[[nodiscard]] auto flat_combine(std::initializer_list<result<T, E>> results, F&& transform)
{
    return impl::flat_combine_uniform(rc::span<result<T, E> const>(results.begin(), static_cast<isize>(results.size())),
                                      rc::forward<F>(transform));
}
} // namespace rc
