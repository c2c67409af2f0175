#pragma once

#include <result-core/error.hh>
#include <result-core/fwd.hh>
#include <result-core/span.hh>
#include <result-core/utility.hh>

#include <array>
#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

// Shared machinery behind rc::combine, rc::flat_combine and result::combine.
//
// Every arity lowers its inputs to a span of opaque_result handles and goes through flat_combine_opaque,
// which is the only place that decides "first error wins". The typed front-ends restore the static
// value types positionally before calling the user transform.

namespace rc::impl
{
/// Type-erased view of one combination input.
/// Exactly one pointer is set: value points to the T of a result holding a value, error to the E otherwise.
/// Only valid while the viewed result is alive.
template <class E>
struct opaque_result
{
    void const* value = nullptr;
    E const* error = nullptr;
};

template <class T, class E>
[[nodiscard]] opaque_result<E> make_opaque(rc::result<T, E> const& r)
{
    if (r.has_value())
        return {.value = std::addressof(r.value()), .error = nullptr};
    return {.value = nullptr, .error = std::addressof(r.error())};
}

/// Scans inputs in order and returns (a copy of) the first error.
/// on_values is only invoked if every input holds a value; it receives the unchanged handle span.
template <class R, class E, class F>
[[nodiscard]] rc::result<R, E> flat_combine_opaque(rc::span<opaque_result<E> const> inputs, F&& on_values)
{
    for (auto const& in : inputs)
        if (in.error != nullptr)
            return rc::result<R, E>(rc::error(*in.error));

    return rc::forward<F>(on_values)(inputs);
}

template <class... Ts, class F, class E, std::size_t... I>
decltype(auto) invoke_with_restored_values(F& transform, rc::span<opaque_result<E> const> values, std::index_sequence<I...>)
{
    return std::invoke(transform, *static_cast<Ts const*>(values[static_cast<isize>(I)].value)...);
}

template <class F, class E, class... Ts>
[[nodiscard]] auto flat_combine_fixed(F&& transform, rc::result<Ts, E> const&... inputs)
{
    using out_t = std::remove_cvref_t<std::invoke_result_t<F&, Ts const&...>>;
    static_assert(is_result<out_t>, "flat_combine transform must return an rc::result");
    static_assert(std::is_same_v<typename out_t::error_type, E>, "flat_combine transform must keep the error type");

    std::array<opaque_result<E>, sizeof...(Ts)> const handles = {impl::make_opaque(inputs)...};

    return impl::flat_combine_opaque<typename out_t::value_type, E>(
        rc::span<opaque_result<E> const>(handles),
        [&](rc::span<opaque_result<E> const> values) -> out_t
        { return impl::invoke_with_restored_values<Ts...>(transform, values, std::index_sequence_for<Ts...>{}); });
}

template <class F, class E, class... Ts>
[[nodiscard]] auto combine_fixed(F&& transform, rc::result<Ts, E> const&... inputs)
{
    using R = std::remove_cvref_t<std::invoke_result_t<F&, Ts const&...>>;
    static_assert(!std::is_void_v<R>, "combine transform must return a value");

    return impl::flat_combine_fixed([&](Ts const&... values) { return rc::result<R, E>(std::invoke(transform, values...)); },
                                    inputs...);
}

template <class T, class E, class F>
[[nodiscard]] auto flat_combine_uniform(rc::span<rc::result<T, E> const> inputs, F&& transform)
{
    using out_t = std::remove_cvref_t<std::invoke_result_t<F&, std::vector<T>>>;
    static_assert(is_result<out_t>, "flat_combine transform must return an rc::result");
    static_assert(std::is_same_v<typename out_t::error_type, E>, "flat_combine transform must keep the error type");

    std::vector<opaque_result<E>> handles;
    handles.reserve(static_cast<std::size_t>(inputs.size()));
    for (auto const& in : inputs)
        handles.push_back(impl::make_opaque(in));

    return impl::flat_combine_opaque<typename out_t::value_type, E>(
        rc::span<opaque_result<E> const>(handles),
        [&](rc::span<opaque_result<E> const> values) -> out_t
        {
            std::vector<T> unwrapped;
            unwrapped.reserve(static_cast<std::size_t>(values.size()));
            for (auto const& v : values)
                unwrapped.push_back(*static_cast<T const*>(v.value));

            return std::invoke(transform, rc::move(unwrapped));
        });
}

template <class T, class E, class F>
[[nodiscard]] auto combine_uniform(rc::span<rc::result<T, E> const> inputs, F&& transform)
{
    using R = std::remove_cvref_t<std::invoke_result_t<F&, std::vector<T>>>;
    static_assert(!std::is_void_v<R>, "combine transform must return a value");

    return impl::flat_combine_uniform(inputs, [&](std::vector<T> values)
                                      { return rc::result<R, E>(std::invoke(transform, rc::move(values))); });
}

/// Anything contiguous with .data() and .size() whose elements are rc::results.
template <class Results>
concept result_range = requires(Results const& r) {
    { r.size() } -> std::convertible_to<isize>;
    requires is_result<std::remove_cvref_t<decltype(*r.data())>>;
};
} // namespace rc::impl
