#pragma once

#include <result-core/macros.hh>
#include <result-core/result.hh>
#include <result-core/utility.hh>

#include <exception>
#include <functional>
#include <type_traits>

#ifndef RC_HAS_CPP_EXCEPTIONS
#error "<result-core/run_or_catch.hh> requires C++ exceptions"
#endif

// =========================================================================================================
// Bridge from exception-throwing code to rc::result
// =========================================================================================================
//
// run_or_catch(f)            - calls f(); value on normal return, error on any exception
// run_or_catch(receiver, f)  - calls f(receiver) with the same conversion
//
// The error type is std::exception_ptr and holds the exact exception object that was thrown,
// so it can be inspected later via std::rethrow_exception.
// This is the only place in result-core that catches exceptions. Every other operation lets
// exceptions from user callables propagate unchanged.
//
// Usage:
//   auto cfg = rc::run_or_catch([&] { return load_config(path); }); // result<config, std::exception_ptr>
//   if (cfg.has_error())
//       log_failure(cfg.error());

namespace rc
{
template <class F>
[[nodiscard]] auto run_or_catch(F&& block) -> result<std::remove_cvref_t<std::invoke_result_t<F>>, std::exception_ptr>
{
    using R = std::remove_cvref_t<std::invoke_result_t<F>>;
    static_assert(!std::is_void_v<R>, "run_or_catch block must return a value");

    try
    {
        return result<R, std::exception_ptr>(std::invoke(rc::forward<F>(block)));
    }
    catch (...)
    {
        return rc::error(std::current_exception());
    }
}

template <class Receiver, class F>
[[nodiscard]] auto run_or_catch(Receiver&& receiver, F&& block)
    -> result<std::remove_cvref_t<std::invoke_result_t<F, Receiver>>, std::exception_ptr>
{
    using R = std::remove_cvref_t<std::invoke_result_t<F, Receiver>>;
    static_assert(!std::is_void_v<R>, "run_or_catch block must return a value");

    try
    {
        return result<R, std::exception_ptr>(std::invoke(rc::forward<F>(block), rc::forward<Receiver>(receiver)));
    }
    catch (...)
    {
        return rc::error(std::current_exception());
    }
}
} // namespace rc
