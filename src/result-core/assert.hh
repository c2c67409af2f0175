#pragma once

// Lean header: only macros and source_location, no string or format dependencies.
#include <result-core/macros.hh>
#include <result-core/source_location.hh>

// =========================================================================================================
// RC_ASSERT - Runtime contract check with a string literal message
//
// Used for PROGRAMMER ERRORS only: violated preconditions, invariants and postconditions.
// Expected failures are modeled with rc::result<T, E>, never with assertions.
//
// Error handling strategy of result-core:
//   - Assertions      -> programmer errors (e.g. value() on a result that holds an error)
//   - result<T, E>    -> common/expected failures, passed around as values
//   - Exceptions      -> only raised by user callables, propagated unchanged
//                        (rc::run_or_catch is the single place that turns them into results)
//
// When assertions are active:
//   RC_DEBUG and RC_RELWITHDEBINFO builds (and builds without a configuration define).
//   RC_RELEASE builds strip them unless RC_ENABLE_ASSERT_IN_RELEASE is defined.
//
// On failure:
//   The topmost handler from <result-core/assert-handler.hh> is called (default: report to stderr),
//   then the program aborts. Handlers may throw instead to unwind to a recovery point.
//
// Usage:
//   RC_ASSERT(has_value(), "accessed value of a result holding an error");
//   RC_ASSERT(0 <= i && i < _size, "index out of bounds");
//
#define RC_ASSERT(cond, msg) RC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// RC_ASSERT_ALWAYS - Assertion that stays active in every build configuration
//
// Usage:
//   RC_ASSERT_ALWAYS(handler_count > 0, "unbalanced assertion handler stack");
//
#define RC_ASSERT_ALWAYS(cond, msg) RC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace rc::impl
{
// Reports a failed assertion to the topmost handler (or the stderr report if none is installed)
// Returns normally unless the handler throws; the caller aborts afterwards
RC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, rc::source_location location);

[[noreturn]] void perform_abort() noexcept;
} // namespace rc::impl

#define RC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::rc::impl::handle_assert_failure(#cond, msg, ::rc::source_location::current()); \
            ::rc::impl::perform_abort();                                                     \
        }                                                                                    \
    } while (false)

#if RC_ASSERT_ENABLED

#define RC_IMPL_ASSERT(cond, msg) RC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// condition and message still have to compile, but are never evaluated
#define RC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        RC_UNUSED(cond);          \
        RC_UNUSED(msg);           \
    } while (false)

#endif
