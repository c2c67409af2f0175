#pragma once

#include <result-core/macros.hh>
#include <result-core/source_location.hh>

#include <functional>
#include <string>

namespace rc::impl
{
// Customizable assertion handler stack
// NOTE: the stack is global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = rc::impl::scoped_assertion_handler([](rc::impl::assertion_info const& info) {
//           report_to_crash_log(info);
//           throw contract_violation{info.message};
//       });
//
//       // a failed RC_ASSERT in this scope calls the handler above
//       auto v = res.value();
//   } // handler is popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    rc::source_location location;
};

// Push a handler that receives all assertion failures until it is popped
// Handlers may throw to unwind to a recovery point instead of aborting
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost handler, no-op if the stack is empty
// NOTE: with throwing handlers, prefer scoped_assertion_handler so pops are not skipped
void pop_assertion_handler();

// RAII push/pop of an assertion handler
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace rc::impl
