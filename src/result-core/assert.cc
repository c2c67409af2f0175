#include "assert.hh"

#include <result-core/assert-handler.hh>

#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>
#include <version>

#ifdef __cpp_lib_stacktrace
#include <stacktrace>
#endif

namespace
{
using handler_t = std::move_only_function<void(rc::impl::assertion_info const&)>;

// NOTE: not thread-safe, push/pop must be externally synchronized
std::vector<handler_t>& handler_stack()
{
    static std::vector<handler_t> handlers;
    return handlers;
}

void report_to_stderr(rc::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << "[result-core] assertion `" << info.expression << "` failed: " << info.message << '\n'
              << "  at " << loc.file_name() << ':' << loc.line() << " in " << loc.function_name() << '\n';

#ifdef __cpp_lib_stacktrace
    std::cerr << std::stacktrace::current(1) << '\n';
#endif
    std::cerr.flush();
}
} // namespace

void rc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    handler_stack().push_back(std::move(handler));
}

void rc::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

rc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

rc::impl::scoped_assertion_handler::~scoped_assertion_handler() { pop_assertion_handler(); }

RC_COLD_FUNC void rc::impl::handle_assert_failure(char const* expression, char const* message, rc::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = handler_stack();
    if (handlers.empty())
        report_to_stderr(info);
    else
        handlers.back()(info);
}

[[noreturn]] void rc::impl::perform_abort() noexcept { std::abort(); }
