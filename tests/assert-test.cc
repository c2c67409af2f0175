#include <result-core/assert-handler.hh>
#include <result-core/assert.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>


TEST("assertions - failing assertion calls handler with correct payload")
{
    std::optional<rc::impl::assertion_info> captured;
    int const test_line = __LINE__ + 11; // line of RC_ASSERT_ALWAYS below

    {
        auto handler = rc::impl::scoped_assertion_handler(
            [&](rc::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // must throw to prevent abort
            });
        try
        {
            RC_ASSERT_ALWAYS(false, "hello assert");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());

    CHECK(captured->expression.find("false") != std::string::npos);
    CHECK(captured->message == "hello assert");

    auto file_name = std::string(captured->location.file_name());
    CHECK(file_name.ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
    CHECK(!std::string(captured->location.function_name()).empty());
}

TEST("assertions - passing assertion does not call handler")
{
    bool handler_called = false;
    int counter = 0;

    auto cheap_check = [&]() -> bool
    {
        ++counter;
        return true;
    };

    {
        auto handler = rc::impl::scoped_assertion_handler([&](rc::impl::assertion_info const&) { handler_called = true; });
        RC_ASSERT_ALWAYS(cheap_check(), "should not fire");
    }

    CHECK(!handler_called);
    CHECK(counter == 1); // condition is evaluated exactly once
}

TEST("assertions - RC_ASSERT follows the build configuration")
{
    int failures = 0;
    auto handler = rc::impl::scoped_assertion_handler(
        [&](rc::impl::assertion_info const&)
        {
            ++failures;
            throw 0;
        });

    try
    {
        RC_ASSERT(1 + 1 == 3, "arithmetic is broken");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

#if RC_ASSERT_ENABLED
    CHECK(failures == 1);
#else
    CHECK(failures == 0);
#endif
}

TEST("assertions - handler stack is LIFO and nesting works")
{
    std::vector<int> events;

    auto handler_a = rc::impl::scoped_assertion_handler(
        [&](rc::impl::assertion_info const&)
        {
            events.push_back(1);
            throw 0;
        });

    {
        auto handler_b = rc::impl::scoped_assertion_handler(
            [&](rc::impl::assertion_info const&)
            {
                events.push_back(2);
                throw 0;
            });

        try
        {
            RC_ASSERT_ALWAYS(false, "first failure");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    try
    {
        RC_ASSERT_ALWAYS(false, "second failure");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - scoped handler pops on scope exit even when handler throws")
{
    std::vector<int> events;

    auto outer = rc::impl::scoped_assertion_handler(
        [&](rc::impl::assertion_info const&)
        {
            events.push_back(1);
            throw 0;
        });

    struct sentinel_exception
    {
    };

    try
    {
        auto inner = rc::impl::scoped_assertion_handler(
            [&](rc::impl::assertion_info const&)
            {
                events.push_back(2);
                throw sentinel_exception{};
            });

        RC_ASSERT_ALWAYS(false, "trigger inner");
        CHECK(false); // unreachable
    }
    catch (sentinel_exception const&) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 1);
    CHECK(events[0] == 2);

    try
    {
        RC_ASSERT_ALWAYS(false, "trigger outer");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - manual push and pop")
{
    std::vector<std::string> messages;

    rc::impl::push_assertion_handler(
        [&](rc::impl::assertion_info const& info)
        {
            messages.push_back(info.message);
            throw 0;
        });

    try
    {
        RC_ASSERT_ALWAYS(2 < 1, "manual handler");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    rc::impl::pop_assertion_handler();

    REQUIRE(messages.size() == 1);
    CHECK(messages[0] == "manual handler");
}
