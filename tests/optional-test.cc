#include <result-core/optional.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

// optional stays trivial
static_assert(std::is_constructible_v<rc::optional<int>>);
static_assert(std::is_constructible_v<rc::optional<int>, int>);
static_assert(std::is_constructible_v<rc::optional<int>, rc::nullopt_t>);
static_assert(std::is_trivially_copyable_v<rc::optional<int>>);
static_assert(std::is_trivially_destructible_v<rc::optional<int>>);

static_assert(!std::is_trivially_copyable_v<rc::optional<std::string>>);
static_assert(!std::is_copy_constructible_v<rc::optional<std::unique_ptr<int>>>);

namespace
{
// counting type to track special member function calls
struct counting_type
{
    int value = 0;

    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
    }

    explicit counting_type(int v) : value(v) {}

    counting_type(counting_type const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    counting_type(counting_type&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }

    counting_type& operator=(counting_type const& rhs) = default;
    counting_type& operator=(counting_type&& rhs) noexcept = default;

    ~counting_type() { ++dtor_count; }
};
} // namespace

TEST("optional - trivial types")
{
    SECTION("default construction")
    {
        auto const opt = rc::optional<int>{};
        CHECK(!opt.has_value());
    }

    SECTION("nullopt construction")
    {
        rc::optional<int> const opt = rc::nullopt;
        CHECK(!opt.has_value());
    }

    SECTION("value construction")
    {
        auto const opt = rc::optional<int>{42};
        CHECK(opt.has_value());
        CHECK(opt.value() == 42);
    }

    SECTION("assignment")
    {
        auto opt = rc::optional<int>{};
        opt = 17;
        CHECK(opt.value() == 17);
        opt = rc::nullopt;
        CHECK(!opt.has_value());
    }
}

TEST("optional - non-trivial types")
{
    SECTION("copy keeps the source")
    {
        auto const a = rc::optional<std::string>{"text"};
        auto const b = a; // NOLINT
        CHECK(a.value() == "text");
        CHECK(b.value() == "text");
    }

    SECTION("move leaves the source empty")
    {
        auto a = rc::optional<std::string>{"text"};
        auto const b = rc::move(a);
        CHECK(!a.has_value()); // NOLINT(bugprone-use-after-move)
        CHECK(b.value() == "text");
    }

    SECTION("copy assignment over a value and over empty")
    {
        auto const src = rc::optional<std::string>{"src"};
        auto filled = rc::optional<std::string>{"old"};
        auto empty = rc::optional<std::string>{};

        filled = src;
        empty = src;
        CHECK(filled.value() == "src");
        CHECK(empty.value() == "src");

        filled = rc::optional<std::string>{};
        CHECK(!filled.has_value());
    }

    SECTION("self assignment")
    {
        auto opt = rc::optional<std::string>{"keep"};
        auto& alias = opt;
        opt = alias;
        CHECK(opt.value() == "keep");
        opt = rc::move(alias);
        CHECK(opt.value() == "keep");
    }
}

TEST("optional - counting special member functions")
{
    counting_type::reset_counters();
    {
        auto a = rc::optional<counting_type>{counting_type{1}};
        CHECK(counting_type::move_ctor_count == 1);

        auto b = a;
        CHECK(counting_type::copy_ctor_count == 1);

        auto c = rc::move(b);
        CHECK(counting_type::move_ctor_count == 2);
        CHECK(!b.has_value()); // NOLINT(bugprone-use-after-move)
    }

    // temporary, a, moved-from b payload, c
    CHECK(counting_type::dtor_count == 4);
}

TEST("optional - move-only types")
{
    auto opt = rc::optional<std::unique_ptr<int>>{std::make_unique<int>(5)};
    REQUIRE(opt.has_value());
    CHECK(*opt.value() == 5);

    auto ptr = rc::move(opt).value();
    CHECK(*ptr == 5);
}

TEST("optional - value_or")
{
    CHECK(rc::optional<int>{3}.value_or(9) == 3);
    CHECK(rc::optional<int>{}.value_or(9) == 9);

    auto const name = rc::optional<std::string>{};
    CHECK(name.value_or("anonymous") == "anonymous");
}

TEST("optional - equality")
{
    CHECK(rc::optional<int>{} == rc::optional<int>{});
    CHECK(rc::optional<int>{1} == rc::optional<int>{1});
    CHECK(rc::optional<int>{1} != rc::optional<int>{2});
    CHECK(rc::optional<int>{1} != rc::optional<int>{});

    CHECK(rc::optional<int>{1} == 1);
    CHECK(rc::optional<int>{} != 1);
    CHECK(rc::optional<int>{} == rc::nullopt);
    CHECK(rc::optional<int>{0} != rc::nullopt);

    CHECK(rc::optional<std::string>{"a"} == std::string("a"));
}

TEST("optional - value preserves category")
{
    auto opt = rc::optional<int>{1};
    auto const copt = rc::optional<int>{1};
    static_assert(std::is_same_v<decltype(opt.value()), int&>);
    static_assert(std::is_same_v<decltype(copt.value()), int const&>);
    static_assert(std::is_same_v<decltype(rc::move(opt).value()), int&&>);

    opt.value() = 5;
    CHECK(opt.value() == 5);
}
