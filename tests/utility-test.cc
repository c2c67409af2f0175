#include <result-core/utility.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

// move and forward keep the exact reference types
static_assert(std::is_same_v<decltype(rc::move(std::declval<int&>())), int&&>);
static_assert(std::is_same_v<decltype(rc::move(std::declval<int const&>())), int const&&>);
static_assert(std::is_same_v<decltype(rc::forward<int&>(std::declval<int&>())), int&>);
static_assert(std::is_same_v<decltype(rc::forward<int>(std::declval<int&>())), int&&>);

// forward_like takes category and constness from the owner
static_assert(std::is_same_v<decltype(rc::forward_like<int&>(std::declval<std::string&>())), std::string&>);
static_assert(std::is_same_v<decltype(rc::forward_like<int const&>(std::declval<std::string&>())), std::string const&>);
static_assert(std::is_same_v<decltype(rc::forward_like<int>(std::declval<std::string&>())), std::string&&>);
static_assert(std::is_same_v<decltype(rc::forward_like<int const>(std::declval<std::string&>())), std::string const&&>);

// storage_for keeps the triviality of its payload
static_assert(std::is_trivially_copyable_v<rc::storage_for<int>>);
static_assert(std::is_trivially_destructible_v<rc::storage_for<int>>);
static_assert(!std::is_trivially_destructible_v<rc::storage_for<std::string>>);
static_assert(sizeof(rc::storage_for<std::string>) == sizeof(std::string));
static_assert(alignof(rc::storage_for<double>) == alignof(double));

TEST("utility - move transfers ownership")
{
    auto a = std::make_unique<int>(3);
    auto b = rc::move(a);
    CHECK(a == nullptr); // NOLINT(bugprone-use-after-move)
    CHECK(*b == 3);
}

TEST("utility - identity_function")
{
    auto const id = rc::identity_function{};

    int x = 5;
    static_assert(std::is_same_v<decltype(id(x)), int&>);
    static_assert(std::is_same_v<decltype(id(rc::move(x))), int&&>);
    CHECK(&id(x) == &x);

    auto const s = std::string(id(std::string("abc")));
    CHECK(s == "abc");
}

TEST("utility - storage_for lifetime is managed by the owner")
{
    rc::storage_for<std::string> storage;
    new (rc::placement_new, &storage.value) std::string("payload");
    CHECK(storage.value == "payload");
    storage.value.~basic_string();
}
