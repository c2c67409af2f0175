#pragma once

#include <result-core/assert.hh>
#include <result-core/fwd.hh>
#include <result-core/utility.hh>

#include <type_traits>

/// Sentinel type for the "no value" state of rc::optional.
/// Not default constructible so that optional<T> = {} stays unambiguous.
struct rc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace rc
{
/// The canonical empty marker: optional<int> opt = rc::nullopt;
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace rc

/// Either a value of type T or nothing.
/// This is the "absent" answer of rc::result::opt_value() and rc::result::opt_error().
/// No operator* or operator->: access goes through value(), which asserts engagement.
/// Trivially copyable when T is trivially copyable.
template <class T>
struct rc::optional
{
    // construction
public:
    optional() = default;

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (rc::placement_new, &_storage.value) T(rc::forward<U>(value));
    }

    optional(nullopt_t) {}

    // trivial copy/move/destroy
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Leaves rhs empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_storage.value) T(rhs._storage.value);
    }

    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = rc::move(rhs._storage.value);
            else
                new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = rhs._storage.value;
            else
                new (rc::placement_new, &_storage.value) T(rhs._storage.value);

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Precondition: has_value().
    [[nodiscard]] T const& value() const&
    {
        RC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T& value() &
    {
        RC_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        RC_ASSERT(_has_value, "attempted to access value of empty optional");
        return rc::move(_storage.value);
    }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(rc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return _has_value ? rc::move(_storage.value) : static_cast<T>(rc::forward<U>(fallback));
    }

    // comparison
public:
    /// Both empty, or both engaged with equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// optional<int> == true would silently compare the value; only optional<bool> may do that.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    rc::storage_for<T> _storage;

    bool _has_value = false;
};
