#pragma once

#include <result-core/assert.hh>
#include <result-core/error.hh>
#include <result-core/fwd.hh>
#include <result-core/impl/combine_core.hh>
#include <result-core/optional.hh>
#include <result-core/utility.hh>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace rc::impl
{
template <class T, class E>
constexpr bool is_trivial_result = std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>;
}

/// Sum type holding either a value T (success) or an error E (expected failure).
/// Exactly one of the two is alive at any time; there is no empty state.
///
/// Construction:
///   rc::result<int, std::string> a = 42;                       // value
///   rc::result<int, std::string> b = rc::error("not found");   // error
///
/// Composition (all return new results, the source is never modified):
///   a.map(f)            T -> R                  on value, error passes through
///   a.map_error(f)      E -> G                  on error, value passes through
///   a.flat_map(f)       T -> result<R, E>       on value, returned directly
///   a.flat_map_error(f) E -> result<T, G>       on error, returned directly
///   a.recover(f)        E -> T                  turns an error into a value
///   a.flat_recover(f)   E -> result<T, E>       recovery that may fail again
///   a.combine(b, f)     (T, U) -> R             see rc::combine in <result-core/combine.hh>
///
/// Exceptions thrown by user callables are never caught here (see rc::run_or_catch for that).
/// Trivially copyable when T and E are trivially copyable.
template <class T, class E>
struct rc::result
{
    static_assert(!std::is_void_v<T> && !std::is_void_v<E>, "result cannot hold void");
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result cannot hold references");
    static_assert(!impl::is_as_error<T> && !impl::is_as_error<E>, "as_error_t is only a construction marker");

    using value_type = T;
    using error_type = E;

    // construction
public:
    /// Default result holds a value-initialized error.
    /// Only meant for containers and members that need a default constructor; prefer naming the state explicitly.
    result()
        requires std::is_default_constructible_v<E>
      : _has_value(false)
    {
        new (rc::placement_new, std::addressof(_error)) E();
    }

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, result> && !impl::is_as_error<std::remove_cvref_t<U>>
                 && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) result(U&& value) : _has_value(true) // NOLINT
    {
        new (rc::placement_new, std::addressof(_value)) T(rc::forward<U>(value));
    }

    template <class G>
        requires std::is_constructible_v<E, G>
    explicit(!std::is_convertible_v<G, E>) result(as_error_t<G> err) : _has_value(false) // NOLINT
    {
        new (rc::placement_new, std::addressof(_error)) E(rc::move(err.value));
    }

    /// Converts value and error separately, e.g. result<int, int> -> result<long, long>.
    /// Not considered if T can be constructed from the source result itself (nested results).
    template <class U, class G>
        requires(!std::is_same_v<result<U, G>, result> && !std::is_constructible_v<T, result<U, G>>
                 && std::is_constructible_v<T, U> && std::is_constructible_v<E, G>)
    explicit(!std::is_convertible_v<U, T> || !std::is_convertible_v<G, E>) result(result<U, G> rhs)
      : _has_value(rhs.has_value())
    {
        if (_has_value)
            new (rc::placement_new, std::addressof(_value)) T(rc::move(rhs).value());
        else
            new (rc::placement_new, std::addressof(_error)) E(rc::move(rhs).error());
    }

    // trivial copy/move/destroy
public:
    result(result&&)
        requires impl::is_trivial_result<T, E>
    = default;
    result(result const&)
        requires impl::is_trivial_result<T, E>
    = default;
    result& operator=(result&&)
        requires impl::is_trivial_result<T, E>
    = default;
    result& operator=(result const&)
        requires impl::is_trivial_result<T, E>
    = default;
    ~result()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;

    // non-trivial copy/move/destroy
public:
    /// rhs keeps its state with a moved-from payload.
    result(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        requires(!impl::is_trivial_result<T, E>)
      : _has_value(rhs._has_value)
    {
        impl_construct_from(rc::move(rhs));
    }

    result(result const& rhs)
        requires(!impl::is_trivial_result<T, E> && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        impl_construct_from(rhs);
    }

    /// Same state: payload is move-assigned. Different state: see impl_reinit.
    result& operator=(result&& rhs) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>
                                             && std::is_nothrow_move_assignable_v<T> && std::is_nothrow_move_assignable_v<E>)
        requires(!impl::is_trivial_result<T, E>)
    {
        if (this == &rhs)
            return *this;

        if (_has_value == rhs._has_value)
        {
            if (_has_value)
                _value = rc::move(rhs._value);
            else
                _error = rc::move(rhs._error);
        }
        else if (rhs._has_value)
        {
            impl_reinit(_value, _error, rc::move(rhs._value));
            _has_value = true;
        }
        else
        {
            impl_reinit(_error, _value, rc::move(rhs._error));
            _has_value = false;
        }

        return *this;
    }

    result& operator=(result const& rhs)
        requires(!impl::is_trivial_result<T, E> && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>
                 && std::is_copy_assignable_v<T> && std::is_copy_assignable_v<E>)
    {
        if (this == &rhs)
            return *this;

        if (_has_value == rhs._has_value)
        {
            if (_has_value)
                _value = rhs._value;
            else
                _error = rhs._error;
        }
        else if (rhs._has_value)
        {
            impl_reinit(_value, _error, rhs._value);
            _has_value = true;
        }
        else
        {
            impl_reinit(_error, _value, rhs._error);
            _has_value = false;
        }

        return *this;
    }

    ~result()
        requires(!std::is_trivially_destructible_v<T> || !std::is_trivially_destructible_v<E>)
    {
        impl_destroy();
    }

    // queries
public:
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    /// Copy of the value, or rc::nullopt if this holds an error. Never asserts.
    [[nodiscard]] rc::optional<T> opt_value() const&
    {
        if (_has_value)
            return rc::optional<T>(_value);
        return rc::nullopt;
    }
    [[nodiscard]] rc::optional<T> opt_value() &&
    {
        if (_has_value)
            return rc::optional<T>(rc::move(_value));
        return rc::nullopt;
    }

    /// Copy of the error, or rc::nullopt if this holds a value. Never asserts.
    [[nodiscard]] rc::optional<E> opt_error() const&
    {
        if (!_has_value)
            return rc::optional<E>(_error);
        return rc::nullopt;
    }
    [[nodiscard]] rc::optional<E> opt_error() &&
    {
        if (!_has_value)
            return rc::optional<E>(rc::move(_error));
        return rc::nullopt;
    }

    // access
public:
    /// Precondition: has_value().
    [[nodiscard]] T const& value() const&
    {
        RC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return _value;
    }
    [[nodiscard]] T& value() &
    {
        RC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return _value;
    }
    [[nodiscard]] T&& value() &&
    {
        RC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return rc::move(_value);
    }

    /// Precondition: has_error().
    [[nodiscard]] E const& error() const&
    {
        RC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return _error;
    }
    [[nodiscard]] E& error() &
    {
        RC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return _error;
    }
    [[nodiscard]] E&& error() &&
    {
        RC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return rc::move(_error);
    }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        return _has_value ? _value : static_cast<T>(rc::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        return _has_value ? rc::move(_value) : static_cast<T>(rc::forward<U>(fallback));
    }

    template <class G>
    [[nodiscard]] E error_or(G&& fallback) const&
    {
        return !_has_value ? _error : static_cast<E>(rc::forward<G>(fallback));
    }
    template <class G>
    [[nodiscard]] E error_or(G&& fallback) &&
    {
        return !_has_value ? rc::move(_error) : static_cast<E>(rc::forward<G>(fallback));
    }

    // in-place modification
public:
    /// Replaces the current payload by a value constructed from args.
    /// If that construction throws, the result keeps its previous state and payload.
    template <class... Args>
    T& emplace_value(Args&&... args)
    {
        if (_has_value)
            impl_replace(_value, rc::forward<Args>(args)...);
        else
            impl_reinit(_value, _error, rc::forward<Args>(args)...);

        _has_value = true;
        return _value;
    }

    /// Replaces the current payload by an error constructed from args.
    /// If that construction throws, the result keeps its previous state and payload.
    template <class... Args>
    E& emplace_error(Args&&... args)
    {
        if (!_has_value)
            impl_replace(_error, rc::forward<Args>(args)...);
        else
            impl_reinit(_error, _value, rc::forward<Args>(args)...);

        _has_value = false;
        return _error;
    }

    // side-effect hooks
public:
    /// Calls action(value) if this holds a value. Returns this result for chaining.
    template <class F>
    result const& on_value(F&& action) const&
    {
        if (_has_value)
            std::invoke(rc::forward<F>(action), _value);
        return *this;
    }
    template <class F>
    result on_value(F&& action) &&
    {
        if (_has_value)
            std::invoke(rc::forward<F>(action), std::as_const(_value));
        return rc::move(*this);
    }

    /// Calls action(error) if this holds an error. Returns this result for chaining.
    template <class F>
    result const& on_error(F&& action) const&
    {
        if (!_has_value)
            std::invoke(rc::forward<F>(action), _error);
        return *this;
    }
    template <class F>
    result on_error(F&& action) &&
    {
        if (!_has_value)
            std::invoke(rc::forward<F>(action), std::as_const(_error));
        return rc::move(*this);
    }

    // transformations
    // rvalue results hand their payload to the callable (or the output) by move
public:
    template <class F>
    [[nodiscard]] auto map(F&& transform) const&
    {
        return impl_map(*this, rc::forward<F>(transform));
    }
    template <class F>
    [[nodiscard]] auto map(F&& transform) &&
    {
        return impl_map(rc::move(*this), rc::forward<F>(transform));
    }

    template <class F>
    [[nodiscard]] auto map_error(F&& transform) const&
    {
        return impl_map_error(*this, rc::forward<F>(transform));
    }
    template <class F>
    [[nodiscard]] auto map_error(F&& transform) &&
    {
        return impl_map_error(rc::move(*this), rc::forward<F>(transform));
    }

    template <class F>
    [[nodiscard]] auto flat_map(F&& transform) const&
    {
        return impl_flat_map(*this, rc::forward<F>(transform));
    }
    template <class F>
    [[nodiscard]] auto flat_map(F&& transform) &&
    {
        return impl_flat_map(rc::move(*this), rc::forward<F>(transform));
    }

    template <class F>
    [[nodiscard]] auto flat_map_error(F&& transform) const&
    {
        return impl_flat_map_error(*this, rc::forward<F>(transform));
    }
    template <class F>
    [[nodiscard]] auto flat_map_error(F&& transform) &&
    {
        return impl_flat_map_error(rc::move(*this), rc::forward<F>(transform));
    }

    template <class F>
    [[nodiscard]] result recover(F&& transform) const&
    {
        return impl_recover(*this, rc::forward<F>(transform));
    }
    template <class F>
    [[nodiscard]] result recover(F&& transform) &&
    {
        return impl_recover(rc::move(*this), rc::forward<F>(transform));
    }

    template <class F>
    [[nodiscard]] result flat_recover(F&& transform) const&
    {
        return impl_flat_recover(*this, rc::forward<F>(transform));
    }
    template <class F>
    [[nodiscard]] result flat_recover(F&& transform) &&
    {
        return impl_flat_recover(rc::move(*this), rc::forward<F>(transform));
    }

    /// Same as rc::combine(*this, other, transform).
    template <class U, class F>
    [[nodiscard]] auto combine(result<U, E> const& other, F&& transform) const
    {
        return impl::combine_fixed(rc::forward<F>(transform), *this, other);
    }

    // comparison
public:
    /// Equal iff both hold a value or both hold an error, and the payloads compare equal.
    [[nodiscard]] friend bool operator==(result const& lhs, result const& rhs)
        requires requires(T const& v, E const& e) {
            bool(v == v);
            bool(e == e);
        }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return bool(lhs._value == rhs._value);
        return bool(lhs._error == rhs._error);
    }

    // helper
private:
    void impl_destroy()
    {
        if (_has_value)
            _value.~T();
        else
            _error.~E();
    }

    // Ends the lifetime of old_slot and starts new_slot from args.
    // If constructing New throws, old_slot is alive again (restored from a backup) and the caller's _has_value still matches it.
    template <class New, class Old, class... Args>
    static void impl_reinit(New& new_slot, Old& old_slot, Args&&... args)
    {
        if constexpr (std::is_nothrow_constructible_v<New, Args...>)
        {
            old_slot.~Old();
            new (rc::placement_new, std::addressof(new_slot)) New(rc::forward<Args>(args)...);
        }
        else if constexpr (std::is_nothrow_move_constructible_v<Old>)
        {
            Old backup(rc::move(old_slot));
            old_slot.~Old();
#ifdef RC_HAS_CPP_EXCEPTIONS
            try
            {
                new (rc::placement_new, std::addressof(new_slot)) New(rc::forward<Args>(args)...);
            }
            catch (...)
            {
                new (rc::placement_new, std::addressof(old_slot)) Old(rc::move(backup));
                throw;
            }
#else
            new (rc::placement_new, std::addressof(new_slot)) New(rc::forward<Args>(args)...);
#endif
        }
        else
        {
            static_assert(std::is_nothrow_move_constructible_v<New>,
                          "switching the state of a result needs a nothrow move constructor for T or E");

            New tmp(rc::forward<Args>(args)...);
            old_slot.~Old();
            new (rc::placement_new, std::addressof(new_slot)) New(rc::move(tmp));
        }
    }

    // Same-state replacement. A throwing constructor leaves slot untouched.
    template <class U, class... Args>
    static void impl_replace(U& slot, Args&&... args)
    {
        if constexpr (std::is_nothrow_constructible_v<U, Args...>)
        {
            slot.~U();
            new (rc::placement_new, std::addressof(slot)) U(rc::forward<Args>(args)...);
        }
        else
        {
            slot = U(rc::forward<Args>(args)...);
        }
    }

    // expects _has_value to already match rhs
    template <class Rhs>
    void impl_construct_from(Rhs&& rhs)
    {
        if (_has_value)
            new (rc::placement_new, std::addressof(_value)) T(rc::forward_like<Rhs>(rhs._value));
        else
            new (rc::placement_new, std::addressof(_error)) E(rc::forward_like<Rhs>(rhs._error));
    }

    template <class Self, class F>
    static auto impl_map(Self&& self, F&& transform)
    {
        using R = std::remove_cvref_t<std::invoke_result_t<F, impl::forward_like_t<Self, T>>>;
        static_assert(!std::is_void_v<R>, "map transform must return a value");

        if (self._has_value)
            return result<R, E>(std::invoke(rc::forward<F>(transform), rc::forward_like<Self>(self._value)));
        return result<R, E>(rc::error(rc::forward_like<Self>(self._error)));
    }

    template <class Self, class F>
    static auto impl_map_error(Self&& self, F&& transform)
    {
        using G = std::remove_cvref_t<std::invoke_result_t<F, impl::forward_like_t<Self, E>>>;
        static_assert(!std::is_void_v<G>, "map_error transform must return a value");

        if (!self._has_value)
            return result<T, G>(rc::error(std::invoke(rc::forward<F>(transform), rc::forward_like<Self>(self._error))));
        return result<T, G>(rc::forward_like<Self>(self._value));
    }

    template <class Self, class F>
    static auto impl_flat_map(Self&& self, F&& transform)
    {
        using out_t = std::remove_cvref_t<std::invoke_result_t<F, impl::forward_like_t<Self, T>>>;
        static_assert(impl::is_result<out_t>, "flat_map transform must return an rc::result");
        static_assert(std::is_same_v<typename out_t::error_type, E>, "flat_map transform must keep the error type");

        if (self._has_value)
            return out_t(std::invoke(rc::forward<F>(transform), rc::forward_like<Self>(self._value)));
        return out_t(rc::error(rc::forward_like<Self>(self._error)));
    }

    template <class Self, class F>
    static auto impl_flat_map_error(Self&& self, F&& transform)
    {
        using out_t = std::remove_cvref_t<std::invoke_result_t<F, impl::forward_like_t<Self, E>>>;
        static_assert(impl::is_result<out_t>, "flat_map_error transform must return an rc::result");
        static_assert(std::is_same_v<typename out_t::value_type, T>, "flat_map_error transform must keep the value type");

        if (!self._has_value)
            return out_t(std::invoke(rc::forward<F>(transform), rc::forward_like<Self>(self._error)));
        return out_t(rc::forward_like<Self>(self._value));
    }

    template <class Self, class F>
    static result impl_recover(Self&& self, F&& transform)
    {
        if (!self._has_value)
            return result(std::invoke(rc::forward<F>(transform), rc::forward_like<Self>(self._error)));
        return result(rc::forward<Self>(self));
    }

    template <class Self, class F>
    static result impl_flat_recover(Self&& self, F&& transform)
    {
        using out_t = std::remove_cvref_t<std::invoke_result_t<F, impl::forward_like_t<Self, E>>>;
        static_assert(std::is_same_v<out_t, result>, "flat_recover transform must return the same result type");

        if (!self._has_value)
            return std::invoke(rc::forward<F>(transform), rc::forward_like<Self>(self._error));
        return result(rc::forward<Self>(self));
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };

    bool _has_value = false;
};
