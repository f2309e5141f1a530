#pragma once

#include <rack-core/assert.hh>
#include <rack-core/fwd.hh>
#include <rack-core/utility.hh>

#include <type_traits>

/// Wrapper marking a value as the error alternative of a result.
/// Construct via rc::error(e) so that result<int, int> stays unambiguous.
template <class E>
struct rc::as_error_t
{
    E value;
};

namespace rc
{
/// Marks e as an error for result construction.
/// Usage: return rc::error(capacity_exceeded<T>{rc::move(value)});
template <class E>
[[nodiscard]] constexpr as_error_t<std::remove_cvref_t<E>> error(E&& e)
{
    return as_error_t<std::remove_cvref_t<E>>{rc::forward<E>(e)};
}
} // namespace rc

/// Sum type representing either a success value T or an error value E.
/// Used for expected failures that the caller is supposed to handle (e.g. a full rack).
/// Programmer errors go through RC_ASSERT instead.
/// There is no operator* or operator->; access is explicit via value() / error().
template <class T, class E>
struct rc::result
{
    // construction
public:
    /// Default result holds a default-constructed error.
    result()
        requires std::is_default_constructible_v<E>
      : _has_value(false)
    {
        new (rc::placement_new, &_storage.error) E();
    }

    /// Constructs a result holding the success value.
    result(T value) : _has_value(true) // NOLINT
    {
        new (rc::placement_new, &_storage.value) T(rc::move(value));
    }

    /// Constructs a result holding the error, see rc::error(e).
    result(as_error_t<E> err) : _has_value(false) // NOLINT
    {
        new (rc::placement_new, &_storage.error) E(rc::move(err.value));
    }

    /// Move constructor: move-constructs whichever alternative rhs holds.
    /// rhs keeps its alternative in a moved-from state.
    result(result&& rhs) noexcept : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));
        else
            new (rc::placement_new, &_storage.error) E(rc::move(rhs._storage.error));
    }

    result(result const& rhs)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (rc::placement_new, &_storage.value) T(rhs._storage.value);
        else
            new (rc::placement_new, &_storage.error) E(rhs._storage.error);
    }

    /// Move assignment: destroys the current alternative and move-constructs rhs's alternative.
    result& operator=(result&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_destroy();
            _has_value = rhs._has_value;
            if (_has_value)
                new (rc::placement_new, &_storage.value) T(rc::move(rhs._storage.value));
            else
                new (rc::placement_new, &_storage.error) E(rc::move(rhs._storage.error));
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this != &rhs)
        {
            impl_destroy();
            _has_value = rhs._has_value;
            if (_has_value)
                new (rc::placement_new, &_storage.value) T(rhs._storage.value);
            else
                new (rc::placement_new, &_storage.error) E(rhs._storage.error);
        }
        return *this;
    }

    ~result() { impl_destroy(); }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }
    [[nodiscard]] bool has_error() const { return !_has_value; }

    /// Returns the success value.
    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        RC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        RC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        RC_ASSERT(_has_value, "attempted to access value of a result holding an error");
        return rc::move(_storage.value);
    }

    /// Returns the error value.
    /// Precondition: has_error() == true.
    [[nodiscard]] E& error() &
    {
        RC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return _storage.error;
    }
    [[nodiscard]] E const& error() const&
    {
        RC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return _storage.error;
    }
    [[nodiscard]] E&& error() &&
    {
        RC_ASSERT(!_has_value, "attempted to access error of a result holding a value");
        return rc::move(_storage.error);
    }

    // helper
private:
    void impl_destroy()
    {
        if (_has_value)
            _storage.value.~T();
        else
            _storage.error.~E();
    }

    // members
private:
    union storage
    {
        storage() {}
        ~storage() {}

        T value;
        E error;
    };

    storage _storage;

    /// Tag for _storage: true when value is live, false when error is live.
    bool _has_value;
};
