#pragma once

#include <rack-core/fwd.hh>
#include <rack-core/macros.hh>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Object lifetime:
//   new (rc::placement_new, ptr) T(...) - construct in preallocated storage without including <new>
//


namespace rc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   auto u = rack.must_add(rc::move(obj));  // transfer obj into the rack
///   auto v = rc::move(u).take();             // consume the unit
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
/// Usage:
///   template<class... Args>
///   void emplace(Args&&... args) {
///       new (rc::placement_new, p) T(rc::forward<Args>(args)...);
///   }
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto rack = rc::exchange(_rack, nullptr);     // take ownership, leave the handle empty
///   auto idx = rc::exchange(_index, rc::no_vacant_slot);
template <class T, class U = T>
[[nodiscard]] RC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag for placement new that does not depend on <new> (unavailable on some freestanding toolchains)
struct placement_new_tag
{
};
constexpr placement_new_tag placement_new = {};

} // namespace rc

/// Placement new keyed on rc::placement_new_tag, never collides with user overloads of operator new
inline void* operator new(std::size_t, rc::placement_new_tag, void* buffer) noexcept
{
    return buffer;
}
/// Matching placement delete, only called by the compiler if a constructor throws
inline void operator delete(void*, rc::placement_new_tag, void*) noexcept {}
