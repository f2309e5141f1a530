#pragma once

#include <rack-core/assert.hh>
#include <rack-core/fwd.hh>
#include <rack-core/impl/rack_core.hh>
#include <rack-core/result.hh>
#include <rack-core/slot_storage.hh>
#include <rack-core/unit.hh>
#include <rack-core/utility.hh>

#include <type_traits>

/// Error of rack::add on a full rack.
/// Hands the rejected value back so the caller can retry, drop it, or escalate.
template <class T>
struct rc::capacity_exceeded
{
    T value;

    [[nodiscard]] static constexpr char const* message() { return "the rack is full"; }
};

/// Error of rack::emplace on a full rack; there is no value to hand back.
template <>
struct rc::capacity_exceeded<void>
{
    [[nodiscard]] static constexpr char const* message() { return "the rack is full"; }
};

/// Fixed-capacity pool of N slots of T with no dynamic allocation.
/// Allocation hands out rc::unit<T> handles; a slot is released when its unit is destroyed or taken from.
/// All storage is inline in the rack object, which is therefore neither copyable nor movable.
///
/// Time Complexity:
///   - construction: O(N) (threads the free list)
///   - add / emplace / release / take: O(1)
///
/// Usage:
///   rc::rack<sensor_frame, 16> frames;
///   auto u = frames.must_add(sensor_frame{...});
///   u.as_mut_ref()->timestamp = now;
///
///   if (auto r = frames.add(make_frame()); r.has_value())
///       queue.push(rc::move(r).value());
///
/// NOT thread-safe: a rack and its units must be used from one thread.
template <class T, rc::isize N>
struct rc::rack
{
    static_assert(N > 0, "rack capacity must be positive");

    using add_result = rc::result<unit<T>, capacity_exceeded<T>>;
    using emplace_result = rc::result<unit<T>, capacity_exceeded<void>>;

    // allocation
public:
    /// Stores value in a vacant slot.
    /// On a full rack the value is returned inside the error and nothing changes.
    [[nodiscard]] add_result add(T value)
    {
        auto const idx = _core.occupy(rc::move(value));
        if (idx == rc::no_vacant_slot)
            return rc::error(capacity_exceeded<T>{rc::move(value)});

        return unit<T>(&_core, idx);
    }

    /// Like add, but a full rack is a fatal error.
    /// For call sites that have proven by construction that capacity suffices.
    [[nodiscard]] unit<T> must_add(T value)
    {
        auto const idx = _core.occupy(rc::move(value));
        RC_ASSERT_ALWAYS(idx != rc::no_vacant_slot, "the rack is full");
        return unit<T>(&_core, idx);
    }

    /// Constructs T in place from args, works for immovable T.
    template <class... Args>
    [[nodiscard]] emplace_result emplace(Args&&... args)
    {
        static_assert(std::is_constructible_v<T, Args&&...>, "T is not constructible from the provided argument types");

        auto const idx = _core.occupy(rc::forward<Args>(args)...);
        if (idx == rc::no_vacant_slot)
            return rc::error(capacity_exceeded<void>{});

        return unit<T>(&_core, idx);
    }

    /// Like emplace, but a full rack is a fatal error.
    template <class... Args>
    [[nodiscard]] unit<T> must_emplace(Args&&... args)
    {
        static_assert(std::is_constructible_v<T, Args&&...>, "T is not constructible from the provided argument types");

        auto const idx = _core.occupy(rc::forward<Args>(args)...);
        RC_ASSERT_ALWAYS(idx != rc::no_vacant_slot, "the rack is full");
        return unit<T>(&_core, idx);
    }

    // queries
public:
    /// Number of occupied slots, equal to the number of live units.
    [[nodiscard]] isize used() const { return _core.used; }
    /// Compile-time capacity N.
    [[nodiscard]] static constexpr isize capacity() { return N; }
    [[nodiscard]] isize vacant() const { return N - _core.used; }

    [[nodiscard]] bool is_full() const { return _core.used == N; }
    [[nodiscard]] bool is_empty() const { return _core.used == 0; }

    /// Walks the free list and returns its length (== vacant() unless the rack is corrupted).
    /// O(N), meant for diagnostics and tests.
    [[nodiscard]] isize count_vacant_chain() const { return _core.count_vacant_chain(); }

    // ctors/dtor
public:
    rack()
    {
        _core.slots = _storage.data();
        _core.capacity = N;
        _core.free_head = _storage.link_all_vacant();
        _core.used = 0;
    }

    // units point into the rack, so it stays where it was constructed
    rack(rack const&) = delete;
    rack(rack&&) = delete;
    rack& operator=(rack const&) = delete;
    rack& operator=(rack&&) = delete;

    ~rack() { _core.teardown(); }

    // members
private:
    slot_storage<T, N> _storage;
    impl::rack_core<T> _core;
};

// =========================================================================================================
// Preset capacities
// =========================================================================================================

namespace rc
{
template <class T>
using rack1 = rack<T, 1>;
template <class T>
using rack2 = rack<T, 2>;
template <class T>
using rack4 = rack<T, 4>;
template <class T>
using rack8 = rack<T, 8>;
template <class T>
using rack16 = rack<T, 16>;
template <class T>
using rack32 = rack<T, 32>;
template <class T>
using rack64 = rack<T, 64>;
template <class T>
using rack128 = rack<T, 128>;
template <class T>
using rack256 = rack<T, 256>;
template <class T>
using rack512 = rack<T, 512>;
template <class T>
using rack1024 = rack<T, 1024>;
} // namespace rc
