#pragma once

#include <rack-core/assert.hh>
#include <rack-core/fwd.hh>
#include <rack-core/utility.hh>

namespace rc
{
/// Free-list terminator, also the index of an empty unit.
constexpr isize no_vacant_slot = -1;

namespace impl
{
// slot state word
// >= 0 means occupied, the value is the number of live slot_ref readers
enum slot_state : i32
{
    slot_vacant = -2,
    slot_write_borrowed = -1,
    slot_unborrowed = 0,
};
} // namespace impl
} // namespace rc

/// One storage cell of a rack.
/// A vacant slot stores the index of the next vacant slot, so the free list costs no memory beyond the cells.
/// An occupied slot stores a live T; the state word doubles as the checked-borrow counter.
/// The slot never constructs or destroys T on its own: emplace() and destroy() are driven by the rack.
template <class T>
struct rc::impl::slot
{
    // properties
public:
    [[nodiscard]] bool is_vacant() const { return state == slot_vacant; }
    [[nodiscard]] bool is_occupied() const { return state != slot_vacant; }
    [[nodiscard]] bool is_borrowed() const { return state != slot_vacant && state != slot_unborrowed; }

    // occupancy
public:
    /// Constructs the value in place and marks the slot as occupied.
    /// If T's constructor throws, the slot stays vacant (its next_vacant link is gone, the rack re-links it).
    template <class... Args>
    T& emplace(Args&&... args)
    {
        RC_ASSERT(is_vacant(), "slot is already occupied");
        auto const p = new (rc::placement_new, &value) T(rc::forward<Args>(args)...);
        state = slot_unborrowed;
        return *p;
    }

    /// Destroys the value and marks the slot as vacant.
    /// The caller is responsible for linking it back into the free list.
    void destroy()
    {
        RC_ASSERT(is_occupied(), "slot destroyed twice. double release or corruption?");
        // vacant before ~T() so a reentrant release of this index from the destructor is caught above
        state = slot_vacant;
        value.~T();
        next_vacant = rc::no_vacant_slot;
    }

    // checked borrows
public:
    void acquire_shared()
    {
        RC_ASSERT_ALWAYS(state >= slot_unborrowed, "value is already mutably borrowed");
        ++state;
    }
    void release_shared()
    {
        RC_ASSERT(state > slot_unborrowed, "no shared borrow to release");
        --state;
    }
    void acquire_exclusive()
    {
        RC_ASSERT_ALWAYS(state == slot_unborrowed, "value is already borrowed");
        state = slot_write_borrowed;
    }
    void release_exclusive()
    {
        RC_ASSERT(state == slot_write_borrowed, "no mutable borrow to release");
        state = slot_unborrowed;
    }

    // ctors/dtor
public:
    slot() : next_vacant(rc::no_vacant_slot) {}

    // value lifetime is owned by the rack, see rack_core::teardown
    ~slot() {}

    slot(slot const&) = delete;
    slot(slot&&) = delete;
    slot& operator=(slot const&) = delete;
    slot& operator=(slot&&) = delete;

    // members
public:
    union
    {
        /// Active while vacant: next vacant index or rc::no_vacant_slot.
        isize next_vacant;
        /// Active while occupied.
        T value;
    };

    /// slot_vacant, slot_write_borrowed, or the reader count (slot_unborrowed == 0 readers).
    i32 state = slot_vacant;
};

/// Contiguous, inline storage for exactly N slots of T.
/// Never allocates, never relocates: the address of every slot is fixed for the lifetime of the storage.
/// Provides the free-list threading but not the free-list head; that bookkeeping lives in rc::impl::rack_core.
template <class T, rc::isize N>
struct rc::slot_storage
{
    static_assert(N > 0, "slot_storage capacity must be positive");

    // free list
public:
    /// Chains all slots in index order: 0 -> 1 -> ... -> N-1 -> no_vacant_slot.
    /// Precondition: every slot is vacant.
    /// Returns the new free-list head (always 0).
    isize link_all_vacant()
    {
        for (isize i = 0; i < N; ++i)
        {
            RC_ASSERT(_slots[i].is_vacant(), "cannot relink an occupied slot");
            _slots[i].next_vacant = i + 1 < N ? i + 1 : rc::no_vacant_slot;
        }
        return 0;
    }

    // element access
public:
    [[nodiscard]] impl::slot<T>& operator[](isize i)
    {
        RC_ASSERT(0 <= i && i < N, "slot index out of bounds");
        return _slots[i];
    }
    [[nodiscard]] impl::slot<T> const& operator[](isize i) const
    {
        RC_ASSERT(0 <= i && i < N, "slot index out of bounds");
        return _slots[i];
    }

    [[nodiscard]] impl::slot<T>* data() { return _slots; }
    [[nodiscard]] impl::slot<T> const* data() const { return _slots; }

    // queries
public:
    [[nodiscard]] static constexpr isize size() { return N; }

    // members
private:
    impl::slot<T> _slots[N];
};
