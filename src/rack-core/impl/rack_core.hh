#pragma once

#include <rack-core/assert.hh>
#include <rack-core/fwd.hh>
#include <rack-core/slot_storage.hh>
#include <rack-core/utility.hh>

// Capacity-independent bookkeeping of a rack: free-list head, occupied count and a view of the slots.
// rc::rack<T, N> owns one of these next to its slot_storage; rc::unit<T> points to it,
// which keeps unit<T> independent of N and keeps the slot code out of every N instantiation.
//
// This is the only code that changes slot occupancy.
// Every mutation of free_head / used happens before or after user code (T's ctor/dtor) runs, never across it:
//   - occupy pops the head before constructing T, so a reentrant allocation gets a different slot
//   - release destroys T before pushing the index, so T's dtor may release other units of the same rack
// NOT thread-safe: a rack and its units belong to one thread.
template <class T>
struct rc::impl::rack_core
{
    // allocation protocol
public:
    /// Pops a vacant slot and constructs T in it.
    /// Returns the slot index or rc::no_vacant_slot if the rack is full (args are left untouched then).
    /// If T's constructor throws, the slot goes back to the free list and used is unchanged.
    template <class... Args>
    [[nodiscard]] isize occupy(Args&&... args)
    {
        auto const idx = free_head;
        if (idx == rc::no_vacant_slot)
            return rc::no_vacant_slot;

        RC_ASSERT(0 <= idx && idx < capacity, "free list head out of range");
        free_head = slots[idx].next_vacant;

        vacancy_rollback rollback{this, idx};
        slots[idx].emplace(rc::forward<Args>(args)...);
        rollback.index = rc::no_vacant_slot;

        ++used;
        RC_ASSERT(used <= capacity, "more occupied slots than capacity");
        return idx;
    }

    /// Destroys the value at idx and returns the slot to the free list.
    /// Only called by the unit that owns idx, exactly once.
    void release(isize idx)
    {
        auto& s = slot_at(idx);

        // teardown destroys in index order, a value destroyed later may still hold a unit to an earlier slot
        if (tearing_down && s.is_vacant())
            return;

        RC_ASSERT(!s.is_borrowed(), "unit released while its value is still borrowed");

        s.destroy();
        push_vacant(idx);

        RC_ASSERT(used > 0, "released a slot of an empty rack");
        --used;
    }

    /// Moves the value out of idx, then releases the slot.
    /// The slot is released even if T's move constructor throws; the value is lost then.
    [[nodiscard]] T take(isize idx)
    {
        auto& s = slot_at(idx);
        RC_ASSERT(!s.is_borrowed(), "cannot take a value that is still borrowed");

        // runs after the return value is constructed
        release_on_exit guard{this, idx};
        return rc::move(s.value);
    }

    // queries
public:
    [[nodiscard]] impl::slot<T>& slot_at(isize idx)
    {
        RC_ASSERT(0 <= idx && idx < capacity, "slot index out of bounds");
        return slots[idx];
    }

    /// Walks the free list and returns its length, checking every link on the way.
    /// O(capacity), intended for diagnostics and tests.
    [[nodiscard]] isize count_vacant_chain() const
    {
        isize n = 0;
        for (auto i = free_head; i != rc::no_vacant_slot; i = slots[i].next_vacant)
        {
            RC_ASSERT_ALWAYS(0 <= i && i < capacity, "free list link out of range");
            RC_ASSERT_ALWAYS(slots[i].is_vacant(), "occupied slot found in the free list");
            ++n;
            RC_ASSERT_ALWAYS(n <= capacity, "free list contains a cycle");
        }
        return n;
    }

    // teardown
public:
    /// Destroys every value that is still occupied.
    /// Only reachable when a unit was leaked; live units are destroyed before their rack.
    /// A leaked value may own units of the same rack, whose release then happens from inside this loop.
    void teardown()
    {
        tearing_down = true;
        for (isize i = 0; i < capacity; ++i)
        {
            if (slots[i].is_occupied())
            {
                slots[i].state = impl::slot_unborrowed;
                slots[i].destroy();
                push_vacant(i);
                --used;
            }
        }
        RC_ASSERT(used == 0, "occupied slots left after teardown");
    }

    // helper
private:
    void push_vacant(isize idx)
    {
        slots[idx].next_vacant = free_head;
        free_head = idx;
    }

    struct release_on_exit
    {
        rack_core* core;
        isize index;

        ~release_on_exit() { core->release(index); }
    };

    // puts a popped slot back unless construction completed
    struct vacancy_rollback
    {
        rack_core* core;
        isize index;

        ~vacancy_rollback()
        {
            if (index != rc::no_vacant_slot)
                core->push_vacant(index);
        }
    };

    // members
public:
    /// Non-owning view of the N slots of the owning rack.
    impl::slot<T>* slots = nullptr;
    isize capacity = 0;

    /// Head of the intrusive free list, rc::no_vacant_slot when full.
    isize free_head = rc::no_vacant_slot;

    /// Number of occupied slots, 0 <= used <= capacity.
    isize used = 0;

    /// Set for the rest of the rack's lifetime once teardown started.
    bool tearing_down = false;
};
