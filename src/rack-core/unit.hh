#pragma once

#include <rack-core/assert.hh>
#include <rack-core/borrow.hh>
#include <rack-core/fwd.hh>
#include <rack-core/impl/rack_core.hh>
#include <rack-core/utility.hh>

/// Move-only owning handle for a single live T stored in a rack slot.
/// Stores only the rack's bookkeeping pointer and the slot index; the rack keeps no reference back.
/// The destructor destroys the T and returns the slot to the rack's free list.
/// take() moves the T out instead and leaves the unit empty.
///
/// Access goes through checked borrows (as_ref / as_mut_ref) that follow the usual aliasing rules:
/// many readers or one writer. Violations and any use of an empty unit trigger RC_ASSERT_ALWAYS.
///
/// A unit must not outlive the rack it was allocated from.
template <class T>
struct rc::unit
{
    // properties
public:
    /// false for default-constructed, moved-from, reset or consumed units.
    [[nodiscard]] bool is_valid() const { return _rack != nullptr; }
    explicit operator bool() const { return _rack != nullptr; }

    /// Slot index inside the owning rack; distinct for all live units of one rack.
    [[nodiscard]] isize index() const
    {
        impl_check_valid();
        return _index;
    }

    // access
public:
    /// Shared read-only view of the value.
    /// Fails if a slot_mut of this unit is alive.
    [[nodiscard]] slot_ref<T> as_ref() const
    {
        impl_check_valid();
        return slot_ref<T>(_rack->slot_at(_index));
    }

    /// Exclusive mutable view of the value.
    /// Fails if any slot_ref or slot_mut of this unit is alive.
    [[nodiscard]] slot_mut<T> as_mut_ref()
    {
        impl_check_valid();
        return slot_mut<T>(_rack->slot_at(_index));
    }

    /// Member access for the duration of one expression: u->field, u->method().
    /// Borrows like as_ref() on a const unit and like as_mut_ref() otherwise.
    [[nodiscard]] slot_ref<T> operator->() const { return as_ref(); }
    [[nodiscard]] slot_mut<T> operator->() { return as_mut_ref(); }

    // consumption
public:
    /// Moves the value out and releases the slot; the unit is empty afterwards.
    /// Usage: auto v = rc::move(u).take();
    [[nodiscard]] T take() &&
    {
        impl_check_releasable();
        auto const rack = rc::exchange(_rack, nullptr);
        auto const idx = rc::exchange(_index, rc::no_vacant_slot);
        return rack->take(idx);
    }

    /// Destroys the value and releases the slot; the unit is empty afterwards.
    /// No-op on an empty unit.
    void reset()
    {
        if (_rack == nullptr)
            return;

        impl_check_releasable();

        // the unit is empty before ~T() runs, so T's dtor can never reach this slot through us again
        auto const rack = rc::exchange(_rack, nullptr);
        auto const idx = rc::exchange(_index, rc::no_vacant_slot);
        rack->release(idx);
    }

    // ctors/dtor
public:
    unit() = default;

    unit(unit&& rhs) noexcept
      : _rack(rc::exchange(rhs._rack, nullptr)), _index(rc::exchange(rhs._index, rc::no_vacant_slot))
    {
    }
    unit& operator=(unit&& rhs) noexcept
    {
        if (this != &rhs)
        {
            // rhs may live inside our own value (e.g. list = move(list->next)), detach it before reset()
            auto const rack = rc::exchange(rhs._rack, nullptr);
            auto const idx = rc::exchange(rhs._index, rc::no_vacant_slot);
            reset();
            _rack = rack;
            _index = idx;
        }
        return *this;
    }
    unit(unit const&) = delete;
    unit& operator=(unit const&) = delete;

    ~unit() { reset(); }

private:
    unit(impl::rack_core<T>* rack, isize idx) : _rack(rack), _index(idx) {}

    void impl_check_valid() const { RC_ASSERT_ALWAYS(_rack != nullptr, "unit is empty (moved-from or consumed)"); }

    // checked while the unit still owns the slot, so a rejected take/reset leaves it intact
    void impl_check_releasable() const
    {
        impl_check_valid();
        RC_ASSERT_ALWAYS(!_rack->slot_at(_index).is_borrowed(), "unit released while its value is still borrowed");
    }

    // members
private:
    impl::rack_core<T>* _rack = nullptr;
    isize _index = rc::no_vacant_slot;

    template <class, isize>
    friend struct rack;
};
