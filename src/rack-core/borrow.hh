#pragma once

#include <rack-core/assert.hh>
#include <rack-core/fwd.hh>
#include <rack-core/slot_storage.hh>
#include <rack-core/utility.hh>

/// Scoped read-only view of a unit's value, returned by unit::as_ref().
/// Any number of slot_refs to the same value may coexist, but none alongside a slot_mut.
/// Copying a slot_ref adds another reader.
/// Must not outlive the unit it was borrowed from.
template <class T>
struct rc::slot_ref
{
    // access
public:
    [[nodiscard]] T const& get() const
    {
        RC_ASSERT_ALWAYS(_slot != nullptr, "slot_ref is empty (moved-from)");
        return _slot->value;
    }
    [[nodiscard]] T const& operator*() const { return get(); }
    [[nodiscard]] T const* operator->() const { return &get(); }

    // ctors/dtor
public:
    slot_ref(slot_ref const& rhs) : _slot(rhs._slot)
    {
        if (_slot != nullptr)
            _slot->acquire_shared();
    }
    slot_ref(slot_ref&& rhs) noexcept : _slot(rc::exchange(rhs._slot, nullptr)) {}

    slot_ref& operator=(slot_ref const& rhs)
    {
        if (this != &rhs)
        {
            if (rhs._slot != nullptr)
                rhs._slot->acquire_shared();
            impl_release();
            _slot = rhs._slot;
        }
        return *this;
    }
    slot_ref& operator=(slot_ref&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_release();
            _slot = rc::exchange(rhs._slot, nullptr);
        }
        return *this;
    }

    ~slot_ref() { impl_release(); }

private:
    explicit slot_ref(impl::slot<T>& s) : _slot(&s) { s.acquire_shared(); }

    void impl_release()
    {
        if (_slot != nullptr)
            rc::exchange(_slot, nullptr)->release_shared();
    }

    impl::slot<T>* _slot = nullptr;

    friend unit<T>;
};

/// Scoped exclusive mutable view of a unit's value, returned by unit::as_mut_ref().
/// While a slot_mut is alive no other view of the same value may be acquired.
/// Move-only; the borrow ends when the last owner is destroyed.
template <class T>
struct rc::slot_mut
{
    // access
public:
    [[nodiscard]] T& get() const
    {
        RC_ASSERT_ALWAYS(_slot != nullptr, "slot_mut is empty (moved-from)");
        return _slot->value;
    }
    [[nodiscard]] T& operator*() const { return get(); }
    [[nodiscard]] T* operator->() const { return &get(); }

    // ctors/dtor
public:
    slot_mut(slot_mut&& rhs) noexcept : _slot(rc::exchange(rhs._slot, nullptr)) {}
    slot_mut& operator=(slot_mut&& rhs) noexcept
    {
        if (this != &rhs)
        {
            impl_release();
            _slot = rc::exchange(rhs._slot, nullptr);
        }
        return *this;
    }
    slot_mut(slot_mut const&) = delete;
    slot_mut& operator=(slot_mut const&) = delete;

    ~slot_mut() { impl_release(); }

private:
    explicit slot_mut(impl::slot<T>& s) : _slot(&s) { s.acquire_exclusive(); }

    void impl_release()
    {
        if (_slot != nullptr)
            rc::exchange(_slot, nullptr)->release_exclusive();
    }

    impl::slot<T>* _slot = nullptr;

    friend unit<T>;
};
