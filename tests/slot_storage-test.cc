#include <rack-core/slot_storage.hh>

#include <nexus/test.hh>

#include <string>

using namespace rc;

// a vacant slot reuses the value bytes for its free-list link, only the state word is extra
static_assert(sizeof(impl::slot<u64>) == 16);
static_assert(sizeof(impl::slot<u8>) == 16);
static_assert(sizeof(slot_storage<u64, 8>) == 8 * sizeof(impl::slot<u64>));
static_assert(slot_storage<int, 5>::size() == 5);

namespace
{
struct tracked
{
    static inline int alive = 0;

    int value = 0;

    explicit tracked(int v) : value(v) { ++alive; }
    tracked(tracked const&) = delete;
    tracked& operator=(tracked const&) = delete;
    ~tracked() { --alive; }
};
} // namespace

TEST("slot_storage - fresh storage is fully vacant")
{
    slot_storage<int, 4> storage;

    for (isize i = 0; i < storage.size(); ++i)
    {
        CHECK(storage[i].is_vacant());
        CHECK(!storage[i].is_occupied());
        CHECK(!storage[i].is_borrowed());
    }
}

TEST("slot_storage - link_all_vacant threads slots in index order")
{
    slot_storage<std::string, 5> storage;

    auto const head = storage.link_all_vacant();
    CHECK(head == 0);

    isize visited = 0;
    isize expected = 0;
    for (auto i = head; i != no_vacant_slot; i = storage[i].next_vacant)
    {
        CHECK(i == expected);
        ++expected;
        ++visited;
    }
    CHECK(visited == 5);
    CHECK(storage[4].next_vacant == no_vacant_slot);
}

TEST("slot_storage - single slot storage terminates immediately")
{
    slot_storage<int, 1> storage;
    CHECK(storage.link_all_vacant() == 0);
    CHECK(storage[0].next_vacant == no_vacant_slot);
}

TEST("slot - emplace and destroy drive the value lifetime")
{
    tracked::alive = 0;
    slot_storage<tracked, 2> storage;
    CHECK(storage.link_all_vacant() == 0);

    auto& value = storage[1].emplace(17);
    CHECK(value.value == 17);
    CHECK(&value == &storage[1].value);
    CHECK(storage[1].is_occupied());
    CHECK(!storage[1].is_borrowed());
    CHECK(storage[0].is_vacant());
    CHECK(tracked::alive == 1);

    storage[1].destroy();
    CHECK(storage[1].is_vacant());
    CHECK(tracked::alive == 0);
}

TEST("slot - borrow state counts readers and a single writer")
{
    slot_storage<int, 1> storage;
    CHECK(storage.link_all_vacant() == 0);
    auto& s = storage[0];
    s.emplace(3);

    SECTION("readers")
    {
        s.acquire_shared();
        s.acquire_shared();
        CHECK(s.is_borrowed());
        CHECK(s.state == 2);

        s.release_shared();
        CHECK(s.state == 1);
        s.release_shared();
        CHECK(s.state == impl::slot_unborrowed);
        CHECK(!s.is_borrowed());
    }

    SECTION("writer")
    {
        s.acquire_exclusive();
        CHECK(s.is_borrowed());
        CHECK(s.state == impl::slot_write_borrowed);

        s.release_exclusive();
        CHECK(!s.is_borrowed());
    }

    s.destroy();
}
