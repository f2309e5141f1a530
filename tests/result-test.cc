#include <rack-core/rack.hh>
#include <rack-core/result.hh>

#include <nexus/test.hh>

#include <string>

using namespace rc;

static_assert(!std::is_copy_constructible_v<rack<int, 2>::add_result>);
static_assert(std::is_move_constructible_v<rack<int, 2>::add_result>);
static_assert(std::is_same_v<rack<int, 2>::emplace_result, result<unit<int>, capacity_exceeded<void>>>);
static_assert(std::is_copy_constructible_v<result<int, std::string>>);

namespace
{
// counts live payloads to check that every alternative is destroyed exactly once
struct payload
{
    static inline int alive = 0;

    std::string name;

    explicit payload(std::string n) : name(rc::move(n)) { ++alive; }
    payload(payload&& rhs) noexcept : name(rc::move(rhs.name)) { ++alive; }
    payload(payload const&) = delete;
    payload& operator=(payload const&) = delete;
    payload& operator=(payload&&) = delete;
    ~payload() { --alive; }
};

// pushes items until the rack refuses one, returns the refused item
template <isize N>
result<int, std::string> fill_until_refused(rack<std::string, N>& r, unit<std::string> (&units)[N + 1])
{
    for (auto i = 0; i <= N; ++i)
    {
        auto res = r.add("item " + std::to_string(i));
        if (res.has_error())
            return rc::error(rc::move(res).error().value);
        units[i] = rc::move(res).value();
    }
    return int(N + 1);
}
} // namespace

TEST("result - add on a rack with room holds a unit")
{
    rack<int, 2> r;
    auto res = r.add(42);

    REQUIRE(res.has_value());
    CHECK(!res.has_error());
    CHECK(res.value().is_valid());
    CHECK(*res.value().as_ref() == 42);
    CHECK(r.used() == 1);

    SECTION("moving the unit out leaves the result with an empty unit")
    {
        auto u = rc::move(res).value();
        CHECK(u.is_valid());
        CHECK(res.has_value());
        CHECK(!res.value().is_valid());
        CHECK(r.used() == 1);
    }

    SECTION("moving the whole result keeps the slot")
    {
        auto moved = rc::move(res);
        REQUIRE(moved.has_value());
        CHECK(*moved.value().as_ref() == 42);
        CHECK(r.used() == 1);
    }

    SECTION("dropping the result releases the slot")
    {
        {
            auto dropped = rc::move(res);
        }
        CHECK(r.used() == 0);
        CHECK(r.count_vacant_chain() == 2);
    }
}

TEST("result - add on a full rack holds the refused value")
{
    payload::alive = 0;
    {
        rack<payload, 1> r;
        auto kept = r.must_add(payload("kept"));

        auto res = r.add(payload("refused"));
        REQUIRE(res.has_error());
        CHECK(!res.has_value());
        CHECK(res.error().value.name == "refused");
        CHECK(std::string(res.error().message()) == "the rack is full");
        CHECK(payload::alive == 2);

        // retry once there is room
        kept.reset();
        CHECK(payload::alive == 1);

        auto retry = r.add(rc::move(res).error().value);
        REQUIRE(retry.has_value());
        CHECK(retry.value().as_ref()->name == "refused");
        CHECK(r.is_full());
    }
    CHECK(payload::alive == 0);
}

TEST("result - emplace reports a full rack without a payload")
{
    rack<std::string, 1> r;
    auto a = r.must_emplace(3, 'x');
    CHECK(*a.as_ref() == "xxx");

    auto res = r.emplace(2, 'y');
    REQUIRE(res.has_error());
    CHECK(std::string(res.error().message()) == "the rack is full");
    CHECK(r.used() == 1);
}

TEST("result - assignment switches alternatives and releases units")
{
    rack<int, 2> r;

    auto res = r.add(1);
    REQUIRE(res.has_value());
    CHECK(r.used() == 1);

    res = rack<int, 2>::add_result(rc::error(capacity_exceeded<int>{7}));
    REQUIRE(res.has_error());
    CHECK(res.error().value == 7);
    CHECK(r.used() == 0);

    res = r.add(2);
    REQUIRE(res.has_value());
    CHECK(r.used() == 1);
    CHECK(*res.value().as_ref() == 2);
}

TEST("result - forwarding a refused value as an error")
{
    rack<std::string, 3> r;
    unit<std::string> units[4];

    auto res = fill_until_refused(r, units);
    REQUIRE(res.has_error());
    CHECK(res.error() == "item 3");
    CHECK(r.is_full());
    CHECK(!units[3].is_valid());
    CHECK(*units[2].as_ref() == "item 2");
}

TEST("result - plain values")
{
    auto const ok = result<int, std::string>{5};
    REQUIRE(ok.has_value());
    CHECK(ok.value() == 5);

    auto const failed = result<int, std::string>{rc::error(std::string("no room"))};
    REQUIRE(failed.has_error());
    CHECK(failed.error() == "no room");

    auto copy = failed;
    copy = ok;
    REQUIRE(copy.has_value());
    CHECK(copy.value() == 5);

    auto const defaulted = result<int, int>{};
    CHECK(defaulted.has_error());
    CHECK(defaulted.error() == 0);
}
