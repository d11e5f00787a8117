#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/reordering.hpp"

#include <utility>

using namespace uuidsort;

namespace {

// A version 1 UUID, RFC variant, with the given tick count in RFC order.
Uuid standard_uuid_for(uint64_t ticks, uint64_t low_bits) {
    const uint64_t time_low = ticks & 0xffff'ffff;
    const uint64_t time_mid = (ticks >> 32) & 0xffff;
    const uint64_t time_hi = (ticks >> 48) & 0x0fff;
    const uint64_t high = time_low << 32 | time_mid << 16 | VERSION_ONE | time_hi;
    return Uuid(high, (low_bits & 0x3fff'ffff'ffff'ffff) | VARIANT_RFC_4122);
}

} // namespace

namespace rc {

// Any 128-bit value with the version nibble forced to 1.
template<>
struct Arbitrary<Uuid> {
    static Gen<Uuid> arbitrary() {
        return gen::map(
            gen::pair(gen::arbitrary<uint64_t>(), gen::arbitrary<uint64_t>()),
            [](std::pair<uint64_t, uint64_t> words) {
                return Uuid((words.first & ~uint64_t{0xf000}) | VERSION_ONE, words.second);
            }
        );
    }
};

} // namespace rc

TEST_CASE("Property: reordering round-trips", "[property][reordering]") {
    REQUIRE(rc::check("to_standard(to_sortable(x)) == x",
        [](const Uuid& x) {
            RC_ASSERT(to_standard(to_sortable(x).unwrap()).unwrap() == x);
        }
    ));

    REQUIRE(rc::check("to_sortable(to_standard(y)) == y",
        [](const Uuid& y) {
            RC_ASSERT(to_sortable(to_standard(y).unwrap()).unwrap() == y);
        }
    ));
}

TEST_CASE("Property: low word and version are preserved", "[property][reordering]") {
    REQUIRE(rc::check("low() is untouched and version stays 1",
        [](const Uuid& x) {
            const auto sortable = to_sortable(x).unwrap();
            const auto standard = to_standard(x).unwrap();
            RC_ASSERT(sortable.low() == x.low());
            RC_ASSERT(standard.low() == x.low());
            RC_ASSERT(sortable.version() == 1u);
            RC_ASSERT(standard.version() == 1u);
        }
    ));
}

TEST_CASE("Property: other versions are rejected", "[property][reordering]") {
    REQUIRE(rc::check("version != 1 fails with InvalidVersion",
        [](const Uuid& x) {
            const auto version = *rc::gen::suchThat(rc::gen::inRange<unsigned>(0, 16),
                                                    [](unsigned v) { return v != 1; });
            const Uuid id((x.high() & ~uint64_t{0xf000}) | (uint64_t{version} << 12), x.low());

            const auto sortable = to_sortable(id);
            const auto standard = to_standard(id);
            RC_ASSERT(sortable.is_err());
            RC_ASSERT(standard.is_err());
            RC_ASSERT(sortable.unwrap_err().kind == ErrorKind::InvalidVersion);
            RC_ASSERT(sortable.unwrap_err().observed_version == version);
        }
    ));
}

TEST_CASE("Property: sortable order is chronological", "[property][reordering]") {
    REQUIRE(rc::check("ticks(a) < ticks(b) implies sortable(a) < sortable(b)",
        [](uint64_t low_a, uint64_t low_b) {
            const auto ticks_a = *rc::gen::inRange<uint64_t>(0, MAX_TICKS);
            const auto ticks_b = *rc::gen::inRange<uint64_t>(ticks_a + 1, MAX_TICKS + 1);

            const auto a = to_sortable(standard_uuid_for(ticks_a, low_a)).unwrap();
            const auto b = to_sortable(standard_uuid_for(ticks_b, low_b)).unwrap();
            RC_ASSERT(a < b);
            RC_ASSERT(sortable_ticks(a).unwrap() == ticks_a);
            RC_ASSERT(sortable_ticks(b).unwrap() == ticks_b);
        }
    ));
}

TEST_CASE("Property: lowest_bound is a lower bound for its tick", "[property][reordering]") {
    REQUIRE(rc::check("lowest_bound(t) <= to_sortable(x) for x with tick t",
        [](uint64_t low_bits) {
            const auto ticks = *rc::gen::inRange<uint64_t>(0, MAX_TICKS + 1);

            const auto bound = lowest_bound_for_ticks(ticks).unwrap();
            const auto sortable = to_sortable(standard_uuid_for(ticks, low_bits)).unwrap();
            RC_ASSERT(bound <= sortable);
            RC_ASSERT(bound.high() == sortable.high());
            RC_ASSERT(sortable_ticks(bound).unwrap() == ticks);
        }
    ));
}

TEST_CASE("Property: instant conversion agrees with tick conversion", "[property][reordering]") {
    REQUIRE(rc::check("ticks_from_instant(instant_from_ticks(t)) == t",
        []() {
            const auto ticks = *rc::gen::inRange<uint64_t>(0, MAX_TICKS + 1);
            const auto when = instant_from_ticks(ticks).unwrap();
            RC_ASSERT(ticks_from_instant(when).unwrap() == ticks);
            RC_ASSERT(lowest_bound(when).unwrap() == lowest_bound_for_ticks(ticks).unwrap());
        }
    ));
}
