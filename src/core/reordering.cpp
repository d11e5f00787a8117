#include "core/reordering.hpp"

#include <QLoggingCategory>
#include <QString>

Q_LOGGING_CATEGORY(uuidsortReorderLog, "uuidsort.reorder", QtInfoMsg)

namespace uuidsort {

namespace {

// Timestamp sub-fields as plain right-aligned integers.
struct TimeFields {
    uint64_t time_hi = 0;        // 12 bits
    uint64_t time_mid = 0;       // 16 bits
    uint64_t time_low_hi20 = 0;  // time_low bits 31-12
    uint64_t time_low_lo12 = 0;  // time_low bits 11-0
};

constexpr uint64_t VERSION_MASK = 0x0000'0000'0000'f000;

// RFC 4122 order of the high word.
namespace rfc_layout {
constexpr uint64_t TIME_LOW_HI20_MASK  = 0xffff'f000'0000'0000;
constexpr int      TIME_LOW_HI20_SHIFT = 44;
constexpr uint64_t TIME_LOW_LO12_MASK  = 0x0000'0fff'0000'0000;
constexpr int      TIME_LOW_LO12_SHIFT = 32;
constexpr uint64_t TIME_MID_MASK       = 0x0000'0000'ffff'0000;
constexpr int      TIME_MID_SHIFT      = 16;
constexpr uint64_t TIME_HI_MASK        = 0x0000'0000'0000'0fff;
constexpr int      TIME_HI_SHIFT       = 0;
} // namespace rfc_layout

// Big-endian order of the high word.
namespace sortable_layout {
constexpr uint64_t TIME_HI_MASK        = 0xfff0'0000'0000'0000;
constexpr int      TIME_HI_SHIFT       = 52;
constexpr uint64_t TIME_MID_MASK       = 0x000f'fff0'0000'0000;
constexpr int      TIME_MID_SHIFT      = 36;
constexpr uint64_t TIME_LOW_HI20_MASK  = 0x0000'000f'ffff'0000;
constexpr int      TIME_LOW_HI20_SHIFT = 16;
constexpr uint64_t TIME_LOW_LO12_MASK  = 0x0000'0000'0000'0fff;
constexpr int      TIME_LOW_LO12_SHIFT = 0;
} // namespace sortable_layout

// Every bit of the high word belongs to exactly one field in each layout.
static_assert((rfc_layout::TIME_LOW_HI20_MASK | rfc_layout::TIME_LOW_LO12_MASK | rfc_layout::TIME_MID_MASK |
               rfc_layout::TIME_HI_MASK | VERSION_MASK) == ~uint64_t{0});
static_assert((rfc_layout::TIME_LOW_HI20_MASK ^ rfc_layout::TIME_LOW_LO12_MASK ^ rfc_layout::TIME_MID_MASK ^
               rfc_layout::TIME_HI_MASK ^ VERSION_MASK) == ~uint64_t{0});
static_assert((sortable_layout::TIME_HI_MASK | sortable_layout::TIME_MID_MASK | sortable_layout::TIME_LOW_HI20_MASK |
               sortable_layout::TIME_LOW_LO12_MASK | VERSION_MASK) == ~uint64_t{0});
static_assert((sortable_layout::TIME_HI_MASK ^ sortable_layout::TIME_MID_MASK ^ sortable_layout::TIME_LOW_HI20_MASK ^
               sortable_layout::TIME_LOW_LO12_MASK ^ VERSION_MASK) == ~uint64_t{0});

// Counter bits on either side of the version nibble, for building bounds.
constexpr uint64_t TICKS_ABOVE_VERSION_MASK = 0x0fff'ffff'ffff'f000;
constexpr uint64_t TICKS_BELOW_VERSION_MASK = 0x0000'0000'0000'0fff;
constexpr int VERSION_WIDTH = 4;

constexpr TimeFields extract_standard(uint64_t high) noexcept {
    return TimeFields{
        .time_hi       = (high & rfc_layout::TIME_HI_MASK) >> rfc_layout::TIME_HI_SHIFT,
        .time_mid      = (high & rfc_layout::TIME_MID_MASK) >> rfc_layout::TIME_MID_SHIFT,
        .time_low_hi20 = (high & rfc_layout::TIME_LOW_HI20_MASK) >> rfc_layout::TIME_LOW_HI20_SHIFT,
        .time_low_lo12 = (high & rfc_layout::TIME_LOW_LO12_MASK) >> rfc_layout::TIME_LOW_LO12_SHIFT,
    };
}

constexpr uint64_t pack_standard(const TimeFields& f) noexcept {
    return VERSION_ONE
        | f.time_low_hi20 << rfc_layout::TIME_LOW_HI20_SHIFT
        | f.time_low_lo12 << rfc_layout::TIME_LOW_LO12_SHIFT
        | f.time_mid << rfc_layout::TIME_MID_SHIFT
        | f.time_hi << rfc_layout::TIME_HI_SHIFT;
}

constexpr TimeFields extract_sortable(uint64_t high) noexcept {
    return TimeFields{
        .time_hi       = (high & sortable_layout::TIME_HI_MASK) >> sortable_layout::TIME_HI_SHIFT,
        .time_mid      = (high & sortable_layout::TIME_MID_MASK) >> sortable_layout::TIME_MID_SHIFT,
        .time_low_hi20 = (high & sortable_layout::TIME_LOW_HI20_MASK) >> sortable_layout::TIME_LOW_HI20_SHIFT,
        .time_low_lo12 = (high & sortable_layout::TIME_LOW_LO12_MASK) >> sortable_layout::TIME_LOW_LO12_SHIFT,
    };
}

constexpr uint64_t pack_sortable(const TimeFields& f) noexcept {
    return VERSION_ONE
        | f.time_hi << sortable_layout::TIME_HI_SHIFT
        | f.time_mid << sortable_layout::TIME_MID_SHIFT
        | f.time_low_hi20 << sortable_layout::TIME_LOW_HI20_SHIFT
        | f.time_low_lo12 << sortable_layout::TIME_LOW_LO12_SHIFT;
}

// time_hi | time_mid | time_low, most significant first.
constexpr uint64_t ticks_of(const TimeFields& f) noexcept {
    return f.time_hi << 48 | f.time_mid << 32 | f.time_low_hi20 << 12 | f.time_low_lo12;
}

constexpr uint64_t pack_bound(uint64_t ticks) noexcept {
    return (ticks & TICKS_ABOVE_VERSION_MASK) << VERSION_WIDTH
        | VERSION_ONE
        | (ticks & TICKS_BELOW_VERSION_MASK);
}

// The sortable layout is the tick counter with the version nibble spliced in.
static_assert(pack_bound(MAX_TICKS) == 0xffff'ffff'ffff'1fff);
static_assert(pack_sortable(extract_standard(0x0d0b'40f8'e965'11e8)) == 0x1e8e'9650'd0b4'10f8);
static_assert(pack_standard(extract_sortable(0x1e8e'9650'd0b4'10f8)) == 0x0d0b'40f8'e965'11e8);

Instant to_instant(uint64_t ticks) noexcept {
    const auto t = static_cast<int64_t>(ticks);
    return Instant(t / TICKS_PER_SECOND - GREGORIAN_TO_UNIX_SECONDS,
                   (t % TICKS_PER_SECOND) * NANOS_PER_TICK);
}

} // namespace

Result<Uuid> check_version(const Uuid& id) {
    if (id.version() != 1) {
        qCDebug(uuidsortReorderLog) << "rejecting" << QString::fromStdString(id.to_string())
                                    << "with version" << id.version();
        return Result<Uuid>::err(Error::invalid_version(id.version()));
    }
    return Result<Uuid>::ok(id);
}

Result<Uuid> to_sortable(const Uuid& standard) {
    return check_version(standard).map([](const Uuid& id) {
        return Uuid(pack_sortable(extract_standard(id.high())), id.low());
    });
}

Result<Uuid> to_standard(const Uuid& sortable) {
    return check_version(sortable).map([](const Uuid& id) {
        return Uuid(pack_standard(extract_sortable(id.high())), id.low());
    });
}

Result<Uuid> lowest_bound_for_ticks(uint64_t ticks) {
    if (ticks > MAX_TICKS) {
        qCDebug(uuidsortReorderLog) << "tick count" << ticks << "overflows 60 bits";
        return Result<Uuid>::err(Error::out_of_range(ticks));
    }
    return Result<Uuid>::ok(Uuid(pack_bound(ticks), VARIANT_RFC_4122));
}

Result<Uuid> lowest_bound(const Instant& when) {
    return ticks_from_instant(when).and_then(lowest_bound_for_ticks);
}

Result<uint64_t> ticks_from_instant(const Instant& when) {
    if (when < GREGORIAN_EPOCH || when > MAX_TIMESTAMP) {
        qCDebug(uuidsortReorderLog) << "instant" << QString::fromStdString(when.to_iso_string())
                                    << "is outside the UUID timestamp range";
        return Result<uint64_t>::err(Error::out_of_range(when));
    }

    const auto ticks = (when.epoch_seconds() + GREGORIAN_TO_UNIX_SECONDS) * TICKS_PER_SECOND
                     + when.nanos() / NANOS_PER_TICK;
    return Result<uint64_t>::ok(static_cast<uint64_t>(ticks));
}

Result<Instant> instant_from_ticks(uint64_t ticks) {
    if (ticks > MAX_TICKS) {
        return Result<Instant>::err(Error::out_of_range(ticks));
    }
    return Result<Instant>::ok(to_instant(ticks));
}

Result<uint64_t> standard_ticks(const Uuid& standard) {
    return check_version(standard).map([](const Uuid& id) {
        return ticks_of(extract_standard(id.high()));
    });
}

Result<uint64_t> sortable_ticks(const Uuid& sortable) {
    return check_version(sortable).map([](const Uuid& id) {
        return ticks_of(extract_sortable(id.high()));
    });
}

Result<Instant> standard_timestamp(const Uuid& standard) {
    return standard_ticks(standard).map(to_instant);
}

Result<Instant> sortable_timestamp(const Uuid& sortable) {
    return sortable_ticks(sortable).map(to_instant);
}

} // namespace uuidsort
