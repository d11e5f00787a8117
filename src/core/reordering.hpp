#pragma once

#include <cstdint>

#include "core/result.hpp"
#include "core/types.hpp"

/*
 * Reorders time-based (version 1) UUIDs so that the most significant time
 * bits come first and the raw 128-bit values sort chronologically.
 *
 * RFC 4122 lays out the high word of a version 1 UUID as
 *
 *  0                   1                   2                   3
 *  0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |                          time_low                             |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |       time_mid                |         time_hi_and_version   |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 *
 * and the sortable form packs the same bits big-endian, leaving the
 * version nibble where it was:
 *
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |        time_hi        |           time_mid            |tl(0:3)|
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 * |        time_low(4:19)         |version|    time_low(20:31)    |
 * +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
 *
 * The low word (variant, clock sequence, node) is never touched.
 *
 * Hibernate's CustomVersionOneStrategy puts the machine identifier first
 * and counts milliseconds, which is not bit-compatible with the RFC
 * timestamp. No converter is provided for it.
 */

namespace uuidsort {

inline constexpr uint64_t VERSION_ONE = 0x0000'0000'0000'1000;
inline constexpr uint64_t VARIANT_RFC_4122 = 0x8000'0000'0000'0000;

// 100 ns ticks since 1582-10-15T00:00:00Z fit in 60 bits.
inline constexpr uint64_t MAX_TICKS = (uint64_t{1} << 60) - 1;
inline constexpr int64_t TICKS_PER_SECOND = 10'000'000;
inline constexpr int64_t NANOS_PER_TICK = 100;
inline constexpr int64_t GREGORIAN_TO_UNIX_SECONDS = 12'219'292'800;

inline constexpr Instant GREGORIAN_EPOCH{-GREGORIAN_TO_UNIX_SECONDS, 0};

// When the timestamp field rolls over: 5236-03-31T21:21:00.6846975Z (tick 2^60 - 1).
inline constexpr Instant MAX_TIMESTAMP{103'072'857'660, 684'697'500};

/**
 * Succeeds with `id` unchanged when its version nibble is 1, otherwise
 * fails with ErrorKind::InvalidVersion carrying the observed version.
 */
[[nodiscard]] Result<Uuid> check_version(const Uuid& id);

/**
 * Reorder an RFC 4122 version 1 UUID into big-endian timestamp order.
 */
[[nodiscard]] Result<Uuid> to_sortable(const Uuid& standard);

/**
 * Reorder a big-endian version 1 UUID back to RFC 4122 order.
 * Exact inverse of to_sortable().
 */
[[nodiscard]] Result<Uuid> to_standard(const Uuid& sortable);

/**
 * The numerically smallest sortable UUID carrying `when`.
 *
 * All clock sequence and node bits are zero and only the RFC variant bit
 * is set in the low word. Real generators never produce a zero node
 * together with a zero clock sequence, so the result is safe as an
 * inclusive or exclusive range bound.
 *
 * Fails with OutOfRange for instants before the Gregorian epoch or after
 * MAX_TIMESTAMP.
 */
[[nodiscard]] Result<Uuid> lowest_bound(const Instant& when);

// As lowest_bound(), for a raw tick count. Fails with OutOfRange above MAX_TICKS.
[[nodiscard]] Result<Uuid> lowest_bound_for_ticks(uint64_t ticks);

// Sub-tick nanoseconds are truncated.
[[nodiscard]] Result<uint64_t> ticks_from_instant(const Instant& when);
[[nodiscard]] Result<Instant> instant_from_ticks(uint64_t ticks);

/**
 * Read the 60-bit tick counter of a version 1 UUID in RFC order
 * (standard_*) or in big-endian order (sortable_*).
 */
[[nodiscard]] Result<uint64_t> standard_ticks(const Uuid& standard);
[[nodiscard]] Result<uint64_t> sortable_ticks(const Uuid& sortable);

[[nodiscard]] Result<Instant> standard_timestamp(const Uuid& standard);
[[nodiscard]] Result<Instant> sortable_timestamp(const Uuid& sortable);

} // namespace uuidsort
