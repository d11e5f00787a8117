#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace uuidsort {

/**
 * Uuid - a 128-bit identifier held as two 64-bit words.
 *
 * `high` carries the first eight bytes of the canonical string form and
 * `low` the last eight, both most significant byte first. The words are
 * logical halves only; nothing here depends on host byte order.
 *
 * Ordering compares (high, low) as unsigned integers, which is the same
 * as comparing the canonical strings or the network-order bytes.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    /**
     * Create a nil (all zeros) UUID.
     */
    constexpr Uuid() noexcept : high_(0), low_(0) {}

    constexpr Uuid(uint64_t high, uint64_t low) noexcept : high_(high), low_(low) {}

    /**
     * Create a UUID from its 16 bytes in network order.
     */
    [[nodiscard]] static constexpr Uuid from_bytes(const Bytes& bytes) noexcept {
        uint64_t high = 0;
        uint64_t low = 0;
        for (size_t i = 0; i < 8; ++i) {
            high = (high << 8) | bytes[i];
            low = (low << 8) | bytes[i + 8];
        }
        return Uuid(high, low);
    }

    /**
     * Parse the canonical 8-4-4-4-12 form, or 32 bare hex digits.
     * Either case is accepted.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    /**
     * Lowercase hyphenated form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr uint64_t high() const noexcept { return high_; }
    [[nodiscard]] constexpr uint64_t low() const noexcept { return low_; }

    // Bits 15-12 of the high word, in either timestamp layout.
    [[nodiscard]] constexpr unsigned version() const noexcept {
        return static_cast<unsigned>((high_ >> 12) & 0xF);
    }

    // The two most significant bits of the low word; 0b10 for RFC 4122.
    [[nodiscard]] constexpr unsigned variant_bits() const noexcept {
        return static_cast<unsigned>(low_ >> 62);
    }

    [[nodiscard]] constexpr Bytes bytes() const noexcept {
        Bytes out{};
        for (size_t i = 0; i < 8; ++i) {
            out[i] = static_cast<uint8_t>(high_ >> (56 - 8 * i));
            out[i + 8] = static_cast<uint8_t>(low_ >> (56 - 8 * i));
        }
        return out;
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        return high_ == 0 && low_ == 0;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    // Declaration order is the comparison order.
    uint64_t high_;
    uint64_t low_;
};

/**
 * Instant - a wall-clock point with nanosecond precision.
 *
 * Stored as seconds since the Unix epoch (may be negative) plus a
 * nanosecond fraction normalized into [0, 1e9). The range is far wider
 * than std::chrono::system_clock's, which matters because the version 1
 * timestamp only rolls over in the year 5236.
 */
class Instant {
public:
    static constexpr int64_t NANOS_PER_SECOND = 1'000'000'000;

    constexpr Instant() noexcept : seconds_(0), nanos_(0) {}

    /**
     * Nanoseconds outside [0, 1e9) carry into the seconds.
     */
    constexpr Instant(int64_t epoch_seconds, int64_t nanos) noexcept
        : seconds_(epoch_seconds + floor_div(nanos, NANOS_PER_SECOND)),
          nanos_(static_cast<uint32_t>(nanos - floor_div(nanos, NANOS_PER_SECOND) * NANOS_PER_SECOND)) {}

    [[nodiscard]] static constexpr Instant of_epoch_second(int64_t epoch_seconds) noexcept {
        return Instant(epoch_seconds, 0);
    }

    template<typename Duration>
    [[nodiscard]] static Instant from_time_point(
        std::chrono::time_point<std::chrono::system_clock, Duration> tp) {
        const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
        return Instant(0, ns.count());
    }

    [[nodiscard]] constexpr int64_t epoch_seconds() const noexcept { return seconds_; }
    [[nodiscard]] constexpr uint32_t nanos() const noexcept { return nanos_; }

    [[nodiscard]] constexpr Instant plus_nanos(int64_t nanos) const noexcept {
        return Instant(seconds_, static_cast<int64_t>(nanos_) + nanos);
    }

    /**
     * ISO 8601 in UTC with a 7-digit (100 ns) fraction,
     * e.g. 5236-03-31T21:21:00.6846975Z.
     */
    [[nodiscard]] std::string to_iso_string() const;

    auto operator<=>(const Instant&) const = default;
    bool operator==(const Instant&) const = default;

private:
    static constexpr int64_t floor_div(int64_t a, int64_t b) noexcept {
        return a / b - ((a % b != 0) && ((a < 0) != (b < 0)) ? 1 : 0);
    }

    int64_t seconds_;
    uint32_t nanos_;
};

} // namespace uuidsort

// Hash specialization for use in std containers
namespace std {
    template<>
    struct hash<uuidsort::Uuid> {
        size_t operator()(const uuidsort::Uuid& uuid) const noexcept {
            size_t h = static_cast<size_t>(uuid.high());
            h ^= static_cast<size_t>(uuid.low()) + 0x9e3779b9 + (h << 6) + (h >> 2);
            return h;
        }
    };
}
