#include "core/types.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>

namespace uuidsort {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Instant>, "Instant should be trivially copyable");

namespace {

constexpr int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr bool is_hyphen_position(size_t i) noexcept {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

constexpr int64_t SECONDS_PER_DAY = 86'400;

struct CivilDate {
    int64_t year;
    unsigned month;
    unsigned day;
};

// Proleptic Gregorian date of a day count since 1970-01-01, over the whole
// int64 range (H. Hinnant, "chrono-Compatible Low-Level Date Algorithms").
constexpr CivilDate civil_from_days(int64_t z) noexcept {
    z += 719'468;
    const int64_t era = (z >= 0 ? z : z - 146'096) / 146'097;
    const int64_t doe = z - era * 146'097;
    const int64_t yoe = (doe - doe / 1'460 + doe / 36'524 - doe / 146'096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const auto day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    const auto month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    return {yoe + era * 400 + (month <= 2 ? 1 : 0), month, day};
}

static_assert(civil_from_days(0).year == 1970);
static_assert(civil_from_days(-141'427).year == 1582 && civil_from_days(-141'427).month == 10 &&
              civil_from_days(-141'427).day == 15);
static_assert(civil_from_days(-719'469).year == 0 && civil_from_days(-719'469).month == 12);

} // namespace

std::optional<Uuid> Uuid::parse(std::string_view str) {
    const bool hyphenated = str.size() == 36;
    if (!hyphenated && str.size() != 32) return std::nullopt;

    Bytes bytes{};
    size_t nibble = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        if (hyphenated && is_hyphen_position(i)) {
            if (str[i] != '-') return std::nullopt;
            continue;
        }
        const int v = hex_value(str[i]);
        if (v < 0) return std::nullopt;
        bytes[nibble / 2] = static_cast<uint8_t>((bytes[nibble / 2] << 4) | v);
        ++nibble;
    }

    return from_bytes(bytes);
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    const auto b = bytes();
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(b[i]);
    }

    return oss.str();
}

std::string Instant::to_iso_string() const {
    const int64_t days_since_epoch =
        seconds_ / SECONDS_PER_DAY - ((seconds_ % SECONDS_PER_DAY) < 0 ? 1 : 0);
    const int64_t second_of_day = seconds_ - days_since_epoch * SECONDS_PER_DAY;
    const auto date = civil_from_days(days_since_epoch);

    std::ostringstream oss;
    oss << std::setfill('0') << std::internal
        << std::setw(4) << date.year << '-'
        << std::setw(2) << date.month << '-'
        << std::setw(2) << date.day << 'T'
        << std::setw(2) << second_of_day / 3600 << ':'
        << std::setw(2) << (second_of_day / 60) % 60 << ':'
        << std::setw(2) << second_of_day % 60 << '.'
        << std::setw(7) << nanos_ / 100 << 'Z';

    return oss.str();
}

} // namespace uuidsort
