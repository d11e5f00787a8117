#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace uuidsort {

enum class ErrorKind : uint8_t {
    // The UUID's version nibble is not 1.
    InvalidVersion,
    // The instant or tick count does not fit the 60-bit timestamp.
    OutOfRange,
};

/**
 * Failure of a reordering operation.
 *
 * Exactly one of the payload fields is meaningful, selected by `kind`:
 * InvalidVersion sets `observed_version`; OutOfRange sets either
 * `offending_ticks` or `offending_instant`.
 */
struct Error {
    ErrorKind kind{ErrorKind::InvalidVersion};
    std::string message;
    unsigned observed_version{0};
    std::optional<uint64_t> offending_ticks;
    std::optional<Instant> offending_instant;

    [[nodiscard]] static Error invalid_version(unsigned observed);
    [[nodiscard]] static Error out_of_range(uint64_t ticks);
    [[nodiscard]] static Error out_of_range(const Instant& when);

    bool operator==(const Error&) const = default;
};

[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

} // namespace uuidsort
