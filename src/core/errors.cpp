#include "core/errors.hpp"

#include <string>

namespace uuidsort {

Error Error::invalid_version(unsigned observed) {
    Error e;
    e.kind = ErrorKind::InvalidVersion;
    e.message = "input UUID was version " + std::to_string(observed);
    e.observed_version = observed;
    return e;
}

Error Error::out_of_range(uint64_t ticks) {
    Error e;
    e.kind = ErrorKind::OutOfRange;
    e.message = "the tick count " + std::to_string(ticks) + " overflows the 60-bit UUID timestamp";
    e.offending_ticks = ticks;
    return e;
}

Error Error::out_of_range(const Instant& when) {
    Error e;
    e.kind = ErrorKind::OutOfRange;
    e.message = "the provided timestamp " + when.to_iso_string() +
                " is outside the 60-bit UUID timestamp range";
    e.offending_instant = when;
    return e;
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidVersion: return "InvalidVersion";
        case ErrorKind::OutOfRange: return "OutOfRange";
    }
    return "?";
}

} // namespace uuidsort
