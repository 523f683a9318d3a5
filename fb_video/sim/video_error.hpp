// Fatal error types raised by the video core models.
//
// None of the conditions reported here are recoverable by the core itself.
// Two classes exist:
//   - ConfigError:   the host programmed something the hardware cannot
//                    honour (unmapped register, a pitch/address combination
//                    that yields an illegal burst).
//   - ProtocolError: a collaborator broke its side of a handshake (a bus
//                    grant with no outstanding request, a burst that
//                    violates the bus contract).
//
// Models throw on the cycle the condition is detected and latch a halted
// state; the surrounding system decides whether to reset and reconfigure.

#pragma once

#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

/// Base class for all fatal video core conditions.
class VideoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Host configuration contract violation.
class ConfigError : public VideoError {
public:
    using VideoError::VideoError;
};

/// Bus or handshake protocol violation by a collaborator.
class ProtocolError : public VideoError {
public:
    using VideoError::VideoError;
};

/// Format a 32-bit value as 0x%08X for diagnostic messages.
inline std::string hex32(uint32_t value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08X", value);
    return buf;
}
