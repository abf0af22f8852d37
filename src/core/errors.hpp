// core/errors.hpp
// Error taxonomy
//
//   DecodeError      - malformed datagram, returned by the codec (never thrown)
//   SocketError      - socket/bind/connect/resolve failure, thrown at startup
//   RateConfigError  - invalid rate/packet size/flow count, thrown by validate()
//
// Steady-state I/O failures are never thrown: flows count and log them.
#pragma once

#include <cstring>
#include <stdexcept>
#include <string>

namespace udpperf {

enum class DecodeError {
    NONE = 0,
    TRUNCATED = 1,      // Buffer shorter than the fixed header
    UNKNOWN_TYPE = 2    // Type tag not recognized
};

inline const char* decode_error_name(DecodeError err) {
    switch (err) {
        case DecodeError::NONE: return "none";
        case DecodeError::TRUNCATED: return "truncated";
        case DecodeError::UNKNOWN_TYPE: return "unknown-type";
    }
    return "unknown";
}

class SocketError : public std::runtime_error {
public:
    SocketError(const std::string& what, int err)
        : std::runtime_error(what + ": " + strerror(err))
        , errno_(err)
    {}

    explicit SocketError(const std::string& what)
        : std::runtime_error(what)
        , errno_(0)
    {}

    int error_code() const { return errno_; }

private:
    int errno_;
};

class RateConfigError : public std::invalid_argument {
public:
    explicit RateConfigError(const std::string& what)
        : std::invalid_argument(what)
    {}
};

} // namespace udpperf
