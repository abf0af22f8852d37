// examples/cli_common.hpp
// Argument parsing helpers and exit codes shared by the udpperf programs
#pragma once

#include "flow/session_config.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

constexpr int EXIT_OK = 0;
constexpr int EXIT_CONFIG_ERROR = 1;    // RateConfigError, SocketError, I/O failure
constexpr int EXIT_USAGE = 2;

// Thrown by the helpers below for malformed command lines
class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& what) : std::invalid_argument(what) {}
};

// Value following argv[*i]; advances *i
inline const char* next_value(int argc, char* argv[], int* i) {
    if (*i + 1 >= argc) {
        throw UsageError(std::string(argv[*i]) + " requires a value");
    }
    return argv[++(*i)];
}

inline double parse_double_arg(const char* flag, const char* text) {
    char* end = nullptr;
    errno = 0;
    double v = strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE) {
        throw UsageError(std::string(flag) + ": invalid number '" + text + "'");
    }
    return v;
}

inline uint64_t parse_uint_arg(const char* flag, const char* text, uint64_t max) {
    char* end = nullptr;
    errno = 0;
    unsigned long long v = strtoull(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || text[0] == '-' || v > max) {
        throw UsageError(std::string(flag) + ": invalid value '" + text + "'");
    }
    return static_cast<uint64_t>(v);
}

inline udpperf::JitterMode parse_jitter_arg(const char* text) {
    udpperf::JitterMode mode;
    if (!udpperf::parse_jitter_mode(text, &mode)) {
        throw UsageError(std::string("--jitter: unknown mode '") + text + "' (mean-abs-delta, rfc3550, stddev)");
    }
    return mode;
}
