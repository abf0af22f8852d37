// core/log.hpp
// Debug print macros and a per-flow log rate limiter
//
// Log lines are plain printf/fprintf with a bracketed component tag:
//   [SENDER] [RECEIVER] [COORD] [SOCKET] [WARN] [ERROR]
#pragma once

#include <cstdint>
#include <cstdio>

// Debug printing - enable with -DDEBUG
#ifdef DEBUG
#define UDPPERF_DEBUG_PRINT(...) do { printf(__VA_ARGS__); fflush(stdout); } while(0)
#else
#define UDPPERF_DEBUG_PRINT(...) ((void)0)
#endif

namespace udpperf {

/**
 * LogRateLimiter - allows one hot-path warning per period
 *
 * Owned by a single flow thread; not thread-safe. Suppressed lines are
 * counted and reported with the next allowed line.
 */
struct LogRateLimiter {
    explicit LogRateLimiter(int64_t period_ns = 1000000000LL)
        : period_ns_(period_ns)
        , last_ns_(INT64_MIN)
        , suppressed_(0)
    {}

    // Returns true if a line may be printed at now_ns.
    // *suppressed receives the number of lines dropped since the last one.
    bool allow(int64_t now_ns, uint64_t* suppressed) {
        if (last_ns_ != INT64_MIN && now_ns - last_ns_ < period_ns_) {
            suppressed_++;
            return false;
        }
        last_ns_ = now_ns;
        *suppressed = suppressed_;
        suppressed_ = 0;
        return true;
    }

private:
    int64_t period_ns_;
    int64_t last_ns_;
    uint64_t suppressed_;
};

} // namespace udpperf
