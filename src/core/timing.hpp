// core/timing.hpp
// Monotonic nanosecond clock, absolute-deadline sleep and kernel RX timestamps
//
// All engine timestamps are CLOCK_MONOTONIC nanoseconds held in int64_t.
// Kernel receive timestamps (SO_TIMESTAMPNS) arrive in CLOCK_REALTIME and are
// converted to CLOCK_MONOTONIC before use.
//
// Clock Policy Interface (duck typing, checked by ClockPolicyConcept):
//   int64_t now_ns()
//   void sleep_until_ns(int64_t deadline_ns)
//
#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <cstring>
#include <cerrno>

#ifdef __linux__
#include <sys/socket.h>
#endif

namespace udpperf {

constexpr int64_t NS_PER_US  = 1000LL;
constexpr int64_t NS_PER_MS  = 1000LL * 1000LL;
constexpr int64_t NS_PER_SEC = 1000LL * 1000LL * 1000LL;

inline int64_t timespec_to_ns(const struct timespec& ts) {
    return static_cast<int64_t>(ts.tv_sec) * NS_PER_SEC + ts.tv_nsec;
}

inline struct timespec ns_to_timespec(int64_t ns) {
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(ns / NS_PER_SEC);
    ts.tv_nsec = static_cast<long>(ns % NS_PER_SEC);
    return ts;
}

// Current CLOCK_MONOTONIC time in nanoseconds
inline int64_t monotonic_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return timespec_to_ns(ts);
}

// Current CLOCK_REALTIME time in nanoseconds
inline int64_t realtime_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return timespec_to_ns(ts);
}

// Convert a CLOCK_REALTIME timestamp to CLOCK_MONOTONIC
// Formula: monotonic = (realtime_ts - realtime_now) + monotonic_now
inline int64_t realtime_to_monotonic_ns(int64_t real_ts_ns) {
    struct timespec now_real, now_mono;
    clock_gettime(CLOCK_REALTIME, &now_real);
    clock_gettime(CLOCK_MONOTONIC, &now_mono);

    int64_t mono_ns = timespec_to_ns(now_mono) + (real_ts_ns - timespec_to_ns(now_real));
    return mono_ns > 0 ? mono_ns : 0;
}

// Sleep until an absolute CLOCK_MONOTONIC deadline
// Deadlines in the past return immediately. EINTR restarts the sleep with
// the same absolute deadline, so signals never shorten or stretch pacing.
inline void sleep_until_ns(int64_t deadline_ns) {
    struct timespec ts = ns_to_timespec(deadline_ns);
    while (clock_nanosleep(CLOCK_MONOTONIC, TIMER_ABSTIME, &ts, nullptr) == EINTR) {
    }
}

// Enable kernel software RX timestamps (SO_TIMESTAMPNS) on a socket
// Returns true on success, false on failure (arrival time then falls back
// to monotonic_ns() taken when the datagram is drained)
inline bool enable_rx_timestamping(int sockfd) {
#ifdef __linux__
    int on = 1;
    if (setsockopt(sockfd, SOL_SOCKET, SO_TIMESTAMPNS, &on, sizeof(on)) == 0) {
        return true;
    }
    fprintf(stderr, "[TIMESTAMP] Failed to enable SO_TIMESTAMPNS: %s\n", strerror(errno));
    return false;
#else
    (void)sockfd;
    return false;
#endif
}

// Control buffer size for one SCM_TIMESTAMPNS ancillary message
constexpr size_t RX_TIMESTAMP_CONTROL_LEN = 64;

// Extract the RX timestamp from a received msghdr and convert to CLOCK_MONOTONIC
// Returns 0 if the kernel did not attach a timestamp
inline int64_t extract_rx_timestamp_ns(struct msghdr* msg) {
#ifdef __linux__
    for (struct cmsghdr* cmsg = CMSG_FIRSTHDR(msg); cmsg != nullptr; cmsg = CMSG_NXTHDR(msg, cmsg)) {
        if (cmsg->cmsg_level == SOL_SOCKET && cmsg->cmsg_type == SCM_TIMESTAMPNS) {
            struct timespec ts;
            std::memcpy(&ts, CMSG_DATA(cmsg), sizeof(ts));
            if (ts.tv_sec > 0 || ts.tv_nsec > 0) {
                return realtime_to_monotonic_ns(timespec_to_ns(ts));
            }
        }
    }
#else
    (void)msg;
#endif
    return 0;
}

/**
 * MonotonicClock - production clock policy
 *
 * Thin wrapper over monotonic_ns()/sleep_until_ns(). Stateless, so one
 * instance can be shared by every flow thread.
 */
struct MonotonicClock {
    int64_t now_ns() const {
        return monotonic_ns();
    }

    void sleep_until_ns(int64_t deadline_ns) const {
        udpperf::sleep_until_ns(deadline_ns);
    }

    static constexpr const char* name() {
        return "monotonic";
    }
};

} // namespace udpperf

// ============================================================================
// Clock Policy Concept (C++20)
// ============================================================================

#if __cplusplus >= 202002L
#include <concepts>

namespace udpperf {

template<typename T>
concept ClockPolicyConcept = requires(T clock, int64_t deadline) {
    { clock.now_ns() } -> std::convertible_to<int64_t>;
    { clock.sleep_until_ns(deadline) } -> std::same_as<void>;
};

static_assert(ClockPolicyConcept<MonotonicClock>);

} // namespace udpperf

#endif // C++20
