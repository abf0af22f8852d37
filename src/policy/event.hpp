// policy/event.hpp
// Event Loop Policy - epoll readiness notification for the receive path
//
// The policy conforms to the EventPolicyConcept interface:
//   - void init()
//   - void add_read(int fd)
//   - void remove(int fd)
//   - void set_wait_timeout(int ms)     // Pre-convert timeout (call once)
//   - int wait_with_timeout()           // Wait with pre-converted timeout
//   - int get_ready_fd() const
//
// Namespace: udpperf::event_policies

#pragma once

#include <stdexcept>
#include <cstdint>
#include <cstring>
#include <cerrno>
#include <string>

#if defined(__linux__)
    #define EVENT_POLICY_LINUX 1
    #include <sys/epoll.h>
    #include <unistd.h>
#else
    #error "Unsupported platform for event policy (epoll required)"
#endif

namespace udpperf {
namespace event_policies {

/**
 * EpollPolicy - Linux epoll-based event notification
 *
 * Uses edge-triggered mode (EPOLLET): after a readiness event the caller
 * must drain the fd until EAGAIN, or remember that data is still pending.
 *
 * Thread safety: Not thread-safe (one instance per socket-owner thread)
 */
struct EpollPolicy {
    EpollPolicy() : epfd_(-1), ready_fd_(-1), ready_events_(0), timeout_ms_(-1) {}

    ~EpollPolicy() {
        cleanup();
    }

    // Prevent copying
    EpollPolicy(const EpollPolicy&) = delete;
    EpollPolicy& operator=(const EpollPolicy&) = delete;

    // Allow moving
    EpollPolicy(EpollPolicy&& other) noexcept
        : epfd_(other.epfd_)
        , ready_fd_(other.ready_fd_)
        , ready_events_(other.ready_events_)
        , timeout_ms_(other.timeout_ms_)
    {
        other.epfd_ = -1;
        other.ready_fd_ = -1;
        other.ready_events_ = 0;
    }

    EpollPolicy& operator=(EpollPolicy&& other) noexcept {
        if (this != &other) {
            cleanup();
            epfd_ = other.epfd_;
            ready_fd_ = other.ready_fd_;
            ready_events_ = other.ready_events_;
            timeout_ms_ = other.timeout_ms_;
            other.epfd_ = -1;
            other.ready_fd_ = -1;
            other.ready_events_ = 0;
        }
        return *this;
    }

    /**
     * Initialize epoll instance
     *
     * @throws std::runtime_error if epoll_create1() fails
     */
    void init() {
        cleanup();
        epfd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epfd_ < 0) {
            throw std::runtime_error(std::string("epoll_create1() failed: ") + strerror(errno));
        }
    }

    /**
     * Register file descriptor for read events (EPOLLIN, edge-triggered)
     *
     * @throws std::runtime_error if epoll_ctl() fails
     */
    void add_read(int fd) {
        struct epoll_event ev = {};
        ev.events = EPOLLIN | EPOLLET;
        ev.data.fd = fd;

        if (epoll_ctl(epfd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            throw std::runtime_error(std::string("epoll_ctl(ADD, EPOLLIN) failed: ") + strerror(errno));
        }
    }

    void remove(int fd) {
        epoll_ctl(epfd_, EPOLL_CTL_DEL, fd, nullptr);
    }

    /**
     * Set timeout value for wait_with_timeout()
     *
     * @param timeout_ms Timeout in milliseconds (-1 = infinite, 0 = poll)
     */
    void set_wait_timeout(int timeout_ms) {
        timeout_ms_ = timeout_ms;
    }

    /**
     * Wait for events with pre-configured timeout
     *
     * @return Number of ready file descriptors (0 = timeout or EINTR, -1 = error)
     */
    int wait_with_timeout() {
        struct epoll_event events[MAX_EVENTS];
        int n = epoll_wait(epfd_, events, MAX_EVENTS, timeout_ms_);

        if (n > 0) {
            // Store first ready event (single-FD optimization)
            ready_fd_ = events[0].data.fd;
            ready_events_ = events[0].events;
            return n;
        }
        if (n < 0 && errno == EINTR) {
            return 0;
        }
        return n;
    }

    int get_ready_fd() const {
        return ready_fd_;
    }

    bool is_readable() const {
        return ready_events_ & EPOLLIN;
    }

    bool has_error() const {
        return ready_events_ & (EPOLLERR | EPOLLHUP);
    }

    static constexpr const char* name() {
        return "epoll";
    }

    static constexpr int MAX_EVENTS = 8;

private:
    void cleanup() {
        if (epfd_ >= 0) {
            ::close(epfd_);
            epfd_ = -1;
        }
        ready_fd_ = -1;
        ready_events_ = 0;
    }

    int epfd_;              // epoll file descriptor
    int ready_fd_;          // Most recently ready file descriptor
    uint32_t ready_events_; // Events for ready_fd_
    int timeout_ms_;        // Pre-configured timeout for wait_with_timeout()
};

} // namespace event_policies
} // namespace udpperf

using EventPolicy = udpperf::event_policies::EpollPolicy;

// ============================================================================
// Event Policy Concept (C++20)
// ============================================================================

#if __cplusplus >= 202002L
#include <concepts>

template<typename T>
concept EventPolicyConcept = requires(T event, int fd, int timeout) {
    { event.init() } -> std::same_as<void>;
    { event.add_read(fd) } -> std::same_as<void>;
    { event.remove(fd) } -> std::same_as<void>;
    { event.set_wait_timeout(timeout) } -> std::same_as<void>;
    { event.wait_with_timeout() } -> std::convertible_to<int>;
    { event.get_ready_fd() } -> std::convertible_to<int>;
};

static_assert(EventPolicyConcept<udpperf::event_policies::EpollPolicy>);

#endif // C++20
