// policy/recv_backend.hpp
// Receive Backend - batched datagram receive for the socket-owner thread
//
// This header provides two backends:
//   - Linux: EpollRecvBackend (default): epoll readiness + recvmmsg() batches
//   - Linux: IoUringRecvBackend (with ENABLE_IO_URING): pre-posted recvmsg SQEs
//
// All backends conform to the RecvBackendConcept interface:
//   - void init(int fd, int wait_timeout_ms)
//   - int poll(Handler&& on_datagram)    // -1 = error (errno), else datagrams handled
//
// poll() blocks for at most wait_timeout_ms, so the owner observes its stop
// signal at least that often. Each datagram is handed over as a RecvDatagram
// whose data pointer is only valid during the callback.
//
// Namespace: udpperf::recv_backends

#pragma once

#include "event.hpp"
#include "../core/timing.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <netinet/in.h>
#include <errno.h>

// io_uring header must be included outside namespace to avoid polluting it
#ifdef ENABLE_IO_URING
#include <liburing.h>
#endif

namespace udpperf {
namespace recv_backends {

struct RecvDatagram {
    const uint8_t* data;
    size_t len;
    sockaddr_in src;
    int64_t recv_time_ns;    // Kernel RX timestamp, CLOCK_MONOTONIC
    bool truncated;          // MSG_TRUNC: datagram larger than the slot
};

// Slot size covers the largest IPv4 UDP payload
constexpr size_t RECV_SLOT_LEN = 65536;

// ============================================================================
// Linux: epoll + recvmmsg
// ============================================================================

/**
 * EpollRecvBackend - readiness via EventPolicyT, data via recvmmsg()
 *
 * Edge-triggered: a full batch means the socket may still hold data, so the
 * next poll() reads again without waiting on epoll.
 *
 * Thread safety: Not thread-safe (owned by the socket-owner thread)
 */
template<typename EventPolicyT = event_policies::EpollPolicy>
struct EpollRecvBackend {
    static constexpr size_t BATCH = 32;

    EpollRecvBackend() : fd_(-1), pending_(false) {}

    EpollRecvBackend(const EpollRecvBackend&) = delete;
    EpollRecvBackend& operator=(const EpollRecvBackend&) = delete;

    void init(int fd, int wait_timeout_ms) {
        fd_ = fd;
        event_.init();
        event_.add_read(fd);
        event_.set_wait_timeout(wait_timeout_ms);

        buffers_.reset(new uint8_t[BATCH * RECV_SLOT_LEN]);
        pending_ = true;  // Datagrams may have queued before registration
    }

    template<typename Handler>
    int poll(Handler&& on_datagram) {
        if (!pending_) {
            int n = event_.wait_with_timeout();
            if (n <= 0) {
                return n;
            }
        }

        for (size_t i = 0; i < BATCH; i++) {
            iovs_[i].iov_base = buffers_.get() + i * RECV_SLOT_LEN;
            iovs_[i].iov_len = RECV_SLOT_LEN;
            std::memset(&msgs_[i], 0, sizeof(msgs_[i]));
            msgs_[i].msg_hdr.msg_name = &addrs_[i];
            msgs_[i].msg_hdr.msg_namelen = sizeof(addrs_[i]);
            msgs_[i].msg_hdr.msg_iov = &iovs_[i];
            msgs_[i].msg_hdr.msg_iovlen = 1;
            msgs_[i].msg_hdr.msg_control = controls_[i];
            msgs_[i].msg_hdr.msg_controllen = RX_TIMESTAMP_CONTROL_LEN;
        }

        int n = recvmmsg(fd_, msgs_, BATCH, MSG_DONTWAIT, nullptr);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                pending_ = false;
                return 0;
            }
            return -1;
        }
        pending_ = (static_cast<size_t>(n) == BATCH);

        int64_t drain_ns = monotonic_ns();
        for (int i = 0; i < n; i++) {
            int64_t ts = extract_rx_timestamp_ns(&msgs_[i].msg_hdr);
            RecvDatagram dgram;
            dgram.data = static_cast<const uint8_t*>(iovs_[i].iov_base);
            dgram.len = msgs_[i].msg_len;
            dgram.src = addrs_[i];
            dgram.recv_time_ns = ts > 0 ? ts : drain_ns;
            dgram.truncated = (msgs_[i].msg_hdr.msg_flags & MSG_TRUNC) != 0;
            on_datagram(dgram);
        }
        return n;
    }

    static constexpr const char* name() {
        return "epoll+recvmmsg";
    }

private:
    int fd_;
    bool pending_;
    EventPolicyT event_;
    std::unique_ptr<uint8_t[]> buffers_;
    struct mmsghdr msgs_[BATCH];
    struct iovec iovs_[BATCH];
    sockaddr_in addrs_[BATCH];
    char controls_[BATCH][RX_TIMESTAMP_CONTROL_LEN];
};

// ============================================================================
// Linux: io_uring
// ============================================================================

#ifdef ENABLE_IO_URING

/**
 * IoUringRecvBackend - pre-posted recvmsg operations on an io_uring
 *
 * SLOTS receives are kept in flight at all times; each completion is handed
 * to the caller and its slot is immediately re-posted. Kernel RX timestamps
 * are delivered in the recvmsg control buffer exactly as with recvmmsg().
 *
 * Thread safety: Not thread-safe (single-threaded design)
 */
struct IoUringRecvBackend {
    static constexpr unsigned QUEUE_DEPTH = 64;
    static constexpr size_t SLOTS = 32;

    IoUringRecvBackend() : fd_(-1), initialized_(false) {}

    ~IoUringRecvBackend() {
        if (initialized_) {
            io_uring_queue_exit(&ring_);
        }
    }

    // Prevent copying
    IoUringRecvBackend(const IoUringRecvBackend&) = delete;
    IoUringRecvBackend& operator=(const IoUringRecvBackend&) = delete;

    void init(int fd, int wait_timeout_ms) {
        fd_ = fd;
        timeout_.tv_sec = wait_timeout_ms / 1000;
        timeout_.tv_nsec = (wait_timeout_ms % 1000) * 1000000L;

        int ret = io_uring_queue_init(QUEUE_DEPTH, &ring_, 0);
        if (ret < 0) {
            throw std::runtime_error(std::string("io_uring_queue_init() failed: ") + strerror(-ret));
        }
        initialized_ = true;

        slots_.reset(new Slot[SLOTS]);
        for (size_t i = 0; i < SLOTS; i++) {
            slots_[i].buffer.reset(new uint8_t[RECV_SLOT_LEN]);
            submit_recv(&slots_[i]);
        }
        io_uring_submit(&ring_);
    }

    template<typename Handler>
    int poll(Handler&& on_datagram) {
        struct io_uring_cqe* cqe = nullptr;
        int ret = io_uring_wait_cqe_timeout(&ring_, &cqe, &timeout_);
        if (ret == -ETIME || ret == -EINTR) {
            return 0;
        }
        if (ret < 0) {
            errno = -ret;
            return -1;
        }

        int count = 0;
        int64_t drain_ns = monotonic_ns();
        while (io_uring_peek_cqe(&ring_, &cqe) == 0) {
            Slot* slot = static_cast<Slot*>(io_uring_cqe_get_data(cqe));
            int res = cqe->res;
            io_uring_cqe_seen(&ring_, cqe);
            if (!slot) continue;

            if (res > 0) {
                int64_t ts = extract_rx_timestamp_ns(&slot->msg);
                RecvDatagram dgram;
                dgram.data = slot->buffer.get();
                dgram.len = static_cast<size_t>(res);
                dgram.src = slot->addr;
                dgram.recv_time_ns = ts > 0 ? ts : drain_ns;
                dgram.truncated = (slot->msg.msg_flags & MSG_TRUNC) != 0;
                on_datagram(dgram);
                count++;
            }
            submit_recv(slot);
        }
        io_uring_submit(&ring_);
        return count;
    }

    static constexpr const char* name() {
        return "io_uring";
    }

private:
    struct Slot {
        std::unique_ptr<uint8_t[]> buffer;
        struct msghdr msg;
        struct iovec iov;
        sockaddr_in addr;
        char control[RX_TIMESTAMP_CONTROL_LEN];
    };

    void submit_recv(Slot* slot) {
        struct io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
        if (!sqe) return;

        slot->iov.iov_base = slot->buffer.get();
        slot->iov.iov_len = RECV_SLOT_LEN;
        std::memset(&slot->msg, 0, sizeof(slot->msg));
        slot->msg.msg_name = &slot->addr;
        slot->msg.msg_namelen = sizeof(slot->addr);
        slot->msg.msg_iov = &slot->iov;
        slot->msg.msg_iovlen = 1;
        slot->msg.msg_control = slot->control;
        slot->msg.msg_controllen = sizeof(slot->control);

        io_uring_prep_recvmsg(sqe, fd_, &slot->msg, 0);
        io_uring_sqe_set_data(sqe, slot);
    }

    int fd_;
    bool initialized_;
    struct io_uring ring_;
    struct __kernel_timespec timeout_;
    std::unique_ptr<Slot[]> slots_;
};

#endif // ENABLE_IO_URING

} // namespace recv_backends
} // namespace udpperf

// ============================================================================
// Receive Backend Concept (C++20)
// ============================================================================

#if __cplusplus >= 202002L
#include <concepts>

namespace udpperf {

template<typename T>
concept RecvBackendConcept = requires(T backend, int fd, int timeout,
                                      void (*handler)(const recv_backends::RecvDatagram&)) {
    { backend.init(fd, timeout) } -> std::same_as<void>;
    { backend.poll(handler) } -> std::convertible_to<int>;
    { T::name() } -> std::convertible_to<const char*>;
};

static_assert(RecvBackendConcept<recv_backends::EpollRecvBackend<>>);
#ifdef ENABLE_IO_URING
static_assert(RecvBackendConcept<recv_backends::IoUringRecvBackend>);
#endif

} // namespace udpperf

#endif // C++20
