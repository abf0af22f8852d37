// src/transport/udp_socket.hpp
// UDP Socket - kernel UDP socket used by every flow
//
// Policy-based design: No inheritance, no virtual functions
// Setup failures throw SocketError; send/recv return ssize_t like the syscalls.
//
// Socket Interface (duck typing, also implemented by test mocks):
//   ssize_t send(const void* data, size_t len)
//   ssize_t recv_datagram(void* buf, size_t len, int64_t* arrival_ns, sockaddr_in* src)
//   int get_fd() const

#pragma once

#include "../core/errors.hpp"
#include "../core/timing.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <netdb.h>
#include <errno.h>

namespace udpperf {
namespace transport {

/**
 * UDP Socket Configuration
 */
struct UdpSocketConfig {
    int rcvbuf_bytes;      // SO_RCVBUF request (default: 4MB)
    int sndbuf_bytes;      // SO_SNDBUF request (default: 4MB)
    bool rx_timestamps;    // Enable SO_TIMESTAMPNS (default: true)
    bool nonblocking;      // O_NONBLOCK (default: true)

    UdpSocketConfig()
        : rcvbuf_bytes(4 * 1024 * 1024)
        , sndbuf_bytes(4 * 1024 * 1024)
        , rx_timestamps(true)
        , nonblocking(true)
    {}
};

// Resolve an IPv4 host name or dotted quad. Throws SocketError.
inline sockaddr_in resolve_ipv4(const char* host, uint16_t port) {
    sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (!host || host[0] == '\0' || strcmp(host, "0.0.0.0") == 0) {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        return addr;
    }
    if (inet_pton(AF_INET, host, &addr.sin_addr) == 1) {
        return addr;
    }

    struct addrinfo hints = {};
    struct addrinfo* result = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    int ret = getaddrinfo(host, nullptr, &hints, &result);
    if (ret != 0) {
        throw SocketError(std::string("getaddrinfo(") + host + ") failed: " + gai_strerror(ret));
    }
    if (!result || !result->ai_addr) {
        if (result) freeaddrinfo(result);
        throw SocketError(std::string("getaddrinfo(") + host + ") returned no address");
    }

    addr.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return addr;
}

inline std::string format_address(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

inline bool same_address(const sockaddr_in& a, const sockaddr_in& b) {
    return a.sin_addr.s_addr == b.sin_addr.s_addr && a.sin_port == b.sin_port;
}

/**
 * UdpSocket - RAII wrapper for one AF_INET/SOCK_DGRAM socket
 *
 * Movable, not copyable. Sender flows use a connected socket (send/recv_datagram),
 * the receiver socket owner uses a bound socket (send_to plus a receive backend).
 */
struct UdpSocket {
    UdpSocket()
        : fd_(-1)
        , connected_(false)
        , rx_timestamps_(false)
    {}

    ~UdpSocket() {
        close();
    }

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    UdpSocket(UdpSocket&& other) noexcept
        : fd_(other.fd_)
        , connected_(other.connected_)
        , rx_timestamps_(other.rx_timestamps_)
        , config_(other.config_)
    {
        other.fd_ = -1;
        other.connected_ = false;
    }

    UdpSocket& operator=(UdpSocket&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            connected_ = other.connected_;
            rx_timestamps_ = other.rx_timestamps_;
            config_ = other.config_;
            other.fd_ = -1;
            other.connected_ = false;
        }
        return *this;
    }

    // =====================
    // Setup (throws SocketError)
    // =====================

    void open(const UdpSocketConfig& config = UdpSocketConfig()) {
        close();
        config_ = config;

        fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) {
            throw SocketError("socket(AF_INET, SOCK_DGRAM) failed", errno);
        }

        int reuse = 1;
        if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
            fprintf(stderr, "[WARN] Failed to set SO_REUSEADDR: %s\n", strerror(errno));
        }

        // Buffer sizes are requests; the kernel may clamp them (net.core.*mem_max)
        if (config_.rcvbuf_bytes > 0 &&
            ::setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, &config_.rcvbuf_bytes, sizeof(config_.rcvbuf_bytes)) < 0) {
            fprintf(stderr, "[WARN] Failed to set SO_RCVBUF=%d: %s\n", config_.rcvbuf_bytes, strerror(errno));
        }
        if (config_.sndbuf_bytes > 0 &&
            ::setsockopt(fd_, SOL_SOCKET, SO_SNDBUF, &config_.sndbuf_bytes, sizeof(config_.sndbuf_bytes)) < 0) {
            fprintf(stderr, "[WARN] Failed to set SO_SNDBUF=%d: %s\n", config_.sndbuf_bytes, strerror(errno));
        }

        if (config_.rx_timestamps) {
            rx_timestamps_ = enable_rx_timestamping(fd_);
        }

        if (config_.nonblocking) {
            int flags = fcntl(fd_, F_GETFL, 0);
            if (flags < 0 || fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
                int err = errno;
                close();
                throw SocketError("Failed to set non-blocking mode", err);
            }
        }
    }

    void bind(const char* host, uint16_t port) {
        sockaddr_in addr = resolve_ipv4(host, port);
        if (::bind(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
            throw SocketError("bind(" + format_address(addr) + ") failed", errno);
        }
    }

    // Connect to a peer; afterwards send() targets it and the kernel filters
    // datagrams from other sources
    void connect(const sockaddr_in& peer) {
        if (::connect(fd_, reinterpret_cast<const sockaddr*>(&peer), sizeof(peer)) < 0) {
            throw SocketError("connect(" + format_address(peer) + ") failed", errno);
        }
        connected_ = true;
    }

    void connect(const char* host, uint16_t port) {
        connect(resolve_ipv4(host, port));
    }

    sockaddr_in local_address() const {
        sockaddr_in addr = {};
        socklen_t len = sizeof(addr);
        if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
            throw SocketError("getsockname() failed", errno);
        }
        return addr;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
            connected_ = false;
        }
    }

    bool is_open() const {
        return fd_ >= 0;
    }

    bool is_connected() const {
        return connected_ && fd_ >= 0;
    }

    bool has_rx_timestamps() const {
        return rx_timestamps_;
    }

    // =====================
    // Data path (never throws)
    // =====================

    ssize_t send(const void* data, size_t len) {
        if (fd_ < 0) {
            errno = EBADF;
            return -1;
        }
        return ::send(fd_, data, len, MSG_DONTWAIT);
    }

    ssize_t send_to(const void* data, size_t len, const sockaddr_in& dest) {
        if (fd_ < 0) {
            errno = EBADF;
            return -1;
        }
        return ::sendto(fd_, data, len, MSG_DONTWAIT,
                        reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
    }

    /**
     * Receive one datagram without blocking
     *
     * @param arrival_ns Kernel RX timestamp (CLOCK_MONOTONIC), or monotonic_ns()
     *                   at drain time when the kernel attached none
     * @param src        Source address (may be nullptr)
     * @return Datagram length, or -1 with errno (EAGAIN when empty)
     */
    ssize_t recv_datagram(void* buf, size_t len, int64_t* arrival_ns, sockaddr_in* src = nullptr) {
        if (fd_ < 0) {
            errno = EBADF;
            return -1;
        }

        char control[RX_TIMESTAMP_CONTROL_LEN];
        struct iovec iov;
        struct msghdr msg = {};
        sockaddr_in from = {};

        iov.iov_base = buf;
        iov.iov_len = len;
        msg.msg_name = &from;
        msg.msg_namelen = sizeof(from);
        msg.msg_iov = &iov;
        msg.msg_iovlen = 1;
        msg.msg_control = control;
        msg.msg_controllen = sizeof(control);

        ssize_t n = ::recvmsg(fd_, &msg, MSG_DONTWAIT);
        if (n < 0) {
            return n;
        }

        if (arrival_ns) {
            int64_t ts = rx_timestamps_ ? extract_rx_timestamp_ns(&msg) : 0;
            *arrival_ns = ts > 0 ? ts : monotonic_ns();
        }
        if (src) {
            *src = from;
        }
        return n;
    }

    int get_fd() const {
        return fd_;
    }

private:
    int fd_;
    bool connected_;
    bool rx_timestamps_;
    UdpSocketConfig config_;
};

} // namespace transport
} // namespace udpperf
