// flow/rendezvous.hpp
// Reverse-mode rendezvous: the client registers its flows with HELLO packets
//
// Client: opens its receiving socket, sends one HELLO per flow (HELLO_ROUNDS
//         rounds, HELLO_SPACING_NS apart) from that socket to the server.
// Server: waits on its listening socket for the first HELLO, then keeps
//         collecting until every announced flow registered or hello_timeout
//         elapsed. The HELLO source address is where the flows are sent.
#pragma once

#include "../core/errors.hpp"
#include "../core/log.hpp"
#include "../core/timing.hpp"
#include "../msg/packet_codec.hpp"
#include "../policy/event.hpp"
#include "../transport/udp_socket.hpp"
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <optional>
#include <set>
#include <vector>

namespace udpperf {

constexpr int HELLO_ROUNDS = 3;
constexpr int64_t HELLO_SPACING_NS = 20 * NS_PER_MS;

struct HelloRegistration {
    sockaddr_in client = {};
    uint32_t total_flows = 0;
    std::vector<uint32_t> flow_ids;     // Sorted, unique
};

/**
 * Send HELLO for flows [0, num_flows) to the server
 *
 * @return Number of HELLO datagrams sent
 * @throws SocketError if no HELLO could be sent at all
 */
inline size_t send_hellos(transport::UdpSocket& socket, const sockaddr_in& server, uint32_t num_flows) {
    uint8_t buf[msg::HEADER_LEN];
    size_t sent = 0;
    int last_errno = 0;

    for (int round = 0; round < HELLO_ROUNDS; round++) {
        if (round > 0) {
            sleep_until_ns(monotonic_ns() + HELLO_SPACING_NS);
        }
        for (uint32_t flow_id = 0; flow_id < num_flows; flow_id++) {
            msg::HelloPacket hello{flow_id, num_flows, monotonic_ns()};
            size_t len = msg::encode_hello(buf, sizeof(buf), hello);
            if (socket.send_to(buf, len, server) < 0) {
                last_errno = errno;
                continue;
            }
            sent++;
        }
    }

    if (sent == 0) {
        throw SocketError("HELLO to " + transport::format_address(server) + " failed", last_errno);
    }
    printf("[COORD] registered %u flows with %s (%zu HELLOs)\n",
           num_flows, transport::format_address(server).c_str(), sent);
    return sent;
}

/**
 * Collect HELLOs on the server's listening socket
 *
 * Waits indefinitely for the first HELLO (until stop). HELLOs from any other
 * client address than the first one are ignored, as are other packet types.
 *
 * @return The registration, or std::nullopt if stop was raised first
 */
inline std::optional<HelloRegistration> collect_hellos(transport::UdpSocket& socket,
                                                       int64_t hello_timeout_ns,
                                                       uint32_t max_flows,
                                                       const std::atomic<bool>& stop) {
    event_policies::EpollPolicy event;
    event.init();
    event.add_read(socket.get_fd());
    event.set_wait_timeout(50);

    HelloRegistration reg;
    std::set<uint32_t> flows;
    bool have_client = false;
    int64_t first_hello_ns = 0;
    uint8_t buf[2048];

    while (!stop.load(std::memory_order_relaxed)) {
        if (have_client) {
            if (flows.size() >= reg.total_flows) break;
            if (monotonic_ns() - first_hello_ns >= hello_timeout_ns) {
                fprintf(stderr, "[WARN] [COORD] HELLO timeout: %zu of %u flows registered\n",
                        flows.size(), reg.total_flows);
                break;
            }
        }

        if (event.wait_with_timeout() < 0) {
            throw SocketError("epoll_wait() failed while waiting for HELLO", errno);
        }

        // Edge-triggered: drain until EAGAIN
        while (true) {
            sockaddr_in src = {};
            int64_t arrival_ns = 0;
            ssize_t n = socket.recv_datagram(buf, sizeof(buf), &arrival_ns, &src);
            if (n < 0) {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    fprintf(stderr, "[WARN] [COORD] recv failed while waiting for HELLO: %s\n", strerror(errno));
                }
                break;
            }

            msg::ParseResult parsed = msg::decode(buf, static_cast<size_t>(n));
            if (!parsed.valid || parsed.type != msg::PacketType::HELLO) {
                continue;
            }

            msg::HelloPacket hello = parsed.as_hello();
            if (!have_client) {
                if (hello.total_flows == 0 || hello.total_flows > max_flows) {
                    fprintf(stderr, "[WARN] [COORD] ignoring HELLO announcing %lu flows from %s\n",
                            hello.total_flows, transport::format_address(src).c_str());
                    continue;
                }
                have_client = true;
                first_hello_ns = arrival_ns;
                reg.client = src;
                reg.total_flows = static_cast<uint32_t>(hello.total_flows);
                printf("[COORD] HELLO from %s: %u flows\n",
                       transport::format_address(src).c_str(), reg.total_flows);
            } else if (!transport::same_address(src, reg.client)) {
                continue;
            }

            if (hello.flow_id < reg.total_flows) {
                flows.insert(hello.flow_id);
            }
        }
    }

    if (!have_client) {
        return std::nullopt;
    }
    reg.flow_ids.assign(flows.begin(), flows.end());
    return reg;
}

/**
 * Discard everything queued on a listening socket between sessions
 *
 * Repeated FINs and the later HELLO rounds of a finished session would
 * otherwise be read as the start of the next one.
 *
 * @return Number of datagrams discarded
 */
inline size_t discard_pending(transport::UdpSocket& socket) {
    uint8_t buf[2048];
    size_t discarded = 0;
    while (true) {
        int64_t arrival_ns = 0;
        ssize_t n = socket.recv_datagram(buf, sizeof(buf), &arrival_ns, nullptr);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        discarded++;
    }
    if (discarded > 0) {
        UDPPERF_DEBUG_PRINT("[COORD] discarded %zu stale datagrams\n", discarded);
    }
    return discarded;
}

} // namespace udpperf
