// flow/flow_coordinator.hpp
// Flow Coordinator - runs one test session for one side
//
// Template parameters:
//   ClockPolicy  - MonotonicClock in production
//   RecvBackend  - receive backend of the socket owner (epoll or io_uring)
//
// Sender session:   one thread per flow, all paced from a shared start_time_ns,
//                   stop raised at start + duration (or by request_stop()).
// Receiver session: one socket-owner thread plus lazily created flow workers,
//                   ends on stop, deadline, FIN from every flow or idle timeout.
//
// In both cases the calling thread prints progress lines and, after every
// flow thread is joined, merges the per-flow shards into one event stream.
//
// Usage:
//   FlowCoordinator<> coord(config);
//   SessionResult result = coord.run();   // resolves side/mode into a Role
//
// A coordinator runs one session; the stop flag is never re-armed.
#pragma once

#include "flow_event.hpp"
#include "flow_receiver.hpp"
#include "flow_sender.hpp"
#include "rendezvous.hpp"
#include "session_config.hpp"
#include "../core/errors.hpp"
#include "../core/timing.hpp"
#include "../policy/recv_backend.hpp"
#include "../transport/udp_socket.hpp"
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace udpperf {

struct SessionResult {
    Role role = Role::SENDER;
    uint32_t num_flows = 0;
    size_t packet_size = 0;
    int64_t start_time_ns = 0;
    int64_t end_time_ns = 0;
    bool stopped = false;                   // request_stop() ended the session early

    std::vector<FlowEvent> events;          // Merged, time ordered

    // Sender session
    std::vector<FlowState> sender_flows;

    // Receiver session
    std::vector<FlowReceiverStats> receiver_flows;
    ReceiverOwnerStats receiver_stats;
    ReceiverExit receiver_exit = ReceiverExit::STOPPED;
};

template<typename ClockPolicy = MonotonicClock,
         typename RecvBackend = recv_backends::EpollRecvBackend<>>
class FlowCoordinator {
public:
    static constexpr int64_t SUPERVISE_SLICE_NS = 50 * NS_PER_MS;

    /**
     * @throws RateConfigError if config does not validate
     */
    explicit FlowCoordinator(const SessionConfig& config, ClockPolicy clock = ClockPolicy())
        : config_(config)
        , clock_(clock)
        , stop_(false)
    {
        config_.validate();
    }

    FlowCoordinator(const FlowCoordinator&) = delete;
    FlowCoordinator& operator=(const FlowCoordinator&) = delete;

    // Async-signal-safe: a single lock-free atomic store
    void request_stop() noexcept {
        stop_.store(true, std::memory_order_relaxed);
    }

    bool stop_requested() const {
        return stop_.load(std::memory_order_relaxed);
    }

    const SessionConfig& config() const { return config_; }

    transport::UdpSocketConfig socket_config() const {
        transport::UdpSocketConfig sc;
        sc.rcvbuf_bytes = config_.socket_buffer_bytes;
        sc.sndbuf_bytes = config_.socket_buffer_bytes;
        return sc;
    }

    // =====================
    // Session entry points
    // =====================

    /**
     * Run one complete session for the configured side
     *
     * @throws SocketError on socket setup failure (before any flow starts)
     */
    SessionResult run() {
        if (config_.side == Side::SERVER) {
            transport::UdpSocket listen = open_listen_socket();
            return run_server(listen);
        }
        return run_client();
    }

    // Server listening socket on bind_host:port
    transport::UdpSocket open_listen_socket() const {
        transport::UdpSocket sock;
        sock.open(socket_config());
        sock.bind(config_.bind_host.c_str(), config_.port);
        printf("[COORD] listening on %s\n", transport::format_address(sock.local_address()).c_str());
        return sock;
    }

    /**
     * Serve one session on an already bound socket
     *
     * Normal mode receives on it. Reverse mode collects HELLOs on it and then
     * sends each registered flow from its own socket to the client.
     */
    SessionResult run_server(transport::UdpSocket& listen) {
        if (config_.role() == Role::RECEIVER) {
            SessionResult result = run_receiver(listen, 0, 0);
            discard_pending(listen);
            return result;
        }

        std::optional<HelloRegistration> reg =
            collect_hellos(listen, config_.hello_timeout_ns, config_.max_flows, stop_);
        if (!reg || reg->flow_ids.empty()) {
            SessionResult empty;
            empty.role = Role::SENDER;
            empty.packet_size = config_.packet_size;
            empty.stopped = stop_requested();
            return empty;
        }

        std::vector<transport::UdpSocket> sockets = open_sender_sockets(reg->client, reg->flow_ids.size());
        SessionResult result = run_senders(sockets, reg->flow_ids);
        discard_pending(listen);
        return result;
    }

    SessionResult run_client() {
        sockaddr_in server = transport::resolve_ipv4(config_.server_host.c_str(), config_.port);

        if (config_.role() == Role::SENDER) {
            std::vector<transport::UdpSocket> sockets = open_sender_sockets(server, config_.num_flows);
            std::vector<uint32_t> flow_ids;
            for (uint32_t i = 0; i < config_.num_flows; i++) flow_ids.push_back(i);
            return run_senders(sockets, flow_ids);
        }

        transport::UdpSocket sock;
        sock.open(socket_config());
        sock.bind("0.0.0.0", 0);
        send_hellos(sock, server, config_.num_flows);
        // The server starts sending once registration closes; silence past
        // that point means no server answered
        int64_t first_timeout = config_.hello_timeout_ns + config_.start_delay_ns + config_.idle_timeout_ns;
        return run_receiver(sock, config_.num_flows, 0, first_timeout);
    }

    // One connected socket per flow
    std::vector<transport::UdpSocket> open_sender_sockets(const sockaddr_in& peer, size_t count) const {
        std::vector<transport::UdpSocket> sockets(count);
        for (auto& sock : sockets) {
            sock.open(socket_config());
            sock.connect(peer);
        }
        printf("[COORD] %zu flow sockets connected to %s\n", count, transport::format_address(peer).c_str());
        return sockets;
    }

    // =====================
    // Sender session
    // =====================

    /**
     * Run one FlowSender per socket, flow_ids[i] on sockets[i]
     *
     * Every thread is started before start_time_ns is chosen, so all flows
     * begin pacing at the same instant.
     */
    SessionResult run_senders(std::vector<transport::UdpSocket>& sockets, const std::vector<uint32_t>& flow_ids) {
        using Sender = FlowSender<ClockPolicy, transport::UdpSocket>;
        size_t n = sockets.size();
        counters_.reset(new FlowCounters[n]);
        num_counters_ = n;

        std::vector<std::unique_ptr<Sender>> senders;
        for (size_t i = 0; i < n; i++) {
            FlowSenderConfig fc;
            fc.flow_id = flow_ids[i];
            fc.target_rate_bps = config_.target_rate_bps();
            fc.packet_size = config_.packet_size;
            fc.eviction_timeout_ns = config_.eviction_timeout_ns;
            fc.drain_grace_ns = config_.drain_grace_ns;
            senders.emplace_back(new Sender(clock_, sockets[i], fc, &counters_[i]));
        }

        std::atomic<size_t> ready{0};
        std::atomic<size_t> finished{0};
        std::atomic<int64_t> start_ns{0};
        int64_t duration_ns = config_.duration_ns();

        std::vector<std::thread> threads;
        for (size_t i = 0; i < n; i++) {
            threads.emplace_back([&, i] {
                ready.fetch_add(1, std::memory_order_release);
                int64_t start;
                while ((start = start_ns.load(std::memory_order_acquire)) == 0) {
                    std::this_thread::yield();
                }
                senders[i]->schedule(start, start + duration_ns);
                senders[i]->run(stop_);
                finished.fetch_add(1, std::memory_order_release);
            });
        }

        while (ready.load(std::memory_order_acquire) < n) {
            std::this_thread::yield();
        }
        int64_t start = clock_.now_ns() + config_.start_delay_ns;
        int64_t end = start + duration_ns;
        start_ns.store(start, std::memory_order_release);

        printf("[COORD] %zu sender flows, %.3f Mbps/flow, %zu-byte packets, %.1fs\n",
               n, config_.bandwidth_mbps, config_.packet_size, config_.duration_s);

        supervise(Role::SENDER, start, end, [&] { return finished.load(std::memory_order_acquire) >= n; });

        for (auto& t : threads) t.join();

        SessionResult result;
        result.role = Role::SENDER;
        result.num_flows = static_cast<uint32_t>(n);
        result.packet_size = config_.packet_size;
        result.start_time_ns = start;
        result.end_time_ns = clock_.now_ns();
        result.stopped = external_stop_;

        std::vector<EventShard> shards;
        for (auto& sender : senders) {
            result.sender_flows.push_back(sender->state());
            shards.push_back(sender->take_events());
        }
        result.events = merge_shards(shards);
        return result;
    }

    // =====================
    // Receiver session
    // =====================

    /**
     * Receive on a bound socket until the session ends
     *
     * @param expected_flows Flow count announced out of band (0 = unknown)
     * @param max_duration_ns Hard limit from now (0 = none)
     * @param first_datagram_timeout_ns End as idle if nothing arrives this long (0 = wait)
     * @throws std::runtime_error if the receive backend cannot be initialized
     */
    SessionResult run_receiver(transport::UdpSocket& socket, uint32_t expected_flows, int64_t max_duration_ns,
                               int64_t first_datagram_timeout_ns = 0) {
        counters_.reset(new FlowCounters[config_.max_flows]);
        num_counters_ = config_.max_flows;

        int64_t start = clock_.now_ns();

        ReceiverOwnerConfig oc;
        oc.max_flows = config_.max_flows;
        oc.expected_flows = expected_flows;
        oc.ack_enabled = config_.ack_enabled;
        oc.idle_timeout_ns = config_.idle_timeout_ns;
        oc.deadline_ns = max_duration_ns > 0 ? start + max_duration_ns : 0;
        oc.first_datagram_timeout_ns = first_datagram_timeout_ns;

        ReceiverSocketOwner<RecvBackend> owner(socket, oc, counters_.get());
        std::atomic<bool> owner_done{false};
        ReceiverExit exit_reason = ReceiverExit::STOPPED;
        std::exception_ptr owner_error;

        std::thread owner_thread([&] {
            try {
                exit_reason = owner.run(stop_);
            } catch (const std::exception& e) {
                fprintf(stderr, "[ERROR] [RECEIVER] socket owner failed: %s\n", e.what());
                owner_error = std::current_exception();
            }
            owner_done.store(true, std::memory_order_release);
        });

        supervise(Role::RECEIVER, start, 0, [&] { return owner_done.load(std::memory_order_acquire); });
        owner_thread.join();

        if (owner_error) {
            std::rethrow_exception(owner_error);
        }

        SessionResult result;
        result.role = Role::RECEIVER;
        result.packet_size = config_.packet_size;
        result.start_time_ns = start;
        result.end_time_ns = clock_.now_ns();
        result.stopped = external_stop_;
        result.receiver_exit = exit_reason;
        result.receiver_stats = owner.stats();
        result.receiver_flows = owner.flow_stats();
        result.num_flows = static_cast<uint32_t>(result.receiver_flows.size());
        result.events = merge_shards(owner.take_shards());
        return result;
    }

private:
    // Wait for done(), raising stop at end_ns (0 = no deadline) and printing
    // progress every report_interval_ms
    template<typename DoneFn>
    void supervise(Role role, int64_t start_ns, int64_t end_ns, DoneFn&& done) {
        external_stop_ = false;
        int64_t interval_ns = static_cast<int64_t>(config_.report_interval_ms) * NS_PER_MS;
        int64_t next_report = start_ns + interval_ns;
        uint64_t last_packets = 0;
        uint64_t last_bytes = 0;
        bool deadline_stop = false;

        while (!done()) {
            int64_t now = clock_.now_ns();

            if (!deadline_stop && stop_requested()) {
                external_stop_ = true;
            }
            if (end_ns > 0 && !deadline_stop && now >= end_ns) {
                deadline_stop = true;
                stop_.store(true, std::memory_order_relaxed);
            }

            if (interval_ns > 0 && now >= next_report) {
                report_progress(role, now - start_ns, interval_ns, &last_packets, &last_bytes);
                next_report += interval_ns;
            }

            int64_t wake = now + SUPERVISE_SLICE_NS;
            if (end_ns > 0 && !deadline_stop && end_ns < wake) wake = end_ns;
            clock_.sleep_until_ns(wake);
        }

        // The session may have ended on a stop raised after the last check
        if (!deadline_stop && stop_requested()) {
            external_stop_ = true;
        }
    }

    void report_progress(Role role, int64_t elapsed_ns, int64_t interval_ns,
                         uint64_t* last_packets, uint64_t* last_bytes) {
        uint64_t packets = 0, bytes = 0, acked = 0, lost = 0;
        for (size_t i = 0; i < num_counters_; i++) {
            const FlowCounters& c = counters_[i];
            lost += c.packets_lost.load(std::memory_order_relaxed);
            if (role == Role::SENDER) {
                uint64_t sent = c.packets_sent.load(std::memory_order_relaxed);
                packets += sent;
                bytes += sent * config_.packet_size;
                acked += c.packets_acked.load(std::memory_order_relaxed);
            } else {
                packets += c.packets_received.load(std::memory_order_relaxed);
                bytes += c.bytes_received.load(std::memory_order_relaxed);
            }
        }

        double secs = static_cast<double>(interval_ns) / NS_PER_SEC;
        double pps = (packets - *last_packets) / secs;
        double mbps = (bytes - *last_bytes) * 8.0 / secs / 1e6;
        *last_packets = packets;
        *last_bytes = bytes;

        if (role == Role::SENDER) {
            printf("[COORD] t=%.1fs sent=%lu acked=%lu lost=%lu | %.0f pkt/s %.2f Mbps\n",
                   static_cast<double>(elapsed_ns) / NS_PER_SEC, packets, acked, lost, pps, mbps);
        } else {
            printf("[COORD] t=%.1fs received=%lu lost=%lu | %.0f pkt/s %.2f Mbps\n",
                   static_cast<double>(elapsed_ns) / NS_PER_SEC, packets, lost, pps, mbps);
        }
        fflush(stdout);
    }

    SessionConfig config_;
    ClockPolicy clock_;
    std::atomic<bool> stop_;
    bool external_stop_ = false;
    std::unique_ptr<FlowCounters[]> counters_;
    size_t num_counters_ = 0;
};

} // namespace udpperf
