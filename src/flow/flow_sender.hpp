// flow/flow_sender.hpp
// Flow Sender - rate-paced DATA emission and ACK correlation for one flow
//
// Policy-based design:
//   ClockPolicy  - now_ns(), sleep_until_ns()          (MonotonicClock, test ManualClock)
//   SocketPolicy - send(), recv_datagram()             (transport::UdpSocket, test mocks)
//
// The socket is connected to the peer; ACKs come back on the same socket.
// One FlowSender runs on one thread and owns all of its state.
//
// Lifecycle:
//   run(stop)
//     pacing loop: sleep until next_send_time -> poll ACKs -> evict -> send
//     drain:       poll ACKs for drain_grace, evict whatever is still pending
//     finalize:    FIN x fin_repeats carrying packets_sent
#pragma once

#include "flow_event.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"
#include "../core/timing.hpp"
#include "../msg/packet_codec.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <sys/types.h>

namespace udpperf {

struct FlowSenderConfig {
    uint32_t flow_id = 0;
    double target_rate_bps = 0;
    size_t packet_size = 1400;
    int64_t start_time_ns = 0;                      // Shared start barrier
    int64_t end_time_ns = 0;                        // start + duration
    int64_t eviction_timeout_ns = 1000 * NS_PER_MS;
    int64_t drain_grace_ns = 500 * NS_PER_MS;
    int64_t retry_backoff_ns = 50 * NS_PER_US;
    int fin_repeats = 3;
};

/**
 * FlowState - everything the sender knows about its flow
 *
 * pending maps seq -> send time. Sequence numbers are assigned in send
 * order, so begin() is always the oldest outstanding packet.
 */
struct FlowState {
    uint32_t flow_id = 0;
    double target_rate_bps = 0;
    uint64_t packets_sent = 0;
    uint64_t packets_acked = 0;
    int64_t last_send_time_ns = 0;
    std::map<uint64_t, int64_t> pending;

    uint64_t packets_evicted = 0;
    uint64_t send_failures = 0;
    uint64_t send_retries = 0;
    uint64_t unmatched_acks = 0;     // Unknown, duplicate, late or negative-RTT ACKs
    uint64_t malformed = 0;          // Undecodable datagrams on the flow socket
};

inline bool is_transient_send_error(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == ENOBUFS || err == EINTR;
}

template<typename ClockPolicy, typename SocketPolicy>
class FlowSender {
public:
    // Longest single sleep, so ACKs are drained and stop is observed regularly
    static constexpr int64_t MAX_SLEEP_SLICE_NS = 50 * NS_PER_MS;
    static constexpr int64_t DRAIN_POLL_NS = 1 * NS_PER_MS;
    static constexpr size_t ACK_BUF_LEN = 2048;

    /**
     * @throws RateConfigError if the rate is not positive or the packet size
     *         cannot hold the header
     */
    FlowSender(ClockPolicy& clock, SocketPolicy& socket, const FlowSenderConfig& config,
               FlowCounters* counters = nullptr)
        : clock_(clock)
        , socket_(socket)
        , config_(config)
        , counters_(counters)
        , interval_ns_(0)
        , next_send_ns_(static_cast<double>(config.start_time_ns))
    {
        if (!(config_.target_rate_bps > 0)) {
            throw RateConfigError("flow " + std::to_string(config_.flow_id) + ": target rate must be positive");
        }
        if (config_.packet_size < msg::HEADER_LEN || config_.packet_size > msg::MAX_DATAGRAM_LEN) {
            throw RateConfigError("flow " + std::to_string(config_.flow_id) + ": packet size " +
                                  std::to_string(config_.packet_size) + " cannot carry the " +
                                  std::to_string(msg::HEADER_LEN) + "-byte header");
        }

        interval_ns_ = static_cast<double>(config_.packet_size) * 8.0 * 1e9 / config_.target_rate_bps;
        state_.flow_id = config_.flow_id;
        state_.target_rate_bps = config_.target_rate_bps;
        tx_buf_.reset(new uint8_t[config_.packet_size]);
    }

    FlowSender(const FlowSender&) = delete;
    FlowSender& operator=(const FlowSender&) = delete;

    // Set the pacing window once the start barrier is known. Call before run().
    void schedule(int64_t start_time_ns, int64_t end_time_ns) {
        config_.start_time_ns = start_time_ns;
        config_.end_time_ns = end_time_ns;
        next_send_ns_ = static_cast<double>(start_time_ns);
    }

    /**
     * Run the flow to completion: pace until end_time_ns or stop, then drain
     * and send FIN. Never throws on I/O errors.
     */
    void run(const std::atomic<bool>& stop) {
        UDPPERF_DEBUG_PRINT("[SENDER] flow %u interval=%.0fns packet_size=%zu\n",
                            config_.flow_id, interval_ns_, config_.packet_size);

        while (!stop.load(std::memory_order_relaxed)) {
            int64_t deadline = next_send_time_ns();
            if (deadline >= config_.end_time_ns) {
                break;
            }

            int64_t now = clock_.now_ns();
            if (now < deadline) {
                int64_t wake = std::min(deadline, now + MAX_SLEEP_SLICE_NS);
                clock_.sleep_until_ns(std::min(wake, config_.end_time_ns));
                poll_acks();
                continue;
            }

            poll_acks();
            evict_expired(now);
            send_next(now);
            next_send_ns_ += interval_ns_;
        }

        drain();
        finalize();
    }

    /**
     * Send the next DATA packet stamped with now_ns
     *
     * A transient failure is retried once after retry_backoff_ns. A send that
     * still fails is counted in send_failures and does not consume a seq.
     *
     * @return true if the packet left
     */
    bool send_next(int64_t now_ns) {
        uint64_t seq = state_.packets_sent;
        ssize_t n = send_data(seq, now_ns);

        if (n < 0 && is_transient_send_error(errno)) {
            state_.send_retries++;
            clock_.sleep_until_ns(now_ns + config_.retry_backoff_ns);
            now_ns = clock_.now_ns();
            n = send_data(seq, now_ns);
        }

        if (n != static_cast<ssize_t>(config_.packet_size)) {
            int err = (n < 0) ? errno : EMSGSIZE;
            state_.send_failures++;
            uint64_t suppressed = 0;
            if (send_log_limiter_.allow(now_ns, &suppressed)) {
                fprintf(stderr, "[WARN] [SENDER] flow %u send seq=%lu failed: %s (%lu similar suppressed)\n",
                        config_.flow_id, seq, strerror(err), suppressed);
            }
            return false;
        }

        state_.pending[seq] = now_ns;
        state_.last_send_time_ns = now_ns;
        state_.packets_sent++;
        events_.push_back(SendEvent{config_.flow_id, seq, now_ns});
        if (counters_) FlowCounters::bump(counters_->packets_sent);
        return true;
    }

    // Drain every datagram queued on the socket without blocking
    void poll_acks() {
        uint8_t buf[ACK_BUF_LEN];
        while (true) {
            int64_t arrival_ns = 0;
            ssize_t n = socket_.recv_datagram(buf, sizeof(buf), &arrival_ns, nullptr);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    return;
                }
                if (errno == EINTR || errno == ECONNREFUSED) {
                    // ICMP port unreachable is reported once per error; keep draining
                    continue;
                }
                uint64_t suppressed = 0;
                if (recv_log_limiter_.allow(clock_.now_ns(), &suppressed)) {
                    fprintf(stderr, "[WARN] [SENDER] flow %u recv failed: %s\n",
                            config_.flow_id, strerror(errno));
                }
                return;
            }

            msg::ParseResult parsed = msg::decode(buf, static_cast<size_t>(n));
            if (!parsed.valid) {
                state_.malformed++;
                UDPPERF_DEBUG_PRINT("[SENDER] flow %u dropped %s datagram (%zd bytes)\n",
                                    config_.flow_id, decode_error_name(parsed.error), n);
                continue;
            }
            if (parsed.type != msg::PacketType::ACK || parsed.flow_id != config_.flow_id) {
                state_.unmatched_acks++;
                continue;
            }
            on_ack(parsed.seq, arrival_ns);
        }
    }

    /**
     * Correlate an ACK with its pending send
     *
     * ack_arrival_ns is the local arrival time. Unknown, already-acked and
     * evicted seqs, and ACKs that would give a negative RTT, are discarded.
     *
     * @return true if an AckEvent was emitted
     */
    bool on_ack(uint64_t seq, int64_t ack_arrival_ns) {
        auto it = state_.pending.find(seq);
        if (it == state_.pending.end()) {
            state_.unmatched_acks++;
            return false;
        }

        int64_t rtt_ns = ack_arrival_ns - it->second;
        if (rtt_ns < 0) {
            state_.unmatched_acks++;
            return false;
        }

        state_.pending.erase(it);
        state_.packets_acked++;
        events_.push_back(AckEvent{config_.flow_id, seq, ack_arrival_ns, rtt_ns});
        if (counters_) FlowCounters::bump(counters_->packets_acked);
        return true;
    }

    // Evict pending entries older than eviction_timeout_ns, one LossEvent each
    size_t evict_expired(int64_t now_ns) {
        size_t evicted = 0;
        while (!state_.pending.empty()) {
            auto oldest = state_.pending.begin();
            if (now_ns - oldest->second <= config_.eviction_timeout_ns) {
                break;
            }
            evict(oldest, now_ns);
            evicted++;
        }
        return evicted;
    }

    // Poll for late ACKs until the grace period ends, then evict the rest
    void drain() {
        int64_t now = clock_.now_ns();
        int64_t drain_end = now + config_.drain_grace_ns;

        poll_acks();
        while (!state_.pending.empty() && now < drain_end) {
            clock_.sleep_until_ns(std::min(now + DRAIN_POLL_NS, drain_end));
            poll_acks();
            now = clock_.now_ns();
            evict_expired(now);
        }

        now = clock_.now_ns();
        while (!state_.pending.empty()) {
            evict(state_.pending.begin(), now);
        }
    }

    // FIN is fire-and-forget; the receiver also ends on its idle timeout
    void finalize() {
        uint8_t fin_buf[msg::HEADER_LEN];
        msg::FinPacket fin{config_.flow_id, state_.packets_sent, clock_.now_ns()};
        size_t len = msg::encode_fin(fin_buf, sizeof(fin_buf), fin);

        for (int i = 0; i < config_.fin_repeats; i++) {
            if (socket_.send(fin_buf, len) < 0) {
                UDPPERF_DEBUG_PRINT("[SENDER] flow %u FIN send failed: %s\n", config_.flow_id, strerror(errno));
            }
        }

        printf("[SENDER] flow %u done: sent=%lu acked=%lu evicted=%lu failures=%lu unmatched_acks=%lu\n",
               config_.flow_id, state_.packets_sent, state_.packets_acked, state_.packets_evicted,
               state_.send_failures, state_.unmatched_acks);
    }

    // =====================
    // Accessors
    // =====================

    const FlowState& state() const { return state_; }
    const EventShard& events() const { return events_; }
    EventShard take_events() { return std::move(events_); }

    // Absolute deadline of the next send (accumulator, rounded down)
    int64_t next_send_time_ns() const {
        return static_cast<int64_t>(next_send_ns_);
    }

    double interval_ns() const { return interval_ns_; }

private:
    ssize_t send_data(uint64_t seq, int64_t now_ns) {
        msg::Packet pkt{config_.flow_id, seq, now_ns};
        size_t len = msg::encode_data(tx_buf_.get(), config_.packet_size, pkt, config_.packet_size);
        return socket_.send(tx_buf_.get(), len);
    }

    void evict(std::map<uint64_t, int64_t>::iterator it, int64_t now_ns) {
        events_.push_back(LossEvent{config_.flow_id, it->first, 1, now_ns, LossReason::EVICTED});
        state_.pending.erase(it);
        state_.packets_evicted++;
        if (counters_) FlowCounters::bump(counters_->packets_lost);
    }

    ClockPolicy& clock_;
    SocketPolicy& socket_;
    FlowSenderConfig config_;
    FlowCounters* counters_;

    double interval_ns_;        // packet_size * 8 * 1e9 / target_rate_bps
    double next_send_ns_;       // Accumulator, never re-based on wake-up time
    FlowState state_;
    EventShard events_;
    std::unique_ptr<uint8_t[]> tx_buf_;

    LogRateLimiter send_log_limiter_;
    LogRateLimiter recv_log_limiter_;
};

} // namespace udpperf
