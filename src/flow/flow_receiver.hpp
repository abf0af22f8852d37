// flow/flow_receiver.hpp
// Flow Receiver - shared-socket owner, per-flow workers and per-flow receive state
//
// Threading:
//   ReceiverSocketOwner  - the only thread touching the socket. Receives through
//                          the RecvBackend, decodes, ACKs immediately and hands
//                          each datagram to its flow's worker.
//   FlowReceiverWorker   - one thread per flow id, created on first sight.
//                          Consumes its SpscQueue and drives a FlowReceiver.
//   FlowReceiver         - single-threaded sequence/IPD/gap state, no locks.
//
//   socket -> [owner: decode, ACK] -> SpscQueue<ReceivedDatagram> -> [worker: FlowReceiver]
#pragma once

#include "flow_event.hpp"
#include "../core/log.hpp"
#include "../core/spsc_queue.hpp"
#include "../core/timing.hpp"
#include "../msg/packet_codec.hpp"
#include "../policy/recv_backend.hpp"
#include "../transport/udp_socket.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <map>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace udpperf {

// A jump this far past the highest seq is treated as a corrupt header
constexpr uint64_t MAX_SEQ_JUMP = 1ULL << 24;

struct FlowReceiverStats {
    uint64_t packets_received = 0;
    uint64_t bytes_received = 0;
    uint64_t duplicates = 0;
    uint64_t reordered = 0;
    uint64_t gap_lost = 0;          // Net: reported gaps minus late fills
    uint64_t malformed = 0;
    uint64_t total_sent = 0;        // From FIN, 0 until then
    bool finished = false;
};

/**
 * FlowReceiver - receive-side state of one flow
 *
 * Missing sequence ranges are kept as [first, last) so a late packet can be
 * matched against the gap it fills. Gap loss is reported the moment the gap
 * is seen; a late fill is reported as reordered and cancels its share.
 */
class FlowReceiver {
public:
    explicit FlowReceiver(uint32_t flow_id, FlowCounters* counters = nullptr)
        : flow_id_(flow_id)
        , counters_(counters)
        , started_(false)
        , highest_seq_(0)
        , prev_recv_ns_(0)
    {}

    /**
     * Account one DATA packet
     *
     * @return true if a RecvEvent was recorded (false for duplicates and
     *         implausible sequence jumps)
     */
    bool on_data(uint64_t seq, int64_t send_time_ns, int64_t recv_time_ns, uint32_t bytes) {
        bool reordered = false;

        if (!started_) {
            if (seq > MAX_SEQ_JUMP) {
                stats_.malformed++;
                return false;
            }
            if (seq > 0) {
                record_gap(0, seq, recv_time_ns);
            }
            started_ = true;
            highest_seq_ = seq;
        } else if (seq > highest_seq_) {
            if (seq - highest_seq_ > MAX_SEQ_JUMP) {
                stats_.malformed++;
                return false;
            }
            if (seq > highest_seq_ + 1) {
                record_gap(highest_seq_ + 1, seq, recv_time_ns);
            }
            highest_seq_ = seq;
        } else {
            if (!fill_gap(seq)) {
                stats_.duplicates++;
                return false;
            }
            reordered = true;
        }

        RecvEvent ev;
        ev.flow_id = flow_id_;
        ev.seq = seq;
        ev.recv_time_ns = recv_time_ns;
        if (stats_.packets_received > 0) {
            ev.inter_packet_delay_ns = recv_time_ns - prev_recv_ns_;
        }
        ev.send_time_ns = send_time_ns;
        ev.bytes = bytes;
        ev.reordered = reordered;
        events_.push_back(ev);

        prev_recv_ns_ = recv_time_ns;
        stats_.packets_received++;
        stats_.bytes_received += bytes;
        if (reordered) stats_.reordered++;
        if (counters_) {
            FlowCounters::bump(counters_->packets_received);
            FlowCounters::bump(counters_->bytes_received, bytes);
        }
        return true;
    }

    // FIN carries the sender's total; the unreceived tail becomes gap loss
    void on_fin(uint64_t total_sent, int64_t now_ns) {
        if (stats_.finished) {
            return;
        }
        stats_.finished = true;
        stats_.total_sent = total_sent;

        uint64_t next = started_ ? highest_seq_ + 1 : 0;
        if (total_sent > next && total_sent - next <= MAX_SEQ_JUMP) {
            record_gap(next, total_sent, now_ns);
            started_ = true;
            highest_seq_ = total_sent - 1;
        }
    }

    uint32_t flow_id() const { return flow_id_; }
    bool finished() const { return stats_.finished; }
    uint64_t highest_seq() const { return highest_seq_; }
    size_t missing_ranges() const { return missing_.size(); }
    const FlowReceiverStats& stats() const { return stats_; }
    const EventShard& events() const { return events_; }
    EventShard take_events() { return std::move(events_); }

private:
    void record_gap(uint64_t first, uint64_t last, int64_t now_ns) {
        uint64_t count = last - first;
        missing_[first] = last;
        stats_.gap_lost += count;
        events_.push_back(LossEvent{flow_id_, first, count, now_ns, LossReason::GAP});
        if (counters_) FlowCounters::bump(counters_->packets_lost, count);
    }

    // Remove seq from the missing ranges. Returns false if it was not missing.
    bool fill_gap(uint64_t seq) {
        auto it = missing_.upper_bound(seq);
        if (it == missing_.begin()) {
            return false;
        }
        --it;
        uint64_t first = it->first;
        uint64_t last = it->second;
        if (seq >= last) {
            return false;
        }

        missing_.erase(it);
        if (first < seq) missing_[first] = seq;
        if (seq + 1 < last) missing_[seq + 1] = last;

        stats_.gap_lost--;
        if (counters_) FlowCounters::unbump(counters_->packets_lost);
        return true;
    }

    uint32_t flow_id_;
    FlowCounters* counters_;
    bool started_;
    uint64_t highest_seq_;
    int64_t prev_recv_ns_;
    std::map<uint64_t, uint64_t> missing_;   // first -> last (exclusive)
    FlowReceiverStats stats_;
    EventShard events_;
};

// Socket owner -> worker hand-off item
struct ReceivedDatagram {
    msg::PacketType type;
    uint64_t seq;               // DATA: seq, FIN: total sent
    int64_t timestamp_ns;       // Sender clock from the header
    int64_t recv_time_ns;       // Local arrival time
    uint32_t bytes;
};

/**
 * FlowReceiverWorker - thread + queue driving one FlowReceiver
 *
 * push() is called by the socket owner only; the worker thread is the only
 * consumer. finish() lets the worker drain its queue, then joins it.
 */
class FlowReceiverWorker {
public:
    static constexpr size_t QUEUE_CAPACITY = 4096;
    static constexpr int IDLE_SPINS = 64;

    FlowReceiverWorker(uint32_t flow_id, FlowCounters* counters)
        : receiver_(flow_id, counters)
        , done_(false)
    {}

    ~FlowReceiverWorker() {
        finish();
    }

    FlowReceiverWorker(const FlowReceiverWorker&) = delete;
    FlowReceiverWorker& operator=(const FlowReceiverWorker&) = delete;

    void start() {
        thread_ = std::thread([this] { loop(); });
    }

    // Blocks (yielding) while the queue is full; datagrams are never dropped here
    void push(const ReceivedDatagram& item) {
        while (!queue_.try_push(item)) {
            std::this_thread::yield();
        }
    }

    void finish() {
        done_.store(true, std::memory_order_release);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    // Only valid after finish()
    FlowReceiver& receiver() { return receiver_; }

private:
    void loop() {
        ReceivedDatagram item;
        int idle = 0;
        while (true) {
            if (queue_.try_pop(item)) {
                idle = 0;
                handle(item);
                continue;
            }
            if (done_.load(std::memory_order_acquire)) {
                // Producer has stopped; anything pushed before done_ is visible now
                while (queue_.try_pop(item)) {
                    handle(item);
                }
                return;
            }
            if (++idle < IDLE_SPINS) {
                std::this_thread::yield();
            } else {
                std::this_thread::sleep_for(std::chrono::microseconds(50));
            }
        }
    }

    void handle(const ReceivedDatagram& item) {
        if (item.type == msg::PacketType::FIN) {
            receiver_.on_fin(item.seq, item.recv_time_ns);
        } else {
            receiver_.on_data(item.seq, item.timestamp_ns, item.recv_time_ns, item.bytes);
        }
    }

    FlowReceiver receiver_;
    SpscQueue<ReceivedDatagram, QUEUE_CAPACITY> queue_;
    std::atomic<bool> done_;
    std::thread thread_;
};

struct ReceiverOwnerConfig {
    uint32_t max_flows = 1024;
    uint32_t expected_flows = 0;        // 0 = unknown, end when every seen flow sent FIN
    bool ack_enabled = true;
    int64_t idle_timeout_ns = 3000 * NS_PER_MS;
    int64_t deadline_ns = 0;            // Absolute end, 0 = none
    int64_t first_datagram_timeout_ns = 0;  // Give up if nothing arrives this long after start, 0 = wait
    int wait_timeout_ms = 50;
};

// Socket-level counters (the owner's own state)
struct ReceiverOwnerStats {
    uint64_t datagrams = 0;
    uint64_t malformed = 0;         // Undecodable, truncated or flow id out of range
    uint64_t ignored = 0;           // Valid but unexpected type (ACK, stray HELLO)
    uint64_t acks_sent = 0;
    uint64_t ack_failures = 0;
    uint64_t recv_errors = 0;
    uint32_t flows_seen = 0;
    uint32_t fins_seen = 0;
};

enum class ReceiverExit { STOPPED, DEADLINE, ALL_FINISHED, IDLE };

inline const char* receiver_exit_name(ReceiverExit reason) {
    switch (reason) {
        case ReceiverExit::STOPPED: return "stopped";
        case ReceiverExit::DEADLINE: return "deadline";
        case ReceiverExit::ALL_FINISHED: return "all flows finished";
        case ReceiverExit::IDLE: return "idle timeout";
    }
    return "unknown";
}

/**
 * ReceiverSocketOwner - owns one bound UDP socket shared by all flows
 *
 * Template parameters:
 *   RecvBackend  - recv_backends::EpollRecvBackend<> or IoUringRecvBackend
 *   SocketPolicy - provides get_fd() and send_to() for ACKs
 *
 * counters must point to max_flows FlowCounters owned by the caller, so a
 * progress reporter can read them while flows are still appearing.
 */
template<typename RecvBackend, typename SocketPolicy = transport::UdpSocket>
class ReceiverSocketOwner {
public:
    ReceiverSocketOwner(SocketPolicy& socket, const ReceiverOwnerConfig& config, FlowCounters* counters)
        : socket_(socket)
        , config_(config)
        , counters_(counters)
        , workers_(config.max_flows)
        , fin_seen_(config.max_flows, false)
    {}

    ReceiverSocketOwner(const ReceiverSocketOwner&) = delete;
    ReceiverSocketOwner& operator=(const ReceiverSocketOwner&) = delete;

    /**
     * Receive until stop, deadline, all flows finished or idle timeout
     *
     * Idle is measured from the last datagram, or from the start of run()
     * when first_datagram_timeout_ns is set and nothing has arrived yet.
     *
     * Workers are joined before returning.
     *
     * @throws std::runtime_error if the backend cannot be initialized
     */
    ReceiverExit run(const std::atomic<bool>& stop) {
        backend_.init(socket_.get_fd(), config_.wait_timeout_ms);
        printf("[RECEIVER] socket owner started (backend=%s, max_flows=%u)\n",
               RecvBackend::name(), config_.max_flows);

        ReceiverExit reason = ReceiverExit::STOPPED;
        int64_t start_ns = monotonic_ns();
        int64_t last_rx_ns = 0;

        while (!stop.load(std::memory_order_relaxed)) {
            int n = backend_.poll([this](const recv_backends::RecvDatagram& dgram) {
                handle(dgram);
            });
            int64_t now = monotonic_ns();

            if (n < 0) {
                stats_.recv_errors++;
                uint64_t suppressed = 0;
                if (recv_log_limiter_.allow(now, &suppressed)) {
                    fprintf(stderr, "[WARN] [RECEIVER] receive failed: %s (%lu similar suppressed)\n",
                            strerror(errno), suppressed);
                }
            } else if (n > 0) {
                last_rx_ns = now;
            }

            if (config_.deadline_ns > 0 && now >= config_.deadline_ns) {
                reason = ReceiverExit::DEADLINE;
                break;
            }
            if (all_finished()) {
                reason = ReceiverExit::ALL_FINISHED;
                break;
            }
            if (last_rx_ns > 0 && now - last_rx_ns >= config_.idle_timeout_ns) {
                reason = ReceiverExit::IDLE;
                break;
            }
            if (last_rx_ns == 0 && config_.first_datagram_timeout_ns > 0 &&
                now - start_ns >= config_.first_datagram_timeout_ns) {
                fprintf(stderr, "[WARN] [RECEIVER] no datagram within %.1fs of start\n",
                        static_cast<double>(config_.first_datagram_timeout_ns) / NS_PER_SEC);
                reason = ReceiverExit::IDLE;
                break;
            }
        }

        for (auto& worker : workers_) {
            if (worker) worker->finish();
        }

        printf("[RECEIVER] socket owner exit (%s): datagrams=%lu flows=%u fins=%u malformed=%lu acks=%lu\n",
               receiver_exit_name(reason), stats_.datagrams, stats_.flows_seen, stats_.fins_seen,
               stats_.malformed, stats_.acks_sent);
        return reason;
    }

    // Per-flow event shards in flow id order. Only valid after run().
    std::vector<EventShard> take_shards() {
        std::vector<EventShard> shards;
        for (auto& worker : workers_) {
            if (worker) shards.push_back(worker->receiver().take_events());
        }
        return shards;
    }

    // Per-flow receive stats in flow id order. Only valid after run().
    std::vector<FlowReceiverStats> flow_stats() {
        std::vector<FlowReceiverStats> out;
        for (auto& worker : workers_) {
            if (worker) out.push_back(worker->receiver().stats());
        }
        return out;
    }

    const ReceiverOwnerStats& stats() const { return stats_; }

private:
    void handle(const recv_backends::RecvDatagram& dgram) {
        stats_.datagrams++;

        msg::ParseResult parsed = msg::decode(dgram.data, dgram.len);
        if (!parsed.valid || dgram.truncated) {
            drop_malformed(dgram, parsed.valid ? "truncated by receive buffer" : decode_error_name(parsed.error));
            return;
        }

        switch (parsed.type) {
            case msg::PacketType::DATA:
            case msg::PacketType::FIN:
                break;
            default:
                stats_.ignored++;
                UDPPERF_DEBUG_PRINT("[RECEIVER] ignoring %s from %s\n",
                                    msg::packet_type_name(parsed.type),
                                    transport::format_address(dgram.src).c_str());
                return;
        }

        if (parsed.flow_id >= config_.max_flows) {
            drop_malformed(dgram, "flow id out of range");
            return;
        }

        if (parsed.type == msg::PacketType::DATA && config_.ack_enabled) {
            send_ack(parsed, dgram);
        }

        FlowReceiverWorker* worker = get_worker(parsed.flow_id);
        if (parsed.type == msg::PacketType::FIN && !fin_seen_[parsed.flow_id]) {
            fin_seen_[parsed.flow_id] = true;
            stats_.fins_seen++;
        }

        ReceivedDatagram item;
        item.type = parsed.type;
        item.seq = parsed.seq;
        item.timestamp_ns = parsed.timestamp_ns;
        item.recv_time_ns = dgram.recv_time_ns;
        item.bytes = static_cast<uint32_t>(dgram.len);
        worker->push(item);
    }

    // Fire-and-forget ACK to the datagram's source, stamped with its arrival time
    void send_ack(const msg::ParseResult& parsed, const recv_backends::RecvDatagram& dgram) {
        uint8_t ack_buf[msg::HEADER_LEN];
        msg::AckPacket ack{parsed.flow_id, parsed.seq, dgram.recv_time_ns};
        size_t len = msg::encode_ack(ack_buf, sizeof(ack_buf), ack);

        if (socket_.send_to(ack_buf, len, dgram.src) < 0) {
            stats_.ack_failures++;
            uint64_t suppressed = 0;
            if (ack_log_limiter_.allow(dgram.recv_time_ns, &suppressed)) {
                fprintf(stderr, "[WARN] [RECEIVER] ACK to %s failed: %s (%lu similar suppressed)\n",
                        transport::format_address(dgram.src).c_str(), strerror(errno), suppressed);
            }
            return;
        }
        stats_.acks_sent++;
    }

    void drop_malformed(const recv_backends::RecvDatagram& dgram, const char* why) {
        stats_.malformed++;
        uint64_t suppressed = 0;
        if (malformed_log_limiter_.allow(dgram.recv_time_ns, &suppressed)) {
            fprintf(stderr, "[WARN] [RECEIVER] dropped %zu-byte datagram from %s: %s (%lu similar suppressed)\n",
                    dgram.len, transport::format_address(dgram.src).c_str(), why, suppressed);
        }
    }

    FlowReceiverWorker* get_worker(uint32_t flow_id) {
        auto& slot = workers_[flow_id];
        if (!slot) {
            slot.reset(new FlowReceiverWorker(flow_id, counters_ ? &counters_[flow_id] : nullptr));
            slot->start();
            stats_.flows_seen++;
            printf("[RECEIVER] flow %u started\n", flow_id);
        }
        return slot.get();
    }

    bool all_finished() const {
        if (stats_.flows_seen == 0 || stats_.fins_seen < stats_.flows_seen) {
            return false;
        }
        return config_.expected_flows == 0 || stats_.fins_seen >= config_.expected_flows;
    }

    SocketPolicy& socket_;
    ReceiverOwnerConfig config_;
    FlowCounters* counters_;
    RecvBackend backend_;
    std::vector<std::unique_ptr<FlowReceiverWorker>> workers_;
    std::vector<bool> fin_seen_;
    ReceiverOwnerStats stats_;

    LogRateLimiter recv_log_limiter_;
    LogRateLimiter ack_log_limiter_;
    LogRateLimiter malformed_log_limiter_;
};

} // namespace udpperf
