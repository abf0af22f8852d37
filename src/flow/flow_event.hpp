// flow/flow_event.hpp
// Per-packet event records, per-flow event shards and live counters
//
// Every flow appends to its own EventShard (single writer, no locks).
// The coordinator merges shards only after all flow threads are joined.
#pragma once

#include "../core/spsc_queue.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>

namespace udpperf {

enum class LossReason : uint8_t {
    GAP = 0,        // Receiver saw a sequence gap (or FIN reported unreceived tail)
    EVICTED = 1     // Sender gave up waiting for the ACK
};

inline const char* loss_reason_name(LossReason reason) {
    return reason == LossReason::GAP ? "gap" : "evicted";
}

struct SendEvent {
    uint32_t flow_id = 0;
    uint64_t seq = 0;
    int64_t send_time_ns = 0;
};

struct RecvEvent {
    uint32_t flow_id = 0;
    uint64_t seq = 0;
    int64_t recv_time_ns = 0;
    std::optional<int64_t> inter_packet_delay_ns;   // nullopt for the first packet
    int64_t send_time_ns = 0;                       // Peer clock, from the DATA header
    uint32_t bytes = 0;
    bool reordered = false;                         // Filled a previously reported gap
};

struct AckEvent {
    uint32_t flow_id = 0;
    uint64_t seq = 0;
    int64_t ack_time_ns = 0;
    int64_t rtt_ns = 0;
};

// count consecutive sequence numbers starting at seq
struct LossEvent {
    uint32_t flow_id = 0;
    uint64_t seq = 0;
    uint64_t count = 0;
    int64_t time_ns = 0;
    LossReason reason = LossReason::GAP;
};

using FlowEvent = std::variant<SendEvent, RecvEvent, AckEvent, LossEvent>;
using EventShard = std::vector<FlowEvent>;

inline int64_t event_time_ns(const FlowEvent& ev) {
    return std::visit([](const auto& e) -> int64_t {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SendEvent>) return e.send_time_ns;
        else if constexpr (std::is_same_v<T, RecvEvent>) return e.recv_time_ns;
        else if constexpr (std::is_same_v<T, AckEvent>) return e.ack_time_ns;
        else return e.time_ns;
    }, ev);
}

inline uint32_t event_flow_id(const FlowEvent& ev) {
    return std::visit([](const auto& e) -> uint32_t { return e.flow_id; }, ev);
}

/**
 * Merge per-flow shards into one stream ordered by event time
 *
 * Each shard is already in emission order. Ties are broken by shard index,
 * then by position within the shard, so the merge is stable.
 */
inline std::vector<FlowEvent> merge_shards(const std::vector<EventShard>& shards) {
    size_t total = 0;
    for (const auto& shard : shards) total += shard.size();

    std::vector<FlowEvent> merged;
    merged.reserve(total);

    // (time, shard index, position) - smallest on top
    using Cursor = std::tuple<int64_t, size_t, size_t>;
    std::priority_queue<Cursor, std::vector<Cursor>, std::greater<Cursor>> heap;

    for (size_t i = 0; i < shards.size(); i++) {
        if (!shards[i].empty()) {
            heap.emplace(event_time_ns(shards[i][0]), i, 0);
        }
    }

    while (!heap.empty()) {
        auto [time_ns, shard_idx, pos] = heap.top();
        (void)time_ns;
        heap.pop();

        const EventShard& shard = shards[shard_idx];
        merged.push_back(shard[pos]);
        if (pos + 1 < shard.size()) {
            heap.emplace(event_time_ns(shard[pos + 1]), shard_idx, pos + 1);
        }
    }
    return merged;
}

/**
 * FlowCounters - live per-flow counters for progress reporting
 *
 * Single writer (the flow's own thread), any number of relaxed readers.
 * Cache-line aligned so neighbouring flows do not share a line.
 */
struct alignas(CACHE_LINE_SIZE) FlowCounters {
    std::atomic<uint64_t> packets_sent{0};
    std::atomic<uint64_t> packets_acked{0};
    std::atomic<uint64_t> packets_received{0};
    std::atomic<uint64_t> bytes_received{0};
    std::atomic<uint64_t> packets_lost{0};      // Net of late gap fills

    // Single-writer increment: no read-modify-write needed
    static void bump(std::atomic<uint64_t>& counter, uint64_t n = 1) {
        counter.store(counter.load(std::memory_order_relaxed) + n, std::memory_order_relaxed);
    }

    static void unbump(std::atomic<uint64_t>& counter, uint64_t n = 1) {
        counter.store(counter.load(std::memory_order_relaxed) - n, std::memory_order_relaxed);
    }
};

} // namespace udpperf
