// test/unittest/test_flow_sender.cpp
// ACK correlation, eviction and send failure handling in FlowSender

#include "flow/flow_sender.hpp"
#include "flow_mocks.hpp"
#include "test_harness.hpp"
#include <atomic>
#include <cerrno>
#include <variant>

using namespace udpperf;

using Sender = FlowSender<ManualClock, MockDatagramSocket>;

static FlowSenderConfig default_config() {
    FlowSenderConfig cfg;
    cfg.flow_id = 7;
    cfg.target_rate_bps = 10e6;
    cfg.packet_size = 1400;
    cfg.start_time_ns = 0;
    cfg.end_time_ns = NS_PER_SEC;
    cfg.eviction_timeout_ns = NS_PER_SEC;
    cfg.drain_grace_ns = 500 * NS_PER_MS;
    return cfg;
}

template<typename T>
static size_t count_events(const EventShard& events) {
    size_t n = 0;
    for (const auto& ev : events) {
        if (std::holds_alternative<T>(ev)) n++;
    }
    return n;
}

// ============================================================================
// Construction
// ============================================================================

TEST(rejects_non_positive_rate) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    FlowSenderConfig cfg = default_config();
    cfg.target_rate_bps = 0;
    ASSERT_THROWS(Sender(clock, socket, cfg), RateConfigError);
    cfg.target_rate_bps = -1;
    ASSERT_THROWS(Sender(clock, socket, cfg), RateConfigError);
}

TEST(rejects_packet_smaller_than_header) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    FlowSenderConfig cfg = default_config();
    cfg.packet_size = msg::HEADER_LEN - 1;
    ASSERT_THROWS(Sender(clock, socket, cfg), RateConfigError);
    cfg.packet_size = msg::MAX_DATAGRAM_LEN + 1;
    ASSERT_THROWS(Sender(clock, socket, cfg), RateConfigError);
}

// ============================================================================
// ACK correlation
// ============================================================================

TEST(ack_produces_rtt_on_local_clock) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.auto_ack = false;
    FlowCounters counters;
    Sender sender(clock, socket, default_config(), &counters);

    clock.set(1000);
    ASSERT_TRUE(sender.send_next(clock.now_ns()));
    ASSERT_TRUE(sender.on_ack(0, 1000 + 250000));

    const AckEvent* ack = std::get_if<AckEvent>(&sender.events().back());
    ASSERT_TRUE(ack != nullptr);
    ASSERT_EQ(ack->seq, 0u);
    ASSERT_EQ(ack->rtt_ns, 250000);
    ASSERT_EQ(ack->ack_time_ns, 251000);
    ASSERT_EQ(ack->flow_id, 7u);
    ASSERT_EQ(counters.packets_sent.load(), 1u);
    ASSERT_EQ(counters.packets_acked.load(), 1u);
}

TEST(unknown_seq_ack_is_discarded) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    Sender sender(clock, socket, default_config());

    ASSERT_FALSE(sender.on_ack(99, 1000));
    ASSERT_EQ(sender.state().unmatched_acks, 1u);
    ASSERT_EQ(sender.state().packets_acked, 0u);
    ASSERT_TRUE(sender.events().empty());
}

TEST(duplicate_ack_is_discarded) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.auto_ack = false;
    Sender sender(clock, socket, default_config());

    sender.send_next(0);
    ASSERT_TRUE(sender.on_ack(0, 500));
    ASSERT_FALSE(sender.on_ack(0, 600));
    ASSERT_EQ(sender.state().packets_acked, 1u);
    ASSERT_EQ(sender.state().unmatched_acks, 1u);
    ASSERT_EQ(count_events<AckEvent>(sender.events()), 1u);
}

TEST(negative_rtt_is_discarded_and_keeps_pending) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.auto_ack = false;
    Sender sender(clock, socket, default_config());

    clock.set(10000);
    sender.send_next(clock.now_ns());
    ASSERT_FALSE(sender.on_ack(0, 9999));
    ASSERT_EQ(sender.state().unmatched_acks, 1u);
    ASSERT_EQ(sender.state().pending.size(), 1u);

    // A sane ACK for the same seq still matches
    ASSERT_TRUE(sender.on_ack(0, 10000));
    ASSERT_EQ(sender.state().packets_acked, 1u);
}

TEST(poll_acks_reads_socket) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.ack_delay_ns = 2 * NS_PER_MS;
    Sender sender(clock, socket, default_config());

    sender.send_next(0);
    sender.poll_acks();
    ASSERT_EQ(sender.state().packets_acked, 0u);    // Not arrived yet
    ASSERT_EQ(socket.pending_inbound(), 1u);

    clock.set(2 * NS_PER_MS);
    sender.poll_acks();
    ASSERT_EQ(sender.state().packets_acked, 1u);
    const AckEvent* ack = std::get_if<AckEvent>(&sender.events().back());
    ASSERT_TRUE(ack != nullptr);
    ASSERT_EQ(ack->rtt_ns, 2 * NS_PER_MS);
}

TEST(malformed_and_foreign_datagrams_are_counted) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.auto_ack = false;
    Sender sender(clock, socket, default_config());

    sender.send_next(0);
    socket.inject({0x01, 0x02, 0x03}, 0);                          // Truncated
    std::vector<uint8_t> unknown = msg::encode(msg::AckPacket{7, 0, 5});
    unknown[0] = 0x09;
    socket.inject(unknown, 0);                                     // Unknown type
    socket.inject(msg::encode(msg::AckPacket{8, 0, 5}), 0);        // Other flow
    socket.inject(msg::encode(msg::Packet{7, 0, 5}, 100), 0);      // DATA, not ACK

    sender.poll_acks();
    ASSERT_EQ(sender.state().malformed, 2u);
    ASSERT_EQ(sender.state().unmatched_acks, 2u);
    ASSERT_EQ(sender.state().packets_acked, 0u);
    ASSERT_EQ(sender.state().pending.size(), 1u);
}

// ============================================================================
// Eviction
// ============================================================================

TEST(eviction_is_strictly_after_timeout) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.auto_ack = false;
    FlowCounters counters;
    Sender sender(clock, socket, default_config(), &counters);

    sender.send_next(0);
    ASSERT_EQ(sender.evict_expired(NS_PER_SEC), 0u);
    ASSERT_EQ(sender.state().pending.size(), 1u);

    ASSERT_EQ(sender.evict_expired(NS_PER_SEC + 1), 1u);
    ASSERT_TRUE(sender.state().pending.empty());
    ASSERT_EQ(sender.state().packets_evicted, 1u);
    ASSERT_EQ(counters.packets_lost.load(), 1u);

    const LossEvent* loss = std::get_if<LossEvent>(&sender.events().back());
    ASSERT_TRUE(loss != nullptr);
    ASSERT_TRUE(loss->reason == LossReason::EVICTED);
    ASSERT_EQ(loss->seq, 0u);
    ASSERT_EQ(loss->count, 1u);
    ASSERT_EQ(loss->time_ns, NS_PER_SEC + 1);

    // An ACK arriving after eviction does not resurrect the packet
    ASSERT_FALSE(sender.on_ack(0, NS_PER_SEC + 2));
    ASSERT_EQ(sender.state().unmatched_acks, 1u);
    ASSERT_EQ(sender.state().packets_acked, 0u);
}

TEST(eviction_stops_at_first_young_entry) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.auto_ack = false;
    Sender sender(clock, socket, default_config());

    sender.send_next(0);
    sender.send_next(100 * NS_PER_MS);
    sender.send_next(200 * NS_PER_MS);

    ASSERT_EQ(sender.evict_expired(NS_PER_SEC + 150 * NS_PER_MS), 2u);
    ASSERT_EQ(sender.state().pending.size(), 1u);
    ASSERT_EQ(sender.state().pending.begin()->first, 2u);
}

TEST(drain_evicts_everything_still_pending) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.auto_ack = false;
    Sender sender(clock, socket, default_config());

    sender.send_next(0);
    sender.send_next(0);
    sender.send_next(0);
    sender.drain();

    ASSERT_TRUE(sender.state().pending.empty());
    ASSERT_EQ(sender.state().packets_evicted, 3u);
    ASSERT_EQ(count_events<LossEvent>(sender.events()), 3u);
    ASSERT_GE(clock.now_ns(), 500 * NS_PER_MS);
}

TEST(drain_picks_up_late_acks) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.ack_delay_ns = 100 * NS_PER_MS;
    socket.drop_acks_for.insert(1);
    Sender sender(clock, socket, default_config());

    sender.send_next(0);
    sender.send_next(0);
    sender.drain();

    ASSERT_EQ(sender.state().packets_acked, 1u);
    ASSERT_EQ(sender.state().packets_evicted, 1u);
}

// ============================================================================
// Send failures
// ============================================================================

TEST(transient_failure_is_retried_once) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.fail_next_sends = 1;
    socket.fail_errno = ENOBUFS;
    Sender sender(clock, socket, default_config());

    ASSERT_TRUE(sender.send_next(0));
    ASSERT_EQ(socket.send_calls, 2u);
    ASSERT_EQ(sender.state().send_retries, 1u);
    ASSERT_EQ(sender.state().send_failures, 0u);
    ASSERT_EQ(sender.state().packets_sent, 1u);

    // Stamped with the time of the retry
    const SendEvent* send = std::get_if<SendEvent>(&sender.events().back());
    ASSERT_TRUE(send != nullptr);
    ASSERT_EQ(send->send_time_ns, 50 * NS_PER_US);
}

TEST(persistent_failure_does_not_consume_seq) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.auto_ack = false;
    socket.fail_next_sends = 2;
    Sender sender(clock, socket, default_config());

    ASSERT_FALSE(sender.send_next(0));
    ASSERT_EQ(sender.state().send_failures, 1u);
    ASSERT_EQ(sender.state().packets_sent, 0u);
    ASSERT_TRUE(sender.events().empty());

    ASSERT_TRUE(sender.send_next(clock.now_ns()));
    const SendEvent* send = std::get_if<SendEvent>(&sender.events().back());
    ASSERT_TRUE(send != nullptr);
    ASSERT_EQ(send->seq, 0u);
}

TEST(hard_failure_is_not_retried) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    socket.fail_next_sends = 1;
    socket.fail_errno = EPERM;
    Sender sender(clock, socket, default_config());

    ASSERT_FALSE(sender.send_next(0));
    ASSERT_EQ(socket.send_calls, 1u);
    ASSERT_EQ(sender.state().send_retries, 0u);
    ASSERT_EQ(sender.state().send_failures, 1u);
}

TEST(failures_during_run_keep_pacing) {
    ManualClock clock;
    MockDatagramSocket socket(clock);
    FlowSenderConfig cfg = default_config();
    cfg.end_time_ns = 100 * NS_PER_MS;
    cfg.target_rate_bps = 1e6;
    cfg.packet_size = 1000;                // 8ms interval, 13 slots
    socket.fail_next_sends = 4;
    socket.fail_errno = EPERM;
    Sender sender(clock, socket, cfg);

    std::atomic<bool> stop{false};
    sender.run(stop);

    // Four slots lost to failures, the schedule itself is unchanged
    ASSERT_EQ(sender.state().send_failures, 4u);
    ASSERT_EQ(sender.state().packets_sent, 9u);
    ASSERT_EQ(sender.state().packets_acked, 9u);
}

TEST(is_transient_send_error_classification) {
    ASSERT_TRUE(is_transient_send_error(EAGAIN));
    ASSERT_TRUE(is_transient_send_error(ENOBUFS));
    ASSERT_TRUE(is_transient_send_error(EINTR));
    ASSERT_FALSE(is_transient_send_error(EPERM));
    ASSERT_FALSE(is_transient_send_error(ECONNREFUSED));
}

// ============================================================================
// Main
// ============================================================================

int main() {
    return run_all_tests("FlowSender");
}
