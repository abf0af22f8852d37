// test/unittest/test_flow_receiver.cpp
// Sequence tracking, gap accounting and worker hand-off for the receive side

#include "flow/flow_receiver.hpp"
#include "test_harness.hpp"
#include <variant>

using namespace udpperf;

static const RecvEvent* last_recv(const FlowReceiver& rx) {
    for (auto it = rx.events().rbegin(); it != rx.events().rend(); ++it) {
        if (const RecvEvent* ev = std::get_if<RecvEvent>(&*it)) return ev;
    }
    return nullptr;
}

static const LossEvent* last_loss(const FlowReceiver& rx) {
    for (auto it = rx.events().rbegin(); it != rx.events().rend(); ++it) {
        if (const LossEvent* ev = std::get_if<LossEvent>(&*it)) return ev;
    }
    return nullptr;
}

// ============================================================================
// In-order delivery
// ============================================================================

TEST(first_packet_has_no_inter_packet_delay) {
    FlowReceiver rx(3);
    ASSERT_TRUE(rx.on_data(0, 100, 1000, 1400));

    const RecvEvent* ev = last_recv(rx);
    ASSERT_TRUE(ev != nullptr);
    ASSERT_FALSE(ev->inter_packet_delay_ns.has_value());
    ASSERT_EQ(ev->flow_id, 3u);
    ASSERT_EQ(ev->send_time_ns, 100);
    ASSERT_EQ(ev->bytes, 1400u);
    ASSERT_FALSE(ev->reordered);
}

TEST(inter_packet_delay_uses_local_arrivals) {
    FlowReceiver rx(0);
    rx.on_data(0, 0, 1000, 100);
    rx.on_data(1, 10, 1250, 100);
    rx.on_data(2, 20, 1300, 100);

    const RecvEvent* ev = last_recv(rx);
    ASSERT_TRUE(ev->inter_packet_delay_ns.has_value());
    ASSERT_EQ(*ev->inter_packet_delay_ns, 50);
    ASSERT_EQ(rx.stats().packets_received, 3u);
    ASSERT_EQ(rx.stats().bytes_received, 300u);
    ASSERT_EQ(rx.stats().gap_lost, 0u);
    ASSERT_EQ(rx.highest_seq(), 2u);
}

TEST(counters_follow_receives) {
    FlowCounters counters;
    FlowReceiver rx(0, &counters);
    rx.on_data(0, 0, 10, 500);
    rx.on_data(3, 0, 20, 500);
    ASSERT_EQ(counters.packets_received.load(), 2u);
    ASSERT_EQ(counters.bytes_received.load(), 1000u);
    ASSERT_EQ(counters.packets_lost.load(), 2u);
}

TEST(live_loss_counter_is_net_of_late_fills) {
    FlowCounters counters;
    FlowReceiver rx(0, &counters);
    rx.on_data(0, 0, 10, 100);
    rx.on_data(4, 0, 20, 100);      // 1, 2, 3 missing
    ASSERT_EQ(counters.packets_lost.load(), 3u);

    rx.on_data(2, 0, 30, 100);
    rx.on_data(1, 0, 40, 100);
    ASSERT_EQ(counters.packets_lost.load(), 1u);
    ASSERT_EQ(counters.packets_lost.load(), rx.stats().gap_lost);

    rx.on_data(2, 0, 50, 100);      // Duplicate: no change
    ASSERT_EQ(counters.packets_lost.load(), 1u);
}

// ============================================================================
// Gaps and reordering
// ============================================================================

TEST(initial_gap_is_reported) {
    FlowReceiver rx(0);
    rx.on_data(4, 0, 1000, 100);

    const LossEvent* loss = last_loss(rx);
    ASSERT_TRUE(loss != nullptr);
    ASSERT_EQ(loss->seq, 0u);
    ASSERT_EQ(loss->count, 4u);
    ASSERT_TRUE(loss->reason == LossReason::GAP);
    ASSERT_EQ(rx.stats().gap_lost, 4u);
    ASSERT_EQ(rx.missing_ranges(), 1u);
}

TEST(gap_fill_is_reordered_and_cancels_loss) {
    FlowReceiver rx(0);
    rx.on_data(0, 0, 100, 100);
    rx.on_data(2, 0, 200, 100);
    ASSERT_EQ(rx.stats().gap_lost, 1u);

    ASSERT_TRUE(rx.on_data(1, 0, 300, 100));
    const RecvEvent* ev = last_recv(rx);
    ASSERT_TRUE(ev->reordered);
    ASSERT_EQ(ev->seq, 1u);
    ASSERT_EQ(rx.stats().gap_lost, 0u);
    ASSERT_EQ(rx.stats().reordered, 1u);
    ASSERT_EQ(rx.missing_ranges(), 0u);
    ASSERT_EQ(rx.highest_seq(), 2u);
}

TEST(swapped_pair_is_one_reorder) {
    FlowReceiver rx(0);
    rx.on_data(0, 0, 100, 100);
    rx.on_data(1, 0, 200, 100);
    rx.on_data(2, 0, 300, 100);
    rx.on_data(3, 0, 400, 100);
    rx.on_data(5, 0, 500, 100);
    rx.on_data(4, 0, 600, 100);

    ASSERT_EQ(rx.stats().packets_received, 6u);
    ASSERT_EQ(rx.stats().reordered, 1u);
    ASSERT_EQ(rx.stats().gap_lost, 0u);
    ASSERT_EQ(rx.stats().duplicates, 0u);
}

TEST(duplicate_is_not_recorded) {
    FlowReceiver rx(0);
    rx.on_data(0, 0, 100, 100);
    rx.on_data(1, 0, 200, 100);
    size_t events = rx.events().size();

    ASSERT_FALSE(rx.on_data(1, 0, 300, 100));
    ASSERT_FALSE(rx.on_data(0, 0, 400, 100));
    ASSERT_EQ(rx.stats().duplicates, 2u);
    ASSERT_EQ(rx.stats().packets_received, 2u);
    ASSERT_EQ(rx.events().size(), events);
}

TEST(duplicate_of_filled_gap_is_not_recorded) {
    FlowReceiver rx(0);
    rx.on_data(0, 0, 100, 100);
    rx.on_data(2, 0, 200, 100);
    ASSERT_TRUE(rx.on_data(1, 0, 300, 100));
    ASSERT_FALSE(rx.on_data(1, 0, 400, 100));
    ASSERT_EQ(rx.stats().duplicates, 1u);
    ASSERT_EQ(rx.stats().reordered, 1u);
}

TEST(fill_in_middle_splits_range) {
    FlowReceiver rx(0);
    rx.on_data(0, 0, 100, 100);
    rx.on_data(10, 0, 200, 100);            // Missing [1, 10)
    ASSERT_EQ(rx.stats().gap_lost, 9u);
    ASSERT_EQ(rx.missing_ranges(), 1u);

    rx.on_data(5, 0, 300, 100);             // Missing [1, 5) and [6, 10)
    ASSERT_EQ(rx.missing_ranges(), 2u);
    ASSERT_EQ(rx.stats().gap_lost, 8u);

    rx.on_data(1, 0, 400, 100);             // Missing [2, 5) and [6, 10)
    rx.on_data(9, 0, 500, 100);             // Missing [2, 5) and [6, 9)
    ASSERT_EQ(rx.missing_ranges(), 2u);
    ASSERT_EQ(rx.stats().gap_lost, 6u);
    ASSERT_EQ(rx.stats().reordered, 3u);
}

TEST(implausible_jump_is_malformed) {
    FlowReceiver rx(0);
    rx.on_data(0, 0, 100, 100);
    ASSERT_FALSE(rx.on_data(MAX_SEQ_JUMP + 1, 0, 200, 100));
    ASSERT_EQ(rx.stats().malformed, 1u);
    ASSERT_EQ(rx.stats().gap_lost, 0u);
    ASSERT_EQ(rx.highest_seq(), 0u);

    // The flow continues normally afterwards
    ASSERT_TRUE(rx.on_data(1, 0, 300, 100));
    ASSERT_EQ(rx.stats().gap_lost, 0u);
}

TEST(implausible_first_seq_is_malformed) {
    FlowReceiver rx(0);
    ASSERT_FALSE(rx.on_data(MAX_SEQ_JUMP + 5, 0, 100, 100));
    ASSERT_EQ(rx.stats().malformed, 1u);
    ASSERT_TRUE(rx.events().empty());
}

// ============================================================================
// FIN
// ============================================================================

TEST(fin_reports_unreceived_tail) {
    FlowReceiver rx(0);
    rx.on_data(0, 0, 100, 100);
    rx.on_data(1, 0, 200, 100);
    rx.on_fin(5, 300);

    ASSERT_TRUE(rx.finished());
    ASSERT_EQ(rx.stats().total_sent, 5u);
    ASSERT_EQ(rx.stats().gap_lost, 3u);
    const LossEvent* loss = last_loss(rx);
    ASSERT_EQ(loss->seq, 2u);
    ASSERT_EQ(loss->count, 3u);
    ASSERT_EQ(loss->time_ns, 300);
}

TEST(fin_after_complete_flow_adds_nothing) {
    FlowReceiver rx(0);
    rx.on_data(0, 0, 100, 100);
    rx.on_data(1, 0, 200, 100);
    size_t events = rx.events().size();
    rx.on_fin(2, 300);
    ASSERT_EQ(rx.events().size(), events);
    ASSERT_EQ(rx.stats().gap_lost, 0u);
}

TEST(fin_without_data_reports_everything_lost) {
    FlowReceiver rx(0);
    rx.on_fin(4, 300);
    ASSERT_EQ(rx.stats().gap_lost, 4u);
    ASSERT_EQ(rx.stats().packets_received, 0u);
}

TEST(repeated_fin_is_ignored) {
    FlowReceiver rx(0);
    rx.on_data(0, 0, 100, 100);
    rx.on_fin(3, 300);
    rx.on_fin(3, 310);
    rx.on_fin(3, 320);
    ASSERT_EQ(rx.stats().gap_lost, 2u);
}

TEST(tail_packet_after_fin_is_reordered) {
    FlowReceiver rx(0);
    rx.on_data(0, 0, 100, 100);
    rx.on_fin(3, 200);
    ASSERT_TRUE(rx.on_data(2, 0, 300, 100));
    ASSERT_TRUE(last_recv(rx)->reordered);
    ASSERT_EQ(rx.stats().gap_lost, 1u);
}

// ============================================================================
// Worker hand-off
// ============================================================================

TEST(worker_consumes_queue_before_join) {
    FlowCounters counters;
    FlowReceiverWorker worker(2, &counters);
    worker.start();

    for (uint64_t seq = 0; seq < 10000; seq++) {
        if (seq == 5000) continue;
        ReceivedDatagram item{msg::PacketType::DATA, seq, static_cast<int64_t>(seq), static_cast<int64_t>(seq * 10), 200};
        worker.push(item);
    }
    worker.push(ReceivedDatagram{msg::PacketType::FIN, 10000, 0, 200000, 0});
    worker.finish();

    const FlowReceiverStats& st = worker.receiver().stats();
    ASSERT_EQ(st.packets_received, 9999u);
    ASSERT_EQ(st.gap_lost, 1u);
    ASSERT_TRUE(st.finished);
    ASSERT_EQ(st.total_sent, 10000u);
    ASSERT_EQ(counters.packets_received.load(), 9999u);
    ASSERT_EQ(worker.receiver().flow_id(), 2u);
}

TEST(receiver_exit_names) {
    ASSERT_EQ(std::string(receiver_exit_name(ReceiverExit::ALL_FINISHED)), "all flows finished");
    ASSERT_EQ(std::string(receiver_exit_name(ReceiverExit::IDLE)), "idle timeout");
}

// ============================================================================
// Main
// ============================================================================

int main() {
    return run_all_tests("FlowReceiver");
}
