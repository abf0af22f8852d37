// test/integration/loopback_session.cpp
// Integration test: full client/server sessions over 127.0.0.1
//
// Runs the server coordinator on a thread and the client coordinator on the
// main thread, in both directions, and checks that both sides agree on what
// was sent, received and acknowledged.
//
// Usage:
//   ./build/test_loopback_session

#include "udpperf.hpp"
#include "../unittest/test_harness.hpp"
#include <chrono>
#include <exception>
#include <thread>
#include <vector>

using namespace udpperf;
using udpperf::transport::UdpSocket;

// Server listening socket on an ephemeral loopback port
static UdpSocket open_loopback_listener(uint16_t* port) {
    UdpSocket sock;
    sock.open();
    sock.bind("127.0.0.1", 0);
    *port = ntohs(sock.local_address().sin_port);
    return sock;
}

static SessionConfig base_config(Side side, Mode mode, uint16_t port) {
    SessionConfig cfg;
    cfg.side = side;
    cfg.mode = mode;
    cfg.server_host = "127.0.0.1";
    cfg.bind_host = "127.0.0.1";
    cfg.port = port;
    cfg.report_interval_ms = 0;
    cfg.idle_timeout_ns = 1000 * NS_PER_MS;
    cfg.drain_grace_ns = 200 * NS_PER_MS;
    cfg.max_flows = 64;
    return cfg;
}

// Runs run_server() on its own thread; exceptions are carried back to join()
struct ServerThread {
    explicit ServerThread(const SessionConfig& config, UdpSocket& listen)
        : coord(config)
    {
        thread = std::thread([this, &listen] {
            try {
                result = coord.run_server(listen);
            } catch (const std::exception&) {
                error = std::current_exception();
            }
        });
    }

    ~ServerThread() {
        if (thread.joinable()) {
            coord.request_stop();
            thread.join();
        }
    }

    SessionResult join() {
        thread.join();
        if (error) std::rethrow_exception(error);
        return result;
    }

    EpollCoordinator coord;
    SessionResult result;
    std::exception_ptr error;
    std::thread thread;
};

// ============================================================================
// Normal mode: client sends, server receives
// ============================================================================

TEST(normal_mode_single_flow) {
    uint16_t port = 0;
    UdpSocket listen = open_loopback_listener(&port);

    ServerThread server(base_config(Side::SERVER, Mode::NORMAL, port), listen);

    SessionConfig client_cfg = base_config(Side::CLIENT, Mode::NORMAL, port);
    client_cfg.num_flows = 1;
    client_cfg.bandwidth_mbps = 10;
    client_cfg.duration_s = 2;
    client_cfg.packet_size = 1400;

    EpollCoordinator client(client_cfg);
    SessionResult sent = client.run_client();
    SessionResult received = server.join();

    // Client view
    ASSERT_TRUE(sent.role == Role::SENDER);
    ASSERT_EQ(sent.sender_flows.size(), 1u);
    const FlowState& flow = sent.sender_flows[0];
    // 2s at 1.12ms per packet
    ASSERT_GE(flow.packets_sent, 1780u);
    ASSERT_LE(flow.packets_sent, 1786u);
    ASSERT_EQ(flow.packets_acked, flow.packets_sent);
    ASSERT_EQ(flow.packets_evicted, 0u);
    ASSERT_FALSE(sent.stopped);

    // Server view
    ASSERT_TRUE(received.role == Role::RECEIVER);
    ASSERT_TRUE(received.receiver_exit == ReceiverExit::ALL_FINISHED);
    ASSERT_EQ(received.receiver_flows.size(), 1u);
    const FlowReceiverStats& rx = received.receiver_flows[0];
    ASSERT_EQ(rx.packets_received, flow.packets_sent);
    ASSERT_EQ(rx.total_sent, flow.packets_sent);
    ASSERT_EQ(rx.gap_lost, 0u);
    ASSERT_EQ(rx.duplicates, 0u);
    ASSERT_EQ(received.receiver_stats.acks_sent, flow.packets_sent);

    // Aggregated metrics from each side's event stream
    AggregatorConfig ac;
    ac.packet_size = client_cfg.packet_size;
    MetricsAggregator client_metrics(ac);
    client_metrics.add_all(sent.events);
    SessionMetrics cm = client_metrics.finish();
    ASSERT_EQ(cm.total.sent, flow.packets_sent);
    ASSERT_EQ(cm.total.lost, 0u);
    ASSERT_GT(cm.total.rtt_ns.count, 0u);
    ASSERT_GT(cm.total.rtt_ns.min, 0.0);

    MetricsAggregator server_metrics(ac);
    server_metrics.add_all(received.events);
    SessionMetrics sm = server_metrics.finish();
    ASSERT_EQ(sm.total.received, flow.packets_sent);
    ASSERT_NEAR(sm.total.loss_rate, 0.0, 1e-12);
    // Paced at 10 Mbps: measured within 10%
    ASSERT_NEAR(sm.total.throughput_bps, 10e6, 1e6);
}

TEST(normal_mode_multiple_flows_and_garbage) {
    uint16_t port = 0;
    UdpSocket listen = open_loopback_listener(&port);

    ServerThread server(base_config(Side::SERVER, Mode::NORMAL, port), listen);

    SessionConfig client_cfg = base_config(Side::CLIENT, Mode::NORMAL, port);
    client_cfg.num_flows = 3;
    client_cfg.bandwidth_mbps = 2;
    client_cfg.duration_s = 1;
    client_cfg.packet_size = 500;

    // A stray datagram on the server port must be counted, not crash anything
    UdpSocket stray;
    stray.open();
    stray.connect("127.0.0.1", port);
    const uint8_t garbage[5] = {0xde, 0xad, 0xbe, 0xef, 0x00};
    ASSERT_EQ(stray.send(garbage, sizeof(garbage)), 5);

    EpollCoordinator client(client_cfg);
    SessionResult sent = client.run_client();
    SessionResult received = server.join();

    ASSERT_EQ(sent.sender_flows.size(), 3u);
    ASSERT_EQ(received.receiver_flows.size(), 3u);
    ASSERT_GE(received.receiver_stats.malformed, 1u);
    ASSERT_TRUE(received.receiver_exit == ReceiverExit::ALL_FINISHED);

    for (size_t i = 0; i < 3; i++) {
        ASSERT_EQ(sent.sender_flows[i].flow_id, static_cast<uint32_t>(i));
        ASSERT_EQ(received.receiver_flows[i].packets_received, sent.sender_flows[i].packets_sent);
        ASSERT_EQ(sent.sender_flows[i].packets_acked, sent.sender_flows[i].packets_sent);
    }

    // Merged events are time ordered
    for (size_t i = 1; i < sent.events.size(); i++) {
        ASSERT_LE(event_time_ns(sent.events[i - 1]), event_time_ns(sent.events[i]));
    }
}

// ============================================================================
// Reverse mode: client registers, server sends
// ============================================================================

TEST(reverse_mode_two_flows) {
    uint16_t port = 0;
    UdpSocket listen = open_loopback_listener(&port);

    SessionConfig server_cfg = base_config(Side::SERVER, Mode::REVERSE, port);
    server_cfg.bandwidth_mbps = 4;
    server_cfg.duration_s = 1;
    server_cfg.packet_size = 1000;
    ServerThread server(server_cfg, listen);

    SessionConfig client_cfg = base_config(Side::CLIENT, Mode::REVERSE, port);
    client_cfg.num_flows = 2;

    EpollCoordinator client(client_cfg);
    SessionResult received = client.run_client();
    SessionResult sent = server.join();

    ASSERT_TRUE(sent.role == Role::SENDER);
    ASSERT_TRUE(received.role == Role::RECEIVER);
    ASSERT_EQ(sent.sender_flows.size(), 2u);
    ASSERT_EQ(received.receiver_flows.size(), 2u);
    ASSERT_TRUE(received.receiver_exit == ReceiverExit::ALL_FINISHED);

    for (size_t i = 0; i < 2; i++) {
        const FlowState& tx = sent.sender_flows[i];
        const FlowReceiverStats& rx = received.receiver_flows[i];
        // 1s at 2ms per packet
        ASSERT_GE(tx.packets_sent, 499u);
        ASSERT_LE(tx.packets_sent, 501u);
        ASSERT_EQ(rx.packets_received, tx.packets_sent);
        ASSERT_EQ(rx.total_sent, tx.packets_sent);
        ASSERT_EQ(tx.packets_acked, tx.packets_sent);
    }
}

TEST(reverse_mode_without_acks_evicts) {
    uint16_t port = 0;
    UdpSocket listen = open_loopback_listener(&port);

    SessionConfig server_cfg = base_config(Side::SERVER, Mode::REVERSE, port);
    server_cfg.bandwidth_mbps = 1;
    server_cfg.duration_s = 0.5;
    server_cfg.packet_size = 1000;
    ServerThread server(server_cfg, listen);

    SessionConfig client_cfg = base_config(Side::CLIENT, Mode::REVERSE, port);
    client_cfg.num_flows = 1;
    client_cfg.ack_enabled = false;

    EpollCoordinator client(client_cfg);
    SessionResult received = client.run_client();
    SessionResult sent = server.join();

    const FlowState& tx = sent.sender_flows[0];
    ASSERT_GT(tx.packets_sent, 0u);
    ASSERT_EQ(tx.packets_acked, 0u);
    ASSERT_EQ(tx.packets_evicted, tx.packets_sent);
    ASSERT_EQ(received.receiver_flows[0].packets_received, tx.packets_sent);
    ASSERT_EQ(received.receiver_stats.acks_sent, 0u);
}

TEST(reverse_client_without_server_gives_up) {
    // Reserve a port, then release it so nothing answers there
    uint16_t port = 0;
    {
        UdpSocket unused = open_loopback_listener(&port);
    }

    SessionConfig client_cfg = base_config(Side::CLIENT, Mode::REVERSE, port);
    client_cfg.num_flows = 1;
    client_cfg.duration_s = 1;
    client_cfg.hello_timeout_ns = 500 * NS_PER_MS;

    auto start = std::chrono::steady_clock::now();
    EpollCoordinator client(client_cfg);
    SessionResult received = client.run_client();
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ASSERT_TRUE(received.role == Role::RECEIVER);
    ASSERT_TRUE(received.receiver_exit == ReceiverExit::IDLE);
    ASSERT_FALSE(received.stopped);
    ASSERT_TRUE(received.receiver_flows.empty());
    ASSERT_TRUE(received.events.empty());
    // hello 0.5s + start delay 0.1s + idle 1s, plus HELLO rounds
    ASSERT_GE(elapsed_ms, 1500);
    ASSERT_LT(elapsed_ms, 5000);
}

// ============================================================================
// Stop
// ============================================================================

TEST(stop_request_ends_server_without_traffic) {
    uint16_t port = 0;
    UdpSocket listen = open_loopback_listener(&port);

    ServerThread server(base_config(Side::SERVER, Mode::NORMAL, port), listen);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    server.coord.request_stop();
    SessionResult result = server.join();

    ASSERT_TRUE(result.stopped);
    ASSERT_TRUE(result.events.empty());
    ASSERT_TRUE(result.receiver_exit == ReceiverExit::STOPPED);
}

int main() {
    return run_all_tests("LoopbackSession");
}
