// metrics/metrics_aggregator.hpp
// Metrics Aggregator - throughput, loss, RTT distribution and jitter from events
//
// Input is any event stream: live from FlowCoordinator, read back from one
// CSV, or the concatenation of a sender and a receiver CSV. Per-flow events
// must be in time order (a merged stream is).
//
// Counting rules:
//   sent      SendEvents, or received + net gap loss when the stream has none
//   received  RecvEvents, or AckEvents when the stream has none (an ACK
//             proves delivery; bytes are then packet_size per ACK)
//   net gap   sum of GAP loss counts minus reordered arrivals that filled them
//   lost      sent - received
//
// Jitter (JitterMode):
//   MEAN_ABS_DELTA  mean |IPD_i - IPD_{i-1}| over consecutive defined IPDs
//   RFC3550         J += (|D| - J) / 16, D = (R_i - R_{i-1}) - (S_i - S_{i-1})
//   STDDEV          population standard deviation of the defined IPDs
// Aggregate jitter is the sample-weighted mean of the flow jitters.
//
// Throughput buckets: sends and ACKs are placed from the first sender-clock
// timestamp, receives from the first receiver-clock timestamp. The width is
// widened when the series would exceed MAX_BUCKETS.
#pragma once

#include "../core/stats.hpp"
#include "../core/timing.hpp"
#include "../flow/flow_event.hpp"
#include "../flow/session_config.hpp"
#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace udpperf {

struct AggregatorConfig {
    size_t packet_size = 1400;              // Bytes per ACK for sender-only streams
    int64_t bucket_ns = NS_PER_SEC;
    JitterMode jitter_mode = JitterMode::MEAN_ABS_DELTA;
};

struct FlowMetrics {
    uint32_t flow_id = 0;
    uint64_t sent = 0;
    uint64_t received = 0;
    uint64_t acked = 0;
    uint64_t lost = 0;
    uint64_t lost_gap = 0;          // Net of late fills
    uint64_t lost_evicted = 0;
    uint64_t reordered = 0;
    uint64_t bytes_received = 0;
    double loss_rate = 0;           // 1 - received/sent, 0 when nothing was sent
    double throughput_bps = 0;      // Over the first-to-last receive window
    Stats rtt_ns;
    double jitter_ns = 0;
    uint64_t jitter_samples = 0;
};

struct ThroughputBucket {
    int64_t start_ns = 0;           // Offset from the timeline origin
    int64_t span_ns = 0;
    uint64_t packets_sent = 0;
    uint64_t packets_received = 0;
    uint64_t bytes_received = 0;
    double throughput_bps = 0;
};

struct SessionMetrics {
    JitterMode jitter_mode = JitterMode::MEAN_ABS_DELTA;
    uint64_t event_count = 0;
    int64_t first_event_ns = 0;
    int64_t last_event_ns = 0;
    int64_t duration_ns = 0;        // Longest single-clock span (sender or receiver)
    int64_t bucket_ns = 0;          // Bucket width used, >= the configured one

    FlowMetrics total;              // flow_id unused
    std::vector<FlowMetrics> flows; // Ordered by flow id
    std::vector<ThroughputBucket> buckets;
};

class MetricsAggregator {
public:
    static constexpr size_t MAX_BUCKETS = 100000;

    explicit MetricsAggregator(const AggregatorConfig& config = AggregatorConfig())
        : config_(config)
        , event_count_(0)
        , first_event_ns_(0)
        , last_event_ns_(0)
    {}

    void add(const FlowEvent& ev) {
        int64_t t = event_time_ns(ev);
        if (event_count_ == 0 || t < first_event_ns_) first_event_ns_ = t;
        if (event_count_ == 0 || t > last_event_ns_) last_event_ns_ = t;
        event_count_++;

        FlowAccumulator& acc = flows_[event_flow_id(ev)];
        std::visit([&](const auto& e) { accumulate(acc, e); }, ev);
    }

    void add_all(const std::vector<FlowEvent>& events) {
        for (const auto& ev : events) add(ev);
    }

    SessionMetrics finish() const {
        SessionMetrics out;
        out.jitter_mode = config_.jitter_mode;
        out.event_count = event_count_;
        out.first_event_ns = first_event_ns_;
        out.last_event_ns = last_event_ns_;

        std::vector<double> all_rtts;
        double jitter_weighted = 0;
        uint64_t jitter_samples = 0;
        std::optional<int64_t> first_rx, last_rx;

        for (const auto& [flow_id, acc] : flows_) {
            FlowMetrics fm = flow_metrics(flow_id, acc);

            out.total.sent += fm.sent;
            out.total.received += fm.received;
            out.total.acked += fm.acked;
            out.total.lost += fm.lost;
            out.total.lost_gap += fm.lost_gap;
            out.total.lost_evicted += fm.lost_evicted;
            out.total.reordered += fm.reordered;
            out.total.bytes_received += fm.bytes_received;

            all_rtts.insert(all_rtts.end(), acc.rtts.begin(), acc.rtts.end());
            jitter_weighted += fm.jitter_ns * static_cast<double>(fm.jitter_samples);
            jitter_samples += fm.jitter_samples;

            if (acc.first_rx_ns && (!first_rx || *acc.first_rx_ns < *first_rx)) first_rx = acc.first_rx_ns;
            if (acc.last_rx_ns && (!last_rx || *acc.last_rx_ns > *last_rx)) last_rx = acc.last_rx_ns;

            out.flows.push_back(fm);
        }

        out.total.loss_rate = loss_rate(out.total.sent, out.total.received);
        out.total.rtt_ns = calculate_stats(std::move(all_rtts));
        out.total.jitter_samples = jitter_samples;
        out.total.jitter_ns = jitter_samples > 0 ? jitter_weighted / static_cast<double>(jitter_samples) : 0;
        if (first_rx && last_rx) {
            out.total.throughput_bps = rate_bps(out.total.bytes_received, *last_rx - *first_rx);
        }

        out.duration_ns = observed_duration_ns();
        out.bucket_ns = effective_bucket_ns();
        out.buckets = build_buckets(out.bucket_ns);
        return out;
    }

private:
    struct FlowAccumulator {
        uint64_t send_events = 0;
        uint64_t recv_events = 0;
        uint64_t ack_events = 0;
        uint64_t gap_reported = 0;
        uint64_t evicted = 0;
        uint64_t reordered = 0;
        uint64_t bytes_received = 0;
        std::optional<int64_t> first_rx_ns;
        std::optional<int64_t> last_rx_ns;
        std::vector<double> rtts;

        // Jitter state
        std::vector<double> ipds;
        std::optional<int64_t> prev_ipd;
        double abs_delta_sum = 0;
        uint64_t abs_delta_count = 0;
        std::optional<int64_t> prev_transit;    // R - S of the previous arrival
        double rfc_jitter = 0;
        uint64_t rfc_samples = 0;

        // ACK arrivals stand in for receives on sender-only flows
        std::vector<std::pair<int64_t, uint32_t>> ack_times;
    };

    void accumulate(FlowAccumulator& acc, const SendEvent& e) {
        acc.send_events++;
        sends_.push_back(e.send_time_ns);
    }

    void accumulate(FlowAccumulator& acc, const RecvEvent& e) {
        acc.recv_events++;
        acc.bytes_received += e.bytes;
        if (e.reordered) acc.reordered++;
        note_rx(acc, e.recv_time_ns);
        recvs_.emplace_back(e.recv_time_ns, e.bytes);

        if (e.inter_packet_delay_ns) {
            int64_t ipd = *e.inter_packet_delay_ns;
            acc.ipds.push_back(static_cast<double>(ipd));
            if (acc.prev_ipd) {
                acc.abs_delta_sum += std::fabs(static_cast<double>(ipd - *acc.prev_ipd));
                acc.abs_delta_count++;
            }
            acc.prev_ipd = ipd;
        }

        int64_t transit = e.recv_time_ns - e.send_time_ns;
        if (acc.prev_transit) {
            double d = std::fabs(static_cast<double>(transit - *acc.prev_transit));
            acc.rfc_jitter += (d - acc.rfc_jitter) / 16.0;
            acc.rfc_samples++;
        }
        acc.prev_transit = transit;
    }

    void accumulate(FlowAccumulator& acc, const AckEvent& e) {
        acc.ack_events++;
        acc.rtts.push_back(static_cast<double>(e.rtt_ns));
        acc.ack_times.emplace_back(e.ack_time_ns, static_cast<uint32_t>(config_.packet_size));
    }

    void accumulate(FlowAccumulator& acc, const LossEvent& e) {
        if (e.reason == LossReason::GAP) {
            acc.gap_reported += e.count;
        } else {
            acc.evicted += e.count;
        }
    }

    static void note_rx(FlowAccumulator& acc, int64_t t) {
        if (!acc.first_rx_ns || t < *acc.first_rx_ns) acc.first_rx_ns = t;
        if (!acc.last_rx_ns || t > *acc.last_rx_ns) acc.last_rx_ns = t;
    }

    static double loss_rate(uint64_t sent, uint64_t received) {
        if (sent == 0 || received >= sent) return 0;
        return 1.0 - static_cast<double>(received) / static_cast<double>(sent);
    }

    static double rate_bps(uint64_t bytes, int64_t window_ns) {
        if (window_ns <= 0) return 0;
        return static_cast<double>(bytes) * 8.0 * 1e9 / static_cast<double>(window_ns);
    }

    bool sender_only(const FlowAccumulator& acc) const {
        return acc.recv_events == 0;
    }

    FlowMetrics flow_metrics(uint32_t flow_id, const FlowAccumulator& acc) const {
        FlowMetrics fm;
        fm.flow_id = flow_id;
        fm.acked = acc.ack_events;
        fm.reordered = acc.reordered;
        fm.lost_evicted = acc.evicted;
        fm.lost_gap = acc.gap_reported > acc.reordered ? acc.gap_reported - acc.reordered : 0;

        if (sender_only(acc)) {
            fm.received = acc.ack_events;
            fm.bytes_received = acc.ack_events * config_.packet_size;
            std::optional<int64_t> first, last;
            for (const auto& [t, bytes] : acc.ack_times) {
                (void)bytes;
                if (!first || t < *first) first = t;
                if (!last || t > *last) last = t;
            }
            if (first && last) fm.throughput_bps = rate_bps(fm.bytes_received, *last - *first);
        } else {
            fm.received = acc.recv_events;
            fm.bytes_received = acc.bytes_received;
            fm.throughput_bps = rate_bps(fm.bytes_received, *acc.last_rx_ns - *acc.first_rx_ns);
        }

        fm.sent = acc.send_events > 0 ? acc.send_events : fm.received + fm.lost_gap;
        fm.lost = fm.sent > fm.received ? fm.sent - fm.received : 0;
        fm.loss_rate = loss_rate(fm.sent, fm.received);
        fm.rtt_ns = calculate_stats(acc.rtts);

        switch (config_.jitter_mode) {
            case JitterMode::MEAN_ABS_DELTA:
                fm.jitter_samples = acc.abs_delta_count;
                fm.jitter_ns = acc.abs_delta_count > 0 ? acc.abs_delta_sum / acc.abs_delta_count : 0;
                break;
            case JitterMode::RFC3550:
                fm.jitter_samples = acc.rfc_samples;
                fm.jitter_ns = acc.rfc_jitter;
                break;
            case JitterMode::STDDEV: {
                Stats s = calculate_stats(acc.ipds);
                fm.jitter_samples = s.count;
                fm.jitter_ns = s.stddev;
                break;
            }
        }
        return fm;
    }

    // Sends and ACK arrivals are stamped by the sender's clock, receives by
    // the receiver's. Combined client/server streams come from two hosts, so
    // each timeline is bucketed from its own origin.
    struct Timeline {
        std::optional<int64_t> first;
        std::optional<int64_t> last;

        void note(int64_t t) {
            if (!first || t < *first) first = t;
            if (!last || t > *last) last = t;
        }
        int64_t span() const { return first ? *last - *first : 0; }
    };

    Timeline sender_timeline() const {
        Timeline tl;
        for (int64_t t : sends_) tl.note(t);
        for (const auto& [flow_id, acc] : flows_) {
            (void)flow_id;
            for (const auto& [t, bytes] : acc.ack_times) {
                (void)bytes;
                tl.note(t);
            }
        }
        return tl;
    }

    Timeline receiver_timeline() const {
        Timeline tl;
        for (const auto& [t, bytes] : recvs_) {
            (void)bytes;
            tl.note(t);
        }
        return tl;
    }

    int64_t observed_duration_ns() const {
        return std::max(sender_timeline().span(), receiver_timeline().span());
    }

    // Bucket width actually used: bucket_ns, widened so the series never
    // exceeds MAX_BUCKETS entries
    int64_t effective_bucket_ns() const {
        int64_t span = observed_duration_ns();
        int64_t width = config_.bucket_ns;
        if (width > 0 && span / width >= static_cast<int64_t>(MAX_BUCKETS)) {
            width = span / static_cast<int64_t>(MAX_BUCKETS - 1) + 1;
        }
        return width;
    }

    // Bucket i covers [i*width, (i+1)*width) from each timeline's origin;
    // the last one covers its observed span
    std::vector<ThroughputBucket> build_buckets(int64_t width) const {
        std::vector<ThroughputBucket> buckets;
        Timeline tx = sender_timeline();
        Timeline rx = receiver_timeline();
        if ((!tx.first && !rx.first) || width <= 0) {
            return buckets;
        }

        int64_t span = std::max(tx.span(), rx.span());
        size_t count = static_cast<size_t>(span / width) + 1;
        buckets.resize(count);
        for (size_t i = 0; i < count; i++) {
            buckets[i].start_ns = static_cast<int64_t>(i) * width;
            buckets[i].span_ns = width;
        }
        int64_t last_span = span - buckets.back().start_ns;
        if (last_span > 0) buckets.back().span_ns = last_span;

        auto index = [&](const Timeline& tl, int64_t t) {
            return static_cast<size_t>((t - *tl.first) / width);
        };

        for (int64_t t : sends_) {
            buckets[index(tx, t)].packets_sent++;
        }
        for (const auto& [t, bytes] : recvs_) {
            buckets[index(rx, t)].packets_received++;
            buckets[index(rx, t)].bytes_received += bytes;
        }
        for (const auto& [flow_id, acc] : flows_) {
            (void)flow_id;
            if (!sender_only(acc)) continue;
            for (const auto& [t, bytes] : acc.ack_times) {
                buckets[index(tx, t)].packets_received++;
                buckets[index(tx, t)].bytes_received += bytes;
            }
        }

        for (auto& b : buckets) {
            b.throughput_bps = rate_bps(b.bytes_received, b.span_ns);
        }
        return buckets;
    }

    AggregatorConfig config_;
    std::map<uint32_t, FlowAccumulator> flows_;
    std::vector<int64_t> sends_;
    std::vector<std::pair<int64_t, uint32_t>> recvs_;
    uint64_t event_count_;
    int64_t first_event_ns_;
    int64_t last_event_ns_;
};

// ============================================================================
// Report
// ============================================================================

inline void appendf(std::string& out, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

inline void appendf(std::string& out, const char* fmt, ...) {
    char line[512];
    va_list args;
    va_start(args, fmt);
    int n = vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);
    if (n > 0) {
        out.append(line, static_cast<size_t>(n) < sizeof(line) ? static_cast<size_t>(n) : sizeof(line) - 1);
    }
}

// Human-readable session summary
inline std::string format_report(const SessionMetrics& m, const char* title = "udpperf session summary") {
    std::string out;
    const FlowMetrics& t = m.total;
    auto ms = [](double ns) { return ns / NS_PER_MS; };

    appendf(out, "=== %s ===\n", title);
    appendf(out, "Flows:              %zu\n", m.flows.size());
    appendf(out, "Events:             %lu over %.3f s\n", m.event_count,
            static_cast<double>(m.duration_ns) / NS_PER_SEC);
    appendf(out, "Packets sent:       %lu\n", t.sent);
    appendf(out, "Packets received:   %lu\n", t.received);
    appendf(out, "Packets acked:      %lu\n", t.acked);
    appendf(out, "Packets lost:       %lu (%.2f%%) [gap=%lu evicted=%lu]\n",
            t.lost, t.loss_rate * 100.0, t.lost_gap, t.lost_evicted);
    appendf(out, "Reordered:          %lu\n", t.reordered);
    appendf(out, "Bytes received:     %lu\n", t.bytes_received);
    appendf(out, "Throughput:         %.3f Mbps\n", t.throughput_bps / 1e6);

    if (t.rtt_ns.count > 0) {
        appendf(out, "RTT (ms):           min=%.3f mean=%.3f p50=%.3f p95=%.3f p99=%.3f max=%.3f stddev=%.3f (n=%lu)\n",
                ms(t.rtt_ns.min), ms(t.rtt_ns.mean), ms(t.rtt_ns.median), ms(t.rtt_ns.p95),
                ms(t.rtt_ns.p99), ms(t.rtt_ns.max), ms(t.rtt_ns.stddev), t.rtt_ns.count);
    } else {
        appendf(out, "RTT (ms):           n/a\n");
    }
    if (t.jitter_samples > 0) {
        appendf(out, "Jitter (%s): %.3f ms (n=%lu)\n", jitter_mode_name(m.jitter_mode),
                ms(t.jitter_ns), t.jitter_samples);
    } else {
        appendf(out, "Jitter (%s): n/a\n", jitter_mode_name(m.jitter_mode));
    }

    appendf(out, "\nPer flow:\n");
    appendf(out, "  %6s %10s %10s %10s %8s %10s %10s %10s\n",
            "flow", "sent", "received", "lost", "loss%", "Mbps", "rtt_ms", "jitter_ms");
    for (const auto& f : m.flows) {
        appendf(out, "  %6u %10lu %10lu %10lu %8.2f %10.3f %10.3f %10.3f\n",
                f.flow_id, f.sent, f.received, f.lost, f.loss_rate * 100.0,
                f.throughput_bps / 1e6, ms(f.rtt_ns.mean), ms(f.jitter_ns));
    }

    if (!m.buckets.empty()) {
        appendf(out, "\nThroughput over time (%.3f s buckets):\n", static_cast<double>(m.bucket_ns) / NS_PER_SEC);
        appendf(out, "  %8s %10s %10s %10s %8s\n", "t_s", "Mbps", "sent", "received", "loss%");
        for (const auto& b : m.buckets) {
            double loss = 0;
            if (b.packets_sent > b.packets_received && b.packets_sent > 0) {
                loss = 100.0 * static_cast<double>(b.packets_sent - b.packets_received) / b.packets_sent;
            }
            appendf(out, "  %8.1f %10.3f %10lu %10lu %8.2f\n",
                    static_cast<double>(b.start_ns) / NS_PER_SEC, b.throughput_bps / 1e6,
                    b.packets_sent, b.packets_received, loss);
        }
    }
    return out;
}

} // namespace udpperf
