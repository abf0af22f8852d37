// log/session_output.hpp
// Writes a finished session to <output_dir>/<stem>_events.csv and <stem>_summary.txt
#pragma once

#include "event_csv.hpp"
#include "../flow/flow_coordinator.hpp"
#include "../metrics/metrics_aggregator.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace udpperf {

// Engine-side counters that never appear as events
inline std::string format_session_counters(const SessionResult& result) {
    std::string out;
    if (result.role == Role::SENDER) {
        uint64_t failures = 0, retries = 0, unmatched = 0, malformed = 0;
        for (const auto& f : result.sender_flows) {
            failures += f.send_failures;
            retries += f.send_retries;
            unmatched += f.unmatched_acks;
            malformed += f.malformed;
        }
        appendf(out, "Sender counters:    send_failures=%lu send_retries=%lu unmatched_acks=%lu malformed=%lu\n",
                failures, retries, unmatched, malformed);
    } else {
        uint64_t duplicates = 0, finished = 0;
        for (const auto& f : result.receiver_flows) {
            duplicates += f.duplicates;
            if (f.finished) finished++;
        }
        const ReceiverOwnerStats& s = result.receiver_stats;
        appendf(out, "Receiver counters:  datagrams=%lu malformed=%lu ignored=%lu duplicates=%lu acks_sent=%lu ack_failures=%lu\n",
                s.datagrams, s.malformed, s.ignored, duplicates, s.acks_sent, s.ack_failures);
        appendf(out, "Receiver exit:      %s (%lu of %zu flows sent FIN)\n",
                receiver_exit_name(result.receiver_exit), finished, result.receiver_flows.size());
    }
    if (result.stopped) {
        appendf(out, "Session stopped early by request\n");
    }
    return out;
}

/**
 * Write the event CSV and summary report, print the report to stdout
 *
 * @return Path of the summary file
 * @throws std::runtime_error (or std::filesystem::filesystem_error) on I/O failure
 */
inline std::string write_session_output(const std::string& output_dir, const std::string& stem,
                                        const SessionResult& result, JitterMode jitter_mode) {
    std::filesystem::create_directories(output_dir);
    std::filesystem::path dir(output_dir);
    std::string events_path = (dir / (stem + "_events.csv")).string();
    std::string summary_path = (dir / (stem + "_summary.txt")).string();

    EventCsvWriter csv(events_path);
    csv.write_all(result.events);
    csv.close();

    AggregatorConfig ac;
    ac.packet_size = result.packet_size;
    ac.jitter_mode = jitter_mode;
    MetricsAggregator aggregator(ac);
    aggregator.add_all(result.events);

    std::string title = std::string("udpperf ") + role_name(result.role) + " summary";
    std::string report = format_report(aggregator.finish(), title.c_str());
    report += "\n";
    report += format_session_counters(result);

    FILE* f = fopen(summary_path.c_str(), "w");
    if (!f) {
        throw std::runtime_error("Failed to open " + summary_path + ": " + strerror(errno));
    }
    bool ok = fwrite(report.data(), 1, report.size(), f) == report.size();
    if (fclose(f) != 0) ok = false;
    if (!ok) {
        throw std::runtime_error("Failed to write " + summary_path);
    }

    printf("\n%s", report.c_str());
    printf("[OUTPUT] %zu events -> %s\n", csv.rows(), events_path.c_str());
    printf("[OUTPUT] summary -> %s\n", summary_path.c_str());
    return summary_path;
}

} // namespace udpperf
