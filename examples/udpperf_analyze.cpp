// examples/udpperf_analyze.cpp
// Offline analysis of one or more event CSVs
//
// Usage:
//   udpperf_analyze --events FILE [--events FILE ...] [--packet-size B]
//                   [--bucket-ms MS] [--jitter MODE] [--output FILE]
//
// Passing the client and the server CSV of the same session combines sender
// and receiver views: sent comes from send rows, received from recv rows.
// Each log is on its own host's monotonic clock, so the throughput-over-time
// buckets of a combined analysis only line up when both ends shared a host.

#include "udpperf.hpp"
#include "cli_common.hpp"
#include <cstdio>
#include <cstring>
#include <exception>
#include <string>
#include <vector>

static void print_usage(const char* prog) {
    printf("Usage: %s --events FILE [options]\n", prog);
    printf("  --events FILE       Event CSV (repeatable)\n");
    printf("  --packet-size B     Bytes per ACK for sender-only logs (default 1400)\n");
    printf("  --bucket-ms MS      Throughput bucket width (default 1000)\n");
    printf("  --jitter MODE       mean-abs-delta | rfc3550 | stddev\n");
    printf("  --output FILE       Also write the report to FILE\n");
}

struct AnalyzeArgs {
    std::vector<std::string> event_files;
    udpperf::AggregatorConfig aggregator;
    std::string output;
};

static AnalyzeArgs parse_args(int argc, char* argv[]) {
    AnalyzeArgs args;
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        if (strcmp(arg, "--events") == 0) {
            args.event_files.push_back(next_value(argc, argv, &i));
        } else if (strcmp(arg, "--packet-size") == 0) {
            args.aggregator.packet_size = parse_uint_arg(arg, next_value(argc, argv, &i), udpperf::msg::MAX_DATAGRAM_LEN);
        } else if (strcmp(arg, "--bucket-ms") == 0) {
            uint64_t ms = parse_uint_arg(arg, next_value(argc, argv, &i), 3600 * 1000);
            if (ms == 0) throw UsageError("--bucket-ms must be positive");
            args.aggregator.bucket_ns = static_cast<int64_t>(ms) * udpperf::NS_PER_MS;
        } else if (strcmp(arg, "--jitter") == 0) {
            args.aggregator.jitter_mode = parse_jitter_arg(next_value(argc, argv, &i));
        } else if (strcmp(arg, "--output") == 0) {
            args.output = next_value(argc, argv, &i);
        } else {
            throw UsageError(std::string("unknown option '") + arg + "'");
        }
    }
    if (args.event_files.empty()) {
        throw UsageError("--events is required");
    }
    return args;
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return EXIT_OK;
        }
    }

    AnalyzeArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const UsageError& e) {
        fprintf(stderr, "[ERROR] %s\n", e.what());
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        udpperf::MetricsAggregator aggregator(args.aggregator);
        for (const auto& path : args.event_files) {
            udpperf::EventCsvReadResult csv = udpperf::read_event_csv(path);
            printf("[ANALYZE] %s: %zu events", path.c_str(), csv.events.size());
            if (csv.bad_rows > 0) {
                printf(", %zu unparseable rows skipped", csv.bad_rows);
            }
            printf("\n");
            aggregator.add_all(csv.events);
        }

        std::string report = udpperf::format_report(aggregator.finish(), "udpperf analysis");
        printf("\n%s", report.c_str());

        if (!args.output.empty()) {
            FILE* f = fopen(args.output.c_str(), "w");
            if (!f) {
                throw std::runtime_error("Failed to open " + args.output + ": " + strerror(errno));
            }
            bool ok = fwrite(report.data(), 1, report.size(), f) == report.size();
            if (fclose(f) != 0) ok = false;
            if (!ok) {
                throw std::runtime_error("Failed to write " + args.output);
            }
            printf("[OUTPUT] report -> %s\n", args.output.c_str());
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "[ERROR] %s\n", e.what());
        return EXIT_CONFIG_ERROR;
    }

    return EXIT_OK;
}
