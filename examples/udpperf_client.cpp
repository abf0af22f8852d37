// examples/udpperf_client.cpp
// udpperf client: sends N rate-paced flows (normal mode) or receives them (--reverse)
//
// Usage:
//   udpperf_client --server ADDR --bandwidth MBPS [--port P] [--flows N]
//                  [--duration S] [--packet-size B] [--reverse]
//                  [--output-dir DIR] [--jitter MODE] [--no-ack]
//
// Writes <output-dir>/client_events.csv and client_summary.txt.

#include "udpperf.hpp"
#include "cli_common.hpp"
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>

using udpperf::SessionConfig;
using udpperf::SessionResult;

static std::atomic<DefaultCoordinator*> g_coordinator{nullptr};

static void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        DefaultCoordinator* coord = g_coordinator.load();
        if (coord) {
            coord->request_stop();
        }
    }
}

static void print_usage(const char* prog) {
    printf("Usage: %s --server ADDR --bandwidth MBPS [options]\n", prog);
    printf("  --server ADDR       Server address (required)\n");
    printf("  --port P            UDP port (default 5000)\n");
    printf("  --bandwidth MBPS    Per-flow rate (required unless --reverse)\n");
    printf("  --flows N           Concurrent flows (default 4)\n");
    printf("  --duration S        Test duration in seconds (default 10)\n");
    printf("  --packet-size B     UDP payload size (default 1400)\n");
    printf("  --reverse           Server sends, client receives\n");
    printf("  --output-dir DIR    Output directory (default .)\n");
    printf("  --jitter MODE       mean-abs-delta | rfc3550 | stddev\n");
    printf("  --no-ack            Do not acknowledge received packets (--reverse)\n");
}

static void parse_args(int argc, char* argv[], SessionConfig& config) {
    bool have_server = false;
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        if (strcmp(arg, "--server") == 0) {
            config.server_host = next_value(argc, argv, &i);
            have_server = true;
        } else if (strcmp(arg, "--port") == 0) {
            config.port = static_cast<uint16_t>(parse_uint_arg(arg, next_value(argc, argv, &i), 65535));
        } else if (strcmp(arg, "--bandwidth") == 0) {
            config.bandwidth_mbps = parse_double_arg(arg, next_value(argc, argv, &i));
        } else if (strcmp(arg, "--flows") == 0) {
            config.num_flows = static_cast<uint32_t>(parse_uint_arg(arg, next_value(argc, argv, &i), UINT32_MAX));
        } else if (strcmp(arg, "--duration") == 0) {
            config.duration_s = parse_double_arg(arg, next_value(argc, argv, &i));
        } else if (strcmp(arg, "--packet-size") == 0) {
            config.packet_size = parse_uint_arg(arg, next_value(argc, argv, &i), 1u << 20);
        } else if (strcmp(arg, "--reverse") == 0) {
            config.mode = udpperf::Mode::REVERSE;
        } else if (strcmp(arg, "--output-dir") == 0) {
            config.output_dir = next_value(argc, argv, &i);
        } else if (strcmp(arg, "--jitter") == 0) {
            config.jitter_mode = parse_jitter_arg(next_value(argc, argv, &i));
        } else if (strcmp(arg, "--no-ack") == 0) {
            config.ack_enabled = false;
        } else {
            throw UsageError(std::string("unknown option '") + arg + "'");
        }
    }

    if (!have_server) {
        throw UsageError("--server is required");
    }
    if (config.mode == udpperf::Mode::NORMAL && config.bandwidth_mbps == 0) {
        throw UsageError("--bandwidth is required unless --reverse");
    }
}

int main(int argc, char* argv[]) {
    SessionConfig config;
    config.side = udpperf::Side::CLIENT;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return EXIT_OK;
        }
    }

    try {
        parse_args(argc, argv, config);
    } catch (const UsageError& e) {
        fprintf(stderr, "[ERROR] %s\n", e.what());
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    config.apply_env_overrides();

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        config.validate();
        config.print();

        DefaultCoordinator coord(config);
        g_coordinator.store(&coord);
        SessionResult result = coord.run_client();
        g_coordinator.store(nullptr);

        udpperf::write_session_output(config.output_dir, "client", result, config.jitter_mode);
    } catch (const udpperf::RateConfigError& e) {
        g_coordinator.store(nullptr);
        fprintf(stderr, "[ERROR] Invalid configuration: %s\n", e.what());
        return EXIT_CONFIG_ERROR;
    } catch (const udpperf::SocketError& e) {
        g_coordinator.store(nullptr);
        fprintf(stderr, "[ERROR] Socket setup failed: %s\n", e.what());
        return EXIT_CONFIG_ERROR;
    } catch (const std::runtime_error& e) {
        g_coordinator.store(nullptr);
        fprintf(stderr, "[ERROR] %s\n", e.what());
        return EXIT_CONFIG_ERROR;
    }

    return EXIT_OK;
}
