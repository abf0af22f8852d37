// examples/udpperf_server.cpp
// udpperf server: receives flows (normal mode) or sends them back (--reverse)
//
// Usage:
//   udpperf_server [--bind ADDR] [--port P] [--output-dir DIR] [--jitter MODE]
//                  [--reverse --bandwidth MBPS --duration S --packet-size B]
//                  [--no-ack] [--forever]
//
// Writes <output-dir>/server_events.csv and server_summary.txt per session
// (server_<n>_* with --forever).

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
static volatile sig_atomic_t g_interrupted = 0;

static void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted = 1;
        DefaultCoordinator* coord = g_coordinator.load();
        if (coord) {
            coord->request_stop();
        }
    }
}

static void print_usage(const char* prog) {
    printf("Usage: %s [options]\n", prog);
    printf("  --bind ADDR         Listen address (default 0.0.0.0)\n");
    printf("  --port P            UDP port (default 5000)\n");
    printf("  --output-dir DIR    Output directory (default .)\n");
    printf("  --jitter MODE       mean-abs-delta | rfc3550 | stddev\n");
    printf("  --reverse           Send to the client instead of receiving\n");
    printf("  --bandwidth MBPS    Per-flow rate in reverse mode\n");
    printf("  --duration S        Test duration in reverse mode (default 10)\n");
    printf("  --packet-size B     Packet size in reverse mode (default 1400)\n");
    printf("  --no-ack            Do not acknowledge received packets\n");
    printf("  --forever           Serve sessions until interrupted\n");
}

static void parse_args(int argc, char* argv[], SessionConfig& config, bool* forever) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        if (strcmp(arg, "--bind") == 0) {
            config.bind_host = next_value(argc, argv, &i);
        } else if (strcmp(arg, "--port") == 0) {
            config.port = static_cast<uint16_t>(parse_uint_arg(arg, next_value(argc, argv, &i), 65535));
        } else if (strcmp(arg, "--output-dir") == 0) {
            config.output_dir = next_value(argc, argv, &i);
        } else if (strcmp(arg, "--jitter") == 0) {
            config.jitter_mode = parse_jitter_arg(next_value(argc, argv, &i));
        } else if (strcmp(arg, "--reverse") == 0) {
            config.mode = udpperf::Mode::REVERSE;
        } else if (strcmp(arg, "--bandwidth") == 0) {
            config.bandwidth_mbps = parse_double_arg(arg, next_value(argc, argv, &i));
        } else if (strcmp(arg, "--duration") == 0) {
            config.duration_s = parse_double_arg(arg, next_value(argc, argv, &i));
        } else if (strcmp(arg, "--packet-size") == 0) {
            config.packet_size = parse_uint_arg(arg, next_value(argc, argv, &i), 1u << 20);
        } else if (strcmp(arg, "--no-ack") == 0) {
            config.ack_enabled = false;
        } else if (strcmp(arg, "--forever") == 0) {
            *forever = true;
        } else {
            throw UsageError(std::string("unknown option '") + arg + "'");
        }
    }
    if (config.mode == udpperf::Mode::REVERSE && config.bandwidth_mbps <= 0) {
        throw UsageError("--reverse requires --bandwidth");
    }
}

int main(int argc, char* argv[]) {
    SessionConfig config;
    config.side = udpperf::Side::SERVER;
    bool forever = false;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return EXIT_OK;
        }
    }

    try {
        parse_args(argc, argv, config, &forever);
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

        DefaultCoordinator setup(config);
        udpperf::transport::UdpSocket listen = setup.open_listen_socket();

        int session = 0;
        do {
            DefaultCoordinator coord(config);
            g_coordinator.store(&coord);
            if (g_interrupted) coord.request_stop();

            SessionResult result = coord.run_server(listen);
            g_coordinator.store(nullptr);

            if (result.events.empty() && result.stopped) {
                break;
            }

            std::string stem = forever ? "server_" + std::to_string(session) : "server";
            udpperf::write_session_output(config.output_dir, stem, result, config.jitter_mode);
            session++;
        } while (forever && !g_interrupted);
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
