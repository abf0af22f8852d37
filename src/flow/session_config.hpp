// flow/session_config.hpp
// Session configuration, role resolution and validation
//
// SessionConfig is filled from the command line, then from environment
// overrides, then validated once before any socket is opened:
//
//   UDPPERF_EVICTION_TIMEOUT_MS   pending-ACK eviction timeout (default 1000)
//   UDPPERF_DRAIN_GRACE_MS        ACK drain after the last send (default 500)
//   UDPPERF_IDLE_TIMEOUT_MS       receiver idle timeout (default 3000)
//   UDPPERF_REPORT_INTERVAL_MS    progress line interval, 0 = off (default 5000)
//   UDPPERF_SOCKET_BUFFER_BYTES   SO_RCVBUF/SO_SNDBUF request (default 4MB)
#pragma once

#include "../core/errors.hpp"
#include "../core/timing.hpp"
#include "../msg/packet_codec.hpp"
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace udpperf {

enum class Side { CLIENT, SERVER };
enum class Mode { NORMAL, REVERSE };
enum class Role { SENDER, RECEIVER };

// Jitter definitions, see metrics/metrics_aggregator.hpp
enum class JitterMode {
    MEAN_ABS_DELTA,     // mean |IPD_i - IPD_{i-1}|
    RFC3550,            // RFC 3550 interarrival jitter, J += (|D| - J) / 16
    STDDEV              // standard deviation of IPD
};

inline const char* side_name(Side side) {
    return side == Side::CLIENT ? "client" : "server";
}

inline const char* role_name(Role role) {
    return role == Role::SENDER ? "sender" : "receiver";
}

inline const char* jitter_mode_name(JitterMode mode) {
    switch (mode) {
        case JitterMode::MEAN_ABS_DELTA: return "mean-abs-delta";
        case JitterMode::RFC3550: return "rfc3550";
        case JitterMode::STDDEV: return "stddev";
    }
    return "unknown";
}

// Accepts the names printed by jitter_mode_name()
inline bool parse_jitter_mode(const char* text, JitterMode* out) {
    if (strcmp(text, "mean-abs-delta") == 0) {
        *out = JitterMode::MEAN_ABS_DELTA;
    } else if (strcmp(text, "rfc3550") == 0) {
        *out = JitterMode::RFC3550;
    } else if (strcmp(text, "stddev") == 0) {
        *out = JitterMode::STDDEV;
    } else {
        return false;
    }
    return true;
}

// Normal: client sends, server receives. Reverse: the opposite.
inline Role resolve_role(Side side, Mode mode) {
    bool client_sends = (mode == Mode::NORMAL);
    if (side == Side::CLIENT) {
        return client_sends ? Role::SENDER : Role::RECEIVER;
    }
    return client_sends ? Role::RECEIVER : Role::SENDER;
}

struct SessionConfig {
    Side side = Side::CLIENT;
    Mode mode = Mode::NORMAL;

    std::string server_host = "127.0.0.1";  // Client: where to send / register
    std::string bind_host = "0.0.0.0";      // Server: listen address
    uint16_t port = 5000;
    std::string output_dir = ".";

    // Sender parameters (bandwidth is per flow)
    uint32_t num_flows = 4;
    double bandwidth_mbps = 0;
    double duration_s = 10;
    size_t packet_size = 1400;

    // Timeouts
    int64_t eviction_timeout_ns = 1000 * NS_PER_MS;
    int64_t drain_grace_ns = 500 * NS_PER_MS;
    int64_t idle_timeout_ns = 3000 * NS_PER_MS;
    int64_t hello_timeout_ns = 2000 * NS_PER_MS;
    int64_t start_delay_ns = 100 * NS_PER_MS;   // Start barrier lead time

    int report_interval_ms = 5000;
    int socket_buffer_bytes = 4 * 1024 * 1024;
    uint32_t max_flows = 1024;
    bool ack_enabled = true;
    JitterMode jitter_mode = JitterMode::MEAN_ABS_DELTA;

    Role role() const {
        return resolve_role(side, mode);
    }

    double target_rate_bps() const {
        return bandwidth_mbps * 1e6;
    }

    int64_t duration_ns() const {
        return static_cast<int64_t>(duration_s * static_cast<double>(NS_PER_SEC));
    }

    /**
     * Validate the configuration
     *
     * Rate, duration and packet size only matter on the sending side.
     *
     * @throws RateConfigError describing the first invalid field
     */
    void validate() const {
        if (num_flows == 0) {
            throw RateConfigError("flow count must be at least 1");
        }
        if (num_flows > max_flows) {
            throw RateConfigError("flow count " + std::to_string(num_flows) +
                                  " exceeds maximum " + std::to_string(max_flows));
        }
        if (port == 0) {
            throw RateConfigError("port must be non-zero");
        }
        if (eviction_timeout_ns <= 0 || idle_timeout_ns <= 0 || hello_timeout_ns <= 0) {
            throw RateConfigError("timeouts must be positive");
        }
        if (drain_grace_ns < 0 || report_interval_ms < 0) {
            throw RateConfigError("drain grace and report interval must not be negative");
        }
        if (role() != Role::SENDER) {
            return;
        }
        if (!(bandwidth_mbps > 0)) {
            throw RateConfigError("bandwidth must be positive (got " + std::to_string(bandwidth_mbps) + " Mbps)");
        }
        if (!(duration_s > 0)) {
            throw RateConfigError("duration must be positive (got " + std::to_string(duration_s) + " s)");
        }
        if (packet_size < msg::HEADER_LEN || packet_size > msg::MAX_DATAGRAM_LEN) {
            throw RateConfigError("packet size " + std::to_string(packet_size) + " outside [" +
                                  std::to_string(msg::HEADER_LEN) + ", " +
                                  std::to_string(msg::MAX_DATAGRAM_LEN) + "]");
        }
    }

    // Apply UDPPERF_* environment overrides. Unparseable values are ignored with a warning.
    void apply_env_overrides() {
        int64_t value;
        if (read_env_int("UDPPERF_EVICTION_TIMEOUT_MS", &value)) eviction_timeout_ns = value * NS_PER_MS;
        if (read_env_int("UDPPERF_DRAIN_GRACE_MS", &value)) drain_grace_ns = value * NS_PER_MS;
        if (read_env_int("UDPPERF_IDLE_TIMEOUT_MS", &value)) idle_timeout_ns = value * NS_PER_MS;
        if (read_env_int("UDPPERF_REPORT_INTERVAL_MS", &value)) report_interval_ms = static_cast<int>(value);
        if (read_env_int("UDPPERF_SOCKET_BUFFER_BYTES", &value)) socket_buffer_bytes = static_cast<int>(value);
    }

    void print() const {
        printf("[CONFIG] %s/%s role=%s flows=%u packet_size=%zu",
               side_name(side), mode == Mode::NORMAL ? "normal" : "reverse",
               role_name(role()), num_flows, packet_size);
        if (role() == Role::SENDER) {
            printf(" bandwidth=%.3f Mbps/flow duration=%.1fs", bandwidth_mbps, duration_s);
        }
        printf(" jitter=%s\n", jitter_mode_name(jitter_mode));
    }

private:
    static bool read_env_int(const char* name, int64_t* out) {
        const char* text = getenv(name);
        if (!text || text[0] == '\0') {
            return false;
        }
        char* end = nullptr;
        long long v = strtoll(text, &end, 10);
        if (*end != '\0' || v < 0 || v > INT32_MAX) {
            fprintf(stderr, "[WARN] Ignoring %s=%s (expected a non-negative integer)\n", name, text);
            return false;
        }
        *out = static_cast<int64_t>(v);
        return true;
    }
};

} // namespace udpperf
