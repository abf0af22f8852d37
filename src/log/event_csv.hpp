// log/event_csv.hpp
// CSV sink and reader for the per-packet event stream
//
// One row per event, empty field when a column does not apply:
//
//   event,flow_id,packet_number,time_ns,send_time_ns,inter_packet_delay_ns,rtt_ns,bytes,count,flag
//   send,0,17,1200000,,,,,,
//   recv,0,17,1250000,1200000,100000,,1400,,reordered
//   ack,0,17,1300000,,,100000,,,
//   loss,0,18,1400000,,,,,3,gap
//
// time_ns is the send, receive, ACK arrival or loss detection time.
#pragma once

#include "../flow/flow_event.hpp"
#include <cerrno>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace udpperf {

constexpr const char* EVENT_CSV_HEADER =
    "event,flow_id,packet_number,time_ns,send_time_ns,inter_packet_delay_ns,rtt_ns,bytes,count,flag";

/**
 * EventCsvWriter - buffered CSV sink (RAII over FILE*)
 *
 * The header row is written on open.
 */
class EventCsvWriter {
public:
    EventCsvWriter() : file_(nullptr), rows_(0) {}

    explicit EventCsvWriter(const std::string& path) : file_(nullptr), rows_(0) {
        open(path);
    }

    ~EventCsvWriter() {
        if (file_ && !close_file()) {
            fprintf(stderr, "[WARN] Failed to write %s\n", path_.c_str());
        }
    }

    EventCsvWriter(const EventCsvWriter&) = delete;
    EventCsvWriter& operator=(const EventCsvWriter&) = delete;

    // @throws std::runtime_error if the file cannot be created
    void open(const std::string& path) {
        close();
        file_ = fopen(path.c_str(), "w");
        if (!file_) {
            throw std::runtime_error("Failed to open " + path + ": " + strerror(errno));
        }
        path_ = path;
        fprintf(file_, "%s\n", EVENT_CSV_HEADER);
    }

    void write(const FlowEvent& ev) {
        std::visit([this](const auto& e) { write_row(e); }, ev);
        rows_++;
    }

    void write_all(const std::vector<FlowEvent>& events) {
        for (const auto& ev : events) write(ev);
    }

    // @throws std::runtime_error if buffered rows could not be written
    void close() {
        if (file_ && !close_file()) {
            throw std::runtime_error("Failed to write " + path_);
        }
    }

    size_t rows() const { return rows_; }

private:
    bool close_file() {
        bool ok = ferror(file_) == 0;
        if (fclose(file_) != 0) ok = false;
        file_ = nullptr;
        return ok;
    }

    void write_row(const SendEvent& e) {
        fprintf(file_, "send,%u,%" PRIu64 ",%" PRId64 ",,,,,,\n", e.flow_id, e.seq, e.send_time_ns);
    }

    void write_row(const RecvEvent& e) {
        fprintf(file_, "recv,%u,%" PRIu64 ",%" PRId64 ",%" PRId64 ",", e.flow_id, e.seq, e.recv_time_ns, e.send_time_ns);
        if (e.inter_packet_delay_ns) {
            fprintf(file_, "%" PRId64, *e.inter_packet_delay_ns);
        }
        fprintf(file_, ",,%u,,%s\n", e.bytes, e.reordered ? "reordered" : "");
    }

    void write_row(const AckEvent& e) {
        fprintf(file_, "ack,%u,%" PRIu64 ",%" PRId64 ",,,%" PRId64 ",,,\n", e.flow_id, e.seq, e.ack_time_ns, e.rtt_ns);
    }

    void write_row(const LossEvent& e) {
        fprintf(file_, "loss,%u,%" PRIu64 ",%" PRId64 ",,,,,%" PRIu64 ",%s\n",
                e.flow_id, e.seq, e.time_ns, e.count, loss_reason_name(e.reason));
    }

    FILE* file_;
    std::string path_;
    size_t rows_;
};

struct EventCsvReadResult {
    std::vector<FlowEvent> events;
    size_t bad_rows = 0;        // Unparseable rows, skipped
};

namespace detail {

// Split one CSV line (no quoting) into exactly 10 fields
inline bool split_event_row(char* line, char* fields[10]) {
    size_t len = strlen(line);
    while (len > 0 && (line[len - 1] == '\n' || line[len - 1] == '\r')) {
        line[--len] = '\0';
    }

    int n = 0;
    char* p = line;
    fields[n++] = p;
    for (; *p; p++) {
        if (*p == ',') {
            if (n == 10) return false;
            *p = '\0';
            fields[n++] = p + 1;
        }
    }
    return n == 10;
}

inline bool parse_i64(const char* s, int64_t* out) {
    if (!s || *s == '\0') return false;
    char* end = nullptr;
    errno = 0;
    long long v = strtoll(s, &end, 10);
    if (*end != '\0' || errno == ERANGE) return false;
    *out = static_cast<int64_t>(v);
    return true;
}

inline bool parse_u64(const char* s, uint64_t* out) {
    if (!s || *s == '\0' || *s == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = strtoull(s, &end, 10);
    if (*end != '\0' || errno == ERANGE) return false;
    *out = static_cast<uint64_t>(v);
    return true;
}

inline bool parse_event_row(char* line, FlowEvent* out) {
    char* f[10];
    if (!split_event_row(line, f)) return false;

    uint64_t flow_id, seq;
    int64_t time_ns;
    if (!parse_u64(f[1], &flow_id) || flow_id > UINT32_MAX) return false;
    if (!parse_u64(f[2], &seq) || !parse_i64(f[3], &time_ns)) return false;
    uint32_t flow = static_cast<uint32_t>(flow_id);

    if (strcmp(f[0], "send") == 0) {
        *out = SendEvent{flow, seq, time_ns};
        return true;
    }
    if (strcmp(f[0], "recv") == 0) {
        RecvEvent ev;
        ev.flow_id = flow;
        ev.seq = seq;
        ev.recv_time_ns = time_ns;
        uint64_t bytes;
        if (!parse_i64(f[4], &ev.send_time_ns) || !parse_u64(f[7], &bytes)) return false;
        ev.bytes = static_cast<uint32_t>(bytes);
        if (f[5][0] != '\0') {
            int64_t ipd;
            if (!parse_i64(f[5], &ipd)) return false;
            ev.inter_packet_delay_ns = ipd;
        }
        ev.reordered = strcmp(f[9], "reordered") == 0;
        *out = ev;
        return true;
    }
    if (strcmp(f[0], "ack") == 0) {
        int64_t rtt;
        if (!parse_i64(f[6], &rtt)) return false;
        *out = AckEvent{flow, seq, time_ns, rtt};
        return true;
    }
    if (strcmp(f[0], "loss") == 0) {
        uint64_t count;
        if (!parse_u64(f[8], &count)) return false;
        LossReason reason;
        if (strcmp(f[9], "gap") == 0) {
            reason = LossReason::GAP;
        } else if (strcmp(f[9], "evicted") == 0) {
            reason = LossReason::EVICTED;
        } else {
            return false;
        }
        *out = LossEvent{flow, seq, count, time_ns, reason};
        return true;
    }
    return false;
}

} // namespace detail

/**
 * Read an event CSV written by EventCsvWriter
 *
 * The header row is optional. Unparseable rows are skipped and counted.
 *
 * @throws std::runtime_error if the file cannot be opened
 */
inline EventCsvReadResult read_event_csv(const std::string& path) {
    FILE* file = fopen(path.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Failed to open " + path + ": " + strerror(errno));
    }

    EventCsvReadResult result;
    char line[1024];
    bool first = true;
    while (fgets(line, sizeof(line), file)) {
        if (first) {
            first = false;
            if (strncmp(line, "event,", 6) == 0) continue;
        }
        if (line[0] == '\n' || line[0] == '\0') continue;

        FlowEvent ev;
        if (detail::parse_event_row(line, &ev)) {
            result.events.push_back(ev);
        } else {
            result.bad_rows++;
        }
    }
    fclose(file);
    return result;
}

} // namespace udpperf
