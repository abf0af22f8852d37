// msg/packet_codec.hpp
// Wire format for DATA, ACK, HELLO and FIN datagrams
//
// Provides:
//   - encode_data() / encode_ack() / encode_hello() / encode_fin()
//       write one datagram into a caller buffer, return its length (0 on error)
//   - decode() - parse one datagram into a ParseResult
//
// Design:
//   - PURE FUNCTIONS: No side effects, no I/O
//   - One datagram carries exactly one packet, no batching
//
// Header layout (24 bytes, all multi-byte fields big-endian / network order):
//
//   offset  size  field
//   0       1     type      0x01 DATA, 0x02 ACK, 0x03 HELLO, 0x04 FIN
//   1       1     version   PROTOCOL_VERSION
//   2       2     reserved  zero
//   4       4     flow_id
//   8       8     seq       DATA/ACK: sequence, HELLO: flow count, FIN: packets sent
//   16      8     time_ns   DATA: send time, ACK: receiver arrival time,
//                           HELLO/FIN: sender clock at emission
//
// DATA is zero-padded to the configured packet size. ACK, HELLO and FIN are
// header-only.
#pragma once

#include "../core/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace udpperf {
namespace msg {

constexpr size_t HEADER_LEN = 24;
constexpr uint8_t PROTOCOL_VERSION = 1;

// Largest UDP payload over IPv4 (65535 - 20 IP - 8 UDP)
constexpr size_t MAX_DATAGRAM_LEN = 65507;

enum class PacketType : uint8_t {
    DATA  = 0x01,
    ACK   = 0x02,
    HELLO = 0x03,
    FIN   = 0x04
};

inline const char* packet_type_name(PacketType type) {
    switch (type) {
        case PacketType::DATA: return "DATA";
        case PacketType::ACK: return "ACK";
        case PacketType::HELLO: return "HELLO";
        case PacketType::FIN: return "FIN";
    }
    return "UNKNOWN";
}

// Data packet; payload is implied zero padding up to the packet size
struct Packet {
    uint32_t flow_id = 0;
    uint64_t seq = 0;
    int64_t send_time_ns = 0;
};

struct AckPacket {
    uint32_t flow_id = 0;
    uint64_t seq = 0;
    int64_t recv_time_ns = 0;
};

// Reverse-mode registration: client -> server, one per flow
struct HelloPacket {
    uint32_t flow_id = 0;
    uint64_t total_flows = 0;
    int64_t time_ns = 0;
};

// End of flow: sender -> receiver after the drain grace period
struct FinPacket {
    uint32_t flow_id = 0;
    uint64_t total_sent = 0;
    int64_t time_ns = 0;
};

// Result of decoding one datagram
struct ParseResult {
    bool valid = false;
    DecodeError error = DecodeError::NONE;
    PacketType type = PacketType::DATA;
    uint32_t flow_id = 0;
    uint64_t seq = 0;
    int64_t timestamp_ns = 0;
    size_t wire_len = 0;            // Full datagram length, padding included

    Packet as_data() const { return Packet{flow_id, seq, timestamp_ns}; }
    AckPacket as_ack() const { return AckPacket{flow_id, seq, timestamp_ns}; }
    HelloPacket as_hello() const { return HelloPacket{flow_id, seq, timestamp_ns}; }
    FinPacket as_fin() const { return FinPacket{flow_id, seq, timestamp_ns}; }
};

// ============================================================================
// Big-endian field access
// ============================================================================

inline void store_be32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

inline void store_be64(uint8_t* p, uint64_t v) {
    store_be32(p, static_cast<uint32_t>(v >> 32));
    store_be32(p + 4, static_cast<uint32_t>(v));
}

inline uint32_t load_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

inline uint64_t load_be64(const uint8_t* p) {
    return (static_cast<uint64_t>(load_be32(p)) << 32) | load_be32(p + 4);
}

// ============================================================================
// Encoding
// ============================================================================

inline void write_header(uint8_t* buf, PacketType type, uint32_t flow_id,
                         uint64_t seq, int64_t timestamp_ns) {
    buf[0] = static_cast<uint8_t>(type);
    buf[1] = PROTOCOL_VERSION;
    buf[2] = 0;
    buf[3] = 0;
    store_be32(buf + 4, flow_id);
    store_be64(buf + 8, seq);
    store_be64(buf + 16, static_cast<uint64_t>(timestamp_ns));
}

/**
 * Encode a DATA packet padded to packet_size
 *
 * @return packet_size, or 0 if packet_size is outside [HEADER_LEN, MAX_DATAGRAM_LEN]
 *         or does not fit in capacity
 */
inline size_t encode_data(uint8_t* buf, size_t capacity, const Packet& pkt, size_t packet_size) {
    if (!buf || packet_size < HEADER_LEN || packet_size > MAX_DATAGRAM_LEN || packet_size > capacity) {
        return 0;
    }
    write_header(buf, PacketType::DATA, pkt.flow_id, pkt.seq, pkt.send_time_ns);
    std::memset(buf + HEADER_LEN, 0, packet_size - HEADER_LEN);
    return packet_size;
}

inline size_t encode_ack(uint8_t* buf, size_t capacity, const AckPacket& ack) {
    if (!buf || capacity < HEADER_LEN) return 0;
    write_header(buf, PacketType::ACK, ack.flow_id, ack.seq, ack.recv_time_ns);
    return HEADER_LEN;
}

inline size_t encode_hello(uint8_t* buf, size_t capacity, const HelloPacket& hello) {
    if (!buf || capacity < HEADER_LEN) return 0;
    write_header(buf, PacketType::HELLO, hello.flow_id, hello.total_flows, hello.time_ns);
    return HEADER_LEN;
}

inline size_t encode_fin(uint8_t* buf, size_t capacity, const FinPacket& fin) {
    if (!buf || capacity < HEADER_LEN) return 0;
    write_header(buf, PacketType::FIN, fin.flow_id, fin.total_sent, fin.time_ns);
    return HEADER_LEN;
}

// Allocating variants
inline std::vector<uint8_t> encode(const Packet& pkt, size_t packet_size) {
    std::vector<uint8_t> out(packet_size < HEADER_LEN ? HEADER_LEN : packet_size);
    out.resize(encode_data(out.data(), out.size(), pkt, packet_size));
    return out;
}

inline std::vector<uint8_t> encode(const AckPacket& ack) {
    std::vector<uint8_t> out(HEADER_LEN);
    encode_ack(out.data(), out.size(), ack);
    return out;
}

// ============================================================================
// Decoding
// ============================================================================

/**
 * Decode one datagram
 *
 * Fails with DecodeError::TRUNCATED when len < HEADER_LEN and with
 * DecodeError::UNKNOWN_TYPE when the type tag is not recognized. The version
 * and reserved bytes are not checked. The caller drops failed datagrams.
 */
inline ParseResult decode(const uint8_t* data, size_t len) {
    ParseResult result;
    result.wire_len = len;

    if (!data || len < HEADER_LEN) {
        result.error = DecodeError::TRUNCATED;
        return result;
    }

    uint8_t tag = data[0];
    if (tag < static_cast<uint8_t>(PacketType::DATA) || tag > static_cast<uint8_t>(PacketType::FIN)) {
        result.error = DecodeError::UNKNOWN_TYPE;
        return result;
    }

    result.type = static_cast<PacketType>(tag);
    result.flow_id = load_be32(data + 4);
    result.seq = load_be64(data + 8);
    result.timestamp_ns = static_cast<int64_t>(load_be64(data + 16));
    result.valid = true;
    return result;
}

inline ParseResult decode(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

} // namespace msg
} // namespace udpperf
