#pragma once

#include "conduit/types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace conduit {
namespace protocol {

// Frame kind discriminant (first byte on the wire)
enum class FrameType : uint8_t {
    CONNECT        = 0x01,  // Handshake request, carries our nonce and limits
    CONNECT_ACK    = 0x02,  // Echoes the peer's handshake nonce
    DISCONNECT     = 0x03,  // Request teardown
    DISCONNECT_ACK = 0x04,  // Confirm teardown
    DATA           = 0x05,  // Datagrams (whole packets or fragments)
    ACK            = 0x06,  // Frame ack groups + receiver window bases
    SYNC           = 0x07,  // Sender's next frame/packet IDs (resync + keepalive)
};

const char* frameTypeToString(FrameType type);

// Handshake parameters carried by CONNECT
struct ConnectParams {
    uint8_t version = PROTOCOL_VERSION;
    uint32_t nonce = 0;
    uint8_t channel_count = MAX_CHANNELS;
    uint32_t max_receive_rate = 0;
    uint32_t max_packet_size = 0;
    uint32_t max_receive_alloc = 0;

    bool operator==(const ConnectParams&) const = default;
};

// One packet, or one fragment of a packet, inside a DATA frame.
//
// Wire format (big-endian):
// ┌──────┬───────────────────┬──────────────────┬─────────────────────┬──────┐
// │ HEAD │ SEQ:20 | WLEAD:12 │ CLEAD:12 | LEN:12│ [FRAG:16 | LAST:16] │ DATA │
// │  1B  │        4B         │        3B        │     4B (frag only)  │  N   │
// └──────┴───────────────────┴──────────────────┴─────────────────────┴──────┘
//
// HEAD: bit 7 = fragmented, bits 0..5 = channel id.
struct Datagram {
    static constexpr size_t WHOLE_HEADER_SIZE = 8;
    static constexpr size_t FRAGMENT_HEADER_SIZE = 12;
    static constexpr uint16_t MAX_LEAD = 0x0FFF;
    static constexpr size_t MAX_DATA = 0x0FFF;

    uint32_t sequence_id = 0;          // Packet sequence ID (20 bits)
    uint8_t channel_id = 0;            // 0..63
    uint16_t window_parent_lead = 0;   // Distance back to last outstanding reliable packet (0 = none)
    uint16_t channel_parent_lead = 0;  // Same, restricted to this channel
    uint16_t fragment_id = 0;
    uint16_t last_fragment_id = 0;     // 0 means whole packet
    Bytes data;

    bool isFragment() const { return last_fragment_id != 0; }
    size_t encodedSize() const;

    bool operator==(const Datagram&) const = default;
};

// Acknowledges up to 32 consecutive frames starting at base_id.
// nonce is the XOR of the nonce bits of every frame set in bitfield.
struct AckGroup {
    static constexpr size_t ENCODED_SIZE = 8;

    uint32_t base_id = 0;
    uint32_t bitfield = 0;   // bit i = frame (base_id + i) received, bit 0 always set
    bool nonce = false;

    bool operator==(const AckGroup&) const = default;
};

// A single UDP payload.
//
// Wire format (big-endian):
// ┌──────┬──────────────────────────┬───────┐
// │ KIND │ BODY (depends on kind)   │ CRC32 │
// │  1B  │                          │  4B   │
// └──────┴──────────────────────────┴───────┘
//
//   CONNECT        version:1 nonce:4 channels:1 max_recv_rate:4 max_packet:4 max_alloc:4
//   CONNECT_ACK    nonce:4
//   DISCONNECT     -
//   DISCONNECT_ACK -
//   DATA           [nonce:1 | 0:3 | frame_id:20] datagram...
//   ACK            frame_base:3 packet_base:3 count:1 group[count]
//   SYNC           next_frame_id:3 next_packet_id:3
//
// CRC covers KIND and BODY.
//
struct Frame {
    static constexpr size_t KIND_SIZE = 1;
    static constexpr size_t CRC_SIZE = 4;
    static constexpr size_t MIN_SIZE = KIND_SIZE + CRC_SIZE;

    // DATA frame bytes not available to datagrams
    static constexpr size_t DATA_HEADER_SIZE = KIND_SIZE + 3;
    static constexpr size_t DATA_OVERHEAD = DATA_HEADER_SIZE + CRC_SIZE;

    // ACK frame layout
    static constexpr size_t ACK_HEADER_SIZE = KIND_SIZE + 3 + 3 + 1;
    static constexpr size_t ACK_OVERHEAD = ACK_HEADER_SIZE + CRC_SIZE;
    static constexpr size_t MAX_ACK_GROUPS = 255;

    FrameType type = FrameType::DATA;

    // CONNECT
    ConnectParams connect;

    // CONNECT_ACK
    uint32_t nonce = 0;

    // DATA
    uint32_t frame_id = 0;
    bool nonce_bit = false;
    std::vector<Datagram> datagrams;

    // ACK
    uint32_t frame_window_base = 0;
    uint32_t packet_window_base = 0;
    std::vector<AckGroup> ack_groups;

    // SYNC
    uint32_t next_frame_id = 0;
    uint32_t next_packet_id = 0;

    Frame() = default;

    static Frame makeConnect(const ConnectParams& params);
    static Frame makeConnectAck(uint32_t nonce);
    static Frame makeDisconnect();
    static Frame makeDisconnectAck();
    static Frame makeData(uint32_t frame_id, bool nonce_bit, std::vector<Datagram> datagrams);
    static Frame makeAck(uint32_t frame_window_base, uint32_t packet_window_base,
                         std::vector<AckGroup> groups);
    static Frame makeSync(uint32_t next_frame_id, uint32_t next_packet_id);

    // Serialize frame to bytes (appends CRC)
    Bytes serialize() const;

    // Deserialize frame from bytes
    // Returns nullopt if invalid (CRC mismatch, truncated, unknown kind,
    // out-of-range field, trailing bytes)
    static std::optional<Frame> deserialize(ByteSpan data);

    // Size serialize() will produce
    size_t encodedSize() const;

    bool operator==(const Frame&) const = default;
};

// Largest fragment payload that fits a DATA frame of max_frame_size bytes
constexpr size_t fragmentPayloadSize(size_t max_frame_size) {
    return max_frame_size - Frame::DATA_OVERHEAD - Datagram::FRAGMENT_HEADER_SIZE;
}

// Debug output
std::string frameToString(const Frame& frame);

} // namespace protocol
} // namespace conduit
