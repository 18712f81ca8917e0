#include "frame.hpp"
#include "crc32.hpp"
#include "sequence.hpp"
#include "conduit/logging.hpp"
#include <algorithm>
#include <cstdio>

namespace conduit {
namespace protocol {

const char* frameTypeToString(FrameType type) {
    switch (type) {
        case FrameType::CONNECT:        return "CONNECT";
        case FrameType::CONNECT_ACK:    return "CONNECT_ACK";
        case FrameType::DISCONNECT:     return "DISCONNECT";
        case FrameType::DISCONNECT_ACK: return "DISCONNECT_ACK";
        case FrameType::DATA:           return "DATA";
        case FrameType::ACK:            return "ACK";
        case FrameType::SYNC:           return "SYNC";
        default:                        return "UNKNOWN";
    }
}

namespace {

// --- Big-endian writers ---

void putU8(Bytes& out, uint8_t v) {
    out.push_back(v);
}

void putU16(Bytes& out, uint16_t v) {
    out.push_back((v >> 8) & 0xFF);
    out.push_back(v & 0xFF);
}

void putU24(Bytes& out, uint32_t v) {
    out.push_back((v >> 16) & 0xFF);
    out.push_back((v >> 8) & 0xFF);
    out.push_back(v & 0xFF);
}

void putU32(Bytes& out, uint32_t v) {
    out.push_back((v >> 24) & 0xFF);
    out.push_back((v >> 16) & 0xFF);
    out.push_back((v >> 8) & 0xFF);
    out.push_back(v & 0xFF);
}

// Bounds-checked big-endian reader. Any overrun latches ok = false.
struct Reader {
    ByteSpan data;
    size_t pos = 0;
    bool ok = true;

    size_t remaining() const { return data.size() - pos; }

    bool need(size_t n) {
        if (!ok || remaining() < n) {
            ok = false;
            return false;
        }
        return true;
    }

    uint8_t u8() {
        if (!need(1)) return 0;
        return data[pos++];
    }

    uint16_t u16() {
        if (!need(2)) return 0;
        uint16_t v = (static_cast<uint16_t>(data[pos]) << 8) | data[pos + 1];
        pos += 2;
        return v;
    }

    uint32_t u24() {
        if (!need(3)) return 0;
        uint32_t v = (static_cast<uint32_t>(data[pos]) << 16) |
                     (static_cast<uint32_t>(data[pos + 1]) << 8) |
                     data[pos + 2];
        pos += 3;
        return v;
    }

    uint32_t u32() {
        if (!need(4)) return 0;
        uint32_t v = (static_cast<uint32_t>(data[pos]) << 24) |
                     (static_cast<uint32_t>(data[pos + 1]) << 16) |
                     (static_cast<uint32_t>(data[pos + 2]) << 8) |
                     data[pos + 3];
        pos += 4;
        return v;
    }

    // 20-bit ID in 3 bytes; top nibble must be zero
    uint32_t id() {
        uint32_t v = u24();
        if (!idValid(v)) ok = false;
        return v & ID_MASK;
    }
};

constexpr uint8_t DATAGRAM_FRAGMENT_FLAG = 0x80;
constexpr uint8_t DATAGRAM_CHANNEL_MASK = 0x3F;
constexpr uint32_t DATA_NONCE_FLAG = 0x800000;

void writeDatagram(Bytes& out, const Datagram& dg) {
    uint8_t head = dg.channel_id & DATAGRAM_CHANNEL_MASK;
    if (dg.isFragment()) head |= DATAGRAM_FRAGMENT_FLAG;
    putU8(out, head);
    putU32(out, ((dg.sequence_id & ID_MASK) << 12) | (dg.window_parent_lead & Datagram::MAX_LEAD));
    putU24(out, (static_cast<uint32_t>(dg.channel_parent_lead & Datagram::MAX_LEAD) << 12) |
                (static_cast<uint32_t>(dg.data.size()) & Datagram::MAX_DATA));
    if (dg.isFragment()) {
        putU16(out, dg.fragment_id);
        putU16(out, dg.last_fragment_id);
    }
    out.insert(out.end(), dg.data.begin(), dg.data.end());
}

bool readDatagram(Reader& r, Datagram& dg) {
    uint8_t head = r.u8();
    uint32_t word = r.u32();
    uint32_t word2 = r.u24();
    if (!r.ok) return false;

    if (head & 0x40) return false;  // Reserved bit
    if ((head & DATAGRAM_CHANNEL_MASK) >= MAX_CHANNELS) return false;

    dg.channel_id = head & DATAGRAM_CHANNEL_MASK;
    dg.sequence_id = word >> 12;
    dg.window_parent_lead = static_cast<uint16_t>(word & Datagram::MAX_LEAD);
    dg.channel_parent_lead = static_cast<uint16_t>(word2 >> 12);
    size_t len = word2 & Datagram::MAX_DATA;

    if (head & DATAGRAM_FRAGMENT_FLAG) {
        dg.fragment_id = r.u16();
        dg.last_fragment_id = r.u16();
        if (!r.ok) return false;
        // A single-fragment packet is always sent whole
        if (dg.last_fragment_id == 0 || dg.fragment_id > dg.last_fragment_id) return false;
    } else {
        dg.fragment_id = 0;
        dg.last_fragment_id = 0;
    }

    if (!r.need(len)) return false;
    dg.data.assign(r.data.begin() + r.pos, r.data.begin() + r.pos + len);
    r.pos += len;
    return true;
}

} // namespace

size_t Datagram::encodedSize() const {
    return (isFragment() ? FRAGMENT_HEADER_SIZE : WHOLE_HEADER_SIZE) + data.size();
}

// Factory methods

Frame Frame::makeConnect(const ConnectParams& params) {
    Frame f;
    f.type = FrameType::CONNECT;
    f.connect = params;
    return f;
}

Frame Frame::makeConnectAck(uint32_t nonce) {
    Frame f;
    f.type = FrameType::CONNECT_ACK;
    f.nonce = nonce;
    return f;
}

Frame Frame::makeDisconnect() {
    Frame f;
    f.type = FrameType::DISCONNECT;
    return f;
}

Frame Frame::makeDisconnectAck() {
    Frame f;
    f.type = FrameType::DISCONNECT_ACK;
    return f;
}

Frame Frame::makeData(uint32_t frame_id, bool nonce_bit, std::vector<Datagram> datagrams) {
    Frame f;
    f.type = FrameType::DATA;
    f.frame_id = frame_id & ID_MASK;
    f.nonce_bit = nonce_bit;
    f.datagrams = std::move(datagrams);
    return f;
}

Frame Frame::makeAck(uint32_t frame_window_base, uint32_t packet_window_base,
                     std::vector<AckGroup> groups) {
    Frame f;
    f.type = FrameType::ACK;
    f.frame_window_base = frame_window_base & ID_MASK;
    f.packet_window_base = packet_window_base & ID_MASK;
    f.ack_groups = std::move(groups);
    return f;
}

Frame Frame::makeSync(uint32_t next_frame_id, uint32_t next_packet_id) {
    Frame f;
    f.type = FrameType::SYNC;
    f.next_frame_id = next_frame_id & ID_MASK;
    f.next_packet_id = next_packet_id & ID_MASK;
    return f;
}

size_t Frame::encodedSize() const {
    size_t body = 0;
    switch (type) {
        case FrameType::CONNECT:
            body = 1 + 4 + 1 + 4 + 4 + 4;
            break;
        case FrameType::CONNECT_ACK:
            body = 4;
            break;
        case FrameType::DISCONNECT:
        case FrameType::DISCONNECT_ACK:
            body = 0;
            break;
        case FrameType::DATA:
            body = 3;
            for (const auto& dg : datagrams) body += dg.encodedSize();
            break;
        case FrameType::ACK:
            body = 3 + 3 + 1 + ack_groups.size() * AckGroup::ENCODED_SIZE;
            break;
        case FrameType::SYNC:
            body = 3 + 3;
            break;
    }
    return KIND_SIZE + body + CRC_SIZE;
}

Bytes Frame::serialize() const {
    Bytes result;
    result.reserve(encodedSize());

    // KIND (1 byte)
    putU8(result, static_cast<uint8_t>(type));

    switch (type) {
        case FrameType::CONNECT:
            putU8(result, connect.version);
            putU32(result, connect.nonce);
            putU8(result, connect.channel_count);
            putU32(result, connect.max_receive_rate);
            putU32(result, connect.max_packet_size);
            putU32(result, connect.max_receive_alloc);
            break;

        case FrameType::CONNECT_ACK:
            putU32(result, nonce);
            break;

        case FrameType::DISCONNECT:
        case FrameType::DISCONNECT_ACK:
            break;

        case FrameType::DATA:
            putU24(result, (frame_id & ID_MASK) | (nonce_bit ? DATA_NONCE_FLAG : 0));
            for (const auto& dg : datagrams) {
                writeDatagram(result, dg);
            }
            break;

        case FrameType::ACK: {
            putU24(result, frame_window_base & ID_MASK);
            putU24(result, packet_window_base & ID_MASK);
            size_t count = std::min(ack_groups.size(), MAX_ACK_GROUPS);
            putU8(result, static_cast<uint8_t>(count));
            for (size_t i = 0; i < count; i++) {
                putU24(result, ack_groups[i].base_id & ID_MASK);
                putU32(result, ack_groups[i].bitfield);
                putU8(result, ack_groups[i].nonce ? 1 : 0);
            }
            break;
        }

        case FrameType::SYNC:
            putU24(result, next_frame_id & ID_MASK);
            putU24(result, next_packet_id & ID_MASK);
            break;
    }

    // CRC32 (4 bytes, big-endian) - calculated over everything before CRC
    putU32(result, crc32(result));

    return result;
}

std::optional<Frame> Frame::deserialize(ByteSpan data) {
    if (data.size() < MIN_SIZE) {
        return std::nullopt;
    }

    // Verify CRC before looking at anything else
    size_t body_end = data.size() - CRC_SIZE;
    uint32_t expected = (static_cast<uint32_t>(data[body_end]) << 24) |
                        (static_cast<uint32_t>(data[body_end + 1]) << 16) |
                        (static_cast<uint32_t>(data[body_end + 2]) << 8) |
                        data[body_end + 3];
    if (crc32(data.first(body_end)) != expected) {
        LOG_FRAME(TRACE, "CRC mismatch (%zu bytes)", data.size());
        return std::nullopt;
    }

    Reader r{data.first(body_end)};
    uint8_t kind = r.u8();
    if (kind < static_cast<uint8_t>(FrameType::CONNECT) ||
        kind > static_cast<uint8_t>(FrameType::SYNC)) {
        return std::nullopt;
    }

    Frame frame;
    frame.type = static_cast<FrameType>(kind);

    switch (frame.type) {
        case FrameType::CONNECT:
            frame.connect.version = r.u8();
            frame.connect.nonce = r.u32();
            frame.connect.channel_count = r.u8();
            frame.connect.max_receive_rate = r.u32();
            frame.connect.max_packet_size = r.u32();
            frame.connect.max_receive_alloc = r.u32();
            break;

        case FrameType::CONNECT_ACK:
            frame.nonce = r.u32();
            break;

        case FrameType::DISCONNECT:
        case FrameType::DISCONNECT_ACK:
            break;

        case FrameType::DATA: {
            uint32_t word = r.u24();
            if (!r.ok) return std::nullopt;
            if (word & 0x700000) return std::nullopt;
            frame.frame_id = word & ID_MASK;
            frame.nonce_bit = (word & DATA_NONCE_FLAG) != 0;
            while (r.ok && r.remaining() > 0) {
                Datagram dg;
                if (!readDatagram(r, dg)) return std::nullopt;
                frame.datagrams.push_back(std::move(dg));
            }
            if (frame.datagrams.empty()) return std::nullopt;
            break;
        }

        case FrameType::ACK: {
            frame.frame_window_base = r.id();
            frame.packet_window_base = r.id();
            size_t count = r.u8();
            if (!r.ok || r.remaining() != count * AckGroup::ENCODED_SIZE) return std::nullopt;
            frame.ack_groups.reserve(count);
            for (size_t i = 0; i < count; i++) {
                AckGroup group;
                group.base_id = r.id();
                group.bitfield = r.u32();
                uint8_t nonce = r.u8();
                if (nonce > 1 || (group.bitfield & 1) == 0) return std::nullopt;
                group.nonce = nonce != 0;
                frame.ack_groups.push_back(group);
            }
            break;
        }

        case FrameType::SYNC:
            frame.next_frame_id = r.id();
            frame.next_packet_id = r.id();
            break;
    }

    // Truncated, or trailing bytes after a fixed-size body
    if (!r.ok || r.remaining() != 0) {
        return std::nullopt;
    }

    return frame;
}

std::string frameToString(const Frame& frame) {
    char buf[160];
    switch (frame.type) {
        case FrameType::CONNECT:
            snprintf(buf, sizeof(buf), "CONNECT v%u nonce=%08X ch=%u rate=%u pkt=%u alloc=%u",
                     frame.connect.version, frame.connect.nonce, frame.connect.channel_count,
                     frame.connect.max_receive_rate, frame.connect.max_packet_size,
                     frame.connect.max_receive_alloc);
            break;
        case FrameType::CONNECT_ACK:
            snprintf(buf, sizeof(buf), "CONNECT_ACK nonce=%08X", frame.nonce);
            break;
        case FrameType::DATA:
            snprintf(buf, sizeof(buf), "DATA id=%u nonce=%d datagrams=%zu",
                     frame.frame_id, frame.nonce_bit ? 1 : 0, frame.datagrams.size());
            break;
        case FrameType::ACK:
            snprintf(buf, sizeof(buf), "ACK fbase=%u pbase=%u groups=%zu",
                     frame.frame_window_base, frame.packet_window_base, frame.ack_groups.size());
            break;
        case FrameType::SYNC:
            snprintf(buf, sizeof(buf), "SYNC next_frame=%u next_packet=%u",
                     frame.next_frame_id, frame.next_packet_id);
            break;
        default:
            snprintf(buf, sizeof(buf), "%s", frameTypeToString(frame.type));
            break;
    }
    return buf;
}

} // namespace protocol
} // namespace conduit
