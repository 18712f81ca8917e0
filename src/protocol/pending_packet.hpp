#pragma once

#include "conduit/types.hpp"
#include <algorithm>
#include <memory>
#include <vector>

namespace conduit {
namespace protocol {

// An outbound packet that has been assigned a sequence ID.
// Shared between the first-send queue, the resend queue and the frame log
// so that an ack for any frame carrying a fragment can mark it delivered.
struct PendingPacket {
    uint32_t sequence_id = 0;
    uint8_t channel_id = 0;
    SendMode mode = SendMode::RELIABLE;
    uint16_t window_parent_lead = 0;
    uint16_t channel_parent_lead = 0;
    uint32_t flush_id = 0;          // TIME_SENSITIVE: the only flush it may go out in
    uint16_t last_fragment_id = 0;
    size_t fragment_size = 0;       // Payload bytes per fragment (last may be shorter)
    size_t alloc_size = 0;          // Receive allocation the peer holds for it
    Bytes data;

    std::vector<bool> fragment_acked;
    size_t acked_count = 0;
    bool released = false;          // Sender window base has passed this packet

    bool isResendable() const {
        return mode == SendMode::RELIABLE || mode == SendMode::PERSISTENT;
    }

    bool fullyAcked() const { return acked_count == fragment_acked.size(); }

    // Payload bytes carried by one fragment
    size_t fragmentBytes(uint16_t fragment_id) const {
        size_t begin = static_cast<size_t>(fragment_id) * fragment_size;
        if (begin >= data.size()) return 0;
        return std::min(fragment_size, data.size() - begin);
    }
};

using PendingPacketPtr = std::shared_ptr<PendingPacket>;

} // namespace protocol
} // namespace conduit
