#pragma once

#include "pending_packet.hpp"
#include "sequence.hpp"
#include <cstdint>
#include <deque>
#include <vector>

namespace conduit {
namespace protocol {

// One fragment carried by a sent frame
struct FragmentRef {
    PendingPacketPtr packet;
    uint16_t fragment_id = 0;
};

// Sender-side record of a DATA frame
struct SentFrame {
    uint64_t send_time_ms = 0;
    size_t size = 0;                 // Encoded bytes
    bool nonce = false;
    bool rate_limited = false;       // Sender was held back by its rate just before this frame
    std::vector<FragmentRef> fragments;
};

/**
 * Frame Log
 *
 * Contiguous record of DATA frames sent but not yet forgotten, indexed by
 * frame ID. Ack groups are validated against it; frames are dropped from
 * the front once they can no longer be acknowledged.
 */
class FrameLog {
public:
    explicit FrameLog(uint32_t base_id);

    // frame_id must equal nextId()
    bool push(uint32_t frame_id, SentFrame frame);

    // nullptr if frame_id is not in [baseId(), nextId())
    SentFrame* get(uint32_t frame_id);
    const SentFrame* get(uint32_t frame_id) const;

    // Number of frames at the front sent before thresh_ms
    uint32_t countExpired(uint64_t thresh_ms) const;

    void drainFront(uint32_t count);

    uint32_t baseId() const { return base_id_; }
    uint32_t nextId() const { return next_id_; }
    size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }

private:
    uint32_t base_id_;
    uint32_t next_id_;
    std::deque<SentFrame> frames_;
};

} // namespace protocol
} // namespace conduit
