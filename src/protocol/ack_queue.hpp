#pragma once

#include "frame.hpp"
#include <deque>
#include <optional>

namespace conduit {
namespace protocol {

/**
 * Receiver-side ack group builder
 *
 * Each accepted DATA frame is recorded with the sender's nonce bit.
 * Consecutive IDs are folded into 32-frame groups; a group's nonce is the
 * XOR of the nonce bits it covers, which the sender recomputes to prove the
 * ack came from someone who actually received those frames.
 */
class AckQueue {
public:
    void markSeen(uint32_t frame_id, bool nonce);

    // Oldest pending group, or nullopt
    std::optional<AckGroup> pop();

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

private:
    struct Entry {
        uint32_t base_id = 0;
        uint32_t frame_bits = 0;
        uint32_t nonce_bits = 0;
    };

    std::deque<Entry> entries_;
};

} // namespace protocol
} // namespace conduit
