#include "ack_queue.hpp"
#include "sequence.hpp"

namespace conduit {
namespace protocol {

void AckQueue::markSeen(uint32_t frame_id, bool nonce) {
    if (!entries_.empty()) {
        Entry& last = entries_.back();
        uint32_t bit = idLead(frame_id, last.base_id);
        if (bit < 32) {
            uint32_t mask = 1u << bit;
            if ((last.frame_bits & mask) == 0) {
                last.frame_bits |= mask;
                if (nonce) last.nonce_bits |= mask;
            }
            return;
        }
    }

    Entry entry;
    entry.base_id = frame_id;
    entry.frame_bits = 1;
    entry.nonce_bits = nonce ? 1 : 0;
    entries_.push_back(entry);
}

std::optional<AckGroup> AckQueue::pop() {
    if (entries_.empty()) {
        return std::nullopt;
    }

    Entry entry = entries_.front();
    entries_.pop_front();

    AckGroup group;
    group.base_id = entry.base_id;
    group.bitfield = entry.frame_bits;
    // Parity of the nonce bits that were received
    uint32_t bits = entry.nonce_bits & entry.frame_bits;
    bool parity = false;
    while (bits) {
        parity = !parity;
        bits &= bits - 1;
    }
    group.nonce = parity;
    return group;
}

} // namespace protocol
} // namespace conduit
