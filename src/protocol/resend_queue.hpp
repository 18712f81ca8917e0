#pragma once

#include "pending_packet.hpp"
#include <cstdint>
#include <queue>
#include <vector>

namespace conduit {
namespace protocol {

// Resend backoff: rto * 2^min(send_count, MAX_BACKOFF_EXPONENT)
constexpr uint32_t MAX_BACKOFF_EXPONENT = 4;

// True if a fragment must stay queued for retransmission.
// Reliable data is kept until acked (or delivered, which moves the peer's
// base past it); persistent data is abandoned as soon as the peer's window
// moves past it, whether delivered or superseded by a newer packet.
// Unreliable and time-sensitive data is never resent.
bool retainForResend(SendMode mode, bool fragment_acked, bool behind_sender_base);

struct ResendEntry {
    uint64_t resend_time_ms = 0;
    uint32_t send_count = 0;
    PendingPacketPtr packet;
    uint16_t fragment_id = 0;
};

/**
 * Resend Queue
 *
 * Min-heap of sent reliable/persistent fragments ordered by resend time.
 */
class ResendQueue {
public:
    void push(ResendEntry entry);

    // Earliest entry, or nullptr
    const ResendEntry* peek() const;
    ResendEntry pop();

    bool empty() const { return heap_.empty(); }
    size_t size() const { return heap_.size(); }
    void clear();

    // Resend time for the next attempt after send_count sends
    static uint64_t nextResendTime(uint64_t now_ms, uint64_t rto_ms, uint32_t send_count);

private:
    struct Later {
        bool operator()(const ResendEntry& a, const ResendEntry& b) const {
            return a.resend_time_ms > b.resend_time_ms;
        }
    };

    std::priority_queue<ResendEntry, std::vector<ResendEntry>, Later> heap_;
};

} // namespace protocol
} // namespace conduit
