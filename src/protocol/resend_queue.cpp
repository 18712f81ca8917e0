#include "resend_queue.hpp"
#include <algorithm>

namespace conduit {
namespace protocol {

bool retainForResend(SendMode mode, bool fragment_acked, bool behind_sender_base) {
    switch (mode) {
        case SendMode::RELIABLE:
            // The peer only moves its base past a reliable packet once it
            // has delivered it, so that counts as an ack
            return !fragment_acked && !behind_sender_base;
        case SendMode::PERSISTENT:
            return !fragment_acked && !behind_sender_base;
        case SendMode::UNRELIABLE:
        case SendMode::TIME_SENSITIVE:
        default:
            return false;
    }
}

void ResendQueue::push(ResendEntry entry) {
    heap_.push(std::move(entry));
}

const ResendEntry* ResendQueue::peek() const {
    return heap_.empty() ? nullptr : &heap_.top();
}

ResendEntry ResendQueue::pop() {
    ResendEntry entry = heap_.top();
    heap_.pop();
    return entry;
}

void ResendQueue::clear() {
    heap_ = {};
}

uint64_t ResendQueue::nextResendTime(uint64_t now_ms, uint64_t rto_ms, uint32_t send_count) {
    uint32_t exponent = std::min(send_count, MAX_BACKOFF_EXPONENT);
    return now_ms + rto_ms * (1ull << exponent);
}

} // namespace protocol
} // namespace conduit
