#include "frame_log.hpp"
#include "conduit/logging.hpp"

namespace conduit {
namespace protocol {

FrameLog::FrameLog(uint32_t base_id)
    : base_id_(base_id & ID_MASK)
    , next_id_(base_id & ID_MASK) {
}

bool FrameLog::push(uint32_t frame_id, SentFrame frame) {
    if (frame_id != next_id_) {
        LOG_ERROR("ACK", "Frame log out of order: got %u, expected %u", frame_id, next_id_);
        return false;
    }
    frames_.push_back(std::move(frame));
    next_id_ = idAdd(next_id_, 1);
    return true;
}

SentFrame* FrameLog::get(uint32_t frame_id) {
    uint32_t index = idLead(frame_id, base_id_);
    if (index >= frames_.size()) {
        return nullptr;
    }
    return &frames_[index];
}

const SentFrame* FrameLog::get(uint32_t frame_id) const {
    uint32_t index = idLead(frame_id, base_id_);
    if (index >= frames_.size()) {
        return nullptr;
    }
    return &frames_[index];
}

uint32_t FrameLog::countExpired(uint64_t thresh_ms) const {
    uint32_t count = 0;
    for (const auto& frame : frames_) {
        if (frame.send_time_ms >= thresh_ms) {
            break;
        }
        count++;
    }
    return count;
}

void FrameLog::drainFront(uint32_t count) {
    if (count > frames_.size()) {
        count = static_cast<uint32_t>(frames_.size());
    }
    frames_.erase(frames_.begin(), frames_.begin() + count);
    base_id_ = idAdd(base_id_, count);
}

} // namespace protocol
} // namespace conduit
