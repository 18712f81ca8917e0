#include "frame_window.hpp"
#include "conduit/logging.hpp"
#include <algorithm>

namespace conduit {
namespace protocol {

const char* frameVerdictToString(FrameWindow::Verdict verdict) {
    switch (verdict) {
        case FrameWindow::Verdict::ACCEPTED:  return "ACCEPTED";
        case FrameWindow::Verdict::DUPLICATE: return "DUPLICATE";
        case FrameWindow::Verdict::STALE:     return "STALE";
        case FrameWindow::Verdict::AHEAD:     return "AHEAD";
        default:                              return "UNKNOWN";
    }
}

FrameWindow::FrameWindow(uint32_t base_id)
    : base_id_(base_id & ID_MASK)
    , seen_(FRAME_WINDOW_SIZE, false) {
}

FrameWindow::Verdict FrameWindow::accept(uint32_t frame_id) {
    uint32_t lead = idLead(frame_id, base_id_);

    if (lead >= ID_HALF) {
        return Verdict::STALE;
    }
    if (lead >= FRAME_WINDOW_SIZE) {
        LOG_WINDOW(DEBUG, "Frame %u is %u ahead of base %u", frame_id, lead, base_id_);
        return Verdict::AHEAD;
    }

    size_t slot = frame_id % FRAME_WINDOW_SIZE;
    if (seen_[slot]) {
        return Verdict::DUPLICATE;
    }
    seen_[slot] = true;

    // Keep the upper half of the window free
    if (lead >= FRAME_WINDOW_SIZE / 2) {
        advanceTo(idSub(frame_id, FRAME_WINDOW_SIZE / 2 - 1));
    }

    return Verdict::ACCEPTED;
}

bool FrameWindow::resynchronize(uint32_t next_frame_id) {
    uint32_t target = idSub(next_frame_id, FRAME_WINDOW_SIZE / 2);
    if (!idAhead(target, base_id_)) {
        return false;
    }
    LOG_WINDOW(DEBUG, "Frame window resync %u -> %u", base_id_, target);
    advanceTo(target);
    return true;
}

void FrameWindow::advanceTo(uint32_t new_base) {
    uint32_t distance = idLead(new_base, base_id_);
    if (distance >= FRAME_WINDOW_SIZE) {
        std::fill(seen_.begin(), seen_.end(), false);
    } else {
        for (uint32_t i = 0; i < distance; i++) {
            seen_[idAdd(base_id_, i) % FRAME_WINDOW_SIZE] = false;
        }
    }
    base_id_ = new_base & ID_MASK;
}

} // namespace protocol
} // namespace conduit
