#include "feedback.hpp"
#include "conduit/logging.hpp"
#include <algorithm>

namespace conduit {
namespace protocol {

FeedbackTracker::FeedbackTracker(uint32_t base_id)
    : log_(base_id)
    , next_ack_id_(base_id & ID_MASK) {
}

bool FeedbackTracker::logFrame(uint32_t frame_id, SentFrame frame) {
    frame.rate_limited = next_rate_limited_;
    next_rate_limited_ = false;
    return log_.push(frame_id, std::move(frame));
}

bool FeedbackTracker::acknowledgeGroup(const AckGroup& group, uint64_t rtt_ms,
                                       std::vector<FragmentRef>& acked_fragments) {
    if (group.bitfield == 0) {
        return false;
    }

    uint32_t span = 32;
    while (span > 0 && (group.bitfield & (1u << (span - 1))) == 0) {
        span--;
    }

    bool true_nonce = false;
    size_t recv_size = 0;
    bool rate_limited = false;
    uint64_t last_send_time = 0;

    for (uint32_t i = 0; i < span; i++) {
        const SentFrame* sent = log_.get(idAdd(group.base_id, i));
        if (!sent) {
            LOG_ACK(DEBUG, "Ack group %u/%08x rejected: frame %u not logged",
                    group.base_id, group.bitfield, idAdd(group.base_id, i));
            return false;
        }
        if (group.bitfield & (1u << i)) {
            true_nonce ^= sent->nonce;
            recv_size += sent->size;
            last_send_time = sent->send_time_ms;
        }
        rate_limited |= sent->rate_limited;
    }

    if (group.nonce != true_nonce) {
        LOG_ACK(DEBUG, "Ack group %u/%08x rejected: bad nonce", group.base_id, group.bitfield);
        return false;
    }

    for (uint32_t i = 0; i < span; i++) {
        if ((group.bitfield & (1u << i)) == 0) {
            continue;
        }
        uint32_t frame_id = idAdd(group.base_id, i);
        SentFrame* sent = log_.get(frame_id);
        for (auto& ref : sent->fragments) {
            acked_fragments.push_back(std::move(ref));
        }
        sent->fragments.clear();
        acknowledgeFrame(frame_id, rtt_ms);
    }

    if (pending_) {
        pending_->last_send_time_ms = std::max(pending_->last_send_time_ms, last_send_time);
        pending_->total_ack_size += recv_size;
        pending_->rate_limited |= rate_limited;
    } else {
        Feedback fb;
        fb.last_send_time_ms = last_send_time;
        fb.total_ack_size = recv_size;
        fb.rate_limited = rate_limited;
        pending_ = fb;
    }
    return true;
}

void FeedbackTracker::forgetFrames(uint64_t thresh_ms, uint64_t rtt_ms) {
    forgetCount(log_.countExpired(thresh_ms), rtt_ms);
}

void FeedbackTracker::forgetCount(uint32_t count, uint64_t rtt_ms) {
    count = std::min<uint32_t>(count, static_cast<uint32_t>(log_.size()));
    if (count == 0) {
        return;
    }

    uint32_t new_base = idAdd(log_.baseId(), count);
    uint32_t new_end_lead = idLead(log_.nextId(), new_base);

    // Held acks about to fall out of the log settle everything before them
    while (auto lowest = reorder_.min(next_ack_id_)) {
        if (idLead(*lowest, new_base) < new_end_lead) {
            break;
        }
        reorder_.pop(next_ack_id_);
        putNackRange(next_ack_id_, idLead(*lowest, next_ack_id_), rtt_ms);
        loss_intervals_.ack();
        next_ack_id_ = idAdd(*lowest, 1);
    }

    // Unacked frames being forgotten count as lost
    if (idLead(next_ack_id_, new_base) >= new_end_lead) {
        putNackRange(next_ack_id_, idLead(new_base, next_ack_id_), rtt_ms);
        next_ack_id_ = new_base;
    }

    log_.drainFront(count);
}

std::optional<Feedback> FeedbackTracker::takeFeedback() {
    if (pending_) {
        pending_->loss_rate = loss_intervals_.lossRate();
    }
    std::optional<Feedback> out = pending_;
    pending_.reset();
    return out;
}

void FeedbackTracker::acknowledgeFrame(uint32_t frame_id, uint64_t rtt_ms) {
    uint32_t base = log_.baseId();
    if (idLead(frame_id, base) < idLead(next_ack_id_, base)) {
        // Already settled (counted as lost, or a duplicate)
        return;
    }

    if (auto evicted = reorder_.push(next_ack_id_, frame_id)) {
        putNackRange(next_ack_id_, idLead(*evicted, next_ack_id_), rtt_ms);
        loss_intervals_.ack();
        next_ack_id_ = idAdd(*evicted, 1);
    }
}

void FeedbackTracker::putNackRange(uint32_t base_id, uint32_t count, uint64_t rtt_ms) {
    for (uint32_t i = 0; i < count; i++) {
        const SentFrame* sent = log_.get(idAdd(base_id, i));
        if (!sent) {
            continue;
        }
        loss_intervals_.nack(sent->send_time_ms, rtt_ms);
    }
}

} // namespace protocol
} // namespace conduit
