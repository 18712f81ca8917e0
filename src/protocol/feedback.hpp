#pragma once

#include "frame.hpp"
#include "frame_log.hpp"
#include "loss_intervals.hpp"
#include <optional>
#include <vector>

namespace conduit {
namespace protocol {

// Accumulated result of validated acks since the last congestion step
struct Feedback {
    uint64_t last_send_time_ms = 0;   // Send time of the newest acked frame
    size_t total_ack_size = 0;        // Encoded bytes acknowledged
    double loss_rate = 0.0;
    bool rate_limited = false;

    bool operator==(const Feedback&) const = default;
};

/**
 * Feedback Tracker
 *
 * Sender half of the ack path. Logs every DATA frame sent, validates ack
 * groups against the log and the per-frame nonce bits, feeds acks and
 * inferred losses into the loss interval history, and accumulates
 * Feedback for the rate controller.
 *
 * An ack group is rejected whole if any frame in its span is no longer
 * logged or if its nonce does not match the XOR of the acked frames'
 * nonce bits. A frame is declared lost once three later frames have been
 * acked, or when it is forgotten without being acked.
 */
class FeedbackTracker {
public:
    explicit FeedbackTracker(uint32_t base_id);

    bool logFrame(uint32_t frame_id, SentFrame frame);

    // Mark the next logged frame as sent after a rate-limited pause
    void logRateLimited() { next_rate_limited_ = true; }

    // Validate and apply one ack group. Fragment refs of newly acked frames
    // are moved into acked_fragments. Returns false if the group is rejected.
    bool acknowledgeGroup(const AckGroup& group, uint64_t rtt_ms,
                          std::vector<FragmentRef>& acked_fragments);

    // Forget frames sent before thresh_ms
    void forgetFrames(uint64_t thresh_ms, uint64_t rtt_ms);

    // Forget the oldest count frames regardless of age
    void forgetCount(uint32_t count, uint64_t rtt_ms);

    void seedLossRate(double initial_p) { loss_intervals_.seed(initial_p); }

    std::optional<Feedback> takeFeedback();

    double lossRate() const { return loss_intervals_.lossRate(); }
    std::vector<uint32_t> lossIntervalLengths() const { return loss_intervals_.lengths(); }

    uint32_t nextAckId() const { return next_ack_id_; }
    uint32_t logBaseId() const { return log_.baseId(); }
    uint32_t logNextId() const { return log_.nextId(); }
    size_t logSize() const { return log_.size(); }

private:
    void acknowledgeFrame(uint32_t frame_id, uint64_t rtt_ms);
    void putNackRange(uint32_t base_id, uint32_t count, uint64_t rtt_ms);

    FrameLog log_;
    bool next_rate_limited_ = false;

    uint32_t next_ack_id_;
    ReorderBuffer reorder_;
    LossIntervalQueue loss_intervals_;

    std::optional<Feedback> pending_;
};

} // namespace protocol
} // namespace conduit
