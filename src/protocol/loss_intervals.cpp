#include "loss_intervals.hpp"
#include "sequence.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace conduit {
namespace protocol {

// === ReorderBuffer ===

std::optional<uint32_t> ReorderBuffer::min(uint32_t base_id) const {
    if (size_ == 0) return std::nullopt;
    if (size_ == 1) return buf_[0];
    return idLead(buf_[0], base_id) < idLead(buf_[1], base_id) ? buf_[0] : buf_[1];
}

std::optional<uint32_t> ReorderBuffer::push(uint32_t base_id, uint32_t frame_id) {
    for (size_t i = 0; i < size_; i++) {
        if (buf_[i] == frame_id) {
            return std::nullopt;
        }
    }
    if (size_ < 2) {
        buf_[size_++] = frame_id;
        return std::nullopt;
    }

    size_t lo = idLead(buf_[0], base_id) < idLead(buf_[1], base_id) ? 0 : 1;
    uint32_t evicted = buf_[lo];
    buf_[lo] = frame_id;
    return evicted;
}

std::optional<uint32_t> ReorderBuffer::pop(uint32_t base_id) {
    if (size_ == 0) return std::nullopt;
    if (size_ == 1) {
        size_ = 0;
        return buf_[0];
    }

    size_ = 1;
    if (idLead(buf_[0], base_id) < idLead(buf_[1], base_id)) {
        uint32_t lowest = buf_[0];
        buf_[0] = buf_[1];
        return lowest;
    }
    return buf_[1];
}

// === LossIntervalQueue ===

void LossIntervalQueue::seed(double initial_p) {
    if (entries_.empty() || !entries_.back().is_initial || initial_p <= 0.0) {
        return;
    }
    double length = std::round(WEIGHTS[0] / initial_p);
    length = std::clamp(length, 0.0, static_cast<double>(std::numeric_limits<uint32_t>::max()));
    entries_.back().length = static_cast<uint32_t>(length);
}

void LossIntervalQueue::ack() {
    if (!entries_.empty() && entries_.front().length < std::numeric_limits<uint32_t>::max()) {
        entries_.front().length++;
    }
}

void LossIntervalQueue::nack(uint64_t send_time_ms, uint64_t rtt_ms) {
    if (entries_.empty()) {
        entries_.push_front({send_time_ms + rtt_ms, 1, 1, true});
        return;
    }

    Interval& current = entries_.front();
    if (send_time_ms >= current.end_time_ms) {
        entries_.push_front({send_time_ms + rtt_ms, 1, 1, false});
        if (entries_.size() > MAX_ENTRIES) {
            entries_.resize(MAX_ENTRIES);
        }
    } else {
        if (current.length < std::numeric_limits<uint32_t>::max()) current.length++;
        if (current.nack_count < std::numeric_limits<uint32_t>::max()) current.nack_count++;
    }
}

double LossIntervalQueue::lossRate() const {
    if (entries_.empty()) {
        return 0.0;
    }
    if (entries_.size() == 1) {
        return 1.0 / static_cast<double>(std::max<uint32_t>(entries_[0].length, 1));
    }

    // I_tot0 includes the open interval, I_tot1 does not; take the larger mean
    double i_total_0 = 0.0;
    double i_total_1 = 0.0;
    double w_total = 0.0;
    for (size_t i = 0; i + 1 < entries_.size(); i++) {
        i_total_0 += entries_[i].length * WEIGHTS[i];
        w_total += WEIGHTS[i];
    }
    for (size_t i = 1; i < entries_.size(); i++) {
        i_total_1 += entries_[i].length * WEIGHTS[i - 1];
    }
    return w_total / std::max(i_total_0, i_total_1);
}

std::vector<uint32_t> LossIntervalQueue::lengths() const {
    std::vector<uint32_t> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        out.push_back(e.length);
    }
    return out;
}

} // namespace protocol
} // namespace conduit
