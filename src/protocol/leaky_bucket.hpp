#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace conduit {
namespace protocol {

/**
 * Leaky bucket pacing the sender at the TFRC rate.
 *
 * Credit is refilled only by refill(), which the engine calls from step();
 * flush() spends credit but never adds any.
 */
class LeakyBucket {
public:
    explicit LeakyBucket(size_t initial_credit)
        : credit_(static_cast<double>(initial_credit)) {}

    // Add rate * dt bytes, capped at max(rate * rtt, min_cap)
    void refill(uint32_t rate, uint64_t dt_ms, uint64_t rtt_ms, size_t min_cap) {
        double cap = std::max(static_cast<double>(rate) * rtt_ms / 1000.0, static_cast<double>(min_cap));
        credit_ = std::min(credit_ + static_cast<double>(rate) * dt_ms / 1000.0, cap);
    }

    bool canSpend(size_t bytes) const { return credit_ >= static_cast<double>(bytes); }

    void spend(size_t bytes) { credit_ -= static_cast<double>(bytes); }

    double credit() const { return credit_; }

private:
    double credit_;
};

} // namespace protocol
} // namespace conduit
