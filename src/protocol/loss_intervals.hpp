#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace conduit {
namespace protocol {

/**
 * Reorder Buffer
 *
 * Holds up to two acked frame IDs that arrived ahead of the next expected
 * one. A third out-of-order ack (the third duplicate ack in TCP terms)
 * forces the oldest held ID out, declaring every frame before it lost.
 */
class ReorderBuffer {
public:
    // Lowest held ID relative to base_id
    std::optional<uint32_t> min(uint32_t base_id) const;

    // Hold frame_id; returns the ID evicted when the buffer was full
    std::optional<uint32_t> push(uint32_t base_id, uint32_t frame_id);

    // Remove and return the lowest held ID
    std::optional<uint32_t> pop(uint32_t base_id);

    size_t size() const { return size_; }

private:
    std::array<uint32_t, 2> buf_{};
    size_t size_ = 0;
};

/**
 * Loss Interval Queue (RFC 5348 section 5)
 *
 * Front entry is the open (most recent) interval. A nack opens a new
 * interval only if the lost frame was sent at least one RTT after the
 * current interval began; otherwise it is folded into the current one.
 */
class LossIntervalQueue {
public:
    static constexpr size_t MAX_ENTRIES = 9;
    static constexpr std::array<double, 8> WEIGHTS = {1.0, 1.0, 1.0, 1.0, 0.8, 0.6, 0.4, 0.2};

    // Overwrite the first interval so that it alone yields loss rate p
    void seed(double initial_p);

    void ack();
    void nack(uint64_t send_time_ms, uint64_t rtt_ms);

    double lossRate() const;

    // Interval lengths, newest first
    std::vector<uint32_t> lengths() const;
    size_t size() const { return entries_.size(); }

private:
    struct Interval {
        uint64_t end_time_ms = 0;
        uint32_t length = 0;
        uint32_t nack_count = 0;
        bool is_initial = false;
    };

    std::deque<Interval> entries_;
};

} // namespace protocol
} // namespace conduit
