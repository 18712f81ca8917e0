#pragma once

#include "conduit/types.hpp"
#include <deque>
#include <random>
#include <vector>

namespace conduit {
namespace sim {

/**
 * Lossy Link
 *
 * One direction of a simulated UDP path driven by a virtual clock:
 * - Fixed one-way latency
 * - Deterministic loss (every Nth datagram) and/or random loss
 * - Random single-bit corruption
 *
 * Seeded, so a given run is reproducible.
 */
class LossyLink {
public:
    struct Config {
        uint64_t latency_ms = 0;

        // Drop every Nth datagram written (0 = off)
        uint32_t drop_every = 0;

        // Independent random loss
        float drop_probability = 0.0f;

        // Flip one random bit of a delivered datagram
        float corrupt_probability = 0.0f;
    };

    struct Stats {
        size_t written = 0;
        size_t dropped = 0;
        size_t corrupted = 0;
        size_t delivered = 0;
    };

    explicit LossyLink(const Config& config, uint32_t seed = 42)
        : config_(config)
        , rng_(seed)
        , uniform_(0.0f, 1.0f)
    {
    }

    // Put a datagram on the link at now_ms
    void write(const Bytes& data, uint64_t now_ms) {
        stats_.written++;

        if (config_.drop_every > 0 && stats_.written % config_.drop_every == 0) {
            stats_.dropped++;
            return;
        }
        if (config_.drop_probability > 0.0f && uniform_(rng_) < config_.drop_probability) {
            stats_.dropped++;
            return;
        }

        InFlight f;
        f.deliver_at_ms = now_ms + config_.latency_ms;
        f.data = data;

        if (config_.corrupt_probability > 0.0f && !f.data.empty() &&
            uniform_(rng_) < config_.corrupt_probability) {
            std::uniform_int_distribution<size_t> bit(0, f.data.size() * 8 - 1);
            size_t b = bit(rng_);
            f.data[b / 8] ^= static_cast<uint8_t>(1u << (b % 8));
            stats_.corrupted++;
        }

        queue_.push_back(std::move(f));
    }

    // Datagrams due by now_ms, in send order
    std::vector<Bytes> read(uint64_t now_ms) {
        std::vector<Bytes> out;
        while (!queue_.empty() && queue_.front().deliver_at_ms <= now_ms) {
            out.push_back(std::move(queue_.front().data));
            queue_.pop_front();
            stats_.delivered++;
        }
        return out;
    }

    size_t inFlight() const { return queue_.size(); }
    const Stats& stats() const { return stats_; }
    const Config& config() const { return config_; }

    void clear() { queue_.clear(); }

private:
    struct InFlight {
        uint64_t deliver_at_ms = 0;
        Bytes data;
    };

    Config config_;
    std::mt19937 rng_;
    std::uniform_real_distribution<float> uniform_;
    std::deque<InFlight> queue_;
    Stats stats_;
};

} // namespace sim
} // namespace conduit
