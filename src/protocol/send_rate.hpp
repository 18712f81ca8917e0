#pragma once

#include "conduit/types.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace conduit {
namespace protocol {

// TFRC constants (RFC 5348)
constexpr uint32_t TFRC_SEGMENT_SIZE = MAX_FRAME_SIZE;           // s
constexpr uint32_t TFRC_INITIAL_WINDOW = 4380;                   // Section 4.2
constexpr uint32_t TFRC_MINIMUM_RATE = TFRC_SEGMENT_SIZE / 64;   // s / t_mbi
constexpr uint64_t TFRC_INITIAL_NOFEEDBACK_MS = 2000;
constexpr double TFRC_RTT_ALPHA = 0.1;

// TCP throughput equation, bytes/s for RTT rtt_s and loss event rate p
uint32_t tcpThroughput(double rtt_s, double p);

// Loss event rate at which tcpThroughput() is within 5% of target_rate
double tcpThroughputInverse(double rtt_s, uint32_t target_rate);

/**
 * Receive rate set (X_recv_set, RFC 5348 section 4.3)
 */
class RecvRateSet {
public:
    void resetInitial(uint64_t now_ms);
    void reset(uint64_t now_ms, uint32_t rate);

    uint32_t rateLimitedUpdate(uint64_t now_ms, uint32_t recv_rate, uint64_t rtt_ms);
    uint32_t lossIncreaseUpdate(uint64_t now_ms, uint32_t recv_rate);
    uint32_t dataLimitedUpdate(uint64_t now_ms, uint32_t recv_rate);

    uint32_t max() const;

private:
    struct Entry {
        uint32_t value = 0;
        uint64_t timestamp_ms = 0;
        bool is_initial = false;
    };

    uint32_t replaceMax(uint64_t now_ms, uint32_t recv_rate);

    std::vector<Entry> entries_;
};

// One congestion step's worth of receiver feedback
struct FeedbackData {
    uint64_t rtt_ms = 0;         // RTT sample
    uint32_t receive_rate = 0;   // Bytes/s acknowledged since last feedback
    double loss_rate = 0.0;
    bool rate_limited = false;
};

enum class RateMode : uint8_t {
    AWAIT_SEND,     // Nothing sent yet
    SLOW_START,
    THROUGHPUT_EQN,
};

const char* rateModeToString(RateMode mode);

/**
 * Send Rate Controller
 *
 * Sender-side TFRC. The receiver only reports which frames arrived; the
 * sender derives RTT, receive rate and loss event rate itself and feeds
 * them in through step().
 */
class SendRateController {
public:
    explicit SendRateController(uint32_t max_send_rate);

    void notifyFrameSent(uint64_t now_ms);

    // Apply feedback (or check the nofeedback timer if none). Returns the
    // loss rate to seed the loss history with when slow start ends.
    std::optional<double> step(uint64_t now_ms, const std::optional<FeedbackData>& feedback);

    uint32_t sendRate() const { return send_rate_; }
    uint32_t maxSendRate() const { return max_send_rate_; }
    void setMaxSendRate(uint32_t rate);

    std::optional<uint64_t> rttMs() const { return rtt_ms_; }
    std::optional<uint64_t> rtoMs() const { return rto_ms_; }
    RateMode mode() const { return mode_; }

private:
    std::optional<double> handleFeedback(uint64_t now_ms, const FeedbackData& feedback);
    void nofeedbackExpired(uint64_t now_ms);
    void updateRtt(double sample_s);
    double updateRto(double rtt_s);

    uint32_t max_send_rate_;
    uint32_t send_rate_ = TFRC_SEGMENT_SIZE;
    RateMode mode_ = RateMode::AWAIT_SEND;

    // SLOW_START
    std::optional<uint64_t> time_last_doubled_ms_;
    // THROUGHPUT_EQN
    uint32_t send_rate_tcp_ = 0;

    double prev_loss_rate_ = 0.0;
    std::optional<uint64_t> nofeedback_exp_ms_;
    bool nofeedback_idle_ = false;

    RecvRateSet recv_rate_set_;

    std::optional<double> rtt_s_;
    std::optional<uint64_t> rtt_ms_;
    std::optional<uint64_t> rto_ms_;
};

} // namespace protocol
} // namespace conduit
