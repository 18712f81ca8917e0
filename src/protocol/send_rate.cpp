#include "send_rate.hpp"
#include "conduit/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace conduit {
namespace protocol {

namespace {

uint64_t secondsToMs(double s) {
    return static_cast<uint64_t>(std::round(std::max(s, 0.0) * 1000.0));
}

uint32_t initialRate(double rtt_s) {
    return static_cast<uint32_t>(TFRC_INITIAL_WINDOW / rtt_s);
}

uint32_t initialLossRate(double rtt_s) {
    return static_cast<uint32_t>((TFRC_SEGMENT_SIZE / 2) / rtt_s);
}

uint32_t saturatingDouble(uint32_t v) {
    return v > std::numeric_limits<uint32_t>::max() / 2 ? std::numeric_limits<uint32_t>::max() : v * 2;
}

} // anonymous namespace

uint32_t tcpThroughput(double rtt_s, double p) {
    double s = TFRC_SEGMENT_SIZE;
    double f_p = std::sqrt(p * 2.0 / 3.0) + 12.0 * std::sqrt(p * 3.0 / 8.0) * p * (1.0 + 32.0 * p * p);
    double rate = s / (rtt_s * f_p);
    if (!(rate < static_cast<double>(std::numeric_limits<uint32_t>::max()))) {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(rate);
}

double tcpThroughputInverse(double rtt_s, uint32_t target_rate) {
    uint32_t delta = static_cast<uint32_t>(target_rate * 0.05);
    double a = 0.0;
    double b = 1.0;
    double c = 0.5;

    // Throughput falls monotonically with p
    for (int i = 0; i < 64; i++) {
        c = (a + b) / 2.0;
        uint32_t rate = tcpThroughput(rtt_s, c);
        if (rate > target_rate) {
            if (rate - target_rate <= delta) break;
            a = c;
        } else if (rate < target_rate) {
            if (target_rate - rate <= delta) break;
            b = c;
        } else {
            break;
        }
    }
    return c;
}

// === RecvRateSet ===

void RecvRateSet::resetInitial(uint64_t now_ms) {
    entries_.clear();
    entries_.push_back({std::numeric_limits<uint32_t>::max(), now_ms, true});
}

void RecvRateSet::reset(uint64_t now_ms, uint32_t rate) {
    entries_.clear();
    entries_.push_back({rate, now_ms, false});
}

uint32_t RecvRateSet::rateLimitedUpdate(uint64_t now_ms, uint32_t recv_rate, uint64_t rtt_ms) {
    entries_.push_back({recv_rate, now_ms, false});
    // Keep the last two RTTs
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const Entry& e) { return now_ms - e.timestamp_ms >= 2 * rtt_ms; }),
                   entries_.end());
    if (entries_.empty()) {
        entries_.push_back({recv_rate, now_ms, false});
    }
    return max();
}

uint32_t RecvRateSet::lossIncreaseUpdate(uint64_t now_ms, uint32_t recv_rate) {
    for (auto& e : entries_) {
        e.value /= 2;
    }
    return replaceMax(now_ms, static_cast<uint32_t>(recv_rate * 0.85));
}

uint32_t RecvRateSet::dataLimitedUpdate(uint64_t now_ms, uint32_t recv_rate) {
    return replaceMax(now_ms, recv_rate);
}

uint32_t RecvRateSet::max() const {
    uint32_t m = 0;
    for (const auto& e : entries_) {
        m = std::max(m, e.value);
    }
    return m;
}

uint32_t RecvRateSet::replaceMax(uint64_t now_ms, uint32_t recv_rate) {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [](const Entry& e) { return e.is_initial; }),
                   entries_.end());
    uint32_t max_rate = entries_.empty() ? recv_rate : std::max(max(), recv_rate);
    reset(now_ms, max_rate);
    return max_rate;
}

// === SendRateController ===

const char* rateModeToString(RateMode mode) {
    switch (mode) {
        case RateMode::AWAIT_SEND: return "AWAIT_SEND";
        case RateMode::SLOW_START: return "SLOW_START";
        case RateMode::THROUGHPUT_EQN: return "THROUGHPUT_EQN";
        default: return "UNKNOWN";
    }
}

SendRateController::SendRateController(uint32_t max_send_rate)
    : max_send_rate_(std::max(max_send_rate, TFRC_MINIMUM_RATE)) {
    send_rate_ = std::min(send_rate_, max_send_rate_);
}

void SendRateController::setMaxSendRate(uint32_t rate) {
    max_send_rate_ = std::max(rate, TFRC_MINIMUM_RATE);
    send_rate_ = std::min(send_rate_, max_send_rate_);
}

void SendRateController::notifyFrameSent(uint64_t now_ms) {
    if (mode_ == RateMode::AWAIT_SEND) {
        nofeedback_exp_ms_ = now_ms + TFRC_INITIAL_NOFEEDBACK_MS;
        mode_ = RateMode::SLOW_START;
        time_last_doubled_ms_.reset();
        recv_rate_set_.resetInitial(now_ms);
    }
    nofeedback_idle_ = false;
}

std::optional<double> SendRateController::step(uint64_t now_ms, const std::optional<FeedbackData>& feedback) {
    if (mode_ == RateMode::AWAIT_SEND) {
        return std::nullopt;
    }
    if (feedback) {
        return handleFeedback(now_ms, *feedback);
    }
    if (nofeedback_exp_ms_ && now_ms >= *nofeedback_exp_ms_) {
        nofeedbackExpired(now_ms);
    }
    return std::nullopt;
}

std::optional<double> SendRateController::handleFeedback(uint64_t now_ms, const FeedbackData& fb) {
    std::optional<double> seed;

    updateRtt(static_cast<double>(fb.rtt_ms) / 1000.0);
    double rtt_s = *rtt_s_;
    uint64_t rtt_ms = *rtt_ms_;
    double rto_s = updateRto(rtt_s);

    bool loss_increase = fb.loss_rate > prev_loss_rate_;

    uint32_t limit;
    if (fb.rate_limited) {
        limit = saturatingDouble(recv_rate_set_.rateLimitedUpdate(now_ms, fb.receive_rate, rtt_ms));
    } else if (loss_increase) {
        limit = recv_rate_set_.lossIncreaseUpdate(now_ms, fb.receive_rate);
    } else {
        limit = saturatingDouble(recv_rate_set_.dataLimitedUpdate(now_ms, fb.receive_rate));
    }
    limit = std::min(limit, max_send_rate_);

    prev_loss_rate_ = fb.loss_rate;

    if (mode_ == RateMode::SLOW_START) {
        if (loss_increase) {
            // First loss: enter the throughput equation phase with a loss
            // history that reproduces the target rate (section 6.3.1)
            uint32_t target = time_last_doubled_ms_ ? send_rate_ / 2 : initialLossRate(rtt_s);
            double initial_p = tcpThroughputInverse(rtt_s, target);
            seed = initial_p;

            send_rate_ = std::max(std::min(target, limit), TFRC_MINIMUM_RATE);
            send_rate_tcp_ = target;
            mode_ = RateMode::THROUGHPUT_EQN;

            LOG_CC(INFO, "Loss detected, leaving slow start: rate=%u p=%.5f rtt=%llums",
                   send_rate_, initial_p, static_cast<unsigned long long>(rtt_ms));
        } else {
            uint32_t initial = initialRate(rtt_s);
            if (time_last_doubled_ms_) {
                if (now_ms - *time_last_doubled_ms_ >= rtt_ms) {
                    time_last_doubled_ms_ = now_ms;
                    send_rate_ = std::max(std::min(saturatingDouble(send_rate_), limit), initial);
                }
            } else {
                time_last_doubled_ms_ = now_ms;
                send_rate_ = initial;
            }
        }
    } else {
        send_rate_tcp_ = tcpThroughput(rtt_s, fb.loss_rate);
        send_rate_ = std::max(std::min(send_rate_tcp_, limit), TFRC_MINIMUM_RATE);
    }

    send_rate_ = std::min(send_rate_, max_send_rate_);

    LOG_CC(DEBUG, "Feedback: rtt=%llums recv=%u p=%.5f limited=%d -> rate=%u (%s)",
           static_cast<unsigned long long>(fb.rtt_ms), fb.receive_rate, fb.loss_rate,
           fb.rate_limited ? 1 : 0, send_rate_, rateModeToString(mode_));

    nofeedback_exp_ms_ = now_ms + secondsToMs(rto_s);
    nofeedback_idle_ = true;
    return seed;
}

void SendRateController::nofeedbackExpired(uint64_t now_ms) {
    if (mode_ == RateMode::SLOW_START) {
        if (rtt_s_) {
            uint32_t recover_rate = initialRate(*rtt_s_);
            if (!(nofeedback_idle_ && send_rate_ < saturatingDouble(recover_rate))) {
                send_rate_ = std::max(send_rate_ / 2, TFRC_MINIMUM_RATE);
            }
        } else {
            send_rate_ = std::max(send_rate_ / 2, TFRC_MINIMUM_RATE);
        }
    } else if (mode_ == RateMode::THROUGHPUT_EQN) {
        uint32_t recover_rate = initialRate(rtt_s_.value_or(1.0));
        uint32_t recv_rate = recv_rate_set_.max();
        if (!(nofeedback_idle_ && recv_rate < recover_rate)) {
            // Rework the receive rate set so the limit halves from here on
            uint32_t current_limit = std::min(send_rate_tcp_, saturatingDouble(recv_rate));
            uint32_t new_limit = std::max(current_limit / 2, TFRC_MINIMUM_RATE);
            recv_rate_set_.reset(now_ms, new_limit / 2);
            send_rate_ = std::min(send_rate_tcp_, new_limit);
        }
    }

    LOG_CC(DEBUG, "Nofeedback timer expired: rate=%u", send_rate_);

    // With no RTT yet the RTO starts at 2s and doubles as the rate halves
    double rto_s = updateRto(rtt_s_.value_or(0.0));
    nofeedback_exp_ms_ = now_ms + secondsToMs(rto_s);
    nofeedback_idle_ = true;
}

void SendRateController::updateRtt(double sample_s) {
    double rtt = rtt_s_ ? (1.0 - TFRC_RTT_ALPHA) * *rtt_s_ + TFRC_RTT_ALPHA * sample_s : sample_s;
    // A zero RTT would make every rate infinite
    rtt = std::max(rtt, 0.001);
    rtt_s_ = rtt;
    rtt_ms_ = secondsToMs(rtt);
}

double SendRateController::updateRto(double rtt_s) {
    double rto = std::max(4.0 * rtt_s, (2.0 * TFRC_SEGMENT_SIZE) / static_cast<double>(send_rate_));
    rto_ms_ = secondsToMs(rto);
    return rto;
}

} // namespace protocol
} // namespace conduit
