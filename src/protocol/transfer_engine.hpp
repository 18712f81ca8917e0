#pragma once

#include "ack_queue.hpp"
#include "feedback.hpp"
#include "frame.hpp"
#include "frame_window.hpp"
#include "leaky_bucket.hpp"
#include "packet_receiver.hpp"
#include "packet_sender.hpp"
#include "resend_queue.hpp"
#include "send_rate.hpp"
#include <deque>
#include <functional>
#include <optional>
#include <random>
#include <vector>

namespace conduit {
namespace protocol {

// Timing defaults used until the first RTT sample
constexpr uint64_t INITIAL_RTT_MS = 150;
constexpr uint64_t INITIAL_RTO_MS = 4 * INITIAL_RTT_MS;
constexpr uint64_t MIN_SYNC_TIMEOUT_MS = 2000;

// Sent frames are forgotten this many RTTs after they were sent
constexpr uint64_t FRAME_FORGET_RTTS = 4;

// Unacknowledged frames the sender keeps at most
constexpr uint32_t FRAME_LOG_LIMIT = FRAME_WINDOW_SIZE / 2;

// Parameters fixed when the handshake completes
struct TransferConfig {
    size_t max_frame_size = MAX_FRAME_SIZE;
    uint32_t max_send_rate = 2000000;       // min(local cap, peer's receive rate)
    size_t max_packet_size = 1000000;       // Largest packet send() accepts
    size_t peer_receive_alloc = 1000000;    // Bytes the peer will buffer for us
    size_t max_receive_alloc = 1000000;     // Bytes we buffer for the peer
    size_t peer_max_packet_size = 1000000;  // Largest packet the peer will send us
    uint8_t channel_count = MAX_CHANNELS;
    uint32_t local_base_id = 0;             // First outbound frame / packet ID
    uint32_t remote_base_id = 0;            // First inbound frame / packet ID
    bool keepalive = true;
    uint32_t keepalive_interval_ms = 5000;
    uint32_t nonce_seed = 0;                // Seeds per-frame nonce bits
};

struct TransferStats {
    size_t data_frames_sent = 0;
    size_t ack_frames_sent = 0;
    size_t sync_frames_sent = 0;
    size_t bytes_sent = 0;
    size_t fragments_sent = 0;
    size_t fragments_resent = 0;
    size_t data_frames_received = 0;
    size_t frames_duplicate = 0;
    size_t frames_rejected_window = 0;
    size_t acks_rejected = 0;
    size_t syncs_received = 0;
};

/**
 * Transfer Engine
 *
 * The data phase of one connection: packet queueing, fragmentation,
 * frame emission paced by TFRC, retransmission, ack generation and
 * validation, and in-order delivery on the receive side.
 *
 * Time only moves through step(). flush() emits whatever the current
 * credit allows (new acks in particular) without refilling the bucket or
 * touching congestion state.
 *
 * Emission order within one call:
 *   1. SYNC, if the link has gone quiet after data was sent
 *   2. ACK frames for frames received since the last call
 *   3. Due retransmissions
 *   4. Fragments waiting for their first transmission
 *   5. New packets from the send queue
 */
class TransferEngine {
public:
    using FrameSink = std::function<void(const Frame& frame)>;

    explicit TransferEngine(const TransferConfig& config);

    // Queue a packet. Returns false on a bad channel or oversize packet.
    bool send(Bytes data, uint8_t channel_id, SendMode mode);

    void handleData(const Frame& frame);
    void handleAck(const Frame& frame);
    void handleSync(const Frame& frame);

    void step(uint64_t now_ms, const FrameSink& sink);
    void flush(uint64_t now_ms, const FrameSink& sink);

    // Move delivered packets out as RECEIVE events
    void takeDelivered(std::vector<Event>& out) { receiver_.takeDelivered(out); }

    // Bytes queued, awaiting first transmission, or sent but unacknowledged
    size_t pendingBytes() const;

    bool isSendPending() const;

    std::optional<uint64_t> rttMs() const { return rate_.rttMs(); }
    uint32_t sendRate() const { return rate_.sendRate(); }
    RateMode rateMode() const { return rate_.mode(); }
    double lossRate() const { return feedback_.lossRate(); }
    double bucketCredit() const { return bucket_.credit(); }

    const TransferConfig& config() const { return config_; }
    const TransferStats& stats() const { return stats_; }
    const SenderStats& senderStats() const { return sender_.stats(); }
    const ReceiverStats& receiverStats() const { return receiver_.stats(); }
    size_t reassembliesEvicted() const { return receiver_.evictionCount(); }

private:
    enum class PushResult : uint8_t {
        OK,
        SIZE_LIMITED,    // Out of credit
        WINDOW_LIMITED,  // Frame log full
    };

    struct QueuedFragment {
        PendingPacketPtr packet;
        uint16_t fragment_id = 0;
    };

    void updateRate(uint64_t now_ms);
    void emit(uint64_t now_ms, const FrameSink& sink);

    bool syncDue(uint64_t now_ms) const;
    void emitSync(uint64_t now_ms, const FrameSink& sink);
    void emitAcks(uint64_t now_ms, const FrameSink& sink);
    void emitData(uint64_t now_ms, const FrameSink& sink);

    PushResult pushFragment(const PendingPacketPtr& packet, uint16_t fragment_id,
                            uint64_t now_ms, const FrameSink& sink);
    PushResult startFrame(Datagram dg, const PendingPacketPtr& packet, uint16_t fragment_id);
    void finishFrame(uint64_t now_ms, const FrameSink& sink);

    void dropUnsent(const QueuedFragment& fragment);
    uint64_t rttOrDefault() const { return rate_.rttMs().value_or(INITIAL_RTT_MS); }
    uint64_t rtoOrDefault() const { return rate_.rtoMs().value_or(INITIAL_RTO_MS); }

    TransferConfig config_;
    size_t fragment_size_;
    size_t max_ack_groups_;

    // Send side
    PacketSender sender_;
    std::deque<QueuedFragment> first_send_;
    size_t unsent_unreliable_bytes_ = 0;
    ResendQueue resend_;
    FeedbackTracker feedback_;
    SendRateController rate_;
    LeakyBucket bucket_;
    uint32_t flush_id_ = 0;
    std::mt19937 rng_;

    // Frame under construction
    bool frame_open_ = false;
    uint32_t open_frame_id_ = 0;
    bool open_nonce_ = false;
    size_t open_size_ = 0;
    std::vector<Datagram> open_datagrams_;
    std::vector<FragmentRef> open_refs_;

    // Receive side
    FrameWindow frame_window_;
    AckQueue ack_queue_;
    PacketReceiver receiver_;
    uint32_t acked_frame_base_;
    uint32_t acked_packet_base_;

    // Timing
    std::optional<uint64_t> last_step_ms_;
    std::optional<uint64_t> last_feedback_ms_;
    std::optional<uint64_t> time_data_sent_ms_;
    std::optional<uint64_t> time_last_sent_ms_;

    TransferStats stats_;
};

} // namespace protocol
} // namespace conduit
