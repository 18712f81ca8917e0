#include "transfer_engine.hpp"
#include "fragment.hpp"
#include "conduit/logging.hpp"
#include <algorithm>
#include <limits>

namespace conduit {
namespace protocol {

TransferEngine::TransferEngine(const TransferConfig& config)
    : config_(config)
    , fragment_size_(fragmentPayloadSize(config.max_frame_size))
    , max_ack_groups_(std::min(Frame::MAX_ACK_GROUPS,
                               (config.max_frame_size - Frame::ACK_OVERHEAD) / AckGroup::ENCODED_SIZE))
    , sender_(config.channel_count, config.peer_receive_alloc, config.local_base_id,
              fragmentPayloadSize(config.max_frame_size), config.max_packet_size)
    , feedback_(config.local_base_id)
    , rate_(config.max_send_rate)
    , bucket_(config.max_frame_size)
    , rng_(config.nonce_seed)
    , frame_window_(config.remote_base_id)
    , receiver_(config.channel_count, config.max_receive_alloc, config.remote_base_id,
                config.peer_max_packet_size)
    , acked_frame_base_(frame_window_.baseId())
    , acked_packet_base_(receiver_.baseId()) {
}

bool TransferEngine::send(Bytes data, uint8_t channel_id, SendMode mode) {
    return sender_.enqueue(std::move(data), channel_id, mode, flush_id_);
}

// ============================================================================
// Inbound frames
// ============================================================================

void TransferEngine::handleData(const Frame& frame) {
    FrameWindow::Verdict verdict = frame_window_.accept(frame.frame_id);

    switch (verdict) {
        case FrameWindow::Verdict::ACCEPTED:
            break;
        case FrameWindow::Verdict::DUPLICATE:
            stats_.frames_duplicate++;
            LOG_WINDOW(TRACE, "Duplicate frame %u", frame.frame_id);
            return;
        default:
            stats_.frames_rejected_window++;
            LOG_WINDOW(DEBUG, "Frame %u rejected: %s (base %u)", frame.frame_id,
                       frameVerdictToString(verdict), frame_window_.baseId());
            return;
    }

    stats_.data_frames_received++;
    ack_queue_.markSeen(frame.frame_id, frame.nonce_bit);

    for (const auto& dg : frame.datagrams) {
        receiver_.handleDatagram(dg);
    }
}

void TransferEngine::handleAck(const Frame& frame) {
    uint64_t rtt = rttOrDefault();

    std::vector<FragmentRef> acked;
    for (const auto& group : frame.ack_groups) {
        if (!feedback_.acknowledgeGroup(group, rtt, acked)) {
            stats_.acks_rejected++;
        }
    }
    for (const auto& ref : acked) {
        sender_.markFragmentAcked(*ref.packet, ref.fragment_id);
    }

    // Frames behind the peer's frame window can never be acked
    uint32_t lead = idLead(frame.frame_window_base, feedback_.logBaseId());
    if (lead > 0 && lead <= feedback_.logSize()) {
        feedback_.forgetCount(lead, rtt);
    }

    sender_.acknowledge(frame.packet_window_base);
}

void TransferEngine::handleSync(const Frame& frame) {
    stats_.syncs_received++;

    if (frame_window_.resynchronize(frame.next_frame_id)) {
        LOG_WINDOW(DEBUG, "Frame window resynchronized to base %u", frame_window_.baseId());
    }
    if (receiver_.resynchronize(frame.next_packet_id)) {
        LOG_WINDOW(DEBUG, "Packet window resynchronized to base %u", receiver_.baseId());
    }
}

// ============================================================================
// Step / flush
// ============================================================================

void TransferEngine::step(uint64_t now_ms, const FrameSink& sink) {
    uint64_t rtt = rttOrDefault();
    uint64_t horizon = FRAME_FORGET_RTTS * rtt;
    feedback_.forgetFrames(now_ms > horizon ? now_ms - horizon : 0, rtt);

    updateRate(now_ms);

    if (last_step_ms_ && now_ms > *last_step_ms_) {
        bucket_.refill(rate_.sendRate(), now_ms - *last_step_ms_, rate_.rttMs().value_or(0),
                       config_.max_frame_size);
    }
    last_step_ms_ = now_ms;

    if (!time_last_sent_ms_) {
        time_last_sent_ms_ = now_ms;
    }

    emit(now_ms, sink);
}

void TransferEngine::flush(uint64_t now_ms, const FrameSink& sink) {
    emit(now_ms, sink);
}

void TransferEngine::updateRate(uint64_t now_ms) {
    std::optional<FeedbackData> data;

    if (auto fb = feedback_.takeFeedback()) {
        FeedbackData d;
        d.rtt_ms = now_ms > fb->last_send_time_ms ? now_ms - fb->last_send_time_ms : 0;
        if (last_feedback_ms_) {
            uint64_t dt = std::max<uint64_t>(now_ms - *last_feedback_ms_, 1);
            uint64_t rate = static_cast<uint64_t>(fb->total_ack_size) * 1000 / dt;
            d.receive_rate = static_cast<uint32_t>(
                std::min<uint64_t>(rate, std::numeric_limits<uint32_t>::max()));
        }
        d.loss_rate = fb->loss_rate;
        d.rate_limited = fb->rate_limited;
        last_feedback_ms_ = now_ms;
        data = d;
    }

    if (auto seed = rate_.step(now_ms, data)) {
        feedback_.seedLossRate(*seed);
    }
}

void TransferEngine::emit(uint64_t now_ms, const FrameSink& sink) {
    if (syncDue(now_ms)) {
        emitSync(now_ms, sink);
    }
    emitAcks(now_ms, sink);
    emitData(now_ms, sink);

    // Time-sensitive data that missed this flush is dropped
    sender_.expireTimeSensitive(flush_id_);
    for (auto it = first_send_.begin(); it != first_send_.end();) {
        if (it->packet->mode == SendMode::TIME_SENSITIVE && it->packet->flush_id == flush_id_) {
            dropUnsent(*it);
            it = first_send_.erase(it);
        } else {
            ++it;
        }
    }

    flush_id_++;
}

bool TransferEngine::syncDue(uint64_t now_ms) const {
    if (time_data_sent_ms_ && resend_.empty() && first_send_.empty()) {
        uint64_t timeout = std::max(rtoOrDefault(), MIN_SYNC_TIMEOUT_MS);
        if (now_ms - *time_data_sent_ms_ >= timeout) {
            return true;
        }
    }
    if (config_.keepalive && time_last_sent_ms_ &&
        now_ms - *time_last_sent_ms_ >= config_.keepalive_interval_ms) {
        return true;
    }
    return false;
}

void TransferEngine::emitSync(uint64_t now_ms, const FrameSink& sink) {
    Frame frame = Frame::makeSync(feedback_.logNextId(), sender_.nextId());
    size_t size = frame.encodedSize();
    if (!bucket_.canSpend(size)) {
        return;
    }

    LOG_WINDOW(TRACE, "Sync: next frame %u, next packet %u", frame.next_frame_id, frame.next_packet_id);
    bucket_.spend(size);
    stats_.sync_frames_sent++;
    stats_.bytes_sent += size;
    time_data_sent_ms_.reset();
    time_last_sent_ms_ = now_ms;
    sink(frame);
}

void TransferEngine::emitAcks(uint64_t now_ms, const FrameSink& sink) {
    bool bases_changed = frame_window_.baseId() != acked_frame_base_ ||
                         receiver_.baseId() != acked_packet_base_;

    while (!ack_queue_.empty() || bases_changed) {
        if (!bucket_.canSpend(Frame::ACK_OVERHEAD)) {
            return;
        }
        size_t room = (static_cast<size_t>(bucket_.credit()) - Frame::ACK_OVERHEAD) / AckGroup::ENCODED_SIZE;
        size_t count = std::min({ack_queue_.size(), max_ack_groups_, room});
        if (count == 0 && !bases_changed) {
            return;
        }

        std::vector<AckGroup> groups;
        groups.reserve(count);
        for (size_t i = 0; i < count; i++) {
            if (auto group = ack_queue_.pop()) {
                groups.push_back(*group);
            }
        }

        Frame frame = Frame::makeAck(frame_window_.baseId(), receiver_.baseId(), std::move(groups));
        size_t size = frame.encodedSize();

        LOG_ACK(TRACE, "Ack: %zu groups, frame base %u, packet base %u",
                frame.ack_groups.size(), frame.frame_window_base, frame.packet_window_base);

        bucket_.spend(size);
        stats_.ack_frames_sent++;
        stats_.bytes_sent += size;
        time_last_sent_ms_ = now_ms;
        acked_frame_base_ = frame.frame_window_base;
        acked_packet_base_ = frame.packet_window_base;
        bases_changed = false;
        sink(frame);
    }
}

void TransferEngine::emitData(uint64_t now_ms, const FrameSink& sink) {
    uint64_t rto = rtoOrDefault();

    // Retransmissions first
    while (const ResendEntry* top = resend_.peek()) {
        if (top->resend_time_ms > now_ms) {
            break;
        }
        const PendingPacket& packet = *top->packet;
        if (!retainForResend(packet.mode, packet.fragment_acked[top->fragment_id], packet.released)) {
            resend_.pop();
            continue;
        }

        ResendEntry entry = *top;
        if (pushFragment(entry.packet, entry.fragment_id, now_ms, sink) != PushResult::OK) {
            finishFrame(now_ms, sink);
            return;
        }
        resend_.pop();

        LOG_CHAN(TRACE, "Resend packet %u fragment %u (attempt %u)",
                 entry.packet->sequence_id, entry.fragment_id, entry.send_count + 1);

        entry.send_count++;
        entry.resend_time_ms = ResendQueue::nextResendTime(now_ms, rto, entry.send_count);
        resend_.push(std::move(entry));
        stats_.fragments_resent++;
    }

    for (;;) {
        // Fragments waiting for their first transmission
        while (!first_send_.empty()) {
            QueuedFragment queued = first_send_.front();
            if (pushFragment(queued.packet, queued.fragment_id, now_ms, sink) != PushResult::OK) {
                finishFrame(now_ms, sink);
                return;
            }
            first_send_.pop_front();

            if (queued.packet->isResendable()) {
                ResendEntry entry;
                entry.resend_time_ms = ResendQueue::nextResendTime(now_ms, rto, 0);
                entry.send_count = 0;
                entry.packet = queued.packet;
                entry.fragment_id = queued.fragment_id;
                resend_.push(std::move(entry));
            } else {
                unsent_unreliable_bytes_ -= queued.packet->fragmentBytes(queued.fragment_id);
            }
        }

        // Then new packets
        PendingPacketPtr packet = sender_.nextPacket(flush_id_);
        if (!packet) {
            break;
        }
        for (uint32_t i = 0; i <= packet->last_fragment_id; i++) {
            QueuedFragment queued;
            queued.packet = packet;
            queued.fragment_id = static_cast<uint16_t>(i);
            if (!packet->isResendable()) {
                unsent_unreliable_bytes_ += packet->fragmentBytes(queued.fragment_id);
            }
            first_send_.push_back(std::move(queued));
        }
    }

    finishFrame(now_ms, sink);
}

TransferEngine::PushResult TransferEngine::pushFragment(const PendingPacketPtr& packet, uint16_t fragment_id,
                                                        uint64_t now_ms, const FrameSink& sink) {
    Datagram dg = makeDatagram(*packet, fragment_id);

    if (frame_open_) {
        size_t potential = open_size_ + dg.encodedSize();
        if (potential <= config_.max_frame_size) {
            if (!bucket_.canSpend(potential)) {
                finishFrame(now_ms, sink);
                feedback_.logRateLimited();
                return PushResult::SIZE_LIMITED;
            }
            open_size_ = potential;
            open_datagrams_.push_back(std::move(dg));
            if (packet->isResendable()) {
                open_refs_.push_back({packet, fragment_id});
            }
            return PushResult::OK;
        }
        finishFrame(now_ms, sink);
    }

    return startFrame(std::move(dg), packet, fragment_id);
}

TransferEngine::PushResult TransferEngine::startFrame(Datagram dg, const PendingPacketPtr& packet,
                                                      uint16_t fragment_id) {
    if (feedback_.logSize() >= FRAME_LOG_LIMIT) {
        return PushResult::WINDOW_LIMITED;
    }

    size_t potential = Frame::DATA_OVERHEAD + dg.encodedSize();
    if (!bucket_.canSpend(potential)) {
        feedback_.logRateLimited();
        return PushResult::SIZE_LIMITED;
    }

    frame_open_ = true;
    open_frame_id_ = feedback_.logNextId();
    open_nonce_ = (rng_() & 1) != 0;
    open_size_ = potential;
    open_datagrams_.push_back(std::move(dg));
    if (packet->isResendable()) {
        open_refs_.push_back({packet, fragment_id});
    }
    return PushResult::OK;
}

void TransferEngine::finishFrame(uint64_t now_ms, const FrameSink& sink) {
    if (!frame_open_) {
        return;
    }

    Frame frame = Frame::makeData(open_frame_id_, open_nonce_, std::move(open_datagrams_));
    size_t size = frame.encodedSize();

    SentFrame sent;
    sent.send_time_ms = now_ms;
    sent.size = size;
    sent.nonce = open_nonce_;
    sent.fragments = std::move(open_refs_);
    feedback_.logFrame(open_frame_id_, std::move(sent));

    rate_.notifyFrameSent(now_ms);
    bucket_.spend(size);

    stats_.data_frames_sent++;
    stats_.fragments_sent += frame.datagrams.size();
    stats_.bytes_sent += size;
    time_data_sent_ms_ = now_ms;
    time_last_sent_ms_ = now_ms;

    LOG_FRAME(TRACE, "DATA frame %u: %zu datagrams, %zu bytes",
              frame.frame_id, frame.datagrams.size(), size);

    frame_open_ = false;
    open_size_ = 0;
    open_datagrams_.clear();
    open_refs_.clear();

    sink(frame);
}

void TransferEngine::dropUnsent(const QueuedFragment& fragment) {
    if (!fragment.packet->isResendable()) {
        unsent_unreliable_bytes_ -= fragment.packet->fragmentBytes(fragment.fragment_id);
    }
}

// ============================================================================
// Queries
// ============================================================================

size_t TransferEngine::pendingBytes() const {
    return sender_.queuedBytes() + unsent_unreliable_bytes_ + sender_.unackedBytes();
}

bool TransferEngine::isSendPending() const {
    return sender_.queuedCount() != 0 || !first_send_.empty() || !resend_.empty();
}

} // namespace protocol
} // namespace conduit
