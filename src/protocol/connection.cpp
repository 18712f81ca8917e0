#include "connection.hpp"
#include "conduit/logging.hpp"
#include <algorithm>

namespace conduit {
namespace protocol {

Connection::Connection(const EndpointConfig& config, std::string remote_address, uint64_t now_ms,
                       uint32_t seed)
    : config_(config)
    , remote_address_(std::move(remote_address))
    , rng_(seed)
    , local_nonce_(rng_()) {
    StateTimers timers;
    timers.timeout_ms = config_.timeout_ms;
    timers.handshake_timeout_ms = config_.handshake_timeout_ms;
    timers.handshake_resend_ms = config_.handshake_resend_ms;
    timers.disconnect_timeout_ms = config_.disconnect_timeout_ms;
    context_ = initialContext(timers, now_ms);

    // An unusable configuration never leaves CLOSED
    if (!config_.isValid()) {
        LOG_CONN(ERROR, "Connection to %s refused: configuration out of range",
                 remote_address_.c_str());
        context_.state = ConnectionState::CLOSED;
        return;
    }

    LOG_CONN(INFO, "Connection to %s created, nonce %08x", remote_address_.c_str(), local_nonce_);
}

// =============================================================================
// DRIVING
// =============================================================================

void Connection::receive(ByteSpan data, uint64_t now_ms) {
    stats_.frames_received++;
    stats_.bytes_received += data.size();

    auto frame = Frame::deserialize(data);
    if (!frame) {
        stats_.frames_rejected_crc++;
        LOG_FRAME(DEBUG, "Dropping undecodable frame (%zu bytes) from %s",
                  data.size(), remote_address_.c_str());
        return;
    }

    LOG_FRAME(TRACE, "RX %s", frameToString(*frame).c_str());

    switch (frame->type) {
        case FrameType::CONNECT:
            handleConnect(*frame, now_ms);
            break;
        case FrameType::CONNECT_ACK:
            handleConnectAck(*frame, now_ms);
            break;
        case FrameType::DISCONNECT:
            dispatchEvent(LinkEventType::DISCONNECT_RECEIVED, now_ms);
            break;
        case FrameType::DISCONNECT_ACK:
            dispatchEvent(LinkEventType::DISCONNECT_ACK_RECEIVED, now_ms);
            break;
        case FrameType::DATA:
        case FrameType::ACK:
        case FrameType::SYNC:
            handleDataPhase(*frame, now_ms);
            break;
    }
}

void Connection::step(uint64_t now_ms) {
    if (engine_) {
        engine_->step(now_ms, [this](const Frame& frame) { transmitFrame(frame); });
        collectDelivered();
    }

    bool drained = !engine_ || engine_->pendingBytes() == 0;
    dispatchEvent(LinkEventType::TICK, now_ms, drained);
}

void Connection::flush(uint64_t now_ms) {
    if (engine_) {
        engine_->flush(now_ms, [this](const Frame& frame) { transmitFrame(frame); });
    }
}

// =============================================================================
// APPLICATION
// =============================================================================

bool Connection::send(Bytes data, uint8_t channel_id, SendMode mode) {
    if (context_.state != ConnectionState::CONNECTED || !engine_) {
        LOG_WARN("CONN", "send() while %s", connectionStateToString(context_.state));
        return false;
    }
    return engine_->send(std::move(data), channel_id, mode);
}

std::vector<Event> Connection::pollEvents() {
    std::vector<Event> out;
    out.swap(events_);
    return out;
}

void Connection::disconnect(uint64_t now_ms) {
    dispatchEvent(LinkEventType::DISCONNECT_REQUESTED, now_ms);
}

void Connection::disconnectNow(uint64_t now_ms) {
    dispatchEvent(LinkEventType::DISCONNECT_NOW, now_ms);
}

size_t Connection::pendingBytes() const {
    return engine_ ? engine_->pendingBytes() : 0;
}

std::optional<uint64_t> Connection::rttMs() const {
    return engine_ ? engine_->rttMs() : std::nullopt;
}

uint32_t Connection::sendRate() const {
    return engine_ ? engine_->sendRate() : 0;
}

ConnectionStats Connection::stats() const {
    ConnectionStats s = stats_;
    if (engine_) {
        const TransferStats& ts = engine_->stats();
        s.packets_sent += engine_->senderStats().packets_assigned;
        s.packets_delivered += engine_->receiverStats().packets_delivered;
        s.fragments_resent += ts.fragments_resent;
        s.frames_rejected_window += ts.frames_rejected_window;
        s.acks_rejected += ts.acks_rejected;
        s.reassemblies_evicted += engine_->reassembliesEvicted();
    }
    return s;
}

// =============================================================================
// STATE MACHINE
// =============================================================================

void Connection::dispatchEvent(LinkEventType type, uint64_t now_ms, bool drained) {
    LinkEvent event;
    event.type = type;
    event.now_ms = now_ms;
    event.drained = drained;

    ConnectionState before = context_.state;
    Transition t = dispatch(context_, event);
    context_ = t.context;

    if (context_.state != before) {
        LOG_CONN(INFO, "%s: %s -> %s (%s)", remote_address_.c_str(),
                 connectionStateToString(before), connectionStateToString(context_.state),
                 linkEventTypeToString(type));
    }

    for (Effect effect : t.effects) {
        applyEffect(effect);
    }
}

void Connection::applyEffect(Effect effect) {
    LOG_CONN(TRACE, "%s: effect %s", remote_address_.c_str(), effectToString(effect));

    switch (effect) {
        case Effect::SEND_CONNECT: {
            ConnectParams params;
            params.version = PROTOCOL_VERSION;
            params.nonce = local_nonce_;
            params.channel_count = config_.channel_count;
            params.max_receive_rate = config_.max_receive_rate;
            params.max_packet_size = static_cast<uint32_t>(config_.max_packet_size);
            params.max_receive_alloc = static_cast<uint32_t>(config_.max_receive_alloc);
            transmitFrame(Frame::makeConnect(params));
            break;
        }
        case Effect::SEND_CONNECT_ACK:
            if (remote_params_) {
                transmitFrame(Frame::makeConnectAck(remote_params_->nonce));
            }
            break;
        case Effect::SEND_DISCONNECT:
            transmitFrame(Frame::makeDisconnect());
            break;
        case Effect::SEND_DISCONNECT_ACK:
            transmitFrame(Frame::makeDisconnectAck());
            break;
        case Effect::OPEN_DATA:
            openTransfer();
            break;
        case Effect::EMIT_CONNECT:
            events_.push_back(Event{EventType::CONNECT, 0, {}});
            break;
        case Effect::EMIT_DISCONNECT:
            collectDelivered();
            events_.push_back(Event{EventType::DISCONNECT, 0, {}});
            break;
        case Effect::EMIT_TIMEOUT:
            collectDelivered();
            events_.push_back(Event{EventType::TIMEOUT, 0, {}});
            break;
        case Effect::RELEASE:
            release();
            break;
    }
}

void Connection::openTransfer() {
    if (!remote_params_) {
        LOG_ERROR("CONN", "Data phase opened without peer parameters");
        return;
    }
    const ConnectParams& peer = *remote_params_;

    TransferConfig tc;
    tc.max_frame_size = config_.max_frame_size;
    tc.max_send_rate = std::min(config_.max_send_rate, peer.max_receive_rate);
    tc.max_packet_size = std::min<size_t>(config_.max_packet_size, peer.max_receive_alloc);
    tc.peer_receive_alloc = peer.max_receive_alloc;
    tc.max_receive_alloc = config_.max_receive_alloc;
    tc.peer_max_packet_size = peer.max_packet_size;
    tc.channel_count = std::min(config_.channel_count, peer.channel_count);
    tc.local_base_id = local_nonce_ & ID_MASK;
    tc.remote_base_id = peer.nonce & ID_MASK;
    tc.keepalive = config_.keepalive;
    tc.keepalive_interval_ms = config_.keepalive_interval_ms;
    tc.nonce_seed = rng_();

    engine_ = std::make_unique<TransferEngine>(tc);

    LOG_CONN(INFO, "%s: data phase open, rate cap %u B/s, %u channels, max packet %zu",
             remote_address_.c_str(), tc.max_send_rate, tc.channel_count, tc.max_packet_size);
}

void Connection::release() {
    if (!engine_) {
        return;
    }
    collectDelivered();

    // Keep the counters of the finished data phase
    ConnectionStats final_stats = stats();
    stats_ = final_stats;
    engine_.reset();
}

void Connection::collectDelivered() {
    if (engine_) {
        engine_->takeDelivered(events_);
    }
}

void Connection::transmitFrame(const Frame& frame) {
    Bytes data = frame.serialize();
    stats_.frames_sent++;
    stats_.bytes_sent += data.size();

    LOG_FRAME(TRACE, "TX %s", frameToString(frame).c_str());

    if (on_transmit_) {
        on_transmit_(remote_address_, data);
    }
}

} // namespace protocol
} // namespace conduit
