// Connection frame handlers
// Split from connection.cpp for maintainability

#include "connection.hpp"
#include "conduit/logging.hpp"

namespace conduit {
namespace protocol {

// =============================================================================
// HANDSHAKE
// =============================================================================

bool Connection::validConnectParams(const ConnectParams& params) const {
    if (params.version != PROTOCOL_VERSION) {
        LOG_CONN(DEBUG, "CONNECT rejected: version %u", params.version);
        return false;
    }
    if (params.channel_count == 0 || params.channel_count > MAX_CHANNELS) {
        LOG_CONN(DEBUG, "CONNECT rejected: %u channels", params.channel_count);
        return false;
    }
    if (params.max_receive_rate == 0 || params.max_receive_alloc == 0) {
        LOG_CONN(DEBUG, "CONNECT rejected: zero receive rate or allocation");
        return false;
    }
    // We could not reassemble the largest packet the peer may send
    if (params.max_packet_size > config_.max_receive_alloc) {
        LOG_CONN(DEBUG, "CONNECT rejected: max packet %u exceeds our allocation %zu",
                 params.max_packet_size, config_.max_receive_alloc);
        return false;
    }
    return true;
}

void Connection::handleConnect(const Frame& frame, uint64_t now_ms) {
    if (context_.state == ConnectionState::CLOSED) {
        return;
    }

    const ConnectParams& params = frame.connect;

    if (remote_params_) {
        // Only a repeat of the CONNECT we already accepted is acknowledged
        if (params != *remote_params_) {
            stats_.handshakes_rejected++;
            LOG_CONN(DEBUG, "CONNECT from %s rejected: nonce %08x, expected %08x",
                     remote_address_.c_str(), params.nonce, remote_params_->nonce);
            return;
        }
    } else {
        if (!validConnectParams(params)) {
            stats_.handshakes_rejected++;
            return;
        }
        remote_params_ = params;
    }

    dispatchEvent(LinkEventType::CONNECT_RECEIVED, now_ms);
}

void Connection::handleConnectAck(const Frame& frame, uint64_t now_ms) {
    if (frame.nonce != local_nonce_) {
        stats_.handshakes_rejected++;
        LOG_CONN(DEBUG, "CONNECT_ACK from %s rejected: nonce %08x, ours %08x",
                 remote_address_.c_str(), frame.nonce, local_nonce_);
        return;
    }
    dispatchEvent(LinkEventType::CONNECT_ACK_RECEIVED, now_ms);
}

// =============================================================================
// DATA PHASE
// =============================================================================

void Connection::handleDataPhase(const Frame& frame, uint64_t now_ms) {
    if (!engine_) {
        stats_.frames_rejected_state++;
        LOG_CONN(DEBUG, "%s frame from %s dropped while %s", frameTypeToString(frame.type),
                 remote_address_.c_str(), connectionStateToString(context_.state));
        return;
    }

    switch (frame.type) {
        case FrameType::DATA:
            engine_->handleData(frame);
            break;
        case FrameType::ACK:
            engine_->handleAck(frame);
            break;
        case FrameType::SYNC:
            engine_->handleSync(frame);
            break;
        default:
            return;
    }
    collectDelivered();

    dispatchEvent(LinkEventType::FRAME_RECEIVED, now_ms);
}

} // namespace protocol
} // namespace conduit
