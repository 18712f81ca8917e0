#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace conduit {
namespace protocol {

enum class ConnectionState : uint8_t {
    HANDSHAKING,    // CONNECT sent, waiting for the peer's CONNECT and CONNECT_ACK
    CONNECTED,      // Data phase
    DISCONNECTING,  // Draining, then DISCONNECT until acknowledged
    CLOSED          // Terminal
};

const char* connectionStateToString(ConnectionState state);

// Inputs to the state machine. Frames reach it only after validation.
enum class LinkEventType : uint8_t {
    CONNECT_RECEIVED,         // Valid CONNECT from the peer
    CONNECT_ACK_RECEIVED,     // CONNECT_ACK echoing our nonce
    DISCONNECT_RECEIVED,
    DISCONNECT_ACK_RECEIVED,
    FRAME_RECEIVED,           // Any other valid frame in the data phase
    DISCONNECT_REQUESTED,     // Graceful local close
    DISCONNECT_NOW,           // Immediate local close
    TICK,                     // Time has passed
};

const char* linkEventTypeToString(LinkEventType type);

struct LinkEvent {
    LinkEventType type = LinkEventType::TICK;
    uint64_t now_ms = 0;
    bool drained = false;     // TICK: nothing left to send or acknowledge
};

// Side effects requested by a transition, applied by the caller in order
enum class Effect : uint8_t {
    SEND_CONNECT,
    SEND_CONNECT_ACK,
    SEND_DISCONNECT,
    SEND_DISCONNECT_ACK,
    OPEN_DATA,        // Start the transfer engine
    EMIT_CONNECT,     // Surface a CONNECT event
    EMIT_DISCONNECT,
    EMIT_TIMEOUT,
    RELEASE,          // Free all per-connection transfer state
};

const char* effectToString(Effect effect);

struct StateTimers {
    uint32_t timeout_ms = 10000;
    uint32_t handshake_timeout_ms = 10000;
    uint32_t handshake_resend_ms = 500;
    uint32_t disconnect_timeout_ms = 3000;
};

struct StateContext {
    ConnectionState state = ConnectionState::HANDSHAKING;
    StateTimers timers;

    bool connect_acked = false;        // Peer echoed our nonce
    bool peer_connect_seen = false;    // Peer's CONNECT received

    uint64_t state_entered_ms = 0;
    uint64_t last_receive_ms = 0;
    std::optional<uint64_t> last_resend_ms;       // Last CONNECT / DISCONNECT sent
    std::optional<uint64_t> disconnect_sent_ms;   // First DISCONNECT sent
};

struct Transition {
    StateContext context;
    std::vector<Effect> effects;
};

// Initial context for a connection created at now_ms
StateContext initialContext(const StateTimers& timers, uint64_t now_ms);

/**
 * Connection state machine
 *
 * Pure function of (context, event). Every side effect comes back as an
 * Effect in the returned Transition; nothing is sent or surfaced here.
 *
 *   HANDSHAKING --(our nonce acked + peer CONNECT)--> CONNECTED
 *   CONNECTED   --(disconnect())--> DISCONNECTING --(DISCONNECT_ACK / grace)--> CLOSED
 *   any         --(DISCONNECT received / disconnectNow() / watchdog)--> CLOSED
 */
Transition dispatch(const StateContext& context, const LinkEvent& event);

} // namespace protocol
} // namespace conduit
