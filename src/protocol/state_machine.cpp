#include "state_machine.hpp"

namespace conduit {
namespace protocol {

const char* connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::HANDSHAKING: return "HANDSHAKING";
        case ConnectionState::CONNECTED: return "CONNECTED";
        case ConnectionState::DISCONNECTING: return "DISCONNECTING";
        case ConnectionState::CLOSED: return "CLOSED";
        default: return "UNKNOWN";
    }
}

const char* linkEventTypeToString(LinkEventType type) {
    switch (type) {
        case LinkEventType::CONNECT_RECEIVED: return "CONNECT_RECEIVED";
        case LinkEventType::CONNECT_ACK_RECEIVED: return "CONNECT_ACK_RECEIVED";
        case LinkEventType::DISCONNECT_RECEIVED: return "DISCONNECT_RECEIVED";
        case LinkEventType::DISCONNECT_ACK_RECEIVED: return "DISCONNECT_ACK_RECEIVED";
        case LinkEventType::FRAME_RECEIVED: return "FRAME_RECEIVED";
        case LinkEventType::DISCONNECT_REQUESTED: return "DISCONNECT_REQUESTED";
        case LinkEventType::DISCONNECT_NOW: return "DISCONNECT_NOW";
        case LinkEventType::TICK: return "TICK";
        default: return "UNKNOWN";
    }
}

const char* effectToString(Effect effect) {
    switch (effect) {
        case Effect::SEND_CONNECT: return "SEND_CONNECT";
        case Effect::SEND_CONNECT_ACK: return "SEND_CONNECT_ACK";
        case Effect::SEND_DISCONNECT: return "SEND_DISCONNECT";
        case Effect::SEND_DISCONNECT_ACK: return "SEND_DISCONNECT_ACK";
        case Effect::OPEN_DATA: return "OPEN_DATA";
        case Effect::EMIT_CONNECT: return "EMIT_CONNECT";
        case Effect::EMIT_DISCONNECT: return "EMIT_DISCONNECT";
        case Effect::EMIT_TIMEOUT: return "EMIT_TIMEOUT";
        case Effect::RELEASE: return "RELEASE";
        default: return "UNKNOWN";
    }
}

StateContext initialContext(const StateTimers& timers, uint64_t now_ms) {
    StateContext ctx;
    ctx.timers = timers;
    ctx.state_entered_ms = now_ms;
    ctx.last_receive_ms = now_ms;
    return ctx;
}

namespace {

void enter(Transition& t, ConnectionState state, uint64_t now_ms) {
    t.context.state = state;
    t.context.state_entered_ms = now_ms;
    t.context.last_resend_ms.reset();
}

void closeWith(Transition& t, Effect reason, uint64_t now_ms) {
    enter(t, ConnectionState::CLOSED, now_ms);
    t.effects.push_back(reason);
    t.effects.push_back(Effect::RELEASE);
}

bool resendDue(const StateContext& ctx, uint64_t now_ms) {
    return !ctx.last_resend_ms || now_ms - *ctx.last_resend_ms >= ctx.timers.handshake_resend_ms;
}

// === HANDSHAKING ===

void handshaking(Transition& t, const LinkEvent& ev) {
    StateContext& ctx = t.context;

    switch (ev.type) {
        case LinkEventType::TICK:
            if (ev.now_ms - ctx.state_entered_ms >= ctx.timers.handshake_timeout_ms) {
                closeWith(t, Effect::EMIT_TIMEOUT, ev.now_ms);
                return;
            }
            if (!ctx.connect_acked && resendDue(ctx, ev.now_ms)) {
                t.effects.push_back(Effect::SEND_CONNECT);
                ctx.last_resend_ms = ev.now_ms;
            }
            return;

        case LinkEventType::CONNECT_RECEIVED:
            ctx.peer_connect_seen = true;
            ctx.last_receive_ms = ev.now_ms;
            t.effects.push_back(Effect::SEND_CONNECT_ACK);
            break;

        case LinkEventType::CONNECT_ACK_RECEIVED:
            ctx.connect_acked = true;
            ctx.last_receive_ms = ev.now_ms;
            break;

        case LinkEventType::DISCONNECT_RECEIVED:
            t.effects.push_back(Effect::SEND_DISCONNECT_ACK);
            closeWith(t, Effect::EMIT_DISCONNECT, ev.now_ms);
            return;

        case LinkEventType::DISCONNECT_REQUESTED:
        case LinkEventType::DISCONNECT_NOW:
            t.effects.push_back(Effect::SEND_DISCONNECT);
            closeWith(t, Effect::EMIT_DISCONNECT, ev.now_ms);
            return;

        default:
            // Data-phase frames before the handshake completes are dropped
            return;
    }

    if (ctx.connect_acked && ctx.peer_connect_seen) {
        enter(t, ConnectionState::CONNECTED, ev.now_ms);
        t.effects.push_back(Effect::OPEN_DATA);
        t.effects.push_back(Effect::EMIT_CONNECT);
    }
}

// === CONNECTED / DISCONNECTING ===

void dataPhase(Transition& t, const LinkEvent& ev) {
    StateContext& ctx = t.context;
    bool disconnecting = ctx.state == ConnectionState::DISCONNECTING;

    switch (ev.type) {
        case LinkEventType::TICK:
            if (ev.now_ms - ctx.last_receive_ms >= ctx.timers.timeout_ms) {
                closeWith(t, Effect::EMIT_TIMEOUT, ev.now_ms);
                return;
            }
            if (!disconnecting) {
                return;
            }
            if (ctx.disconnect_sent_ms &&
                ev.now_ms - *ctx.disconnect_sent_ms >= ctx.timers.disconnect_timeout_ms) {
                closeWith(t, Effect::EMIT_DISCONNECT, ev.now_ms);
                return;
            }
            if ((ev.drained || ctx.disconnect_sent_ms) && resendDue(ctx, ev.now_ms)) {
                t.effects.push_back(Effect::SEND_DISCONNECT);
                ctx.last_resend_ms = ev.now_ms;
                if (!ctx.disconnect_sent_ms) {
                    ctx.disconnect_sent_ms = ev.now_ms;
                }
            }
            return;

        case LinkEventType::CONNECT_RECEIVED:
            // Our CONNECT_ACK was lost
            ctx.last_receive_ms = ev.now_ms;
            t.effects.push_back(Effect::SEND_CONNECT_ACK);
            return;

        case LinkEventType::CONNECT_ACK_RECEIVED:
        case LinkEventType::FRAME_RECEIVED:
            ctx.last_receive_ms = ev.now_ms;
            return;

        case LinkEventType::DISCONNECT_RECEIVED:
            t.effects.push_back(Effect::SEND_DISCONNECT_ACK);
            closeWith(t, Effect::EMIT_DISCONNECT, ev.now_ms);
            return;

        case LinkEventType::DISCONNECT_ACK_RECEIVED:
            ctx.last_receive_ms = ev.now_ms;
            if (disconnecting && ctx.disconnect_sent_ms) {
                closeWith(t, Effect::EMIT_DISCONNECT, ev.now_ms);
            }
            return;

        case LinkEventType::DISCONNECT_REQUESTED:
            if (!disconnecting) {
                enter(t, ConnectionState::DISCONNECTING, ev.now_ms);
                ctx.disconnect_sent_ms.reset();
            }
            return;

        case LinkEventType::DISCONNECT_NOW:
            t.effects.push_back(Effect::SEND_DISCONNECT);
            closeWith(t, Effect::EMIT_DISCONNECT, ev.now_ms);
            return;

        default:
            return;
    }
}

// === CLOSED ===

void closed(Transition& t, const LinkEvent& ev) {
    // Answer so a peer still retrying can finish
    if (ev.type == LinkEventType::DISCONNECT_RECEIVED) {
        t.effects.push_back(Effect::SEND_DISCONNECT_ACK);
    }
}

} // anonymous namespace

Transition dispatch(const StateContext& context, const LinkEvent& event) {
    Transition t;
    t.context = context;

    switch (context.state) {
        case ConnectionState::HANDSHAKING:
            handshaking(t, event);
            break;
        case ConnectionState::CONNECTED:
        case ConnectionState::DISCONNECTING:
            dataPhase(t, event);
            break;
        case ConnectionState::CLOSED:
            closed(t, event);
            break;
    }
    return t;
}

} // namespace protocol
} // namespace conduit
