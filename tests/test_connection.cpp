/**
 * Connection Test Suite
 *
 * State machine transitions in isolation, then two Connections wired
 * back to back through simulated lossy links on a virtual clock.
 */

#include "protocol/connection.hpp"
#include "protocol/state_machine.hpp"
#include "sim/lossy_link.hpp"
#include "conduit/logging.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <map>

using namespace conduit;
using namespace conduit::protocol;

// Test counters
static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    do { std::cout << "  Testing " << name << "... " << std::flush; tests_run++; } while(0)

#define PASS() \
    do { std::cout << "PASS\n"; tests_passed++; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << "\n"; return false; } while(0)

// ============================================================================
// State machine (pure)
// ============================================================================

static LinkEvent ev(LinkEventType type, uint64_t now_ms, bool drained = false) {
    LinkEvent e;
    e.type = type;
    e.now_ms = now_ms;
    e.drained = drained;
    return e;
}

static bool hasEffect(const Transition& t, Effect e) {
    return std::find(t.effects.begin(), t.effects.end(), e) != t.effects.end();
}

bool test_sm_handshake() {
    TEST("Handshake resends CONNECT and opens on both confirmations");

    StateTimers timers;
    StateContext ctx = initialContext(timers, 0);

    Transition t = dispatch(ctx, ev(LinkEventType::TICK, 0));
    if (!hasEffect(t, Effect::SEND_CONNECT)) FAIL("no CONNECT on first tick");
    ctx = t.context;

    t = dispatch(ctx, ev(LinkEventType::TICK, timers.handshake_resend_ms - 1));
    if (!t.effects.empty()) FAIL("resent too early");

    t = dispatch(ctx, ev(LinkEventType::TICK, timers.handshake_resend_ms));
    if (!hasEffect(t, Effect::SEND_CONNECT)) FAIL("no resend");
    ctx = t.context;

    t = dispatch(ctx, ev(LinkEventType::CONNECT_RECEIVED, 600));
    if (!hasEffect(t, Effect::SEND_CONNECT_ACK)) FAIL("peer CONNECT not acknowledged");
    if (t.context.state != ConnectionState::HANDSHAKING) FAIL("opened without our ack");
    ctx = t.context;

    t = dispatch(ctx, ev(LinkEventType::CONNECT_ACK_RECEIVED, 650));
    if (t.context.state != ConnectionState::CONNECTED) FAIL("state " << connectionStateToString(t.context.state));
    if (!hasEffect(t, Effect::OPEN_DATA) || !hasEffect(t, Effect::EMIT_CONNECT)) FAIL("open effects");

    PASS();
    return true;
}

bool test_sm_handshake_timeout() {
    TEST("Handshake times out");

    StateTimers timers;
    StateContext ctx = initialContext(timers, 1000);
    ctx = dispatch(ctx, ev(LinkEventType::CONNECT_ACK_RECEIVED, 1100)).context;

    Transition t = dispatch(ctx, ev(LinkEventType::TICK, 1000 + timers.handshake_timeout_ms));
    if (t.context.state != ConnectionState::CLOSED) FAIL("still open");
    if (!hasEffect(t, Effect::EMIT_TIMEOUT) || !hasEffect(t, Effect::RELEASE)) FAIL("timeout effects");

    PASS();
    return true;
}

static StateContext connectedContext(const StateTimers& timers, uint64_t now_ms) {
    StateContext ctx = initialContext(timers, now_ms);
    ctx = dispatch(ctx, ev(LinkEventType::CONNECT_RECEIVED, now_ms)).context;
    ctx = dispatch(ctx, ev(LinkEventType::CONNECT_ACK_RECEIVED, now_ms)).context;
    return ctx;
}

bool test_sm_silence_timeout() {
    TEST("Connected link times out after silence");

    StateTimers timers;
    StateContext ctx = connectedContext(timers, 0);

    ctx = dispatch(ctx, ev(LinkEventType::FRAME_RECEIVED, 4000)).context;
    Transition t = dispatch(ctx, ev(LinkEventType::TICK, 4000 + timers.timeout_ms - 1));
    if (t.context.state != ConnectionState::CONNECTED) FAIL("timed out early");

    t = dispatch(ctx, ev(LinkEventType::TICK, 4000 + timers.timeout_ms));
    if (t.context.state != ConnectionState::CLOSED || !hasEffect(t, Effect::EMIT_TIMEOUT)) FAIL("no timeout");

    PASS();
    return true;
}

bool test_sm_graceful_disconnect() {
    TEST("Disconnect waits for drain, then for the ack");

    StateTimers timers;
    StateContext ctx = connectedContext(timers, 0);

    ctx = dispatch(ctx, ev(LinkEventType::DISCONNECT_REQUESTED, 100)).context;
    if (ctx.state != ConnectionState::DISCONNECTING) FAIL("not disconnecting");

    Transition t = dispatch(ctx, ev(LinkEventType::TICK, 110, false));
    if (!t.effects.empty()) FAIL("DISCONNECT sent before drain");

    t = dispatch(ctx, ev(LinkEventType::TICK, 120, true));
    if (!hasEffect(t, Effect::SEND_DISCONNECT)) FAIL("no DISCONNECT once drained");
    ctx = t.context;

    t = dispatch(ctx, ev(LinkEventType::DISCONNECT_ACK_RECEIVED, 150));
    if (t.context.state != ConnectionState::CLOSED) FAIL("ack did not close");
    if (!hasEffect(t, Effect::EMIT_DISCONNECT) || !hasEffect(t, Effect::RELEASE)) FAIL("close effects");

    PASS();
    return true;
}

bool test_sm_disconnect_timeout() {
    TEST("Unacknowledged disconnect gives up");

    StateTimers timers;
    StateContext ctx = connectedContext(timers, 0);
    ctx = dispatch(ctx, ev(LinkEventType::DISCONNECT_REQUESTED, 100)).context;
    ctx = dispatch(ctx, ev(LinkEventType::TICK, 100, true)).context;

    // Keep the silence timer from firing first
    ctx = dispatch(ctx, ev(LinkEventType::FRAME_RECEIVED, 2000)).context;

    Transition t = dispatch(ctx, ev(LinkEventType::TICK, 100 + timers.disconnect_timeout_ms));
    if (t.context.state != ConnectionState::CLOSED) FAIL("still disconnecting");
    if (!hasEffect(t, Effect::EMIT_DISCONNECT)) FAIL("no disconnect event");

    PASS();
    return true;
}

bool test_sm_peer_disconnect() {
    TEST("Peer DISCONNECT is acknowledged in every state");

    StateTimers timers;
    StateContext ctx = connectedContext(timers, 0);

    Transition t = dispatch(ctx, ev(LinkEventType::DISCONNECT_RECEIVED, 50));
    if (t.context.state != ConnectionState::CLOSED) FAIL("not closed");
    if (!hasEffect(t, Effect::SEND_DISCONNECT_ACK) || !hasEffect(t, Effect::EMIT_DISCONNECT)) FAIL("effects");

    t = dispatch(t.context, ev(LinkEventType::DISCONNECT_RECEIVED, 60));
    if (!hasEffect(t, Effect::SEND_DISCONNECT_ACK)) FAIL("closed state did not answer");
    if (hasEffect(t, Effect::EMIT_DISCONNECT)) FAIL("second disconnect event");

    PASS();
    return true;
}

// ============================================================================
// Two endpoints on a virtual clock
// ============================================================================

class LinkPair {
public:
    LinkPair(const EndpointConfig& config, const sim::LossyLink::Config& link)
        : a2b_(link, 11)
        , b2a_(link, 22)
        , a_(config, "bravo", 0, 101)
        , b_(config, "alpha", 0, 202)
    {
        a_.setTransmitCallback([this](const std::string&, const Bytes& d) {
            if (!block_a2b_) a2b_.write(d, now_);
        });
        b_.setTransmitCallback([this](const std::string&, const Bytes& d) {
            if (!block_b2a_) b2a_.write(d, now_);
        });
    }

    void tick(uint64_t dt_ms = 5) {
        now_ += dt_ms;
        for (const auto& d : a2b_.read(now_)) b_.receive(d, now_);
        for (const auto& d : b2a_.read(now_)) a_.receive(d, now_);
        a_.flush(now_);
        b_.flush(now_);
        a_.step(now_);
        b_.step(now_);
        collect(a_, a_events_);
        collect(b_, b_events_);
    }

    bool runUntil(const std::function<bool()>& done, uint64_t limit_ms) {
        uint64_t end = now_ + limit_ms;
        while (now_ < end) {
            if (done()) return true;
            tick();
        }
        return done();
    }

    bool connect() {
        return runUntil([this] { return a_.isConnected() && b_.isConnected(); }, 15000);
    }

    size_t count(const std::vector<Event>& events, EventType type) const {
        return std::count_if(events.begin(), events.end(),
                             [type](const Event& e) { return e.type == type; });
    }

    Connection& a() { return a_; }
    Connection& b() { return b_; }
    std::vector<Event>& aEvents() { return a_events_; }
    std::vector<Event>& bEvents() { return b_events_; }
    uint64_t now() const { return now_; }
    void block(bool a2b, bool b2a) { block_a2b_ = a2b; block_b2a_ = b2a; }

private:
    static void collect(Connection& c, std::vector<Event>& out) {
        for (auto& e : c.pollEvents()) out.push_back(std::move(e));
    }

    uint64_t now_ = 0;
    bool block_a2b_ = false;
    bool block_b2a_ = false;
    sim::LossyLink a2b_;
    sim::LossyLink b2a_;
    Connection a_;
    Connection b_;
    std::vector<Event> a_events_;
    std::vector<Event> b_events_;
};

static Bytes tagged(uint8_t tag, size_t len) {
    Bytes b(len);
    for (size_t i = 0; i < len; i++) b[i] = static_cast<uint8_t>(tag + i);
    if (len > 0) b[0] = tag;
    return b;
}

bool test_handshake_clean() {
    TEST("Handshake over a clean link");

    LinkPair pair(EndpointConfig{}, sim::LossyLink::Config{});
    if (!pair.connect()) FAIL("not connected");
    if (pair.count(pair.aEvents(), EventType::CONNECT) != 1) FAIL("alpha CONNECT events");
    if (pair.count(pair.bEvents(), EventType::CONNECT) != 1) FAIL("bravo CONNECT events");
    if (!pair.a().transfer() || pair.a().transfer()->config().channel_count != MAX_CHANNELS) {
        FAIL("negotiated channel count");
    }

    PASS();
    return true;
}

bool test_handshake_spoof() {
    TEST("Spoofed and malformed handshake frames are rejected");

    EndpointConfig cfg;
    Connection c(cfg, "peer", 0, 5);
    std::vector<Bytes> sent;
    c.setTransmitCallback([&](const std::string&, const Bytes& d) { sent.push_back(d); });
    c.step(0);

    // Wrong nonce in CONNECT_ACK
    c.receive(Frame::makeConnectAck(c.localNonce() ^ 1).serialize(), 10);
    if (c.stats().handshakes_rejected != 1) FAIL("bad CONNECT_ACK accepted");

    // Unsupported version
    ConnectParams bad;
    bad.version = PROTOCOL_VERSION + 1;
    bad.nonce = 77;
    bad.max_receive_rate = 1000;
    bad.max_packet_size = 1000;
    bad.max_receive_alloc = 1000;
    c.receive(Frame::makeConnect(bad).serialize(), 20);
    if (c.stats().handshakes_rejected != 2) FAIL("bad version accepted");

    // Genuine CONNECT, then a different one claiming to be the same peer
    ConnectParams good = bad;
    good.version = PROTOCOL_VERSION;
    c.receive(Frame::makeConnect(good).serialize(), 30);
    ConnectParams other = good;
    other.nonce = 78;
    c.receive(Frame::makeConnect(other).serialize(), 40);
    if (c.stats().handshakes_rejected != 3) FAIL("conflicting CONNECT accepted");

    // Data before the handshake completes, and garbage
    c.receive(Frame::makeSync(1, 1).serialize(), 50);
    if (c.stats().frames_rejected_state != 1) FAIL("early data-phase frame accepted");
    c.receive(Bytes{0x05, 0x01, 0x02}, 55);
    if (c.stats().frames_rejected_crc != 1) FAIL("garbage not counted");
    if (c.state() != ConnectionState::HANDSHAKING) FAIL("state changed");

    // The genuine ack completes it
    c.receive(Frame::makeConnectAck(c.localNonce()).serialize(), 60);
    if (!c.isConnected()) FAIL("genuine handshake failed");
    auto events = c.pollEvents();
    if (events.size() != 1 || events[0].type != EventType::CONNECT) FAIL("CONNECT event");

    // CONNECT_ACK echoing the peer's nonce went out
    bool acked = false;
    for (const auto& d : sent) {
        auto f = Frame::deserialize(d);
        if (f && f->type == FrameType::CONNECT_ACK && f->nonce == good.nonce) acked = true;
    }
    if (!acked) FAIL("peer CONNECT never acknowledged");

    PASS();
    return true;
}

bool test_invalid_config_refused() {
    TEST("Out-of-range configuration never connects");

    EndpointConfig cfg;
    cfg.max_frame_size = 20;
    Connection c(cfg, "peer", 0, 13);
    std::vector<Bytes> sent;
    c.setTransmitCallback([&](const std::string&, const Bytes& d) { sent.push_back(d); });
    if (c.state() != ConnectionState::CLOSED) FAIL("state " << connectionStateToString(c.state()));

    for (uint64_t t = 0; t < 1000; t += 10) c.step(t);
    if (!sent.empty()) FAIL("transmitted " << sent.size() << " frames");
    if (c.send(Bytes(4000), 0, SendMode::RELIABLE)) FAIL("send accepted");

    ConnectParams params;
    params.version = PROTOCOL_VERSION;
    params.nonce = 99;
    params.channel_count = 1;
    params.max_receive_rate = 1000;
    params.max_packet_size = 1000;
    params.max_receive_alloc = 1000;
    c.receive(Frame::makeConnect(params).serialize(), 1000);
    c.step(1010);
    if (c.state() != ConnectionState::CLOSED || !sent.empty()) FAIL("peer CONNECT answered");
    if (!c.pollEvents().empty()) FAIL("events raised");

    LinkPair pair(cfg, sim::LossyLink::Config{});
    if (pair.connect()) FAIL("pair connected");
    if (!pair.aEvents().empty() || !pair.bEvents().empty()) FAIL("events raised");

    PASS();
    return true;
}

bool test_send_requires_connection() {
    TEST("send() refused outside the data phase");

    Connection c(EndpointConfig{}, "peer", 0, 9);
    if (c.send(Bytes(10), 0, SendMode::RELIABLE)) FAIL("send accepted while handshaking");
    if (c.pendingBytes() != 0) FAIL("pending bytes while handshaking");

    PASS();
    return true;
}

bool test_reliable_end_to_end() {
    TEST("Reliable 5000-byte packet on channel 3");

    LinkPair pair(EndpointConfig{}, sim::LossyLink::Config{});
    if (!pair.connect()) FAIL("not connected");

    Bytes payload = tagged(42, 5000);
    if (!pair.a().send(payload, 3, SendMode::RELIABLE)) FAIL("send refused");
    if (pair.a().pendingBytes() != 5000) FAIL("pending " << pair.a().pendingBytes());

    bool ok = pair.runUntil([&] {
        return pair.count(pair.bEvents(), EventType::RECEIVE) >= 1 && pair.a().pendingBytes() == 0;
    }, 10000);
    if (!ok) FAIL("not delivered (pending " << pair.a().pendingBytes() << ")");

    // A little longer: no duplicate deliveries
    pair.runUntil([] { return false; }, 2000);

    if (pair.count(pair.bEvents(), EventType::RECEIVE) != 1) FAIL("delivered more than once");
    const Event* rx = nullptr;
    for (const auto& e : pair.bEvents()) {
        if (e.type == EventType::RECEIVE) rx = &e;
    }
    if (rx->channel_id != 3 || rx->data != payload) FAIL("wrong channel or payload");

    PASS();
    return true;
}

bool test_reliable_under_loss() {
    TEST("Reliable delivery with every 3rd datagram dropped");

    sim::LossyLink::Config link;
    link.latency_ms = 10;
    link.drop_every = 3;
    LinkPair pair(EndpointConfig{}, link);
    if (!pair.connect()) FAIL("not connected");

    const int PACKETS = 20;
    for (int i = 0; i < PACKETS; i++) {
        size_t len = 200 + static_cast<size_t>(i) * 137;
        if (!pair.a().send(tagged(static_cast<uint8_t>(i), len), static_cast<uint8_t>(i % 4), SendMode::RELIABLE)) {
            FAIL("send " << i << " refused");
        }
    }

    bool ok = pair.runUntil([&] {
        return pair.count(pair.bEvents(), EventType::RECEIVE) >= PACKETS && pair.a().pendingBytes() == 0;
    }, 120000);
    if (!ok) {
        FAIL("delivered " << pair.count(pair.bEvents(), EventType::RECEIVE) << "/" << PACKETS
             << ", pending " << pair.a().pendingBytes());
    }

    // Per-channel order and exactly-once
    std::map<uint8_t, int> last;
    int received = 0;
    for (const auto& e : pair.bEvents()) {
        if (e.type != EventType::RECEIVE) continue;
        received++;
        int tag = e.data[0];
        if (tag % 4 != e.channel_id) FAIL("packet " << tag << " on channel " << int(e.channel_id));
        if (e.data != tagged(static_cast<uint8_t>(tag), 200 + static_cast<size_t>(tag) * 137)) {
            FAIL("payload of packet " << tag);
        }
        auto it = last.find(e.channel_id);
        if (it != last.end() && it->second >= tag) FAIL("channel " << int(e.channel_id) << " out of order");
        last[e.channel_id] = tag;
    }
    if (received != PACKETS) FAIL("received " << received);
    if (pair.a().stats().fragments_resent == 0) FAIL("nothing was resent");

    PASS();
    return true;
}

bool test_persistent_supersede() {
    TEST("Stale persistent packet is never delivered");

    LinkPair pair(EndpointConfig{}, sim::LossyLink::Config{});
    if (!pair.connect()) FAIL("not connected");

    // First update is lost on the wire
    pair.block(true, false);
    pair.a().send(tagged(1, 100), 0, SendMode::PERSISTENT);
    pair.tick();
    pair.block(false, false);

    pair.a().send(tagged(2, 100), 0, SendMode::PERSISTENT);

    bool ok = pair.runUntil([&] {
        return pair.count(pair.bEvents(), EventType::RECEIVE) >= 1 && pair.a().pendingBytes() == 0;
    }, 10000);
    if (!ok) FAIL("newer update not delivered");
    pair.runUntil([] { return false; }, 3000);

    if (pair.count(pair.bEvents(), EventType::RECEIVE) != 1) FAIL("stale update delivered");
    for (const auto& e : pair.bEvents()) {
        if (e.type == EventType::RECEIVE && e.data[0] != 2) FAIL("wrong update delivered");
    }

    PASS();
    return true;
}

bool test_time_sensitive_expiry() {
    TEST("Time-sensitive packet that misses its flush is dropped");

    LinkPair pair(EndpointConfig{}, sim::LossyLink::Config{});
    if (!pair.connect()) FAIL("not connected");

    // Bulk data ahead of it uses up the credit
    pair.a().send(tagged(1, 100000), 0, SendMode::RELIABLE);
    pair.a().send(tagged(2, 50), 1, SendMode::TIME_SENSITIVE);
    pair.tick();

    if (pair.a().transfer()->senderStats().packets_expired != 1) FAIL("not expired");

    pair.runUntil([&] { return pair.a().pendingBytes() == 0; }, 60000);
    for (const auto& e : pair.bEvents()) {
        if (e.type == EventType::RECEIVE && e.channel_id == 1) FAIL("expired packet delivered");
    }
    if (pair.count(pair.bEvents(), EventType::RECEIVE) != 1) FAIL("bulk packet not delivered");

    PASS();
    return true;
}

bool test_corruption() {
    TEST("Corrupted datagrams are discarded and recovered");

    sim::LossyLink::Config link;
    link.latency_ms = 5;
    link.corrupt_probability = 0.2f;
    LinkPair pair(EndpointConfig{}, link);
    if (!pair.connect()) FAIL("not connected");

    pair.a().send(tagged(9, 30000), 0, SendMode::RELIABLE);
    bool ok = pair.runUntil([&] {
        return pair.count(pair.bEvents(), EventType::RECEIVE) == 1 && pair.a().pendingBytes() == 0;
    }, 60000);
    if (!ok) FAIL("not delivered");

    size_t rejected = pair.a().stats().frames_rejected_crc + pair.b().stats().frames_rejected_crc;
    if (rejected == 0) FAIL("no corrupt frame was seen");
    for (const auto& e : pair.bEvents()) {
        if (e.type == EventType::RECEIVE && e.data != tagged(9, 30000)) FAIL("payload corrupted");
    }

    PASS();
    return true;
}

bool test_graceful_disconnect() {
    TEST("Graceful disconnect after draining");

    LinkPair pair(EndpointConfig{}, sim::LossyLink::Config{});
    if (!pair.connect()) FAIL("not connected");

    pair.a().send(tagged(3, 20000), 2, SendMode::RELIABLE);
    pair.a().disconnect(pair.now());

    bool ok = pair.runUntil([&] {
        return pair.a().state() == ConnectionState::CLOSED && pair.b().state() == ConnectionState::CLOSED;
    }, 20000);
    if (!ok) FAIL("not closed");

    if (pair.count(pair.bEvents(), EventType::RECEIVE) != 1) FAIL("queued data lost on disconnect");
    if (pair.count(pair.aEvents(), EventType::DISCONNECT) != 1) FAIL("alpha DISCONNECT events");
    if (pair.count(pair.bEvents(), EventType::DISCONNECT) != 1) FAIL("bravo DISCONNECT events");
    if (pair.a().send(Bytes(1), 0, SendMode::RELIABLE)) FAIL("send after close");

    PASS();
    return true;
}

bool test_silence_timeout() {
    TEST("Both ends time out when the path goes dead");

    LinkPair pair(EndpointConfig{}, sim::LossyLink::Config{});
    if (!pair.connect()) FAIL("not connected");

    pair.block(true, true);
    bool ok = pair.runUntil([&] {
        return pair.count(pair.aEvents(), EventType::TIMEOUT) == 1 &&
               pair.count(pair.bEvents(), EventType::TIMEOUT) == 1;
    }, 15000);
    if (!ok) FAIL("no timeout");

    PASS();
    return true;
}

bool test_keepalive() {
    TEST("Keepalive holds an idle link open");

    LinkPair pair(EndpointConfig{}, sim::LossyLink::Config{});
    if (!pair.connect()) FAIL("not connected");

    pair.runUntil([] { return false; }, 30000);
    if (!pair.a().isConnected() || !pair.b().isConnected()) FAIL("idle link dropped");
    if (pair.a().transfer()->stats().sync_frames_sent == 0) FAIL("no keepalive sent");

    PASS();
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    setLogLevel(LogLevel::WARN);

    std::cout << "=== Connection Tests ===\n\n";

    std::cout << "State machine:\n";
    test_sm_handshake();
    test_sm_handshake_timeout();
    test_sm_silence_timeout();
    test_sm_graceful_disconnect();
    test_sm_disconnect_timeout();
    test_sm_peer_disconnect();

    std::cout << "\nHandshake:\n";
    test_handshake_clean();
    test_handshake_spoof();
    test_send_requires_connection();
    test_invalid_config_refused();

    std::cout << "\nData transfer:\n";
    test_reliable_end_to_end();
    test_reliable_under_loss();
    test_persistent_supersede();
    test_time_sensitive_expiry();
    test_corruption();

    std::cout << "\nTeardown:\n";
    test_graceful_disconnect();
    test_silence_timeout();
    test_keepalive();

    std::cout << "\n=== Results: " << tests_passed << "/" << tests_run << " passed ===\n";
    return (tests_passed == tests_run) ? 0 : 1;
}
