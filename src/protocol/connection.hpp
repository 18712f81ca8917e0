#pragma once

#include "frame.hpp"
#include "state_machine.hpp"
#include "transfer_engine.hpp"
#include "conduit/config.hpp"
#include "conduit/types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace conduit {
namespace protocol {

// Connection statistics
struct ConnectionStats {
    size_t frames_sent = 0;
    size_t bytes_sent = 0;
    size_t frames_received = 0;
    size_t bytes_received = 0;

    size_t packets_sent = 0;            // Assigned a sequence ID
    size_t packets_delivered = 0;
    size_t fragments_resent = 0;

    size_t frames_rejected_crc = 0;     // Failed to decode (checksum or structure)
    size_t frames_rejected_window = 0;  // Frame ID outside the receive window
    size_t frames_rejected_state = 0;   // Data-phase frame outside the data phase
    size_t acks_rejected = 0;           // Ack group failed validation
    size_t handshakes_rejected = 0;     // Bad version/parameters/nonce
    size_t reassemblies_evicted = 0;
};

/**
 * Connection
 *
 * One peer relationship, driven entirely by the caller:
 *   - receive() with every datagram from the peer's address
 *   - step() periodically (all timers run off the supplied time)
 *   - flush() when newly processed acks should go out immediately
 *   - pollEvents() for CONNECT / RECEIVE / DISCONNECT / TIMEOUT
 *
 * Outbound datagrams leave through the transmit callback together with the
 * remote address. Both sides run the same handshake: each sends CONNECT
 * with a random nonce and acknowledges the other's; the connection opens
 * once both directions are confirmed.
 *
 * Not thread-safe. Share between threads only by handing the whole object
 * over or by guarding it with a single lock.
 */
class Connection {
public:
    using TransmitCallback = std::function<void(const std::string& address, const Bytes& data)>;

    Connection(const EndpointConfig& config, std::string remote_address, uint64_t now_ms,
               uint32_t seed = std::random_device{}());

    void setTransmitCallback(TransmitCallback cb) { on_transmit_ = std::move(cb); }

    // --- Driving ---

    void receive(ByteSpan data, uint64_t now_ms);
    void step(uint64_t now_ms);
    void flush(uint64_t now_ms);

    // --- Application ---

    // Queue a packet. Returns false if not connected, the channel is not
    // open, or the packet is larger than negotiated.
    bool send(Bytes data, uint8_t channel_id, SendMode mode);

    // Events produced since the last call
    std::vector<Event> pollEvents();

    // Graceful close: drain, then DISCONNECT until acknowledged
    void disconnect(uint64_t now_ms);

    // Send one DISCONNECT and close
    void disconnectNow(uint64_t now_ms);

    // --- State ---

    ConnectionState state() const { return context_.state; }
    bool isConnected() const { return context_.state == ConnectionState::CONNECTED; }
    const std::string& remoteAddress() const { return remote_address_; }
    uint32_t localNonce() const { return local_nonce_; }

    // Bytes awaiting delivery confirmation (0 when not in the data phase)
    size_t pendingBytes() const;

    std::optional<uint64_t> rttMs() const;
    uint32_t sendRate() const;
    ConnectionStats stats() const;

    // Negotiated data-phase parameters (only valid once connected)
    const TransferEngine* transfer() const { return engine_.get(); }

private:
    // Frame handlers (connection_handlers.cpp)
    void handleConnect(const Frame& frame, uint64_t now_ms);
    void handleConnectAck(const Frame& frame, uint64_t now_ms);
    void handleDataPhase(const Frame& frame, uint64_t now_ms);
    bool validConnectParams(const ConnectParams& params) const;

    void dispatchEvent(LinkEventType type, uint64_t now_ms, bool drained = false);
    void applyEffect(Effect effect);

    void openTransfer();
    void release();
    void collectDelivered();
    void transmitFrame(const Frame& frame);

    EndpointConfig config_;
    std::string remote_address_;
    std::mt19937 rng_;

    uint32_t local_nonce_;
    std::optional<ConnectParams> remote_params_;

    StateContext context_;
    std::unique_ptr<TransferEngine> engine_;
    std::vector<Event> events_;

    ConnectionStats stats_;
    TransmitCallback on_transmit_;
};

} // namespace protocol
} // namespace conduit
