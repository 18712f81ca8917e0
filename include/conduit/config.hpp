#pragma once

#include "conduit/types.hpp"
#include <string>

namespace conduit {

// Per-endpoint parameters, read once when a connection is constructed.
struct EndpointConfig {
    size_t max_frame_size = MAX_FRAME_SIZE;     // Largest UDP payload emitted (MTU override)
    uint32_t max_send_rate = 2000000;           // Outgoing bandwidth cap (bytes/s)
    uint32_t max_receive_rate = 2000000;        // Announced to peer, caps its send rate
    size_t max_packet_size = 1000000;           // Largest packet send() accepts
    size_t max_receive_alloc = 1000000;         // Reassembly memory limit (bytes)
    uint8_t channel_count = MAX_CHANNELS;       // Channels announced (1..64)

    bool keepalive = true;                      // Send Sync frames while idle
    uint32_t keepalive_interval_ms = 5000;      // Idle time before a keepalive

    uint32_t timeout_ms = 10000;                // Silence before a connected link times out
    uint32_t handshake_timeout_ms = 10000;      // Time allowed for the handshake
    uint32_t handshake_resend_ms = 500;         // CONNECT / DISCONNECT retransmit interval
    uint32_t disconnect_timeout_ms = 3000;      // Grace period after first DISCONNECT

    // True if every parameter is within range
    bool isValid() const;
};

// INI persistence ([Endpoint] section, key=value lines, '#' comments).
// Unknown keys are ignored. Returns false if the file cannot be opened
// or the loaded configuration is invalid (cfg is left untouched then).
bool loadConfig(const std::string& path, EndpointConfig& cfg);
bool saveConfig(const std::string& path, const EndpointConfig& cfg);

} // namespace conduit
