#pragma once

#include <cstdint>
#include <cstddef>
#include <span>
#include <vector>

namespace conduit {

// Core types
using Bytes = std::vector<uint8_t>;            // Packet / frame payload
using ByteSpan = std::span<const uint8_t>;     // Read-only view for decoding
using MutableByteSpan = std::span<uint8_t>;

// Protocol version announced in CONNECT
constexpr uint8_t PROTOCOL_VERSION = 1;

// Channels per connection (ids 0..63)
constexpr size_t MAX_CHANNELS = 64;

// Size limits
constexpr size_t INTERNET_MTU = 1500;
constexpr size_t UDP_HEADER_SIZE = 28;                           // IPv4 + UDP
constexpr size_t MAX_FRAME_SIZE = INTERNET_MTU - UDP_HEADER_SIZE; // 1472
constexpr size_t MIN_FRAME_SIZE = 256;                           // Smallest MTU override

// Largest packet send() will ever accept
constexpr size_t MAX_PACKET_SIZE = 8 * 1024 * 1024;

// Delivery guarantee chosen per packet
enum class SendMode : uint8_t {
    TIME_SENSITIVE = 0,  // Dropped if not emitted during the flush it was queued for
    UNRELIABLE     = 1,  // Sent once, ordered per channel
    PERSISTENT     = 2,  // Resent until acked or superseded by a newer packet
    RELIABLE       = 3,  // Resent until acked, never superseded
};

const char* sendModeToString(SendMode mode);

// Events surfaced to the application
enum class EventType : uint8_t {
    CONNECT,     // Handshake completed
    DISCONNECT,  // Orderly teardown completed (either side)
    RECEIVE,     // Packet delivered
    TIMEOUT,     // Peer went silent; connection closed
};

const char* eventTypeToString(EventType type);

struct Event {
    EventType type = EventType::RECEIVE;
    uint8_t channel_id = 0;   // RECEIVE only
    Bytes data;               // RECEIVE only
};

} // namespace conduit
