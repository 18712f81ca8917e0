#pragma once

#include "frame.hpp"
#include "pending_packet.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace conduit {
namespace protocol {

// Number of fragments a payload of len bytes needs (an empty payload still
// takes one)
inline size_t fragmentCount(size_t len, size_t fragment_size) {
    return (len + fragment_size - 1) / fragment_size + (len == 0 ? 1 : 0);
}

// Largest fragment payload a peer can send (full-size frames)
constexpr size_t MAX_FRAGMENT_SIZE = fragmentPayloadSize(MAX_FRAME_SIZE);

// Receive allocation a packet is worth. The receiver cannot know the
// sender's fragment size, so fragmented packets count full-size fragments.
// Sender and receiver both charge this amount.
inline size_t packetAllocSize(size_t len, uint16_t last_fragment_id) {
    if (last_fragment_id == 0) {
        return len;
    }
    return (static_cast<size_t>(last_fragment_id) + 1) * MAX_FRAGMENT_SIZE;
}

// Allocation limit rounded up to whole fragments
inline size_t allocLimitCeil(size_t limit) {
    return (limit + MAX_FRAGMENT_SIZE - 1) / MAX_FRAGMENT_SIZE * MAX_FRAGMENT_SIZE;
}

// Build the datagram carrying one fragment of a pending packet. Packets
// that fit a single fragment are encoded whole (no fragment header).
Datagram makeDatagram(const PendingPacket& packet, uint16_t fragment_id);

// Split a whole packet into its datagrams, in fragment order
std::vector<Datagram> fragmentPacket(const PendingPacket& packet);

/**
 * Fragment Reassembler
 *
 * Buffers fragments keyed by packet sequence ID until every index from 0
 * to last_fragment_id is present, then returns the concatenated payload.
 *
 * Holds no memory policy of its own: the packet receiver reserves each
 * packet's allocation before its first fragment gets here, and evicts the
 * oldest() assembly when a new packet needs the room.
 */
class Reassembler {
public:
    // Add one fragment (dg.isFragment() must be true). Returns the full
    // payload when this fragment completes the packet.
    std::optional<Bytes> addFragment(const Datagram& dg);

    // Drop any partial state for a packet
    void erase(uint32_t sequence_id);

    void clear();

    // Sequence ID of the incomplete packet started first
    std::optional<uint32_t> oldest() const;

    bool contains(uint32_t sequence_id) const { return assemblies_.count(sequence_id) != 0; }
    size_t bufferedBytes() const { return buffered_bytes_; }
    size_t pendingCount() const { return assemblies_.size(); }

private:
    struct Assembly {
        uint16_t last_fragment_id = 0;
        uint16_t received = 0;
        size_t bytes = 0;
        uint64_t age = 0;              // Creation order, lower is older
        std::vector<Bytes> fragments;
        std::vector<bool> present;
    };

    void eraseIt(std::map<uint32_t, Assembly>::iterator it);

    size_t buffered_bytes_ = 0;
    uint64_t next_age_ = 0;
    std::map<uint32_t, Assembly> assemblies_;
};

} // namespace protocol
} // namespace conduit
