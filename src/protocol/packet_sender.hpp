#pragma once

#include "pending_packet.hpp"
#include "sequence.hpp"
#include <array>
#include <deque>
#include <optional>

namespace conduit {
namespace protocol {

struct SenderStats {
    size_t packets_queued = 0;
    size_t packets_assigned = 0;          // Given a sequence ID
    size_t packets_expired = 0;           // TIME_SENSITIVE, missed their flush
    size_t packets_rejected = 0;          // Bad channel or too large
};

/**
 * Packet Sender
 *
 * Queues application packets and assigns sequence IDs when the emitter
 * asks for more data. An ID is handed out only while it stays inside the
 * peer's packet window and the packets in flight, each worth
 * packetAllocSize(), fit the peer's receive allocation. The peer charges
 * the same amounts, so a packet assigned here is never refused there.
 *
 * Every packet records two parent leads: the distance back to the newest
 * reliable packet still ahead of the sender base (window parent) and the
 * same restricted to its own channel (channel parent). The receiver uses
 * them to order delivery and to skip packets that were never reliable.
 */
class PacketSender {
public:
    PacketSender(uint8_t channel_count, size_t alloc_limit, uint32_t base_id,
                 size_t fragment_size, size_t max_packet_size);

    // Returns false (and drops the packet) on a bad channel, an oversize
    // packet, or one the peer's allocation could never hold
    bool enqueue(Bytes data, uint8_t channel_id, SendMode mode, uint32_t flush_id);

    // Next packet with an ID assigned, or nullptr if the queue is empty or
    // the window / allocation is full. TIME_SENSITIVE packets queued for a
    // different flush are discarded on the way.
    PendingPacketPtr nextPacket(uint32_t flush_id);

    // Drop TIME_SENSITIVE packets not emitted during their flush
    void expireTimeSensitive(uint32_t flush_id);

    // Peer reports its packet window base. Releases every packet behind it.
    // Returns false if the value is not a forward move within what was sent.
    bool acknowledge(uint32_t receiver_base_id);

    void markFragmentAcked(PendingPacket& packet, uint16_t fragment_id);

    bool isBehindBase(uint32_t sequence_id) const {
        return idLead(sequence_id, base_id_) >= ID_HALF;
    }

    uint32_t baseId() const { return base_id_; }
    uint32_t nextId() const { return next_id_; }
    size_t queuedCount() const { return queue_.size(); }
    size_t queuedBytes() const { return queued_bytes_; }
    size_t unackedBytes() const { return unacked_bytes_; }
    size_t inFlightBytes() const { return in_flight_bytes_; }
    size_t allocUsed() const { return alloc_used_; }
    size_t allocLimit() const { return alloc_limit_; }
    size_t inFlightCount() const { return in_flight_.size(); }
    size_t fragmentSize() const { return fragment_size_; }
    const SenderStats& stats() const { return stats_; }

    void clear();

private:
    struct QueuedPacket {
        Bytes data;
        uint8_t channel_id = 0;
        SendMode mode = SendMode::RELIABLE;
        uint32_t flush_id = 0;
    };

    void release(PendingPacket& packet);
    uint16_t parentLead(const std::optional<uint32_t>& parent) const;

    uint8_t channel_count_;
    size_t alloc_limit_;
    size_t fragment_size_;
    size_t max_packet_size_;

    uint32_t base_id_;
    uint32_t next_id_;

    std::deque<QueuedPacket> queue_;
    std::deque<PendingPacketPtr> in_flight_;   // Every assigned ID, oldest first

    std::optional<uint32_t> window_parent_;
    std::array<std::optional<uint32_t>, MAX_CHANNELS> channel_parents_{};

    size_t queued_bytes_ = 0;
    size_t in_flight_bytes_ = 0;
    size_t alloc_used_ = 0;
    size_t unacked_bytes_ = 0;

    SenderStats stats_;
};

} // namespace protocol
} // namespace conduit
