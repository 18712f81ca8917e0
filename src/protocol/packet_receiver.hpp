#pragma once

#include "fragment.hpp"
#include "sequence.hpp"
#include "conduit/types.hpp"
#include <array>
#include <deque>
#include <vector>

namespace conduit {
namespace protocol {

// Receive-side counters
struct ReceiverStats {
    size_t datagrams_received = 0;
    size_t datagrams_rejected = 0;   // Outside window, bad channel, inconsistent header
    size_t datagrams_duplicate = 0;
    size_t packets_delivered = 0;
    size_t packets_dropped = 0;      // Superseded, skipped or dropped on resync
    size_t packets_refused = 0;      // Receive allocation full
    size_t reassemblies_evicted = 0;
};

/**
 * Packet Receiver
 *
 * Owns the packet sequence-ID window and per-channel delivery.
 *
 * A packet is released to the application when it is complete, its channel
 * parent (the previous reliable packet on its channel) has been released or
 * lies behind the window base, and it is newer than the last packet released
 * on its channel. Complete packets older than that are dropped.
 *
 * The window base advances past released/dropped slots, and past missing
 * slots that a later datagram proves were not reliable: a packet s with
 * window_parent_lead W says every ID strictly between (s - W) and s is not
 * reliable, and W == 0 says no reliable packet before s is outstanding.
 *
 * Memory: every packet is charged packetAllocSize() against the receive
 * allocation when its first datagram opens a slot, before anything is
 * buffered, and keeps the charge until it is released or dropped. A packet
 * that does not fit evicts the oldest incomplete reassembly; if it still
 * does not fit it is refused and left for the sender to resend.
 */
class PacketReceiver {
public:
    // max_packet_size: largest packet the peer announced it will send
    PacketReceiver(uint8_t channel_count, size_t alloc_limit, uint32_t base_id,
                   size_t max_packet_size = MAX_PACKET_SIZE);

    void handleDatagram(const Datagram& dg);

    // Force the base forward to next_packet_id, delivering what can be
    // delivered and dropping the rest. Returns false if the move is not a
    // forward move within the window.
    bool resynchronize(uint32_t next_packet_id);

    // Move delivered packets into out (ownership passes to the caller)
    void takeDelivered(std::vector<Event>& out);

    uint32_t baseId() const { return base_id_; }
    size_t deliveredPending() const { return ready_.size(); }
    size_t reassemblyBytes() const { return reassembler_.bufferedBytes(); }
    size_t allocUsed() const { return alloc_used_; }
    size_t allocLimit() const { return alloc_limit_; }
    size_t evictionCount() const { return stats_.reassemblies_evicted; }
    const ReceiverStats& stats() const { return stats_; }

private:
    enum class SlotState : uint8_t {
        EMPTY,
        ASSEMBLING,
        COMPLETE,
        DELIVERED,
        DROPPED,
    };

    struct Slot {
        SlotState state = SlotState::EMPTY;
        uint8_t channel_id = 0;
        uint16_t window_parent_lead = 0;
        uint16_t channel_parent_lead = 0;
        uint16_t last_fragment_id = 0;
        size_t alloc = 0;            // Charged against alloc_used_
        Bytes data;
    };

    struct ChannelState {
        bool has_last = false;
        uint32_t last_delivered = 0;
    };

    Slot& slotFor(uint32_t id) { return slots_[id % PACKET_WINDOW_SIZE]; }

    // Datagram sizes within what the peer may legitimately send
    bool plausibleSize(const Datagram& dg) const;

    // Charge alloc bytes, evicting incomplete reassemblies if needed
    bool reserve(size_t alloc);
    void evict(uint32_t id);
    void releaseAlloc(Slot& slot);

    bool parentSatisfied(uint32_t id, const Slot& slot) const;
    bool newerOnChannel(uint32_t id, uint8_t channel_id) const;

    // Release complete packets in order
    void deliverReady();

    // Advance the base over finished and provably unreliable slots
    void advanceBase();

    // Retire the base slot and move the base forward by one
    void retireBase();

    uint8_t channel_count_;
    size_t alloc_limit_;
    size_t alloc_used_ = 0;
    size_t max_packet_size_;
    size_t max_fragments_;
    uint32_t base_id_;
    uint32_t end_lead_ = 0;  // One past the highest slot with a known header
    std::vector<Slot> slots_;
    std::array<ChannelState, MAX_CHANNELS> channels_{};
    Reassembler reassembler_;
    std::deque<Event> ready_;
    ReceiverStats stats_;
};

} // namespace protocol
} // namespace conduit
