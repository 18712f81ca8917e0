#include "packet_receiver.hpp"
#include "conduit/logging.hpp"
#include <algorithm>
#include <limits>

namespace conduit {
namespace protocol {

PacketReceiver::PacketReceiver(uint8_t channel_count, size_t alloc_limit, uint32_t base_id,
                               size_t max_packet_size)
    : channel_count_(channel_count)
    , alloc_limit_(allocLimitCeil(alloc_limit))
    , max_packet_size_(max_packet_size)
    , max_fragments_(fragmentCount(max_packet_size, fragmentPayloadSize(MIN_FRAME_SIZE)))
    , base_id_(base_id & ID_MASK)
    , slots_(PACKET_WINDOW_SIZE) {
}

void PacketReceiver::handleDatagram(const Datagram& dg) {
    stats_.datagrams_received++;

    if (dg.channel_id >= channel_count_) {
        LOG_CHAN(DEBUG, "Datagram on unopened channel %u", dg.channel_id);
        stats_.datagrams_rejected++;
        return;
    }

    if (!plausibleSize(dg)) {
        LOG_FRAG(DEBUG, "Packet %u: %zu bytes, %u fragments exceeds what the peer may send",
                 dg.sequence_id, dg.data.size(), dg.last_fragment_id + 1);
        stats_.datagrams_rejected++;
        return;
    }

    uint32_t lead = idLead(dg.sequence_id, base_id_);
    if (lead >= PACKET_WINDOW_SIZE) {
        LOG_WINDOW(TRACE, "Packet %u outside window (base %u)", dg.sequence_id, base_id_);
        stats_.datagrams_rejected++;
        return;
    }

    Slot& slot = slotFor(dg.sequence_id);
    switch (slot.state) {
        case SlotState::COMPLETE:
        case SlotState::DELIVERED:
        case SlotState::DROPPED:
            stats_.datagrams_duplicate++;
            return;

        case SlotState::ASSEMBLING:
            if (!dg.isFragment() ||
                slot.channel_id != dg.channel_id ||
                slot.last_fragment_id != dg.last_fragment_id ||
                slot.window_parent_lead != dg.window_parent_lead ||
                slot.channel_parent_lead != dg.channel_parent_lead) {
                LOG_FRAG(DEBUG, "Packet %u: inconsistent fragment header", dg.sequence_id);
                stats_.datagrams_rejected++;
                return;
            }
            break;

        case SlotState::EMPTY: {
            size_t alloc = packetAllocSize(dg.data.size(), dg.last_fragment_id);
            if (!reserve(alloc)) {
                LOG_FRAG(DEBUG, "Packet %u refused: needs %zu bytes, %zu of %zu in use",
                         dg.sequence_id, alloc, alloc_used_, alloc_limit_);
                stats_.packets_refused++;
                return;
            }
            slot.state = SlotState::ASSEMBLING;
            slot.alloc = alloc;
            slot.last_fragment_id = dg.last_fragment_id;
            slot.channel_id = dg.channel_id;
            slot.window_parent_lead = dg.window_parent_lead;
            slot.channel_parent_lead = dg.channel_parent_lead;
            end_lead_ = std::max(end_lead_, lead + 1);
            break;
        }
    }

    if (!dg.isFragment()) {
        slot.data = dg.data;
        slot.state = SlotState::COMPLETE;
    } else if (auto packet = reassembler_.addFragment(dg)) {
        slot.data = std::move(*packet);
        slot.state = SlotState::COMPLETE;
    }

    if (slot.state == SlotState::COMPLETE) {
        deliverReady();
    }
    advanceBase();
}

bool PacketReceiver::resynchronize(uint32_t next_packet_id) {
    uint32_t lead = idLead(next_packet_id, base_id_);
    if (lead == 0 || lead > PACKET_WINDOW_SIZE) {
        return false;
    }

    LOG_WINDOW(DEBUG, "Packet window resync %u -> %u", base_id_, next_packet_id);

    deliverReady();
    while (base_id_ != (next_packet_id & ID_MASK)) {
        Slot& slot = slotFor(base_id_);
        if (slot.state == SlotState::COMPLETE || slot.state == SlotState::ASSEMBLING) {
            stats_.packets_dropped++;
        }
        reassembler_.erase(base_id_);
        retireBase();
    }
    deliverReady();
    advanceBase();
    return true;
}

void PacketReceiver::takeDelivered(std::vector<Event>& out) {
    while (!ready_.empty()) {
        out.push_back(std::move(ready_.front()));
        ready_.pop_front();
    }
}

bool PacketReceiver::plausibleSize(const Datagram& dg) const {
    if (!dg.isFragment()) {
        return dg.data.size() <= max_packet_size_;
    }
    return dg.data.size() <= MAX_FRAGMENT_SIZE &&
           static_cast<size_t>(dg.last_fragment_id) + 1 <= max_fragments_;
}

bool PacketReceiver::reserve(size_t alloc) {
    if (alloc > alloc_limit_) {
        return false;
    }
    while (alloc_used_ + alloc > alloc_limit_) {
        auto oldest = reassembler_.oldest();
        if (!oldest) {
            return false;
        }
        evict(*oldest);
    }
    alloc_used_ += alloc;
    return true;
}

void PacketReceiver::evict(uint32_t id) {
    Slot& slot = slotFor(id);
    LOG_FRAG(DEBUG, "Evicting incomplete packet %u (%zu bytes reserved)", id, slot.alloc);
    reassembler_.erase(id);
    releaseAlloc(slot);
    // The slot reopens for a resend
    slot = Slot{};
    stats_.reassemblies_evicted++;
}

void PacketReceiver::releaseAlloc(Slot& slot) {
    alloc_used_ -= slot.alloc;
    slot.alloc = 0;
}

bool PacketReceiver::parentSatisfied(uint32_t id, const Slot& slot) const {
    if (slot.channel_parent_lead == 0) {
        return true;
    }
    uint32_t parent = idSub(id, slot.channel_parent_lead);
    if (idLead(parent, base_id_) >= PACKET_WINDOW_SIZE) {
        return true;  // Behind the base, so already released
    }
    return slots_[parent % PACKET_WINDOW_SIZE].state == SlotState::DELIVERED;
}

bool PacketReceiver::newerOnChannel(uint32_t id, uint8_t channel_id) const {
    const ChannelState& ch = channels_[channel_id];
    if (!ch.has_last) {
        return true;
    }
    return idLead(id, base_id_) > idLead(ch.last_delivered, base_id_);
}

void PacketReceiver::deliverReady() {
    for (uint32_t i = 0; i < end_lead_; i++) {
        uint32_t id = idAdd(base_id_, i);
        Slot& slot = slotFor(id);
        if (slot.state != SlotState::COMPLETE) {
            continue;
        }

        if (!newerOnChannel(id, slot.channel_id)) {
            LOG_CHAN(TRACE, "Packet %u superseded on channel %u", id, slot.channel_id);
            slot.state = SlotState::DROPPED;
            slot.data.clear();
            releaseAlloc(slot);
            stats_.packets_dropped++;
            continue;
        }

        if (!parentSatisfied(id, slot)) {
            continue;
        }

        Event ev;
        ev.type = EventType::RECEIVE;
        ev.channel_id = slot.channel_id;
        ev.data = std::move(slot.data);
        ready_.push_back(std::move(ev));

        slot.data.clear();
        slot.state = SlotState::DELIVERED;
        releaseAlloc(slot);
        channels_[slot.channel_id].has_last = true;
        channels_[slot.channel_id].last_delivered = id;
        stats_.packets_delivered++;
    }
}

void PacketReceiver::advanceBase() {
    if (end_lead_ == 0) {
        return;
    }

    // floor[i]: lowest position (relative to the current base) below which a
    // known slot at or after i can no longer vouch for missing slots.
    // A missing slot m is provably unreliable if some known s > m has its
    // window parent strictly below m.
    const int64_t NONE = std::numeric_limits<int64_t>::max();
    uint32_t end = end_lead_;
    std::vector<int64_t> floor(end + 1, NONE);
    for (int64_t i = static_cast<int64_t>(end) - 1; i >= 0; i--) {
        const Slot& slot = slotFor(idAdd(base_id_, static_cast<uint32_t>(i)));
        int64_t f = NONE;
        if (slot.state != SlotState::EMPTY) {
            f = slot.window_parent_lead == 0 ? -1 : i - slot.window_parent_lead;
        }
        floor[i] = std::min(f, floor[i + 1]);
    }

    for (uint32_t i = 0; i < end; i++) {
        Slot& slot = slotFor(base_id_);
        if (slot.state == SlotState::DELIVERED || slot.state == SlotState::DROPPED) {
            retireBase();
            continue;
        }
        if (slot.state == SlotState::COMPLETE) {
            break;
        }
        // EMPTY or ASSEMBLING
        if (floor[i + 1] < static_cast<int64_t>(i)) {
            if (slot.state == SlotState::ASSEMBLING) {
                stats_.packets_dropped++;
            }
            LOG_WINDOW(TRACE, "Skipping unreliable packet %u", base_id_);
            reassembler_.erase(base_id_);
            retireBase();
            continue;
        }
        break;
    }
}

void PacketReceiver::retireBase() {
    Slot& slot = slotFor(base_id_);
    if (slot.state == SlotState::DELIVERED) {
        ChannelState& ch = channels_[slot.channel_id];
        if (ch.has_last && ch.last_delivered == base_id_) {
            ch.has_last = false;
        }
    }
    releaseAlloc(slot);
    slot = Slot{};
    base_id_ = idAdd(base_id_, 1);
    if (end_lead_ > 0) end_lead_--;
}

} // namespace protocol
} // namespace conduit
