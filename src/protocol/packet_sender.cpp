#include "packet_sender.hpp"
#include "fragment.hpp"
#include "conduit/logging.hpp"

namespace conduit {
namespace protocol {

PacketSender::PacketSender(uint8_t channel_count, size_t alloc_limit, uint32_t base_id,
                           size_t fragment_size, size_t max_packet_size)
    : channel_count_(channel_count)
    , alloc_limit_(allocLimitCeil(alloc_limit))
    , fragment_size_(fragment_size)
    , max_packet_size_(max_packet_size)
    , base_id_(base_id & ID_MASK)
    , next_id_(base_id & ID_MASK) {
}

bool PacketSender::enqueue(Bytes data, uint8_t channel_id, SendMode mode, uint32_t flush_id) {
    if (channel_id >= channel_count_) {
        LOG_WARN("CHAN", "send() on channel %u, only %u open", channel_id, channel_count_);
        stats_.packets_rejected++;
        return false;
    }
    if (data.size() > max_packet_size_) {
        LOG_WARN("CHAN", "send() of %zu bytes exceeds limit %zu", data.size(), max_packet_size_);
        stats_.packets_rejected++;
        return false;
    }
    size_t last_fragment_id = fragmentCount(data.size(), fragment_size_) - 1;
    if (last_fragment_id > UINT16_MAX ||
        packetAllocSize(data.size(), static_cast<uint16_t>(last_fragment_id)) > alloc_limit_) {
        LOG_WARN("CHAN", "send() of %zu bytes in %zu fragments exceeds the peer's allocation %zu",
                 data.size(), last_fragment_id + 1, alloc_limit_);
        stats_.packets_rejected++;
        return false;
    }

    queued_bytes_ += data.size();
    stats_.packets_queued++;

    QueuedPacket qp;
    qp.data = std::move(data);
    qp.channel_id = channel_id;
    qp.mode = mode;
    qp.flush_id = flush_id;
    queue_.push_back(std::move(qp));
    return true;
}

PendingPacketPtr PacketSender::nextPacket(uint32_t flush_id) {
    while (!queue_.empty()) {
        QueuedPacket& front = queue_.front();

        if (front.mode == SendMode::TIME_SENSITIVE && front.flush_id != flush_id) {
            queued_bytes_ -= front.data.size();
            queue_.pop_front();
            stats_.packets_expired++;
            continue;
        }

        // Window full
        if (idLead(next_id_, base_id_) >= PACKET_WINDOW_SIZE) {
            return nullptr;
        }
        uint16_t last_fragment_id =
            static_cast<uint16_t>(fragmentCount(front.data.size(), fragment_size_) - 1);
        size_t alloc = packetAllocSize(front.data.size(), last_fragment_id);

        // Peer cannot buffer more right now
        if (alloc_used_ + alloc > alloc_limit_) {
            return nullptr;
        }

        auto packet = std::make_shared<PendingPacket>();
        packet->sequence_id = next_id_;
        packet->channel_id = front.channel_id;
        packet->mode = front.mode;
        packet->flush_id = front.flush_id;
        packet->window_parent_lead = parentLead(window_parent_);
        packet->channel_parent_lead = parentLead(channel_parents_[front.channel_id]);
        packet->fragment_size = fragment_size_;
        packet->last_fragment_id = last_fragment_id;
        packet->alloc_size = alloc;
        packet->fragment_acked.assign(static_cast<size_t>(packet->last_fragment_id) + 1, false);
        packet->data = std::move(front.data);

        queued_bytes_ -= packet->data.size();
        queue_.pop_front();

        if (packet->mode == SendMode::RELIABLE) {
            window_parent_ = packet->sequence_id;
            channel_parents_[packet->channel_id] = packet->sequence_id;
        }

        in_flight_bytes_ += packet->data.size();
        alloc_used_ += alloc;
        if (packet->isResendable()) {
            unacked_bytes_ += packet->data.size();
        }
        in_flight_.push_back(packet);

        next_id_ = idAdd(next_id_, 1);
        stats_.packets_assigned++;

        LOG_CHAN(TRACE, "Packet %u assigned: ch=%u mode=%s len=%zu wlead=%u clead=%u",
                 packet->sequence_id, packet->channel_id, sendModeToString(packet->mode),
                 packet->data.size(), packet->window_parent_lead, packet->channel_parent_lead);
        return packet;
    }
    return nullptr;
}

void PacketSender::expireTimeSensitive(uint32_t flush_id) {
    for (auto it = queue_.begin(); it != queue_.end();) {
        if (it->mode == SendMode::TIME_SENSITIVE && it->flush_id == flush_id) {
            queued_bytes_ -= it->data.size();
            stats_.packets_expired++;
            it = queue_.erase(it);
        } else {
            ++it;
        }
    }
}

bool PacketSender::acknowledge(uint32_t receiver_base_id) {
    uint32_t lead = idLead(receiver_base_id, base_id_);
    if (lead == 0) {
        return true;
    }
    if (lead > idLead(next_id_, base_id_)) {
        LOG_WINDOW(DEBUG, "Ignoring receiver base %u (sender base %u, next %u)",
                   receiver_base_id, base_id_, next_id_);
        return false;
    }

    for (uint32_t i = 0; i < lead && !in_flight_.empty(); i++) {
        release(*in_flight_.front());
        in_flight_.pop_front();
    }
    base_id_ = receiver_base_id & ID_MASK;

    // Parents behind the base are settled
    if (window_parent_ && isBehindBase(*window_parent_)) {
        window_parent_.reset();
    }
    for (auto& parent : channel_parents_) {
        if (parent && isBehindBase(*parent)) {
            parent.reset();
        }
    }
    return true;
}

void PacketSender::markFragmentAcked(PendingPacket& packet, uint16_t fragment_id) {
    if (packet.released || fragment_id >= packet.fragment_acked.size() ||
        packet.fragment_acked[fragment_id]) {
        return;
    }
    packet.fragment_acked[fragment_id] = true;
    packet.acked_count++;
    if (packet.isResendable()) {
        unacked_bytes_ -= packet.fragmentBytes(fragment_id);
    }
}

void PacketSender::release(PendingPacket& packet) {
    in_flight_bytes_ -= packet.data.size();
    alloc_used_ -= packet.alloc_size;
    if (packet.isResendable()) {
        for (size_t i = 0; i < packet.fragment_acked.size(); i++) {
            if (!packet.fragment_acked[i]) {
                unacked_bytes_ -= packet.fragmentBytes(static_cast<uint16_t>(i));
            }
        }
    }
    packet.released = true;
}

uint16_t PacketSender::parentLead(const std::optional<uint32_t>& parent) const {
    if (!parent) {
        return 0;
    }
    return static_cast<uint16_t>(idLead(next_id_, *parent));
}

void PacketSender::clear() {
    queue_.clear();
    for (auto& packet : in_flight_) {
        packet->released = true;
    }
    in_flight_.clear();
    queued_bytes_ = 0;
    in_flight_bytes_ = 0;
    alloc_used_ = 0;
    unacked_bytes_ = 0;
}

} // namespace protocol
} // namespace conduit
