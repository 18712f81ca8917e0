#include "fragment.hpp"
#include "conduit/logging.hpp"

namespace conduit {
namespace protocol {

Datagram makeDatagram(const PendingPacket& packet, uint16_t fragment_id) {
    Datagram dg;
    dg.sequence_id = packet.sequence_id;
    dg.channel_id = packet.channel_id;
    dg.window_parent_lead = packet.window_parent_lead;
    dg.channel_parent_lead = packet.channel_parent_lead;
    dg.fragment_id = fragment_id;
    dg.last_fragment_id = packet.last_fragment_id;

    size_t begin = static_cast<size_t>(fragment_id) * packet.fragment_size;
    size_t len = packet.fragmentBytes(fragment_id);
    dg.data.assign(packet.data.begin() + begin, packet.data.begin() + begin + len);
    return dg;
}

std::vector<Datagram> fragmentPacket(const PendingPacket& packet) {
    std::vector<Datagram> out;
    out.reserve(static_cast<size_t>(packet.last_fragment_id) + 1);
    for (uint32_t i = 0; i <= packet.last_fragment_id; i++) {
        out.push_back(makeDatagram(packet, static_cast<uint16_t>(i)));
    }
    return out;
}

// ============================================================================
// Reassembler
// ============================================================================

std::optional<Bytes> Reassembler::addFragment(const Datagram& dg) {
    auto it = assemblies_.find(dg.sequence_id);

    if (it == assemblies_.end()) {
        Assembly a;
        a.last_fragment_id = dg.last_fragment_id;
        a.age = next_age_++;
        a.fragments.resize(static_cast<size_t>(dg.last_fragment_id) + 1);
        a.present.resize(static_cast<size_t>(dg.last_fragment_id) + 1, false);
        it = assemblies_.emplace(dg.sequence_id, std::move(a)).first;
    } else {
        const Assembly& a = it->second;
        if (a.last_fragment_id != dg.last_fragment_id) {
            LOG_FRAG(DEBUG, "Packet %u: fragment count changed (%u vs %u), dropping fragment",
                     dg.sequence_id, a.last_fragment_id, dg.last_fragment_id);
            return std::nullopt;
        }
        if (a.present[dg.fragment_id]) {
            return std::nullopt;  // Duplicate
        }
    }

    Assembly& a = it->second;
    a.fragments[dg.fragment_id] = dg.data;
    a.present[dg.fragment_id] = true;
    a.received++;
    a.bytes += dg.data.size();
    buffered_bytes_ += dg.data.size();

    if (a.received != static_cast<size_t>(a.last_fragment_id) + 1) {
        return std::nullopt;
    }

    // Complete: concatenate in index order
    Bytes packet;
    packet.reserve(a.bytes);
    for (const auto& frag : a.fragments) {
        packet.insert(packet.end(), frag.begin(), frag.end());
    }
    LOG_FRAG(TRACE, "Packet %u reassembled (%zu bytes, %u fragments)",
             dg.sequence_id, packet.size(), a.last_fragment_id + 1);
    eraseIt(it);
    return packet;
}

void Reassembler::erase(uint32_t sequence_id) {
    auto it = assemblies_.find(sequence_id);
    if (it != assemblies_.end()) {
        eraseIt(it);
    }
}

void Reassembler::clear() {
    assemblies_.clear();
    buffered_bytes_ = 0;
}

std::optional<uint32_t> Reassembler::oldest() const {
    auto oldest = assemblies_.end();
    for (auto it = assemblies_.begin(); it != assemblies_.end(); ++it) {
        if (oldest == assemblies_.end() || it->second.age < oldest->second.age) {
            oldest = it;
        }
    }
    if (oldest == assemblies_.end()) {
        return std::nullopt;
    }
    return oldest->first;
}

void Reassembler::eraseIt(std::map<uint32_t, Assembly>::iterator it) {
    buffered_bytes_ -= it->second.bytes;
    assemblies_.erase(it);
}

} // namespace protocol
} // namespace conduit
