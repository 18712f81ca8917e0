#pragma once

#include <cstdint>

namespace conduit {
namespace protocol {

// 20-bit sequence arithmetic shared by frame IDs and packet IDs.
// All IDs live in [0, ID_SPACE); comparisons are done through lead(),
// the forward distance from a base, so wraparound is transparent.
constexpr uint32_t ID_BITS = 20;
constexpr uint32_t ID_SPACE = 1u << ID_BITS;
constexpr uint32_t ID_MASK = ID_SPACE - 1;
constexpr uint32_t ID_HALF = ID_SPACE / 2;

// Sliding window widths
constexpr uint32_t PACKET_WINDOW_SIZE = 4096;
constexpr uint32_t FRAME_WINDOW_SIZE = 16384;

inline uint32_t idAdd(uint32_t id, uint32_t n) { return (id + n) & ID_MASK; }
inline uint32_t idSub(uint32_t id, uint32_t n) { return (id - n) & ID_MASK; }

// Forward distance from base to id
inline uint32_t idLead(uint32_t id, uint32_t base) { return (id - base) & ID_MASK; }

// True if id is ahead of base by less than half the space
inline bool idAhead(uint32_t id, uint32_t base) {
    uint32_t lead = idLead(id, base);
    return lead != 0 && lead < ID_HALF;
}

inline bool idValid(uint32_t id) { return (id & ~ID_MASK) == 0; }

} // namespace protocol
} // namespace conduit
