#include "crc32.hpp"
#include <array>

namespace conduit {
namespace protocol {

namespace {

constexpr uint32_t POLY_REFLECTED = 0x9960034C;

constexpr std::array<uint32_t, 256> makeTable() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t reg = i;
        for (int bit = 0; bit < 8; bit++) {
            reg = (reg & 1) ? (reg >> 1) ^ POLY_REFLECTED : (reg >> 1);
        }
        table[i] = reg;
    }
    return table;
}

constexpr std::array<uint32_t, 256> CRC_TABLE = makeTable();

} // namespace

uint32_t crc32Update(uint32_t crc, ByteSpan data) {
    uint32_t reg = ~crc;
    for (uint8_t b : data) {
        reg = (reg >> 8) ^ CRC_TABLE[(reg ^ b) & 0xFF];
    }
    return ~reg;
}

uint32_t crc32(ByteSpan data) {
    return crc32Update(0, data);
}

} // namespace protocol
} // namespace conduit
