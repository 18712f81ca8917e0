#pragma once

#include "conduit/types.hpp"
#include <cstdint>

namespace conduit {
namespace protocol {

// CRC-32 with polynomial 0x132C00699 (Koopman), reflected form 0x9960034C.
// Init 0xFFFFFFFF, final xor 0xFFFFFFFF. Check("123456789") = 0x11A6F2A3.
uint32_t crc32(ByteSpan data);

// Continue a running CRC (pass the previous return value as crc)
uint32_t crc32Update(uint32_t crc, ByteSpan data);

} // namespace protocol
} // namespace conduit
