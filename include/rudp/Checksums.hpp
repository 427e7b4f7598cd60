#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstddef>
#include <cstdint>

namespace com { namespace arena {

// incremental CRC-16 (polynomial 0x1021, MSB first). answers the current state of
// the shift register; the packet checksum is the inverted final register.

uint16_t crc16_ccitt(uint16_t crc, const void *buf, size_t len);
uint16_t crc16_ccitt(const void *buf, size_t len); // initialize register with 0xFFFF

// crc16_ccitt over header (with its checksum bytes treated as zero) then payload, inverted.
uint16_t packet_crc16(const void *header, size_t headerLen, size_t checksumOffset, const void *payload, size_t payloadLen);

} } // namespace com::arena
