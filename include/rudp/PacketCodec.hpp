#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "Object.hpp"
#include "packet.hpp"

namespace com { namespace arena { namespace rudp {

struct PacketHeader {
	uint8_t  type { 0 };
	uint8_t  flags { 0 };
	uint16_t sequence { 0 };
	uint16_t ack { 0 };
	uint16_t checksum { 0 };      // filled in by encode/decode
	uint16_t payloadLength { 0 }; // filled in by encode/decode
	uint8_t  fragmentIndex { 0 };

	bool hasFlag(uint8_t flag) const { return flag == (flags & flag); }
};

enum DecodeResult {
	DECODE_OK = 0,
	MALFORMED_HEADER,
	BAD_CHECKSUM,
	LENGTH_MISMATCH
};

const char *decodeResultName(DecodeResult result);

// Write header with checksum 0, then the payload, then back-patch the CRC16.
// Answers the encoded length, or 0 if dst is too small or len exceeds 65535.
size_t encodePacket(PacketHeader &header, const void *payload, size_t len, uint8_t *dst, size_t dstLen);
Bytes  encodePacket(PacketHeader &header, const void *payload, size_t len);
Bytes  encodePacket(PacketHeader &header, const Bytes &payload);

// On DECODE_OK, payload points into bytes (no copy) and header.payloadLength
// bytes are available there.
DecodeResult decodePacket(const void *bytes, size_t len, PacketHeader &header, const uint8_t *&payload);

} } } // namespace com::arena::rudp
