// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstring>

#include "../include/rudp/PacketCodec.hpp"
#include "../include/rudp/Checksums.hpp"

namespace com { namespace arena { namespace rudp {

static void put16(uint8_t *dst, uint16_t v)
{
	dst[0] = (v >> 8) & 0xff;
	dst[1] = v & 0xff;
}

static uint16_t get16(const uint8_t *src)
{
	return uint16_t((src[0] << 8) | src[1]);
}

const char *decodeResultName(DecodeResult result)
{
	switch(result)
	{
	case DECODE_OK: return "ok";
	case MALFORMED_HEADER: return "malformed header";
	case BAD_CHECKSUM: return "bad checksum";
	case LENGTH_MISMATCH: return "length mismatch";
	}
	return "unknown";
}

size_t encodePacket(PacketHeader &header, const void *payload, size_t len, uint8_t *dst, size_t dstLen)
{
	if((len > 0xffff) or (dstLen < HEADER_LENGTH + len))
		return 0;

	header.payloadLength = uint16_t(len);

	dst[HEADER_TYPE_OFFSET] = header.type;
	dst[HEADER_FLAGS_OFFSET] = header.flags;
	put16(dst + HEADER_SEQUENCE_OFFSET, header.sequence);
	put16(dst + HEADER_ACK_OFFSET, header.ack);
	put16(dst + HEADER_CHECKSUM_OFFSET, 0);
	put16(dst + HEADER_LENGTH_OFFSET, header.payloadLength);
	dst[HEADER_FRAGINDEX_OFFSET] = (header.flags & FLAG_FRAGMENTED) ? header.fragmentIndex : 0;
	dst[HEADER_PADDING_OFFSET] = 0;

	if(len)
		memmove(dst + HEADER_LENGTH, payload, len);

	header.checksum = packet_crc16(dst, HEADER_LENGTH, HEADER_CHECKSUM_OFFSET, dst + HEADER_LENGTH, len);
	put16(dst + HEADER_CHECKSUM_OFFSET, header.checksum);

	return HEADER_LENGTH + len;
}

Bytes encodePacket(PacketHeader &header, const void *payload, size_t len)
{
	Bytes rv(HEADER_LENGTH + len);
	if(0 == encodePacket(header, payload, len, rv.data(), rv.size()))
		rv.clear();
	return rv;
}

Bytes encodePacket(PacketHeader &header, const Bytes &payload)
{
	return encodePacket(header, payload.data(), payload.size());
}

DecodeResult decodePacket(const void *bytes_, size_t len, PacketHeader &header, const uint8_t *&payload)
{
	const uint8_t *bytes = (const uint8_t *)bytes_;

	if((not bytes) or (len < HEADER_LENGTH))
		return MALFORMED_HEADER;

	uint16_t onWire = get16(bytes + HEADER_CHECKSUM_OFFSET);
	if(onWire != packet_crc16(bytes, HEADER_LENGTH, HEADER_CHECKSUM_OFFSET, bytes + HEADER_LENGTH, len - HEADER_LENGTH))
		return BAD_CHECKSUM;

	uint16_t payloadLength = get16(bytes + HEADER_LENGTH_OFFSET);
	if(size_t(payloadLength) != len - HEADER_LENGTH)
		return LENGTH_MISMATCH;

	header.type = bytes[HEADER_TYPE_OFFSET];
	header.flags = bytes[HEADER_FLAGS_OFFSET];
	header.sequence = get16(bytes + HEADER_SEQUENCE_OFFSET);
	header.ack = get16(bytes + HEADER_ACK_OFFSET);
	header.checksum = onWire;
	header.payloadLength = payloadLength;
	header.fragmentIndex = (header.flags & FLAG_FRAGMENTED) ? bytes[HEADER_FRAGINDEX_OFFSET] : 0;

	payload = bytes + HEADER_LENGTH;

	return DECODE_OK;
}

} } } // namespace com::arena::rudp
