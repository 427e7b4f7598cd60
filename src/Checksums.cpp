// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rudp/Checksums.hpp"

namespace com { namespace arena {

uint16_t crc16_ccitt(uint16_t crc, const void *buf_, size_t len)
{
	const uint8_t *buf = (const uint8_t *)buf_;

	for(size_t i = 0; i < len; i++)
	{
		crc ^= uint16_t(buf[i]) << 8;
		for(int j = 0; j < 8; j++)
		{
			if(crc & 0x8000)
				crc = uint16_t((crc << 1) ^ 0x1021);
			else
				crc = uint16_t(crc << 1);
		}
	}

	return crc;
}

uint16_t crc16_ccitt(const void *buf, size_t len)
{
	return crc16_ccitt(0xFFFF, buf, len);
}

uint16_t packet_crc16(const void *header_, size_t headerLen, size_t checksumOffset, const void *payload, size_t payloadLen)
{
	const uint8_t *header = (const uint8_t *)header_;
	const uint8_t zeros[2] = { 0, 0 };
	uint16_t crc = 0xFFFF;

	// never the on-wire checksum value: the checksum field is computed as zero.
	crc = crc16_ccitt(crc, header, checksumOffset);
	crc = crc16_ccitt(crc, zeros, sizeof(zeros));
	crc = crc16_ccitt(crc, header + checksumOffset + 2, headerLen - checksumOffset - 2);
	crc = crc16_ccitt(crc, payload, payloadLen);

	return uint16_t(~crc);
}

} } // namespace com::arena
