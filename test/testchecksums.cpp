#include <cassert>
#include <cstdio>
#include <cstring>

#include "rudp/Checksums.hpp"
#include "rudp/packet.hpp"

using namespace com::arena;

int main(int argc, char *argv[])
{
	const char check[] = "123456789";

	// CRC-16/CCITT-FALSE check value
	uint16_t crc = crc16_ccitt(check, strlen(check));
	printf("crc16_ccitt of '%s': %04X\n", check, crc);
	assert(0x29B1 == crc);

	assert(0xFFFF == crc16_ccitt(check, 0));

	// scatter-gather incremental crc
	assert(crc == crc16_ccitt(crc16_ccitt(check, 4), check + 4, strlen(check) - 4));

	uint8_t header[rudp::HEADER_LENGTH] = { 1, 3, 0, 7, 0, 0, 0xAA, 0xBB, 0, 5, 0, 0 };
	uint8_t payload[] = { 'h', 'e', 'l', 'l', 'o' };

	uint16_t sum = packet_crc16(header, sizeof(header), rudp::HEADER_CHECKSUM_OFFSET, payload, sizeof(payload));

	// the checksum field itself never contributes
	header[rudp::HEADER_CHECKSUM_OFFSET] = 0x12;
	header[rudp::HEADER_CHECKSUM_OFFSET + 1] = 0x34;
	assert(sum == packet_crc16(header, sizeof(header), rudp::HEADER_CHECKSUM_OFFSET, payload, sizeof(payload)));

	// same as a flat crc over the header with zeros in the checksum field, inverted
	uint8_t flat[sizeof(header) + sizeof(payload)];
	memmove(flat, header, sizeof(header));
	memmove(flat + sizeof(header), payload, sizeof(payload));
	flat[rudp::HEADER_CHECKSUM_OFFSET] = 0;
	flat[rudp::HEADER_CHECKSUM_OFFSET + 1] = 0;
	assert(sum == uint16_t(~crc16_ccitt(flat, sizeof(flat))));

	payload[0] ^= 1;
	assert(sum != packet_crc16(header, sizeof(header), rudp::HEADER_CHECKSUM_OFFSET, payload, sizeof(payload)));

	printf("end.\n");

	return 0;
}
