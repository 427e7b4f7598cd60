#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstddef>
#include <cstdint>

namespace com { namespace arena { namespace rudp {

enum {
	PACKET_DATA               = 0x01,
	PACKET_ACK                = 0x02,
	PACKET_NAK                = 0x03,
	PACKET_CONNECT            = 0x04,
	PACKET_CONNECT_ACK        = 0x05,
	PACKET_DISCONNECT         = 0x06,
	PACKET_DISCONNECT_ACK     = 0x07,
	PACKET_HEARTBEAT          = 0x08,
	PACKET_CONGESTION_CONTROL = 0x09,
	PACKET_PING               = 0x0a,
	PACKET_PONG               = 0x0b
};

const uint8_t FLAG_RELIABLE      = 0x01;
const uint8_t FLAG_ORDERED       = 0x02;
const uint8_t FLAG_FRAGMENTED    = 0x04;
const uint8_t FLAG_LAST_FRAGMENT = 0x08;
const uint8_t FLAG_COMPRESSED    = 0x10;
const uint8_t FLAG_ENCRYPTED     = 0x20;

const uint8_t FLAGS_UNSUPPORTED  = FLAG_COMPRESSED | FLAG_ENCRYPTED | 0xc0;

// header layout, big-endian
const size_t HEADER_LENGTH          = 12;
const size_t HEADER_TYPE_OFFSET     = 0;
const size_t HEADER_FLAGS_OFFSET    = 1;
const size_t HEADER_SEQUENCE_OFFSET = 2;
const size_t HEADER_ACK_OFFSET      = 4;
const size_t HEADER_CHECKSUM_OFFSET = 6;
const size_t HEADER_LENGTH_OFFSET   = 8;
const size_t HEADER_FRAGINDEX_OFFSET = 10; // reserved byte, fragment index when FRAGMENTED
const size_t HEADER_PADDING_OFFSET  = 11;

const size_t SACK_BITMAP_LENGTH     = 8;
const size_t PING_TIMESTAMP_LENGTH  = 8;

inline bool isKnownPacketType(uint8_t type)
{
	return (type >= PACKET_DATA) and (type <= PACKET_PONG);
}

} } } // namespace com::arena::rudp
