#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <functional>
#include <vector>

#include "Object.hpp"
#include "params.hpp"

namespace com { namespace arena { namespace rudp {

// Receive side of the reliable stream: duplicate suppression, ordered
// delivery through a bounded buffer, and the cumulative/selective ACK state.
class RecvWindow {
public:
	enum Disposition {
		ACCEPTED,
		DUPLICATE,
		OVERFLOW // beyond the window; the connection must close
	};

	using DeliverFn = std::function<void(uint8_t type, uint16_t sequence, uint8_t flags, uint8_t fragmentIndex, const uint8_t *bytes, size_t len)>;

	RecvWindow(size_t window = RECEIVE_WINDOW, uint16_t firstSequence = 0);

	void reset(uint16_t firstSequence);

	// Unordered packets are delivered at once. ORDERED packets are delivered
	// when every earlier sequence has been received, otherwise held. deliver is
	// called after the window state is updated, so it may touch this window.
	Disposition receive(uint8_t type, uint16_t sequence, uint8_t flags, uint8_t fragmentIndex, const uint8_t *bytes, size_t len, const DeliverFn &deliver);

	uint16_t getCumulativeAck() const; // highest contiguously received sequence
	uint16_t getExpected() const;
	size_t   getOutOfOrderCount() const;
	size_t   getHeldCount() const;
	size_t   getWindow() const;

	// bit i (least significant first) set: sequence cumulativeAck + 1 + i was received
	uint64_t getSelectiveAckBitmap() const;

	void clear();

protected:
	struct Slot {
		bool     m_received { false };
		bool     m_held { false };
		uint8_t  m_type { 0 };
		uint8_t  m_flags { 0 };
		uint8_t  m_fragmentIndex { 0 };
		Bytes    m_payload;
	};

	Slot &slotAt(size_t offset); // offset 1 is the expected sequence
	const Slot &slotAt(size_t offset) const;

	std::vector<Slot> m_slots;
	uint16_t m_contiguous;
	uint64_t m_position; // count of sequences contiguously received, indexes m_slots
	size_t   m_outOfOrder;
	size_t   m_held;
};

} } } // namespace com::arena::rudp
