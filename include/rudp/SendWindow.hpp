#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <deque>

#include "Timer.hpp"
#include "params.hpp"

namespace com { namespace arena { namespace rudp {

struct SendEntry {
	uint16_t sequence { 0 };
	uint8_t  type { 0 };
	uint8_t  flags { 0 };
	uint8_t  fragmentIndex { 0 };
	Bytes    payload;
	Time     firstSent { 0 };
	Time     lastSent { 0 };
	unsigned retries { 0 };
	Duration rto { 0 };
	bool     acked { false };
	std::shared_ptr<Timer> timer;
};

// Unacknowledged reliable packets of one connection, in sequence order.
// Sequences are assigned consecutively, so each appears here at most once.
class SendWindow {
public:
	struct AckResult {
		size_t   newlyAcked { 0 };
		size_t   ackedBytes { 0 };
		bool     haveRttSample { false };
		Duration rttSample { 0 };
		bool     duplicate { false }; // cumulative ack did not move while data outstanding
	};

	SendWindow(uint16_t firstSequence = 0);

	uint16_t getNextSequence() const;

	// Assign the next sequence and track the packet. Answers the entry, valid
	// until the next mutation of this window.
	SendEntry *add(uint8_t type, uint8_t flags, uint8_t fragmentIndex, const Bytes &payload, Time now, Duration rto);

	// Everything at or before ack is received. Answers acked entries' timers
	// cancelled and removed. Samples RTT only from never-retransmitted entries.
	void onCumulativeAck(uint16_t ack, Time now, AckResult &result);

	// bit i: sequence ack + 1 + i received
	void onSelectiveAck(uint16_t ack, uint64_t bitmap, Time now, AckResult &result);

	SendEntry *find(uint16_t sequence);
	SendEntry *firstUnacked();
	bool       isOutstanding(uint16_t sequence) const;

	size_t getInFlight() const;      // unacked packets
	size_t getInFlightBytes() const;
	size_t getSpan() const;          // oldest unacked through newest sent

	// For the hole below a selectively acknowledged packet: first unacked
	// sequence that has acked successors. Answers nullptr if none.
	SendEntry *firstHole();

	void clear(); // cancels all timers

protected:
	void ackEntry(SendEntry &entry, Time now, AckResult &result);
	void trimFront();

	std::deque<SendEntry> m_entries;
	uint16_t m_base; // sequence of m_entries.front()
	size_t   m_inFlight;
	size_t   m_inFlightBytes;
};

} } } // namespace com::arena::rudp
