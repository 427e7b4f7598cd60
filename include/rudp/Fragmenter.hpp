#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <map>

#include "Timer.hpp"
#include "params.hpp"

namespace com { namespace arena { namespace rudp {

// Split len bytes into pieces of at most maxFragmentSize. A payload no larger
// than maxFragmentSize yields exactly one piece. Answers false (and no pieces)
// if len exceeds maxBytes or maxFragmentSize is 0.
bool fragmentPayload(const uint8_t *bytes, size_t len, size_t maxFragmentSize, std::vector<Bytes> &fragments, size_t maxBytes = MAX_FRAG_BYTES);

// Collects the fragments of groups identified by the sequence number of their
// first fragment. Fragment i of a group lands at offset i * maxFragmentSize.
class Reassembler {
public:
	enum Result {
		INCOMPLETE, // stored, group still waiting
		COMPLETE,   // message answered in `completed`
		DUPLICATE,  // already have this fragment
		DROPPED     // group discarded (too big or inconsistent)
	};

	Reassembler(size_t maxFragmentSize, size_t maxBytes = MAX_FRAG_BYTES, Duration timeout = FRAG_TIMEOUT);

	Result insert(uint16_t sequence, uint8_t fragmentIndex, bool last, const uint8_t *bytes, size_t len, Time now, Bytes &completed);

	// Drop groups older than the timeout. Answers the number dropped.
	size_t expire(Time now);

	Time   getNextDeadline() const; // INFINITY if no groups
	size_t getGroupCount() const;
	size_t getBufferedBytes() const;
	void   clear();

protected:
	struct Group {
		Bytes             m_buffer;
		std::vector<bool> m_arrived;
		size_t            m_arrivedCount { 0 };
		long              m_lastIndex { -1 };
		Time              m_deadline { 0 };
	};

	size_t m_maxFragmentSize;
	size_t m_maxBytes;
	Duration m_timeout;
	std::map<uint16_t, Group> m_groups;
};

} } } // namespace com::arena::rudp
