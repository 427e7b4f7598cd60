// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>

#include "../include/rudp/RecvWindow.hpp"
#include "../include/rudp/Sequence.hpp"

namespace com { namespace arena { namespace rudp {

namespace {

struct Release {
	uint8_t  m_type;
	uint16_t m_sequence;
	uint8_t  m_flags;
	uint8_t  m_fragmentIndex;
	const uint8_t *m_bytes;
	size_t   m_len;
	Bytes    m_payload;
};

}

RecvWindow::RecvWindow(size_t window, uint16_t firstSequence) :
	m_slots(window ? window : RECEIVE_WINDOW)
{
	reset(firstSequence);
}

void RecvWindow::reset(uint16_t firstSequence)
{
	clear();
	m_contiguous = uint16_t(firstSequence - 1);
}

RecvWindow::Slot & RecvWindow::slotAt(size_t offset)
{
	return m_slots[(m_position + offset) % m_slots.size()];
}

const RecvWindow::Slot & RecvWindow::slotAt(size_t offset) const
{
	return m_slots[(m_position + offset) % m_slots.size()];
}

RecvWindow::Disposition RecvWindow::receive(uint8_t type, uint16_t sequence, uint8_t flags, uint8_t fragmentIndex, const uint8_t *bytes, size_t len, const DeliverFn &deliver)
{
	int32_t offset = seqDiff(sequence, m_contiguous);

	if(offset <= 0)
		return DUPLICATE; // at or behind the contiguous point (or too old to tell)
	if(size_t(offset) > m_slots.size())
		return OVERFLOW;

	Slot &slot = slotAt(size_t(offset));
	if(slot.m_received)
		return DUPLICATE;

	std::vector<Release> releases;
	bool ordered = flags & FLAG_ORDERED;

	slot.m_received = true;
	slot.m_type = type;
	slot.m_flags = flags;
	slot.m_fragmentIndex = fragmentIndex;

	if((not ordered) or (1 == offset))
	{
		Release release = { type, sequence, flags, fragmentIndex, bytes, len, Bytes() };
		releases.push_back(release);
	}
	else
	{
		slot.m_held = true;
		slot.m_payload.assign(bytes, bytes + len);
		m_held++;
	}

	if(offset > 1)
		m_outOfOrder++;

	// drain the now-contiguous prefix, releasing held successors in order.
	// only an arrival at offset 1 can make the prefix grow.
	bool first = true;
	while(slotAt(1).m_received)
	{
		Slot &each = slotAt(1);
		uint16_t eachSequence = uint16_t(m_contiguous + 1);

		if(not first)
			m_outOfOrder--; // was counted when it arrived early
		first = false;

		if(each.m_held)
		{
			Release release = { each.m_type, eachSequence, each.m_flags, each.m_fragmentIndex, nullptr, 0, Bytes() };
			release.m_payload.swap(each.m_payload);
			releases.push_back(release);
			m_held--;
		}

		each = Slot();
		m_contiguous = eachSequence;
		m_position++;
	}

	if(deliver)
	{
		for(auto it = releases.begin(); it != releases.end(); it++)
		{
			if(it->m_bytes or it->m_payload.empty())
				deliver(it->m_type, it->m_sequence, it->m_flags, it->m_fragmentIndex, it->m_bytes, it->m_len);
			else
				deliver(it->m_type, it->m_sequence, it->m_flags, it->m_fragmentIndex, it->m_payload.data(), it->m_payload.size());
		}
	}

	return ACCEPTED;
}

uint16_t RecvWindow::getCumulativeAck() const
{
	return m_contiguous;
}

uint16_t RecvWindow::getExpected() const
{
	return uint16_t(m_contiguous + 1);
}

size_t RecvWindow::getOutOfOrderCount() const
{
	return m_outOfOrder;
}

size_t RecvWindow::getHeldCount() const
{
	return m_held;
}

size_t RecvWindow::getWindow() const
{
	return m_slots.size();
}

uint64_t RecvWindow::getSelectiveAckBitmap() const
{
	uint64_t rv = 0;
	size_t limit = std::min(size_t(64), m_slots.size());

	for(size_t i = 0; i < limit; i++)
		if(slotAt(i + 1).m_received)
			rv |= uint64_t(1) << i;

	return rv;
}

void RecvWindow::clear()
{
	for(auto it = m_slots.begin(); it != m_slots.end(); it++)
		*it = Slot();
	m_position = 0;
	m_outOfOrder = 0;
	m_held = 0;
}

} } } // namespace com::arena::rudp
