// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rudp/SendWindow.hpp"
#include "../include/rudp/Sequence.hpp"

namespace com { namespace arena { namespace rudp {

SendWindow::SendWindow(uint16_t firstSequence) :
	m_base(firstSequence),
	m_inFlight(0),
	m_inFlightBytes(0)
{}

uint16_t SendWindow::getNextSequence() const
{
	return uint16_t(m_base + m_entries.size());
}

SendEntry * SendWindow::add(uint8_t type, uint8_t flags, uint8_t fragmentIndex, const Bytes &payload, Time now, Duration rto)
{
	SendEntry entry;
	entry.sequence = getNextSequence();
	entry.type = type;
	entry.flags = flags;
	entry.fragmentIndex = fragmentIndex;
	entry.payload = payload;
	entry.firstSent = now;
	entry.lastSent = now;
	entry.rto = rto;

	m_entries.push_back(entry);
	m_inFlight++;
	m_inFlightBytes += payload.size();

	return &m_entries.back();
}

void SendWindow::ackEntry(SendEntry &entry, Time now, AckResult &result)
{
	if(entry.acked)
		return;

	entry.acked = true;
	if(entry.timer)
		entry.timer->cancel();
	entry.timer.reset();

	m_inFlight--;
	m_inFlightBytes -= entry.payload.size();

	result.newlyAcked++;
	result.ackedBytes += entry.payload.size();

	if(0 == entry.retries)
	{
		// Karn: the newest never-retransmitted packet gives the sample
		result.haveRttSample = true;
		result.rttSample = now - entry.firstSent;
	}

	entry.payload.clear();
	entry.payload.shrink_to_fit();
}

void SendWindow::trimFront()
{
	while((not m_entries.empty()) and m_entries.front().acked)
	{
		m_entries.pop_front();
		m_base++;
	}
}

void SendWindow::onCumulativeAck(uint16_t ack, Time now, AckResult &result)
{
	if(m_entries.empty())
		return;

	int32_t covered = seqDiff(ack, m_base) + 1; // entries from the front that ack covers

	if(covered <= 0)
	{
		if((0 == covered) and m_inFlight)
			result.duplicate = true;
		return;
	}

	if(size_t(covered) > m_entries.size())
		return; // acknowledges something never sent

	for(int32_t i = 0; i < covered; i++)
		ackEntry(m_entries[i], now, result);

	trimFront();
}

void SendWindow::onSelectiveAck(uint16_t ack, uint64_t bitmap, Time now, AckResult &result)
{
	for(int i = 0; i < 64; i++)
	{
		if(0 == (bitmap & (uint64_t(1) << i)))
			continue;

		SendEntry *entry = find(uint16_t(ack + 1 + i));
		if(entry)
			ackEntry(*entry, now, result);
	}

	trimFront();
}

SendEntry * SendWindow::find(uint16_t sequence)
{
	int32_t offset = seqDiff(sequence, m_base);
	if((offset < 0) or (size_t(offset) >= m_entries.size()))
		return nullptr;
	return &m_entries[size_t(offset)];
}

SendEntry * SendWindow::firstUnacked()
{
	for(auto it = m_entries.begin(); it != m_entries.end(); it++)
		if(not it->acked)
			return &*it;
	return nullptr;
}

bool SendWindow::isOutstanding(uint16_t sequence) const
{
	int32_t offset = seqDiff(sequence, m_base);
	if((offset < 0) or (size_t(offset) >= m_entries.size()))
		return false;
	return not m_entries[size_t(offset)].acked;
}

SendEntry * SendWindow::firstHole()
{
	SendEntry *hole = nullptr;

	for(auto it = m_entries.begin(); it != m_entries.end(); it++)
	{
		if(not it->acked)
		{
			if(not hole)
				hole = &*it;
		}
		else if(hole)
			return hole;
	}

	return nullptr;
}

size_t SendWindow::getInFlight() const
{
	return m_inFlight;
}

size_t SendWindow::getInFlightBytes() const
{
	return m_inFlightBytes;
}

size_t SendWindow::getSpan() const
{
	return m_entries.size();
}

void SendWindow::clear()
{
	for(auto it = m_entries.begin(); it != m_entries.end(); it++)
		if(it->timer)
			it->timer->cancel();

	m_base = getNextSequence();
	m_entries.clear();
	m_inFlight = 0;
	m_inFlightBytes = 0;
}

} } } // namespace com::arena::rudp
