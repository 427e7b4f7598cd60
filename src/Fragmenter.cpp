// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cstring>

#include "../include/rudp/Fragmenter.hpp"

namespace com { namespace arena { namespace rudp {

bool fragmentPayload(const uint8_t *bytes, size_t len, size_t maxFragmentSize, std::vector<Bytes> &fragments, size_t maxBytes)
{
	fragments.clear();

	if((0 == maxFragmentSize) or (len > maxBytes))
		return false;

	if(len <= maxFragmentSize)
	{
		fragments.push_back(Bytes(bytes, bytes + len));
		return true;
	}

	size_t count = (len + maxFragmentSize - 1) / maxFragmentSize;
	if(count > 256) // fragment index is one byte
		return false;

	for(size_t offset = 0; offset < len; offset += maxFragmentSize)
	{
		size_t each = std::min(maxFragmentSize, len - offset);
		fragments.push_back(Bytes(bytes + offset, bytes + offset + each));
	}

	return true;
}

Reassembler::Reassembler(size_t maxFragmentSize, size_t maxBytes, Duration timeout) :
	m_maxFragmentSize(maxFragmentSize),
	m_maxBytes(maxBytes),
	m_timeout(timeout)
{}

Reassembler::Result Reassembler::insert(uint16_t sequence, uint8_t fragmentIndex, bool last, const uint8_t *bytes, size_t len, Time now, Bytes &completed)
{
	uint16_t groupID = uint16_t(sequence - fragmentIndex);
	size_t offset = size_t(fragmentIndex) * m_maxFragmentSize;

	auto it = m_groups.find(groupID);
	if(it == m_groups.end())
	{
		it = m_groups.insert(std::make_pair(groupID, Group())).first;
		it->second.m_deadline = now + m_timeout;
	}
	Group &group = it->second;

	if((len > m_maxFragmentSize) or ((not last) and (len != m_maxFragmentSize)) or (offset + len > m_maxBytes))
	{
		m_groups.erase(it);
		return DROPPED;
	}

	if((group.m_arrived.size() > fragmentIndex) and group.m_arrived[fragmentIndex])
		return DUPLICATE;

	if(last)
	{
		if((group.m_lastIndex >= 0) or (group.m_arrived.size() > size_t(fragmentIndex) + 1))
		{
			// a second end, or fragments already seen beyond this end
			m_groups.erase(it);
			return DROPPED;
		}
		group.m_lastIndex = fragmentIndex;
	}
	else if((group.m_lastIndex >= 0) and (long(fragmentIndex) > group.m_lastIndex))
	{
		m_groups.erase(it);
		return DROPPED;
	}

	if(group.m_buffer.size() < offset + len)
		group.m_buffer.resize(offset + len);
	if(group.m_arrived.size() <= fragmentIndex)
		group.m_arrived.resize(size_t(fragmentIndex) + 1, false);

	memmove(group.m_buffer.data() + offset, bytes, len);
	group.m_arrived[fragmentIndex] = true;
	group.m_arrivedCount++;

	if((group.m_lastIndex >= 0) and (group.m_arrivedCount == size_t(group.m_lastIndex) + 1))
	{
		completed.swap(group.m_buffer);
		m_groups.erase(it);
		return COMPLETE;
	}

	return INCOMPLETE;
}

size_t Reassembler::expire(Time now)
{
	size_t rv = 0;

	for(auto it = m_groups.begin(); it != m_groups.end(); )
	{
		if(it->second.m_deadline <= now)
		{
			it = m_groups.erase(it);
			rv++;
		}
		else
			it++;
	}

	return rv;
}

Time Reassembler::getNextDeadline() const
{
	Time rv = INFINITY;
	for(auto it = m_groups.begin(); it != m_groups.end(); it++)
		rv = std::min(rv, it->second.m_deadline);
	return rv;
}

size_t Reassembler::getGroupCount() const
{
	return m_groups.size();
}

size_t Reassembler::getBufferedBytes() const
{
	size_t rv = 0;
	for(auto it = m_groups.begin(); it != m_groups.end(); it++)
		rv += it->second.m_buffer.size();
	return rv;
}

void Reassembler::clear()
{
	m_groups.clear();
}

} } } // namespace com::arena::rudp
