// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rudp/DuplicateWindow.hpp"
#include "../include/rudp/Sequence.hpp"

namespace com { namespace arena { namespace rudp {

DuplicateWindow::DuplicateWindow(size_t size) :
	m_bits(size ? size : DUPLICATE_WINDOW, false),
	m_newest(0),
	m_any(false)
{}

bool DuplicateWindow::check(uint16_t sequence)
{
	size_t size = m_bits.size();

	if(not m_any)
	{
		m_any = true;
		m_newest = sequence;
		m_bits[sequence % size] = true;
		return true;
	}

	int32_t delta = seqDiff(sequence, m_newest);
	if(delta > 0)
	{
		if(size_t(delta) >= size)
			m_bits.assign(size, false);
		else
			for(int32_t i = 1; i <= delta; i++)
				m_bits[uint16_t(m_newest + i) % size] = false;

		m_newest = sequence;
		m_bits[sequence % size] = true;
		return true;
	}

	if(size_t(-delta) >= size)
		return false;

	if(m_bits[sequence % size])
		return false;

	m_bits[sequence % size] = true;
	return true;
}

bool DuplicateWindow::contains(uint16_t sequence) const
{
	if(not m_any)
		return false;

	int32_t delta = seqDiff(sequence, m_newest);
	if(delta > 0)
		return false;
	if(size_t(-delta) >= m_bits.size())
		return true;
	return m_bits[sequence % m_bits.size()];
}

void DuplicateWindow::reset()
{
	m_bits.assign(m_bits.size(), false);
	m_any = false;
}

} } } // namespace com::arena::rudp
