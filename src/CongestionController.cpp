// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cmath>

#include "../include/rudp/CongestionController.hpp"

namespace com { namespace arena { namespace rudp {

CongestionController::CongestionController(double cwndInit, double ssthreshInit, Duration minRto, Duration maxRto, double cwndMax) :
	m_cwndMax(std::max(cwndMax, 1.0)),
	m_srtt(-1),
	m_rttvar(0),
	m_lastRtt(0),
	m_minRto(minRto),
	m_maxRto(std::max(minRto, maxRto)),
	m_losses(0)
{
	m_cwnd = std::min(std::max(cwndInit, 1.0), m_cwndMax);
	m_ssthresh = std::max(ssthreshInit, SSTHRESH_MIN);
	m_rto = std::min(std::max(INITIAL_RTO, m_minRto), m_maxRto);
}

void CongestionController::onRttSample(Duration rtt)
{
	if(rtt < 0)
		return;

	m_lastRtt = rtt;

	if(m_srtt >= 0)
	{
		Duration rtt_delta = fabsl(m_srtt - rtt);
		m_rttvar = ((3.0 * m_rttvar) + rtt_delta) / 4.0;
		m_srtt = ((7.0 * m_srtt) + rtt) / 8.0;
	}
	else
	{
		m_srtt = rtt;
		m_rttvar = rtt / 2.0;
	}

	m_rto = std::min(std::max(m_srtt + 4.0 * m_rttvar, m_minRto), m_maxRto);
}

void CongestionController::onFreshAck(size_t packets)
{
	for(size_t i = 0; i < packets; i++)
	{
		if(m_cwnd < m_ssthresh)
			m_cwnd += 1.0;
		else
			m_cwnd += 1.0 / m_cwnd;
	}

	m_cwnd = std::min(m_cwnd, m_cwndMax);
}

void CongestionController::onLoss()
{
	double before = m_cwnd;

	m_ssthresh = std::max(before / 2.0, SSTHRESH_MIN);
	m_cwnd = std::max(std::min(m_ssthresh, before), 1.0);
	m_losses++;
}

Duration CongestionController::getSRTT() const
{
	return m_srtt < 0 ? 0 : m_srtt;
}

Duration CongestionController::getPacingInterval() const
{
	if(m_srtt <= 0)
		return 0;
	return m_srtt / m_cwnd;
}

} } } // namespace com::arena::rudp
