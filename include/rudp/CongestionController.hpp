#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "Timer.hpp"
#include "params.hpp"

namespace com { namespace arena { namespace rudp {

// RTT estimation (Jacobson/Karels) and an AIMD window counted in packets.
class CongestionController {
public:
	CongestionController(double cwndInit = CWND_INIT, double ssthreshInit = SSTHRESH_INIT,
		Duration minRto = MIN_RTO, Duration maxRto = MAX_RTO, double cwndMax = CWND_MAX);

	void onRttSample(Duration rtt);
	void onFreshAck(size_t packets = 1);
	void onLoss();

	bool canSend(size_t inFlight) const { return double(inFlight) < m_cwnd; }

	double   getCwnd() const { return m_cwnd; }
	double   getSsthresh() const { return m_ssthresh; }
	bool     isInSlowStart() const { return m_cwnd < m_ssthresh; }
	bool     hasRttSample() const { return m_srtt >= 0; }
	Duration getSRTT() const; // 0 before any sample
	Duration getRTTVariance() const { return m_rttvar; }
	Duration getLastRttSample() const { return m_lastRtt; }
	Duration getRTO() const { return m_rto; }
	Duration getMinRTO() const { return m_minRto; }
	Duration getMaxRTO() const { return m_maxRto; }
	size_t   getLossCount() const { return m_losses; }

	// Spacing between packets so that a window drains over one SRTT.
	Duration getPacingInterval() const;

protected:
	double   m_cwnd;
	double   m_ssthresh;
	double   m_cwndMax;
	Duration m_srtt;
	Duration m_rttvar;
	Duration m_lastRtt;
	Duration m_rto;
	Duration m_minRto;
	Duration m_maxRto;
	size_t   m_losses;
};

} } } // namespace com::arena::rudp
