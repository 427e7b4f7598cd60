#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "RunLoop.hpp"
#include "rudp.hpp"

namespace com { namespace arena { namespace rudp {

// Binds one non-blocking UDP socket on a run loop and connects it to an
// Endpoint: datagrams read from the socket go to Endpoint::onReceivePacket,
// the Endpoint's timer work is driven by an alarm on the run loop.
class PosixPlatformAdapter : public IPlatformAdapter {
public:
	PosixPlatformAdapter(RunLoop *runloop);
	~PosixPlatformAdapter();

	void      setEndpoint(Endpoint *endpoint);
	Endpoint *getEndpoint() const;

	RunLoop *getRunLoop() const;

	// Answers the bound address, or an empty shared_ptr on error. With
	// reusePort, several adapters (one per thread) may bind the same address.
	std::shared_ptr<Address> bindUdp(const Address &addr, bool reusePort = false);
	std::shared_ptr<Address> bindUdp(int port = 0, int family = AF_INET, bool reusePort = false);

	Task onShutdownCompleteCallback;

	virtual void close();

	Time getCurrentTime() override;
	void onHowLongToSleepDidChange() override;
	bool writePacket(const void *bytes, size_t len, const struct sockaddr *addr, socklen_t addrLen) override;
	void onShutdownComplete() override;

	size_t maxReadsPerReadable { 64 };

protected:
	void onSocketReadable();
	long receiveOnePacket();

	Endpoint               *m_endpoint;
	RunLoop                *m_runloop;
	int                     m_fd;
	int                     m_family;
	std::shared_ptr<Timer>  m_endpointAlarm;
	uint64_t                m_writeErrors;
};

} } } // namespace com::arena::rudp
