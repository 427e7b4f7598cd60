// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cerrno>
#include <cstring>

#include "../include/rudp/PosixPlatformAdapter.hpp"
#include "../include/rudp/Log.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <netinet/ip.h>

namespace com { namespace arena { namespace rudp {

PosixPlatformAdapter::PosixPlatformAdapter(RunLoop *runloop) :
	m_endpoint(nullptr),
	m_runloop(runloop),
	m_fd(-1),
	m_family(AF_INET),
	m_writeErrors(0)
{
}

PosixPlatformAdapter::~PosixPlatformAdapter()
{
	close();
}

void PosixPlatformAdapter::setEndpoint(Endpoint *endpoint)
{
	if(endpoint and not m_endpoint)
	{
		m_endpoint = endpoint;
		m_endpointAlarm = m_runloop->scheduleRel(
			[endpoint] (const std::shared_ptr<Timer> &sender, Time now) {
				endpoint->doTimerWork();
				sender->setNextFireTime(now + endpoint->howLongToSleep());
			}, 0, 1);
	}
}

Endpoint * PosixPlatformAdapter::getEndpoint() const
{
	return m_endpoint;
}

RunLoop * PosixPlatformAdapter::getRunLoop() const
{
	return m_runloop;
}

std::shared_ptr<Address> PosixPlatformAdapter::bindUdp(int port, int family, bool reusePort)
{
	Address addr;
	if(not addr.setFamily(family))
		return std::shared_ptr<Address>();
	addr.setPort(port);

	return bindUdp(addr, reusePort);
}

std::shared_ptr<Address> PosixPlatformAdapter::bindUdp(const Address &addr, bool reusePort)
{
	std::shared_ptr<Address> rv;

	if(m_fd >= 0)
		return rv;

	int fd = socket(addr.getFamily(), SOCK_DGRAM, 0);
	if(fd < 0)
	{
		log()->error("socket: {}", strerror(errno));
		return rv;
	}

	{
		int on = 1;
		setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
		if(reusePort and setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &on, sizeof(on)))
			log()->warn("SO_REUSEPORT: {}", strerror(errno));

		// the portable thing is to always have separate sockets for each family.
		if(AF_INET6 == addr.getFamily())
			setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &on, sizeof(on));
	}

	{
		int flags = fcntl(fd, F_GETFL);
		flags |= O_NONBLOCK;
		fcntl(fd, F_SETFL, flags);
	}

	union Address::in_sockaddr boundAddr;
	socklen_t addrLen = sizeof(boundAddr);
	if( (bind(fd, addr.getSockaddr(), addr.getSockaddrLen()))
	 or (getsockname(fd, &boundAddr.s, &addrLen))
	)
	{
		log()->error("bind {}: {}", addr.toPresentation(), strerror(errno));
		::close(fd);
		return rv;
	}

	m_fd = fd;
	m_family = addr.getFamily();
	rv = std::make_shared<Address>(&boundAddr.s);

	m_runloop->registerDescriptor(m_fd, RunLoop::READABLE, [this] { this->onSocketReadable(); });

	return rv;
}

void PosixPlatformAdapter::close()
{
	if(m_fd >= 0)
	{
		m_runloop->unregisterDescriptor(m_fd);
		::close(m_fd);
		m_fd = -1;
	}

	if(m_endpointAlarm)
		m_endpointAlarm->cancel();
}

Time PosixPlatformAdapter::getCurrentTime()
{
	return m_runloop->getCurrentTime();
}

void PosixPlatformAdapter::onHowLongToSleepDidChange()
{
	if(m_endpointAlarm)
		m_endpointAlarm->setNextFireTime(getCurrentTime() + m_endpoint->howLongToSleep());
}

bool PosixPlatformAdapter::writePacket(const void *bytes, size_t len, const struct sockaddr *addr, socklen_t addrLen)
{
	if((m_fd < 0) or (addr->sa_family != m_family))
		return false;

	ssize_t rv = ::sendto(m_fd, bytes, len, 0, addr, addrLen);
	if(rv < 0)
	{
		if(0 == (m_writeErrors++ % 1000))
			log()->debug("sendto: {} ({} errors)", strerror(errno), m_writeErrors);
		return false;
	}

	return true;
}

void PosixPlatformAdapter::onShutdownComplete()
{
	if(onShutdownCompleteCallback)
		onShutdownCompleteCallback();
}

void PosixPlatformAdapter::onSocketReadable()
{
	for(size_t i = 0; i < maxReadsPerReadable; i++)
		if(receiveOnePacket() < 0)
			break;
}

long PosixPlatformAdapter::receiveOnePacket()
{
	union Address::in_sockaddr addr_u;
	socklen_t addrLen = sizeof(addr_u);
	uint8_t buf[MAX_MTU];

	ssize_t rv = ::recvfrom(m_fd, buf, sizeof(buf), 0, &addr_u.s, &addrLen);
	if(rv < 0)
	{
		if((EAGAIN != errno) and (EWOULDBLOCK != errno) and (EINTR != errno))
			log()->debug("recvfrom: {}", strerror(errno));
		return rv;
	}

	if(m_endpoint)
		m_endpoint->onReceivePacket(buf, size_t(rv), &addr_u.s);

	return rv;
}

} } } // namespace com::arena::rudp
