// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rudp/Address.hpp"

#include <arpa/inet.h>
#include <cstdio>
#include <cstring>

namespace com { namespace arena { namespace rudp {

Address::Address()
{
	erase();
}

Address::Address(const struct sockaddr *addr)
{
	erase();
	if(addr)
		setSockaddr(addr);
}

void Address::erase()
{
	memset(&m_addr, 0, sizeof(m_addr));
}

bool Address::setFamily(int family)
{
	if((AF_INET != family) and (AF_INET6 != family))
		return false;

	if(getFamily() == family)
		return true;

	unsigned savedPort = getPort();
	erase();
	m_addr.s.sa_family = family;
	setPort(savedPort);

	return true;
}

void Address::setPort(unsigned port)
{
	switch(getFamily())
	{
	case AF_INET:
		m_addr.s4.sin_port = htons(port);
		break;

	case AF_INET6:
		m_addr.s6.sin6_port = htons(port);
		break;
	}
}

unsigned Address::getPort() const
{
	switch(getFamily())
	{
	case AF_INET: return ntohs(m_addr.s4.sin_port);
	case AF_INET6: return ntohs(m_addr.s6.sin6_port);
	default: return 0;
	}
}

size_t Address::getIPAddressLength() const
{
	switch(getFamily())
	{
	case AF_INET: return 4;
	case AF_INET6: return 16;
	}

	return 0;
}

const uint8_t * Address::getIPAddressPtr() const
{
	switch(getFamily())
	{
	case AF_INET: return (const uint8_t *)&m_addr.s4.sin_addr;
	case AF_INET6: return (const uint8_t *)&m_addr.s6.sin6_addr;
	}

	return nullptr;
}

bool Address::setIPAddress(const uint8_t *src, size_t len)
{
	switch(len)
	{
	case 4:
		setFamily(AF_INET);
		memmove(&m_addr.s4.sin_addr, src, 4);
		return true;

	case 16:
		setFamily(AF_INET6);
		memmove(&m_addr.s6.sin6_addr, src, 16);
		return true;
	}

	return false;
}

bool Address::setSockaddr(const struct sockaddr *addr)
{
	switch(addr->sa_family)
	{
	case AF_INET:
		memmove(&m_addr.s4, addr, sizeof(struct sockaddr_in));
		return true;
	case AF_INET6:
		memmove(&m_addr.s6, addr, sizeof(struct sockaddr_in6));
		return true;
	}

	return false;
}

socklen_t Address::getSockaddrLen() const
{
	switch(getFamily())
	{
	case AF_INET: return sizeof(struct sockaddr_in);
	case AF_INET6: return sizeof(struct sockaddr_in6);
	}

	return 0;
}

bool Address::operator< (const Address &rhs) const
{
	int family = getFamily();
	int rhsFamily = rhs.getFamily();

	if(family != rhsFamily)
		return family < rhsFamily;

	// same family, so addrs are the same size
	int cmp = memcmp(getIPAddressPtr(), rhs.getIPAddressPtr(), getIPAddressLength());
	if(cmp)
		return cmp < 0;

	return getPort() < rhs.getPort();
}

bool Address::operator== (const Address &rhs) const
{
	return (getFamily() == rhs.getFamily())
	    and (0 == memcmp(getIPAddressPtr(), rhs.getIPAddressPtr(), getIPAddressLength()))
	    and (getPort() == rhs.getPort());
}

std::string Address::toPresentation(bool withPort) const
{
	char buf[INET6_ADDRSTRLEN];
	char dst[INET6_ADDRSTRLEN + 10];

	if(not inet_ntop(getFamily(), getIPAddressPtr(), buf, sizeof(buf)))
		return std::string();

	if(not withPort)
		return std::string(buf);

	if(AF_INET == getFamily())
		snprintf(dst, sizeof(dst), "%s:%u", buf, getPort());
	else
		snprintf(dst, sizeof(dst), "[%s]:%u", buf, getPort());

	return std::string(dst);
}

static size_t _count_colons(const char *src)
{
	size_t rv = 0;
	char ch;
	while((ch = *src++))
		if(':' == ch)
			rv++;
	return rv;
}

bool Address::setFromPresentation(const char *src, bool withPort)
{
	char ip[INET6_ADDRSTRLEN];
	int port = 0;
	int family = _count_colons(src) > (withPort ? 1 : 0) ? AF_INET6 : AF_INET;

	if(withPort)
	{
		if(2 != sscanf(src, "[%45[0-9a-fA-F:.]]:%d", ip, &port))
		{
			if(AF_INET6 == family)
				return false;

			if(2 != sscanf(src, "%45[0-9.]:%d", ip, &port))
				return false;
		}
		if((port < 0) or (port > 65535))
			return false;
	}
	else
	{
		if((1 != sscanf(src, "[%45[^]]]", ip)) and (1 != sscanf(src, "%45s", ip)))
			return false;
	}

	uint8_t ipaddr[16];
	if(inet_pton(family, ip, ipaddr) < 1)
		return false;

	setIPAddress(ipaddr, AF_INET6 == family ? 16 : 4);

	if(withPort)
		setPort(unsigned(port));

	return true;
}

} } } // namespace com::arena::rudp
