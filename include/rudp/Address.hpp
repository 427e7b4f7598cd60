#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <sys/socket.h>
#include <netinet/in.h>

#include <cstdint>
#include <string>

namespace com { namespace arena { namespace rudp {

// Peer address: connection table key. IPv4 is address + port, IPv6 the full
// 128-bit address + port.
class Address {
public:
	union in_sockaddr {
		struct sockaddr     s;
		struct sockaddr_in  s4;
		struct sockaddr_in6 s6;
	};

	Address();
	Address(const struct sockaddr *addr);

	void erase();

	bool setFamily(int family);
	int  getFamily() const { return m_addr.s.sa_family; }

	void      setPort(unsigned port);
	unsigned  getPort() const;

	size_t         getIPAddressLength() const;
	const uint8_t *getIPAddressPtr() const;
	bool           setIPAddress(const uint8_t *src, size_t len);

	bool                   setSockaddr(const struct sockaddr *addr);
	const struct sockaddr *getSockaddr() const { return &m_addr.s; }
	socklen_t              getSockaddrLen() const;

	bool operator< (const Address &rhs) const;
	bool operator== (const Address &rhs) const;
	bool operator!= (const Address &rhs) const { return not (*this == rhs); }

	// "192.0.2.1:5000" or "[2001:db8::1]:5000"
	std::string toPresentation(bool withPort = true) const;
	bool setFromPresentation(const char *src, bool withPort = true);

protected:
	union in_sockaddr m_addr;
};

} } } // namespace com::arena::rudp
