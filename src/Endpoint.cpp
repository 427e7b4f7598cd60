// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "Connection.hpp"
#include "../include/rudp/Log.hpp"

namespace com { namespace arena { namespace rudp {

const char *closeReasonName(CloseReason reason)
{
	switch(reason)
	{
	case CLOSE_NORMAL:                  return "Normal";
	case CLOSE_REMOTE:                  return "Remote";
	case CLOSE_IDLE_TIMEOUT:            return "IdleTimeout";
	case CLOSE_PEER_UNREACHABLE:        return "PeerUnreachable";
	case CLOSE_RECEIVE_WINDOW_OVERFLOW: return "ReceiveWindowOverflow";
	case CLOSE_SEND_QUEUE_OVERFLOW:     return "SendQueueOverflow";
	case CLOSE_REJECTED:                return "Rejected";
	case CLOSE_SHUTDOWN:                return "Shutdown";
	}
	return "Unknown";
}

const char *connectionStateName(ConnectionState state)
{
	switch(state)
	{
	case S_HANDSHAKING: return "Handshaking";
	case S_ESTABLISHED: return "Established";
	case S_CLOSING:     return "Closing";
	case S_CLOSED:      return "Closed";
	}
	return "Unknown";
}

Endpoint::Endpoint(IPlatformAdapter *platform, const EndpointConfig &config, uint8_t shardIndex) :
	m_platform(platform),
	m_config(config),
	m_shardIndex(shardIndex),
	m_nextID(1),
	m_shutdown(false),
	m_shutdownComplete(false)
{
	m_timers.onHowLongToSleepDidChange = [platform] { platform->onHowLongToSleepDidChange(); };
}

Endpoint::~Endpoint()
{
	m_timers.onHowLongToSleepDidChange = nullptr;

	for(auto it = m_connections.begin(); it != m_connections.end(); it++)
		it->second->teardown();
	m_connections.clear();
	m_connectionsByAddress.clear();

	m_timers.clear();
}

uint32_t Endpoint::connect(const Address &addr, const void *payload, size_t len)
{
	if(m_shutdown or m_connectionsByAddress.count(addr))
		return 0;

	uint32_t connectionID = nextConnectionID();
	auto conn = share_ref(new Connection(this, connectionID, addr, false), false);
	m_connections[connectionID] = conn;
	m_connectionsByAddress[addr] = connectionID;

	log()->debug("connection {} connecting to {}", connectionID, addr.toPresentation());
	conn->startConnect((const uint8_t *)payload, len);

	return connectionID;
}

uint32_t Endpoint::connect(const Address &addr, const Bytes &payload)
{
	return connect(addr, payload.data(), payload.size());
}

bool Endpoint::send(uint32_t connectionID, const void *bytes, size_t len, bool reliable, bool ordered, uint8_t priority)
{
	auto conn = findConnection(connectionID);
	if(not conn)
		return false;
	return conn->send((const uint8_t *)bytes, len, reliable, ordered, priority);
}

bool Endpoint::send(uint32_t connectionID, const Bytes &bytes, bool reliable, bool ordered, uint8_t priority)
{
	return send(connectionID, bytes.data(), bytes.size(), reliable, ordered, priority);
}

bool Endpoint::close(uint32_t connectionID, CloseReason reason)
{
	auto conn = findConnection(connectionID);
	if((not conn) or (S_HANDSHAKING != conn->getState() and S_ESTABLISHED != conn->getState()))
		return false;

	conn->close(reason);
	return true;
}

bool Endpoint::ping(uint32_t connectionID)
{
	auto conn = findConnection(connectionID);
	return conn and conn->ping();
}

void Endpoint::shutdown(bool immediately)
{
	if(not m_shutdown)
		log()->info("endpoint shard {} shutting down with {} connections", m_shardIndex, m_connections.size());
	m_shutdown = true;

	std::vector<std::shared_ptr<Connection> > connections;
	for(auto it = m_connections.begin(); it != m_connections.end(); it++)
		connections.push_back(it->second);

	for(auto it = connections.begin(); it != connections.end(); it++)
	{
		if(immediately)
			(*it)->abort(CLOSE_SHUTDOWN);
		else
			(*it)->close(CLOSE_SHUTDOWN);
	}

	checkShutdownComplete();
}

bool Endpoint::isShutdown() const
{
	return m_shutdown;
}

bool Endpoint::isOpen(uint32_t connectionID) const
{
	ConnectionState state = getState(connectionID);
	return (S_HANDSHAKING == state) or (S_ESTABLISHED == state);
}

ConnectionState Endpoint::getState(uint32_t connectionID) const
{
	auto conn = findConnection(connectionID);
	return conn ? conn->getState() : S_CLOSED;
}

bool Endpoint::getStats(uint32_t connectionID, ConnectionStats &stats) const
{
	auto conn = findConnection(connectionID);
	if(not conn)
		return false;
	conn->getStats(stats);
	return true;
}

bool Endpoint::getAddress(uint32_t connectionID, Address &addr) const
{
	auto conn = findConnection(connectionID);
	if(not conn)
		return false;
	addr = conn->getAddress();
	return true;
}

size_t Endpoint::getConnectionCount() const
{
	return m_connections.size();
}

std::vector<uint32_t> Endpoint::getConnectionIDs() const
{
	std::vector<uint32_t> rv;
	for(auto it = m_connections.begin(); it != m_connections.end(); it++)
		rv.push_back(it->first);
	return rv;
}

const EndpointConfig & Endpoint::getConfig() const
{
	return m_config;
}

const Endpoint::Statistics & Endpoint::getStatistics() const
{
	return m_stats;
}

uint8_t Endpoint::getShardIndex() const
{
	return m_shardIndex;
}

Duration Endpoint::howLongToSleep() const
{
	return m_timers.howLongToNextFire(getCurrentTime());
}

void Endpoint::doTimerWork()
{
	m_timers.fireDueTimers(getCurrentTime());
}

Time Endpoint::getCurrentTime() const
{
	return m_platform->getCurrentTime();
}

void Endpoint::onReceivePacket(const void *bytes, size_t len, const struct sockaddr *addr)
{
	m_stats.packetsReceived++;

	PacketHeader header;
	const uint8_t *payload = nullptr;
	DecodeResult result = decodePacket(bytes, len, header, payload);
	if(DECODE_OK != result)
	{
		switch(result)
		{
		case MALFORMED_HEADER: m_stats.malformedHeader++; break;
		case BAD_CHECKSUM:     m_stats.badChecksum++; break;
		case LENGTH_MISMATCH:  m_stats.lengthMismatch++; break;
		default: break;
		}
		log()->trace("dropped {} byte datagram: {}", len, decodeResultName(result));
		return;
	}

	if(not isKnownPacketType(header.type))
	{
		m_stats.unknownType++;
		log()->trace("dropped packet of unknown type 0x{:02x}", header.type);
		return;
	}

	if(header.flags & FLAGS_UNSUPPORTED)
	{
		m_stats.unsupportedFlags++;
		log()->trace("dropped packet with unsupported flags 0x{:02x}", header.flags);
		return;
	}

	Address from;
	if(not from.setSockaddr(addr))
	{
		m_stats.unknownPeer++;
		return;
	}

	auto it = m_connectionsByAddress.find(from);
	if(it == m_connectionsByAddress.end())
	{
		if((PACKET_CONNECT == header.type) and header.hasFlag(FLAG_RELIABLE))
			handleConnect(from, header, payload);
		else
			m_stats.unknownPeer++;
		return;
	}

	auto conn = findConnection(it->second);
	if(conn)
		conn->onPacket(header, payload);
}

void Endpoint::handleConnect(const Address &addr, const PacketHeader &header, const uint8_t *payload)
{
	ConnectRequest request;
	request.connectionID = nextConnectionID();
	request.address = addr;
	request.payload = payload;
	request.payloadLength = header.payloadLength;
	request.serverFull = m_connections.size() >= m_config.maxConnections;

	bool accept = false;
	if(not m_shutdown)
		accept = onConnectRequest ? onConnectRequest(request) : not request.serverFull;

	if(m_connectionsByAddress.count(addr))
		accept = false; // opened to this address from inside the callback

	if(not accept)
	{
		m_stats.connectsDenied++;
		log()->debug("denied connection from {}{}", addr.toPresentation(), request.serverFull ? " (server full)" : "");
		sendDeny(addr, header, request.response);
		return;
	}

	auto conn = share_ref(new Connection(this, request.connectionID, addr, true), false);
	m_connections[request.connectionID] = conn;
	m_connectionsByAddress[addr] = request.connectionID;
	m_stats.connectsAccepted++;

	log()->info("connection {} accepted from {}", request.connectionID, addr.toPresentation());
	conn->acceptConnect(header, request.response);
}

void Endpoint::sendDeny(const Address &addr, const PacketHeader &header, const Bytes &response)
{
	PacketHeader deny;
	deny.type = PACKET_CONNECT_ACK;
	deny.flags = 0;
	deny.sequence = 0;
	deny.ack = header.sequence;

	Bytes packet = encodePacket(deny, response);
	if(not packet.empty())
		writePacket(packet, addr);
}

uint32_t Endpoint::nextConnectionID()
{
	const uint32_t mask = (uint32_t(1) << CONNECTION_ID_SHARD_SHIFT) - 1;
	uint32_t rv;

	do {
		rv = (uint32_t(m_shardIndex) << CONNECTION_ID_SHARD_SHIFT) | (m_nextID & mask);
		m_nextID = (m_nextID + 1) & mask;
	} while((0 == (rv & mask)) or m_connections.count(rv));

	return rv;
}

std::shared_ptr<Connection> Endpoint::findConnection(uint32_t connectionID) const
{
	auto it = m_connections.find(connectionID);
	if(it == m_connections.end())
		return std::shared_ptr<Connection>();
	return it->second;
}

std::shared_ptr<Timer> Endpoint::scheduleRel(Duration delta, Duration recurInterval)
{
	return m_timers.schedule(getCurrentTime() + delta, recurInterval);
}

bool Endpoint::writePacket(const Bytes &packet, const Address &addr)
{
	m_stats.packetsSent++;
	return m_platform->writePacket(packet.data(), packet.size(), addr.getSockaddr(), addr.getSockaddrLen());
}

void Endpoint::onConnectionDidEstablish(Connection *conn)
{
	log()->debug("connection {} established with {}", conn->getConnectionID(), conn->getAddress().toPresentation());
	if(onConnectionEstablished)
		onConnectionEstablished(conn->getConnectionID());
}

void Endpoint::onConnectionDidClose(std::shared_ptr<Connection> conn, CloseReason reason)
{
	uint32_t connectionID = conn->getConnectionID();

	auto it = m_connectionsByAddress.find(conn->getAddress());
	if((it != m_connectionsByAddress.end()) and (it->second == connectionID))
		m_connectionsByAddress.erase(it);
	m_connections.erase(connectionID);

	log()->info("connection {} closed: {}", connectionID, closeReasonName(reason));
	if(onConnectionClosed)
		onConnectionClosed(connectionID, reason);

	checkShutdownComplete();
}

void Endpoint::checkShutdownComplete()
{
	if(m_shutdown and (not m_shutdownComplete) and m_connections.empty())
	{
		m_shutdownComplete = true;
		m_platform->onShutdownComplete();
	}
}

} } } // namespace com::arena::rudp
