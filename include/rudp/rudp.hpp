#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

// Reliable UDP transport for real-time games: connection handshake, per
// packet reliability with selectable ordering, fragmentation, AIMD congestion
// control with pacing, heartbeats and orderly teardown.

#include <map>

#include "Timer.hpp"
#include "Address.hpp"
#include "params.hpp"

namespace com { namespace arena { namespace rudp {

class IPlatformAdapter;
class Connection;
struct PacketHeader;

enum ConnectionState { S_HANDSHAKING, S_ESTABLISHED, S_CLOSING, S_CLOSED };

enum CloseReason {
	CLOSE_NORMAL = 0,
	CLOSE_REMOTE,
	CLOSE_IDLE_TIMEOUT,
	CLOSE_PEER_UNREACHABLE,
	CLOSE_RECEIVE_WINDOW_OVERFLOW,
	CLOSE_SEND_QUEUE_OVERFLOW,
	CLOSE_REJECTED,
	CLOSE_SHUTDOWN
};

const char *closeReasonName(CloseReason reason);
const char *connectionStateName(ConnectionState state);

struct EndpointConfig {
	size_t   mtu { DEFAULT_MTU };
	size_t   maxConnections { DEFAULT_MAX_CONNECTIONS };
	Duration heartbeatInterval { HEARTBEAT_INTERVAL };
	Duration idleTimeout { IDLE_TIMEOUT };
	Duration ackDelay { ACK_DELAY };
	size_t   ackThreshold { ACK_THRESHOLD };
	Duration minRto { MIN_RTO };
	Duration maxRto { MAX_RTO };
	unsigned maxRetries { MAX_RETRIES };
	double   cwndInit { CWND_INIT };
	double   ssthreshInit { SSTHRESH_INIT };
	size_t   receiveWindow { RECEIVE_WINDOW };
	size_t   sendQueueLimit { SEND_QUEUE_LIMIT };
	Duration fragTimeout { FRAG_TIMEOUT };
	size_t   maxFragBytes { MAX_FRAG_BYTES };

	size_t getMaxFragmentSize() const { return mtu > HEADER_LENGTH ? mtu - HEADER_LENGTH : 0; }
};

struct ConnectionStats {
	Duration srtt { 0 };
	Duration rttvar { 0 };
	Duration rto { 0 };
	double   cwnd { 0 };
	double   ssthresh { 0 };
	size_t   inFlight { 0 };
	size_t   queuedPackets { 0 };
	uint64_t bytesSent { 0 };
	uint64_t bytesReceived { 0 };
	uint64_t packetsSent { 0 };
	uint64_t packetsReceived { 0 };
	uint64_t messagesSent { 0 };
	uint64_t messagesReceived { 0 };
	uint64_t retransmissions { 0 };
	uint64_t losses { 0 };
};

// Presented to Endpoint::onConnectRequest for a Connect from an unknown address.
struct ConnectRequest {
	uint32_t       connectionID { 0 }; // provisional; becomes the connection's id if accepted
	Address        address;
	const uint8_t *payload { nullptr };
	size_t         payloadLength { 0 };
	bool           serverFull { false };
	Bytes          response; // sent in the ConnectAck either way
};

class Endpoint : public Object {
public:
	struct Statistics {
		uint64_t packetsReceived { 0 };
		uint64_t packetsSent { 0 };
		uint64_t malformedHeader { 0 };
		uint64_t badChecksum { 0 };
		uint64_t lengthMismatch { 0 };
		uint64_t unknownType { 0 };
		uint64_t unsupportedFlags { 0 };
		uint64_t unknownPeer { 0 };
		uint64_t duplicates { 0 };
		uint64_t fragmentTimeouts { 0 };
		uint64_t receiveWindowOverflows { 0 };
		uint64_t sendQueueDrops { 0 };
		uint64_t connectsAccepted { 0 };
		uint64_t connectsDenied { 0 };
		uint64_t retransmissions { 0 };
	};

	Endpoint(IPlatformAdapter *platform, const EndpointConfig &config = EndpointConfig(), uint8_t shardIndex = 0);
	Endpoint() = delete;
	~Endpoint();

	// Start a handshake with addr carrying payload in the Connect packet.
	// Answers the new connection id, or 0 on error (shut down, or a connection
	// to addr already exists).
	uint32_t connect(const Address &addr, const void *payload, size_t len);
	uint32_t connect(const Address &addr, const Bytes &payload);

	// Queue a message. Answers false if the connection is not open, the
	// message is larger than maxFragBytes, or the send queue overflowed and
	// the connection was closed. An unreliable message dropped for
	// backpressure still answers true.
	bool send(uint32_t connectionID, const void *bytes, size_t len, bool reliable, bool ordered, uint8_t priority);
	bool send(uint32_t connectionID, const Bytes &bytes, bool reliable, bool ordered, uint8_t priority);

	// Orderly close if established, otherwise immediate. onConnectionClosed
	// is called with reason once the close completes.
	bool close(uint32_t connectionID, CloseReason reason = CLOSE_NORMAL);

	// Send a Ping; the Pong gives an RTT sample.
	bool ping(uint32_t connectionID);

	// Refuse new connections and close all existing ones with CLOSE_SHUTDOWN.
	// platform->onShutdownComplete() is called once none remain.
	void shutdown(bool immediately = false);
	bool isShutdown() const;

	bool            isOpen(uint32_t connectionID) const; // handshaking or established
	ConnectionState getState(uint32_t connectionID) const; // S_CLOSED if unknown
	bool            getStats(uint32_t connectionID, ConnectionStats &stats) const;
	bool            getAddress(uint32_t connectionID, Address &addr) const;
	size_t          getConnectionCount() const;
	std::vector<uint32_t> getConnectionIDs() const;

	const EndpointConfig &getConfig() const;
	const Statistics     &getStatistics() const;
	uint8_t               getShardIndex() const;

	// Answer true to accept. A denied request still sends request.response
	// in a stateless ConnectAck. Without this callback, connections are
	// accepted unless the server is full.
	std::function<bool(ConnectRequest &request)> onConnectRequest;

	// Client side: the server's ConnectAck payload.
	std::function<void(uint32_t connectionID, const uint8_t *bytes, size_t len, bool accepted)> onConnectResponse;

	std::function<void(uint32_t connectionID)> onConnectionEstablished;
	std::function<void(uint32_t connectionID, const uint8_t *bytes, size_t len)> onMessage;
	std::function<void(uint32_t connectionID, CloseReason reason)> onConnectionClosed;

	// Platform interface.
	Duration howLongToSleep() const;
	void     doTimerWork();
	void     onReceivePacket(const void *bytes, size_t len, const struct sockaddr *addr);
	Time     getCurrentTime() const;

protected:
	friend class Connection;

	std::shared_ptr<Timer> scheduleRel(Duration delta, Duration recurInterval = 0);
	bool writePacket(const Bytes &packet, const Address &addr);
	void onConnectionDidClose(std::shared_ptr<Connection> conn, CloseReason reason);
	void onConnectionDidEstablish(Connection *conn);
	void handleConnect(const Address &addr, const PacketHeader &header, const uint8_t *payload);
	void sendDeny(const Address &addr, const PacketHeader &header, const Bytes &response);
	uint32_t nextConnectionID();
	std::shared_ptr<Connection> findConnection(uint32_t connectionID) const;
	void checkShutdownComplete();

	IPlatformAdapter *m_platform;
	EndpointConfig    m_config;
	uint8_t           m_shardIndex;
	uint32_t          m_nextID;
	bool              m_shutdown;
	bool              m_shutdownComplete;
	Statistics        m_stats;
	TimerWheel        m_timers;

	std::map<uint32_t, std::shared_ptr<Connection> > m_connections;
	std::map<Address, uint32_t> m_connectionsByAddress;
};

class IPlatformAdapter {
public:
	virtual ~IPlatformAdapter() {}

	virtual Time getCurrentTime() = 0; // Answer the current time (seconds).

	// Called if the deadline for calling Endpoint::doTimerWork() changes. This can be
	// used for re-setting a platform alarm for calling doTimerWork().
	virtual void onHowLongToSleepDidChange() {}

	// Write a datagram to addr.
	virtual bool writePacket(const void *bytes, size_t len, const struct sockaddr *addr, socklen_t addrLen) = 0;

	virtual void onShutdownComplete() {} // See Endpoint::shutdown().
};

} } } // namespace com::arena::rudp
