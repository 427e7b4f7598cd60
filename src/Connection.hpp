#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rudp/rudp.hpp"
#include "../include/rudp/CongestionController.hpp"
#include "../include/rudp/DuplicateWindow.hpp"
#include "../include/rudp/Fragmenter.hpp"
#include "../include/rudp/PacketCodec.hpp"
#include "../include/rudp/RecvWindow.hpp"
#include "../include/rudp/SendWindow.hpp"

#include <deque>

namespace com { namespace arena { namespace rudp {

class Connection : public Object {
public:
	Connection(Endpoint *endpoint, uint32_t connectionID, const Address &addr, bool isServer);
	~Connection();

	// Client: send the Connect packet (reliable sequence 0).
	void startConnect(const uint8_t *payload, size_t len);

	// Server: the peer's Connect was accepted. Record it and answer with a
	// reliable ConnectAck carrying response.
	void acceptConnect(const PacketHeader &header, const Bytes &response);

	void onPacket(const PacketHeader &header, const uint8_t *payload);

	bool send(const uint8_t *bytes, size_t len, bool reliable, bool ordered, uint8_t priority);
	void close(CloseReason reason); // orderly if established
	void abort(CloseReason reason); // no packet, no linger
	void teardown(); // timers and buffers only, no callbacks
	bool ping();

	ConnectionState getState() const { return m_state; }
	uint32_t        getConnectionID() const { return m_connectionID; }
	const Address  &getAddress() const { return m_address; }
	bool            isServer() const { return m_isServer; }
	void            getStats(ConnectionStats &stats) const;

protected:
	struct Outgoing {
		uint8_t            m_flags { 0 };
		std::vector<Bytes> m_fragments;
		size_t             m_next { 0 }; // first fragment not yet released
	};

	bool isOpen() const { return (S_HANDSHAKING == m_state) or (S_ESTABLISHED == m_state); }
	bool isSending() const { return (S_ESTABLISHED == m_state) or ((S_CLOSING == m_state) and m_localClose); }
	Time now() const;

	// emission
	void transmit(uint8_t type, uint8_t flags, uint16_t sequence, uint8_t fragmentIndex, const uint8_t *payload, size_t len);
	void transmitEntry(SendEntry *entry);
	void sendReliable(uint8_t type, uint8_t flags, uint8_t fragmentIndex, const Bytes &payload);
	void sendUnreliable(uint8_t flags, uint8_t fragmentIndex, const Bytes &payload);
	void sendControl(uint8_t type, const uint8_t *payload, size_t len);
	void sendAck();
	void sendNak(uint16_t from, uint16_t to);
	void startRetransmitTimer(SendEntry *entry);
	void onRetransmitTimeout(uint16_t sequence);
	void retransmit(SendEntry *entry);

	// queueing, gating, pacing
	bool enqueue(uint8_t priority, Outgoing &outgoing);
	bool evictLeastUrgentUnreliable();
	bool canSendReliable() const;
	void flush();
	void releaseFragment(const Outgoing &outgoing, size_t index);

	// receive
	void processAcks(const PacketHeader &header, const uint8_t *payload);
	void onReliablePacket(const PacketHeader &header, const uint8_t *payload);
	void onUnreliableData(const PacketHeader &header, const uint8_t *payload);
	void onReliableDelivery(uint8_t type, uint16_t sequence, uint8_t flags, uint8_t fragmentIndex, const uint8_t *bytes, size_t len);
	void onRejected(const uint8_t *payload, size_t len);
	void onNak(const uint8_t *payload, size_t len);
	void onDisconnect();
	void onPong(const uint8_t *payload, size_t len);
	void deliverFragment(Reassembler &reassembler, uint16_t sequence, uint8_t flags, uint8_t fragmentIndex, const uint8_t *bytes, size_t len);
	void deliverMessage(const uint8_t *bytes, size_t len);
	void scheduleAck();
	void scheduleFragmentExpiry(Time deadline);
	void onFragmentExpiry();

	// lifecycle
	void setEstablished();
	void sendDisconnect();
	void checkCloseReady();
	void scheduleHeartbeat();
	void startIdleTimer();
	void finish(CloseReason reason);

	Endpoint          *m_endpoint;
	const EndpointConfig &m_config;
	uint32_t           m_connectionID;
	Address            m_address;
	bool               m_isServer;
	ConnectionState    m_state;
	CloseReason        m_closeReason;
	bool               m_localClose;

	SendWindow           m_sendWindow;
	RecvWindow           m_recvWindow;
	DuplicateWindow      m_unreliableDuplicates;
	CongestionController m_cc;
	Reassembler          m_reliableReassembler;
	Reassembler          m_unreliableReassembler;

	std::map<uint8_t, std::deque<Outgoing> > m_sendQueues; // lower value is more urgent
	size_t   m_queuedPackets;
	bool     m_reliablePartial; // a fragmented reliable message is part way out
	uint8_t  m_partialPriority;
	uint16_t m_nextUnreliableSequence;
	uint16_t m_recvHighest; // newest reliable sequence received
	size_t   m_acksPending;
	size_t   m_dupAcks;
	size_t   m_sackRounds;
	size_t   m_burst;
	Time     m_burstStart;
	bool     m_heldPressure;
	unsigned m_disconnectRetries;

	Time m_lastSent;
	Time m_lastHeard;

	std::shared_ptr<Timer> m_ackTimer;
	std::shared_ptr<Timer> m_pacingTimer;
	std::shared_ptr<Timer> m_heartbeatTimer;
	std::shared_ptr<Timer> m_idleTimer;
	std::shared_ptr<Timer> m_fragmentTimer;
	std::shared_ptr<Timer> m_closeTimer;

	ConnectionStats m_stats;
};

} } } // namespace com::arena::rudp
