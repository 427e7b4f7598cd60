// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cmath>

#include "Connection.hpp"
#include "../include/rudp/Log.hpp"
#include "../include/rudp/Sequence.hpp"

namespace com { namespace arena { namespace rudp {

namespace {

const size_t MAX_NAK_ENTRIES = 32;

uint64_t readU64(const uint8_t *src)
{
	uint64_t rv = 0;
	for(int i = 0; i < 8; i++)
		rv = (rv << 8) | src[i];
	return rv;
}

void writeU64(uint64_t val, uint8_t *dst)
{
	for(int i = 7; i >= 0; i--)
	{
		dst[i] = val & 0xff;
		val >>= 8;
	}
}

}

Connection::Connection(Endpoint *endpoint, uint32_t connectionID, const Address &addr, bool isServer) :
	m_endpoint(endpoint),
	m_config(endpoint->m_config),
	m_connectionID(connectionID),
	m_address(addr),
	m_isServer(isServer),
	m_state(S_HANDSHAKING),
	m_closeReason(CLOSE_NORMAL),
	m_localClose(false),
	m_sendWindow(0),
	m_recvWindow(m_config.receiveWindow, 0),
	m_unreliableDuplicates(DUPLICATE_WINDOW),
	m_cc(m_config.cwndInit, m_config.ssthreshInit, m_config.minRto, m_config.maxRto, double(m_config.receiveWindow)),
	m_reliableReassembler(m_config.getMaxFragmentSize(), m_config.maxFragBytes, m_config.fragTimeout),
	m_unreliableReassembler(m_config.getMaxFragmentSize(), m_config.maxFragBytes, m_config.fragTimeout),
	m_queuedPackets(0),
	m_reliablePartial(false),
	m_partialPriority(0),
	m_nextUnreliableSequence(0),
	m_recvHighest(0xffff),
	m_acksPending(0),
	m_dupAcks(0),
	m_sackRounds(0),
	m_burst(0),
	m_burstStart(0),
	m_heldPressure(false),
	m_disconnectRetries(0)
{
	m_lastSent = m_lastHeard = now();
}

Connection::~Connection()
{
	teardown();
}

Time Connection::now() const
{
	return m_endpoint->getCurrentTime();
}

void Connection::startConnect(const uint8_t *payload, size_t len)
{
	startIdleTimer();
	sendReliable(PACKET_CONNECT, FLAG_ORDERED, 0, Bytes(payload, payload + len));
}

void Connection::acceptConnect(const PacketHeader &header, const Bytes &response)
{
	startIdleTimer();

	m_recvWindow.reset(header.sequence);
	m_recvWindow.receive(header.type, header.sequence, header.flags, 0, nullptr, 0,
		[] (uint8_t, uint16_t, uint8_t, uint8_t, const uint8_t *, size_t) {});
	m_recvHighest = header.sequence;
	m_acksPending = 1; // piggybacked on the ConnectAck

	sendReliable(PACKET_CONNECT_ACK, FLAG_ORDERED, 0, response);
}

// --- emission

void Connection::transmit(uint8_t type, uint8_t flags, uint16_t sequence, uint8_t fragmentIndex, const uint8_t *payload, size_t len)
{
	PacketHeader header;
	header.type = type;
	header.flags = flags;
	header.sequence = sequence;
	header.ack = m_recvWindow.getCumulativeAck();
	header.fragmentIndex = fragmentIndex;

	Bytes packet = encodePacket(header, payload, len);
	if(packet.empty())
		return;

	m_endpoint->writePacket(packet, m_address);
	m_lastSent = now();
	m_stats.packetsSent++;
	m_stats.bytesSent += packet.size();

	// the cumulative ack rode along; only an Ack carries the selective bitmap
	if(m_recvWindow.getOutOfOrderCount() <= 1)
	{
		m_acksPending = 0;
		if(m_ackTimer)
		{
			m_ackTimer->cancel();
			m_ackTimer.reset();
		}
	}
}

void Connection::transmitEntry(SendEntry *entry)
{
	transmit(entry->type, entry->flags, entry->sequence, entry->fragmentIndex, entry->payload.data(), entry->payload.size());
	entry->lastSent = now();
}

void Connection::sendReliable(uint8_t type, uint8_t flags, uint8_t fragmentIndex, const Bytes &payload)
{
	SendEntry *entry = m_sendWindow.add(type, flags | FLAG_RELIABLE, fragmentIndex, payload, now(), m_cc.getRTO());
	transmitEntry(entry);
	startRetransmitTimer(entry);
}

void Connection::sendUnreliable(uint8_t flags, uint8_t fragmentIndex, const Bytes &payload)
{
	transmit(PACKET_DATA, flags & ~(FLAG_RELIABLE | FLAG_ORDERED), m_nextUnreliableSequence++, fragmentIndex, payload.data(), payload.size());
}

void Connection::sendControl(uint8_t type, const uint8_t *payload, size_t len)
{
	transmit(type, 0, m_nextUnreliableSequence, 0, payload, len);
}

void Connection::sendAck()
{
	uint8_t bitmap[SACK_BITMAP_LENGTH];
	size_t len = 0;

	if(m_recvWindow.getOutOfOrderCount() > 1)
	{
		writeU64(m_recvWindow.getSelectiveAckBitmap(), bitmap);
		len = sizeof(bitmap);
	}

	sendControl(PACKET_ACK, bitmap, len);

	m_acksPending = 0;
	if(m_ackTimer)
	{
		m_ackTimer->cancel();
		m_ackTimer.reset();
	}
}

void Connection::sendNak(uint16_t from, uint16_t to)
{
	Bytes payload;

	for(uint16_t each = from; payload.size() < MAX_NAK_ENTRIES * 2; each++)
	{
		payload.push_back((each >> 8) & 0xff);
		payload.push_back(each & 0xff);
		if(each == to)
			break;
	}

	sendControl(PACKET_NAK, payload.data(), payload.size());
}

void Connection::startRetransmitTimer(SendEntry *entry)
{
	if(entry->timer)
		entry->timer->cancel();

	auto myself = share_ref(this);
	uint16_t sequence = entry->sequence;
	entry->timer = m_endpoint->scheduleRel(entry->rto);
	entry->timer->action = Timer::makeAction([myself, sequence] { myself->onRetransmitTimeout(sequence); });
}

void Connection::onRetransmitTimeout(uint16_t sequence)
{
	if(not (isOpen() or isSending()))
		return;

	SendEntry *entry = m_sendWindow.find(sequence);
	if((not entry) or entry->acked)
		return;

	if(entry->retries >= m_config.maxRetries)
	{
		log()->debug("connection {} sequence {} unacknowledged after {} retries", m_connectionID, sequence, entry->retries);
		abort(CLOSE_PEER_UNREACHABLE);
		return;
	}

	entry->rto = std::min(entry->rto * 2, m_cc.getMaxRTO());
	m_cc.onLoss();
	m_stats.losses++;
	retransmit(entry);
}

void Connection::retransmit(SendEntry *entry)
{
	entry->retries++;
	m_stats.retransmissions++;
	m_endpoint->m_stats.retransmissions++;
	transmitEntry(entry);
	startRetransmitTimer(entry);
}

// --- queueing

bool Connection::send(const uint8_t *bytes, size_t len, bool reliable, bool ordered, uint8_t priority)
{
	if(not isOpen())
		return false;

	Outgoing outgoing;
	if(not fragmentPayload(bytes, len, m_config.getMaxFragmentSize(), outgoing.m_fragments, m_config.maxFragBytes))
		return false;
	if(reliable and (outgoing.m_fragments.size() > m_config.receiveWindow))
		return false;

	outgoing.m_flags = reliable ? (FLAG_RELIABLE | (ordered ? FLAG_ORDERED : 0)) : 0;

	if(not enqueue(priority, outgoing))
		return false;

	m_stats.messagesSent++;
	flush();

	return true;
}

bool Connection::enqueue(uint8_t priority, Outgoing &outgoing)
{
	size_t count = outgoing.m_fragments.size();
	bool reliable = outgoing.m_flags & FLAG_RELIABLE;

	while(m_queuedPackets + count > m_config.sendQueueLimit)
	{
		if(evictLeastUrgentUnreliable())
			continue;

		if(not reliable)
		{
			m_endpoint->m_stats.sendQueueDrops++;
			return true;
		}

		log()->warn("connection {} send queue full ({} packets)", m_connectionID, m_queuedPackets);
		abort(CLOSE_SEND_QUEUE_OVERFLOW);
		return false;
	}

	m_sendQueues[priority].push_back(std::move(outgoing));
	m_queuedPackets += count;

	return true;
}

bool Connection::evictLeastUrgentUnreliable()
{
	for(auto it = m_sendQueues.rbegin(); it != m_sendQueues.rend(); it++)
	{
		auto &queue = it->second;
		for(auto each = queue.begin(); each != queue.end(); each++)
		{
			if(0 == (each->m_flags & FLAG_RELIABLE))
			{
				m_queuedPackets -= each->m_fragments.size();
				queue.erase(each);
				m_endpoint->m_stats.sendQueueDrops++;
				return true;
			}
		}
	}

	return false;
}

bool Connection::canSendReliable() const
{
	return m_cc.canSend(m_sendWindow.getInFlight())
	   and (m_sendWindow.getSpan() < m_config.receiveWindow);
}

void Connection::flush()
{
	if((not isSending()) or m_pacingTimer)
		return;

	Time t = now();
	Duration perPacket = m_cc.getPacingInterval();

	if(t - m_burstStart >= m_burst * perPacket)
	{
		m_burst = 0;
		m_burstStart = t;
	}

	bool sent = true;
	while(sent and isSending())
	{
		sent = false;

		for(auto it = m_sendQueues.begin(); it != m_sendQueues.end(); )
		{
			auto &queue = it->second;
			if(queue.empty())
			{
				it = m_sendQueues.erase(it);
				continue;
			}

			// a reliable message held by the window blocks only its own queue.
			// fragments of one message take consecutive sequences, so no other
			// reliable message starts while one is part way out.
			Outgoing &front = queue.front();
			bool reliable = front.m_flags & FLAG_RELIABLE;
			if(reliable and ((m_reliablePartial and (it->first != m_partialPriority)) or not canSendReliable()))
			{
				it++;
				continue;
			}

			if(m_burst >= MAX_BURST)
			{
				Duration wait = m_burstStart + m_burst * perPacket - t;
				if((m_burst * perPacket >= m_endpoint->m_timers.getGranularity()) and (wait > 0))
				{
					auto myself = share_ref(this);
					m_pacingTimer = m_endpoint->scheduleRel(wait);
					m_pacingTimer->action = Timer::makeAction([myself] {
						myself->m_pacingTimer.reset();
						myself->flush();
					});
					return;
				}

				m_burst = 0;
				m_burstStart = t;
			}

			if(reliable)
			{
				// one fragment per pass, each gated by the window
				releaseFragment(front, front.m_next++);
				m_queuedPackets--;
				m_burst++;

				m_reliablePartial = front.m_next < front.m_fragments.size();
				if(m_reliablePartial)
					m_partialPriority = it->first;
				else
					queue.pop_front();
			}
			else
			{
				Outgoing outgoing = std::move(front);
				queue.pop_front();
				m_queuedPackets -= outgoing.m_fragments.size();
				m_burst += outgoing.m_fragments.size();

				for(size_t i = 0; i < outgoing.m_fragments.size(); i++)
					releaseFragment(outgoing, i);
			}

			sent = true;
			break;
		}
	}

	checkCloseReady();
}

void Connection::releaseFragment(const Outgoing &outgoing, size_t index)
{
	size_t count = outgoing.m_fragments.size();
	uint8_t flags = outgoing.m_flags;
	if(count > 1)
		flags |= FLAG_FRAGMENTED | ((index + 1 == count) ? FLAG_LAST_FRAGMENT : 0);

	if(flags & FLAG_RELIABLE)
		sendReliable(PACKET_DATA, flags, uint8_t(index), outgoing.m_fragments[index]);
	else
		sendUnreliable(flags, uint8_t(index), outgoing.m_fragments[index]);
}

// --- receive

void Connection::onPacket(const PacketHeader &header, const uint8_t *payload)
{
	if(S_CLOSED == m_state)
		return;

	m_lastHeard = now();
	m_stats.packetsReceived++;
	m_stats.bytesReceived += HEADER_LENGTH + header.payloadLength;

	bool rejection = (PACKET_CONNECT_ACK == header.type) and not header.hasFlag(FLAG_RELIABLE);
	if(not rejection)
	{
		processAcks(header, payload);
		if(S_CLOSED == m_state)
			return;
	}

	switch(header.type)
	{
	case PACKET_DATA:
		if(header.hasFlag(FLAG_RELIABLE))
			onReliablePacket(header, payload);
		else
			onUnreliableData(header, payload);
		break;

	case PACKET_CONNECT:
	case PACKET_CONNECT_ACK:
		if(rejection)
			onRejected(payload, header.payloadLength);
		else if(header.hasFlag(FLAG_RELIABLE))
			onReliablePacket(header, payload);
		break;

	case PACKET_NAK:
		onNak(payload, header.payloadLength);
		break;

	case PACKET_DISCONNECT:
		onDisconnect();
		break;

	case PACKET_DISCONNECT_ACK:
		if((S_CLOSING == m_state) and m_localClose and m_closeTimer)
			finish(m_closeReason);
		break;

	case PACKET_CONGESTION_CONTROL:
		m_cc.onLoss();
		m_stats.losses++;
		break;

	case PACKET_PING:
		if(isOpen())
			sendControl(PACKET_PONG, payload, header.payloadLength);
		break;

	case PACKET_PONG:
		onPong(payload, header.payloadLength);
		break;

	case PACKET_ACK:
	case PACKET_HEARTBEAT:
	default:
		break;
	}
}

void Connection::processAcks(const PacketHeader &header, const uint8_t *payload)
{
	SendWindow::AckResult result;
	Time t = now();
	bool isAck = PACKET_ACK == header.type;
	uint64_t bitmap = 0;

	m_sendWindow.onCumulativeAck(header.ack, t, result);
	if(isAck and (header.payloadLength >= SACK_BITMAP_LENGTH))
	{
		bitmap = readU64(payload);
		m_sendWindow.onSelectiveAck(header.ack, bitmap, t, result);
	}

	if(result.haveRttSample)
		m_cc.onRttSample(result.rttSample);

	if(result.newlyAcked)
	{
		m_cc.onFreshAck(result.newlyAcked);
		m_dupAcks = 0;
	}

	// the ConnectAck is reliable sequence 0
	if(m_isServer and (S_HANDSHAKING == m_state) and not m_sendWindow.isOutstanding(0))
		setEstablished();

	if(isAck and m_sendWindow.getInFlight())
	{
		if(result.duplicate)
			m_dupAcks++;

		SendEntry *hole = bitmap ? m_sendWindow.firstHole() : nullptr;
		if(hole)
			m_sackRounds++;
		else
			m_sackRounds = 0;

		if((m_dupAcks >= DUPACKS_FOR_LOSS) or (m_sackRounds >= DUPACKS_FOR_LOSS))
		{
			SendEntry *entry = hole ? hole : m_sendWindow.firstUnacked();
			m_dupAcks = 0;
			m_sackRounds = 0;
			if(entry)
			{
				m_cc.onLoss();
				m_stats.losses++;
				retransmit(entry);
			}
		}
	}

	if(result.newlyAcked)
		flush();
}

void Connection::onReliablePacket(const PacketHeader &header, const uint8_t *payload)
{
	if(m_isServer and (S_HANDSHAKING == m_state) and (PACKET_DATA == header.type))
		setEstablished();

	int32_t jump = seqDiff(header.sequence, m_recvHighest);

	m_acksPending++;
	RecvWindow::Disposition disposition = m_recvWindow.receive(header.type, header.sequence, header.flags, header.fragmentIndex, payload, header.payloadLength,
		[this] (uint8_t type, uint16_t sequence, uint8_t flags, uint8_t fragmentIndex, const uint8_t *bytes, size_t len) {
			onReliableDelivery(type, sequence, flags, fragmentIndex, bytes, len);
		});

	if(RecvWindow::OVERFLOW == disposition)
	{
		m_endpoint->m_stats.receiveWindowOverflows++;
		log()->debug("connection {} sequence {} beyond receive window", m_connectionID, header.sequence);
		abort(CLOSE_RECEIVE_WINDOW_OVERFLOW);
		return;
	}

	if(S_CLOSED == m_state)
		return;

	if(RecvWindow::DUPLICATE == disposition)
		m_endpoint->m_stats.duplicates++;
	else if(jump > 0)
	{
		if(jump > 1)
			sendNak(uint16_t(m_recvHighest + 1), uint16_t(header.sequence - 1));
		m_recvHighest = header.sequence;
	}

	size_t held = m_recvWindow.getHeldCount();
	if((not m_heldPressure) and (held > m_recvWindow.getWindow() / 2))
	{
		m_heldPressure = true;
		sendControl(PACKET_CONGESTION_CONTROL, nullptr, 0);
	}
	else if(held <= m_recvWindow.getWindow() / 4)
		m_heldPressure = false;

	scheduleAck();
}

void Connection::onUnreliableData(const PacketHeader &header, const uint8_t *payload)
{
	if(m_isServer and (S_HANDSHAKING == m_state))
		setEstablished();

	if(not m_unreliableDuplicates.check(header.sequence))
	{
		m_endpoint->m_stats.duplicates++;
		return;
	}

	if(header.hasFlag(FLAG_FRAGMENTED))
		deliverFragment(m_unreliableReassembler, header.sequence, header.flags, header.fragmentIndex, payload, header.payloadLength);
	else
		deliverMessage(payload, header.payloadLength);
}

void Connection::onReliableDelivery(uint8_t type, uint16_t sequence, uint8_t flags, uint8_t fragmentIndex, const uint8_t *bytes, size_t len)
{
	if(S_CLOSED == m_state)
		return;

	switch(type)
	{
	case PACKET_DATA:
		if(flags & FLAG_FRAGMENTED)
			deliverFragment(m_reliableReassembler, sequence, flags, fragmentIndex, bytes, len);
		else
			deliverMessage(bytes, len);
		break;

	case PACKET_CONNECT_ACK:
		if((not m_isServer) and (S_HANDSHAKING == m_state))
		{
			if(m_endpoint->onConnectResponse)
				m_endpoint->onConnectResponse(m_connectionID, bytes, len, true);
			setEstablished();
		}
		break;

	default:
		break;
	}
}

void Connection::onRejected(const uint8_t *payload, size_t len)
{
	if(m_isServer or (S_HANDSHAKING != m_state))
		return;

	if(m_endpoint->onConnectResponse)
		m_endpoint->onConnectResponse(m_connectionID, payload, len, false);
	abort(CLOSE_REJECTED);
}

void Connection::onNak(const uint8_t *payload, size_t len)
{
	if(not isSending())
		return;

	Time t = now();
	bool lost = false;

	for(size_t i = 0; i + 2 <= len; i += 2)
	{
		uint16_t sequence = (uint16_t(payload[i]) << 8) | payload[i + 1];
		SendEntry *entry = m_sendWindow.find(sequence);

		// a packet sent less than an RTT ago may merely be reordered
		if(entry and (not entry->acked) and (t - entry->lastSent >= m_cc.getSRTT()))
		{
			retransmit(entry);
			lost = true;
		}
	}

	if(lost)
	{
		m_cc.onLoss();
		m_stats.losses++;
	}
}

void Connection::onDisconnect()
{
	sendControl(PACKET_DISCONNECT_ACK, nullptr, 0);

	if(S_CLOSING == m_state)
	{
		// our own close is still draining; the peer is going away regardless
		if(m_localClose and not m_closeTimer)
			finish(m_closeReason);
		return;
	}

	m_state = S_CLOSING;
	m_localClose = false;
	m_closeReason = CLOSE_REMOTE;

	m_sendQueues.clear();
	m_queuedPackets = 0;
	m_reliablePartial = false;
	m_sendWindow.clear();
	if(m_heartbeatTimer)
		m_heartbeatTimer->cancel();
	if(m_pacingTimer)
		m_pacingTimer->cancel();
	m_pacingTimer.reset();

	auto myself = share_ref(this);
	m_closeTimer = m_endpoint->scheduleRel(std::max(Duration(2 * m_cc.getSRTT()), Duration(MIN_CLOSE_LINGER)));
	m_closeTimer->action = Timer::makeAction([myself] { myself->finish(CLOSE_REMOTE); });
}

void Connection::onPong(const uint8_t *payload, size_t len)
{
	if(PING_TIMESTAMP_LENGTH != len)
		return;

	Time sent = Time(readU64(payload)) / 1000000.0;
	Duration rtt = now() - sent;
	if(rtt >= 0)
		m_cc.onRttSample(rtt);
}

void Connection::deliverFragment(Reassembler &reassembler, uint16_t sequence, uint8_t flags, uint8_t fragmentIndex, const uint8_t *bytes, size_t len)
{
	Bytes completed;

	switch(reassembler.insert(sequence, fragmentIndex, flags & FLAG_LAST_FRAGMENT, bytes, len, now(), completed))
	{
	case Reassembler::COMPLETE:
		deliverMessage(completed.data(), completed.size());
		break;

	case Reassembler::INCOMPLETE:
		scheduleFragmentExpiry(reassembler.getNextDeadline());
		break;

	case Reassembler::DROPPED:
		m_endpoint->m_stats.fragmentTimeouts++;
		break;

	case Reassembler::DUPLICATE:
		m_endpoint->m_stats.duplicates++;
		break;
	}
}

void Connection::deliverMessage(const uint8_t *bytes, size_t len)
{
	if(S_ESTABLISHED != m_state)
		return;

	m_stats.messagesReceived++;
	if(m_endpoint->onMessage)
		m_endpoint->onMessage(m_connectionID, bytes, len);
}

void Connection::scheduleAck()
{
	if(0 == m_acksPending)
		return;

	if(m_acksPending >= m_config.ackThreshold)
	{
		sendAck();
		return;
	}

	if(not m_ackTimer)
	{
		auto myself = share_ref(this);
		m_ackTimer = m_endpoint->scheduleRel(m_config.ackDelay);
		m_ackTimer->action = Timer::makeAction([myself] {
			myself->m_ackTimer.reset();
			if(myself->m_acksPending and (S_CLOSED != myself->m_state))
				myself->sendAck();
		});
	}
}

void Connection::scheduleFragmentExpiry(Time deadline)
{
	if(std::isinf(deadline))
		return;

	if(m_fragmentTimer)
	{
		if(deadline < m_fragmentTimer->getNextFireTime())
			m_fragmentTimer->setNextFireTime(deadline);
		return;
	}

	auto myself = share_ref(this);
	m_fragmentTimer = m_endpoint->m_timers.schedule(deadline);
	m_fragmentTimer->action = Timer::makeAction([myself] {
		myself->m_fragmentTimer.reset();
		myself->onFragmentExpiry();
	});
}

void Connection::onFragmentExpiry()
{
	if(S_CLOSED == m_state)
		return;

	Time t = now();
	size_t expired = m_reliableReassembler.expire(t) + m_unreliableReassembler.expire(t);
	if(expired)
	{
		m_endpoint->m_stats.fragmentTimeouts += expired;
		log()->debug("connection {} dropped {} incomplete fragment groups", m_connectionID, expired);
	}

	scheduleFragmentExpiry(std::min(m_reliableReassembler.getNextDeadline(), m_unreliableReassembler.getNextDeadline()));
}

// --- lifecycle

bool Connection::ping()
{
	if(not isOpen())
		return false;

	uint8_t timestamp[PING_TIMESTAMP_LENGTH];
	writeU64(uint64_t(now() * 1000000.0), timestamp);
	sendControl(PACKET_PING, timestamp, sizeof(timestamp));

	return true;
}

void Connection::setEstablished()
{
	if(S_HANDSHAKING != m_state)
		return;

	m_state = S_ESTABLISHED;
	scheduleHeartbeat();
	m_endpoint->onConnectionDidEstablish(this);

	flush();
}

void Connection::scheduleHeartbeat()
{
	auto myself = share_ref(this);
	m_heartbeatTimer = m_endpoint->m_timers.schedule(m_lastSent + m_config.heartbeatInterval);
	m_heartbeatTimer->action = [myself] (const std::shared_ptr<Timer> &sender, Time now) {
		if(S_ESTABLISHED != myself->m_state)
			return;

		Time due = myself->m_lastSent + myself->m_config.heartbeatInterval;
		if(now >= due)
		{
			myself->sendControl(PACKET_HEARTBEAT, nullptr, 0);
			due = myself->m_lastSent + myself->m_config.heartbeatInterval;
		}
		sender->setNextFireTime(due);
	};
}

void Connection::startIdleTimer()
{
	auto myself = share_ref(this);
	m_idleTimer = m_endpoint->m_timers.schedule(m_lastHeard + m_config.idleTimeout);
	m_idleTimer->action = [myself] (const std::shared_ptr<Timer> &sender, Time now) {
		Time due = myself->m_lastHeard + myself->m_config.idleTimeout;
		if(now >= due)
			myself->abort(CLOSE_IDLE_TIMEOUT);
		else
			sender->setNextFireTime(due);
	};
}

void Connection::close(CloseReason reason)
{
	if(not isOpen())
		return;

	if(S_HANDSHAKING == m_state)
	{
		abort(reason);
		return;
	}

	m_state = S_CLOSING;
	m_localClose = true;
	m_closeReason = reason;
	if(m_heartbeatTimer)
		m_heartbeatTimer->cancel();

	// queued and unacknowledged messages drain first, then the Disconnect
	flush();
}

void Connection::sendDisconnect()
{
	uint8_t reason = uint8_t(m_closeReason);
	sendControl(PACKET_DISCONNECT, &reason, 1);
}

void Connection::checkCloseReady()
{
	if((S_CLOSING != m_state) or (not m_localClose) or m_closeTimer)
		return;
	if(m_queuedPackets or m_sendWindow.getInFlight())
		return;

	m_disconnectRetries = 0;
	sendDisconnect();

	auto myself = share_ref(this);
	m_closeTimer = m_endpoint->scheduleRel(m_cc.getRTO());
	m_closeTimer->action = [myself] (const std::shared_ptr<Timer> &sender, Time now) {
		if(myself->m_disconnectRetries >= myself->m_config.maxRetries)
		{
			myself->finish(myself->m_closeReason);
			return;
		}

		myself->m_disconnectRetries++;
		myself->sendDisconnect();
		sender->setNextFireTime(now + myself->m_cc.getRTO());
	};
}

void Connection::abort(CloseReason reason)
{
	finish(reason);
}

void Connection::teardown()
{
	std::shared_ptr<Timer> *timers[] = { &m_ackTimer, &m_pacingTimer, &m_heartbeatTimer, &m_idleTimer, &m_fragmentTimer, &m_closeTimer };
	for(size_t i = 0; i < sizeof(timers) / sizeof(timers[0]); i++)
	{
		if(*timers[i])
			(*timers[i])->cancel();
		timers[i]->reset();
	}

	m_sendWindow.clear();
	m_recvWindow.clear();
	m_reliableReassembler.clear();
	m_unreliableReassembler.clear();
	m_sendQueues.clear();
	m_queuedPackets = 0;
	m_reliablePartial = false;
	m_acksPending = 0;
}

void Connection::finish(CloseReason reason)
{
	if(S_CLOSED == m_state)
		return;

	auto myself = share_ref(this);
	m_state = S_CLOSED;
	teardown();

	m_endpoint->onConnectionDidClose(myself, reason);
}

void Connection::getStats(ConnectionStats &stats) const
{
	stats = m_stats;
	stats.srtt = m_cc.getSRTT();
	stats.rttvar = m_cc.getRTTVariance();
	stats.rto = m_cc.getRTO();
	stats.cwnd = m_cc.getCwnd();
	stats.ssthresh = m_cc.getSsthresh();
	stats.inFlight = m_sendWindow.getInFlight();
	stats.queuedPackets = m_queuedPackets;
}

} } } // namespace com::arena::rudp
