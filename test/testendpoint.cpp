#include <cassert>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <deque>
#include <map>

#include "rudp/rudp.hpp"
#include "rudp/PacketCodec.hpp"

using namespace com::arena;
using namespace com::arena::rudp;

namespace {

class FakeNetwork;

// Datagrams written here are queued on the network and delivered on a later
// step, never from inside writePacket.
class FakePlatform : public IPlatformAdapter {
public:
	FakePlatform(FakeNetwork *network, const char *addr);

	Time getCurrentTime() override;
	bool writePacket(const void *bytes, size_t len, const struct sockaddr *addr, socklen_t addrLen) override;
	void onShutdownComplete() override { shutdownComplete = true; }

	FakeNetwork *m_network;
	Address      m_address;
	Endpoint    *m_endpoint { nullptr };
	bool         shutdownComplete { false };
};

struct Datagram {
	Address from;
	Address to;
	Bytes   bytes;
	Time    deliverAt;
};

class FakeNetwork {
public:
	// answer true to drop
	using Filter = std::function<bool(const Address &from, const Address &to, const PacketHeader &header)>;

	void attach(FakePlatform *platform, Endpoint *endpoint)
	{
		platform->m_endpoint = endpoint;
		m_platforms.push_back(platform);
	}

	void post(const Address &from, const Address &to, const uint8_t *bytes, size_t len)
	{
		PacketHeader header;
		const uint8_t *payload = nullptr;
		if((DECODE_OK == decodePacket(bytes, len, header, payload)) and filter and filter(from, to, header))
			return;

		Datagram datagram = { from, to, Bytes(bytes, bytes + len), now + latency };
		m_datagrams.push_back(datagram);
	}

	void run(Duration duration, Duration step = 0.001)
	{
		Time end = now + duration;
		while(now < end)
		{
			now += step;

			while((not m_datagrams.empty()) and (m_datagrams.front().deliverAt <= now))
			{
				Datagram datagram = m_datagrams.front();
				m_datagrams.pop_front();

				for(auto it = m_platforms.begin(); it != m_platforms.end(); it++)
					if((*it)->m_address == datagram.to)
						(*it)->m_endpoint->onReceivePacket(datagram.bytes.data(), datagram.bytes.size(), datagram.from.getSockaddr());
			}

			for(auto it = m_platforms.begin(); it != m_platforms.end(); it++)
				(*it)->m_endpoint->doTimerWork();
		}
	}

	Time     now { 0 };
	Duration latency { 0.005 };
	Filter   filter;

protected:
	std::vector<FakePlatform *> m_platforms;
	std::deque<Datagram>        m_datagrams;
};

FakePlatform::FakePlatform(FakeNetwork *network, const char *addr) :
	m_network(network)
{
	bool ok = m_address.setFromPresentation(addr);
	assert(ok);
}

Time FakePlatform::getCurrentTime()
{
	return m_network->now;
}

bool FakePlatform::writePacket(const void *bytes, size_t len, const struct sockaddr *addr, socklen_t addrLen)
{
	m_network->post(m_address, Address(addr), (const uint8_t *)bytes, len);
	return true;
}

// One endpoint with its callbacks recorded.
struct Peer {
	Peer(FakeNetwork *network, const char *addr, const EndpointConfig &config = EndpointConfig()) :
		platform(network, addr),
		endpoint(share_ref(new Endpoint(&platform, config), false))
	{
		network->attach(&platform, endpoint.get());

		endpoint->onConnectResponse = [this] (uint32_t connectionID, const uint8_t *bytes, size_t len, bool accepted) {
			responses++;
			responseAccepted = accepted;
			response.assign(bytes, bytes + len);
		};
		endpoint->onConnectionEstablished = [this] (uint32_t connectionID) {
			established.push_back(connectionID);
		};
		endpoint->onMessage = [this] (uint32_t connectionID, const uint8_t *bytes, size_t len) {
			messages.push_back(Bytes(bytes, bytes + len));
			lastMessageFrom = connectionID;
		};
		endpoint->onConnectionClosed = [this] (uint32_t connectionID, CloseReason reason) {
			closed.push_back(connectionID);
			closeReasons.push_back(reason);
		};
	}

	FakePlatform              platform;
	std::shared_ptr<Endpoint> endpoint;

	int                   responses { 0 };
	bool                  responseAccepted { false };
	Bytes                 response;
	std::vector<uint32_t> established;
	std::vector<Bytes>    messages;
	uint32_t              lastMessageFrom { 0 };
	std::vector<uint32_t> closed;
	std::vector<CloseReason> closeReasons;
};

Bytes str(const char *s)
{
	return Bytes(s, s + strlen(s));
}

uint32_t handshake(FakeNetwork &network, Peer &server, Peer &client, const char *payload = "hello")
{
	server.endpoint->onConnectRequest = [] (ConnectRequest &request) {
		request.response = str("welcome");
		return true;
	};

	uint32_t connectionID = client.endpoint->connect(server.platform.m_address, str(payload));
	assert(connectionID);
	network.run(0.1);

	assert(1 == client.responses);
	assert(client.responseAccepted);
	assert(client.response == str("welcome"));
	assert(1 == client.established.size());
	assert(1 == server.established.size());
	assert(S_ESTABLISHED == client.endpoint->getState(connectionID));

	return connectionID;
}

}

static void testHandshakeHeartbeatIdle()
{
	FakeNetwork network;
	Peer server(&network, "10.0.0.1:5000");
	Peer client(&network, "10.0.0.2:40000");

	Bytes seenPayload;
	server.endpoint->onConnectRequest = [&] (ConnectRequest &request) {
		assert(not request.serverFull);
		seenPayload.assign(request.payload, request.payload + request.payloadLength);
		request.response = str("welcome");
		return true;
	};

	size_t serverHeartbeats = 0;
	bool silenceClient = false;
	network.filter = [&] (const Address &from, const Address &to, const PacketHeader &header) {
		if((from == server.platform.m_address) and (PACKET_HEARTBEAT == header.type))
			serverHeartbeats++;
		return silenceClient and (from == client.platform.m_address);
	};

	uint32_t clientConnection = client.endpoint->connect(server.platform.m_address, str("alice"));
	assert(clientConnection);
	assert(0 == client.endpoint->connect(server.platform.m_address, str("again"))); // one per address

	network.run(0.1);
	assert(seenPayload == str("alice"));
	assert(client.responseAccepted);
	assert(1 == server.established.size());
	uint32_t serverConnection = server.established[0];
	assert(S_ESTABLISHED == server.endpoint->getState(serverConnection));

	Address peerAddr;
	assert(server.endpoint->getAddress(serverConnection, peerAddr));
	assert(peerAddr == client.platform.m_address);

	assert(client.endpoint->ping(clientConnection));
	network.run(0.05);
	ConnectionStats stats;
	assert(client.endpoint->getStats(clientConnection, stats));
	assert(stats.srtt > 0);

	silenceClient = true;
	network.run(1.35);
	assert(1 == serverHeartbeats);

	network.run(13.4);
	assert(server.endpoint->isOpen(serverConnection));
	assert(server.closed.empty());

	network.run(1.2);
	assert(1 == server.closed.size());
	assert(serverConnection == server.closed[0]);
	assert(CLOSE_IDLE_TIMEOUT == server.closeReasons[0]);
	assert(0 == server.endpoint->getConnectionCount());
	assert(S_CLOSED == server.endpoint->getState(serverConnection));
}

static void testRetransmissionUnderLoss()
{
	FakeNetwork network;
	Peer server(&network, "10.0.0.1:5000");
	Peer client(&network, "10.0.0.2:40000");

	uint32_t connectionID = handshake(network, server, client);

	std::vector<Time> sends;
	network.filter = [&] (const Address &from, const Address &to, const PacketHeader &header) {
		if((from == client.platform.m_address) and (PACKET_DATA == header.type) and header.hasFlag(FLAG_RELIABLE) and (42 == header.sequence))
		{
			sends.push_back(network.now);
			return 1 == sends.size();
		}
		return false;
	};

	// the Connect was reliable sequence 0, so message 42 rides sequence 42
	for(uint8_t i = 1; i <= 42; i++)
		assert(client.endpoint->send(connectionID, &i, 1, true, true, 1));

	network.run(2);

	assert(sends.size() >= 2);
	Duration delay = sends[1] - sends[0];
	assert(delay >= MIN_RTO - 0.002);
	assert(delay <= INITIAL_RTO + 0.01);

	assert(42 == server.messages.size());
	for(size_t i = 0; i < server.messages.size(); i++)
	{
		assert(1 == server.messages[i].size());
		assert(i + 1 == server.messages[i][0]);
	}

	ConnectionStats stats;
	assert(client.endpoint->getStats(connectionID, stats));
	assert(0 == stats.inFlight);
	assert(stats.retransmissions >= 1);
}

static void testFragmentedMessage()
{
	FakeNetwork network;
	Peer server(&network, "10.0.0.1:5000");
	Peer client(&network, "10.0.0.2:40000");

	uint32_t connectionID = handshake(network, server, client);

	struct Fragment { uint16_t sequence; uint8_t flags; uint8_t index; };
	std::vector<Fragment> fragments;
	network.filter = [&] (const Address &from, const Address &to, const PacketHeader &header) {
		if((from == client.platform.m_address) and (PACKET_DATA == header.type) and header.hasFlag(FLAG_FRAGMENTED))
		{
			Fragment fragment = { header.sequence, header.flags, header.fragmentIndex };
			fragments.push_back(fragment);
		}
		return false;
	};

	Bytes attack(3 * 1024);
	for(size_t i = 0; i < attack.size(); i++)
		attack[i] = uint8_t(i ^ (i >> 7));

	assert(DEFAULT_MTU == client.endpoint->getConfig().mtu);
	assert(client.endpoint->send(connectionID, attack, true, true, 1));
	network.run(0.5);

	assert(3 == fragments.size());
	for(uint8_t i = 0; i < 3; i++)
	{
		assert(i == fragments[i].index);
		assert(uint16_t(fragments[0].sequence + i) == fragments[i].sequence);
		assert(fragments[i].flags & FLAG_RELIABLE);
		assert(bool(fragments[i].flags & FLAG_LAST_FRAGMENT) == (2 == i));
	}

	assert(1 == server.messages.size());
	assert(server.messages[0] == attack);

	ConnectionStats stats;
	assert(client.endpoint->getStats(connectionID, stats));
	assert(0 == stats.inFlight);

	// larger than maxFragBytes
	Bytes huge(MAX_FRAG_BYTES + 1);
	assert(not client.endpoint->send(connectionID, huge, true, true, 1));
}

static void testLargeMessageHonorsWindow()
{
	FakeNetwork network;
	Peer server(&network, "10.0.0.1:5000");
	Peer client(&network, "10.0.0.2:40000");

	uint32_t connectionID = handshake(network, server, client);

	std::map<uint8_t, uint16_t> firstSequence; // fragment index -> sequence of its first transmission
	size_t lastFragments = 0;
	network.filter = [&] (const Address &from, const Address &to, const PacketHeader &header) {
		if((from == client.platform.m_address) and (PACKET_DATA == header.type) and header.hasFlag(FLAG_FRAGMENTED))
		{
			if(not firstSequence.count(header.fragmentIndex))
				firstSequence[header.fragmentIndex] = header.sequence;
			if(header.hasFlag(FLAG_LAST_FRAGMENT))
				lastFragments++;
		}
		return false;
	};

	Bytes big(60 * 1024);
	for(size_t i = 0; i < big.size(); i++)
		big[i] = uint8_t(i * 7);
	size_t count = (big.size() + client.endpoint->getConfig().getMaxFragmentSize() - 1) / client.endpoint->getConfig().getMaxFragmentSize();
	assert(count > 50);

	assert(client.endpoint->send(connectionID, big, true, true, 1));
	assert(client.endpoint->send(connectionID, str("urgent"), true, true, 0)); // may not split the fragment run

	ConnectionStats stats;
	assert(client.endpoint->getStats(connectionID, stats));
	printf("cwnd %.2f inFlight %zu queued %zu\n", stats.cwnd, stats.inFlight, stats.queuedPackets);
	assert(stats.inFlight <= size_t(std::ceil(stats.cwnd)));
	assert(stats.queuedPackets > 0);

	for(int i = 0; (i < 5000) and (server.messages.size() < 2); i++)
	{
		network.run(0.001);
		assert(client.endpoint->getStats(connectionID, stats));
		assert(stats.inFlight <= size_t(std::ceil(stats.cwnd)));
	}

	assert(2 == server.messages.size());
	assert(server.messages[0] == big);
	assert(server.messages[1] == str("urgent"));

	assert(count == firstSequence.size());
	assert(1 == lastFragments);
	for(auto it = firstSequence.begin(); it != firstSequence.end(); it++)
		assert(uint16_t(firstSequence[0] + it->first) == it->second);

	assert(client.endpoint->getStats(connectionID, stats));
	assert(0 == stats.inFlight);
	assert(0 == stats.queuedPackets);
}

static void testOrderedAcrossSequenceWrap()
{
	FakeNetwork network;
	Peer server(&network, "10.0.0.1:5000");
	Peer client(&network, "10.0.0.2:40000");

	uint32_t connectionID = handshake(network, server, client);

	const uint32_t total = 2 * 65536;

	uint32_t received = 0;
	bool inOrder = true;
	server.endpoint->onMessage = [&] (uint32_t id, const uint8_t *bytes, size_t len) {
		uint32_t index = (uint32_t(bytes[0]) << 24) | (uint32_t(bytes[1]) << 16) | (uint32_t(bytes[2]) << 8) | bytes[3];
		if((4 != len) or (index != received))
			inOrder = false;
		received++;
	};

	// lose one data packet in a hundred, retransmissions included
	size_t dataPackets = 0;
	network.filter = [&] (const Address &from, const Address &to, const PacketHeader &header) {
		if((from == client.platform.m_address) and (PACKET_DATA == header.type))
			return 37 == (dataPackets++ % 100);
		return false;
	};

	uint32_t sent = 0;
	ConnectionStats stats;
	while((received < total) and (network.now < 3000))
	{
		assert(client.endpoint->getStats(connectionID, stats));
		while((sent < total) and (stats.queuedPackets < 512))
		{
			uint8_t msg[] = { uint8_t(sent >> 24), uint8_t(sent >> 16), uint8_t(sent >> 8), uint8_t(sent) };
			assert(client.endpoint->send(connectionID, msg, sizeof(msg), true, true, 1));
			sent++;
			stats.queuedPackets++;
		}

		network.run(0.01);
	}

	printf("sent %u received %u at %.1f s\n", sent, received, double(network.now));
	assert(total == sent);
	assert(total == received);
	assert(inOrder);
	assert(client.endpoint->isOpen(connectionID));
	assert(client.closed.empty() and server.closed.empty());

	assert(client.endpoint->getStats(connectionID, stats));
	assert(stats.retransmissions > 0);
}

static void testUnreliableDelivery()
{
	FakeNetwork network;
	Peer server(&network, "10.0.0.1:5000");
	Peer client(&network, "10.0.0.2:40000");

	handshake(network, server, client);
	uint32_t serverConnection = server.established[0];

	for(int i = 0; i < 5; i++)
		assert(server.endpoint->send(serverConnection, str("move"), false, false, 100));
	network.run(0.1);

	assert(5 == client.messages.size());
	assert(client.messages[4] == str("move"));
}

static void testDeny()
{
	FakeNetwork network;
	Peer server(&network, "10.0.0.1:5000");
	Peer client(&network, "10.0.0.2:40000");

	server.endpoint->onConnectRequest = [] (ConnectRequest &request) {
		request.response = str("nope");
		return false;
	};

	uint32_t connectionID = client.endpoint->connect(server.platform.m_address, str("mallory"));
	network.run(0.1);

	assert(1 == client.responses);
	assert(not client.responseAccepted);
	assert(client.response == str("nope"));
	assert(1 == client.closed.size());
	assert(connectionID == client.closed[0]);
	assert(CLOSE_REJECTED == client.closeReasons[0]);
	assert(client.established.empty());

	assert(0 == server.endpoint->getConnectionCount());
	assert(1 == server.endpoint->getStatistics().connectsDenied);
	assert(server.established.empty());
}

static void testServerFull()
{
	FakeNetwork network;
	EndpointConfig config;
	config.maxConnections = 1;
	Peer server(&network, "10.0.0.1:5000", config);
	Peer first(&network, "10.0.0.2:40000");
	Peer second(&network, "10.0.0.3:40000");

	first.endpoint->connect(server.platform.m_address, str("first"));
	network.run(0.1);
	assert(first.responseAccepted);

	second.endpoint->connect(server.platform.m_address, str("second"));
	network.run(0.1);
	assert(1 == second.responses);
	assert(not second.responseAccepted);
	assert(CLOSE_REJECTED == second.closeReasons[0]);
	assert(1 == server.endpoint->getConnectionCount());
}

static void testOrderlyClose()
{
	FakeNetwork network;
	Peer server(&network, "10.0.0.1:5000");
	Peer client(&network, "10.0.0.2:40000");

	uint32_t connectionID = handshake(network, server, client);

	assert(client.endpoint->send(connectionID, str("goodbye"), true, true, 2));
	assert(client.endpoint->close(connectionID));
	assert(S_CLOSING == client.endpoint->getState(connectionID));
	assert(not client.endpoint->send(connectionID, str("too late"), true, true, 2));

	network.run(1);

	assert(1 == server.messages.size());
	assert(server.messages[0] == str("goodbye"));

	assert(1 == client.closed.size());
	assert(CLOSE_NORMAL == client.closeReasons[0]);
	assert(1 == server.closed.size());
	assert(CLOSE_REMOTE == server.closeReasons[0]);
	assert(0 == client.endpoint->getConnectionCount());
	assert(0 == server.endpoint->getConnectionCount());
}

static void testShutdown()
{
	FakeNetwork network;
	Peer server(&network, "10.0.0.1:5000");
	Peer client(&network, "10.0.0.2:40000");
	Peer late(&network, "10.0.0.3:40000");

	handshake(network, server, client);

	server.endpoint->shutdown();
	assert(server.endpoint->isShutdown());
	assert(not server.platform.shutdownComplete);

	network.run(1);

	assert(server.platform.shutdownComplete);
	assert(1 == server.closed.size());
	assert(CLOSE_SHUTDOWN == server.closeReasons[0]);
	assert(1 == client.closed.size());
	assert(CLOSE_REMOTE == client.closeReasons[0]);

	late.endpoint->connect(server.platform.m_address, str("late"));
	network.run(0.1);
	assert(not late.responseAccepted);
	assert(CLOSE_REJECTED == late.closeReasons[0]);
}

static void testGarbageIgnored()
{
	FakeNetwork network;
	Peer server(&network, "10.0.0.1:5000");
	Peer client(&network, "10.0.0.2:40000");

	PacketHeader header;
	header.type = PACKET_DATA;
	header.flags = FLAG_RELIABLE;
	Bytes packet = encodePacket(header, str("hi"));

	Bytes corrupt = packet;
	corrupt.back() ^= 0x01;
	server.endpoint->onReceivePacket(corrupt.data(), corrupt.size(), client.platform.m_address.getSockaddr());
	server.endpoint->onReceivePacket(packet.data(), 3, client.platform.m_address.getSockaddr());

	// well formed, but not a Connect from an unknown address
	server.endpoint->onReceivePacket(packet.data(), packet.size(), client.platform.m_address.getSockaddr());

	const Endpoint::Statistics &stats = server.endpoint->getStatistics();
	assert(1 == stats.badChecksum);
	assert(1 == stats.malformedHeader);
	assert(1 == stats.unknownPeer);
	assert(0 == server.endpoint->getConnectionCount());
}

int main(int argc, char *argv[])
{
	testHandshakeHeartbeatIdle();
	testRetransmissionUnderLoss();
	testFragmentedMessage();
	testLargeMessageHonorsWindow();
	testOrderedAcrossSequenceWrap();
	testUnreliableDelivery();
	testDeny();
	testServerFull();
	testOrderlyClose();
	testShutdown();
	testGarbageIgnored();

	printf("end.\n");

	return 0;
}
