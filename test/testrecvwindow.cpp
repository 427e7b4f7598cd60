#include <cassert>
#include <cstdio>
#include <cstring>

#include "rudp/RecvWindow.hpp"
#include "rudp/packet.hpp"

using namespace com::arena;
using namespace com::arena::rudp;

namespace {

std::vector<uint16_t> delivered;
std::vector<Bytes> payloads;

void deliver(uint8_t type, uint16_t sequence, uint8_t flags, uint8_t fragmentIndex, const uint8_t *bytes, size_t len)
{
	delivered.push_back(sequence);
	payloads.push_back(Bytes(bytes, bytes + len));
}

RecvWindow::Disposition receive(RecvWindow &window, uint16_t sequence, uint8_t flags = FLAG_RELIABLE | FLAG_ORDERED)
{
	uint8_t payload[2] = { uint8_t(sequence >> 8), uint8_t(sequence) };
	return window.receive(PACKET_DATA, sequence, flags, 0, payload, sizeof(payload), deliver);
}

void reset()
{
	delivered.clear();
	payloads.clear();
}

}

static void testOrderedDelivery()
{
	reset();
	RecvWindow window(RECEIVE_WINDOW, 10);

	assert(RecvWindow::ACCEPTED == receive(window, 10));
	assert(RecvWindow::ACCEPTED == receive(window, 12));
	assert(RecvWindow::ACCEPTED == receive(window, 13));
	assert(1 == delivered.size());
	assert(2 == window.getHeldCount());
	assert(2 == window.getOutOfOrderCount());
	assert(10 == window.getCumulativeAck());
	assert(0x6 == window.getSelectiveAckBitmap()); // 12 and 13 beyond the ack

	assert(RecvWindow::ACCEPTED == receive(window, 11));

	assert(4 == delivered.size());
	assert(10 == delivered[0]);
	assert(11 == delivered[1]);
	assert(12 == delivered[2]);
	assert(13 == delivered[3]);
	assert(12 == payloads[2][1]); // held payload survived
	assert(13 == window.getCumulativeAck());
	assert(0 == window.getHeldCount());
	assert(0 == window.getOutOfOrderCount());
	assert(0 == window.getSelectiveAckBitmap());

	assert(RecvWindow::DUPLICATE == receive(window, 12));
	assert(RecvWindow::DUPLICATE == receive(window, 13));
	assert(4 == delivered.size());
}

static void testUnorderedDeliveredAtOnce()
{
	reset();
	RecvWindow window(RECEIVE_WINDOW, 0);

	assert(RecvWindow::ACCEPTED == receive(window, 2, FLAG_RELIABLE));
	assert(1 == delivered.size());
	assert(2 == delivered[0]);
	assert(0xffff == window.getCumulativeAck());

	assert(RecvWindow::DUPLICATE == receive(window, 2, FLAG_RELIABLE));

	// an ordered packet behind a hole waits even though 2 was delivered
	assert(RecvWindow::ACCEPTED == receive(window, 1));
	assert(1 == delivered.size());

	assert(RecvWindow::ACCEPTED == receive(window, 0, FLAG_RELIABLE));
	assert(3 == delivered.size());
	assert(0 == delivered[1]);
	assert(1 == delivered[2]);
	assert(2 == window.getCumulativeAck());
}

static void testWrap()
{
	reset();
	RecvWindow window(RECEIVE_WINDOW, 0xfffe);

	assert(RecvWindow::ACCEPTED == receive(window, 0));
	assert(RecvWindow::ACCEPTED == receive(window, 0xffff));
	assert(RecvWindow::ACCEPTED == receive(window, 0xfffe));

	assert(3 == delivered.size());
	assert(0xfffe == delivered[0]);
	assert(0xffff == delivered[1]);
	assert(0 == delivered[2]);
	assert(0 == window.getCumulativeAck());
	assert(1 == window.getExpected());
}

static void testWindowEdge()
{
	reset();
	RecvWindow window(256, 0);

	// expected is 0, so 255 is the last sequence that fits
	assert(RecvWindow::ACCEPTED == receive(window, 255));
	assert(RecvWindow::OVERFLOW == receive(window, 256));
	assert(0 == delivered.size());

	for(uint16_t seq = 0; seq < 255; seq++)
		assert(RecvWindow::ACCEPTED == receive(window, seq));

	assert(256 == delivered.size());
	assert(255 == window.getCumulativeAck());
	assert(RecvWindow::ACCEPTED == receive(window, 256));
	assert(RecvWindow::ACCEPTED == receive(window, 511));
	assert(RecvWindow::OVERFLOW == receive(window, 512));
}

int main(int argc, char *argv[])
{
	testOrderedDelivery();
	testUnorderedDeliveredAtOnce();
	testWrap();
	testWindowEdge();

	printf("end.\n");

	return 0;
}
