#include <cassert>
#include <cstdio>

#include "rudp/SendWindow.hpp"
#include "rudp/DuplicateWindow.hpp"

using namespace com::arena;
using namespace com::arena::rudp;

static void testCumulativeAck()
{
	SendWindow window(0xfffe);
	Bytes payload(100, 'x');

	assert(0xfffe == window.add(PACKET_DATA, FLAG_RELIABLE, 0, payload, 1.0, 1.0)->sequence);
	assert(0xffff == window.add(PACKET_DATA, FLAG_RELIABLE, 0, payload, 1.0, 1.0)->sequence);
	assert(0 == window.add(PACKET_DATA, FLAG_RELIABLE, 0, payload, 1.0, 1.0)->sequence);
	assert(3 == window.getInFlight());
	assert(300 == window.getInFlightBytes());
	assert(1 == window.getNextSequence());

	SendWindow::AckResult result;
	window.onCumulativeAck(0xffff, 1.25, result);
	assert(2 == result.newlyAcked);
	assert(200 == result.ackedBytes);
	assert(result.haveRttSample);
	assert(0.25 == result.rttSample);
	assert(1 == window.getInFlight());
	assert(1 == window.getSpan());
	assert(window.isOutstanding(0));
	assert(not window.isOutstanding(0xffff));

	// the same ack again while data is outstanding
	SendWindow::AckResult again;
	window.onCumulativeAck(0xffff, 1.3, again);
	assert(0 == again.newlyAcked);
	assert(again.duplicate);

	// acknowledging something never sent changes nothing
	SendWindow::AckResult bogus;
	window.onCumulativeAck(5, 1.3, bogus);
	assert(0 == bogus.newlyAcked);
	assert(1 == window.getInFlight());
}

static void testRetransmittedNotSampled()
{
	SendWindow window(42);
	Bytes payload(10, 'a');

	SendEntry *entry = window.add(PACKET_DATA, FLAG_RELIABLE, 0, payload, 0.0, 1.0);
	assert(42 == entry->sequence);

	// first transmission lost, retransmitted at now + RTO
	entry->retries++;
	entry->lastSent = 1.0;

	SendWindow::AckResult result;
	window.onCumulativeAck(42, 1.1, result);
	assert(1 == result.newlyAcked);
	assert(not result.haveRttSample);
	assert(0 == window.getInFlight());
	assert(nullptr == window.find(42));

	// acked exactly once
	SendWindow::AckResult again;
	window.onCumulativeAck(42, 1.2, again);
	assert(0 == again.newlyAcked);
}

static void testSelectiveAck()
{
	SendWindow window(100);
	Bytes payload(10, 'b');

	for(int i = 0; i < 5; i++)
		window.add(PACKET_DATA, FLAG_RELIABLE, 0, payload, 0, 1.0);

	assert(nullptr == window.firstHole());

	// 100 received cumulatively, 102 and 104 selectively
	SendWindow::AckResult result;
	window.onCumulativeAck(100, 0.5, result);
	window.onSelectiveAck(100, 0xa, 0.5, result);
	assert(3 == result.newlyAcked);
	assert(2 == window.getInFlight());
	assert(window.isOutstanding(101));
	assert(not window.isOutstanding(102));
	assert(window.isOutstanding(103));

	SendEntry *hole = window.firstHole();
	assert(hole and (101 == hole->sequence));
	assert(101 == window.firstUnacked()->sequence);

	SendWindow::AckResult rest;
	window.onCumulativeAck(104, 0.6, rest);
	assert(2 == rest.newlyAcked);
	assert(0 == window.getSpan());
	assert(105 == window.getNextSequence());
}

static void testDuplicateWindow()
{
	DuplicateWindow window(64);

	assert(not window.contains(5));
	assert(window.check(5));
	assert(not window.check(5));
	assert(window.contains(5));

	assert(window.check(7));
	assert(window.check(6)); // late but unseen
	assert(not window.check(6));

	assert(window.check(100));
	assert(not window.check(5)); // too old to tell, treated as seen
	assert(window.contains(5));
	assert(not window.contains(101));

	window.reset();
	assert(not window.contains(100));

	// wrap
	assert(window.check(0xfffe));
	assert(window.check(1));
	assert(window.check(0xffff));
	assert(not window.check(0xffff));
	assert(window.contains(0xfffe));
	assert(not window.contains(0));
}

int main(int argc, char *argv[])
{
	testCumulativeAck();
	testRetransmittedNotSampled();
	testSelectiveAck();
	testDuplicateWindow();

	printf("end.\n");

	return 0;
}
