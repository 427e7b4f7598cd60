#include <algorithm>
#include <cassert>
#include <cstdio>
#include <thread>

#include "rudp/RoomManager.hpp"

using namespace com::arena::game;

namespace {

uint64_t clockMillis = 1000;

UserState user(PlayerID id, const char *name)
{
	UserState rv;
	rv.userID = id;
	rv.name = name;
	return rv;
}

bool contains(const std::vector<PlayerID> &ids, PlayerID id)
{
	return ids.end() != std::find(ids.begin(), ids.end(), id);
}

}

static void testMembership()
{
	RoomManager rooms([] { return clockMillis; });

	rooms.join(42, user(1, "alice"));
	rooms.join(42, user(2, "bob"));
	rooms.join(7, user(3, "carol"));
	assert(2 == rooms.roomCount());
	assert(3 == rooms.userCount());

	UserState found;
	assert(rooms.find(42, 1, found));
	assert(("alice" == found.name) and (42 == found.roomID) and (1000 == found.lastUpdated));
	assert(not rooms.find(7, 1, found));

	RoomID room = 0;
	assert(rooms.roomOf(3, room) and (7 == room));
	assert(not rooms.roomOf(99, room));

	// joining another room leaves the first
	rooms.join(7, user(2, "bob"));
	assert(rooms.roomOf(2, room) and (7 == room));
	assert(1 == rooms.snapshot(42).size());
	assert(2 == rooms.snapshot(7).size());
	assert(3 == rooms.userCount());

	assert(not rooms.leave(42, 2)); // not in 42 any more
	assert(rooms.leave(7, 2));
	assert(not rooms.leave(7, 2));

	RoomID from = 0;
	assert(rooms.leaveAny(3, &from) and (7 == from));
	assert(not rooms.leaveAny(3));
	assert(1 == rooms.userCount());
	assert(rooms.snapshot(7).empty());
}

static void testUpdateAndTargets()
{
	RoomManager rooms([] { return clockMillis; });

	rooms.join(1, user(10, "a"));
	rooms.join(1, user(11, "b"));
	rooms.join(1, user(12, "c"));

	clockMillis = 2000;
	assert(rooms.update(1, 11, [] (UserState &state) {
		state.position = Position(1, 2, 3);
		state.health = 50;
		state.userID = 999; // identity is restored
	}));
	assert(not rooms.update(2, 11, nullptr));
	assert(not rooms.update(1, 99, nullptr));

	UserState found;
	assert(rooms.find(1, 11, found));
	assert((11 == found.userID) and (1 == found.roomID));
	assert((50 == found.health) and (found.position == Position(1, 2, 3)));
	assert(2000 == found.lastUpdated);

	auto all = rooms.broadcastTargets(1);
	assert(3 == all.size());

	auto others = rooms.broadcastTargets(1, 10);
	assert(2 == others.size());
	assert(contains(others, 11) and contains(others, 12) and not contains(others, 10));

	rooms.update(1, 12, [] (UserState &state) { state.connected = false; });
	others = rooms.broadcastTargets(1, 10);
	assert((1 == others.size()) and (11 == others[0]));

	assert(rooms.broadcastTargets(77).empty());
}

static void testReaping()
{
	clockMillis = 10000;
	RoomManager rooms([] { return clockMillis; });

	rooms.join(5, user(1, "stale"));
	rooms.join(6, user(2, "stale too"));
	rooms.join(6, user(3, "fresh"));

	clockMillis = 40000;
	rooms.update(6, 3, nullptr);

	clockMillis = 45000;
	auto removed = rooms.reapIdle(clockMillis, 30000);
	assert(2 == removed.size());
	assert(1 == rooms.userCount());
	RoomID room;
	assert(not rooms.roomOf(1, room));
	assert(rooms.roomOf(3, room) and (6 == room));
	assert(1 == rooms.roomCount()); // room 5 was left empty by the reap

	// an emptied room survives until it has been empty for the interval
	clockMillis = 50000;
	assert(rooms.leave(6, 3));
	assert(0 == rooms.reapEmptyRooms(clockMillis + 59999, 60000));
	assert(1 == rooms.roomCount());
	assert(1 == rooms.reapEmptyRooms(clockMillis + 60000, 60000));
	assert(0 == rooms.roomCount());
}

static void testConcurrentJoins()
{
	RoomManager rooms;
	std::vector<std::thread> threads;

	for(int t = 0; t < 4; t++)
		threads.push_back(std::thread([&rooms, t] {
			for(PlayerID i = 0; i < 500; i++)
			{
				PlayerID id = t * 1000 + i + 1;
				rooms.join(i % 20, user(id, "p"));
				rooms.update(i % 20, id, [] (UserState &state) { state.level++; });
				if(i % 3 == 0)
					rooms.join((i + 1) % 20, user(id, "p"));
				if(i % 5 == 0)
					rooms.leaveAny(id);
			}
		}));

	for(auto it = threads.begin(); it != threads.end(); it++)
		it->join();

	size_t total = 0;
	for(RoomID r = 0; r < 20; r++)
		total += rooms.snapshot(r).size();
	assert(total == rooms.userCount());
	assert(4 * 400 == total);
}

int main(int argc, char *argv[])
{
	testMembership();
	testUpdateAndTargets();
	testReaping();
	testConcurrentJoins();

	printf("end.\n");

	return 0;
}
