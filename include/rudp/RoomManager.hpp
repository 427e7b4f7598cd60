#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

// Room membership shared by all server shards. The room table is split into
// shards each with its own mutex, each room has its own mutex, and the
// user-to-room index has another. Lock order is index, then shard, then room.

#include <functional>
#include <map>
#include <mutex>

#include "GameMessage.hpp"

namespace com { namespace arena { namespace game {

struct UserState {
	PlayerID    userID { 0 };
	RoomID      roomID { 0 };
	std::string name;
	Position    position;
	uint32_t    health { 100 };
	uint32_t    maxHealth { 100 };
	uint32_t    level { 1 };
	uint64_t    lastUpdated { 0 }; // ms, server monotonic clock
	bool        connected { true };
	std::map<std::string, StateValue> gameData;
};

class RoomManager {
public:
	static const size_t SHARD_COUNT = 16;

	// clock answers milliseconds; defaults to the steady clock.
	RoomManager(const std::function<uint64_t(void)> &clock = nullptr);
	RoomManager(const RoomManager&) = delete;
	RoomManager& operator= (const RoomManager&) = delete;

	// Place user in room (created on demand), leaving any other room first.
	// A user already in room has its state replaced.
	void join(RoomID room, const UserState &user);

	bool leave(RoomID room, PlayerID user);
	bool leaveAny(PlayerID user, RoomID *fromRoom = nullptr);

	// Apply mutator to the user's state under the room lock and refresh
	// lastUpdated. Answers false if the user is not in room.
	bool update(RoomID room, PlayerID user, const std::function<void(UserState &)> &mutator);

	bool find(RoomID room, PlayerID user, UserState &dst) const;

	// Connected users only.
	std::vector<PlayerID> broadcastTargets(RoomID room) const;
	std::vector<PlayerID> broadcastTargets(RoomID room, PlayerID exclude) const;

	std::vector<UserState> snapshot(RoomID room) const;
	bool roomOf(PlayerID user, RoomID &dst) const;

	// Remove users not updated within timeoutMs of now, and the rooms they
	// leave empty. Answers the removed users.
	std::vector<UserState> reapIdle(uint64_t now, uint64_t timeoutMs);

	// Remove rooms that have been empty for at least intervalMs. Answers the
	// number removed.
	size_t reapEmptyRooms(uint64_t now, uint64_t intervalMs);

	size_t roomCount() const;
	size_t userCount() const;

	uint64_t getCurrentTimeMillis() const;

protected:
	struct Room {
		mutable std::mutex               m_mutex;
		std::map<PlayerID, UserState>    m_users;
		uint64_t                         m_emptySince { 0 };
	};

	struct Shard {
		mutable std::mutex                        m_mutex;
		std::map<RoomID, std::shared_ptr<Room> >  m_rooms;
	};

	Shard       &shardFor(RoomID room);
	const Shard &shardFor(RoomID room) const;
	std::shared_ptr<Room> findRoom(RoomID room) const;
	bool removeFromRoom(RoomID room, PlayerID user); // index lock held

	std::function<uint64_t(void)>   m_clock;
	Shard                           m_shards[SHARD_COUNT];
	mutable std::mutex              m_indexMutex;
	std::map<PlayerID, RoomID>      m_index;
};

} } } // namespace com::arena::game
