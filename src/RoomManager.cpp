// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <chrono>

#include "../include/rudp/RoomManager.hpp"

namespace com { namespace arena { namespace game {

RoomManager::RoomManager(const std::function<uint64_t(void)> &clock) :
	m_clock(clock)
{
	if(not m_clock)
		m_clock = [] {
			return uint64_t(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now().time_since_epoch()).count());
		};
}

uint64_t RoomManager::getCurrentTimeMillis() const
{
	return m_clock();
}

RoomManager::Shard & RoomManager::shardFor(RoomID room)
{
	return m_shards[room % SHARD_COUNT];
}

const RoomManager::Shard & RoomManager::shardFor(RoomID room) const
{
	return m_shards[room % SHARD_COUNT];
}

std::shared_ptr<RoomManager::Room> RoomManager::findRoom(RoomID room) const
{
	const Shard &shard = shardFor(room);
	std::unique_lock<std::mutex> l(shard.m_mutex);
	auto it = shard.m_rooms.find(room);
	if(it == shard.m_rooms.end())
		return std::shared_ptr<Room>();
	return it->second;
}

void RoomManager::join(RoomID room, const UserState &user)
{
	std::unique_lock<std::mutex> il(m_indexMutex);

	auto indexIt = m_index.find(user.userID);
	if((indexIt != m_index.end()) and (indexIt->second != room))
		removeFromRoom(indexIt->second, user.userID);

	Shard &shard = shardFor(room);
	std::unique_lock<std::mutex> sl(shard.m_mutex);

	auto &roomPtr = shard.m_rooms[room];
	if(not roomPtr)
		roomPtr = std::make_shared<Room>();

	std::unique_lock<std::mutex> rl(roomPtr->m_mutex);
	UserState &state = roomPtr->m_users[user.userID];
	state = user;
	state.roomID = room;
	state.lastUpdated = m_clock();

	m_index[user.userID] = room;
}

bool RoomManager::removeFromRoom(RoomID room, PlayerID user)
{
	Shard &shard = shardFor(room);
	std::unique_lock<std::mutex> sl(shard.m_mutex);

	auto it = shard.m_rooms.find(room);
	if(it == shard.m_rooms.end())
		return false;

	Room &r = *it->second;
	std::unique_lock<std::mutex> rl(r.m_mutex);
	if(0 == r.m_users.erase(user))
		return false;
	if(r.m_users.empty())
		r.m_emptySince = m_clock();
	return true;
}

bool RoomManager::leave(RoomID room, PlayerID user)
{
	std::unique_lock<std::mutex> il(m_indexMutex);

	auto indexIt = m_index.find(user);
	if((indexIt == m_index.end()) or (indexIt->second != room))
		return false;

	m_index.erase(indexIt);
	return removeFromRoom(room, user);
}

bool RoomManager::leaveAny(PlayerID user, RoomID *fromRoom)
{
	std::unique_lock<std::mutex> il(m_indexMutex);

	auto indexIt = m_index.find(user);
	if(indexIt == m_index.end())
		return false;

	RoomID room = indexIt->second;
	m_index.erase(indexIt);
	if(fromRoom)
		*fromRoom = room;
	return removeFromRoom(room, user);
}

bool RoomManager::update(RoomID room, PlayerID user, const std::function<void(UserState &)> &mutator)
{
	auto r = findRoom(room);
	if(not r)
		return false;

	std::unique_lock<std::mutex> rl(r->m_mutex);
	auto it = r->m_users.find(user);
	if(it == r->m_users.end())
		return false;

	if(mutator)
		mutator(it->second);
	it->second.userID = user;
	it->second.roomID = room;
	it->second.lastUpdated = m_clock();
	return true;
}

bool RoomManager::find(RoomID room, PlayerID user, UserState &dst) const
{
	auto r = findRoom(room);
	if(not r)
		return false;

	std::unique_lock<std::mutex> rl(r->m_mutex);
	auto it = r->m_users.find(user);
	if(it == r->m_users.end())
		return false;

	dst = it->second;
	return true;
}

std::vector<PlayerID> RoomManager::broadcastTargets(RoomID room) const
{
	std::vector<PlayerID> rv;
	auto r = findRoom(room);
	if(not r)
		return rv;

	std::unique_lock<std::mutex> rl(r->m_mutex);
	for(auto it = r->m_users.begin(); it != r->m_users.end(); it++)
		if(it->second.connected)
			rv.push_back(it->first);
	return rv;
}

std::vector<PlayerID> RoomManager::broadcastTargets(RoomID room, PlayerID exclude) const
{
	std::vector<PlayerID> rv = broadcastTargets(room);
	for(auto it = rv.begin(); it != rv.end(); it++)
	{
		if(*it == exclude)
		{
			rv.erase(it);
			break;
		}
	}
	return rv;
}

std::vector<UserState> RoomManager::snapshot(RoomID room) const
{
	std::vector<UserState> rv;
	auto r = findRoom(room);
	if(not r)
		return rv;

	std::unique_lock<std::mutex> rl(r->m_mutex);
	for(auto it = r->m_users.begin(); it != r->m_users.end(); it++)
		rv.push_back(it->second);
	return rv;
}

bool RoomManager::roomOf(PlayerID user, RoomID &dst) const
{
	std::unique_lock<std::mutex> il(m_indexMutex);
	auto it = m_index.find(user);
	if(it == m_index.end())
		return false;
	dst = it->second;
	return true;
}

std::vector<UserState> RoomManager::reapIdle(uint64_t now, uint64_t timeoutMs)
{
	std::vector<UserState> rv;
	std::unique_lock<std::mutex> il(m_indexMutex);

	for(size_t i = 0; i < SHARD_COUNT; i++)
	{
		Shard &shard = m_shards[i];
		std::unique_lock<std::mutex> sl(shard.m_mutex);

		for(auto roomIt = shard.m_rooms.begin(); roomIt != shard.m_rooms.end(); )
		{
			Room &r = *roomIt->second;
			bool removedAny = false;
			bool leftEmpty;
			{
				std::unique_lock<std::mutex> rl(r.m_mutex);
				for(auto userIt = r.m_users.begin(); userIt != r.m_users.end(); )
				{
					if((now > userIt->second.lastUpdated) and (now - userIt->second.lastUpdated > timeoutMs))
					{
						rv.push_back(userIt->second);
						m_index.erase(userIt->first);
						userIt = r.m_users.erase(userIt);
						removedAny = true;
					}
					else
						userIt++;
				}
				leftEmpty = removedAny and r.m_users.empty();
			}

			if(leftEmpty)
				roomIt = shard.m_rooms.erase(roomIt);
			else
				roomIt++;
		}
	}

	return rv;
}

size_t RoomManager::reapEmptyRooms(uint64_t now, uint64_t intervalMs)
{
	size_t rv = 0;

	for(size_t i = 0; i < SHARD_COUNT; i++)
	{
		Shard &shard = m_shards[i];
		std::unique_lock<std::mutex> sl(shard.m_mutex);

		for(auto roomIt = shard.m_rooms.begin(); roomIt != shard.m_rooms.end(); )
		{
			Room &r = *roomIt->second;
			bool expired;
			{
				std::unique_lock<std::mutex> rl(r.m_mutex);
				expired = r.m_users.empty() and (now >= r.m_emptySince) and (now - r.m_emptySince >= intervalMs);
			}

			if(expired)
			{
				roomIt = shard.m_rooms.erase(roomIt);
				rv++;
			}
			else
				roomIt++;
		}
	}

	return rv;
}

size_t RoomManager::roomCount() const
{
	size_t rv = 0;
	for(size_t i = 0; i < SHARD_COUNT; i++)
	{
		std::unique_lock<std::mutex> sl(m_shards[i].m_mutex);
		rv += m_shards[i].m_rooms.size();
	}
	return rv;
}

size_t RoomManager::userCount() const
{
	std::unique_lock<std::mutex> il(m_indexMutex);
	return m_index.size();
}

} } } // namespace com::arena::game
