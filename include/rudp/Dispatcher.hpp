#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

// Game rules over decoded messages: handshake admission, movement, combat,
// skills, death and respawn. One Dispatcher is shared by every server shard;
// its player registry is guarded by a mutex that is never held while calling
// the host.

#include <mutex>

#include "rudp.hpp"
#include "Auth.hpp"
#include "Config.hpp"
#include "MessageClassifier.hpp"
#include "RoomManager.hpp"
#include "SkillRules.hpp"

namespace com { namespace arena { namespace game {

// The transport as seen by the Dispatcher. Implementations route a
// connection id to the shard that owns it.
class IGameHost {
public:
	virtual ~IGameHost() {}

	virtual bool sendBytes(uint32_t connectionID, const Bytes &bytes, const DeliveryClass &delivery) = 0;
	virtual void closeConnection(uint32_t connectionID, rudp::CloseReason reason) = 0;
	virtual uint64_t getCurrentTimeMillis() = 0; // monotonic
};

// Fire and forget. Called without any Dispatcher lock held.
class IPersistence {
public:
	virtual ~IPersistence() {}
	virtual void saveSnapshot(const UserState &state) = 0;
};

struct PlayerRecord {
	PlayerID     playerID { 0 };
	uint32_t     connectionID { 0 };
	std::string  name;
	RoomID       roomID { 0 };
	uint32_t     mana { 100 };
	uint32_t     maxMana { 100 };
	PlayerStatus status { STATUS_ALIVE };
	uint32_t     attackPower { 10 };
	uint32_t     defense { 5 };
	float        movementSpeed { 5 };
	uint64_t     respawnEligibleAt { 0 };
	bool         hasBroadcastMove { false };
	uint64_t     lastMoveBroadcast { 0 };
	std::map<uint32_t, uint64_t> skillCooldowns;  // skill id -> ready at (ms)
	std::map<int, uint64_t>      attackCooldowns; // AttackType::Kind -> ready at (ms)
};

class Dispatcher {
public:
	static const uint64_t DEFAULT_ATTACK_COOLDOWN_MS[];
	static const float    ATTACK_RANGE_UNIT;       // 5
	static const float    ATTACK_RANGE_FACTOR[];   // by AttackType::Kind
	static const float    AOE_RADIUS;              // 4 * ATTACK_RANGE_UNIT
	static const uint32_t WEAPON_BONUS = 10;

	Dispatcher(IGameHost *host, RoomManager *rooms, SkillRuleBook *skills, IAuthenticator *auth,
		const ServerConfig &config, IPersistence *persistence = nullptr);
	Dispatcher(const Dispatcher&) = delete;
	Dispatcher& operator= (const Dispatcher&) = delete;

	// For Endpoint::onConnectRequest. payload is the client's encoded Connect.
	// Answers true to admit, with response set to the encoded ConnectResponse
	// either way. A denial keeps no state.
	bool handleConnectRequest(uint32_t connectionID, const uint8_t *payload, size_t len, bool serverFull, Bytes &response);

	void onMessage(uint32_t connectionID, const uint8_t *bytes, size_t len);
	void onMessage(uint32_t connectionID, const GameMessage &msg);

	// The transport connection is gone: leave the room, drop the record and
	// persist a snapshot.
	void onConnectionClosed(uint32_t connectionID);

	bool send(uint32_t connectionID, const GameMessage &msg);
	void broadcast(RoomID room, const GameMessage &msg);
	void broadcast(RoomID room, const GameMessage &msg, PlayerID exclude);
	void broadcastNotice(const ServerNoticeMessage &notice); // every room
	void broadcastNotice(RoomID room, const ServerNoticeMessage &notice);
	void close(uint32_t connectionID, rudp::CloseReason reason);

	// Drop users idle longer than the configured timeout and close their
	// connections. Answers how many were removed.
	size_t reapIdle(uint64_t now);

	bool   findPlayer(PlayerID playerID, PlayerRecord &dst) const;
	bool   playerForConnection(uint32_t connectionID, PlayerID &dst) const;
	bool   isPlayer(PlayerID playerID) const;
	size_t playerCount() const;

	static uint32_t computeDamage(uint32_t attackPower, bool hasWeapon, uint32_t defense);
	static uint32_t respawnCooldownSeconds(uint32_t level);

protected:
	void fillDenial(ConnectResponseMessage &dst, ErrorCode code, const std::string &detail) const;
	void fillWelcome(ConnectResponseMessage &dst, const PlayerRecord &record, const UserState &user) const;
	PlayerState playerState(const PlayerRecord &record, const UserState &user) const;

	void sendError(uint32_t connectionID, ErrorCode code, const std::string &detail);
	void removePlayer(uint32_t connectionID, bool persist);

	void onConnect(uint32_t connectionID, PlayerID playerID);
	void onMove(uint32_t connectionID, PlayerID playerID, const MoveMessage &msg);
	void onAttack(uint32_t connectionID, PlayerID playerID, const AttackMessage &msg);
	void onSkill(uint32_t connectionID, PlayerID playerID, uint32_t skillID, bool hasTargetPlayer, PlayerID targetPlayer,
		bool hasTargetPosition, const Position &targetPosition);
	void onDie(uint32_t connectionID, PlayerID playerID, const DieMessage &msg);
	void onRespawn(uint32_t connectionID, PlayerID playerID, const RespawnMessage &msg);
	void onDisconnect(uint32_t connectionID, PlayerID playerID, const DisconnectMessage &msg);

	// Subtract damage from target's health. Answers false if the target is not
	// in room. killed is set if this took health to zero.
	bool applyDamage(RoomID room, PlayerID target, uint32_t damage, uint32_t &remaining, bool &killed);
	bool applyHealing(RoomID room, PlayerID target, uint32_t healing, uint32_t &remaining);
	void die(PlayerID playerID, const DeathCause &cause, bool hasKiller, PlayerID killer);
	bool isAlive(PlayerID playerID) const;
	void sendStateUpdate(RoomID room, PlayerID playerID, const std::map<std::string, StateValue> &changes);

	IGameHost      *m_host;
	RoomManager    *m_rooms;
	SkillRuleBook  *m_skills;
	IAuthenticator *m_auth;
	ServerConfig    m_config;
	IPersistence   *m_persistence;

	mutable std::mutex                 m_mutex;
	std::map<PlayerID, PlayerRecord>   m_players;
	std::map<uint32_t, PlayerID>       m_playerByConnection;
};

} } } // namespace com::arena::game
