// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>

#include "../include/rudp/Dispatcher.hpp"
#include "../include/rudp/Log.hpp"

namespace com { namespace arena { namespace game {

const uint64_t Dispatcher::DEFAULT_ATTACK_COOLDOWN_MS[] = { 1000, 3000, 1500, 2000, 5000, 0 };
const float    Dispatcher::ATTACK_RANGE_UNIT = 5;
const float    Dispatcher::ATTACK_RANGE_FACTOR[] = { 1, 1, 3, 2, 1.5, 1 };
const float    Dispatcher::AOE_RADIUS = 4 * Dispatcher::ATTACK_RANGE_UNIT;
const uint32_t Dispatcher::WEAPON_BONUS;

namespace {

size_t utf8Length(const std::string &s)
{
	size_t rv = 0;
	for(auto it = s.begin(); it != s.end(); it++)
		if((uint8_t(*it) & 0xc0) != 0x80)
			rv++;
	return rv;
}

std::string majorVersion(const std::string &version)
{
	return version.substr(0, version.find('.'));
}

}

Dispatcher::Dispatcher(IGameHost *host, RoomManager *rooms, SkillRuleBook *skills, IAuthenticator *auth,
		const ServerConfig &config, IPersistence *persistence) :
	m_host(host),
	m_rooms(rooms),
	m_skills(skills),
	m_auth(auth),
	m_config(config),
	m_persistence(persistence)
{}

uint32_t Dispatcher::computeDamage(uint32_t attackPower, bool hasWeapon, uint32_t defense)
{
	double base = double(attackPower) + (hasWeapon ? WEAPON_BONUS : 0);
	double mitigation = 1.0 - double(defense) / (double(defense) + 100.0);
	uint32_t rv = uint32_t(base * mitigation);
	return std::max(rv, uint32_t(1));
}

uint32_t Dispatcher::respawnCooldownSeconds(uint32_t level)
{
	return std::min(uint32_t(10) + std::min(level, uint32_t(50)), uint32_t(60));
}

// --- handshake

bool Dispatcher::handleConnectRequest(uint32_t connectionID, const uint8_t *payload, size_t len, bool serverFull, Bytes &response)
{
	ConnectResponseMessage rsp;
	auto msg = GameMessage::decode(payload, len);

	if((not msg) or (MSG_CONNECT != msg->getType()))
	{
		fillDenial(rsp, PROTOCOL_ERROR, "expected a Connect message");
		rsp.encode(response);
		return false;
	}

	const ConnectMessage &connect = static_cast<const ConnectMessage &>(*msg);
	size_t nameLength = utf8Length(connect.playerName);
	bool nameOK = (nameLength >= 3) and (nameLength <= 20);
	bool versionOK = (not connect.clientVersion.empty()) and (majorVersion(connect.clientVersion) == majorVersion(m_config.clientVersion));

	UserRecord user;
	bool authenticated = nameOK and versionOK and m_auth and m_auth->validateToken(connect.authToken, user);

	// a player taking over its own session already holds a slot
	if(serverFull and authenticated and isPlayer(user.userID))
		serverFull = false;

	if(not nameOK)
		fillDenial(rsp, INVALID_NAME, "player name must be 3 to 20 characters");
	else if(not versionOK)
		fillDenial(rsp, VERSION_MISMATCH, "client version " + connect.clientVersion + " is not compatible with " + m_config.clientVersion);
	else if(serverFull)
		fillDenial(rsp, SERVER_FULL, "server is full");
	else if(not authenticated)
		fillDenial(rsp, AUTH_FAILED, "authentication failed");
	else
	{
		uint32_t oldConnectionID = 0;
		bool takeover = false;
		PlayerRecord record;

		{
			std::unique_lock<std::mutex> l(m_mutex);
			auto it = m_players.find(user.userID);
			if(it != m_players.end())
			{
				if(it->second.connectionID != connectionID)
				{
					oldConnectionID = it->second.connectionID;
					m_playerByConnection.erase(oldConnectionID);
					takeover = true;
				}
				it->second.connectionID = connectionID;
				it->second.name = connect.playerName;
				record = it->second;
			}
			else
			{
				record.playerID = user.userID;
				record.connectionID = connectionID;
				record.name = connect.playerName;
				record.roomID = user.roomID ? user.roomID : m_config.defaultRoom;
				m_players[user.userID] = record;
			}
			m_playerByConnection[connectionID] = user.userID;
		}

		UserState state;
		bool resumed = takeover and m_rooms->update(record.roomID, record.playerID, [&] (UserState &u) {
			u.name = connect.playerName;
			u.connected = true;
			state = u;
		});
		if(not resumed)
		{
			state.userID = record.playerID;
			state.name = connect.playerName;
			state.position = m_config.spawnPoint;
			m_rooms->join(record.roomID, state);
			m_rooms->find(record.roomID, record.playerID, state);
		}

		if(takeover)
		{
			log()->info("player {} ({}) taken over by connection {} from {}", record.playerID, record.name, connectionID, oldConnectionID);
			m_host->closeConnection(oldConnectionID, rudp::CLOSE_NORMAL);
		}
		else
			log()->info("player {} ({}) joined room {} on connection {}", record.playerID, record.name, record.roomID, connectionID);

		fillWelcome(rsp, record, state);
		rsp.encode(response);
		return true;
	}

	log()->debug("connection {} denied: {}", connectionID, rsp.message);
	rsp.encode(response);
	return false;
}

void Dispatcher::fillDenial(ConnectResponseMessage &dst, ErrorCode code, const std::string &detail) const
{
	dst.success = false;
	dst.hasPlayerID = false;
	dst.hasSpawnPosition = false;
	dst.hasInitialState = false;
	dst.hasServerSettings = false;
	dst.message = std::string(errorCodeName(code)) + ": " + detail;
}

void Dispatcher::fillWelcome(ConnectResponseMessage &dst, const PlayerRecord &record, const UserState &user) const
{
	dst.success = true;
	dst.hasPlayerID = true;
	dst.playerID = record.playerID;
	dst.hasSpawnPosition = true;
	dst.spawnPosition = user.position;
	dst.hasInitialState = true;
	dst.initialState = playerState(record, user);
	dst.message = "welcome, " + record.name;
	dst.hasServerSettings = true;
	dst.serverSettings = m_config.toServerSettings();
}

PlayerState Dispatcher::playerState(const PlayerRecord &record, const UserState &user) const
{
	PlayerState rv;

	rv.health = user.health;
	rv.maxHealth = user.maxHealth;
	rv.mana = record.mana;
	rv.maxMana = record.maxMana;
	rv.position = user.position;
	rv.movementSpeed = record.movementSpeed;
	rv.attackPower = record.attackPower;
	rv.defense = record.defense;
	rv.level = user.level;
	rv.status = record.status;

	return rv;
}

// --- dispatch

void Dispatcher::onMessage(uint32_t connectionID, const uint8_t *bytes, size_t len)
{
	auto msg = GameMessage::decode(bytes, len);
	if(not msg)
	{
		log()->debug("undecodable {} byte message from connection {}", len, connectionID);
		sendError(connectionID, PROTOCOL_ERROR, "undecodable message");
		return;
	}

	onMessage(connectionID, *msg);
}

void Dispatcher::onMessage(uint32_t connectionID, const GameMessage &msg)
{
	PlayerID playerID;
	if(not playerForConnection(connectionID, playerID))
	{
		log()->debug("{} from connection {} with no player", messageTypeName(msg.getType()), connectionID);
		return;
	}

	if(msg.isServerOnly())
	{
		sendError(connectionID, UNKNOWN_MESSAGE, std::string(messageTypeName(msg.getType())) + " is not accepted from clients");
		return;
	}

	switch(msg.getType())
	{
	case MSG_CONNECT:
		onConnect(connectionID, playerID);
		break;

	case MSG_MOVE:
		onMove(connectionID, playerID, static_cast<const MoveMessage &>(msg));
		break;

	case MSG_ATTACK:
		onAttack(connectionID, playerID, static_cast<const AttackMessage &>(msg));
		break;

	case MSG_SKILL:
		{
			const SkillMessage &skill = static_cast<const SkillMessage &>(msg);
			onSkill(connectionID, playerID, skill.skillID, skill.hasTargetPlayer, skill.targetPlayer, skill.hasTargetPosition, skill.targetPosition);
		}
		break;

	case MSG_DIE:
		onDie(connectionID, playerID, static_cast<const DieMessage &>(msg));
		break;

	case MSG_RESPAWN:
		onRespawn(connectionID, playerID, static_cast<const RespawnMessage &>(msg));
		break;

	case MSG_DISCONNECT:
		onDisconnect(connectionID, playerID, static_cast<const DisconnectMessage &>(msg));
		break;

	default:
		sendError(connectionID, UNKNOWN_MESSAGE, messageTypeName(msg.getType()));
		break;
	}
}

void Dispatcher::onConnect(uint32_t connectionID, PlayerID playerID)
{
	PlayerRecord record;
	UserState user;

	if(not findPlayer(playerID, record))
		return;
	m_rooms->find(record.roomID, playerID, user);

	ConnectResponseMessage rsp;
	fillWelcome(rsp, record, user);
	send(connectionID, rsp);
}

void Dispatcher::onMove(uint32_t connectionID, PlayerID playerID, const MoveMessage &msg)
{
	if(not msg.targetPosition.isValid(m_config.worldBounds))
	{
		sendError(connectionID, OUT_OF_RANGE, "position outside the world");
		return;
	}

	uint64_t now = m_host->getCurrentTimeMillis();
	uint64_t interval = 1000 / std::max(m_config.moveBroadcastHz, 1u);
	bool dead = false;
	bool broadcastNow = false;
	PlayerRecord record;

	{
		std::unique_lock<std::mutex> l(m_mutex);
		auto it = m_players.find(playerID);
		if(it == m_players.end())
			return;

		if(STATUS_DEAD == it->second.status)
			dead = true;
		else if((not it->second.hasBroadcastMove) or (now - it->second.lastMoveBroadcast >= interval))
		{
			it->second.hasBroadcastMove = true;
			it->second.lastMoveBroadcast = now;
			broadcastNow = true;
		}
		record = it->second;
	}

	if(dead)
	{
		sendError(connectionID, NOT_ALIVE, "dead players can't move");
		return;
	}

	m_rooms->update(record.roomID, playerID, [&msg] (UserState &u) { u.position = msg.targetPosition; });

	if(broadcastNow)
	{
		float speed = record.movementSpeed * msg.speedMultiplier;
		MoveUpdateMessage update;
		update.playerID = playerID;
		update.currentPosition = msg.targetPosition;
		update.velocity = Velocity(msg.direction.x * speed, msg.direction.y * speed, msg.direction.z * speed);
		update.serverTimestamp = now;
		broadcast(record.roomID, update, playerID);
	}
}

void Dispatcher::onAttack(uint32_t connectionID, PlayerID playerID, const AttackMessage &msg)
{
	if(AttackType::SKILL == msg.attackType.kind)
	{
		bool hasTargetPlayer = AttackTarget::PLAYER == msg.target.kind;
		bool hasTargetPosition = AttackTarget::POSITION == msg.target.kind;
		onSkill(connectionID, playerID, msg.attackType.skillID, hasTargetPlayer, msg.target.id, hasTargetPosition, msg.target.position);
		return;
	}

	int kind = msg.attackType.kind;
	uint64_t now = m_host->getCurrentTimeMillis();
	PlayerRecord attacker;
	ErrorCode error = ERROR_NONE;

	{
		std::unique_lock<std::mutex> l(m_mutex);
		auto it = m_players.find(playerID);
		if(it == m_players.end())
			return;
		attacker = it->second;
	}

	UserState attackerState;
	if(not m_rooms->find(attacker.roomID, playerID, attackerState))
		return;

	float range = ATTACK_RANGE_UNIT * ATTACK_RANGE_FACTOR[kind];
	std::vector<PlayerID> victims;

	if(STATUS_DEAD == attacker.status)
		error = NOT_ALIVE;
	else if(now < attacker.attackCooldowns[kind])
		error = ON_COOLDOWN;
	else if(AttackTarget::PLAYER == msg.target.kind)
	{
		UserState target;
		if( (not m_config.pvpEnabled)
		 or (msg.target.id == playerID)
		 or (not m_rooms->find(attacker.roomID, msg.target.id, target))
		 or (not isAlive(msg.target.id))
		)
			error = INVALID_TARGET;
		else if(attackerState.position.distanceTo(target.position) > range)
			error = OUT_OF_RANGE;
		else
			victims.push_back(msg.target.id);
	}
	else if(AttackTarget::POSITION == msg.target.kind)
	{
		if( (not msg.target.position.isValid(m_config.worldBounds))
		 or (attackerState.position.distanceTo(msg.target.position) > range)
		)
			error = OUT_OF_RANGE;
		else if(m_config.pvpEnabled)
		{
			auto users = m_rooms->snapshot(attacker.roomID);
			for(auto it = users.begin(); it != users.end(); it++)
				if((it->userID != playerID) and (it->position.distanceTo(msg.target.position) <= AOE_RADIUS) and isAlive(it->userID))
					victims.push_back(it->userID);
		}
	}

	if(error)
	{
		sendError(connectionID, error, std::string("attack rejected: ") + errorCodeName(error));
		return;
	}

	{
		std::unique_lock<std::mutex> l(m_mutex);
		auto it = m_players.find(playerID);
		if(it != m_players.end())
			it->second.attackCooldowns[kind] = now + DEFAULT_ATTACK_COOLDOWN_MS[kind];
	}

	if(victims.empty())
	{
		AttackResultMessage result;
		result.attackerID = playerID;
		result.target = msg.target;
		result.attackType = msg.attackType;
		result.hit = false;
		result.serverTimestamp = now;
		broadcast(attacker.roomID, result);
		return;
	}

	for(auto it = victims.begin(); it != victims.end(); it++)
	{
		PlayerRecord victim;
		if(not findPlayer(*it, victim))
			continue;

		uint32_t damage = computeDamage(attacker.attackPower, msg.hasWeaponID, victim.defense);
		uint32_t remaining = 0;
		bool killed = false;
		if(not applyDamage(attacker.roomID, *it, damage, remaining, killed))
			continue;

		AttackResultMessage result;
		result.attackerID = playerID;
		result.target = AttackTarget::player(*it);
		result.attackType = msg.attackType;
		result.hit = true;
		result.damageDealt = damage;
		result.hasTargetHealth = true;
		result.targetHealth = remaining;
		result.serverTimestamp = now;
		broadcast(attacker.roomID, result);

		if(killed)
		{
			DeathCause cause;
			cause.kind = DeathCause::PLAYER_KILL;
			cause.id = playerID;
			die(*it, cause, true, playerID);
		}
	}
}

void Dispatcher::onSkill(uint32_t connectionID, PlayerID playerID, uint32_t skillID, bool hasTargetPlayer, PlayerID targetPlayer,
		bool hasTargetPosition, const Position &targetPosition)
{
	auto table = m_skills ? m_skills->snapshot() : std::shared_ptr<const SkillTable>();
	const SkillDefinition *skill = table ? table->find(skillID) : nullptr;
	if(not skill)
	{
		sendError(connectionID, UNKNOWN_SKILL, "unknown skill " + std::to_string(skillID));
		return;
	}

	uint64_t now = m_host->getCurrentTimeMillis();
	PlayerRecord caster;
	ErrorCode error = ERROR_NONE;

	{
		std::unique_lock<std::mutex> l(m_mutex);
		auto it = m_players.find(playerID);
		if(it == m_players.end())
			return;
		caster = it->second;
	}

	UserState casterState;
	if(not m_rooms->find(caster.roomID, playerID, casterState))
		return;

	bool damages = skill->baseDamage > 0;
	bool heals = skill->baseHealing > 0;
	Position center = casterState.position;
	std::vector<PlayerID> victims;
	PlayerID healTarget = playerID;

	if(STATUS_DEAD == caster.status)
		error = NOT_ALIVE;
	else if(now < caster.skillCooldowns[skillID])
		error = ON_COOLDOWN;
	else if(caster.mana < skill->manaCost)
		error = INSUFFICIENT_MANA;
	else if(hasTargetPlayer)
	{
		UserState target;
		if(targetPlayer == playerID)
		{
			if(damages)
				error = INVALID_TARGET;
		}
		else if( (not m_rooms->find(caster.roomID, targetPlayer, target))
		 or (not isAlive(targetPlayer))
		 or (damages and not m_config.pvpEnabled)
		)
			error = INVALID_TARGET;
		else if(casterState.position.distanceTo(target.position) > skill->range)
			error = OUT_OF_RANGE;
		else
			center = target.position;

		healTarget = targetPlayer;
		if((not error) and damages and not skill->hasAreaOfEffect)
			victims.push_back(targetPlayer);
	}
	else if(hasTargetPosition)
	{
		if((not targetPosition.isValid(m_config.worldBounds)) or (damages and not skill->hasAreaOfEffect))
			error = INVALID_TARGET;
		else if(casterState.position.distanceTo(targetPosition) > skill->range)
			error = OUT_OF_RANGE;
		else
			center = targetPosition;
	}
	else if(damages)
		error = INVALID_TARGET;

	if(error)
	{
		sendError(connectionID, error, std::string(skill->name) + ": " + errorCodeName(error));
		return;
	}

	if(damages and skill->hasAreaOfEffect and m_config.pvpEnabled)
	{
		auto users = m_rooms->snapshot(caster.roomID);
		for(auto it = users.begin(); it != users.end(); it++)
			if((it->userID != playerID) and (it->position.distanceTo(center) <= skill->areaOfEffect) and isAlive(it->userID))
				victims.push_back(it->userID);
	}

	uint32_t casterMana = 0;
	{
		std::unique_lock<std::mutex> l(m_mutex);
		auto it = m_players.find(playerID);
		if(it == m_players.end())
			return;
		it->second.mana -= std::min(it->second.mana, skill->manaCost);
		it->second.skillCooldowns[skillID] = now + skill->cooldownMs;
		casterMana = it->second.mana;
	}

	if((SKILL_TELEPORT == skill->type) and hasTargetPosition)
		m_rooms->update(caster.roomID, playerID, [&targetPosition] (UserState &u) { u.position = targetPosition; });

	AttackType attackType(AttackType::SKILL, skillID);
	uint32_t level = casterState.level;
	bool resulted = false;

	for(auto it = victims.begin(); it != victims.end(); it++)
	{
		uint32_t damage = skill->damageAt(level);
		uint32_t remaining = 0;
		bool killed = false;
		if(not applyDamage(caster.roomID, *it, damage, remaining, killed))
			continue;

		AttackResultMessage result;
		result.attackerID = playerID;
		result.target = AttackTarget::player(*it);
		result.attackType = attackType;
		result.hit = true;
		result.damageDealt = damage;
		result.hasTargetHealth = true;
		result.targetHealth = remaining;
		result.serverTimestamp = now;
		broadcast(caster.roomID, result);
		resulted = true;

		std::map<std::string, StateValue> changes;
		changes["health"] = StateValue(int64_t(remaining));
		sendStateUpdate(caster.roomID, *it, changes);

		if(killed)
		{
			DeathCause cause;
			cause.kind = DeathCause::PLAYER_KILL;
			cause.id = playerID;
			die(*it, cause, true, playerID);
		}
	}

	if(heals)
	{
		uint32_t remaining = 0;
		if(applyHealing(caster.roomID, healTarget, skill->healingAt(level), remaining))
		{
			AttackResultMessage result;
			result.attackerID = playerID;
			result.target = AttackTarget::player(healTarget);
			result.attackType = attackType;
			result.hit = true;
			result.hasTargetHealth = true;
			result.targetHealth = remaining;
			result.serverTimestamp = now;
			broadcast(caster.roomID, result);
			resulted = true;

			std::map<std::string, StateValue> changes;
			changes["health"] = StateValue(int64_t(remaining));
			sendStateUpdate(caster.roomID, healTarget, changes);
		}
	}

	if(not resulted)
	{
		AttackResultMessage result;
		result.attackerID = playerID;
		result.target = hasTargetPlayer ? AttackTarget::player(targetPlayer) : AttackTarget::at(center);
		result.attackType = attackType;
		result.hit = false;
		result.serverTimestamp = now;
		broadcast(caster.roomID, result);
	}

	std::map<std::string, StateValue> changes;
	changes["mana"] = StateValue(int64_t(casterMana));
	sendStateUpdate(caster.roomID, playerID, changes);
}

void Dispatcher::onDie(uint32_t connectionID, PlayerID playerID, const DieMessage &msg)
{
	if(not isAlive(playerID))
	{
		sendError(connectionID, NOT_ALIVE, "already dead");
		return;
	}

	die(playerID, msg.deathCause, msg.hasKillerID, msg.killerID);
}

void Dispatcher::onRespawn(uint32_t connectionID, PlayerID playerID, const RespawnMessage &msg)
{
	uint64_t now = m_host->getCurrentTimeMillis();
	ErrorCode error = ERROR_NONE;
	PlayerRecord record;

	{
		std::unique_lock<std::mutex> l(m_mutex);
		auto it = m_players.find(playerID);
		if(it == m_players.end())
			return;

		if(STATUS_DEAD != it->second.status)
			error = PROTOCOL_ERROR;
		else if(now < it->second.respawnEligibleAt)
			error = ON_COOLDOWN;
		else
		{
			it->second.status = STATUS_ALIVE;
			it->second.mana = it->second.maxMana;
		}
		record = it->second;
	}

	if(error)
	{
		sendError(connectionID, error, PROTOCOL_ERROR == error ? "not dead" : "respawn not yet available");
		return;
	}

	Position spawn = m_config.respawnPoint;
	if(msg.hasPreferredSpawn and msg.preferredSpawn.isValid(m_config.worldBounds))
		spawn = msg.preferredSpawn;

	UserState user;
	m_rooms->update(record.roomID, playerID, [&] (UserState &u) {
		u.health = u.maxHealth;
		u.position = spawn;
		user = u;
	});

	RespawnCompleteMessage complete;
	complete.playerID = playerID;
	complete.spawnPosition = spawn;
	complete.restoredState = playerState(record, user);
	complete.serverTimestamp = now;
	broadcast(record.roomID, complete);
}

void Dispatcher::onDisconnect(uint32_t connectionID, PlayerID playerID, const DisconnectMessage &msg)
{
	log()->info("player {} disconnecting (reason {})", playerID, int(msg.reason));
	removePlayer(connectionID, true);
	m_host->closeConnection(connectionID, rudp::CLOSE_NORMAL);
}

void Dispatcher::onConnectionClosed(uint32_t connectionID)
{
	removePlayer(connectionID, true);
}

void Dispatcher::removePlayer(uint32_t connectionID, bool persist)
{
	PlayerID playerID;
	RoomID roomID;

	{
		std::unique_lock<std::mutex> l(m_mutex);
		auto it = m_playerByConnection.find(connectionID);
		if(it == m_playerByConnection.end())
			return;
		playerID = it->second;
		m_playerByConnection.erase(it);

		auto playerIt = m_players.find(playerID);
		roomID = playerIt == m_players.end() ? 0 : playerIt->second.roomID;
		if(playerIt != m_players.end())
			m_players.erase(playerIt);
	}

	UserState state;
	bool found = m_rooms->find(roomID, playerID, state);
	m_rooms->leave(roomID, playerID);

	log()->info("player {} left room {}", playerID, roomID);

	if(persist and found and m_persistence)
	{
		state.connected = false;
		m_persistence->saveSnapshot(state);
	}
}

// --- combat helpers

bool Dispatcher::applyDamage(RoomID room, PlayerID target, uint32_t damage, uint32_t &remaining, bool &killed)
{
	killed = false;
	return m_rooms->update(room, target, [&] (UserState &u) {
		bool wasAlive = u.health > 0;
		u.health = u.health > damage ? u.health - damage : 0;
		remaining = u.health;
		killed = wasAlive and (0 == u.health);
	});
}

bool Dispatcher::applyHealing(RoomID room, PlayerID target, uint32_t healing, uint32_t &remaining)
{
	return m_rooms->update(room, target, [&] (UserState &u) {
		u.health = uint32_t(std::min(uint64_t(u.health) + healing, uint64_t(u.maxHealth)));
		remaining = u.health;
	});
}

void Dispatcher::die(PlayerID playerID, const DeathCause &cause, bool hasKiller, PlayerID killer)
{
	uint64_t now = m_host->getCurrentTimeMillis();
	PlayerRecord record;
	UserState user;

	if(not findPlayer(playerID, record))
		return;
	m_rooms->find(record.roomID, playerID, user);

	uint32_t cooldown = respawnCooldownSeconds(user.level);

	{
		std::unique_lock<std::mutex> l(m_mutex);
		auto it = m_players.find(playerID);
		if((it == m_players.end()) or (STATUS_DEAD == it->second.status))
			return;
		it->second.status = STATUS_DEAD;
		it->second.respawnEligibleAt = now + uint64_t(cooldown) * 1000;
	}

	m_rooms->update(record.roomID, playerID, [] (UserState &u) { u.health = 0; });

	DieMessage msg;
	msg.playerID = playerID;
	msg.deathCause = cause;
	msg.hasKillerID = hasKiller;
	msg.killerID = hasKiller ? killer : 0;
	msg.deathPosition = user.position;
	msg.respawnCooldown = cooldown;
	msg.deathPenalty.goldLost = 0;
	msg.deathPenalty.durabilityLoss = 0.1f;

	log()->debug("player {} died, respawn in {}s", playerID, cooldown);
	broadcast(record.roomID, msg);
}

bool Dispatcher::isAlive(PlayerID playerID) const
{
	std::unique_lock<std::mutex> l(m_mutex);
	auto it = m_players.find(playerID);
	return (it != m_players.end()) and (STATUS_DEAD != it->second.status);
}

void Dispatcher::sendStateUpdate(RoomID room, PlayerID playerID, const std::map<std::string, StateValue> &changes)
{
	StateUpdateMessage msg;
	msg.playerID = playerID;
	msg.stateChanges = changes;
	msg.serverTimestamp = m_host->getCurrentTimeMillis();
	broadcast(room, msg);
}

// --- output

bool Dispatcher::send(uint32_t connectionID, const GameMessage &msg)
{
	return m_host->sendBytes(connectionID, msg.encode(), classify(msg));
}

void Dispatcher::sendError(uint32_t connectionID, ErrorCode code, const std::string &detail)
{
	ErrorMessage msg(code, detail);
	send(connectionID, msg);
}

void Dispatcher::broadcast(RoomID room, const GameMessage &msg)
{
	std::vector<PlayerID> targets = m_rooms->broadcastTargets(room);
	std::vector<uint32_t> connections;
	Bytes bytes = msg.encode();
	DeliveryClass delivery = classify(msg);

	{
		std::unique_lock<std::mutex> l(m_mutex);
		for(auto it = targets.begin(); it != targets.end(); it++)
		{
			auto playerIt = m_players.find(*it);
			if(playerIt != m_players.end())
				connections.push_back(playerIt->second.connectionID);
		}
	}

	for(auto it = connections.begin(); it != connections.end(); it++)
		m_host->sendBytes(*it, bytes, delivery);
}

void Dispatcher::broadcast(RoomID room, const GameMessage &msg, PlayerID exclude)
{
	std::vector<PlayerID> targets = m_rooms->broadcastTargets(room, exclude);
	std::vector<uint32_t> connections;
	Bytes bytes = msg.encode();
	DeliveryClass delivery = classify(msg);

	{
		std::unique_lock<std::mutex> l(m_mutex);
		for(auto it = targets.begin(); it != targets.end(); it++)
		{
			auto playerIt = m_players.find(*it);
			if(playerIt != m_players.end())
				connections.push_back(playerIt->second.connectionID);
		}
	}

	for(auto it = connections.begin(); it != connections.end(); it++)
		m_host->sendBytes(*it, bytes, delivery);
}

void Dispatcher::broadcastNotice(const ServerNoticeMessage &notice)
{
	std::vector<uint32_t> connections;
	Bytes bytes = notice.encode();
	DeliveryClass delivery = classify(notice);

	{
		std::unique_lock<std::mutex> l(m_mutex);
		for(auto it = m_players.begin(); it != m_players.end(); it++)
			connections.push_back(it->second.connectionID);
	}

	for(auto it = connections.begin(); it != connections.end(); it++)
		m_host->sendBytes(*it, bytes, delivery);
}

void Dispatcher::broadcastNotice(RoomID room, const ServerNoticeMessage &notice)
{
	broadcast(room, notice);
}

void Dispatcher::close(uint32_t connectionID, rudp::CloseReason reason)
{
	m_host->closeConnection(connectionID, reason);
}

size_t Dispatcher::reapIdle(uint64_t now)
{
	auto removed = m_rooms->reapIdle(now, m_config.idleUserTimeoutMs);
	size_t rv = 0;

	for(auto it = removed.begin(); it != removed.end(); it++)
	{
		uint32_t connectionID = 0;
		bool found = false;

		{
			std::unique_lock<std::mutex> l(m_mutex);
			auto playerIt = m_players.find(it->userID);
			if((playerIt != m_players.end()) and (playerIt->second.roomID == it->roomID))
			{
				connectionID = playerIt->second.connectionID;
				m_playerByConnection.erase(connectionID);
				m_players.erase(playerIt);
				found = true;
			}
		}

		rv++;
		log()->info("reaped idle player {} from room {}", it->userID, it->roomID);

		if(m_persistence)
		{
			UserState state = *it;
			state.connected = false;
			m_persistence->saveSnapshot(state);
		}

		if(found)
			m_host->closeConnection(connectionID, rudp::CLOSE_IDLE_TIMEOUT);
	}

	return rv;
}

// --- queries

bool Dispatcher::findPlayer(PlayerID playerID, PlayerRecord &dst) const
{
	std::unique_lock<std::mutex> l(m_mutex);
	auto it = m_players.find(playerID);
	if(it == m_players.end())
		return false;
	dst = it->second;
	return true;
}

bool Dispatcher::playerForConnection(uint32_t connectionID, PlayerID &dst) const
{
	std::unique_lock<std::mutex> l(m_mutex);
	auto it = m_playerByConnection.find(connectionID);
	if(it == m_playerByConnection.end())
		return false;
	dst = it->second;
	return true;
}

bool Dispatcher::isPlayer(PlayerID playerID) const
{
	std::unique_lock<std::mutex> l(m_mutex);
	return m_players.count(playerID) > 0;
}

size_t Dispatcher::playerCount() const
{
	std::unique_lock<std::mutex> l(m_mutex);
	return m_players.size();
}

} } } // namespace com::arena::game
