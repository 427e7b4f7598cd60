// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstring>

#include "../include/rudp/GameMessage.hpp"

namespace com { namespace arena { namespace game {

namespace {

void putU8(Bytes &dst, uint8_t v)
{
	dst.push_back(v);
}

void putU16(Bytes &dst, uint16_t v)
{
	dst.push_back(v & 0xff);
	dst.push_back((v >> 8) & 0xff);
}

void putU32(Bytes &dst, uint32_t v)
{
	for(int i = 0; i < 4; i++)
		dst.push_back((v >> (8 * i)) & 0xff);
}

void putU64(Bytes &dst, uint64_t v)
{
	for(int i = 0; i < 8; i++)
		dst.push_back((v >> (8 * i)) & 0xff);
}

void putF32(Bytes &dst, float v)
{
	uint32_t bits;
	memcpy(&bits, &v, sizeof(bits));
	putU32(dst, bits);
}

void putF64(Bytes &dst, double v)
{
	uint64_t bits;
	memcpy(&bits, &v, sizeof(bits));
	putU64(dst, bits);
}

void putBool(Bytes &dst, bool v)
{
	putU8(dst, v ? 1 : 0);
}

void putString(Bytes &dst, const std::string &s)
{
	size_t len = s.size() > 0xffff ? 0xffff : s.size();
	putU16(dst, len);
	dst.insert(dst.end(), s.begin(), s.begin() + len);
}

void putVector(Bytes &dst, const Vector3 &v)
{
	putF32(dst, v.x);
	putF32(dst, v.y);
	putF32(dst, v.z);
}

bool getU8(const uint8_t **cursor_ptr, const uint8_t *limit, uint8_t &dst)
{
	if(limit - *cursor_ptr < 1)
		return false;
	dst = *(*cursor_ptr)++;
	return true;
}

bool getU16(const uint8_t **cursor_ptr, const uint8_t *limit, uint16_t &dst)
{
	const uint8_t *cursor = *cursor_ptr;
	if(limit - cursor < 2)
		return false;
	dst = uint16_t(cursor[0]) | (uint16_t(cursor[1]) << 8);
	*cursor_ptr = cursor + 2;
	return true;
}

bool getU32(const uint8_t **cursor_ptr, const uint8_t *limit, uint32_t &dst)
{
	const uint8_t *cursor = *cursor_ptr;
	if(limit - cursor < 4)
		return false;
	dst = 0;
	for(int i = 0; i < 4; i++)
		dst |= uint32_t(cursor[i]) << (8 * i);
	*cursor_ptr = cursor + 4;
	return true;
}

bool getU64(const uint8_t **cursor_ptr, const uint8_t *limit, uint64_t &dst)
{
	const uint8_t *cursor = *cursor_ptr;
	if(limit - cursor < 8)
		return false;
	dst = 0;
	for(int i = 0; i < 8; i++)
		dst |= uint64_t(cursor[i]) << (8 * i);
	*cursor_ptr = cursor + 8;
	return true;
}

bool getF32(const uint8_t **cursor_ptr, const uint8_t *limit, float &dst)
{
	uint32_t bits;
	if(not getU32(cursor_ptr, limit, bits))
		return false;
	memcpy(&dst, &bits, sizeof(dst));
	return true;
}

bool getF64(const uint8_t **cursor_ptr, const uint8_t *limit, double &dst)
{
	uint64_t bits;
	if(not getU64(cursor_ptr, limit, bits))
		return false;
	memcpy(&dst, &bits, sizeof(dst));
	return true;
}

bool getBool(const uint8_t **cursor_ptr, const uint8_t *limit, bool &dst)
{
	uint8_t v;
	if((not getU8(cursor_ptr, limit, v)) or (v > 1))
		return false;
	dst = (1 == v);
	return true;
}

// Well-formed UTF-8 only: no overlong forms, surrogates, or code points past U+10FFFF.
bool isValidUTF8(const uint8_t *cursor, const uint8_t *limit)
{
	while(cursor < limit)
	{
		uint8_t c = *cursor++;
		if(c < 0x80)
			continue;

		size_t trailing;
		uint32_t codepoint;
		uint32_t minimum;
		if((c & 0xe0) == 0xc0)
		{
			trailing = 1;
			codepoint = c & 0x1f;
			minimum = 0x80;
		}
		else if((c & 0xf0) == 0xe0)
		{
			trailing = 2;
			codepoint = c & 0x0f;
			minimum = 0x800;
		}
		else if((c & 0xf8) == 0xf0)
		{
			trailing = 3;
			codepoint = c & 0x07;
			minimum = 0x10000;
		}
		else
			return false;

		if(size_t(limit - cursor) < trailing)
			return false;
		for(size_t i = 0; i < trailing; i++)
		{
			if((cursor[i] & 0xc0) != 0x80)
				return false;
			codepoint = (codepoint << 6) | (cursor[i] & 0x3f);
		}
		cursor += trailing;

		if((codepoint < minimum) or (codepoint > 0x10ffff) or ((codepoint >= 0xd800) and (codepoint <= 0xdfff)))
			return false;
	}

	return true;
}

bool getString(const uint8_t **cursor_ptr, const uint8_t *limit, std::string &dst)
{
	uint16_t len;
	if(not getU16(cursor_ptr, limit, len))
		return false;
	if(limit - *cursor_ptr < len)
		return false;
	if(not isValidUTF8(*cursor_ptr, *cursor_ptr + len))
		return false;
	dst.assign((const char *)*cursor_ptr, len);
	*cursor_ptr += len;
	return true;
}

bool getVector(const uint8_t **cursor_ptr, const uint8_t *limit, Vector3 &dst)
{
	return getF32(cursor_ptr, limit, dst.x)
	   and getF32(cursor_ptr, limit, dst.y)
	   and getF32(cursor_ptr, limit, dst.z);
}

template <typename T>
bool getEnum(const uint8_t **cursor_ptr, const uint8_t *limit, T &dst, T last)
{
	uint8_t v;
	if((not getU8(cursor_ptr, limit, v)) or (v > uint8_t(last)))
		return false;
	dst = T(v);
	return true;
}

void putPlayerState(Bytes &dst, const PlayerState &state)
{
	putU32(dst, state.health);
	putU32(dst, state.maxHealth);
	putU32(dst, state.mana);
	putU32(dst, state.maxMana);
	putVector(dst, state.position);
	putF32(dst, state.movementSpeed);
	putU32(dst, state.attackPower);
	putU32(dst, state.defense);
	putU32(dst, state.level);
	putU8(dst, state.status);
}

bool getPlayerState(const uint8_t **cursor_ptr, const uint8_t *limit, PlayerState &state)
{
	return getU32(cursor_ptr, limit, state.health)
	   and getU32(cursor_ptr, limit, state.maxHealth)
	   and getU32(cursor_ptr, limit, state.mana)
	   and getU32(cursor_ptr, limit, state.maxMana)
	   and getVector(cursor_ptr, limit, state.position)
	   and getF32(cursor_ptr, limit, state.movementSpeed)
	   and getU32(cursor_ptr, limit, state.attackPower)
	   and getU32(cursor_ptr, limit, state.defense)
	   and getU32(cursor_ptr, limit, state.level)
	   and getEnum(cursor_ptr, limit, state.status, STATUS_TRADING);
}

void putTarget(Bytes &dst, const AttackTarget &target)
{
	putU8(dst, target.kind);
	if(AttackTarget::POSITION == target.kind)
		putVector(dst, target.position);
	else
		putU32(dst, target.id);
}

bool getTarget(const uint8_t **cursor_ptr, const uint8_t *limit, AttackTarget &target)
{
	if(not getEnum(cursor_ptr, limit, target.kind, AttackTarget::NPC))
		return false;
	if(AttackTarget::POSITION == target.kind)
		return getVector(cursor_ptr, limit, target.position);
	return getU32(cursor_ptr, limit, target.id);
}

void putAttackType(Bytes &dst, const AttackType &attackType)
{
	putU8(dst, attackType.kind);
	if(AttackType::SKILL == attackType.kind)
		putU32(dst, attackType.skillID);
}

bool getAttackType(const uint8_t **cursor_ptr, const uint8_t *limit, AttackType &attackType)
{
	if(not getEnum(cursor_ptr, limit, attackType.kind, AttackType::SKILL))
		return false;
	if(AttackType::SKILL == attackType.kind)
		return getU32(cursor_ptr, limit, attackType.skillID);
	return true;
}

} // anonymous namespace

const char *messageTypeName(int type)
{
	switch(type)
	{
	case MSG_CONNECT:          return "Connect";
	case MSG_CONNECT_RESPONSE: return "ConnectResponse";
	case MSG_DISCONNECT:       return "Disconnect";
	case MSG_MOVE:             return "Move";
	case MSG_MOVE_UPDATE:      return "MoveUpdate";
	case MSG_ATTACK:           return "Attack";
	case MSG_ATTACK_RESULT:    return "AttackResult";
	case MSG_DIE:              return "Die";
	case MSG_RESPAWN:          return "Respawn";
	case MSG_RESPAWN_COMPLETE: return "RespawnComplete";
	case MSG_STATE_UPDATE:     return "StateUpdate";
	case MSG_ERROR:            return "Error";
	case MSG_SERVER_NOTICE:    return "ServerNotice";
	case MSG_SKILL:            return "Skill";
	default:                   return "Unknown";
	}
}

const char *errorCodeName(ErrorCode code)
{
	switch(code)
	{
	case ERROR_NONE:              return "None";
	case MALFORMED_PACKET:        return "MalformedPacket";
	case FRAGMENT_TIMEOUT:        return "FragmentTimeout";
	case RECEIVE_WINDOW_OVERFLOW: return "ReceiveWindowOverflow";
	case SEND_QUEUE_OVERFLOW:     return "SendQueueOverflow";
	case PEER_UNREACHABLE:        return "PeerUnreachable";
	case IDLE_TIMEOUT:            return "IdleTimeout";
	case UNKNOWN_MESSAGE:         return "UnknownMessage";
	case PROTOCOL_ERROR:          return "ProtocolError";
	case VERSION_MISMATCH:        return "VersionMismatch";
	case AUTH_FAILED:             return "AuthFailed";
	case SERVER_FULL:             return "ServerFull";
	case INVALID_NAME:            return "InvalidName";
	case UNKNOWN_SKILL:           return "UnknownSkill";
	case ON_COOLDOWN:             return "OnCooldown";
	case INSUFFICIENT_MANA:       return "InsufficientMana";
	case OUT_OF_RANGE:            return "OutOfRange";
	case INVALID_TARGET:          return "InvalidTarget";
	case NOT_ALIVE:               return "NotAlive";
	}
	return "Unknown";
}

ErrorCategory errorCategoryOf(ErrorCode code)
{
	if(AUTH_FAILED == code)
		return CATEGORY_AUTHENTICATION;
	if(SERVER_FULL == code)
		return CATEGORY_AUTHORIZATION;
	if(code >= UNKNOWN_SKILL)
		return CATEGORY_GAME_LOGIC;
	if(code >= UNKNOWN_MESSAGE)
		return CATEGORY_PROTOCOL;
	if(code > ERROR_NONE)
		return CATEGORY_NETWORK;
	return CATEGORY_SYSTEM;
}

float Position::distanceTo(const Position &other) const
{
	float dx = x - other.x;
	float dy = y - other.y;
	float dz = z - other.z;
	return std::sqrt(dx * dx + dy * dy + dz * dz);
}

bool Position::isValid(const WorldBounds &bounds) const
{
	if(not (std::isfinite(x) and std::isfinite(y) and std::isfinite(z)))
		return false;
	return (std::fabs(x) <= bounds.width / 2)
	   and (y >= 0) and (y <= bounds.height)
	   and (std::fabs(z) <= bounds.depth / 2);
}

AttackTarget AttackTarget::player(PlayerID id)
{
	AttackTarget rv;
	rv.kind = PLAYER;
	rv.id = id;
	return rv;
}

AttackTarget AttackTarget::at(const Position &pos)
{
	AttackTarget rv;
	rv.kind = POSITION;
	rv.position = pos;
	return rv;
}

AttackTarget AttackTarget::npc(uint32_t id)
{
	AttackTarget rv;
	rv.kind = NPC;
	rv.id = id;
	return rv;
}

bool StateValue::operator== (const StateValue &rhs) const
{
	if(kind != rhs.kind)
		return false;
	switch(kind)
	{
	case INTEGER: return integerValue == rhs.integerValue;
	case FLOAT:   return floatValue == rhs.floatValue;
	case BOOLEAN: return booleanValue == rhs.booleanValue;
	case STRING:  return stringValue == rhs.stringValue;
	}
	return false;
}

// --- GameMessage

Bytes GameMessage::encode() const
{
	Bytes rv;
	encode(rv);
	return rv;
}

void GameMessage::encode(Bytes &dst) const
{
	putU8(dst, getType());
	encodeFields(dst);
}

std::shared_ptr<GameMessage> GameMessage::make(int type)
{
	switch(type)
	{
	case MSG_CONNECT:          return share_ref<GameMessage>(new ConnectMessage(), false);
	case MSG_CONNECT_RESPONSE: return share_ref<GameMessage>(new ConnectResponseMessage(), false);
	case MSG_DISCONNECT:       return share_ref<GameMessage>(new DisconnectMessage(), false);
	case MSG_MOVE:             return share_ref<GameMessage>(new MoveMessage(), false);
	case MSG_MOVE_UPDATE:      return share_ref<GameMessage>(new MoveUpdateMessage(), false);
	case MSG_ATTACK:           return share_ref<GameMessage>(new AttackMessage(), false);
	case MSG_ATTACK_RESULT:    return share_ref<GameMessage>(new AttackResultMessage(), false);
	case MSG_DIE:              return share_ref<GameMessage>(new DieMessage(), false);
	case MSG_RESPAWN:          return share_ref<GameMessage>(new RespawnMessage(), false);
	case MSG_RESPAWN_COMPLETE: return share_ref<GameMessage>(new RespawnCompleteMessage(), false);
	case MSG_STATE_UPDATE:     return share_ref<GameMessage>(new StateUpdateMessage(), false);
	case MSG_ERROR:            return share_ref<GameMessage>(new ErrorMessage(), false);
	case MSG_SERVER_NOTICE:    return share_ref<GameMessage>(new ServerNoticeMessage(), false);
	case MSG_SKILL:            return share_ref<GameMessage>(new SkillMessage(), false);
	default:                   return std::shared_ptr<GameMessage>();
	}
}

std::shared_ptr<GameMessage> GameMessage::decode(const uint8_t *bytes, size_t len)
{
	const uint8_t *cursor = bytes;
	const uint8_t *limit = bytes + len;
	uint8_t tag;

	if(not getU8(&cursor, limit, tag))
		return std::shared_ptr<GameMessage>();

	auto rv = make(tag);
	if((not rv) or (not rv->decodeFields(&cursor, limit)) or (cursor != limit))
		return std::shared_ptr<GameMessage>();

	return rv;
}

std::shared_ptr<GameMessage> GameMessage::decode(const Bytes &bytes)
{
	return decode(bytes.data(), bytes.size());
}

bool GameMessage::isServerOnly() const
{
	switch(getType())
	{
	case MSG_CONNECT_RESPONSE:
	case MSG_MOVE_UPDATE:
	case MSG_ATTACK_RESULT:
	case MSG_RESPAWN_COMPLETE:
	case MSG_STATE_UPDATE:
	case MSG_ERROR:
	case MSG_SERVER_NOTICE:
		return true;
	default:
		return false;
	}
}

// --- Connect

void ConnectMessage::encodeFields(Bytes &dst) const
{
	putString(dst, playerName);
	putString(dst, authToken);
	putString(dst, clientVersion);
}

bool ConnectMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	return getString(cursor_ptr, limit, playerName)
	   and getString(cursor_ptr, limit, authToken)
	   and getString(cursor_ptr, limit, clientVersion);
}

// --- ConnectResponse

void ConnectResponseMessage::encodeFields(Bytes &dst) const
{
	putBool(dst, success);

	putBool(dst, hasPlayerID);
	if(hasPlayerID)
		putU32(dst, playerID);

	putBool(dst, hasSpawnPosition);
	if(hasSpawnPosition)
		putVector(dst, spawnPosition);

	putBool(dst, hasInitialState);
	if(hasInitialState)
		putPlayerState(dst, initialState);

	putString(dst, message);

	putBool(dst, hasServerSettings);
	if(hasServerSettings)
	{
		putU32(dst, serverSettings.tickRate);
		putU32(dst, serverSettings.maxPlayers);
		putBool(dst, serverSettings.pvpEnabled);
		putF32(dst, serverSettings.goldMultiplier);
		putF32(dst, serverSettings.worldBounds.width);
		putF32(dst, serverSettings.worldBounds.height);
		putF32(dst, serverSettings.worldBounds.depth);
	}
}

bool ConnectResponseMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	if(not getBool(cursor_ptr, limit, success))
		return false;

	if(not getBool(cursor_ptr, limit, hasPlayerID))
		return false;
	if(hasPlayerID and not getU32(cursor_ptr, limit, playerID))
		return false;

	if(not getBool(cursor_ptr, limit, hasSpawnPosition))
		return false;
	if(hasSpawnPosition and not getVector(cursor_ptr, limit, spawnPosition))
		return false;

	if(not getBool(cursor_ptr, limit, hasInitialState))
		return false;
	if(hasInitialState and not getPlayerState(cursor_ptr, limit, initialState))
		return false;

	if(not getString(cursor_ptr, limit, message))
		return false;

	if(not getBool(cursor_ptr, limit, hasServerSettings))
		return false;
	if(hasServerSettings)
		return getU32(cursor_ptr, limit, serverSettings.tickRate)
		   and getU32(cursor_ptr, limit, serverSettings.maxPlayers)
		   and getBool(cursor_ptr, limit, serverSettings.pvpEnabled)
		   and getF32(cursor_ptr, limit, serverSettings.goldMultiplier)
		   and getF32(cursor_ptr, limit, serverSettings.worldBounds.width)
		   and getF32(cursor_ptr, limit, serverSettings.worldBounds.height)
		   and getF32(cursor_ptr, limit, serverSettings.worldBounds.depth);

	return true;
}

// --- Disconnect

void DisconnectMessage::encodeFields(Bytes &dst) const
{
	putU8(dst, reason);
}

bool DisconnectMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	return getEnum(cursor_ptr, limit, reason, DISCONNECT_CLIENT_ERROR);
}

// --- Move

void MoveMessage::encodeFields(Bytes &dst) const
{
	putVector(dst, targetPosition);
	putVector(dst, direction);
	putF32(dst, speedMultiplier);
	putU64(dst, clientTimestamp);
}

bool MoveMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	return getVector(cursor_ptr, limit, targetPosition)
	   and getVector(cursor_ptr, limit, direction)
	   and getF32(cursor_ptr, limit, speedMultiplier)
	   and getU64(cursor_ptr, limit, clientTimestamp);
}

// --- MoveUpdate

void MoveUpdateMessage::encodeFields(Bytes &dst) const
{
	putU32(dst, playerID);
	putVector(dst, currentPosition);
	putVector(dst, velocity);
	putU64(dst, serverTimestamp);
}

bool MoveUpdateMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	return getU32(cursor_ptr, limit, playerID)
	   and getVector(cursor_ptr, limit, currentPosition)
	   and getVector(cursor_ptr, limit, velocity)
	   and getU64(cursor_ptr, limit, serverTimestamp);
}

// --- Attack

void AttackMessage::encodeFields(Bytes &dst) const
{
	putTarget(dst, target);
	putAttackType(dst, attackType);
	putBool(dst, hasWeaponID);
	if(hasWeaponID)
		putU32(dst, weaponID);
	putVector(dst, attackDirection);
	putU32(dst, predictedDamage);
}

bool AttackMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	if(not (getTarget(cursor_ptr, limit, target) and getAttackType(cursor_ptr, limit, attackType)))
		return false;
	if(not getBool(cursor_ptr, limit, hasWeaponID))
		return false;
	if(hasWeaponID and not getU32(cursor_ptr, limit, weaponID))
		return false;
	return getVector(cursor_ptr, limit, attackDirection)
	   and getU32(cursor_ptr, limit, predictedDamage);
}

// --- AttackResult

void AttackResultMessage::encodeFields(Bytes &dst) const
{
	putU32(dst, attackerID);
	putTarget(dst, target);
	putAttackType(dst, attackType);
	putBool(dst, hit);
	putU32(dst, damageDealt);
	putBool(dst, criticalHit);
	putBool(dst, hasTargetHealth);
	if(hasTargetHealth)
		putU32(dst, targetHealth);
	putU64(dst, serverTimestamp);
}

bool AttackResultMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	if(not (getU32(cursor_ptr, limit, attackerID)
	    and getTarget(cursor_ptr, limit, target)
	    and getAttackType(cursor_ptr, limit, attackType)
	    and getBool(cursor_ptr, limit, hit)
	    and getU32(cursor_ptr, limit, damageDealt)
	    and getBool(cursor_ptr, limit, criticalHit)
	    and getBool(cursor_ptr, limit, hasTargetHealth))
	)
		return false;
	if(hasTargetHealth and not getU32(cursor_ptr, limit, targetHealth))
		return false;
	return getU64(cursor_ptr, limit, serverTimestamp);
}

// --- Die

void DieMessage::encodeFields(Bytes &dst) const
{
	putU32(dst, playerID);

	putU8(dst, deathCause.kind);
	if((DeathCause::PLAYER_KILL == deathCause.kind) or (DeathCause::NPC_KILL == deathCause.kind))
		putU32(dst, deathCause.id);
	else if(DeathCause::OTHER == deathCause.kind)
		putString(dst, deathCause.text);

	putBool(dst, hasKillerID);
	if(hasKillerID)
		putU32(dst, killerID);

	putVector(dst, deathPosition);

	size_t count = droppedItems.size() > 0xffff ? 0xffff : droppedItems.size();
	putU16(dst, count);
	for(size_t i = 0; i < count; i++)
		putU32(dst, droppedItems[i]);

	putU32(dst, respawnCooldown);
	putU32(dst, deathPenalty.goldLost);
	putF32(dst, deathPenalty.durabilityLoss);
}

bool DieMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	if(not getU32(cursor_ptr, limit, playerID))
		return false;

	if(not getEnum(cursor_ptr, limit, deathCause.kind, DeathCause::OTHER))
		return false;
	if((DeathCause::PLAYER_KILL == deathCause.kind) or (DeathCause::NPC_KILL == deathCause.kind))
	{
		if(not getU32(cursor_ptr, limit, deathCause.id))
			return false;
	}
	else if(DeathCause::OTHER == deathCause.kind)
	{
		if(not getString(cursor_ptr, limit, deathCause.text))
			return false;
	}

	if(not getBool(cursor_ptr, limit, hasKillerID))
		return false;
	if(hasKillerID and not getU32(cursor_ptr, limit, killerID))
		return false;

	if(not getVector(cursor_ptr, limit, deathPosition))
		return false;

	uint16_t count;
	if(not getU16(cursor_ptr, limit, count))
		return false;
	droppedItems.clear();
	for(uint16_t i = 0; i < count; i++)
	{
		uint32_t item;
		if(not getU32(cursor_ptr, limit, item))
			return false;
		droppedItems.push_back(item);
	}

	return getU32(cursor_ptr, limit, respawnCooldown)
	   and getU32(cursor_ptr, limit, deathPenalty.goldLost)
	   and getF32(cursor_ptr, limit, deathPenalty.durabilityLoss);
}

// --- Respawn

void RespawnMessage::encodeFields(Bytes &dst) const
{
	putBool(dst, hasPreferredSpawn);
	if(hasPreferredSpawn)
		putVector(dst, preferredSpawn);
}

bool RespawnMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	if(not getBool(cursor_ptr, limit, hasPreferredSpawn))
		return false;
	return (not hasPreferredSpawn) or getVector(cursor_ptr, limit, preferredSpawn);
}

// --- RespawnComplete

void RespawnCompleteMessage::encodeFields(Bytes &dst) const
{
	putU32(dst, playerID);
	putVector(dst, spawnPosition);
	putPlayerState(dst, restoredState);
	putU64(dst, serverTimestamp);
}

bool RespawnCompleteMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	return getU32(cursor_ptr, limit, playerID)
	   and getVector(cursor_ptr, limit, spawnPosition)
	   and getPlayerState(cursor_ptr, limit, restoredState)
	   and getU64(cursor_ptr, limit, serverTimestamp);
}

// --- StateUpdate

void StateUpdateMessage::encodeFields(Bytes &dst) const
{
	putU32(dst, playerID);

	size_t count = 0;
	size_t countOffset = dst.size();
	putU16(dst, 0);
	for(auto it = stateChanges.begin(); (it != stateChanges.end()) and (count < 0xffff); it++, count++)
	{
		putString(dst, it->first);
		putU8(dst, it->second.kind);
		switch(it->second.kind)
		{
		case StateValue::INTEGER: putU64(dst, uint64_t(it->second.integerValue)); break;
		case StateValue::FLOAT:   putF64(dst, it->second.floatValue); break;
		case StateValue::BOOLEAN: putBool(dst, it->second.booleanValue); break;
		case StateValue::STRING:  putString(dst, it->second.stringValue); break;
		}
	}
	dst[countOffset] = count & 0xff;
	dst[countOffset + 1] = (count >> 8) & 0xff;

	putU64(dst, serverTimestamp);
}

bool StateUpdateMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	uint16_t count;
	if(not (getU32(cursor_ptr, limit, playerID) and getU16(cursor_ptr, limit, count)))
		return false;

	stateChanges.clear();
	for(uint16_t i = 0; i < count; i++)
	{
		std::string key;
		StateValue value;
		uint64_t integerBits;

		if(not (getString(cursor_ptr, limit, key) and getEnum(cursor_ptr, limit, value.kind, StateValue::STRING)))
			return false;

		bool ok = false;
		switch(value.kind)
		{
		case StateValue::INTEGER:
			ok = getU64(cursor_ptr, limit, integerBits);
			value.integerValue = int64_t(integerBits);
			break;
		case StateValue::FLOAT:   ok = getF64(cursor_ptr, limit, value.floatValue); break;
		case StateValue::BOOLEAN: ok = getBool(cursor_ptr, limit, value.booleanValue); break;
		case StateValue::STRING:  ok = getString(cursor_ptr, limit, value.stringValue); break;
		}
		if(not ok)
			return false;

		stateChanges[key] = value;
	}

	return getU64(cursor_ptr, limit, serverTimestamp);
}

// --- Error

ErrorMessage::ErrorMessage(ErrorCode code_, const std::string &message_) :
	code(code_),
	message(message_),
	category(errorCategoryOf(code_)),
	recoverable(true)
{}

void ErrorMessage::encodeFields(Bytes &dst) const
{
	putU16(dst, code);
	putString(dst, message);
	putU8(dst, category);
	putBool(dst, recoverable);
}

bool ErrorMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	uint16_t rawCode;
	if(not getU16(cursor_ptr, limit, rawCode))
		return false;
	code = ErrorCode(rawCode);
	return getString(cursor_ptr, limit, message)
	   and getEnum(cursor_ptr, limit, category, CATEGORY_SYSTEM)
	   and getBool(cursor_ptr, limit, recoverable);
}

// --- ServerNotice

void ServerNoticeMessage::encodeFields(Bytes &dst) const
{
	putU8(dst, noticeType);
	putString(dst, message);
	putU8(dst, priority);
	putBool(dst, hasExpiresAt);
	if(hasExpiresAt)
		putU64(dst, expiresAt);
}

bool ServerNoticeMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	if(not (getEnum(cursor_ptr, limit, noticeType, NOTICE_INFO)
	    and getString(cursor_ptr, limit, message)
	    and getEnum(cursor_ptr, limit, priority, PRIORITY_CRITICAL)
	    and getBool(cursor_ptr, limit, hasExpiresAt))
	)
		return false;
	return (not hasExpiresAt) or getU64(cursor_ptr, limit, expiresAt);
}

// --- Skill

void SkillMessage::encodeFields(Bytes &dst) const
{
	putU32(dst, skillID);
	putBool(dst, hasTargetPlayer);
	if(hasTargetPlayer)
		putU32(dst, targetPlayer);
	putBool(dst, hasTargetPosition);
	if(hasTargetPosition)
		putVector(dst, targetPosition);
	putU64(dst, clientTimestamp);
}

bool SkillMessage::decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit)
{
	if(not (getU32(cursor_ptr, limit, skillID) and getBool(cursor_ptr, limit, hasTargetPlayer)))
		return false;
	if(hasTargetPlayer and not getU32(cursor_ptr, limit, targetPlayer))
		return false;
	if(not getBool(cursor_ptr, limit, hasTargetPosition))
		return false;
	if(hasTargetPosition and not getVector(cursor_ptr, limit, targetPosition))
		return false;
	return getU64(cursor_ptr, limit, clientTimestamp);
}

} } } // namespace com::arena::game
