#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

// Game messages carried as the payload of rudp Data packets. Encoding: a
// one byte tag followed by the variant's fields; integers and IEEE-754 floats
// little-endian, strings u16-length-prefixed UTF-8, optionals a u8 presence
// flag then the value, lists and maps a u16 count then the elements.

#include <cmath>
#include <map>
#include <string>
#include <vector>

#include "Object.hpp"

namespace com { namespace arena { namespace game {

using PlayerID = uint32_t;
using RoomID = uint32_t;

enum MessageType {
	MSG_CONNECT          = 0x01,
	MSG_CONNECT_RESPONSE = 0x02,
	MSG_DISCONNECT       = 0x03,
	MSG_MOVE             = 0x04,
	MSG_MOVE_UPDATE      = 0x05,
	MSG_ATTACK           = 0x06,
	MSG_ATTACK_RESULT    = 0x07,
	MSG_DIE              = 0x08,
	MSG_RESPAWN          = 0x09,
	MSG_RESPAWN_COMPLETE = 0x0a,
	MSG_STATE_UPDATE     = 0x0b,
	MSG_ERROR            = 0x0c,
	MSG_SERVER_NOTICE    = 0x0d,
	MSG_SKILL            = 0x0e
};

const char *messageTypeName(int type);

enum ErrorCode : uint16_t {
	ERROR_NONE = 0,

	// transport, reported locally
	MALFORMED_PACKET = 1,
	FRAGMENT_TIMEOUT,
	RECEIVE_WINDOW_OVERFLOW,
	SEND_QUEUE_OVERFLOW,
	PEER_UNREACHABLE,
	IDLE_TIMEOUT,

	// protocol
	UNKNOWN_MESSAGE = 100,
	PROTOCOL_ERROR,
	VERSION_MISMATCH,
	AUTH_FAILED,
	SERVER_FULL,
	INVALID_NAME,

	// game
	UNKNOWN_SKILL = 200,
	ON_COOLDOWN,
	INSUFFICIENT_MANA,
	OUT_OF_RANGE,
	INVALID_TARGET,
	NOT_ALIVE
};

enum ErrorCategory { CATEGORY_NETWORK = 0, CATEGORY_AUTHENTICATION, CATEGORY_AUTHORIZATION,
	CATEGORY_GAME_LOGIC, CATEGORY_PROTOCOL, CATEGORY_SYSTEM };

const char   *errorCodeName(ErrorCode code);
ErrorCategory errorCategoryOf(ErrorCode code);

enum DisconnectReason { DISCONNECT_NORMAL = 0, DISCONNECT_TIMEOUT, DISCONNECT_KICKED,
	DISCONNECT_BANNED, DISCONNECT_NETWORK_ERROR, DISCONNECT_CLIENT_ERROR };

enum PlayerStatus { STATUS_ALIVE = 0, STATUS_DEAD, STATUS_IN_COMBAT, STATUS_AWAY, STATUS_TRADING };

enum NoticeType { NOTICE_MAINTENANCE = 0, NOTICE_EVENT, NOTICE_WARNING, NOTICE_INFO };

enum NoticePriority { PRIORITY_LOW = 0, PRIORITY_MEDIUM, PRIORITY_HIGH, PRIORITY_CRITICAL };

struct WorldBounds {
	float width { 10000 };
	float height { 10000 };
	float depth { 10000 };
};

struct Vector3 {
	Vector3() {}
	Vector3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

	float x { 0 };
	float y { 0 };
	float z { 0 };

	float magnitude() const { return std::sqrt(x * x + y * y + z * z); }
	bool  operator== (const Vector3 &rhs) const { return (x == rhs.x) and (y == rhs.y) and (z == rhs.z); }
	bool  operator!= (const Vector3 &rhs) const { return not (*this == rhs); }
};

using Direction = Vector3;
using Velocity = Vector3;

struct Position : public Vector3 {
	Position() {}
	Position(float x_, float y_, float z_) : Vector3(x_, y_, z_) {}

	float distanceTo(const Position &other) const;

	// |x| <= width/2, 0 <= y <= height, |z| <= depth/2, all finite.
	bool isValid(const WorldBounds &bounds = WorldBounds()) const;
};

struct PlayerState {
	uint32_t     health { 100 };
	uint32_t     maxHealth { 100 };
	uint32_t     mana { 100 };
	uint32_t     maxMana { 100 };
	Position     position;
	float        movementSpeed { 5 };
	uint32_t     attackPower { 10 };
	uint32_t     defense { 5 };
	uint32_t     level { 1 };
	PlayerStatus status { STATUS_ALIVE };
};

struct ServerSettings {
	uint32_t    tickRate { 60 };
	uint32_t    maxPlayers { 0 };
	bool        pvpEnabled { true };
	float       goldMultiplier { 1 };
	WorldBounds worldBounds;
};

struct AttackTarget {
	enum Kind { PLAYER = 0, POSITION, NPC };

	Kind     kind { PLAYER };
	uint32_t id { 0 }; // player or npc
	Position position;

	static AttackTarget player(PlayerID id);
	static AttackTarget at(const Position &pos);
	static AttackTarget npc(uint32_t id);
};

struct AttackType {
	enum Kind { MELEE_BASIC = 0, MELEE_HEAVY, RANGED, MAGIC, AREA_OF_EFFECT, SKILL };

	AttackType() {}
	AttackType(Kind kind_, uint32_t skillID_ = 0) : kind(kind_), skillID(skillID_) {}

	Kind     kind { MELEE_BASIC };
	uint32_t skillID { 0 }; // SKILL only
};

struct DeathCause {
	enum Kind { PLAYER_KILL = 0, NPC_KILL, ENVIRONMENTAL, SUICIDE, TIMEOUT, OTHER };

	Kind        kind { ENVIRONMENTAL };
	uint32_t    id { 0 };  // PLAYER_KILL, NPC_KILL
	std::string text;      // OTHER
};

struct DeathPenalty {
	uint32_t goldLost { 0 };
	float    durabilityLoss { 0 };
};

struct StateValue {
	enum Kind { INTEGER = 0, FLOAT, BOOLEAN, STRING };

	StateValue() {}
	StateValue(int64_t v) : kind(INTEGER), integerValue(v) {}
	StateValue(double v) : kind(FLOAT), floatValue(v) {}
	StateValue(bool v) : kind(BOOLEAN), booleanValue(v) {}
	StateValue(const std::string &v) : kind(STRING), stringValue(v) {}
	StateValue(const char *v) : kind(STRING), stringValue(v) {}

	Kind        kind { INTEGER };
	int64_t     integerValue { 0 };
	double      floatValue { 0 };
	bool        booleanValue { false };
	std::string stringValue;

	bool operator== (const StateValue &rhs) const;
};

class GameMessage : public Object {
public:
	virtual MessageType getType() const = 0;

	Bytes encode() const;
	void  encode(Bytes &dst) const;

	// Answers an empty shared_ptr for an unknown tag, a truncated field, an
	// out-of-range enumeration, or trailing bytes.
	static std::shared_ptr<GameMessage> decode(const uint8_t *bytes, size_t len);
	static std::shared_ptr<GameMessage> decode(const Bytes &bytes);

	static std::shared_ptr<GameMessage> make(int type); // empty if unknown

	// Variants only a server sends.
	bool isServerOnly() const;

protected:
	virtual void encodeFields(Bytes &dst) const = 0;
	virtual bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) = 0;
};

class ConnectMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_CONNECT; }

	std::string playerName;
	std::string authToken;
	std::string clientVersion;

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class ConnectResponseMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_CONNECT_RESPONSE; }

	bool           success { false };
	bool           hasPlayerID { false };
	PlayerID       playerID { 0 };
	bool           hasSpawnPosition { false };
	Position       spawnPosition;
	bool           hasInitialState { false };
	PlayerState    initialState;
	std::string    message;
	bool           hasServerSettings { false };
	ServerSettings serverSettings;

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class DisconnectMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_DISCONNECT; }

	DisconnectReason reason { DISCONNECT_NORMAL };

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class MoveMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_MOVE; }

	Position  targetPosition;
	Direction direction;
	float     speedMultiplier { 1 };
	uint64_t  clientTimestamp { 0 };

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class MoveUpdateMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_MOVE_UPDATE; }

	PlayerID playerID { 0 };
	Position currentPosition;
	Velocity velocity;
	uint64_t serverTimestamp { 0 };

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class AttackMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_ATTACK; }

	AttackTarget target;
	AttackType   attackType;
	bool         hasWeaponID { false };
	uint32_t     weaponID { 0 };
	Direction    attackDirection;
	uint32_t     predictedDamage { 0 };

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class AttackResultMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_ATTACK_RESULT; }

	PlayerID     attackerID { 0 };
	AttackTarget target;
	AttackType   attackType;
	bool         hit { false };
	uint32_t     damageDealt { 0 };
	bool         criticalHit { false };
	bool         hasTargetHealth { false };
	uint32_t     targetHealth { 0 };
	uint64_t     serverTimestamp { 0 };

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class DieMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_DIE; }

	PlayerID              playerID { 0 };
	DeathCause            deathCause;
	bool                  hasKillerID { false };
	PlayerID              killerID { 0 };
	Position              deathPosition;
	std::vector<uint32_t> droppedItems;
	uint32_t              respawnCooldown { 0 }; // seconds
	DeathPenalty          deathPenalty;

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class RespawnMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_RESPAWN; }

	bool     hasPreferredSpawn { false };
	Position preferredSpawn;

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class RespawnCompleteMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_RESPAWN_COMPLETE; }

	PlayerID    playerID { 0 };
	Position    spawnPosition;
	PlayerState restoredState;
	uint64_t    serverTimestamp { 0 };

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class StateUpdateMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_STATE_UPDATE; }

	PlayerID                          playerID { 0 };
	std::map<std::string, StateValue> stateChanges;
	uint64_t                          serverTimestamp { 0 };

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class ErrorMessage : public GameMessage {
public:
	ErrorMessage() {}
	ErrorMessage(ErrorCode code, const std::string &message);

	MessageType getType() const override { return MSG_ERROR; }

	ErrorCode     code { ERROR_NONE };
	std::string   message;
	ErrorCategory category { CATEGORY_SYSTEM };
	bool          recoverable { true };

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class ServerNoticeMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_SERVER_NOTICE; }

	NoticeType     noticeType { NOTICE_INFO };
	std::string    message;
	NoticePriority priority { PRIORITY_MEDIUM };
	bool           hasExpiresAt { false };
	uint64_t       expiresAt { 0 };

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

class SkillMessage : public GameMessage {
public:
	MessageType getType() const override { return MSG_SKILL; }

	uint32_t skillID { 0 };
	bool     hasTargetPlayer { false };
	PlayerID targetPlayer { 0 };
	bool     hasTargetPosition { false };
	Position targetPosition;
	uint64_t clientTimestamp { 0 };

protected:
	void encodeFields(Bytes &dst) const override;
	bool decodeFields(const uint8_t **cursor_ptr, const uint8_t *limit) override;
};

} } } // namespace com::arena::game
