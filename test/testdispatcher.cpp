#include <cassert>
#include <cstdio>
#include <sstream>

#include "rudp/Dispatcher.hpp"

using namespace com::arena;
using namespace com::arena::game;

namespace {

struct Sent {
	uint32_t                     connectionID;
	std::shared_ptr<GameMessage> msg;
	DeliveryClass                delivery;
};

struct Closed {
	uint32_t          connectionID;
	rudp::CloseReason reason;
};

class FakeHost : public IGameHost {
public:
	bool sendBytes(uint32_t connectionID, const Bytes &bytes, const DeliveryClass &delivery) override
	{
		auto msg = GameMessage::decode(bytes);
		assert(msg);
		Sent sent = { connectionID, msg, delivery };
		sends.push_back(sent);
		return true;
	}

	void closeConnection(uint32_t connectionID, rudp::CloseReason reason) override
	{
		Closed c = { connectionID, reason };
		closes.push_back(c);
	}

	uint64_t getCurrentTimeMillis() override
	{
		return now;
	}

	size_t count(uint32_t connectionID, MessageType type) const
	{
		size_t rv = 0;
		for(auto it = sends.begin(); it != sends.end(); it++)
			if((it->connectionID == connectionID) and (it->msg->getType() == type))
				rv++;
		return rv;
	}

	size_t count(MessageType type) const
	{
		size_t rv = 0;
		for(auto it = sends.begin(); it != sends.end(); it++)
			if(it->msg->getType() == type)
				rv++;
		return rv;
	}

	template <typename T>
	std::shared_ptr<T> last(uint32_t connectionID, MessageType type) const
	{
		for(auto it = sends.rbegin(); it != sends.rend(); it++)
			if((it->connectionID == connectionID) and (it->msg->getType() == type))
				return std::static_pointer_cast<T>(it->msg);
		return std::shared_ptr<T>();
	}

	ErrorCode lastError(uint32_t connectionID) const
	{
		auto error = last<ErrorMessage>(connectionID, MSG_ERROR);
		return error ? error->code : ERROR_NONE;
	}

	void clear()
	{
		sends.clear();
		closes.clear();
	}

	uint64_t            now { 1000000 };
	std::vector<Sent>   sends;
	std::vector<Closed> closes;
};

class FakePersistence : public IPersistence {
public:
	void saveSnapshot(const UserState &state) override { saved.push_back(state); }

	std::vector<UserState> saved;
};

// A Dispatcher with its collaborators, all on one fake clock.
struct World {
	World(IAuthenticator *auth, const ServerConfig &config = ServerConfig(), std::shared_ptr<const SkillTable> skills = SkillTable::defaults()) :
		rooms([this] { return host.now; }),
		skillBook(skills),
		dispatcher(&host, &rooms, &skillBook, auth, config, &persistence)
	{}

	std::shared_ptr<ConnectResponseMessage> connect(uint32_t connectionID, const std::string &name, const std::string &token,
		const std::string &version = "1.0", bool serverFull = false)
	{
		ConnectMessage msg;
		msg.playerName = name;
		msg.authToken = token;
		msg.clientVersion = version;
		Bytes payload = msg.encode();

		Bytes response;
		bool accepted = dispatcher.handleConnectRequest(connectionID, payload.data(), payload.size(), serverFull, response);

		auto rsp = GameMessage::decode(response);
		assert(rsp and (MSG_CONNECT_RESPONSE == rsp->getType()));
		auto rv = std::static_pointer_cast<ConnectResponseMessage>(rsp);
		assert(accepted == rv->success);
		return rv;
	}

	void receive(uint32_t connectionID, const GameMessage &msg)
	{
		Bytes bytes = msg.encode();
		dispatcher.onMessage(connectionID, bytes.data(), bytes.size());
	}

	void move(uint32_t connectionID, const Position &to)
	{
		MoveMessage msg;
		msg.targetPosition = to;
		msg.direction = Direction(1, 0, 0);
		receive(connectionID, msg);
	}

	void skill(uint32_t connectionID, uint32_t skillID, PlayerID target = 0)
	{
		SkillMessage msg;
		msg.skillID = skillID;
		msg.hasTargetPlayer = target != 0;
		msg.targetPlayer = target;
		receive(connectionID, msg);
	}

	uint32_t health(PlayerID playerID)
	{
		PlayerRecord record;
		UserState user;
		bool ok = dispatcher.findPlayer(playerID, record) and rooms.find(record.roomID, playerID, user);
		assert(ok);
		return user.health;
	}

	FakeHost        host;
	FakePersistence persistence;
	RoomManager     rooms;
	SkillRuleBook   skillBook;
	Dispatcher      dispatcher;
};

std::shared_ptr<const SkillTable> skillTable(const char *text)
{
	std::stringstream in(text);
	std::string error;
	auto rv = SkillTable::parse(in, error);
	assert(rv);
	return rv;
}

}

static void testAdmission()
{
	HmacTokenAuthenticator auth("secret");
	ServerConfig config;
	config.clientVersion = "1.4";
	World world(&auth, config);

	std::string token = auth.mint(7, 0, 0);

	auto rsp = world.connect(1, "ab", token);
	assert(0 == rsp->message.find("InvalidName: "));
	assert(not rsp->hasPlayerID);

	rsp = world.connect(1, "abcdefghijklmnopqrstu", token); // 21
	assert(0 == rsp->message.find("InvalidName: "));

	rsp = world.connect(1, "alice", token, "2.0");
	assert(0 == rsp->message.find("VersionMismatch: "));

	rsp = world.connect(1, "alice", token, "");
	assert(0 == rsp->message.find("VersionMismatch: "));

	rsp = world.connect(1, "alice", token, "1.0", true);
	assert(0 == rsp->message.find("ServerFull: "));

	rsp = world.connect(1, "alice", "7.0.0.forged");
	assert(0 == rsp->message.find("AuthFailed: "));

	Bytes notConnect = DisconnectMessage().encode();
	Bytes response;
	assert(not world.dispatcher.handleConnectRequest(1, notConnect.data(), notConnect.size(), false, response));
	auto denial = std::static_pointer_cast<ConnectResponseMessage>(GameMessage::decode(response));
	assert(denial and (0 == denial->message.find("ProtocolError: ")));

	// a name that isn't UTF-8 never reaches the length check
	const uint8_t badName[] = { MSG_CONNECT, 4, 0, 'a', 'b', 'c', 0xfe, 0, 0, 3, 0, '1', '.', '4' };
	Bytes badNameResponse;
	assert(not world.dispatcher.handleConnectRequest(1, badName, sizeof(badName), false, badNameResponse));
	denial = std::static_pointer_cast<ConnectResponseMessage>(GameMessage::decode(badNameResponse));
	assert(denial and (0 == denial->message.find("ProtocolError: ")));

	// denials keep nothing
	assert(0 == world.dispatcher.playerCount());
	assert(0 == world.rooms.userCount());
	assert(world.host.sends.empty());

	// multibyte names are counted in characters
	rsp = world.connect(1, "\xc3\xa9\xc3\xa9\xc3\xa9", token, "1.0");
	assert(rsp->success);

	// a different minor version is compatible
	rsp = world.connect(2, "bob", auth.mint(8, 0, 0), "1.9.3");
	assert(rsp->success);
	assert(rsp->hasPlayerID and (8 == rsp->playerID));
	assert(rsp->hasSpawnPosition and (rsp->spawnPosition == config.spawnPoint));
	assert(rsp->hasInitialState and (100 == rsp->initialState.health) and (100 == rsp->initialState.mana));
	assert(rsp->hasServerSettings and (config.maxConnections == rsp->serverSettings.maxPlayers));

	RoomID room = 0;
	assert(world.rooms.roomOf(8, room) and (config.defaultRoom == room));
	assert(2 == world.dispatcher.playerCount());
}

static void testTakeover()
{
	HmacTokenAuthenticator hmac("secret");
	World world(&hmac);
	std::string token = hmac.mint(5, 9, 0);

	assert(world.connect(10, "alice", token)->success);
	world.move(10, Position(10, 0, 10));

	auto rsp = world.connect(11, "alice2", token);
	assert(rsp->success and (5 == rsp->playerID));
	assert(rsp->spawnPosition == Position(10, 0, 10)); // resumes where it was

	assert(1 == world.host.closes.size());
	assert((10 == world.host.closes[0].connectionID) and (rudp::CLOSE_NORMAL == world.host.closes[0].reason));

	PlayerID playerID;
	assert(not world.dispatcher.playerForConnection(10, playerID));
	assert(world.dispatcher.playerForConnection(11, playerID) and (5 == playerID));
	assert(1 == world.dispatcher.playerCount());
	assert(1 == world.rooms.userCount());

	// the old connection closing afterwards doesn't remove the player
	world.dispatcher.onConnectionClosed(10);
	assert(1 == world.dispatcher.playerCount());

	// a full server still lets a known player take its session back
	rsp = world.connect(12, "alice3", token, "1.0", true);
	assert(rsp->success and (5 == rsp->playerID));
	assert(2 == world.host.closes.size());
	assert(11 == world.host.closes[1].connectionID);
	assert(world.dispatcher.playerForConnection(12, playerID) and (5 == playerID));
	assert(1 == world.dispatcher.playerCount());

	// but not a newcomer
	rsp = world.connect(13, "carol", hmac.mint(6, 9, 0), "1.0", true);
	assert(0 == rsp->message.find("ServerFull: "));
	assert(1 == world.dispatcher.playerCount());
}

static void testRoomBroadcast()
{
	HmacTokenAuthenticator auth("secret");
	World world(&auth);

	assert(world.connect(101, "user one", auth.mint(1, 42, 0))->success);
	assert(world.connect(102, "user two", auth.mint(2, 42, 0))->success);
	assert(world.connect(103, "user three", auth.mint(3, 42, 0))->success);
	assert(world.connect(104, "elsewhere", auth.mint(4, 43, 0))->success);
	world.host.clear();

	world.move(101, Position(3, 0, 4));

	assert(0 == world.host.count(101, MSG_MOVE_UPDATE));
	assert(1 == world.host.count(102, MSG_MOVE_UPDATE));
	assert(1 == world.host.count(103, MSG_MOVE_UPDATE));
	assert(0 == world.host.count(104, MSG_MOVE_UPDATE));

	auto update = world.host.last<MoveUpdateMessage>(102, MSG_MOVE_UPDATE);
	assert((1 == update->playerID) and (update->currentPosition == Position(3, 0, 4)));
	assert(5 == update->velocity.x); // direction times movement speed
	assert(not world.host.sends[0].delivery.reliable);

	// rate limited to move_broadcast_hz, but the position still updates
	world.host.now += 10;
	world.move(101, Position(4, 0, 4));
	assert(1 == world.host.count(102, MSG_MOVE_UPDATE));
	UserState user;
	assert(world.rooms.find(42, 1, user) and (user.position == Position(4, 0, 4)));

	world.host.now += 40;
	world.move(101, Position(5, 0, 4));
	assert(2 == world.host.count(102, MSG_MOVE_UPDATE));

	world.move(101, Position(6000, 0, 0));
	assert(OUT_OF_RANGE == world.host.lastError(101));

	world.host.clear();
	ServerNoticeMessage notice;
	notice.message = "hello";
	world.dispatcher.broadcastNotice(notice);
	assert(4 == world.host.count(MSG_SERVER_NOTICE));
	world.dispatcher.broadcastNotice(43, notice);
	assert(2 == world.host.count(104, MSG_SERVER_NOTICE));
	assert(5 == world.host.count(MSG_SERVER_NOTICE));
}

static void testSkillCooldown()
{
	OpenAuthenticator auth;
	World world(&auth, ServerConfig(), skillTable(
		"100|Smite|BasicAttack|0|3000|0|1000|-|10|0|0\n"
		"101|Doom|BasicAttack|0|0|0|1000|-|500|0|0\n"
		"102|Costly|BasicAttack|1000|0|0|1000|-|10|0|0\n"));

	assert(world.connect(1, "caster", "x")->success);
	assert(world.connect(2, "target", "y")->success);
	world.host.clear();

	uint64_t t0 = world.host.now;
	world.skill(1, 100, 2);
	assert(ERROR_NONE == world.host.lastError(1));
	auto result = world.host.last<AttackResultMessage>(1, MSG_ATTACK_RESULT);
	assert(result and result->hit and (10 == result->damageDealt) and (90 == result->targetHealth));
	assert((AttackType::SKILL == result->attackType.kind) and (100 == result->attackType.skillID));
	assert(1 == world.host.count(2, MSG_ATTACK_RESULT));
	assert(2 == world.host.count(2, MSG_STATE_UPDATE)); // target health, caster mana

	world.host.now = t0 + 1500;
	world.skill(1, 100, 2);
	assert(ON_COOLDOWN == world.host.lastError(1));
	assert(1 == world.host.count(2, MSG_ATTACK_RESULT));
	assert(0 == world.host.count(2, MSG_ERROR));

	world.host.now = t0 + 3100;
	world.skill(1, 100, 2);
	assert(2 == world.host.count(2, MSG_ATTACK_RESULT));
	assert(80 == world.health(2));

	world.skill(1, 999, 2);
	assert(UNKNOWN_SKILL == world.host.lastError(1));

	world.skill(1, 102, 2);
	assert(INSUFFICIENT_MANA == world.host.lastError(1));

	world.skill(1, 101, 1);
	assert(INVALID_TARGET == world.host.lastError(1));

	world.skill(1, 101); // damage needs a target
	assert(INVALID_TARGET == world.host.lastError(1));

	// lethal
	world.skill(1, 101, 2);
	auto die = world.host.last<DieMessage>(1, MSG_DIE);
	assert(die and (2 == die->playerID));
	assert(die->hasKillerID and (1 == die->killerID));
	assert(DeathCause::PLAYER_KILL == die->deathCause.kind);
	PlayerRecord record;
	assert(world.dispatcher.findPlayer(2, record) and (STATUS_DEAD == record.status));

	world.host.now += 3000;
	world.skill(1, 100, 2);
	assert(INVALID_TARGET == world.host.lastError(1));
}

static void testHealingAndMana()
{
	OpenAuthenticator auth;
	World world(&auth);

	assert(world.connect(1, "healer", "x")->success);
	assert(world.connect(2, "brute", "y")->success);

	AttackMessage attack;
	attack.target = AttackTarget::player(1);
	attack.attackType = AttackType(AttackType::MELEE_HEAVY);
	world.receive(2, attack);
	uint32_t damage = Dispatcher::computeDamage(10, false, 5);
	assert(100 - damage == world.health(1));

	world.host.clear();
	world.skill(1, 2); // Heal, self
	assert(ERROR_NONE == world.host.lastError(1));
	assert(100 == world.health(1));

	auto mana = world.host.last<StateUpdateMessage>(2, MSG_STATE_UPDATE);
	assert(mana and (1 == mana->playerID));
	assert(mana->stateChanges["mana"] == StateValue(int64_t(80)));

	world.host.now += 5000;
	world.skill(1, 2);
	world.host.now += 5000;
	world.skill(1, 2);
	world.host.now += 5000;
	world.skill(1, 2);
	world.host.now += 5000;
	world.skill(1, 2);
	PlayerRecord record;
	assert(world.dispatcher.findPlayer(1, record) and (0 == record.mana));
	world.host.now += 5000;
	world.skill(1, 2);
	assert(INSUFFICIENT_MANA == world.host.lastError(1));
}

static void testAttacks()
{
	assert(9 == Dispatcher::computeDamage(10, false, 5));
	assert(10 == Dispatcher::computeDamage(10, true, 100));
	assert(1 == Dispatcher::computeDamage(0, false, 0));
	assert(11 == Dispatcher::respawnCooldownSeconds(1));
	assert(60 == Dispatcher::respawnCooldownSeconds(50));
	assert(60 == Dispatcher::respawnCooldownSeconds(1000));

	OpenAuthenticator auth;
	World world(&auth);
	assert(world.connect(1, "attacker", "x")->success);
	assert(world.connect(2, "defender", "y")->success);
	world.host.clear();

	AttackMessage attack;
	attack.target = AttackTarget::player(2);
	attack.attackType = AttackType(AttackType::MELEE_BASIC);
	world.receive(1, attack);

	auto result = world.host.last<AttackResultMessage>(2, MSG_ATTACK_RESULT);
	assert(result and result->hit and (9 == result->damageDealt));
	assert(result->hasTargetHealth and (91 == result->targetHealth));
	assert(world.host.sends.back().delivery.reliable);

	world.receive(1, attack);
	assert(ON_COOLDOWN == world.host.lastError(1));

	world.host.now += 1000;
	attack.target = AttackTarget::player(1);
	world.receive(1, attack);
	assert(INVALID_TARGET == world.host.lastError(1));

	attack.target = AttackTarget::player(77);
	world.receive(1, attack);
	assert(INVALID_TARGET == world.host.lastError(1));

	world.move(2, Position(50, 0, 0));
	attack.target = AttackTarget::player(2);
	world.receive(1, attack);
	assert(OUT_OF_RANGE == world.host.lastError(1));

	// ranged reaches 15
	world.move(2, Position(12, 0, 0));
	world.host.clear();
	attack.attackType = AttackType(AttackType::RANGED);
	world.receive(1, attack);
	assert(ERROR_NONE == world.host.lastError(1));
	assert(82 == world.health(2));

	// area attack at a position, 20 around the point
	world.host.now += 5000;
	world.host.clear();
	attack.target = AttackTarget::at(Position(5, 0, 0));
	attack.attackType = AttackType(AttackType::AREA_OF_EFFECT);
	world.receive(1, attack);
	assert(ERROR_NONE == world.host.lastError(1));
	assert(73 == world.health(2));
	assert(100 == world.health(1));

	// nobody near the point
	world.host.now += 5000;
	world.host.clear();
	attack.target = AttackTarget::at(Position(0, 0, 7));
	world.move(2, Position(40, 0, 0));
	world.receive(1, attack);
	result = world.host.last<AttackResultMessage>(1, MSG_ATTACK_RESULT);
	assert(result and not result->hit);
}

static void testDeathAndRespawn()
{
	OpenAuthenticator auth;
	ServerConfig config;
	World world(&auth, config);
	assert(world.connect(1, "mortal", "x")->success);
	assert(world.connect(2, "witness", "y")->success);

	world.receive(1, RespawnMessage());
	assert(PROTOCOL_ERROR == world.host.lastError(1));

	uint64_t diedAt = world.host.now;
	DieMessage die;
	die.deathCause.kind = DeathCause::ENVIRONMENTAL;
	world.receive(1, die);

	auto announced = world.host.last<DieMessage>(2, MSG_DIE);
	assert(announced and (1 == announced->playerID));
	assert(11 == announced->respawnCooldown);
	assert(0.1f == announced->deathPenalty.durabilityLoss);
	assert(0 == world.health(1));

	world.receive(1, die);
	assert(NOT_ALIVE == world.host.lastError(1));

	world.move(1, Position(1, 0, 1));
	assert(NOT_ALIVE == world.host.lastError(1));

	world.host.now = diedAt + 10999;
	world.receive(1, RespawnMessage());
	assert(ON_COOLDOWN == world.host.lastError(1));
	assert(0 == world.host.count(MSG_RESPAWN_COMPLETE));

	world.host.now = diedAt + 11000;
	world.receive(1, RespawnMessage());
	auto complete = world.host.last<RespawnCompleteMessage>(2, MSG_RESPAWN_COMPLETE);
	assert(complete and (1 == complete->playerID));
	assert(complete->spawnPosition == config.respawnPoint);
	assert((100 == complete->restoredState.health) and (STATUS_ALIVE == complete->restoredState.status));
	assert(100 == world.health(1));
}

static void testProtocolErrors()
{
	OpenAuthenticator auth;
	World world(&auth);
	assert(world.connect(1, "client", "x")->success);
	world.host.clear();

	const uint8_t garbage[] = { 0x7f, 1, 2 };
	world.dispatcher.onMessage(1, garbage, sizeof(garbage));
	assert(PROTOCOL_ERROR == world.host.lastError(1));
	assert(world.host.sends.back().delivery.reliable);

	world.receive(1, MoveUpdateMessage());
	assert(UNKNOWN_MESSAGE == world.host.lastError(1));
	world.receive(1, ErrorMessage(AUTH_FAILED, "spoofed"));
	assert(UNKNOWN_MESSAGE == world.host.lastError(1));

	// a second Connect gets the welcome again
	world.receive(1, ConnectMessage());
	auto welcome = world.host.last<ConnectResponseMessage>(1, MSG_CONNECT_RESPONSE);
	assert(welcome and welcome->success and (1 == welcome->playerID));

	// nothing answers a connection without a player
	world.host.clear();
	world.move(99, Position(1, 0, 1));
	world.dispatcher.onMessage(99, garbage, 1);
	assert(1 == world.host.sends.size()); // undecodable is still reported
	assert(PROTOCOL_ERROR == world.host.lastError(99));
}

static void testDisconnectAndReap()
{
	OpenAuthenticator auth;
	ServerConfig config;
	config.idleUserTimeoutMs = 1000;
	World world(&auth, config);

	assert(world.connect(1, "leaver", "x")->success);
	assert(world.connect(2, "idler", "y")->success);
	assert(world.connect(3, "active", "z")->success);

	DisconnectMessage disconnect;
	disconnect.reason = DISCONNECT_NORMAL;
	world.receive(1, disconnect);

	assert(1 == world.host.closes.size());
	assert((1 == world.host.closes[0].connectionID) and (rudp::CLOSE_NORMAL == world.host.closes[0].reason));
	assert(2 == world.dispatcher.playerCount());
	assert(2 == world.rooms.userCount());
	assert(1 == world.persistence.saved.size());
	assert((1 == world.persistence.saved[0].userID) and not world.persistence.saved[0].connected);

	world.host.now += 800;
	world.move(3, Position(1, 0, 1));
	world.host.now += 800;

	world.host.clear();
	assert(1 == world.dispatcher.reapIdle(world.host.now));
	assert(1 == world.host.closes.size());
	assert((2 == world.host.closes[0].connectionID) and (rudp::CLOSE_IDLE_TIMEOUT == world.host.closes[0].reason));
	assert(1 == world.dispatcher.playerCount());
	assert(2 == world.persistence.saved.size());

	world.dispatcher.onConnectionClosed(3);
	assert(0 == world.dispatcher.playerCount());
	assert(0 == world.rooms.userCount());
	assert(3 == world.persistence.saved.size());

	world.dispatcher.onConnectionClosed(3);
	assert(3 == world.persistence.saved.size());
}

int main(int argc, char *argv[])
{
	testAdmission();
	testTakeover();
	testRoomBroadcast();
	testSkillCooldown();
	testHealingAndMana();
	testAttacks();
	testDeathAndRespawn();
	testProtocolErrors();
	testDisconnectAndReap();

	printf("end.\n");

	return 0;
}
