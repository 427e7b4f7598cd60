#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

#include "rudp/EPollRunLoop.hpp"
#include "rudp/GameMessage.hpp"
#include "rudp/Hex.hpp"
#include "rudp/Log.hpp"
#include "rudp/MessageClassifier.hpp"
#include "rudp/PosixPlatformAdapter.hpp"

using namespace com::arena;
using namespace com::arena::rudp;
using namespace com::arena::game;

namespace {

int verbose = 0;

void printMessage(const GameMessage &msg)
{
	switch(msg.getType())
	{
	case MSG_CONNECT_RESPONSE:
		{
			const ConnectResponseMessage &rsp = static_cast<const ConnectResponseMessage &>(msg);
			printf("ConnectResponse success:%d player:%u \"%s\"\n", rsp.success, rsp.playerID, rsp.message.c_str());
			if(rsp.hasSpawnPosition)
				printf("  spawn: %.1f %.1f %.1f\n", rsp.spawnPosition.x, rsp.spawnPosition.y, rsp.spawnPosition.z);
		}
		break;

	case MSG_MOVE_UPDATE:
		{
			const MoveUpdateMessage &update = static_cast<const MoveUpdateMessage &>(msg);
			printf("MoveUpdate player:%u at %.1f %.1f %.1f\n", update.playerID, update.currentPosition.x, update.currentPosition.y, update.currentPosition.z);
		}
		break;

	case MSG_ATTACK_RESULT:
		{
			const AttackResultMessage &result = static_cast<const AttackResultMessage &>(msg);
			printf("AttackResult attacker:%u hit:%d damage:%u\n", result.attackerID, result.hit, result.damageDealt);
		}
		break;

	case MSG_ERROR:
		{
			const ErrorMessage &error = static_cast<const ErrorMessage &>(msg);
			printf("Error %s (%u): %s\n", errorCodeName(error.code), unsigned(error.code), error.message.c_str());
		}
		break;

	case MSG_SERVER_NOTICE:
		printf("ServerNotice: %s\n", static_cast<const ServerNoticeMessage &>(msg).message.c_str());
		break;

	default:
		printf("%s\n", messageTypeName(msg.getType()));
		break;
	}
	fflush(stdout);
}

}

static int usage(const char *name, const char *message = nullptr)
{
	if(message)
		printf("%s\n", message);
	printf("usage: %s [options] serveraddr serverport\n", name);
	printf("  -n name     -- player name (default player)\n");
	printf("  -t token    -- auth token (default dev)\n");
	printf("  -V version  -- client version (default 1.0)\n");
	printf("  -m count    -- moves to send (default 20)\n");
	printf("  -v          -- increase verbosity, dump messages in hex\n");
	printf("  -h          -- show this help\n");
	return 1;
}

int main(int argc, char * const argv[])
{
	const char *name = "player";
	const char *token = "dev";
	const char *version = "1.0";
	int moves = 20;
	int ch;

	while((ch = getopt(argc, argv, "hvn:t:V:m:")) != -1)
	{
		switch(ch)
		{
		case 'v':
			verbose++;
			break;
		case 'n':
			name = optarg;
			break;
		case 't':
			token = optarg;
			break;
		case 'V':
			version = optarg;
			break;
		case 'm':
			moves = atoi(optarg);
			break;
		case 'h':
		default:
			return usage(argv[0]);
		}
	}

	if(argc - optind != 2)
		return usage(argv[0], "specify serveraddr serverport");

	Address serverAddr;
	if(not serverAddr.setFromPresentation(argv[optind], false))
		return usage(argv[0], "can't parse serveraddr");
	serverAddr.setPort(atoi(argv[optind + 1]));

	setLogVerbosity(verbose);

	EPollRunLoop rl;
	PosixPlatformAdapter platform(&rl);
	platform.onShutdownCompleteCallback = [&rl] { printf("shutdown complete\n"); rl.stop(); };

	auto endpoint = share_ref(new Endpoint(&platform), false);
	platform.setEndpoint(endpoint.get());

	if(not platform.bindUdp(0, serverAddr.getFamily()))
		return 1;

	auto sendMessage = [endpoint] (uint32_t connectionID, const GameMessage &msg) {
		DeliveryClass delivery = classify(msg);
		Bytes bytes = msg.encode();
		if(verbose)
			Hex::dump(messageTypeName(msg.getType()), bytes.data(), bytes.size());
		return endpoint->send(connectionID, bytes, delivery.reliable, delivery.ordered, delivery.priority);
	};

	Position position;
	std::shared_ptr<Timer> moveTimer;

	endpoint->onConnectResponse = [&] (uint32_t connectionID, const uint8_t *bytes, size_t len, bool accepted) {
		auto msg = GameMessage::decode(bytes, len);
		if(msg)
			printMessage(*msg);
		if(not accepted)
		{
			printf("connection refused\n");
			endpoint->shutdown();
			return;
		}

		if(msg and (MSG_CONNECT_RESPONSE == msg->getType()))
			position = static_cast<const ConnectResponseMessage &>(*msg).spawnPosition;

		int remaining = moves;
		moveTimer = rl.scheduleRel([&, connectionID, remaining] (const std::shared_ptr<Timer> &sender, Time now) mutable {
			if(remaining-- > 0)
			{
				MoveMessage move;
				position.x += 1;
				move.targetPosition = position;
				move.direction = Direction(1, 0, 0);
				move.clientTimestamp = uint64_t(now * 1000);
				sendMessage(connectionID, move);
				return;
			}

			sender->cancel();

			AttackMessage attack;
			attack.target = AttackTarget::at(Position(position.x + 2, position.y, position.z));
			attack.attackType = AttackType(AttackType::MELEE_BASIC);
			sendMessage(connectionID, attack);

			DisconnectMessage disconnect;
			disconnect.reason = DISCONNECT_NORMAL;
			sendMessage(connectionID, disconnect);
		}, 0.1, 0.1);
	};

	endpoint->onMessage = [] (uint32_t connectionID, const uint8_t *bytes, size_t len) {
		if(verbose)
			Hex::dump("received", bytes, len);
		auto msg = GameMessage::decode(bytes, len);
		if(msg)
			printMessage(*msg);
		else
			printf("undecodable message (%lu bytes)\n", (unsigned long)len);
	};

	endpoint->onConnectionClosed = [&] (uint32_t connectionID, CloseReason reason) {
		printf("connection closed: %s\n", closeReasonName(reason));
		if(moveTimer)
			moveTimer->cancel();
		endpoint->shutdown();
	};

	ConnectMessage connect;
	connect.playerName = name;
	connect.authToken = token;
	connect.clientVersion = version;
	if(0 == endpoint->connect(serverAddr, connect.encode()))
		return 1;

	rl.scheduleRel(Timer::makeAction([endpoint] { printf("giving up\n"); endpoint->shutdown(true); }), 30, 0);
	rl.run();

	platform.close();
	endpoint.reset();

	printf("end.\n");

	return 0;
}
