#include <cassert>
#include <cstdio>

#include "rudp/MessageClassifier.hpp"

using namespace com::arena::game;

static void check(int type, bool reliable, bool ordered, uint8_t priority)
{
	DeliveryClass delivery = classify(type);
	assert(reliable == delivery.reliable);
	assert(ordered == delivery.ordered);
	assert(priority == delivery.priority);
}

int main(int argc, char *argv[])
{
	check(MSG_CONNECT,          true,  true,  PRIORITY_SESSION);
	check(MSG_CONNECT_RESPONSE, true,  true,  PRIORITY_SESSION);
	check(MSG_DISCONNECT,       true,  true,  PRIORITY_SESSION);
	check(MSG_MOVE,             false, false, PRIORITY_MOVEMENT);
	check(MSG_MOVE_UPDATE,      false, false, PRIORITY_MOVEMENT);
	check(MSG_ATTACK,           true,  true,  PRIORITY_COMBAT);
	check(MSG_ATTACK_RESULT,    true,  true,  PRIORITY_COMBAT);
	check(MSG_SKILL,            true,  true,  PRIORITY_COMBAT);
	check(MSG_ERROR,            true,  true,  PRIORITY_COMBAT);
	check(MSG_DIE,              true,  true,  PRIORITY_CRITICAL_EVENT);
	check(MSG_RESPAWN,          true,  true,  PRIORITY_CRITICAL_EVENT);
	check(MSG_RESPAWN_COMPLETE, true,  true,  PRIORITY_CRITICAL_EVENT);
	check(MSG_STATE_UPDATE,     true,  false, PRIORITY_STATE);
	check(MSG_SERVER_NOTICE,    true,  false, PRIORITY_DEFAULT);

	// lower values go first
	assert(PRIORITY_CRITICAL_EVENT < PRIORITY_COMBAT);
	assert(PRIORITY_COMBAT < PRIORITY_SESSION);
	assert(PRIORITY_STATE < PRIORITY_MOVEMENT);

	MoveMessage move;
	DeliveryClass delivery = classify(move);
	assert((not delivery.reliable) and (PRIORITY_MOVEMENT == delivery.priority));

	printf("end.\n");

	return 0;
}
