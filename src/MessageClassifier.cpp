// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "../include/rudp/MessageClassifier.hpp"

namespace com { namespace arena { namespace game {

DeliveryClass classify(int type)
{
	switch(type)
	{
	case MSG_CONNECT:
	case MSG_CONNECT_RESPONSE:
	case MSG_DISCONNECT:
		return DeliveryClass { true, true, PRIORITY_SESSION };

	case MSG_ATTACK:
	case MSG_ATTACK_RESULT:
	case MSG_SKILL:
	case MSG_ERROR:
		return DeliveryClass { true, true, PRIORITY_COMBAT };

	case MSG_DIE:
	case MSG_RESPAWN:
	case MSG_RESPAWN_COMPLETE:
		return DeliveryClass { true, true, PRIORITY_CRITICAL_EVENT };

	case MSG_STATE_UPDATE:
		return DeliveryClass { true, false, PRIORITY_STATE };

	case MSG_MOVE:
	case MSG_MOVE_UPDATE:
		return DeliveryClass { false, false, PRIORITY_MOVEMENT };

	default:
		return DeliveryClass { true, false, PRIORITY_DEFAULT };
	}
}

DeliveryClass classify(const GameMessage &msg)
{
	return classify(msg.getType());
}

} } } // namespace com::arena::game
