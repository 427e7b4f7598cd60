#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "GameMessage.hpp"

namespace com { namespace arena { namespace game {

// How a game message rides the transport. Lower priority values are sent
// first.
struct DeliveryClass {
	bool    reliable;
	bool    ordered;
	uint8_t priority;
};

const uint8_t PRIORITY_CRITICAL_EVENT = 0;   // Die, Respawn
const uint8_t PRIORITY_COMBAT         = 1;   // Attack, Skill, Error
const uint8_t PRIORITY_SESSION        = 2;   // Connect, Disconnect
const uint8_t PRIORITY_STATE          = 3;
const uint8_t PRIORITY_DEFAULT        = 50;
const uint8_t PRIORITY_MOVEMENT       = 100;

DeliveryClass classify(int type);
DeliveryClass classify(const GameMessage &msg);

} } } // namespace com::arena::game
