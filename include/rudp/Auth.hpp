#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <atomic>
#include <functional>
#include <string>

#include "GameMessage.hpp"

namespace com { namespace arena { namespace game {

struct UserRecord {
	PlayerID userID { 0 };
	RoomID   roomID { 0 }; // 0 for the server's default room
	uint64_t expiresAt { 0 }; // unix seconds, 0 for never
};

// Called on a shard thread during the handshake. Implementations must be
// safe to call from several shards at once.
class IAuthenticator {
public:
	virtual ~IAuthenticator() {}
	virtual bool validateToken(const std::string &token, UserRecord &dst) = 0;
};

// Tokens are "user_id.room_id.expiry.signature" where signature is the
// lowercase hex HMAC-SHA256 of "user_id.room_id.expiry" under the shared
// secret and expiry is unix seconds.
class HmacTokenAuthenticator : public IAuthenticator {
public:
	// clock answers unix seconds; defaults to the system clock.
	HmacTokenAuthenticator(const std::string &secret, const std::function<uint64_t(void)> &clock = nullptr);

	bool validateToken(const std::string &token, UserRecord &dst) override;

	std::string mint(PlayerID userID, RoomID roomID, uint64_t expiry) const;

	static std::string sign(const std::string &secret, const std::string &message);

protected:
	std::string                   m_secret;
	std::function<uint64_t(void)> m_clock;
};

// Development only: any non-empty token is accepted and assigned the next
// sequential user id starting at 1.
class OpenAuthenticator : public IAuthenticator {
public:
	OpenAuthenticator();

	bool validateToken(const std::string &token, UserRecord &dst) override;

protected:
	std::atomic<uint32_t> m_nextUserID;
};

} } } // namespace com::arena::game
