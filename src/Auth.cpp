// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cerrno>
#include <chrono>
#include <cstdlib>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "../include/rudp/Auth.hpp"
#include "../include/rudp/Hex.hpp"
#include "../include/rudp/Log.hpp"

namespace com { namespace arena { namespace game {

namespace {

bool parseDecimal(const std::string &s, uint64_t &dst)
{
	if(s.empty() or (s.size() > 20))
		return false;
	for(auto it = s.begin(); it != s.end(); it++)
		if((*it < '0') or (*it > '9'))
			return false;
	errno = 0;
	unsigned long long v = strtoull(s.c_str(), nullptr, 10);
	if(errno)
		return false;
	dst = v;
	return true;
}

}

HmacTokenAuthenticator::HmacTokenAuthenticator(const std::string &secret, const std::function<uint64_t(void)> &clock) :
	m_secret(secret),
	m_clock(clock)
{
	if(not m_clock)
		m_clock = [] {
			return uint64_t(std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
		};
}

std::string HmacTokenAuthenticator::sign(const std::string &secret, const std::string &message)
{
	uint8_t md[EVP_MAX_MD_SIZE];
	unsigned int mdLen = 0;

	if(not HMAC(EVP_sha256(), secret.data(), int(secret.size()), (const uint8_t *)message.data(), message.size(), md, &mdLen))
		return std::string();

	return Hex::encode(md, mdLen);
}

std::string HmacTokenAuthenticator::mint(PlayerID userID, RoomID roomID, uint64_t expiry) const
{
	std::string message = std::to_string(userID) + "." + std::to_string(roomID) + "." + std::to_string(expiry);
	return message + "." + sign(m_secret, message);
}

bool HmacTokenAuthenticator::validateToken(const std::string &token, UserRecord &dst)
{
	size_t lastDot = token.rfind('.');
	if((std::string::npos == lastDot) or (0 == lastDot))
		return false;

	std::string message = token.substr(0, lastDot);
	std::string signature = token.substr(lastDot + 1);

	size_t dot1 = message.find('.');
	size_t dot2 = std::string::npos == dot1 ? dot1 : message.find('.', dot1 + 1);
	if((std::string::npos == dot2) or (std::string::npos != message.find('.', dot2 + 1)))
		return false;

	uint64_t userID, roomID, expiry;
	if( (not parseDecimal(message.substr(0, dot1), userID))
	 or (not parseDecimal(message.substr(dot1 + 1, dot2 - dot1 - 1), roomID))
	 or (not parseDecimal(message.substr(dot2 + 1), expiry))
	 or (userID > UINT32_MAX)
	 or (roomID > UINT32_MAX)
	)
		return false;

	std::string expected = sign(m_secret, message);
	if(expected.empty() or (expected.size() != signature.size())
	 or (0 != CRYPTO_memcmp(expected.data(), signature.data(), expected.size())))
	{
		log()->debug("rejected token for user {}: bad signature", userID);
		return false;
	}

	if(expiry and (m_clock() >= expiry))
	{
		log()->debug("rejected token for user {}: expired", userID);
		return false;
	}

	dst.userID = PlayerID(userID);
	dst.roomID = RoomID(roomID);
	dst.expiresAt = expiry;
	return true;
}

OpenAuthenticator::OpenAuthenticator() :
	m_nextUserID(1)
{
	log()->warn("open authentication: every non-empty token is accepted, use only for development");
}

bool OpenAuthenticator::validateToken(const std::string &token, UserRecord &dst)
{
	if(token.empty())
		return false;

	dst.userID = m_nextUserID++;
	dst.roomID = 0;
	dst.expiresAt = 0;
	return true;
}

} } } // namespace com::arena::game
