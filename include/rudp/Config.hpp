#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <string>

#include "rudp.hpp"
#include "GameMessage.hpp"

namespace com { namespace arena { namespace game {

struct ServerConfig {
	ServerConfig();

	// transport
	std::string bindAddr { "0.0.0.0" };
	int         port { 5000 };
	size_t      mtu { rudp::DEFAULT_MTU };
	size_t      maxConnections { rudp::DEFAULT_MAX_CONNECTIONS };
	uint64_t    heartbeatIntervalMs { 1000 };
	uint64_t    idleTimeoutMs { 15000 };
	uint64_t    ackDelayMs { 20 };
	size_t      ackThreshold { rudp::ACK_THRESHOLD };
	uint64_t    minRtoMs { 100 };
	uint64_t    maxRtoMs { 4000 };
	unsigned    maxRetries { rudp::MAX_RETRIES };
	double      cwndInit { rudp::CWND_INIT };
	double      ssthreshInit { rudp::SSTHRESH_INIT };
	size_t      sendQueueLimit { rudp::SEND_QUEUE_LIMIT };
	size_t      receiveWindow { rudp::RECEIVE_WINDOW };
	uint64_t    fragTimeoutMs { 2000 };
	size_t      maxFragBytes { rudp::MAX_FRAG_BYTES };

	// game
	unsigned    moveBroadcastHz { 20 };
	uint64_t    roomReapIntervalMs { 60000 };
	uint64_t    idleUserTimeoutMs { 300000 };
	std::string clientVersion { "1.0" };
	RoomID      defaultRoom { 1 };
	uint32_t    tickRate { 60 };
	bool        pvpEnabled { true };
	float       goldMultiplier { 1 };
	WorldBounds worldBounds;
	Position    spawnPoint { 0, 0, 0 };
	Position    respawnPoint { 2500, 0, 2500 };

	// process
	unsigned    threads; // hardware concurrency, at least 1
	std::string logLevel { "info" };
	std::string authSecret; // empty selects the open (development) authenticator
	std::string skillsFile;

	static ServerConfig development();
	static ServerConfig production();

	// Answers false for an unknown preset name.
	static bool preset(const std::string &name, ServerConfig &dst);

	// Set one recognized key from its textual value. Answers false with error
	// set for an unknown key or an unparseable value.
	bool set(const std::string &key, const std::string &value, std::string &error);

	// key = value lines, # comments and blank lines ignored. Any bad line fails
	// the load; keys before it may already have been applied.
	bool loadFile(const std::string &path, std::string &error);

	enum ParseResult { PARSE_OK, PARSE_HELP, PARSE_ERROR };

	// -p port -b bind_addr -t threads -c file -s skills -k auth_secret
	// -P preset -v (repeatable) -h. A preset replaces everything set before it.
	ParseResult parseArgs(int argc, char * const argv[], std::string &error);
	static std::string usage(const char *name);

	bool validate(std::string &error) const;

	rudp::EndpointConfig toEndpointConfig() const;
	ServerSettings       toServerSettings() const;

	int verbosity { 0 }; // count of -v
};

} } } // namespace com::arena::game
