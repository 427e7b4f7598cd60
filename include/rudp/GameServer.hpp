#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

// The game server process: one transport shard per thread, each with its own
// run loop and UDP socket bound with SO_REUSEPORT to the same address, all
// sharing one RoomManager, SkillRuleBook and Dispatcher. The main thread runs
// a control loop for signals and periodic reaping.

#include <atomic>
#include <thread>

#include "Dispatcher.hpp"
#include "EPollRunLoop.hpp"
#include "Performer.hpp"
#include "PosixPlatformAdapter.hpp"

namespace com { namespace arena { namespace game {

class GameServer : public IGameHost {
public:
	GameServer(const ServerConfig &config);
	GameServer(const GameServer&) = delete;
	GameServer& operator= (const GameServer&) = delete;
	~GameServer();

	// Load skills, bind every shard and start their threads. Answers false
	// (having logged why) if any shard can't bind.
	bool start();

	// Run the control loop until shutdown completes. SIGINT and SIGTERM
	// begin a graceful shutdown, SIGHUP reloads the skills file.
	void run();

	// Announce maintenance to every player, then close all connections.
	// Safe from any thread.
	void shutdown();

	bool reloadSkills();

	RoomManager   *getRooms() { return &m_rooms; }
	SkillRuleBook *getSkills() { return &m_skills; }
	Dispatcher    *getDispatcher() { return m_dispatcher.get(); }
	size_t         getShardCount() const { return m_shards.size(); }

	// IGameHost
	bool sendBytes(uint32_t connectionID, const Bytes &bytes, const DeliveryClass &delivery) override;
	void closeConnection(uint32_t connectionID, rudp::CloseReason reason) override;
	uint64_t getCurrentTimeMillis() override;

protected:
	struct Shard {
		Shard(uint8_t index, const rudp::EndpointConfig &config);

		uint8_t                    m_index;
		EPollRunLoop               m_runLoop;
		Performer                  m_performer;
		rudp::PosixPlatformAdapter m_platform;
		rudp::Endpoint             m_endpoint;
		std::thread                m_thread;
	};

	Shard *shardFor(uint32_t connectionID);
	void   wireShard(Shard *shard);
	void   onShardShutdownComplete();
	void   stopAll();

	ServerConfig                          m_config;
	EPollRunLoop                          m_mainRunLoop;
	Performer                             m_mainPerformer;
	RoomManager                           m_rooms;
	SkillRuleBook                         m_skills;
	std::unique_ptr<IAuthenticator>       m_auth;
	std::unique_ptr<Dispatcher>           m_dispatcher;
	std::vector<std::unique_ptr<Shard> >  m_shards;
	std::shared_ptr<Timer>                m_roomReapTimer;
	std::shared_ptr<Timer>                m_idleReapTimer;
	std::atomic_bool                      m_shuttingDown;
	std::atomic<size_t>                   m_shardsRunning;
};

} } } // namespace com::arena::game
