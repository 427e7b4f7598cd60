// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <csignal>

#include "../include/rudp/GameServer.hpp"
#include "../include/rudp/Log.hpp"

namespace com { namespace arena { namespace game {

namespace {

const Duration SHUTDOWN_GRACE = 5.0;

}

GameServer::Shard::Shard(uint8_t index, const rudp::EndpointConfig &config) :
	m_index(index),
	m_performer(&m_runLoop),
	m_platform(&m_runLoop),
	m_endpoint(&m_platform, config, index)
{
	m_platform.setEndpoint(&m_endpoint);
}

GameServer::GameServer(const ServerConfig &config) :
	m_config(config),
	m_mainPerformer(&m_mainRunLoop),
	m_shuttingDown(false),
	m_shardsRunning(0)
{
	if(m_config.authSecret.empty())
		m_auth.reset(new OpenAuthenticator());
	else
		m_auth.reset(new HmacTokenAuthenticator(m_config.authSecret));

	m_dispatcher.reset(new Dispatcher(this, &m_rooms, &m_skills, m_auth.get(), m_config));
}

GameServer::~GameServer()
{
	for(auto it = m_shards.begin(); it != m_shards.end(); it++)
	{
		Shard *shard = it->get();
		if(shard->m_thread.joinable())
		{
			shard->m_performer.perform([shard] { shard->m_runLoop.stop(); });
			shard->m_thread.join();
		}
		shard->m_performer.close();
		shard->m_platform.close();
	}

	m_mainPerformer.close();
}

bool GameServer::start()
{
	if(not m_config.skillsFile.empty())
	{
		std::string error;
		if(not m_skills.reload(m_config.skillsFile, error))
			return false;
	}

	rudp::Address bindAddr;
	if(not bindAddr.setFromPresentation(m_config.bindAddr.c_str(), false))
	{
		log()->error("can't parse bind address {}", m_config.bindAddr);
		return false;
	}
	bindAddr.setPort(m_config.port);

	// signals are blocked here so the shard threads inherit the mask
	if( (not m_mainRunLoop.registerSignal(SIGINT, [this] { log()->info("interrupted"); shutdown(); }))
	 or (not m_mainRunLoop.registerSignal(SIGTERM, [this] { log()->info("terminated"); shutdown(); }))
	 or (not m_mainRunLoop.registerSignal(SIGHUP, [this] { reloadSkills(); }))
	)
	{
		log()->error("can't register signal handlers");
		return false;
	}

	rudp::EndpointConfig endpointConfig = m_config.toEndpointConfig();
	endpointConfig.maxConnections = std::max(m_config.maxConnections / m_config.threads, size_t(1));

	for(unsigned i = 0; i < m_config.threads; i++)
	{
		std::unique_ptr<Shard> shard(new Shard(uint8_t(i), endpointConfig));
		auto boundAddr = shard->m_platform.bindUdp(bindAddr, m_config.threads > 1);
		if(not boundAddr)
		{
			log()->error("shard {} can't bind {}", i, bindAddr.toPresentation());
			return false;
		}

		wireShard(shard.get());
		log()->info("shard {} listening on {}", i, boundAddr->toPresentation());
		m_shards.push_back(std::move(shard));
	}

	m_shardsRunning = m_shards.size();
	for(auto it = m_shards.begin(); it != m_shards.end(); it++)
	{
		Shard *shard = it->get();
		shard->m_thread = std::thread([shard] { shard->m_runLoop.run(); });
	}

	Duration roomReapInterval = m_config.roomReapIntervalMs / 1000.0;
	m_roomReapTimer = m_mainRunLoop.scheduleRel([this] (const std::shared_ptr<Timer> &sender, Time now) {
		size_t removed = m_rooms.reapEmptyRooms(getCurrentTimeMillis(), m_config.roomReapIntervalMs);
		if(removed)
			log()->debug("reaped {} empty rooms, {} remain", removed, m_rooms.roomCount());
	}, roomReapInterval, roomReapInterval);

	Duration idleReapInterval = std::max(m_config.idleUserTimeoutMs / 10, uint64_t(1000)) / 1000.0;
	m_idleReapTimer = m_mainRunLoop.scheduleRel([this] (const std::shared_ptr<Timer> &sender, Time now) {
		m_dispatcher->reapIdle(getCurrentTimeMillis());
	}, idleReapInterval, idleReapInterval);

	log()->info("game server started with {} shards, {} skills", m_shards.size(), m_skills.snapshot()->size());

	return true;
}

void GameServer::run()
{
	m_mainRunLoop.run();

	for(auto it = m_shards.begin(); it != m_shards.end(); it++)
		if((*it)->m_thread.joinable())
			(*it)->m_thread.join();

	log()->info("game server stopped");
}

void GameServer::wireShard(Shard *shard)
{
	rudp::Endpoint *endpoint = &shard->m_endpoint;

	endpoint->onConnectRequest = [this] (rudp::ConnectRequest &request) {
		return m_dispatcher->handleConnectRequest(request.connectionID, request.payload, request.payloadLength, request.serverFull, request.response);
	};

	endpoint->onConnectionEstablished = [endpoint] (uint32_t connectionID) {
		rudp::Address addr;
		endpoint->getAddress(connectionID, addr);
		log()->debug("connection {} established from {}", connectionID, addr.toPresentation());
	};

	endpoint->onMessage = [this] (uint32_t connectionID, const uint8_t *bytes, size_t len) {
		m_dispatcher->onMessage(connectionID, bytes, len);
	};

	endpoint->onConnectionClosed = [this] (uint32_t connectionID, rudp::CloseReason reason) {
		log()->debug("connection {} closed: {}", connectionID, rudp::closeReasonName(reason));
		m_dispatcher->onConnectionClosed(connectionID);
	};

	shard->m_platform.onShutdownCompleteCallback = [this] {
		m_mainPerformer.perform([this] { onShardShutdownComplete(); });
	};
}

GameServer::Shard * GameServer::shardFor(uint32_t connectionID)
{
	size_t index = connectionID >> rudp::CONNECTION_ID_SHARD_SHIFT;
	return index < m_shards.size() ? m_shards[index].get() : nullptr;
}

bool GameServer::sendBytes(uint32_t connectionID, const Bytes &bytes, const DeliveryClass &delivery)
{
	Shard *shard = shardFor(connectionID);
	if(not shard)
		return false;

	rudp::Endpoint *endpoint = &shard->m_endpoint;
	if(shard->m_runLoop.isRunningInThisThread())
		return endpoint->send(connectionID, bytes, delivery.reliable, delivery.ordered, delivery.priority);

	return shard->m_performer.perform([endpoint, connectionID, bytes, delivery] {
		endpoint->send(connectionID, bytes, delivery.reliable, delivery.ordered, delivery.priority);
	});
}

void GameServer::closeConnection(uint32_t connectionID, rudp::CloseReason reason)
{
	Shard *shard = shardFor(connectionID);
	if(not shard)
		return;

	// always deferred, this can be called from inside an Endpoint callback
	rudp::Endpoint *endpoint = &shard->m_endpoint;
	shard->m_performer.perform([endpoint, connectionID, reason] { endpoint->close(connectionID, reason); });
}

uint64_t GameServer::getCurrentTimeMillis()
{
	return m_rooms.getCurrentTimeMillis();
}

bool GameServer::reloadSkills()
{
	if(m_config.skillsFile.empty())
	{
		log()->info("no skills file configured, nothing to reload");
		return false;
	}

	std::string error;
	return m_skills.reload(m_config.skillsFile, error);
}

void GameServer::shutdown()
{
	if(m_shuttingDown.exchange(true))
		return;

	log()->info("shutting down {} players", m_dispatcher->playerCount());

	ServerNoticeMessage notice;
	notice.noticeType = NOTICE_MAINTENANCE;
	notice.message = "server is shutting down for maintenance";
	notice.priority = PRIORITY_CRITICAL;
	m_dispatcher->broadcastNotice(notice);

	if(m_shards.empty())
	{
		m_mainPerformer.perform([this] { stopAll(); });
		return;
	}

	for(auto it = m_shards.begin(); it != m_shards.end(); it++)
	{
		rudp::Endpoint *endpoint = &(*it)->m_endpoint;
		(*it)->m_performer.perform([endpoint] { endpoint->shutdown(); });
	}

	m_mainPerformer.perform([this] {
		m_mainRunLoop.scheduleRel(Timer::makeAction([this] {
			if(m_shardsRunning)
			{
				log()->warn("graceful shutdown timed out, closing remaining connections");
				for(auto it = m_shards.begin(); it != m_shards.end(); it++)
				{
					rudp::Endpoint *endpoint = &(*it)->m_endpoint;
					(*it)->m_performer.perform([endpoint] { endpoint->shutdown(true); });
				}
			}
		}), SHUTDOWN_GRACE);
	});
}

void GameServer::onShardShutdownComplete()
{
	if(m_shardsRunning and (0 == --m_shardsRunning))
		stopAll();
}

void GameServer::stopAll()
{
	if(m_roomReapTimer)
		m_roomReapTimer->cancel();
	if(m_idleReapTimer)
		m_idleReapTimer->cancel();

	for(auto it = m_shards.begin(); it != m_shards.end(); it++)
	{
		Shard *shard = it->get();
		shard->m_performer.perform([shard] { shard->m_runLoop.stop(); });
	}

	m_mainRunLoop.stop();
}

} } } // namespace com::arena::game
