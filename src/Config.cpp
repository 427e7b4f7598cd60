// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <thread>
#include <unistd.h>

#include "../include/rudp/Config.hpp"
#include "../include/rudp/Log.hpp"

namespace com { namespace arena { namespace game {

namespace {

std::string trim(const std::string &s)
{
	size_t begin = s.find_first_not_of(" \t\r\n");
	if(std::string::npos == begin)
		return std::string();
	size_t end = s.find_last_not_of(" \t\r\n");
	return s.substr(begin, end - begin + 1);
}

bool parseUnsigned(const std::string &value, uint64_t &dst)
{
	if(value.empty() or ('-' == value[0]))
		return false;
	char *endp = nullptr;
	errno = 0;
	unsigned long long v = strtoull(value.c_str(), &endp, 10);
	if(errno or (*endp))
		return false;
	dst = v;
	return true;
}

bool parseDouble(const std::string &value, double &dst)
{
	if(value.empty())
		return false;
	char *endp = nullptr;
	errno = 0;
	double v = strtod(value.c_str(), &endp);
	if(errno or (*endp))
		return false;
	dst = v;
	return true;
}

bool parseBool(const std::string &value, bool &dst)
{
	if(("true" == value) or ("yes" == value) or ("on" == value) or ("1" == value))
		dst = true;
	else if(("false" == value) or ("no" == value) or ("off" == value) or ("0" == value))
		dst = false;
	else
		return false;
	return true;
}

template <typename T>
bool setUnsigned(const std::string &key, const std::string &value, T &dst, std::string &error)
{
	uint64_t v;
	if((not parseUnsigned(value, v)) or (v > uint64_t(T(-1))))
	{
		error = "invalid value for " + key + ": " + value;
		return false;
	}
	dst = T(v);
	return true;
}

} // anonymous namespace

ServerConfig::ServerConfig() :
	threads(std::max(std::thread::hardware_concurrency(), 1u))
{}

ServerConfig ServerConfig::development()
{
	ServerConfig rv;
	rv.bindAddr = "127.0.0.1";
	rv.maxConnections = 100;
	rv.logLevel = "debug";
	return rv;
}

ServerConfig ServerConfig::production()
{
	ServerConfig rv;
	rv.bindAddr = "0.0.0.0";
	rv.maxConnections = 2000;
	rv.receiveWindow = 512;
	return rv;
}

bool ServerConfig::preset(const std::string &name, ServerConfig &dst)
{
	if("development" == name)
		dst = development();
	else if("production" == name)
		dst = production();
	else if("default" == name)
		dst = ServerConfig();
	else
		return false;
	return true;
}

bool ServerConfig::set(const std::string &key, const std::string &value, std::string &error)
{
	if("bind_addr" == key)
	{
		bindAddr = value;
		return true;
	}
	if("port" == key)
	{
		uint16_t v;
		if(not setUnsigned(key, value, v, error))
			return false;
		port = v;
		return true;
	}
	if("mtu" == key)                   return setUnsigned(key, value, mtu, error);
	if("max_connections" == key)       return setUnsigned(key, value, maxConnections, error);
	if("heartbeat_interval_ms" == key) return setUnsigned(key, value, heartbeatIntervalMs, error);
	if("idle_timeout_ms" == key)       return setUnsigned(key, value, idleTimeoutMs, error);
	if("ack_delay_ms" == key)          return setUnsigned(key, value, ackDelayMs, error);
	if("ack_threshold" == key)         return setUnsigned(key, value, ackThreshold, error);
	if("min_rto_ms" == key)            return setUnsigned(key, value, minRtoMs, error);
	if("max_rto_ms" == key)            return setUnsigned(key, value, maxRtoMs, error);
	if("max_retries" == key)           return setUnsigned(key, value, maxRetries, error);
	if("send_queue_limit" == key)      return setUnsigned(key, value, sendQueueLimit, error);
	if("receive_window" == key)        return setUnsigned(key, value, receiveWindow, error);
	if("frag_timeout_ms" == key)       return setUnsigned(key, value, fragTimeoutMs, error);
	if("max_frag_bytes" == key)        return setUnsigned(key, value, maxFragBytes, error);
	if("move_broadcast_hz" == key)     return setUnsigned(key, value, moveBroadcastHz, error);
	if("room_reap_interval_ms" == key) return setUnsigned(key, value, roomReapIntervalMs, error);
	if("idle_user_timeout_ms" == key)  return setUnsigned(key, value, idleUserTimeoutMs, error);
	if("threads" == key)               return setUnsigned(key, value, threads, error);
	if("default_room" == key)          return setUnsigned(key, value, defaultRoom, error);
	if("tick_rate" == key)             return setUnsigned(key, value, tickRate, error);

	if(("cwnd_init" == key) or ("ssthresh_init" == key) or ("gold_multiplier" == key))
	{
		double v;
		if(not parseDouble(value, v))
		{
			error = "invalid value for " + key + ": " + value;
			return false;
		}
		if("cwnd_init" == key)
			cwndInit = v;
		else if("ssthresh_init" == key)
			ssthreshInit = v;
		else
			goldMultiplier = float(v);
		return true;
	}

	if("pvp_enabled" == key)
	{
		if(not parseBool(value, pvpEnabled))
		{
			error = "invalid value for " + key + ": " + value;
			return false;
		}
		return true;
	}

	if("log_level" == key)
	{
		logLevel = value;
		return true;
	}
	if("auth_secret" == key)
	{
		authSecret = value;
		return true;
	}
	if("skills_file" == key)
	{
		skillsFile = value;
		return true;
	}
	if("client_version" == key)
	{
		clientVersion = value;
		return true;
	}

	error = "unknown configuration key: " + key;
	return false;
}

bool ServerConfig::loadFile(const std::string &path, std::string &error)
{
	std::ifstream in(path);
	if(not in)
	{
		error = "can't open configuration file: " + path;
		return false;
	}

	std::string line;
	size_t lineNumber = 0;
	while(std::getline(in, line))
	{
		lineNumber++;

		size_t hash = line.find('#');
		if(std::string::npos != hash)
			line.erase(hash);
		line = trim(line);
		if(line.empty())
			continue;

		size_t eq = line.find('=');
		if(std::string::npos == eq)
		{
			error = path + ":" + std::to_string(lineNumber) + ": expected key = value";
			return false;
		}

		std::string key = trim(line.substr(0, eq));
		std::string value = trim(line.substr(eq + 1));
		std::string setError;
		if(not set(key, value, setError))
		{
			error = path + ":" + std::to_string(lineNumber) + ": " + setError;
			return false;
		}
	}

	log()->debug("loaded configuration from {}", path);
	return true;
}

ServerConfig::ParseResult ServerConfig::parseArgs(int argc, char * const argv[], std::string &error)
{
	int ch;

	optind = 1;
	opterr = 0;

	while((ch = getopt(argc, argv, "hvp:b:t:c:s:k:P:")) != -1)
	{
		switch(ch)
		{
		case 'p':
			if(not set("port", optarg, error))
				return PARSE_ERROR;
			break;
		case 'b':
			bindAddr = optarg;
			break;
		case 't':
			if(not set("threads", optarg, error))
				return PARSE_ERROR;
			break;
		case 'c':
			if(not loadFile(optarg, error))
				return PARSE_ERROR;
			break;
		case 's':
			skillsFile = optarg;
			break;
		case 'k':
			authSecret = optarg;
			break;
		case 'P':
			{
				int savedVerbosity = verbosity;
				if(not preset(optarg, *this))
				{
					error = std::string("unknown preset: ") + optarg;
					return PARSE_ERROR;
				}
				verbosity = savedVerbosity;
			}
			break;
		case 'v':
			verbosity++;
			break;
		case 'h':
			return PARSE_HELP;
		default:
			error = std::string("unrecognized option -") + char(optopt);
			return PARSE_ERROR;
		}
	}

	if(optind < argc)
	{
		error = std::string("unexpected argument: ") + argv[optind];
		return PARSE_ERROR;
	}

	return PARSE_OK;
}

std::string ServerConfig::usage(const char *name)
{
	return std::string("usage: ") + name + " [options]\n"
		"  -p port        -- UDP port (default 5000)\n"
		"  -b addr        -- bind address (default 0.0.0.0)\n"
		"  -t threads     -- worker shards (default: hardware concurrency)\n"
		"  -c file        -- load key = value configuration\n"
		"  -s file        -- skill definitions\n"
		"  -k secret      -- HMAC auth secret (default: open authentication)\n"
		"  -P preset      -- development, production or default\n"
		"  -v             -- increase verbose output\n"
		"  -h             -- show this help\n";
}

bool ServerConfig::validate(std::string &error) const
{
	rudp::Address addr;
	if(not addr.setFromPresentation(bindAddr.c_str(), false))
		error = "invalid bind_addr: " + bindAddr;
	else if((port <= 0) or (port > 65535))
		error = "port must be between 1 and 65535";
	else if((mtu < rudp::MIN_MTU) or (mtu > rudp::MAX_MTU))
		error = "mtu must be between 64 and 65507";
	else if(0 == maxConnections)
		error = "max_connections must be positive";
	else if(heartbeatIntervalMs >= idleTimeoutMs)
		error = "heartbeat_interval_ms must be less than idle_timeout_ms";
	else if(minRtoMs > maxRtoMs)
		error = "min_rto_ms must not exceed max_rto_ms";
	else if(0 == maxRetries)
		error = "max_retries must be positive";
	else if(cwndInit < 1)
		error = "cwnd_init must be at least 1";
	else if(ssthreshInit < 2)
		error = "ssthresh_init must be at least 2";
	else if(0 == moveBroadcastHz)
		error = "move_broadcast_hz must be positive";
	else if((threads < 1) or (threads > 256))
		error = "threads must be between 1 and 256";
	else if((0 == receiveWindow) or (receiveWindow > 32767))
		error = "receive_window must be between 1 and 32767";
	else if(0 == sendQueueLimit)
		error = "send_queue_limit must be positive";
	else if(0 == roomReapIntervalMs)
		error = "room_reap_interval_ms must be positive";
	else if(0 == maxFragBytes)
		error = "max_frag_bytes must be positive";
	else if(not (spawnPoint.isValid(worldBounds) and respawnPoint.isValid(worldBounds)))
		error = "spawn points must lie inside the world bounds";
	else
		return true;

	return false;
}

rudp::EndpointConfig ServerConfig::toEndpointConfig() const
{
	rudp::EndpointConfig rv;

	rv.mtu = mtu;
	rv.maxConnections = maxConnections;
	rv.heartbeatInterval = heartbeatIntervalMs / 1000.0;
	rv.idleTimeout = idleTimeoutMs / 1000.0;
	rv.ackDelay = ackDelayMs / 1000.0;
	rv.ackThreshold = ackThreshold;
	rv.minRto = minRtoMs / 1000.0;
	rv.maxRto = maxRtoMs / 1000.0;
	rv.maxRetries = maxRetries;
	rv.cwndInit = cwndInit;
	rv.ssthreshInit = ssthreshInit;
	rv.receiveWindow = receiveWindow;
	rv.sendQueueLimit = sendQueueLimit;
	rv.fragTimeout = fragTimeoutMs / 1000.0;
	rv.maxFragBytes = maxFragBytes;

	return rv;
}

ServerSettings ServerConfig::toServerSettings() const
{
	ServerSettings rv;

	rv.tickRate = tickRate;
	rv.maxPlayers = uint32_t(std::min(maxConnections, size_t(UINT32_MAX)));
	rv.pvpEnabled = pvpEnabled;
	rv.goldMultiplier = goldMultiplier;
	rv.worldBounds = worldBounds;

	return rv;
}

} } } // namespace com::arena::game
