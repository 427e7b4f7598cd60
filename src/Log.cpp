// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "../include/rudp/Log.hpp"

namespace com { namespace arena {

namespace {

std::once_flag s_loggerOnce;
std::shared_ptr<spdlog::logger> s_logger;

}

std::shared_ptr<spdlog::logger> log()
{
	std::call_once(s_loggerOnce, [] {
		s_logger = spdlog::get("rudp");
		if(not s_logger)
			s_logger = spdlog::stderr_color_mt("rudp");
		s_logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%l%$ [%t] %v");
		s_logger->set_level(spdlog::level::info);
	});

	return s_logger;
}

bool setLogLevel(const std::string &level)
{
	static const char * const names[] = { "trace", "debug", "info", "warn", "error", "critical", "off" };

	for(size_t i = 0; i < sizeof(names) / sizeof(names[0]); i++)
	{
		if(level == names[i])
		{
			log()->set_level(spdlog::level::level_enum(i));
			return true;
		}
	}

	return false;
}

void setLogVerbosity(int verbosity)
{
	if(verbosity >= 2)
		log()->set_level(spdlog::level::trace);
	else if(1 == verbosity)
		log()->set_level(spdlog::level::debug);
}

} } // namespace com::arena
