#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace com { namespace arena {

// The shared "rudp" logger, writing to stderr. Created on first use.
std::shared_ptr<spdlog::logger> log();

// Accepts trace, debug, info, warn, error, critical, off.
bool setLogLevel(const std::string &level);

// Each -v raises verbosity one step from info.
void setLogVerbosity(int verbosity);

} } // namespace com::arena
