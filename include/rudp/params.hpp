#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include "Timer.hpp"
#include "packet.hpp"

namespace com { namespace arena { namespace rudp {

const size_t DEFAULT_MTU               = 1200;
const size_t MIN_MTU                   = 64;
const size_t MAX_MTU                   = 65507;
const size_t MAX_FRAG_BYTES            = 64 * 1024;
const Time   FRAG_TIMEOUT              = 2.0;
const size_t RECEIVE_WINDOW            = 256;
const size_t DUPLICATE_WINDOW          = 1024;
const Time   ACK_DELAY                 = 0.020;
const size_t ACK_THRESHOLD             = 2;
const Time   MIN_RTO                   = 0.100;
const Time   MAX_RTO                   = 4.0;
const Time   INITIAL_RTO               = 1.0; // before any RTT sample
const unsigned MAX_RETRIES             = 8;
const double CWND_INIT                 = 2;
const double SSTHRESH_INIT             = 64;
const double CWND_MAX                  = RECEIVE_WINDOW;
const double SSTHRESH_MIN              = 2;
const size_t DUPACKS_FOR_LOSS          = 3;
const size_t MAX_BURST                 = 4;
const Time   HEARTBEAT_INTERVAL        = 1.0;
const Time   IDLE_TIMEOUT              = 15.0;
const Time   MIN_CLOSE_LINGER          = 0.010;
const size_t SEND_QUEUE_LIMIT          = 1024;
const size_t DEFAULT_MAX_CONNECTIONS   = 2000;
const uint32_t CONNECTION_ID_SHARD_SHIFT = 24;
const uint8_t UNORDERED_PRIORITY_DEFAULT = 50;

} } } // namespace com::arena::rudp
