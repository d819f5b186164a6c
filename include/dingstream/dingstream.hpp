// This is the single entry point for the dingstream library.
// Include this file to get access to the core public API.

#pragma once

// Client and its configuration
#include "dingstream/core/client.hpp"
#include "dingstream/core/config.hpp"
#include "dingstream/core/constants.hpp"

// Wire types and payloads
#include "dingstream/core/protocol/stream_protocol.hpp"
#include "dingstream/core/protocol/robot_message.hpp"

// Credentials and negotiation
#include "dingstream/core/auth/credentials.hpp"
#include "dingstream/core/auth/token_negotiator.hpp"

// Public interfaces for extension
#include "dingstream/core/interfaces/ihttp_client.hpp"
#include "dingstream/core/interfaces/ischeduler.hpp"
#include "dingstream/core/interfaces/itransport.hpp"

// Utilities
#include "dingstream/core/util/conn_state.hpp"
#include "dingstream/core/util/error_types.hpp"
#include "dingstream/core/util/logger.hpp"
#include "dingstream/core/util/thread_pool.hpp"
