#pragma once

/// fanout - server-sent event broker
///
/// Include this file to get the whole library.

#define FANOUT_VERSION_MAJOR 0
#define FANOUT_VERSION_MINOR 1
#define FANOUT_VERSION_PATCH 0

// Core coroutine types
#include "coro/task.hpp"

// Runtime
#include "runtime/scheduler.hpp"

// Synchronization primitives
#include "sync/channel.hpp"
#include "sync/event.hpp"

// Logging
#include "log/logger.hpp"

// Wire format
#include "sse/event.hpp"
#include "sse/writer.hpp"
#include "sse/gzip_writer.hpp"
#include "sse/encoder.hpp"

// Broker
#include "broker/subscription.hpp"
#include "broker/repository.hpp"
#include "broker/memory_repository.hpp"
#include "broker/broker.hpp"

// HTTP edge
#include "http/message.hpp"
#include "http/transport.hpp"
#include "http/stream_handler.hpp"
#include "http/hold_adapter.hpp"

#include "server.hpp"
#include "run.hpp"
