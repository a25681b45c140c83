#pragma once

#include <relay/common/logger.h>
#include <relay/log_level_forward.h>

namespace relay
{
namespace transfer
{

// Worker pool.
common::Logger& executorLogger();

// State database.
common::Logger& storeLogger();

// Engine, sink, reader and reporter.
common::Logger& transferLogger();

// Change the level of every subsystem at once.
void logLevel(LogLevel level);

} // transfer
} // relay

