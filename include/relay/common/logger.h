#pragma once

#include <atomic>
#include <cstdarg>
#include <stdexcept>
#include <string>

#include <relay/log_level_forward.h>
#include <relay/common/logger_forward.h>

namespace relay
{
namespace common
{

// Tags messages with a subsystem name and filters them by level.
//
// A message is emitted only when both this logger's level and the
// process-wide level admit it.
class Logger
{
    // Prefixed to every message.
    const char* mName;

    // Most verbose severity this logger will emit.
    std::atomic<LogLevel> mLevel;

    // Emit an already formatted message.
    void emit(const char* filename,
              unsigned int line,
              int severity,
              const std::string& message) const;

public:
    Logger(const char* name, LogLevel level);

    Logger(const Logger& other) = delete;

    Logger& operator=(const Logger& rhs) = delete;

    // Log an error and return an exception describing it.
    std::runtime_error error(const char* filename,
                             unsigned int line,
                             const char* format,
                             ...) const;

    // Log a formatted message.
    void log(const char* filename,
             unsigned int line,
             int severity,
             const char* format,
             ...) const;

    // Log a message verbatim.
    void log(const char* filename,
             unsigned int line,
             int severity,
             const std::string& message) const;

    void level(LogLevel level);

    LogLevel level() const;

    bool masked(int severity) const;

    const char* name() const;
}; // Logger

} // common
} // relay

