/**
 * @file relay/logging.h
 * @brief Logging class
 *
 * (c) 2013-2014 by Mega Limited, Auckland, New Zealand
 *
 * This file is part of relay.
 *
 * relay is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>

#include <relay/log_level.h>

namespace relay
{

// Output Log Interface
class Logger
{
public:
    virtual ~Logger() = default;

    virtual void log(const char* time,
                     int loglevel,
                     const char* source,
                     const char* message) = 0;
}; // Logger

// Writes log messages to a stream, one line per message.
class ConsoleLogger
  : public Logger
{
    // Serializes access to mStream.
    std::mutex mLock;

    // Where should we write our messages?
    std::ostream& mStream;

public:
    ConsoleLogger();

    explicit ConsoleLogger(std::ostream& stream);

    void log(const char* time,
             int loglevel,
             const char* source,
             const char* message) override;
}; // ConsoleLogger

class SimpleLogger
{
    // Where should messages be sent?
    static std::atomic<Logger*> logger;

    // Messages above this level are discarded.
    static std::atomic<LogLevel> logCurrentLevel;

    static std::string getTime();

public:
    SimpleLogger() = delete;

    static LogLevel getLogLevel()
    {
        return logCurrentLevel;
    }

    static void setLogLevel(LogLevel level)
    {
        logCurrentLevel = level;
    }

    // Specify where messages should be sent.
    //
    // Passing nullptr discards all messages.
    static void setOutputClass(Logger* output)
    {
        logger = output;
    }

    static void postLog(LogLevel logLevel,
                        const char* message,
                        const char* filename,
                        int line);
}; // SimpleLogger

// source file leaf name - maybe to be compile time calculated one day
template<std::size_t N> inline const char* log_file_leafname(const char (&fullpath)[N])
{
    for (auto i = N - 1; --i; )
    {
        if (fullpath[i] == '/' || fullpath[i] == '\\')
            return &fullpath[i+1];
    }
    return fullpath;
}

} // relay

