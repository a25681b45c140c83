/**
 * @file logging.cpp
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

#include <ctime>
#include <iostream>
#include <string>

#include <relay/logging.h>

namespace relay
{

std::atomic<Logger*> SimpleLogger::logger{nullptr};

// by the default, display logs with level equal or less than logInfo
std::atomic<LogLevel> SimpleLogger::logCurrentLevel{logInfo};

ConsoleLogger::ConsoleLogger()
  : ConsoleLogger(std::cerr)
{
}

ConsoleLogger::ConsoleLogger(std::ostream& stream)
  : mLock()
  , mStream(stream)
{
}

void ConsoleLogger::log(const char* time,
                        int loglevel,
                        const char* source,
                        const char* message)
{
    if (!time)
        time = "";

    if (!source)
        source = "";

    if (!message)
        message = "";

    std::lock_guard<std::mutex> guard(mLock);

    mStream << "["
            << time
            << "]["
            << toString(static_cast<LogLevel>(loglevel))
            << "] "
            << message;

    if (*source)
        mStream << " (" << source << ")";

    mStream << std::endl;
}

std::string SimpleLogger::getTime()
{
    char ts[50];
    time_t t = std::time(NULL);
    std::tm tm{};

    gmtime_r(&t, &tm);

    if (std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm)) return ts;

    return {};
}

void SimpleLogger::postLog(LogLevel logLevel,
                           const char* message,
                           const char* filename,
                           int line)
{
    if (logCurrentLevel < logLevel)
        return;

    auto* output = logger.load();

    // Nowhere to send the message.
    if (!output)
        return;

    auto source = std::string(filename ? filename : "");

    if (!source.empty())
        source += ":" + std::to_string(line);

    output->log(getTime().c_str(),
                logLevel,
                source.c_str(),
                message ? message : "");
}

} // relay

