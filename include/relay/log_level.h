#pragma once

#include <optional>
#include <string>

#include <relay/log_level_forward.h>

namespace relay
{

#define DEFINE_LOG_LEVELS(expander) \
    expander(Fatal) \
    expander(Error) \
    expander(Warning) \
    expander(Info) \
    expander(Debug) \
    expander(Verbose)

enum LogLevel : int
{
#define DEFINE_LOG_LEVEL_ENUMERANT(name) log ## name,
    DEFINE_LOG_LEVELS(DEFINE_LOG_LEVEL_ENUMERANT)
#undef DEFINE_LOG_LEVEL_ENUMERANT
    logMax = logVerbose
}; // LogLevel

// Translate a level's name, such as "warning", into a level.
//
// Case is ignored. Returns nothing if the name isn't recognized.
std::optional<LogLevel> toLogLevel(const std::string& name);

const char* toString(LogLevel level);

} // relay

