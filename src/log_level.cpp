#include <relay/common/utility.h>
#include <relay/log_level.h>

namespace relay
{

std::optional<LogLevel> toLogLevel(const std::string& name)
{
    auto upper = common::toUpper(name);

#define DEFINE_LOG_LEVEL_MATCH(name) \
    if (upper == common::toUpper(#name)) \
        return log ## name;

    DEFINE_LOG_LEVELS(DEFINE_LOG_LEVEL_MATCH);

#undef DEFINE_LOG_LEVEL_MATCH

    // Common abbreviation.
    if (upper == "WARN")
        return logWarning;

    return std::nullopt;
}

const char* toString(LogLevel level)
{
    switch (level)
    {
#define DEFINE_LOG_LEVEL_CLAUSE(name) \
    case log ## name: \
        return #name;

        DEFINE_LOG_LEVELS(DEFINE_LOG_LEVEL_CLAUSE);

#undef DEFINE_LOG_LEVEL_CLAUSE
    }

    return "Unknown";
}

} // relay

