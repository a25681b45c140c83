#include <relay/log_level.h>
#include <relay/transfer/subsystem_loggers.h>

namespace relay
{
namespace transfer
{

common::Logger& executorLogger()
{
    static common::Logger logger("Executor", logInfo);

    return logger;
}

common::Logger& storeLogger()
{
    static common::Logger logger("Store", logInfo);

    return logger;
}

common::Logger& transferLogger()
{
    static common::Logger logger("Transfer", logInfo);

    return logger;
}

void logLevel(LogLevel level)
{
    executorLogger().level(level);
    storeLogger().level(level);
    transferLogger().level(level);
}

} // transfer
} // relay

