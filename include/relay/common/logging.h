#pragma once

#include <string>

#include <relay/log_level.h>
#include <relay/logging.h>
#include <relay/common/logger.h>

#define RelayLog1(logger, message, severity) do \
{ \
    if (!(logger).masked((severity))) \
        (logger).log(::relay::log_file_leafname(__FILE__), \
                     __LINE__, \
                     (severity), \
                     std::string(message)); \
} \
while (0)

#define RelayLogF(logger, severity, format, ...) do \
{ \
    if (!(logger).masked((severity))) \
        (logger).log(::relay::log_file_leafname(__FILE__), \
                     __LINE__, \
                     (severity), \
                     (format), \
                     __VA_ARGS__); \
} \
while (0)

#define LogDebug1(logger, message) \
  RelayLog1((logger), (message), ::relay::logDebug)

#define LogDebugF(logger, format, ...) \
  RelayLogF((logger), ::relay::logDebug, (format), __VA_ARGS__)

#define LogInfo1(logger, message) \
  RelayLog1((logger), (message), ::relay::logInfo)

#define LogInfoF(logger, format, ...) \
  RelayLogF((logger), ::relay::logInfo, (format), __VA_ARGS__)

#define LogWarning1(logger, message) \
  RelayLog1((logger), (message), ::relay::logWarning)

#define LogWarningF(logger, format, ...) \
  RelayLogF((logger), ::relay::logWarning, (format), __VA_ARGS__)

// Both of these evaluate to an exception so callers can throw the result.
#define LogError1(logger, message) \
  (logger).error(::relay::log_file_leafname(__FILE__), __LINE__, "%s", std::string(message).c_str())

#define LogErrorF(logger, format, ...) \
  (logger).error(::relay::log_file_leafname(__FILE__), __LINE__, (format), __VA_ARGS__)

