#include <cassert>
#include <sstream>
#include <thread>

#include <relay/log_level.h>
#include <relay/logging.h>
#include <relay/common/logger.h>
#include <relay/common/utility.h>

namespace relay
{
namespace common
{

void Logger::emit(const char* filename,
                  unsigned int line,
                  int severity,
                  const std::string& message) const
{
    assert(filename);

    std::ostringstream ostream;

    ostream << mName
            << " ["
            << std::this_thread::get_id()
            << "] "
            << message;

    SimpleLogger::postLog(static_cast<LogLevel>(severity),
                          ostream.str().c_str(),
                          filename,
                          static_cast<int>(line));
}

Logger::Logger(const char* name, LogLevel level)
  : mName(name)
  , mLevel(level)
{
    assert(mName);
}

std::runtime_error Logger::error(const char* filename,
                                 unsigned int line,
                                 const char* format,
                                 ...) const
{
    std::va_list arguments;

    va_start(arguments, format);

    auto message = formatv(arguments, format);

    va_end(arguments);

    if (!masked(logError))
        emit(filename, line, logError, message);

    return std::runtime_error(message);
}

void Logger::log(const char* filename,
                 unsigned int line,
                 int severity,
                 const char* format,
                 ...) const
{
    assert(format);

    if (masked(severity))
        return;

    std::va_list arguments;

    va_start(arguments, format);

    auto message = formatv(arguments, format);

    va_end(arguments);

    emit(filename, line, severity, message);
}

void Logger::log(const char* filename,
                 unsigned int line,
                 int severity,
                 const std::string& message) const
{
    if (!masked(severity))
        emit(filename, line, severity, message);
}

void Logger::level(LogLevel level)
{
    mLevel.store(level);
}

LogLevel Logger::level() const
{
    return mLevel.load();
}

bool Logger::masked(int severity) const
{
    assert(severity <= logMax);

    return mLevel.load() < severity
           || SimpleLogger::getLogLevel() < severity;
}

const char* Logger::name() const
{
    return mName;
}

} // common
} // relay

