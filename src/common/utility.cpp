#include <algorithm>
#include <cassert>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

#include <relay/common/utility.h>

namespace relay
{
namespace common
{

std::string format(const char* format, ...)
{
    assert(format);

    std::va_list arguments;

    va_start(arguments, format);

    auto result = formatv(arguments, format);

    va_end(arguments);

    return result;
}

std::string formatv(std::va_list arguments, const char* format)
{
    assert(format);

    std::va_list temp;

    va_copy(temp, arguments);

    auto required = std::vsnprintf(nullptr,
                                   0,
                                   format,
                                   temp);

    va_end(temp);

    // Malformed format string.
    if (required < 0)
        return std::string();

    std::string buffer;

    buffer.resize(static_cast<std::size_t>(required) + 1);

    va_copy(temp, arguments);

    std::vsnprintf(&buffer[0],
                   buffer.size(),
                   format,
                   temp);

    buffer.pop_back();

    va_end(temp);

    return buffer;
}

std::int64_t now()
{
    // Convenience.
    using std::chrono::system_clock;

    // Get our hands on the current time.
    auto now = system_clock::now();

    // Return the current time to our caller as a time_t value.
    return system_clock::to_time_t(now);
}

std::string iso8601(std::int64_t time)
{
    char buffer[32];
    std::tm tm{};
    auto value = static_cast<std::time_t>(time);

    gmtime_r(&value, &tm);

    if (!std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm))
        return std::string();

    return buffer;
}

std::string toLower(std::string value)
{
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char character) {
                       return static_cast<char>(std::tolower(character));
                   });

    return value;
}

std::string toUpper(std::string value)
{
    std::transform(value.begin(),
                   value.end(),
                   value.begin(),
                   [](unsigned char character) {
                       return static_cast<char>(std::toupper(character));
                   });

    return value;
}

std::string trim(const std::string& value)
{
    auto isSpace = [](unsigned char character) {
        return std::isspace(character) != 0;
    }; // isSpace

    auto begin = std::find_if_not(value.begin(), value.end(), isSpace);
    auto end = std::find_if_not(value.rbegin(), value.rend(), isSpace).base();

    if (begin >= end)
        return std::string();

    return std::string(begin, end);
}

} // common
} // relay

