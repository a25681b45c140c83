#pragma once

#include <cstdarg>
#include <cstdint>
#include <string>

namespace relay
{
namespace common
{

std::string format(const char* format, ...);

std::string formatv(std::va_list arguments, const char* format);

// Current time as seconds since the epoch.
std::int64_t now();

// Render an epoch time as an ISO-8601 UTC timestamp.
std::string iso8601(std::int64_t time);

std::string toLower(std::string value);

std::string toUpper(std::string value);

// Strip leading and trailing whitespace.
std::string trim(const std::string& value);

} // common
} // relay

