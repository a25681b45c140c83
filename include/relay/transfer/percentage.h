#pragma once

#include <cstdint>

namespace relay
{
namespace transfer
{

// floor(bytes / total * 100), capped at 100.
//
// An unknown total (zero) always yields zero.
constexpr std::uint32_t percentage(std::uint64_t bytes, std::uint64_t total)
{
    if (!total)
        return 0;

    if (bytes >= total)
        return 100;

    // Avoid overflowing bytes * 100 on very large payloads.
    if (bytes > UINT64_MAX / 100)
        return static_cast<std::uint32_t>(bytes / (total / 100));

    return static_cast<std::uint32_t>(bytes * 100 / total);
}

} // transfer
} // relay

