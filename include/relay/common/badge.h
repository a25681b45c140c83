#pragma once

namespace relay
{
namespace common
{

// Restricts who can call a function.
//
// Only T can construct a Badge<T>, so only T can call functions that
// require one as a parameter.
template<typename T>
class Badge
{
    friend T;

    Badge() = default;

public:
    Badge(const Badge& other) = default;

    ~Badge() = default;
}; // Badge<T>

} // common
} // relay

