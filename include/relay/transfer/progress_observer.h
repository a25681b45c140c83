#pragma once

#include <cstdint>

namespace relay
{
namespace transfer
{

// Receives progress updates as a transfer proceeds.
//
// progress(...) is called synchronously on the transfer's thread after
// every chunk and so should return promptly.
class ProgressObserver
{
public:
    virtual ~ProgressObserver() = default;

    // totalBytes is zero when the payload's length is unknown.
    virtual void progress(std::uint64_t bytesTransferred,
                          std::uint64_t totalBytes) = 0;
}; // ProgressObserver

} // transfer
} // relay

