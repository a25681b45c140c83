#pragma once

#include <cstdint>
#include <string>

#include <relay/common/logger_forward.h>
#include <relay/transfer/progress_observer.h>

namespace relay
{
namespace transfer
{

// Logs a transfer's progress at regular milestones.
//
// A milestone is reached whenever the percentage has advanced by
// mPercentStep or, if the payload's length is unknown, whenever
// another mByteStep bytes have moved.
class ProgressLogger
  : public ProgressObserver
{
    std::uint64_t mByteStep;

    // How many messages have we emitted?
    std::uint64_t mLogged;

    common::Logger& mLogger;

    // Next milestone, in bytes or percent.
    std::uint64_t mNext;

    std::uint32_t mPercentStep;

    const std::string mTransferID;

public:
    ProgressLogger(const std::string& transferID,
                   common::Logger& logger,
                   std::uint32_t percentStep = 10,
                   std::uint64_t byteStep = 100ull * 1024 * 1024);

    // How many messages have been emitted?
    std::uint64_t logged() const;

    void progress(std::uint64_t bytesTransferred,
                  std::uint64_t totalBytes) override;
}; // ProgressLogger

} // transfer
} // relay

