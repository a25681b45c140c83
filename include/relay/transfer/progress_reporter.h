#pragma once

#include <cstdint>
#include <string>

#include <relay/common/logger_forward.h>
#include <relay/transfer/progress_observer.h>
#include <relay/transfer/transfer_store.h>

namespace relay
{
namespace transfer
{

struct ProgressReporterConfig
{
    // Persist whenever this many bytes have moved since the last write.
    std::uint64_t mByteThreshold = 100ull * 1024 * 1024;

    // Persist whenever the percentage has moved by this much.
    std::uint32_t mPercentThreshold = 1;
}; // ProgressReporterConfig

// Relays a transfer's progress to an observer and the state store.
class ProgressReporter
{
    // Write the current progress to the store.
    void persist(std::uint64_t bytesTransferred,
                 std::uint64_t totalBytes,
                 std::uint32_t percentage);

    ProgressReporterConfig mConfig;

    // What was last written to the store?
    std::uint64_t mLastBytes;
    std::uint32_t mLastPercentage;

    common::Logger& mLogger;

    // May be null.
    ProgressObserver* mObserver;

    // How many times have we written to the store?
    std::uint64_t mPersisted;

    // Highest percentage reported so far.
    std::uint32_t mReported;

    TransferStore& mStore;

    const std::string mTransferID;

public:
    ProgressReporter(TransferStore& store,
                     const std::string& transferID,
                     ProgressObserver* observer,
                     const ProgressReporterConfig& config,
                     common::Logger& logger);

    // Called once the transfer has finished moving bytes.
    //
    // Always writes to the store.
    void finish(std::uint64_t bytesTransferred, std::uint64_t totalBytes);

    // Called after every chunk.
    void onChunk(std::uint64_t bytesTransferred, std::uint64_t totalBytes);

    // How many times has progress been written to the store?
    std::uint64_t persisted() const;

    // Called once the payload's length is known.
    void start(std::uint64_t totalBytes);
}; // ProgressReporter

} // transfer
} // relay

