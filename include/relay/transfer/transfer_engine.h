#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <relay/common/logger_forward.h>
#include <relay/transfer/engine_config.h>
#include <relay/transfer/object_store.h>
#include <relay/transfer/progress_observer.h>
#include <relay/transfer/source_reader.h>
#include <relay/transfer/transfer_error.h>
#include <relay/transfer/transfer_store.h>

namespace relay
{
namespace transfer
{

// What should be transferred where.
struct TransferRequest
{
    std::string mBucket;

    // May be empty.
    std::string mKeyPrefix;

    // May be null.
    ProgressObserver* mObserver = nullptr;

    std::string mSourceURL;
    std::string mTransferID;
}; // TransferRequest

// How a transfer turned out.
struct TransferResult
{
    std::uint64_t mBytesTransferred = 0;

    // Present if and only if the transfer failed.
    std::optional<TransferError> mError;

    // Present if and only if the transfer succeeded.
    std::string mS3Location;

    bool mSuccess = false;

    std::string mTransferID;
}; // TransferResult

// Relays a source's payload into the object store.
class TransferEngine
{
    const EngineConfig& mConfig;
    common::Logger& mLogger;
    ObjectStore& mObjects;
    SourceReader& mSource;
    TransferStore& mStore;

public:
    TransferEngine(SourceReader& source,
                   ObjectStore& objects,
                   TransferStore& store,
                   const EngineConfig& config,
                   common::Logger& logger);

    TransferEngine(const TransferEngine& other) = delete;

    TransferEngine& operator=(const TransferEngine& rhs) = delete;

    // Perform a transfer from start to finish.
    //
    // Never throws: Every failure is classified and reported through the
    // result. Any upload initiated before a failure is aborted before this
    // function returns. Repeating a failed transfer restarts it from the
    // first byte and overwrites the destination.
    TransferResult transfer(const TransferRequest& request);
}; // TransferEngine

} // transfer
} // relay

