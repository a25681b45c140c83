#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace relay
{
namespace transfer
{

// enumerant, persisted name
#define DEFINE_TRANSFER_STATUSES(expander) \
    expander(PENDING, pending) \
    expander(IN_PROGRESS, in_progress) \
    expander(COMPLETED, completed) \
    expander(FAILED, failed)

enum TransferStatus : unsigned int
{
#define DEFINE_TRANSFER_STATUS_ENUMERANT(name, text) TRANSFER_ ## name,
    DEFINE_TRANSFER_STATUSES(DEFINE_TRANSFER_STATUS_ENUMERANT)
#undef DEFINE_TRANSFER_STATUS_ENUMERANT
}; // TransferStatus

const char* toString(TransferStatus status);

std::optional<TransferStatus> toTransferStatus(const std::string& text);

// Is status one that permits no further transitions?
bool terminal(TransferStatus status);

// Describes a transfer and how far it has progressed.
//
// Optional text fields are empty when absent.
struct TransferRecord
{
    std::string mBucket;
    std::uint64_t mBytesTransferred = 0;

    // Set only on a terminal transition.
    std::string mEndTime;

    // Present only when the transfer has failed.
    std::string mError;

    std::string mKeyPrefix;
    std::string mLastUpdateTime;
    std::uint32_t mPercentage = 0;

    // Derived by the engine once the transfer starts.
    std::string mS3Key;

    // Present only when the transfer has completed.
    std::string mS3Location;

    std::string mSourceURL;
    std::string mStartTime;
    TransferStatus mStatus = TRANSFER_PENDING;

    // Zero when the payload's length is unknown.
    std::uint64_t mTotalBytes = 0;

    std::string mTransferID;

    // When the store may discard this record, in seconds since the epoch.
    std::int64_t mTTL = 0;
}; // TransferRecord

} // transfer
} // relay

