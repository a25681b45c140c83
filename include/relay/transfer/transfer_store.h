#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <relay/transfer/transfer_record.h>

namespace relay
{
namespace transfer
{

// Where the state of each transfer is kept.
//
// Transition methods return false when the record doesn't exist or isn't
// in a state that permits the transition. Other failures are thrown.
class TransferStore
{
public:
    virtual ~TransferStore() = default;

    // Add a new pending transfer.
    virtual void create(const TransferRecord& record) = 0;

    // Retrieve a transfer's current state.
    virtual std::optional<TransferRecord> get(const std::string& transferID) = 0;

    // Transfer has finished: The object is available at location.
    virtual bool markComplete(const std::string& transferID,
                              const std::string& location) = 0;

    // Transfer has failed for good.
    virtual bool markFailed(const std::string& transferID,
                            const std::string& message) = 0;

    // Transfer is about to begin writing to key.
    virtual bool markInProgress(const std::string& transferID,
                                const std::string& key) = 0;

    // Record how far a running transfer has progressed.
    virtual bool updateProgress(const std::string& transferID,
                                std::uint64_t bytesTransferred,
                                std::uint64_t totalBytes,
                                std::uint32_t percentage) = 0;
}; // TransferStore

} // transfer
} // relay

