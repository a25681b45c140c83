#pragma once

#include <cstdint>
#include <string>

#include <relay/common/database.h>
#include <relay/common/logger_forward.h>
#include <relay/transfer/transfer_store.h>

namespace relay
{
namespace transfer
{

// How long are terminal records kept?
constexpr std::int64_t RecordLifetime = 30 * 24 * 60 * 60;

// The longest error message we'll store.
constexpr std::size_t MaxErrorLength = 1000;

// Shorten message so that it fits within MaxErrorLength.
std::string truncateError(const std::string& message);

// Keeps transfer state in an SQLite database.
class SqliteTransferStore
  : public TransferStore
{
    common::Database mDatabase;

    common::Logger& mLogger;

public:
    SqliteTransferStore(common::Logger& logger, const std::string& path);

    void create(const TransferRecord& record) override;

    std::optional<TransferRecord> get(const std::string& transferID) override;

    bool markComplete(const std::string& transferID,
                      const std::string& location) override;

    bool markFailed(const std::string& transferID,
                    const std::string& message) override;

    bool markInProgress(const std::string& transferID,
                        const std::string& key) override;

    // Remove terminal records whose lifetime has expired.
    //
    // Returns the number of records removed.
    std::uint64_t purge(std::int64_t now);

    bool updateProgress(const std::string& transferID,
                        std::uint64_t bytesTransferred,
                        std::uint64_t totalBytes,
                        std::uint32_t percentage) override;
}; // SqliteTransferStore

} // transfer
} // relay

