#pragma once

#include <chrono>
#include <mutex>
#include <string>

#include <relay/common/database_forward.h>
#include <relay/common/logger_forward.h>

struct sqlite3;

namespace relay
{
namespace common
{

// An SQLite database shared by every thread in the process.
//
// Other processes may open the same file: Writers wait up to the busy
// timeout for each other before giving up.
class Database
{
    // Serializes this process' transactions.
    std::mutex mLock;

    Logger& mLogger;

    std::string mPath;

    sqlite3* mHandle;

public:
    Database(Logger& logger,
             const std::string& path,
             std::chrono::milliseconds busyTimeout = std::chrono::seconds(5));

    Database(const Database& other) = delete;

    ~Database();

    Database& operator=(const Database& rhs) = delete;

    // Only queries may touch the raw handle.
    sqlite3* handle(Badge<Query> badge) const;

    std::unique_lock<std::mutex> lock();

    Logger& logger() const;

    const std::string& path() const;

    Query query();

    Transaction transaction();
}; // Database

} // common
} // relay

