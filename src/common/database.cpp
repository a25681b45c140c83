#include <sqlite3.h>

#include <relay/common/badge.h>
#include <relay/common/database.h>
#include <relay/common/logging.h>
#include <relay/common/query.h>
#include <relay/common/transaction.h>

namespace relay
{
namespace common
{

// Run a statement that produces no rows.
//
// Returns an empty string on success and a description of the failure
// otherwise.
static std::string exec(sqlite3* handle, const char* statement)
{
    char* message = nullptr;

    auto result = sqlite3_exec(handle, statement, nullptr, nullptr, &message);

    if (result == SQLITE_OK)
        return std::string();

    std::string reason = message ? message : sqlite3_errstr(result);

    sqlite3_free(message);

    return reason;
}

Database::Database(Logger& logger,
                   const std::string& path,
                   std::chrono::milliseconds busyTimeout)
  : mLock()
  , mLogger(logger)
  , mPath(path)
  , mHandle(nullptr)
{
    constexpr auto flags = SQLITE_OPEN_CREATE
                           | SQLITE_OPEN_FULLMUTEX
                           | SQLITE_OPEN_READWRITE;

    auto result = sqlite3_open_v2(mPath.c_str(), &mHandle, flags, nullptr);

    std::string reason;

    if (result != SQLITE_OK)
        reason = sqlite3_errstr(result);

    if (reason.empty())
    {
        result = sqlite3_busy_timeout(mHandle,
                                      static_cast<int>(busyTimeout.count()));

        if (result != SQLITE_OK)
            reason = sqlite3_errstr(result);
    }

    if (reason.empty())
        reason = exec(mHandle, "pragma journal_mode = WAL");

    if (reason.empty())
    {
        LogDebugF(mLogger, "Opened database: %s", mPath.c_str());
        return;
    }

    // Release whatever the open call may have allocated.
    sqlite3_close(mHandle);

    throw LogErrorF(mLogger,
                    "Couldn't open database %s: %s",
                    mPath.c_str(),
                    reason.c_str());
}

Database::~Database()
{
    sqlite3_close(mHandle);

    LogDebugF(mLogger, "Closed database: %s", mPath.c_str());
}

sqlite3* Database::handle(Badge<Query>) const
{
    return mHandle;
}

std::unique_lock<std::mutex> Database::lock()
{
    return std::unique_lock<std::mutex>(mLock);
}

Logger& Database::logger() const
{
    return mLogger;
}

const std::string& Database::path() const
{
    return mPath;
}

Query Database::query()
{
    return Query({}, *this);
}

Transaction Database::transaction()
{
    return Transaction({}, *this);
}

} // common
} // relay

