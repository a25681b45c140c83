#include <relay/common/database_utilities.h>
#include <relay/common/logging.h>
#include <relay/common/utility.h>
#include <relay/transfer/sqlite_transfer_store.h>
#include <relay/transfer/transfer_database_builder.h>

namespace relay
{
namespace transfer
{

using namespace common;

// Retrieve an optional text field.
static std::string text(Query& query, const char* name)
{
    auto field = query.field(name);

    if (field.null())
        return std::string();

    return field.get<std::string>();
}

std::string truncateError(const std::string& message)
{
    if (message.size() <= MaxErrorLength)
        return message;

    return message.substr(0, MaxErrorLength - 3) + "...";
}

SqliteTransferStore::SqliteTransferStore(common::Logger& logger,
                                         const std::string& path)
  : TransferStore()
  , mDatabase(logger, path)
  , mLogger(logger)
{
    TransferDatabaseBuilder(mDatabase).build();

    LogDebugF(mLogger, "Transfer store opened: %s", path.c_str());
}

void SqliteTransferStore::create(const TransferRecord& record)
{
    withQuery(mDatabase, [&](Query&& query) {
        query = "insert into transfers values ( "
                "  :bucket, "
                "  :bytes_transferred, "
                "  :end_time, "
                "  :error, "
                "  :key_prefix, "
                "  :last_update_time, "
                "  :percentage, "
                "  :s3_key, "
                "  :s3_location, "
                "  :source_url, "
                "  :start_time, "
                "  :status, "
                "  :total_bytes, "
                "  :transfer_id, "
                "  :ttl "
                ")";

        auto optional = [&query](const char* name, const std::string& value) {
            if (value.empty())
                query.param(name).set(nullptr);
            else
                query.param(name).set(value);
        }; // optional

        query.param(":bucket").set(record.mBucket);
        query.param(":bytes_transferred").set(record.mBytesTransferred);
        optional(":end_time", record.mEndTime);
        optional(":error", record.mError);
        optional(":key_prefix", record.mKeyPrefix);
        optional(":last_update_time", record.mLastUpdateTime);
        query.param(":percentage").set(record.mPercentage);
        optional(":s3_key", record.mS3Key);
        optional(":s3_location", record.mS3Location);
        query.param(":source_url").set(record.mSourceURL);
        optional(":start_time", record.mStartTime);
        query.param(":status").set(toString(record.mStatus));
        query.param(":total_bytes").set(record.mTotalBytes);
        query.param(":transfer_id").set(record.mTransferID);

        if (record.mTTL)
            query.param(":ttl").set(record.mTTL);
        else
            query.param(":ttl").set(nullptr);

        query.execute();
    });

    LogDebugF(mLogger, "Transfer %s created", record.mTransferID.c_str());
}

std::optional<TransferRecord> SqliteTransferStore::get(const std::string& transferID)
{
    return withQuery(mDatabase, [&](Query&& query) -> std::optional<TransferRecord> {
        query = "select * "
                "  from transfers "
                " where transfer_id = :transfer_id";

        query.param(":transfer_id").set(transferID);
        query.execute();

        if (!query)
            return std::nullopt;

        TransferRecord record;

        record.mBucket = query.field("bucket").get<std::string>();
        record.mBytesTransferred = query.field("bytes_transferred").get<std::uint64_t>();
        record.mEndTime = text(query, "end_time");
        record.mError = text(query, "error");
        record.mKeyPrefix = text(query, "key_prefix");
        record.mLastUpdateTime = text(query, "last_update_time");
        record.mPercentage = query.field("percentage").get<std::uint32_t>();
        record.mS3Key = text(query, "s3_key");
        record.mS3Location = text(query, "s3_location");
        record.mSourceURL = query.field("source_url").get<std::string>();
        record.mStartTime = text(query, "start_time");
        record.mTotalBytes = query.field("total_bytes").get<std::uint64_t>();
        record.mTransferID = query.field("transfer_id").get<std::string>();

        if (!query.field("ttl").null())
            record.mTTL = query.field("ttl").get<std::int64_t>();

        auto status = toTransferStatus(query.field("status").get<std::string>());

        if (!status)
            throw LogErrorF(mLogger,
                            "Transfer %s has an unknown status",
                            transferID.c_str());

        record.mStatus = *status;

        return record;
    });
}

bool SqliteTransferStore::markComplete(const std::string& transferID,
                                       const std::string& location)
{
    auto now = common::now();
    auto timestamp = iso8601(now);

    auto changed = withQuery(mDatabase, [&](Query&& query) {
        query = "update transfers "
                "   set end_time = :now, "
                "       last_update_time = :now, "
                "       percentage = 100, "
                "       s3_location = :location, "
                "       status = 'completed', "
                "       ttl = :ttl "
                " where transfer_id = :transfer_id "
                "   and status = 'in_progress'";

        query.param(":location").set(location);
        query.param(":now").set(timestamp);
        query.param(":transfer_id").set(transferID);
        query.param(":ttl").set(now + RecordLifetime);
        query.execute();

        return query.changed();
    });

    if (!changed)
        LogWarningF(mLogger,
                    "Transfer %s can't be marked complete",
                    transferID.c_str());

    return changed > 0;
}

bool SqliteTransferStore::markFailed(const std::string& transferID,
                                     const std::string& message)
{
    auto now = common::now();
    auto timestamp = iso8601(now);

    auto changed = withQuery(mDatabase, [&](Query&& query) {
        query = "update transfers "
                "   set end_time = :now, "
                "       error = :error, "
                "       last_update_time = :now, "
                "       status = 'failed', "
                "       ttl = :ttl "
                " where transfer_id = :transfer_id "
                "   and status in ('pending', 'in_progress')";

        query.param(":error").set(truncateError(message));
        query.param(":now").set(timestamp);
        query.param(":transfer_id").set(transferID);
        query.param(":ttl").set(now + RecordLifetime);
        query.execute();

        return query.changed();
    });

    if (!changed)
        LogWarningF(mLogger,
                    "Transfer %s can't be marked failed",
                    transferID.c_str());

    return changed > 0;
}

bool SqliteTransferStore::markInProgress(const std::string& transferID,
                                         const std::string& key)
{
    auto timestamp = iso8601(common::now());

    // Failed and stale transfers may be started again from scratch.
    auto changed = withQuery(mDatabase, [&](Query&& query) {
        query = "update transfers "
                "   set bytes_transferred = 0, "
                "       end_time = null, "
                "       error = null, "
                "       last_update_time = :now, "
                "       percentage = 0, "
                "       s3_key = :s3_key, "
                "       s3_location = null, "
                "       start_time = :now, "
                "       status = 'in_progress', "
                "       total_bytes = 0, "
                "       ttl = null "
                " where transfer_id = :transfer_id "
                "   and status != 'completed'";

        query.param(":now").set(timestamp);
        query.param(":s3_key").set(key);
        query.param(":transfer_id").set(transferID);
        query.execute();

        return query.changed();
    });

    return changed > 0;
}

std::uint64_t SqliteTransferStore::purge(std::int64_t now)
{
    auto removed = withQuery(mDatabase, [&](Query&& query) {
        query = "delete from transfers "
                " where ttl is not null "
                "   and ttl <= :now";

        query.param(":now").set(now);
        query.execute();

        return query.changed();
    });

    if (removed)
        LogInfoF(mLogger,
                 "Purged %llu expired transfer(s)",
                 static_cast<unsigned long long>(removed));

    return removed;
}

bool SqliteTransferStore::updateProgress(const std::string& transferID,
                                         std::uint64_t bytesTransferred,
                                         std::uint64_t totalBytes,
                                         std::uint32_t percentage)
{
    auto timestamp = iso8601(common::now());

    auto changed = withQuery(mDatabase, [&](Query&& query) {
        query = "update transfers "
                "   set bytes_transferred = :bytes_transferred, "
                "       last_update_time = :now, "
                "       percentage = :percentage, "
                "       total_bytes = :total_bytes "
                " where transfer_id = :transfer_id "
                "   and status = 'in_progress'";

        query.param(":bytes_transferred").set(bytesTransferred);
        query.param(":now").set(timestamp);
        query.param(":percentage").set(percentage);
        query.param(":total_bytes").set(totalBytes);
        query.param(":transfer_id").set(transferID);
        query.execute();

        return query.changed();
    });

    return changed > 0;
}

} // transfer
} // relay

