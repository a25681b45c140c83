#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include <relay/common/utility.h>
#include <relay/transfer/sqlite_transfer_store.h>
#include <relay/transfer/subsystem_loggers.h>

#include "transfer_fakes.h"

using namespace relay::testing;
using namespace relay::transfer;

namespace
{

TransferRecord pending(const std::string& transferID)
{
    TransferRecord record;

    record.mBucket = "bucket";
    record.mKeyPrefix = "prefix";
    record.mSourceURL = "https://example.com/file.zip";
    record.mTransferID = transferID;

    return record;
}

class SqliteTransferStoreTest
  : public ::testing::Test
{
protected:
    SqliteTransferStoreTest()
      : ::testing::Test()
      , mFile("transfers.db")
      , mStore(storeLogger(), mFile.path())
    {
    }

    TemporaryFile mFile;
    SqliteTransferStore mStore;
}; // SqliteTransferStoreTest

} // anonymous

TEST(TransferStatus, Names)
{
    EXPECT_STREQ("pending", toString(TRANSFER_PENDING));
    EXPECT_STREQ("in_progress", toString(TRANSFER_IN_PROGRESS));
    EXPECT_STREQ("completed", toString(TRANSFER_COMPLETED));
    EXPECT_STREQ("failed", toString(TRANSFER_FAILED));

    EXPECT_EQ(TRANSFER_IN_PROGRESS, toTransferStatus("in_progress"));
    EXPECT_FALSE(toTransferStatus("bogus"));

    EXPECT_FALSE(terminal(TRANSFER_PENDING));
    EXPECT_FALSE(terminal(TRANSFER_IN_PROGRESS));
    EXPECT_TRUE(terminal(TRANSFER_COMPLETED));
    EXPECT_TRUE(terminal(TRANSFER_FAILED));
}

TEST(TruncateError, LongMessagesAreShortened)
{
    std::string message(1500, 'x');

    auto truncated = truncateError(message);

    EXPECT_EQ(MaxErrorLength, truncated.size());
    EXPECT_EQ("...", truncated.substr(truncated.size() - 3));

    EXPECT_EQ("short", truncateError("short"));
    EXPECT_EQ(std::string(MaxErrorLength, 'y'),
              truncateError(std::string(MaxErrorLength, 'y')));
}

TEST_F(SqliteTransferStoreTest, CreateAndGet)
{
    mStore.create(pending("t1"));

    auto record = mStore.get("t1");

    ASSERT_TRUE(record);
    EXPECT_EQ("bucket", record->mBucket);
    EXPECT_EQ(0u, record->mBytesTransferred);
    EXPECT_TRUE(record->mEndTime.empty());
    EXPECT_TRUE(record->mError.empty());
    EXPECT_EQ("prefix", record->mKeyPrefix);
    EXPECT_EQ(0u, record->mPercentage);
    EXPECT_TRUE(record->mS3Key.empty());
    EXPECT_TRUE(record->mS3Location.empty());
    EXPECT_EQ("https://example.com/file.zip", record->mSourceURL);
    EXPECT_EQ(TRANSFER_PENDING, record->mStatus);
    EXPECT_EQ(0u, record->mTotalBytes);
    EXPECT_EQ("t1", record->mTransferID);
    EXPECT_EQ(0, record->mTTL);
}

TEST_F(SqliteTransferStoreTest, GetUnknownTransfer)
{
    EXPECT_FALSE(mStore.get("missing"));
}

TEST_F(SqliteTransferStoreTest, DuplicateTransfersAreRejected)
{
    mStore.create(pending("t1"));

    EXPECT_THROW(mStore.create(pending("t1")), std::runtime_error);
}

TEST_F(SqliteTransferStoreTest, SuccessfulLifecycle)
{
    mStore.create(pending("t1"));

    ASSERT_TRUE(mStore.markInProgress("t1", "prefix/file.zip"));

    auto record = mStore.get("t1");

    ASSERT_TRUE(record);
    EXPECT_EQ(TRANSFER_IN_PROGRESS, record->mStatus);
    EXPECT_EQ("prefix/file.zip", record->mS3Key);
    EXPECT_FALSE(record->mStartTime.empty());
    EXPECT_EQ(record->mStartTime, record->mLastUpdateTime);

    EXPECT_TRUE(mStore.updateProgress("t1", 400, 1000, 40));

    record = mStore.get("t1");

    ASSERT_TRUE(record);
    EXPECT_EQ(400u, record->mBytesTransferred);
    EXPECT_EQ(1000u, record->mTotalBytes);
    EXPECT_EQ(40u, record->mPercentage);

    auto before = relay::common::now();

    EXPECT_TRUE(mStore.markComplete("t1", "s3://bucket/prefix/file.zip"));

    record = mStore.get("t1");

    ASSERT_TRUE(record);
    EXPECT_EQ(TRANSFER_COMPLETED, record->mStatus);
    EXPECT_EQ("s3://bucket/prefix/file.zip", record->mS3Location);
    EXPECT_EQ(100u, record->mPercentage);
    EXPECT_FALSE(record->mEndTime.empty());
    EXPECT_GE(record->mTTL, before + RecordLifetime);
    EXPECT_TRUE(record->mError.empty());
}

TEST_F(SqliteTransferStoreTest, FailedLifecycle)
{
    mStore.create(pending("t1"));

    ASSERT_TRUE(mStore.markInProgress("t1", "prefix/file.zip"));
    EXPECT_TRUE(mStore.markFailed("t1", std::string(2000, 'e')));

    auto record = mStore.get("t1");

    ASSERT_TRUE(record);
    EXPECT_EQ(TRANSFER_FAILED, record->mStatus);
    EXPECT_EQ(MaxErrorLength, record->mError.size());
    EXPECT_FALSE(record->mEndTime.empty());
    EXPECT_NE(0, record->mTTL);
    EXPECT_TRUE(record->mS3Location.empty());
}

TEST_F(SqliteTransferStoreTest, PendingTransfersCanFail)
{
    mStore.create(pending("t1"));

    EXPECT_TRUE(mStore.markFailed("t1", "Source file not found: HTTP 404"));

    auto record = mStore.get("t1");

    ASSERT_TRUE(record);
    EXPECT_EQ(TRANSFER_FAILED, record->mStatus);
    EXPECT_EQ("Source file not found: HTTP 404", record->mError);
}

TEST_F(SqliteTransferStoreTest, TerminalStatesAreFinal)
{
    mStore.create(pending("t1"));

    ASSERT_TRUE(mStore.markInProgress("t1", "key"));
    ASSERT_TRUE(mStore.markComplete("t1", "s3://bucket/key"));

    EXPECT_FALSE(mStore.markFailed("t1", "too late"));
    EXPECT_FALSE(mStore.markComplete("t1", "s3://bucket/other"));
    EXPECT_FALSE(mStore.markInProgress("t1", "key"));
    EXPECT_FALSE(mStore.updateProgress("t1", 1, 1, 100));

    auto record = mStore.get("t1");

    ASSERT_TRUE(record);
    EXPECT_EQ(TRANSFER_COMPLETED, record->mStatus);
    EXPECT_EQ("s3://bucket/key", record->mS3Location);
    EXPECT_TRUE(record->mError.empty());
}

TEST_F(SqliteTransferStoreTest, FailedTransfersCanBeRetried)
{
    mStore.create(pending("t1"));

    ASSERT_TRUE(mStore.markInProgress("t1", "key"));
    ASSERT_TRUE(mStore.updateProgress("t1", 500, 1000, 50));
    ASSERT_TRUE(mStore.markFailed("t1", "Network interruption"));

    EXPECT_TRUE(mStore.markInProgress("t1", "key"));

    auto record = mStore.get("t1");

    ASSERT_TRUE(record);
    EXPECT_EQ(TRANSFER_IN_PROGRESS, record->mStatus);
    EXPECT_EQ(0u, record->mBytesTransferred);
    EXPECT_EQ(0u, record->mPercentage);
    EXPECT_TRUE(record->mError.empty());
    EXPECT_TRUE(record->mEndTime.empty());
    EXPECT_EQ(0, record->mTTL);
}

TEST_F(SqliteTransferStoreTest, CompleteRequiresInProgress)
{
    mStore.create(pending("t1"));

    EXPECT_FALSE(mStore.markComplete("t1", "s3://bucket/key"));
    EXPECT_FALSE(mStore.updateProgress("t1", 1, 2, 50));

    auto record = mStore.get("t1");

    ASSERT_TRUE(record);
    EXPECT_EQ(TRANSFER_PENDING, record->mStatus);
}

TEST_F(SqliteTransferStoreTest, UnknownTransfersAreNotChanged)
{
    EXPECT_FALSE(mStore.markInProgress("missing", "key"));
    EXPECT_FALSE(mStore.markComplete("missing", "s3://bucket/key"));
    EXPECT_FALSE(mStore.markFailed("missing", "failed"));
    EXPECT_FALSE(mStore.updateProgress("missing", 1, 2, 50));
}

TEST_F(SqliteTransferStoreTest, PurgeRemovesExpiredRecords)
{
    mStore.create(pending("done"));
    mStore.create(pending("running"));

    ASSERT_TRUE(mStore.markInProgress("done", "key"));
    ASSERT_TRUE(mStore.markComplete("done", "s3://bucket/key"));
    ASSERT_TRUE(mStore.markInProgress("running", "key"));

    auto ttl = mStore.get("done")->mTTL;

    // Nothing has expired yet.
    EXPECT_EQ(0u, mStore.purge(ttl - 1));
    EXPECT_TRUE(mStore.get("done"));

    EXPECT_EQ(1u, mStore.purge(ttl));
    EXPECT_FALSE(mStore.get("done"));

    // Running transfers never expire.
    EXPECT_TRUE(mStore.get("running"));
}

TEST_F(SqliteTransferStoreTest, StatePersists)
{
    mStore.create(pending("t1"));

    ASSERT_TRUE(mStore.markInProgress("t1", "key"));

    SqliteTransferStore other(storeLogger(), mFile.path());

    auto record = other.get("t1");

    ASSERT_TRUE(record);
    EXPECT_EQ(TRANSFER_IN_PROGRESS, record->mStatus);
}
