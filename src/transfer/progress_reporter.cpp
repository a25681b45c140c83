#include <algorithm>

#include <relay/common/logging.h>
#include <relay/transfer/percentage.h>
#include <relay/transfer/progress_reporter.h>

namespace relay
{
namespace transfer
{

void ProgressReporter::persist(std::uint64_t bytesTransferred,
                               std::uint64_t totalBytes,
                               std::uint32_t percentage)
{
    mLastBytes = bytesTransferred;
    mLastPercentage = percentage;

    ++mPersisted;

    // Keep bytesTransferred within the declared total.
    if (totalBytes)
        totalBytes = std::max(totalBytes, bytesTransferred);

    try
    {
        mStore.updateProgress(mTransferID,
                              bytesTransferred,
                              totalBytes,
                              percentage);
    }
    catch (std::exception& exception)
    {
        // Progress is best-effort.
        LogWarningF(mLogger,
                    "Unable to persist progress of transfer %s: %s",
                    mTransferID.c_str(),
                    exception.what());
    }
}

ProgressReporter::ProgressReporter(TransferStore& store,
                                   const std::string& transferID,
                                   ProgressObserver* observer,
                                   const ProgressReporterConfig& config,
                                   common::Logger& logger)
  : mConfig(config)
  , mLastBytes(0)
  , mLastPercentage(0)
  , mLogger(logger)
  , mObserver(observer)
  , mPersisted(0)
  , mReported(0)
  , mStore(store)
  , mTransferID(transferID)
{
}

void ProgressReporter::finish(std::uint64_t bytesTransferred,
                              std::uint64_t totalBytes)
{
    auto percent = std::max(mReported, percentage(bytesTransferred, totalBytes));

    mReported = percent;

    LogInfoF(mLogger,
             "Transferred %llu bytes (%u%%)",
             static_cast<unsigned long long>(bytesTransferred),
             percent);

    persist(bytesTransferred, totalBytes, percent);
}

void ProgressReporter::onChunk(std::uint64_t bytesTransferred,
                               std::uint64_t totalBytes)
{
    // Percentages never go backwards.
    auto percent = std::max(mReported, percentage(bytesTransferred, totalBytes));

    mReported = percent;

    if (mObserver)
    {
        try
        {
            mObserver->progress(bytesTransferred, totalBytes);
        }
        catch (std::exception& exception)
        {
            LogWarningF(mLogger,
                        "Progress observer failed: %s",
                        exception.what());
        }
    }

    auto percentMoved = percent - mLastPercentage >= mConfig.mPercentThreshold;
    auto bytesMoved = bytesTransferred - mLastBytes >= mConfig.mByteThreshold;

    // Not enough has changed to bother the store.
    if (!percentMoved && !bytesMoved)
        return;

    if (totalBytes)
        LogInfoF(mLogger,
                 "Transferred %llu of %llu bytes (%u%%)",
                 static_cast<unsigned long long>(bytesTransferred),
                 static_cast<unsigned long long>(totalBytes),
                 percent);
    else
        LogInfoF(mLogger,
                 "Transferred %llu bytes",
                 static_cast<unsigned long long>(bytesTransferred));

    persist(bytesTransferred, totalBytes, percent);
}

std::uint64_t ProgressReporter::persisted() const
{
    return mPersisted;
}

void ProgressReporter::start(std::uint64_t totalBytes)
{
    // Let pollers know how large the payload is.
    if (totalBytes)
        persist(0, totalBytes, 0);
}

} // transfer
} // relay

