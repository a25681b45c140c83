#include <utility>

#include <relay/common/logging.h>
#include <relay/common/utility.h>
#include <relay/transfer/error_classifier.h>
#include <relay/transfer/fault.h>
#include <relay/transfer/subsystem_loggers.h>
#include <relay/transfer/upload_sink.h>

namespace relay
{
namespace transfer
{

using namespace common;

const char* toString(UploadSinkState state)
{
    switch (state)
    {
#define DEFINE_UPLOAD_SINK_STATE_CLAUSE(name) case UPLOAD_SINK_ ## name: return #name;
        DEFINE_UPLOAD_SINK_STATES(DEFINE_UPLOAD_SINK_STATE_CLAUSE);
#undef DEFINE_UPLOAD_SINK_STATE_CLAUSE
    }

    // Silence the compiler.
    return "N/A";
}

void UploadSink::attempt(std::shared_ptr<UploadPart> part,
                         unsigned int attempt,
                         const Task& task)
{
    // Convenience.
    auto partNumber = part->mPartNumber;

    {
        std::lock_guard<std::mutex> guard(mLock);

        // No point uploading anything if the upload's dead.
        auto abandoned = task.cancelled()
                         || mFailure
                         || mState != UPLOAD_SINK_INITIATED;

        if (abandoned)
        {
            LogDebugF(mLogger, "Part %u abandoned", partNumber);

            --mInFlight;

            mCV.notify_all();

            return;
        }
    }

    try
    {
        LogDebugF(mLogger,
                  "Uploading part %u (%llu bytes, attempt %u of %u)",
                  partNumber,
                  static_cast<unsigned long long>(part->size()),
                  attempt,
                  mConfig.mRetryAttempts);

        auto etag = mStore.uploadPart(mBucket, mKey, mUploadID, *part);

        if (attempt > 1)
            LogInfoF(mLogger,
                     "Part %u uploaded on attempt %u",
                     partNumber,
                     attempt);

        uploaded(partNumber, std::move(etag));
    }
    catch (Fault& fault)
    {
        // Worth another try?
        if (attempt < mConfig.mRetryAttempts && transient(fault))
        {
            auto delay = mConfig.mRetryBaseDelay * (1u << attempt);

            LogWarningF(mLogger,
                        "Part %u failed on attempt %u of %u: %s: retrying in %lld ms",
                        partNumber,
                        attempt,
                        mConfig.mRetryAttempts,
                        fault.what(),
                        static_cast<long long>(delay.count()));

            auto retry = [this, part, attempt](const Task& task) {
                this->attempt(part, attempt + 1, task);
            }; // retry

            mExecutor.execute(std::move(retry), delay);

            return;
        }

        LogErrorF(mLogger,
                  "Unable to upload part %u after %u attempt(s): %s",
                  partNumber,
                  attempt,
                  fault.what());

        fault.partNumber(partNumber);

        failed(std::make_exception_ptr(fault));
    }
    catch (std::exception& exception)
    {
        LogErrorF(mLogger,
                  "Unable to upload part %u: %s",
                  partNumber,
                  exception.what());

        failed(std::current_exception());
    }
}

void UploadSink::failed(std::exception_ptr failure)
{
    std::lock_guard<std::mutex> guard(mLock);

    // Only the first failure is of interest.
    if (!mFailure)
        mFailure = std::move(failure);

    --mInFlight;

    mCV.notify_all();
}

void UploadSink::rethrow(std::unique_lock<std::mutex>&)
{
    if (mFailure)
        std::rethrow_exception(mFailure);
}

void UploadSink::uploaded(std::uint32_t partNumber, std::string etag)
{
    std::lock_guard<std::mutex> guard(mLock);

    LogDebugF(mLogger, "Part %u uploaded: %s", partNumber, etag.c_str());

    mCompleted[partNumber] = std::move(etag);

    --mInFlight;

    mCV.notify_all();
}

void UploadSink::waitUntil(std::unique_lock<std::mutex>& lock,
                           std::size_t count)
{
    mCV.wait(lock, [&]() {
        return mInFlight <= count || mFailure;
    });
}

UploadSink::UploadSink(ObjectStore& store,
                       const UploadSinkConfig& config,
                       common::Logger& logger)
  : mBucket()
  , mKey()
  , mCompleted()
  , mConfig(config)
  , mCV()
  , mFailure()
  , mInFlight(0)
  , mLock()
  , mLogger(logger)
  , mNextPartNumber(1)
  , mState(UPLOAD_SINK_UNINITIATED)
  , mStore(store)
  , mUploadID()
  , mExecutor(config.mMaxConcurrentUploads, executorLogger())
{
    if (!mConfig.mRetryAttempts)
        mConfig.mRetryAttempts = 1;

    if (!mConfig.mHighWaterMark)
        mConfig.mHighWaterMark = 1;

    if (mConfig.mLowWaterMark >= mConfig.mHighWaterMark)
        mConfig.mLowWaterMark = mConfig.mHighWaterMark - 1;
}

UploadSink::~UploadSink()
{
    if (mState == UPLOAD_SINK_INITIATED)
        LogWarningF(mLogger,
                    "Upload %s destroyed before being completed or aborted",
                    mUploadID.c_str());
}

bool UploadSink::abort()
{
    std::unique_lock<std::mutex> lock(mLock);

    // Nothing to abort.
    if (mState != UPLOAD_SINK_INITIATED)
    {
        LogDebugF(mLogger,
                  "Not aborting upload as it is %s",
                  toString(mState));

        return false;
    }

    // Any queued parts will now be abandoned.
    mState = UPLOAD_SINK_ABORTED;

    LogInfoF(mLogger,
             "Aborting upload %s of s3://%s/%s",
             mUploadID.c_str(),
             mBucket.c_str(),
             mKey.c_str());

    // Wait for in-flight parts to settle.
    mCV.wait(lock, [&]() { return !mInFlight; });

    lock.unlock();

    try
    {
        mStore.abort(mBucket, mKey, mUploadID);

        LogInfoF(mLogger, "Upload %s aborted", mUploadID.c_str());

        return true;
    }
    catch (std::exception& exception)
    {
        // Never mask whatever caused the abort.
        LogWarningF(mLogger,
                    "Unable to abort upload %s: %s",
                    mUploadID.c_str(),
                    exception.what());
    }

    return false;
}

std::vector<CompletedPart> UploadSink::complete()
{
    std::unique_lock<std::mutex> lock(mLock);

    if (mState != UPLOAD_SINK_INITIATED)
        throw LogErrorF(mLogger,
                        "Can't complete an upload that is %s",
                        toString(mState));

    // Wait for every part to be uploaded.
    waitUntil(lock, 0);

    // Make sure every part was uploaded successfully.
    rethrow(lock);

    std::vector<CompletedPart> parts;

    parts.reserve(mCompleted.size());

    // Parts are sorted by number as the map is ordered.
    for (auto& entry : mCompleted)
    {
        CompletedPart part;

        part.mETag = entry.second;
        part.mPartNumber = entry.first;

        // Parts must be numbered one through N without gaps.
        if (part.mPartNumber != parts.size() + 1)
            throw LogErrorF(mLogger,
                            "Part %u is out of sequence: expected part %zu",
                            part.mPartNumber,
                            parts.size() + 1);

        parts.emplace_back(std::move(part));
    }

    if (parts.size() + 1 != mNextPartNumber)
        throw LogErrorF(mLogger,
                        "Only %zu of %u part(s) were uploaded",
                        parts.size(),
                        mNextPartNumber - 1);

    if (parts.empty())
        throw LogError1(mLogger, "Can't complete an upload without any parts");

    lock.unlock();

    mStore.complete(mBucket, mKey, mUploadID, parts);

    lock.lock();

    mState = UPLOAD_SINK_COMPLETED;

    LogInfoF(mLogger,
             "Upload %s completed with %zu part(s)",
             mUploadID.c_str(),
             parts.size());

    return parts;
}

void UploadSink::initiate(const std::string& bucket, const std::string& key)
{
    std::unique_lock<std::mutex> lock(mLock);

    if (mState != UPLOAD_SINK_UNINITIATED)
        throw LogErrorF(mLogger,
                        "Can't initiate an upload that is %s",
                        toString(mState));

    lock.unlock();

    // Make sure we can actually write to the bucket.
    if (mConfig.mValidateBucket)
        mStore.headBucket(bucket);

    auto uploadID = mStore.initiate(bucket, key);

    lock.lock();

    mBucket = bucket;
    mKey = key;
    mState = UPLOAD_SINK_INITIATED;
    mUploadID = std::move(uploadID);

    LogInfoF(mLogger,
             "Initiated upload %s to s3://%s/%s",
             mUploadID.c_str(),
             mBucket.c_str(),
             mKey.c_str());
}

std::size_t UploadSink::inFlight() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mInFlight;
}

UploadSinkState UploadSink::state() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mState;
}

void UploadSink::upload(UploadPart part)
{
    std::unique_lock<std::mutex> lock(mLock);

    if (mState != UPLOAD_SINK_INITIATED)
        throw LogErrorF(mLogger,
                        "Can't upload a part to an upload that is %s",
                        toString(mState));

    // Let the caller know if an earlier part failed.
    rethrow(lock);

    // Parts must arrive in stream order.
    if (part.mPartNumber != mNextPartNumber)
        throw LogErrorF(mLogger,
                        "Received part %u when expecting part %u",
                        part.mPartNumber,
                        mNextPartNumber);

    // Too many parts in flight: Stop reading until the workers catch up.
    if (mInFlight >= mConfig.mHighWaterMark)
    {
        LogDebugF(mLogger,
                  "%zu part(s) in flight: waiting for uploads to drain",
                  mInFlight);

        waitUntil(lock, mConfig.mLowWaterMark);

        rethrow(lock);
    }

    ++mInFlight;
    ++mNextPartNumber;

    lock.unlock();

    auto shared = std::make_shared<UploadPart>(std::move(part));

    auto upload = [this, shared](const Task& task) {
        attempt(shared, 1, task);
    }; // upload

    mExecutor.execute(std::move(upload));
}

const std::string& UploadSink::uploadID() const
{
    return mUploadID;
}

} // transfer
} // relay

