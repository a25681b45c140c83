#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <relay/common/logger_forward.h>
#include <relay/common/task_executor.h>
#include <relay/transfer/object_store.h>
#include <relay/transfer/upload_part.h>

namespace relay
{
namespace transfer
{

#define DEFINE_UPLOAD_SINK_STATES(expander) \
    expander(UNINITIATED) \
    expander(INITIATED) \
    expander(COMPLETED) \
    expander(ABORTED)

enum UploadSinkState : unsigned int
{
#define DEFINE_UPLOAD_SINK_STATE_ENUMERANT(name) UPLOAD_SINK_ ## name,
    DEFINE_UPLOAD_SINK_STATES(DEFINE_UPLOAD_SINK_STATE_ENUMERANT)
#undef DEFINE_UPLOAD_SINK_STATE_ENUMERANT
}; // UploadSinkState

const char* toString(UploadSinkState state);

struct UploadSinkConfig
{
    // Stop accepting parts when this many are in flight.
    std::size_t mHighWaterMark = 3;

    // Resume accepting parts when this many are in flight.
    std::size_t mLowWaterMark = 1;

    // How many threads may upload parts at the same time?
    std::size_t mMaxConcurrentUploads = 10;

    // How many times may we try to upload a part?
    unsigned int mRetryAttempts = 3;

    // Retry n is delayed by 2^n times this amount.
    std::chrono::milliseconds mRetryBaseDelay = std::chrono::milliseconds(1000);

    // Check the bucket is accessible before initiating an upload.
    bool mValidateBucket = true;
}; // UploadSinkConfig

// Drives a single multipart upload to completion.
//
// Parts are uploaded by a small pool of workers while the caller continues
// to produce more parts. Failures from the workers are rethrown on the
// caller's thread by the next call to upload(...) or complete().
class UploadSink
{
    // Called by a worker to upload a part.
    void attempt(std::shared_ptr<UploadPart> part,
                 unsigned int attempt,
                 const common::Task& task);

    // Called by a worker when a part has failed for good.
    void failed(std::exception_ptr failure);

    // Throw any failure reported by the workers.
    void rethrow(std::unique_lock<std::mutex>& lock);

    // Called by a worker when a part has been uploaded.
    void uploaded(std::uint32_t partNumber, std::string etag);

    // Wait until at most count parts are in flight.
    void waitUntil(std::unique_lock<std::mutex>& lock, std::size_t count);

    // Where are we uploading to?
    std::string mBucket;
    std::string mKey;

    // Parts that have been confirmed by the store.
    std::map<std::uint32_t, std::string> mCompleted;

    UploadSinkConfig mConfig;

    // Signalled whenever a part has finished, successfully or not.
    std::condition_variable mCV;

    // The first failure reported by a worker.
    std::exception_ptr mFailure;

    // How many parts are being uploaded?
    std::size_t mInFlight;

    // Serializes access to instance members.
    mutable std::mutex mLock;

    common::Logger& mLogger;

    // What number do we expect the next part to have?
    std::uint32_t mNextPartNumber;

    UploadSinkState mState;

    ObjectStore& mStore;

    // Identifies the upload once it has been initiated.
    std::string mUploadID;

    // Must be last so that workers are stopped before anything they
    // reference is destroyed.
    common::TaskExecutor mExecutor;

public:
    UploadSink(ObjectStore& store,
               const UploadSinkConfig& config,
               common::Logger& logger);

    UploadSink(const UploadSink& other) = delete;

    ~UploadSink();

    UploadSink& operator=(const UploadSink& rhs) = delete;

    // Abandon the upload.
    //
    // Waits for in-flight parts to settle before asking the store to
    // discard the upload. Failures are logged and never thrown.
    //
    // Returns true if the store acknowledged the abort.
    bool abort();

    // Wait for every part to be uploaded and assemble the object.
    //
    // Returns the parts that make up the object, sorted by part number.
    std::vector<CompletedPart> complete();

    // Begin a new multipart upload.
    void initiate(const std::string& bucket, const std::string& key);

    // How many parts are currently being uploaded?
    std::size_t inFlight() const;

    UploadSinkState state() const;

    // Queue a part for upload.
    //
    // Blocks while too many parts are in flight.
    void upload(UploadPart part);

    const std::string& uploadID() const;
}; // UploadSink

} // transfer
} // relay

