#include <memory>
#include <string_view>
#include <utility>

#include <relay/common/logging.h>
#include <relay/common/utility.h>
#include <relay/transfer/destination_key.h>
#include <relay/transfer/error_classifier.h>
#include <relay/transfer/part_builder.h>
#include <relay/transfer/progress_reporter.h>
#include <relay/transfer/transfer_engine.h>
#include <relay/transfer/upload_sink.h>

namespace relay
{
namespace transfer
{

TransferEngine::TransferEngine(SourceReader& source,
                               ObjectStore& objects,
                               TransferStore& store,
                               const EngineConfig& config,
                               common::Logger& logger)
  : mConfig(config)
  , mLogger(logger)
  , mObjects(objects)
  , mSource(source)
  , mStore(store)
{
}

TransferResult TransferEngine::transfer(const TransferRequest& request)
{
    ClassifierContext context;
    TransferResult result;
    std::unique_ptr<UploadSink> sink;

    context.mBucket = request.mBucket;
    result.mTransferID = request.mTransferID;

    // Called whenever the transfer can't proceed.
    auto failed = [&](TransferError error) {
        LogErrorF(mLogger,
                  "Transfer %s failed: %s: %s (%s)",
                  request.mTransferID.c_str(),
                  error.code(),
                  error.mMessage.c_str(),
                  error.mRetryable ? "retryable" : "not retryable");

        // Don't leave orphaned parts lying around.
        if (sink)
            sink->abort();

        try
        {
            mStore.markFailed(request.mTransferID, error.mMessage);
        }
        catch (std::exception& exception)
        {
            LogWarningF(mLogger,
                        "Unable to record failure of transfer %s: %s",
                        request.mTransferID.c_str(),
                        exception.what());
        }

        result.mBytesTransferred = context.mBytesTransferred;
        result.mError = std::move(error);
        result.mSuccess = false;

        return result;
    }; // failed

    try
    {
        // The submitter must have created a record for this transfer.
        if (!mStore.get(request.mTransferID))
            return failed(validationError(
                            common::format("Transfer %s does not exist",
                                           request.mTransferID.c_str())));

        // Where will the payload end up?
        auto key = deriveKey(request.mSourceURL, request.mKeyPrefix);

        if (!key)
            return failed(key.error());

        if (!mStore.markInProgress(request.mTransferID, *key))
            return failed(validationError(
                            common::format("Transfer %s can't be started as it has already completed",
                                           request.mTransferID.c_str())));

        LogInfoF(mLogger,
                 "Transfer %s started: %s -> %s",
                 request.mTransferID.c_str(),
                 request.mSourceURL.c_str(),
                 objectLocation(request.mBucket, *key).c_str());

        auto stream = mSource.open(request.mSourceURL);

        context.mTotalBytes = stream->totalBytes();

        // How large should each part be?
        auto partSize = selectPartSize(context.mTotalBytes, mConfig.mPartSize);

        if (!partSize)
            return failed(partSize.error());

        LogDebugF(mLogger,
                  "Using parts of %llu bytes for a payload of %llu bytes",
                  static_cast<unsigned long long>(*partSize),
                  static_cast<unsigned long long>(context.mTotalBytes));

        sink = std::make_unique<UploadSink>(mObjects, mConfig.mSink, mLogger);

        sink->initiate(request.mBucket, *key);

        PartBuilder builder(*partSize);
        ProgressReporter reporter(mStore,
                                  request.mTransferID,
                                  request.mObserver,
                                  mConfig.mProgress,
                                  mLogger);

        reporter.start(context.mTotalBytes);

        std::string chunk;

        // Relay the payload one chunk at a time.
        while (stream->next(chunk))
        {
            std::string_view remaining(chunk);

            while (!remaining.empty())
            {
                if (auto part = builder.consume(remaining))
                    sink->upload(std::move(*part));
            }

            context.mBytesTransferred = builder.consumed();

            reporter.onChunk(context.mBytesTransferred, context.mTotalBytes);
        }

        // Flush whatever's left.
        if (auto part = builder.finish())
        {
            sink->upload(std::move(*part));
        }
        else if (!builder.emitted())
        {
            // Objects need at least one part, even if it's empty.
            UploadPart empty;

            empty.mPartNumber = 1;

            sink->upload(std::move(empty));
        }

        auto parts = sink->complete();

        reporter.finish(context.mBytesTransferred, context.mTotalBytes);

        result.mBytesTransferred = context.mBytesTransferred;
        result.mS3Location = objectLocation(request.mBucket, *key);
        result.mSuccess = true;

        LogInfoF(mLogger,
                 "Transfer %s completed: %llu bytes in %zu part(s) to %s",
                 request.mTransferID.c_str(),
                 static_cast<unsigned long long>(result.mBytesTransferred),
                 parts.size(),
                 result.mS3Location.c_str());
    }
    catch (std::exception& exception)
    {
        return failed(classify(exception, context));
    }

    // The object exists regardless of whether we can record it.
    try
    {
        mStore.markComplete(request.mTransferID, result.mS3Location);
    }
    catch (std::exception& exception)
    {
        LogErrorF(mLogger,
                  "Unable to record completion of transfer %s: %s",
                  request.mTransferID.c_str(),
                  exception.what());
    }

    return result;
}

} // transfer
} // relay

