#include <iostream>
#include <memory>
#include <string>

#include <relay/arguments.h>
#include <relay/common/logging.h>
#include <relay/common/utility.h>
#include <relay/logging.h>
#include <relay/transfer/curl_source_reader.h>
#include <relay/transfer/engine_config.h>
#include <relay/transfer/progress_logger.h>
#include <relay/transfer/s3_object_store.h>
#include <relay/transfer/sqlite_transfer_store.h>
#include <relay/transfer/subsystem_loggers.h>
#include <relay/transfer/transfer_engine.h>

using relay::Arguments;
using relay::ConsoleLogger;
using relay::SimpleLogger;

using namespace relay::transfer;

namespace
{

std::string USAGE = R"--(
Relays a remote archive into an S3 bucket
Usage:
  relay_worker [name=value...]

  help                      Show help
  transfer_id=arg           Transfer to perform (required)
  source_url=arg            Where to read the archive from (required)
  bucket=arg                Where to write the archive to (required)
  key_prefix=arg            Prefix for the destination key
  state_db_path=arg         Transfer state database (default: relay.db)
  aws_region=arg            Destination region (default: us-east-1)
  s3_endpoint=arg           Destination endpoint
  max_concurrent_uploads=arg
                            Part upload threads, 1 to 20 (default: 10)
  part_size_bytes=arg       Part size, 0 is adaptive (default: 0)
  part_retry_attempts=arg   Attempts per part (default: 3)
  retry_base_delay_ms=arg   Base retry delay (default: 1000)
  socket_timeout_seconds=arg
                            Connect and stall timeout (default: 60)
  validate_bucket=arg       Check bucket before upload (default: true)
  log_level=arg             FATAL, ERROR, WARNING, INFO, DEBUG or VERBOSE

Every setting may also be given by its uppercase environment variable.
)--";

} // anonymous

int main(int argc, char** argv)
{
    auto arguments = Arguments::parse(argc, argv);

    if (arguments.contains("help") || arguments.contains("h"))
    {
        std::cout << USAGE << std::endl;
        return 0;
    }

    ConsoleLogger console;

    SimpleLogger::setOutputClass(&console);

    auto& logger = transferLogger();
    auto config = EngineConfig::load(arguments, environmentSettings(), logger);

    SimpleLogger::setLogLevel(config.mLogLevel);
    logLevel(config.mLogLevel);

    auto missing = config.missing();

    if (!missing.empty())
    {
        LogErrorF(logger, "Missing required setting: %s", missing.c_str());
        return 1;
    }

    std::unique_ptr<SqliteTransferStore> store;

    try
    {
        store = std::make_unique<SqliteTransferStore>(storeLogger(),
                                                      config.mStateDatabasePath);
    }
    catch (std::exception& exception)
    {
        LogErrorF(logger,
                  "Unable to open transfer store %s: %s",
                  config.mStateDatabasePath.c_str(),
                  exception.what());
        return 1;
    }

    try
    {
        // The submitter must have recorded the transfer.
        auto record = store->get(config.mTransferID);

        if (!record)
        {
            LogErrorF(logger,
                      "Transfer %s does not exist",
                      config.mTransferID.c_str());
            return 1;
        }

        // Inputs recorded by the submitter fill any gaps.
        if (config.mKeyPrefix.empty())
            config.mKeyPrefix = record->mKeyPrefix;

        LogInfoF(logger,
                 "Transfer %s: %s -> s3://%s/%s",
                 config.mTransferID.c_str(),
                 config.mSourceURL.c_str(),
                 config.mBucket.c_str(),
                 config.mKeyPrefix.c_str());

        std::unique_ptr<CurlSourceReader> source;
        std::unique_ptr<S3ObjectStore> objects;

        try
        {
            source = std::make_unique<CurlSourceReader>(config.mSource, logger);
            objects = std::make_unique<S3ObjectStore>(config.mS3, logger);
        }
        catch (std::exception& exception)
        {
            auto message = std::string("Unable to start transfer: ") + exception.what();

            LogError1(logger, message);

            if (!store->markFailed(config.mTransferID, message))
                LogWarningF(logger,
                            "Transfer %s couldn't be marked failed",
                            config.mTransferID.c_str());

            return 1;
        }

        TransferEngine engine(*source, *objects, *store, config, logger);
        ProgressLogger progress(config.mTransferID, logger);
        TransferRequest request;

        request.mBucket = config.mBucket;
        request.mKeyPrefix = config.mKeyPrefix;
        request.mObserver = &progress;
        request.mSourceURL = config.mSourceURL;
        request.mTransferID = config.mTransferID;

        auto result = engine.transfer(request);

        if (!result.mSuccess)
        {
            LogErrorF(logger,
                      "Transfer %s failed after %llu bytes: %s: %s (retryable: %s)",
                      result.mTransferID.c_str(),
                      static_cast<unsigned long long>(result.mBytesTransferred),
                      result.mError->code(),
                      result.mError->mMessage.c_str(),
                      result.mError->mRetryable ? "yes" : "no");
            return 1;
        }

        LogInfoF(logger,
                 "Transfer %s succeeded: %llu bytes written to %s",
                 result.mTransferID.c_str(),
                 static_cast<unsigned long long>(result.mBytesTransferred),
                 result.mS3Location.c_str());

        // Clear out records that have outlived their usefulness.
        store->purge(relay::common::now());
    }
    catch (std::exception& exception)
    {
        LogErrorF(logger, "Unexpected failure: %s", exception.what());
        return 1;
    }

    return 0;
}

