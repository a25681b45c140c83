#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <relay/arguments.h>
#include <relay/common/logger_forward.h>
#include <relay/log_level.h>
#include <relay/transfer/curl_source_reader.h>
#include <relay/transfer/progress_reporter.h>
#include <relay/transfer/s3_object_store.h>
#include <relay/transfer/upload_sink.h>

namespace relay
{
namespace transfer
{

// Bounds on how many parts may be uploaded at once.
constexpr std::size_t DefaultConcurrentUploads = 10;
constexpr std::size_t MaxConcurrentUploads = 20;

// Retrieves the value of a named setting.
//
// Returns an empty string if the setting hasn't been specified.
using SettingSource = std::function<std::string(const std::string&)>;

// Settings from the process environment.
SettingSource environmentSettings();

// Everything needed to run a single transfer.
struct EngineConfig
{
    // Populate a configuration from the environment.
    //
    // Arguments take precedence over the environment. An argument's name
    // is the lowercase form of the environment variable's name.
    static EngineConfig load(const Arguments& arguments,
                             const SettingSource& environment,
                             common::Logger& logger);

    // Which settings does the worker require?
    //
    // Returns the name of the first missing setting or an empty string.
    std::string missing() const;

    // Where we're writing to.
    std::string mBucket;
    std::string mKeyPrefix;

    // How verbose should we be?
    LogLevel mLogLevel = logInfo;

    // Zero to select part sizes adaptively.
    std::uint64_t mPartSize = 0;

    ProgressReporterConfig mProgress;

    S3Config mS3;

    UploadSinkConfig mSink;

    SourceReaderConfig mSource;

    std::string mSourceURL;

    // Where transfer records are kept.
    std::string mStateDatabasePath = "relay.db";

    std::string mTransferID;
}; // EngineConfig

} // transfer
} // relay

