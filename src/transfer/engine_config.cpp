#include <cerrno>
#include <cstdlib>

#include <relay/common/logging.h>
#include <relay/common/utility.h>
#include <relay/log_level.h>
#include <relay/transfer/engine_config.h>
#include <relay/transfer/part_builder.h>

namespace relay
{
namespace transfer
{
namespace
{

// Looks up settings by name in arguments then the environment.
class Settings
{
    const Arguments& mArguments;
    const SettingSource& mEnvironment;
    common::Logger& mLogger;

public:
    Settings(const Arguments& arguments,
             const SettingSource& environment,
             common::Logger& logger)
      : mArguments(arguments)
      , mEnvironment(environment)
      , mLogger(logger)
    {
    }

    // Retrieve a setting as a boolean.
    bool flag(const std::string& name, bool defaultValue) const
    {
        auto value = common::toLower(text(name));

        if (value.empty())
            return defaultValue;

        if (value == "1" || value == "true" || value == "yes")
            return true;

        if (value == "0" || value == "false" || value == "no")
            return false;

        LogWarningF(mLogger,
                    "Invalid value for %s: \"%s\": using %s",
                    name.c_str(),
                    value.c_str(),
                    defaultValue ? "true" : "false");

        return defaultValue;
    }

    LogLevel level(const std::string& name, LogLevel defaultValue) const
    {
        auto value = text(name);

        if (value.empty())
            return defaultValue;

        if (auto level = toLogLevel(value))
            return *level;

        LogWarningF(mLogger,
                    "Invalid value for %s: \"%s\": using %s",
                    name.c_str(),
                    value.c_str(),
                    toString(defaultValue));

        return defaultValue;
    }

    // Retrieve a setting as an integer within [minimum, maximum].
    //
    // Invalid values are replaced by defaultValue. Values outside of the
    // range are clamped.
    std::uint64_t number(const std::string& name,
                         std::uint64_t defaultValue,
                         std::uint64_t minimum,
                         std::uint64_t maximum) const
    {
        auto value = text(name);

        if (value.empty())
            return defaultValue;

        char* end = nullptr;

        errno = 0;

        auto number = std::strtoull(value.c_str(), &end, 10);

        if (errno || *end || value[0] == '-')
        {
            LogWarningF(mLogger,
                        "Invalid value for %s: \"%s\": using %llu",
                        name.c_str(),
                        value.c_str(),
                        static_cast<unsigned long long>(defaultValue));

            return defaultValue;
        }

        if (number < minimum || number > maximum)
        {
            auto clamped = number < minimum ? minimum : maximum;

            LogWarningF(mLogger,
                        "Value for %s out of range: %llu: using %llu",
                        name.c_str(),
                        static_cast<unsigned long long>(number),
                        static_cast<unsigned long long>(clamped));

            return clamped;
        }

        return number;
    }

    // Retrieve a setting as a string.
    std::string text(const std::string& name,
                     const std::string& defaultValue = std::string()) const
    {
        auto argument = common::toLower(name);

        if (auto value = mArguments.value(argument))
            return common::trim(*value);

        auto value = common::trim(mEnvironment(name));

        if (value.empty())
            return defaultValue;

        return value;
    }
}; // Settings

} // anonymous

SettingSource environmentSettings()
{
    return [](const std::string& name) {
        auto* value = std::getenv(name.c_str());

        if (!value)
            return std::string();

        return std::string(value);
    };
}

EngineConfig EngineConfig::load(const Arguments& arguments,
                                const SettingSource& environment,
                                common::Logger& logger)
{
    Settings settings(arguments, environment, logger);
    EngineConfig config;

    config.mBucket = settings.text("BUCKET");
    config.mKeyPrefix = settings.text("KEY_PREFIX");
    config.mLogLevel = settings.level("LOG_LEVEL", logInfo);
    config.mPartSize = settings.number("PART_SIZE_BYTES", 0, 0, MaxPartSize);
    config.mSourceURL = settings.text("SOURCE_URL");
    config.mStateDatabasePath = settings.text("STATE_DB_PATH", "relay.db");
    config.mTransferID = settings.text("TRANSFER_ID");

    auto& s3 = config.mS3;

    s3.mCredentials.mAccessKeyID = settings.text("AWS_ACCESS_KEY_ID");
    s3.mCredentials.mSecretAccessKey = settings.text("AWS_SECRET_ACCESS_KEY");
    s3.mCredentials.mSessionToken = settings.text("AWS_SESSION_TOKEN");
    s3.mEndpoint = settings.text("S3_ENDPOINT");
    s3.mRegion = settings.text("AWS_REGION", "us-east-1");

    auto& sink = config.mSink;

    sink.mMaxConcurrentUploads =
      static_cast<std::size_t>(settings.number("MAX_CONCURRENT_UPLOADS",
                                               DefaultConcurrentUploads,
                                               1,
                                               MaxConcurrentUploads));

    sink.mRetryAttempts =
      static_cast<unsigned int>(settings.number("PART_RETRY_ATTEMPTS", 3, 1, 10));

    sink.mRetryBaseDelay =
      std::chrono::milliseconds(settings.number("RETRY_BASE_DELAY_MS", 1000, 0, 3600000));

    sink.mValidateBucket = settings.flag("VALIDATE_BUCKET", true);

    auto timeout = settings.number("SOCKET_TIMEOUT_SECONDS", 60, 1, 3600);

    config.mSource.mConnectTimeout = std::chrono::seconds(timeout);
    config.mSource.mSocketTimeout = std::chrono::seconds(timeout);
    s3.mConnectTimeout = std::chrono::seconds(timeout);

    LogDebugF(logger,
              "Configuration: bucket: %s, concurrency: %zu, part size: %llu, region: %s",
              config.mBucket.c_str(),
              sink.mMaxConcurrentUploads,
              static_cast<unsigned long long>(config.mPartSize),
              s3.mRegion.c_str());

    return config;
}

std::string EngineConfig::missing() const
{
    if (mTransferID.empty())
        return "TRANSFER_ID";

    if (mSourceURL.empty())
        return "SOURCE_URL";

    if (mBucket.empty())
        return "BUCKET";

    return std::string();
}

} // transfer
} // relay

