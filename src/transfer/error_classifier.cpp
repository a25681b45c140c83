#include <map>
#include <new>
#include <utility>
#include <vector>

#include <relay/common/utility.h>
#include <relay/transfer/error_classifier.h>
#include <relay/transfer/percentage.h>

namespace relay
{
namespace transfer
{
namespace
{

struct StorageEntry
{
    // May contain a single %s that receives the bucket's name.
    const char* mFormat;

    bool mRetryable;
}; // StorageEntry

// Keyed on the storage service's error code.
const std::map<std::string, StorageEntry>& storageCodes()
{
    static const std::map<std::string, StorageEntry> codes = {
        {"AccessDenied",         {"Access denied to bucket '%s'", false}},
        {"EntityTooLarge",       {"File size exceeds S3 limits", false}},
        {"Forbidden",            {"Insufficient permissions to write to bucket '%s'", false}},
        {"InternalError",        {"S3 internal server error", true}},
        {"InvalidBucketName",    {"Invalid bucket name: '%s'", false}},
        {"InvalidPart",          {"Invalid part in multipart upload", false}},
        {"InvalidPartOrder",     {"Parts must be in ascending order", false}},
        {"NoSuchBucket",         {"S3 bucket '%s' does not exist", false}},
        {"NoSuchUpload",         {"Multipart upload does not exist or was aborted", false}},
        {"QuotaExceeded",        {"S3 storage quota exceeded", false}},
        {"RequestLimitExceeded", {"S3 request throttled, please retry", true}},
        {"RequestTimeout",       {"S3 request timed out", true}},
        {"ServiceUnavailable",   {"S3 service temporarily unavailable", true}},
        {"SlowDown",             {"S3 request rate exceeded, please retry", true}},
        {"ThrottlingException",  {"S3 request throttled, please retry", true}}
    }; // codes

    return codes;
}

// Used when the service didn't send an error code.
const char* storageCodeFromStatus(long status)
{
    switch (status)
    {
    case 403:
        return "Forbidden";
    case 404:
        return "NoSuchBucket";
    case 408:
        return "RequestTimeout";
    case 429:
        return "SlowDown";
    case 500:
        return "InternalError";
    case 503:
        return "ServiceUnavailable";
    default:
        break;
    }

    return nullptr;
}

const StorageEntry* storageEntry(const Fault& fault)
{
    auto& codes = storageCodes();

    auto i = codes.find(fault.serviceCode());

    if (i != codes.end())
        return &i->second;

    auto* code = storageCodeFromStatus(fault.httpStatus());

    if (!code)
        return nullptr;

    return &codes.at(code);
}

bool isNetworkCode(FaultCode code)
{
    switch (code)
    {
    case FAULT_BROKEN_PIPE:
    case FAULT_CONNECTION_ABORTED:
    case FAULT_CONNECTION_REFUSED:
    case FAULT_CONNECTION_RESET:
    case FAULT_HOST_NOT_FOUND:
    case FAULT_HOST_UNREACHABLE:
    case FAULT_NETWORK_UNREACHABLE:
    case FAULT_PREMATURE_CLOSE:
    case FAULT_TIMED_OUT:
    case FAULT_TLS_FAILURE:
        return true;
    default:
        break;
    }

    return false;
}

// Timeouts, resets, refusals and broken pipes.
bool isTransientNetworkCode(FaultCode code)
{
    switch (code)
    {
    case FAULT_BROKEN_PIPE:
    case FAULT_CONNECTION_REFUSED:
    case FAULT_CONNECTION_RESET:
    case FAULT_TIMED_OUT:
        return true;
    default:
        break;
    }

    return false;
}

// Renders "X of Y bytes transferred" with an optional " (P%)".
std::string progressOf(const ClassifierContext& context, bool withPercent = true)
{
    auto bytes = static_cast<unsigned long long>(context.mBytesTransferred);
    auto total = static_cast<unsigned long long>(context.mTotalBytes);

    std::string progress;

    if (!total)
        progress = common::format("%llu of unknown bytes transferred", bytes);
    else
        progress = common::format("%llu of %llu bytes transferred", bytes, total);

    if (withPercent)
        progress += common::format(" (%u%%)",
                                   percentage(context.mBytesTransferred,
                                              context.mTotalBytes));

    return progress;
}

// Something on our side went wrong before any data moved.
TransferError localError(const std::string& detail)
{
    return TransferError(ERROR_KIND_VALIDATION_ERROR,
                         "Transfer could not be started: " + detail,
                         false);
}

TransferError streamingError(FaultCode code,
                             std::uint32_t partNumber,
                             const std::string& detail,
                             bool retryable,
                             const ClassifierContext& context)
{
    auto bytes = static_cast<unsigned long long>(context.mBytesTransferred);
    auto percent = percentage(context.mBytesTransferred, context.mTotalBytes);
    auto progress = progressOf(context);

    auto make = [&](std::string message, bool defaultRetryable) {
        return TransferError(ERROR_KIND_STREAMING_ERROR,
                             std::move(message),
                             retryable || defaultRetryable);
    }; // make

    // Part failures take precedence as they tell the user the most.
    if (partNumber)
        return make(common::format("Upload failed during part %u: %s",
                                   partNumber,
                                   progress.c_str()),
                    false);

    switch (code)
    {
    case FAULT_BROKEN_PIPE:
        return make("Connection closed unexpectedly: " + progress, true);
    case FAULT_CONNECTION_ABORTED:
        return make("Transfer aborted: " + progress, false);
    case FAULT_CONNECTION_RESET:
        return make("Network interruption: " + progress, true);
    case FAULT_HOST_UNREACHABLE:
    case FAULT_NETWORK_UNREACHABLE:
        return make(common::format("Network unreachable during transfer at %llu bytes (%u%%)",
                                   bytes,
                                   percent),
                    false);
    case FAULT_OUT_OF_MEMORY:
        return make("Insufficient memory for transfer: " + progress, false);
    case FAULT_PREMATURE_CLOSE:
        return make("Incomplete transfer: " + progress, false);
    case FAULT_TIMED_OUT:
        return make(common::format("Transfer timed out after %llu bytes (%u%%)",
                                   bytes,
                                   percent),
                    true);
    default:
        break;
    }

    return make(common::format("Streaming transfer failed at %u%% (%s): %s",
                               percent,
                               progressOf(context, false).c_str(),
                               detail.c_str()),
                isTransientNetworkCode(code));
}

TransferError urlFetchError(const Fault& fault, FaultCode code)
{
    auto make = [](std::string message, bool retryable) {
        return TransferError(ERROR_KIND_URL_FETCH_ERROR,
                             std::move(message),
                             retryable);
    }; // make

    switch (code)
    {
    case FAULT_CONNECTION_ABORTED:
        return make("Connection aborted by source server", false);
    case FAULT_CONNECTION_REFUSED:
        return make("Connection refused by source server", true);
    case FAULT_CONNECTION_RESET:
        return make("Connection reset by source server", true);
    case FAULT_HOST_NOT_FOUND:
        return make("Unable to resolve URL: DNS lookup failed", false);
    case FAULT_HOST_UNREACHABLE:
        return make("Host unreachable", false);
    case FAULT_NETWORK_UNREACHABLE:
        return make("Network unreachable", false);
    case FAULT_TIMED_OUT:
        return make("Connection to source URL timed out", true);
    case FAULT_TLS_FAILURE:
        return make("Secure connection failed: SSL/TLS error", false);
    default:
        break;
    }

    if (code != FAULT_HTTP_STATUS)
        return make(std::string("Failed to fetch from URL: ") + fault.what(),
                    isTransientNetworkCode(code));

    auto status = fault.httpStatus();

    switch (status)
    {
    case 401:
        return make("Authentication required: HTTP 401", false);
    case 403:
        return make("Access forbidden: HTTP 403", false);
    case 404:
        return make("Source file not found: HTTP 404", false);
    case 500:
        return make("Source server error: HTTP 500", false);
    case 503:
        return make("Source server unavailable: HTTP 503", true);
    default:
        break;
    }

    // Request timeouts and rate limiting are worth another try.
    auto retryable = status == 408 || status == 429;

    if (status >= 400 && status < 500)
        return make(common::format("Client error: HTTP %ld", status), retryable);

    if (status >= 500 && status < 600)
        return make(common::format("Server error: HTTP %ld", status), false);

    return make(common::format("Failed to fetch from URL: HTTP %ld", status), false);
}

TransferError storageError(const Fault& fault, const ClassifierContext& context)
{
    auto make = [](std::string message, bool retryable) {
        return TransferError(ERROR_KIND_S3_ERROR,
                             std::move(message),
                             retryable);
    }; // make

    if (fault.code() == FAULT_TIMED_OUT)
        return make("S3 request timed out", true);

    if (isNetworkCode(fault.code()))
        return make("Failed to upload to S3: network error", true);

    if (auto* entry = storageEntry(fault))
        return make(common::format(entry->mFormat, context.mBucket.c_str()),
                    entry->mRetryable);

    auto detail = std::string(fault.what());

    if (!fault.serviceCode().empty())
        detail += " (" + fault.serviceCode() + ")";

    return make("S3 operation failed: " + detail, false);
}

} // anonymous

TransferError classify(const Fault& fault, const ClassifierContext& context)
{
    auto code = fault.code();

    // No structured code: Fall back to the message.
    if (code == FAULT_UNKNOWN)
        code = inferFaultCode(fault.what());

    switch (fault.origin())
    {
    case FAULT_ORIGIN_SOURCE:
        // Premature closes only ever happen once data has moved.
        if (code == FAULT_PREMATURE_CLOSE)
            return streamingError(code, 0, fault.what(), false, context);

        // Failures before the first byte mean the source was unusable.
        if (!context.mBytesTransferred || code == FAULT_HTTP_STATUS)
            return urlFetchError(fault, code);

        return streamingError(code, 0, fault.what(), false, context);

    case FAULT_ORIGIN_STORAGE:
        // Part uploads that exhausted their retries on a transient fault.
        if (fault.partNumber() && transient(fault))
            return streamingError(code,
                                  fault.partNumber(),
                                  fault.what(),
                                  true,
                                  context);

        return storageError(fault, context);

    case FAULT_ORIGIN_LOCAL:
        if (!context.mBytesTransferred && code != FAULT_OUT_OF_MEMORY)
            return localError(fault.what());
        break;
    }

    return streamingError(code, 0, fault.what(), false, context);
}

TransferError classify(const std::exception& exception,
                       const ClassifierContext& context)
{
    // Structured faults know what they are.
    if (auto* fault = dynamic_cast<const Fault*>(&exception))
        return classify(*fault, context);

    // Allocation failures have a type of their own.
    if (dynamic_cast<const std::bad_alloc*>(&exception))
        return streamingError(FAULT_OUT_OF_MEMORY,
                              0,
                              exception.what(),
                              false,
                              context);

    // Nothing has moved so this can't have been a streaming failure.
    if (!context.mBytesTransferred)
        return localError(exception.what());

    return streamingError(inferFaultCode(exception.what()),
                          0,
                          exception.what(),
                          false,
                          context);
}

FaultCode inferFaultCode(const std::string& message)
{
    static const std::vector<std::pair<const char*, FaultCode>> patterns = {
        {"econnreset",          FAULT_CONNECTION_RESET},
        {"connection reset",    FAULT_CONNECTION_RESET},
        {"epipe",               FAULT_BROKEN_PIPE},
        {"broken pipe",         FAULT_BROKEN_PIPE},
        {"premature close",     FAULT_PREMATURE_CLOSE},
        {"enetunreach",         FAULT_NETWORK_UNREACHABLE},
        {"network unreachable", FAULT_NETWORK_UNREACHABLE},
        {"ehostunreach",        FAULT_HOST_UNREACHABLE},
        {"enotfound",           FAULT_HOST_NOT_FOUND},
        {"econnrefused",        FAULT_CONNECTION_REFUSED},
        {"etimedout",           FAULT_TIMED_OUT},
        {"timed out",           FAULT_TIMED_OUT},
        {"timeout",             FAULT_TIMED_OUT},
        {"econnaborted",        FAULT_CONNECTION_ABORTED},
        {"aborted",             FAULT_CONNECTION_ABORTED},
        {"enomem",              FAULT_OUT_OF_MEMORY},
        {"out of memory",       FAULT_OUT_OF_MEMORY}
    }; // patterns

    auto lowered = common::toLower(message);

    for (auto& pattern : patterns)
    {
        if (lowered.find(pattern.first) != std::string::npos)
            return pattern.second;
    }

    return FAULT_UNKNOWN;
}

bool transient(const Fault& fault)
{
    if (fault.origin() != FAULT_ORIGIN_STORAGE)
        return isTransientNetworkCode(fault.code());

    // Every network failure talking to the store is worth another try.
    if (isNetworkCode(fault.code()))
        return true;

    if (auto* entry = storageEntry(fault))
        return entry->mRetryable;

    return false;
}

TransferError validationError(const std::string& message)
{
    return TransferError(ERROR_KIND_VALIDATION_ERROR, message, false);
}

} // transfer
} // relay

