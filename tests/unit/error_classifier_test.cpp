#include <new>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include <relay/transfer/error_classifier.h>
#include <relay/transfer/percentage.h>

using namespace relay::transfer;

namespace
{

ClassifierContext context(std::uint64_t bytes, std::uint64_t total)
{
    ClassifierContext result;

    result.mBucket = "bucket";
    result.mBytesTransferred = bytes;
    result.mTotalBytes = total;

    return result;
}

bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // anonymous

TEST(Percentage, FloorsAndCaps)
{
    EXPECT_EQ(0u, percentage(0, 0));
    EXPECT_EQ(0u, percentage(100, 0));
    EXPECT_EQ(0u, percentage(0, 100));
    EXPECT_EQ(39u, percentage(399, 1000));
    EXPECT_EQ(40u, percentage(400, 1000));
    EXPECT_EQ(100u, percentage(1000, 1000));
    EXPECT_EQ(100u, percentage(2000, 1000));

    // No overflow with enormous payloads.
    EXPECT_EQ(50u, percentage(UINT64_MAX / 2, UINT64_MAX));
}

TEST(ErrorClassifier, SourceHTTPStatuses)
{
    struct Case
    {
        long mStatus;
        const char* mMessage;
        bool mRetryable;
    }; // Case

    const Case cases[] = {
        {401, "Authentication required: HTTP 401", false},
        {403, "Access forbidden: HTTP 403", false},
        {404, "Source file not found: HTTP 404", false},
        {410, "Client error: HTTP 410", false},
        {429, "Client error: HTTP 429", true},
        {500, "Source server error: HTTP 500", false},
        {502, "Server error: HTTP 502", false},
        {503, "Source server unavailable: HTTP 503", true}
    }; // cases

    for (auto& testCase : cases)
    {
        auto error = classify(httpFault(testCase.mStatus, "HTTP"), context(0, 0));

        EXPECT_EQ(ERROR_KIND_URL_FETCH_ERROR, error.mKind);
        EXPECT_STREQ("URL_FETCH_ERROR", error.code());
        EXPECT_EQ(testCase.mMessage, error.mMessage);
        EXPECT_EQ(testCase.mRetryable, error.mRetryable) << testCase.mStatus;
    }
}

TEST(ErrorClassifier, HTTPStatusIsAlwaysAFetchError)
{
    // Even if bytes have somehow moved.
    auto error = classify(httpFault(404, "HTTP 404"), context(10, 100));

    EXPECT_EQ(ERROR_KIND_URL_FETCH_ERROR, error.mKind);
}

TEST(ErrorClassifier, SourceNetworkFaultsBeforeFirstByte)
{
    struct Case
    {
        FaultCode mCode;
        const char* mMessage;
        bool mRetryable;
    }; // Case

    const Case cases[] = {
        {FAULT_HOST_NOT_FOUND, "Unable to resolve URL: DNS lookup failed", false},
        {FAULT_TIMED_OUT, "Connection to source URL timed out", true},
        {FAULT_CONNECTION_REFUSED, "Connection refused by source server", true},
        {FAULT_CONNECTION_RESET, "Connection reset by source server", true},
        {FAULT_CONNECTION_ABORTED, "Connection aborted by source server", false},
        {FAULT_NETWORK_UNREACHABLE, "Network unreachable", false},
        {FAULT_HOST_UNREACHABLE, "Host unreachable", false},
        {FAULT_TLS_FAILURE, "Secure connection failed: SSL/TLS error", false}
    }; // cases

    for (auto& testCase : cases)
    {
        auto error = classify(sourceFault(testCase.mCode, "boom"), context(0, 1000));

        EXPECT_EQ(ERROR_KIND_URL_FETCH_ERROR, error.mKind);
        EXPECT_EQ(testCase.mMessage, error.mMessage);
        EXPECT_EQ(testCase.mRetryable, error.mRetryable) << toString(testCase.mCode);
    }
}

TEST(ErrorClassifier, UnknownSourceFaultBeforeFirstByte)
{
    auto error = classify(sourceFault(FAULT_UNKNOWN, "something odd"), context(0, 0));

    EXPECT_EQ(ERROR_KIND_URL_FETCH_ERROR, error.mKind);
    EXPECT_EQ("Failed to fetch from URL: something odd", error.mMessage);
    EXPECT_FALSE(error.mRetryable);
}

TEST(ErrorClassifier, ResetAfterFortyPercent)
{
    auto error = classify(sourceFault(FAULT_CONNECTION_RESET, "reset"),
                          context(400, 1000));

    EXPECT_EQ(ERROR_KIND_STREAMING_ERROR, error.mKind);
    EXPECT_STREQ("STREAMING_ERROR", error.code());
    EXPECT_EQ("Network interruption: 400 of 1000 bytes transferred (40%)",
              error.mMessage);
    EXPECT_TRUE(error.mRetryable);
}

TEST(ErrorClassifier, StreamingMessages)
{
    struct Case
    {
        FaultCode mCode;
        const char* mMessage;
        bool mRetryable;
    }; // Case

    const Case cases[] = {
        {FAULT_BROKEN_PIPE,
         "Connection closed unexpectedly: 250 of 1000 bytes transferred (25%)",
         true},
        {FAULT_TIMED_OUT,
         "Transfer timed out after 250 bytes (25%)",
         true},
        {FAULT_CONNECTION_ABORTED,
         "Transfer aborted: 250 of 1000 bytes transferred (25%)",
         false},
        {FAULT_NETWORK_UNREACHABLE,
         "Network unreachable during transfer at 250 bytes (25%)",
         false},
        {FAULT_PREMATURE_CLOSE,
         "Incomplete transfer: 250 of 1000 bytes transferred (25%)",
         false},
        {FAULT_OUT_OF_MEMORY,
         "Insufficient memory for transfer: 250 of 1000 bytes transferred (25%)",
         false}
    }; // cases

    for (auto& testCase : cases)
    {
        auto error = classify(sourceFault(testCase.mCode, "boom"), context(250, 1000));

        EXPECT_EQ(ERROR_KIND_STREAMING_ERROR, error.mKind);
        EXPECT_EQ(testCase.mMessage, error.mMessage);
        EXPECT_EQ(testCase.mRetryable, error.mRetryable) << toString(testCase.mCode);
    }
}

TEST(ErrorClassifier, StreamingWithUnknownTotal)
{
    auto error = classify(sourceFault(FAULT_CONNECTION_RESET, "reset"),
                          context(4096, 0));

    EXPECT_EQ(ERROR_KIND_STREAMING_ERROR, error.mKind);
    EXPECT_EQ("Network interruption: 4096 of unknown bytes transferred (0%)",
              error.mMessage);
}

TEST(ErrorClassifier, PrematureCloseIsAlwaysStreaming)
{
    auto error = classify(sourceFault(FAULT_PREMATURE_CLOSE, "closed"),
                          context(0, 1000));

    EXPECT_EQ(ERROR_KIND_STREAMING_ERROR, error.mKind);
}

TEST(ErrorClassifier, StorageCodes)
{
    struct Case
    {
        const char* mCode;
        const char* mMessage;
        bool mRetryable;
    }; // Case

    const Case cases[] = {
        {"NoSuchBucket", "S3 bucket 'bucket' does not exist", false},
        {"AccessDenied", "Access denied to bucket 'bucket'", false},
        {"Forbidden", "Insufficient permissions to write to bucket 'bucket'", false},
        {"QuotaExceeded", "S3 storage quota exceeded", false},
        {"EntityTooLarge", "File size exceeds S3 limits", false},
        {"RequestTimeout", "S3 request timed out", true},
        {"ServiceUnavailable", "S3 service temporarily unavailable", true},
        {"InternalError", "S3 internal server error", true},
        {"SlowDown", "S3 request rate exceeded, please retry", true},
        {"ThrottlingException", "S3 request throttled, please retry", true},
        {"RequestLimitExceeded", "S3 request throttled, please retry", true},
        {"InvalidBucketName", "Invalid bucket name: 'bucket'", false},
        {"NoSuchUpload", "Multipart upload does not exist or was aborted", false},
        {"InvalidPart", "Invalid part in multipart upload", false},
        {"InvalidPartOrder", "Parts must be in ascending order", false}
    }; // cases

    for (auto& testCase : cases)
    {
        auto fault = storageFault(testCase.mCode, 400, "rejected");
        auto error = classify(fault, context(0, 0));

        EXPECT_EQ(ERROR_KIND_S3_ERROR, error.mKind);
        EXPECT_STREQ("S3_ERROR", error.code());
        EXPECT_EQ(testCase.mMessage, error.mMessage);
        EXPECT_EQ(testCase.mRetryable, error.mRetryable) << testCase.mCode;
        EXPECT_EQ(testCase.mRetryable, transient(fault)) << testCase.mCode;
    }
}

TEST(ErrorClassifier, StorageStatusFallback)
{
    auto notFound = classify(storageFault("", 404, "Not Found"), context(0, 0));

    EXPECT_EQ("S3 bucket 'bucket' does not exist", notFound.mMessage);

    auto forbidden = classify(storageFault("", 403, "Forbidden"), context(0, 0));

    EXPECT_EQ("Insufficient permissions to write to bucket 'bucket'", forbidden.mMessage);

    auto unavailable = classify(storageFault("", 503, "Slow"), context(0, 0));

    EXPECT_EQ("S3 service temporarily unavailable", unavailable.mMessage);
    EXPECT_TRUE(unavailable.mRetryable);

    auto other = classify(storageFault("Weird", 418, "I'm a teapot"), context(0, 0));

    EXPECT_EQ(ERROR_KIND_S3_ERROR, other.mKind);
    EXPECT_TRUE(contains(other.mMessage, "S3 operation failed"));
    EXPECT_FALSE(other.mRetryable);
}

TEST(ErrorClassifier, StorageNetworkFaults)
{
    Fault reset(FAULT_ORIGIN_STORAGE, FAULT_CONNECTION_RESET, "reset");

    auto error = classify(reset, context(0, 0));

    EXPECT_EQ(ERROR_KIND_S3_ERROR, error.mKind);
    EXPECT_EQ("Failed to upload to S3: network error", error.mMessage);
    EXPECT_TRUE(error.mRetryable);
}

TEST(ErrorClassifier, PartFailureAfterRetries)
{
    auto fault = storageFault("ServiceUnavailable", 503, "Please reduce your request rate");

    fault.partNumber(3);

    auto error = classify(fault, context(300, 1000));

    EXPECT_EQ(ERROR_KIND_STREAMING_ERROR, error.mKind);
    EXPECT_EQ("Upload failed during part 3: 300 of 1000 bytes transferred (30%)",
              error.mMessage);
    EXPECT_TRUE(error.mRetryable);
}

TEST(ErrorClassifier, PermanentPartFailureIsAStorageError)
{
    auto fault = storageFault("AccessDenied", 403, "Access Denied");

    fault.partNumber(1);

    auto error = classify(fault, context(100, 1000));

    EXPECT_EQ(ERROR_KIND_S3_ERROR, error.mKind);
    EXPECT_EQ("Access denied to bucket 'bucket'", error.mMessage);
    EXPECT_FALSE(error.mRetryable);
}

TEST(ErrorClassifier, ArbitraryExceptions)
{
    auto memory = classify(std::bad_alloc(), context(500, 1000));

    EXPECT_EQ(ERROR_KIND_STREAMING_ERROR, memory.mKind);
    EXPECT_EQ("Insufficient memory for transfer: 500 of 1000 bytes transferred (50%)",
              memory.mMessage);

    auto broken = classify(std::runtime_error("write EPIPE"), context(500, 1000));

    EXPECT_EQ("Connection closed unexpectedly: 500 of 1000 bytes transferred (50%)",
              broken.mMessage);

    auto other = classify(std::runtime_error("kaboom"), context(500, 1000));

    EXPECT_EQ(ERROR_KIND_STREAMING_ERROR, other.mKind);
    EXPECT_TRUE(contains(other.mMessage, "50%"));
    EXPECT_TRUE(contains(other.mMessage, "kaboom"));
    EXPECT_FALSE(other.mRetryable);
}

TEST(ErrorClassifier, LocalFailuresBeforeAnyDataMoved)
{
    auto store = classify(std::runtime_error("database is locked"), context(0, 0));

    EXPECT_EQ(ERROR_KIND_VALIDATION_ERROR, store.mKind);
    EXPECT_EQ("Transfer could not be started: database is locked", store.mMessage);
    EXPECT_FALSE(store.mRetryable);

    auto local = classify(Fault(FAULT_ORIGIN_LOCAL, FAULT_UNKNOWN, "bad handle"),
                          context(0, 1000));

    EXPECT_EQ(ERROR_KIND_VALIDATION_ERROR, local.mKind);
    EXPECT_EQ("Transfer could not be started: bad handle", local.mMessage);

    // Allocation failures are still reported as such.
    auto memory = classify(std::bad_alloc(), context(0, 1000));

    EXPECT_EQ(ERROR_KIND_STREAMING_ERROR, memory.mKind);

    // Once data has moved, local failures are streaming failures.
    auto later = classify(Fault(FAULT_ORIGIN_LOCAL, FAULT_UNKNOWN, "bad handle"),
                          context(250, 1000));

    EXPECT_EQ(ERROR_KIND_STREAMING_ERROR, later.mKind);
    EXPECT_EQ("Streaming transfer failed at 25% "
              "(250 of 1000 bytes transferred): bad handle",
              later.mMessage);

    auto unknown = classify(std::runtime_error("kaboom"), context(250, 0));

    EXPECT_EQ("Streaming transfer failed at 0% "
              "(250 of unknown bytes transferred): kaboom",
              unknown.mMessage);
}

TEST(ErrorClassifier, StructuredFaultsIgnoreTheirMessage)
{
    // The message mentions a timeout but the code says otherwise.
    auto error = classify(sourceFault(FAULT_HOST_NOT_FOUND, "lookup timed out"),
                          context(0, 0));

    EXPECT_EQ("Unable to resolve URL: DNS lookup failed", error.mMessage);
}

TEST(ErrorClassifier, InfersCodesFromMessages)
{
    EXPECT_EQ(FAULT_CONNECTION_RESET, inferFaultCode("read ECONNRESET"));
    EXPECT_EQ(FAULT_BROKEN_PIPE, inferFaultCode("write EPIPE"));
    EXPECT_EQ(FAULT_TIMED_OUT, inferFaultCode("Operation timed out"));
    EXPECT_EQ(FAULT_TIMED_OUT, inferFaultCode("socket timeout"));
    EXPECT_EQ(FAULT_CONNECTION_ABORTED, inferFaultCode("request aborted"));
    EXPECT_EQ(FAULT_NETWORK_UNREACHABLE, inferFaultCode("connect ENETUNREACH"));
    EXPECT_EQ(FAULT_PREMATURE_CLOSE, inferFaultCode("Premature close"));
    EXPECT_EQ(FAULT_UNKNOWN, inferFaultCode("nothing to see here"));
}

TEST(ErrorClassifier, ValidationErrors)
{
    auto error = validationError("bad input");

    EXPECT_EQ(ERROR_KIND_VALIDATION_ERROR, error.mKind);
    EXPECT_STREQ("VALIDATION_ERROR", error.code());
    EXPECT_STREQ("ValidationError", toString(error.mKind));
    EXPECT_EQ("bad input", error.mMessage);
    EXPECT_FALSE(error.mRetryable);
}
