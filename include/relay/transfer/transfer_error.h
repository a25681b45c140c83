#pragma once

#include <cstddef>
#include <string>

#include <relay/transfer/transfer_error_forward.h>

namespace relay
{
namespace transfer
{

// name, stable code
#define DEFINE_ERROR_KINDS(expander) \
    expander(UrlFetchError, URL_FETCH_ERROR) \
    expander(StorageError, S3_ERROR) \
    expander(StreamingError, STREAMING_ERROR) \
    expander(ValidationError, VALIDATION_ERROR)

enum ErrorKind : unsigned int
{
#define DEFINE_ERROR_KIND_ENUMERANT(name, code) ERROR_KIND_ ## code,
    DEFINE_ERROR_KINDS(DEFINE_ERROR_KIND_ENUMERANT)
#undef DEFINE_ERROR_KIND_ENUMERANT
}; // ErrorKind

#define PLUS1(name, code) + 1

constexpr std::size_t NUM_ERROR_KINDS =
    DEFINE_ERROR_KINDS(PLUS1);

#undef PLUS1

// The kind's stable taxonomy code, e.g. "URL_FETCH_ERROR".
const char* toCode(ErrorKind kind);

// The kind's name, e.g. "UrlFetchError".
const char* toString(ErrorKind kind);

// A classified failure.
struct TransferError
{
    TransferError() = default;

    TransferError(ErrorKind kind,
                  std::string message,
                  bool retryable);

    // Stable taxonomy code.
    const char* code() const;

    bool operator==(const TransferError& rhs) const;

    ErrorKind mKind = ERROR_KIND_VALIDATION_ERROR;

    // Human readable, never a stack trace.
    std::string mMessage;

    // Should an orchestrator try the whole transfer again?
    bool mRetryable = false;
}; // TransferError

} // transfer
} // relay

