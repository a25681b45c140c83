#include <utility>

#include <relay/transfer/transfer_error.h>

namespace relay
{
namespace transfer
{

const char* toCode(ErrorKind kind)
{
    switch (kind)
    {
#define DEFINE_ERROR_KIND_CLAUSE(name, code) case ERROR_KIND_ ## code: return #code;
        DEFINE_ERROR_KINDS(DEFINE_ERROR_KIND_CLAUSE);
#undef DEFINE_ERROR_KIND_CLAUSE
    }

    // Silence the compiler.
    return "N/A";
}

const char* toString(ErrorKind kind)
{
    switch (kind)
    {
#define DEFINE_ERROR_KIND_CLAUSE(name, code) case ERROR_KIND_ ## code: return #name;
        DEFINE_ERROR_KINDS(DEFINE_ERROR_KIND_CLAUSE);
#undef DEFINE_ERROR_KIND_CLAUSE
    }

    // Silence the compiler.
    return "N/A";
}

TransferError::TransferError(ErrorKind kind,
                             std::string message,
                             bool retryable)
  : mKind(kind)
  , mMessage(std::move(message))
  , mRetryable(retryable)
{
}

const char* TransferError::code() const
{
    return toCode(mKind);
}

bool TransferError::operator==(const TransferError& rhs) const
{
    return mKind == rhs.mKind
           && mMessage == rhs.mMessage
           && mRetryable == rhs.mRetryable;
}

} // transfer
} // relay

