#include <utility>

#include <relay/transfer/fault.h>

namespace relay
{
namespace transfer
{

const char* toString(FaultOrigin origin)
{
    switch (origin)
    {
#define DEFINE_FAULT_ORIGIN_CLAUSE(name) case FAULT_ORIGIN_ ## name: return #name;
        DEFINE_FAULT_ORIGINS(DEFINE_FAULT_ORIGIN_CLAUSE);
#undef DEFINE_FAULT_ORIGIN_CLAUSE
    }

    // Silence the compiler.
    return "N/A";
}

const char* toString(FaultCode code)
{
    switch (code)
    {
#define DEFINE_FAULT_CODE_CLAUSE(name) case FAULT_ ## name: return #name;
        DEFINE_FAULT_CODES(DEFINE_FAULT_CODE_CLAUSE);
#undef DEFINE_FAULT_CODE_CLAUSE
    }

    // Silence the compiler.
    return "N/A";
}

Fault::Fault(FaultOrigin origin,
             FaultCode code,
             const std::string& message)
  : std::runtime_error(message)
  , mCode(code)
  , mHTTPStatus(0)
  , mOrigin(origin)
  , mPartNumber(0)
  , mServiceCode()
{
}

Fault& Fault::httpStatus(long status)
{
    mHTTPStatus = status;

    return *this;
}

Fault& Fault::partNumber(std::uint32_t number)
{
    mPartNumber = number;

    return *this;
}

Fault& Fault::serviceCode(std::string code)
{
    mServiceCode = std::move(code);

    return *this;
}

FaultCode Fault::code() const
{
    return mCode;
}

long Fault::httpStatus() const
{
    return mHTTPStatus;
}

FaultOrigin Fault::origin() const
{
    return mOrigin;
}

std::uint32_t Fault::partNumber() const
{
    return mPartNumber;
}

const std::string& Fault::serviceCode() const
{
    return mServiceCode;
}

Fault sourceFault(FaultCode code, const std::string& message)
{
    return Fault(FAULT_ORIGIN_SOURCE, code, message);
}

Fault httpFault(long status, const std::string& message)
{
    return Fault(FAULT_ORIGIN_SOURCE, FAULT_HTTP_STATUS, message).httpStatus(status);
}

Fault storageFault(const std::string& serviceCode,
                   long status,
                   const std::string& message)
{
    return Fault(FAULT_ORIGIN_STORAGE, FAULT_SERVICE_ERROR, message)
             .httpStatus(status)
             .serviceCode(serviceCode);
}

} // transfer
} // relay

