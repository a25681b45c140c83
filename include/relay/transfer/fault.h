#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace relay
{
namespace transfer
{

#define DEFINE_FAULT_ORIGINS(expander) \
    expander(LOCAL) \
    expander(SOURCE) \
    expander(STORAGE)

// Where did a fault occur?
enum FaultOrigin : unsigned int
{
#define DEFINE_FAULT_ORIGIN_ENUMERANT(name) FAULT_ORIGIN_ ## name,
    DEFINE_FAULT_ORIGINS(DEFINE_FAULT_ORIGIN_ENUMERANT)
#undef DEFINE_FAULT_ORIGIN_ENUMERANT
}; // FaultOrigin

#define DEFINE_FAULT_CODES(expander) \
    expander(BROKEN_PIPE) \
    expander(CONNECTION_ABORTED) \
    expander(CONNECTION_REFUSED) \
    expander(CONNECTION_RESET) \
    expander(HOST_NOT_FOUND) \
    expander(HOST_UNREACHABLE) \
    expander(HTTP_STATUS) \
    expander(NETWORK_UNREACHABLE) \
    expander(OUT_OF_MEMORY) \
    expander(PREMATURE_CLOSE) \
    expander(SERVICE_ERROR) \
    expander(TIMED_OUT) \
    expander(TLS_FAILURE) \
    expander(UNKNOWN)

// What went wrong, as precisely as the transport could tell us.
enum FaultCode : unsigned int
{
#define DEFINE_FAULT_CODE_ENUMERANT(name) FAULT_ ## name,
    DEFINE_FAULT_CODES(DEFINE_FAULT_CODE_ENUMERANT)
#undef DEFINE_FAULT_CODE_ENUMERANT
}; // FaultCode

const char* toString(FaultOrigin origin);

const char* toString(FaultCode code);

// A raw failure raised by a transport.
//
// Faults carry enough structure to be classified without inspecting
// their message. The message is kept for logging and as a last resort.
class Fault
  : public std::runtime_error
{
    FaultCode mCode;
    long mHTTPStatus;
    FaultOrigin mOrigin;
    std::uint32_t mPartNumber;
    std::string mServiceCode;

public:
    Fault(FaultOrigin origin,
          FaultCode code,
          const std::string& message);

    // Specify the HTTP status associated with this fault.
    Fault& httpStatus(long status);

    // Specify which part was being uploaded when this fault occurred.
    Fault& partNumber(std::uint32_t number);

    // Specify the storage service's error code, e.g. "AccessDenied".
    Fault& serviceCode(std::string code);

    FaultCode code() const;

    long httpStatus() const;

    FaultOrigin origin() const;

    // Zero if the fault didn't occur while uploading a part.
    std::uint32_t partNumber() const;

    const std::string& serviceCode() const;
}; // Fault

// Convenience.
Fault sourceFault(FaultCode code, const std::string& message);

Fault httpFault(long status, const std::string& message);

Fault storageFault(const std::string& serviceCode,
                   long status,
                   const std::string& message);

} // transfer
} // relay

