#pragma once

#include <cstdint>
#include <exception>
#include <string>

#include <relay/transfer/fault.h>
#include <relay/transfer/transfer_error.h>

namespace relay
{
namespace transfer
{

// What the classifier needs to know about the transfer at the time of
// the failure.
struct ClassifierContext
{
    // Which bucket were we writing to?
    std::string mBucket;

    // How many bytes had been consumed from the source?
    std::uint64_t mBytesTransferred = 0;

    // How many bytes did the source declare? Zero if unknown.
    std::uint64_t mTotalBytes = 0;
}; // ClassifierContext

// Map a raw fault onto exactly one classified error.
//
// Faults are classified by their structured code. Only faults whose code
// is FAULT_UNKNOWN fall back to inspecting their message.
TransferError classify(const Fault& fault, const ClassifierContext& context);

// Classify an arbitrary exception.
//
// Faults are dispatched to the function above. Anything else raised
// before the first byte was consumed is a local failure reported as a
// validation error. Later, it's a mid-transfer failure whose nature is
// inferred from its message.
TransferError classify(const std::exception& exception,
                       const ClassifierContext& context);

// Guess a fault's code from its message.
//
// Known fragility: this is a substring match against the wording used by
// common transports and may misclassify unrelated messages. It is only
// consulted when no structured code is available.
FaultCode inferFaultCode(const std::string& message);

// Is the storage service likely to succeed if this request is repeated?
bool transient(const Fault& fault);

// Convenience.
TransferError validationError(const std::string& message);

} // transfer
} // relay

