#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace relay
{
namespace transfer
{

// A lazy, finite, non-restartable sequence of byte chunks.
class SourceStream
{
public:
    virtual ~SourceStream() = default;

    // Retrieve the next chunk of the payload.
    //
    // Returns false once the payload has been exhausted. Throws a Fault if
    // the connection fails or closes before the declared length arrives.
    virtual bool next(std::string& chunk) = 0;

    // How many bytes did the source declare? Zero if unknown.
    virtual std::uint64_t totalBytes() const = 0;
}; // SourceStream

using SourceStreamPtr = std::unique_ptr<SourceStream>;

// Opens streams to remote sources.
class SourceReader
{
public:
    virtual ~SourceReader() = default;

    // Issue a request for url and validate the response.
    //
    // Throws a Fault if the source can't be reached or rejects the request.
    virtual SourceStreamPtr open(const std::string& url) = 0;
}; // SourceReader

} // transfer
} // relay

