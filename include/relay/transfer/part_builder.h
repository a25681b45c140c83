#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <relay/transfer/error_or.h>
#include <relay/transfer/upload_part.h>

namespace relay
{
namespace transfer
{

constexpr std::uint64_t MiB = 1024ull * 1024ull;
constexpr std::uint64_t GiB = 1024ull * MiB;
constexpr std::uint64_t TiB = 1024ull * GiB;

// Limits imposed by the store.
constexpr std::uint64_t MinPartSize = 5 * MiB;
constexpr std::uint64_t MaxPartSize = 5 * GiB;
constexpr std::uint64_t MaxPartCount = 10000;

// The largest payload we're willing to relay.
constexpr std::uint64_t MaxObjectSize = 10 * TiB;

// Select a part size suitable for a payload of totalBytes.
//
// Larger payloads use larger parts so that they fit within the store's
// part count limit. A nonzero override replaces the adaptive choice but
// must still respect the part count limit.
ErrorOr<std::uint64_t> selectPartSize(std::uint64_t totalBytes,
                                      std::uint64_t overrideSize = 0);

// Accumulates a stream of chunks into numbered parts.
class PartBuilder
{
    // Bytes waiting to become part of a part.
    std::string mBuffer;

    // How many bytes have we consumed in total?
    std::uint64_t mConsumed;

    // What number will the next part have?
    std::uint32_t mNextPartNumber;

    // How large should each part be?
    const std::uint64_t mPartSize;

    // Take ownership of the buffer as a new part.
    UploadPart emit();

public:
    explicit PartBuilder(std::uint64_t partSize);

    PartBuilder(const PartBuilder& other) = delete;

    PartBuilder& operator=(const PartBuilder& rhs) = delete;

    // Consume bytes from the front of chunk.
    //
    // Consumes at most enough bytes to complete one part and advances chunk
    // past whatever was consumed. Callers should call this repeatedly until
    // chunk is empty.
    //
    // Returns a part if one was completed.
    std::optional<UploadPart> consume(std::string_view& chunk);

    // Flush any buffered bytes as the final part.
    //
    // The final part is the only one that may be smaller than the part
    // size. Returns nothing if no bytes remain.
    std::optional<UploadPart> finish();

    // How many bytes have been consumed so far?
    std::uint64_t consumed() const;

    // How many parts have been emitted so far?
    std::uint32_t emitted() const;

    std::uint64_t partSize() const;
}; // PartBuilder

} // transfer
} // relay

