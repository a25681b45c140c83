#include <algorithm>
#include <cassert>
#include <utility>

#include <relay/common/utility.h>
#include <relay/transfer/error_classifier.h>
#include <relay/transfer/part_builder.h>

namespace relay
{
namespace transfer
{

static std::uint64_t ceilDiv(std::uint64_t numerator, std::uint64_t denominator)
{
    return numerator / denominator + !!(numerator % denominator);
}

ErrorOr<std::uint64_t> selectPartSize(std::uint64_t totalBytes,
                                      std::uint64_t overrideSize)
{
    if (totalBytes > MaxObjectSize)
        return common::unexpected(
                 TransferError(ERROR_KIND_STREAMING_ERROR,
                               common::format("File size exceeds maximum supported "
                                              "size of 10 TiB: %llu bytes",
                                              static_cast<unsigned long long>(totalBytes)),
                               false));

    // Caller knows best.
    if (overrideSize)
    {
        if (overrideSize > MaxPartSize)
            return common::unexpected(
                     validationError("Part size exceeds the maximum of 5 GiB"));

        if (totalBytes && ceilDiv(totalBytes, overrideSize) > MaxPartCount)
            return common::unexpected(
                     validationError(common::format("Part size of %llu bytes would need "
                                                    "more than %llu parts",
                                                    static_cast<unsigned long long>(overrideSize),
                                                    static_cast<unsigned long long>(MaxPartCount))));

        return overrideSize;
    }

    std::uint64_t partSize = 500 * MiB;

    if (totalBytes < 10 * GiB)
        partSize = 100 * MiB;
    else if (totalBytes < 100 * GiB)
        partSize = 250 * MiB;

    partSize = std::clamp(partSize, MinPartSize, MaxPartSize);

    // Make sure we don't exceed the store's part count limit.
    if (ceilDiv(totalBytes, partSize) > MaxPartCount)
        partSize = ceilDiv(totalBytes, MaxPartCount);

    if (partSize > MaxPartSize)
        return common::unexpected(
                 validationError("File too large: required part size exceeds 5 GiB"));

    return partSize;
}

UploadPart PartBuilder::emit()
{
    // Sanity.
    assert(!mBuffer.empty());

    UploadPart part;

    part.mOffset = mConsumed - mBuffer.size();
    part.mPartNumber = mNextPartNumber++;

    // Hand our buffer over to the part.
    part.mData.swap(mBuffer);

    return part;
}

PartBuilder::PartBuilder(std::uint64_t partSize)
  : mBuffer()
  , mConsumed(0)
  , mNextPartNumber(1)
  , mPartSize(partSize)
{
    assert(mPartSize);
}

std::optional<UploadPart> PartBuilder::consume(std::string_view& chunk)
{
    // How many bytes can we take before the buffer is full?
    auto wanted = mPartSize - mBuffer.size();
    auto count = std::min<std::uint64_t>(wanted, chunk.size());

    // Make sure we only allocate once per part.
    if (mBuffer.empty() && count)
        mBuffer.reserve(static_cast<std::size_t>(mPartSize));

    mBuffer.append(chunk.data(), static_cast<std::size_t>(count));

    chunk.remove_prefix(static_cast<std::size_t>(count));

    mConsumed += count;

    // Buffer isn't full yet.
    if (mBuffer.size() < mPartSize)
        return std::nullopt;

    return emit();
}

std::optional<UploadPart> PartBuilder::finish()
{
    if (mBuffer.empty())
        return std::nullopt;

    return emit();
}

std::uint64_t PartBuilder::consumed() const
{
    return mConsumed;
}

std::uint32_t PartBuilder::emitted() const
{
    return mNextPartNumber - 1;
}

std::uint64_t PartBuilder::partSize() const
{
    return mPartSize;
}

} // transfer
} // relay

