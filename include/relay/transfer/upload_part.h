#pragma once

#include <cstdint>
#include <string>

namespace relay
{
namespace transfer
{

// A contiguous, numbered range of the source payload.
struct UploadPart
{
    // Where does this part start within the payload?
    std::uint64_t begin() const
    {
        return mOffset;
    }

    // Where does this part end within the payload?
    std::uint64_t end() const
    {
        return mOffset + mData.size();
    }

    std::uint64_t size() const
    {
        return mData.size();
    }

    // The part's content.
    std::string mData;

    // Assigned by the store once the part has been uploaded.
    std::string mETag;

    std::uint64_t mOffset = 0;

    // One-based.
    std::uint32_t mPartNumber = 0;
}; // UploadPart

// What the store needs to know about an uploaded part.
struct CompletedPart
{
    bool operator<(const CompletedPart& rhs) const
    {
        return mPartNumber < rhs.mPartNumber;
    }

    std::string mETag;
    std::uint32_t mPartNumber = 0;
}; // CompletedPart

} // transfer
} // relay

