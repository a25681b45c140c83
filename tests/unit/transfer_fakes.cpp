#include <algorithm>
#include <atomic>
#include <thread>
#include <utility>

#include <unistd.h>

#include <relay/common/utility.h>

#include "transfer_fakes.h"

namespace relay
{
namespace testing
{

using namespace transfer;

namespace
{

class FakeSourceStream
  : public SourceStream
{
    const FakeSourceReader& mReader;
    std::size_t mPosition = 0;

public:
    explicit FakeSourceStream(const FakeSourceReader& reader)
      : mReader(reader)
    {
    }

    bool next(std::string& chunk) override
    {
        chunk.clear();

        auto end = mReader.mPayload.size();

        // Stop short wherever the failure's been injected.
        if (mReader.mStreamFailure)
        {
            auto failAt = static_cast<std::size_t>(mReader.mFailAfter);

            if (mPosition >= failAt)
                throw *mReader.mStreamFailure;

            end = std::min(end, failAt);
        }

        if (mPosition >= end)
            return false;

        auto count = std::min(mReader.mChunkSize, end - mPosition);

        chunk = mReader.mPayload.substr(mPosition, count);
        mPosition += count;

        return true;
    }

    std::uint64_t totalBytes() const override
    {
        if (!mReader.mDeclareLength)
            return 0;

        return mReader.mPayload.size();
    }
}; // FakeSourceStream

std::string location(const std::string& bucket, const std::string& key)
{
    return bucket + "/" + key;
}

} // anonymous

SourceStreamPtr FakeSourceReader::open(const std::string& url)
{
    mOpened.emplace_back(url);

    if (mOpenFailure)
        throw *mOpenFailure;

    return std::make_unique<FakeSourceStream>(*this);
}

void FakeObjectStore::fail(std::deque<Fault>& queue)
{
    if (queue.empty())
        return;

    auto fault = std::move(queue.front());

    queue.pop_front();

    throw fault;
}

void FakeObjectStore::abort(const std::string&,
                            const std::string&,
                            const std::string& uploadID)
{
    std::lock_guard<std::mutex> guard(mLock);

    ++mAborts;

    fail(mAbortFailures);

    if (!mUploads.erase(uploadID))
        throw storageFault("NoSuchUpload", 404, "The specified upload does not exist");
}

void FakeObjectStore::complete(const std::string& bucket,
                               const std::string& key,
                               const std::string& uploadID,
                               const std::vector<CompletedPart>& parts)
{
    std::lock_guard<std::mutex> guard(mLock);

    ++mCompletes;

    std::vector<std::uint32_t> order;

    for (auto& part : parts)
        order.emplace_back(part.mPartNumber);

    mCompletedOrders.emplace_back(std::move(order));

    fail(mCompleteFailures);

    auto i = mUploads.find(uploadID);

    if (i == mUploads.end())
        throw storageFault("NoSuchUpload", 404, "The specified upload does not exist");

    std::string content;

    for (auto& part : parts)
    {
        auto j = i->second.mParts.find(part.mPartNumber);

        if (j == i->second.mParts.end())
            throw storageFault("InvalidPart", 400, "One or more parts could not be found");

        if (part.mETag != common::format("\"etag-%u\"", part.mPartNumber))
            throw storageFault("InvalidPart", 400, "Entity tag mismatch");

        content += j->second;
    }

    // Completing an upload replaces any existing object.
    mObjects[location(bucket, key)] = std::move(content);

    mUploads.erase(i);
}

void FakeObjectStore::headBucket(const std::string& bucket)
{
    std::lock_guard<std::mutex> guard(mLock);

    ++mHeads;

    fail(mHeadFailures);

    if (!mBuckets.count(bucket))
        throw storageFault(std::string(), 404, "Not Found");
}

std::string FakeObjectStore::initiate(const std::string& bucket,
                                      const std::string& key)
{
    std::lock_guard<std::mutex> guard(mLock);

    ++mInitiates;

    fail(mInitiateFailures);

    if (!mBuckets.count(bucket))
        throw storageFault("NoSuchBucket", 404, "The specified bucket does not exist");

    auto uploadID = "upload-" + std::to_string(mNextUploadID++);

    auto& upload = mUploads[uploadID];

    upload.mBucket = bucket;
    upload.mKey = key;

    return uploadID;
}

std::string FakeObjectStore::uploadPart(const std::string&,
                                        const std::string&,
                                        const std::string& uploadID,
                                        const UploadPart& part)
{
    std::chrono::milliseconds delay(0);

    {
        std::lock_guard<std::mutex> guard(mLock);

        ++mPartAttempts;

        fail(mPartFailures[part.mPartNumber]);

        mPeakInFlight = std::max(mPeakInFlight, ++mInFlight);

        if (mPartDelay)
            delay = mPartDelay(part.mPartNumber);
    }

    std::this_thread::sleep_for(delay);

    std::lock_guard<std::mutex> guard(mLock);

    --mInFlight;

    auto i = mUploads.find(uploadID);

    if (i == mUploads.end())
        throw storageFault("NoSuchUpload", 404, "The specified upload does not exist");

    i->second.mParts[part.mPartNumber] = part.mData;

    return common::format("\"etag-%u\"", part.mPartNumber);
}

std::optional<std::string> FakeObjectStore::object(const std::string& bucket,
                                                   const std::string& key) const
{
    std::lock_guard<std::mutex> guard(mLock);

    auto i = mObjects.find(location(bucket, key));

    if (i == mObjects.end())
        return std::nullopt;

    return i->second;
}

std::size_t FakeObjectStore::openUploads() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mUploads.size();
}

std::string payload(std::size_t size)
{
    std::string result;

    result.reserve(size);

    for (std::size_t i = 0; i < size; ++i)
        result.push_back(static_cast<char>((i * 31 + i / 251) & 0xff));

    return result;
}

TemporaryFile::TemporaryFile(const std::string& name)
  : mPath()
{
    static std::atomic<unsigned int> counter{0};

    auto leaf = common::format("relay-%d-%u-%s",
                               static_cast<int>(getpid()),
                               counter++,
                               name.c_str());

    mPath = std::filesystem::temp_directory_path() / leaf;
}

TemporaryFile::~TemporaryFile()
{
    std::error_code error;

    // The database may have left journals behind.
    for (auto* suffix : {"", "-shm", "-wal", "-journal"})
        std::filesystem::remove(mPath.string() + suffix, error);
}

std::string TemporaryFile::path() const
{
    return mPath.string();
}

} // testing
} // relay

