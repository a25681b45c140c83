#include <cstdlib>
#include <memory>

#include <relay/common/logging.h>
#include <relay/common/utility.h>
#include <relay/transfer/curl_source_reader.h>
#include <relay/transfer/curl_utilities.h>

namespace relay
{
namespace transfer
{
namespace
{

// Releases a multi handle when it goes out of scope.
struct MultiHandleDeleter
{
    void operator()(CURLM* handle) const
    {
        curl_multi_cleanup(handle);
    }
}; // MultiHandleDeleter

using EasyHandlePtr = std::unique_ptr<CURL, EasyHandleDeleter>;
using MultiHandlePtr = std::unique_ptr<CURLM, MultiHandleDeleter>;

bool isRedirect(long status)
{
    switch (status)
    {
    case 301:
    case 302:
    case 303:
    case 307:
    case 308:
        return true;
    default:
        break;
    }

    return false;
}

class CurlSourceStream
  : public SourceStream
{
    // Called by libcurl whenever it receives a header line.
    static std::size_t onHeader(char* data,
                                std::size_t size,
                                std::size_t count,
                                void* context);

    // Called by libcurl whenever it receives some of the body.
    static std::size_t onWrite(char* data,
                               std::size_t size,
                               std::size_t count,
                               void* context);

    // Let libcurl make some progress.
    void drive();

    // Translate the transfer's result into a fault.
    Fault fault() const;

    // Process a single header line.
    void header(const std::string& line);

    // Content-Length and Content-Type of the final response.
    std::uint64_t mContentLength;
    std::string mContentType;

    // Has the transfer finished?
    bool mDone;

    // libcurl's handles.
    EasyHandlePtr mEasy;
    MultiHandlePtr mMulti;

    // Human readable description of any failure.
    char mErrorBuffer[CURL_ERROR_SIZE];

    // Have we received the final response's headers?
    bool mHeadersDone;

    common::Logger& mLogger;

    // Body bytes waiting to be handed to our caller.
    std::string mPending;

    // How many body bytes have we received?
    std::uint64_t mReceived;

    // Result of the transfer once it's done.
    CURLcode mResult;

    // Status of the current response.
    long mStatus;

    const std::string mURL;

public:
    CurlSourceStream(const SourceReaderConfig& config,
                     common::Logger& logger,
                     const std::string& url);

    ~CurlSourceStream();

    // Wait for the final response's headers and validate them.
    void start();

    bool next(std::string& chunk) override;

    std::uint64_t totalBytes() const override;
}; // CurlSourceStream

CurlSourceStream::CurlSourceStream(const SourceReaderConfig& config,
                                   common::Logger& logger,
                                   const std::string& url)
  : mContentLength(0)
  , mContentType()
  , mDone(false)
  , mEasy(curl_easy_init())
  , mMulti(curl_multi_init())
  , mErrorBuffer()
  , mHeadersDone(false)
  , mLogger(logger)
  , mPending()
  , mReceived(0)
  , mResult(CURLE_OK)
  , mStatus(0)
  , mURL(url)
{
    if (!mEasy || !mMulti)
        throw Fault(FAULT_ORIGIN_LOCAL,
                    FAULT_OUT_OF_MEMORY,
                    "Unable to allocate libcurl handles");

    auto* easy = mEasy.get();

    curl_easy_setopt(easy, CURLOPT_URL, mURL.c_str());
    curl_easy_setopt(easy, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, mErrorBuffer);
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy, CURLOPT_MAXREDIRS, config.mMaxRedirects);
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(easy,
                     CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(config.mConnectTimeout.count()));

    // A stalled connection is one moving less than a byte per second.
    curl_easy_setopt(easy, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(easy,
                     CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(config.mSocketTimeout.count()));

    curl_easy_setopt(easy, CURLOPT_USERAGENT, config.mUserAgent.c_str());
    curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, &CurlSourceStream::onHeader);
    curl_easy_setopt(easy, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlSourceStream::onWrite);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, this);

    auto result = curl_multi_add_handle(mMulti.get(), easy);

    if (result != CURLM_OK)
        throw Fault(FAULT_ORIGIN_LOCAL,
                    FAULT_UNKNOWN,
                    curl_multi_strerror(result));
}

CurlSourceStream::~CurlSourceStream()
{
    curl_multi_remove_handle(mMulti.get(), mEasy.get());
}

std::size_t CurlSourceStream::onHeader(char* data,
                                       std::size_t size,
                                       std::size_t count,
                                       void* context)
{
    auto& stream = *static_cast<CurlSourceStream*>(context);

    stream.header(std::string(data, size * count));

    return size * count;
}

std::size_t CurlSourceStream::onWrite(char* data,
                                      std::size_t size,
                                      std::size_t count,
                                      void* context)
{
    auto& stream = *static_cast<CurlSourceStream*>(context);
    auto length = size * count;

    // Bodies of redirects and error responses are of no interest.
    if (stream.mStatus < 200 || stream.mStatus >= 300)
        return length;

    stream.mPending.append(data, length);
    stream.mReceived += length;

    return length;
}

void CurlSourceStream::drive()
{
    auto running = 0;
    auto result = curl_multi_perform(mMulti.get(), &running);

    if (result != CURLM_OK)
        throw Fault(FAULT_ORIGIN_LOCAL,
                    FAULT_UNKNOWN,
                    curl_multi_strerror(result));

    if (!running)
    {
        auto remaining = 0;

        while (auto* message = curl_multi_info_read(mMulti.get(), &remaining))
        {
            if (message->msg != CURLMSG_DONE)
                continue;

            mDone = true;
            mResult = message->data.result;
        }

        // Transfer's finished but libcurl had nothing to say.
        mDone = true;

        return;
    }

    // Wait for something interesting to happen.
    result = curl_multi_poll(mMulti.get(), nullptr, 0, 1000, nullptr);

    if (result != CURLM_OK)
        throw Fault(FAULT_ORIGIN_LOCAL,
                    FAULT_UNKNOWN,
                    curl_multi_strerror(result));
}

Fault CurlSourceStream::fault() const
{
    long osErrno = 0;

    curl_easy_getinfo(mEasy.get(), CURLINFO_OS_ERRNO, &osErrno);

    return curlFault(FAULT_ORIGIN_SOURCE, mResult, osErrno, mErrorBuffer);
}

void CurlSourceStream::header(const std::string& line)
{
    // Status line of a new response.
    if (!line.compare(0, 5, "HTTP/"))
    {
        auto space = line.find(' ');

        mContentLength = 0;
        mContentType.clear();
        mStatus = 0;

        if (space != std::string::npos)
            mStatus = std::strtol(line.c_str() + space + 1, nullptr, 10);

        return;
    }

    auto value = common::trim(line);

    // Blank line: The response's headers are complete.
    if (value.empty())
    {
        // Interim responses and redirects precede the response we want.
        mHeadersDone = mStatus >= 200 && !isRedirect(mStatus);
        return;
    }

    auto colon = value.find(':');

    if (colon == std::string::npos)
        return;

    auto name = common::toLower(value.substr(0, colon));

    value = common::trim(value.substr(colon + 1));

    if (name == "content-length")
        mContentLength = std::strtoull(value.c_str(), nullptr, 10);
    else if (name == "content-type")
        mContentType = value;
}

void CurlSourceStream::start()
{
    while (!mHeadersDone && !mDone)
        drive();

    if (!mHeadersDone)
    {
        if (mResult != CURLE_OK)
            throw fault();

        // Redirect without a destination.
        throw httpFault(mStatus, common::format("HTTP %ld", mStatus));
    }

    LogDebugF(mLogger,
              "Source responded with HTTP %ld (%llu bytes, type: %s)",
              mStatus,
              static_cast<unsigned long long>(mContentLength),
              mContentType.empty() ? "unspecified" : mContentType.c_str());

    if (mStatus < 200 || mStatus >= 300)
        throw httpFault(mStatus, common::format("HTTP %ld", mStatus));

    if (!acceptableContentType(mContentType))
        LogWarningF(mLogger,
                    "Unexpected content type from %s: %s",
                    mURL.c_str(),
                    mContentType.empty() ? "unspecified" : mContentType.c_str());
}

bool CurlSourceStream::next(std::string& chunk)
{
    chunk.clear();

    while (mPending.empty() && !mDone)
        drive();

    // Deliver whatever we've received before reporting any failure.
    if (!mPending.empty())
    {
        chunk.swap(mPending);
        return true;
    }

    if (mResult != CURLE_OK)
        throw fault();

    if (mContentLength && mReceived < mContentLength)
        throw sourceFault(FAULT_PREMATURE_CLOSE,
                          common::format("Premature close after %llu of %llu bytes",
                                         static_cast<unsigned long long>(mReceived),
                                         static_cast<unsigned long long>(mContentLength)));

    return false;
}

std::uint64_t CurlSourceStream::totalBytes() const
{
    return mContentLength;
}

} // anonymous

CurlSourceReader::CurlSourceReader(const SourceReaderConfig& config,
                                   common::Logger& logger)
  : SourceReader()
  , mConfig(config)
  , mLogger(logger)
{
    ensureCurlInitialized();
}

SourceStreamPtr CurlSourceReader::open(const std::string& url)
{
    LogDebugF(mLogger, "Opening source: %s", url.c_str());

    auto stream = std::make_unique<CurlSourceStream>(mConfig, mLogger, url);

    stream->start();

    return stream;
}

bool acceptableContentType(const std::string& contentType)
{
    static const char* accepted[] = {
        "application/octet-stream",
        "application/x-zip",
        "application/x-zip-compressed",
        "application/zip",
        "multipart/x-zip"
    }; // accepted

    // Strip any parameters such as charset.
    auto type = common::toLower(common::trim(contentType.substr(0, contentType.find(';'))));

    for (auto* candidate : accepted)
    {
        if (type == candidate)
            return true;
    }

    return false;
}

} // transfer
} // relay

