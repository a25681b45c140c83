#include <memory>
#include <utility>
#include <vector>

#include <rapidxml/rapidxml.hpp>

#include <relay/common/logging.h>
#include <relay/common/utility.h>
#include <relay/transfer/curl_utilities.h>
#include <relay/transfer/s3_object_store.h>
#include <relay/transfer/subsystem_loggers.h>

namespace relay
{
namespace transfer
{
namespace
{

using EasyHandlePtr = std::unique_ptr<CURL, EasyHandleDeleter>;
using HeaderListPtr = std::unique_ptr<curl_slist, HeaderListDeleter>;

const std::string EmptyPayloadHash = sha256Hex(std::string());

std::size_t onBody(char* data,
                   std::size_t size,
                   std::size_t count,
                   void* context)
{
    static_cast<std::string*>(context)->append(data, size * count);

    return size * count;
}

std::size_t onHeader(char* data,
                     std::size_t size,
                     std::size_t count,
                     void* context)
{
    auto line = std::string(data, size * count);
    auto colon = line.find(':');

    if (colon != std::string::npos
        && common::toLower(line.substr(0, colon)) == "etag")
        *static_cast<std::string*>(context) = common::trim(line.substr(colon + 1));

    return size * count;
}

// Path-style location of key within bucket.
std::string objectPath(const std::string& bucket, const std::string& key)
{
    auto path = "/" + uriEncode(bucket, true);

    if (!key.empty())
        path += "/" + uriEncode(key, false);

    return path;
}

} // anonymous

S3ObjectStore::S3ObjectStore(const S3Config& config, common::Logger& logger)
  : ObjectStore()
  , mConfig(config)
  , mEndpoint(config.mEndpoint)
  , mHost()
  , mLogger(logger)
{
    ensureCurlInitialized();

    if (mEndpoint.empty())
        mEndpoint = "https://s3." + mConfig.mRegion + ".amazonaws.com";

    // Trailing slashes would end up in every path.
    while (!mEndpoint.empty() && mEndpoint.back() == '/')
        mEndpoint.pop_back();

    auto scheme = mEndpoint.find("://");

    if (scheme == std::string::npos)
        throw LogErrorF(mLogger, "Malformed storage endpoint: %s", mEndpoint.c_str());

    mHost = mEndpoint.substr(scheme + 3);

    if (mHost.empty() || mHost.find('/') != std::string::npos)
        throw LogErrorF(mLogger, "Malformed storage endpoint: %s", mEndpoint.c_str());

    LogDebugF(mLogger,
              "Using storage endpoint %s (region: %s)",
              mEndpoint.c_str(),
              mConfig.mRegion.c_str());
}

auto S3ObjectStore::request(const std::string& method,
                            const std::string& bucket,
                            const std::string& key,
                            const std::map<std::string, std::string>& query,
                            const char* body,
                            std::size_t length,
                            const char* contentType) const
  -> Response
{
    EasyHandlePtr easy(curl_easy_init());

    if (!easy)
        throw Fault(FAULT_ORIGIN_LOCAL,
                    FAULT_OUT_OF_MEMORY,
                    "Unable to allocate libcurl handle");

    SignableRequest signable;

    signable.mMethod = method;
    signable.mPath = objectPath(bucket, key);
    signable.mQuery = query;

    if (length)
        signable.mPayloadHash = sha256Hex(body, length);
    else
        signable.mPayloadHash = EmptyPayloadHash;

    auto timestamp = amzTimestamp();

    signable.mHeaders["host"] = mHost;
    signable.mHeaders["x-amz-content-sha256"] = signable.mPayloadHash;
    signable.mHeaders["x-amz-date"] = timestamp;

    if (!mConfig.mCredentials.mSessionToken.empty())
        signable.mHeaders["x-amz-security-token"] = mConfig.mCredentials.mSessionToken;

    auto signature = authorization(signable,
                                        mConfig.mCredentials,
                                        mConfig.mRegion,
                                        "s3",
                                        timestamp);

    HeaderListPtr headers;

    auto append = [&headers](const std::string& header) {
        auto* list = curl_slist_append(headers.get(), header.c_str());

        if (!list)
            throw Fault(FAULT_ORIGIN_LOCAL,
                        FAULT_OUT_OF_MEMORY,
                        "Unable to allocate request header");

        headers.release();
        headers.reset(list);
    }; // append

    for (auto& header : signable.mHeaders)
    {
        // libcurl derives the host header from the URL.
        if (header.first != "host")
            append(header.first + ": " + header.second);
    }

    append("Authorization: " + signature);
    append(std::string("Content-Type: ") + (contentType ? contentType : "application/octet-stream"));

    // Don't wait for permission to send the body.
    append("Expect:");

    auto url = mEndpoint + signable.mPath;
    auto parameters = canonicalQuery(query);

    if (!parameters.empty())
        url += "?" + parameters;

    Response response;
    char errorBuffer[CURL_ERROR_SIZE] = {};

    auto* handle = easy.get();

    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle,
                     CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(mConfig.mConnectTimeout.count()));
    curl_easy_setopt(handle,
                     CURLOPT_TIMEOUT,
                     static_cast<long>(mConfig.mRequestTimeout.count()));
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, &onHeader);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.mETag);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &onBody);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.mBody);

    if (method == "HEAD")
    {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    }
    else
    {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, method.c_str());

        if (method != "DELETE")
        {
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, length ? body : "");
            curl_easy_setopt(handle,
                             CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(length));
        }
    }

    auto result = curl_easy_perform(handle);

    if (result != CURLE_OK)
    {
        long osErrno = 0;

        curl_easy_getinfo(handle, CURLINFO_OS_ERRNO, &osErrno);

        throw curlFault(FAULT_ORIGIN_STORAGE, result, osErrno, errorBuffer);
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.mStatus);

    if (response.mStatus >= 200 && response.mStatus < 300)
        return response;

    auto code = responseElement(response.mBody, {"Error", "Code"});
    auto message = responseElement(response.mBody, {"Error", "Message"});

    if (message.empty())
        message = common::format("%s %s failed with HTTP %ld",
                                 method.c_str(),
                                 signable.mPath.c_str(),
                                 response.mStatus);

    LogDebugF(mLogger,
              "%s %s: HTTP %ld (%s): %s",
              method.c_str(),
              signable.mPath.c_str(),
              response.mStatus,
              code.empty() ? "no code" : code.c_str(),
              message.c_str());

    throw storageFault(code, response.mStatus, message);
}

void S3ObjectStore::abort(const std::string& bucket,
                          const std::string& key,
                          const std::string& uploadID)
{
    request("DELETE",
            bucket,
            key,
            {{"uploadId", uploadID}},
            nullptr,
            0,
            nullptr);
}

void S3ObjectStore::complete(const std::string& bucket,
                             const std::string& key,
                             const std::string& uploadID,
                             const std::vector<CompletedPart>& parts)
{
    auto document = completionDocument(parts);

    auto response = request("POST",
                            bucket,
                            key,
                            {{"uploadId", uploadID}},
                            document.data(),
                            document.size(),
                            "application/xml");

    // Completion can fail after the service has sent a 200.
    auto code = responseElement(response.mBody, {"Error", "Code"});

    if (code.empty())
        return;

    throw storageFault(code,
                       response.mStatus,
                       responseElement(response.mBody, {"Error", "Message"}));
}

void S3ObjectStore::headBucket(const std::string& bucket)
{
    request("HEAD", bucket, std::string(), {}, nullptr, 0, nullptr);
}

std::string S3ObjectStore::initiate(const std::string& bucket,
                                    const std::string& key)
{
    auto response = request("POST",
                            bucket,
                            key,
                            {{"uploads", std::string()}},
                            nullptr,
                            0,
                            nullptr);

    auto uploadID = responseElement(response.mBody, {"InitiateMultipartUploadResult", "UploadId"});

    if (uploadID.empty())
        throw storageFault("InvalidResponse",
                           response.mStatus,
                           "Response didn't contain an upload ID");

    return uploadID;
}

std::string S3ObjectStore::uploadPart(const std::string& bucket,
                                      const std::string& key,
                                      const std::string& uploadID,
                                      const UploadPart& part)
{
    auto response = request("PUT",
                            bucket,
                            key,
                            {{"partNumber", std::to_string(part.mPartNumber)},
                             {"uploadId", uploadID}},
                            part.mData.data(),
                            part.mData.size(),
                            nullptr);

    if (response.mETag.empty())
        throw storageFault("InvalidResponse",
                           response.mStatus,
                           common::format("Part %u was stored without an entity tag",
                                          part.mPartNumber));

    return response.mETag;
}

std::string completionDocument(const std::vector<CompletedPart>& parts)
{
    std::string document = "<CompleteMultipartUpload>";

    for (auto& part : parts)
    {
        document += common::format("<Part><PartNumber>%u</PartNumber>"
                                   "<ETag>%s</ETag></Part>",
                                   part.mPartNumber,
                                   xmlEscape(part.mETag).c_str());
    }

    document += "</CompleteMultipartUpload>";

    return document;
}

std::string responseElement(const std::string& document,
                            std::initializer_list<const char*> path)
{
    // The parser works in place and expects a terminated buffer.
    std::vector<char> buffer(document.begin(), document.end());

    buffer.push_back('\0');

    rapidxml::xml_document<> parsed;

    try
    {
        parsed.parse<0>(buffer.data());
    }
    catch (const rapidxml::parse_error& exception)
    {
        LogDebugF(transferLogger(),
                  "Couldn't parse response document: %s",
                  exception.what());

        return std::string();
    }

    rapidxml::xml_node<>* node = &parsed;

    for (auto name : path)
    {
        node = node->first_node(name);

        if (!node)
            return std::string();
    }

    std::string text;

    // Character data may be split across several text and CDATA nodes.
    for (auto* child = node->first_node(); child; child = child->next_sibling())
    {
        if (child->type() == rapidxml::node_data
            || child->type() == rapidxml::node_cdata)
            text.append(child->value(), child->value_size());
    }

    return text;
}

std::string xmlEscape(const std::string& value)
{
    std::string result;

    result.reserve(value.size());

    for (auto character : value)
    {
        switch (character)
        {
        case '"':
            result += "&quot;";
            break;
        case '&':
            result += "&amp;";
            break;
        case '\'':
            result += "&apos;";
            break;
        case '<':
            result += "&lt;";
            break;
        case '>':
            result += "&gt;";
            break;
        default:
            result.push_back(character);
            break;
        }
    }

    return result;
}

} // transfer
} // relay

