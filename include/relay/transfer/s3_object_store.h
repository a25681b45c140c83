#pragma once

#include <chrono>
#include <initializer_list>
#include <map>
#include <string>

#include <relay/common/logger_forward.h>
#include <relay/transfer/object_store.h>
#include <relay/transfer/signature_v4.h>

namespace relay
{
namespace transfer
{

struct S3Config
{
    // How long may we spend establishing a connection?
    std::chrono::seconds mConnectTimeout = std::chrono::seconds(60);

    Credentials mCredentials;

    // Empty to use the region's public endpoint.
    std::string mEndpoint;

    std::string mRegion = "us-east-1";

    // How long may a single request take?
    std::chrono::seconds mRequestTimeout = std::chrono::seconds(600);
}; // S3Config

// Talks to an S3 compatible store over its REST interface.
class S3ObjectStore
  : public ObjectStore
{
    // What a request produced.
    struct Response
    {
        std::string mBody;
        std::string mETag;
        long mStatus = 0;
    }; // Response

    // Issue a signed request, throwing a Fault if it fails.
    Response request(const std::string& method,
                     const std::string& bucket,
                     const std::string& key,
                     const std::map<std::string, std::string>& query,
                     const char* body,
                     std::size_t length,
                     const char* contentType) const;

    S3Config mConfig;

    // Scheme and authority, e.g. "https://s3.us-east-1.amazonaws.com".
    std::string mEndpoint;

    // Authority, e.g. "s3.us-east-1.amazonaws.com".
    std::string mHost;

    common::Logger& mLogger;

public:
    S3ObjectStore(const S3Config& config, common::Logger& logger);

    void abort(const std::string& bucket,
               const std::string& key,
               const std::string& uploadID) override;

    void complete(const std::string& bucket,
                  const std::string& key,
                  const std::string& uploadID,
                  const std::vector<CompletedPart>& parts) override;

    void headBucket(const std::string& bucket) override;

    std::string initiate(const std::string& bucket,
                         const std::string& key) override;

    std::string uploadPart(const std::string& bucket,
                           const std::string& key,
                           const std::string& uploadID,
                           const UploadPart& part) override;
}; // S3ObjectStore

// Build the body of a CompleteMultipartUpload request.
std::string completionDocument(const std::vector<CompletedPart>& parts);

// Extract the text of the element reached by following path from the root.
//
// Returns an empty string if the document isn't well formed or if no
// element lies at the end of path.
std::string responseElement(const std::string& document,
                            std::initializer_list<const char*> path);

std::string xmlEscape(const std::string& value);

} // transfer
} // relay

