#pragma once

#include <chrono>
#include <string>

#include <relay/common/logger_forward.h>
#include <relay/transfer/source_reader.h>

namespace relay
{
namespace transfer
{

struct SourceReaderConfig
{
    // How long may we spend establishing a connection?
    std::chrono::seconds mConnectTimeout = std::chrono::seconds(60);

    // How many redirects will we follow?
    long mMaxRedirects = 5;

    // How long may the connection stall before we give up?
    std::chrono::seconds mSocketTimeout = std::chrono::seconds(60);

    std::string mUserAgent = "relay/1.0";
}; // SourceReaderConfig

// Reads sources over HTTPS using libcurl.
class CurlSourceReader
  : public SourceReader
{
    SourceReaderConfig mConfig;

    // Where should we emit our messages?
    common::Logger& mLogger;

public:
    CurlSourceReader(const SourceReaderConfig& config,
                     common::Logger& logger);

    SourceStreamPtr open(const std::string& url) override;
}; // CurlSourceReader

// Is contentType something we'd expect an archive to be served as?
bool acceptableContentType(const std::string& contentType);

} // transfer
} // relay

