#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

#include <relay/transfer/curl_source_reader.h>
#include <relay/transfer/fault.h>
#include <relay/transfer/subsystem_loggers.h>

#include "loopback_server.h"

using namespace relay::testing;
using namespace relay::transfer;

namespace
{

// Build a response with the specified status line, headers and body.
std::string response(const std::string& status,
                     const std::string& headers,
                     const std::string& body)
{
    return "HTTP/1.1 " + status + "\r\n"
           + headers
           + "Connection: close\r\n"
           + "\r\n"
           + body;
}

class CurlSourceReaderTest
  : public ::testing::Test
{
protected:
    CurlSourceReaderTest()
      : Test()
      , mReader(SourceReaderConfig(), transferLogger())
      , mServer()
    {
        // Requests to the loopback server must never be proxied.
        setenv("no_proxy", "127.0.0.1", 1);
    }

    // Read whatever remains of stream.
    std::string drain(SourceStream& stream)
    {
        std::string chunk;
        std::string payload;

        while (stream.next(chunk))
            payload += chunk;

        return payload;
    }

    CurlSourceReader mReader;
    LoopbackServer mServer;
}; // CurlSourceReaderTest

} // anonymous

TEST_F(CurlSourceReaderTest, ReadsPayload)
{
    mServer.serve("/file.zip",
                  response("200 OK",
                           "Content-Length: 11\r\n"
                           "Content-Type: application/zip\r\n",
                           "hello world"));

    auto stream = mReader.open(mServer.url("/file.zip"));

    ASSERT_TRUE(stream);
    EXPECT_EQ(11u, stream->totalBytes());
    EXPECT_EQ("hello world", drain(*stream));

    // Exhausted streams stay exhausted.
    std::string chunk;

    EXPECT_FALSE(stream->next(chunk));
    EXPECT_TRUE(chunk.empty());
}

TEST_F(CurlSourceReaderTest, ReadsPayloadOfUnknownLength)
{
    mServer.serve("/file.zip",
                  response("200 OK", "Content-Type: text/html\r\n", "abc"));

    auto stream = mReader.open(mServer.url("/file.zip"));

    EXPECT_EQ(0u, stream->totalBytes());
    EXPECT_EQ("abc", drain(*stream));
}

TEST_F(CurlSourceReaderTest, FollowsRedirects)
{
    mServer.serve("/moved.zip",
                  response("302 Found",
                           "Location: /file.zip\r\n"
                           "Content-Length: 7\r\n",
                           "go away"));

    mServer.serve("/file.zip",
                  response("200 OK", "Content-Length: 5\r\n", "hello"));

    auto stream = mReader.open(mServer.url("/moved.zip"));

    // Only the final response's length and body count.
    EXPECT_EQ(5u, stream->totalBytes());
    EXPECT_EQ("hello", drain(*stream));
}

TEST_F(CurlSourceReaderTest, SkipsInterimResponses)
{
    mServer.serve("/file.zip",
                  "HTTP/1.1 100 Continue\r\n"
                  "\r\n"
                  + response("200 OK", "Content-Length: 5\r\n", "hello"));

    auto stream = mReader.open(mServer.url("/file.zip"));

    EXPECT_EQ(5u, stream->totalBytes());
    EXPECT_EQ("hello", drain(*stream));
}

TEST_F(CurlSourceReaderTest, RejectsUnsuccessfulResponses)
{
    mServer.serve("/file.zip",
                  response("404 Not Found", "Content-Length: 9\r\n", "not found"));

    try
    {
        mReader.open(mServer.url("/file.zip"));

        FAIL() << "Expected the request to be rejected";
    }
    catch (Fault& fault)
    {
        EXPECT_EQ(FAULT_ORIGIN_SOURCE, fault.origin());
        EXPECT_EQ(FAULT_HTTP_STATUS, fault.code());
        EXPECT_EQ(404, fault.httpStatus());
    }
}

TEST_F(CurlSourceReaderTest, RejectsRedirectsToFailures)
{
    mServer.serve("/moved.zip",
                  response("301 Moved Permanently",
                           "Location: /missing.zip\r\n"
                           "Content-Length: 0\r\n",
                           ""));

    try
    {
        mReader.open(mServer.url("/moved.zip"));

        FAIL() << "Expected the request to be rejected";
    }
    catch (Fault& fault)
    {
        EXPECT_EQ(FAULT_HTTP_STATUS, fault.code());
        EXPECT_EQ(404, fault.httpStatus());
    }
}

TEST_F(CurlSourceReaderTest, DetectsPrematureClose)
{
    mServer.serve("/file.zip",
                  response("200 OK",
                           "Content-Length: 100\r\n",
                           std::string(40, 'x')));

    auto stream = mReader.open(mServer.url("/file.zip"));

    EXPECT_EQ(100u, stream->totalBytes());

    std::string chunk;
    std::string received;

    try
    {
        while (stream->next(chunk))
            received += chunk;

        FAIL() << "Expected the stream to report a short read";
    }
    catch (Fault& fault)
    {
        EXPECT_EQ(FAULT_ORIGIN_SOURCE, fault.origin());
        EXPECT_EQ(FAULT_PREMATURE_CLOSE, fault.code());
    }

    // Everything that did arrive was delivered.
    EXPECT_EQ(std::string(40, 'x'), received);
}

TEST(CurlSourceReader, ConnectionRefused)
{
    std::string url;

    // Nothing will be listening once the server's gone.
    {
        LoopbackServer server;

        url = server.url("/file.zip");
    }

    setenv("no_proxy", "127.0.0.1", 1);

    CurlSourceReader reader(SourceReaderConfig(), transferLogger());

    try
    {
        reader.open(url);

        FAIL() << "Expected the connection to be refused";
    }
    catch (Fault& fault)
    {
        EXPECT_EQ(FAULT_ORIGIN_SOURCE, fault.origin());
        EXPECT_EQ(FAULT_CONNECTION_REFUSED, fault.code());
    }
}

