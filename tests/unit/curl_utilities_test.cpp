#include <cerrno>

#include <gtest/gtest.h>

#include <relay/transfer/curl_source_reader.h>
#include <relay/transfer/curl_utilities.h>

using namespace relay::transfer;

TEST(CurlUtilities, TranslatesResults)
{
    EXPECT_EQ(FAULT_HOST_NOT_FOUND, toFaultCode(CURLE_COULDNT_RESOLVE_HOST, 0));
    EXPECT_EQ(FAULT_CONNECTION_REFUSED, toFaultCode(CURLE_COULDNT_CONNECT, 0));
    EXPECT_EQ(FAULT_NETWORK_UNREACHABLE, toFaultCode(CURLE_COULDNT_CONNECT, ENETUNREACH));
    EXPECT_EQ(FAULT_HOST_UNREACHABLE, toFaultCode(CURLE_COULDNT_CONNECT, EHOSTUNREACH));
    EXPECT_EQ(FAULT_TIMED_OUT, toFaultCode(CURLE_OPERATION_TIMEDOUT, 0));
    EXPECT_EQ(FAULT_TLS_FAILURE, toFaultCode(CURLE_SSL_CONNECT_ERROR, 0));
    EXPECT_EQ(FAULT_TLS_FAILURE, toFaultCode(CURLE_PEER_FAILED_VERIFICATION, 0));
    EXPECT_EQ(FAULT_CONNECTION_RESET, toFaultCode(CURLE_RECV_ERROR, 0));
    EXPECT_EQ(FAULT_CONNECTION_ABORTED, toFaultCode(CURLE_RECV_ERROR, ECONNABORTED));
    EXPECT_EQ(FAULT_BROKEN_PIPE, toFaultCode(CURLE_SEND_ERROR, 0));
    EXPECT_EQ(FAULT_CONNECTION_RESET, toFaultCode(CURLE_SEND_ERROR, ECONNRESET));
    EXPECT_EQ(FAULT_CONNECTION_RESET, toFaultCode(CURLE_GOT_NOTHING, 0));
    EXPECT_EQ(FAULT_PREMATURE_CLOSE, toFaultCode(CURLE_PARTIAL_FILE, 0));
    EXPECT_EQ(FAULT_OUT_OF_MEMORY, toFaultCode(CURLE_OUT_OF_MEMORY, 0));
    EXPECT_EQ(FAULT_UNKNOWN, toFaultCode(CURLE_UNSUPPORTED_PROTOCOL, 0));
}

TEST(CurlUtilities, DescribesFaults)
{
    auto fault = curlFault(FAULT_ORIGIN_SOURCE, CURLE_PARTIAL_FILE, 0, "3 bytes missing");

    EXPECT_EQ(FAULT_ORIGIN_SOURCE, fault.origin());
    EXPECT_EQ(FAULT_PREMATURE_CLOSE, fault.code());
    EXPECT_NE(std::string::npos, std::string(fault.what()).find("3 bytes missing"));
}

TEST(CurlSourceReader, AcceptableContentTypes)
{
    EXPECT_TRUE(acceptableContentType("application/zip"));
    EXPECT_TRUE(acceptableContentType("Application/ZIP"));
    EXPECT_TRUE(acceptableContentType("application/octet-stream; charset=binary"));
    EXPECT_TRUE(acceptableContentType("application/x-zip-compressed"));

    EXPECT_FALSE(acceptableContentType("text/html"));
    EXPECT_FALSE(acceptableContentType(""));
}
