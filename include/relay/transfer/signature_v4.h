#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace relay
{
namespace transfer
{

struct Credentials
{
    std::string mAccessKeyID;
    std::string mSecretAccessKey;

    // Only present for temporary credentials.
    std::string mSessionToken;
}; // Credentials

// The parts of a request that contribute to its signature.
struct SignableRequest
{
    // Lowercase header names.
    std::map<std::string, std::string> mHeaders;

    std::string mMethod;

    // Already encoded, e.g. "/bucket/some%20key".
    std::string mPath;

    // Hex encoded SHA-256 of the request's body.
    std::string mPayloadHash;

    // Unencoded parameter names and values.
    std::map<std::string, std::string> mQuery;
}; // SignableRequest

// Percent-encode value as the signing process requires.
std::string uriEncode(const std::string& value, bool encodeSlash);

// Hex encoded SHA-256 of data.
std::string sha256Hex(const char* data, std::size_t length);

std::string sha256Hex(const std::string& data);

std::string canonicalQuery(const std::map<std::string, std::string>& query);

std::string canonicalRequest(const SignableRequest& request);

// Compute the value of the request's Authorization header.
//
// timestamp must have the form YYYYMMDDTHHMMSSZ and match the request's
// x-amz-date header.
std::string authorization(const SignableRequest& request,
                          const Credentials& credentials,
                          const std::string& region,
                          const std::string& service,
                          const std::string& timestamp);

// Current time in the form YYYYMMDDTHHMMSSZ.
std::string amzTimestamp();

} // transfer
} // relay

