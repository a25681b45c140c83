#pragma once

#include <string>

#include <relay/transfer/error_or.h>

namespace relay
{
namespace transfer
{

// Used when a URL's path doesn't name a file.
constexpr const char* DefaultFilename = "download.zip";

// The longest key the store will accept.
constexpr std::size_t MaxKeyLength = 1024;

// Extract the percent-decoded last path segment of a URL.
std::string extractFilename(const std::string& url);

// Join a user supplied prefix and a filename.
std::string constructKey(const std::string& prefix, const std::string& filename);

// Derive and validate the destination key for a source URL.
ErrorOr<std::string> deriveKey(const std::string& sourceURL,
                               const std::string& prefix);

// Check that key is acceptable to the store.
//
// Returns an empty string if key is valid and a description of the
// problem otherwise.
std::string validateKey(const std::string& key);

// Where a transfer's object can be found, e.g. "s3://bucket/key".
std::string objectLocation(const std::string& bucket, const std::string& key);

} // transfer
} // relay

