#pragma once

#include <string>
#include <vector>

#include <relay/transfer/upload_part.h>

namespace relay
{
namespace transfer
{

// A destination that supports multipart uploads.
//
// Every method throws a Fault whose origin is FAULT_ORIGIN_STORAGE when
// the store can't be reached or rejects a request. uploadPart(...) may be
// called concurrently from several threads.
class ObjectStore
{
public:
    virtual ~ObjectStore() = default;

    // Abandon a multipart upload, discarding any parts.
    virtual void abort(const std::string& bucket,
                       const std::string& key,
                       const std::string& uploadID) = 0;

    // Assemble the uploaded parts into a single object.
    //
    // Parts must be sorted by ascending part number.
    virtual void complete(const std::string& bucket,
                          const std::string& key,
                          const std::string& uploadID,
                          const std::vector<CompletedPart>& parts) = 0;

    // Check that bucket exists and that we may access it.
    virtual void headBucket(const std::string& bucket) = 0;

    // Begin a multipart upload, returning its identifier.
    virtual std::string initiate(const std::string& bucket,
                                 const std::string& key) = 0;

    // Upload a single part, returning the part's entity tag.
    virtual std::string uploadPart(const std::string& bucket,
                                   const std::string& key,
                                   const std::string& uploadID,
                                   const UploadPart& part) = 0;
}; // ObjectStore

} // transfer
} // relay

