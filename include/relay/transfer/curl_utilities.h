#pragma once

#include <string>

#include <curl/curl.h>

#include <relay/transfer/fault.h>

namespace relay
{
namespace transfer
{

// Make sure libcurl has been initialized.
void ensureCurlInitialized();

// Translate a libcurl result into a fault code.
//
// osErrno is the value reported by CURLINFO_OS_ERRNO, if any.
FaultCode toFaultCode(CURLcode result, long osErrno);

// Construct a fault describing a failed libcurl transfer.
Fault curlFault(FaultOrigin origin,
                CURLcode result,
                long osErrno,
                const char* detail);

// Releases an easy handle when it goes out of scope.
struct EasyHandleDeleter
{
    void operator()(CURL* handle) const
    {
        curl_easy_cleanup(handle);
    }
}; // EasyHandleDeleter

// Releases a header list when it goes out of scope.
struct HeaderListDeleter
{
    void operator()(curl_slist* list) const
    {
        curl_slist_free_all(list);
    }
}; // HeaderListDeleter

} // transfer
} // relay

