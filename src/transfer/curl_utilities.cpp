#include <cerrno>
#include <mutex>
#include <stdexcept>

#include <relay/common/utility.h>
#include <relay/transfer/curl_utilities.h>

namespace relay
{
namespace transfer
{

void ensureCurlInitialized()
{
    static std::once_flag initialized;

    std::call_once(initialized, []() {
        auto result = curl_global_init(CURL_GLOBAL_DEFAULT);

        if (result != CURLE_OK)
            throw std::runtime_error(common::format("Unable to initialize libcurl: %s",
                                                    curl_easy_strerror(result)));
    });
}

FaultCode toFaultCode(CURLcode result, long osErrno)
{
    switch (result)
    {
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
        return FAULT_HOST_NOT_FOUND;

    case CURLE_COULDNT_CONNECT:
        // libcurl lumps every connection failure together.
        switch (osErrno)
        {
        case ENETUNREACH:
            return FAULT_NETWORK_UNREACHABLE;
        case EHOSTUNREACH:
            return FAULT_HOST_UNREACHABLE;
        case ETIMEDOUT:
            return FAULT_TIMED_OUT;
        default:
            break;
        }

        return FAULT_CONNECTION_REFUSED;

    case CURLE_OPERATION_TIMEDOUT:
        return FAULT_TIMED_OUT;

    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CACERT_BADFILE:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_SSL_ENGINE_INITFAILED:
    case CURLE_SSL_ENGINE_NOTFOUND:
    case CURLE_SSL_ISSUER_ERROR:
        return FAULT_TLS_FAILURE;

    case CURLE_RECV_ERROR:
        if (osErrno == ECONNABORTED)
            return FAULT_CONNECTION_ABORTED;

        return FAULT_CONNECTION_RESET;

    case CURLE_SEND_ERROR:
        if (osErrno == ECONNRESET)
            return FAULT_CONNECTION_RESET;

        return FAULT_BROKEN_PIPE;

    case CURLE_GOT_NOTHING:
        return FAULT_CONNECTION_RESET;

    case CURLE_PARTIAL_FILE:
        return FAULT_PREMATURE_CLOSE;

    case CURLE_OUT_OF_MEMORY:
        return FAULT_OUT_OF_MEMORY;

    case CURLE_ABORTED_BY_CALLBACK:
        return FAULT_CONNECTION_ABORTED;

    default:
        break;
    }

    return FAULT_UNKNOWN;
}

Fault curlFault(FaultOrigin origin,
                CURLcode result,
                long osErrno,
                const char* detail)
{
    auto message = std::string(curl_easy_strerror(result));

    if (detail && *detail)
        message += common::format(": %s", detail);

    return Fault(origin, toFaultCode(result, osErrno), message);
}

} // transfer
} // relay

