#include <ctime>

#include <relay/common/utility.h>
#include <relay/crypto/cryptopp.h>
#include <relay/transfer/signature_v4.h>

namespace relay
{
namespace transfer
{
namespace
{

std::string hmac(const std::string& key, const std::string& data)
{
    HMACSHA256 generator(key);
    std::string digest;

    generator.add(data);
    generator.get(&digest);

    return digest;
}

} // anonymous

std::string uriEncode(const std::string& value, bool encodeSlash)
{
    static const char digits[] = "0123456789ABCDEF";

    std::string result;

    result.reserve(value.size());

    for (auto character : value)
    {
        auto code = static_cast<unsigned char>(character);

        if ((code >= 'A' && code <= 'Z')
            || (code >= 'a' && code <= 'z')
            || (code >= '0' && code <= '9')
            || code == '-'
            || code == '.'
            || code == '_'
            || code == '~'
            || (code == '/' && !encodeSlash))
        {
            result.push_back(character);
            continue;
        }

        result.push_back('%');
        result.push_back(digits[code >> 4]);
        result.push_back(digits[code & 0xf]);
    }

    return result;
}

std::string sha256Hex(const char* data, std::size_t length)
{
    HashSHA256 hash;
    std::string digest;

    hash.add(reinterpret_cast<const byte*>(data), length);
    hash.get(&digest);

    return toHex(digest);
}

std::string sha256Hex(const std::string& data)
{
    return sha256Hex(data.data(), data.size());
}

std::string canonicalQuery(const std::map<std::string, std::string>& query)
{
    std::map<std::string, std::string> encoded;

    // Sorting is by encoded name.
    for (auto& parameter : query)
        encoded.emplace(uriEncode(parameter.first, true),
                        uriEncode(parameter.second, true));

    std::string result;

    for (auto& parameter : encoded)
    {
        if (!result.empty())
            result.push_back('&');

        result += parameter.first;
        result.push_back('=');
        result += parameter.second;
    }

    return result;
}

std::string canonicalRequest(const SignableRequest& request)
{
    std::string headers;
    std::string signedHeaders;

    for (auto& header : request.mHeaders)
    {
        headers += header.first + ":" + common::trim(header.second) + "\n";

        if (!signedHeaders.empty())
            signedHeaders.push_back(';');

        signedHeaders += header.first;
    }

    return request.mMethod + "\n"
           + request.mPath + "\n"
           + canonicalQuery(request.mQuery) + "\n"
           + headers + "\n"
           + signedHeaders + "\n"
           + request.mPayloadHash;
}

std::string authorization(const SignableRequest& request,
                          const Credentials& credentials,
                          const std::string& region,
                          const std::string& service,
                          const std::string& timestamp)
{
    auto date = timestamp.substr(0, 8);
    auto scope = date + "/" + region + "/" + service + "/aws4_request";

    auto stringToSign = "AWS4-HMAC-SHA256\n"
                        + timestamp + "\n"
                        + scope + "\n"
                        + sha256Hex(canonicalRequest(request));

    auto key = hmac("AWS4" + credentials.mSecretAccessKey, date);

    key = hmac(key, region);
    key = hmac(key, service);
    key = hmac(key, "aws4_request");

    std::string signedHeaders;

    for (auto& header : request.mHeaders)
    {
        if (!signedHeaders.empty())
            signedHeaders.push_back(';');

        signedHeaders += header.first;
    }

    return common::format("AWS4-HMAC-SHA256 Credential=%s/%s, SignedHeaders=%s, Signature=%s",
                          credentials.mAccessKeyID.c_str(),
                          scope.c_str(),
                          signedHeaders.c_str(),
                          toHex(hmac(key, stringToSign)).c_str());
}

std::string amzTimestamp()
{
    auto now = std::time(nullptr);
    std::tm time;
    char buffer[32];

    gmtime_r(&now, &time);

    std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &time);

    return buffer;
}

} // transfer
} // relay

