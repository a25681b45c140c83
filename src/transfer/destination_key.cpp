#include <cctype>

#include <relay/common/utility.h>
#include <relay/transfer/destination_key.h>
#include <relay/transfer/error_classifier.h>

namespace relay
{
namespace transfer
{
namespace
{

int hexValue(char character)
{
    if (character >= '0' && character <= '9')
        return character - '0';

    if (character >= 'a' && character <= 'f')
        return character - 'a' + 10;

    if (character >= 'A' && character <= 'F')
        return character - 'A' + 10;

    return -1;
}

// Malformed escapes are left as they are.
std::string percentDecode(const std::string& value)
{
    std::string result;

    result.reserve(value.size());

    for (std::size_t i = 0; i < value.size(); ++i)
    {
        if (value[i] == '%' && i + 2 < value.size())
        {
            auto high = hexValue(value[i + 1]);
            auto low = hexValue(value[i + 2]);

            if (high >= 0 && low >= 0)
            {
                result.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }

        result.push_back(value[i]);
    }

    return result;
}

// Extract the path component of a URL.
std::string urlPath(const std::string& url)
{
    auto begin = url.find("://");

    // Skip the scheme and authority.
    if (begin != std::string::npos)
    {
        begin = url.find('/', begin + 3);

        if (begin == std::string::npos)
            return std::string();
    }
    else
    {
        begin = 0;
    }

    auto end = url.find_first_of("?#", begin);

    return url.substr(begin, end == std::string::npos ? end : end - begin);
}

bool validKeyCharacter(unsigned char character)
{
    if (std::isalnum(character))
        return true;

    switch (character)
    {
    case '!':
    case '\'':
    case '(':
    case ')':
    case '*':
    case '-':
    case '.':
    case '/':
    case '_':
        return true;
    default:
        break;
    }

    return false;
}

} // anonymous

std::string extractFilename(const std::string& url)
{
    auto path = urlPath(url);

    // Ignore a single trailing slash.
    if (!path.empty() && path.back() == '/')
        path.pop_back();

    auto slash = path.find_last_of('/');

    if (slash != std::string::npos)
        path.erase(0, slash + 1);

    auto filename = percentDecode(path);

    if (filename.empty())
        return DefaultFilename;

    return filename;
}

std::string constructKey(const std::string& prefix, const std::string& filename)
{
    // No prefix: The key is just the filename.
    if (common::trim(prefix).empty())
        return filename;

    auto normalized = prefix;

    // Keys shouldn't start with a slash.
    if (normalized.front() == '/')
        normalized.erase(0, 1);

    normalized = common::trim(normalized);

    if (!normalized.empty() && normalized.back() != '/')
        normalized.push_back('/');

    return normalized + filename;
}

ErrorOr<std::string> deriveKey(const std::string& sourceURL,
                               const std::string& prefix)
{
    auto key = constructKey(prefix, extractFilename(sourceURL));
    auto problem = validateKey(key);

    if (!problem.empty())
        return common::unexpected(validationError(problem));

    return key;
}

std::string validateKey(const std::string& key)
{
    if (key.empty())
        return "S3 key must not be empty";

    if (key.size() > MaxKeyLength)
        return common::format("S3 key must not exceed %zu characters",
                              MaxKeyLength);

    if (key.front() == '/')
        return "S3 key should not start with a forward slash";

    for (auto character : key)
    {
        if (!validKeyCharacter(static_cast<unsigned char>(character)))
            return common::format("S3 key contains invalid character: '%c'",
                                  character);
    }

    return std::string();
}

std::string objectLocation(const std::string& bucket, const std::string& key)
{
    return "s3://" + bucket + "/" + key;
}

} // transfer
} // relay

