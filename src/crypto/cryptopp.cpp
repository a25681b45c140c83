/**
 * @file cryptopp.cpp
 * @brief Request signing primitives using Crypto++
 *
 * (c) 2013-2014 by Mega Limited, Auckland, New Zealand
 *
 * This file is part of relay.
 *
 * relay is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

#include <relay/crypto/cryptopp.h>

namespace relay
{

void HashSHA256::add(const byte* data, std::size_t length)
{
    hash.Update(data, length);
}

void HashSHA256::add(const std::string& data)
{
    add(reinterpret_cast<const byte*>(data.data()), data.size());
}

void HashSHA256::get(std::string* out)
{
    out->resize(hash.DigestSize());
    hash.Final(reinterpret_cast<byte*>(&(*out)[0]));
}

HMACSHA256::HMACSHA256(const byte* key, std::size_t length)
  : hmac(key, length)
{
}

HMACSHA256::HMACSHA256(const std::string& key)
  : HMACSHA256(reinterpret_cast<const byte*>(key.data()), key.size())
{
}

void HMACSHA256::add(const byte* data, std::size_t length)
{
    hmac.Update(data, length);
}

void HMACSHA256::add(const std::string& data)
{
    add(reinterpret_cast<const byte*>(data.data()), data.size());
}

void HMACSHA256::get(std::string* out)
{
    out->resize(hmac.DigestSize());
    hmac.Final(reinterpret_cast<byte*>(&(*out)[0]));
}

std::string toHex(const std::string& data)
{
    static const char digits[] = "0123456789abcdef";

    std::string result;

    result.reserve(data.size() * 2);

    for (auto character : data)
    {
        auto value = static_cast<unsigned char>(character);

        result.push_back(digits[value >> 4]);
        result.push_back(digits[value & 0xf]);
    }

    return result;
}

} // relay

