/**
 * @file cryptopp.h
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

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <cryptopp/cryptlib.h>
#include <cryptopp/hmac.h>
#include <cryptopp/sha.h>

namespace relay
{

using byte = std::uint8_t;

class HashSHA256
{
    CryptoPP::SHA256 hash;

public:
    void add(const byte* data, std::size_t length);

    void add(const std::string& data);

    void get(std::string* out);
};

/**
 * @brief HMAC-SHA256 generator
 */
class HMACSHA256
{
    CryptoPP::HMAC<CryptoPP::SHA256> hmac;

public:
    /**
     * @brief Constructor
     * @param key HMAC key
     * @param length Key length
     */
    HMACSHA256(const byte* key, std::size_t length);

    explicit HMACSHA256(const std::string& key);

    /**
     * @brief Add data to the HMAC
     * @param data Data to add
     * @param length Data length
     */
    void add(const byte* data, std::size_t length);

    void add(const std::string& data);

    /**
     * @brief Compute the HMAC for the current message
     * @param out Receives the raw 32-byte digest
     */
    void get(std::string* out);
};

// Render binary data as lowercase hexadecimal.
std::string toHex(const std::string& data);

} // relay

