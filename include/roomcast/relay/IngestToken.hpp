/* Copyright 2026, Roomcast contributors. All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <roomcast/relay/Errors.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace roomcast
{
namespace relay
{

// Stream-scoped, expiring producer credentials:
//
//   <expiry>.<hex HMAC-SHA256 over "<streamId>\n<expiry>">
//
// expiry counts milliseconds on the issuing clock, so tokens are only
// meaningful to the process that issued them.
class IngestTokens
{
public:
  using Duration = std::chrono::milliseconds;

  // An empty secret is replaced by random bytes
  explicit IngestTokens(std::string secret)
    : mSecret(secret.empty() ? randomSecret() : std::move(secret))
  {
  }

  template <typename TimePoint>
  std::string issue(const std::string& streamId, const TimePoint expiresAt) const
  {
    const auto expiry = std::to_string(millis(expiresAt));
    return expiry + "." + sign(streamId, expiry);
  }

  // Throws InvalidToken with the reason of the rejection
  template <typename TimePoint>
  void verify(const std::string& streamId, const std::string& token, const TimePoint now) const
  {
    const auto dot = token.find('.');
    if (dot == std::string::npos || dot == 0)
    {
      throw InvalidToken{"malformed token"};
    }
    const auto expiry = token.substr(0, dot);
    char* pEnd = nullptr;
    const auto expiresAt = std::strtoll(expiry.c_str(), &pEnd, 10);
    if (*pEnd != '\0')
    {
      throw InvalidToken{"malformed token"};
    }

    const auto expected = sign(streamId, expiry);
    const auto signature = token.substr(dot + 1);
    if (signature.size() != expected.size()
        || CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0)
    {
      throw InvalidToken{"token was not issued for stream " + streamId};
    }
    if (millis(now) >= expiresAt)
    {
      throw InvalidToken{"token expired"};
    }
  }

private:
  template <typename TimePoint>
  static long long millis(const TimePoint t)
  {
    return std::chrono::duration_cast<Duration>(t.time_since_epoch()).count();
  }

  std::string sign(const std::string& streamId, const std::string& expiry) const
  {
    const auto message = streamId + "\n" + expiry;
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest;
    unsigned int length = 0;
    if (!HMAC(EVP_sha256(),
              mSecret.data(),
              static_cast<int>(mSecret.size()),
              reinterpret_cast<const unsigned char*>(message.data()),
              message.size(),
              digest.data(),
              &length))
    {
      throw std::runtime_error("HMAC-SHA256 failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i)
    {
      result += kHex[digest[i] >> 4];
      result += kHex[digest[i] & 0x0f];
    }
    return result;
  }

  static std::string randomSecret()
  {
    std::array<unsigned char, 32> bytes;
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1)
    {
      throw std::runtime_error("no randomness for the ingest secret");
    }
    return std::string(bytes.begin(), bytes.end());
  }

  std::string mSecret;
};

} // namespace relay
} // namespace roomcast
