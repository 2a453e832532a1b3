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

#include <roomcast/platforms/asio/AsioWrapper.hpp>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace roomcast
{
namespace discovery
{
namespace test
{

// In-memory search socket. Tests inspect what was sent and inject answers.
class Interface
{
public:
  using Endpoint = ::asio::ip::udp::endpoint;
  using Buffer = std::vector<uint8_t>;

  struct SentMessage
  {
    std::string text;
    Endpoint to;
  };

  explicit Interface(const ::asio::ip::address_v4 address)
    : mAddress(address)
  {
  }

  std::size_t send(const uint8_t* const pData, const std::size_t numBytes, const Endpoint& to)
  {
    if (mFailSends)
    {
      throw std::runtime_error("network is unreachable");
    }
    mSentMessages.push_back({std::string(pData, pData + numBytes), to});
    return numBytes;
  }

  template <typename Handler>
  void receive(Handler handler)
  {
    mCallback = [handler](const Endpoint& from, const Buffer& buffer) mutable
    { handler(from, buffer.begin(), buffer.end()); };
  }

  // Delivers a datagram if a receive is pending. Returns whether it was
  // delivered.
  bool incomingMessage(const Endpoint& from, const std::string& text)
  {
    if (!mCallback)
    {
      return false;
    }
    auto callback = std::move(mCallback);
    mCallback = nullptr;
    const Buffer buffer(text.begin(), text.end());
    callback(from, buffer);
    return true;
  }

  Endpoint endpoint() const { return {mAddress, 49152}; }

  void close()
  {
    mClosed = true;
    mCallback = nullptr;
  }

  void failSends() { mFailSends = true; }

  const std::vector<SentMessage>& sentMessages() const { return mSentMessages; }

  bool closed() const { return mClosed; }

  bool receiving() const { return static_cast<bool>(mCallback); }

  ::asio::ip::address_v4 address() const { return mAddress; }

private:
  ::asio::ip::address_v4 mAddress;
  std::function<void(const Endpoint&, const Buffer&)> mCallback;
  std::vector<SentMessage> mSentMessages;
  bool mFailSends = false;
  bool mClosed = false;
};

} // namespace test
} // namespace discovery
} // namespace roomcast
