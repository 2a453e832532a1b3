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

#include <roomcast/http/Message.hpp>
#include <roomcast/relay/Errors.hpp>
#include <roomcast/relay/Frame.hpp>
#include <roomcast/relay/NetworkByteStream.hpp>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace roomcast
{
namespace relay
{
namespace websocket
{

enum class Opcode : std::uint8_t
{
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xa
};

// Close codes used by the server side
static constexpr std::uint16_t kNormalClosure = 1000;
static constexpr std::uint16_t kGoingAway = 1001;
static constexpr std::uint16_t kProtocolError = 1002;
static constexpr std::uint16_t kMessageTooBig = 1009;
static constexpr std::uint16_t kInternalError = 1011;

struct Message
{
  Opcode opcode;
  Bytes payload;

  std::string text() const { return std::string(payload.begin(), payload.end()); }
};

inline std::string acceptKey(const std::string& clientKey)
{
  static constexpr char kGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
  const auto input = http::trim(clientKey) + kGuid;
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest;
  SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest.data());

  std::array<unsigned char, 4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1> encoded;
  const auto length = EVP_EncodeBlock(encoded.data(), digest.data(), SHA_DIGEST_LENGTH);
  return std::string(reinterpret_cast<const char*>(encoded.data()),
                     static_cast<std::size_t>(length));
}

inline bool isUpgradeRequest(const http::Request& request)
{
  const auto upgrade = request.headers.get("Upgrade");
  const auto connection = request.headers.get("Connection");
  const auto version = request.headers.get("Sec-WebSocket-Version");
  return request.method == "GET" && upgrade && http::iequals(http::trim(*upgrade), "websocket")
         && connection && http::toLower(*connection).find("upgrade") != std::string::npos
         && request.headers.contains("Sec-WebSocket-Key") && version
         && http::trim(*version) == "13";
}

inline http::Response makeHandshakeResponse(const http::Request& request)
{
  auto response = http::makeResponse(101);
  response.headers.set("Upgrade", "websocket");
  response.headers.set("Connection", "Upgrade");
  response.headers.set("Sec-WebSocket-Accept",
                       acceptKey(request.headers.get("Sec-WebSocket-Key").value_or("")));
  return response;
}

// Server frames are never masked and never fragmented
inline Bytes encodeFrame(const Opcode opcode, const std::uint8_t* pData, const std::size_t size)
{
  Bytes frame;
  frame.reserve(size + 10);
  auto out = std::back_inserter(frame);
  out = toNetworkByteStream(static_cast<std::uint8_t>(0x80 | static_cast<std::uint8_t>(opcode)),
                            out);
  if (size <= 125)
  {
    out = toNetworkByteStream(static_cast<std::uint8_t>(size), out);
  }
  else if (size <= 0xffff)
  {
    out = toNetworkByteStream(std::uint8_t{126}, out);
    out = toNetworkByteStream(static_cast<std::uint16_t>(size), out);
  }
  else
  {
    out = toNetworkByteStream(std::uint8_t{127}, out);
    out = toNetworkByteStream(static_cast<std::uint64_t>(size), out);
  }
  frame.insert(frame.end(), pData, pData + size);
  return frame;
}

inline Bytes encodeFrame(const Opcode opcode, const std::string& payload)
{
  return encodeFrame(
    opcode, reinterpret_cast<const std::uint8_t*>(payload.data()), payload.size());
}

inline Bytes encodeClose(const std::uint16_t code, const std::string& reason = {})
{
  Bytes payload;
  toNetworkByteStream(code, std::back_inserter(payload));
  // Control frames carry at most 125 bytes
  payload.insert(payload.end(), reason.begin(), reason.begin()
                                                  + static_cast<std::ptrdiff_t>(
                                                    std::min<std::size_t>(reason.size(), 123)));
  return encodeFrame(Opcode::Close, payload.data(), payload.size());
}

// Status code of a close message, if it carries one
inline std::optional<std::uint16_t> closeCode(const Message& message)
{
  if (message.opcode != Opcode::Close || message.payload.size() < 2)
  {
    return std::nullopt;
  }
  return Deserialize<std::uint16_t>::fromNetworkByteStream(
           message.payload.begin(), message.payload.end())
    .first;
}

// Incremental decoder for the frames a client sends. Bytes can be fed in
// arbitrary pieces; complete messages come out with fragments joined and
// masks removed. Control messages may arrive between the fragments of a
// data message and are returned as they come.
class FrameDecoder
{
public:
  explicit FrameDecoder(const std::size_t maxMessageSize = 1024 * 1024)
    : mMaxMessageSize(maxMessageSize)
  {
  }

  // Throws ProtocolError
  std::vector<Message> feed(const std::uint8_t* pData, const std::size_t size)
  {
    mBuffer.insert(mBuffer.end(), pData, pData + size);
    std::vector<Message> messages;
    while (auto message = nextMessage())
    {
      messages.push_back(std::move(*message));
    }
    return messages;
  }

  std::vector<Message> feed(const Bytes& bytes) { return feed(bytes.data(), bytes.size()); }

private:
  std::optional<Message> nextMessage()
  {
    while (auto frame = nextFrame())
    {
      if (auto message = assemble(std::move(*frame)))
      {
        return message;
      }
    }
    return std::nullopt;
  }

  struct RawFrame
  {
    bool fin;
    Opcode opcode;
    Bytes payload;
  };

  static bool isControl(const Opcode opcode)
  {
    return (static_cast<std::uint8_t>(opcode) & 0x8) != 0;
  }

  static bool isKnown(const std::uint8_t opcode)
  {
    return opcode <= 0x2 || (opcode >= 0x8 && opcode <= 0xa);
  }

  // Takes one complete frame off the buffer, if there is one
  std::optional<RawFrame> nextFrame()
  {
    if (mBuffer.size() < 2)
    {
      return std::nullopt;
    }

    auto it = mBuffer.cbegin();
    const auto end = mBuffer.cend();
    std::uint8_t first = 0;
    std::uint8_t second = 0;
    std::tie(first, it) = Deserialize<std::uint8_t>::fromNetworkByteStream(it, end);
    std::tie(second, it) = Deserialize<std::uint8_t>::fromNetworkByteStream(it, end);

    if ((first & 0x70) != 0)
    {
      throw ProtocolError{kProtocolError, "reserved bits set"};
    }
    const auto opcodeBits = static_cast<std::uint8_t>(first & 0x0f);
    if (!isKnown(opcodeBits))
    {
      throw ProtocolError{kProtocolError, "unknown opcode " + std::to_string(opcodeBits)};
    }
    if ((second & 0x80) == 0)
    {
      throw ProtocolError{kProtocolError, "client frame without mask"};
    }

    const auto fin = (first & 0x80) != 0;
    const auto opcode = static_cast<Opcode>(opcodeBits);
    std::uint64_t length = second & 0x7f;
    const auto headerEnd = [&](const std::size_t extra)
    { return static_cast<std::size_t>(std::distance(mBuffer.cbegin(), it)) + extra; };

    if (length == 126)
    {
      if (mBuffer.size() < headerEnd(2))
      {
        return std::nullopt;
      }
      std::uint16_t extended = 0;
      std::tie(extended, it) = Deserialize<std::uint16_t>::fromNetworkByteStream(it, end);
      length = extended;
    }
    else if (length == 127)
    {
      if (mBuffer.size() < headerEnd(8))
      {
        return std::nullopt;
      }
      std::tie(length, it) = Deserialize<std::uint64_t>::fromNetworkByteStream(it, end);
      if ((length >> 63) != 0)
      {
        throw ProtocolError{kProtocolError, "invalid payload length"};
      }
    }

    if (isControl(opcode) && (!fin || length > 125))
    {
      throw ProtocolError{kProtocolError, "invalid control frame"};
    }
    if (length > mMaxMessageSize)
    {
      throw ProtocolError{kMessageTooBig, "frame of " + std::to_string(length) + " bytes"};
    }
    if (mBuffer.size() < headerEnd(4) + length)
    {
      return std::nullopt;
    }

    std::array<std::uint8_t, 4> mask;
    for (auto& byte : mask)
    {
      std::tie(byte, it) = Deserialize<std::uint8_t>::fromNetworkByteStream(it, end);
    }
    RawFrame frame{fin, opcode, Bytes(it, it + static_cast<std::ptrdiff_t>(length))};
    for (std::size_t i = 0; i < frame.payload.size(); ++i)
    {
      frame.payload[i] ^= mask[i % 4];
    }
    const auto frameEnd = headerEnd(0) + static_cast<std::size_t>(length);
    mBuffer.erase(mBuffer.begin(), mBuffer.begin() + static_cast<std::ptrdiff_t>(frameEnd));
    return frame;
  }

  std::optional<Message> assemble(RawFrame frame)
  {
    if (isControl(frame.opcode))
    {
      return Message{frame.opcode, std::move(frame.payload)};
    }

    if (frame.opcode == Opcode::Continuation)
    {
      if (!mFragmentOpcode)
      {
        throw ProtocolError{kProtocolError, "continuation without message"};
      }
      if (mFragments.size() + frame.payload.size() > mMaxMessageSize)
      {
        throw ProtocolError{kMessageTooBig, "fragmented message too big"};
      }
      mFragments.insert(mFragments.end(), frame.payload.begin(), frame.payload.end());
      if (!frame.fin)
      {
        return std::nullopt;
      }
      Message message{*mFragmentOpcode, std::move(mFragments)};
      mFragmentOpcode = std::nullopt;
      mFragments.clear();
      return message;
    }

    if (mFragmentOpcode)
    {
      throw ProtocolError{kProtocolError, "new message before the last one ended"};
    }
    if (!frame.fin)
    {
      mFragmentOpcode = frame.opcode;
      mFragments = std::move(frame.payload);
      return std::nullopt;
    }
    return Message{frame.opcode, std::move(frame.payload)};
  }

  std::size_t mMaxMessageSize;
  Bytes mBuffer;
  std::optional<Opcode> mFragmentOpcode;
  Bytes mFragments;
};

} // namespace websocket
} // namespace relay
} // namespace roomcast
