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

#include <roomcast/relay/NetworkByteStream.hpp>
#include <roomcast/relay/WebSocket.hpp>
#include <array>
#include <iterator>
#include <string>

namespace roomcast
{
namespace relay
{
namespace test
{

// Frames as a WebSocket client sends them: always masked
inline Bytes clientFrame(const websocket::Opcode opcode,
                         const Bytes& payload,
                         const bool fin = true,
                         const std::array<std::uint8_t, 4> mask = {{0x37, 0xfa, 0x21, 0x3d}})
{
  Bytes frame;
  auto out = std::back_inserter(frame);
  out = toNetworkByteStream(
    static_cast<std::uint8_t>((fin ? 0x80 : 0x00) | static_cast<std::uint8_t>(opcode)), out);
  if (payload.size() <= 125)
  {
    out = toNetworkByteStream(static_cast<std::uint8_t>(0x80 | payload.size()), out);
  }
  else if (payload.size() <= 0xffff)
  {
    out = toNetworkByteStream(std::uint8_t{0x80 | 126}, out);
    out = toNetworkByteStream(static_cast<std::uint16_t>(payload.size()), out);
  }
  else
  {
    out = toNetworkByteStream(std::uint8_t{0x80 | 127}, out);
    out = toNetworkByteStream(static_cast<std::uint64_t>(payload.size()), out);
  }
  frame.insert(frame.end(), mask.begin(), mask.end());
  for (std::size_t i = 0; i < payload.size(); ++i)
  {
    frame.push_back(static_cast<std::uint8_t>(payload[i] ^ mask[i % 4]));
  }
  return frame;
}

inline Bytes clientFrame(const websocket::Opcode opcode, const std::string& text)
{
  return clientFrame(opcode, Bytes(text.begin(), text.end()));
}

// Splits what the server sent back into messages. Server frames are
// unmasked and never fragmented.
inline std::vector<websocket::Message> serverMessages(const Bytes& bytes)
{
  std::vector<websocket::Message> result;
  std::size_t pos = 0;
  while (pos + 2 <= bytes.size())
  {
    const auto first = bytes[pos];
    std::size_t length = bytes[pos + 1] & 0x7f;
    std::size_t header = 2;
    if (length == 126)
    {
      length = Deserialize<std::uint16_t>::fromNetworkByteStream(
                 bytes.begin() + static_cast<std::ptrdiff_t>(pos + 2), bytes.end())
                 .first;
      header = 4;
    }
    else if (length == 127)
    {
      length = static_cast<std::size_t>(
        Deserialize<std::uint64_t>::fromNetworkByteStream(
          bytes.begin() + static_cast<std::ptrdiff_t>(pos + 2), bytes.end())
          .first);
      header = 10;
    }
    const auto begin = bytes.begin() + static_cast<std::ptrdiff_t>(pos + header);
    result.push_back({static_cast<websocket::Opcode>(first & 0x0f),
                      Bytes(begin, begin + static_cast<std::ptrdiff_t>(length))});
    pos += header + length;
  }
  return result;
}

} // namespace test
} // namespace relay
} // namespace roomcast
