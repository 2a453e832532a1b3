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

#include <roomcast/StreamMetadata.hpp>
#include <roomcast/relay/Frame.hpp>
#include <algorithm>
#include <string>

namespace roomcast
{
namespace relay
{

// Renders metadata as an ICY metadata block:
//
//   [n] StreamTitle='artist - title'; [zero padding to n * 16 bytes]
//
// The leading byte is the number of 16 byte blocks that follow. Without a
// title or artist the block is a single zero byte.
inline Bytes formatInlineMetadata(const StreamMetadata& metadata)
{
  std::string text;
  if (metadata.artist && metadata.title)
  {
    text = *metadata.artist + " - " + *metadata.title;
  }
  else if (metadata.title)
  {
    text = *metadata.title;
  }
  else if (metadata.artist)
  {
    text = *metadata.artist;
  }
  if (text.empty())
  {
    return Bytes{0};
  }

  std::string escaped;
  for (const auto c : text)
  {
    if (c == '\'')
    {
      escaped += '\\';
    }
    escaped += c;
  }
  const auto payload = "StreamTitle='" + escaped + "';";

  // One length byte can describe at most 255 blocks
  const auto numBlocks = std::min<std::size_t>((payload.size() + 15) / 16, 255);
  auto length = std::min(payload.size(), numBlocks * 16);
  if (length < payload.size())
  {
    // Never cut a UTF-8 sequence: back off over continuation bytes to the
    // lead byte and drop it too
    while (length > 0 && (static_cast<unsigned char>(payload[length]) & 0xc0) == 0x80)
    {
      --length;
    }
  }
  Bytes block(1 + numBlocks * 16, 0);
  block[0] = static_cast<std::uint8_t>(numBlocks);
  std::copy_n(payload.begin(), length, block.begin() + 1);
  return block;
}

} // namespace relay
} // namespace roomcast
