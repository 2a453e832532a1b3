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

#include <roomcast/relay/Frame.hpp>
#include <algorithm>
#include <cstddef>

namespace roomcast
{
namespace relay
{

// Audio bytes between two metadata blocks, announced as icy-metaint
static constexpr std::size_t kIcyMetaInt = 8192;

// Inserts a metadata block into one consumer's audio after every metaInt
// audio bytes. Positions depend on byte counts only.
class IcyInterleaver
{
public:
  explicit IcyInterleaver(const std::size_t metaInt = kIcyMetaInt)
    : mMetaInt(metaInt)
  {
  }

  // Appends audio to out, with block inserted at every boundary reached
  void interleave(const Bytes& audio, const Bytes& block, Bytes& out)
  {
    auto it = audio.begin();
    while (it != audio.end())
    {
      const auto untilBlock = mMetaInt - mBytesSinceBlock;
      const auto available = static_cast<std::size_t>(audio.end() - it);
      const auto count = std::min(untilBlock, available);
      out.insert(out.end(), it, it + static_cast<std::ptrdiff_t>(count));
      it += static_cast<std::ptrdiff_t>(count);
      mBytesSinceBlock += count;
      if (mBytesSinceBlock == mMetaInt)
      {
        out.insert(out.end(), block.begin(), block.end());
        mBytesSinceBlock = 0;
      }
    }
  }

  Bytes interleave(const Bytes& audio, const Bytes& block)
  {
    Bytes out;
    out.reserve(audio.size() + block.size());
    interleave(audio, block, out);
    return out;
  }

  std::size_t bytesSinceBlock() const { return mBytesSinceBlock; }

private:
  std::size_t mMetaInt;
  std::size_t mBytesSinceBlock = 0;
};

} // namespace relay
} // namespace roomcast
