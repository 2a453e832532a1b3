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

#include <optional>
#include <string>

namespace roomcast
{
namespace relay
{

// Encoding of the frames a producer sends. Frames are relayed as they
// arrive; a Wav stream must already carry its header.
enum class Codec
{
  Mp3,
  Aac,
  Flac,
  Wav
};

// Maps the codec names producers announce. Raw PCM is served as Wav, and
// anything unknown falls back to it.
inline Codec resolveCodec(const std::optional<std::string>& name)
{
  if (!name)
  {
    return Codec::Wav;
  }
  if (*name == "mp3")
  {
    return Codec::Mp3;
  }
  if (*name == "aac" || *name == "aac-lc" || *name == "he-aac" || *name == "he-aac-v2")
  {
    return Codec::Aac;
  }
  if (*name == "flac")
  {
    return Codec::Flac;
  }
  return Codec::Wav;
}

inline const char* toString(const Codec codec)
{
  switch (codec)
  {
  case Codec::Mp3:
    return "mp3";
  case Codec::Aac:
    return "aac";
  case Codec::Flac:
    return "flac";
  case Codec::Wav:
    break;
  }
  return "wav";
}

// Suffix of the live path, including the dot
inline std::string fileExtension(const Codec codec)
{
  return std::string{"."} + toString(codec);
}

inline const char* contentType(const Codec codec)
{
  switch (codec)
  {
  case Codec::Mp3:
    return "audio/mpeg";
  case Codec::Aac:
    return "audio/aac";
  case Codec::Flac:
    return "audio/flac";
  case Codec::Wav:
    break;
  }
  return "audio/wav";
}

} // namespace relay
} // namespace roomcast
