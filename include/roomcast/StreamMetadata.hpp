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

// Track description supplied by the producer alongside the audio
struct StreamMetadata
{
  std::optional<std::string> title;
  std::optional<std::string> artist;
  std::optional<std::string> album;

  friend bool operator==(const StreamMetadata& lhs, const StreamMetadata& rhs)
  {
    return lhs.title == rhs.title && lhs.artist == rhs.artist && lhs.album == rhs.album;
  }

  friend bool operator!=(const StreamMetadata& lhs, const StreamMetadata& rhs)
  {
    return !(lhs == rhs);
  }
};

} // namespace roomcast
