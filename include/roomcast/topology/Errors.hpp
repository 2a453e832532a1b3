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

#include <stdexcept>
#include <string>

namespace roomcast
{
namespace topology
{

// Discovery found no device to ask for the zone group state
struct NoDevicesAvailable : std::runtime_error
{
  NoDevicesAvailable()
    : std::runtime_error("no devices available")
  {
  }
};

struct GroupNotFound : std::runtime_error
{
  explicit GroupNotFound(const std::string& id)
    : std::runtime_error("no group " + id)
    , groupId(id)
  {
  }

  std::string groupId;
};

struct ParseError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

} // namespace topology
} // namespace roomcast
