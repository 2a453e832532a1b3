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

#include <string>

namespace roomcast
{
namespace discovery
{

struct DiscoveredDevice
{
  std::string uuid;
  std::string ip;
  std::string descriptorUrl;

  friend bool operator==(const DiscoveredDevice& lhs, const DiscoveredDevice& rhs)
  {
    return lhs.uuid == rhs.uuid && lhs.ip == rhs.ip && lhs.descriptorUrl == rhs.descriptorUrl;
  }
};

} // namespace discovery
} // namespace roomcast
