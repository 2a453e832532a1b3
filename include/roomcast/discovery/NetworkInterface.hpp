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
#include <array>
#include <string>

namespace roomcast
{
namespace discovery
{

struct NetworkInterface
{
  std::string name;
  ::asio::ip::address_v4 address;

  friend bool operator==(const NetworkInterface& lhs, const NetworkInterface& rhs)
  {
    return lhs.name == rhs.name && lhs.address == rhs.address;
  }
};

// Container and bridge interfaces never reach a speaker
inline bool isVirtualInterfaceName(const std::string& name)
{
  static const std::array<const char*, 4> kPrefixes = {{"docker", "veth", "br-", "virbr"}};
  for (const auto* prefix : kPrefixes)
  {
    if (name.compare(0, std::char_traits<char>::length(prefix), prefix) == 0)
    {
      return true;
    }
  }
  return false;
}

inline bool isUsableForDiscovery(const NetworkInterface& iface)
{
  return !iface.address.is_loopback() && !iface.address.is_unspecified()
         && !isVirtualInterfaceName(iface.name);
}

} // namespace discovery
} // namespace roomcast
