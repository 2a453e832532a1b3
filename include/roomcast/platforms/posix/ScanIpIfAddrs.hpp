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

#include <roomcast/discovery/NetworkInterface.hpp>
#include <vector>

namespace roomcast
{
namespace platforms
{
namespace posix
{

// Scan active network interfaces and return the name and address of every
// interface that is up and carries an IPv4 address.
struct ScanIpIfAddrs
{
  std::vector<discovery::NetworkInterface> operator()();
};

} // namespace posix
} // namespace platforms
} // namespace roomcast
