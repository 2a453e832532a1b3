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
#include <vector>

namespace roomcast
{
namespace topology
{

struct DeviceMember
{
  std::string uuid;
  std::string ip;
  std::string displayName;
  std::string modelLabel;

  friend bool operator==(const DeviceMember& lhs, const DeviceMember& rhs)
  {
    return lhs.uuid == rhs.uuid && lhs.ip == rhs.ip && lhs.displayName == rhs.displayName
           && lhs.modelLabel == rhs.modelLabel;
  }
};

// Speakers playing in sync. The coordinator is always one of the members
// and the group is identified by its uuid.
struct Group
{
  std::string id;
  std::string displayName;
  std::string coordinatorUuid;
  std::string coordinatorIp;
  std::vector<DeviceMember> members;

  friend bool operator==(const Group& lhs, const Group& rhs)
  {
    return lhs.id == rhs.id && lhs.displayName == rhs.displayName
           && lhs.coordinatorUuid == rhs.coordinatorUuid
           && lhs.coordinatorIp == rhs.coordinatorIp && lhs.members == rhs.members;
  }
};

} // namespace topology
} // namespace roomcast
