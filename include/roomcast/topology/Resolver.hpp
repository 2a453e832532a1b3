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

#include <roomcast/control/Commands.hpp>
#include <roomcast/discovery/Device.hpp>
#include <roomcast/topology/Errors.hpp>
#include <roomcast/topology/Group.hpp>
#include <roomcast/topology/ZoneGroupState.hpp>
#include <roomcast/util/Locked.hpp>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace roomcast
{
namespace topology
{

// Resolves the current group layout and keeps the latest result.
// Every successful fetch replaces the whole group set at once.
template <typename Client, typename Log>
class Resolver
{
public:
  // Returns the devices to ask when no address is given, typically backed
  // by a discovery::DeviceCache
  using DeviceLookup = std::function<std::vector<discovery::DiscoveredDevice>()>;

  Resolver(Client& client, DeviceLookup lookup, Log log)
    : mClient(client)
    , mLookup(std::move(lookup))
    , mLog(channel(log, "topology"))
  {
  }

  // Asks the given device, or each discovered device in turn until one
  // answers. Throws NoDevicesAvailable if discovery finds nothing, otherwise
  // the error of the last device tried.
  std::vector<Group> getGroups(const std::optional<std::string>& deviceIp = std::nullopt)
  {
    if (deviceIp)
    {
      return fetch(*deviceIp);
    }

    const auto devices = mLookup();
    if (devices.empty())
    {
      throw NoDevicesAvailable{};
    }

    std::exception_ptr pLastError;
    for (const auto& device : devices)
    {
      try
      {
        return fetch(device.ip);
      }
      catch (const std::runtime_error& e)
      {
        warning(mLog) << "zone group state from " << device.ip << " failed: " << e.what();
        pLastError = std::current_exception();
      }
    }
    std::rethrow_exception(pLastError);
  }

  // The groups from the last successful fetch
  std::vector<Group> groups() const { return mGroups.read(); }

  std::optional<Group> findGroup(const std::string& groupId) const
  {
    return mGroups.inspect(
      [&](const std::vector<Group>& groups) -> std::optional<Group>
      {
        for (const auto& group : groups)
        {
          if (group.id == groupId)
          {
            return group;
          }
        }
        return std::nullopt;
      });
  }

private:
  std::vector<Group> fetch(const std::string& deviceIp)
  {
    auto groups = parseZoneGroupState(control::getZoneGroupState(mClient, deviceIp), mLog);
    info(mLog) << deviceIp << " reports " << groups.size() << " group(s)";
    mGroups.update([&](std::vector<Group>& current) { current = groups; });
    return groups;
  }

  Client& mClient;
  DeviceLookup mLookup;
  Log mLog;
  util::Locked<std::vector<Group>> mGroups;
};

} // namespace topology
} // namespace roomcast
