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

#include <roomcast/http/Message.hpp>
#include <roomcast/topology/Errors.hpp>
#include <roomcast/topology/Group.hpp>
#include <roomcast/xml/Scanner.hpp>
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace roomcast
{
namespace topology
{

// Label for a home theatre channel assignment like "LF,RF" or "SW"
inline std::string channelRoleLabel(const std::string& channels)
{
  if (channels == "LF,RF")
  {
    return "Soundbar";
  }
  if (channels == "SW")
  {
    return "Subwoofer";
  }
  if (channels == "LR")
  {
    return "Surround Left";
  }
  if (channels == "RR")
  {
    return "Surround Right";
  }
  if (channels == "LF")
  {
    return "Left";
  }
  if (channels == "RF")
  {
    return "Right";
  }
  return channels;
}

// Looks up the role of a device in a channel map of the form
// "RINCON_A:LF,RF;RINCON_B:SW;RINCON_C:LR;RINCON_D:RR"
inline std::optional<std::string> channelRole(const std::string& channelMap,
                                              const std::string& uuid)
{
  std::size_t pos = 0;
  while (pos <= channelMap.size())
  {
    const auto end = std::min(channelMap.find(';', pos), channelMap.size());
    const auto mapping = channelMap.substr(pos, end - pos);
    const auto colon = mapping.find(':');
    if (colon != std::string::npos && mapping.compare(0, colon, uuid) == 0
        && colon == uuid.size())
    {
      return channelRoleLabel(mapping.substr(colon + 1));
    }
    pos = end + 1;
  }
  return std::nullopt;
}

// "x-rincon-cpicon:sonos-one-g1" -> "one"
inline std::optional<std::string> modelFromIcon(const std::string& icon)
{
  static const std::string kMarker = "sonos-";
  const auto pos = icon.find(kMarker);
  if (pos == std::string::npos)
  {
    return std::nullopt;
  }
  auto model = icon.substr(pos + kMarker.size());
  model = model.substr(0, model.find('-'));
  if (model.empty())
  {
    return std::nullopt;
  }
  return model;
}

namespace detail
{

inline std::optional<DeviceMember> parseMember(const xml::Element& element,
                                               const std::optional<std::string>& channelMap)
{
  if (element.attribute("IsZoneBridge") == std::optional<std::string>{"1"})
  {
    return std::nullopt;
  }
  const auto uuid = element.attribute("UUID");
  const auto location = element.attribute("Location");
  const auto zoneName = element.attribute("ZoneName");
  if (!uuid || !location || !zoneName || uuid->empty())
  {
    return std::nullopt;
  }
  const auto url = http::parseUrl(*location);
  if (!url)
  {
    return std::nullopt;
  }

  DeviceMember member{*uuid, url->host, *zoneName, "Speaker"};
  std::optional<std::string> label;
  if (channelMap)
  {
    label = channelRole(*channelMap, *uuid);
  }
  if (!label)
  {
    if (const auto icon = element.attribute("Icon"))
    {
      label = modelFromIcon(*icon);
    }
  }
  if (label)
  {
    member.modelLabel = std::move(*label);
  }
  return member;
}

// Coordinator name first, then every other distinct name in member order
inline std::string groupName(const std::vector<DeviceMember>& members,
                             const std::string& coordinatorName)
{
  std::vector<std::string> names{coordinatorName};
  for (const auto& member : members)
  {
    if (std::find(names.begin(), names.end(), member.displayName) == names.end())
    {
      names.push_back(member.displayName);
    }
  }

  std::string result;
  for (const auto& name : names)
  {
    result += (result.empty() ? "" : " + ") + name;
  }
  return result;
}

} // namespace detail

// Parses a decoded zone group description into groups. Groups that cannot
// be played to are dropped and reported to the log:
//  - groups containing another group element
//  - groups without eligible members
//  - groups whose coordinator is not an eligible member
// Members are eligible unless they are bridges or lack a uuid, location
// or zone name. Throws ParseError if the text holds no zone group list.
template <typename Log>
std::vector<Group> parseZoneGroupState(const std::string& text, const Log& log)
{
  const auto zoneGroups = xml::elementText(text, "ZoneGroups");
  if (!zoneGroups)
  {
    throw ParseError{"no ZoneGroups element in zone group state"};
  }

  std::vector<Group> result;
  for (const auto& groupElement : xml::elements(*zoneGroups, "ZoneGroup"))
  {
    const auto coordinator = groupElement.attribute("Coordinator");
    if (groupElement.nested)
    {
      warning(log) << "skipping zone group " << coordinator.value_or("?")
                   << " with a nested group";
      continue;
    }
    if (!coordinator)
    {
      debug(log) << "skipping zone group without coordinator";
      continue;
    }

    auto memberElements = xml::elements(groupElement.content, "ZoneGroupMember");
    for (auto& satellite : xml::elements(groupElement.content, "Satellite"))
    {
      memberElements.push_back(std::move(satellite));
    }

    // Channel roles are declared on the coordinator
    std::optional<std::string> channelMap;
    for (const auto& element : memberElements)
    {
      if (element.attribute("UUID") == coordinator)
      {
        channelMap = element.attribute("HTSatChanMapSet");
      }
    }

    Group group;
    group.id = *coordinator;
    group.coordinatorUuid = *coordinator;
    for (const auto& element : memberElements)
    {
      auto member = detail::parseMember(element, channelMap);
      if (!member)
      {
        continue;
      }
      const auto known = std::any_of(group.members.begin(),
                                     group.members.end(),
                                     [&](const DeviceMember& m) { return m.uuid == member->uuid; });
      if (!known)
      {
        group.members.push_back(std::move(*member));
      }
    }

    const auto pCoordinator = std::find_if(group.members.begin(),
                                           group.members.end(),
                                           [&](const DeviceMember& m)
                                           { return m.uuid == *coordinator; });
    if (pCoordinator == group.members.end())
    {
      debug(log) << "skipping zone group " << *coordinator << " without eligible coordinator";
      continue;
    }
    group.coordinatorIp = pCoordinator->ip;
    group.displayName = detail::groupName(group.members, pCoordinator->displayName);
    result.push_back(std::move(group));
  }
  return result;
}

} // namespace topology
} // namespace roomcast
