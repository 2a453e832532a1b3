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

#include <roomcast/control/Services.hpp>
#include <array>
#include <optional>
#include <ostream>
#include <string>

namespace roomcast
{
namespace events
{

// Event sources a device offers subscriptions for
enum class Channel
{
  AVTransport,
  RenderingControl,
  GroupRenderingControl,
  ZoneGroupTopology
};

static constexpr std::array<Channel, 4> kAllChannels = {{Channel::AVTransport,
                                                         Channel::RenderingControl,
                                                         Channel::GroupRenderingControl,
                                                         Channel::ZoneGroupTopology}};

inline const control::Service& service(const Channel channel)
{
  switch (channel)
  {
  case Channel::AVTransport:
    return control::kAvTransport;
  case Channel::RenderingControl:
    return control::kRenderingControl;
  case Channel::GroupRenderingControl:
    return control::kGroupRenderingControl;
  case Channel::ZoneGroupTopology:
    break;
  }
  return control::kZoneGroupTopology;
}

inline const char* name(const Channel channel)
{
  return service(channel).name;
}

inline std::optional<Channel> parseChannel(const std::string& text)
{
  for (const auto channel : kAllChannels)
  {
    if (text == name(channel))
    {
      return channel;
    }
  }
  return std::nullopt;
}

inline std::ostream& operator<<(std::ostream& stream, const Channel channel)
{
  return stream << name(channel);
}

} // namespace events
} // namespace roomcast
