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

#include <roomcast/events/Channel.hpp>
#include <roomcast/events/Event.hpp>
#include <roomcast/http/Message.hpp>
#include <roomcast/xml/Scanner.hpp>
#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

namespace roomcast
{
namespace events
{

// Compares two stream locations by host and path only. Devices report the
// stream they were sent under their own schemes, sometimes nested, as in
// "aac://http://host/path".
inline bool sameStreamLocation(const std::string& lhs, const std::string& rhs)
{
  const auto hostAndPath = [](const std::string& url)
  {
    const auto pos = url.rfind("://");
    return pos == std::string::npos ? url : url.substr(pos + 3);
  };
  return http::iequals(hostAndPath(lhs), hostAndPath(rhs));
}

namespace detail
{

inline std::optional<int> parseLevel(const std::string& text)
{
  const auto trimmed = http::trim(text);
  char* pEnd = nullptr;
  const auto value = std::strtol(trimmed.c_str(), &pEnd, 10);
  if (trimmed.empty() || *pEnd != '\0')
  {
    return std::nullopt;
  }
  return static_cast<int>(std::min(std::max(value, 0L), 100L));
}

// The val attribute of the first element with the given name on the
// master channel, as used by RenderingControl
inline std::optional<std::string> masterValue(const std::string& lastChange,
                                              const std::string& elementName)
{
  for (const auto& element : xml::elements(lastChange, elementName))
  {
    if (element.attribute("channel") == std::optional<std::string>{"Master"})
    {
      return element.attribute("val");
    }
  }
  return std::nullopt;
}

inline std::vector<Event> parseAvTransport(const std::string& lastChange,
                                           const std::optional<std::string>& expectedUrl)
{
  std::vector<Event> result;
  auto currentUri = xml::attribute(lastChange, "CurrentTrackURI", "val");
  if (currentUri && currentUri->empty())
  {
    currentUri = std::nullopt;
  }

  if (const auto stateText = xml::attribute(lastChange, "TransportState", "val"))
  {
    if (const auto state = parseTransportState(*stateText))
    {
      result.emplace_back(TransportStateChanged{*state, currentUri});
    }
  }

  if (currentUri && expectedUrl && !sameStreamLocation(*currentUri, *expectedUrl))
  {
    result.emplace_back(SourceChanged{*currentUri, *expectedUrl});
  }
  return result;
}

inline std::vector<Event> parseRenderingControl(const std::string& lastChange)
{
  std::vector<Event> result;
  if (const auto volume = masterValue(lastChange, "Volume"))
  {
    if (const auto level = parseLevel(*volume))
    {
      result.emplace_back(VolumeChanged{*level});
    }
  }
  if (const auto mute = masterValue(lastChange, "Mute"))
  {
    result.emplace_back(MuteChanged{http::trim(*mute) == "1"});
  }
  return result;
}

inline std::vector<Event> parseGroupRenderingControl(const std::string& body)
{
  std::vector<Event> result;
  if (const auto volume = xml::elementText(body, "GroupVolume"))
  {
    if (const auto level = parseLevel(*volume))
    {
      result.emplace_back(VolumeChanged{*level});
    }
  }
  if (const auto mute = xml::elementText(body, "GroupMute"))
  {
    result.emplace_back(MuteChanged{http::trim(*mute) == "1"});
  }
  return result;
}

} // namespace detail

// Events carried by one notification body of the given channel, in the
// order transport, source, volume, mute. expectedStreamUrl is the stream
// the device should be playing, if any.
inline std::vector<Event> parseNotification(
  const Channel channel,
  const std::string& body,
  const std::optional<std::string>& expectedStreamUrl = std::nullopt)
{
  switch (channel)
  {
  case Channel::AVTransport:
  case Channel::RenderingControl:
  {
    // State changes arrive as an escaped document inside LastChange
    const auto lastChange = xml::elementText(body, "LastChange");
    if (!lastChange)
    {
      return {};
    }
    const auto decoded = xml::unescape(*lastChange);
    return channel == Channel::AVTransport
             ? detail::parseAvTransport(decoded, expectedStreamUrl)
             : detail::parseRenderingControl(decoded);
  }
  case Channel::GroupRenderingControl:
    return detail::parseGroupRenderingControl(body);
  case Channel::ZoneGroupTopology:
    break;
  }

  if (xml::elementText(body, "ZoneGroupState"))
  {
    return {TopologyChanged{}};
  }
  return {};
}

} // namespace events
} // namespace roomcast
