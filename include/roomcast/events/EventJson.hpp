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

#include <roomcast/events/Event.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace roomcast
{
namespace events
{
namespace detail
{

struct EventFields
{
  void operator()(const TransportStateChanged& e) const
  {
    json["type"] = "transportChanged";
    json["state"] = toString(e.state);
    if (e.currentUri)
    {
      json["currentUri"] = *e.currentUri;
    }
  }
  void operator()(const VolumeChanged& e) const
  {
    json["type"] = "volumeChanged";
    json["volume"] = e.volume;
  }
  void operator()(const MuteChanged& e) const
  {
    json["type"] = "muteChanged";
    json["muted"] = e.muted;
  }
  void operator()(const TopologyChanged&) const { json["type"] = "topologyChanged"; }
  void operator()(const SourceChanged& e) const
  {
    json["type"] = "sourceChanged";
    json["currentUri"] = e.currentUri;
    json["expectedUri"] = e.expectedUri;
  }
  void operator()(const SubscriptionLost& e) const
  {
    json["type"] = "subscriptionLost";
    json["service"] = name(e.channel);
    json["reason"] = e.reason;
  }

  nlohmann::json& json;
};

} // namespace detail

// Device event as pushed to producers:
//   {"category": "sonos", "type": ..., "speakerIp": ..., <fields>, "timestamp": <ms>}
inline nlohmann::json toJson(const std::string& deviceIp,
                             const Event& event,
                             const std::chrono::milliseconds timestamp)
{
  nlohmann::json json{{"category", "sonos"}, {"speakerIp", deviceIp}};
  std::visit(detail::EventFields{json}, event);
  json["timestamp"] = timestamp.count();
  return json;
}

} // namespace events
} // namespace roomcast
