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

#include <roomcast/StreamMetadata.hpp>
#include <roomcast/control/Client.hpp>
#include <roomcast/control/Didl.hpp>
#include <algorithm>
#include <cstdlib>
#include <string>

namespace roomcast
{
namespace control
{

// Transport and volume actions on a group coordinator. All of them throw
// what Client::send throws unless noted otherwise.

namespace detail
{

inline const Params& instanceOnly()
{
  static const Params params = {{"InstanceID", "0"}};
  return params;
}

} // namespace detail

template <typename Client>
void play(Client& client, const std::string& coordinatorIp)
{
  client.sendWithRetry(
    coordinatorIp, kAvTransport, "Play", {{"InstanceID", "0"}, {"Speed", "1"}});
}

template <typename Client>
void pause(Client& client, const std::string& coordinatorIp)
{
  client.sendWithRetry(coordinatorIp, kAvTransport, "Pause", detail::instanceOnly());
}

// A device that is already stopped answers Stop with "transition not
// available". That still leaves it stopped, so it is not an error.
template <typename Client>
void stop(Client& client, const std::string& coordinatorIp)
{
  try
  {
    client.send(coordinatorIp, kAvTransport, "Stop", detail::instanceOnly());
  }
  catch (const DeviceProtocolError& e)
  {
    if (e.faultCode != DeviceProtocolError::kTransitionNotAvailable)
    {
      throw;
    }
    debug(client.log()) << "Stop on " << coordinatorIp << ": already stopped";
  }
}

template <typename Client>
void setAvTransportUri(Client& client,
                       const std::string& coordinatorIp,
                       const std::string& streamUrl,
                       const StreamMetadata& metadata)
{
  info(client.log()) << "SetAVTransportURI " << toRadioUri(streamUrl) << " on "
                     << coordinatorIp;
  client.sendWithRetry(coordinatorIp,
                       kAvTransport,
                       "SetAVTransportURI",
                       {{"InstanceID", "0"},
                        {"CurrentURI", toRadioUri(streamUrl)},
                        {"CurrentURIMetaData", makeDidlLite(streamUrl, metadata)}});
}

// Points the coordinator at a live stream and starts it
template <typename Client>
void playStream(Client& client,
                const std::string& coordinatorIp,
                const std::string& streamUrl,
                const StreamMetadata& metadata)
{
  setAvTransportUri(client, coordinatorIp, streamUrl, metadata);
  play(client, coordinatorIp);
}

// Throws DeviceProtocolError if the response carries no volume
template <typename Client>
int getGroupVolume(Client& client, const std::string& coordinatorIp)
{
  const auto body =
    client.send(coordinatorIp, kGroupRenderingControl, "GetGroupVolume", detail::instanceOnly());
  const auto volume = responseValue(body, "CurrentVolume");
  if (!volume)
  {
    throw DeviceProtocolError{200, 0, "GetGroupVolume response without CurrentVolume"};
  }
  return std::atoi(volume->c_str());
}

// Volume is clamped to 0..100
template <typename Client>
void setGroupVolume(Client& client, const std::string& coordinatorIp, const int volume)
{
  const auto clamped = std::min(std::max(volume, 0), 100);
  client.sendWithRetry(coordinatorIp,
                       kGroupRenderingControl,
                       "SetGroupVolume",
                       {{"InstanceID", "0"}, {"DesiredVolume", std::to_string(clamped)}});
}

template <typename Client>
bool getGroupMute(Client& client, const std::string& coordinatorIp)
{
  const auto body =
    client.send(coordinatorIp, kGroupRenderingControl, "GetGroupMute", detail::instanceOnly());
  const auto mute = responseValue(body, "CurrentMute");
  if (!mute)
  {
    throw DeviceProtocolError{200, 0, "GetGroupMute response without CurrentMute"};
  }
  return http::trim(*mute) == "1";
}

template <typename Client>
void setGroupMute(Client& client, const std::string& coordinatorIp, const bool muted)
{
  client.sendWithRetry(coordinatorIp,
                       kGroupRenderingControl,
                       "SetGroupMute",
                       {{"InstanceID", "0"}, {"DesiredMute", muted ? "1" : "0"}});
}

// Volume and mute of a single device, regardless of its group

template <typename Client>
int getVolume(Client& client, const std::string& deviceIp)
{
  const auto body = client.send(
    deviceIp, kRenderingControl, "GetVolume", {{"InstanceID", "0"}, {"Channel", "Master"}});
  const auto volume = responseValue(body, "CurrentVolume");
  if (!volume)
  {
    throw DeviceProtocolError{200, 0, "GetVolume response without CurrentVolume"};
  }
  return std::atoi(volume->c_str());
}

template <typename Client>
void setVolume(Client& client, const std::string& deviceIp, const int volume)
{
  const auto clamped = std::min(std::max(volume, 0), 100);
  client.sendWithRetry(deviceIp,
                       kRenderingControl,
                       "SetVolume",
                       {{"InstanceID", "0"},
                        {"Channel", "Master"},
                        {"DesiredVolume", std::to_string(clamped)}});
}

template <typename Client>
bool getMute(Client& client, const std::string& deviceIp)
{
  const auto body = client.send(
    deviceIp, kRenderingControl, "GetMute", {{"InstanceID", "0"}, {"Channel", "Master"}});
  const auto mute = responseValue(body, "CurrentMute");
  if (!mute)
  {
    throw DeviceProtocolError{200, 0, "GetMute response without CurrentMute"};
  }
  return http::trim(*mute) == "1";
}

template <typename Client>
void setMute(Client& client, const std::string& deviceIp, const bool muted)
{
  client.sendWithRetry(
    deviceIp,
    kRenderingControl,
    "SetMute",
    {{"InstanceID", "0"}, {"Channel", "Master"}, {"DesiredMute", muted ? "1" : "0"}});
}

// The zone group description, decoded from its transport escaping.
// Throws DeviceProtocolError if the response does not carry one.
template <typename Client>
std::string getZoneGroupState(Client& client, const std::string& deviceIp)
{
  const auto body = client.send(deviceIp, kZoneGroupTopology, "GetZoneGroupState", {});
  auto state = responseValue(body, "ZoneGroupState");
  if (!state)
  {
    throw DeviceProtocolError{200, 0, "GetZoneGroupState response without ZoneGroupState"};
  }
  return std::move(*state);
}

} // namespace control
} // namespace roomcast
