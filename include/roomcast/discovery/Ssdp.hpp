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

#include <roomcast/discovery/Device.hpp>
#include <roomcast/http/Message.hpp>
#include <roomcast/platforms/asio/AsioWrapper.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace roomcast
{
namespace discovery
{

// The IPv4 multicast group and port of the search protocol
inline ::asio::ip::udp::endpoint multicastEndpoint()
{
  return {::asio::ip::make_address("239.255.255.250"), 1900};
}

// Search targets for networks that drop multicast: the directed broadcast
// of the interface's network, taken to be a /24, and the limited broadcast
inline std::vector<::asio::ip::udp::endpoint> broadcastEndpoints(
  const ::asio::ip::address_v4& interfaceAddress)
{
  auto bytes = interfaceAddress.to_bytes();
  bytes[3] = 255;
  return {{::asio::ip::address_v4(bytes), 1900}, {::asio::ip::address_v4::broadcast(), 1900}};
}

static constexpr const char* kZonePlayerSearchTarget =
  "urn:schemas-upnp-org:device:ZonePlayer:1";

struct Settings
{
  std::string searchTarget = kZonePlayerSearchTarget;
  // Device ids of interest start with this prefix, everything else that
  // answers is ignored
  std::string devicePrefix = "RINCON_";
  // Maximum answer delay requested from devices, in seconds
  unsigned mx = 3;
  // Number of searches sent from every interface
  unsigned retryCount = 3;
  std::chrono::milliseconds retryInterval{800};
  // Every search also goes out as broadcast
  bool broadcastSearch = true;
  std::chrono::milliseconds timeout{5000};
  std::chrono::milliseconds cacheTtl{60000};
};

inline std::string makeSearchRequest(const std::string& searchTarget, const unsigned mx)
{
  const auto group = multicastEndpoint();
  return "M-SEARCH * HTTP/1.1\r\n"
         "HOST: "
         + group.address().to_string() + ":" + std::to_string(group.port())
         + "\r\n"
           "MAN: \"ssdp:discover\"\r\n"
           "MX: "
         + std::to_string(mx)
         + "\r\n"
           "ST: "
         + searchTarget + "\r\n\r\n";
}

// Parses a search answer. Returns nullopt for anything that is not a
// successful answer from a device with the given id prefix.
inline std::optional<DiscoveredDevice> parseSearchResponse(const std::string& text,
                                                           const std::string& devicePrefix)
{
  http::Response response;
  try
  {
    const auto headEnd = text.find("\r\n\r\n");
    response = http::parseResponseHead(
      headEnd == std::string::npos ? text : text.substr(0, headEnd));
  }
  catch (const http::ParseError&)
  {
    // Announcements and other chatter on the group are not responses
    return std::nullopt;
  }
  if (response.status != 200)
  {
    return std::nullopt;
  }

  const auto location = response.headers.get("LOCATION");
  const auto usn = response.headers.get("USN");
  if (!location || !usn)
  {
    return std::nullopt;
  }

  // USN: uuid:RINCON_000E58A0123401400::urn:schemas-upnp-org:device:...
  auto uuid = usn->substr(0, usn->find("::"));
  if (uuid.compare(0, 5, "uuid:") == 0)
  {
    uuid.erase(0, 5);
  }
  if (uuid.compare(0, devicePrefix.size(), devicePrefix) != 0
      || uuid.size() == devicePrefix.size())
  {
    return std::nullopt;
  }

  const auto url = http::parseUrl(*location);
  if (!url)
  {
    return std::nullopt;
  }
  ::asio::error_code ec;
  ::asio::ip::make_address_v4(url->host, ec);
  if (ec)
  {
    return std::nullopt;
  }

  return DiscoveredDevice{std::move(uuid), url->host, *location};
}

} // namespace discovery
} // namespace roomcast
