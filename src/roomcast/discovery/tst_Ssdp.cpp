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

#include <roomcast/discovery/NetworkInterface.hpp>
#include <roomcast/discovery/Ssdp.hpp>
#include <roomcast/test/CatchWrapper.hpp>

namespace roomcast
{
namespace discovery
{
namespace
{

const std::string kAnswer = "HTTP/1.1 200 OK\r\n"
                            "CACHE-CONTROL: max-age = 1800\r\n"
                            "EXT:\r\n"
                            "LOCATION: http://192.168.1.20:1400/xml/device_description.xml\r\n"
                            "SERVER: Linux UPnP/1.0 Sonos/70.3-35220 (ZPS12)\r\n"
                            "ST: urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
                            "USN: uuid:RINCON_000E58A0123401400::urn:schemas-upnp-org:"
                            "device:ZonePlayer:1\r\n"
                            "\r\n";

} // namespace

TEST_CASE("Ssdp | SearchRequest", "[Ssdp]")
{
  const auto request = makeSearchRequest(kZonePlayerSearchTarget, 3);
  CHECK(request.compare(0, 23, "M-SEARCH * HTTP/1.1\r\nHO") == 0);
  CHECK(request.find("HOST: 239.255.255.250:1900\r\n") != std::string::npos);
  CHECK(request.find("MAN: \"ssdp:discover\"\r\n") != std::string::npos);
  CHECK(request.find("MX: 3\r\n") != std::string::npos);
  CHECK(request.find("ST: urn:schemas-upnp-org:device:ZonePlayer:1\r\n") != std::string::npos);
  CHECK(request.size() - request.rfind("\r\n\r\n") == 4);
}

TEST_CASE("Ssdp | BroadcastEndpoints", "[Ssdp]")
{
  const auto endpoints = broadcastEndpoints(::asio::ip::make_address_v4("192.168.1.5"));
  REQUIRE(2 == endpoints.size());
  CHECK("192.168.1.255" == endpoints[0].address().to_string());
  CHECK("255.255.255.255" == endpoints[1].address().to_string());
  CHECK(1900 == endpoints[0].port());
  CHECK(1900 == endpoints[1].port());
}

TEST_CASE("Ssdp | ParseAnswer", "[Ssdp]")
{
  const auto device = parseSearchResponse(kAnswer, "RINCON_");
  REQUIRE(device);
  CHECK("RINCON_000E58A0123401400" == device->uuid);
  CHECK("192.168.1.20" == device->ip);
  CHECK("http://192.168.1.20:1400/xml/device_description.xml" == device->descriptorUrl);
}

TEST_CASE("Ssdp | HeaderNamesAreCaseInsensitive", "[Ssdp]")
{
  const auto answer = "HTTP/1.1 200 OK\r\n"
                      "Location: http://10.0.0.7:1400/xml/device_description.xml\r\n"
                      "usn: uuid:RINCON_B8E9375831C001400\r\n\r\n";
  const auto device = parseSearchResponse(answer, "RINCON_");
  REQUIRE(device);
  CHECK("RINCON_B8E9375831C001400" == device->uuid);
  CHECK("10.0.0.7" == device->ip);
}

TEST_CASE("Ssdp | IgnoresOtherDevices", "[Ssdp]")
{
  const auto answer = "HTTP/1.1 200 OK\r\n"
                      "LOCATION: http://192.168.1.1:49000/igd.xml\r\n"
                      "USN: uuid:75802409-bccb-40e7-8e6c-fa095ecce13e::upnp:rootdevice\r\n\r\n";
  CHECK(!parseSearchResponse(answer, "RINCON_"));
}

TEST_CASE("Ssdp | IgnoresMalformedAnswers", "[Ssdp]")
{
  SECTION("NotifyAnnouncement")
  {
    const auto notify = "NOTIFY * HTTP/1.1\r\n"
                        "HOST: 239.255.255.250:1900\r\n"
                        "NTS: ssdp:alive\r\n\r\n";
    CHECK(!parseSearchResponse(notify, "RINCON_"));
  }

  SECTION("Garbage")
  {
    CHECK(!parseSearchResponse("\x01\x02garbage", "RINCON_"));
    CHECK(!parseSearchResponse("", "RINCON_"));
  }

  SECTION("ErrorStatus")
  {
    auto answer = kAnswer;
    answer.replace(9, 6, "404 NF");
    CHECK(!parseSearchResponse(answer, "RINCON_"));
  }

  SECTION("MissingLocation")
  {
    const auto answer = "HTTP/1.1 200 OK\r\n"
                        "USN: uuid:RINCON_000E58A0123401400\r\n\r\n";
    CHECK(!parseSearchResponse(answer, "RINCON_"));
  }

  SECTION("HostNameInLocation")
  {
    const auto answer = "HTTP/1.1 200 OK\r\n"
                        "LOCATION: http://kitchen.local:1400/xml/device_description.xml\r\n"
                        "USN: uuid:RINCON_000E58A0123401400\r\n\r\n";
    CHECK(!parseSearchResponse(answer, "RINCON_"));
  }

  SECTION("BarePrefix")
  {
    const auto answer = "HTTP/1.1 200 OK\r\n"
                        "LOCATION: http://192.168.1.20:1400/x.xml\r\n"
                        "USN: uuid:RINCON_::urn:schemas-upnp-org:device:ZonePlayer:1\r\n\r\n";
    CHECK(!parseSearchResponse(answer, "RINCON_"));
  }
}

TEST_CASE("NetworkInterface | UsableForDiscovery", "[NetworkInterface]")
{
  using ::asio::ip::make_address_v4;
  CHECK(isUsableForDiscovery({"eth0", make_address_v4("192.168.1.5")}));
  CHECK(isUsableForDiscovery({"wlan0", make_address_v4("10.0.0.12")}));
  CHECK(!isUsableForDiscovery({"lo", make_address_v4("127.0.0.1")}));
  CHECK(!isUsableForDiscovery({"eth1", make_address_v4("0.0.0.0")}));
  CHECK(!isUsableForDiscovery({"docker0", make_address_v4("172.17.0.1")}));
  CHECK(!isUsableForDiscovery({"veth12ab", make_address_v4("172.18.0.1")}));
  CHECK(!isUsableForDiscovery({"br-5f2c0e", make_address_v4("172.19.0.1")}));
  CHECK(!isUsableForDiscovery({"virbr0", make_address_v4("192.168.122.1")}));
}

} // namespace discovery
} // namespace roomcast
