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

#include <roomcast/events/EventJson.hpp>
#include <roomcast/test/CatchWrapper.hpp>

namespace roomcast
{
namespace events
{

TEST_CASE("EventJson | Envelope", "[EventJson]")
{
  const auto json =
    toJson("10.0.0.5", VolumeChanged{42}, std::chrono::milliseconds{1700000000000});
  CHECK("sonos" == json.at("category").get<std::string>());
  CHECK("volumeChanged" == json.at("type").get<std::string>());
  CHECK("10.0.0.5" == json.at("speakerIp").get<std::string>());
  CHECK(42 == json.at("volume").get<int>());
  CHECK(1700000000000 == json.at("timestamp").get<long long>());
}

TEST_CASE("EventJson | Fields", "[EventJson]")
{
  const auto at = std::chrono::milliseconds{0};

  SECTION("Transport")
  {
    const auto json = toJson(
      "ip", TransportStateChanged{TransportState::Playing, std::string{"x-rincon-mp3radio://a"}}, at);
    CHECK("transportChanged" == json.at("type").get<std::string>());
    CHECK("PLAYING" == json.at("state").get<std::string>());
    CHECK("x-rincon-mp3radio://a" == json.at("currentUri").get<std::string>());
  }

  SECTION("TransportWithoutUri")
  {
    const auto json =
      toJson("ip", TransportStateChanged{TransportState::Stopped, std::nullopt}, at);
    CHECK("STOPPED" == json.at("state").get<std::string>());
    CHECK(json.find("currentUri") == json.end());
  }

  SECTION("Mute")
  {
    const auto json = toJson("ip", MuteChanged{true}, at);
    CHECK("muteChanged" == json.at("type").get<std::string>());
    CHECK(json.at("muted").get<bool>());
  }

  SECTION("Topology")
  {
    CHECK("topologyChanged" == toJson("ip", TopologyChanged{}, at).at("type").get<std::string>());
  }

  SECTION("Source")
  {
    const auto json = toJson("ip", SourceChanged{"x-rincon:RINCON_1", "http://h/live"}, at);
    CHECK("sourceChanged" == json.at("type").get<std::string>());
    CHECK("x-rincon:RINCON_1" == json.at("currentUri").get<std::string>());
    CHECK("http://h/live" == json.at("expectedUri").get<std::string>());
  }

  SECTION("SubscriptionLost")
  {
    const auto json =
      toJson("ip", SubscriptionLost{Channel::AVTransport, "device unreachable"}, at);
    CHECK("subscriptionLost" == json.at("type").get<std::string>());
    CHECK("AVTransport" == json.at("service").get<std::string>());
    CHECK("device unreachable" == json.at("reason").get<std::string>());
  }
}

} // namespace events
} // namespace roomcast
