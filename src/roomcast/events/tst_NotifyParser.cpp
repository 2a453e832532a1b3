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

#include <roomcast/events/NotifyParser.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/xml/Scanner.hpp>
#include <sstream>

namespace roomcast
{
namespace events
{
namespace
{

std::string propertySet(const std::string& content)
{
  return "<?xml version=\"1.0\"?><e:propertyset "
         "xmlns:e=\"urn:schemas-upnp-org:event-1-0\"><e:property>"
         + content + "</e:property></e:propertyset>";
}

std::string lastChange(const std::string& instance)
{
  return propertySet("<LastChange>"
                     + xml::escape("<Event xmlns=\"urn:schemas-upnp-org:metadata-1-0/AVT/\">"
                                   "<InstanceID val=\"0\">"
                                   + instance + "</InstanceID></Event>")
                     + "</LastChange>");
}

} // namespace

TEST_CASE("NotifyParser | TransportState", "[NotifyParser]")
{
  const auto events = parseNotification(
    Channel::AVTransport,
    lastChange("<TransportState val=\"PLAYING\"/>"
               "<CurrentTrackURI val=\"x-rincon-mp3radio://192.168.1.5:45100/streams/a/live.mp3\"/>"));
  REQUIRE(1 == events.size());
  const auto& changed = std::get<TransportStateChanged>(events[0]);
  CHECK(TransportState::Playing == changed.state);
  CHECK(std::optional<std::string>{"x-rincon-mp3radio://192.168.1.5:45100/streams/a/live.mp3"}
        == changed.currentUri);
}

TEST_CASE("NotifyParser | ShortPausedSpelling", "[NotifyParser]")
{
  const auto events =
    parseNotification(Channel::AVTransport, lastChange("<TransportState val=\"PAUSED\"/>"));
  REQUIRE(1 == events.size());
  CHECK(TransportState::PausedPlayback == std::get<TransportStateChanged>(events[0]).state);
  CHECK(!std::get<TransportStateChanged>(events[0]).currentUri);
}

TEST_CASE("NotifyParser | UnknownTransportState", "[NotifyParser]")
{
  CHECK(parseNotification(Channel::AVTransport, lastChange("<TransportState val=\"NAPPING\"/>"))
          .empty());
}

TEST_CASE("NotifyParser | SourceChanged", "[NotifyParser]")
{
  const auto expected = std::string{"http://192.168.1.5:45100/streams/a/live.mp3"};

  SECTION("SameLocationUnderDeviceScheme")
  {
    const auto events = parseNotification(
      Channel::AVTransport,
      lastChange("<TransportState val=\"PLAYING\"/>"
                 "<CurrentTrackURI val=\"aac://http://192.168.1.5:45100/streams/a/live.mp3\"/>"),
      expected);
    REQUIRE(1 == events.size());
    CHECK(std::holds_alternative<TransportStateChanged>(events[0]));
  }

  SECTION("OtherSource")
  {
    const auto events = parseNotification(
      Channel::AVTransport,
      lastChange("<TransportState val=\"PLAYING\"/>"
                 "<CurrentTrackURI val=\"x-sonos-spotify:spotify%3atrack%3a1\"/>"),
      expected);
    REQUIRE(2 == events.size());
    const auto& changed = std::get<SourceChanged>(events[1]);
    CHECK("x-sonos-spotify:spotify%3atrack%3a1" == changed.currentUri);
    CHECK(expected == changed.expectedUri);
  }

  SECTION("EmptyTrackIsNoSource")
  {
    const auto events = parseNotification(
      Channel::AVTransport,
      lastChange("<TransportState val=\"STOPPED\"/><CurrentTrackURI val=\"\"/>"),
      expected);
    REQUIRE(1 == events.size());
    CHECK(!std::get<TransportStateChanged>(events[0]).currentUri);
  }
}

TEST_CASE("NotifyParser | RenderingControl", "[NotifyParser]")
{
  const auto events = parseNotification(
    Channel::RenderingControl,
    lastChange("<Volume channel=\"LF\" val=\"100\"/><Volume channel=\"Master\" val=\"37\"/>"
               "<Mute channel=\"Master\" val=\"1\"/>"));
  REQUIRE(2 == events.size());
  CHECK(37 == std::get<VolumeChanged>(events[0]).volume);
  CHECK(std::get<MuteChanged>(events[1]).muted);
}

TEST_CASE("NotifyParser | VolumeIsClamped", "[NotifyParser]")
{
  const auto events = parseNotification(
    Channel::RenderingControl, lastChange("<Volume channel=\"Master\" val=\"140\"/>"));
  REQUIRE(1 == events.size());
  CHECK(100 == std::get<VolumeChanged>(events[0]).volume);
}

TEST_CASE("NotifyParser | GroupRenderingControl", "[NotifyParser]")
{
  const auto events = parseNotification(
    Channel::GroupRenderingControl,
    propertySet("<GroupVolume>12</GroupVolume></e:property><e:property>"
                "<GroupMute>0</GroupMute>"));
  REQUIRE(2 == events.size());
  CHECK(12 == std::get<VolumeChanged>(events[0]).volume);
  CHECK(!std::get<MuteChanged>(events[1]).muted);
}

TEST_CASE("NotifyParser | ZoneGroupTopology", "[NotifyParser]")
{
  const auto events = parseNotification(
    Channel::ZoneGroupTopology,
    propertySet("<ZoneGroupState>" + xml::escape("<ZoneGroupState><ZoneGroups/></ZoneGroupState>")
                + "</ZoneGroupState>"));
  REQUIRE(1 == events.size());
  CHECK(std::holds_alternative<TopologyChanged>(events[0]));

  CHECK(parseNotification(Channel::ZoneGroupTopology, propertySet("<AreasUpdateID/>")).empty());
}

TEST_CASE("NotifyParser | MalformedBodies", "[NotifyParser]")
{
  CHECK(parseNotification(Channel::AVTransport, "").empty());
  CHECK(parseNotification(Channel::AVTransport, "not xml at all").empty());
  CHECK(parseNotification(Channel::RenderingControl, propertySet("<LastChange>")).empty());
}

TEST_CASE("NotifyParser | SameStreamLocation", "[NotifyParser]")
{
  CHECK(sameStreamLocation("http://Host:1/a", "x-rincon-mp3radio://host:1/a"));
  CHECK(sameStreamLocation("aac://http://host:1/a", "http://host:1/a"));
  CHECK(!sameStreamLocation("http://host:1/a", "http://host:1/b"));
}

TEST_CASE("Event | Print", "[Event]")
{
  const auto print = [](const Event& event)
  {
    std::ostringstream stream;
    stream << event;
    return stream.str();
  };

  CHECK("transport PAUSED_PLAYBACK" == print(TransportStateChanged{TransportState::PausedPlayback, {}}));
  CHECK("volume 12" == print(VolumeChanged{12}));
  CHECK("muted" == print(MuteChanged{true}));
  CHECK("source changed to x-rincon:RINCON_1, expected http://h/a"
        == print(SourceChanged{"x-rincon:RINCON_1", "http://h/a"}));
  CHECK("AVTransport subscription lost: device unreachable"
        == print(SubscriptionLost{Channel::AVTransport, "device unreachable"}));
}

} // namespace events
} // namespace roomcast
