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

#include <roomcast/control/Client.hpp>
#include <roomcast/control/Commands.hpp>
#include <roomcast/control/test/Transport.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/util/Log.hpp>

namespace roomcast
{
namespace control
{
namespace
{

using TestClient = Client<test::Transport, util::NullLog>;

struct Fixture
{
  test::Transport transport;
  TestClient client{transport, {}, {}, [](std::chrono::milliseconds) {}};

  std::string body(const std::size_t index) const
  {
    return transport.sent().at(index).request.body;
  }

  std::string soapAction(const std::size_t index) const
  {
    return *transport.sent().at(index).request.headers.get("SOAPACTION");
  }
};

bool contains(const std::string& text, const std::string& fragment)
{
  return text.find(fragment) != std::string::npos;
}

} // namespace

TEST_CASE("Commands | PlayStream", "[Commands]")
{
  Fixture fixture;
  playStream(fixture.client,
             "192.168.1.10",
             "http://192.168.1.5:45100/streams/tab-1/live.mp3",
             StreamMetadata{std::string{"Song"}, std::string{"Band"}, std::nullopt});

  REQUIRE(2 == fixture.transport.sent().size());
  CHECK(contains(fixture.soapAction(0), "#SetAVTransportURI"));
  CHECK(contains(fixture.soapAction(1), "#Play\""));

  const auto setUri = fixture.body(0);
  CHECK(contains(setUri,
                 "<CurrentURI>x-rincon-mp3radio://192.168.1.5:45100/streams/tab-1/live.mp3"
                 "</CurrentURI>"));
  // The metadata travels escaped inside the envelope
  CHECK(contains(setUri, "&lt;dc:title&gt;Song&lt;/dc:title&gt;"));
  CHECK(contains(setUri, "&lt;dc:creator&gt;Band&lt;/dc:creator&gt;"));
  CHECK(!contains(setUri, "upnp:album"));
  CHECK(contains(fixture.body(1), "<Speed>1</Speed>"));
}

TEST_CASE("Commands | SetAvTransportUriRetriesTransientFaults", "[Commands]")
{
  Fixture fixture;
  fixture.transport.respond(test::soapFault(714));
  setAvTransportUri(fixture.client, "192.168.1.10", "http://h/s.mp3", StreamMetadata{});
  CHECK(2 == fixture.transport.sent().size());
}

TEST_CASE("Commands | Stop", "[Commands]")
{
  Fixture fixture;

  SECTION("AlreadyStoppedIsSuccess")
  {
    fixture.transport.respond(test::soapFault(701));
    CHECK_NOTHROW(stop(fixture.client, "192.168.1.10"));
    CHECK(1 == fixture.transport.sent().size());
  }

  SECTION("OtherFaultsPropagate")
  {
    fixture.transport.respond(test::soapFault(402));
    CHECK_THROWS_AS(stop(fixture.client, "192.168.1.10"), DeviceProtocolError);
  }
}

TEST_CASE("Commands | GroupVolume", "[Commands]")
{
  Fixture fixture;

  SECTION("Get")
  {
    fixture.transport.respond(200,
                              test::soapResponse("GetGroupVolume",
                                                 kGroupRenderingControl.urn,
                                                 "<CurrentVolume>37</CurrentVolume>"));
    CHECK(37 == getGroupVolume(fixture.client, "192.168.1.10"));
    CHECK("/MediaRenderer/GroupRenderingControl/Control"
          == fixture.transport.sent()[0].request.target);
  }

  SECTION("GetWithoutValue")
  {
    fixture.transport.respond(
      200, test::soapResponse("GetGroupVolume", kGroupRenderingControl.urn, ""));
    CHECK_THROWS_AS(getGroupVolume(fixture.client, "192.168.1.10"), DeviceProtocolError);
  }

  SECTION("SetIsClamped")
  {
    setGroupVolume(fixture.client, "192.168.1.10", 150);
    setGroupVolume(fixture.client, "192.168.1.10", -3);
    CHECK(contains(fixture.body(0), "<DesiredVolume>100</DesiredVolume>"));
    CHECK(contains(fixture.body(1), "<DesiredVolume>0</DesiredVolume>"));
  }
}

TEST_CASE("Commands | GroupMute", "[Commands]")
{
  Fixture fixture;
  fixture.transport.respond(
    200,
    test::soapResponse(
      "GetGroupMute", kGroupRenderingControl.urn, "<CurrentMute>1</CurrentMute>"));
  CHECK(getGroupMute(fixture.client, "192.168.1.10"));

  setGroupMute(fixture.client, "192.168.1.10", false);
  CHECK(contains(fixture.body(1), "<DesiredMute>0</DesiredMute>"));
}

TEST_CASE("Commands | DeviceVolumeAndMute", "[Commands]")
{
  Fixture fixture;

  SECTION("GetVolume")
  {
    fixture.transport.respond(
      200,
      test::soapResponse(
        "GetVolume", kRenderingControl.urn, "<CurrentVolume>18</CurrentVolume>"));
    CHECK(18 == getVolume(fixture.client, "192.168.1.11"));
    CHECK("/MediaRenderer/RenderingControl/Control" == fixture.transport.sent()[0].request.target);
    CHECK(contains(fixture.body(0), "<Channel>Master</Channel>"));
  }

  SECTION("SetVolumeIsClamped")
  {
    setVolume(fixture.client, "192.168.1.11", 101);
    CHECK(contains(fixture.soapAction(0), "RenderingControl:1#SetVolume"));
    CHECK(contains(fixture.body(0), "<DesiredVolume>100</DesiredVolume>"));
  }

  SECTION("Mute")
  {
    fixture.transport.respond(
      200, test::soapResponse("GetMute", kRenderingControl.urn, "<CurrentMute>0</CurrentMute>"));
    CHECK(!getMute(fixture.client, "192.168.1.11"));
    setMute(fixture.client, "192.168.1.11", true);
    CHECK(contains(fixture.body(1), "<DesiredMute>1</DesiredMute>"));
  }

  SECTION("GetMuteWithoutValue")
  {
    fixture.transport.respond(200, test::soapResponse("GetMute", kRenderingControl.urn, ""));
    CHECK_THROWS_AS(getMute(fixture.client, "192.168.1.11"), DeviceProtocolError);
  }
}

TEST_CASE("Commands | PlayAndPause", "[Commands]")
{
  Fixture fixture;
  play(fixture.client, "192.168.1.10");
  pause(fixture.client, "192.168.1.10");
  CHECK(contains(fixture.soapAction(0), "AVTransport:1#Play"));
  CHECK(contains(fixture.soapAction(1), "AVTransport:1#Pause"));
  CHECK(contains(fixture.body(1), "<InstanceID>0</InstanceID>"));
}

TEST_CASE("Didl | RadioUri", "[Didl]")
{
  CHECK("x-rincon-mp3radio://10.0.0.2:8080/live.mp3" == toRadioUri("http://10.0.0.2:8080/live.mp3"));
  CHECK("x-rincon-mp3radio://host/live.aac" == toRadioUri("https://host/live.aac"));
  CHECK("x-file-cifs://nas/a.flac" == toRadioUri("x-file-cifs://nas/a.flac"));
}

TEST_CASE("Didl | Metadata", "[Didl]")
{
  SECTION("Defaults")
  {
    const auto didl = makeDidlLite("http://h/s.mp3", StreamMetadata{});
    CHECK(contains(didl, "<dc:title>Browser Audio</dc:title>"));
    CHECK(contains(didl, "<dc:creator>Roomcast</dc:creator>"));
    CHECK(contains(didl, "<upnp:class>object.item.audioItem.audioBroadcast</upnp:class>"));
    CHECK(contains(didl, "<res protocolInfo=\"http-get:*:audio/*:*\">http://h/s.mp3</res>"));
  }

  SECTION("Escaped")
  {
    const auto didl = makeDidlLite(
      "http://h/s.mp3?a=1&b=2",
      StreamMetadata{std::string{"Rock & Roll"}, std::string{"<AC/DC>"}, std::string{"Best"}});
    CHECK(contains(didl, "<dc:title>Rock &amp; Roll</dc:title>"));
    CHECK(contains(didl, "<dc:creator>&lt;AC/DC&gt;</dc:creator>"));
    CHECK(contains(didl, "<upnp:album>Best</upnp:album>"));
    CHECK(contains(didl, "s.mp3?a=1&amp;b=2</res>"));
  }
}

} // namespace control
} // namespace roomcast
