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
#include <roomcast/control/test/Transport.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/topology/Resolver.hpp>
#include <roomcast/util/Log.hpp>
#include <roomcast/xml/Scanner.hpp>

namespace roomcast
{
namespace topology
{
namespace
{

using TestClient = control::Client<control::test::Transport, util::NullLog>;
using Devices = std::vector<discovery::DiscoveredDevice>;

std::string zoneGroupStateResponse(const std::string& coordinator, const std::string& ip)
{
  const auto state = "<ZoneGroupState><ZoneGroups><ZoneGroup Coordinator=\"" + coordinator
                     + "\" ID=\"" + coordinator + ":1\"><ZoneGroupMember UUID=\""
                     + coordinator + "\" Location=\"http://" + ip
                     + ":1400/xml/device_description.xml\" ZoneName=\"Kitchen\"/>"
                       "</ZoneGroup></ZoneGroups></ZoneGroupState>";
  return control::test::soapResponse("GetZoneGroupState",
                                     control::kZoneGroupTopology.urn,
                                     "<ZoneGroupState>" + xml::escape(state)
                                       + "</ZoneGroupState>");
}

struct Fixture
{
  control::test::Transport transport;
  TestClient client{transport, {}, {}, [](std::chrono::milliseconds) {}};
  Devices devices;
  int numLookups = 0;
  Resolver<TestClient, util::NullLog> resolver{client,
                                               [this]
                                               {
                                                 ++numLookups;
                                                 return devices;
                                               },
                                               {}};
};

} // namespace

TEST_CASE("Resolver | ExplicitDevice", "[Resolver]")
{
  Fixture fixture;
  fixture.transport.respond(200, zoneGroupStateResponse("RINCON_K", "192.168.1.10"));

  const auto groups = fixture.resolver.getGroups(std::string{"192.168.1.10"});
  REQUIRE(1 == groups.size());
  CHECK("RINCON_K" == groups[0].coordinatorUuid);
  CHECK(0 == fixture.numLookups);
  CHECK(groups == fixture.resolver.groups());

  const auto calls = fixture.transport.sent();
  REQUIRE(1 == calls.size());
  CHECK("192.168.1.10" == calls[0].host);
  CHECK("/ZoneGroupTopology/Control" == calls[0].request.target);
  CHECK(fixture.resolver.findGroup("RINCON_K"));
  CHECK(!fixture.resolver.findGroup("RINCON_X"));
}

TEST_CASE("Resolver | NoDevicesAvailable", "[Resolver]")
{
  Fixture fixture;
  CHECK_THROWS_AS(fixture.resolver.getGroups(), NoDevicesAvailable);
  CHECK(fixture.transport.sent().empty());
}

TEST_CASE("Resolver | TriesDiscoveredDevicesInOrder", "[Resolver]")
{
  Fixture fixture;
  fixture.devices = {{"RINCON_A", "192.168.1.10", "http://192.168.1.10:1400/x.xml"},
                     {"RINCON_B", "192.168.1.11", "http://192.168.1.11:1400/x.xml"}};
  fixture.transport.failUnreachable();
  fixture.transport.respond(200, zoneGroupStateResponse("RINCON_B", "192.168.1.11"));

  const auto groups = fixture.resolver.getGroups();
  REQUIRE(1 == groups.size());
  CHECK("192.168.1.11" == groups[0].coordinatorIp);

  const auto calls = fixture.transport.sent();
  REQUIRE(2 == calls.size());
  CHECK("192.168.1.10" == calls[0].host);
  CHECK("192.168.1.11" == calls[1].host);
}

TEST_CASE("Resolver | LastErrorWhenNoDeviceAnswers", "[Resolver]")
{
  Fixture fixture;
  fixture.devices = {{"RINCON_A", "192.168.1.10", "http://192.168.1.10:1400/x.xml"},
                     {"RINCON_B", "192.168.1.11", "http://192.168.1.11:1400/x.xml"}};
  fixture.transport.failUnreachable();
  fixture.transport.respond(control::test::soapFault(402));

  CHECK_THROWS_AS(fixture.resolver.getGroups(), control::DeviceProtocolError);
}

TEST_CASE("Resolver | GroupSetIsReplaced", "[Resolver]")
{
  Fixture fixture;
  fixture.transport.respond(200, zoneGroupStateResponse("RINCON_K", "192.168.1.10"));
  fixture.transport.respond(200, zoneGroupStateResponse("RINCON_O", "192.168.1.20"));

  fixture.resolver.getGroups(std::string{"192.168.1.10"});
  fixture.resolver.getGroups(std::string{"192.168.1.10"});

  const auto groups = fixture.resolver.groups();
  REQUIRE(1 == groups.size());
  CHECK("RINCON_O" == groups[0].id);
}

TEST_CASE("Resolver | FailedFetchKeepsPreviousGroups", "[Resolver]")
{
  Fixture fixture;
  fixture.transport.respond(200, zoneGroupStateResponse("RINCON_K", "192.168.1.10"));
  fixture.transport.respond(200, "<s:Envelope><s:Body></s:Body></s:Envelope>");

  fixture.resolver.getGroups(std::string{"192.168.1.10"});
  CHECK_THROWS_AS(fixture.resolver.getGroups(std::string{"192.168.1.10"}),
                  control::DeviceProtocolError);
  CHECK(1 == fixture.resolver.groups().size());
}

} // namespace topology
} // namespace roomcast
