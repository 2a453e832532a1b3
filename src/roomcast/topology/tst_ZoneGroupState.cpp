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

#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/topology/ZoneGroupState.hpp>
#include <roomcast/util/Log.hpp>
#include <roomcast/util/test/Log.hpp>

namespace roomcast
{
namespace topology
{
namespace
{

std::string member(const std::string& uuid,
                   const std::string& ip,
                   const std::string& zoneName,
                   const std::string& extra = {})
{
  return "<ZoneGroupMember UUID=\"" + uuid + "\" Location=\"http://" + ip
         + ":1400/xml/device_description.xml\" ZoneName=\"" + zoneName + "\" " + extra
         + "/>";
}

std::string group(const std::string& coordinator, const std::string& members)
{
  return "<ZoneGroup Coordinator=\"" + coordinator + "\" ID=\"" + coordinator
         + ":1234567\">" + members + "</ZoneGroup>";
}

std::string zoneGroups(const std::string& groups)
{
  return "<ZoneGroupState><ZoneGroups>" + groups
         + "</ZoneGroups><VanishedDevices></VanishedDevices></ZoneGroupState>";
}

std::vector<Group> parse(const std::string& text)
{
  return parseZoneGroupState(text, util::NullLog{});
}

} // namespace

TEST_CASE("ZoneGroupState | SingleSpeaker", "[ZoneGroupState]")
{
  const auto groups = parse(zoneGroups(group(
    "RINCON_K", member("RINCON_K", "192.168.1.10", "Kitchen", "Icon=\"x-rincon-cpicon:sonos-one-g1\""))));

  REQUIRE(1 == groups.size());
  CHECK("RINCON_K" == groups[0].id);
  CHECK("Kitchen" == groups[0].displayName);
  CHECK("RINCON_K" == groups[0].coordinatorUuid);
  CHECK("192.168.1.10" == groups[0].coordinatorIp);
  REQUIRE(1 == groups[0].members.size());
  CHECK(DeviceMember{"RINCON_K", "192.168.1.10", "Kitchen", "one"} == groups[0].members[0]);
}

TEST_CASE("ZoneGroupState | GroupNames", "[ZoneGroupState]")
{
  SECTION("CoordinatorFirst")
  {
    const auto groups = parse(zoneGroups(group("RINCON_O",
                                               member("RINCON_K", "192.168.1.10", "Kitchen")
                                                 + member("RINCON_O", "192.168.1.20", "Office")
                                                 + member("RINCON_B", "192.168.1.30", "Bedroom"))));
    REQUIRE(1 == groups.size());
    CHECK("Office + Kitchen + Bedroom" == groups[0].displayName);
    CHECK("192.168.1.20" == groups[0].coordinatorIp);
  }

  SECTION("StereoPairNameOnce")
  {
    const auto groups =
      parse(zoneGroups(group("RINCON_L",
                             member("RINCON_L", "192.168.1.10", "Living Room")
                               + member("RINCON_R", "192.168.1.11", "Living Room"))));
    REQUIRE(1 == groups.size());
    CHECK("Living Room" == groups[0].displayName);
    CHECK(2 == groups[0].members.size());
  }
}

TEST_CASE("ZoneGroupState | HomeTheatreRoles", "[ZoneGroupState]")
{
  const auto map = "HTSatChanMapSet=\"RINCON_BAR:LF,RF;RINCON_SUB:SW;RINCON_SL:LR;"
                   "RINCON_SR:RR\" Icon=\"x-rincon-cpicon:sonos-arc\"";
  const auto satellites =
    "<Satellite UUID=\"RINCON_SUB\" Location=\"http://192.168.1.11:1400/x.xml\" "
    "ZoneName=\"Living Room\" Icon=\"x-rincon-cpicon:sonos-sub-g3\"/>"
    "<Satellite UUID=\"RINCON_SL\" Location=\"http://192.168.1.12:1400/x.xml\" "
    "ZoneName=\"Living Room\"/>"
    "<Satellite UUID=\"RINCON_SR\" Location=\"http://192.168.1.13:1400/x.xml\" "
    "ZoneName=\"Living Room\"/>";
  const auto doc = zoneGroups(
    "<ZoneGroup Coordinator=\"RINCON_BAR\" ID=\"RINCON_BAR:1\">"
    "<ZoneGroupMember UUID=\"RINCON_BAR\" Location=\"http://192.168.1.10:1400/x.xml\" "
    "ZoneName=\"Living Room\" "
    + std::string(map) + ">" + satellites + "</ZoneGroupMember></ZoneGroup>");

  const auto groups = parse(doc);
  REQUIRE(1 == groups.size());
  const auto& members = groups[0].members;
  REQUIRE(4 == members.size());
  CHECK("Soundbar" == members[0].modelLabel);
  CHECK("Subwoofer" == members[1].modelLabel);
  CHECK("Surround Left" == members[2].modelLabel);
  CHECK("Surround Right" == members[3].modelLabel);
  CHECK("Living Room" == groups[0].displayName);
}

TEST_CASE("ZoneGroupState | ModelLabels", "[ZoneGroupState]")
{
  CHECK(std::optional<std::string>{"one"} == modelFromIcon("x-rincon-cpicon:sonos-one-g1"));
  CHECK(std::optional<std::string>{"arc"} == modelFromIcon("x-rincon-cpicon:sonos-arc"));
  CHECK(!modelFromIcon("x-rincon-roomicon:living"));
  CHECK(std::optional<std::string>{"Left"} == channelRole("RINCON_A:LF;RINCON_B:RF", "RINCON_A"));
  CHECK(std::optional<std::string>{"Right"} == channelRole("RINCON_A:LF;RINCON_B:RF", "RINCON_B"));
  CHECK(!channelRole("RINCON_AB:LF", "RINCON_A"));

  const auto groups = parse(zoneGroups(group(
    "RINCON_K", member("RINCON_K", "192.168.1.10", "Kitchen", "Icon=\"x-rincon-roomicon:kitchen\""))));
  REQUIRE(1 == groups.size());
  CHECK("Speaker" == groups[0].members[0].modelLabel);
}

TEST_CASE("ZoneGroupState | IneligibleMembers", "[ZoneGroupState]")
{
  const auto doc = zoneGroups(
    group("RINCON_K",
          member("RINCON_K", "192.168.1.10", "Kitchen")
            + member("RINCON_BRIDGE", "192.168.1.2", "Bridge", "IsZoneBridge=\"1\"")
            + "<ZoneGroupMember UUID=\"RINCON_X\" ZoneName=\"Nowhere\"/>"
            + "<ZoneGroupMember UUID=\"RINCON_Y\" Location=\"http://192.168.1.3:1400/x.xml\"/>"
            + member("RINCON_K", "192.168.1.99", "Kitchen Copy"))
    + group("RINCON_BRIDGE", member("RINCON_BRIDGE", "192.168.1.2", "Bridge", "IsZoneBridge=\"1\"")));

  const auto groups = parse(doc);
  REQUIRE(1 == groups.size());
  REQUIRE(1 == groups[0].members.size());
  CHECK("192.168.1.10" == groups[0].members[0].ip);
  CHECK("Kitchen" == groups[0].displayName);
}

TEST_CASE("ZoneGroupState | DroppedGroups", "[ZoneGroupState]")
{
  util::test::CapturingLog log;
  const auto doc = zoneGroups(
    group("RINCON_GONE", member("RINCON_K", "192.168.1.10", "Kitchen"))
    + group("RINCON_OUTER",
            member("RINCON_OUTER", "192.168.1.40", "Outer")
              + group("RINCON_INNER", member("RINCON_INNER", "192.168.1.41", "Inner")))
    + "<ZoneGroup Coordinator=\"RINCON_EMPTY\" ID=\"RINCON_EMPTY:1\"></ZoneGroup>"
    + group("RINCON_O", member("RINCON_O", "192.168.1.20", "Office")));

  const auto groups = parseZoneGroupState(doc, log);
  REQUIRE(1 == groups.size());
  CHECK("RINCON_O" == groups[0].id);
  CHECK(log.contains("nested group"));
}

TEST_CASE("ZoneGroupState | Malformed", "[ZoneGroupState]")
{
  CHECK_THROWS_AS(parse("<html>not a zone group state</html>"), ParseError);
  CHECK(parse("<ZoneGroupState><ZoneGroups/></ZoneGroupState>").empty());
  CHECK(parse("<ZoneGroups></ZoneGroups>").empty());
}

} // namespace topology
} // namespace roomcast
