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
#include <roomcast/xml/Scanner.hpp>

namespace roomcast
{
namespace xml
{

TEST_CASE("Scanner | Escaping", "[Scanner]")
{
  CHECK("a &amp; b &lt;c&gt; &quot;d&quot; &apos;e&apos;" == escape("a & b <c> \"d\" 'e'"));
  CHECK("a & b <c> \"d\" 'e'" == unescape("a &amp; b &lt;c&gt; &quot;d&quot; &apos;e&apos;"));
  CHECK("&lt;" == unescape("&amp;lt;"));
  CHECK("caf\xc3\xa9 \xe2\x82\xac" == unescape("caf&#233; &#x20AC;"));
  CHECK("plain" == unescape("plain"));
}

TEST_CASE("Scanner | ElementText", "[Scanner]")
{
  const std::string doc =
    "<s:Envelope><s:Body><u:GetVolumeResponse>"
    "<CurrentVolume>42</CurrentVolume><Empty/><Meta>&lt;DIDL&gt;</Meta>"
    "</u:GetVolumeResponse></s:Body></s:Envelope>";

  CHECK(std::optional<std::string>{"42"} == elementText(doc, "CurrentVolume"));
  CHECK(std::optional<std::string>{""} == elementText(doc, "Empty"));
  CHECK(std::optional<std::string>{"&lt;DIDL&gt;"} == elementText(doc, "Meta"));
  CHECK(!elementText(doc, "Missing"));
  CHECK(!elementText("<Open>no end", "Open"));
  CHECK(std::optional<std::string>{"<CurrentVolume>42</CurrentVolume><Empty/><Meta>&lt;DIDL&gt;</Meta>"}
        == elementText(doc, "GetVolumeResponse"));

  SECTION("DuplicateTagsFirstWins")
  {
    CHECK(std::optional<std::string>{"x"} == elementText("<a><b>x</b><b>y</b></a>", "b"));
  }

  SECTION("NestedSameNameEndsAtFirstClose")
  {
    CHECK(std::optional<std::string>{"<g>in"} == elementText("<g><g>in</g>tail</g>", "g"));
  }
}

TEST_CASE("Scanner | Attributes", "[Scanner]")
{
  const std::string doc =
    R"(<Event><TransportState val="PLAYING"/><Volume channel='Master' val="12"/>)"
    R"(<Title val="Rock &amp; Roll"/></Event>)";

  CHECK(std::optional<std::string>{"PLAYING"} == attribute(doc, "TransportState", "val"));
  CHECK(std::optional<std::string>{"Master"} == attribute(doc, "Volume", "channel"));
  CHECK(std::optional<std::string>{"Rock & Roll"} == attribute(doc, "Title", "val"));
  CHECK(!attribute(doc, "Volume", "missing"));
  CHECK(!attribute(doc, "Missing", "val"));

  const auto attributes = parseAttributes(R"(<Volume channel="LF" val = "3">)");
  REQUIRE(2 == attributes.size());
  CHECK("channel" == attributes[0].first);
  CHECK("3" == attributes[1].second);
}

TEST_CASE("Scanner | Elements", "[Scanner]")
{
  const std::string doc = "<ZoneGroups>"
                          R"(<ZoneGroup Coordinator="A"><ZoneGroupMember UUID="A"/>)"
                          R"(<ZoneGroupMember UUID="B"></ZoneGroupMember></ZoneGroup>)"
                          R"(<ZoneGroup Coordinator="C"><ZoneGroupMember UUID="C"/></ZoneGroup>)"
                          "</ZoneGroups>";

  const auto groups = elements(doc, "ZoneGroup");
  REQUIRE(2 == groups.size());
  CHECK(std::optional<std::string>{"A"} == groups[0].attribute("Coordinator"));
  CHECK(std::optional<std::string>{"C"} == groups[1].attribute("Coordinator"));

  const auto members = elements(groups[0].content, "ZoneGroupMember");
  REQUIRE(2 == members.size());
  CHECK(std::optional<std::string>{"B"} == members[1].attribute("UUID"));
  CHECK(members[0].content.empty());

  CHECK(elements(doc, "Missing").empty());
}

} // namespace xml
} // namespace roomcast
