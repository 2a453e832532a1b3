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

#include <roomcast/control/Envelope.hpp>
#include <roomcast/control/Services.hpp>
#include <roomcast/control/test/Transport.hpp>
#include <roomcast/test/CatchWrapper.hpp>

namespace roomcast
{
namespace control
{

TEST_CASE("Envelope | Shape", "[Envelope]")
{
  const auto envelope = makeEnvelope(kAvTransport.urn,
                                     "SetAVTransportURI",
                                     {{"InstanceID", "0"},
                                      {"CurrentURI", "x-rincon-mp3radio://h/a?b=1&c=2"},
                                      {"CurrentURIMetaData", "<DIDL-Lite a=\"'\"/>"}});

  CHECK(envelope.compare(0, 5, "<?xml") == 0);
  CHECK(envelope.find('\n') == std::string::npos);
  CHECK(envelope.find("s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\"")
        != std::string::npos);
  CHECK(envelope.find("<u:SetAVTransportURI xmlns:u=\"urn:schemas-upnp-org:service:"
                      "AVTransport:1\">")
        != std::string::npos);

  const auto instance = envelope.find("<InstanceID>0</InstanceID>");
  const auto uri = envelope.find("<CurrentURI>x-rincon-mp3radio://h/a?b=1&amp;c=2</CurrentURI>");
  const auto metadata = envelope.find(
    "<CurrentURIMetaData>&lt;DIDL-Lite a=&quot;&apos;&quot;/&gt;</CurrentURIMetaData>");
  REQUIRE(instance != std::string::npos);
  REQUIRE(uri != std::string::npos);
  REQUIRE(metadata != std::string::npos);
  CHECK(instance < uri);
  CHECK(uri < metadata);
}

TEST_CASE("Envelope | ControlRequest", "[Envelope]")
{
  const auto request = makeControlRequest("192.168.1.10:1400",
                                          kGroupRenderingControl.controlPath,
                                          kGroupRenderingControl.urn,
                                          "SetGroupVolume",
                                          {{"InstanceID", "0"}, {"DesiredVolume", "30"}});
  CHECK("POST" == request.method);
  CHECK("/MediaRenderer/GroupRenderingControl/Control" == request.target);
  CHECK("text/xml; charset=\"utf-8\"" == *request.headers.get("Content-Type"));
  CHECK("\"urn:schemas-upnp-org:service:GroupRenderingControl:1#SetGroupVolume\""
        == *request.headers.get("SOAPACTION"));
  CHECK(std::to_string(request.body.size()) == *request.headers.get("content-length"));
}

TEST_CASE("Envelope | Fault", "[Envelope]")
{
  SECTION("UpnpErrorCode")
  {
    const auto fault = parseFault(test::soapFault(701).body);
    REQUIRE(fault);
    CHECK(701 == fault->code);
    CHECK("UPnPError" == fault->message);
  }

  SECTION("Description")
  {
    const auto fault = parseFault(
      "<s:Envelope><s:Body><s:Fault><faultcode>s:Client</faultcode>"
      "<faultstring>UPnPError</faultstring><detail><UPnPError><errorCode>714</errorCode>"
      "<errorDescription>Illegal MIME-type</errorDescription></UPnPError></detail>"
      "</s:Fault></s:Body></s:Envelope>");
    REQUIRE(fault);
    CHECK(714 == fault->code);
    CHECK("Illegal MIME-type" == fault->message);
  }

  SECTION("WithoutCode")
  {
    const auto fault = parseFault(
      "<soap:Envelope><soap:Body><soap:Fault><faultstring>Bad &amp; worse</faultstring>"
      "</soap:Fault></soap:Body></soap:Envelope>");
    REQUIRE(fault);
    CHECK(0 == fault->code);
    CHECK("Bad & worse" == fault->message);
  }

  SECTION("NoFault")
  {
    CHECK(!parseFault(test::soapResponse("Play", kAvTransport.urn, "")));
  }
}

TEST_CASE("Envelope | ResponseValue", "[Envelope]")
{
  const auto body = test::soapResponse("GetGroupVolume",
                                       kGroupRenderingControl.urn,
                                       "<CurrentVolume>42</CurrentVolume>"
                                       "<CurrentVolume>7</CurrentVolume>");
  CHECK(std::optional<std::string>{"42"} == responseValue(body, "CurrentVolume"));
  CHECK(!responseValue(body, "CurrentMute"));

  SECTION("NamespacePrefixIgnored")
  {
    CHECK(std::optional<std::string>{"1"}
          == responseValue("<r><x:CurrentMute>1</x:CurrentMute></r>", "CurrentMute"));
  }

  SECTION("UnescapedOnce")
  {
    CHECK(std::optional<std::string>{"<a b=\"&lt;\"/>"}
          == responseValue("<v>&lt;a b=&quot;&amp;lt;&quot;/&gt;</v>", "v"));
  }
}

} // namespace control
} // namespace roomcast
