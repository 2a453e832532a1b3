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

#include <roomcast/events/Gena.hpp>
#include <roomcast/test/CatchWrapper.hpp>

namespace roomcast
{
namespace events
{

TEST_CASE("Gena | CallbackPath", "[Gena]")
{
  CHECK("/notify/192-168-1-10/AVTransport" == callbackPath("192.168.1.10", Channel::AVTransport));
  CHECK("/notify/10-0-0-2/ZoneGroupTopology"
        == callbackPath("10.0.0.2", Channel::ZoneGroupTopology));
}

TEST_CASE("Gena | SubscribeRequest", "[Gena]")
{
  const auto request = makeSubscribeRequest("192.168.1.10:1400",
                                            "/MediaRenderer/AVTransport/Event",
                                            "http://192.168.1.5:3400/notify/x/AVTransport",
                                            std::chrono::seconds{3600});
  CHECK("SUBSCRIBE" == request.method);
  CHECK("/MediaRenderer/AVTransport/Event" == request.target);
  CHECK(std::optional<std::string>{"<http://192.168.1.5:3400/notify/x/AVTransport>"}
        == request.headers.get("CALLBACK"));
  CHECK(std::optional<std::string>{"upnp:event"} == request.headers.get("NT"));
  CHECK(std::optional<std::string>{"Second-3600"} == request.headers.get("TIMEOUT"));
  CHECK(!request.headers.contains("SID"));
}

TEST_CASE("Gena | RenewAndUnsubscribe", "[Gena]")
{
  const auto renew = makeRenewRequest("h:1400", "/e", "uuid:sub-1", std::chrono::seconds{60});
  CHECK("SUBSCRIBE" == renew.method);
  CHECK(std::optional<std::string>{"uuid:sub-1"} == renew.headers.get("SID"));
  CHECK(!renew.headers.contains("CALLBACK"));
  CHECK(!renew.headers.contains("NT"));

  const auto unsubscribe = makeUnsubscribeRequest("h:1400", "/e", "uuid:sub-1");
  CHECK("UNSUBSCRIBE" == unsubscribe.method);
  CHECK(std::optional<std::string>{"uuid:sub-1"} == unsubscribe.headers.get("SID"));
  CHECK(!unsubscribe.headers.contains("TIMEOUT"));
}

TEST_CASE("Gena | ParseTimeout", "[Gena]")
{
  CHECK(std::optional<std::chrono::seconds>{1800} == parseTimeout("Second-1800"));
  CHECK(std::optional<std::chrono::seconds>{86400} == parseTimeout(" second-86400 "));
  CHECK(!parseTimeout("infinite"));
  CHECK(!parseTimeout("Second-"));
  CHECK(!parseTimeout("Second-12x"));
  CHECK(!parseTimeout("Second-0"));
}

TEST_CASE("Gena | RenewalDelay", "[Gena]")
{
  using std::chrono::seconds;
  CHECK(seconds{3300} == renewalDelay(seconds{3600}, seconds{300}, seconds{60}));
  CHECK(seconds{60} == renewalDelay(seconds{200}, seconds{300}, seconds{60}));
}

} // namespace events
} // namespace roomcast
