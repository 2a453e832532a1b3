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

#include <roomcast/engine/Routes.hpp>
#include <roomcast/test/CatchWrapper.hpp>

namespace roomcast
{
namespace engine
{
namespace
{

http::Request request(std::string method, std::string target)
{
  http::Request result;
  result.method = std::move(method);
  result.target = std::move(target);
  return result;
}

} // namespace

TEST_CASE("Routes | Endpoints", "[Routes]")
{
  CHECK(RouteKind::Notify == route(request("NOTIFY", "/notify/192-168-1-10/AVTransport")).kind);
  CHECK(RouteKind::Health == route(request("GET", "/health")).kind);

  for (const auto* target : {"/streams/s1/live",
                             "/streams/s1/live.mp3",
                             "/streams/s1/live.aac",
                             "/streams/s1/live.flac",
                             "/streams/s1/live.wav"})
  {
    const auto live = route(request("GET", target));
    CHECK(RouteKind::LiveStream == live.kind);
    CHECK("s1" == live.streamId);
  }

  const auto ingest = route(request("GET", "/ingest/tab-42?token=123.abc"));
  CHECK(RouteKind::Ingest == ingest.kind);
  CHECK("tab-42" == ingest.streamId);
  CHECK("123.abc" == ingest.token);
  CHECK(route(request("GET", "/ingest/tab-42")).token.empty());

  const auto token = route(request("POST", "/streams/s1/token"));
  CHECK(RouteKind::IssueToken == token.kind);
  CHECK("s1" == token.streamId);
}

TEST_CASE("Routes | Rejections", "[Routes]")
{
  CHECK(RouteKind::MethodNotAllowed == route(request("GET", "/notify/x")).kind);
  CHECK(RouteKind::MethodNotAllowed == route(request("POST", "/streams/s1/live")).kind);
  CHECK(RouteKind::MethodNotAllowed == route(request("GET", "/streams/s1/token")).kind);
  CHECK(RouteKind::NotFound == route(request("GET", "/")).kind);
  CHECK(RouteKind::NotFound == route(request("GET", "/streams/s1")).kind);
  CHECK(RouteKind::NotFound == route(request("GET", "/streams/s1/other")).kind);
  CHECK(RouteKind::NotFound == route(request("GET", "/ingest/")).kind);
  CHECK(RouteKind::NotFound == route(request("GET", "/ingest/a%2Fb")).kind);
  CHECK(RouteKind::NotFound == route(request("GET", "/streams/../live")).kind);
}

TEST_CASE("Routes | Helpers", "[Routes]")
{
  CHECK(isValidStreamId("Tab_1.mp3-x"));
  CHECK(!isValidStreamId(""));
  CHECK(!isValidStreamId(std::string(65, 'a')));
  CHECK(!isValidStreamId("a b"));
  CHECK(!isValidStreamId(".hidden"));
  CHECK("/streams/s1/live.mp3" == liveStreamPath("s1"));
  CHECK("/streams/s1/live.flac" == liveStreamPath("s1", relay::Codec::Flac));
  CHECK(std::string{"audio/flac"} == liveContentType("/streams/s1/live.flac"));
  CHECK(std::string{"audio/wav"} == liveContentType("/streams/s1/live.wav"));
  CHECK("/ingest/s1" == ingestPath("s1"));
  CHECK(std::string{"audio/aac"} == liveContentType("/streams/s1/live.aac?x=1"));
  CHECK(std::string{"audio/mpeg"} == liveContentType("/streams/s1/live"));
}

} // namespace engine
} // namespace roomcast
