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


#pragma once

#include <roomcast/http/Message.hpp>
#include <roomcast/relay/Codec.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace roomcast
{
namespace engine
{

enum class RouteKind
{
  Notify,
  LiveStream,
  Ingest,
  IssueToken,
  Health,
  MethodNotAllowed,
  NotFound
};

struct Route
{
  RouteKind kind;
  std::string streamId;
  // Ingest token from the query, empty if absent
  std::string token;
};

// Letters, digits and "-_.", not starting with a dot
inline bool isValidStreamId(const std::string& id)
{
  return !id.empty() && id.size() <= 64 && id.front() != '.'
         && std::all_of(id.begin(),
                        id.end(),
                        [](const char c)
                        {
                          return std::isalnum(static_cast<unsigned char>(c)) || c == '-'
                                 || c == '_' || c == '.';
                        });
}

inline std::string liveStreamPath(const std::string& streamId,
                                  const relay::Codec codec = relay::Codec::Mp3)
{
  return "/streams/" + streamId + "/live" + relay::fileExtension(codec);
}

inline std::string ingestPath(const std::string& streamId)
{
  return "/ingest/" + streamId;
}

namespace detail
{

inline bool startsWith(const std::string& text, const std::string& prefix)
{
  return text.compare(0, prefix.size(), prefix) == 0;
}

inline Route withMethod(const http::Request& request,
                        const char* method,
                        RouteKind kind,
                        std::string streamId = {})
{
  if (request.method != method)
  {
    return {RouteKind::MethodNotAllowed, {}, {}};
  }
  return {kind, std::move(streamId), {}};
}

} // namespace detail

// Maps a request onto the endpoint serving it:
//   NOTIFY /notify/...               event callbacks
//   GET    /streams/<id>/live[.mp3|.aac|.flac|.wav]
//   GET    /ingest/<id>?token=...    WebSocket upgrade
//   POST   /streams/<id>/token
//   GET    /health
inline Route route(const http::Request& request)
{
  const auto target = http::splitTarget(request.target);
  const auto& path = target.path;

  if (detail::startsWith(path, "/notify/"))
  {
    return detail::withMethod(request, "NOTIFY", RouteKind::Notify);
  }
  if (path == "/health")
  {
    return detail::withMethod(request, "GET", RouteKind::Health);
  }
  if (detail::startsWith(path, "/ingest/"))
  {
    const auto id = path.substr(8);
    if (!isValidStreamId(id))
    {
      return {RouteKind::NotFound, {}, {}};
    }
    auto result = detail::withMethod(request, "GET", RouteKind::Ingest, id);
    result.token = http::queryParameter(target.query, "token").value_or("");
    return result;
  }
  if (detail::startsWith(path, "/streams/"))
  {
    const auto slash = path.find('/', 9);
    if (slash == std::string::npos)
    {
      return {RouteKind::NotFound, {}, {}};
    }
    const auto id = path.substr(9, slash - 9);
    const auto rest = path.substr(slash);
    if (!isValidStreamId(id))
    {
      return {RouteKind::NotFound, {}, {}};
    }
    if (rest == "/live" || rest == "/live.mp3" || rest == "/live.aac" || rest == "/live.flac"
        || rest == "/live.wav")
    {
      return detail::withMethod(request, "GET", RouteKind::LiveStream, id);
    }
    if (rest == "/token")
    {
      return detail::withMethod(request, "POST", RouteKind::IssueToken, id);
    }
  }
  return {RouteKind::NotFound, {}, {}};
}

// Content type of a live stream, from the suffix of the requested path
inline const char* liveContentType(const std::string& target)
{
  const auto path = http::splitTarget(target).path;
  for (const auto codec : {relay::Codec::Aac, relay::Codec::Flac, relay::Codec::Wav})
  {
    const auto suffix = relay::fileExtension(codec);
    if (path.size() >= suffix.size()
        && path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0)
    {
      return relay::contentType(codec);
    }
  }
  return relay::contentType(relay::Codec::Mp3);
}

} // namespace engine
} // namespace roomcast
