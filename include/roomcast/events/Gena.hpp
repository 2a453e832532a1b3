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

#include <roomcast/events/Channel.hpp>
#include <roomcast/http/Message.hpp>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>

namespace roomcast
{
namespace events
{

// "/notify/192-168-1-10/AVTransport": unique per device and channel
inline std::string callbackPath(const std::string& deviceIp, const Channel channel)
{
  auto ip = deviceIp;
  std::replace(ip.begin(), ip.end(), '.', '-');
  return "/notify/" + ip + "/" + name(channel);
}

inline std::string timeoutHeader(const std::chrono::seconds lease)
{
  return "Second-" + std::to_string(lease.count());
}

inline http::Request makeSubscribeRequest(const std::string& host,
                                          const std::string& eventPath,
                                          const std::string& callbackUrl,
                                          const std::chrono::seconds lease)
{
  http::Request request;
  request.method = "SUBSCRIBE";
  request.target = eventPath;
  request.headers.set("HOST", host);
  request.headers.set("CALLBACK", "<" + callbackUrl + ">");
  request.headers.set("NT", "upnp:event");
  request.headers.set("TIMEOUT", timeoutHeader(lease));
  request.headers.set("Connection", "close");
  return request;
}

inline http::Request makeRenewRequest(const std::string& host,
                                      const std::string& eventPath,
                                      const std::string& subscriptionId,
                                      const std::chrono::seconds lease)
{
  http::Request request;
  request.method = "SUBSCRIBE";
  request.target = eventPath;
  request.headers.set("HOST", host);
  request.headers.set("SID", subscriptionId);
  request.headers.set("TIMEOUT", timeoutHeader(lease));
  request.headers.set("Connection", "close");
  return request;
}

inline http::Request makeUnsubscribeRequest(const std::string& host,
                                            const std::string& eventPath,
                                            const std::string& subscriptionId)
{
  http::Request request;
  request.method = "UNSUBSCRIBE";
  request.target = eventPath;
  request.headers.set("HOST", host);
  request.headers.set("SID", subscriptionId);
  request.headers.set("Connection", "close");
  return request;
}

// Parses "Second-1800". Returns nullopt for "infinite" and anything
// unparsable.
inline std::optional<std::chrono::seconds> parseTimeout(const std::string& header)
{
  const auto text = http::trim(header);
  if (text.size() <= 7 || !http::iequals(text.substr(0, 7), "Second-"))
  {
    return std::nullopt;
  }
  const auto number = text.substr(7);
  char* pEnd = nullptr;
  const auto seconds = std::strtol(number.c_str(), &pEnd, 10);
  if (*pEnd != '\0' || seconds <= 0)
  {
    return std::nullopt;
  }
  return std::chrono::seconds{seconds};
}

// Renewal happens margin before the lease ends, but never sooner than
// minDelay from now
inline std::chrono::seconds renewalDelay(const std::chrono::seconds lease,
                                         const std::chrono::seconds margin,
                                         const std::chrono::seconds minDelay)
{
  return std::max(lease - margin, minDelay);
}

} // namespace events
} // namespace roomcast
