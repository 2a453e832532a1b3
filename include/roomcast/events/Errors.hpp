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
#include <stdexcept>
#include <string>

namespace roomcast
{
namespace events
{

// The device refused a subscription or the callback listener is not up.
// status is the HTTP status of the refusal, 0 if no request was made.
struct SubscriptionFailed : std::runtime_error
{
  SubscriptionFailed(const std::string& ip,
                     const Channel channel,
                     const int statusCode,
                     const std::string& reason)
    : std::runtime_error("subscribing to " + std::string(name(channel)) + " on " + ip
                         + " failed: " + reason)
    , deviceIp(ip)
    , status(statusCode)
  {
  }

  std::string deviceIp;
  int status;
};

// The device accepted a subscription without telling its id
struct MissingSubscriptionId : std::runtime_error
{
  MissingSubscriptionId(const std::string& ip)
    : std::runtime_error("subscription response from " + ip + " without SID")
  {
  }
};

struct SubscriptionNotFound : std::runtime_error
{
  SubscriptionNotFound(const std::string& id)
    : std::runtime_error("unknown subscription " + id)
    , subscriptionId(id)
  {
  }

  std::string subscriptionId;
};

} // namespace events
} // namespace roomcast
