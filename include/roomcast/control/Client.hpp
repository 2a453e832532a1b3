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

#include <roomcast/control/Envelope.hpp>
#include <roomcast/control/Errors.hpp>
#include <roomcast/control/Services.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace roomcast
{
namespace control
{

struct Settings
{
  std::uint16_t port = kDevicePort;
  std::chrono::milliseconds requestTimeout{10000};
  // Pause before each retry of a transient failure
  std::vector<std::chrono::milliseconds> retryDelays{std::chrono::milliseconds{200},
                                                     std::chrono::milliseconds{500},
                                                     std::chrono::milliseconds{1000}};
};

// Device-control client. Transport must provide
//   http::Response send(const std::string& host, std::uint16_t port,
//                       const http::Request&, std::chrono::milliseconds timeout)
// throwing DeviceUnreachable or DeviceTimeout.
template <typename Transport, typename Log>
class Client
{
public:
  using Sleep = std::function<void(std::chrono::milliseconds)>;

  Client(Transport& transport, Log log, Settings settings = {}, Sleep sleep = {})
    : mTransport(transport)
    , mLog(channel(log, "control"))
    , mSettings(std::move(settings))
    , mSleep(sleep ? std::move(sleep)
                   : [](const std::chrono::milliseconds delay)
                   { std::this_thread::sleep_for(delay); })
  {
  }

  // Sends one action and returns the raw response body.
  // Throws DeviceUnreachable, DeviceTimeout, DeviceProtocolError.
  std::string send(const std::string& deviceIp,
                   const std::string& controlPath,
                   const std::string& serviceUrn,
                   const std::string& action,
                   const Params& params)
  {
    const auto request = makeControlRequest(
      deviceIp + ":" + std::to_string(mSettings.port), controlPath, serviceUrn, action, params);

    debug(mLog) << action << " -> " << deviceIp;
    const auto response =
      mTransport.send(deviceIp, mSettings.port, request, mSettings.requestTimeout);

    // Devices report faults with HTTP 500, but a fault body is a fault
    // whatever the status says
    if (const auto fault = parseFault(response.body))
    {
      throw DeviceProtocolError{response.status, fault->code, fault->message};
    }
    if (!response.ok())
    {
      throw DeviceProtocolError{response.status, 0, response.reason};
    }
    return response.body;
  }

  std::string send(const std::string& deviceIp,
                   const Service& service,
                   const std::string& action,
                   const Params& params)
  {
    return send(deviceIp, service.controlPath, service.urn, action, params);
  }

  // Like send(), but transient faults and timeouts are retried after each
  // of the configured delays. Any other failure propagates immediately.
  std::string sendWithRetry(const std::string& deviceIp,
                            const std::string& controlPath,
                            const std::string& serviceUrn,
                            const std::string& action,
                            const Params& params)
  {
    for (std::size_t attempt = 0;; ++attempt)
    {
      const auto canRetry = attempt < mSettings.retryDelays.size();
      try
      {
        return send(deviceIp, controlPath, serviceUrn, action, params);
      }
      catch (const DeviceProtocolError& e)
      {
        if (!canRetry || !e.isTransient())
        {
          throw;
        }
        info(mLog) << action << " on " << deviceIp << " failed transiently (" << e.what()
                   << "), retrying";
      }
      catch (const DeviceTimeout& e)
      {
        if (!canRetry)
        {
          throw;
        }
        info(mLog) << e.what() << " during " << action << ", retrying";
      }
      mSleep(mSettings.retryDelays[attempt]);
    }
  }

  std::string sendWithRetry(const std::string& deviceIp,
                            const Service& service,
                            const std::string& action,
                            const Params& params)
  {
    return sendWithRetry(deviceIp, service.controlPath, service.urn, action, params);
  }

  const Settings& settings() const { return mSettings; }

  Log& log() { return mLog; }

private:
  Transport& mTransport;
  Log mLog;
  Settings mSettings;
  Sleep mSleep;
};

} // namespace control
} // namespace roomcast
