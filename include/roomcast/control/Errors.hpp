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

#include <stdexcept>
#include <string>

namespace roomcast
{
namespace control
{

// Failure to exchange a request with a device at the transport level
struct NetworkError : std::runtime_error
{
  NetworkError(const std::string& what, std::string ip)
    : std::runtime_error(what)
    , deviceIp(std::move(ip))
  {
  }

  std::string deviceIp;
};

// Connection refused, host unreachable, reset before a response arrived
struct DeviceUnreachable : NetworkError
{
  DeviceUnreachable(const std::string& ip, const std::string& reason)
    : NetworkError("device " + ip + " unreachable: " + reason, ip)
  {
  }
};

// No complete response within the request timeout
struct DeviceTimeout : NetworkError
{
  DeviceTimeout(const std::string& ip)
    : NetworkError("device " + ip + " timed out", ip)
  {
  }
};

// The device answered, but with an HTTP error or a protocol fault. faultCode
// is the UPnP error code from the fault detail, or 0 if the response
// carried none.
struct DeviceProtocolError : std::runtime_error
{
  // UPnP AVTransport codes a device reports while it is busy changing state
  static constexpr int kTransitionNotAvailable = 701;
  static constexpr int kIllegalSeekTarget = 714;
  static constexpr int kResourceNotFound = 716;

  DeviceProtocolError(const int status, const int code, const std::string& message)
    : std::runtime_error(describe(status, code, message))
    , httpStatus(status)
    , faultCode(code)
    , faultMessage(message)
  {
  }

  bool isTransient() const
  {
    return faultCode == kTransitionNotAvailable || faultCode == kIllegalSeekTarget
           || faultCode == kResourceNotFound;
  }

  int httpStatus;
  int faultCode;
  std::string faultMessage;

private:
  static std::string describe(const int status, const int code, const std::string& message)
  {
    auto text = "device returned HTTP " + std::to_string(status);
    if (code != 0)
    {
      text += ", fault " + std::to_string(code);
    }
    if (!message.empty())
    {
      text += ": " + message;
    }
    return text;
  }
};

} // namespace control
} // namespace roomcast
