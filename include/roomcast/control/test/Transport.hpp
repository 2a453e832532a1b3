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

#include <roomcast/control/Errors.hpp>
#include <roomcast/http/Message.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace roomcast
{
namespace control
{
namespace test
{

// Scripted transport. Every send() is recorded and answered by the next
// queued reply; with no reply queued it answers 200 with an empty body.
struct Transport
{
  struct Call
  {
    std::string host;
    std::uint16_t port;
    http::Request request;
    std::chrono::milliseconds timeout;
  };

  using Reply = std::function<http::Response(const Call&)>;

  http::Response send(const std::string& host,
                      const std::uint16_t port,
                      const http::Request& request,
                      const std::chrono::milliseconds timeout)
  {
    Reply reply;
    Call call{host, port, request, timeout};
    {
      std::lock_guard<std::mutex> lock(mMutex);
      calls.push_back(call);
      if (!replies.empty())
      {
        reply = std::move(replies.front());
        replies.pop_front();
      }
    }
    return reply ? reply(call) : http::makeResponse(200);
  }

  void respond(http::Response response)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    replies.push_back([response](const Call&) { return response; });
  }

  void respond(const int status, std::string body = {})
  {
    respond(http::makeResponse(status, std::move(body)));
  }

  // Answers the next call with whatever the function returns or throws
  void respondWith(Reply reply)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    replies.push_back(std::move(reply));
  }

  void failUnreachable()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    replies.push_back([](const Call& call) -> http::Response
                      { throw DeviceUnreachable{call.host, "connection refused"}; });
  }

  void failTimeout()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    replies.push_back([](const Call& call) -> http::Response
                      { throw DeviceTimeout{call.host}; });
  }

  std::vector<Call> sent() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return calls;
  }

  mutable std::mutex mMutex;
  std::vector<Call> calls;
  std::deque<Reply> replies;
};

inline std::string soapResponse(const std::string& action,
                                const std::string& serviceUrn,
                                const std::string& content)
{
  return "<?xml version=\"1.0\"?><s:Envelope "
         "xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
         "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\"><s:Body><u:"
         + action + "Response xmlns:u=\"" + serviceUrn + "\">" + content + "</u:" + action
         + "Response></s:Body></s:Envelope>";
}

inline http::Response soapFault(const int errorCode)
{
  return http::makeResponse(
    500,
    "<?xml version=\"1.0\"?><s:Envelope "
    "xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\"><s:Body><s:Fault>"
    "<faultcode>s:Client</faultcode><faultstring>UPnPError</faultstring><detail>"
    "<UPnPError xmlns=\"urn:schemas-upnp-org:control-1-0\"><errorCode>"
      + std::to_string(errorCode)
      + "</errorCode></UPnPError></detail></s:Fault></s:Body></s:Envelope>");
}

} // namespace test
} // namespace control
} // namespace roomcast
