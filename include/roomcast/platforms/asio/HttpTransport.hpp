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
#include <roomcast/platforms/asio/TcpConnection.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace roomcast
{
namespace platforms
{
namespace asio
{

// One request per connection, bounded as a whole by the given timeout.
// Satisfies the transport requirements of control::Client and
// events::SubscriptionManager.
struct HttpTransport
{
  static constexpr std::size_t kMaxHeadSize = 16 * 1024;
  static constexpr std::size_t kMaxBodySize = 4 * 1024 * 1024;

  // Throws control::DeviceUnreachable, control::DeviceTimeout and
  // control::DeviceProtocolError for responses that cannot be parsed
  http::Response send(const std::string& host,
                      const std::uint16_t port,
                      const http::Request& request,
                      const std::chrono::milliseconds timeout)
  {
    ::asio::error_code ec;
    const auto address = ::asio::ip::make_address(host, ec);
    if (ec)
    {
      throw control::DeviceUnreachable{host, "not an IP address"};
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    try
    {
      auto connection = TcpConnection::connect({address, port}, timeout);
      connection.write(http::toString(request), TcpConnection::remaining(deadline));

      const auto head =
        connection.readUntil("\r\n\r\n", kMaxHeadSize, TcpConnection::remaining(deadline));
      if (!head)
      {
        throw control::DeviceTimeout{host};
      }
      auto response = http::parseResponseHead(*head);
      response.body = readBody(connection, response, host, deadline);
      return response;
    }
    catch (const ::asio::system_error& e)
    {
      if (e.code() == ::asio::error::timed_out)
      {
        throw control::DeviceTimeout{host};
      }
      throw control::DeviceUnreachable{host, e.what()};
    }
    catch (const http::ParseError& e)
    {
      throw control::DeviceProtocolError{0, 0, e.what()};
    }
  }

private:
  static std::string readBody(TcpConnection& connection,
                              const http::Response& response,
                              const std::string& host,
                              const std::chrono::steady_clock::time_point deadline)
  {
    std::optional<std::string> body;
    const auto contentLength = response.headers.get("Content-Length");
    const auto transferEncoding = response.headers.get("Transfer-Encoding");
    if (transferEncoding && http::toLower(*transferEncoding).find("chunked") != std::string::npos)
    {
      // Requests are sent with "Connection: close", so the decoded body
      // ends where the stream does
      body = connection.readToEnd(kMaxBodySize, TcpConnection::remaining(deadline));
      if (body)
      {
        body = http::decodeChunked(*body);
      }
    }
    else if (contentLength)
    {
      const auto length = std::strtoull(contentLength->c_str(), nullptr, 10);
      if (length > kMaxBodySize)
      {
        throw control::DeviceProtocolError{response.status, 0, "response body too large"};
      }
      body = connection.readExactly(
        static_cast<std::size_t>(length), TcpConnection::remaining(deadline));
    }
    else if (response.status == 204 || response.status == 304)
    {
      body = std::string{};
    }
    else
    {
      body = connection.readToEnd(kMaxBodySize, TcpConnection::remaining(deadline));
    }

    if (!body)
    {
      throw control::DeviceTimeout{host};
    }
    return std::move(*body);
  }
};

} // namespace asio
} // namespace platforms
} // namespace roomcast
