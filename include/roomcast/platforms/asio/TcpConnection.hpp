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

#include <roomcast/platforms/asio/AsioWrapper.hpp>
#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <sys/socket.h>

namespace roomcast
{
namespace platforms
{
namespace asio
{

// A TCP stream with its own io_context, used from one thread with blocking
// calls that are bounded by a timeout. Each call starts an asynchronous
// operation and runs the private io_context until the operation completes
// or the time is up, in which case the operation is cancelled.
class TcpConnection
{
public:
  using Duration = std::chrono::milliseconds;

  TcpConnection(std::unique_ptr<::asio::io_context> pIo, ::asio::ip::tcp::socket socket)
    : mpIo(std::move(pIo))
    , mSocket(std::move(socket))
  {
  }

  TcpConnection(const TcpConnection&) = delete;
  TcpConnection& operator=(const TcpConnection&) = delete;

  TcpConnection(TcpConnection&&) = default;

  ~TcpConnection()
  {
    if (mpIo)
    {
      close();
    }
  }

  // Throws asio::system_error, with asio::error::timed_out on timeout
  static TcpConnection connect(const ::asio::ip::tcp::endpoint& endpoint,
                               const Duration timeout)
  {
    auto pIo = std::make_unique<::asio::io_context>();
    auto socket = ::asio::ip::tcp::socket{*pIo};
    auto connection = TcpConnection{std::move(pIo), std::move(socket)};
    const auto result = connection.run(
      [&](auto handler) { connection.mSocket.async_connect(endpoint, handler); }, timeout);
    if (result.timedOut)
    {
      throw ::asio::system_error{::asio::error::make_error_code(::asio::error::timed_out)};
    }
    if (result.error)
    {
      throw ::asio::system_error{result.error};
    }
    ::asio::error_code ignored;
    connection.mSocket.set_option(::asio::ip::tcp::no_delay(true), ignored);
    return connection;
  }

  // Reads at most numBytes. Returns 0 at the end of the stream and nullopt
  // if nothing arrived within the timeout. Throws asio::system_error.
  std::optional<std::size_t> readSome(uint8_t* const pData,
                                      const std::size_t numBytes,
                                      const Duration timeout)
  {
    if (!mPending.empty())
    {
      const auto count = std::min(numBytes, mPending.size());
      std::copy(mPending.begin(), mPending.begin() + static_cast<std::ptrdiff_t>(count), pData);
      mPending.erase(0, count);
      return count;
    }

    const auto result = run(
      [&](auto handler)
      { mSocket.async_read_some(::asio::buffer(pData, numBytes), handler); },
      timeout);
    if (result.timedOut)
    {
      return std::nullopt;
    }
    if (result.error == ::asio::error::eof)
    {
      return std::size_t{0};
    }
    if (result.error)
    {
      throw ::asio::system_error{result.error};
    }
    return result.bytes;
  }

  // Reads until the delimiter and returns everything before it. Bytes
  // after the delimiter stay buffered for the next read. Returns nullopt on
  // timeout. Throws asio::system_error on errors, at the end of the stream
  // and when more than maxBytes arrive without a delimiter.
  std::optional<std::string> readUntil(const std::string& delimiter,
                                       const std::size_t maxBytes,
                                       const Duration timeout)
  {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string data = std::move(mPending);
    mPending.clear();
    while (true)
    {
      const auto found = data.find(delimiter);
      if (found != std::string::npos)
      {
        mPending = data.substr(found + delimiter.size());
        data.resize(found);
        return data;
      }
      if (data.size() > maxBytes)
      {
        throw ::asio::system_error{::asio::error::make_error_code(::asio::error::message_size)};
      }

      std::array<uint8_t, 4096> chunk;
      const auto count = readSome(chunk.data(), chunk.size(), remaining(deadline));
      if (!count)
      {
        mPending = std::move(data);
        return std::nullopt;
      }
      if (*count == 0)
      {
        throw ::asio::system_error{::asio::error::make_error_code(::asio::error::eof)};
      }
      data.append(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(*count));
    }
  }

  // Reads exactly numBytes. Returns nullopt on timeout.
  // Throws asio::system_error.
  std::optional<std::string> readExactly(const std::size_t numBytes, const Duration timeout)
  {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string data;
    data.reserve(numBytes);
    std::array<uint8_t, 4096> chunk;
    while (data.size() < numBytes)
    {
      const auto wanted = std::min(chunk.size(), numBytes - data.size());
      const auto count = readSome(chunk.data(), wanted, remaining(deadline));
      if (!count)
      {
        return std::nullopt;
      }
      if (*count == 0)
      {
        throw ::asio::system_error{::asio::error::make_error_code(::asio::error::eof)};
      }
      data.append(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(*count));
    }
    return data;
  }

  // Reads until the peer closes. Returns nullopt on timeout.
  std::optional<std::string> readToEnd(const std::size_t maxBytes, const Duration timeout)
  {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string data = std::move(mPending);
    mPending.clear();
    std::array<uint8_t, 4096> chunk;
    while (data.size() <= maxBytes)
    {
      const auto count = readSome(chunk.data(), chunk.size(), remaining(deadline));
      if (!count)
      {
        return std::nullopt;
      }
      if (*count == 0)
      {
        return data;
      }
      data.append(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(*count));
    }
    throw ::asio::system_error{::asio::error::make_error_code(::asio::error::message_size)};
  }

  // Throws asio::system_error, with asio::error::timed_out on timeout
  void write(const void* const pData, const std::size_t numBytes, const Duration timeout)
  {
    const auto result = run(
      [&](auto handler)
      { ::asio::async_write(mSocket, ::asio::buffer(pData, numBytes), handler); },
      timeout);
    if (result.timedOut)
    {
      throw ::asio::system_error{::asio::error::make_error_code(::asio::error::timed_out)};
    }
    if (result.error)
    {
      throw ::asio::system_error{result.error};
    }
  }

  void write(const std::string& data, const Duration timeout)
  {
    write(data.data(), data.size(), timeout);
  }

  // Makes a read or write blocked in another thread return. Safe to call
  // from any thread.
  void interrupt()
  {
    if (mSocket.is_open())
    {
      ::shutdown(mSocket.native_handle(), SHUT_RDWR);
    }
  }

  void close()
  {
    ::asio::error_code ec;
    mSocket.shutdown(::asio::ip::tcp::socket::shutdown_both, ec);
    mSocket.close(ec);
  }

  ::asio::ip::tcp::endpoint remoteEndpoint() const
  {
    ::asio::error_code ec;
    return mSocket.remote_endpoint(ec);
  }

  ::asio::ip::tcp::endpoint localEndpoint() const
  {
    ::asio::error_code ec;
    return mSocket.local_endpoint(ec);
  }

  static Duration remaining(const std::chrono::steady_clock::time_point deadline)
  {
    const auto left = std::chrono::duration_cast<Duration>(
      deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : Duration{0};
  }

private:
  struct Result
  {
    ::asio::error_code error;
    std::size_t bytes;
    bool timedOut;
  };

  template <typename Start>
  Result run(Start start, const Duration timeout)
  {
    Result result{::asio::error::would_block, 0, false};
    auto done = false;
    start(
      [&result, &done](const ::asio::error_code& error, auto... bytes)
      {
        result.error = error;
        result.bytes = sizeof...(bytes) > 0 ? std::size_t(bytes...) : 0;
        done = true;
      });

    mpIo->restart();
    mpIo->run_for(timeout);
    if (!done)
    {
      // Let the cancelled operation finish before its buffers go away
      ::asio::error_code ignored;
      mSocket.cancel(ignored);
      mpIo->restart();
      mpIo->run();
      // The operation may have completed before the cancellation took hold
      result.timedOut = result.error == ::asio::error::operation_aborted;
    }
    return result;
  }

  std::unique_ptr<::asio::io_context> mpIo;
  ::asio::ip::tcp::socket mSocket;
  std::string mPending;
};

} // namespace asio
} // namespace platforms
} // namespace roomcast
