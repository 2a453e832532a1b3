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
#include <roomcast/platforms/asio/AsioWrapper.hpp>
#include <roomcast/platforms/asio/TcpConnection.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>

namespace roomcast
{
namespace platforms
{
namespace asio
{

struct PortUnavailable : std::runtime_error
{
  PortUnavailable(const std::uint16_t first, const std::uint16_t last)
    : std::runtime_error("no free port in " + std::to_string(first) + ".."
                         + std::to_string(last))
  {
  }
};

struct ServerSettings
{
  std::size_t maxConnections = 64;
  std::size_t maxHeadSize = 16 * 1024;
  std::size_t maxBodySize = 1024 * 1024;
  std::chrono::milliseconds requestTimeout{10000};
};

// Minimal HTTP/1.1 server with one thread per connection. Every request is
// answered with "Connection: close". A handler either returns the response
// or returns nullopt after taking over the connection, which is how
// streaming responses and protocol upgrades are served.
template <typename ThreadFactory, typename Log>
class HttpServer
{
public:
  using Handler = std::function<std::optional<http::Response>(const http::Request&,
                                                              TcpConnection&)>;

  HttpServer(Log log, ServerSettings settings = {})
    : mLog(channel(log, "http"))
    , mSettings(std::move(settings))
  {
  }

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  ~HttpServer() { stop(); }

  // Listens on the first free port of port..port+numFallbackPorts and
  // returns it. Throws PortUnavailable.
  std::uint16_t start(const ::asio::ip::address& address,
                      const std::uint16_t port,
                      const std::uint16_t numFallbackPorts,
                      Handler handler)
  {
    stop();
    mpAcceptor = std::make_unique<::asio::ip::tcp::acceptor>(mIo);
    const auto last = static_cast<std::uint16_t>(port + numFallbackPorts);
    for (auto candidate = port;; ++candidate)
    {
      if (tryListen({address, candidate}))
      {
        // Port 0 binds to an ephemeral port
        mPort = mpAcceptor->local_endpoint().port();
        break;
      }
      if (candidate == last)
      {
        mpAcceptor.reset();
        throw PortUnavailable{port, last};
      }
    }

    mHandler = std::move(handler);
    mRunning = true;
    mAcceptThread = ThreadFactory::makeThread("roomcast-http", [this] { acceptLoop(); });
    info(mLog) << "listening on " << address.to_string() << ":" << mPort;
    return mPort;
  }

  // Closes the listener, interrupts every open connection and waits for
  // their threads
  void stop()
  {
    if (!mRunning.exchange(false))
    {
      return;
    }
    // Closing alone does not wake a thread blocked in accept
    ::shutdown(mpAcceptor->native_handle(), SHUT_RDWR);
    ::asio::error_code ec;
    mpAcceptor->close(ec);
    if (mAcceptThread.joinable())
    {
      mAcceptThread.join();
    }

    std::list<Worker> workers;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      workers.swap(mWorkers);
    }
    for (auto& worker : workers)
    {
      worker.pConnection->interrupt();
    }
    for (auto& worker : workers)
    {
      worker.thread.join();
    }
    mpAcceptor.reset();
    info(mLog) << "stopped listening on port " << mPort;
  }

  bool running() const { return mRunning; }

  std::uint16_t port() const { return mPort; }

  std::size_t numConnections() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mWorkers.size();
  }

private:
  struct Worker
  {
    std::thread thread;
    std::shared_ptr<TcpConnection> pConnection;
    std::shared_ptr<std::atomic<bool>> pDone;
  };

  bool tryListen(const ::asio::ip::tcp::endpoint& endpoint)
  {
    ::asio::error_code ec;
    if (mpAcceptor->is_open())
    {
      mpAcceptor->close(ec);
    }
    mpAcceptor->open(endpoint.protocol(), ec);
    if (!ec)
    {
      mpAcceptor->set_option(::asio::socket_base::reuse_address(true), ec);
    }
    if (!ec)
    {
      mpAcceptor->bind(endpoint, ec);
    }
    if (!ec)
    {
      mpAcceptor->listen(::asio::socket_base::max_listen_connections, ec);
    }
    if (ec)
    {
      debug(mLog) << "port " << endpoint.port() << " unavailable: " << ec.message();
      return false;
    }
    return true;
  }

  void acceptLoop()
  {
    while (mRunning)
    {
      auto pIo = std::make_unique<::asio::io_context>();
      ::asio::ip::tcp::socket socket{*pIo};
      ::asio::error_code ec;
      mpAcceptor->accept(socket, ec);
      if (ec)
      {
        if (mRunning)
        {
          warning(mLog) << "accept failed: " << ec.message();
        }
        continue;
      }

      auto pConnection = std::make_shared<TcpConnection>(std::move(pIo), std::move(socket));
      reapFinishedWorkers();
      if (numConnections() >= mSettings.maxConnections)
      {
        warning(mLog) << "rejecting " << pConnection->remoteEndpoint()
                      << ": too many connections";
        writeResponse(*pConnection, http::makeResponse(503));
        continue;
      }

      auto pDone = std::make_shared<std::atomic<bool>>(false);
      std::lock_guard<std::mutex> lock(mMutex);
      mWorkers.push_back({ThreadFactory::makeThread("roomcast-conn",
                                                    [this, pConnection, pDone]
                                                    {
                                                      serve(*pConnection);
                                                      pConnection->close();
                                                      *pDone = true;
                                                    }),
                          pConnection,
                          pDone});
    }
  }

  void reapFinishedWorkers()
  {
    std::list<Worker> finished;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      for (auto it = mWorkers.begin(); it != mWorkers.end();)
      {
        if (*it->pDone)
        {
          finished.splice(finished.end(), mWorkers, it++);
        }
        else
        {
          ++it;
        }
      }
    }
    for (auto& worker : finished)
    {
      worker.thread.join();
    }
  }

  void serve(TcpConnection& connection)
  {
    try
    {
      const auto head =
        connection.readUntil("\r\n\r\n", mSettings.maxHeadSize, mSettings.requestTimeout);
      if (!head)
      {
        debug(mLog) << "no request from " << connection.remoteEndpoint() << " in time";
        return;
      }

      auto request = http::parseRequestHead(*head);
      if (const auto length = request.headers.get("Content-Length"))
      {
        const auto size = std::strtoull(length->c_str(), nullptr, 10);
        if (size > mSettings.maxBodySize)
        {
          writeResponse(connection, http::makeResponse(413));
          return;
        }
        auto body = connection.readExactly(static_cast<std::size_t>(size),
                                           mSettings.requestTimeout);
        if (!body)
        {
          return;
        }
        request.body = std::move(*body);
      }

      debug(mLog) << request.method << " " << request.target << " from "
                  << connection.remoteEndpoint();
      if (auto response = dispatch(request, connection))
      {
        writeResponse(connection, *response);
      }
    }
    catch (const http::ParseError& e)
    {
      debug(mLog) << "bad request from " << connection.remoteEndpoint() << ": " << e.what();
      writeResponse(connection, http::makeResponse(400));
    }
    catch (const ::asio::system_error& e)
    {
      debug(mLog) << "connection to " << connection.remoteEndpoint()
                  << " failed: " << e.what();
    }
  }

  std::optional<http::Response> dispatch(const http::Request& request,
                                         TcpConnection& connection)
  {
    try
    {
      return mHandler(request, connection);
    }
    catch (const ::asio::system_error&)
    {
      throw;
    }
    catch (const std::exception& e)
    {
      error(mLog) << request.method << " " << request.target << " failed: " << e.what();
      return http::makeResponse(500);
    }
  }

  void writeResponse(TcpConnection& connection, http::Response response)
  {
    response.headers.set("Connection", "close");
    try
    {
      connection.write(http::toString(response), mSettings.requestTimeout);
    }
    catch (const ::asio::system_error& e)
    {
      debug(mLog) << "could not answer " << connection.remoteEndpoint() << ": " << e.what();
    }
  }

  Log mLog;
  ServerSettings mSettings;
  ::asio::io_context mIo;
  std::unique_ptr<::asio::ip::tcp::acceptor> mpAcceptor;
  std::atomic<bool> mRunning{false};
  std::uint16_t mPort = 0;
  Handler mHandler;
  std::thread mAcceptThread;
  mutable std::mutex mMutex;
  std::list<Worker> mWorkers;
};

} // namespace asio
} // namespace platforms
} // namespace roomcast
