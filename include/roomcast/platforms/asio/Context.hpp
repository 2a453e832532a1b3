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

#include <roomcast/discovery/NetworkInterface.hpp>
#include <roomcast/platforms/asio/AsioTimer.hpp>
#include <roomcast/platforms/asio/AsioWrapper.hpp>
#include <roomcast/platforms/asio/UdpInterface.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace roomcast
{
namespace platforms
{
namespace asio
{

// An io_context driven by one dedicated thread. Exceptions of the type
// named by ExceptionHandler::Exception that escape a handler are passed to
// the exception handler and the thread keeps running.
template <typename ScanIpIfAddrs, typename LogT, typename ThreadFactory>
class Context
{
public:
  using Timer = AsioTimer;
  using Log = LogT;
  using Interface = UdpInterface;

  explicit Context(std::string threadName)
    : Context(std::move(threadName), DefaultHandler{})
  {
  }

  template <typename ExceptionHandler>
  Context(std::string threadName, ExceptionHandler exceptHandler)
    : mpService(new ::asio::io_context())
    , mpWork(new WorkGuard(::asio::make_work_guard(*mpService)))
  {
    mThread = ThreadFactory::makeThread(
      std::move(threadName),
      [](::asio::io_context& service, ExceptionHandler handler)
      {
        for (;;)
        {
          try
          {
            service.run();
            break;
          }
          catch (const typename ExceptionHandler::Exception& exception)
          {
            handler(exception);
          }
        }
      },
      std::ref(*mpService),
      std::move(exceptHandler));
  }

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  ~Context()
  {
    if (mpService && mpWork)
    {
      mpWork.reset();
      mpService->stop();
      mThread.join();
    }
  }

  std::vector<discovery::NetworkInterface> scanNetworkInterfaces()
  {
    return mScanIpIfAddrs();
  }

  // Opens a UDP socket bound to the given interface address for
  // multicast searches from that interface.
  std::shared_ptr<Interface> openSearchInterface(const ::asio::ip::address_v4& addr)
  {
    return std::make_shared<Interface>(*mpService, addr);
  }

  Timer makeTimer() const { return {*mpService}; }

  template <typename Handler>
  void async(Handler handler)
  {
    ::asio::post(*mpService, std::move(handler));
  }

  bool runningInThisThread() const
  {
    return std::this_thread::get_id() == mThread.get_id();
  }

  ::asio::io_context& ioContext() { return *mpService; }

  Log& log() { return mLog; }

private:
  using WorkGuard = ::asio::executor_work_guard<::asio::io_context::executor_type>;

  // Default handler is hidden and defines a hidden exception type
  // that will never be thrown by other code, so it effectively does
  // not catch.
  struct DefaultHandler
  {
    struct Exception
    {
    };

    void operator()(const Exception&) {}
  };

  std::unique_ptr<::asio::io_context> mpService;
  std::unique_ptr<WorkGuard> mpWork;
  std::thread mThread;
  Log mLog;
  ScanIpIfAddrs mScanIpIfAddrs;
};

} // namespace asio
} // namespace platforms
} // namespace roomcast
