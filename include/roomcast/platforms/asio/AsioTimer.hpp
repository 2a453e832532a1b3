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
#include <chrono>
#include <functional>
#include <memory>

namespace roomcast
{
namespace platforms
{
namespace asio
{

// Timer concept implementation on top of asio's system_timer.
//
// asio timers may invoke a completion handler without an error code
// after they have been cancelled. The handler is therefore kept in a
// shared slot that cancel() clears and that the asio completion only
// reaches through a weak_ptr.
class AsioTimer
{
public:
  using ErrorCode = ::asio::error_code;
  using TimePoint = std::chrono::system_clock::time_point;

  AsioTimer(::asio::io_context& io)
    : mpTimer(new ::asio::system_timer(io))
    , mpHandlerSlot(std::make_shared<HandlerSlot>())
  {
  }

  ~AsioTimer()
  {
    // The timer may have been moved from
    if (mpTimer)
    {
      cancel();
    }
  }

  AsioTimer(const AsioTimer&) = delete;
  AsioTimer& operator=(const AsioTimer&) = delete;

  AsioTimer(AsioTimer&& rhs) = default;
  AsioTimer& operator=(AsioTimer&& rhs) = default;

  void expires_at(const TimePoint tp) { mpTimer->expires_at(tp); }

  template <typename T>
  void expires_from_now(T duration)
  {
    mpTimer->expires_after(std::chrono::duration_cast<TimePoint::duration>(duration));
  }

  ErrorCode cancel()
  {
    mpTimer->cancel();
    mpHandlerSlot->mHandler = nullptr;
    return {};
  }

  template <typename Handler>
  void async_wait(Handler handler)
  {
    mpHandlerSlot->mHandler = std::move(handler);
    std::weak_ptr<HandlerSlot> wpSlot = mpHandlerSlot;
    mpTimer->async_wait(
      [wpSlot](const ErrorCode e)
      {
        if (const auto pSlot = wpSlot.lock())
        {
          (*pSlot)(e);
        }
      });
  }

  TimePoint now() const { return std::chrono::system_clock::now(); }

private:
  struct HandlerSlot
  {
    void operator()(const ErrorCode e)
    {
      if (mHandler)
      {
        // Keep the handler alive even if it re-arms or cancels the timer
        auto handler = std::move(mHandler);
        mHandler = nullptr;
        handler(e);
      }
    }

    std::function<void(const ErrorCode)> mHandler;
  };

  std::unique_ptr<::asio::system_timer> mpTimer;
  std::shared_ptr<HandlerSlot> mpHandlerSlot;
};

} // namespace asio
} // namespace platforms
} // namespace roomcast
