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

#include <roomcast/util/test/Timer.hpp>
#include <list>
#include <mutex>
#include <vector>

namespace roomcast
{
namespace util
{
namespace test
{

// Single-threaded stand-in for platforms::asio::Context. Posted handlers
// run on runHandlers() or advance(); all timers share the context's clock.
// Like the real context, async() may be called from any thread.
class IoContext
{
public:
  // Wrapper around the internal util::test::Timer in the list
  struct Timer
  {
    using ErrorCode = test::Timer::ErrorCode;
    using TimePoint = test::Timer::TimePoint;

    Timer(util::test::Timer* pTimer)
      : mpTimer(pTimer)
    {
    }

    void expires_at(const TimePoint t) { mpTimer->expires_at(t); }

    template <typename T, typename Rep>
    void expires_from_now(std::chrono::duration<T, Rep> duration)
    {
      mpTimer->expires_from_now(duration);
    }

    ErrorCode cancel() { return mpTimer->cancel(); }

    template <typename Handler>
    void async_wait(Handler handler)
    {
      mpTimer->async_wait(std::move(handler));
    }

    TimePoint now() const { return mpTimer->now(); }

    util::test::Timer* mpTimer;
  };

  IoContext() = default;

  IoContext(const IoContext&) = delete;
  IoContext& operator=(const IoContext&) = delete;

  Timer makeTimer()
  {
    mTimers.emplace_back(mNow);
    return Timer{&mTimers.back()};
  }

  template <typename Handler>
  void async(Handler handler)
  {
    std::lock_guard<std::mutex> lock(mHandlerMutex);
    mHandlers.emplace_back(std::move(handler));
  }

  // Advances the shared clock. Timers created by handlers fired during
  // this call start at the new time and are not advanced again.
  template <typename T, typename Rep>
  void advance(std::chrono::duration<T, Rep> duration)
  {
    runHandlers();

    mNow += std::chrono::duration_cast<Timer::TimePoint::duration>(duration);
    auto numTimers = mTimers.size();
    for (auto it = mTimers.begin(); numTimers > 0; ++it, --numTimers)
    {
      it->advance(duration);
    }

    runHandlers();
  }

  void runHandlers()
  {
    while (true)
    {
      std::vector<std::function<void()>> handlers;
      {
        std::lock_guard<std::mutex> lock(mHandlerMutex);
        handlers.swap(mHandlers);
      }
      if (handlers.empty())
      {
        return;
      }
      for (auto& handler : handlers)
      {
        handler();
      }
    }
  }

  std::size_t numPendingTimers() const
  {
    std::size_t count = 0;
    for (const auto& timer : mTimers)
    {
      count += timer.pending() ? 1 : 0;
    }
    return count;
  }

  Timer::TimePoint now() const { return mNow; }

private:
  std::mutex mHandlerMutex;
  std::vector<std::function<void()>> mHandlers;
  // std::list keeps Timer addresses stable while timers are added
  std::list<util::test::Timer> mTimers;
  Timer::TimePoint mNow{std::chrono::milliseconds{123456789}};
};

} // namespace test
} // namespace util
} // namespace roomcast
