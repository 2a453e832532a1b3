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

#include <chrono>
#include <functional>

namespace roomcast
{
namespace util
{
namespace test
{

// Manually driven timer. Time only moves on advance(); a pending handler
// fires once the timer's deadline has been reached.
struct Timer
{
  using ErrorCode = int;
  using TimePoint = std::chrono::system_clock::time_point;

  // Initialize timer with an arbitrary large value to simulate the
  // time_since_epoch of a real clock.
  Timer()
    : mNow{std::chrono::milliseconds{123456789}}
  {
  }

  explicit Timer(const TimePoint now)
    : mNow(now)
  {
  }

  void expires_at(const TimePoint t)
  {
    cancel();
    mFireAt = t;
  }

  template <typename T, typename Rep>
  void expires_from_now(std::chrono::duration<T, Rep> duration)
  {
    cancel();
    mFireAt = now() + std::chrono::duration_cast<TimePoint::duration>(duration);
  }

  ErrorCode cancel()
  {
    if (mHandler)
    {
      auto handler = std::move(mHandler);
      mHandler = nullptr;
      handler(1); // call existing handler with truthy error code
    }
    return 0;
  }

  template <typename Handler>
  void async_wait(Handler handler)
  {
    mHandler = [handler](ErrorCode ec) mutable { handler(ec); };
  }

  TimePoint now() const { return mNow; }

  template <typename T, typename Rep>
  void advance(std::chrono::duration<T, Rep> duration)
  {
    mNow += std::chrono::duration_cast<TimePoint::duration>(duration);
    if (mHandler && mFireAt <= mNow)
    {
      // The handler may re-arm this timer
      auto handler = std::move(mHandler);
      mHandler = nullptr;
      handler(0);
    }
  }

  bool pending() const { return static_cast<bool>(mHandler); }

  std::function<void(ErrorCode)> mHandler;
  TimePoint mFireAt;
  TimePoint mNow;
};

} // namespace test
} // namespace util
} // namespace roomcast
