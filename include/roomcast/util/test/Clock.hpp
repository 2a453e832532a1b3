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
#include <memory>

namespace roomcast
{
namespace util
{
namespace test
{

// Clock that only moves when told to. Copies share the same time.
struct Clock
{
  using TimePoint = std::chrono::steady_clock::time_point;

  TimePoint now() const { return *mpNow; }

  template <typename Rep, typename Period>
  void advance(const std::chrono::duration<Rep, Period> duration)
  {
    *mpNow += std::chrono::duration_cast<TimePoint::duration>(duration);
  }

  std::shared_ptr<TimePoint> mpNow = std::make_shared<TimePoint>(std::chrono::hours{1});
};

} // namespace test
} // namespace util
} // namespace roomcast
