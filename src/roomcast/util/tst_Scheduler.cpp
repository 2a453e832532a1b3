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

#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/util/Scheduler.hpp>
#include <roomcast/util/test/IoContext.hpp>
#include <thread>

namespace roomcast
{
namespace util
{

TEST_CASE("Scheduler")
{
  test::IoContext io;
  Scheduler<test::IoContext> scheduler{io};
  auto runs = 0;

  SECTION("RunsOnceAfterDelay")
  {
    auto handle = scheduler.schedule(std::chrono::seconds{10}, [&] { ++runs; });
    CHECK(handle);
    io.advance(std::chrono::seconds{9});
    CHECK(0 == runs);
    io.advance(std::chrono::seconds{1});
    CHECK(1 == runs);
    io.advance(std::chrono::seconds{10});
    CHECK(1 == runs);
    // Cancelling a task that already ran is harmless
    handle.cancel();
    CHECK(!handle);
  }

  SECTION("Cancel")
  {
    auto handle = scheduler.schedule(std::chrono::seconds{10}, [&] { ++runs; });
    handle.cancel();
    io.advance(std::chrono::seconds{10});
    CHECK(0 == runs);
    CHECK(0 == io.numPendingTimers());
  }

  SECTION("CancelFromAnotherThread")
  {
    auto handle = scheduler.schedule(std::chrono::seconds{10}, [&] { ++runs; });
    std::thread canceller([&] { handle.cancel(); });
    canceller.join();
    CHECK(!handle);
    // The timer is released once the context runs the posted cancel
    CHECK(1 == io.numPendingTimers());
    io.runHandlers();
    CHECK(0 == io.numPendingTimers());
    io.advance(std::chrono::seconds{10});
    CHECK(0 == runs);
  }

  SECTION("DestroyingTheHandleCancels")
  {
    {
      auto handle = scheduler.schedule(std::chrono::seconds{1}, [&] { ++runs; });
    }
    io.advance(std::chrono::seconds{1});
    CHECK(0 == runs);
  }

  SECTION("MoveAssignmentCancelsThePrevious")
  {
    auto runsB = 0;
    auto handle = scheduler.schedule(std::chrono::seconds{1}, [&] { ++runs; });
    handle = scheduler.schedule(std::chrono::seconds{2}, [&] { ++runsB; });
    io.advance(std::chrono::seconds{2});
    CHECK(0 == runs);
    CHECK(1 == runsB);
  }

  SECTION("TaskMayScheduleAgain")
  {
    CancelHandle next;
    auto first = scheduler.schedule(std::chrono::seconds{1},
                                    [&]
                                    {
                                      ++runs;
                                      next = scheduler.schedule(
                                        std::chrono::seconds{1}, [&] { ++runs; });
                                    });
    io.advance(std::chrono::seconds{1});
    CHECK(1 == runs);
    io.advance(std::chrono::seconds{1});
    CHECK(2 == runs);
  }
}

} // namespace util
} // namespace roomcast
