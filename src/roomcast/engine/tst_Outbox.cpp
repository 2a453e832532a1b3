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

#include <roomcast/engine/Outbox.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <thread>

namespace roomcast
{
namespace engine
{

TEST_CASE("Outbox | Drain", "[Outbox]")
{
  Outbox outbox;
  CHECK(outbox.drain().empty());

  outbox.push("a");
  outbox.push("b");
  CHECK((std::vector<std::string>{"a", "b"}) == outbox.drain());
  CHECK(outbox.drain().empty());
}

TEST_CASE("Outbox | DropsOldestWhenFull", "[Outbox]")
{
  Outbox outbox{2};
  outbox.push("a");
  outbox.push("b");
  outbox.push("c");
  CHECK((std::vector<std::string>{"b", "c"}) == outbox.drain());
  CHECK(1 == outbox.numDropped());
}

TEST_CASE("Outbox | PushFromAnotherThread", "[Outbox]")
{
  Outbox outbox{1000};
  std::thread producer(
    [&outbox]
    {
      for (int i = 0; i < 500; ++i)
      {
        outbox.push(std::to_string(i));
      }
    });

  std::vector<std::string> received;
  while (received.size() < 500)
  {
    for (auto& message : outbox.drain())
    {
      received.push_back(std::move(message));
    }
    std::this_thread::yield();
  }
  producer.join();
  for (int i = 0; i < 500; ++i)
  {
    REQUIRE(std::to_string(i) == received[static_cast<std::size_t>(i)]);
  }
  CHECK(0 == outbox.numDropped());
}

} // namespace engine
} // namespace roomcast
