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

#include <roomcast/discovery/DeviceCache.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/util/test/Clock.hpp>
#include <stdexcept>

namespace roomcast
{
namespace discovery
{
namespace
{

using Devices = std::vector<DiscoveredDevice>;

const Devices kDevices = {{"RINCON_A", "192.168.1.20", "http://192.168.1.20:1400/x.xml"}};

} // namespace

TEST_CASE("DeviceCache")
{
  util::test::Clock clock;
  DeviceCache<util::test::Clock> cache{std::chrono::seconds{60}, clock};
  auto numSearches = 0;
  auto result = kDevices;
  const auto search = [&]
  {
    ++numSearches;
    return result;
  };

  SECTION("FreshResultIsReused")
  {
    CHECK(kDevices == cache.get(search));
    clock.advance(std::chrono::seconds{59});
    CHECK(kDevices == cache.get(search));
    CHECK(1 == numSearches);
  }

  SECTION("ExpiredResultIsReplaced")
  {
    cache.get(search);
    clock.advance(std::chrono::seconds{60});
    result.push_back({"RINCON_B", "192.168.1.21", "http://192.168.1.21:1400/x.xml"});
    CHECK(2 == cache.get(search).size());
    CHECK(2 == numSearches);
  }

  SECTION("ForcedRefreshSearches")
  {
    cache.get(search);
    cache.get(search, true);
    CHECK(2 == numSearches);
  }

  SECTION("EmptyResultIsNotCached")
  {
    result.clear();
    CHECK(cache.get(search).empty());
    CHECK(!cache.fresh());
    result = kDevices;
    CHECK(kDevices == cache.get(search));
    CHECK(2 == numSearches);
  }

  SECTION("EmptyRefreshKeepsPreviousEntry")
  {
    cache.get(search);
    result.clear();
    CHECK(cache.get(search, true).empty());
    REQUIRE(cache.fresh());
    CHECK(kDevices == *cache.fresh());
  }

  SECTION("FailedSearchLeavesCacheUntouched")
  {
    cache.get(search);
    clock.advance(std::chrono::minutes{2});
    CHECK_THROWS_AS(cache.get([]() -> Devices { throw std::runtime_error("boom"); }),
                    std::runtime_error);
    CHECK(!cache.fresh());
  }

  SECTION("Invalidate")
  {
    cache.get(search);
    cache.invalidate();
    cache.get(search);
    CHECK(2 == numSearches);
  }
}

} // namespace discovery
} // namespace roomcast
