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

#include <roomcast/discovery/Device.hpp>
#include <roomcast/platforms/stl/Clock.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

namespace roomcast
{
namespace discovery
{

// Remembers the last non-empty discovery result for a limited time. An
// empty result is handed out but never cached, so the next lookup searches
// again.
template <typename Clock = platforms::stl::Clock>
class DeviceCache
{
public:
  using Devices = std::vector<DiscoveredDevice>;

  explicit DeviceCache(const std::chrono::milliseconds ttl, Clock clock = {})
    : mTtl(ttl)
    , mClock(std::move(clock))
  {
  }

  // Returns the cached devices if they are fresh, otherwise calls discover()
  // and caches its result. Exceptions from discover() pass through and
  // leave the cache untouched.
  template <typename Discover>
  Devices get(Discover discover, const bool forceRefresh = false)
  {
    if (!forceRefresh)
    {
      if (auto devices = fresh())
      {
        return std::move(*devices);
      }
    }

    auto devices = discover();
    if (!devices.empty())
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mEntry = Entry{devices, mClock.now()};
    }
    return devices;
  }

  std::optional<Devices> fresh() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mEntry && mClock.now() - mEntry->storedAt < mTtl)
    {
      return mEntry->devices;
    }
    return std::nullopt;
  }

  void invalidate()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mEntry = std::nullopt;
  }

private:
  struct Entry
  {
    Devices devices;
    typename Clock::TimePoint storedAt;
  };

  std::chrono::milliseconds mTtl;
  Clock mClock;
  mutable std::mutex mMutex;
  std::optional<Entry> mEntry;
};

} // namespace discovery
} // namespace roomcast
