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

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace roomcast
{
namespace engine
{

// Messages queued for one producer connection. Filled from any thread and
// drained by the connection's thread. When full, the oldest message is
// dropped.
class Outbox
{
public:
  explicit Outbox(const std::size_t capacity = 64)
    : mCapacity(capacity)
  {
  }

  void push(std::string message)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mCapacity == 0)
    {
      ++mNumDropped;
      return;
    }
    if (mMessages.size() == mCapacity)
    {
      mMessages.pop_front();
      ++mNumDropped;
    }
    mMessages.push_back(std::move(message));
  }

  std::vector<std::string> drain()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<std::string> messages(
      std::make_move_iterator(mMessages.begin()), std::make_move_iterator(mMessages.end()));
    mMessages.clear();
    return messages;
  }

  std::size_t numDropped() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mNumDropped;
  }

private:
  mutable std::mutex mMutex;
  std::size_t mCapacity;
  std::deque<std::string> mMessages;
  std::size_t mNumDropped = 0;
};

} // namespace engine
} // namespace roomcast
