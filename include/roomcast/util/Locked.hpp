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

#include <mutex>

namespace roomcast
{
namespace util
{

// A value that is only reachable while holding its mutex. read() returns
// a copy, update() runs the given function on the value under the lock and
// returns whatever the function returns.
template <typename T>
class Locked
{
public:
  Locked() = default;

  explicit Locked(T value)
    : mValue(std::move(value))
  {
  }

  Locked(const Locked&) = delete;
  Locked& operator=(const Locked&) = delete;

  T read() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mValue;
  }

  template <typename Function>
  auto update(Function f)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return f(mValue);
  }

  template <typename Function>
  auto inspect(Function f) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return f(static_cast<const T&>(mValue));
  }

private:
  mutable std::mutex mMutex;
  T mValue{};
};

} // namespace util
} // namespace roomcast
