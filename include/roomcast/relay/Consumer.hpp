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

#include <roomcast/relay/Frame.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace roomcast
{
namespace relay
{

// Bounded frame queue between the producer side and one consumer. Pushing
// never blocks; a full queue rejects the frame and closes itself, which
// ends the consumer's reads.
class ConsumerQueue
{
public:
  explicit ConsumerQueue(const std::size_t capacity)
    : mCapacity(capacity)
  {
  }

  // Returns false if the queue is closed or was full
  bool push(Frame frame)
  {
    {
      std::lock_guard<std::mutex> lock(mMutex);
      if (mClosed)
      {
        return false;
      }
      if (mFrames.size() >= mCapacity)
      {
        mClosed = true;
        mFrames.clear();
      }
      else
      {
        mFrames.push_back(std::move(frame));
      }
    }
    mCondition.notify_one();
    return !closed();
  }

  // Blocks until a frame is available. Returns nullopt once closed.
  std::optional<Frame> pop()
  {
    std::unique_lock<std::mutex> lock(mMutex);
    mCondition.wait(lock, [this] { return mClosed || !mFrames.empty(); });
    return takeLocked();
  }

  // As pop(), but also returns nullopt when nothing arrived in time
  std::optional<Frame> popFor(const std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(mMutex);
    mCondition.wait_for(lock, timeout, [this] { return mClosed || !mFrames.empty(); });
    return takeLocked();
  }

  void close()
  {
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mClosed = true;
      mFrames.clear();
    }
    mCondition.notify_all();
  }

  bool closed() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mClosed;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mFrames.size();
  }

private:
  std::optional<Frame> takeLocked()
  {
    if (mClosed || mFrames.empty())
    {
      return std::nullopt;
    }
    auto frame = std::move(mFrames.front());
    mFrames.pop_front();
    return frame;
  }

  const std::size_t mCapacity;
  mutable std::mutex mMutex;
  std::condition_variable mCondition;
  std::deque<Frame> mFrames;
  bool mClosed = false;
};

// Handle through which one consumer reads a stream. Cancelling it, or
// destroying it, removes the consumer from its stream before returning.
class ConsumerStream
{
public:
  ConsumerStream(std::shared_ptr<ConsumerQueue> pQueue, std::function<void()> deregister)
    : mpQueue(std::move(pQueue))
    , mDeregister(std::move(deregister))
  {
  }

  ConsumerStream(const ConsumerStream&) = delete;
  ConsumerStream& operator=(const ConsumerStream&) = delete;

  ConsumerStream(ConsumerStream&& rhs)
    : mpQueue(std::move(rhs.mpQueue))
    , mDeregister(std::move(rhs.mDeregister))
  {
    rhs.mDeregister = nullptr;
  }

  ConsumerStream& operator=(ConsumerStream&& rhs)
  {
    if (this != &rhs)
    {
      cancel();
      mpQueue = std::move(rhs.mpQueue);
      mDeregister = std::move(rhs.mDeregister);
      rhs.mDeregister = nullptr;
    }
    return *this;
  }

  ~ConsumerStream() { cancel(); }

  // Next frame in submission order. Blocks until one arrives; returns
  // nullopt once the stream was cancelled or removed or the consumer fell
  // behind.
  std::optional<Frame> read() { return mpQueue ? mpQueue->pop() : std::nullopt; }

  std::optional<Frame> readFor(const std::chrono::milliseconds timeout)
  {
    return mpQueue ? mpQueue->popFor(timeout) : std::nullopt;
  }

  void cancel()
  {
    if (mpQueue)
    {
      mpQueue->close();
    }
    if (mDeregister)
    {
      auto deregister = std::move(mDeregister);
      mDeregister = nullptr;
      deregister();
    }
  }

  bool ended() const { return !mpQueue || mpQueue->closed(); }

  std::size_t numQueuedFrames() const { return mpQueue ? mpQueue->size() : 0; }

private:
  std::shared_ptr<ConsumerQueue> mpQueue;
  std::function<void()> mDeregister;
};

} // namespace relay
} // namespace roomcast
