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

#include <atomic>
#include <functional>
#include <memory>

namespace roomcast
{
namespace util
{

// Move-only handle to a pending task. Cancelling or destroying the handle
// guarantees that the task will not run afterwards. A handle that was
// moved from or cancelled is disarmed.
class CancelHandle
{
public:
  CancelHandle() = default;

  explicit CancelHandle(std::function<void()> cancel)
    : mCancel(std::move(cancel))
  {
  }

  CancelHandle(const CancelHandle&) = delete;
  CancelHandle& operator=(const CancelHandle&) = delete;

  CancelHandle(CancelHandle&& rhs)
    : mCancel(std::move(rhs.mCancel))
  {
    rhs.mCancel = nullptr;
  }

  CancelHandle& operator=(CancelHandle&& rhs)
  {
    if (this != &rhs)
    {
      cancel();
      mCancel = std::move(rhs.mCancel);
      rhs.mCancel = nullptr;
    }
    return *this;
  }

  ~CancelHandle() { cancel(); }

  void cancel()
  {
    if (mCancel)
    {
      auto cancelTask = std::move(mCancel);
      mCancel = nullptr;
      cancelTask();
    }
  }

  explicit operator bool() const { return static_cast<bool>(mCancel); }

private:
  std::function<void()> mCancel;
};

// Runs one-shot delayed tasks on timers made by the given IoContext. The
// context must provide makeTimer() returning a type that satisfies the
// Timer concept (expires_from_now, async_wait, cancel) and async() to post
// a handler to its thread. Handles may be cancelled from any thread; the
// timer itself is only touched on the context's thread.
template <typename IoContext>
class Scheduler
{
public:
  using Timer = typename IoContext::Timer;
  using ErrorCode = typename Timer::ErrorCode;

  explicit Scheduler(IoContext& io)
    : mIo(io)
  {
  }

  template <typename Duration, typename Task>
  CancelHandle schedule(const Duration delay, Task task)
  {
    auto pPending = std::make_shared<Pending>(mIo.makeTimer());
    std::weak_ptr<Pending> wpPending = pPending;
    pPending->mTimer.expires_from_now(delay);
    pPending->mTimer.async_wait(
      [wpPending, task = std::move(task)](const ErrorCode e) mutable
      {
        // The pending record going away means the handle was cancelled
        // while the completion was already queued.
        const auto pPending = wpPending.lock();
        if (!e && pPending && !pPending->mCancelled.exchange(true))
        {
          task();
        }
      });

    auto pIo = &mIo;
    return CancelHandle{[pIo, pPending]() mutable
                        {
                          pPending->mCancelled = true;
                          pIo->async([pPending] { pPending->mTimer.cancel(); });
                          pPending.reset();
                        }};
  }

private:
  struct Pending
  {
    Pending(Timer timer)
      : mTimer(std::move(timer))
    {
    }

    Timer mTimer;
    std::atomic<bool> mCancelled{false};
  };

  IoContext& mIo;
};

} // namespace util
} // namespace roomcast
