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

#include <roomcast/control/Errors.hpp>
#include <roomcast/control/Services.hpp>
#include <roomcast/events/Channel.hpp>
#include <roomcast/events/Errors.hpp>
#include <roomcast/events/Event.hpp>
#include <roomcast/events/Gena.hpp>
#include <roomcast/events/NotifyParser.hpp>
#include <roomcast/http/Message.hpp>
#include <roomcast/util/Scheduler.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace roomcast
{
namespace events
{

struct Settings
{
  std::uint16_t devicePort = control::kDevicePort;
  std::chrono::seconds requestedLease{3600};
  std::chrono::seconds renewalMargin{300};
  std::chrono::seconds minRenewalDelay{60};
  std::chrono::milliseconds requestTimeout{10000};
  std::size_t maxNotifyBodySize = 64 * 1024;
};

struct Subscription
{
  std::string subscriptionId;
  std::string deviceIp;
  Channel channel;
  std::chrono::system_clock::time_point expiresAt;
  std::string callbackPath;
};

// Last state a device reported through its notifications
struct DeviceState
{
  std::optional<TransportState> transportState;
  std::optional<std::string> currentUri;
  std::optional<int> volume;
  std::optional<bool> muted;
};

struct Diagnostics
{
  struct Entry
  {
    std::string id;
    std::string deviceIp;
    Channel channel;
  };

  bool running = false;
  std::uint16_t listenPort = 0;
  std::string localAddress;
  std::vector<Entry> subscriptions;
};

// Keeps event subscriptions on devices alive and turns their notifications
// into typed events.
//
// Transport has the requirements of control::Client's transport. Renewals
// are scheduled on timers of IoContext and run on its thread, which should
// not be shared with latency sensitive work since a renewal blocks for up
// to the request timeout. All other operations may be called from any
// thread. Handlers are invoked without any internal lock held.
template <typename Transport, typename IoContext, typename Log>
class SubscriptionManager
{
public:
  using Handler = std::function<void(const std::string& deviceIp, const Event&)>;

  SubscriptionManager(Transport& transport, IoContext& io, Log log, Settings settings = {})
    : mpImpl(std::make_shared<Impl>(transport, io, channel(log, "events"), std::move(settings)))
  {
  }

  SubscriptionManager(const SubscriptionManager&) = delete;
  SubscriptionManager& operator=(const SubscriptionManager&) = delete;

  // Transport and IoContext must stay alive until the io thread has
  // finished a renewal that is running at this point.
  ~SubscriptionManager() { mpImpl->shutdown(); }

  // Address and port notifications are delivered to. Subscribing needs a
  // running listener.
  void setListening(const bool running, std::string localAddress, const std::uint16_t port)
  {
    mpImpl->setListening(running, std::move(localAddress), port);
  }

  // Returns the id of the subscription for the device and channel,
  // subscribing first if there is none. Throws control::DeviceUnreachable,
  // control::DeviceTimeout, SubscriptionFailed and MissingSubscriptionId.
  std::string subscribe(const std::string& deviceIp, const Channel channel)
  {
    return mpImpl->subscribe(deviceIp, channel);
  }

  // Extends the lease of a subscription. If the device refuses, the
  // subscription is replaced by a new one. Returns the id that is current
  // afterwards, or nullopt if resubscribing failed too, in which case the
  // subscription is gone and the handler receives SubscriptionLost.
  // Throws SubscriptionNotFound.
  std::optional<std::string> renew(const std::string& subscriptionId)
  {
    return mpImpl->renew(subscriptionId);
  }

  // Ends a subscription. The local record and its renewal are always
  // removed; a failure to tell the device is only logged. Returns false if
  // the id was unknown.
  bool unsubscribe(const std::string& subscriptionId)
  {
    return mpImpl->unsubscribe(subscriptionId);
  }

  void unsubscribeAll(const std::string& deviceIp) { mpImpl->unsubscribeAll(deviceIp); }

  void unsubscribeEverything() { mpImpl->unsubscribeEverything(); }

  // Replaces the process-wide notification handler
  void onNotification(Handler handler) { mpImpl->onNotification(std::move(handler)); }

  // Answers an inbound notification request:
  //  405 for other methods, 413 for oversized bodies, 400 without SID,
  //  412 for unknown subscriptions, 200 otherwise.
  http::Response handleNotify(const http::Request& request)
  {
    return mpImpl->handleNotify(request);
  }

  // The stream a device was told to play. Notifications that report
  // another source produce a SourceChanged event.
  void setExpectedStreamUrl(const std::string& deviceIp, std::string url)
  {
    mpImpl->setExpectedStreamUrl(deviceIp, std::move(url));
  }

  void clearExpectedStreamUrl(const std::string& deviceIp)
  {
    mpImpl->clearExpectedStreamUrl(deviceIp);
  }

  std::optional<DeviceState> deviceState(const std::string& deviceIp) const
  {
    return mpImpl->deviceState(deviceIp);
  }

  std::optional<Subscription> subscription(const std::string& subscriptionId) const
  {
    return mpImpl->subscription(subscriptionId);
  }

  std::size_t subscriptionCount() const { return mpImpl->subscriptionCount(); }

  Diagnostics diagnostics() const { return mpImpl->diagnostics(); }

private:
  struct Impl : std::enable_shared_from_this<Impl>
  {
    struct Record
    {
      Subscription subscription;
      util::CancelHandle renewal;
      bool renewing = false;
    };

    struct StateUpdate
    {
      void operator()(const TransportStateChanged& e)
      {
        state.transportState = e.state;
        state.currentUri = e.currentUri;
      }
      void operator()(const VolumeChanged& e) { state.volume = e.volume; }
      void operator()(const MuteChanged& e) { state.muted = e.muted; }
      void operator()(const TopologyChanged&) {}
      void operator()(const SourceChanged& e) { state.currentUri = e.currentUri; }
      void operator()(const SubscriptionLost&) {}

      DeviceState& state;
    };

    Impl(Transport& transport, IoContext& io, Log log, Settings settings)
      : mTransport(transport)
      , mScheduler(io)
      , mLog(std::move(log))
      , mSettings(std::move(settings))
    {
    }

    // Cancels all renewals and detaches the handler. A renewal that is
    // already on its way completes without effect.
    void shutdown()
    {
      std::map<std::string, Record> records;
      {
        std::lock_guard<std::mutex> lock(mMutex);
        records.swap(mRecords);
        mHandler = nullptr;
        mRunning = false;
      }
    }

    void setListening(const bool running, std::string localAddress, const std::uint16_t port)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mRunning = running;
      mLocalAddress = std::move(localAddress);
      mListenPort = port;
    }

    std::string subscribe(const std::string& deviceIp, const Channel channel)
    {
      std::string callbackUrl;
      {
        std::lock_guard<std::mutex> lock(mMutex);
        if (const auto existing = findLocked(deviceIp, channel))
        {
          return *existing;
        }
        if (!mRunning)
        {
          throw SubscriptionFailed{deviceIp, channel, 0, "callback listener not running"};
        }
        callbackUrl = "http://" + mLocalAddress + ":" + std::to_string(mListenPort)
                      + callbackPath(deviceIp, channel);
      }

      const auto& service = events::service(channel);
      const auto response = mTransport.send(
        deviceIp,
        mSettings.devicePort,
        makeSubscribeRequest(
          hostHeader(deviceIp), service.eventPath, callbackUrl, mSettings.requestedLease),
        mSettings.requestTimeout);
      if (!response.ok())
      {
        throw SubscriptionFailed{
          deviceIp, channel, response.status, "HTTP " + std::to_string(response.status)};
      }
      const auto sid = response.headers.get("SID");
      if (!sid || http::trim(*sid).empty())
      {
        throw MissingSubscriptionId{deviceIp};
      }
      const auto id = http::trim(*sid);
      const auto lease = grantedLease(response);

      std::optional<std::string> raced;
      {
        std::lock_guard<std::mutex> lock(mMutex);
        raced = findLocked(deviceIp, channel);
        if (!raced)
        {
          auto& record = mRecords[id];
          record.subscription = {id,
                                 deviceIp,
                                 channel,
                                 std::chrono::system_clock::now() + lease,
                                 callbackPath(deviceIp, channel)};
          record.renewal = scheduleRenewal(id, lease);
        }
      }
      if (raced)
      {
        // A concurrent subscribe for the same channel won
        sendUnsubscribe(deviceIp, channel, id);
        return *raced;
      }

      info(mLog) << "subscribed to " << channel << " on " << deviceIp << " (" << id << ", "
                 << lease.count() << "s)";
      return id;
    }

    std::optional<std::string> renew(const std::string& subscriptionId)
    {
      Subscription subscription;
      {
        std::lock_guard<std::mutex> lock(mMutex);
        const auto it = mRecords.find(subscriptionId);
        if (it == mRecords.end())
        {
          throw SubscriptionNotFound{subscriptionId};
        }
        if (it->second.renewing)
        {
          debug(mLog) << "renewal of " << subscriptionId << " already in progress";
          return subscriptionId;
        }
        it->second.renewing = true;
        subscription = it->second.subscription;
      }

      try
      {
        const auto& service = events::service(subscription.channel);
        const auto response = mTransport.send(subscription.deviceIp,
                                              mSettings.devicePort,
                                              makeRenewRequest(hostHeader(subscription.deviceIp),
                                                               service.eventPath,
                                                               subscriptionId,
                                                               mSettings.requestedLease),
                                              mSettings.requestTimeout);
        if (!response.ok())
        {
          throw SubscriptionFailed{subscription.deviceIp,
                                   subscription.channel,
                                   response.status,
                                   "renewal refused with HTTP " + std::to_string(response.status)};
        }

        const auto lease = grantedLease(response);
        std::lock_guard<std::mutex> lock(mMutex);
        const auto it = mRecords.find(subscriptionId);
        if (it == mRecords.end())
        {
          // Unsubscribed while the renewal was on its way
          return std::nullopt;
        }
        it->second.subscription.expiresAt = std::chrono::system_clock::now() + lease;
        it->second.renewing = false;
        it->second.renewal = scheduleRenewal(subscriptionId, lease);
        debug(mLog) << "renewed " << subscriptionId << " for " << lease.count() << "s";
        return subscriptionId;
      }
      catch (const std::runtime_error& e)
      {
        warning(mLog) << "renewal of " << subscriptionId << " failed: " << e.what()
                      << ", subscribing again";
      }

      if (!remove(subscriptionId))
      {
        return std::nullopt;
      }
      try
      {
        return subscribe(subscription.deviceIp, subscription.channel);
      }
      catch (const std::runtime_error& e)
      {
        error(mLog) << "resubscribing to " << subscription.channel << " on "
                    << subscription.deviceIp << " failed: " << e.what();
        deliver(subscription.deviceIp, {SubscriptionLost{subscription.channel, e.what()}});
        return std::nullopt;
      }
    }

    bool unsubscribe(const std::string& subscriptionId)
    {
      std::optional<Subscription> subscription;
      {
        std::lock_guard<std::mutex> lock(mMutex);
        const auto it = mRecords.find(subscriptionId);
        if (it != mRecords.end())
        {
          subscription = it->second.subscription;
        }
      }
      if (!subscription || !remove(subscriptionId))
      {
        return false;
      }
      sendUnsubscribe(subscription->deviceIp, subscription->channel, subscriptionId);
      info(mLog) << "unsubscribed from " << subscription->channel << " on "
                 << subscription->deviceIp;
      return true;
    }

    void unsubscribeAll(const std::string& deviceIp)
    {
      for (const auto& id : idsWhere([&](const Subscription& s) { return s.deviceIp == deviceIp; }))
      {
        unsubscribe(id);
      }
    }

    void unsubscribeEverything()
    {
      for (const auto& id : idsWhere([](const Subscription&) { return true; }))
      {
        unsubscribe(id);
      }
    }

    void onNotification(Handler handler)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mHandler = std::move(handler);
    }

    http::Response handleNotify(const http::Request& request)
    {
      if (request.method != "NOTIFY")
      {
        return http::makeResponse(405);
      }
      if (request.body.size() > mSettings.maxNotifyBodySize)
      {
        return http::makeResponse(413);
      }
      const auto sid = request.headers.get("SID");
      if (!sid || http::trim(*sid).empty())
      {
        return http::makeResponse(400);
      }

      std::string deviceIp;
      Channel channel;
      std::optional<std::string> expected;
      {
        std::lock_guard<std::mutex> lock(mMutex);
        const auto it = mRecords.find(http::trim(*sid));
        if (it == mRecords.end())
        {
          debug(mLog) << "notification for unknown subscription " << *sid;
          return http::makeResponse(412);
        }
        deviceIp = it->second.subscription.deviceIp;
        channel = it->second.subscription.channel;
        const auto exp = mExpectedStreams.find(deviceIp);
        if (exp != mExpectedStreams.end())
        {
          expected = exp->second;
        }
      }

      const auto events = parseNotification(channel, request.body, expected);
      {
        std::lock_guard<std::mutex> lock(mMutex);
        auto& state = mDeviceStates[deviceIp];
        for (const auto& event : events)
        {
          std::visit(StateUpdate{state}, event);
        }
      }

      deliver(deviceIp, events);
      return http::makeResponse(200);
    }

    void setExpectedStreamUrl(const std::string& deviceIp, std::string url)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mExpectedStreams[deviceIp] = std::move(url);
    }

    void clearExpectedStreamUrl(const std::string& deviceIp)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mExpectedStreams.erase(deviceIp);
    }

    std::optional<DeviceState> deviceState(const std::string& deviceIp) const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      const auto it = mDeviceStates.find(deviceIp);
      if (it == mDeviceStates.end())
      {
        return std::nullopt;
      }
      return it->second;
    }

    std::optional<Subscription> subscription(const std::string& subscriptionId) const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      const auto it = mRecords.find(subscriptionId);
      if (it == mRecords.end())
      {
        return std::nullopt;
      }
      return it->second.subscription;
    }

    std::size_t subscriptionCount() const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      return mRecords.size();
    }

    Diagnostics diagnostics() const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      Diagnostics result;
      result.running = mRunning;
      result.listenPort = mListenPort;
      result.localAddress = mLocalAddress;
      for (const auto& entry : mRecords)
      {
        const auto& s = entry.second.subscription;
        result.subscriptions.push_back({s.subscriptionId, s.deviceIp, s.channel});
      }
      return result;
    }

    std::string hostHeader(const std::string& deviceIp) const
    {
      return deviceIp + ":" + std::to_string(mSettings.devicePort);
    }

    std::chrono::seconds grantedLease(const http::Response& response) const
    {
      if (const auto header = response.headers.get("TIMEOUT"))
      {
        if (const auto lease = parseTimeout(*header))
        {
          return *lease;
        }
      }
      return mSettings.requestedLease;
    }

    util::CancelHandle scheduleRenewal(const std::string& subscriptionId,
                                       const std::chrono::seconds lease)
    {
      const auto delay =
        renewalDelay(lease, mSettings.renewalMargin, mSettings.minRenewalDelay);
      std::weak_ptr<Impl> wpImpl = this->shared_from_this();
      return mScheduler.schedule(delay,
                                 [wpImpl, subscriptionId]
                                 {
                                   // Keeps the state alive while the renewal blocks
                                   const auto pImpl = wpImpl.lock();
                                   if (!pImpl)
                                   {
                                     return;
                                   }
                                   try
                                   {
                                     pImpl->renew(subscriptionId);
                                   }
                                   catch (const SubscriptionNotFound&)
                                   {
                                     debug(pImpl->mLog)
                                       << subscriptionId << " ended before renewal";
                                   }
                                 });
    }

    void deliver(const std::string& deviceIp, const std::vector<Event>& events)
    {
      Handler handler;
      {
        std::lock_guard<std::mutex> lock(mMutex);
        handler = mHandler;
      }
      if (!handler)
      {
        return;
      }
      for (const auto& event : events)
      {
        try
        {
          handler(deviceIp, event);
        }
        catch (const std::exception& e)
        {
          error(mLog) << "notification handler failed: " << e.what();
        }
      }
    }

    // Erases the record, cancelling its renewal. Returns false if it was
    // already gone.
    bool remove(const std::string& subscriptionId)
    {
      std::optional<Record> record;
      {
        std::lock_guard<std::mutex> lock(mMutex);
        const auto it = mRecords.find(subscriptionId);
        if (it == mRecords.end())
        {
          return false;
        }
        record = std::move(it->second);
        mRecords.erase(it);
      }
      return true;
    }

    void sendUnsubscribe(const std::string& deviceIp,
                         const Channel channel,
                         const std::string& subscriptionId)
    {
      try
      {
        const auto response = mTransport.send(
          deviceIp,
          mSettings.devicePort,
          makeUnsubscribeRequest(
            hostHeader(deviceIp), events::service(channel).eventPath, subscriptionId),
          mSettings.requestTimeout);
        if (!response.ok())
        {
          warning(mLog) << "unsubscribing " << subscriptionId << " from " << deviceIp
                        << " answered HTTP " << response.status;
        }
      }
      catch (const std::runtime_error& e)
      {
        warning(mLog) << "unsubscribing " << subscriptionId << " from " << deviceIp
                      << " failed: " << e.what();
      }
    }

    std::optional<std::string> findLocked(const std::string& deviceIp, const Channel channel) const
    {
      for (const auto& entry : mRecords)
      {
        const auto& s = entry.second.subscription;
        if (s.deviceIp == deviceIp && s.channel == channel)
        {
          return entry.first;
        }
      }
      return std::nullopt;
    }

    template <typename Predicate>
    std::vector<std::string> idsWhere(Predicate predicate) const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      std::vector<std::string> result;
      for (const auto& entry : mRecords)
      {
        if (predicate(entry.second.subscription))
        {
          result.push_back(entry.first);
        }
      }
      return result;
    }

    Transport& mTransport;
    util::Scheduler<IoContext> mScheduler;
    Log mLog;
    Settings mSettings;
    mutable std::mutex mMutex;
    std::map<std::string, Record> mRecords;
    std::map<std::string, std::string> mExpectedStreams;
    std::map<std::string, DeviceState> mDeviceStates;
    Handler mHandler;
    bool mRunning = false;
    std::uint16_t mListenPort = 0;
    std::string mLocalAddress;
  };

  std::shared_ptr<Impl> mpImpl;
};

} // namespace events
} // namespace roomcast
