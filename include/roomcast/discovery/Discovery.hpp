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
#include <roomcast/discovery/NetworkInterface.hpp>
#include <roomcast/discovery/Ssdp.hpp>
#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace roomcast
{
namespace discovery
{

// Multicast device search over every usable network interface.
//
// IoContext must provide Timer and Interface types, makeTimer(),
// async(handler), scanNetworkInterfaces() and
// openSearchInterface(address_v4) returning std::shared_ptr<Interface>.
// Interface must provide send(data, size, endpoint), receive(handler),
// and close().
//
// Discovery uses a "shared_ptr pImpl" pattern so that work posted to the
// io context never outlives the objects it refers to.
template <typename IoContext, typename Log>
class Discovery
{
public:
  using Devices = std::vector<DiscoveredDevice>;
  using Callback = std::function<void(Devices)>;
  using Timer = typename IoContext::Timer;
  using TimerError = typename Timer::ErrorCode;
  using Interface = typename IoContext::Interface;

  Discovery(IoContext& io, Log log, Settings settings = {})
    : mpImpl(std::make_shared<Impl>(io, channel(log, "discovery"), std::move(settings)))
  {
  }

  Discovery(const Discovery&) = delete;
  Discovery& operator=(const Discovery&) = delete;

  // Runs one search and calls back exactly once on the io thread with the
  // devices found, in the order they answered. Never throws; failures are
  // logged and reported as an empty result.
  void discoverAsync(const std::chrono::milliseconds timeout, Callback callback)
  {
    std::weak_ptr<Impl> wpImpl = mpImpl;
    mpImpl->mIo.async(
      [wpImpl, timeout, callback = std::move(callback)]() mutable
      {
        if (const auto pImpl = wpImpl.lock())
        {
          pImpl->startSearch(timeout, std::move(callback));
        }
        else
        {
          callback({});
        }
      });
  }

  // Blocking search. Must not be called from the io context's thread.
  Devices discover(const std::chrono::milliseconds timeout)
  {
    auto pPromise = std::make_shared<std::promise<Devices>>();
    auto result = pPromise->get_future();
    discoverAsync(timeout,
                  [pPromise](Devices devices) { pPromise->set_value(std::move(devices)); });

    // The search ends itself once the timeout has passed, the margin
    // only covers a busy io thread
    if (result.wait_for(timeout + std::chrono::seconds(1)) != std::future_status::ready)
    {
      warning(mpImpl->mLog) << "search did not complete in time";
      cancel();
      return {};
    }
    return result.get();
  }

  Devices discover() { return discover(mpImpl->mSettings.timeout); }

  // Stops listening on all running searches. Their callbacks receive what
  // has been found so far. Searches already sent are not retracted.
  void cancel()
  {
    std::weak_ptr<Impl> wpImpl = mpImpl;
    mpImpl->mIo.async(
      [wpImpl]
      {
        if (const auto pImpl = wpImpl.lock())
        {
          auto searches = pImpl->mSearches;
          for (const auto& pSearch : searches)
          {
            pSearch->finish();
          }
        }
      });
  }

  const Settings& settings() const { return mpImpl->mSettings; }

private:
  struct OpenInterface
  {
    NetworkInterface info;
    std::shared_ptr<Interface> pInterface;
  };

  struct Search : std::enable_shared_from_this<Search>
  {
    Search(Timer timer,
           Log log,
           const Settings& settings,
           const std::chrono::milliseconds timeout,
           Callback callback)
      : mTimer(std::move(timer))
      , mLog(std::move(log))
      , mSettings(settings)
      , mTimeout(timeout)
      , mCallback(std::move(callback))
    {
    }

    void start(std::vector<OpenInterface> interfaces)
    {
      mInterfaces = std::move(interfaces);
      for (std::size_t i = 0; i < mInterfaces.size(); ++i)
      {
        listen(i);
      }
      sendSearch(0);
    }

    void listen(const std::size_t index)
    {
      std::weak_ptr<Search> wpSelf = this->shared_from_this();
      mInterfaces[index].pInterface->receive(
        [wpSelf, index](const auto& from, const auto begin, const auto end)
        {
          if (const auto pSelf = wpSelf.lock())
          {
            pSelf->onDatagram(index, from, begin, end);
          }
        });
    }

    template <typename Endpoint, typename It>
    void onDatagram(const std::size_t index, const Endpoint& from, const It begin, const It end)
    {
      if (mFinished)
      {
        return;
      }

      if (auto device =
            parseSearchResponse(std::string(begin, end), mSettings.devicePrefix))
      {
        const auto known = std::any_of(mDevices.begin(),
                                       mDevices.end(),
                                       [&](const DiscoveredDevice& d)
                                       { return d.uuid == device->uuid; });
        if (!known)
        {
          debug(mLog) << "found " << device->uuid << " at " << device->ip << " (answer from "
                      << from.address().to_string() << " via "
                      << mInterfaces[index].info.name << ")";
          mDevices.push_back(std::move(*device));
        }
      }
      listen(index);
    }

    void sendSearch(const unsigned round)
    {
      const auto message = makeSearchRequest(mSettings.searchTarget, mSettings.mx);
      for (const auto& iface : mInterfaces)
      {
        std::vector<::asio::ip::udp::endpoint> targets{multicastEndpoint()};
        if (mSettings.broadcastSearch)
        {
          const auto broadcast = broadcastEndpoints(iface.info.address);
          targets.insert(targets.end(), broadcast.begin(), broadcast.end());
        }
        for (const auto& target : targets)
        {
          try
          {
            iface.pInterface->send(
              reinterpret_cast<const uint8_t*>(message.data()), message.size(), target);
          }
          catch (const std::runtime_error& e)
          {
            warning(mLog) << "M-SEARCH on " << iface.info.name << " to "
                          << target.address().to_string() << " failed: " << e.what();
          }
        }
      }

      std::weak_ptr<Search> wpSelf = this->shared_from_this();
      if (round + 1 < std::max(mSettings.retryCount, 1u))
      {
        mTimer.expires_from_now(mSettings.retryInterval);
        mTimer.async_wait(
          [wpSelf, round](const TimerError e)
          {
            const auto pSelf = wpSelf.lock();
            if (!e && pSelf)
            {
              pSelf->sendSearch(round + 1);
            }
          });
      }
      else
      {
        mTimer.expires_from_now(listenWindow());
        mTimer.async_wait(
          [wpSelf](const TimerError e)
          {
            const auto pSelf = wpSelf.lock();
            if (!e && pSelf)
            {
              pSelf->finish();
            }
          });
      }
    }

    // Time left for answers after the last search
    std::chrono::milliseconds listenWindow() const
    {
      const auto probing =
        mSettings.retryInterval * (std::max(mSettings.retryCount, 1u) - 1);
      return std::max(mTimeout - probing, std::chrono::milliseconds{0});
    }

    void finish()
    {
      if (mFinished)
      {
        return;
      }
      // The callback drops the last owning reference
      const auto self = this->shared_from_this();
      mFinished = true;
      mTimer.cancel();
      for (auto& iface : mInterfaces)
      {
        iface.pInterface->close();
      }
      mInterfaces.clear();

      info(mLog) << "search finished with " << mDevices.size() << " device(s)";
      auto callback = std::move(mCallback);
      callback(std::move(mDevices));
    }

    Timer mTimer;
    Log mLog;
    Settings mSettings;
    std::chrono::milliseconds mTimeout;
    Callback mCallback;
    std::vector<OpenInterface> mInterfaces;
    Devices mDevices;
    bool mFinished = false;
  };

  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(IoContext& io, Log log, Settings settings)
      : mIo(io)
      , mLog(std::move(log))
      , mSettings(std::move(settings))
    {
    }

    void startSearch(const std::chrono::milliseconds timeout, Callback callback)
    {
      auto interfaces = openInterfaces();
      if (interfaces.empty())
      {
        error(mLog) << "no network interface to search on";
        callback({});
        return;
      }

      std::weak_ptr<Impl> wpImpl = this->shared_from_this();
      auto pSearch =
        std::make_shared<Search>(mIo.makeTimer(),
                                 mLog,
                                 mSettings,
                                 timeout,
                                 [wpImpl, callback = std::move(callback)](Devices devices)
                                 {
                                   if (const auto pImpl = wpImpl.lock())
                                   {
                                     pImpl->retire();
                                   }
                                   callback(std::move(devices));
                                 });
      mSearches.push_back(pSearch);
      pSearch->start(std::move(interfaces));
    }

    std::vector<OpenInterface> openInterfaces()
    {
      std::vector<NetworkInterface> candidates;
      try
      {
        candidates = mIo.scanNetworkInterfaces();
      }
      catch (const std::runtime_error& e)
      {
        error(mLog) << "scanning network interfaces failed: " << e.what();
        return {};
      }

      std::vector<OpenInterface> result;
      for (const auto& candidate : candidates)
      {
        if (!isUsableForDiscovery(candidate))
        {
          debug(mLog) << "ignoring interface " << candidate.name;
          continue;
        }
        try
        {
          result.push_back({candidate, mIo.openSearchInterface(candidate.address)});
        }
        catch (const std::runtime_error& e)
        {
          warning(mLog) << "skipping interface " << candidate.name << " ("
                        << candidate.address.to_string() << "): " << e.what();
        }
      }
      return result;
    }

    // Drops searches that have finished
    void retire()
    {
      mSearches.erase(std::remove_if(mSearches.begin(),
                                     mSearches.end(),
                                     [](const std::shared_ptr<Search>& pSearch)
                                     { return pSearch->mFinished; }),
                      mSearches.end());
    }

    IoContext& mIo;
    Log mLog;
    Settings mSettings;
    std::vector<std::shared_ptr<Search>> mSearches;
  };

  std::shared_ptr<Impl> mpImpl;
};

} // namespace discovery
} // namespace roomcast
