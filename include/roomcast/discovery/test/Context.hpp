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

#include <roomcast/discovery/NetworkInterface.hpp>
#include <roomcast/discovery/test/Interface.hpp>
#include <roomcast/util/test/IoContext.hpp>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace roomcast
{
namespace discovery
{
namespace test
{

// Search context with scripted network interfaces on top of the manual
// io context.
class Context
{
public:
  using Timer = util::test::IoContext::Timer;
  using Interface = test::Interface;

  Timer makeTimer() { return mIo.makeTimer(); }

  template <typename Handler>
  void async(Handler handler)
  {
    mIo.async(std::move(handler));
  }

  std::vector<NetworkInterface> scanNetworkInterfaces()
  {
    if (mFailScan)
    {
      throw std::runtime_error("getifaddrs failed");
    }
    return mNetworkInterfaces;
  }

  std::shared_ptr<Interface> openSearchInterface(const ::asio::ip::address_v4& addr)
  {
    if (std::find(mFailingAddresses.begin(), mFailingAddresses.end(), addr)
        != mFailingAddresses.end())
    {
      throw std::runtime_error("cannot assign requested address");
    }
    mOpened.push_back(std::make_shared<Interface>(addr));
    return mOpened.back();
  }

  template <typename T, typename Rep>
  void advance(std::chrono::duration<T, Rep> duration)
  {
    mIo.advance(duration);
  }

  void runHandlers() { mIo.runHandlers(); }

  void addNetworkInterface(std::string name, const std::string& address)
  {
    mNetworkInterfaces.push_back({std::move(name), ::asio::ip::make_address_v4(address)});
  }

  void failToOpen(const std::string& address)
  {
    mFailingAddresses.push_back(::asio::ip::make_address_v4(address));
  }

  void failScan() { mFailScan = true; }

  const std::vector<std::shared_ptr<Interface>>& opened() const { return mOpened; }

private:
  util::test::IoContext mIo;
  std::vector<NetworkInterface> mNetworkInterfaces;
  std::vector<::asio::ip::address_v4> mFailingAddresses;
  std::vector<std::shared_ptr<Interface>> mOpened;
  bool mFailScan = false;
};

} // namespace test
} // namespace discovery
} // namespace roomcast
