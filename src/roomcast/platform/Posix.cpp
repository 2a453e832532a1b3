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

#include <roomcast/platforms/posix/ScanIpIfAddrs.hpp>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>

namespace
{

// RAII type to make [get,free]ifaddrs function pairs exception safe
struct GetIfAddrs
{
  GetIfAddrs()
  {
    if (getifaddrs(&interfaces)) // returns 0 on success
    {
      interfaces = nullptr;
    }
  }
  ~GetIfAddrs()
  {
    if (interfaces)
    {
      freeifaddrs(interfaces);
    }
  }

  // RAII must not copy
  GetIfAddrs(GetIfAddrs&) = delete;
  GetIfAddrs& operator=(GetIfAddrs&) = delete;

  template <typename Function>
  void withIfAddrs(Function f)
  {
    if (interfaces)
    {
      f(*interfaces);
    }
  }

private:
  struct ifaddrs* interfaces = nullptr;
};

} // anonymous namespace

namespace roomcast
{
namespace platforms
{
namespace posix
{

std::vector<discovery::NetworkInterface> ScanIpIfAddrs::operator()()
{
  std::vector<discovery::NetworkInterface> result;

  GetIfAddrs getIfAddrs;
  getIfAddrs.withIfAddrs(
    [&](const struct ifaddrs& interfaces)
    {
      for (auto pInterface = &interfaces; pInterface; pInterface = pInterface->ifa_next)
      {
        const auto pAddr = pInterface->ifa_addr;
        if (pAddr && (pInterface->ifa_flags & IFF_UP) && pAddr->sa_family == AF_INET)
        {
          const auto pAddrIn = reinterpret_cast<const struct sockaddr_in*>(pAddr);
          auto address = ::asio::ip::address_v4{ntohl(pAddrIn->sin_addr.s_addr)};
          result.push_back({pInterface->ifa_name ? pInterface->ifa_name : "",
                            std::move(address)});
        }
      }
    });

  return result;
}

} // namespace posix
} // namespace platforms
} // namespace roomcast
