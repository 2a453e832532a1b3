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

#include <roomcast/platforms/asio/AsioWrapper.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <memory>

namespace roomcast
{
namespace platforms
{
namespace asio
{

// A UDP socket bound to one local interface address. Multicast and
// broadcast searches sent through it leave on that interface and unicast
// answers come back to it.
//
// The socket state lives in a shared Impl so that a pending receive never
// touches a socket that has already been closed and destroyed.
class UdpInterface
{
public:
  static constexpr std::size_t kMaxPacketSize = 2048;
  using Buffer = std::array<uint8_t, kMaxPacketSize>;
  using ByteIt = Buffer::const_iterator;
  using Endpoint = ::asio::ip::udp::endpoint;

  UdpInterface(::asio::io_context& io, const ::asio::ip::address_v4& addr)
    : mpImpl(std::make_shared<Impl>(io))
  {
    auto& socket = mpImpl->mSocket;
    socket.open(::asio::ip::udp::v4());
    socket.set_option(::asio::ip::udp::socket::reuse_address(true));
    socket.set_option(::asio::ip::multicast::enable_loopback(addr.is_loopback()));
    socket.set_option(::asio::ip::multicast::outbound_interface(addr));
    socket.set_option(::asio::ip::multicast::hops(4));
    socket.set_option(::asio::socket_base::broadcast(true));
    socket.bind(Endpoint{addr, 0});
  }

  UdpInterface(const UdpInterface&) = delete;
  UdpInterface& operator=(const UdpInterface&) = delete;

  ~UdpInterface() { close(); }

  // Throws asio::system_error
  std::size_t send(const uint8_t* const pData,
                   const std::size_t numBytes,
                   const Endpoint& to)
  {
    return mpImpl->mSocket.send_to(::asio::buffer(pData, numBytes), to);
  }

  // Handler is called once with (from, begin, end) for the next datagram
  template <typename Handler>
  void receive(Handler handler)
  {
    mpImpl->mHandler = std::move(handler);
    std::weak_ptr<Impl> wpImpl = mpImpl;
    mpImpl->mSocket.async_receive_from(
      ::asio::buffer(mpImpl->mReceiveBuffer, kMaxPacketSize),
      mpImpl->mSenderEndpoint,
      [wpImpl](const ::asio::error_code& error, const std::size_t numBytes)
      {
        if (const auto pImpl = wpImpl.lock())
        {
          (*pImpl)(error, numBytes);
        }
      });
  }

  Endpoint endpoint() const { return mpImpl->mSocket.local_endpoint(); }

  void close()
  {
    // Ignore error codes in shutdown and close as the socket may
    // have already been forcibly closed
    ::asio::error_code ec;
    mpImpl->mSocket.shutdown(::asio::ip::udp::socket::shutdown_both, ec);
    mpImpl->mSocket.close(ec);
    mpImpl->mHandler = nullptr;
  }

private:
  struct Impl
  {
    Impl(::asio::io_context& io)
      : mSocket(io)
    {
    }

    void operator()(const ::asio::error_code& error, const std::size_t numBytes)
    {
      if (!error && numBytes > 0 && numBytes <= kMaxPacketSize && mHandler)
      {
        auto handler = std::move(mHandler);
        mHandler = nullptr;
        const auto bufBegin = mReceiveBuffer.cbegin();
        handler(mSenderEndpoint, bufBegin, bufBegin + static_cast<ptrdiff_t>(numBytes));
      }
    }

    ::asio::ip::udp::socket mSocket;
    Endpoint mSenderEndpoint;
    Buffer mReceiveBuffer;
    std::function<void(const Endpoint&, ByteIt, ByteIt)> mHandler;
  };

  std::shared_ptr<Impl> mpImpl;
};

} // namespace asio
} // namespace platforms
} // namespace roomcast
