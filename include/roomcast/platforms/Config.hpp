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

#include <roomcast/platforms/asio/Context.hpp>
#include <roomcast/platforms/asio/HttpServer.hpp>
#include <roomcast/platforms/asio/HttpTransport.hpp>
#include <roomcast/platforms/posix/ScanIpIfAddrs.hpp>
#include <roomcast/platforms/stl/Clock.hpp>
#include <roomcast/util/Log.hpp>

#if defined(ROOMCAST_PLATFORM_LINUX)
#include <roomcast/platforms/linux/ThreadFactory.hpp>
#endif

namespace roomcast
{
namespace platform
{

#if defined(ROOMCAST_PLATFORM_LINUX)
using ThreadFactory = platforms::linux_::ThreadFactory;
#else
#error "Missing ROOMCAST_PLATFORM_LINUX"
#endif

using Clock = platforms::stl::Clock;
using Log = util::Timestamped<util::StdLog>;
using IoContext = platforms::asio::Context<platforms::posix::ScanIpIfAddrs, Log, ThreadFactory>;
using Transport = platforms::asio::HttpTransport;
using HttpServer = platforms::asio::HttpServer<ThreadFactory, Log>;

} // namespace platform
} // namespace roomcast
