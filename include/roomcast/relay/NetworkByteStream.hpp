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

#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace roomcast
{
namespace relay
{

// Unsigned integers in network byte order, for the fixed-size fields of
// frame headers. toNetworkByteStream writes the value and returns the
// iterator past it. Deserialize<T>::fromNetworkByteStream returns the value
// and the iterator past it and throws std::range_error if the range is too
// short.

template <typename T>
struct Deserialize;

namespace detail
{

template <typename T, typename It>
It copyToByteStream(const T value, It out)
{
  for (auto shift = static_cast<int>(sizeof(T) - 1) * 8; shift >= 0; shift -= 8)
  {
    *out++ = static_cast<std::uint8_t>((value >> shift) & 0xff);
  }
  return out;
}

template <typename T, typename It>
std::pair<T, It> copyFromByteStream(It begin, const It end)
{
  using ItDiff = typename std::iterator_traits<It>::difference_type;
  if (std::distance(begin, end) < static_cast<ItDiff>(sizeof(T)))
  {
    throw std::range_error("Parsing type from byte stream failed");
  }
  T value = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i)
  {
    value = static_cast<T>((value << 8) | static_cast<std::uint8_t>(*begin++));
  }
  return std::make_pair(value, begin);
}

} // namespace detail

template <typename It>
It toNetworkByteStream(const std::uint8_t byte, It out)
{
  return detail::copyToByteStream(byte, std::move(out));
}

template <typename It>
It toNetworkByteStream(const std::uint16_t s, It out)
{
  return detail::copyToByteStream(s, std::move(out));
}

template <typename It>
It toNetworkByteStream(const std::uint64_t ll, It out)
{
  return detail::copyToByteStream(ll, std::move(out));
}

template <>
struct Deserialize<std::uint8_t>
{
  template <typename It>
  static std::pair<std::uint8_t, It> fromNetworkByteStream(It begin, It end)
  {
    return detail::copyFromByteStream<std::uint8_t>(std::move(begin), std::move(end));
  }
};

template <>
struct Deserialize<std::uint16_t>
{
  template <typename It>
  static std::pair<std::uint16_t, It> fromNetworkByteStream(It begin, It end)
  {
    return detail::copyFromByteStream<std::uint16_t>(std::move(begin), std::move(end));
  }
};

template <>
struct Deserialize<std::uint64_t>
{
  template <typename It>
  static std::pair<std::uint64_t, It> fromNetworkByteStream(It begin, It end)
  {
    return detail::copyFromByteStream<std::uint64_t>(std::move(begin), std::move(end));
  }
};

} // namespace relay
} // namespace roomcast
