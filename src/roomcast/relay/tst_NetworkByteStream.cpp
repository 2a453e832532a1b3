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

#include <roomcast/relay/NetworkByteStream.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <vector>

namespace roomcast
{
namespace relay
{

TEST_CASE("NetworkByteStream")
{
  using namespace std;

  SECTION("BigEndianEncoding")
  {
    auto byteStream = vector<uint8_t>{};
    auto out = back_inserter(byteStream);
    out = toNetworkByteStream(uint8_t{0x81}, out);
    out = toNetworkByteStream(uint16_t{0x1234}, out);
    toNetworkByteStream(uint64_t{0x0102030405060708}, out);
    CHECK((vector<uint8_t>{0x81, 0x12, 0x34, 1, 2, 3, 4, 5, 6, 7, 8} == byteStream));
  }

  SECTION("Decoding")
  {
    const auto byteStream = vector<uint8_t>{0x12, 0x34, 0xff};
    const auto deserialized =
      Deserialize<uint16_t>::fromNetworkByteStream(begin(byteStream), end(byteStream));
    CHECK(0x1234 == deserialized.first);
    CHECK(2 == distance(begin(byteStream), deserialized.second));
  }

  SECTION("ShortRangeThrows")
  {
    const auto byteStream = vector<uint8_t>{1, 2, 3};
    CHECK_THROWS_AS(
      Deserialize<uint64_t>::fromNetworkByteStream(begin(byteStream), end(byteStream)),
      range_error);
  }
}

} // namespace relay
} // namespace roomcast
