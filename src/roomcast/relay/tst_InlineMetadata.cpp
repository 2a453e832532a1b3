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

#include <roomcast/relay/IcyInterleaver.hpp>
#include <roomcast/relay/InlineMetadata.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <string>

namespace roomcast
{
namespace relay
{
namespace
{

std::string payloadOf(const Bytes& block)
{
  std::string text(block.begin() + 1, block.end());
  return text.substr(0, text.find('\0'));
}

StreamMetadata metadata(std::optional<std::string> title, std::optional<std::string> artist)
{
  return {std::move(title), std::move(artist), std::nullopt};
}

} // namespace

TEST_CASE("InlineMetadata | ArtistAndTitle", "[InlineMetadata]")
{
  const auto block = formatInlineMetadata(metadata("Song", "Artist"));
  const std::string expected = "StreamTitle='Artist - Song';";
  CHECK((expected.size() + 15) / 16 == block[0]);
  CHECK(1 + block[0] * 16u == block.size());
  CHECK(expected == payloadOf(block));
}

TEST_CASE("InlineMetadata | TitleOnly", "[InlineMetadata]")
{
  const auto block = formatInlineMetadata(metadata("Test Song", std::nullopt));
  CHECK(2 == block[0]);
  CHECK(33 == block.size());
  CHECK("StreamTitle='Test Song';" == payloadOf(block));
}

TEST_CASE("InlineMetadata | ArtistOnly", "[InlineMetadata]")
{
  CHECK("StreamTitle='Artist';"
        == payloadOf(formatInlineMetadata(metadata(std::nullopt, "Artist"))));
}

TEST_CASE("InlineMetadata | Empty", "[InlineMetadata]")
{
  CHECK(Bytes{0} == formatInlineMetadata({}));
  CHECK(Bytes{0} == formatInlineMetadata(metadata("", std::nullopt)));
}

TEST_CASE("InlineMetadata | QuotesAreEscaped", "[InlineMetadata]")
{
  CHECK("StreamTitle='Don\\'t Stop - It\\'s';"
        == payloadOf(formatInlineMetadata(metadata("It's", "Don't Stop"))));
}

TEST_CASE("InlineMetadata | ExactBlockBoundary", "[InlineMetadata]")
{
  // 13 + 17 + 2 bytes fill two blocks without padding
  const auto block = formatInlineMetadata(metadata("abcdefghijklmnopq", std::nullopt));
  CHECK(2 == block[0]);
  CHECK(33 == block.size());
  CHECK(';' == block.back());
}

TEST_CASE("InlineMetadata | Truncation", "[InlineMetadata]")
{
  SECTION("AsciiFillsAllBlocks")
  {
    const auto block = formatInlineMetadata(metadata(std::string(5000, 'a'), std::nullopt));
    CHECK(255 == block[0]);
    CHECK(1 + 255 * 16u == block.size());
    CHECK('a' == block.back());
  }

  SECTION("KeepsMultiByteCharactersWhole")
  {
    // "StreamTitle='" is 13 bytes, so the last block ends inside the
    // first two-byte character
    std::string title(4066, 'a');
    for (int i = 0; i < 10; ++i)
    {
      title += "\xc3\xa9";
    }
    const auto block = formatInlineMetadata(metadata(title, std::nullopt));
    REQUIRE(1 + 255 * 16u == block.size());
    CHECK('a' == block[4079]);
    CHECK(0 == block[4080]);
  }
}

TEST_CASE("InlineMetadata | IgnoresAlbum", "[InlineMetadata]")
{
  auto withAlbum = metadata("Song", "Artist");
  withAlbum.album = "Album";
  CHECK(formatInlineMetadata(metadata("Song", "Artist")) == formatInlineMetadata(withAlbum));
}

TEST_CASE("IcyInterleaver")
{
  IcyInterleaver interleaver;
  const Bytes block = formatInlineMetadata(metadata("Song", "Artist"));

  SECTION("BelowInterval")
  {
    const auto out = interleaver.interleave(Bytes(1000, 0xaa), block);
    CHECK(1000 == out.size());
    CHECK(1000 == interleaver.bytesSinceBlock());
  }

  SECTION("AtInterval")
  {
    const auto out = interleaver.interleave(Bytes(kIcyMetaInt, 0xaa), block);
    REQUIRE(kIcyMetaInt + block.size() == out.size());
    CHECK(Bytes(out.begin() + kIcyMetaInt, out.end()) == block);
    CHECK(0 == interleaver.bytesSinceBlock());
  }

  SECTION("SeveralIntervalsInOneChunk")
  {
    const Bytes empty{0};
    const auto out = interleaver.interleave(Bytes(kIcyMetaInt * 2 + kIcyMetaInt / 2, 0xaa), empty);
    CHECK(kIcyMetaInt * 2 + kIcyMetaInt / 2 + 2 == out.size());
    CHECK(0 == out[kIcyMetaInt]);
    CHECK(0 == out[kIcyMetaInt * 2 + 1]);
    CHECK(kIcyMetaInt / 2 == interleaver.bytesSinceBlock());
  }

  SECTION("IntervalSpansChunks")
  {
    const auto first = interleaver.interleave(Bytes(5000, 0xaa), block);
    CHECK(5000 == first.size());
    const auto second = interleaver.interleave(Bytes(5000, 0xbb), block);
    REQUIRE(5000 + block.size() == second.size());
    CHECK(0xbb == second[kIcyMetaInt - 5000 - 1]);
    CHECK(Bytes(second.begin() + (kIcyMetaInt - 5000),
                second.begin() + static_cast<std::ptrdiff_t>(kIcyMetaInt - 5000 + block.size()))
          == block);
    CHECK(5000 - (kIcyMetaInt - 5000) == interleaver.bytesSinceBlock());
  }

  SECTION("SmallInterval")
  {
    IcyInterleaver small{4};
    const Bytes marker{9};
    CHECK((Bytes{1, 2, 3, 4, 9, 5, 6}) == small.interleave(Bytes{1, 2, 3, 4, 5, 6}, marker));
    CHECK((Bytes{7, 8, 9}) == small.interleave(Bytes{7, 8}, marker));
  }
}

} // namespace relay
} // namespace roomcast
