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

#include <roomcast/relay/WebSocket.hpp>
#include <roomcast/relay/test/Client.hpp>
#include <roomcast/test/CatchWrapper.hpp>

namespace roomcast
{
namespace relay
{
namespace websocket
{
namespace
{

http::Request upgradeRequest()
{
  http::Request request;
  request.method = "GET";
  request.target = "/ingest/s1?token=x";
  request.headers.set("Host", "192.168.1.5:3400");
  request.headers.set("Upgrade", "websocket");
  request.headers.set("Connection", "keep-alive, Upgrade");
  request.headers.set("Sec-WebSocket-Key", "dGhlIHNhbXBsZSBub25jZQ==");
  request.headers.set("Sec-WebSocket-Version", "13");
  return request;
}

} // namespace

TEST_CASE("WebSocket | Handshake", "[WebSocket]")
{
  CHECK("s3pPLMBiTxaQ9kYGzzhZRbK+xOo=" == acceptKey("dGhlIHNhbXBsZSBub25jZQ=="));

  auto request = upgradeRequest();
  CHECK(isUpgradeRequest(request));

  const auto response = makeHandshakeResponse(request);
  CHECK(101 == response.status);
  CHECK("websocket" == response.headers.get("Upgrade").value_or(""));
  CHECK("s3pPLMBiTxaQ9kYGzzhZRbK+xOo="
        == response.headers.get("Sec-WebSocket-Accept").value_or(""));

  SECTION("PlainGetIsNoUpgrade")
  {
    request.headers = {};
    CHECK(!isUpgradeRequest(request));
  }

  SECTION("PostIsNoUpgrade")
  {
    request.method = "POST";
    CHECK(!isUpgradeRequest(request));
  }
}

TEST_CASE("WebSocket | EncodeFrame", "[WebSocket]")
{
  CHECK((Bytes{0x81, 0x05, 'H', 'e', 'l', 'l', 'o'} == encodeFrame(Opcode::Text, "Hello")));

  const auto medium = encodeFrame(Opcode::Binary, std::string(300, 'x'));
  CHECK(304 == medium.size());
  CHECK((Bytes{0x82, 126, 0x01, 0x2c} == Bytes(medium.begin(), medium.begin() + 4)));

  const auto large = encodeFrame(Opcode::Binary, std::string(70000, 'x'));
  CHECK(70010 == large.size());
  CHECK((Bytes{0x82, 127, 0, 0, 0, 0, 0, 0x01, 0x11, 0x70}
         == Bytes(large.begin(), large.begin() + 10)));
}

TEST_CASE("WebSocket | Close", "[WebSocket]")
{
  const auto frame = encodeClose(kGoingAway, "bye");
  CHECK((Bytes{0x88, 0x05, 0x03, 0xe9, 'b', 'y', 'e'} == frame));

  const auto messages = test::serverMessages(frame);
  REQUIRE(1 == messages.size());
  CHECK(std::optional<std::uint16_t>{kGoingAway} == closeCode(messages[0]));
  CHECK(!closeCode(Message{Opcode::Close, {}}));
  CHECK(!closeCode(Message{Opcode::Text, {0x03, 0xe8}}));
}

TEST_CASE("FrameDecoder")
{
  FrameDecoder decoder(100000);

  SECTION("MaskedText")
  {
    const auto messages =
      decoder.feed(Bytes{0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f, 0x9f, 0x4d, 0x51, 0x58});
    REQUIRE(1 == messages.size());
    CHECK(Opcode::Text == messages[0].opcode);
    CHECK("Hello" == messages[0].text());
  }

  SECTION("ByteByByte")
  {
    const auto frame = test::clientFrame(Opcode::Binary, Bytes(300, 0x42));
    std::vector<Message> messages;
    for (const auto byte : frame)
    {
      for (auto& message : decoder.feed(&byte, 1))
      {
        messages.push_back(std::move(message));
      }
    }
    REQUIRE(1 == messages.size());
    CHECK(Opcode::Binary == messages[0].opcode);
    CHECK(Bytes(300, 0x42) == messages[0].payload);
  }

  SECTION("SeveralFramesAtOnce")
  {
    auto bytes = test::clientFrame(Opcode::Text, "one");
    const auto second = test::clientFrame(Opcode::Binary, Bytes(70000, 0x01));
    bytes.insert(bytes.end(), second.begin(), second.end());

    const auto messages = decoder.feed(bytes);
    REQUIRE(2 == messages.size());
    CHECK("one" == messages[0].text());
    CHECK(70000 == messages[1].payload.size());
  }

  SECTION("FragmentsWithPingInBetween")
  {
    CHECK(decoder.feed(test::clientFrame(Opcode::Text, Bytes{'a', 'b'}, false)).empty());

    const auto ping = decoder.feed(test::clientFrame(Opcode::Ping, "?"));
    REQUIRE(1 == ping.size());
    CHECK(Opcode::Ping == ping[0].opcode);

    CHECK(
      decoder.feed(test::clientFrame(Opcode::Continuation, Bytes{'c'}, false)).empty());
    const auto messages =
      decoder.feed(test::clientFrame(Opcode::Continuation, Bytes{'d'}, true));
    REQUIRE(1 == messages.size());
    CHECK(Opcode::Text == messages[0].opcode);
    CHECK("abcd" == messages[0].text());
  }

  SECTION("UnmaskedFrame")
  {
    CHECK_THROWS_AS(decoder.feed(encodeFrame(Opcode::Text, "Hello")), ProtocolError);
  }

  SECTION("ReservedBits")
  {
    auto frame = test::clientFrame(Opcode::Text, "x");
    frame[0] |= 0x40;
    CHECK_THROWS_AS(decoder.feed(frame), ProtocolError);
  }

  SECTION("UnknownOpcode")
  {
    auto frame = test::clientFrame(Opcode::Text, "x");
    frame[0] = 0x83;
    CHECK_THROWS_AS(decoder.feed(frame), ProtocolError);
  }

  SECTION("FragmentedControlFrame")
  {
    CHECK_THROWS_AS(
      decoder.feed(test::clientFrame(Opcode::Ping, Bytes{1}, false)), ProtocolError);
  }

  SECTION("ContinuationWithoutStart")
  {
    CHECK_THROWS_AS(
      decoder.feed(test::clientFrame(Opcode::Continuation, Bytes{1})), ProtocolError);
  }

  SECTION("TooBig")
  {
    try
    {
      decoder.feed(test::clientFrame(Opcode::Binary, Bytes(100001, 0)));
      FAIL("frame was accepted");
    }
    catch (const ProtocolError& e)
    {
      CHECK(kMessageTooBig == e.closeCode);
    }
  }

  SECTION("TooBigWhenJoined")
  {
    decoder.feed(test::clientFrame(Opcode::Binary, Bytes(60000, 0), false));
    try
    {
      decoder.feed(test::clientFrame(Opcode::Continuation, Bytes(60000, 0)));
      FAIL("message was accepted");
    }
    catch (const ProtocolError& e)
    {
      CHECK(kMessageTooBig == e.closeCode);
    }
  }
}

} // namespace websocket
} // namespace relay
} // namespace roomcast
