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


#include <roomcast/Engine.hpp>
#include <roomcast/platforms/asio/AsioWrapper.hpp>
#include <roomcast/relay/test/Client.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <thread>

namespace roomcast
{
namespace
{

Engine::Settings loopbackSettings()
{
  Engine::Settings settings;
  settings.bindAddress = "127.0.0.1";
  settings.advertisedAddress = "127.0.0.1";
  settings.port = 0;
  settings.numFallbackPorts = 0;
  settings.logLevel = util::LogLevel::Error;
  settings.relay.ingestSecret = "secret";
  return settings;
}

// Blocking client side of one connection
class Connection
{
public:
  explicit Connection(const std::uint16_t port)
    : mSocket(mIo)
  {
    mSocket.connect({::asio::ip::make_address("127.0.0.1"), port});
  }

  void send(const std::string& data) { ::asio::write(mSocket, ::asio::buffer(data)); }

  void send(const relay::Bytes& data) { ::asio::write(mSocket, ::asio::buffer(data)); }

  // Everything received up to and including the delimiter
  std::string readUntil(const std::string& delimiter)
  {
    const auto size = ::asio::read_until(mSocket, ::asio::dynamic_buffer(mReceived), delimiter);
    auto result = mReceived.substr(0, size);
    mReceived.erase(0, size);
    return result;
  }

  std::string readToEnd()
  {
    ::asio::error_code ec;
    ::asio::read(mSocket, ::asio::dynamic_buffer(mReceived), ec);
    return std::move(mReceived);
  }

private:
  ::asio::io_context mIo;
  ::asio::ip::tcp::socket mSocket;
  std::string mReceived;
};

std::string request(const std::uint16_t port, const std::string& raw)
{
  Connection connection{port};
  connection.send(raw);
  return connection.readToEnd();
}

std::string body(const std::string& response)
{
  return response.substr(response.find("\r\n\r\n") + 4);
}

std::string upgradeRequest(const std::string& target)
{
  return "GET " + target
         + " HTTP/1.1\r\nHost: localhost\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
           "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\nSec-WebSocket-Version: 13\r\n\r\n";
}

} // namespace

TEST_CASE("Engine | Endpoints", "[Engine]")
{
  Engine engine{loopbackSettings()};
  const auto port = engine.start();
  CHECK(port != 0);
  CHECK(engine.isRunning());
  CHECK("http://127.0.0.1:" + std::to_string(port) == engine.baseUrl());
  CHECK(engine.baseUrl() + "/streams/s1/live.mp3" == engine.streamUrl("s1"));

  SECTION("Health")
  {
    engine.streams().createOrGetStream("s1");
    const auto response = request(port, "GET /health HTTP/1.1\r\nHost: x\r\n\r\n");
    REQUIRE(response.rfind("HTTP/1.1 200", 0) == 0);
    const auto json = nlohmann::json::parse(body(response));
    CHECK("ok" == json["status"]);
    CHECK(1 == json["streamCount"]);
    CHECK("s1" == json["streams"][0]["id"]);
    CHECK(json["listener"]["running"].get<bool>());
  }

  SECTION("IssueToken")
  {
    const auto response = request(port, "POST /streams/s2/token HTTP/1.1\r\nHost: x\r\n\r\n");
    REQUIRE(response.rfind("HTTP/1.1 200", 0) == 0);
    const auto json = nlohmann::json::parse(body(response));
    CHECK("s2" == json["streamId"]);
    CHECK_NOTHROW(engine.streams().validateIngestToken("s2", json["token"].get<std::string>()));
    CHECK(engine.streams().getStream("s2"));
  }

  SECTION("Unrouted")
  {
    CHECK(request(port, "GET /nothing HTTP/1.1\r\n\r\n").rfind("HTTP/1.1 404", 0) == 0);
    CHECK(request(port, "DELETE /health HTTP/1.1\r\n\r\n").rfind("HTTP/1.1 405", 0) == 0);
    CHECK(request(port, "GET /streams/none/live.mp3 HTTP/1.1\r\n\r\n").rfind("HTTP/1.1 404", 0)
          == 0);
  }

  SECTION("UnknownStream")
  {
    CHECK_THROWS_AS(engine.setStreamMetadata("none", {}), relay::StreamNotFound);
  }

  engine.stop();
  CHECK(!engine.isRunning());
}

TEST_CASE("Engine | LiveStream", "[Engine]")
{
  Engine engine{loopbackSettings()};
  const auto port = engine.start();
  engine.streams().createOrGetStream("s1");
  engine.streams().pushFrame("s1", relay::Bytes{'a', 'b', 'c'});

  Connection listener{port};
  listener.send(std::string{"GET /streams/s1/live.mp3 HTTP/1.1\r\nHost: x\r\n\r\n"});
  const auto head = listener.readUntil("\r\n\r\n");
  CHECK(head.rfind("HTTP/1.1 200", 0) == 0);
  CHECK(head.find("Content-Type: audio/mpeg") != std::string::npos);
  CHECK(head.find("Transfer-Encoding: chunked") != std::string::npos);
  CHECK(head.find("icy-metaint") == std::string::npos);

  CHECK("3\r\nabc\r\n" == listener.readUntil("abc\r\n"));
  CHECK(1 == engine.streams().getStream("s1")->numConsumers);

  engine.streams().removeStream("s1");
  CHECK("0\r\n\r\n" == listener.readToEnd());
}

TEST_CASE("Engine | Ingest", "[Engine]")
{
  Engine engine{loopbackSettings()};
  const auto port = engine.start();

  SECTION("InvalidToken")
  {
    const auto response = request(port, upgradeRequest("/ingest/s1?token=nope"));
    CHECK(response.rfind("HTTP/1.1 401", 0) == 0);
    CHECK(!engine.streams().getStream("s1"));
  }

  SECTION("NoUpgrade")
  {
    const auto token = engine.issueIngestToken("s1");
    const auto response =
      request(port, "GET /ingest/s1?token=" + token + " HTTP/1.1\r\nHost: x\r\n\r\n");
    CHECK(response.rfind("HTTP/1.1 400", 0) == 0);
  }

  SECTION("Frames")
  {
    const auto token = engine.issueIngestToken("s1");
    Connection producer{port};
    producer.send(upgradeRequest("/ingest/s1?token=" + token));
    const auto head = producer.readUntil("\r\n\r\n");
    REQUIRE(head.rfind("HTTP/1.1 101", 0) == 0);
    CHECK(head.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=") != std::string::npos);

    producer.send(relay::test::clientFrame(relay::websocket::Opcode::Binary, relay::Bytes{1, 2}));
    producer.send(relay::test::clientFrame(relay::websocket::Opcode::Close, relay::Bytes{0x03, 0xe8}));
    const auto rest = producer.readToEnd();
    const auto messages = relay::test::serverMessages(relay::Bytes(rest.begin(), rest.end()));
    REQUIRE(messages.size() == 2);
    CHECK(messages.front().text().find("STREAM_READY") != std::string::npos);
    CHECK(relay::websocket::Opcode::Close == messages.back().opcode);

    const auto stream = engine.streams().getStream("s1");
    REQUIRE(stream);
    CHECK(1 == stream->numFramesPushed);
  }

  SECTION("Handshake")
  {
    const auto token = engine.issueIngestToken("s1");
    Connection producer{port};
    producer.send(upgradeRequest("/ingest/s1?token=" + token));
    REQUIRE(producer.readUntil("\r\n\r\n").rfind("HTTP/1.1 101", 0) == 0);

    producer.send(relay::test::clientFrame(
      relay::websocket::Opcode::Text,
      R"({"type":"HANDSHAKE","payload":{"encoderConfig":{"codec":"flac"}}})"));
    producer.send(relay::test::clientFrame(
      relay::websocket::Opcode::Text, R"({"type":"START_PLAYBACK","payload":{}})"));
    producer.send(relay::test::clientFrame(relay::websocket::Opcode::Close, relay::Bytes{0x03, 0xe8}));
    const auto rest = producer.readToEnd();
    const auto messages = relay::test::serverMessages(relay::Bytes(rest.begin(), rest.end()));
    REQUIRE(messages.size() == 3);
    const auto ack = nlohmann::json::parse(messages[0].text());
    CHECK("HANDSHAKE_ACK" == ack["type"]);
    CHECK("s1" == ack["payload"]["streamId"]);
    CHECK("PLAYBACK_ERROR" == nlohmann::json::parse(messages[1].text())["type"]);

    CHECK(engine.baseUrl() + "/streams/s1/live.flac" == engine.streamUrl("s1"));
  }
}

} // namespace roomcast
