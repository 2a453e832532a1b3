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

#include <roomcast/relay/IngestSession.hpp>
#include <roomcast/relay/Relay.hpp>
#include <roomcast/relay/test/Client.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/util/test/Clock.hpp>
#include <roomcast/util/test/Log.hpp>
#include <map>
#include <set>
#include <stdexcept>
#include <vector>

namespace roomcast
{
namespace relay
{
namespace
{

// Devices listed in unreachable fail every command
struct Devices
{
  void check(const std::string& ip) const
  {
    if (unreachable.count(ip))
    {
      throw std::runtime_error{ip + ": connection refused"};
    }
  }

  void setVolume(const std::string& ip, const int value, const bool group)
  {
    check(ip);
    volumes[ip] = value;
    groupCommands += group ? 1 : 0;
  }

  int volume(const std::string& ip) const
  {
    check(ip);
    return volumes.at(ip);
  }

  void setMute(const std::string& ip, const bool value, const bool group)
  {
    check(ip);
    mutes[ip] = value;
    groupCommands += group ? 1 : 0;
  }

  bool mute(const std::string& ip) const
  {
    check(ip);
    return mutes.at(ip);
  }

  std::string play(const std::string& ip,
                   const std::string& streamId,
                   const std::optional<StreamMetadata>&)
  {
    check(ip);
    playing.push_back(ip);
    return "http://10.0.0.2:49400/streams/" + streamId + "/live.mp3";
  }

  void stop(const std::string& ip)
  {
    check(ip);
    stopped.push_back(ip);
  }

  std::map<std::string, int> volumes{{"10.0.0.5", 30}};
  std::map<std::string, bool> mutes{{"10.0.0.5", false}};
  std::set<std::string> unreachable;
  std::vector<std::string> playing;
  std::vector<std::string> stopped;
  int groupCommands = 0;
};

using TestRelay = Relay<util::test::Clock, util::test::CapturingLog>;
using Session = IngestSession<TestRelay, Devices, util::test::CapturingLog>;
using websocket::Opcode;

struct Fixture
{
  Fixture() { relay.createOrGetStream("s1"); }

  util::test::Clock clock;
  util::test::CapturingLog log;
  TestRelay relay{log, Settings{}, clock};
  Devices devices;
};

nlohmann::json onlyText(const Bytes& reply)
{
  const auto messages = test::serverMessages(reply);
  REQUIRE(1 == messages.size());
  REQUIRE(Opcode::Text == messages[0].opcode);
  return nlohmann::json::parse(messages[0].text());
}

std::optional<std::uint16_t> onlyClose(const Bytes& reply)
{
  const auto messages = test::serverMessages(reply);
  REQUIRE(1 == messages.size());
  return websocket::closeCode(messages[0]);
}

} // namespace

TEST_CASE("IngestSession | AttachesProducer", "[IngestSession]")
{
  Fixture fixture;
  {
    Session session{fixture.relay, fixture.devices, "s1", 7, fixture.log};
    CHECK(1 == fixture.relay.getStream("s1")->numProducers);
    CHECK("s1" == session.streamId());
  }
  CHECK(0 == fixture.relay.getStream("s1")->numProducers);
  CHECK(1 == fixture.relay.streamCount());
}

TEST_CASE("IngestSession | Frames", "[IngestSession]")
{
  Fixture fixture;
  Session session{fixture.relay, fixture.devices, "s1", 7, fixture.log};
  auto consumer = fixture.relay.openConsumerStream("s1");

  const auto ready = onlyText(session.receive(test::clientFrame(Opcode::Binary, Bytes{1, 2})));
  CHECK("STREAM_READY" == ready["type"]);
  CHECK(1 == ready["payload"]["bufferSize"]);

  CHECK(session.receive(test::clientFrame(Opcode::Binary, Bytes{3})).empty());

  CHECK(Bytes{1, 2} == **consumer.read());
  CHECK(Bytes{3} == **consumer.read());
  CHECK(!session.closed());
}

TEST_CASE("IngestSession | TextMessages", "[IngestSession]")
{
  Fixture fixture;
  Session session{fixture.relay, fixture.devices, "s1", 7, fixture.log};
  fixture.clock.advance(std::chrono::seconds{8});

  SECTION("Heartbeat")
  {
    const auto ack =
      onlyText(session.receive(test::clientFrame(Opcode::Text, R"({"type":"HEARTBEAT"})")));
    CHECK("HEARTBEAT_ACK" == ack["type"]);
    CHECK(fixture.clock.now() == *fixture.relay.lastProducerActivity("s1"));
  }

  SECTION("MetadataUpdate")
  {
    const auto reply = session.receive(test::clientFrame(
      Opcode::Text,
      R"({"type":"METADATA_UPDATE","payload":{"title":"Song","artist":"Artist"}})"));
    CHECK(reply.empty());
    CHECK(std::optional<std::string>{"Song"} == fixture.relay.getStream("s1")->metadata.title);
    CHECK(formatInlineMetadata({std::string{"Song"}, std::string{"Artist"}, std::nullopt})
          == *fixture.relay.inlineMetadata("s1"));
    CHECK(fixture.clock.now() == *fixture.relay.lastProducerActivity("s1"));
  }

  SECTION("BadMessageKeepsTheConnection")
  {
    const auto error =
      onlyText(session.receive(test::clientFrame(Opcode::Text, R"({"type":"STOP"})")));
    CHECK("ERROR" == error["type"]);
    CHECK(!session.closed());
  }
}

TEST_CASE("IngestSession | Handshake", "[IngestSession]")
{
  Fixture fixture;
  Session session{fixture.relay, fixture.devices, "s1", 7, fixture.log};

  const auto ack = onlyText(session.receive(test::clientFrame(
    Opcode::Text, R"({"type":"HANDSHAKE","payload":{"encoderConfig":{"codec":"flac"}}})")));
  CHECK("HANDSHAKE_ACK" == ack["type"]);
  CHECK("s1" == ack["payload"]["streamId"]);
  CHECK(std::optional<Codec>{Codec::Flac} == fixture.relay.getStream("s1")->codec);
}

TEST_CASE("IngestSession | DeviceCommands", "[IngestSession]")
{
  Fixture fixture;
  Session session{fixture.relay, fixture.devices, "s1", 7, fixture.log};

  SECTION("SetVolume")
  {
    const auto state = onlyText(session.receive(test::clientFrame(
      Opcode::Text, R"({"type":"SET_VOLUME","payload":{"ip":"10.0.0.5","volume":55}})")));
    CHECK("VOLUME_STATE" == state["type"]);
    CHECK("10.0.0.5" == state["payload"]["ip"]);
    CHECK(55 == state["payload"]["volume"]);
    CHECK(55 == fixture.devices.volumes["10.0.0.5"]);
    CHECK(0 == fixture.devices.groupCommands);
  }

  SECTION("SetGroupMute")
  {
    const auto state = onlyText(session.receive(test::clientFrame(
      Opcode::Text,
      R"({"type":"SET_MUTE","payload":{"ip":"10.0.0.5","mute":true,"group":true}})")));
    CHECK("MUTE_STATE" == state["type"]);
    CHECK(true == state["payload"]["mute"]);
    CHECK(fixture.devices.mutes["10.0.0.5"]);
    CHECK(1 == fixture.devices.groupCommands);
  }

  SECTION("Queries")
  {
    const auto volume = onlyText(session.receive(test::clientFrame(
      Opcode::Text, R"({"type":"GET_VOLUME","payload":{"ip":"10.0.0.5"}})")));
    CHECK(30 == volume["payload"]["volume"]);
    const auto mute = onlyText(session.receive(
      test::clientFrame(Opcode::Text, R"({"type":"GET_MUTE","payload":{"ip":"10.0.0.5"}})")));
    CHECK(false == mute["payload"]["mute"]);
  }

  SECTION("StopPlaybackSpeakerHasNoReply")
  {
    CHECK(session
            .receive(test::clientFrame(
              Opcode::Text, R"({"type":"STOP_PLAYBACK_SPEAKER","payload":{"ip":"10.0.0.5"}})"))
            .empty());
    CHECK((std::vector<std::string>{"10.0.0.5"}) == fixture.devices.stopped);
  }

  SECTION("DeviceFailureIsReported")
  {
    fixture.devices.unreachable.insert("10.0.0.5");
    const auto error = onlyText(session.receive(test::clientFrame(
      Opcode::Text, R"({"type":"GET_VOLUME","payload":{"ip":"10.0.0.5"}})")));
    CHECK("ERROR" == error["type"]);
    CHECK("10.0.0.5: connection refused" == error["message"]);
    CHECK(!session.closed());
  }
}

TEST_CASE("IngestSession | StartPlayback", "[IngestSession]")
{
  Fixture fixture;
  Session session{fixture.relay, fixture.devices, "s1", 7, fixture.log};

  SECTION("ResultPerDevice")
  {
    fixture.devices.unreachable.insert("10.0.0.6");
    const auto results = onlyText(session.receive(test::clientFrame(
      Opcode::Text,
      R"({"type":"START_PLAYBACK","payload":{"speakerIps":["10.0.0.5","10.0.0.6"],)"
      R"("metadata":{"title":"Tab"}}})")));
    CHECK("PLAYBACK_RESULTS" == results["type"]);
    const auto& list = results["payload"]["results"];
    REQUIRE(2 == list.size());
    CHECK(true == list[0]["success"]);
    CHECK("http://10.0.0.2:49400/streams/s1/live.mp3" == list[0]["streamUrl"]);
    CHECK(false == list[1]["success"]);
    CHECK("10.0.0.6: connection refused" == list[1]["error"]);
    CHECK((std::vector<std::string>{"10.0.0.5"}) == fixture.devices.playing);
    CHECK(std::optional<std::string>{"Tab"} == fixture.relay.getStream("s1")->metadata.title);
  }

  SECTION("NoDevices")
  {
    const auto error = onlyText(session.receive(
      test::clientFrame(Opcode::Text, R"({"type":"START_PLAYBACK","payload":{}})")));
    CHECK("PLAYBACK_ERROR" == error["type"]);
    CHECK("No speaker IPs provided" == error["payload"]["message"]);
    CHECK(fixture.devices.playing.empty());
  }
}

TEST_CASE("IngestSession | DeviceEvents", "[IngestSession]")
{
  Fixture fixture;
  Session session{fixture.relay, fixture.devices, "s1", 7, fixture.log};

  const auto event = onlyText(session.deviceEvent(R"({"category":"sonos"})"));
  CHECK("sonos" == event["category"]);

  session.shutdown();
  CHECK(session.deviceEvent(R"({"category":"sonos"})").empty());
}

TEST_CASE("IngestSession | Control", "[IngestSession]")
{
  Fixture fixture;
  Session session{fixture.relay, fixture.devices, "s1", 7, fixture.log};

  SECTION("Ping")
  {
    const auto messages =
      test::serverMessages(session.receive(test::clientFrame(Opcode::Ping, "hi")));
    REQUIRE(1 == messages.size());
    CHECK(Opcode::Pong == messages[0].opcode);
    CHECK("hi" == messages[0].text());
  }

  SECTION("Close")
  {
    const auto reply = session.receive(
      test::clientFrame(Opcode::Close, Bytes{0x03, 0xe8}));
    CHECK(std::optional<std::uint16_t>{websocket::kNormalClosure} == onlyClose(reply));
    CHECK(session.closed());
    CHECK(session.receive(test::clientFrame(Opcode::Binary, Bytes{1})).empty());
    CHECK(0 == fixture.relay.getStream("s1")->numFramesPushed);
  }

  SECTION("Shutdown")
  {
    CHECK(std::optional<std::uint16_t>{websocket::kGoingAway} == onlyClose(session.shutdown()));
    CHECK(session.shutdown().empty());
  }
}

TEST_CASE("IngestSession | Failures", "[IngestSession]")
{
  Fixture fixture;
  Session session{fixture.relay, fixture.devices, "s1", 7, fixture.log, 16};

  SECTION("ProtocolError")
  {
    const auto reply = session.receive(websocket::encodeFrame(Opcode::Binary, "unmasked"));
    CHECK(std::optional<std::uint16_t>{websocket::kProtocolError} == onlyClose(reply));
    CHECK(session.closed());
    CHECK(fixture.log.contains("broke the protocol"));
  }

  SECTION("TooBig")
  {
    const auto reply = session.receive(test::clientFrame(Opcode::Binary, Bytes(17, 0)));
    CHECK(std::optional<std::uint16_t>{websocket::kMessageTooBig} == onlyClose(reply));
  }

  SECTION("StreamRemoved")
  {
    fixture.relay.removeStream("s1");
    const auto reply = session.receive(test::clientFrame(Opcode::Binary, Bytes{1}));
    CHECK(std::optional<std::uint16_t>{websocket::kGoingAway} == onlyClose(reply));
    CHECK(session.closed());
  }
}

} // namespace relay
} // namespace roomcast
