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

#include <roomcast/relay/IngestMessage.hpp>
#include <roomcast/test/CatchWrapper.hpp>

namespace roomcast
{
namespace relay
{

TEST_CASE("IngestMessage | Heartbeat", "[IngestMessage]")
{
  const auto event = parseIngestMessage(R"({"type":"HEARTBEAT"})");
  CHECK(std::holds_alternative<Heartbeat>(event));
}

TEST_CASE("IngestMessage | MetadataUpdate", "[IngestMessage]")
{
  const auto event = parseIngestMessage(
    R"({"type":"METADATA_UPDATE","payload":{"title":"Song","artist":null}})");
  const auto pUpdate = std::get_if<MetadataUpdate>(&event);
  REQUIRE(pUpdate);
  CHECK(std::optional<std::string>{"Song"} == pUpdate->metadata.title);
  CHECK(!pUpdate->metadata.artist);
  CHECK(!pUpdate->metadata.album);
}

TEST_CASE("IngestMessage | Handshake", "[IngestMessage]")
{
  SECTION("EncoderConfig")
  {
    const auto event = parseIngestMessage(
      R"({"type":"HANDSHAKE","payload":{"encoderConfig":{"codec":"aac-lc","bitrate":192}}})");
    const auto pHandshake = std::get_if<Handshake>(&event);
    REQUIRE(pHandshake);
    CHECK(std::optional<std::string>{"aac-lc"} == pHandshake->codec);
  }

  SECTION("LegacyCodecField")
  {
    const auto event =
      parseIngestMessage(R"({"type":"HANDSHAKE","payload":{"codec":"flac"}})");
    CHECK(std::optional<std::string>{"flac"} == std::get<Handshake>(event).codec);
  }

  SECTION("WithoutPayload")
  {
    const auto event = parseIngestMessage(R"({"type":"HANDSHAKE"})");
    CHECK(!std::get<Handshake>(event).codec);
  }
}

TEST_CASE("IngestMessage | DeviceCommands", "[IngestMessage]")
{
  SECTION("SetVolume")
  {
    const auto event = parseIngestMessage(
      R"({"type":"SET_VOLUME","payload":{"ip":"10.0.0.5","volume":35}})");
    const auto& command = std::get<SetVolume>(event);
    CHECK("10.0.0.5" == command.ip);
    CHECK(35 == command.volume);
    CHECK(!command.group);
  }

  SECTION("SetGroupMute")
  {
    const auto event = parseIngestMessage(
      R"({"type":"SET_MUTE","payload":{"ip":"10.0.0.5","mute":true,"group":true}})");
    const auto& command = std::get<SetMute>(event);
    CHECK(command.mute);
    CHECK(command.group);
  }

  SECTION("Queries")
  {
    CHECK("10.0.0.6"
          == std::get<GetVolume>(
               parseIngestMessage(R"({"type":"GET_VOLUME","payload":{"ip":"10.0.0.6"}})"))
               .ip);
    CHECK("10.0.0.7"
          == std::get<GetMute>(
               parseIngestMessage(R"({"type":"GET_MUTE","payload":{"ip":"10.0.0.7"}})"))
               .ip);
  }

  SECTION("StopPlaybackSpeaker")
  {
    const auto event = parseIngestMessage(
      R"({"type":"STOP_PLAYBACK_SPEAKER","payload":{"streamId":"s1","ip":"10.0.0.5"}})");
    CHECK("10.0.0.5" == std::get<StopPlaybackSpeaker>(event).ip);
  }

  SECTION("VolumeOutOfRange")
  {
    CHECK_THROWS_AS(
      parseIngestMessage(R"({"type":"SET_VOLUME","payload":{"ip":"a","volume":101}})"),
      IngestMessageError);
    CHECK_THROWS_AS(
      parseIngestMessage(R"({"type":"SET_VOLUME","payload":{"ip":"a","volume":-1}})"),
      IngestMessageError);
    CHECK_THROWS_AS(
      parseIngestMessage(R"({"type":"SET_VOLUME","payload":{"ip":"a","volume":"50"}})"),
      IngestMessageError);
  }

  SECTION("MissingFields")
  {
    CHECK_THROWS_AS(parseIngestMessage(R"({"type":"GET_VOLUME"})"), IngestMessageError);
    CHECK_THROWS_AS(
      parseIngestMessage(R"({"type":"SET_MUTE","payload":{"ip":"a"}})"), IngestMessageError);
  }
}

TEST_CASE("IngestMessage | StartPlayback", "[IngestMessage]")
{
  SECTION("SpeakerIps")
  {
    const auto event = parseIngestMessage(
      R"({"type":"START_PLAYBACK","payload":{"speakerIps":["10.0.0.5","10.0.0.6"],)"
      R"("metadata":{"title":"Tab"}}})");
    const auto& start = std::get<StartPlayback>(event);
    CHECK((std::vector<std::string>{"10.0.0.5", "10.0.0.6"}) == start.speakerIps);
    REQUIRE(start.metadata);
    CHECK(std::optional<std::string>{"Tab"} == start.metadata->title);
  }

  SECTION("LegacySpeakerIp")
  {
    const auto event =
      parseIngestMessage(R"({"type":"START_PLAYBACK","payload":{"speakerIp":"10.0.0.5"}})");
    const auto& start = std::get<StartPlayback>(event);
    CHECK((std::vector<std::string>{"10.0.0.5"}) == start.speakerIps);
    CHECK(!start.metadata);
  }

  SECTION("ArrayWinsOverSingle")
  {
    const auto event = parseIngestMessage(
      R"({"type":"START_PLAYBACK","payload":{"speakerIps":[],"speakerIp":"10.0.0.5"}})");
    CHECK(std::get<StartPlayback>(event).speakerIps.empty());
  }
}

TEST_CASE("IngestMessage | Rejected", "[IngestMessage]")
{
  CHECK_THROWS_AS(parseIngestMessage("not json"), IngestMessageError);
  CHECK_THROWS_AS(parseIngestMessage("[1,2]"), IngestMessageError);
  CHECK_THROWS_AS(parseIngestMessage(R"({"payload":{}})"), IngestMessageError);
  CHECK_THROWS_AS(parseIngestMessage(R"({"type":7})"), IngestMessageError);
  CHECK_THROWS_AS(parseIngestMessage(R"({"type":"STOP"})"), IngestMessageError);
  CHECK_THROWS_AS(parseIngestMessage(R"({"type":"METADATA_UPDATE"})"), IngestMessageError);
  CHECK_THROWS_AS(
    parseIngestMessage(R"({"type":"METADATA_UPDATE","payload":{"title":3}})"),
    IngestMessageError);
}

TEST_CASE("IngestMessage | Replies", "[IngestMessage]")
{
  CHECK(nlohmann::json{{"type", "HEARTBEAT_ACK"}} == nlohmann::json::parse(makeHeartbeatAck()));

  const auto ready = nlohmann::json::parse(makeStreamReady(3));
  CHECK("STREAM_READY" == ready["type"]);
  CHECK(3 == ready["payload"]["bufferSize"]);

  const auto error = nlohmann::json::parse(makeErrorMessage("bad"));
  CHECK("ERROR" == error["type"]);
  CHECK("bad" == error["message"]);

  const auto ack = nlohmann::json::parse(makeHandshakeAck("s1"));
  CHECK("HANDSHAKE_ACK" == ack["type"]);
  CHECK("s1" == ack["payload"]["streamId"]);

  const auto volume = nlohmann::json::parse(makeVolumeState("10.0.0.5", 20));
  CHECK("VOLUME_STATE" == volume["type"]);
  CHECK("10.0.0.5" == volume["payload"]["ip"]);
  CHECK(20 == volume["payload"]["volume"]);

  const auto mute = nlohmann::json::parse(makeMuteState("10.0.0.5", false));
  CHECK("MUTE_STATE" == mute["type"]);
  CHECK(false == mute["payload"]["mute"]);

  const auto playbackError = nlohmann::json::parse(makePlaybackError("No speaker IPs provided"));
  CHECK("PLAYBACK_ERROR" == playbackError["type"]);
  CHECK("No speaker IPs provided" == playbackError["payload"]["message"]);
}

TEST_CASE("IngestMessage | PlaybackResults", "[IngestMessage]")
{
  const auto results = nlohmann::json::parse(makePlaybackResults(
    {{"10.0.0.5", true, std::string{"http://h/streams/s1/live.mp3"}, std::nullopt},
     {"10.0.0.6", false, std::nullopt, std::string{"connection refused"}}}));
  CHECK("PLAYBACK_RESULTS" == results["type"]);
  const auto& list = results["payload"]["results"];
  REQUIRE(2 == list.size());
  CHECK("10.0.0.5" == list[0]["speakerIp"]);
  CHECK(true == list[0]["success"]);
  CHECK("http://h/streams/s1/live.mp3" == list[0]["streamUrl"]);
  CHECK(list[0].find("error") == list[0].end());
  CHECK(false == list[1]["success"]);
  CHECK("connection refused" == list[1]["error"]);
  CHECK(list[1].find("streamUrl") == list[1].end());
}

} // namespace relay
} // namespace roomcast
