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

#include <roomcast/relay/Relay.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/util/test/Clock.hpp>
#include <roomcast/util/test/Log.hpp>
#include <thread>

namespace roomcast
{
namespace relay
{
namespace
{

using TestRelay = Relay<util::test::Clock, util::test::CapturingLog>;

Bytes frame(const std::uint8_t value)
{
  return Bytes(4, value);
}

Settings smallSettings()
{
  Settings settings;
  settings.maxConsumers = 2;
  settings.maxBufferFrames = 3;
  settings.consumerQueueFrames = 4;
  settings.ingestSecret = "secret";
  return settings;
}

struct Fixture
{
  Fixture() { relay.createOrGetStream("s1"); }

  util::test::Clock clock;
  util::test::CapturingLog log;
  TestRelay relay{log, smallSettings(), clock};
};

std::vector<std::uint8_t> drain(ConsumerStream& consumer)
{
  std::vector<std::uint8_t> values;
  while (consumer.numQueuedFrames() > 0)
  {
    values.push_back((*consumer.read())->front());
  }
  return values;
}

} // namespace

TEST_CASE("Relay | CreateOrGetStream", "[Relay]")
{
  Fixture fixture;
  fixture.relay.pushFrame("s1", frame(1));

  const auto stream = fixture.relay.createOrGetStream("s1");
  CHECK("s1" == stream.id);
  CHECK(1 == stream.numBufferedFrames);
  CHECK(1 == fixture.relay.streamCount());

  fixture.relay.createOrGetStream("s2");
  CHECK(2 == fixture.relay.streamCount());
  CHECK((std::vector<std::string>{"s1", "s2"} == fixture.relay.streamIds()));
  CHECK(!fixture.relay.getStream("s3"));
}

TEST_CASE("Relay | UnknownStream", "[Relay]")
{
  Fixture fixture;
  CHECK_THROWS_AS(fixture.relay.pushFrame("nope", frame(1)), StreamNotFound);
  CHECK_THROWS_AS(fixture.relay.openConsumerStream("nope"), StreamNotFound);
  CHECK_THROWS_AS(fixture.relay.setMetadata("nope", {}), StreamNotFound);
  CHECK_THROWS_AS(fixture.relay.attachProducer("nope", 1), StreamNotFound);
  CHECK_THROWS_AS(fixture.relay.heartbeat("nope"), StreamNotFound);
  CHECK_NOTHROW(fixture.relay.detachProducer("nope", 1));
  CHECK(!fixture.relay.removeStream("nope"));
}

TEST_CASE("Relay | ReplayBufferKeepsNewestFrames", "[Relay]")
{
  Fixture fixture;
  CHECK(fixture.relay.pushFrame("s1", frame(1)));
  for (std::uint8_t i = 2; i <= 5; ++i)
  {
    CHECK(!fixture.relay.pushFrame("s1", frame(i)));
  }
  CHECK(3 == fixture.relay.getStream("s1")->numBufferedFrames);
  CHECK(5 == fixture.relay.getStream("s1")->numFramesPushed);

  auto consumer = fixture.relay.openConsumerStream("s1");
  CHECK((std::vector<std::uint8_t>{3, 4, 5} == drain(consumer)));
}

TEST_CASE("Relay | ReplayComesBeforeLiveFrames", "[Relay]")
{
  Fixture fixture;
  fixture.relay.pushFrame("s1", frame(1));
  fixture.relay.pushFrame("s1", frame(2));
  auto consumer = fixture.relay.openConsumerStream("s1");
  fixture.relay.pushFrame("s1", frame(3));
  CHECK((std::vector<std::uint8_t>{1, 2, 3} == drain(consumer)));
}

TEST_CASE("Relay | FanOut", "[Relay]")
{
  Fixture fixture;
  auto first = fixture.relay.openConsumerStream("s1");
  auto second = fixture.relay.openConsumerStream("s1");
  fixture.relay.pushFrame("s1", frame(7));
  fixture.relay.pushFrame("s1", frame(8));
  CHECK((std::vector<std::uint8_t>{7, 8} == drain(first)));
  CHECK((std::vector<std::uint8_t>{7, 8} == drain(second)));
}

TEST_CASE("Relay | ConsumerCap", "[Relay]")
{
  Fixture fixture;
  auto first = fixture.relay.openConsumerStream("s1");
  auto second = fixture.relay.openConsumerStream("s1");
  CHECK_THROWS_AS(fixture.relay.openConsumerStream("s1"), TooManyConsumers);
  CHECK(2 == fixture.relay.getStream("s1")->numConsumers);

  SECTION("CancelFreesASlot")
  {
    first.cancel();
    CHECK(1 == fixture.relay.getStream("s1")->numConsumers);
    CHECK(first.ended());
    CHECK(!first.read());
    CHECK_NOTHROW(fixture.relay.openConsumerStream("s1"));
  }

  SECTION("DestructionFreesASlot")
  {
    {
      auto moved = std::move(second);
    }
    CHECK(1 == fixture.relay.getStream("s1")->numConsumers);
  }
}

TEST_CASE("Relay | SlowConsumerIsDropped", "[Relay]")
{
  Fixture fixture;
  auto slow = fixture.relay.openConsumerStream("s1");
  auto fast = fixture.relay.openConsumerStream("s1");

  for (std::uint8_t i = 1; i <= 4; ++i)
  {
    fixture.relay.pushFrame("s1", frame(i));
    drain(fast);
  }
  CHECK(2 == fixture.relay.getStream("s1")->numConsumers);

  // The fifth frame does not fit into the slow consumer's queue
  fixture.relay.pushFrame("s1", frame(5));
  CHECK(1 == fixture.relay.getStream("s1")->numConsumers);
  CHECK(slow.ended());
  CHECK(!slow.read());
  CHECK((std::vector<std::uint8_t>{5} == drain(fast)));
  CHECK(fixture.log.contains("dropped 1 consumer(s) of s1"));
}

TEST_CASE("Relay | RemoveStreamEndsReads", "[Relay]")
{
  Fixture fixture;
  auto consumer = fixture.relay.openConsumerStream("s1");

  auto reads = 0;
  std::thread reader(
    [&]
    {
      while (consumer.read())
      {
        ++reads;
      }
    });

  CHECK(fixture.relay.removeStream("s1"));
  reader.join();

  CHECK(consumer.ended());
  CHECK(0 == reads);
  CHECK(0 == fixture.relay.streamCount());
  // Cancelling after removal is harmless
  consumer.cancel();
}

TEST_CASE("Relay | Metadata", "[Relay]")
{
  Fixture fixture;
  CHECK(Bytes{0} == *fixture.relay.inlineMetadata("s1"));

  const StreamMetadata song{std::string{"Song"}, std::string{"Artist"}, std::string{"Album"}};
  fixture.relay.setMetadata("s1", song);
  const auto block = fixture.relay.inlineMetadata("s1");
  CHECK(formatInlineMetadata(song) == *block);

  SECTION("UnchangedKeepsTheBlock")
  {
    fixture.relay.setMetadata("s1", song);
    CHECK(block == fixture.relay.inlineMetadata("s1"));
  }

  SECTION("AlbumChangeRendersAgain")
  {
    auto other = song;
    other.album = std::string{"Other"};
    fixture.relay.setMetadata("s1", other);
    CHECK(block != fixture.relay.inlineMetadata("s1"));
    CHECK(other == fixture.relay.getStream("s1")->metadata);
  }
}

TEST_CASE("Relay | Producers", "[Relay]")
{
  Fixture fixture;
  fixture.relay.attachProducer("s1", 1);
  fixture.relay.attachProducer("s1", 2);
  fixture.relay.attachProducer("s1", 2);
  CHECK(2 == fixture.relay.getStream("s1")->numProducers);
  fixture.relay.detachProducer("s1", 1);
  CHECK(1 == fixture.relay.getStream("s1")->numProducers);
}

TEST_CASE("Relay | Liveness", "[Relay]")
{
  Fixture fixture;
  fixture.relay.createOrGetStream("s2");
  auto consumer = fixture.relay.openConsumerStream("s2");

  fixture.clock.advance(std::chrono::seconds{6});
  fixture.relay.pushFrame("s1", frame(1));
  CHECK(fixture.clock.now() == *fixture.relay.lastProducerActivity("s1"));

  fixture.clock.advance(std::chrono::seconds{5});
  CHECK((std::vector<std::string>{"s2"} == fixture.relay.reapSilentStreams()));
  CHECK(consumer.ended());
  CHECK(1 == fixture.relay.streamCount());

  SECTION("HeartbeatKeepsAlive")
  {
    fixture.relay.heartbeat("s1");
    fixture.clock.advance(std::chrono::seconds{10});
    CHECK(fixture.relay.reapSilentStreams().empty());
  }

  SECTION("AttachKeepsAlive")
  {
    fixture.clock.advance(std::chrono::seconds{9});
    fixture.relay.attachProducer("s1", 3);
    fixture.clock.advance(std::chrono::seconds{9});
    CHECK(fixture.relay.reapSilentStreams().empty());
  }

  SECTION("SilenceEndsIt")
  {
    fixture.clock.advance(std::chrono::seconds{11});
    CHECK((std::vector<std::string>{"s1"} == fixture.relay.reapSilentStreams()));
    CHECK(!fixture.relay.lastProducerActivity("s1"));
  }
}

TEST_CASE("Relay | AssociatedDevice", "[Relay]")
{
  Fixture fixture;
  CHECK(!fixture.relay.findByDevice("192.168.1.10"));
  fixture.relay.setAssociatedDevice("s1", "192.168.1.10");
  CHECK(std::optional<std::string>{"s1"} == fixture.relay.findByDevice("192.168.1.10"));
  CHECK(std::optional<std::string>{"192.168.1.10"}
        == fixture.relay.getStream("s1")->associatedDeviceIp);
}

TEST_CASE("Relay | Codec", "[Relay]")
{
  Fixture fixture;
  CHECK(!fixture.relay.getStream("s1")->codec);
  fixture.relay.setCodec("s1", Codec::Flac);
  CHECK(std::optional<Codec>{Codec::Flac} == fixture.relay.getStream("s1")->codec);
  CHECK_THROWS_AS(fixture.relay.setCodec("nope", Codec::Mp3), StreamNotFound);
}

TEST_CASE("Codec | Resolve", "[Codec]")
{
  CHECK(Codec::Mp3 == resolveCodec(std::string{"mp3"}));
  CHECK(Codec::Aac == resolveCodec(std::string{"he-aac-v2"}));
  CHECK(Codec::Flac == resolveCodec(std::string{"flac"}));
  CHECK(Codec::Wav == resolveCodec(std::string{"pcm"}));
  CHECK(Codec::Wav == resolveCodec(std::string{"opus"}));
  CHECK(Codec::Wav == resolveCodec(std::nullopt));
  CHECK(".aac" == fileExtension(Codec::Aac));
  CHECK(std::string{"audio/flac"} == contentType(Codec::Flac));
}

TEST_CASE("Relay | IngestTokens", "[Relay]")
{
  Fixture fixture;
  const auto token = fixture.relay.issueIngestToken("s1");
  CHECK_NOTHROW(fixture.relay.validateIngestToken("s1", token));
  CHECK_THROWS_AS(fixture.relay.validateIngestToken("s2", token), InvalidToken);

  fixture.clock.advance(std::chrono::minutes{5});
  CHECK_THROWS_AS(fixture.relay.validateIngestToken("s1", token), InvalidToken);
}

} // namespace relay
} // namespace roomcast
