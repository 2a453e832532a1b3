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

#include <roomcast/discovery/Discovery.hpp>
#include <roomcast/discovery/test/Context.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/util/test/Log.hpp>
#include <memory>
#include <optional>

namespace roomcast
{
namespace discovery
{
namespace
{

using TestDiscovery = Discovery<test::Context, util::test::CapturingLog>;
using Devices = std::vector<DiscoveredDevice>;

std::string answer(const std::string& uuid, const std::string& ip)
{
  return "HTTP/1.1 200 OK\r\n"
         "LOCATION: http://"
         + ip
         + ":1400/xml/device_description.xml\r\n"
           "ST: urn:schemas-upnp-org:device:ZonePlayer:1\r\n"
           "USN: uuid:"
         + uuid + "::urn:schemas-upnp-org:device:ZonePlayer:1\r\n\r\n";
}

::asio::ip::udp::endpoint from(const std::string& ip)
{
  return {::asio::ip::make_address(ip), 1900};
}

struct Fixture
{
  Fixture()
  {
    context.addNetworkInterface("lo", "127.0.0.1");
    context.addNetworkInterface("eth0", "192.168.1.5");
    context.addNetworkInterface("docker0", "172.17.0.1");
    context.addNetworkInterface("wlan0", "10.0.0.12");
  }

  void start(const std::chrono::milliseconds timeout = std::chrono::milliseconds{5000})
  {
    discovery.discoverAsync(timeout, [this](Devices devices) { result = std::move(devices); });
    context.runHandlers();
  }

  test::Context context;
  util::test::CapturingLog log;
  TestDiscovery discovery{context, log};
  std::optional<Devices> result;
};

} // namespace

TEST_CASE("Discovery | SearchesEveryUsableInterface", "[Discovery]")
{
  Fixture fixture;
  fixture.start();

  const auto& opened = fixture.context.opened();
  REQUIRE(2 == opened.size());
  CHECK(::asio::ip::make_address_v4("192.168.1.5") == opened[0]->address());
  CHECK(::asio::ip::make_address_v4("10.0.0.12") == opened[1]->address());

  for (const auto& pInterface : opened)
  {
    REQUIRE(3 == pInterface->sentMessages().size());
    CHECK(multicastEndpoint() == pInterface->sentMessages()[0].to);
    for (const auto& message : pInterface->sentMessages())
    {
      CHECK(message.text.find("M-SEARCH") == 0);
    }
    CHECK(pInterface->receiving());
  }

  fixture.context.advance(std::chrono::milliseconds{800});
  CHECK(6 == opened[0]->sentMessages().size());
  fixture.context.advance(std::chrono::milliseconds{800});
  CHECK(9 == opened[0]->sentMessages().size());
  CHECK(9 == opened[1]->sentMessages().size());
  fixture.context.advance(std::chrono::milliseconds{800});
  CHECK(9 == opened[1]->sentMessages().size());
  CHECK(!fixture.result);
}

TEST_CASE("Discovery | BroadcastSearch", "[Discovery]")
{
  using Endpoint = ::asio::ip::udp::endpoint;

  SECTION("DirectedAndLimitedBroadcastPerInterface")
  {
    Fixture fixture;
    fixture.start();
    const auto& opened = fixture.context.opened();
    REQUIRE(2 == opened.size());

    const auto& eth0 = opened[0]->sentMessages();
    REQUIRE(3 == eth0.size());
    CHECK(Endpoint(::asio::ip::make_address("192.168.1.255"), 1900) == eth0[1].to);
    CHECK(Endpoint(::asio::ip::make_address("255.255.255.255"), 1900) == eth0[2].to);
    CHECK(eth0[0].text == eth0[1].text);

    const auto& wlan0 = opened[1]->sentMessages();
    REQUIRE(3 == wlan0.size());
    CHECK(Endpoint(::asio::ip::make_address("10.0.0.255"), 1900) == wlan0[1].to);
  }

  SECTION("Disabled")
  {
    test::Context context;
    util::test::CapturingLog log;
    context.addNetworkInterface("eth0", "192.168.1.5");
    Settings settings;
    settings.broadcastSearch = false;
    TestDiscovery discovery{context, log, settings};
    discovery.discoverAsync(std::chrono::milliseconds{5000}, [](Devices) {});
    context.runHandlers();

    REQUIRE(1 == context.opened().size());
    const auto& sent = context.opened()[0]->sentMessages();
    REQUIRE(1 == sent.size());
    CHECK(multicastEndpoint() == sent[0].to);
  }
}

TEST_CASE("Discovery | CollectsDevicesInAnswerOrder", "[Discovery]")
{
  Fixture fixture;
  fixture.start();
  const auto& opened = fixture.context.opened();
  REQUIRE(2 == opened.size());

  opened[1]->incomingMessage(from("10.0.0.30"), answer("RINCON_B", "10.0.0.30"));
  opened[0]->incomingMessage(from("192.168.1.20"), answer("RINCON_A", "192.168.1.20"));
  // Repeated answer to a later search, and the same device seen on the
  // other interface
  opened[0]->incomingMessage(from("192.168.1.20"), answer("RINCON_A", "192.168.1.20"));
  opened[1]->incomingMessage(from("10.0.0.31"), answer("RINCON_A", "10.0.0.31"));
  opened[0]->incomingMessage(from("192.168.1.1"), "HTTP/1.1 200 OK\r\nUSN: uuid:x\r\n\r\n");

  fixture.context.advance(std::chrono::milliseconds{800});
  fixture.context.advance(std::chrono::milliseconds{800});
  CHECK(!fixture.result);
  fixture.context.advance(std::chrono::milliseconds{3400});

  REQUIRE(fixture.result);
  const auto expected =
    Devices{{"RINCON_B", "10.0.0.30", "http://10.0.0.30:1400/xml/device_description.xml"},
            {"RINCON_A",
             "192.168.1.20",
             "http://192.168.1.20:1400/xml/device_description.xml"}};
  CHECK(expected == *fixture.result);

  for (const auto& pInterface : opened)
  {
    CHECK(pInterface->closed());
    CHECK(!pInterface->receiving());
  }
}

TEST_CASE("Discovery | AnswersAfterTheWindowAreIgnored", "[Discovery]")
{
  Fixture fixture;
  fixture.start(std::chrono::milliseconds{2000});
  const auto pInterface = fixture.context.opened()[0];

  fixture.context.advance(std::chrono::milliseconds{800});
  fixture.context.advance(std::chrono::milliseconds{800});
  fixture.context.advance(std::chrono::milliseconds{400});
  REQUIRE(fixture.result);
  CHECK(fixture.result->empty());
  CHECK(!pInterface->incomingMessage(from("192.168.1.20"), answer("RINCON_A", "192.168.1.20")));
}

TEST_CASE("Discovery | SkipsInterfacesThatCannotBeOpened", "[Discovery]")
{
  Fixture fixture;
  fixture.context.failToOpen("192.168.1.5");
  fixture.start();

  REQUIRE(1 == fixture.context.opened().size());
  CHECK(::asio::ip::make_address_v4("10.0.0.12") == fixture.context.opened()[0]->address());
  CHECK(fixture.log.contains("skipping interface eth0"));
}

TEST_CASE("Discovery | SendFailuresAreLogged", "[Discovery]")
{
  Fixture fixture;
  fixture.start();
  const auto& opened = fixture.context.opened();
  opened[0]->failSends();

  fixture.context.advance(std::chrono::milliseconds{800});
  CHECK(fixture.log.contains("M-SEARCH on eth0 to 239.255.255.250 failed"));
  CHECK(fixture.log.contains("M-SEARCH on eth0 to 255.255.255.255 failed"));
  CHECK(6 == opened[1]->sentMessages().size());

  opened[1]->incomingMessage(from("10.0.0.30"), answer("RINCON_B", "10.0.0.30"));
  fixture.context.advance(std::chrono::milliseconds{800});
  fixture.context.advance(std::chrono::milliseconds{3400});
  REQUIRE(fixture.result);
  CHECK(1 == fixture.result->size());
}

TEST_CASE("Discovery | EmptyResultWithoutInterfaces", "[Discovery]")
{
  test::Context context;
  util::test::CapturingLog log;
  context.addNetworkInterface("lo", "127.0.0.1");
  context.addNetworkInterface("virbr0", "192.168.122.1");
  TestDiscovery discovery{context, log};

  std::optional<Devices> result;
  discovery.discoverAsync(
    std::chrono::milliseconds{5000}, [&](Devices devices) { result = std::move(devices); });
  context.runHandlers();

  REQUIRE(result);
  CHECK(result->empty());
  CHECK(context.opened().empty());
  CHECK(log.contains("no network interface"));
}

TEST_CASE("Discovery | ScanFailureGivesEmptyResult", "[Discovery]")
{
  Fixture fixture;
  fixture.context.failScan();
  fixture.start();

  REQUIRE(fixture.result);
  CHECK(fixture.result->empty());
  CHECK(fixture.log.contains("getifaddrs failed"));
}

TEST_CASE("Discovery | CancelReportsWhatWasFound", "[Discovery]")
{
  Fixture fixture;
  fixture.start();
  const auto& opened = fixture.context.opened();
  opened[0]->incomingMessage(from("192.168.1.20"), answer("RINCON_A", "192.168.1.20"));

  fixture.discovery.cancel();
  fixture.context.runHandlers();

  REQUIRE(fixture.result);
  CHECK(1 == fixture.result->size());
  CHECK(opened[0]->closed());

  // The search timer was cancelled with the search
  fixture.context.advance(std::chrono::milliseconds{800});
  CHECK(3 == opened[1]->sentMessages().size());
}

TEST_CASE("Discovery | SearchesRunIndependently", "[Discovery]")
{
  Fixture fixture;
  fixture.start();
  std::optional<Devices> second;
  fixture.discovery.discoverAsync(
    std::chrono::milliseconds{5000}, [&](Devices devices) { second = std::move(devices); });
  fixture.context.runHandlers();

  const auto& opened = fixture.context.opened();
  REQUIRE(4 == opened.size());
  opened[2]->incomingMessage(from("192.168.1.20"), answer("RINCON_A", "192.168.1.20"));

  fixture.context.advance(std::chrono::milliseconds{800});
  fixture.context.advance(std::chrono::milliseconds{800});
  fixture.context.advance(std::chrono::milliseconds{3400});

  REQUIRE(fixture.result);
  REQUIRE(second);
  CHECK(fixture.result->empty());
  CHECK(1 == second->size());
}

TEST_CASE("Discovery | DestroyedWhileSearching", "[Discovery]")
{
  test::Context context;
  util::test::CapturingLog log;
  context.addNetworkInterface("eth0", "192.168.1.5");
  auto pDiscovery = std::make_unique<TestDiscovery>(context, log);

  std::optional<Devices> result;
  pDiscovery->discoverAsync(
    std::chrono::milliseconds{5000}, [&](Devices devices) { result = std::move(devices); });
  context.runHandlers();
  REQUIRE(1 == context.opened().size());
  const auto pInterface = context.opened()[0];

  pDiscovery.reset();

  // Late answers and expired timers find nothing left to call into
  pInterface->incomingMessage(from("192.168.1.20"), answer("RINCON_A", "192.168.1.20"));
  context.advance(std::chrono::milliseconds{800});
  context.advance(std::chrono::milliseconds{800});
  context.advance(std::chrono::milliseconds{3400});
  CHECK(!result);
  CHECK(3 == pInterface->sentMessages().size());
}

} // namespace discovery
} // namespace roomcast
