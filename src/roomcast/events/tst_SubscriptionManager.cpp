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

#include <roomcast/control/test/Transport.hpp>
#include <roomcast/events/SubscriptionManager.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/util/test/IoContext.hpp>
#include <roomcast/util/Scheduler.hpp>
#include <roomcast/util/test/Log.hpp>
#include <roomcast/xml/Scanner.hpp>
#include <future>
#include <memory>
#include <thread>

namespace roomcast
{
namespace events
{
namespace
{

using Manager =
  SubscriptionManager<control::test::Transport, util::test::IoContext, util::test::CapturingLog>;

http::Response accepted(const std::string& sid, const std::string& timeout = "Second-1800")
{
  auto response = http::makeResponse(200);
  response.headers.set("SID", sid);
  if (!timeout.empty())
  {
    response.headers.set("TIMEOUT", timeout);
  }
  return response;
}

http::Request notify(const std::string& sid, std::string body)
{
  http::Request request;
  request.method = "NOTIFY";
  request.target = "/notify/192-168-1-10/AVTransport";
  request.headers.set("NT", "upnp:event");
  request.headers.set("NTS", "upnp:propchange");
  if (!sid.empty())
  {
    request.headers.set("SID", sid);
  }
  request.body = std::move(body);
  return request;
}

std::string avTransportChange(const std::string& state, const std::string& uri)
{
  return "<e:propertyset xmlns:e=\"urn:schemas-upnp-org:event-1-0\"><e:property><LastChange>"
         + xml::escape("<Event><InstanceID val=\"0\"><TransportState val=\"" + state
                       + "\"/><CurrentTrackURI val=\"" + uri + "\"/></InstanceID></Event>")
         + "</LastChange></e:property></e:propertyset>";
}

struct Fixture
{
  Fixture() { manager.setListening(true, "192.168.1.5", 3400); }

  std::vector<std::string> methods() const
  {
    std::vector<std::string> result;
    for (const auto& call : transport.sent())
    {
      result.push_back(call.request.method);
    }
    return result;
  }

  control::test::Transport transport;
  util::test::IoContext io;
  util::test::CapturingLog log;
  Manager manager{transport, io, log};
};

} // namespace

TEST_CASE("SubscriptionManager | Subscribe", "[SubscriptionManager]")
{
  Fixture fixture;
  fixture.transport.respond(accepted("uuid:sub-1"));

  CHECK("uuid:sub-1" == fixture.manager.subscribe("192.168.1.10", Channel::AVTransport));

  const auto calls = fixture.transport.sent();
  REQUIRE(1 == calls.size());
  CHECK("192.168.1.10" == calls[0].host);
  CHECK(1400 == calls[0].port);
  CHECK("SUBSCRIBE" == calls[0].request.method);
  CHECK("/MediaRenderer/AVTransport/Event" == calls[0].request.target);
  CHECK(std::optional<std::string>{"<http://192.168.1.5:3400/notify/192-168-1-10/AVTransport>"}
        == calls[0].request.headers.get("CALLBACK"));
  CHECK(std::optional<std::string>{"Second-3600"} == calls[0].request.headers.get("TIMEOUT"));

  const auto subscription = fixture.manager.subscription("uuid:sub-1");
  REQUIRE(subscription);
  CHECK("192.168.1.10" == subscription->deviceIp);
  CHECK(Channel::AVTransport == subscription->channel);
  CHECK("/notify/192-168-1-10/AVTransport" == subscription->callbackPath);

  SECTION("SameChannelIsReused")
  {
    CHECK("uuid:sub-1" == fixture.manager.subscribe("192.168.1.10", Channel::AVTransport));
    CHECK(1 == fixture.transport.sent().size());
  }

  SECTION("OtherChannelSubscribesAgain")
  {
    fixture.transport.respond(accepted("uuid:sub-2"));
    CHECK("uuid:sub-2" == fixture.manager.subscribe("192.168.1.10", Channel::RenderingControl));
    CHECK(2 == fixture.manager.subscriptionCount());
  }
}

TEST_CASE("SubscriptionManager | SubscribeFailures", "[SubscriptionManager]")
{
  Fixture fixture;

  SECTION("ListenerNotRunning")
  {
    fixture.manager.setListening(false, "192.168.1.5", 3400);
    try
    {
      fixture.manager.subscribe("192.168.1.10", Channel::AVTransport);
      FAIL("subscribing without listener succeeded");
    }
    catch (const SubscriptionFailed& e)
    {
      CHECK(0 == e.status);
    }
    CHECK(fixture.transport.sent().empty());
  }

  SECTION("Refused")
  {
    fixture.transport.respond(503);
    try
    {
      fixture.manager.subscribe("192.168.1.10", Channel::AVTransport);
      FAIL("refused subscription succeeded");
    }
    catch (const SubscriptionFailed& e)
    {
      CHECK(503 == e.status);
      CHECK("192.168.1.10" == e.deviceIp);
    }
  }

  SECTION("MissingSid")
  {
    fixture.transport.respond(200);
    CHECK_THROWS_AS(fixture.manager.subscribe("192.168.1.10", Channel::AVTransport),
                    MissingSubscriptionId);
  }

  SECTION("Unreachable")
  {
    fixture.transport.failUnreachable();
    CHECK_THROWS_AS(fixture.manager.subscribe("192.168.1.10", Channel::AVTransport),
                    control::DeviceUnreachable);
  }

  CHECK(0 == fixture.manager.subscriptionCount());
  CHECK(0 == fixture.io.numPendingTimers());
}

TEST_CASE("SubscriptionManager | RenewsBeforeLeaseEnds", "[SubscriptionManager]")
{
  Fixture fixture;
  fixture.transport.respond(accepted("uuid:sub-1"));
  fixture.manager.subscribe("192.168.1.10", Channel::AVTransport);

  fixture.io.advance(std::chrono::seconds{1499});
  CHECK(1 == fixture.transport.sent().size());

  fixture.transport.respond(accepted("uuid:sub-1", "Second-600"));
  fixture.io.advance(std::chrono::seconds{1});
  auto calls = fixture.transport.sent();
  REQUIRE(2 == calls.size());
  CHECK("SUBSCRIBE" == calls[1].request.method);
  CHECK(std::optional<std::string>{"uuid:sub-1"} == calls[1].request.headers.get("SID"));
  CHECK(!calls[1].request.headers.contains("CALLBACK"));

  // The next renewal follows the newly granted lease
  fixture.io.advance(std::chrono::seconds{299});
  CHECK(2 == fixture.transport.sent().size());
  fixture.io.advance(std::chrono::seconds{1});
  CHECK(3 == fixture.transport.sent().size());
  CHECK(fixture.manager.subscription("uuid:sub-1"));
}

TEST_CASE("SubscriptionManager | LeaseWithoutTimeoutHeader", "[SubscriptionManager]")
{
  Fixture fixture;
  fixture.transport.respond(accepted("uuid:sub-1", ""));
  fixture.manager.subscribe("192.168.1.10", Channel::AVTransport);

  fixture.io.advance(std::chrono::seconds{3299});
  CHECK(1 == fixture.transport.sent().size());
  fixture.io.advance(std::chrono::seconds{1});
  CHECK(2 == fixture.transport.sent().size());
}

TEST_CASE("SubscriptionManager | RenewalFailureResubscribes", "[SubscriptionManager]")
{
  Fixture fixture;
  fixture.transport.respond(accepted("uuid:sub-1"));
  fixture.manager.subscribe("192.168.1.10", Channel::AVTransport);

  fixture.transport.respond(412);
  fixture.transport.respond(accepted("uuid:sub-2"));
  CHECK(std::optional<std::string>{"uuid:sub-2"} == fixture.manager.renew("uuid:sub-1"));

  CHECK((std::vector<std::string>{"SUBSCRIBE", "SUBSCRIBE", "SUBSCRIBE"} == fixture.methods()));
  const auto calls = fixture.transport.sent();
  CHECK(calls[2].request.headers.contains("CALLBACK"));
  CHECK(!fixture.manager.subscription("uuid:sub-1"));
  CHECK(fixture.manager.subscription("uuid:sub-2"));
  CHECK(1 == fixture.manager.subscriptionCount());
  CHECK(fixture.log.contains("renewal of uuid:sub-1 failed"));
}

TEST_CASE("SubscriptionManager | ResubscribeFailureDropsSubscription", "[SubscriptionManager]")
{
  Fixture fixture;
  fixture.transport.respond(accepted("uuid:sub-1"));
  fixture.manager.subscribe("192.168.1.10", Channel::AVTransport);

  fixture.transport.failTimeout();
  fixture.transport.failUnreachable();
  fixture.io.advance(std::chrono::seconds{1500});

  CHECK(3 == fixture.transport.sent().size());
  CHECK(0 == fixture.manager.subscriptionCount());
  CHECK(0 == fixture.io.numPendingTimers());
  CHECK(fixture.log.contains("resubscribing to AVTransport on 192.168.1.10 failed"));
}

TEST_CASE("SubscriptionManager | LostSubscriptionIsReported", "[SubscriptionManager]")
{
  Fixture fixture;
  std::vector<std::pair<std::string, Event>> received;
  fixture.manager.onNotification([&](const std::string& deviceIp, const Event& event)
                                 { received.emplace_back(deviceIp, event); });
  fixture.transport.respond(accepted("uuid:sub-1"));
  fixture.manager.subscribe("192.168.1.10", Channel::GroupRenderingControl);

  SECTION("WhenResubscribingFails")
  {
    fixture.transport.respond(412);
    fixture.transport.failUnreachable();
    CHECK(!fixture.manager.renew("uuid:sub-1"));

    REQUIRE(1 == received.size());
    CHECK("192.168.1.10" == received[0].first);
    const auto* pLost = std::get_if<SubscriptionLost>(&received[0].second);
    REQUIRE(pLost);
    CHECK(Channel::GroupRenderingControl == pLost->channel);
    CHECK(pLost->reason.find("connection refused") != std::string::npos);
  }

  SECTION("NotWhenResubscribingSucceeds")
  {
    fixture.transport.respond(412);
    fixture.transport.respond(accepted("uuid:sub-2"));
    CHECK(fixture.manager.renew("uuid:sub-1"));
    CHECK(received.empty());
  }
}

TEST_CASE("SubscriptionManager | DestroyedDuringRenewal", "[SubscriptionManager]")
{
  control::test::Transport transport;
  util::test::IoContext io;
  util::test::CapturingLog log;
  auto pManager = std::make_unique<Manager>(transport, io, log);
  pManager->setListening(true, "192.168.1.5", 3400);
  auto notified = 0;
  pManager->onNotification([&](const std::string&, const Event&) { ++notified; });

  transport.respond(accepted("uuid:sub-1"));
  pManager->subscribe("192.168.1.10", Channel::AVTransport);

  std::promise<void> renewalStarted;
  transport.respondWith(
    [&](const control::test::Transport::Call&)
    {
      renewalStarted.set_value();
      std::this_thread::sleep_for(std::chrono::milliseconds{200});
      return http::makeResponse(412);
    });
  // Resubscribing would fail as well; nothing may be reported once the
  // manager is gone
  transport.failUnreachable();

  std::thread ioThread([&] { io.advance(std::chrono::seconds{1500}); });
  renewalStarted.get_future().wait();
  pManager.reset();
  ioThread.join();

  CHECK(2 == transport.sent().size());
  CHECK(0 == notified);
  CHECK(0 == io.numPendingTimers());
}

TEST_CASE("SubscriptionManager | BlockingRenewalLeavesOtherContextsAlone",
          "[SubscriptionManager]")
{
  control::test::Transport transport;
  util::test::IoContext work;
  util::test::IoContext io;
  util::test::CapturingLog log;
  Manager manager{transport, work, log};
  manager.setListening(true, "192.168.1.5", 3400);

  transport.respond(accepted("uuid:sub-1"));
  manager.subscribe("192.168.1.10", Channel::AVTransport);
  CHECK(1 == work.numPendingTimers());
  CHECK(0 == io.numPendingTimers());

  std::promise<void> renewalStarted;
  std::promise<void> deviceAnswers;
  auto answer = deviceAnswers.get_future().share();
  transport.respondWith(
    [&](const control::test::Transport::Call&)
    {
      renewalStarted.set_value();
      answer.wait_for(std::chrono::seconds{5});
      return accepted("uuid:sub-1");
    });

  std::thread workThread([&] { work.advance(std::chrono::seconds{1500}); });
  renewalStarted.get_future().wait();

  // A timer on another context fires while the renewal is still blocked
  util::Scheduler<util::test::IoContext> scheduler{io};
  auto runs = 0;
  auto handle = scheduler.schedule(std::chrono::seconds{1}, [&] { ++runs; });
  io.advance(std::chrono::seconds{1});
  CHECK(1 == runs);

  deviceAnswers.set_value();
  workThread.join();
  CHECK(2 == transport.sent().size());
  CHECK(1 == manager.subscriptionCount());
}

TEST_CASE("SubscriptionManager | RenewUnknown", "[SubscriptionManager]")
{
  Fixture fixture;
  CHECK_THROWS_AS(fixture.manager.renew("uuid:nope"), SubscriptionNotFound);
}

TEST_CASE("SubscriptionManager | Unsubscribe", "[SubscriptionManager]")
{
  Fixture fixture;
  fixture.transport.respond(accepted("uuid:sub-1"));
  fixture.manager.subscribe("192.168.1.10", Channel::AVTransport);

  SECTION("Acknowledged")
  {
    CHECK(fixture.manager.unsubscribe("uuid:sub-1"));
    const auto calls = fixture.transport.sent();
    REQUIRE(2 == calls.size());
    CHECK("UNSUBSCRIBE" == calls[1].request.method);
    CHECK(std::optional<std::string>{"uuid:sub-1"} == calls[1].request.headers.get("SID"));
  }

  SECTION("DeviceGone")
  {
    fixture.transport.failUnreachable();
    CHECK(fixture.manager.unsubscribe("uuid:sub-1"));
    CHECK(fixture.log.contains("unsubscribing uuid:sub-1 from 192.168.1.10 failed"));
  }

  CHECK(!fixture.manager.unsubscribe("uuid:sub-1"));
  CHECK(0 == fixture.manager.subscriptionCount());

  // The renewal went with the subscription
  const auto numCalls = fixture.transport.sent().size();
  fixture.io.advance(std::chrono::seconds{4000});
  CHECK(numCalls == fixture.transport.sent().size());
}

TEST_CASE("SubscriptionManager | UnsubscribeAll", "[SubscriptionManager]")
{
  Fixture fixture;
  fixture.transport.respond(accepted("uuid:a1"));
  fixture.transport.respond(accepted("uuid:a2"));
  fixture.transport.respond(accepted("uuid:b1"));
  fixture.manager.subscribe("192.168.1.10", Channel::AVTransport);
  fixture.manager.subscribe("192.168.1.10", Channel::RenderingControl);
  fixture.manager.subscribe("192.168.1.11", Channel::AVTransport);

  fixture.manager.unsubscribeAll("192.168.1.10");
  CHECK(1 == fixture.manager.subscriptionCount());
  CHECK(fixture.manager.subscription("uuid:b1"));

  fixture.manager.unsubscribeEverything();
  CHECK(0 == fixture.manager.subscriptionCount());
  CHECK(
    (std::vector<std::string>{
       "SUBSCRIBE", "SUBSCRIBE", "SUBSCRIBE", "UNSUBSCRIBE", "UNSUBSCRIBE", "UNSUBSCRIBE"}
     == fixture.methods()));
}

TEST_CASE("SubscriptionManager | HandleNotify", "[SubscriptionManager]")
{
  Fixture fixture;
  fixture.transport.respond(accepted("uuid:sub-1"));
  fixture.manager.subscribe("192.168.1.10", Channel::AVTransport);

  std::vector<std::pair<std::string, Event>> received;
  fixture.manager.onNotification([&](const std::string& deviceIp, const Event& event)
                                 { received.emplace_back(deviceIp, event); });

  SECTION("Dispatches")
  {
    const auto response =
      fixture.manager.handleNotify(notify("uuid:sub-1", avTransportChange("PLAYING", "")));
    CHECK(200 == response.status);
    REQUIRE(1 == received.size());
    CHECK("192.168.1.10" == received[0].first);
    CHECK(TransportState::Playing == std::get<TransportStateChanged>(received[0].second).state);

    const auto state = fixture.manager.deviceState("192.168.1.10");
    REQUIRE(state);
    CHECK(std::optional<TransportState>{TransportState::Playing} == state->transportState);
    CHECK(!state->volume);
    CHECK(!fixture.manager.deviceState("192.168.1.11"));
  }

  SECTION("ExpectedStream")
  {
    fixture.manager.setExpectedStreamUrl(
      "192.168.1.10", "http://192.168.1.5:45100/streams/a/live.mp3");
    fixture.manager.handleNotify(
      notify("uuid:sub-1", avTransportChange("PLAYING", "x-sonos-htastream:RINCON_1:spdif")));
    REQUIRE(2 == received.size());
    CHECK(std::holds_alternative<SourceChanged>(received[1].second));

    fixture.manager.clearExpectedStreamUrl("192.168.1.10");
    received.clear();
    fixture.manager.handleNotify(
      notify("uuid:sub-1", avTransportChange("PLAYING", "x-sonos-htastream:RINCON_1:spdif")));
    CHECK(1 == received.size());
  }

  SECTION("FailingHandler")
  {
    fixture.manager.onNotification([](const std::string&, const Event&)
                                   { throw std::runtime_error("handler broke"); });
    const auto response =
      fixture.manager.handleNotify(notify("uuid:sub-1", avTransportChange("STOPPED", "")));
    CHECK(200 == response.status);
    CHECK(fixture.log.contains("notification handler failed: handler broke"));
  }

  SECTION("Rejected")
  {
    auto wrongMethod = notify("uuid:sub-1", "");
    wrongMethod.method = "POST";
    CHECK(405 == fixture.manager.handleNotify(wrongMethod).status);
    CHECK(400 == fixture.manager.handleNotify(notify("", "")).status);
    CHECK(412 == fixture.manager.handleNotify(notify("uuid:other", "")).status);
    CHECK(413
          == fixture.manager.handleNotify(notify("uuid:sub-1", std::string(64 * 1024 + 1, 'x')))
               .status);
    CHECK(received.empty());
  }
}

TEST_CASE("SubscriptionManager | Diagnostics", "[SubscriptionManager]")
{
  Fixture fixture;
  fixture.transport.respond(accepted("uuid:sub-1"));
  fixture.manager.subscribe("192.168.1.10", Channel::ZoneGroupTopology);

  const auto diagnostics = fixture.manager.diagnostics();
  CHECK(diagnostics.running);
  CHECK(3400 == diagnostics.listenPort);
  CHECK("192.168.1.5" == diagnostics.localAddress);
  REQUIRE(1 == diagnostics.subscriptions.size());
  CHECK("uuid:sub-1" == diagnostics.subscriptions[0].id);
  CHECK(Channel::ZoneGroupTopology == diagnostics.subscriptions[0].channel);
}

} // namespace events
} // namespace roomcast
