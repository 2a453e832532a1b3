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

#include <roomcast/control/Client.hpp>
#include <roomcast/control/test/Transport.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/util/test/Log.hpp>

namespace roomcast
{
namespace control
{
namespace
{

using TestClient = Client<test::Transport, util::test::CapturingLog>;

struct Fixture
{
  test::Transport transport;
  util::test::CapturingLog log;
  std::vector<std::chrono::milliseconds> sleeps;
  TestClient client{
    transport, log, {}, [this](const std::chrono::milliseconds delay) { sleeps.push_back(delay); }};
};

} // namespace

TEST_CASE("Client | Send", "[Client]")
{
  Fixture fixture;
  const auto response = test::soapResponse("Play", kAvTransport.urn, "");
  fixture.transport.respond(200, response);

  CHECK(response == fixture.client.send("192.168.1.10", kAvTransport, "Play", {}));

  const auto calls = fixture.transport.sent();
  REQUIRE(1 == calls.size());
  CHECK("192.168.1.10" == calls[0].host);
  CHECK(1400 == calls[0].port);
  CHECK(std::chrono::milliseconds{10000} == calls[0].timeout);
  CHECK("192.168.1.10:1400" == *calls[0].request.headers.get("Host"));
  CHECK("/MediaRenderer/AVTransport/Control" == calls[0].request.target);
}

TEST_CASE("Client | Errors", "[Client]")
{
  Fixture fixture;

  SECTION("FaultWithServerError")
  {
    fixture.transport.respond(test::soapFault(402));
    try
    {
      fixture.client.send("192.168.1.10", kAvTransport, "Play", {});
      FAIL("expected DeviceProtocolError");
    }
    catch (const DeviceProtocolError& e)
    {
      CHECK(500 == e.httpStatus);
      CHECK(402 == e.faultCode);
      CHECK(!e.isTransient());
    }
  }

  SECTION("FaultWithSuccessStatus")
  {
    auto response = test::soapFault(714);
    response.status = 200;
    fixture.transport.respond(response);
    CHECK_THROWS_AS(fixture.client.send("192.168.1.10", kAvTransport, "Play", {}),
                    DeviceProtocolError);
  }

  SECTION("HttpErrorWithoutFault")
  {
    fixture.transport.respond(404, "not here");
    try
    {
      fixture.client.send("192.168.1.10", kAvTransport, "Play", {});
      FAIL("expected DeviceProtocolError");
    }
    catch (const DeviceProtocolError& e)
    {
      CHECK(404 == e.httpStatus);
      CHECK(0 == e.faultCode);
    }
  }

  SECTION("Unreachable")
  {
    fixture.transport.failUnreachable();
    CHECK_THROWS_AS(
      fixture.client.send("192.168.1.10", kAvTransport, "Play", {}), DeviceUnreachable);
  }
}

TEST_CASE("Client | TransientClassification", "[Client]")
{
  CHECK(DeviceProtocolError{500, 701, ""}.isTransient());
  CHECK(DeviceProtocolError{500, 714, ""}.isTransient());
  CHECK(DeviceProtocolError{500, 716, ""}.isTransient());
  CHECK(!DeviceProtocolError{500, 402, ""}.isTransient());
  CHECK(!DeviceProtocolError{500, 0, ""}.isTransient());
  CHECK(714 == DeviceProtocolError::kIllegalSeekTarget);
  CHECK(DeviceProtocolError{500, DeviceProtocolError::kIllegalSeekTarget, ""}.isTransient());
}

TEST_CASE("Client | SendWithRetry", "[Client]")
{
  Fixture fixture;
  const auto ok = test::soapResponse("Play", kAvTransport.urn, "");
  using std::chrono::milliseconds;

  SECTION("RetriesTransientFaultsWithBackoff")
  {
    fixture.transport.respond(test::soapFault(701));
    fixture.transport.respond(test::soapFault(716));
    fixture.transport.respond(200, ok);

    CHECK(ok == fixture.client.sendWithRetry("192.168.1.10", kAvTransport, "Play", {}));
    CHECK(3 == fixture.transport.sent().size());
    CHECK(std::vector<milliseconds>{milliseconds{200}, milliseconds{500}} == fixture.sleeps);
    CHECK(fixture.log.contains("retrying"));
  }

  SECTION("GivesUpAfterLastDelay")
  {
    for (auto i = 0; i < 4; ++i)
    {
      fixture.transport.respond(test::soapFault(701));
    }
    CHECK_THROWS_AS(fixture.client.sendWithRetry("192.168.1.10", kAvTransport, "Play", {}),
                    DeviceProtocolError);
    CHECK(4 == fixture.transport.sent().size());
    CHECK(
      std::vector<milliseconds>{milliseconds{200}, milliseconds{500}, milliseconds{1000}}
      == fixture.sleeps);
  }

  SECTION("RetriesTimeouts")
  {
    fixture.transport.failTimeout();
    fixture.transport.respond(200, ok);
    CHECK(ok == fixture.client.sendWithRetry("192.168.1.10", kAvTransport, "Play", {}));
    CHECK(1 == fixture.sleeps.size());
  }

  SECTION("FailsFastOnOtherErrors")
  {
    fixture.transport.respond(test::soapFault(402));
    CHECK_THROWS_AS(fixture.client.sendWithRetry("192.168.1.10", kAvTransport, "Play", {}),
                    DeviceProtocolError);
    fixture.transport.failUnreachable();
    CHECK_THROWS_AS(fixture.client.sendWithRetry("192.168.1.10", kAvTransport, "Play", {}),
                    DeviceUnreachable);
    CHECK(2 == fixture.transport.sent().size());
    CHECK(fixture.sleeps.empty());
  }
}

} // namespace control
} // namespace roomcast
