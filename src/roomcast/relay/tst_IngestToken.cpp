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

#include <roomcast/relay/IngestToken.hpp>
#include <roomcast/test/CatchWrapper.hpp>
#include <roomcast/util/test/Clock.hpp>

namespace roomcast
{
namespace relay
{

TEST_CASE("IngestTokens")
{
  util::test::Clock clock;
  const IngestTokens tokens{"secret"};
  const auto token = tokens.issue("s1", clock.now() + std::chrono::minutes{5});

  SECTION("Format")
  {
    const auto dot = token.find('.');
    REQUIRE(std::string::npos != dot);
    CHECK(64 == token.size() - dot - 1);
  }

  SECTION("Valid")
  {
    CHECK_NOTHROW(tokens.verify("s1", token, clock.now()));
    clock.advance(std::chrono::seconds{299});
    CHECK_NOTHROW(tokens.verify("s1", token, clock.now()));
  }

  SECTION("Expired")
  {
    clock.advance(std::chrono::minutes{5});
    CHECK_THROWS_WITH(tokens.verify("s1", token, clock.now()), "token expired");
  }

  SECTION("OtherStream")
  {
    CHECK_THROWS_AS(tokens.verify("s2", token, clock.now()), InvalidToken);
  }

  SECTION("OtherSecret")
  {
    const IngestTokens other{"other"};
    CHECK_THROWS_AS(other.verify("s1", token, clock.now()), InvalidToken);
  }

  SECTION("ExtendedExpiry")
  {
    // Moving the expiry breaks the signature
    const auto dot = token.find('.');
    const auto later = std::to_string(std::stoll(token.substr(0, dot)) + 60000);
    CHECK_THROWS_AS(
      tokens.verify("s1", later + token.substr(dot), clock.now()), InvalidToken);
  }

  SECTION("Malformed")
  {
    CHECK_THROWS_WITH(tokens.verify("s1", "", clock.now()), "malformed token");
    CHECK_THROWS_WITH(tokens.verify("s1", "abc", clock.now()), "malformed token");
    CHECK_THROWS_WITH(tokens.verify("s1", ".abc", clock.now()), "malformed token");
    CHECK_THROWS_WITH(tokens.verify("s1", "12x.abc", clock.now()), "malformed token");
  }

  SECTION("RandomSecret")
  {
    const IngestTokens first{""};
    const IngestTokens second{""};
    const auto expiry = clock.now() + std::chrono::minutes{1};
    CHECK_NOTHROW(first.verify("s1", first.issue("s1", expiry), clock.now()));
    CHECK(first.issue("s1", expiry) != second.issue("s1", expiry));
  }
}

} // namespace relay
} // namespace roomcast
