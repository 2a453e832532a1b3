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

#include <roomcast/http/Message.hpp>
#include <roomcast/test/CatchWrapper.hpp>

namespace roomcast
{
namespace http
{

TEST_CASE("Message | Headers", "[Message]")
{
  Headers headers{{"Content-Type", "text/xml"}};
  CHECK(std::optional<std::string>{"text/xml"} == headers.get("content-type"));
  headers.set("CONTENT-TYPE", "audio/mpeg");
  CHECK(1 == headers.size());
  CHECK(std::optional<std::string>{"audio/mpeg"} == headers.get("Content-Type"));
  headers.add("X-Extra", "1");
  CHECK(headers.contains("x-extra"));
  CHECK(!headers.contains("Missing"));
}

TEST_CASE("Message | Request", "[Message]")
{
  Request request;
  request.method = "SUBSCRIBE";
  request.target = "/MediaRenderer/AVTransport/Event";
  request.headers.set("HOST", "192.168.1.10:1400");
  request.body = "x";
  CHECK(
    "SUBSCRIBE /MediaRenderer/AVTransport/Event HTTP/1.1\r\nHOST: 192.168.1.10:1400\r\n"
    "Content-Length: 1\r\n\r\nx"
    == toString(request));

  const auto parsed = parseRequestHead(
    "NOTIFY /notify/AVTransport?x=1 HTTP/1.1\r\nSID: uuid:RINCON_1\r\nNT:  upnp:event \r\n");
  CHECK("NOTIFY" == parsed.method);
  CHECK("/notify/AVTransport?x=1" == parsed.target);
  CHECK(std::optional<std::string>{"upnp:event"} == parsed.headers.get("nt"));

  CHECK_THROWS_AS(parseRequestHead("garbage"), ParseError);
  CHECK_THROWS_AS(parseRequestHead("GET / HTTP/1.1\r\nno colon"), ParseError);
}

TEST_CASE("Message | Response", "[Message]")
{
  const auto response =
    parseResponse("HTTP/1.1 500 Internal Server Error\r\nContent-Length: 4\r\n\r\nfail");
  CHECK(500 == response.status);
  CHECK("Internal Server Error" == response.reason);
  CHECK("fail" == response.body);
  CHECK(!response.ok());

  CHECK(200 == parseResponseHead("HTTP/1.1 200").status);
  CHECK_THROWS_AS(parseResponseHead("HTTP/1.1 abc OK"), ParseError);
  CHECK_THROWS_AS(parseResponseHead("ICY 200 OK"), ParseError);

  CHECK("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n" == toString(makeResponse(404)));

  auto upgrade = makeResponse(101);
  CHECK(std::string::npos == toString(upgrade).find("Content-Length"));

  auto chunked = makeResponse(200);
  chunked.headers.set("Transfer-Encoding", "chunked");
  CHECK(std::string::npos == toString(chunked).find("Content-Length"));
}

TEST_CASE("Message | Chunked", "[Message]")
{
  const std::string data(300, 'a');
  const auto chunk = encodeChunk(data.data(), data.size());
  CHECK("12c\r\n" == chunk.substr(0, 5));
  CHECK("hello world" == decodeChunked("5\r\nhello\r\n6;ext=1\r\n world\r\n0\r\n\r\n"));
  CHECK(data == decodeChunked(chunk + "0\r\n\r\n"));
  CHECK_THROWS_AS(decodeChunked("5\r\nhel"), ParseError);
  CHECK_THROWS_AS(decodeChunked("zz\r\n"), ParseError);
  CHECK_THROWS_AS(decodeChunked("5\r\nhello\r\n"), ParseError);
}

TEST_CASE("Message | Targets", "[Message]")
{
  const auto target = splitTarget("/ingest/s1?token=123.ab%2Bc&x");
  CHECK("/ingest/s1" == target.path);
  CHECK(std::optional<std::string>{"123.ab+c"} == queryParameter(target.query, "token"));
  CHECK(std::optional<std::string>{""} == queryParameter(target.query, "x"));
  CHECK(!queryParameter(target.query, "y"));
  CHECK("/health" == splitTarget("/health").path);
  CHECK("a b/c" == percentDecode("a+b%2fc"));
  CHECK("100%" == percentDecode("100%"));
}

TEST_CASE("Message | ParseUrl", "[Message]")
{
  const auto url = parseUrl("http://192.168.1.10:1400/xml/device_description.xml");
  REQUIRE(url);
  CHECK("192.168.1.10" == url->host);
  CHECK(1400 == url->port);
  CHECK("/xml/device_description.xml" == url->path);

  const auto bare = parseUrl("http://speaker.local");
  REQUIRE(bare);
  CHECK(80 == bare->port);
  CHECK("/" == bare->path);

  CHECK(!parseUrl("/relative"));
  CHECK(!parseUrl("http://:1400/"));
  CHECK(!parseUrl("http://host:port/"));
  CHECK(!parseUrl("http://host:70000/"));
}

} // namespace http
} // namespace roomcast
