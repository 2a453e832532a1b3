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

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace roomcast
{
namespace http
{

// Minimal HTTP/1.1 message model shared by the device-control client, the
// event subscription requests, SSDP responses and the local server.

struct ParseError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

inline std::string toLower(std::string text)
{
  std::transform(text.begin(),
                 text.end(),
                 text.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

inline bool iequals(const std::string& lhs, const std::string& rhs)
{
  return lhs.size() == rhs.size()
         && std::equal(lhs.begin(),
                       lhs.end(),
                       rhs.begin(),
                       [](const unsigned char a, const unsigned char b)
                       { return std::tolower(a) == std::tolower(b); });
}

inline std::string trim(const std::string& text)
{
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
  {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

// Header fields in insertion order with case-insensitive lookup
class Headers
{
public:
  using Field = std::pair<std::string, std::string>;

  Headers() = default;

  Headers(std::initializer_list<Field> fields)
    : mFields(fields)
  {
  }

  void set(const std::string& name, std::string value)
  {
    for (auto& field : mFields)
    {
      if (iequals(field.first, name))
      {
        field.second = std::move(value);
        return;
      }
    }
    mFields.emplace_back(name, std::move(value));
  }

  void add(std::string name, std::string value)
  {
    mFields.emplace_back(std::move(name), std::move(value));
  }

  std::optional<std::string> get(const std::string& name) const
  {
    for (const auto& field : mFields)
    {
      if (iequals(field.first, name))
      {
        return field.second;
      }
    }
    return std::nullopt;
  }

  bool contains(const std::string& name) const { return get(name).has_value(); }

  std::vector<Field>::const_iterator begin() const { return mFields.begin(); }
  std::vector<Field>::const_iterator end() const { return mFields.end(); }
  std::size_t size() const { return mFields.size(); }

private:
  std::vector<Field> mFields;
};

struct Request
{
  std::string method;
  std::string target;
  Headers headers;
  std::string body;
};

struct Response
{
  int status = 200;
  std::string reason;
  Headers headers;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

inline const char* reasonPhrase(const int status)
{
  switch (status)
  {
  case 101:
    return "Switching Protocols";
  case 200:
    return "OK";
  case 204:
    return "No Content";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 409:
    return "Conflict";
  case 412:
    return "Precondition Failed";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  default:
    return "Unknown";
  }
}

inline Response makeResponse(const int status, std::string body = {})
{
  Response response;
  response.status = status;
  response.reason = reasonPhrase(status);
  response.body = std::move(body);
  return response;
}

namespace detail
{

inline void appendHeaders(std::string& out, const Headers& headers)
{
  for (const auto& field : headers)
  {
    out += field.first;
    out += ": ";
    out += field.second;
    out += "\r\n";
  }
}

// Splits a message head into its start line and header fields
inline std::pair<std::string, Headers> splitHead(const std::string& head)
{
  auto lineEnd = head.find("\r\n");
  auto startLine = head.substr(0, lineEnd);
  Headers headers;
  while (lineEnd != std::string::npos)
  {
    const auto lineBegin = lineEnd + 2;
    lineEnd = head.find("\r\n", lineBegin);
    const auto line = head.substr(lineBegin,
                                  lineEnd == std::string::npos ? std::string::npos
                                                               : lineEnd - lineBegin);
    if (line.empty())
    {
      break;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos)
    {
      throw ParseError{"malformed header line: " + line};
    }
    headers.add(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
  }
  return {std::move(startLine), std::move(headers)};
}

} // namespace detail

// Serialized request including body. Content-Length is added when absent.
inline std::string toString(const Request& request)
{
  std::string out = request.method + " " + request.target + " HTTP/1.1\r\n";
  detail::appendHeaders(out, request.headers);
  if (!request.headers.contains("Content-Length") && !request.body.empty())
  {
    out += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
  }
  out += "\r\n";
  out += request.body;
  return out;
}

inline std::string toString(const Response& response)
{
  std::string out = "HTTP/1.1 " + std::to_string(response.status) + " "
                    + (response.reason.empty() ? reasonPhrase(response.status)
                                               : response.reason)
                    + "\r\n";
  detail::appendHeaders(out, response.headers);
  if (!response.headers.contains("Content-Length")
      && !response.headers.contains("Transfer-Encoding") && response.status != 101)
  {
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
  }
  out += "\r\n";
  out += response.body;
  return out;
}

// Parses everything up to (excluding) the blank line ending the head.
// Throws ParseError.
inline Request parseRequestHead(const std::string& head)
{
  auto parts = detail::splitHead(head);
  const auto& startLine = parts.first;
  const auto firstSpace = startLine.find(' ');
  const auto secondSpace =
    firstSpace == std::string::npos ? std::string::npos : startLine.find(' ', firstSpace + 1);
  if (secondSpace == std::string::npos
      || startLine.compare(secondSpace + 1, 5, "HTTP/") != 0)
  {
    throw ParseError{"malformed request line: " + startLine};
  }

  Request request;
  request.method = startLine.substr(0, firstSpace);
  request.target = startLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);
  request.headers = std::move(parts.second);
  return request;
}

// Throws ParseError
inline Response parseResponseHead(const std::string& head)
{
  auto parts = detail::splitHead(head);
  const auto& statusLine = parts.first;
  if (statusLine.compare(0, 5, "HTTP/") != 0)
  {
    throw ParseError{"malformed status line: " + statusLine};
  }
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string::npos)
  {
    throw ParseError{"malformed status line: " + statusLine};
  }
  const auto secondSpace = statusLine.find(' ', firstSpace + 1);

  Response response;
  const auto code = statusLine.substr(firstSpace + 1,
                                      secondSpace == std::string::npos
                                        ? std::string::npos
                                        : secondSpace - firstSpace - 1);
  char* pEnd = nullptr;
  response.status = static_cast<int>(std::strtol(code.c_str(), &pEnd, 10));
  if (code.empty() || *pEnd != '\0')
  {
    throw ParseError{"malformed status code: " + code};
  }
  response.reason =
    secondSpace == std::string::npos ? std::string{} : statusLine.substr(secondSpace + 1);
  response.headers = std::move(parts.second);
  return response;
}

// Parses a complete response whose head and body are both in 'raw'
inline Response parseResponse(const std::string& raw)
{
  const auto headEnd = raw.find("\r\n\r\n");
  auto response =
    parseResponseHead(headEnd == std::string::npos ? raw : raw.substr(0, headEnd));
  if (headEnd != std::string::npos)
  {
    response.body = raw.substr(headEnd + 4);
  }
  return response;
}

// Decodes a chunked transfer-coded body. Throws ParseError.
inline std::string decodeChunked(const std::string& body)
{
  std::string result;
  std::size_t pos = 0;
  while (true)
  {
    const auto lineEnd = body.find("\r\n", pos);
    if (lineEnd == std::string::npos)
    {
      throw ParseError{"truncated chunk size"};
    }
    const auto sizeText = body.substr(pos, lineEnd - pos);
    char* pEnd = nullptr;
    const auto size = std::strtoul(sizeText.c_str(), &pEnd, 16);
    if (sizeText.empty() || (pEnd && *pEnd != '\0' && *pEnd != ';'))
    {
      throw ParseError{"malformed chunk size: " + sizeText};
    }
    if (size == 0)
    {
      return result;
    }
    if (lineEnd + 2 + size > body.size())
    {
      throw ParseError{"truncated chunk"};
    }
    result.append(body, lineEnd + 2, size);
    pos = lineEnd + 2 + size + 2;
  }
}

inline std::string encodeChunk(const char* pData, const std::size_t size)
{
  static const char kHex[] = "0123456789abcdef";
  std::string sizeText;
  auto remaining = size;
  do
  {
    sizeText.insert(sizeText.begin(), kHex[remaining % 16]);
    remaining /= 16;
  } while (remaining > 0);

  std::string out = sizeText + "\r\n";
  out.append(pData, size);
  out += "\r\n";
  return out;
}

struct Target
{
  std::string path;
  std::string query;
};

inline Target splitTarget(const std::string& target)
{
  const auto question = target.find('?');
  if (question == std::string::npos)
  {
    return {target, {}};
  }
  return {target.substr(0, question), target.substr(question + 1)};
}

inline std::string percentDecode(const std::string& text)
{
  std::string result;
  result.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i)
  {
    if (text[i] == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1]))
        && std::isxdigit(static_cast<unsigned char>(text[i + 2])))
    {
      result += static_cast<char>(std::strtol(text.substr(i + 1, 2).c_str(), nullptr, 16));
      i += 2;
    }
    else if (text[i] == '+')
    {
      result += ' ';
    }
    else
    {
      result += text[i];
    }
  }
  return result;
}

inline std::optional<std::string> queryParameter(const std::string& query,
                                                 const std::string& name)
{
  std::size_t pos = 0;
  while (pos <= query.size())
  {
    const auto amp = query.find('&', pos);
    const auto pair =
      query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    const auto eq = pair.find('=');
    if (percentDecode(pair.substr(0, eq)) == name)
    {
      return eq == std::string::npos ? std::string{} : percentDecode(pair.substr(eq + 1));
    }
    if (amp == std::string::npos)
    {
      break;
    }
    pos = amp + 1;
  }
  return std::nullopt;
}

struct Url
{
  std::string host;
  std::uint16_t port;
  std::string path;
};

// Splits "http://host:port/path". Returns nullopt for anything that is not
// an absolute URL with a host.
inline std::optional<Url> parseUrl(const std::string& url)
{
  const auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos)
  {
    return std::nullopt;
  }
  const auto authorityBegin = schemeEnd + 3;
  const auto pathBegin = url.find('/', authorityBegin);
  const auto authority = url.substr(
    authorityBegin,
    pathBegin == std::string::npos ? std::string::npos : pathBegin - authorityBegin);
  if (authority.empty())
  {
    return std::nullopt;
  }

  Url result;
  result.path = pathBegin == std::string::npos ? "/" : url.substr(pathBegin);
  const auto colon = authority.rfind(':');
  if (colon == std::string::npos)
  {
    result.host = authority;
    result.port = 80;
    return result;
  }
  result.host = authority.substr(0, colon);
  const auto portText = authority.substr(colon + 1);
  char* pEnd = nullptr;
  const auto port = std::strtoul(portText.c_str(), &pEnd, 10);
  if (portText.empty() || *pEnd != '\0' || port > 65535 || result.host.empty())
  {
    return std::nullopt;
  }
  result.port = static_cast<std::uint16_t>(port);
  return result;
}

} // namespace http
} // namespace roomcast
