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

#include <roomcast/http/Message.hpp>
#include <roomcast/xml/Scanner.hpp>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace roomcast
{
namespace control
{

using Params = std::vector<std::pair<std::string, std::string>>;

// Single-line SOAP envelope for the given action. Parameters keep the
// caller's order and their values are escaped.
inline std::string makeEnvelope(const std::string& serviceUrn,
                                const std::string& action,
                                const Params& params)
{
  std::string body;
  for (const auto& param : params)
  {
    body += "<" + param.first + ">" + xml::escape(param.second) + "</" + param.first + ">";
  }

  return "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
         "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
         "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
         "<s:Body><u:"
         + action + " xmlns:u=\"" + serviceUrn + "\">" + body + "</u:" + action
         + "></s:Body></s:Envelope>";
}

inline http::Request makeControlRequest(const std::string& host,
                                        const std::string& controlPath,
                                        const std::string& serviceUrn,
                                        const std::string& action,
                                        const Params& params)
{
  http::Request request;
  request.method = "POST";
  request.target = controlPath;
  request.body = makeEnvelope(serviceUrn, action, params);
  request.headers.set("Host", host);
  request.headers.set("Content-Type", "text/xml; charset=\"utf-8\"");
  request.headers.set("SOAPACTION", "\"" + serviceUrn + "#" + action + "\"");
  request.headers.set("Content-Length", std::to_string(request.body.size()));
  request.headers.set("Connection", "close");
  return request;
}

struct Fault
{
  // UPnP error code, 0 if the fault carries none
  int code;
  std::string message;
};

inline std::optional<Fault> parseFault(const std::string& body)
{
  const auto faultContent = xml::elementText(body, "Fault");
  if (!faultContent)
  {
    return std::nullopt;
  }

  Fault fault{0, {}};
  if (const auto errorCode = xml::elementText(*faultContent, "errorCode"))
  {
    fault.code = std::atoi(http::trim(*errorCode).c_str());
  }
  if (const auto description = xml::elementText(*faultContent, "errorDescription"))
  {
    fault.message = xml::unescape(http::trim(*description));
  }
  else if (const auto faultString = xml::elementText(*faultContent, "faultstring"))
  {
    fault.message = xml::unescape(http::trim(*faultString));
  }
  return fault;
}

// Text of the named response element, unescaped once
inline std::optional<std::string> responseValue(const std::string& body,
                                                const std::string& name)
{
  if (const auto text = xml::elementText(body, name))
  {
    return xml::unescape(*text);
  }
  return std::nullopt;
}

} // namespace control
} // namespace roomcast
