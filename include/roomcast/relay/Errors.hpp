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

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace roomcast
{
namespace relay
{

struct StreamNotFound : std::runtime_error
{
  StreamNotFound(const std::string& id)
    : std::runtime_error("unknown stream " + id)
    , streamId(id)
  {
  }

  std::string streamId;
};

struct TooManyConsumers : std::runtime_error
{
  TooManyConsumers(const std::string& id, const std::size_t max)
    : std::runtime_error("stream " + id + " already has " + std::to_string(max) + " consumers")
    , streamId(id)
  {
  }

  std::string streamId;
};

struct InvalidToken : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// A text message from a producer that is not a known event
struct IngestMessageError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// Violation of the WebSocket framing rules. closeCode is sent to the peer
// before the connection is dropped.
struct ProtocolError : std::runtime_error
{
  ProtocolError(const std::uint16_t code, const std::string& what)
    : std::runtime_error(what)
    , closeCode(code)
  {
  }

  std::uint16_t closeCode;
};

} // namespace relay
} // namespace roomcast
