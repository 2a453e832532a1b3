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

#include <cstdint>
#include <memory>
#include <vector>

namespace roomcast
{
namespace relay
{

using Bytes = std::vector<std::uint8_t>;

// Encoded audio as received from a producer. Frames are shared between the
// replay buffer and every consumer queue and never modified.
using Frame = std::shared_ptr<const Bytes>;

inline Frame makeFrame(Bytes bytes)
{
  return std::make_shared<const Bytes>(std::move(bytes));
}

} // namespace relay
} // namespace roomcast
