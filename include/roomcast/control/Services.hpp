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

namespace roomcast
{
namespace control
{

// Port every speaker serves control, event and description requests on
static constexpr std::uint16_t kDevicePort = 1400;

struct Service
{
  const char* name;
  const char* urn;
  const char* controlPath;
  const char* eventPath;
};

static constexpr Service kAvTransport = {"AVTransport",
                                         "urn:schemas-upnp-org:service:AVTransport:1",
                                         "/MediaRenderer/AVTransport/Control",
                                         "/MediaRenderer/AVTransport/Event"};

static constexpr Service kRenderingControl = {
  "RenderingControl",
  "urn:schemas-upnp-org:service:RenderingControl:1",
  "/MediaRenderer/RenderingControl/Control",
  "/MediaRenderer/RenderingControl/Event"};

static constexpr Service kGroupRenderingControl = {
  "GroupRenderingControl",
  "urn:schemas-upnp-org:service:GroupRenderingControl:1",
  "/MediaRenderer/GroupRenderingControl/Control",
  "/MediaRenderer/GroupRenderingControl/Event"};

static constexpr Service kZoneGroupTopology = {
  "ZoneGroupTopology",
  "urn:schemas-upnp-org:service:ZoneGroupTopology:1",
  "/ZoneGroupTopology/Control",
  "/ZoneGroupTopology/Event"};

} // namespace control
} // namespace roomcast
