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

#include <roomcast/StreamMetadata.hpp>
#include <roomcast/xml/Scanner.hpp>
#include <initializer_list>
#include <string>

namespace roomcast
{
namespace control
{

static constexpr const char* kDefaultStreamTitle = "Browser Audio";
static constexpr const char* kDefaultStreamCreator = "Roomcast";

// Speakers only accept plain http streams of compressed audio under their
// internet radio scheme
inline std::string toRadioUri(const std::string& streamUrl)
{
  for (const auto* scheme : {"https://", "http://"})
  {
    const auto length = std::char_traits<char>::length(scheme);
    if (streamUrl.compare(0, length, scheme) == 0)
    {
      return "x-rincon-mp3radio://" + streamUrl.substr(length);
    }
  }
  return streamUrl;
}

// DIDL-Lite item describing a live broadcast, shown by the speaker's
// controllers while the stream plays
inline std::string makeDidlLite(const std::string& streamUrl, const StreamMetadata& metadata)
{
  std::string didl =
    "<DIDL-Lite xmlns:dc=\"http://purl.org/dc/elements/1.1/\" "
    "xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\" "
    "xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\">"
    "<item id=\"0\" parentID=\"-1\" restricted=\"true\">";
  didl += "<dc:title>" + xml::escape(metadata.title.value_or(kDefaultStreamTitle))
          + "</dc:title>";
  didl += "<dc:creator>" + xml::escape(metadata.artist.value_or(kDefaultStreamCreator))
          + "</dc:creator>";
  if (metadata.album)
  {
    didl += "<upnp:album>" + xml::escape(*metadata.album) + "</upnp:album>";
  }
  didl += "<upnp:class>object.item.audioItem.audioBroadcast</upnp:class>";
  didl += "<res protocolInfo=\"http-get:*:audio/*:*\">" + xml::escape(streamUrl) + "</res>";
  didl += "</item></DIDL-Lite>";
  return didl;
}

} // namespace control
} // namespace roomcast
