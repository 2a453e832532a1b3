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

#include <roomcast/events/Channel.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace roomcast
{
namespace events
{

enum class TransportState
{
  Playing,
  PausedPlayback,
  Stopped,
  Transitioning
};

// Accepts the device spellings, including the short "PAUSED" some
// firmware versions report
inline std::optional<TransportState> parseTransportState(const std::string& text)
{
  if (text == "PLAYING")
  {
    return TransportState::Playing;
  }
  if (text == "PAUSED_PLAYBACK" || text == "PAUSED")
  {
    return TransportState::PausedPlayback;
  }
  if (text == "STOPPED")
  {
    return TransportState::Stopped;
  }
  if (text == "TRANSITIONING")
  {
    return TransportState::Transitioning;
  }
  return std::nullopt;
}

inline const char* toString(const TransportState state)
{
  switch (state)
  {
  case TransportState::Playing:
    return "PLAYING";
  case TransportState::PausedPlayback:
    return "PAUSED_PLAYBACK";
  case TransportState::Stopped:
    return "STOPPED";
  case TransportState::Transitioning:
    break;
  }
  return "TRANSITIONING";
}

struct TransportStateChanged
{
  TransportState state;
  std::optional<std::string> currentUri;
};

// Volume in 0..100
struct VolumeChanged
{
  int volume;
};

struct MuteChanged
{
  bool muted;
};

// The group layout changed, groups have to be fetched again
struct TopologyChanged
{
};

// The device plays something other than the stream it was sent
struct SourceChanged
{
  std::string currentUri;
  std::string expectedUri;
};

// Renewing failed and so did subscribing again. No further events arrive
// on this channel until something subscribes to it anew.
struct SubscriptionLost
{
  Channel channel;
  std::string reason;
};

using Event = std::variant<TransportStateChanged,
                           VolumeChanged,
                           MuteChanged,
                           TopologyChanged,
                           SourceChanged,
                           SubscriptionLost>;

namespace detail
{

struct PrintEvent
{
  void operator()(const TransportStateChanged& e) const
  {
    stream << "transport " << toString(e.state);
    if (e.currentUri)
    {
      stream << " " << *e.currentUri;
    }
  }
  void operator()(const VolumeChanged& e) const { stream << "volume " << e.volume; }
  void operator()(const MuteChanged& e) const { stream << (e.muted ? "muted" : "unmuted"); }
  void operator()(const TopologyChanged&) const { stream << "topology changed"; }
  void operator()(const SourceChanged& e) const
  {
    stream << "source changed to " << e.currentUri << ", expected " << e.expectedUri;
  }
  void operator()(const SubscriptionLost& e) const
  {
    stream << e.channel << " subscription lost: " << e.reason;
  }

  std::ostream& stream;
};

} // namespace detail

inline std::ostream& operator<<(std::ostream& stream, const Event& event)
{
  std::visit(detail::PrintEvent{stream}, event);
  return stream;
}

} // namespace events
} // namespace roomcast
