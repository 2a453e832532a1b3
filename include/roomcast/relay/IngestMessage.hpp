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
#include <roomcast/relay/Errors.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace roomcast
{
namespace relay
{

// Text messages a producer sends next to its audio:
//
//   {"type": "HANDSHAKE", "payload": {"codec": ...} | {"encoderConfig": {"codec": ...}}}
//   {"type": "METADATA_UPDATE", "payload": {"title": ..., "artist": ..., "album": ...}}
//   {"type": "HEARTBEAT"}
//   {"type": "SET_VOLUME", "payload": {"ip": ..., "volume": 0-100, "group": bool}}
//   {"type": "SET_MUTE", "payload": {"ip": ..., "mute": bool, "group": bool}}
//   {"type": "GET_VOLUME", "payload": {"ip": ...}}
//   {"type": "GET_MUTE", "payload": {"ip": ...}}
//   {"type": "START_PLAYBACK", "payload": {"speakerIps": [...], "metadata": {...}}}
//   {"type": "STOP_PLAYBACK_SPEAKER", "payload": {"ip": ...}}
//
// START_PLAYBACK also accepts a single "speakerIp".

struct Handshake
{
  std::optional<std::string> codec;
};

struct MetadataUpdate
{
  StreamMetadata metadata;
};

struct Heartbeat
{
};

struct SetVolume
{
  std::string ip;
  int volume;
  bool group;
};

struct SetMute
{
  std::string ip;
  bool mute;
  bool group;
};

struct GetVolume
{
  std::string ip;
};

struct GetMute
{
  std::string ip;
};

struct StartPlayback
{
  std::vector<std::string> speakerIps;
  std::optional<StreamMetadata> metadata;
};

struct StopPlaybackSpeaker
{
  std::string ip;
};

using IngestEvent = std::variant<Handshake,
                                 MetadataUpdate,
                                 Heartbeat,
                                 SetVolume,
                                 SetMute,
                                 GetVolume,
                                 GetMute,
                                 StartPlayback,
                                 StopPlaybackSpeaker>;

// Outcome of starting playback on one device
struct PlaybackResult
{
  std::string speakerIp;
  bool success;
  std::optional<std::string> streamUrl;
  std::optional<std::string> error;
};

namespace detail
{

inline std::optional<std::string> optionalString(const nlohmann::json& object,
                                                 const char* key)
{
  const auto it = object.find(key);
  if (it == object.end() || it->is_null())
  {
    return std::nullopt;
  }
  if (!it->is_string())
  {
    throw IngestMessageError{std::string{"\""} + key + "\" must be a string"};
  }
  return it->get<std::string>();
}

inline const nlohmann::json& payloadOf(const nlohmann::json& message, const std::string& type)
{
  const auto payload = message.find("payload");
  if (payload == message.end() || !payload->is_object())
  {
    throw IngestMessageError{type + " without payload"};
  }
  return *payload;
}

inline std::string requiredString(const nlohmann::json& object, const char* key)
{
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string())
  {
    throw IngestMessageError{std::string{"\""} + key + "\" must be a string"};
  }
  return it->get<std::string>();
}

inline bool requiredBool(const nlohmann::json& object, const char* key)
{
  const auto it = object.find(key);
  if (it == object.end() || !it->is_boolean())
  {
    throw IngestMessageError{std::string{"\""} + key + "\" must be a boolean"};
  }
  return it->get<bool>();
}

inline bool optionalBool(const nlohmann::json& object, const char* key)
{
  const auto it = object.find(key);
  return it == object.end() || it->is_null() ? false : requiredBool(object, key);
}

inline StreamMetadata parseMetadata(const nlohmann::json& object)
{
  StreamMetadata metadata;
  metadata.title = optionalString(object, "title");
  metadata.artist = optionalString(object, "artist");
  metadata.album = optionalString(object, "album");
  return metadata;
}

inline Handshake parseHandshake(const nlohmann::json& payload)
{
  Handshake handshake;
  const auto config = payload.find("encoderConfig");
  if (config != payload.end() && config->is_object())
  {
    handshake.codec = optionalString(*config, "codec");
  }
  if (!handshake.codec)
  {
    handshake.codec = optionalString(payload, "codec");
  }
  return handshake;
}

inline StartPlayback parseStartPlayback(const nlohmann::json& payload)
{
  StartPlayback start;
  const auto ips = payload.find("speakerIps");
  if (ips != payload.end() && !ips->is_null())
  {
    if (!ips->is_array())
    {
      throw IngestMessageError{"\"speakerIps\" must be an array"};
    }
    for (const auto& ip : *ips)
    {
      if (!ip.is_string())
      {
        throw IngestMessageError{"\"speakerIps\" must hold strings"};
      }
      start.speakerIps.push_back(ip.get<std::string>());
    }
  }
  else if (const auto ip = optionalString(payload, "speakerIp"))
  {
    start.speakerIps.push_back(*ip);
  }
  const auto metadata = payload.find("metadata");
  if (metadata != payload.end() && metadata->is_object())
  {
    start.metadata = parseMetadata(*metadata);
  }
  return start;
}

} // namespace detail

// Throws IngestMessageError
inline IngestEvent parseIngestMessage(const std::string& text)
{
  const auto message = nlohmann::json::parse(text, nullptr, false);
  if (message.is_discarded() || !message.is_object())
  {
    throw IngestMessageError{"message is not a JSON object"};
  }
  const auto type = message.find("type");
  if (type == message.end() || !type->is_string())
  {
    throw IngestMessageError{"message without type"};
  }

  const auto name = type->get<std::string>();
  if (name == "HEARTBEAT")
  {
    return Heartbeat{};
  }
  if (name == "METADATA_UPDATE")
  {
    return MetadataUpdate{detail::parseMetadata(detail::payloadOf(message, name))};
  }
  if (name == "HANDSHAKE")
  {
    const auto payload = message.find("payload");
    return payload != message.end() && payload->is_object() ? detail::parseHandshake(*payload)
                                                            : Handshake{};
  }
  if (name == "SET_VOLUME")
  {
    const auto& payload = detail::payloadOf(message, name);
    const auto volume = payload.find("volume");
    if (volume == payload.end() || !volume->is_number_integer()
        || volume->get<long long>() < 0 || volume->get<long long>() > 100)
    {
      throw IngestMessageError{"\"volume\" must be an integer from 0 to 100"};
    }
    return SetVolume{detail::requiredString(payload, "ip"), volume->get<int>(),
                     detail::optionalBool(payload, "group")};
  }
  if (name == "SET_MUTE")
  {
    const auto& payload = detail::payloadOf(message, name);
    return SetMute{detail::requiredString(payload, "ip"), detail::requiredBool(payload, "mute"),
                   detail::optionalBool(payload, "group")};
  }
  if (name == "GET_VOLUME")
  {
    return GetVolume{detail::requiredString(detail::payloadOf(message, name), "ip")};
  }
  if (name == "GET_MUTE")
  {
    return GetMute{detail::requiredString(detail::payloadOf(message, name), "ip")};
  }
  if (name == "START_PLAYBACK")
  {
    return detail::parseStartPlayback(detail::payloadOf(message, name));
  }
  if (name == "STOP_PLAYBACK_SPEAKER")
  {
    return StopPlaybackSpeaker{
      detail::requiredString(detail::payloadOf(message, name), "ip")};
  }
  throw IngestMessageError{"unknown message type " + name};
}

inline std::string makeHeartbeatAck()
{
  return nlohmann::json{{"type", "HEARTBEAT_ACK"}}.dump();
}

// Sent once the first frame of a stream has arrived
inline std::string makeStreamReady(const std::size_t bufferSize)
{
  return nlohmann::json{{"type", "STREAM_READY"}, {"payload", {{"bufferSize", bufferSize}}}}
    .dump();
}

inline std::string makeHandshakeAck(const std::string& streamId)
{
  return nlohmann::json{{"type", "HANDSHAKE_ACK"}, {"payload", {{"streamId", streamId}}}}.dump();
}

inline std::string makeVolumeState(const std::string& ip, const int volume)
{
  return nlohmann::json{{"type", "VOLUME_STATE"}, {"payload", {{"ip", ip}, {"volume", volume}}}}
    .dump();
}

inline std::string makeMuteState(const std::string& ip, const bool mute)
{
  return nlohmann::json{{"type", "MUTE_STATE"}, {"payload", {{"ip", ip}, {"mute", mute}}}}
    .dump();
}

inline std::string makePlaybackResults(const std::vector<PlaybackResult>& results)
{
  auto list = nlohmann::json::array();
  for (const auto& result : results)
  {
    nlohmann::json entry{{"speakerIp", result.speakerIp}, {"success", result.success}};
    if (result.streamUrl)
    {
      entry["streamUrl"] = *result.streamUrl;
    }
    if (result.error)
    {
      entry["error"] = *result.error;
    }
    list.push_back(std::move(entry));
  }
  return nlohmann::json{{"type", "PLAYBACK_RESULTS"}, {"payload", {{"results", list}}}}.dump();
}

inline std::string makePlaybackError(const std::string& message)
{
  return nlohmann::json{{"type", "PLAYBACK_ERROR"}, {"payload", {{"message", message}}}}.dump();
}

inline std::string makeErrorMessage(const std::string& message)
{
  return nlohmann::json{{"type", "ERROR"}, {"message", message}}.dump();
}

} // namespace relay
} // namespace roomcast
