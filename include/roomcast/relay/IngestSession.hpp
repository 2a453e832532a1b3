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

#include <roomcast/relay/Errors.hpp>
#include <roomcast/relay/IngestMessage.hpp>
#include <roomcast/relay/Relay.hpp>
#include <roomcast/relay/WebSocket.hpp>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace roomcast
{
namespace relay
{

// Protocol state of one producer connection after the upgrade. The owner
// feeds received bytes in and writes back whatever receive() returns. The
// producer is attached for the lifetime of the session.
//
// Device commands are forwarded to Devices, which provides:
//   setVolume(ip, volume, group), volume(ip), setMute(ip, mute, group), mute(ip),
//   play(ip, streamId, metadata) returning the stream URL, stop(ip)
// and reports failures as std::runtime_error.
template <typename StreamRelay, typename Devices, typename Log>
class IngestSession
{
public:
  IngestSession(StreamRelay& relay,
                Devices& devices,
                std::string streamId,
                const ProducerId producer,
                Log log,
                const std::size_t maxMessageSize = 1024 * 1024)
    : mRelay(relay)
    , mDevices(devices)
    , mStreamId(std::move(streamId))
    , mProducer(producer)
    , mLog(std::move(log))
    , mDecoder(maxMessageSize)
  {
    mRelay.attachProducer(mStreamId, mProducer);
  }

  IngestSession(const IngestSession&) = delete;
  IngestSession& operator=(const IngestSession&) = delete;

  ~IngestSession() { mRelay.detachProducer(mStreamId, mProducer); }

  // Returns the bytes to send back. Once closed() is true the connection
  // should be shut down after sending them.
  Bytes receive(const std::uint8_t* pData, const std::size_t size)
  {
    Bytes reply;
    if (mClosed)
    {
      return reply;
    }
    try
    {
      for (auto& message : mDecoder.feed(pData, size))
      {
        handle(message, reply);
        if (mClosed)
        {
          break;
        }
      }
    }
    catch (const ProtocolError& e)
    {
      warning(mLog) << "producer " << mProducer << " of " << mStreamId
                    << " broke the protocol: " << e.what();
      close(e.closeCode, reply);
    }
    catch (const StreamNotFound&)
    {
      info(mLog) << "stream " << mStreamId << " ended under producer " << mProducer;
      close(websocket::kGoingAway, reply);
    }
    return reply;
  }

  Bytes receive(const Bytes& bytes) { return receive(bytes.data(), bytes.size()); }

  // Closing frame for a shutdown initiated by the server
  Bytes shutdown()
  {
    Bytes reply;
    if (!mClosed)
    {
      close(websocket::kGoingAway, reply);
    }
    return reply;
  }

  // Text frame carrying a device event, empty once closed
  Bytes deviceEvent(const std::string& json) const
  {
    return mClosed ? Bytes{} : websocket::encodeFrame(websocket::Opcode::Text, json);
  }

  bool closed() const { return mClosed; }

  const std::string& streamId() const { return mStreamId; }

private:
  void handle(websocket::Message& message, Bytes& reply)
  {
    using websocket::Opcode;
    switch (message.opcode)
    {
    case Opcode::Binary:
      if (mRelay.pushFrame(mStreamId, std::move(message.payload)))
      {
        info(mLog) << "stream " << mStreamId << " is ready";
        const auto stream = mRelay.getStream(mStreamId);
        append(reply,
               websocket::encodeFrame(Opcode::Text,
                                      makeStreamReady(stream ? stream->numBufferedFrames : 0)));
      }
      break;
    case Opcode::Text:
      handleText(message.text(), reply);
      break;
    case Opcode::Ping:
      append(reply,
             websocket::encodeFrame(
               Opcode::Pong, message.payload.data(), message.payload.size()));
      break;
    case Opcode::Pong:
      break;
    case Opcode::Close:
      debug(mLog) << "producer " << mProducer << " closed with code "
                  << websocket::closeCode(message).value_or(websocket::kNormalClosure);
      close(websocket::kNormalClosure, reply);
      break;
    case Opcode::Continuation:
      break;
    }
  }

  struct Dispatch
  {
    void operator()(const Handshake& handshake)
    {
      const auto codec = resolveCodec(handshake.codec);
      session.mRelay.setCodec(session.mStreamId, codec);
      info(session.mLog) << "producer " << session.mProducer << " of " << session.mStreamId
                         << " sends " << toString(codec);
      session.sendText(reply, makeHandshakeAck(session.mStreamId));
    }

    void operator()(const MetadataUpdate& update)
    {
      session.mRelay.setMetadata(session.mStreamId, update.metadata);
      session.mRelay.heartbeat(session.mStreamId);
    }

    void operator()(const Heartbeat&)
    {
      session.mRelay.heartbeat(session.mStreamId);
      session.sendText(reply, makeHeartbeatAck());
    }

    void operator()(const SetVolume& command)
    {
      session.mDevices.setVolume(command.ip, command.volume, command.group);
      session.sendText(reply, makeVolumeState(command.ip, command.volume));
    }

    void operator()(const SetMute& command)
    {
      session.mDevices.setMute(command.ip, command.mute, command.group);
      session.sendText(reply, makeMuteState(command.ip, command.mute));
    }

    void operator()(const GetVolume& query)
    {
      session.sendText(reply, makeVolumeState(query.ip, session.mDevices.volume(query.ip)));
    }

    void operator()(const GetMute& query)
    {
      session.sendText(reply, makeMuteState(query.ip, session.mDevices.mute(query.ip)));
    }

    void operator()(const StartPlayback& start)
    {
      if (start.speakerIps.empty())
      {
        session.sendText(reply, makePlaybackError("No speaker IPs provided"));
        return;
      }
      // Inline titles are available before the first device connects
      if (start.metadata)
      {
        session.mRelay.setMetadata(session.mStreamId, *start.metadata);
      }
      std::vector<PlaybackResult> results;
      for (const auto& ip : start.speakerIps)
      {
        try
        {
          results.push_back(
            {ip, true, session.mDevices.play(ip, session.mStreamId, start.metadata),
             std::nullopt});
        }
        catch (const std::runtime_error& e)
        {
          warning(session.mLog) << "playback of " << session.mStreamId << " on " << ip
                                << " failed: " << e.what();
          results.push_back({ip, false, std::nullopt, std::string{e.what()}});
        }
      }
      session.sendText(reply, makePlaybackResults(results));
    }

    void operator()(const StopPlaybackSpeaker& command) { session.mDevices.stop(command.ip); }

    IngestSession& session;
    Bytes& reply;
  };

  void handleText(const std::string& text, Bytes& reply)
  {
    IngestEvent event;
    try
    {
      event = parseIngestMessage(text);
    }
    catch (const IngestMessageError& e)
    {
      debug(mLog) << "rejected message from producer " << mProducer << ": " << e.what();
      sendText(reply, makeErrorMessage(e.what()));
      return;
    }
    try
    {
      std::visit(Dispatch{*this, reply}, event);
    }
    catch (const StreamNotFound&)
    {
      throw;
    }
    catch (const std::runtime_error& e)
    {
      warning(mLog) << "device command from producer " << mProducer << " failed: " << e.what();
      sendText(reply, makeErrorMessage(e.what()));
    }
  }

  void sendText(Bytes& reply, const std::string& json)
  {
    append(reply, websocket::encodeFrame(websocket::Opcode::Text, json));
  }

  void close(const std::uint16_t code, Bytes& reply)
  {
    append(reply, websocket::encodeClose(code));
    mClosed = true;
  }

  static void append(Bytes& out, const Bytes& bytes)
  {
    out.insert(out.end(), bytes.begin(), bytes.end());
  }

  StreamRelay& mRelay;
  Devices& mDevices;
  std::string mStreamId;
  ProducerId mProducer;
  Log mLog;
  websocket::FrameDecoder mDecoder;
  bool mClosed = false;
};

} // namespace relay
} // namespace roomcast
