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

#include <roomcast/control/Commands.hpp>
#include <roomcast/engine/Routes.hpp>
#include <roomcast/events/EventJson.hpp>
#include <roomcast/relay/IcyInterleaver.hpp>
#include <roomcast/relay/IngestSession.hpp>
#include <roomcast/relay/WebSocket.hpp>
#include <array>
#include <future>
#include <map>

namespace roomcast
{

namespace detail
{

inline nlohmann::json toJson(const std::optional<std::string>& value)
{
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace detail

inline Engine::Engine(Settings settings)
  : mLog(util::StdLog{"roomcast", settings.logLevel})
  , mSettings(std::move(settings))
  , mIo("roomcast-io", IoExceptionHandler{mLog})
  , mClient(mTransport, mLog, mSettings.control)
  , mWorkIo("roomcast-work", IoExceptionHandler{mLog})
  , mDiscovery(mIo, mLog, mSettings.discovery)
  , mDeviceCache(mSettings.discovery.cacheTtl)
  , mResolver(mClient, [this] { return devices(); }, mLog)
  , mSubscriptions(mTransport, mWorkIo, mLog, mSettings.events)
  , mRelay(mLog, mSettings.relay)
  , mScheduler(mIo)
  , mServer(mLog, mSettings.server)
{
  mSubscriptions.onNotification(
    [this](const std::string& deviceIp, const events::Event& event)
    {
      EventHandler handler;
      {
        std::lock_guard<std::mutex> lock(mHandlerMutex);
        handler = mEventHandler;
      }
      if (handler)
      {
        handler(deviceIp, event);
      }
      pushToProducers(deviceIp, event);
    });
}

inline Engine::~Engine()
{
  stop();
}

inline std::uint16_t Engine::start()
{
  if (mServer.running())
  {
    return mServer.port();
  }

  mAddress = mSettings.advertisedAddress.empty() ? detectAddress()
                                                 : mSettings.advertisedAddress;
  const auto port = mServer.start(::asio::ip::make_address(mSettings.bindAddress),
                                  mSettings.port,
                                  mSettings.numFallbackPorts,
                                  [this](const http::Request& request,
                                         platforms::asio::TcpConnection& connection)
                                  { return handle(request, connection); });
  mSubscriptions.setListening(true, mAddress, port);

  std::promise<void> scheduled;
  mIo.async(
    [this, &scheduled]
    {
      scheduleReaper();
      scheduled.set_value();
    });
  scheduled.get_future().wait();

  info(mLog) << "serving on " << baseUrl();
  return port;
}

inline void Engine::stop()
{
  if (!mServer.running())
  {
    return;
  }

  // Timers belong to the io thread
  std::promise<void> cancelled;
  mIo.async(
    [this, &cancelled]
    {
      mReaper.cancel();
      cancelled.set_value();
    });
  cancelled.get_future().wait();

  mSubscriptions.unsubscribeEverything();
  mSubscriptions.setListening(false, mAddress, mServer.port());
  mServer.stop();
}

inline bool Engine::isRunning() const
{
  return mServer.running();
}

inline std::string Engine::baseUrl() const
{
  return "http://" + mAddress + ":" + std::to_string(mServer.port());
}

inline std::string Engine::streamUrl(const std::string& streamId) const
{
  const auto stream = mRelay.getStream(streamId);
  const auto codec = stream && stream->codec ? *stream->codec : relay::Codec::Mp3;
  return baseUrl() + engine::liveStreamPath(streamId, codec);
}

inline Engine::Devices Engine::devices(const bool forceRefresh)
{
  return mDeviceCache.get([this] { return mDiscovery.discover(); }, forceRefresh);
}

inline std::vector<topology::Group> Engine::groups()
{
  return mResolver.getGroups();
}

inline void Engine::playStream(const std::string& groupId,
                               const std::string& streamId,
                               const StreamMetadata& metadata)
{
  playOnDevice(coordinatorIp(groupId), streamId, metadata);
}

inline void Engine::stopStream(const std::string& groupId)
{
  stopOnDevice(coordinatorIp(groupId));
}

inline std::string Engine::playOnDevice(const std::string& deviceIp,
                                        const std::string& streamId,
                                        const std::optional<StreamMetadata>& metadata)
{
  mRelay.createOrGetStream(streamId);
  mRelay.setAssociatedDevice(streamId, deviceIp);
  if (metadata)
  {
    mRelay.setMetadata(streamId, *metadata);
  }
  const auto url = streamUrl(streamId);
  mSubscriptions.setExpectedStreamUrl(deviceIp, control::toRadioUri(url));

  for (const auto channel : {events::Channel::AVTransport, events::Channel::GroupRenderingControl})
  {
    try
    {
      mSubscriptions.subscribe(deviceIp, channel);
    }
    catch (const std::runtime_error& e)
    {
      warning(mLog) << "playing without " << events::name(channel) << " events: " << e.what();
    }
  }

  const auto stream = mRelay.getStream(streamId);
  control::playStream(
    mClient, deviceIp, url, metadata ? *metadata : stream ? stream->metadata : StreamMetadata{});
  return url;
}

inline void Engine::stopOnDevice(const std::string& deviceIp)
{
  control::stop(mClient, deviceIp);
  mSubscriptions.clearExpectedStreamUrl(deviceIp);
  mSubscriptions.unsubscribeAll(deviceIp);
}

inline void Engine::pause(const std::string& groupId)
{
  control::pause(mClient, coordinatorIp(groupId));
}

inline void Engine::resume(const std::string& groupId)
{
  control::play(mClient, coordinatorIp(groupId));
}

inline void Engine::setGroupVolume(const std::string& groupId, const int volume)
{
  control::setGroupVolume(mClient, coordinatorIp(groupId), volume);
}

inline int Engine::groupVolume(const std::string& groupId)
{
  return control::getGroupVolume(mClient, coordinatorIp(groupId));
}

inline void Engine::setGroupMute(const std::string& groupId, const bool muted)
{
  control::setGroupMute(mClient, coordinatorIp(groupId), muted);
}

inline bool Engine::groupMute(const std::string& groupId)
{
  return control::getGroupMute(mClient, coordinatorIp(groupId));
}

inline void Engine::setStreamMetadata(const std::string& streamId,
                                      const StreamMetadata& metadata)
{
  mRelay.setMetadata(streamId, metadata);
}

inline std::string Engine::issueIngestToken(const std::string& streamId)
{
  mRelay.createOrGetStream(streamId);
  return mRelay.issueIngestToken(streamId);
}

inline void Engine::setEventHandler(EventHandler handler)
{
  std::lock_guard<std::mutex> lock(mHandlerMutex);
  mEventHandler = std::move(handler);
}

inline nlohmann::json Engine::health() const
{
  const auto diagnostics = mSubscriptions.diagnostics();
  auto subscriptions = nlohmann::json::array();
  for (const auto& entry : diagnostics.subscriptions)
  {
    subscriptions.push_back({{"id", entry.id},
                             {"deviceIp", entry.deviceIp},
                             {"channel", events::name(entry.channel)}});
  }

  auto streams = nlohmann::json::array();
  for (const auto& id : mRelay.streamIds())
  {
    const auto stream = mRelay.getStream(id);
    if (!stream)
    {
      continue;
    }
    streams.push_back({{"id", stream->id},
                       {"producers", stream->numProducers},
                       {"consumers", stream->numConsumers},
                       {"bufferedFrames", stream->numBufferedFrames},
                       {"framesPushed", stream->numFramesPushed},
                       {"device", detail::toJson(stream->associatedDeviceIp)},
                       {"metadata",
                        {{"title", detail::toJson(stream->metadata.title)},
                         {"artist", detail::toJson(stream->metadata.artist)},
                         {"album", detail::toJson(stream->metadata.album)}}}});
  }

  return {{"status", "ok"},
          {"listener",
           {{"running", diagnostics.running},
            {"address", diagnostics.localAddress},
            {"port", diagnostics.listenPort}}},
          {"subscriptions", subscriptions},
          {"streamCount", streams.size()},
          {"streams", streams}};
}

inline std::optional<http::Response> Engine::handle(const http::Request& request,
                                                    platforms::asio::TcpConnection& connection)
{
  const auto route = engine::route(request);
  switch (route.kind)
  {
  case engine::RouteKind::Notify:
    return mSubscriptions.handleNotify(request);
  case engine::RouteKind::LiveStream:
    return serveLiveStream(request, route.streamId, connection);
  case engine::RouteKind::Ingest:
    return serveIngest(request, route.streamId, route.token, connection);
  case engine::RouteKind::IssueToken:
    return serveToken(route.streamId, connection);
  case engine::RouteKind::Health:
  {
    auto response = http::makeResponse(200, health().dump());
    response.headers.set("Content-Type", "application/json");
    return response;
  }
  case engine::RouteKind::MethodNotAllowed:
    return http::makeResponse(405);
  case engine::RouteKind::NotFound:
    break;
  }
  return http::makeResponse(404);
}

inline std::optional<http::Response> Engine::serveLiveStream(
  const http::Request& request,
  const std::string& streamId,
  platforms::asio::TcpConnection& connection)
{
  std::optional<relay::ConsumerStream> consumer;
  try
  {
    consumer.emplace(mRelay.openConsumerStream(streamId));
  }
  catch (const relay::StreamNotFound&)
  {
    return http::makeResponse(404);
  }
  catch (const relay::TooManyConsumers& e)
  {
    warning(mLog) << e.what();
    return http::makeResponse(503);
  }

  const auto metaData = request.headers.get("Icy-MetaData");
  const auto withMetadata = metaData && http::trim(*metaData) == "1";

  auto response = http::makeResponse(200);
  response.headers.set("Content-Type", engine::liveContentType(request.target));
  response.headers.set("Transfer-Encoding", "chunked");
  response.headers.set("Cache-Control", "no-cache, no-store");
  response.headers.set("Connection", "close");
  response.headers.set("icy-name", streamId);
  if (withMetadata)
  {
    response.headers.set("icy-metaint", std::to_string(relay::kIcyMetaInt));
  }
  const auto timeout = mSettings.server.requestTimeout;
  connection.write(http::toString(response), timeout);
  info(mLog) << connection.remoteEndpoint() << " listens to " << streamId
             << (withMetadata ? " with metadata" : "");

  relay::IcyInterleaver interleaver;
  relay::Bytes out;
  try
  {
    while (mServer.running())
    {
      const auto frame = consumer->readFor(std::chrono::seconds{1});
      if (!frame)
      {
        if (consumer->ended())
        {
          break;
        }
        continue;
      }

      out.clear();
      if (withMetadata)
      {
        interleaver.interleave(**frame, *mRelay.inlineMetadata(streamId), out);
      }
      else
      {
        out = **frame;
      }
      connection.write(
        http::encodeChunk(reinterpret_cast<const char*>(out.data()), out.size()), timeout);
    }
    connection.write(std::string{"0\r\n\r\n"}, timeout);
  }
  catch (const relay::StreamNotFound&)
  {
    debug(mLog) << "stream " << streamId << " ended";
  }
  catch (const ::asio::system_error& e)
  {
    debug(mLog) << "listener of " << streamId << " went away: " << e.what();
  }
  return std::nullopt;
}

inline std::optional<http::Response> Engine::serveIngest(
  const http::Request& request,
  const std::string& streamId,
  const std::string& token,
  platforms::asio::TcpConnection& connection)
{
  if (!relay::websocket::isUpgradeRequest(request))
  {
    return http::makeResponse(400, "WebSocket upgrade required");
  }
  try
  {
    mRelay.validateIngestToken(streamId, token);
  }
  catch (const relay::InvalidToken& e)
  {
    warning(mLog) << "ingest to " << streamId << " from " << connection.remoteEndpoint()
                  << " refused: " << e.what();
    return http::makeResponse(401);
  }

  mRelay.createOrGetStream(streamId);
  const auto timeout = mSettings.server.requestTimeout;
  connection.write(http::toString(relay::websocket::makeHandshakeResponse(request)), timeout);

  DeviceCommands devices{*this};
  const auto producer = ++mNextProducer;
  relay::IngestSession<Relay, DeviceCommands, Log> session{
    mRelay, devices, streamId, producer, mLog};
  const auto pOutbox = std::make_shared<engine::Outbox>();
  {
    std::lock_guard<std::mutex> lock(mOutboxMutex);
    mOutboxes[producer] = pOutbox;
  }
  info(mLog) << "producer " << connection.remoteEndpoint() << " streams to " << streamId;

  std::array<std::uint8_t, 64 * 1024> buffer;
  try
  {
    while (!session.closed())
    {
      // Short reads so queued device events go out promptly
      const auto count =
        connection.readSome(buffer.data(), buffer.size(), std::chrono::milliseconds{250});
      for (const auto& message : pOutbox->drain())
      {
        const auto frame = session.deviceEvent(message);
        connection.write(frame.data(), frame.size(), timeout);
      }
      if (!count)
      {
        if (!mServer.running())
        {
          const auto goodbye = session.shutdown();
          connection.write(goodbye.data(), goodbye.size(), timeout);
        }
        continue;
      }
      if (*count == 0)
      {
        break;
      }
      const auto reply = session.receive(buffer.data(), *count);
      if (!reply.empty())
      {
        connection.write(reply.data(), reply.size(), timeout);
      }
    }
  }
  catch (const ::asio::system_error& e)
  {
    debug(mLog) << "producer of " << streamId << " went away: " << e.what();
  }
  {
    std::lock_guard<std::mutex> lock(mOutboxMutex);
    mOutboxes.erase(producer);
  }
  info(mLog) << "producer " << connection.remoteEndpoint() << " left " << streamId;
  return std::nullopt;
}

inline http::Response Engine::serveToken(const std::string& streamId,
                                         const platforms::asio::TcpConnection& connection)
{
  if (!connection.remoteEndpoint().address().is_loopback())
  {
    return http::makeResponse(403);
  }
  const auto token = issueIngestToken(streamId);
  auto response = http::makeResponse(
    200,
    nlohmann::json{{"streamId", streamId},
                   {"token", token},
                   {"ingestPath", engine::ingestPath(streamId) + "?token=" + token},
                   {"streamUrl", streamUrl(streamId)}}
      .dump());
  response.headers.set("Content-Type", "application/json");
  return response;
}

inline std::string Engine::coordinatorOfDevice(const std::string& deviceIp)
{
  const auto find = [&deviceIp](const std::vector<topology::Group>& groups)
  {
    for (const auto& group : groups)
    {
      for (const auto& member : group.members)
      {
        if (member.ip == deviceIp)
        {
          return std::optional<std::string>{group.coordinatorIp};
        }
      }
    }
    return std::optional<std::string>{};
  };
  if (const auto ip = find(mResolver.groups()))
  {
    return *ip;
  }
  if (const auto ip = find(mResolver.getGroups()))
  {
    return *ip;
  }
  throw topology::GroupNotFound{deviceIp};
}

inline void Engine::pushToProducers(const std::string& deviceIp, const events::Event& event)
{
  std::vector<std::shared_ptr<engine::Outbox>> outboxes;
  {
    std::lock_guard<std::mutex> lock(mOutboxMutex);
    for (const auto& entry : mOutboxes)
    {
      outboxes.push_back(entry.second);
    }
  }
  if (outboxes.empty())
  {
    return;
  }
  const auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch());
  const auto json = events::toJson(deviceIp, event, timestamp).dump();
  for (const auto& pOutbox : outboxes)
  {
    pOutbox->push(json);
  }
}

inline void Engine::DeviceCommands::setVolume(const std::string& ip,
                                              const int volume,
                                              const bool group)
{
  if (group)
  {
    control::setGroupVolume(engine.mClient, engine.coordinatorOfDevice(ip), volume);
  }
  else
  {
    control::setVolume(engine.mClient, ip, volume);
  }
}

inline int Engine::DeviceCommands::volume(const std::string& ip)
{
  return control::getVolume(engine.mClient, ip);
}

inline void Engine::DeviceCommands::setMute(const std::string& ip,
                                            const bool mute,
                                            const bool group)
{
  if (group)
  {
    control::setGroupMute(engine.mClient, engine.coordinatorOfDevice(ip), mute);
  }
  else
  {
    control::setMute(engine.mClient, ip, mute);
  }
}

inline bool Engine::DeviceCommands::mute(const std::string& ip)
{
  return control::getMute(engine.mClient, ip);
}

inline std::string Engine::DeviceCommands::play(const std::string& ip,
                                                const std::string& streamId,
                                                const std::optional<StreamMetadata>& metadata)
{
  return engine.playOnDevice(ip, streamId, metadata);
}

inline void Engine::DeviceCommands::stop(const std::string& ip)
{
  engine.stopOnDevice(ip);
}

inline std::string Engine::coordinatorIp(const std::string& groupId)
{
  auto group = mResolver.findGroup(groupId);
  if (!group)
  {
    mResolver.getGroups();
    group = mResolver.findGroup(groupId);
  }
  if (!group)
  {
    throw topology::GroupNotFound{groupId};
  }
  return group->coordinatorIp;
}

inline std::string Engine::detectAddress()
{
  for (const auto& iface : mIo.scanNetworkInterfaces())
  {
    if (discovery::isUsableForDiscovery(iface))
    {
      return iface.address.to_string();
    }
  }
  warning(mLog) << "no usable network interface, advertising 127.0.0.1";
  return "127.0.0.1";
}

inline void Engine::scheduleReaper()
{
  mReaper = mScheduler.schedule(mSettings.reapInterval,
                                [this]
                                {
                                  reapSilentStreams();
                                  scheduleReaper();
                                });
}

inline void Engine::reapSilentStreams()
{
  std::map<std::string, std::string> devices;
  for (const auto& id : mRelay.streamIds())
  {
    const auto stream = mRelay.getStream(id);
    if (stream && stream->associatedDeviceIp)
    {
      devices[id] = *stream->associatedDeviceIp;
    }
  }

  for (const auto& id : mRelay.reapSilentStreams())
  {
    const auto device = devices.find(id);
    if (device == devices.end())
    {
      continue;
    }
    mSubscriptions.clearExpectedStreamUrl(device->second);
    mWorkIo.async(
      [this, deviceIp = device->second, id]
      {
        try
        {
          control::stop(mClient, deviceIp);
        }
        catch (const std::runtime_error& e)
        {
          warning(mLog) << "stopping " << deviceIp << " after " << id
                        << " went silent failed: " << e.what();
        }
      });
  }
}

} // namespace roomcast
