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
#include <roomcast/control/Client.hpp>
#include <roomcast/discovery/DeviceCache.hpp>
#include <roomcast/discovery/Discovery.hpp>
#include <roomcast/engine/Outbox.hpp>
#include <roomcast/events/SubscriptionManager.hpp>
#include <roomcast/platforms/Config.hpp>
#include <roomcast/relay/Relay.hpp>
#include <roomcast/topology/Resolver.hpp>
#include <roomcast/util/Scheduler.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace roomcast
{

/*! @class Engine
 *  @brief Speaker control and audio relay behind one HTTP server.
 *
 *  @discussion
 *  The Engine owns the discovery service, the device control client, the
 *  topology resolver, the event subscriptions and the stream relay, and
 *  serves the HTTP endpoints that speakers and producers talk to:
 *  event callbacks, live streams, WebSocket ingest, ingest tokens and a
 *  health snapshot. A periodic reaper removes streams whose producer went
 *  silent and stops playback on the device they were playing on.
 *
 *  Network operations block the calling thread for at most the configured
 *  request timeouts and report failures with the exceptions of the
 *  respective component.
 */
class Engine
{
public:
  using Log = platform::Log;
  using Devices = std::vector<discovery::DiscoveredDevice>;
  using EventHandler = std::function<void(const std::string& deviceIp, const events::Event&)>;

  struct Settings
  {
    std::string bindAddress = "0.0.0.0";
    // Address speakers use to reach this host. Empty means the first
    // interface usable for discovery.
    std::string advertisedAddress;
    std::uint16_t port = 3400;
    std::uint16_t numFallbackPorts = 10;
    std::chrono::milliseconds reapInterval{1000};
    util::LogLevel logLevel = util::LogLevel::Info;
    discovery::Settings discovery;
    control::Settings control;
    events::Settings events;
    relay::Settings relay;
    platforms::asio::ServerSettings server;
  };

  explicit Engine(Settings settings);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  /*! @brief Unsubscribes from all devices and stops the server. */
  ~Engine();

  /*! @brief Starts serving and the liveness reaper.
   *  Thread-safe: no
   *
   *  @discussion Tries the configured port and then the fallback range.
   *  Throws platforms::asio::PortUnavailable if all of them are taken.
   *  @return The port the server listens on.
   */
  std::uint16_t start();

  /*! @brief Stops the reaper, cancels every subscription and closes all
   *  connections. Streams stay registered.
   *  Thread-safe: no
   */
  void stop();

  bool isRunning() const;

  /*! @brief "http://<advertised address>:<port>" */
  std::string baseUrl() const;

  /*! @brief URL under which speakers fetch the given stream, with the
   *  extension of the codec its producer announced.
   */
  std::string streamUrl(const std::string& streamId) const;

  /*! @brief Playback devices on the local network.
   *  Thread-safe: yes, must not be called from an event handler
   *
   *  @discussion Served from the cache unless it expired or forceRefresh
   *  is set. A search that finds nothing is not cached.
   */
  Devices devices(bool forceRefresh = false);

  /*! @brief Fetches the current zone groups.
   *  Thread-safe: yes, must not be called from an event handler
   *
   *  @discussion Throws topology::NoDevicesAvailable if discovery finds no
   *  device, otherwise what the last device asked failed with.
   */
  std::vector<topology::Group> groups();

  /*! @brief Creates the stream if needed and points the group at it.
   *  Thread-safe: yes
   *
   *  @discussion Subscribes to the coordinator's transport and group volume
   *  events first; a failed subscription is logged and does not prevent
   *  playback. Throws topology::GroupNotFound and the control errors.
   */
  void playStream(const std::string& groupId,
                  const std::string& streamId,
                  const StreamMetadata& metadata);

  /*! @brief Stops the group and drops its event subscriptions.
   *  Thread-safe: yes
   */
  void stopStream(const std::string& groupId);

  void pause(const std::string& groupId);
  void resume(const std::string& groupId);

  /*! @brief Points one device at a stream and starts it.
   *  Thread-safe: yes
   *
   *  @discussion Unlike playStream the device is addressed directly; it
   *  should be a group coordinator. Returns the stream URL.
   */
  std::string playOnDevice(const std::string& deviceIp,
                           const std::string& streamId,
                           const std::optional<StreamMetadata>& metadata);

  /*! @brief Stops one device and drops its event subscriptions. */
  void stopOnDevice(const std::string& deviceIp);

  /*! @brief Group volume in the range 0..100. Values outside are clamped. */
  void setGroupVolume(const std::string& groupId, int volume);
  int groupVolume(const std::string& groupId);
  void setGroupMute(const std::string& groupId, bool muted);
  bool groupMute(const std::string& groupId);

  /*! @brief Replaces the metadata of a stream.
   *  Thread-safe: yes
   *
   *  @discussion Throws relay::StreamNotFound.
   */
  void setStreamMetadata(const std::string& streamId, const StreamMetadata& metadata);

  /*! @brief Creates the stream if needed and returns a token that
   *  authorizes one producer to connect to it.
   *  Thread-safe: yes
   */
  std::string issueIngestToken(const std::string& streamId);

  /*! @brief Register a handler for device events.
   *  Thread-safe: yes
   *
   *  @discussion The handler is invoked without any lock held, on a
   *  connection thread of the server for notifications and on the worker
   *  thread for lost subscriptions. Connected producers receive the same
   *  events as JSON text messages regardless of the handler.
   */
  void setEventHandler(EventHandler handler);

  /*! @brief Snapshot of subscriptions and streams, as served on /health. */
  nlohmann::json health() const;

  using Relay = relay::Relay<platform::Clock, Log>;
  Relay& streams() { return mRelay; }

private:
  using Client = control::Client<platform::Transport, Log>;
  using Discovery = discovery::Discovery<platform::IoContext, Log>;
  using Resolver = topology::Resolver<Client, Log>;
  using Subscriptions = events::SubscriptionManager<platform::Transport, platform::IoContext, Log>;

  // Device commands of ingest sessions
  struct DeviceCommands
  {
    void setVolume(const std::string& ip, int volume, bool group);
    int volume(const std::string& ip);
    void setMute(const std::string& ip, bool mute, bool group);
    bool mute(const std::string& ip);
    std::string play(const std::string& ip,
                     const std::string& streamId,
                     const std::optional<StreamMetadata>& metadata);
    void stop(const std::string& ip);

    Engine& engine;
  };

  struct IoExceptionHandler
  {
    using Exception = std::exception;

    void operator()(const Exception& exception)
    {
      error(mLog) << "io thread: " << exception.what();
    }

    Log mLog;
  };

  std::optional<http::Response> handle(const http::Request& request,
                                       platforms::asio::TcpConnection& connection);
  std::optional<http::Response> serveLiveStream(const http::Request& request,
                                                const std::string& streamId,
                                                platforms::asio::TcpConnection& connection);
  std::optional<http::Response> serveIngest(const http::Request& request,
                                            const std::string& streamId,
                                            const std::string& token,
                                            platforms::asio::TcpConnection& connection);
  http::Response serveToken(const std::string& streamId,
                            const platforms::asio::TcpConnection& connection);

  std::string coordinatorIp(const std::string& groupId);
  std::string coordinatorOfDevice(const std::string& deviceIp);
  void pushToProducers(const std::string& deviceIp, const events::Event& event);
  std::string detectAddress();
  void scheduleReaper();
  void reapSilentStreams();

  Log mLog;
  Settings mSettings;
  std::mutex mHandlerMutex;
  EventHandler mEventHandler;
  std::mutex mOutboxMutex;
  std::map<relay::ProducerId, std::shared_ptr<engine::Outbox>> mOutboxes;
  platform::IoContext mIo;
  platform::Transport mTransport;
  Client mClient;
  // Subscription renewals and reaper stops block on devices; they get their
  // own thread so discovery and timers on mIo are not held up
  platform::IoContext mWorkIo;
  Discovery mDiscovery;
  discovery::DeviceCache<platform::Clock> mDeviceCache;
  Resolver mResolver;
  Subscriptions mSubscriptions;
  Relay mRelay;
  util::Scheduler<platform::IoContext> mScheduler;
  util::CancelHandle mReaper;
  std::atomic<relay::ProducerId> mNextProducer{0};
  std::string mAddress;
  platform::HttpServer mServer;
};

} // namespace roomcast

#include <roomcast/Engine.ipp>
