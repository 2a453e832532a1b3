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
#include <roomcast/platforms/stl/Clock.hpp>
#include <roomcast/relay/Codec.hpp>
#include <roomcast/relay/Consumer.hpp>
#include <roomcast/relay/Errors.hpp>
#include <roomcast/relay/Frame.hpp>
#include <roomcast/relay/IngestToken.hpp>
#include <roomcast/relay/InlineMetadata.hpp>
#include <roomcast/util/Log.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace roomcast
{
namespace relay
{

struct Settings
{
  std::size_t maxConsumers = 5;
  std::size_t maxBufferFrames = 300;
  // Frames a consumer may fall behind before it is dropped. Never less
  // than maxBufferFrames, so that the replay always fits.
  std::size_t consumerQueueFrames = 512;
  std::chrono::milliseconds tokenLifetime{5 * 60 * 1000};
  std::chrono::milliseconds silenceTimeout{10000};
  // Key for ingest tokens; random if empty
  std::string ingestSecret;
};

// Identifies one producer connection
using ProducerId = std::uint64_t;

// Snapshot of a stream
template <typename TimePoint>
struct StreamInfo
{
  std::string id;
  std::size_t numProducers;
  std::size_t numConsumers;
  std::size_t numBufferedFrames;
  std::uint64_t numFramesPushed;
  StreamMetadata metadata;
  std::optional<std::string> associatedDeviceIp;
  TimePoint lastProducerActivity;
  // As announced by the producer
  std::optional<Codec> codec;
};

// Registry of live streams. Producers push encoded frames, which are kept
// in a bounded replay buffer and handed to every consumer. All operations
// may be called from any thread; the registry is guarded by one mutex that
// is never held while a consumer blocks.
template <typename Clock = platforms::stl::Clock, typename Log = util::NullLog>
class Relay
{
public:
  using TimePoint = typename Clock::TimePoint;
  using Info = StreamInfo<TimePoint>;
  using InlineBlock = std::shared_ptr<const Bytes>;

  Relay(Log log, Settings settings = {}, Clock clock = {})
    : mpImpl(std::make_shared<Impl>(
      channel(log, "relay"), std::move(settings), std::move(clock)))
  {
  }

  Relay(const Relay&) = delete;
  Relay& operator=(const Relay&) = delete;

  ~Relay()
  {
    for (const auto& id : streamIds())
    {
      removeStream(id);
    }
  }

  Info createOrGetStream(const std::string& id)
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    auto it = mpImpl->mStreams.find(id);
    if (it == mpImpl->mStreams.end())
    {
      it = mpImpl->mStreams.emplace(id, Stream{}).first;
      it->second.lastProducerActivity = mpImpl->mClock.now();
      it->second.inlineBlock = std::make_shared<const Bytes>(formatInlineMetadata({}));
      info(mpImpl->mLog) << "stream " << id << " created";
    }
    return infoLocked(it->first, it->second);
  }

  std::optional<Info> getStream(const std::string& id) const
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    const auto it = mpImpl->mStreams.find(id);
    if (it == mpImpl->mStreams.end())
    {
      return std::nullopt;
    }
    return infoLocked(it->first, it->second);
  }

  // Ends every consumer's reads and drops the buffer and producers.
  // Returns false if there was no such stream.
  bool removeStream(const std::string& id)
  {
    Stream removed;
    {
      std::lock_guard<std::mutex> lock(mpImpl->mMutex);
      const auto it = mpImpl->mStreams.find(id);
      if (it == mpImpl->mStreams.end())
      {
        return false;
      }
      removed = std::move(it->second);
      mpImpl->mStreams.erase(it);
    }
    for (auto& consumer : removed.consumers)
    {
      consumer.pQueue->close();
    }
    info(mpImpl->mLog) << "stream " << id << " removed (" << removed.consumers.size()
                       << " consumer(s) dropped)";
    return true;
  }

  std::size_t streamCount() const
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    return mpImpl->mStreams.size();
  }

  std::vector<std::string> streamIds() const
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    std::vector<std::string> result;
    for (const auto& entry : mpImpl->mStreams)
    {
      result.push_back(entry.first);
    }
    return result;
  }

  // Throws StreamNotFound
  void attachProducer(const std::string& id, const ProducerId producer)
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    auto& stream = streamLocked(id);
    if (std::find(stream.producers.begin(), stream.producers.end(), producer)
        == stream.producers.end())
    {
      stream.producers.push_back(producer);
    }
    stream.lastProducerActivity = mpImpl->mClock.now();
    debug(mpImpl->mLog) << "producer " << producer << " attached to " << id << " ("
                        << stream.producers.size() << " attached)";
  }

  // Detaching from a stream that is gone already is not an error
  void detachProducer(const std::string& id, const ProducerId producer)
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    const auto it = mpImpl->mStreams.find(id);
    if (it != mpImpl->mStreams.end())
    {
      auto& producers = it->second.producers;
      producers.erase(std::remove(producers.begin(), producers.end(), producer), producers.end());
      debug(mpImpl->mLog) << "producer " << producer << " detached from " << id;
    }
  }

  // Buffers the frame and hands it to every consumer. Consumers that cannot
  // take it are dropped once all have been served. Returns true for the
  // first frame of the stream. Throws StreamNotFound.
  bool pushFrame(const std::string& id, Frame frame)
  {
    std::vector<std::shared_ptr<ConsumerQueue>> dropped;
    bool first = false;
    {
      std::lock_guard<std::mutex> lock(mpImpl->mMutex);
      auto& stream = streamLocked(id);
      stream.lastProducerActivity = mpImpl->mClock.now();
      first = stream.numFramesPushed++ == 0;

      stream.buffer.push_back(frame);
      while (stream.buffer.size() > mpImpl->mSettings.maxBufferFrames)
      {
        stream.buffer.pop_front();
      }

      for (auto& consumer : stream.consumers)
      {
        consumer.active = consumer.pQueue->push(frame);
      }
      const auto firstInactive = std::stable_partition(stream.consumers.begin(),
                                                       stream.consumers.end(),
                                                       [](const Consumer& c) { return c.active; });
      for (auto it = firstInactive; it != stream.consumers.end(); ++it)
      {
        dropped.push_back(it->pQueue);
      }
      stream.consumers.erase(firstInactive, stream.consumers.end());
    }

    for (const auto& pQueue : dropped)
    {
      pQueue->close();
    }
    if (!dropped.empty())
    {
      warning(mpImpl->mLog) << "dropped " << dropped.size() << " consumer(s) of " << id
                            << " that fell behind or went away";
    }
    return first;
  }

  bool pushFrame(const std::string& id, Bytes bytes)
  {
    return pushFrame(id, makeFrame(std::move(bytes)));
  }

  // Registers a consumer and queues the whole replay buffer for it before
  // any later frame. Throws StreamNotFound and TooManyConsumers.
  ConsumerStream openConsumerStream(const std::string& id)
  {
    const auto capacity =
      std::max(mpImpl->mSettings.consumerQueueFrames, mpImpl->mSettings.maxBufferFrames);
    auto pQueue = std::make_shared<ConsumerQueue>(capacity);
    std::uint64_t consumerId = 0;
    {
      std::lock_guard<std::mutex> lock(mpImpl->mMutex);
      auto& stream = streamLocked(id);
      if (stream.consumers.size() >= mpImpl->mSettings.maxConsumers)
      {
        throw TooManyConsumers{id, mpImpl->mSettings.maxConsumers};
      }
      for (const auto& frame : stream.buffer)
      {
        pQueue->push(frame);
      }
      consumerId = ++mpImpl->mNextConsumerId;
      stream.consumers.push_back({consumerId, pQueue, true});
      debug(mpImpl->mLog) << "consumer " << consumerId << " joined " << id << " with "
                          << stream.buffer.size() << " buffered frame(s)";
    }

    std::weak_ptr<Impl> wpImpl = mpImpl;
    return ConsumerStream{pQueue,
                          [wpImpl, id, consumerId]
                          {
                            if (const auto pImpl = wpImpl.lock())
                            {
                              pImpl->deregister(id, consumerId);
                            }
                          }};
  }

  // Replaces the metadata unless it is unchanged. The inline block is only
  // rendered again on a change. Throws StreamNotFound.
  void setMetadata(const std::string& id, StreamMetadata metadata)
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    auto& stream = streamLocked(id);
    if (stream.metadata == metadata)
    {
      return;
    }
    stream.inlineBlock = std::make_shared<const Bytes>(formatInlineMetadata(metadata));
    stream.metadata = std::move(metadata);
    debug(mpImpl->mLog) << "metadata of " << id << " changed";
  }

  // The rendered block of the current metadata. Throws StreamNotFound.
  InlineBlock inlineMetadata(const std::string& id) const
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    return streamLocked(id).inlineBlock;
  }

  std::string issueIngestToken(const std::string& id) const
  {
    return mpImpl->mTokens.issue(id, mpImpl->mClock.now() + mpImpl->mSettings.tokenLifetime);
  }

  // Throws InvalidToken
  void validateIngestToken(const std::string& id, const std::string& token) const
  {
    mpImpl->mTokens.verify(id, token, mpImpl->mClock.now());
  }

  // Producer keep-alive without audio. Throws StreamNotFound.
  void heartbeat(const std::string& id)
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    streamLocked(id).lastProducerActivity = mpImpl->mClock.now();
  }

  std::optional<TimePoint> lastProducerActivity(const std::string& id) const
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    const auto it = mpImpl->mStreams.find(id);
    if (it == mpImpl->mStreams.end())
    {
      return std::nullopt;
    }
    return it->second.lastProducerActivity;
  }

  // Removes every stream without producer activity for longer than the
  // timeout and returns their ids
  std::vector<std::string> reapSilentStreams(const std::chrono::milliseconds timeout)
  {
    std::vector<std::string> silent;
    {
      std::lock_guard<std::mutex> lock(mpImpl->mMutex);
      const auto now = mpImpl->mClock.now();
      for (const auto& entry : mpImpl->mStreams)
      {
        if (now - entry.second.lastProducerActivity > timeout)
        {
          silent.push_back(entry.first);
        }
      }
    }
    for (const auto& id : silent)
    {
      warning(mpImpl->mLog) << "stream " << id << " went silent";
      removeStream(id);
    }
    return silent;
  }

  std::vector<std::string> reapSilentStreams()
  {
    return reapSilentStreams(mpImpl->mSettings.silenceTimeout);
  }

  // The device a stream is played on. Throws StreamNotFound.
  void setAssociatedDevice(const std::string& id, std::string deviceIp)
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    streamLocked(id).associatedDeviceIp = std::move(deviceIp);
  }

  // Throws StreamNotFound
  void setCodec(const std::string& id, const Codec codec)
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    streamLocked(id).codec = codec;
  }

  std::optional<std::string> findByDevice(const std::string& deviceIp) const
  {
    std::lock_guard<std::mutex> lock(mpImpl->mMutex);
    for (const auto& entry : mpImpl->mStreams)
    {
      if (entry.second.associatedDeviceIp == deviceIp)
      {
        return entry.first;
      }
    }
    return std::nullopt;
  }

  const Settings& settings() const { return mpImpl->mSettings; }

private:
  struct Consumer
  {
    std::uint64_t id;
    std::shared_ptr<ConsumerQueue> pQueue;
    bool active;
  };

  struct Stream
  {
    std::vector<ProducerId> producers;
    std::vector<Consumer> consumers;
    std::deque<Frame> buffer;
    std::uint64_t numFramesPushed = 0;
    StreamMetadata metadata;
    InlineBlock inlineBlock;
    std::optional<std::string> associatedDeviceIp;
    TimePoint lastProducerActivity{};
    std::optional<Codec> codec;
  };

  struct Impl
  {
    Impl(Log log, Settings settings, Clock clock)
      : mLog(std::move(log))
      , mSettings(std::move(settings))
      , mClock(std::move(clock))
      , mTokens(mSettings.ingestSecret)
    {
    }

    void deregister(const std::string& id, const std::uint64_t consumerId)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      const auto it = mStreams.find(id);
      if (it == mStreams.end())
      {
        return;
      }
      auto& consumers = it->second.consumers;
      consumers.erase(std::remove_if(consumers.begin(),
                                     consumers.end(),
                                     [consumerId](const Consumer& c)
                                     { return c.id == consumerId; }),
                      consumers.end());
      debug(mLog) << "consumer " << consumerId << " left " << id;
    }

    Log mLog;
    Settings mSettings;
    Clock mClock;
    IngestTokens mTokens;
    mutable std::mutex mMutex;
    std::map<std::string, Stream> mStreams;
    std::uint64_t mNextConsumerId = 0;
  };

  Stream& streamLocked(const std::string& id) const
  {
    const auto it = mpImpl->mStreams.find(id);
    if (it == mpImpl->mStreams.end())
    {
      throw StreamNotFound{id};
    }
    return it->second;
  }

  static Info infoLocked(const std::string& id, const Stream& stream)
  {
    return {id,
            stream.producers.size(),
            stream.consumers.size(),
            stream.buffer.size(),
            stream.numFramesPushed,
            stream.metadata,
            stream.associatedDeviceIp,
            stream.lastProducerActivity,
            stream.codec};
  }

  std::shared_ptr<Impl> mpImpl;
};

} // namespace relay
} // namespace roomcast
