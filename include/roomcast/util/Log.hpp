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

#include <chrono>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>

namespace roomcast
{
namespace util
{

// Concept: Log
// Requirements:
//  - copyable
//  - selectors for debug, info, warning, and error streams
//  - channel function that provides new log object tagged with the
//    given channel name

enum class LogLevel
{
  Debug,
  Info,
  Warning,
  Error
};

// Null object for the Log concept
struct NullLog
{
  template <typename T>
  friend const NullLog& operator<<(const NullLog& log, const T&)
  {
    return log;
  }

  friend NullLog debug(const NullLog&) { return {}; }

  friend NullLog info(const NullLog&) { return {}; }

  friend NullLog warning(const NullLog&) { return {}; }

  friend NullLog error(const NullLog&) { return {}; }

  friend NullLog channel(const NullLog&, std::string) { return {}; }
};

// std streams-based log with a minimum level. Messages below the level
// are formatted nowhere.
struct StdLog
{
  StdLog(std::string channelName = {}, LogLevel minLevel = LogLevel::Info)
    : mChannelName(std::move(channelName))
    , mMinLevel(minLevel)
  {
  }

  // Collects one message and writes it to the target stream as a single
  // line on destruction, so that lines from different threads don't mix.
  struct StdLogStream
  {
    StdLogStream(std::ostream* pIoStream, const std::string& channelName)
      : mpIoStream(pIoStream)
    {
      if (mpIoStream && !channelName.empty())
      {
        mBuffer << "[" << channelName << "] ";
      }
    }

    StdLogStream(StdLogStream&& rhs)
      : mpIoStream(rhs.mpIoStream)
      , mBuffer(std::move(rhs.mBuffer))
    {
      rhs.mpIoStream = nullptr;
    }

    ~StdLogStream()
    {
      if (mpIoStream)
      {
        mBuffer << "\n";
        (*mpIoStream) << mBuffer.str();
      }
    }

    template <typename T>
    StdLogStream& operator<<(const T& rhs)
    {
      if (mpIoStream)
      {
        mBuffer << rhs;
      }
      return *this;
    }

    std::ostream* mpIoStream;
    std::ostringstream mBuffer;
  };

  friend StdLogStream debug(const StdLog& log)
  {
    return log.stream(LogLevel::Debug, std::clog);
  }

  friend StdLogStream info(const StdLog& log)
  {
    return log.stream(LogLevel::Info, std::clog);
  }

  friend StdLogStream warning(const StdLog& log)
  {
    return log.stream(LogLevel::Warning, std::clog);
  }

  friend StdLogStream error(const StdLog& log)
  {
    return log.stream(LogLevel::Error, std::cerr);
  }

  friend StdLog channel(const StdLog& log, const std::string& channelName)
  {
    auto compositeName =
      log.mChannelName.empty() ? channelName : log.mChannelName + "::" + channelName;
    return {std::move(compositeName), log.mMinLevel};
  }

  StdLogStream stream(const LogLevel level, std::ostream& ioStream) const
  {
    return {level >= mMinLevel ? &ioStream : nullptr, mChannelName};
  }

  std::string mChannelName;
  LogLevel mMinLevel;
};

// Log adapter that adds timestamps
template <typename Log>
struct Timestamped
{
  Timestamped() = default;

  Timestamped(Log log)
    : mLog(std::move(log))
  {
  }

  Log mLog;

  friend decltype(debug(std::declval<Log>())) debug(const Timestamped& log)
  {
    auto stream = debug(log.mLog);
    log.logTimestamp(stream);
    return stream;
  }

  friend decltype(info(std::declval<Log>())) info(const Timestamped& log)
  {
    auto stream = info(log.mLog);
    log.logTimestamp(stream);
    return stream;
  }

  friend decltype(warning(std::declval<Log>())) warning(const Timestamped& log)
  {
    auto stream = warning(log.mLog);
    log.logTimestamp(stream);
    return stream;
  }

  friend decltype(error(std::declval<Log>())) error(const Timestamped& log)
  {
    auto stream = error(log.mLog);
    log.logTimestamp(stream);
    return stream;
  }

  friend Timestamped channel(const Timestamped& log, const std::string& channelName)
  {
    return {channel(log.mLog, channelName)};
  }

  template <typename Stream>
  void logTimestamp(Stream& stream) const
  {
    using namespace std::chrono;
    stream << "|"
           << duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count()
           << "ms| ";
  }
};

inline LogLevel parseLogLevel(const std::string& name, const LogLevel fallback)
{
  if (name == "debug")
  {
    return LogLevel::Debug;
  }
  if (name == "info")
  {
    return LogLevel::Info;
  }
  if (name == "warning")
  {
    return LogLevel::Warning;
  }
  if (name == "error")
  {
    return LogLevel::Error;
  }
  return fallback;
}

} // namespace util
} // namespace roomcast
