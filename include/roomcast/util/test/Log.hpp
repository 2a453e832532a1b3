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

#include <roomcast/util/Log.hpp>
#include <algorithm>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace roomcast
{
namespace util
{
namespace test
{

// Log that records every message so tests can check that a failure was
// reported. Copies and channels share the same record.
struct CapturingLog
{
  struct Record
  {
    void add(std::string line)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mLines.push_back(std::move(line));
    }

    std::vector<std::string> lines() const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      return mLines;
    }

    mutable std::mutex mMutex;
    std::vector<std::string> mLines;
  };

  struct Stream
  {
    Stream(std::shared_ptr<Record> pRecord, std::string prefix)
      : mpRecord(std::move(pRecord))
    {
      mBuffer << prefix;
    }

    Stream(Stream&& rhs)
      : mpRecord(std::move(rhs.mpRecord))
      , mBuffer(std::move(rhs.mBuffer))
    {
    }

    ~Stream()
    {
      if (mpRecord)
      {
        mpRecord->add(mBuffer.str());
      }
    }

    template <typename T>
    Stream& operator<<(const T& rhs)
    {
      mBuffer << rhs;
      return *this;
    }

    std::shared_ptr<Record> mpRecord;
    std::ostringstream mBuffer;
  };

  CapturingLog()
    : mpRecord(std::make_shared<Record>())
  {
  }

  friend Stream debug(const CapturingLog& log) { return log.stream("debug: "); }

  friend Stream info(const CapturingLog& log) { return log.stream("info: "); }

  friend Stream warning(const CapturingLog& log) { return log.stream("warning: "); }

  friend Stream error(const CapturingLog& log) { return log.stream("error: "); }

  friend CapturingLog channel(const CapturingLog& log, const std::string& channelName)
  {
    auto result = log;
    result.mChannelName =
      log.mChannelName.empty() ? channelName : log.mChannelName + "::" + channelName;
    return result;
  }

  Stream stream(const std::string& level) const
  {
    return {mpRecord, level + (mChannelName.empty() ? "" : "[" + mChannelName + "] ")};
  }

  std::vector<std::string> lines() const { return mpRecord->lines(); }

  bool contains(const std::string& fragment) const
  {
    const auto all = lines();
    return std::any_of(all.begin(),
                       all.end(),
                       [&](const std::string& line)
                       { return line.find(fragment) != std::string::npos; });
  }

  std::shared_ptr<Record> mpRecord;
  std::string mChannelName;
};

} // namespace test
} // namespace util
} // namespace roomcast
