#pragma once

#include <replay/replay.hpp>

#include <catch2/catch.hpp>

#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace Catch {
template <>
struct StringMaker<replay::Time> {
  static std::string convert(const replay::Time& time) {
    return replay::toString(time);
  }
};
}  // namespace Catch

inline void requireOk(const replay::Status& status) {
  CAPTURE(status.code);
  CAPTURE(status.message);
  REQUIRE(status.ok());
}

inline replay::ByteArray Bytes(std::string_view text) {
  return replay::ByteArray{reinterpret_cast<const std::byte*>(text.data()),
                           reinterpret_cast<const std::byte*>(text.data() + text.size())};
}

inline std::string Text(const replay::ByteArray& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline replay::Time Seconds(double seconds) {
  return replay::fromSec(seconds);
}

inline void WriteMsg(replay::RecordWriter& writer, replay::ChannelId channelId, uint32_t sequence,
                     replay::Timestamp logTime, const replay::ByteArray& data) {
  replay::Message msg;
  msg.channelId = channelId;
  msg.sequence = sequence;
  msg.logTime = logTime;
  msg.publishTime = logTime;
  msg.data = data.data();
  msg.dataSize = data.size();
  requireOk(writer.write(msg));
}

/**
 * Writes a recording with a "/a" topic (schema "example/A") holding one message per
 * whole second from 0s through 9s, and a "/b" topic without a schema holding one
 * message at 0.5s.
 */
inline replay::ByteArray WriteExampleRecording(replay::RecordWriterOptions options) {
  replay::BufferWriter out;
  replay::RecordWriter writer;
  writer.open(out, options);
  replay::Schema schema("example/A", "text", "string data");
  writer.addSchema(schema);
  replay::Channel a("/a", "text", schema.id, {{"callerid", "/talker"}});
  writer.addChannel(a);
  replay::Channel b("/b", "text", 0);
  writer.addChannel(b);
  for (uint32_t i = 0; i < 10; ++i) {
    WriteMsg(writer, a.id, i, replay::Timestamp(i) * 1'000'000'000,
             Bytes("a" + std::to_string(i)));
    if (i == 0) {
      WriteMsg(writer, b.id, 0, 500'000'000, Bytes("b0"));
    }
  }
  writer.close();
  return out.release();
}

inline std::vector<replay::TypedRecord> DecodeAll(const replay::ByteArray& input,
                                                  size_t fragmentSize,
                                                  replay::StreamReaderOptions options = {},
                                                  replay::Status* finalStatus = nullptr) {
  replay::StreamReader reader{std::move(options)};
  std::vector<replay::TypedRecord> records;
  size_t offset = 0;
  for (;;) {
    auto result = reader.next();
    if (result.kind == replay::ReadResult::Kind::Record) {
      records.push_back(std::move(*result.record));
      continue;
    }
    if (result.kind != replay::ReadResult::Kind::NeedMoreData || offset >= input.size()) {
      break;
    }
    const size_t size = std::min(fragmentSize, input.size() - offset);
    requireOk(reader.append(input.data() + offset, size));
    offset += size;
  }
  if (finalStatus) {
    *finalStatus = reader.status();
  }
  return records;
}

/**
 * Collects every snapshot delivered to a player listener and lets a test block until
 * one of them satisfies a condition.
 */
class StateRecorder {
public:
  replay::PlayerListener listener() {
    return [this](replay::PlayerState state) {
      std::lock_guard<std::mutex> lock(mutex_);
      states_.push_back(std::move(state));
      changed_.notify_all();
    };
  }

  std::optional<replay::PlayerState> waitFor(
    const std::function<bool(const replay::PlayerState&)>& predicate,
    std::chrono::milliseconds timeout = 5s) {
    std::unique_lock<std::mutex> lock(mutex_);
    std::optional<replay::PlayerState> found;
    changed_.wait_for(lock, timeout, [&] {
      for (auto it = states_.rbegin(); it != states_.rend(); ++it) {
        if (predicate(*it)) {
          found = *it;
          return true;
        }
      }
      return false;
    });
    return found;
  }

  std::vector<replay::PlayerState> states() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_;
  }

  size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
  }

  std::vector<replay::MessageEvent> messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<replay::MessageEvent> messages;
    for (const auto& state : states_) {
      if (state.activeData) {
        messages.insert(messages.end(), state.activeData->messages.begin(),
                        state.activeData->messages.end());
      }
    }
    return messages;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable changed_;
  std::vector<replay::PlayerState> states_;
};

inline bool HasProblem(const replay::PlayerState& state, const std::string& id) {
  return std::any_of(state.problems.begin(), state.problems.end(),
                     [&](const replay::PlayerProblem& problem) {
                       return problem.id == id;
                     });
}

inline const replay::PlayerProblem* FindProblem(const replay::PlayerState& state,
                                                const std::string& id) {
  for (const auto& problem : state.problems) {
    if (problem.id == id) {
      return &problem;
    }
  }
  return nullptr;
}

/**
 * Polls `condition` until it holds or `timeout` elapses.
 */
inline bool Eventually(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return condition();
}
