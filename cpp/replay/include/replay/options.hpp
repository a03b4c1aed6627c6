#pragma once

#include "errors.hpp"
#include "time.hpp"
#include "visibility.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace replay {

/**
 * @brief Look-back window read when seeking while paused.
 */
constexpr int64_t SeekBackNanoseconds = 299 * NanosecondsPerMillisecond;

/**
 * @brief Default offset from the start of a recording for the initial seek.
 */
constexpr int64_t SeekOnStartNanoseconds = 99 * NanosecondsPerMillisecond;

static_assert(SeekOnStartNanoseconds < SeekBackNanoseconds,
              "the initial seek must stay within the look-back window or the first messages "
              "are skipped");

/**
 * @brief Where playback starts once a recording has been opened.
 */
struct REPLAY_PUBLIC SeekToTimeSpec {
  enum struct Type {
    /// `time` is an offset from the start of the recording.
    Relative,
    /// `time` is an absolute timestamp.
    Absolute,
    /// `fraction` of the way through the recording.
    Fraction,
  };

  Type type = Type::Relative;
  Time time = fromNanos(SeekOnStartNanoseconds);
  double fraction = 0;

  static SeekToTimeSpec Relative(const Time& offset) {
    return SeekToTimeSpec{Type::Relative, offset, 0};
  }
  static SeekToTimeSpec Absolute(const Time& time) {
    return SeekToTimeSpec{Type::Absolute, time, 0};
  }
  static SeekToTimeSpec Fraction(double fraction) {
    return SeekToTimeSpec{Type::Fraction, Time{}, fraction};
  }
};

/**
 * @brief Resolves `spec` against a recording spanning `[start, end]`. The result is
 * always clamped to that range.
 */
REPLAY_PUBLIC Time GetSeekTimeFromSpec(const SeekToTimeSpec& spec, const Time& start,
                                       const Time& end);

struct REPLAY_PUBLIC RandomAccessPlayerOptions {
  /**
   * @brief Reported as PlayerState::name.
   */
  std::string name;
  SeekToTimeSpec seekToTime;
  double initialSpeed = 0.2;
  /**
   * @brief Upper bound on the time window read by one tick.
   */
  double maxTickMillis = 300;
  /**
   * @brief Assumed wall time for the first tick after playback starts.
   */
  double firstTickMillis = 20;
  /**
   * @brief Each tick iteration takes at least this long.
   */
  std::chrono::milliseconds minTickInterval{16};
  /**
   * @brief Look-back window read when seeking while paused. Must exceed a relative
   * initial seek offset.
   */
  Time seekBack = fromNanos(SeekBackNanoseconds);

  Status validate() const;
};

struct REPLAY_PUBLIC LivePlayerOptions {
  /**
   * @brief Reported as PlayerState::name, typically the remote URL.
   */
  std::string name;
  /**
   * @brief Topic whose messages drive receive time. Always subscribed.
   */
  std::string clockTopic = "/clock";
  std::chrono::milliseconds topologyPollInterval{3000};
  /**
   * @brief A topology query running longer than this raises a warning problem.
   */
  std::chrono::milliseconds topologyStallWarning{5000};
  std::chrono::milliseconds reconnectDelay{3000};
  /**
   * @brief While connected, state is re-emitted at this interval so that the
   * current time keeps moving.
   */
  std::chrono::milliseconds emitHeartbeat{100};

  Status validate() const;
};

struct REPLAY_PUBLIC McapProviderOptions {
  enum struct ReadMode {
    /// Use the Summary section when present, otherwise scan the whole file.
    Auto,
    /// Always scan the whole file.
    Streamed,
    /// Require a Summary section with chunk indexes.
    Indexed,
  };

  ReadMode readMode = ReadMode::Auto;
  /**
   * @brief Bytes requested from the source per read while scanning.
   */
  uint64_t pageSize = 1024 * 1024;
  bool validateChunkCrc = false;

  Status validate() const;
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "options.inl"
#endif
