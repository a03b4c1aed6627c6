#pragma once

#include "visibility.hpp"
#include <cstdint>
#include <string>

namespace replay {

/**
 * @brief A point in time as whole seconds plus a nanosecond remainder. Values built
 * through the helpers below are normalized so that `0 <= nsec < 1e9`.
 */
struct REPLAY_PUBLIC Time {
  int64_t sec = 0;
  int32_t nsec = 0;
};

constexpr int64_t NanosecondsPerSecond = 1'000'000'000;
constexpr int64_t NanosecondsPerMillisecond = 1'000'000;

REPLAY_PUBLIC Time fromNanos(int64_t nanoseconds);
REPLAY_PUBLIC Time fromMillis(double milliseconds);
REPLAY_PUBLIC Time fromSec(double seconds);
REPLAY_PUBLIC int64_t toNanos(const Time& time);
REPLAY_PUBLIC double toMillis(const Time& time);
REPLAY_PUBLIC double toSec(const Time& time);
REPLAY_PUBLIC bool isZero(const Time& time);

REPLAY_PUBLIC Time add(const Time& left, const Time& right);
REPLAY_PUBLIC Time subtract(const Time& left, const Time& right);

/**
 * @brief Returns negative, zero or positive as `left` is before, equal to or after
 * `right`.
 */
REPLAY_PUBLIC int compare(const Time& left, const Time& right);

REPLAY_PUBLIC Time clampTime(const Time& time, const Time& start, const Time& end);

/**
 * @brief Position of `time` within `[start, end]` as a fraction. An empty range
 * yields 0.
 */
REPLAY_PUBLIC double percentOf(const Time& start, const Time& end, const Time& time);

REPLAY_PUBLIC std::string toString(const Time& time);

inline bool operator==(const Time& left, const Time& right) {
  return left.sec == right.sec && left.nsec == right.nsec;
}
inline bool operator!=(const Time& left, const Time& right) {
  return !(left == right);
}
inline bool operator<(const Time& left, const Time& right) {
  return compare(left, right) < 0;
}
inline bool operator<=(const Time& left, const Time& right) {
  return compare(left, right) <= 0;
}
inline bool operator>(const Time& left, const Time& right) {
  return compare(left, right) > 0;
}
inline bool operator>=(const Time& left, const Time& right) {
  return compare(left, right) >= 0;
}

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "time.inl"
#endif
