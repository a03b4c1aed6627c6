#include <cmath>
#include <cstdio>

namespace replay {

Time fromNanos(int64_t nanoseconds) {
  int64_t sec = nanoseconds / NanosecondsPerSecond;
  int64_t nsec = nanoseconds % NanosecondsPerSecond;
  if (nsec < 0) {
    sec -= 1;
    nsec += NanosecondsPerSecond;
  }
  return Time{sec, int32_t(nsec)};
}

Time fromMillis(double milliseconds) {
  return fromNanos(int64_t(std::llround(milliseconds * double(NanosecondsPerMillisecond))));
}

Time fromSec(double seconds) {
  return fromNanos(int64_t(std::llround(seconds * double(NanosecondsPerSecond))));
}

int64_t toNanos(const Time& time) {
  return time.sec * NanosecondsPerSecond + time.nsec;
}

double toMillis(const Time& time) {
  return double(time.sec) * 1e3 + double(time.nsec) / 1e6;
}

double toSec(const Time& time) {
  return double(time.sec) + double(time.nsec) / 1e9;
}

bool isZero(const Time& time) {
  return time.sec == 0 && time.nsec == 0;
}

Time add(const Time& left, const Time& right) {
  return fromNanos(toNanos(left) + toNanos(right));
}

Time subtract(const Time& left, const Time& right) {
  return fromNanos(toNanos(left) - toNanos(right));
}

int compare(const Time& left, const Time& right) {
  if (left.sec != right.sec) {
    return left.sec < right.sec ? -1 : 1;
  }
  if (left.nsec != right.nsec) {
    return left.nsec < right.nsec ? -1 : 1;
  }
  return 0;
}

Time clampTime(const Time& time, const Time& start, const Time& end) {
  if (compare(time, start) < 0) {
    return start;
  }
  if (compare(time, end) > 0) {
    return end;
  }
  return time;
}

double percentOf(const Time& start, const Time& end, const Time& time) {
  const int64_t range = toNanos(end) - toNanos(start);
  if (range <= 0) {
    return 0.0;
  }
  return double(toNanos(time) - toNanos(start)) / double(range);
}

std::string toString(const Time& time) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%lld.%09d", static_cast<long long>(time.sec),
                static_cast<int>(time.nsec));
  return buffer;
}

}  // namespace replay
