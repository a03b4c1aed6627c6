#include "internal.hpp"
#include <cmath>

namespace replay {

Time GetSeekTimeFromSpec(const SeekToTimeSpec& spec, const Time& start, const Time& end) {
  switch (spec.type) {
    case SeekToTimeSpec::Type::Absolute:
      return clampTime(spec.time, start, end);
    case SeekToTimeSpec::Type::Fraction: {
      const int64_t range = toNanos(end) - toNanos(start);
      const double fraction = std::isfinite(spec.fraction) ? spec.fraction : 0.0;
      return clampTime(add(start, fromNanos(int64_t(double(range) * fraction))), start, end);
    }
    case SeekToTimeSpec::Type::Relative:
    default:
      return clampTime(add(start, spec.time), start, end);
  }
}

Status RandomAccessPlayerOptions::validate() const {
  if (!(initialSpeed > 0) || !std::isfinite(initialSpeed)) {
    return Status{StatusCode::InvalidOptions,
                  internal::StrCat("initialSpeed must be positive, got ", initialSpeed)};
  }
  if (!(maxTickMillis > 0)) {
    return Status{StatusCode::InvalidOptions,
                  internal::StrCat("maxTickMillis must be positive, got ", maxTickMillis)};
  }
  if (!(firstTickMillis > 0)) {
    return Status{StatusCode::InvalidOptions,
                  internal::StrCat("firstTickMillis must be positive, got ", firstTickMillis)};
  }
  if (minTickInterval.count() < 0) {
    return Status{StatusCode::InvalidOptions, "minTickInterval must not be negative"};
  }
  if (seekBack <= Time{}) {
    return Status{StatusCode::InvalidOptions, "seekBack must be positive"};
  }
  if (seekToTime.type == SeekToTimeSpec::Type::Relative && seekToTime.time >= seekBack) {
    return Status{StatusCode::InvalidOptions,
                  internal::StrCat("initial seek offset ", toString(seekToTime.time),
                                   "s must be shorter than seekBack ", toString(seekBack), "s")};
  }
  if (seekToTime.type == SeekToTimeSpec::Type::Fraction &&
      (seekToTime.fraction < 0 || seekToTime.fraction > 1)) {
    return Status{StatusCode::InvalidOptions,
                  internal::StrCat("seek fraction must be within [0, 1], got ",
                                   seekToTime.fraction)};
  }
  return StatusCode::Success;
}

Status LivePlayerOptions::validate() const {
  if (clockTopic.empty()) {
    return Status{StatusCode::InvalidOptions, "clockTopic must not be empty"};
  }
  if (topologyPollInterval.count() <= 0 || topologyStallWarning.count() <= 0 ||
      reconnectDelay.count() <= 0 || emitHeartbeat.count() <= 0) {
    return Status{StatusCode::InvalidOptions, "live player intervals must be positive"};
  }
  return StatusCode::Success;
}

Status McapProviderOptions::validate() const {
  if (pageSize == 0) {
    return Status{StatusCode::InvalidOptions, "pageSize must be positive"};
  }
  return StatusCode::Success;
}

}  // namespace replay
