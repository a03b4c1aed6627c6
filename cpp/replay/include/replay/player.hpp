#pragma once

#include "time.hpp"
#include "types.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace replay {

/**
 * @brief Coarse lifecycle of a player. `Error` is terminal.
 */
enum struct PlayerPresence {
  NotPresent,
  Initializing,
  Reconnecting,
  Present,
  Error,
};

enum struct PlayerCapability {
  SetSpeed,
  PlaybackControl,
  Advertise,
};

enum struct ProblemSeverity {
  Info,
  Warn,
  Error,
};

REPLAY_PUBLIC std::string_view PresenceString(PlayerPresence presence);
REPLAY_PUBLIC std::string_view SeverityString(ProblemSeverity severity);

/**
 * @brief An issue the player wants surfaced to the user without stopping playback.
 * Problems are keyed by `id`; adding a problem with an existing id replaces it.
 */
struct REPLAY_PUBLIC PlayerProblem {
  std::string id;
  ProblemSeverity severity = ProblemSeverity::Error;
  std::string message;
  std::optional<std::string> tip;
  std::optional<std::string> error;
};

struct REPLAY_PUBLIC Topic {
  std::string name;
  std::string datatype;
};

inline bool operator==(const Topic& left, const Topic& right) {
  return left.name == right.name && left.datatype == right.datatype;
}

/**
 * @brief Message definitions keyed by datatype name.
 */
using Datatypes = std::map<std::string, std::string>;

/**
 * @brief Topic or service name to the set of node names associated with it.
 */
using TopicOwners = std::map<std::string, std::set<std::string>>;

/**
 * @brief A single message delivered to the listener. The payload is shared and never
 * modified after construction.
 */
struct REPLAY_PUBLIC MessageEvent {
  std::string topic;
  Time receiveTime;
  std::shared_ptr<const ByteArray> message;
  uint64_t sizeInBytes = 0;
};

struct REPLAY_PUBLIC SubscribePayload {
  std::string topic;
  /**
   * @brief Who asked for the topic, for diagnostics only.
   */
  std::string requester;
};

struct REPLAY_PUBLIC AdvertiseOptions {
  std::string topic;
  std::string datatype;
};

struct REPLAY_PUBLIC PublishPayload {
  std::string topic;
  ByteArray message;
};

/**
 * @brief A `[start, end]` interval expressed as fractions of the playable range.
 */
struct REPLAY_PUBLIC FractionRange {
  double start = 0;
  double end = 0;
};

struct REPLAY_PUBLIC Progress {
  std::optional<std::vector<FractionRange>> fullyLoadedFractionRanges;
};

/**
 * @brief True if `range` lies entirely within a single entry of `ranges`.
 */
REPLAY_PUBLIC bool IsRangeCoveredByRanges(const FractionRange& range,
                                          const std::vector<FractionRange>& ranges);

struct REPLAY_PUBLIC PlayerActiveData {
  /**
   * @brief Messages accumulated since the previous snapshot, in receive order.
   */
  std::vector<MessageEvent> messages;
  uint64_t totalBytesReceived = 0;
  Time startTime;
  Time endTime;
  Time currentTime;
  /**
   * @brief Whether `currentTime` differs from the previously delivered snapshot.
   */
  bool currentTimeChanged = true;
  bool isPlaying = false;
  double speed = 1.0;
  /**
   * @brief Changes whenever messages from a seek are delivered.
   */
  int64_t lastSeekTime = 0;
  std::vector<Topic> topics;
  Datatypes datatypes;
  TopicOwners publishedTopics;
  TopicOwners subscribedTopics;
  TopicOwners services;
};

struct REPLAY_PUBLIC PlayerState {
  std::string name;
  std::string playerId;
  PlayerPresence presence = PlayerPresence::NotPresent;
  Progress progress;
  std::vector<PlayerCapability> capabilities;
  std::vector<PlayerProblem> problems;
  /**
   * @brief Absent while initializing and after a fatal error.
   */
  std::optional<PlayerActiveData> activeData;
};

/**
 * @brief Receives every state snapshot. Never invoked concurrently with itself.
 */
using PlayerListener = std::function<void(PlayerState)>;

/**
 * @brief The playback contract shared by every data source. All operations return
 * immediately and never throw; their effects show up in later snapshots. Snapshots
 * may be coalesced, so listeners should treat each one as the current level rather
 * than as an edge.
 */
class REPLAY_PUBLIC IPlayer {
public:
  virtual ~IPlayer() = default;

  /**
   * @brief Installs the sole listener and emits the current state.
   */
  virtual void setListener(PlayerListener listener) = 0;

  /**
   * @brief Stops emission and releases the underlying source. Idempotent.
   */
  virtual void close() = 0;

  virtual void setSubscriptions(std::vector<SubscribePayload> subscriptions) = 0;
  virtual void setPublishers(std::vector<AdvertiseOptions> publishers) = 0;

  virtual Status setParameter(const std::string& key, const std::string& value) = 0;
  virtual Status publish(const PublishPayload& payload) = 0;

  virtual void startPlayback() = 0;
  virtual void pausePlayback() = 0;
  virtual void setPlaybackSpeed(double speed) = 0;
  /**
   * @brief Moves playback to `time`. `backfillDuration` widens the look-back read
   * performed while paused.
   */
  virtual void seekPlayback(const Time& time,
                            std::optional<Time> backfillDuration = std::nullopt) = 0;
  /**
   * @brief Re-reads the look-back window at the current time while paused.
   */
  virtual void requestBackfill() = 0;
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "player.inl"
#endif
