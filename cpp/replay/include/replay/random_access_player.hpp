#pragma once

#include "data_provider.hpp"
#include "options.hpp"
#include "player.hpp"
#include "problem_store.hpp"
#include "state_emitter.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace replay {

/**
 * @brief Plays a recording served by an IDataProvider. While playing, each tick
 * reads the time window that elapsed on the wall clock (scaled by the playback
 * speed) and emits the messages in it. Seeking while paused reads a short look-back
 * window ending at the seek target so listeners have recent data to show.
 *
 * Every public operation posts to an internal strand and returns immediately.
 * Provider calls run on the executor outside the strand and never overlap.
 */
class REPLAY_PUBLIC RandomAccessPlayer final
    : public IPlayer
    , public std::enable_shared_from_this<RandomAccessPlayer> {
public:
  /**
   * @brief Creates a player reading from `provider`. Nothing is read until a
   * listener is installed. Fails with InvalidOptions if `options` do not validate.
   */
  static Status Create(const boost::asio::any_io_executor& executor,
                       std::unique_ptr<IDataProvider> provider, RandomAccessPlayerOptions options,
                       std::shared_ptr<RandomAccessPlayer>* output);

  ~RandomAccessPlayer() override;

  RandomAccessPlayer(const RandomAccessPlayer&) = delete;
  RandomAccessPlayer& operator=(const RandomAccessPlayer&) = delete;

  void setListener(PlayerListener listener) override;
  void close() override;

  void setSubscriptions(std::vector<SubscribePayload> subscriptions) override;
  void setPublishers(std::vector<AdvertiseOptions> publishers) override;

  Status setParameter(const std::string& key, const std::string& value) override;
  Status publish(const PublishPayload& payload) override;

  void startPlayback() override;
  void pausePlayback() override;
  void setPlaybackSpeed(double speed) override;
  void seekPlayback(const Time& time, std::optional<Time> backfillDuration = std::nullopt) override;
  void requestBackfill() override;

  /**
   * @brief True if the provider reported `[start, end]` as fully loaded.
   */
  bool hasCachedRange(const Time& start, const Time& end) const;

private:
  using Clock = std::chrono::steady_clock;

  RandomAccessPlayer(const boost::asio::any_io_executor& executor,
                     std::unique_ptr<IDataProvider> provider, RandomAccessPlayerOptions options);

  boost::asio::any_io_executor executor_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  StateEmitter emitter_;
  boost::asio::steady_timer tickTimer_;
  std::unique_ptr<IDataProvider> provider_;
  const RandomAccessPlayerOptions options_;
  const std::string playerId_;

  // Provider calls take these from the executor. A backfill takes both, always
  // backfillMutex_ first.
  std::mutex readingMutex_;
  std::mutex backfillMutex_;

  // Guards the fields hasCachedRange() reads from other threads. Written only on
  // the strand.
  mutable std::mutex rangeMutex_;
  Time start_;
  Time end_;
  Progress progress_;

  // Everything below is touched only on strand_.
  bool initStarted_ = false;
  bool initialized_ = false;
  bool reconnecting_ = false;
  bool hasError_ = false;
  bool closed_ = false;
  bool providerClosed_ = false;
  bool isPlaying_ = false;
  double speed_;
  Time nextReadStart_;
  std::optional<Time> currentTime_;
  std::optional<Clock::time_point> lastTickTime_;
  std::optional<double> lastRangeMillis_;
  uint64_t seekGeneration_ = 0;
  int64_t lastSeekEmitTime_;
  bool tickLoopRunning_ = false;
  bool backfillInFlight_ = false;
  bool cancelSeekBackfill_ = false;
  uint64_t totalBytesReceived_ = 0;
  std::vector<MessageEvent> messages_;
  std::set<std::string> subscribedTopics_;
  std::vector<Topic> providerTopics_;
  std::map<std::string, std::string> providerDatatypeByTopic_;
  Datatypes datatypes_;
  TopicOwners publishedTopics_;
  ProblemStore problems_;

  template <typename Handler>
  void dispatch(Handler&& handler);

  void initialize();
  void onInitialized(Status status, InitializationResult result);
  void setError(const std::string& message, std::optional<std::string> error = std::nullopt);
  void closeProvider();

  void doSeek(const Time& time, std::optional<Time> backfillDuration);
  void runTick();
  void scheduleTick(Clock::time_point iterationStart);
  void onTickRead(uint64_t generation, Clock::time_point iterationStart, Time readEnd,
                  std::vector<std::string> topics, Status status, GetMessagesResult result);
  void backfillStep(std::optional<Time> backfillDuration);
  void onBackfillRead(Time readStart, Time backfillEnd, std::optional<Time> backfillDuration,
                      std::vector<std::string> topics, Status status, GetMessagesResult result);

  std::vector<std::string> requestedTopics() const;
  bool filterMessages(GetMessagesResult&& result, const std::vector<std::string>& topics,
                      std::vector<MessageEvent>* output);
  Status readProvider(const Time& start, const Time& end, const std::vector<std::string>& topics,
                      GetMessagesResult* result);
  int64_t nextSeekEmitTime() const;
  void emitState();
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "random_access_player.inl"
#endif
