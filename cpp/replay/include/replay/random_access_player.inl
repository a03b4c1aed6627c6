#include "internal.hpp"
#include "log.hpp"
#include <algorithm>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cmath>
#include <exception>

namespace replay {

namespace internal {

inline int64_t WallClockMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
           std::chrono::system_clock::now().time_since_epoch())
    .count();
}

inline std::string NewPlayerId() {
  return boost::uuids::to_string(boost::uuids::random_generator()());
}

}  // namespace internal

Status RandomAccessPlayer::Create(const boost::asio::any_io_executor& executor,
                                  std::unique_ptr<IDataProvider> provider,
                                  RandomAccessPlayerOptions options,
                                  std::shared_ptr<RandomAccessPlayer>* output) {
  if (!provider) {
    return Status{StatusCode::InvalidOptions, "no data provider"};
  }
  if (auto status = options.validate(); !status.ok()) {
    return status;
  }
  output->reset(new RandomAccessPlayer(executor, std::move(provider), std::move(options)));
  return StatusCode::Success;
}

RandomAccessPlayer::RandomAccessPlayer(const boost::asio::any_io_executor& executor,
                                       std::unique_ptr<IDataProvider> provider,
                                       RandomAccessPlayerOptions options)
    : executor_(executor)
    , strand_(boost::asio::make_strand(executor))
    , emitter_(executor)
    , tickTimer_(strand_)
    , provider_(std::move(provider))
    , options_(std::move(options))
    , playerId_(internal::NewPlayerId())
    , speed_(options_.initialSpeed)
    , lastSeekEmitTime_(internal::WallClockMillis()) {}

RandomAccessPlayer::~RandomAccessPlayer() {
  emitter_.close();
  // No handler can still be queued: each one holds a reference to the player.
  if (!providerClosed_ && provider_) {
    try {
      if (auto status = provider_->close(); !status.ok()) {
        logger()->warn("failed to close data provider: {}", status.message);
      }
    } catch (const std::exception& e) {
      logger()->warn("data provider threw while closing: {}", e.what());
    }
  }
}

template <typename Handler>
void RandomAccessPlayer::dispatch(Handler&& handler) {
  boost::asio::post(strand_, [self = shared_from_this(), handler = std::forward<Handler>(handler)] {
    handler(*self);
  });
}

void RandomAccessPlayer::setListener(PlayerListener listener) {
  emitter_.setListener(std::move(listener));
  dispatch([](RandomAccessPlayer& self) {
    if (self.closed_) {
      return;
    }
    self.emitState();
    if (!self.initStarted_) {
      self.initStarted_ = true;
      self.initialize();
    }
  });
}

void RandomAccessPlayer::initialize() {
  std::weak_ptr<RandomAccessPlayer> weak = shared_from_this();
  ExtensionPoint extensionPoint;
  extensionPoint.progressCallback = [weak](const Progress& progress) {
    if (auto self = weak.lock()) {
      self->dispatch([progress](RandomAccessPlayer& self) {
        {
          std::lock_guard<std::mutex> lock(self.rangeMutex_);
          self.progress_ = progress;
        }
        // While playing, the next tick emits anyway.
        if (!self.isPlaying_) {
          self.emitState();
        }
      });
    }
  };
  extensionPoint.reportMetadataCallback = [weak](const ProviderMetadata& metadata) {
    if (auto self = weak.lock()) {
      self->dispatch([metadata](RandomAccessPlayer& self) {
        if (const auto* reconnecting = std::get_if<ReconnectingMetadata>(&metadata)) {
          self.reconnecting_ = reconnecting->reconnecting;
          self.emitState();
        } else if (const auto* received = std::get_if<ReceivedBytesMetadata>(&metadata)) {
          self.totalBytesReceived_ += received->bytes;
        }
      });
    }
  };

  boost::asio::post(executor_, [self = shared_from_this(), extensionPoint]() {
    InitializationResult result;
    Status status;
    {
      std::lock_guard<std::mutex> backfillLock(self->backfillMutex_);
      std::lock_guard<std::mutex> readingLock(self->readingMutex_);
      try {
        status = self->provider_->initialize(extensionPoint, &result);
      } catch (const std::exception& e) {
        status = Status{StatusCode::ProviderFailed, e.what()};
      }
    }
    boost::asio::post(self->strand_, [self, status = std::move(status),
                                      result = std::move(result)]() mutable {
      self->onInitialized(std::move(status), std::move(result));
    });
  });
}

void RandomAccessPlayer::onInitialized(Status status, InitializationResult result) {
  if (closed_) {
    return;
  }
  if (!status.ok()) {
    setError("Error initializing player", status.message);
    return;
  }
  if (!result.providesParsedMessages) {
    setError("Incorrect message format");
    return;
  }
  if (result.messageDefinitions.kind == MessageDefinitions::Kind::Raw) {
    setError("Missing message definitions");
    return;
  }

  const Time initialTime = GetSeekTimeFromSpec(options_.seekToTime, result.start, result.end);
  {
    std::lock_guard<std::mutex> lock(rangeMutex_);
    start_ = result.start;
    end_ = result.end;
  }
  nextReadStart_ = initialTime;
  currentTime_ = initialTime;
  providerTopics_ = std::move(result.topics);
  for (const auto& topic : providerTopics_) {
    providerDatatypeByTopic_[topic.name] = topic.datatype;
  }
  datatypes_ = std::move(result.messageDefinitions.datatypes);
  for (const auto& connection : result.connections) {
    publishedTopics_[connection.topic].insert(connection.callerId);
  }
  initialized_ = true;
  logger()->info("opened {}: [{}, {}], {} topics", options_.name, toString(start_),
                 toString(end_), providerTopics_.size());

  if (isPlaying_ && !tickLoopRunning_) {
    tickLoopRunning_ = true;
    runTick();
  }
  doSeek(initialTime, std::nullopt);
}

void RandomAccessPlayer::setError(const std::string& message, std::optional<std::string> error) {
  logger()->error("{}: {}{}", options_.name, message, error ? ": " + *error : std::string());
  hasError_ = true;
  problems_.addProblem("global-error",
                       PlayerProblem{"global-error", ProblemSeverity::Error, message, std::nullopt,
                                     std::move(error)});
  isPlaying_ = false;
  tickTimer_.cancel();
  closeProvider();
  emitState();
}

void RandomAccessPlayer::closeProvider() {
  if (providerClosed_) {
    return;
  }
  providerClosed_ = true;
  boost::asio::post(executor_, [self = shared_from_this()] {
    std::lock_guard<std::mutex> backfillLock(self->backfillMutex_);
    std::lock_guard<std::mutex> readingLock(self->readingMutex_);
    try {
      if (auto status = self->provider_->close(); !status.ok()) {
        logger()->warn("failed to close data provider: {}", status.message);
      }
    } catch (const std::exception& e) {
      logger()->warn("data provider threw while closing: {}", e.what());
    }
  });
}

void RandomAccessPlayer::close() {
  emitter_.close();
  dispatch([](RandomAccessPlayer& self) {
    if (self.closed_) {
      return;
    }
    logger()->info("closing {}", self.options_.name);
    self.closed_ = true;
    self.isPlaying_ = false;
    self.tickTimer_.cancel();
    self.messages_.clear();
    self.closeProvider();
  });
}

void RandomAccessPlayer::setSubscriptions(std::vector<SubscribePayload> subscriptions) {
  dispatch([subscriptions = std::move(subscriptions)](RandomAccessPlayer& self) {
    self.subscribedTopics_.clear();
    for (const auto& subscription : subscriptions) {
      self.subscribedTopics_.insert(subscription.topic);
    }
  });
}

void RandomAccessPlayer::setPublishers(std::vector<AdvertiseOptions>) {}

Status RandomAccessPlayer::setParameter(const std::string&, const std::string&) {
  return Status{StatusCode::UnsupportedOperation,
                "parameter editing is not supported by this data source"};
}

Status RandomAccessPlayer::publish(const PublishPayload&) {
  return Status{StatusCode::UnsupportedOperation,
                "publishing is not supported by this data source"};
}

void RandomAccessPlayer::startPlayback() {
  dispatch([](RandomAccessPlayer& self) {
    if (self.isPlaying_ || self.hasError_ || self.closed_) {
      return;
    }
    logger()->info("start playback at speed {}", self.speed_);
    self.isPlaying_ = true;
    self.emitState();
    if (self.initialized_ && !self.tickLoopRunning_) {
      self.tickLoopRunning_ = true;
      self.runTick();
    }
  });
}

void RandomAccessPlayer::pausePlayback() {
  dispatch([](RandomAccessPlayer& self) {
    if (!self.isPlaying_) {
      return;
    }
    logger()->info("pause playback");
    // Resuming must not read the whole paused interval in one tick.
    self.lastTickTime_.reset();
    self.isPlaying_ = false;
    self.emitState();
  });
}

void RandomAccessPlayer::setPlaybackSpeed(double speed) {
  dispatch([speed](RandomAccessPlayer& self) {
    if (!(speed > 0) || !std::isfinite(speed)) {
      logger()->warn("ignoring invalid playback speed {}", speed);
      return;
    }
    self.lastRangeMillis_.reset();
    self.speed_ = speed;
    self.emitState();
  });
}

void RandomAccessPlayer::seekPlayback(const Time& time, std::optional<Time> backfillDuration) {
  dispatch([time, backfillDuration](RandomAccessPlayer& self) {
    self.doSeek(time, backfillDuration);
  });
}

void RandomAccessPlayer::requestBackfill() {
  dispatch([](RandomAccessPlayer& self) {
    if (self.isPlaying_ || !self.initialized_ || !self.currentTime_) {
      return;
    }
    self.doSeek(*self.currentTime_, std::nullopt);
  });
}

bool RandomAccessPlayer::hasCachedRange(const Time& start, const Time& end) const {
  std::lock_guard<std::mutex> lock(rangeMutex_);
  if (!progress_.fullyLoadedFractionRanges) {
    return false;
  }
  const FractionRange range{percentOf(start_, end_, start), percentOf(start_, end_, end)};
  return IsRangeCoveredByRanges(range, *progress_.fullyLoadedFractionRanges);
}

void RandomAccessPlayer::doSeek(const Time& time, std::optional<Time> backfillDuration) {
  if (!initialized_ || hasError_ || closed_) {
    return;
  }
  logger()->info("seek to {}", toString(time));
  nextReadStart_ = clampTime(time, start_, end_);
  ++seekGeneration_;
  if (!backfillInFlight_) {
    backfillStep(backfillDuration);
  }
}

// Playback //////////////////////////////////////////////////////////////////

void RandomAccessPlayer::runTick() {
  if (!isPlaying_ || hasError_ || closed_) {
    tickLoopRunning_ = false;
    return;
  }

  const auto iterationStart = Clock::now();
  const double durationMillis =
    lastTickTime_
      ? std::chrono::duration<double, std::milli>(iterationStart - *lastTickTime_).count()
      : options_.firstTickMillis;
  lastTickTime_ = iterationStart;

  // A single slow iteration must not make the following windows large as well.
  double rangeMillis = std::min(durationMillis * speed_, options_.maxTickMillis);
  if (lastRangeMillis_) {
    rangeMillis = *lastRangeMillis_ * 0.9 + rangeMillis * 0.1;
  }
  lastRangeMillis_ = rangeMillis;

  if (nextReadStart_ > end_) {
    scheduleTick(iterationStart);
    return;
  }

  const uint64_t generation = seekGeneration_;
  const Time readStart = clampTime(nextReadStart_, start_, end_);
  const Time readEnd = clampTime(add(nextReadStart_, fromMillis(rangeMillis)), start_, end_);
  auto topics = requestedTopics();
  logger()->debug("tick reads [{}, {}]", toString(readStart), toString(readEnd));

  if (topics.empty()) {
    onTickRead(generation, iterationStart, readEnd, std::move(topics), StatusCode::Success,
               GetMessagesResult{std::vector<MessageEvent>{}});
    return;
  }

  boost::asio::post(executor_, [self = shared_from_this(), generation, iterationStart, readStart,
                                readEnd, topics = std::move(topics)]() mutable {
    GetMessagesResult result;
    Status status;
    {
      std::lock_guard<std::mutex> lock(self->readingMutex_);
      status = self->readProvider(readStart, readEnd, topics, &result);
    }
    boost::asio::post(self->strand_, [self, generation, iterationStart, readEnd,
                                      topics = std::move(topics), status = std::move(status),
                                      result = std::move(result)]() mutable {
      self->onTickRead(generation, iterationStart, readEnd, std::move(topics), std::move(status),
                       std::move(result));
    });
  });
}

void RandomAccessPlayer::scheduleTick(Clock::time_point iterationStart) {
  tickTimer_.expires_at(iterationStart + options_.minTickInterval);
  tickTimer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
    if (ec) {
      self->tickLoopRunning_ = false;
      return;
    }
    self->runTick();
  });
}

void RandomAccessPlayer::onTickRead(uint64_t generation, Clock::time_point iterationStart,
                                    Time readEnd, std::vector<std::string> topics, Status status,
                                    GetMessagesResult result) {
  if (hasError_ || closed_) {
    tickLoopRunning_ = false;
    return;
  }
  if (!status.ok()) {
    tickLoopRunning_ = false;
    setError("Error reading messages", status.message);
    return;
  }
  if (!result.parsedMessages) {
    tickLoopRunning_ = false;
    setError("Bad set of messages", "data provider returned no parsed messages");
    return;
  }

  // A seek during the read moved nextReadStart_; start over from there.
  if (generation != seekGeneration_) {
    scheduleTick(iterationStart);
    return;
  }
  // Paused during the read. The window is read again on resume.
  if (!isPlaying_) {
    tickLoopRunning_ = false;
    return;
  }

  std::vector<MessageEvent> messages;
  if (!filterMessages(std::move(result), topics, &messages)) {
    tickLoopRunning_ = false;
    return;
  }
  nextReadStart_ = add(readEnd, fromNanos(1));
  messages_.insert(messages_.end(), std::make_move_iterator(messages.begin()),
                   std::make_move_iterator(messages.end()));
  emitState();
  scheduleTick(iterationStart);
}

// Seek backfill /////////////////////////////////////////////////////////////

void RandomAccessPlayer::backfillStep(std::optional<Time> backfillDuration) {
  if (hasError_ || closed_) {
    backfillInFlight_ = false;
    return;
  }
  // The tick loop delivers data soon enough while playing.
  if (isPlaying_) {
    lastSeekEmitTime_ = nextSeekEmitTime();
    backfillInFlight_ = false;
    return;
  }

  backfillInFlight_ = true;
  const Time readStart = nextReadStart_;
  cancelSeekBackfill_ = false;
  // Queued messages predate the seek.
  messages_.clear();

  const Time lookBack = add(options_.seekBack, backfillDuration.value_or(Time{}));
  const Time backfillEnd = clampTime(readStart, start_, end_);
  const Time backfillStart = clampTime(subtract(readStart, lookBack), start_, end_);
  auto topics = requestedTopics();
  logger()->debug("backfill reads [{}, {}]", toString(backfillStart), toString(backfillEnd));

  if (topics.empty()) {
    onBackfillRead(readStart, backfillEnd, backfillDuration, std::move(topics),
                   StatusCode::Success, GetMessagesResult{std::vector<MessageEvent>{}});
    return;
  }

  boost::asio::post(executor_, [self = shared_from_this(), readStart, backfillStart, backfillEnd,
                                backfillDuration, topics = std::move(topics)]() mutable {
    GetMessagesResult result;
    Status status;
    {
      std::lock_guard<std::mutex> backfillLock(self->backfillMutex_);
      std::lock_guard<std::mutex> readingLock(self->readingMutex_);
      status = self->readProvider(backfillStart, backfillEnd, topics, &result);
    }
    boost::asio::post(self->strand_, [self, readStart, backfillEnd, backfillDuration,
                                      topics = std::move(topics), status = std::move(status),
                                      result = std::move(result)]() mutable {
      self->onBackfillRead(readStart, backfillEnd, backfillDuration, std::move(topics),
                           std::move(status), std::move(result));
    });
  });
}

void RandomAccessPlayer::onBackfillRead(Time readStart, Time backfillEnd,
                                        std::optional<Time> backfillDuration,
                                        std::vector<std::string> topics, Status status,
                                        GetMessagesResult result) {
  if (hasError_ || closed_) {
    backfillInFlight_ = false;
    return;
  }
  if (!status.ok()) {
    backfillInFlight_ = false;
    setError("Error reading messages", status.message);
    return;
  }
  std::vector<MessageEvent> messages;
  if (!filterMessages(std::move(result), topics, &messages)) {
    backfillInFlight_ = false;
    return;
  }

  if (nextReadStart_ == readStart && !cancelSeekBackfill_) {
    nextReadStart_ = add(backfillEnd, fromNanos(1));
    messages_ = std::move(messages);
    lastSeekEmitTime_ = nextSeekEmitTime();
    backfillInFlight_ = false;
    emitState();
    return;
  }
  if (nextReadStart_ != readStart) {
    backfillStep(backfillDuration);
    return;
  }
  backfillInFlight_ = false;
}

// Reads and state ///////////////////////////////////////////////////////////

std::vector<std::string> RandomAccessPlayer::requestedTopics() const {
  std::vector<std::string> topics;
  for (const auto& topic : subscribedTopics_) {
    if (providerDatatypeByTopic_.count(topic) > 0) {
      topics.push_back(topic);
    }
  }
  return topics;
}

Status RandomAccessPlayer::readProvider(const Time& start, const Time& end,
                                        const std::vector<std::string>& topics,
                                        GetMessagesResult* result) {
  try {
    return provider_->getMessages(start, end, GetMessagesTopics{topics}, result);
  } catch (const std::exception& e) {
    return Status{StatusCode::ProviderFailed, e.what()};
  }
}

bool RandomAccessPlayer::filterMessages(GetMessagesResult&& result,
                                        const std::vector<std::string>& topics,
                                        std::vector<MessageEvent>* output) {
  if (!result.parsedMessages) {
    setError("Bad set of messages", "data provider returned no parsed messages");
    return false;
  }
  output->reserve(result.parsedMessages->size());
  for (auto& message : *result.parsedMessages) {
    problems_.removeProblem(message.topic);

    std::string problem;
    if (std::find(topics.begin(), topics.end(), message.topic) == topics.end()) {
      problem = internal::StrCat("Unexpected topic encountered: ", message.topic,
                                 ". Skipping message");
    } else if (auto it = providerDatatypeByTopic_.find(message.topic);
               it == providerDatatypeByTopic_.end()) {
      problem = internal::StrCat("Unexpected message on topic: ", message.topic,
                                 ". Skipping message");
    } else if (it->second.empty()) {
      problem = internal::StrCat("Missing datatype for topic: ", message.topic,
                                 ". Skipping message");
    }
    if (!problem.empty()) {
      logger()->warn(problem);
      problems_.addProblem(message.topic, PlayerProblem{message.topic, ProblemSeverity::Warn,
                                                        std::move(problem)});
      continue;
    }
    output->push_back(std::move(message));
  }
  return true;
}

int64_t RandomAccessPlayer::nextSeekEmitTime() const {
  return std::max(internal::WallClockMillis(), lastSeekEmitTime_ + 1);
}

void RandomAccessPlayer::emitState() {
  PlayerState state;
  state.name = options_.name;
  state.playerId = playerId_;
  state.problems = problems_.problems();

  if (hasError_) {
    state.presence = PlayerPresence::Error;
    emitter_.emit(std::move(state));
    return;
  }

  auto messages = std::move(messages_);
  messages_.clear();
  if (!messages.empty()) {
    // Messages older than these must not be delivered by a backfill afterwards.
    cancelSeekBackfill_ = true;
  }

  // nextReadStart_ is where the next read begins; the current time is the last
  // instant already read.
  Time lastEnd = nextReadStart_;
  if (!isZero(lastEnd)) {
    lastEnd = subtract(lastEnd, fromNanos(1));
  }
  const Time clampedLastEnd = clampTime(lastEnd, start_, end_);
  const bool currentTimeChanged = !currentTime_ || *currentTime_ != clampedLastEnd;
  currentTime_ = clampedLastEnd;

  state.presence = reconnecting_   ? PlayerPresence::Reconnecting
                   : !initialized_ ? PlayerPresence::Initializing
                                   : PlayerPresence::Present;
  {
    std::lock_guard<std::mutex> lock(rangeMutex_);
    state.progress = progress_;
  }
  state.capabilities = {PlayerCapability::SetSpeed, PlayerCapability::PlaybackControl};

  if (initialized_) {
    PlayerActiveData data;
    data.messages = std::move(messages);
    data.totalBytesReceived = totalBytesReceived_;
    data.startTime = start_;
    data.endTime = end_;
    data.currentTime = *currentTime_;
    data.currentTimeChanged = currentTimeChanged;
    data.isPlaying = isPlaying_;
    data.speed = speed_;
    data.lastSeekTime = lastSeekEmitTime_;
    data.topics = providerTopics_;
    data.datatypes = datatypes_;
    data.publishedTopics = publishedTopics_;
    state.activeData = std::move(data);
  }
  emitter_.emit(std::move(state));
}

}  // namespace replay
