#include "internal.hpp"
#include "log.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <exception>

namespace replay {

namespace internal {

inline std::string JoinNames(const std::vector<std::string>& names) {
  std::string joined;
  for (const auto& name : names) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += name;
  }
  return joined;
}

inline Time WallClockTime() {
  return fromNanos(std::chrono::duration_cast<std::chrono::nanoseconds>(
                     std::chrono::system_clock::now().time_since_epoch())
                     .count());
}

}  // namespace internal

constexpr char ConnectionFailedProblem[] = "connection-failed";
constexpr char ConnectionErrorProblem[] = "connection-error";
constexpr char TopicsStallProblem[] = "topicsAndRawTypesTimeout";

Status LivePlayer::Create(const boost::asio::any_io_executor& executor,
                          ConnectionFactory connectionFactory,
                          std::shared_ptr<IMessageReaderFactory> readerFactory,
                          LivePlayerOptions options, std::shared_ptr<LivePlayer>* output) {
  if (!connectionFactory) {
    return Status{StatusCode::InvalidOptions, "no connection factory"};
  }
  if (!readerFactory) {
    return Status{StatusCode::InvalidOptions, "no message reader factory"};
  }
  if (auto status = options.validate(); !status.ok()) {
    return status;
  }
  std::shared_ptr<LivePlayer> player(new LivePlayer(executor, std::move(connectionFactory),
                                                    std::move(readerFactory), std::move(options)));
  player->dispatch([](LivePlayer& self) {
    self.open();
  });
  *output = std::move(player);
  return StatusCode::Success;
}

LivePlayer::LivePlayer(const boost::asio::any_io_executor& executor,
                       ConnectionFactory connectionFactory,
                       std::shared_ptr<IMessageReaderFactory> readerFactory,
                       LivePlayerOptions options)
    : executor_(executor)
    , strand_(boost::asio::make_strand(executor))
    , emitter_(executor)
    , reconnectTimer_(strand_)
    , topologyTimer_(strand_)
    , stallTimer_(strand_)
    , heartbeatTimer_(strand_)
    , connectionFactory_(std::move(connectionFactory))
    , readerFactory_(std::move(readerFactory))
    , options_(std::move(options))
    , playerId_(boost::uuids::to_string(boost::uuids::random_generator()()))
    , start_(internal::WallClockTime()) {}

LivePlayer::~LivePlayer() {
  emitter_.close();
  if (connection_) {
    try {
      connection_->close();
    } catch (const std::exception& e) {
      logger()->warn("connection threw while closing: {}", e.what());
    }
  }
}

template <typename Handler>
void LivePlayer::dispatch(Handler&& handler) {
  boost::asio::post(strand_, [self = shared_from_this(), handler = std::forward<Handler>(handler)] {
    handler(*self);
  });
}

void LivePlayer::setListener(PlayerListener listener) {
  emitter_.setListener(std::move(listener));
  dispatch([](LivePlayer& self) {
    self.emitState();
  });
}

void LivePlayer::close() {
  emitter_.close();
  dispatch([](LivePlayer& self) {
    if (self.closed_) {
      return;
    }
    logger()->info("closing connection to {}", self.options_.name);
    self.closed_ = true;
    self.reconnectTimer_.cancel();
    self.topologyTimer_.cancel();
    self.stallTimer_.cancel();
    self.heartbeatTimer_.cancel();
    {
      std::lock_guard<std::mutex> lock(self.publishMutex_);
      self.publishConnection_.reset();
      self.advertisedTopics_.clear();
    }
    ++self.connectionGeneration_;
    self.connected_ = false;
    if (auto connection = std::move(self.connection_)) {
      try {
        connection->close();
      } catch (const std::exception& e) {
        logger()->warn("connection threw while closing: {}", e.what());
      }
    }
    self.messages_.clear();
  });
}

// Connection ////////////////////////////////////////////////////////////////

void LivePlayer::open() {
  if (closed_ || connection_) {
    return;
  }
  problems_.removeProblem(ConnectionFailedProblem);
  logger()->info("opening connection to {}", options_.name);

  const uint64_t generation = ++connectionGeneration_;
  std::shared_ptr<IRemoteConnection> connection;
  try {
    connection = connectionFactory_();
  } catch (const std::exception& e) {
    logger()->error("failed to create connection to {}: {}", options_.name, e.what());
  }
  if (!connection) {
    onConnectionClosed(generation);
    return;
  }
  connection_ = connection;

  std::weak_ptr<LivePlayer> weak = shared_from_this();
  IRemoteConnection::Callbacks callbacks;
  callbacks.onConnection = [weak, generation] {
    if (auto self = weak.lock()) {
      self->dispatch([generation](LivePlayer& self) {
        self.onConnection(generation);
      });
    }
  };
  callbacks.onError = [weak, generation](const std::string& error) {
    if (auto self = weak.lock()) {
      self->dispatch([generation, error](LivePlayer& self) {
        self.onConnectionError(generation, error);
      });
    }
  };
  callbacks.onClose = [weak, generation] {
    if (auto self = weak.lock()) {
      self->dispatch([generation](LivePlayer& self) {
        self.onConnectionClosed(generation);
      });
    }
  };

  try {
    connection->open(std::move(callbacks));
  } catch (const std::exception& e) {
    logger()->error("failed to open connection to {}: {}", options_.name, e.what());
    onConnectionClosed(generation);
  }
}

void LivePlayer::onConnection(uint64_t generation) {
  if (closed_ || generation != connectionGeneration_) {
    return;
  }
  logger()->info("connected to {}", options_.name);
  presence_ = PlayerPresence::Present;
  connected_ = true;
  problems_.removeProblem(ConnectionFailedProblem);
  {
    std::lock_guard<std::mutex> lock(publishMutex_);
    publishConnection_ = connection_;
  }
  setupPublishers();
  requestTopics(true);
}

void LivePlayer::onConnectionError(uint64_t generation, const std::string& error) {
  if (closed_ || generation != connectionGeneration_) {
    return;
  }
  logger()->warn("connection error from {}: {}", options_.name, error);
  problems_.addProblem(ConnectionErrorProblem,
                       PlayerProblem{ConnectionErrorProblem, ProblemSeverity::Warn,
                                     "Connection error", std::nullopt, error});
  emitState();
}

void LivePlayer::onConnectionClosed(uint64_t generation) {
  if (closed_ || generation != connectionGeneration_) {
    return;
  }
  logger()->warn("connection to {} closed; reconnecting in {} ms", options_.name,
                 options_.reconnectDelay.count());
  presence_ = PlayerPresence::Reconnecting;
  connected_ = false;
  ++connectionGeneration_;
  topologyTimer_.cancel();
  stallTimer_.cancel();
  pendingTopicsRequest_.reset();
  {
    std::lock_guard<std::mutex> lock(publishMutex_);
    publishConnection_.reset();
  }

  if (auto connection = std::move(connection_)) {
    try {
      for (const auto& topic : activeSubscriptions_) {
        connection->unsubscribe(topic);
      }
      connection->close();
    } catch (const std::exception& e) {
      logger()->warn("connection threw while closing: {}", e.what());
    }
  }
  activeSubscriptions_.clear();

  problems_.addProblem(
    ConnectionFailedProblem,
    PlayerProblem{ConnectionFailedProblem, ProblemSeverity::Error, "Connection failed",
                  internal::StrCat("Check that the server at ", options_.name,
                                   " is reachable."),
                  std::nullopt});
  emitState();

  reconnectTimer_.expires_after(options_.reconnectDelay);
  reconnectTimer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
    if (!ec) {
      self->open();
    }
  });
}

// Topology //////////////////////////////////////////////////////////////////

void LivePlayer::requestTopics(bool forceUpdate) {
  // Problems from an earlier request must not outlive it.
  problems_.removeProblems([](const std::string& id) {
    return id.rfind("requestTopics:", 0) == 0;
  });
  topologyTimer_.cancel();
  if (!connected_ || closed_) {
    return;
  }

  const uint64_t request = ++topologyRequest_;
  pendingTopicsRequest_ = request;
  stallTimer_.expires_after(options_.topologyStallWarning);
  stallTimer_.async_wait([self = shared_from_this(), request](const boost::system::error_code& ec) {
    if (ec || self->pendingTopicsRequest_ != request) {
      return;
    }
    self->problems_.addProblem(TopicsStallProblem,
                               PlayerProblem{TopicsStallProblem, ProblemSeverity::Warn,
                                             "Taking too long to get topics and raw types."});
    self->emitState();
  });

  boost::asio::post(executor_, [self = shared_from_this(), connection = connection_, request,
                                forceUpdate] {
    TopicsAndRawTypes result;
    Status status;
    try {
      status = connection->getTopicsAndRawTypes(&result);
    } catch (const std::exception& e) {
      status = Status{StatusCode::ConnectionFailed, e.what()};
    }
    boost::asio::post(self->strand_, [self, request, forceUpdate, status = std::move(status),
                                      result = std::move(result)]() mutable {
      self->onTopicsAndRawTypes(request, forceUpdate, std::move(status), std::move(result));
    });
  });
}

void LivePlayer::onTopicsAndRawTypes(uint64_t request, bool forceUpdate, Status status,
                                     TopicsAndRawTypes result) {
  if (closed_ || !connected_ || request != topologyRequest_) {
    return;
  }
  pendingTopicsRequest_.reset();
  stallTimer_.cancel();
  problems_.removeProblem(TopicsStallProblem);

  if (!status.ok()) {
    logger()->error("failed to fetch topics from {}: {}", options_.name, status.message);
    problems_.addProblem("requestTopics:error",
                         PlayerProblem{"requestTopics:error", ProblemSeverity::Error,
                                       "Failed to fetch topics", std::nullopt, status.message});
    finishTopologyRequest();
    return;
  }

  std::vector<std::string> topicsMissingDatatypes;
  std::vector<Topic> topics;
  Datatypes datatypes;
  std::map<std::string, std::shared_ptr<IMessageReader>> readers;
  for (size_t i = 0; i < result.topics.size(); ++i) {
    const std::string& topicName = result.topics[i];
    if (i >= result.types.size() || i >= result.typedefsFullText.size()) {
      topicsMissingDatatypes.push_back(topicName);
      continue;
    }
    const std::string& type = result.types[i];
    const std::string& definition = result.typedefsFullText[i];

    if (readers.count(type) == 0) {
      std::unique_ptr<IMessageReader> reader;
      Status readerStatus;
      try {
        readerStatus = readerFactory_->create(type, definition, &reader);
      } catch (const std::exception& e) {
        readerStatus = Status{StatusCode::InvalidRecord, e.what()};
      }
      if (!readerStatus.ok() || !reader) {
        logger()->warn("no reader for {} on {}: {}", type, topicName, readerStatus.message);
        topicsMissingDatatypes.push_back(topicName);
        continue;
      }
      readers[type] = std::move(reader);
    }
    topics.push_back(Topic{topicName, type});
    datatypes[type] = definition;
  }

  std::sort(topics.begin(), topics.end(), [](const Topic& left, const Topic& right) {
    return left.name < right.name;
  });
  // Polls repeat every few seconds; only a change, or a new connection, rebuilds
  // readers and subscriptions.
  if (providerTopics_ && *providerTopics_ == topics && !forceUpdate) {
    finishTopologyRequest();
    return;
  }

  if (!topicsMissingDatatypes.empty()) {
    problems_.addProblem(
      "requestTopics:missing-types",
      PlayerProblem{"requestTopics:missing-types", ProblemSeverity::Warn,
                    "Could not resolve all message types",
                    internal::StrCat("Message types could not be found for these topics: ",
                                     internal::JoinNames(topicsMissingDatatypes)),
                    std::nullopt});
  }

  if (!providerTopics_) {
    logger()->info("{} publishes {} topics", options_.name, topics.size());
  }
  datatypeByTopic_.clear();
  for (const auto& topic : topics) {
    datatypeByTopic_[topic.name] = topic.datatype;
  }
  providerTopics_ = std::move(topics);
  datatypes_ = std::move(datatypes);
  readersByDatatype_ = std::move(readers);

  applySubscriptions();

  boost::asio::post(executor_, [self = shared_from_this(), connection = connection_, request] {
    SystemState state;
    Status status;
    try {
      status = connection->getSystemState(&state);
    } catch (const std::exception& e) {
      status = Status{StatusCode::ConnectionFailed, e.what()};
    }
    boost::asio::post(self->strand_, [self, request, status = std::move(status),
                                      state = std::move(state)]() mutable {
      self->onSystemState(request, std::move(status), std::move(state));
    });
  });
}

void LivePlayer::onSystemState(uint64_t request, Status status, SystemState state) {
  if (closed_ || !connected_ || request != topologyRequest_) {
    return;
  }
  if (status.ok()) {
    publishedTopics_ = std::move(state.publishers);
    subscribedTopics_ = std::move(state.subscribers);
    services_ = std::move(state.services);
  } else {
    logger()->error("failed to fetch node details from {}: {}", options_.name, status.message);
    problems_.addProblem("requestTopics:system-state",
                         PlayerProblem{"requestTopics:system-state", ProblemSeverity::Error,
                                       "Failed to fetch node details", std::nullopt,
                                       status.message});
    publishedTopics_.clear();
    subscribedTopics_.clear();
    services_.clear();
  }
  finishTopologyRequest();
}

void LivePlayer::finishTopologyRequest() {
  emitState();
  topologyTimer_.expires_after(options_.topologyPollInterval);
  topologyTimer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
    if (!ec) {
      self->requestTopics(false);
    }
  });
}

// Subscriptions and publishing //////////////////////////////////////////////

void LivePlayer::setSubscriptions(std::vector<SubscribePayload> subscriptions) {
  dispatch([subscriptions = std::move(subscriptions)](LivePlayer& self) {
    self.requestedSubscriptions_ = subscriptions;
    self.applySubscriptions();
  });
}

void LivePlayer::applySubscriptions() {
  if (!connected_ || closed_ || !connection_) {
    return;
  }

  std::vector<SubscribePayload> subscriptions = requestedSubscriptions_;
  const auto hasClock = std::any_of(subscriptions.begin(), subscriptions.end(),
                                    [&](const SubscribePayload& subscription) {
                                      return subscription.topic == options_.clockTopic;
                                    });
  if (!hasClock) {
    subscriptions.insert(subscriptions.begin(), SubscribePayload{options_.clockTopic, "player"});
  }

  parsedTopics_.clear();
  std::set<std::string> available;
  for (const auto& subscription : subscriptions) {
    parsedTopics_.insert(subscription.topic);
    if (datatypeByTopic_.count(subscription.topic) > 0) {
      available.insert(subscription.topic);
    }
  }

  std::weak_ptr<LivePlayer> weak = shared_from_this();
  const uint64_t generation = connectionGeneration_;
  for (const auto& topic : available) {
    if (activeSubscriptions_.count(topic) > 0 ||
        readersByDatatype_.count(datatypeByTopic_.at(topic)) == 0) {
      continue;
    }
    auto callback = [weak, generation, topic](const ByteArray& data) {
      if (auto self = weak.lock()) {
        auto payload = std::make_shared<const ByteArray>(data);
        self->dispatch([generation, topic, payload](LivePlayer& self) {
          self.onMessage(generation, topic, payload);
        });
      }
    };
    Status status;
    try {
      status = connection_->subscribe(topic, std::move(callback));
    } catch (const std::exception& e) {
      status = Status{StatusCode::ConnectionFailed, e.what()};
    }
    if (!status.ok()) {
      logger()->warn("failed to subscribe to {}: {}", topic, status.message);
      continue;
    }
    logger()->debug("subscribed to {}", topic);
    activeSubscriptions_.insert(topic);
  }

  for (auto it = activeSubscriptions_.begin(); it != activeSubscriptions_.end();) {
    if (available.count(*it) > 0) {
      ++it;
      continue;
    }
    try {
      connection_->unsubscribe(*it);
    } catch (const std::exception& e) {
      logger()->warn("failed to unsubscribe from {}: {}", *it, e.what());
    }
    it = activeSubscriptions_.erase(it);
  }
}

void LivePlayer::setPublishers(std::vector<AdvertiseOptions> publishers) {
  dispatch([publishers = std::move(publishers)](LivePlayer& self) {
    std::set<std::string> previous;
    {
      std::lock_guard<std::mutex> lock(self.publishMutex_);
      previous = std::move(self.advertisedTopics_);
      self.advertisedTopics_.clear();
    }
    if (self.connected_ && self.connection_) {
      for (const auto& topic : previous) {
        try {
          self.connection_->unadvertise(topic);
        } catch (const std::exception& e) {
          logger()->warn("failed to unadvertise {}: {}", topic, e.what());
        }
      }
    }
    self.advertisements_ = publishers;
    self.setupPublishers();
  });
}

void LivePlayer::setupPublishers() {
  if (!connected_ || !connection_ || advertisements_.empty()) {
    return;
  }
  std::set<std::string> advertised;
  for (const auto& advertisement : advertisements_) {
    Status status;
    try {
      status = connection_->advertise(advertisement);
    } catch (const std::exception& e) {
      status = Status{StatusCode::ConnectionFailed, e.what()};
    }
    if (!status.ok()) {
      logger()->warn("failed to advertise {}: {}", advertisement.topic, status.message);
      continue;
    }
    advertised.insert(advertisement.topic);
  }
  std::lock_guard<std::mutex> lock(publishMutex_);
  advertisedTopics_ = std::move(advertised);
}

Status LivePlayer::setParameter(const std::string&, const std::string&) {
  return Status{StatusCode::UnsupportedOperation,
                "parameter editing is not supported by live connections"};
}

Status LivePlayer::publish(const PublishPayload& payload) {
  std::shared_ptr<IRemoteConnection> connection;
  {
    std::lock_guard<std::mutex> lock(publishMutex_);
    if (advertisedTopics_.count(payload.topic) == 0) {
      return Status{StatusCode::InvalidTopic,
                    internal::StrCat("tried to publish on a topic that is not registered as a "
                                     "publisher: ",
                                     payload.topic)};
    }
    connection = publishConnection_;
  }
  if (!connection) {
    return Status{StatusCode::ConnectionFailed,
                  internal::StrCat("not connected to ", options_.name)};
  }
  try {
    return connection->publish(payload.topic, payload.message);
  } catch (const std::exception& e) {
    return Status{StatusCode::ConnectionFailed, e.what()};
  }
}

// Messages and state ////////////////////////////////////////////////////////

void LivePlayer::onMessage(uint64_t generation, const std::string& topic,
                           std::shared_ptr<const ByteArray> data) {
  if (closed_ || generation != connectionGeneration_ || !providerTopics_) {
    return;
  }
  auto datatype = datatypeByTopic_.find(topic);
  if (datatype == datatypeByTopic_.end()) {
    return;
  }
  auto reader = readersByDatatype_.find(datatype->second);
  if (reader == readersByDatatype_.end()) {
    return;
  }

  const std::string problemId = "message:" + topic;
  if (auto size = reader->second->size(*data); size && *size > data->size()) {
    problems_.addProblem(
      problemId,
      PlayerProblem{problemId, ProblemSeverity::Error,
                    internal::StrCat("Message buffer not large enough on ", topic), std::nullopt,
                    internal::StrCat("Cannot read ", *size, " byte message from ", data->size(),
                                     " byte buffer")});
    emitState();
    return;
  }

  DecodedMessage decoded;
  Status status;
  try {
    status = reader->second->read(*data, &decoded);
  } catch (const std::exception& e) {
    status = Status{StatusCode::InvalidRecord, e.what()};
  }
  if (!status.ok()) {
    logger()->debug("failed to parse message on {}: {}", topic, status.message);
    problems_.addProblem(problemId,
                         PlayerProblem{problemId, ProblemSeverity::Error,
                                       internal::StrCat("Failed to parse message on ", topic),
                                       std::nullopt, status.message});
    emitState();
    return;
  }

  // The clock sets its own receive time.
  if (topic == options_.clockTopic && decoded.clock) {
    if (!clockTime_) {
      start_ = *decoded.clock;
    }
    clockTime_ = decoded.clock;
  }
  totalBytesReceived_ += data->size();
  if (parsedTopics_.count(topic) > 0) {
    messages_.push_back(MessageEvent{topic, currentTime(), std::move(decoded.message),
                                     data->size()});
  }
  problems_.removeProblem(problemId);
  emitState();
}

Time LivePlayer::currentTime() const {
  return clockTime_ ? *clockTime_ : internal::WallClockTime();
}

void LivePlayer::emitState() {
  if (closed_) {
    return;
  }
  PlayerState state;
  state.name = options_.name;
  state.playerId = playerId_;
  state.presence = presence_;
  state.capabilities = {PlayerCapability::Advertise};
  state.problems = problems_.problems();

  if (!providerTopics_) {
    emitter_.emit(std::move(state));
    return;
  }

  // Time moves on while connected even if no message arrives.
  if (presence_ == PlayerPresence::Present) {
    heartbeatTimer_.expires_after(options_.emitHeartbeat);
    heartbeatTimer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
      if (!ec) {
        self->emitState();
      }
    });
  }

  const Time now = currentTime();
  PlayerActiveData data;
  data.messages = std::move(messages_);
  messages_.clear();
  data.totalBytesReceived = totalBytesReceived_;
  data.startTime = std::min(start_, now);
  data.endTime = now;
  data.currentTime = now;
  data.currentTimeChanged = !lastEmittedTime_ || *lastEmittedTime_ != now;
  lastEmittedTime_ = now;
  data.isPlaying = true;
  data.speed = 1;
  // Seeking is unsupported; any fixed non-zero value will do.
  data.lastSeekTime = 1;
  data.topics = *providerTopics_;
  data.datatypes = datatypes_;
  data.publishedTopics = publishedTopics_;
  data.subscribedTopics = subscribedTopics_;
  data.services = services_;
  state.activeData = std::move(data);
  emitter_.emit(std::move(state));
}

}  // namespace replay
