#include "test_helpers.hpp"

#include <map>
#include <set>

using replay::PlayerState;
using replay::StatusCode;
using replay::Time;

namespace {

constexpr char ClockType[] = "rosgraph_msgs/Clock";
constexpr char StringType[] = "std_msgs/String";

/**
 * The remote side of every FakeConnection a test's factory creates.
 */
struct FakeRemote {
  std::mutex mutex;
  bool refuseConnections = false;
  replay::TopicsAndRawTypes topics;
  replay::Status topicsStatus;
  std::chrono::milliseconds topicsDelay{0};
  replay::SystemState system;
  replay::Status systemStatus;
  std::map<std::string, replay::RawMessageCallback> subscriptions;
  std::set<std::string> advertised;
  std::vector<std::pair<std::string, replay::ByteArray>> published;
  replay::IRemoteConnection::Callbacks callbacks;
  int opened = 0;
  int closed = 0;

  template <typename T>
  T get(T FakeRemote::*field) {
    std::lock_guard<std::mutex> lock(mutex);
    return this->*field;
  }

  bool isSubscribed(const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex);
    return subscriptions.count(topic) > 0;
  }

  void send(const std::string& topic, const replay::ByteArray& data) {
    replay::RawMessageCallback callback;
    {
      std::lock_guard<std::mutex> lock(mutex);
      callback = subscriptions.at(topic);
    }
    callback(data);
  }

  void raiseError(const std::string& error) {
    std::function<void(const std::string&)> onError;
    {
      std::lock_guard<std::mutex> lock(mutex);
      onError = callbacks.onError;
    }
    onError(error);
  }

  void drop() {
    std::function<void()> onClose;
    {
      std::lock_guard<std::mutex> lock(mutex);
      onClose = callbacks.onClose;
    }
    onClose();
  }
};

class FakeConnection final : public replay::IRemoteConnection {
public:
  explicit FakeConnection(std::shared_ptr<FakeRemote> remote)
      : remote_(std::move(remote)) {}

  void open(Callbacks callbacks) override {
    bool refuse;
    {
      std::lock_guard<std::mutex> lock(remote_->mutex);
      ++remote_->opened;
      remote_->callbacks = callbacks;
      refuse = remote_->refuseConnections;
    }
    if (refuse) {
      callbacks.onClose();
    } else {
      callbacks.onConnection();
    }
  }

  void close() override {
    std::lock_guard<std::mutex> lock(remote_->mutex);
    ++remote_->closed;
    remote_->subscriptions.clear();
    remote_->advertised.clear();
  }

  replay::Status getTopicsAndRawTypes(replay::TopicsAndRawTypes* output) override {
    std::this_thread::sleep_for(remote_->get(&FakeRemote::topicsDelay));
    std::lock_guard<std::mutex> lock(remote_->mutex);
    *output = remote_->topics;
    return remote_->topicsStatus;
  }

  replay::Status getSystemState(replay::SystemState* output) override {
    std::lock_guard<std::mutex> lock(remote_->mutex);
    *output = remote_->system;
    return remote_->systemStatus;
  }

  replay::Status subscribe(const std::string& topic,
                           replay::RawMessageCallback callback) override {
    std::lock_guard<std::mutex> lock(remote_->mutex);
    remote_->subscriptions[topic] = std::move(callback);
    return StatusCode::Success;
  }

  void unsubscribe(const std::string& topic) override {
    std::lock_guard<std::mutex> lock(remote_->mutex);
    remote_->subscriptions.erase(topic);
  }

  replay::Status advertise(const replay::AdvertiseOptions& options) override {
    std::lock_guard<std::mutex> lock(remote_->mutex);
    remote_->advertised.insert(options.topic);
    return StatusCode::Success;
  }

  void unadvertise(const std::string& topic) override {
    std::lock_guard<std::mutex> lock(remote_->mutex);
    remote_->advertised.erase(topic);
  }

  replay::Status publish(const std::string& topic, const replay::ByteArray& message) override {
    std::lock_guard<std::mutex> lock(remote_->mutex);
    remote_->published.emplace_back(topic, message);
    return StatusCode::Success;
  }

private:
  std::shared_ptr<FakeRemote> remote_;
};

// Text messages. "bad" fails to decode, and a leading '!' claims a 1000 byte
// message.
class TextReader : public replay::IMessageReader {
public:
  explicit TextReader(bool clock)
      : clock_(clock) {}

  std::optional<uint64_t> size(const replay::ByteArray& data) const override {
    if (!data.empty() && data[0] == std::byte('!')) {
      return 1000;
    }
    return std::nullopt;
  }

  replay::Status read(const replay::ByteArray& data, replay::DecodedMessage* output) override {
    const std::string text = Text(data);
    if (text == "bad") {
      return replay::Status{StatusCode::InvalidRecord, "bad bytes"};
    }
    output->message = std::make_shared<const replay::ByteArray>(data);
    if (clock_) {
      output->clock = replay::fromSec(std::stod(text));
    }
    return StatusCode::Success;
  }

private:
  bool clock_;
};

class TextReaderFactory : public replay::IMessageReaderFactory {
public:
  replay::Status create(const std::string& datatype, const std::string&,
                        std::unique_ptr<replay::IMessageReader>* output) override {
    if (datatype != ClockType && datatype != StringType) {
      return replay::Status{StatusCode::InvalidRecord, "unknown datatype " + datatype};
    }
    *output = std::make_unique<TextReader>(datatype == ClockType);
    return StatusCode::Success;
  }
};

std::shared_ptr<FakeRemote> MakeRemote() {
  auto remote = std::make_shared<FakeRemote>();
  remote->topics.topics = {"/clock", "/chatter"};
  remote->topics.types = {ClockType, StringType};
  remote->topics.typedefsFullText = {"time clock", "string data"};
  remote->system.publishers["/chatter"] = {"/talker"};
  remote->system.subscribers["/chatter"] = {"/listener"};
  remote->system.services["/talker/get_loggers"] = {"/talker"};
  return remote;
}

replay::LivePlayerOptions FastOptions() {
  replay::LivePlayerOptions options;
  options.name = "ws://fake:9090";
  options.reconnectDelay = 50ms;
  options.topologyPollInterval = 100ms;
  options.emitHeartbeat = 20ms;
  return options;
}

class LiveFixture {
public:
  explicit LiveFixture(std::shared_ptr<FakeRemote> remote,
                       replay::LivePlayerOptions options = FastOptions())
      : remote(std::move(remote))
      , pool_(4) {
    auto shared = this->remote;
    requireOk(replay::LivePlayer::Create(
      pool_.get_executor(),
      [shared] {
        return std::make_unique<FakeConnection>(shared);
      },
      std::make_shared<TextReaderFactory>(), options, &player));
    player->setListener(recorder.listener());
  }

  ~LiveFixture() {
    shutdown();
  }

  PlayerState waitFor(const std::function<bool(const PlayerState&)>& predicate) {
    auto state = recorder.waitFor(predicate);
    REQUIRE(state.has_value());
    return *state;
  }

  PlayerState waitConnected() {
    return waitFor([](const PlayerState& state) {
      return state.presence == replay::PlayerPresence::Present && state.activeData &&
             !state.activeData->topics.empty();
    });
  }

  void subscribe(std::vector<std::string> topics) {
    std::vector<replay::SubscribePayload> subscriptions;
    for (auto& topic : topics) {
      subscriptions.push_back(replay::SubscribePayload{std::move(topic), "test"});
    }
    player->setSubscriptions(std::move(subscriptions));
  }

  void shutdown() {
    if (!player) {
      return;
    }
    player->close();
    pool_.join();
    player.reset();
  }

  std::shared_ptr<FakeRemote> remote;
  StateRecorder recorder;
  std::shared_ptr<replay::LivePlayer> player;

private:
  boost::asio::thread_pool pool_;
};

bool HasMessageOn(const PlayerState& state, const std::string& topic) {
  if (!state.activeData) {
    return false;
  }
  return std::any_of(state.activeData->messages.begin(), state.activeData->messages.end(),
                     [&](const replay::MessageEvent& message) {
                       return message.topic == topic;
                     });
}

}  // namespace

TEST_CASE("LivePlayer::Create", "[live]") {
  boost::asio::thread_pool pool(1);
  std::shared_ptr<replay::LivePlayer> player;
  const auto factory = [] {
    return std::make_unique<FakeConnection>(MakeRemote());
  };

  REQUIRE(replay::LivePlayer::Create(pool.get_executor(), nullptr,
                                     std::make_shared<TextReaderFactory>(), FastOptions(), &player)
            .code == StatusCode::InvalidOptions);
  REQUIRE(replay::LivePlayer::Create(pool.get_executor(), factory, nullptr, FastOptions(), &player)
            .code == StatusCode::InvalidOptions);
  auto options = FastOptions();
  options.reconnectDelay = 0ms;
  REQUIRE(replay::LivePlayer::Create(pool.get_executor(), factory,
                                     std::make_shared<TextReaderFactory>(), options, &player)
            .code == StatusCode::InvalidOptions);
  REQUIRE(player == nullptr);
  pool.join();
}

TEST_CASE("LivePlayer topology", "[live]") {
  LiveFixture fixture(MakeRemote());
  const auto state = fixture.waitConnected();

  REQUIRE(state.name == "ws://fake:9090");
  REQUIRE(state.capabilities ==
          std::vector<replay::PlayerCapability>{replay::PlayerCapability::Advertise});
  REQUIRE(state.problems.empty());

  const auto& data = *state.activeData;
  REQUIRE(data.topics == std::vector<replay::Topic>{{"/chatter", StringType}, {"/clock", ClockType}});
  REQUIRE(data.datatypes.at(StringType) == "string data");
  REQUIRE(data.isPlaying);
  REQUIRE(data.speed == 1);
  REQUIRE(data.startTime <= data.currentTime);
  REQUIRE(data.endTime == data.currentTime);

  // Node details arrive after the topic list.
  const auto detailed = fixture.waitFor([](const PlayerState& state) {
    return state.activeData && !state.activeData->services.empty();
  });
  REQUIRE(detailed.activeData->publishedTopics.at("/chatter").count("/talker") == 1);
  REQUIRE(detailed.activeData->subscribedTopics.at("/chatter").count("/listener") == 1);

  // The clock is subscribed even though nobody asked for it.
  REQUIRE(Eventually([&] {
    return fixture.remote->isSubscribed("/clock");
  }));
  REQUIRE_FALSE(fixture.remote->isSubscribed("/chatter"));
}

TEST_CASE("LivePlayer messages", "[live]") {
  LiveFixture fixture(MakeRemote());
  fixture.waitConnected();
  fixture.subscribe({"/chatter"});
  REQUIRE(Eventually([&] {
    return fixture.remote->isSubscribed("/chatter") && fixture.remote->isSubscribed("/clock");
  }));

  SECTION("receive time follows the remote clock") {
    fixture.remote->send("/clock", Bytes("100.5"));
    fixture.remote->send("/chatter", Bytes("hello"));
    const auto state = fixture.waitFor([](const PlayerState& state) {
      return HasMessageOn(state, "/chatter");
    });
    const auto& data = *state.activeData;
    const auto& message = data.messages.back();
    REQUIRE(message.topic == "/chatter");
    REQUIRE(Text(*message.message) == "hello");
    REQUIRE(message.receiveTime == Time{100, 500'000'000});
    REQUIRE(message.sizeInBytes == 5);
    REQUIRE(data.currentTime == Time{100, 500'000'000});
    REQUIRE(data.startTime == Time{100, 500'000'000});
    REQUIRE(data.totalBytesReceived == 10);

    fixture.remote->send("/clock", Bytes("101"));
    const auto later = fixture.waitFor([](const PlayerState& state) {
      return state.activeData && state.activeData->currentTime == Time{101, 0};
    });
    REQUIRE(later.activeData->startTime == Time{100, 500'000'000});
  }

  SECTION("receive time is the wall clock without a remote clock") {
    const auto before = replay::fromNanos(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                            std::chrono::system_clock::now().time_since_epoch())
                                            .count());
    fixture.remote->send("/chatter", Bytes("hello"));
    const auto state = fixture.waitFor([](const PlayerState& state) {
      return HasMessageOn(state, "/chatter");
    });
    REQUIRE(state.activeData->messages.back().receiveTime >= before);
  }

  SECTION("decode failures are reported per topic and cleared by the next good message") {
    fixture.remote->send("/chatter", Bytes("bad"));
    const auto failed = fixture.waitFor([](const PlayerState& state) {
      return HasProblem(state, "message:/chatter");
    });
    const auto* problem = FindProblem(failed, "message:/chatter");
    REQUIRE(problem->severity == replay::ProblemSeverity::Error);
    REQUIRE(problem->message == "Failed to parse message on /chatter");
    REQUIRE(problem->error == std::optional<std::string>("bad bytes"));

    fixture.remote->send("/chatter", Bytes("good"));
    const auto recovered = fixture.waitFor([](const PlayerState& state) {
      return HasMessageOn(state, "/chatter");
    });
    REQUIRE_FALSE(HasProblem(recovered, "message:/chatter"));
  }

  SECTION("messages claiming more bytes than received are rejected") {
    fixture.remote->send("/chatter", Bytes("!short"));
    const auto state = fixture.waitFor([](const PlayerState& state) {
      return HasProblem(state, "message:/chatter");
    });
    const auto* problem = FindProblem(state, "message:/chatter");
    REQUIRE(problem->message == "Message buffer not large enough on /chatter");
    REQUIRE(problem->error == std::optional<std::string>("Cannot read 1000 byte message from 6 "
                                                         "byte buffer"));
    REQUIRE(fixture.recorder.messages().empty());
  }

  SECTION("unsubscribing stops delivery") {
    fixture.subscribe({});
    REQUIRE(Eventually([&] {
      return !fixture.remote->isSubscribed("/chatter");
    }));
    REQUIRE(fixture.remote->isSubscribed("/clock"));
  }
}

TEST_CASE("LivePlayer topology problems", "[live]") {
  auto remote = MakeRemote();
  auto options = FastOptions();

  SECTION("unresolvable types") {
    remote->topics.topics = {"/chatter", "/odd", "/untyped"};
    remote->topics.types = {StringType, "custom/Odd"};
    remote->topics.typedefsFullText = {"string data", "odd data"};
    LiveFixture fixture(remote, options);
    const auto state = fixture.waitFor([](const PlayerState& state) {
      return HasProblem(state, "requestTopics:missing-types");
    });
    const auto* problem = FindProblem(state, "requestTopics:missing-types");
    REQUIRE(problem->severity == replay::ProblemSeverity::Warn);
    REQUIRE(problem->message == "Could not resolve all message types");
    REQUIRE(problem->tip ==
            std::optional<std::string>("Message types could not be found for these topics: "
                                       "/odd,/untyped"));
    REQUIRE(state.activeData->topics == std::vector<replay::Topic>{{"/chatter", StringType}});
  }

  SECTION("topic query failure") {
    remote->topicsStatus = replay::Status{StatusCode::ConnectionFailed, "timed out"};
    LiveFixture fixture(remote, options);
    const auto state = fixture.waitFor([](const PlayerState& state) {
      return HasProblem(state, "requestTopics:error");
    });
    const auto* problem = FindProblem(state, "requestTopics:error");
    REQUIRE(problem->severity == replay::ProblemSeverity::Error);
    REQUIRE(problem->message == "Failed to fetch topics");
    REQUIRE(problem->error == std::optional<std::string>("timed out"));
  }

  SECTION("node details failure") {
    remote->systemStatus = replay::Status{StatusCode::ConnectionFailed, "no master"};
    LiveFixture fixture(remote, options);
    const auto state = fixture.waitFor([](const PlayerState& state) {
      return HasProblem(state, "requestTopics:system-state");
    });
    REQUIRE(FindProblem(state, "requestTopics:system-state")->message ==
            "Failed to fetch node details");
    REQUIRE(state.activeData->publishedTopics.empty());
    REQUIRE(state.activeData->services.empty());
  }

  SECTION("slow topic queries raise a warning until they finish") {
    remote->topicsDelay = 300ms;
    options.topologyStallWarning = 50ms;
    options.topologyPollInterval = 10s;
    LiveFixture fixture(remote, options);
    const auto stalled = fixture.waitFor([](const PlayerState& state) {
      return HasProblem(state, "topicsAndRawTypesTimeout");
    });
    REQUIRE(FindProblem(stalled, "topicsAndRawTypesTimeout")->severity ==
            replay::ProblemSeverity::Warn);
    const auto finished = fixture.waitConnected();
    REQUIRE_FALSE(HasProblem(finished, "topicsAndRawTypesTimeout"));
  }
}

TEST_CASE("LivePlayer connection lifecycle", "[live]") {
  SECTION("reconnects after a refused connection") {
    auto remote = MakeRemote();
    remote->refuseConnections = true;
    LiveFixture fixture(remote);

    const auto failed = fixture.waitFor([](const PlayerState& state) {
      return state.presence == replay::PlayerPresence::Reconnecting &&
             HasProblem(state, "connection-failed");
    });
    const auto* problem = FindProblem(failed, "connection-failed");
    REQUIRE(problem->severity == replay::ProblemSeverity::Error);
    REQUIRE(problem->message == "Connection failed");
    REQUIRE(problem->tip ==
            std::optional<std::string>("Check that the server at ws://fake:9090 is reachable."));

    {
      std::lock_guard<std::mutex> lock(remote->mutex);
      remote->refuseConnections = false;
    }
    const auto connected = fixture.waitConnected();
    REQUIRE_FALSE(HasProblem(connected, "connection-failed"));
    REQUIRE(remote->get(&FakeRemote::opened) >= 2);
  }

  SECTION("a dropped connection is reopened and resubscribed") {
    auto remote = MakeRemote();
    LiveFixture fixture(remote);
    fixture.waitConnected();
    fixture.subscribe({"/chatter"});
    REQUIRE(Eventually([&] {
      return remote->isSubscribed("/chatter");
    }));

    remote->drop();
    fixture.waitFor([](const PlayerState& state) {
      return state.presence == replay::PlayerPresence::Reconnecting;
    });
    REQUIRE(Eventually([&] {
      return remote->get(&FakeRemote::opened) == 2 && remote->isSubscribed("/chatter");
    }));
  }

  SECTION("connection errors are warnings") {
    auto remote = MakeRemote();
    LiveFixture fixture(remote);
    fixture.waitConnected();
    remote->raiseError("socket hiccup");
    const auto state = fixture.waitFor([](const PlayerState& state) {
      return HasProblem(state, "connection-error");
    });
    const auto* problem = FindProblem(state, "connection-error");
    REQUIRE(problem->severity == replay::ProblemSeverity::Warn);
    REQUIRE(problem->error == std::optional<std::string>("socket hiccup"));
    REQUIRE(state.presence == replay::PlayerPresence::Present);
  }

  SECTION("close closes the connection and stops emitting") {
    auto remote = MakeRemote();
    LiveFixture fixture(remote);
    fixture.waitConnected();
    fixture.player->close();
    REQUIRE(Eventually([&] {
      return remote->get(&FakeRemote::closed) == 1;
    }));
    const size_t count = fixture.recorder.count();
    std::this_thread::sleep_for(100ms);
    REQUIRE(fixture.recorder.count() == count);
    fixture.shutdown();
    REQUIRE(remote->get(&FakeRemote::closed) == 1);
  }
}

TEST_CASE("LivePlayer publishing", "[live]") {
  auto remote = MakeRemote();
  LiveFixture fixture(remote);

  REQUIRE(fixture.player->setParameter("/rate", "2").code == StatusCode::UnsupportedOperation);
  REQUIRE(fixture.player->publish(replay::PublishPayload{"/cmd", Bytes("go")}).code ==
          StatusCode::InvalidTopic);

  fixture.waitConnected();
  fixture.player->setPublishers({replay::AdvertiseOptions{"/cmd", StringType}});
  REQUIRE(Eventually([&] {
    std::lock_guard<std::mutex> lock(remote->mutex);
    return remote->advertised.count("/cmd") == 1;
  }));

  requireOk(fixture.player->publish(replay::PublishPayload{"/cmd", Bytes("go")}));
  REQUIRE(fixture.player->publish(replay::PublishPayload{"/other", Bytes("go")}).code ==
          StatusCode::InvalidTopic);

  {
    std::lock_guard<std::mutex> lock(remote->mutex);
    REQUIRE(remote->published.size() == 1);
    REQUIRE(remote->published[0].first == "/cmd");
    REQUIRE(Text(remote->published[0].second) == "go");
  }

  fixture.player->setPublishers({});
  REQUIRE(Eventually([&] {
    std::lock_guard<std::mutex> lock(remote->mutex);
    return remote->advertised.empty();
  }));
  REQUIRE(fixture.player->publish(replay::PublishPayload{"/cmd", Bytes("go")}).code ==
          StatusCode::InvalidTopic);
}
