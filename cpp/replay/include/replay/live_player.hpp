#pragma once

#include "options.hpp"
#include "player.hpp"
#include "problem_store.hpp"
#include "state_emitter.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace replay {

/**
 * @brief Topic list reported by a remote. The three vectors are parallel; a topic
 * whose type or definition is missing has a shorter `types` or `typedefsFullText`.
 */
struct REPLAY_PUBLIC TopicsAndRawTypes {
  std::vector<std::string> topics;
  std::vector<std::string> types;
  std::vector<std::string> typedefsFullText;
};

/**
 * @brief Node graph of a remote: which nodes publish or subscribe to each topic and
 * which nodes provide each service.
 */
struct REPLAY_PUBLIC SystemState {
  TopicOwners publishers;
  TopicOwners subscribers;
  TopicOwners services;
};

using RawMessageCallback = std::function<void(const ByteArray&)>;

/**
 * @brief A connection to a remote message bus. Methods may be called from any
 * thread. Callbacks may be invoked from any thread, including from inside open().
 */
class REPLAY_PUBLIC IRemoteConnection {
public:
  struct Callbacks {
    std::function<void()> onConnection;
    std::function<void(const std::string&)> onError;
    /// Reported once when the connection is lost or could not be established.
    std::function<void()> onClose;
  };

  virtual ~IRemoteConnection() = default;

  /**
   * @brief Starts connecting and returns immediately. The outcome is reported
   * through `callbacks`.
   */
  virtual void open(Callbacks callbacks) = 0;
  virtual void close() = 0;

  /**
   * @brief Blocking topology queries.
   */
  virtual Status getTopicsAndRawTypes(TopicsAndRawTypes* output) = 0;
  virtual Status getSystemState(SystemState* output) = 0;

  virtual Status subscribe(const std::string& topic, RawMessageCallback callback) = 0;
  virtual void unsubscribe(const std::string& topic) = 0;
  virtual Status advertise(const AdvertiseOptions& options) = 0;
  virtual void unadvertise(const std::string& topic) = 0;
  virtual Status publish(const std::string& topic, const ByteArray& message) = 0;
};

/**
 * @brief Creates a fresh connection for every (re)connection attempt.
 */
using ConnectionFactory = std::function<std::unique_ptr<IRemoteConnection>()>;

struct REPLAY_PUBLIC DecodedMessage {
  std::shared_ptr<const ByteArray> message;
  /**
   * @brief Set when the message carries a clock value.
   */
  std::optional<Time> clock;
};

/**
 * @brief Decodes messages of one datatype. Only ever called from one thread at a
 * time.
 */
class REPLAY_PUBLIC IMessageReader {
public:
  virtual ~IMessageReader() = default;

  /**
   * @brief The number of bytes the message in `data` claims to occupy, if the
   * encoding makes that cheap to find.
   */
  virtual std::optional<uint64_t> size(const ByteArray& data) const = 0;
  virtual Status read(const ByteArray& data, DecodedMessage* output) = 0;
};

class REPLAY_PUBLIC IMessageReaderFactory {
public:
  virtual ~IMessageReaderFactory() = default;

  virtual Status create(const std::string& datatype, const std::string& definition,
                        std::unique_ptr<IMessageReader>* output) = 0;
};

/**
 * @brief Streams messages from a live remote. Playback controls are no-ops: time
 * always moves forward with the remote clock, or the wall clock when the remote
 * publishes none.
 *
 * The connection is reopened after every loss until close() is called, and the
 * remote's topics are polled so that new topics become subscribable.
 */
class REPLAY_PUBLIC LivePlayer final
    : public IPlayer
    , public std::enable_shared_from_this<LivePlayer> {
public:
  static Status Create(const boost::asio::any_io_executor& executor,
                       ConnectionFactory connectionFactory,
                       std::shared_ptr<IMessageReaderFactory> readerFactory,
                       LivePlayerOptions options, std::shared_ptr<LivePlayer>* output);

  ~LivePlayer() override;

  LivePlayer(const LivePlayer&) = delete;
  LivePlayer& operator=(const LivePlayer&) = delete;

  void setListener(PlayerListener listener) override;
  void close() override;

  void setSubscriptions(std::vector<SubscribePayload> subscriptions) override;
  void setPublishers(std::vector<AdvertiseOptions> publishers) override;

  Status setParameter(const std::string& key, const std::string& value) override;
  /**
   * @brief Fails with InvalidTopic unless `payload.topic` was passed to
   * setPublishers() and advertised on the current connection.
   */
  Status publish(const PublishPayload& payload) override;

  void startPlayback() override {}
  void pausePlayback() override {}
  void setPlaybackSpeed(double) override {}
  void seekPlayback(const Time&, std::optional<Time> = std::nullopt) override {}
  void requestBackfill() override {}

private:
  LivePlayer(const boost::asio::any_io_executor& executor, ConnectionFactory connectionFactory,
             std::shared_ptr<IMessageReaderFactory> readerFactory, LivePlayerOptions options);

  boost::asio::any_io_executor executor_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  StateEmitter emitter_;
  boost::asio::steady_timer reconnectTimer_;
  boost::asio::steady_timer topologyTimer_;
  boost::asio::steady_timer stallTimer_;
  boost::asio::steady_timer heartbeatTimer_;
  ConnectionFactory connectionFactory_;
  std::shared_ptr<IMessageReaderFactory> readerFactory_;
  const LivePlayerOptions options_;
  const std::string playerId_;

  // publish() runs on the caller's thread.
  std::mutex publishMutex_;
  std::shared_ptr<IRemoteConnection> publishConnection_;
  std::set<std::string> advertisedTopics_;

  // Everything below is touched only on strand_.
  bool closed_ = false;
  std::shared_ptr<IRemoteConnection> connection_;
  bool connected_ = false;
  // Bumped whenever connection_ changes so callbacks from older connections are
  // ignored.
  uint64_t connectionGeneration_ = 0;
  uint64_t topologyRequest_ = 0;
  std::optional<uint64_t> pendingTopicsRequest_;
  PlayerPresence presence_ = PlayerPresence::Initializing;
  ProblemStore problems_;
  std::optional<std::vector<Topic>> providerTopics_;
  std::map<std::string, std::string> datatypeByTopic_;
  Datatypes datatypes_;
  std::map<std::string, std::shared_ptr<IMessageReader>> readersByDatatype_;
  TopicOwners publishedTopics_;
  TopicOwners subscribedTopics_;
  TopicOwners services_;
  Time start_;
  std::optional<Time> clockTime_;
  std::optional<Time> lastEmittedTime_;
  std::vector<SubscribePayload> requestedSubscriptions_;
  std::set<std::string> parsedTopics_;
  std::set<std::string> activeSubscriptions_;
  std::vector<AdvertiseOptions> advertisements_;
  std::vector<MessageEvent> messages_;
  uint64_t totalBytesReceived_ = 0;

  template <typename Handler>
  void dispatch(Handler&& handler);

  void open();
  void onConnection(uint64_t generation);
  void onConnectionError(uint64_t generation, const std::string& error);
  void onConnectionClosed(uint64_t generation);

  void requestTopics(bool forceUpdate);
  void onTopicsAndRawTypes(uint64_t request, bool forceUpdate, Status status,
                           TopicsAndRawTypes result);
  void onSystemState(uint64_t request, Status status, SystemState state);
  void finishTopologyRequest();

  void applySubscriptions();
  void setupPublishers();
  void onMessage(uint64_t generation, const std::string& topic,
                 std::shared_ptr<const ByteArray> data);

  Time currentTime() const;
  void emitState();
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "live_player.inl"
#endif
