#pragma once

#include "player.hpp"
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace replay {

/**
 * @brief One publisher of a topic within a recording.
 */
struct REPLAY_PUBLIC TopicConnection {
  std::string topic;
  std::string datatype;
  std::string callerId;
};

struct REPLAY_PUBLIC MessageDefinitions {
  enum struct Kind {
    /// Definitions are only available as unparsed text; playback cannot use them.
    Raw,
    Parsed,
  };

  Kind kind = Kind::Parsed;
  Datatypes datatypes;
};

/**
 * @brief The provider lost or regained its connection to the underlying storage.
 */
struct REPLAY_PUBLIC ReconnectingMetadata {
  bool reconnecting = false;
};

/**
 * @brief Bytes pulled from the underlying storage since the previous report.
 */
struct REPLAY_PUBLIC ReceivedBytesMetadata {
  uint64_t bytes = 0;
};

using ProviderMetadata = std::variant<ReconnectingMetadata, ReceivedBytesMetadata>;

/**
 * @brief Callbacks a provider may invoke from any thread, during or after
 * initialize().
 */
struct REPLAY_PUBLIC ExtensionPoint {
  std::function<void(const Progress&)> progressCallback;
  std::function<void(const ProviderMetadata&)> reportMetadataCallback;
};

struct REPLAY_PUBLIC InitializationResult {
  Time start;
  Time end;
  std::vector<Topic> topics;
  std::vector<TopicConnection> connections;
  bool providesParsedMessages = true;
  MessageDefinitions messageDefinitions;
};

struct REPLAY_PUBLIC GetMessagesTopics {
  std::vector<std::string> parsedMessages;
};

struct REPLAY_PUBLIC GetMessagesResult {
  /**
   * @brief Messages in `[start, end]` on the requested topics, ordered by receive
   * time. Absent when the provider could not produce parsed messages.
   */
  std::optional<std::vector<MessageEvent>> parsedMessages;
};

/**
 * @brief Paginated, seekable storage backend. Calls are blocking and are never made
 * concurrently on one provider.
 */
class REPLAY_PUBLIC IDataProvider {
public:
  virtual ~IDataProvider() = default;

  virtual Status initialize(const ExtensionPoint& extensionPoint,
                            InitializationResult* result) = 0;

  /**
   * @brief Reads messages with receive time in `[start, end]`, both inclusive.
   */
  virtual Status getMessages(const Time& start, const Time& end, const GetMessagesTopics& topics,
                             GetMessagesResult* result) = 0;

  virtual Status close() = 0;
};

}  // namespace replay
