#pragma once

#include "data_provider.hpp"
#include "decompression.hpp"
#include "options.hpp"
#include "readable.hpp"
#include <deque>
#include <memory>
#include <unordered_map>

namespace replay {

/**
 * @brief The parts of a recording's Summary section the indexed provider uses.
 */
struct REPLAY_PUBLIC McapSummary {
  Footer footer;
  std::unordered_map<SchemaId, Schema> schemas;
  std::unordered_map<ChannelId, Channel> channels;
  std::optional<Statistics> statistics;
  std::vector<ChunkIndex> chunkIndexes;
};

/**
 * @brief Provider that decodes an entire recording with StreamReader during
 * initialize() and serves every later read from memory. Works on any well-formed
 * recording, indexed or not.
 */
class REPLAY_PUBLIC McapStreamProvider final : public IDataProvider {
public:
  explicit McapStreamProvider(std::unique_ptr<IReadable> readable,
                              McapProviderOptions options = {});

  Status initialize(const ExtensionPoint& extensionPoint, InitializationResult* result) override;
  Status getMessages(const Time& start, const Time& end, const GetMessagesTopics& topics,
                     GetMessagesResult* result) override;
  Status close() override;

private:
  struct StoredMessage {
    Timestamp logTime;
    ChannelId channelId;
    std::shared_ptr<const ByteArray> data;
  };

  std::unique_ptr<IReadable> readable_;
  McapProviderOptions options_;
  std::unordered_map<SchemaId, Schema> schemas_;
  std::unordered_map<ChannelId, Channel> channels_;
  std::vector<StoredMessage> messages_;
  uint64_t unknownChannelMessages_ = 0;

  void handleRecord(TypedRecord&& record);
};

/**
 * @brief Provider that reads only the Summary section up front and then loads the
 * chunks whose time range overlaps each requested window.
 */
class REPLAY_PUBLIC McapIndexedProvider final : public IDataProvider {
public:
  explicit McapIndexedProvider(std::unique_ptr<IReadable> readable,
                               McapProviderOptions options = {});

  /**
   * @brief Reads the Footer and Summary section of `readable`. Fails with
   * MissingSummary when the recording has no summary or no chunk indexes to serve
   * reads from.
   */
  static Status ReadSummary(IReadable& readable, McapSummary* summary);

  Status initialize(const ExtensionPoint& extensionPoint, InitializationResult* result) override;
  Status getMessages(const Time& start, const Time& end, const GetMessagesTopics& topics,
                     GetMessagesResult* result) override;
  Status close() override;

private:
  static constexpr size_t ChunkCacheSize = 8;

  std::unique_ptr<IReadable> readable_;
  McapProviderOptions options_;
  DecompressionRegistry decompression_ = DecompressionRegistry::WithBuiltins();
  ExtensionPoint extensionPoint_;
  McapSummary summary_;
  std::deque<std::pair<ByteOffset, std::shared_ptr<const ByteArray>>> chunkCache_;

  Status loadChunk(const ChunkIndex& index, std::shared_ptr<const ByteArray>* records);
};

/**
 * @brief Builds the provider selected by `options.readMode` for `readable`. In Auto
 * mode the indexed provider is used when the recording has a usable Summary section.
 */
REPLAY_PUBLIC Status OpenMcapProvider(std::unique_ptr<IReadable> readable,
                                      const McapProviderOptions& options,
                                      std::unique_ptr<IDataProvider>* output);

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "mcap_provider.inl"
#endif
