#include "crc32.hpp"
#include "internal.hpp"
#include "log.hpp"
#include "stream_reader.hpp"
#include <algorithm>
#include <map>
#include <unordered_set>

namespace replay {

namespace internal {

// Fills topics, connections and datatypes from the channels and schemas of a recording.
void DescribeChannels(const std::unordered_map<ChannelId, Channel>& channels,
                      const std::unordered_map<SchemaId, Schema>& schemas,
                      InitializationResult* result) {
  std::map<ChannelId, const Channel*> ordered;
  for (const auto& [id, channel] : channels) {
    ordered.emplace(id, &channel);
  }

  std::unordered_set<std::string> seenTopics;
  for (const auto& [id, channel] : ordered) {
    std::string datatype;
    if (channel->schemaId != 0) {
      if (auto it = schemas.find(channel->schemaId); it != schemas.end()) {
        datatype = it->second.name;
        result->messageDefinitions.datatypes[datatype] =
          std::string(reinterpret_cast<const char*>(it->second.data.data()),
                      it->second.data.size());
      }
    }
    if (seenTopics.insert(channel->topic).second) {
      result->topics.push_back(Topic{channel->topic, datatype});
    }
    std::string callerId;
    if (auto it = channel->metadata.find("callerid"); it != channel->metadata.end()) {
      callerId = it->second;
    }
    result->connections.push_back(TopicConnection{channel->topic, datatype, callerId});
  }
  result->providesParsedMessages = true;
  result->messageDefinitions.kind = MessageDefinitions::Kind::Parsed;
}

std::unordered_set<ChannelId> SubscribedChannels(
  const std::unordered_map<ChannelId, Channel>& channels, const GetMessagesTopics& topics) {
  std::unordered_set<std::string> wanted(topics.parsedMessages.begin(),
                                         topics.parsedMessages.end());
  std::unordered_set<ChannelId> subscribed;
  for (const auto& [id, channel] : channels) {
    if (wanted.count(channel.topic) > 0) {
      subscribed.insert(id);
    }
  }
  return subscribed;
}

Timestamp ToTimestamp(const Time& time) {
  const int64_t nanos = toNanos(time);
  return nanos < 0 ? 0 : Timestamp(nanos);
}

Time FromTimestamp(Timestamp timestamp) {
  return fromNanos(int64_t(std::min<Timestamp>(timestamp, uint64_t(INT64_MAX))));
}

}  // namespace internal

// McapStreamProvider //////////////////////////////////////////////////////////

McapStreamProvider::McapStreamProvider(std::unique_ptr<IReadable> readable,
                                       McapProviderOptions options)
    : readable_(std::move(readable))
    , options_(options) {}

Status McapStreamProvider::initialize(const ExtensionPoint& extensionPoint,
                                      InitializationResult* result) {
  if (auto status = options_.validate(); !status.ok()) {
    return status;
  }
  if (!readable_) {
    return StatusCode::NotOpen;
  }

  StreamReaderOptions readerOptions;
  readerOptions.validateChunkCrc = options_.validateChunkCrc;
  StreamReader reader{std::move(readerOptions)};

  const uint64_t size = readable_->size();
  uint64_t offset = 0;
  for (bool finished = false; !finished;) {
    for (;;) {
      auto next = reader.next();
      if (next.kind == ReadResult::Kind::Record) {
        handleRecord(std::move(*next.record));
        continue;
      }
      if (next.kind == ReadResult::Kind::Failed) {
        return Status{reader.status().code, internal::StrCat("failed to decode recording at byte ",
                                                             reader.bytesConsumed(), ": ",
                                                             reader.status().message)};
      }
      finished = next.kind == ReadResult::Kind::Done;
      break;
    }
    if (finished) {
      break;
    }
    if (offset >= size) {
      return Status{StatusCode::InvalidRecord,
                    internal::StrCat("recording ends after ", size, " bytes without a footer")};
    }

    std::byte* data = nullptr;
    const uint64_t bytesRead = readable_->read(&data, offset, std::min(options_.pageSize, size - offset));
    if (bytesRead == 0) {
      return Status{StatusCode::ReadFailed, internal::StrCat("read failed at offset ", offset)};
    }
    if (auto status = reader.append(data, size_t(bytesRead)); !status.ok()) {
      return status;
    }
    offset += bytesRead;
    if (extensionPoint.reportMetadataCallback) {
      extensionPoint.reportMetadataCallback(ReceivedBytesMetadata{bytesRead});
    }
  }

  if (unknownChannelMessages_ > 0) {
    logger()->warn("skipped {} messages on channels without a Channel record",
                   unknownChannelMessages_);
  }

  std::stable_sort(messages_.begin(), messages_.end(),
                   [](const StoredMessage& left, const StoredMessage& right) {
                     return left.logTime < right.logTime;
                   });

  *result = InitializationResult{};
  if (!messages_.empty()) {
    result->start = internal::FromTimestamp(messages_.front().logTime);
    result->end = internal::FromTimestamp(messages_.back().logTime);
  }
  internal::DescribeChannels(channels_, schemas_, result);

  if (extensionPoint.progressCallback) {
    Progress progress;
    progress.fullyLoadedFractionRanges = std::vector<FractionRange>{{0.0, 1.0}};
    extensionPoint.progressCallback(progress);
  }
  logger()->debug("scanned {} bytes: {} channels, {} messages", size, channels_.size(),
                  messages_.size());
  return StatusCode::Success;
}

void McapStreamProvider::handleRecord(TypedRecord&& record) {
  if (auto* schema = std::get_if<Schema>(&record)) {
    schemas_[schema->id] = std::move(*schema);
  } else if (auto* channel = std::get_if<Channel>(&record)) {
    channels_[channel->id] = std::move(*channel);
  } else if (auto* message = std::get_if<MessageRecord>(&record)) {
    if (channels_.count(message->channelId) == 0) {
      ++unknownChannelMessages_;
      return;
    }
    messages_.push_back(StoredMessage{message->logTime, message->channelId,
                                      std::make_shared<const ByteArray>(std::move(message->data))});
  }
}

Status McapStreamProvider::getMessages(const Time& start, const Time& end,
                                       const GetMessagesTopics& topics,
                                       GetMessagesResult* result) {
  const auto subscribed = internal::SubscribedChannels(channels_, topics);
  const Timestamp startTime = internal::ToTimestamp(start);
  const Timestamp endTime = internal::ToTimestamp(end);

  std::vector<MessageEvent> events;
  auto it = std::lower_bound(messages_.begin(), messages_.end(), startTime,
                             [](const StoredMessage& message, Timestamp time) {
                               return message.logTime < time;
                             });
  for (; it != messages_.end() && it->logTime <= endTime; ++it) {
    if (subscribed.count(it->channelId) == 0) {
      continue;
    }
    events.push_back(MessageEvent{channels_.at(it->channelId).topic,
                                  internal::FromTimestamp(it->logTime), it->data,
                                  it->data->size()});
  }
  result->parsedMessages = std::move(events);
  return StatusCode::Success;
}

Status McapStreamProvider::close() {
  readable_.reset();
  messages_.clear();
  return StatusCode::Success;
}

// McapIndexedProvider /////////////////////////////////////////////////////////

McapIndexedProvider::McapIndexedProvider(std::unique_ptr<IReadable> readable,
                                         McapProviderOptions options)
    : readable_(std::move(readable))
    , options_(options) {}

Status McapIndexedProvider::ReadSummary(IReadable& readable, McapSummary* summary) {
  const uint64_t size = readable.size();
  if (size < sizeof(Magic) + internal::FooterLength) {
    return Status{StatusCode::InvalidFooter,
                  internal::StrCat("recording of ", size, " bytes is too small")};
  }

  std::byte* data = nullptr;
  if (readable.read(&data, 0, sizeof(Magic)) != sizeof(Magic)) {
    return Status{StatusCode::ReadFailed, "failed to read leading magic"};
  }
  if (!internal::IsMagic(data)) {
    return Status{StatusCode::MagicMismatch,
                  internal::StrCat("invalid magic bytes: ", internal::MagicToHex(data))};
  }

  const uint64_t footerOffset = size - internal::FooterLength;
  if (readable.read(&data, footerOffset, internal::FooterLength) != internal::FooterLength) {
    return Status{StatusCode::ReadFailed, "failed to read footer"};
  }
  if (!internal::IsMagic(data + internal::FooterLength - sizeof(Magic))) {
    return Status{StatusCode::MagicMismatch, "invalid trailing magic bytes"};
  }
  Record footerRecord;
  if (!RecordParser::ParseRecordPrefix(data, internal::FooterLength, &footerRecord) ||
      footerRecord.opcode != OpCode::Footer ||
      footerRecord.dataSize != internal::FooterLength - internal::RecordPrefixLength -
                                 sizeof(Magic)) {
    return Status{StatusCode::InvalidFooter, "no Footer record before the trailing magic"};
  }
  if (auto status = RecordParser::ParseFooter(footerRecord, &summary->footer); !status.ok()) {
    return status;
  }

  const Footer& footer = summary->footer;
  if (footer.summaryStart == 0) {
    return Status{StatusCode::MissingSummary, "recording has no summary section"};
  }
  const uint64_t summaryEnd =
    footer.summaryOffsetStart != 0 ? footer.summaryOffsetStart : footerOffset;
  if (footer.summaryStart < sizeof(Magic) || footer.summaryStart > summaryEnd ||
      summaryEnd > footerOffset) {
    return Status{StatusCode::InvalidFooter,
                  internal::StrCat("summary section [", footer.summaryStart, ", ", summaryEnd,
                                   ") is out of bounds")};
  }

  const uint64_t summarySize = summaryEnd - footer.summaryStart;
  if (readable.read(&data, footer.summaryStart, summarySize) != summarySize) {
    return Status{StatusCode::ReadFailed, "failed to read summary section"};
  }
  const ByteArray summaryBytes(data, data + summarySize);

  RecordIterator records{summaryBytes.data(), summaryBytes.size()};
  Record record;
  while (records.next(&record)) {
    Status status;
    switch (record.opcode) {
      case OpCode::Schema: {
        Schema schema;
        status = RecordParser::ParseSchema(record, &schema);
        summary->schemas[schema.id] = std::move(schema);
        break;
      }
      case OpCode::Channel: {
        Channel channel;
        status = RecordParser::ParseChannel(record, &channel);
        summary->channels[channel.id] = std::move(channel);
        break;
      }
      case OpCode::Statistics: {
        Statistics statistics;
        status = RecordParser::ParseStatistics(record, &statistics);
        summary->statistics = std::move(statistics);
        break;
      }
      case OpCode::ChunkIndex: {
        ChunkIndex chunkIndex;
        status = RecordParser::ParseChunkIndex(record, &chunkIndex);
        summary->chunkIndexes.push_back(std::move(chunkIndex));
        break;
      }
      default:
        break;
    }
    if (!status.ok()) {
      return status;
    }
  }
  if (!records.status().ok()) {
    return records.status();
  }

  if (summary->chunkIndexes.empty() &&
      (!summary->statistics || summary->statistics->messageCount > 0)) {
    return Status{StatusCode::MissingSummary, "summary section has no chunk indexes"};
  }
  return StatusCode::Success;
}

Status McapIndexedProvider::initialize(const ExtensionPoint& extensionPoint,
                                       InitializationResult* result) {
  if (auto status = options_.validate(); !status.ok()) {
    return status;
  }
  if (!readable_) {
    return StatusCode::NotOpen;
  }
  extensionPoint_ = extensionPoint;
  summary_ = McapSummary{};
  if (auto status = ReadSummary(*readable_, &summary_); !status.ok()) {
    return status;
  }

  *result = InitializationResult{};
  if (summary_.statistics && summary_.statistics->messageCount > 0) {
    result->start = internal::FromTimestamp(summary_.statistics->messageStartTime);
    result->end = internal::FromTimestamp(summary_.statistics->messageEndTime);
  } else if (!summary_.chunkIndexes.empty()) {
    Timestamp start = MaxTime;
    Timestamp end = 0;
    for (const auto& index : summary_.chunkIndexes) {
      start = std::min(start, index.messageStartTime);
      end = std::max(end, index.messageEndTime);
    }
    result->start = internal::FromTimestamp(start);
    result->end = internal::FromTimestamp(end);
  }
  internal::DescribeChannels(summary_.channels, summary_.schemas, result);

  if (extensionPoint_.progressCallback) {
    extensionPoint_.progressCallback(Progress{std::vector<FractionRange>{}});
  }
  logger()->debug("opened indexed recording: {} channels, {} chunks", summary_.channels.size(),
                  summary_.chunkIndexes.size());
  return StatusCode::Success;
}

Status McapIndexedProvider::loadChunk(const ChunkIndex& index,
                                      std::shared_ptr<const ByteArray>* records) {
  for (const auto& [offset, cached] : chunkCache_) {
    if (offset == index.chunkStartOffset) {
      *records = cached;
      return StatusCode::Success;
    }
  }

  std::byte* data = nullptr;
  if (readable_->read(&data, index.chunkStartOffset, index.chunkLength) != index.chunkLength) {
    return Status{StatusCode::ReadFailed,
                  internal::StrCat("failed to read chunk at offset ", index.chunkStartOffset)};
  }
  Record record;
  if (!RecordParser::ParseRecordPrefix(data, index.chunkLength, &record) ||
      record.opcode != OpCode::Chunk || record.recordSize() != index.chunkLength) {
    return Status{StatusCode::InvalidRecord,
                  internal::StrCat("no Chunk record at offset ", index.chunkStartOffset)};
  }
  Chunk chunk;
  if (auto status = RecordParser::ParseChunk(record, &chunk); !status.ok()) {
    return status;
  }

  auto decompressed = std::make_shared<ByteArray>();
  if (auto status = decompression_.decompress(chunk.compression, chunk.records,
                                              chunk.compressedSize, chunk.uncompressedSize,
                                              decompressed.get());
      !status.ok()) {
    return status;
  }
  if (options_.validateChunkCrc && chunk.uncompressedCrc != 0) {
    const uint32_t crc = internal::crc32(decompressed->data(), decompressed->size());
    if (crc != chunk.uncompressedCrc) {
      return Status{StatusCode::InvalidChunkCrc,
                    internal::StrCat("chunk at offset ", index.chunkStartOffset, " has crc ", crc,
                                     ", expected ", chunk.uncompressedCrc)};
    }
  }
  if (extensionPoint_.reportMetadataCallback) {
    extensionPoint_.reportMetadataCallback(ReceivedBytesMetadata{index.chunkLength});
  }

  chunkCache_.emplace_back(index.chunkStartOffset, decompressed);
  if (chunkCache_.size() > ChunkCacheSize) {
    chunkCache_.pop_front();
  }
  *records = std::move(decompressed);
  return StatusCode::Success;
}

Status McapIndexedProvider::getMessages(const Time& start, const Time& end,
                                        const GetMessagesTopics& topics,
                                        GetMessagesResult* result) {
  if (!readable_) {
    return StatusCode::NotOpen;
  }
  const auto subscribed = internal::SubscribedChannels(summary_.channels, topics);
  const Timestamp startTime = internal::ToTimestamp(start);
  const Timestamp endTime = internal::ToTimestamp(end);

  std::vector<MessageEvent> events;
  for (const auto& index : summary_.chunkIndexes) {
    if (index.messageEndTime < startTime || index.messageStartTime > endTime) {
      continue;
    }
    std::shared_ptr<const ByteArray> records;
    if (auto status = loadChunk(index, &records); !status.ok()) {
      return status;
    }

    RecordIterator iterator{records->data(), records->size()};
    Record record;
    while (iterator.next(&record)) {
      if (record.opcode != OpCode::Message) {
        continue;
      }
      Message message;
      if (auto status = RecordParser::ParseMessage(record, &message); !status.ok()) {
        return status;
      }
      if (message.logTime < startTime || message.logTime > endTime ||
          subscribed.count(message.channelId) == 0) {
        continue;
      }
      auto payload = std::make_shared<const ByteArray>(message.data, message.data + message.dataSize);
      events.push_back(MessageEvent{summary_.channels.at(message.channelId).topic,
                                    internal::FromTimestamp(message.logTime), payload,
                                    message.dataSize});
    }
    if (!iterator.status().ok()) {
      return iterator.status();
    }
  }

  std::stable_sort(events.begin(), events.end(),
                   [](const MessageEvent& left, const MessageEvent& right) {
                     return left.receiveTime < right.receiveTime;
                   });
  result->parsedMessages = std::move(events);
  return StatusCode::Success;
}

Status McapIndexedProvider::close() {
  readable_.reset();
  chunkCache_.clear();
  return StatusCode::Success;
}

Status OpenMcapProvider(std::unique_ptr<IReadable> readable, const McapProviderOptions& options,
                        std::unique_ptr<IDataProvider>* output) {
  if (auto status = options.validate(); !status.ok()) {
    return status;
  }
  if (!readable) {
    return Status{StatusCode::InvalidOptions, "no readable source"};
  }

  switch (options.readMode) {
    case McapProviderOptions::ReadMode::Streamed:
      *output = std::make_unique<McapStreamProvider>(std::move(readable), options);
      return StatusCode::Success;
    case McapProviderOptions::ReadMode::Indexed:
      *output = std::make_unique<McapIndexedProvider>(std::move(readable), options);
      return StatusCode::Success;
    case McapProviderOptions::ReadMode::Auto:
    default:
      break;
  }

  McapSummary summary;
  if (auto status = McapIndexedProvider::ReadSummary(*readable, &summary); !status.ok()) {
    logger()->info("{}; scanning the whole recording", status.message);
    *output = std::make_unique<McapStreamProvider>(std::move(readable), options);
  } else {
    *output = std::make_unique<McapIndexedProvider>(std::move(readable), options);
  }
  return StatusCode::Success;
}

}  // namespace replay
