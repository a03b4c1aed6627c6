#include <replay/replay.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

using replay::ByteOffset;

template <typename... T>
[[nodiscard]] inline std::string StrFormat(std::string_view msg, T&&... args) {
  return fmt::format(fmt::runtime(msg), std::forward<T>(args)...);
}

std::string ToString(const replay::KeyValueMap& map) {
  std::stringstream ss;
  ss << "{";
  bool first = true;
  for (const auto& [key, value] : map) {
    ss << (first ? "" : ", ") << "\"" << key << "\": \"" << value << "\"";
    first = false;
  }
  ss << "}";
  return ss.str();
}

std::string ToString(const std::unordered_map<uint16_t, uint64_t>& map) {
  if (map.size() > 8) {
    return StrFormat("<{} entries>", map.size());
  }
  std::stringstream ss;
  ss << "{";
  bool first = true;
  for (const auto& [key, value] : map) {
    ss << (first ? "" : ", ") << key << ": " << value;
    first = false;
  }
  ss << "}";
  return ss.str();
}

std::string ToString(const replay::Header& header) {
  return StrFormat("[Header] profile={}, library={}", header.profile, header.library);
}

std::string ToString(const replay::Footer& footer) {
  return StrFormat("[Footer] summary_start={}, summary_offset_start={}, summary_crc={}",
                   footer.summaryStart, footer.summaryOffsetStart, footer.summaryCrc);
}

std::string ToString(const replay::Schema& schema) {
  return StrFormat("[Schema] id={}, name={}, encoding={}, data=<{} bytes>", schema.id, schema.name,
                   schema.encoding, schema.data.size());
}

std::string ToString(const replay::Channel& channel) {
  return StrFormat("[Channel] id={}, schema_id={}, topic={}, message_encoding={}, metadata={}",
                   channel.id, channel.schemaId, channel.topic, channel.messageEncoding,
                   ToString(channel.metadata));
}

std::string ToString(const replay::MessageRecord& message) {
  return StrFormat(
    "[Message] channel_id={}, sequence={}, publish_time={}, log_time={}, data=<{} bytes>",
    message.channelId, message.sequence, message.publishTime, message.logTime,
    message.data.size());
}

std::string ToString(const replay::ChunkRecord& chunk) {
  return StrFormat(
    "[Chunk] message_start_time={}, message_end_time={}, uncompressed_size={}, "
    "uncompressed_crc={}, compression={}, data=<{} bytes>",
    chunk.messageStartTime, chunk.messageEndTime, chunk.uncompressedSize, chunk.uncompressedCrc,
    chunk.compression.empty() ? "none" : chunk.compression, chunk.records.size());
}

std::string ToString(const replay::MessageIndex& messageIndex) {
  return StrFormat("[MessageIndex] channel_id={}, records=<{} entries>", messageIndex.channelId,
                   messageIndex.records.size());
}

std::string ToString(const replay::ChunkIndex& chunkIndex) {
  return StrFormat(
    "[ChunkIndex] message_start_time={}, message_end_time={}, chunk_start_offset={}, "
    "chunk_length={}, message_index_length={}, compression={}, compressed_size={}, "
    "uncompressed_size={}",
    chunkIndex.messageStartTime, chunkIndex.messageEndTime, chunkIndex.chunkStartOffset,
    chunkIndex.chunkLength, chunkIndex.messageIndexLength, chunkIndex.compression,
    chunkIndex.compressedSize, chunkIndex.uncompressedSize);
}

std::string ToString(const replay::AttachmentRecord& attachment) {
  return StrFormat(
    "[Attachment] log_time={}, create_time={}, name={}, media_type={}, data=<{} bytes>, crc={}",
    attachment.logTime, attachment.createTime, attachment.name, attachment.mediaType,
    attachment.data.size(), attachment.crc);
}

std::string ToString(const replay::AttachmentIndex& attachmentIndex) {
  return StrFormat("[AttachmentIndex] offset={}, length={}, log_time={}, name={}, media_type={}",
                   attachmentIndex.offset, attachmentIndex.length, attachmentIndex.logTime,
                   attachmentIndex.name, attachmentIndex.mediaType);
}

std::string ToString(const replay::Statistics& statistics) {
  return StrFormat(
    "[Statistics] message_count={}, schema_count={}, channel_count={}, attachment_count={}, "
    "metadata_count={}, chunk_count={}, message_start_time={}, message_end_time={}, "
    "channel_message_counts={}",
    statistics.messageCount, statistics.schemaCount, statistics.channelCount,
    statistics.attachmentCount, statistics.metadataCount, statistics.chunkCount,
    statistics.messageStartTime, statistics.messageEndTime,
    ToString(statistics.channelMessageCounts));
}

std::string ToString(const replay::Metadata& metadata) {
  return StrFormat("[Metadata] name={}, metadata={}", metadata.name, ToString(metadata.metadata));
}

std::string ToString(const replay::MetadataIndex& metadataIndex) {
  return StrFormat("[MetadataIndex] offset={}, length={}, name={}", metadataIndex.offset,
                   metadataIndex.length, metadataIndex.name);
}

std::string ToString(const replay::SummaryOffset& summaryOffset) {
  return StrFormat("[SummaryOffset] group_opcode={} (0x{:02x}), group_start={}, group_length={}",
                   replay::OpCodeString(summaryOffset.groupOpCode),
                   uint8_t(summaryOffset.groupOpCode), summaryOffset.groupStart,
                   summaryOffset.groupLength);
}

std::string ToString(const replay::DataEnd& dataEnd) {
  return StrFormat("[DataEnd] data_section_crc={}", dataEnd.dataSectionCrc);
}

std::string ToString(const replay::UnknownRecord& record) {
  return StrFormat("[Unknown] opcode=0x{:02x}, data=<{} bytes>", record.opcode,
                   record.data.size());
}

// Feeds the file to the decoder `fragmentSize` bytes at a time, the way bytes would
// arrive from a socket, and prints every record as soon as it is decoded.
int DumpRecords(replay::IReadable& dataSource, uint64_t fragmentSize) {
  replay::StreamReaderOptions options;
  options.includeChunks = true;
  options.validateChunkCrc = true;
  replay::StreamReader reader{std::move(options)};

  const uint64_t size = dataSource.size();
  uint64_t offset = 0;
  bool inChunk = false;
  for (;;) {
    const auto result = reader.next();
    if (result.kind == replay::ReadResult::Kind::Record) {
      const auto& record = *result.record;
      const bool isChunk = std::holds_alternative<replay::ChunkRecord>(record);
      const bool nested = std::holds_alternative<replay::Schema>(record) ||
                          std::holds_alternative<replay::Channel>(record) ||
                          std::holds_alternative<replay::MessageRecord>(record);
      inChunk = isChunk || (inChunk && nested);
      std::visit(
        [&](const auto& typed) {
          std::cout << (inChunk && !isChunk ? "  " : "") << ToString(typed) << "\n";
        },
        record);
      continue;
    }
    if (result.kind == replay::ReadResult::Kind::Done) {
      std::cout << ToString(*reader.footer()) << "\n";
      return 0;
    }
    if (result.kind == replay::ReadResult::Kind::Failed) {
      std::cerr << "! " << reader.status().message << " (after " << reader.bytesConsumed()
                << " bytes)\n";
      return 1;
    }
    if (offset >= size) {
      std::cerr << "! file ends after " << size << " bytes without a footer\n";
      return 1;
    }
    std::byte* data = nullptr;
    const uint64_t bytesRead = dataSource.read(&data, offset, std::min(fragmentSize, size - offset));
    if (bytesRead == 0) {
      std::cerr << "! read failed at offset " << offset << "\n";
      return 1;
    }
    if (auto status = reader.append(data, size_t(bytesRead)); !status.ok()) {
      std::cerr << "! " << status.message << "\n";
      return 1;
    }
    offset += bytesRead;
  }
}

int DumpMessages(std::unique_ptr<replay::IReadable> dataSource) {
  std::unique_ptr<replay::IDataProvider> provider;
  auto status = replay::OpenMcapProvider(std::move(dataSource), {}, &provider);
  if (!status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  replay::InitializationResult info;
  status = provider->initialize({}, &info);
  if (!status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }
  std::cout << StrFormat("[{}, {}], {} topics\n", replay::toString(info.start),
                         replay::toString(info.end), info.topics.size());

  replay::GetMessagesTopics topics;
  for (const auto& topic : info.topics) {
    std::cout << StrFormat("  {} ({})\n", topic.name,
                           topic.datatype.empty() ? "no schema" : topic.datatype);
    topics.parsedMessages.push_back(topic.name);
  }

  replay::GetMessagesResult result;
  status = provider->getMessages(info.start, info.end, topics, &result);
  if (!status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }
  for (const auto& message : *result.parsedMessages) {
    std::cout << StrFormat("[{}] {} <{} bytes>\n", message.topic,
                           replay::toString(message.receiveTime), message.sizeInBytes);
  }
  return provider->close().ok() ? 0 : 1;
}

int main(int argc, char* argv[]) {
  if (argc < 2 || argc > 3) {
    std::cerr << "Usage: " << argv[0] << " <input.mcap> [fragment-size|messages]\n";
    return 1;
  }

  std::unique_ptr<replay::FileReader> dataSource;
  if (auto status = replay::FileReader::Open(argv[1], &dataSource); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  const std::string mode = argc == 3 ? argv[2] : "";
  if (mode == "messages") {
    return DumpMessages(std::move(dataSource));
  }
  uint64_t fragmentSize = 4096;
  if (!mode.empty()) {
    fragmentSize = std::strtoull(mode.c_str(), nullptr, 10);
    if (fragmentSize == 0) {
      std::cerr << "! invalid fragment size: " << mode << "\n";
      return 1;
    }
  }
  return DumpRecords(*dataSource, fragmentSize);
}
