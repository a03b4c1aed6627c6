#pragma once

#include "errors.hpp"
#include "visibility.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace replay {

#define REPLAY_LIBRARY_VERSION "0.4.0"

using SchemaId = uint16_t;
using ChannelId = uint16_t;
using Timestamp = uint64_t;
using ByteOffset = uint64_t;
using KeyValueMap = std::unordered_map<std::string, std::string>;
using ByteArray = std::vector<std::byte>;

constexpr char LibraryVersion[] = REPLAY_LIBRARY_VERSION;
constexpr uint8_t Magic[] = {137, 77, 67, 65, 80, '0', 13, 10};  // "\x89MCAP0\r\n"
constexpr uint64_t DefaultChunkSize = 1024 * 768;
constexpr Timestamp MaxTime = std::numeric_limits<Timestamp>::max();

/**
 * @brief Chunk compression algorithms the writer can produce. The decoder is not
 * limited to these: it looks compression names up in a DecompressionRegistry.
 */
enum struct Compression {
  None,
  Lz4,
  Zstd,
};

enum struct CompressionLevel {
  Fastest,
  Fast,
  Default,
  Slow,
  Slowest,
};

/**
 * @brief Container record types.
 */
enum struct OpCode : uint8_t {
  Header = 0x01,
  Footer = 0x02,
  Schema = 0x03,
  Channel = 0x04,
  Message = 0x05,
  Chunk = 0x06,
  MessageIndex = 0x07,
  ChunkIndex = 0x08,
  Attachment = 0x09,
  AttachmentIndex = 0x0A,
  Statistics = 0x0B,
  Metadata = 0x0C,
  MetadataIndex = 0x0D,
  SummaryOffset = 0x0E,
  DataEnd = 0x0F,
};

constexpr std::string_view OpCodeString(OpCode opcode) {
  switch (opcode) {
    case OpCode::Header:
      return "Header";
    case OpCode::Footer:
      return "Footer";
    case OpCode::Schema:
      return "Schema";
    case OpCode::Channel:
      return "Channel";
    case OpCode::Message:
      return "Message";
    case OpCode::Chunk:
      return "Chunk";
    case OpCode::MessageIndex:
      return "MessageIndex";
    case OpCode::ChunkIndex:
      return "ChunkIndex";
    case OpCode::Attachment:
      return "Attachment";
    case OpCode::AttachmentIndex:
      return "AttachmentIndex";
    case OpCode::Statistics:
      return "Statistics";
    case OpCode::Metadata:
      return "Metadata";
    case OpCode::MetadataIndex:
      return "MetadataIndex";
    case OpCode::SummaryOffset:
      return "SummaryOffset";
    case OpCode::DataEnd:
      return "DataEnd";
    default:
      return "Unknown";
  }
}

/**
 * @brief A type-length-value view over a record in some buffer. `data` points at
 * the payload, which is `dataSize` bytes long and is not owned.
 */
struct REPLAY_PUBLIC Record {
  OpCode opcode;
  uint64_t dataSize;
  const std::byte* data;

  uint64_t recordSize() const {
    return sizeof(opcode) + sizeof(dataSize) + dataSize;
  }
};

/**
 * @brief First record after the leading magic: the recording profile and the name
 * of the library that wrote the file.
 */
struct REPLAY_PUBLIC Header {
  std::string profile;
  std::string library;
};

/**
 * @brief Last record before the trailing magic. A zero `summaryStart` means the
 * file has no Summary section.
 */
struct REPLAY_PUBLIC Footer {
  ByteOffset summaryStart = 0;
  ByteOffset summaryOffsetStart = 0;
  uint32_t summaryCrc = 0;
};

struct REPLAY_PUBLIC Schema {
  SchemaId id = 0;
  std::string name;
  std::string encoding;
  ByteArray data;

  Schema() = default;

  Schema(std::string_view name, std::string_view encoding, std::string_view data)
      : name(name)
      , encoding(encoding)
      , data{reinterpret_cast<const std::byte*>(data.data()),
             reinterpret_cast<const std::byte*>(data.data() + data.size())} {}
};

/**
 * @brief A connection from a publisher to a topic. `schemaId` 0 means the channel
 * has no schema.
 */
struct REPLAY_PUBLIC Channel {
  ChannelId id = 0;
  std::string topic;
  std::string messageEncoding;
  SchemaId schemaId = 0;
  KeyValueMap metadata;

  Channel() = default;

  Channel(std::string_view topic, std::string_view messageEncoding, SchemaId schemaId,
          const KeyValueMap& metadata = {})
      : topic(topic)
      , messageEncoding(messageEncoding)
      , schemaId(schemaId)
      , metadata(metadata) {}
};

using SchemaPtr = std::shared_ptr<Schema>;
using ChannelPtr = std::shared_ptr<Channel>;

/**
 * @brief A message as it appears in a buffer. `data` is borrowed and only valid
 * while the buffer it was parsed from is alive and unmodified.
 */
struct REPLAY_PUBLIC Message {
  ChannelId channelId = 0;
  uint32_t sequence = 0;
  /**
   * @brief Nanosecond timestamp when this message was recorded.
   */
  Timestamp logTime = 0;
  Timestamp publishTime = 0;
  uint64_t dataSize = 0;
  const std::byte* data = nullptr;
};

/**
 * @brief A compressed group of Schema, Channel and Message records. `records`
 * is borrowed like `Message::data`.
 */
struct REPLAY_PUBLIC Chunk {
  Timestamp messageStartTime = 0;
  Timestamp messageEndTime = 0;
  uint64_t uncompressedSize = 0;
  uint32_t uncompressedCrc = 0;
  std::string compression;
  uint64_t compressedSize = 0;
  const std::byte* records = nullptr;
};

struct REPLAY_PUBLIC MessageIndex {
  ChannelId channelId = 0;
  std::vector<std::pair<Timestamp, ByteOffset>> records;
};

/**
 * @brief Summary-section pointer to one Chunk. This is the only index the
 * indexed provider relies on.
 */
struct REPLAY_PUBLIC ChunkIndex {
  Timestamp messageStartTime = 0;
  Timestamp messageEndTime = 0;
  ByteOffset chunkStartOffset = 0;
  ByteOffset chunkLength = 0;
  std::unordered_map<ChannelId, ByteOffset> messageIndexOffsets;
  ByteOffset messageIndexLength = 0;
  std::string compression;
  uint64_t compressedSize = 0;
  uint64_t uncompressedSize = 0;
};

struct REPLAY_PUBLIC Attachment {
  Timestamp logTime = 0;
  Timestamp createTime = 0;
  std::string name;
  std::string mediaType;
  uint64_t dataSize = 0;
  const std::byte* data = nullptr;
  uint32_t crc = 0;
};

struct REPLAY_PUBLIC AttachmentIndex {
  ByteOffset offset = 0;
  ByteOffset length = 0;
  Timestamp logTime = 0;
  Timestamp createTime = 0;
  uint64_t dataSize = 0;
  std::string name;
  std::string mediaType;
};

struct REPLAY_PUBLIC Statistics {
  uint64_t messageCount = 0;
  uint16_t schemaCount = 0;
  uint32_t channelCount = 0;
  uint32_t attachmentCount = 0;
  uint32_t metadataCount = 0;
  uint32_t chunkCount = 0;
  Timestamp messageStartTime = 0;
  Timestamp messageEndTime = 0;
  std::unordered_map<ChannelId, uint64_t> channelMessageCounts;
};

struct REPLAY_PUBLIC Metadata {
  std::string name;
  KeyValueMap metadata;
};

struct REPLAY_PUBLIC MetadataIndex {
  ByteOffset offset = 0;
  ByteOffset length = 0;
  std::string name;
};

struct REPLAY_PUBLIC SummaryOffset {
  OpCode groupOpCode = OpCode::Header;
  ByteOffset groupStart = 0;
  ByteOffset groupLength = 0;
};

struct REPLAY_PUBLIC DataEnd {
  uint32_t dataSectionCrc = 0;
};

// Owning record forms. These are what StreamReader hands out: the decoder keeps no
// reference to a record once it has been returned.

struct REPLAY_PUBLIC MessageRecord {
  ChannelId channelId = 0;
  uint32_t sequence = 0;
  Timestamp logTime = 0;
  Timestamp publishTime = 0;
  ByteArray data;

  MessageRecord() = default;
  explicit MessageRecord(const Message& message);

  /**
   * @brief Returns a borrowed view of this record, valid while it is alive.
   */
  Message view() const;
};

struct REPLAY_PUBLIC ChunkRecord {
  Timestamp messageStartTime = 0;
  Timestamp messageEndTime = 0;
  uint64_t uncompressedSize = 0;
  uint32_t uncompressedCrc = 0;
  std::string compression;
  ByteArray records;

  ChunkRecord() = default;
  explicit ChunkRecord(const Chunk& chunk);
};

struct REPLAY_PUBLIC AttachmentRecord {
  Timestamp logTime = 0;
  Timestamp createTime = 0;
  std::string name;
  std::string mediaType;
  ByteArray data;
  uint32_t crc = 0;

  AttachmentRecord() = default;
  explicit AttachmentRecord(const Attachment& attachment);
};

/**
 * @brief A record with an opcode this library does not understand. These are
 * passed through rather than rejected so newer files stay readable.
 */
struct REPLAY_PUBLIC UnknownRecord {
  uint8_t opcode = 0;
  ByteArray data;
};

using TypedRecord =
  std::variant<Header, Schema, Channel, MessageRecord, ChunkRecord, MessageIndex, ChunkIndex,
               AttachmentRecord, AttachmentIndex, Statistics, Metadata, MetadataIndex,
               SummaryOffset, DataEnd, UnknownRecord>;

/**
 * @brief Returns the record kind held by `record`. UnknownRecord maps to its raw
 * opcode value.
 */
REPLAY_PUBLIC
OpCode RecordOpCode(const TypedRecord& record);

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "types.inl"
#endif
