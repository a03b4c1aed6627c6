#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace replay {

/**
 * @brief Configuration for RecordWriter.
 */
struct REPLAY_PUBLIC RecordWriterOptions {
  /**
   * @brief Profile string written to the Header record.
   */
  std::string profile;
  /**
   * @brief Library string written to the Header record.
   */
  std::string library = "replay " REPLAY_LIBRARY_VERSION;
  /**
   * @brief Write Schema, Channel and Message records straight into the data section
   * instead of grouping them into Chunks. Disables chunk indexes.
   */
  bool noChunking = false;
  /**
   * @brief Uncompressed size a chunk must reach before it is compressed and written.
   */
  uint64_t chunkSize = DefaultChunkSize;
  Compression compression = Compression::Zstd;
  CompressionLevel compressionLevel = CompressionLevel::Default;
  /**
   * @brief Store a CRC32 of each chunk's uncompressed records.
   */
  bool chunkCrc = true;
  /**
   * @brief Skip the MessageIndex records written after each Chunk.
   */
  bool noMessageIndex = false;
  /**
   * @brief Skip the Summary section. The Footer then has a zero summary start.
   */
  bool noSummary = false;

  RecordWriterOptions() = default;
  explicit RecordWriterOptions(std::string_view profile)
      : profile(profile) {}
};

/**
 * @brief Destination for encoded container bytes.
 */
class REPLAY_PUBLIC IWritable {
public:
  virtual ~IWritable() = default;

  virtual void write(const std::byte* data, uint64_t size) = 0;
  /**
   * @brief Called once after the trailing magic has been written.
   */
  virtual void end() = 0;
  /**
   * @brief Number of bytes written so far.
   */
  virtual uint64_t size() const = 0;
};

/**
 * @brief IWritable that collects everything in memory.
 */
class REPLAY_PUBLIC BufferWriter final : public IWritable {
public:
  void write(const std::byte* data, uint64_t size) override;
  void end() override {}
  uint64_t size() const override;

  const ByteArray& data() const {
    return buffer_;
  }

  ByteArray release();

private:
  ByteArray buffer_;
};

/**
 * @brief Encoder for the container format. Messages are grouped into compressed
 * chunks followed by their message indexes, and close() writes the Summary section
 * (schemas, channels, statistics, chunk and metadata indexes), the Footer and the
 * trailing magic.
 */
class REPLAY_PUBLIC RecordWriter final {
public:
  RecordWriter() = default;
  ~RecordWriter();

  RecordWriter(const RecordWriter&) = delete;
  RecordWriter& operator=(const RecordWriter&) = delete;

  /**
   * @brief Writes the leading magic and Header to `output`, which must outlive the
   * writer or the next call to close().
   */
  void open(IWritable& output, const RecordWriterOptions& options);

  /**
   * @brief Flushes the last chunk and finishes the file. Safe to call more than once.
   */
  void close();

  /**
   * @brief Assigns `schema.id` and records the schema. Ids start at 1.
   */
  void addSchema(Schema& schema);

  /**
   * @brief Assigns `channel.id` and records the channel. Ids start at 0.
   */
  void addChannel(Channel& channel);

  /**
   * @brief Writes a message on a channel previously passed to addChannel().
   */
  Status write(const Message& message);

  Status write(const Metadata& metadata);

  const Statistics& statistics() const {
    return statistics_;
  }

  // Record serializers. Each returns the number of bytes written.
  static void writeMagic(IWritable& output);
  static uint64_t write(IWritable& output, const Header& header);
  static uint64_t write(IWritable& output, const Footer& footer);
  static uint64_t write(IWritable& output, const Schema& schema);
  static uint64_t write(IWritable& output, const Channel& channel);
  static uint64_t write(IWritable& output, const Message& message);
  static uint64_t write(IWritable& output, const Chunk& chunk);
  static uint64_t write(IWritable& output, const MessageIndex& index);
  static uint64_t write(IWritable& output, const ChunkIndex& index);
  static uint64_t write(IWritable& output, const Statistics& statistics);
  static uint64_t write(IWritable& output, const Metadata& metadata);
  static uint64_t write(IWritable& output, const MetadataIndex& index);
  static uint64_t write(IWritable& output, const SummaryOffset& summaryOffset);
  static uint64_t write(IWritable& output, const DataEnd& dataEnd);
  /**
   * @brief Writes an arbitrary opcode and payload.
   */
  static uint64_t write(IWritable& output, OpCode opcode, const ByteArray& payload);

private:
  IWritable* output_ = nullptr;
  RecordWriterOptions options_;
  std::vector<Schema> schemas_;
  std::vector<Channel> channels_;
  Statistics statistics_;
  std::vector<ChunkIndex> chunkIndexes_;
  std::vector<MetadataIndex> metadataIndexes_;

  BufferWriter chunkBuffer_;
  Timestamp chunkStartTime_ = MaxTime;
  Timestamp chunkEndTime_ = 0;
  std::map<ChannelId, MessageIndex> chunkMessageIndexes_;

  IWritable& dataSink();
  void flushChunk();
  void writeSummary();
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "writer.inl"
#endif
