#include "crc32.hpp"
#include "internal.hpp"
#include "log.hpp"
#include <algorithm>
#include <lz4frame.h>
#include <lz4hc.h>
#include <zstd.h>

namespace replay {

namespace internal {

// Little-endian payload builder, the write-side counterpart of FieldReader.
class FieldWriter {
public:
  FieldWriter& put(uint8_t value) {
    return putLittleEndian(value, 1);
  }
  FieldWriter& put(uint16_t value) {
    return putLittleEndian(value, 2);
  }
  FieldWriter& put(uint32_t value) {
    return putLittleEndian(value, 4);
  }
  FieldWriter& put(uint64_t value) {
    return putLittleEndian(value, 8);
  }
  FieldWriter& put(std::string_view value) {
    put(uint32_t(value.size()));
    return putRaw(reinterpret_cast<const std::byte*>(value.data()), value.size());
  }
  FieldWriter& put(const ByteArray& value) {
    put(uint32_t(value.size()));
    return putRaw(value.data(), value.size());
  }
  FieldWriter& put(const KeyValueMap& map) {
    put(KeyValueMapSize(map));
    for (const auto& [key, value] : map) {
      put(std::string_view(key));
      put(std::string_view(value));
    }
    return *this;
  }
  FieldWriter& putRaw(const std::byte* data, uint64_t size) {
    payload_.insert(payload_.end(), data, data + size);
    return *this;
  }

  const ByteArray& payload() const {
    return payload_;
  }

private:
  ByteArray payload_;

  FieldWriter& putLittleEndian(uint64_t value, int width) {
    for (int i = 0; i < width; ++i) {
      payload_.push_back(std::byte((value >> (8 * i)) & 0xff));
    }
    return *this;
  }
};

int Lz4Level(CompressionLevel level) {
  switch (level) {
    case CompressionLevel::Fastest:
    case CompressionLevel::Fast:
      return 0;
    case CompressionLevel::Default:
      return LZ4HC_CLEVEL_MIN;
    case CompressionLevel::Slow:
      return LZ4HC_CLEVEL_DEFAULT;
    case CompressionLevel::Slowest:
    default:
      return LZ4HC_CLEVEL_MAX;
  }
}

int ZstdLevel(CompressionLevel level) {
  switch (level) {
    case CompressionLevel::Fastest:
      return -5;
    case CompressionLevel::Fast:
      return -3;
    case CompressionLevel::Default:
      return 1;
    case CompressionLevel::Slow:
      return 5;
    case CompressionLevel::Slowest:
    default:
      return 19;
  }
}

Status CompressLz4(const ByteArray& input, CompressionLevel level, ByteArray* output) {
  LZ4F_preferences_t preferences = LZ4F_INIT_PREFERENCES;
  preferences.compressionLevel = Lz4Level(level);
  output->resize(LZ4F_compressFrameBound(input.size(), &preferences));
  const size_t size = LZ4F_compressFrame(output->data(), output->size(), input.data(),
                                         input.size(), &preferences);
  if (LZ4F_isError(size)) {
    output->clear();
    return Status{StatusCode::DecompressionFailed,
                  StrCat("LZ4F_compressFrame failed: ", LZ4F_getErrorName(size))};
  }
  output->resize(size);
  return StatusCode::Success;
}

Status CompressZstd(const ByteArray& input, CompressionLevel level, ByteArray* output) {
  output->resize(ZSTD_compressBound(input.size()));
  const size_t size =
    ZSTD_compress(output->data(), output->size(), input.data(), input.size(), ZstdLevel(level));
  if (ZSTD_isError(size)) {
    output->clear();
    return Status{StatusCode::DecompressionFailed,
                  StrCat("ZSTD_compress failed: ", ZSTD_getErrorName(size))};
  }
  output->resize(size);
  return StatusCode::Success;
}

}  // namespace internal

// BufferWriter ////////////////////////////////////////////////////////////////

void BufferWriter::write(const std::byte* data, uint64_t size) {
  buffer_.insert(buffer_.end(), data, data + size);
}

uint64_t BufferWriter::size() const {
  return buffer_.size();
}

ByteArray BufferWriter::release() {
  ByteArray released;
  released.swap(buffer_);
  return released;
}

// RecordWriter ////////////////////////////////////////////////////////////////

RecordWriter::~RecordWriter() {
  close();
}

void RecordWriter::open(IWritable& output, const RecordWriterOptions& options) {
  close();
  output_ = &output;
  options_ = options;
  schemas_.clear();
  channels_.clear();
  statistics_ = Statistics{};
  chunkIndexes_.clear();
  metadataIndexes_.clear();

  writeMagic(output);
  write(output, Header{options.profile, options.library});
}

void RecordWriter::close() {
  if (!output_) {
    return;
  }
  flushChunk();
  write(*output_, DataEnd{});
  if (options_.noSummary) {
    write(*output_, Footer{});
  } else {
    writeSummary();
  }
  writeMagic(*output_);
  output_->end();
  output_ = nullptr;
}

void RecordWriter::addSchema(Schema& schema) {
  schema.id = SchemaId(schemas_.size() + 1);
  schemas_.push_back(schema);
  ++statistics_.schemaCount;
  if (output_) {
    write(dataSink(), schema);
  }
}

void RecordWriter::addChannel(Channel& channel) {
  channel.id = ChannelId(channels_.size());
  channels_.push_back(channel);
  ++statistics_.channelCount;
  if (output_) {
    write(dataSink(), channel);
  }
}

Status RecordWriter::write(const Message& message) {
  if (!output_) {
    return StatusCode::NotOpen;
  }
  if (message.channelId >= channels_.size()) {
    return Status{StatusCode::InvalidChannelId,
                  internal::StrCat("channel ", message.channelId, " has not been added")};
  }

  if (statistics_.messageCount == 0) {
    statistics_.messageStartTime = message.logTime;
    statistics_.messageEndTime = message.logTime;
  }
  ++statistics_.messageCount;
  ++statistics_.channelMessageCounts[message.channelId];
  statistics_.messageStartTime = std::min(statistics_.messageStartTime, message.logTime);
  statistics_.messageEndTime = std::max(statistics_.messageEndTime, message.logTime);

  if (options_.noChunking) {
    write(*output_, message);
    return StatusCode::Success;
  }

  auto& index = chunkMessageIndexes_[message.channelId];
  index.channelId = message.channelId;
  index.records.emplace_back(message.logTime, chunkBuffer_.size());
  chunkStartTime_ = std::min(chunkStartTime_, message.logTime);
  chunkEndTime_ = std::max(chunkEndTime_, message.logTime);
  write(chunkBuffer_, message);
  if (chunkBuffer_.size() >= options_.chunkSize) {
    flushChunk();
  }
  return StatusCode::Success;
}

Status RecordWriter::write(const Metadata& metadata) {
  if (!output_) {
    return StatusCode::NotOpen;
  }
  MetadataIndex index;
  index.offset = output_->size();
  index.length = write(*output_, metadata);
  index.name = metadata.name;
  metadataIndexes_.push_back(std::move(index));
  ++statistics_.metadataCount;
  return StatusCode::Success;
}

IWritable& RecordWriter::dataSink() {
  if (options_.noChunking) {
    return *output_;
  }
  return chunkBuffer_;
}

void RecordWriter::flushChunk() {
  if (options_.noChunking || chunkBuffer_.size() == 0) {
    return;
  }
  const ByteArray& uncompressed = chunkBuffer_.data();

  ByteArray compressed;
  Compression compression = options_.compression;
  Status status;
  if (compression == Compression::Lz4) {
    status = internal::CompressLz4(uncompressed, options_.compressionLevel, &compressed);
  } else if (compression == Compression::Zstd) {
    status = internal::CompressZstd(uncompressed, options_.compressionLevel, &compressed);
  }
  if (!status.ok()) {
    logger()->error("{}, writing chunk uncompressed", status.message);
    compression = Compression::None;
  }
  if (compression == Compression::None) {
    compressed = uncompressed;
  }

  Chunk chunk;
  const bool hasMessages = chunkStartTime_ != MaxTime;
  chunk.messageStartTime = hasMessages ? chunkStartTime_ : 0;
  chunk.messageEndTime = hasMessages ? chunkEndTime_ : 0;
  chunk.uncompressedSize = uncompressed.size();
  chunk.uncompressedCrc =
    options_.chunkCrc ? internal::crc32(uncompressed.data(), uncompressed.size()) : 0;
  chunk.compression = internal::CompressionString(compression);
  chunk.compressedSize = compressed.size();
  chunk.records = compressed.data();

  ChunkIndex index;
  index.messageStartTime = chunk.messageStartTime;
  index.messageEndTime = chunk.messageEndTime;
  index.chunkStartOffset = output_->size();
  index.chunkLength = write(*output_, chunk);
  const uint64_t messageIndexStart = output_->size();
  if (!options_.noMessageIndex) {
    for (const auto& [channelId, messageIndex] : chunkMessageIndexes_) {
      index.messageIndexOffsets.emplace(channelId, output_->size());
      write(*output_, messageIndex);
    }
  }
  index.messageIndexLength = output_->size() - messageIndexStart;
  index.compression = chunk.compression;
  index.compressedSize = chunk.compressedSize;
  index.uncompressedSize = chunk.uncompressedSize;
  chunkIndexes_.push_back(std::move(index));
  ++statistics_.chunkCount;

  chunkBuffer_.release();
  chunkStartTime_ = MaxTime;
  chunkEndTime_ = 0;
  chunkMessageIndexes_.clear();
}

void RecordWriter::writeSummary() {
  IWritable& output = *output_;
  const uint64_t summaryStart = output.size();
  std::vector<SummaryOffset> offsets;

  auto group = [&](OpCode opcode, auto&& writeGroup) {
    const uint64_t start = output.size();
    writeGroup();
    if (output.size() > start) {
      offsets.push_back(SummaryOffset{opcode, start, output.size() - start});
    }
  };

  group(OpCode::Schema, [&] {
    for (const auto& schema : schemas_) {
      write(output, schema);
    }
  });
  group(OpCode::Channel, [&] {
    for (const auto& channel : channels_) {
      write(output, channel);
    }
  });
  group(OpCode::Statistics, [&] {
    write(output, statistics_);
  });
  group(OpCode::ChunkIndex, [&] {
    for (const auto& index : chunkIndexes_) {
      write(output, index);
    }
  });
  group(OpCode::MetadataIndex, [&] {
    for (const auto& index : metadataIndexes_) {
      write(output, index);
    }
  });

  const uint64_t summaryOffsetStart = output.size();
  for (const auto& offset : offsets) {
    write(output, offset);
  }
  write(output, Footer{summaryStart, summaryOffsetStart, 0});
}

void RecordWriter::writeMagic(IWritable& output) {
  output.write(reinterpret_cast<const std::byte*>(Magic), sizeof(Magic));
}

uint64_t RecordWriter::write(IWritable& output, OpCode opcode, const ByteArray& payload) {
  internal::FieldWriter prefix;
  prefix.put(uint8_t(opcode)).put(uint64_t(payload.size()));
  output.write(prefix.payload().data(), prefix.payload().size());
  output.write(payload.data(), payload.size());
  return internal::RecordPrefixLength + payload.size();
}

uint64_t RecordWriter::write(IWritable& output, const Header& header) {
  internal::FieldWriter fields;
  fields.put(std::string_view(header.profile)).put(std::string_view(header.library));
  return write(output, OpCode::Header, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const Footer& footer) {
  internal::FieldWriter fields;
  fields.put(footer.summaryStart).put(footer.summaryOffsetStart).put(footer.summaryCrc);
  return write(output, OpCode::Footer, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const Schema& schema) {
  internal::FieldWriter fields;
  fields.put(schema.id)
    .put(std::string_view(schema.name))
    .put(std::string_view(schema.encoding))
    .put(schema.data);
  return write(output, OpCode::Schema, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const Channel& channel) {
  internal::FieldWriter fields;
  fields.put(channel.id)
    .put(channel.schemaId)
    .put(std::string_view(channel.topic))
    .put(std::string_view(channel.messageEncoding))
    .put(channel.metadata);
  return write(output, OpCode::Channel, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const Message& message) {
  internal::FieldWriter fields;
  fields.put(message.channelId)
    .put(message.sequence)
    .put(message.logTime)
    .put(message.publishTime)
    .putRaw(message.data, message.dataSize);
  return write(output, OpCode::Message, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const Chunk& chunk) {
  internal::FieldWriter fields;
  fields.put(chunk.messageStartTime)
    .put(chunk.messageEndTime)
    .put(chunk.uncompressedSize)
    .put(chunk.uncompressedCrc)
    .put(std::string_view(chunk.compression))
    .put(chunk.compressedSize)
    .putRaw(chunk.records, chunk.compressedSize);
  return write(output, OpCode::Chunk, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const MessageIndex& index) {
  internal::FieldWriter fields;
  fields.put(index.channelId).put(uint32_t(index.records.size() * 16));
  for (const auto& [timestamp, offset] : index.records) {
    fields.put(timestamp).put(offset);
  }
  return write(output, OpCode::MessageIndex, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const ChunkIndex& index) {
  internal::FieldWriter fields;
  fields.put(index.messageStartTime)
    .put(index.messageEndTime)
    .put(index.chunkStartOffset)
    .put(index.chunkLength)
    .put(uint32_t(index.messageIndexOffsets.size() * 10));
  for (const auto& [channelId, offset] : index.messageIndexOffsets) {
    fields.put(channelId).put(offset);
  }
  fields.put(index.messageIndexLength)
    .put(std::string_view(index.compression))
    .put(index.compressedSize)
    .put(index.uncompressedSize);
  return write(output, OpCode::ChunkIndex, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const Statistics& statistics) {
  internal::FieldWriter fields;
  fields.put(statistics.messageCount)
    .put(statistics.schemaCount)
    .put(statistics.channelCount)
    .put(statistics.attachmentCount)
    .put(statistics.metadataCount)
    .put(statistics.chunkCount)
    .put(statistics.messageStartTime)
    .put(statistics.messageEndTime)
    .put(uint32_t(statistics.channelMessageCounts.size() * 10));
  for (const auto& [channelId, count] : statistics.channelMessageCounts) {
    fields.put(channelId).put(count);
  }
  return write(output, OpCode::Statistics, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const Metadata& metadata) {
  internal::FieldWriter fields;
  fields.put(std::string_view(metadata.name)).put(metadata.metadata);
  return write(output, OpCode::Metadata, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const MetadataIndex& index) {
  internal::FieldWriter fields;
  fields.put(index.offset).put(index.length).put(std::string_view(index.name));
  return write(output, OpCode::MetadataIndex, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const SummaryOffset& summaryOffset) {
  internal::FieldWriter fields;
  fields.put(uint8_t(summaryOffset.groupOpCode))
    .put(summaryOffset.groupStart)
    .put(summaryOffset.groupLength);
  return write(output, OpCode::SummaryOffset, fields.payload());
}

uint64_t RecordWriter::write(IWritable& output, const DataEnd& dataEnd) {
  internal::FieldWriter fields;
  fields.put(dataEnd.dataSectionCrc);
  return write(output, OpCode::DataEnd, fields.payload());
}

}  // namespace replay
