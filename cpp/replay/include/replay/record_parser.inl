#include "internal.hpp"

namespace replay {

namespace internal {

// Reads each field in order, stopping at the first failure.
template <typename... T>
Status ReadFields(FieldReader& reader, T*... fields) {
  Status status;
  (void)((status = reader.read(fields), status.ok()) && ...);
  return status;
}

Status Invalid(std::string_view what, const Status& cause) {
  return Status{StatusCode::InvalidRecord, StrCat("invalid ", what, ": ", cause.message)};
}

template <typename Value>
Status ReadIdMap(FieldReader& reader, std::string_view what,
                 std::unordered_map<uint16_t, Value>* output) {
  uint32_t sizeInBytes = 0;
  if (auto status = reader.read(&sizeInBytes); !status.ok()) {
    return status;
  }
  constexpr uint32_t EntrySize = 2 + sizeof(Value);
  if (sizeInBytes % EntrySize != 0 || sizeInBytes > reader.remaining()) {
    return Status{StatusCode::InvalidRecord,
                  StrCat("invalid ", what, " length: ", sizeInBytes)};
  }
  output->clear();
  output->reserve(sizeInBytes / EntrySize);
  for (uint32_t i = 0; i < sizeInBytes / EntrySize; ++i) {
    uint16_t id = 0;
    Value value = 0;
    if (auto status = ReadFields(reader, &id, &value); !status.ok()) {
      return status;
    }
    output->emplace(id, value);
  }
  return StatusCode::Success;
}

}  // namespace internal

bool RecordParser::ParseRecordPrefix(const std::byte* data, uint64_t available, Record* record) {
  if (available < internal::RecordPrefixLength) {
    return false;
  }
  record->opcode = OpCode(data[0]);
  record->dataSize = internal::ParseUint64(data + 1);
  record->data = data + internal::RecordPrefixLength;
  return true;
}

Status RecordParser::ParseHeader(const Record& record, Header* header) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status = internal::ReadFields(reader, &header->profile, &header->library);
      !status.ok()) {
    return internal::Invalid("Header", status);
  }
  return StatusCode::Success;
}

Status RecordParser::ParseFooter(const Record& record, Footer* footer) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status = internal::ReadFields(reader, &footer->summaryStart,
                                         &footer->summaryOffsetStart, &footer->summaryCrc);
      !status.ok()) {
    return Status{StatusCode::InvalidFooter, internal::StrCat("invalid Footer: ", status.message)};
  }
  return StatusCode::Success;
}

Status RecordParser::ParseSchema(const Record& record, Schema* schema) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status =
        internal::ReadFields(reader, &schema->id, &schema->name, &schema->encoding, &schema->data);
      !status.ok()) {
    return internal::Invalid("Schema", status);
  }
  return StatusCode::Success;
}

Status RecordParser::ParseChannel(const Record& record, Channel* channel) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status = internal::ReadFields(reader, &channel->id, &channel->schemaId, &channel->topic,
                                         &channel->messageEncoding, &channel->metadata);
      !status.ok()) {
    return internal::Invalid("Channel", status);
  }
  return StatusCode::Success;
}

Status RecordParser::ParseMessage(const Record& record, Message* message) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status = internal::ReadFields(reader, &message->channelId, &message->sequence,
                                         &message->logTime, &message->publishTime);
      !status.ok()) {
    return internal::Invalid("Message", status);
  }
  message->dataSize = reader.remaining();
  message->data = reader.position();
  return StatusCode::Success;
}

Status RecordParser::ParseChunk(const Record& record, Chunk* chunk) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status = internal::ReadFields(reader, &chunk->messageStartTime, &chunk->messageEndTime,
                                         &chunk->uncompressedSize, &chunk->uncompressedCrc,
                                         &chunk->compression, &chunk->compressedSize);
      !status.ok()) {
    return internal::Invalid("Chunk", status);
  }
  if (auto status = reader.readBytes(chunk->compressedSize, &chunk->records); !status.ok()) {
    return internal::Invalid("Chunk.records", status);
  }
  return StatusCode::Success;
}

Status RecordParser::ParseMessageIndex(const Record& record, MessageIndex* messageIndex) {
  internal::FieldReader reader{record.data, record.dataSize};
  uint32_t sizeInBytes = 0;
  if (auto status = internal::ReadFields(reader, &messageIndex->channelId, &sizeInBytes);
      !status.ok()) {
    return internal::Invalid("MessageIndex", status);
  }
  if (sizeInBytes % 16 != 0 || sizeInBytes > reader.remaining()) {
    return Status{StatusCode::InvalidRecord,
                  internal::StrCat("invalid MessageIndex.records length: ", sizeInBytes)};
  }
  messageIndex->records.clear();
  messageIndex->records.reserve(sizeInBytes / 16);
  for (uint32_t i = 0; i < sizeInBytes / 16; ++i) {
    Timestamp timestamp = 0;
    ByteOffset offset = 0;
    if (auto status = internal::ReadFields(reader, &timestamp, &offset); !status.ok()) {
      return internal::Invalid("MessageIndex", status);
    }
    messageIndex->records.emplace_back(timestamp, offset);
  }
  return StatusCode::Success;
}

Status RecordParser::ParseChunkIndex(const Record& record, ChunkIndex* chunkIndex) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status =
        internal::ReadFields(reader, &chunkIndex->messageStartTime, &chunkIndex->messageEndTime,
                             &chunkIndex->chunkStartOffset, &chunkIndex->chunkLength);
      !status.ok()) {
    return internal::Invalid("ChunkIndex", status);
  }
  if (auto status = internal::ReadIdMap(reader, "ChunkIndex.message_index_offsets",
                                        &chunkIndex->messageIndexOffsets);
      !status.ok()) {
    return status;
  }
  if (auto status =
        internal::ReadFields(reader, &chunkIndex->messageIndexLength, &chunkIndex->compression,
                             &chunkIndex->compressedSize, &chunkIndex->uncompressedSize);
      !status.ok()) {
    return internal::Invalid("ChunkIndex", status);
  }
  return StatusCode::Success;
}

Status RecordParser::ParseAttachment(const Record& record, Attachment* attachment) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status = internal::ReadFields(reader, &attachment->logTime, &attachment->createTime,
                                         &attachment->name, &attachment->mediaType,
                                         &attachment->dataSize);
      !status.ok()) {
    return internal::Invalid("Attachment", status);
  }
  if (auto status = reader.readBytes(attachment->dataSize, &attachment->data); !status.ok()) {
    return internal::Invalid("Attachment.data", status);
  }
  if (auto status = reader.read(&attachment->crc); !status.ok()) {
    return internal::Invalid("Attachment.crc", status);
  }
  return StatusCode::Success;
}

Status RecordParser::ParseAttachmentIndex(const Record& record, AttachmentIndex* attachmentIndex) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status = internal::ReadFields(
        reader, &attachmentIndex->offset, &attachmentIndex->length, &attachmentIndex->logTime,
        &attachmentIndex->createTime, &attachmentIndex->dataSize, &attachmentIndex->name,
        &attachmentIndex->mediaType);
      !status.ok()) {
    return internal::Invalid("AttachmentIndex", status);
  }
  return StatusCode::Success;
}

Status RecordParser::ParseStatistics(const Record& record, Statistics* statistics) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status = internal::ReadFields(
        reader, &statistics->messageCount, &statistics->schemaCount, &statistics->channelCount,
        &statistics->attachmentCount, &statistics->metadataCount, &statistics->chunkCount,
        &statistics->messageStartTime, &statistics->messageEndTime);
      !status.ok()) {
    return internal::Invalid("Statistics", status);
  }
  return internal::ReadIdMap(reader, "Statistics.channel_message_counts",
                             &statistics->channelMessageCounts);
}

Status RecordParser::ParseMetadata(const Record& record, Metadata* metadata) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status = internal::ReadFields(reader, &metadata->name, &metadata->metadata);
      !status.ok()) {
    return internal::Invalid("Metadata", status);
  }
  return StatusCode::Success;
}

Status RecordParser::ParseMetadataIndex(const Record& record, MetadataIndex* metadataIndex) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status = internal::ReadFields(reader, &metadataIndex->offset, &metadataIndex->length,
                                         &metadataIndex->name);
      !status.ok()) {
    return internal::Invalid("MetadataIndex", status);
  }
  return StatusCode::Success;
}

Status RecordParser::ParseSummaryOffset(const Record& record, SummaryOffset* summaryOffset) {
  internal::FieldReader reader{record.data, record.dataSize};
  uint8_t opcode = 0;
  if (auto status = internal::ReadFields(reader, &opcode, &summaryOffset->groupStart,
                                         &summaryOffset->groupLength);
      !status.ok()) {
    return internal::Invalid("SummaryOffset", status);
  }
  summaryOffset->groupOpCode = OpCode(opcode);
  return StatusCode::Success;
}

Status RecordParser::ParseDataEnd(const Record& record, DataEnd* dataEnd) {
  internal::FieldReader reader{record.data, record.dataSize};
  if (auto status = reader.read(&dataEnd->dataSectionCrc); !status.ok()) {
    return internal::Invalid("DataEnd", status);
  }
  return StatusCode::Success;
}

namespace internal {

template <typename T>
Status ParseInto(Status (*parse)(const Record&, T*), const Record& record, TypedRecord* output) {
  T parsed;
  auto status = parse(record, &parsed);
  if (status.ok()) {
    *output = std::move(parsed);
  }
  return status;
}

template <typename View, typename Owned>
Status ParseOwned(Status (*parse)(const Record&, View*), const Record& record,
                  TypedRecord* output) {
  View view;
  auto status = parse(record, &view);
  if (status.ok()) {
    *output = Owned{view};
  }
  return status;
}

}  // namespace internal

Status RecordParser::ParseTypedRecord(const Record& record, TypedRecord* output) {
  switch (record.opcode) {
    case OpCode::Header:
      return internal::ParseInto(&ParseHeader, record, output);
    case OpCode::Schema:
      return internal::ParseInto(&ParseSchema, record, output);
    case OpCode::Channel:
      return internal::ParseInto(&ParseChannel, record, output);
    case OpCode::Message:
      return internal::ParseOwned<Message, MessageRecord>(&ParseMessage, record, output);
    case OpCode::Chunk:
      return internal::ParseOwned<Chunk, ChunkRecord>(&ParseChunk, record, output);
    case OpCode::MessageIndex:
      return internal::ParseInto(&ParseMessageIndex, record, output);
    case OpCode::ChunkIndex:
      return internal::ParseInto(&ParseChunkIndex, record, output);
    case OpCode::Attachment:
      return internal::ParseOwned<Attachment, AttachmentRecord>(&ParseAttachment, record, output);
    case OpCode::AttachmentIndex:
      return internal::ParseInto(&ParseAttachmentIndex, record, output);
    case OpCode::Statistics:
      return internal::ParseInto(&ParseStatistics, record, output);
    case OpCode::Metadata:
      return internal::ParseInto(&ParseMetadata, record, output);
    case OpCode::MetadataIndex:
      return internal::ParseInto(&ParseMetadataIndex, record, output);
    case OpCode::SummaryOffset:
      return internal::ParseInto(&ParseSummaryOffset, record, output);
    case OpCode::DataEnd:
      return internal::ParseInto(&ParseDataEnd, record, output);
    case OpCode::Footer:
      return Status{StatusCode::InvalidOpCode, "Footer is not a typed record"};
    default:
      break;
  }
  UnknownRecord unknown;
  unknown.opcode = uint8_t(record.opcode);
  unknown.data.assign(record.data, record.data + record.dataSize);
  *output = std::move(unknown);
  return StatusCode::Success;
}

bool RecordIterator::next(Record* record) {
  if (!status_.ok() || offset_ == size_) {
    return false;
  }
  const uint64_t available = size_ - offset_;
  Record parsed;
  if (!RecordParser::ParseRecordPrefix(data_ + offset_, available, &parsed) ||
      parsed.dataSize > available - internal::RecordPrefixLength) {
    status_ = Status{StatusCode::InvalidRecord,
                     internal::StrCat(available, " bytes at offset ", offset_,
                                      " do not form a complete record")};
    return false;
  }
  offset_ += parsed.recordSize();
  *record = parsed;
  return true;
}

}  // namespace replay
