#pragma once

#include "types.hpp"

namespace replay {

/**
 * @brief Parsers for individual container records. Each Parse function reads the
 * payload of a Record whose opcode matches and fills in the output struct. View
 * structs (Message, Chunk, Attachment) borrow from `record.data`.
 */
struct REPLAY_PUBLIC RecordParser {
  /**
   * @brief Reads the opcode and length prefix at `data`. Returns false, leaving
   * `record` untouched, when `available` is too short for the prefix. The payload
   * length is not checked against `available`; callers compare `recordSize()` with
   * what they hold.
   */
  static bool ParseRecordPrefix(const std::byte* data, uint64_t available, Record* record);

  static Status ParseHeader(const Record& record, Header* header);
  static Status ParseFooter(const Record& record, Footer* footer);
  static Status ParseSchema(const Record& record, Schema* schema);
  static Status ParseChannel(const Record& record, Channel* channel);
  static Status ParseMessage(const Record& record, Message* message);
  static Status ParseChunk(const Record& record, Chunk* chunk);
  static Status ParseMessageIndex(const Record& record, MessageIndex* messageIndex);
  static Status ParseChunkIndex(const Record& record, ChunkIndex* chunkIndex);
  static Status ParseAttachment(const Record& record, Attachment* attachment);
  static Status ParseAttachmentIndex(const Record& record, AttachmentIndex* attachmentIndex);
  static Status ParseStatistics(const Record& record, Statistics* statistics);
  static Status ParseMetadata(const Record& record, Metadata* metadata);
  static Status ParseMetadataIndex(const Record& record, MetadataIndex* metadataIndex);
  static Status ParseSummaryOffset(const Record& record, SummaryOffset* summaryOffset);
  static Status ParseDataEnd(const Record& record, DataEnd* dataEnd);

  /**
   * @brief Parses any record except a Footer into an owning TypedRecord. Unknown
   * opcodes become UnknownRecord.
   */
  static Status ParseTypedRecord(const Record& record, TypedRecord* output);
};

/**
 * @brief Walks the records laid out back to back in a fully available buffer, such
 * as a decompressed chunk or a summary section.
 */
class REPLAY_PUBLIC RecordIterator {
public:
  RecordIterator(const std::byte* data, uint64_t size)
      : data_(data)
      , size_(size) {}

  /**
   * @brief Advances to the next record. Returns false at the end of the buffer or
   * when the remaining bytes do not form a complete record; status() tells the two
   * apart.
   */
  bool next(Record* record);

  const Status& status() const {
    return status_;
  }

  uint64_t offset() const {
    return offset_;
  }

private:
  const std::byte* data_;
  uint64_t size_;
  uint64_t offset_ = 0;
  Status status_;
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "record_parser.inl"
#endif
