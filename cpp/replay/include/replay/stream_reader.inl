#include "crc32.hpp"
#include "internal.hpp"

namespace replay {

StreamReader::StreamReader(StreamReaderOptions options)
    : options_(std::move(options)) {}

Status StreamReader::append(const std::byte* data, size_t size) {
  if (done()) {
    return Status{StatusCode::AlreadyDone,
                  internal::StrCat("cannot append ", size, " bytes: already done reading")};
  }
  cursor_.append(data, size);
  return StatusCode::Success;
}

bool StreamReader::done() const {
  return step_ == Step::Done || step_ == Step::Failed;
}

ReadResult StreamReader::next() {
  for (;;) {
    switch (step_) {
      case Step::LeadingMagic: {
        Status status;
        if (!readMagic(&status)) {
          return status.ok() ? ReadResult{} : fail(std::move(status));
        }
        step_ = Step::Records;
        break;
      }
      case Step::Records:
        if (auto result = readTopLevel()) {
          return std::move(*result);
        }
        break;
      case Step::ChunkRecords:
        if (auto result = readNested()) {
          return std::move(*result);
        }
        break;
      case Step::TrailingMagic: {
        Status status;
        if (!readMagic(&status)) {
          return status.ok() ? ReadResult{} : fail(std::move(status));
        }
        if (cursor_.remaining() != 0) {
          return fail(Status{StatusCode::TrailingData,
                             internal::StrCat(cursor_.remaining(),
                                              " bytes remaining after footer and trailing magic")});
        }
        step_ = Step::Done;
        return ReadResult{ReadResult::Kind::Done, std::nullopt};
      }
      case Step::Done:
        return ReadResult{ReadResult::Kind::Done, std::nullopt};
      case Step::Failed:
        return ReadResult{ReadResult::Kind::Failed, std::nullopt};
    }
  }
}

void StreamReader::consume(uint64_t size) {
  cursor_.consume(size_t(size));
  consumed_ += size;
}

ReadResult StreamReader::fail(Status status) {
  step_ = Step::Failed;
  status_ = std::move(status);
  cursor_.clear();
  chunkRecords_.reset();
  chunkData_.clear();
  pendingChunk_.reset();
  return ReadResult{ReadResult::Kind::Failed, std::nullopt};
}

ReadResult StreamReader::record(TypedRecord&& record) {
  return ReadResult{ReadResult::Kind::Record, std::move(record)};
}

bool StreamReader::readMagic(Status* status) {
  if (!cursor_.hasBytes(sizeof(Magic))) {
    return false;
  }
  if (!internal::IsMagic(cursor_.data())) {
    *status = Status{StatusCode::MagicMismatch,
                     internal::StrCat("invalid magic bytes: ", internal::MagicToHex(cursor_.data()))};
    return false;
  }
  consume(sizeof(Magic));
  return true;
}

std::optional<ReadResult> StreamReader::readTopLevel() {
  Record header;
  if (!RecordParser::ParseRecordPrefix(cursor_.data(), cursor_.remaining(), &header)) {
    return ReadResult{};
  }
  if (header.dataSize > std::numeric_limits<uint64_t>::max() - internal::RecordPrefixLength) {
    return fail(Status{StatusCode::InvalidRecord,
                       internal::StrCat("record length ", header.dataSize, " is too large")});
  }
  if (!cursor_.hasBytes(header.recordSize())) {
    return ReadResult{};
  }

  switch (header.opcode) {
    case OpCode::Footer: {
      Footer footer;
      if (auto status = RecordParser::ParseFooter(header, &footer); !status.ok()) {
        return fail(std::move(status));
      }
      consume(header.recordSize());
      footer_ = footer;
      step_ = Step::TrailingMagic;
      return std::nullopt;
    }
    case OpCode::Chunk: {
      Chunk chunk;
      if (auto status = RecordParser::ParseChunk(header, &chunk); !status.ok()) {
        return fail(std::move(status));
      }
      pendingChunk_.emplace(chunk);
      consume(header.recordSize());
      step_ = Step::ChunkRecords;
      if (options_.includeChunks) {
        return record(ChunkRecord{*pendingChunk_});
      }
      return std::nullopt;
    }
    default: {
      TypedRecord typed;
      if (auto status = RecordParser::ParseTypedRecord(header, &typed); !status.ok()) {
        return fail(std::move(status));
      }
      consume(header.recordSize());
      return record(std::move(typed));
    }
  }
}

Status StreamReader::openChunk() {
  const ChunkRecord& chunk = *pendingChunk_;
  if (!options_.decompressHandlers.contains(chunk.compression)) {
    return Status{StatusCode::UnrecognizedCompression,
                  internal::StrCat("unsupported chunk compression \"", chunk.compression, "\"")};
  }
  if (auto status =
        options_.decompressHandlers.decompress(chunk.compression, chunk.records.data(),
                                               chunk.records.size(), chunk.uncompressedSize,
                                               &chunkData_);
      !status.ok()) {
    return status;
  }
  if (options_.validateChunkCrc && chunk.uncompressedCrc != 0) {
    const uint32_t crc = internal::crc32(chunkData_.data(), chunkData_.size());
    if (crc != chunk.uncompressedCrc) {
      return Status{StatusCode::InvalidChunkCrc,
                    internal::StrCat("chunk crc ", crc, " does not match expected ",
                                     chunk.uncompressedCrc)};
    }
  }
  chunkRecords_.emplace(chunkData_.data(), chunkData_.size());
  return StatusCode::Success;
}

std::optional<ReadResult> StreamReader::readNested() {
  if (!chunkRecords_) {
    if (auto status = openChunk(); !status.ok()) {
      return fail(std::move(status));
    }
  }

  Record nested;
  if (chunkRecords_->next(&nested)) {
    switch (nested.opcode) {
      case OpCode::Header:
      case OpCode::Footer:
      case OpCode::Chunk:
      case OpCode::MessageIndex:
      case OpCode::ChunkIndex:
      case OpCode::Attachment:
      case OpCode::AttachmentIndex:
      case OpCode::Statistics:
      case OpCode::Metadata:
      case OpCode::MetadataIndex:
      case OpCode::SummaryOffset:
      case OpCode::DataEnd:
        return fail(Status{StatusCode::InvalidOpCode,
                           internal::StrCat(OpCodeString(nested.opcode),
                                            " record not allowed inside a chunk")});
      default: {
        TypedRecord typed;
        if (auto status = RecordParser::ParseTypedRecord(nested, &typed); !status.ok()) {
          return fail(std::move(status));
        }
        return record(std::move(typed));
      }
    }
  }

  if (!chunkRecords_->status().ok()) {
    return fail(Status{StatusCode::InvalidRecord,
                       internal::StrCat(chunkData_.size() - chunkRecords_->offset(),
                                        " bytes remaining in chunk")});
  }
  chunkRecords_.reset();
  chunkData_.clear();
  pendingChunk_.reset();
  step_ = Step::Records;
  return std::nullopt;
}

}  // namespace replay
