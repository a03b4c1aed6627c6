#pragma once

#include "byte_cursor.hpp"
#include "decompression.hpp"
#include "record_parser.hpp"
#include "types.hpp"
#include <optional>

namespace replay {

/**
 * @brief Options for StreamReader.
 */
struct REPLAY_PUBLIC StreamReaderOptions {
  /**
   * @brief Yield Chunk records themselves before the records they contain. The chunk
   * contents are decoded either way.
   */
  bool includeChunks = false;
  /**
   * @brief Compare each decompressed chunk against its `uncompressedCrc`. A CRC of
   * zero means the writer did not compute one and is never checked.
   */
  bool validateChunkCrc = false;
  /**
   * @brief Decompressors for chunk payloads, looked up by compression name.
   */
  DecompressionRegistry decompressHandlers = DecompressionRegistry::WithBuiltins();
};

/**
 * @brief Outcome of StreamReader::next().
 */
struct REPLAY_PUBLIC ReadResult {
  enum struct Kind {
    /// `record` holds the next decoded record.
    Record,
    /// More bytes must be appended before anything else can be decoded.
    NeedMoreData,
    /// The footer and trailing magic have been read; the stream is complete.
    Done,
    /// Decoding failed. StreamReader::status() holds the reason.
    Failed,
  };

  Kind kind = Kind::NeedMoreData;
  std::optional<TypedRecord> record;
};

/**
 * @brief Incremental decoder for a container stream that arrives in fragments of any
 * size. Bytes are handed over with append() and records pulled out with next(),
 * which never blocks: when a record is only partially buffered it reports
 * NeedMoreData and resumes from the same place once more bytes arrive.
 *
 * Any decoding error is fatal to the reader. Once next() has reported Done or
 * Failed, append() is rejected.
 */
class REPLAY_PUBLIC StreamReader {
public:
  explicit StreamReader(StreamReaderOptions options = {});

  StreamReader(const StreamReader&) = delete;
  StreamReader& operator=(const StreamReader&) = delete;

  /**
   * @brief Buffers `size` more bytes. Fails with AlreadyDone after completion or
   * failure.
   */
  Status append(const std::byte* data, size_t size);

  ReadResult next();

  /**
   * @brief True once the stream has completed or failed.
   */
  bool done() const;

  /**
   * @brief Success unless decoding failed.
   */
  const Status& status() const {
    return status_;
  }

  /**
   * @brief Bytes appended but not yet consumed by a decoded record.
   */
  uint64_t bytesRemaining() const {
    return cursor_.remaining();
  }

  /**
   * @brief Total bytes consumed from the stream so far.
   */
  uint64_t bytesConsumed() const {
    return consumed_;
  }

  /**
   * @brief The Footer record, once it has been decoded.
   */
  const std::optional<Footer>& footer() const {
    return footer_;
  }

private:
  enum struct Step {
    LeadingMagic,
    Records,
    ChunkRecords,
    TrailingMagic,
    Done,
    Failed,
  };

  StreamReaderOptions options_;
  ByteCursor cursor_;
  Step step_ = Step::LeadingMagic;
  Status status_;
  std::optional<Footer> footer_;
  uint64_t consumed_ = 0;

  // Chunk being walked while in Step::ChunkRecords. The payload is decompressed the
  // first time the step runs so that an included Chunk is yielded before any error
  // its contents might raise.
  std::optional<ChunkRecord> pendingChunk_;
  ByteArray chunkData_;
  std::optional<RecordIterator> chunkRecords_;

  void consume(uint64_t size);
  ReadResult fail(Status status);
  ReadResult record(TypedRecord&& record);

  bool readMagic(Status* status);
  std::optional<ReadResult> readTopLevel();
  std::optional<ReadResult> readNested();
  Status openChunk();
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "stream_reader.inl"
#endif
