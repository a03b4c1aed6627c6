#pragma once

#include "types.hpp"
#include <cstdio>
#include <memory>

namespace replay {

/**
 * @brief Random-access byte source that container-backed providers read from.
 */
struct REPLAY_PUBLIC IReadable {
  virtual ~IReadable() = default;

  /**
   * @brief Total number of bytes in the source.
   */
  virtual uint64_t size() const = 0;

  /**
   * @brief Reads up to `size` bytes starting at `offset`. On return `*output` points
   * at the bytes, which stay valid and unmodified until the next call to read().
   * Returns the number of bytes available at `*output`: fewer than requested at the
   * end of the source, zero if the read failed.
   */
  virtual uint64_t read(std::byte** output, uint64_t offset, uint64_t size) = 0;
};

/**
 * @brief IReadable over a file on disk. The file is closed when the reader is
 * destroyed.
 */
class REPLAY_PUBLIC FileReader final : public IReadable {
public:
  /**
   * @brief Opens `path` for reading. Fails with OpenFailed if the file cannot be
   * opened or its size cannot be determined.
   */
  static Status Open(const std::string& path, std::unique_ptr<FileReader>* output);

  ~FileReader() override;

  FileReader(const FileReader&) = delete;
  FileReader& operator=(const FileReader&) = delete;

  uint64_t size() const override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;

private:
  FileReader(std::FILE* file, uint64_t size);

  std::FILE* file_;
  uint64_t size_;
  uint64_t position_ = 0;
  ByteArray buffer_;
};

/**
 * @brief IReadable over bytes held in memory.
 */
class REPLAY_PUBLIC BufferReader final : public IReadable {
public:
  explicit BufferReader(ByteArray data)
      : data_(std::move(data)) {}

  uint64_t size() const override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;

private:
  ByteArray data_;
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "readable.inl"
#endif
