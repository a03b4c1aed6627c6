#pragma once

#include "types.hpp"
#include <functional>
#include <string>
#include <unordered_map>

namespace replay {

/**
 * @brief Decompresses `size` bytes at `data` into `output`, which must end up exactly
 * `uncompressedSize` bytes long.
 */
using DecompressHandler = std::function<Status(const std::byte* data, uint64_t size,
                                               uint64_t uncompressedSize, ByteArray* output)>;

REPLAY_PUBLIC Status DecompressLz4(const std::byte* data, uint64_t size, uint64_t uncompressedSize,
                                   ByteArray* output);

REPLAY_PUBLIC Status DecompressZstd(const std::byte* data, uint64_t size,
                                    uint64_t uncompressedSize, ByteArray* output);

/**
 * @brief Chunk decompressors keyed by the compression name stored in each Chunk. The
 * empty name (uncompressed) is always understood.
 */
class REPLAY_PUBLIC DecompressionRegistry {
public:
  /**
   * @brief A registry that understands "lz4" and "zstd".
   */
  static DecompressionRegistry WithBuiltins();

  /**
   * @brief Adds or replaces the handler for `name`.
   */
  void registerHandler(const std::string& name, DecompressHandler handler);

  bool contains(const std::string& name) const;

  /**
   * @brief Runs the handler registered for `compression`. Fails with
   * UnrecognizedCompression for unknown names and DecompressionSizeMismatch when the
   * handler produced the wrong number of bytes.
   */
  Status decompress(const std::string& compression, const std::byte* data, uint64_t size,
                    uint64_t uncompressedSize, ByteArray* output) const;

private:
  std::unordered_map<std::string, DecompressHandler> handlers_;
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "decompression.inl"
#endif
