#pragma once

#include "visibility.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace replay {

/**
 * @brief An append-only byte buffer with a read cursor. Bytes are appended at the
 * back and consumed from the front; consumed space is reclaimed lazily once it
 * outweighs the unread bytes.
 */
class REPLAY_PUBLIC ByteCursor {
public:
  void append(const std::byte* data, size_t size);

  /**
   * @brief Unread bytes, starting at the cursor. Invalidated by append().
   */
  const std::byte* data() const {
    return buffer_.data() + offset_;
  }

  size_t remaining() const {
    return buffer_.size() - offset_;
  }

  bool hasBytes(uint64_t count) const {
    return uint64_t(remaining()) >= count;
  }

  /**
   * @brief Advances the cursor by `count` bytes. `count` is capped at remaining().
   */
  void consume(size_t count);

  void clear();

private:
  std::vector<std::byte> buffer_;
  size_t offset_ = 0;
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "byte_cursor.inl"
#endif
