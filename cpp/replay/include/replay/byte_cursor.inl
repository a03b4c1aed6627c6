#include <algorithm>

namespace replay {

void ByteCursor::append(const std::byte* data, size_t size) {
  if (size == 0) {
    return;
  }
  if (offset_ > 0 && offset_ >= remaining()) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + std::ptrdiff_t(offset_));
    offset_ = 0;
  }
  buffer_.insert(buffer_.end(), data, data + size);
}

void ByteCursor::consume(size_t count) {
  offset_ += std::min(count, remaining());
  if (offset_ == buffer_.size()) {
    buffer_.clear();
    offset_ = 0;
  }
}

void ByteCursor::clear() {
  buffer_.clear();
  offset_ = 0;
}

}  // namespace replay
