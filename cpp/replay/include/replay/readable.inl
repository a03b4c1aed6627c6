#include "internal.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace replay {

// FileReader //////////////////////////////////////////////////////////////////

Status FileReader::Open(const std::string& path, std::unique_ptr<FileReader>* output) {
  std::FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) {
    return Status{StatusCode::OpenFailed,
                  internal::StrCat("failed to open \"", path, "\": ", std::strerror(errno))};
  }
  if (std::fseek(file, 0, SEEK_END) != 0) {
    std::fclose(file);
    return Status{StatusCode::OpenFailed, internal::StrCat("failed to seek in \"", path, "\"")};
  }
  const long size = std::ftell(file);
  if (size < 0 || std::fseek(file, 0, SEEK_SET) != 0) {
    std::fclose(file);
    return Status{StatusCode::OpenFailed,
                  internal::StrCat("failed to determine size of \"", path, "\"")};
  }
  output->reset(new FileReader(file, uint64_t(size)));
  return StatusCode::Success;
}

FileReader::FileReader(std::FILE* file, uint64_t size)
    : file_(file)
    , size_(size) {}

FileReader::~FileReader() {
  std::fclose(file_);
}

uint64_t FileReader::size() const {
  return size_;
}

uint64_t FileReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= size_) {
    return 0;
  }
  if (offset != position_) {
    if (std::fseek(file_, long(offset), SEEK_SET) != 0) {
      return 0;
    }
    position_ = offset;
  }
  size = std::min(size, size_ - offset);
  if (size > buffer_.size()) {
    buffer_.resize(size);
  }
  const uint64_t bytesRead = uint64_t(std::fread(buffer_.data(), 1, size, file_));
  *output = buffer_.data();
  position_ += bytesRead;
  return bytesRead;
}

// BufferReader ////////////////////////////////////////////////////////////////

uint64_t BufferReader::size() const {
  return data_.size();
}

uint64_t BufferReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= data_.size()) {
    return 0;
  }
  *output = data_.data() + offset;
  return std::min(size, uint64_t(data_.size()) - offset);
}

}  // namespace replay
