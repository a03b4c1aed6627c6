#pragma once

#include "types.hpp"
#include <cstring>
#include <type_traits>

// Do not compile on systems with non-8-bit bytes
static_assert(std::numeric_limits<unsigned char>::digits == 8);

namespace replay::internal {

// Helper for writing compile-time exhaustive variant visitors.
template <class>
inline constexpr bool always_false_v = false;

constexpr uint64_t RecordPrefixLength = /* opcode */ 1 + /* record length */ 8;
constexpr uint64_t FooterLength = RecordPrefixLength +
                                  /* summary start */ 8 +
                                  /* summary offset start */ 8 +
                                  /* summary crc */ 4 +
                                  /* magic bytes */ sizeof(Magic);

inline std::string ToHex(uint8_t byte) {
  std::string result(2, '\0');
  result[0] = "0123456789ABCDEF"[(byte >> 4) & 0x0F];
  result[1] = "0123456789ABCDEF"[byte & 0x0F];
  return result;
}
inline std::string ToHex(std::byte byte) {
  return ToHex(uint8_t(byte));
}

inline std::string to_string(const std::string& arg) {
  return arg;
}
inline std::string to_string(std::string_view arg) {
  return std::string(arg);
}
inline std::string to_string(const char* arg) {
  return std::string(arg);
}
template <typename... T>
[[nodiscard]] inline std::string StrCat(T&&... args) {
  using replay::internal::to_string;
  using std::to_string;
  return ("" + ... + to_string(std::forward<T>(args)));
}

inline std::string MagicToHex(const std::byte* data) {
  std::string result;
  for (size_t i = 0; i < sizeof(Magic); ++i) {
    result += ToHex(data[i]);
  }
  return result;
}

inline bool IsMagic(const std::byte* data) {
  return std::memcmp(data, Magic, sizeof(Magic)) == 0;
}

inline uint32_t KeyValueMapSize(const KeyValueMap& map) {
  size_t size = 0;
  for (const auto& [key, value] : map) {
    size += 4 + key.size() + 4 + value.size();
  }
  return uint32_t(size);
}

inline std::string CompressionString(Compression compression) {
  switch (compression) {
    case Compression::None:
    default:
      return std::string{};
    case Compression::Lz4:
      return "lz4";
    case Compression::Zstd:
      return "zstd";
  }
}

inline uint16_t ParseUint16(const std::byte* data) {
  return uint16_t(uint16_t(data[0]) | (uint16_t(data[1]) << 8));
}

inline uint32_t ParseUint32(const std::byte* data) {
  return uint32_t(data[0]) | (uint32_t(data[1]) << 8) | (uint32_t(data[2]) << 16) |
         (uint32_t(data[3]) << 24);
}

inline uint64_t ParseUint64(const std::byte* data) {
  return uint64_t(ParseUint32(data)) | (uint64_t(ParseUint32(data + 4)) << 32);
}

/**
 * @brief Sequential little-endian field reader over a borrowed record payload. Every
 * read is bounds checked and advances the cursor only on success.
 */
class FieldReader {
public:
  FieldReader(const std::byte* data, uint64_t size)
      : data_(data)
      , size_(size) {}

  uint64_t offset() const {
    return offset_;
  }

  uint64_t remaining() const {
    return size_ - offset_;
  }

  const std::byte* position() const {
    return data_ + offset_;
  }

  Status read(uint8_t* output) {
    if (auto status = require(1, "uint8"); !status.ok()) {
      return status;
    }
    *output = uint8_t(data_[offset_]);
    offset_ += 1;
    return StatusCode::Success;
  }

  Status read(uint16_t* output) {
    if (auto status = require(2, "uint16"); !status.ok()) {
      return status;
    }
    *output = ParseUint16(data_ + offset_);
    offset_ += 2;
    return StatusCode::Success;
  }

  Status read(uint32_t* output) {
    if (auto status = require(4, "uint32"); !status.ok()) {
      return status;
    }
    *output = ParseUint32(data_ + offset_);
    offset_ += 4;
    return StatusCode::Success;
  }

  Status read(uint64_t* output) {
    if (auto status = require(8, "uint64"); !status.ok()) {
      return status;
    }
    *output = ParseUint64(data_ + offset_);
    offset_ += 8;
    return StatusCode::Success;
  }

  Status read(std::string_view* output) {
    uint32_t size = 0;
    if (auto status = peekPrefix(&size, "string"); !status.ok()) {
      return status;
    }
    *output = std::string_view(reinterpret_cast<const char*>(data_ + offset_ + 4), size);
    offset_ += 4 + uint64_t(size);
    return StatusCode::Success;
  }

  Status read(std::string* output) {
    std::string_view view;
    if (auto status = read(&view); !status.ok()) {
      return status;
    }
    output->assign(view.data(), view.size());
    return StatusCode::Success;
  }

  Status read(ByteArray* output) {
    uint32_t size = 0;
    if (auto status = peekPrefix(&size, "byte array"); !status.ok()) {
      return status;
    }
    const std::byte* begin = data_ + offset_ + 4;
    output->assign(begin, begin + size);
    offset_ += 4 + uint64_t(size);
    return StatusCode::Success;
  }

  Status read(KeyValueMap* output) {
    uint32_t sizeInBytes = 0;
    if (auto status = peekPrefix(&sizeInBytes, "key-value map"); !status.ok()) {
      return status;
    }
    FieldReader entries{data_ + offset_ + 4, sizeInBytes};
    output->clear();
    while (entries.remaining() > 0) {
      std::string_view key;
      std::string_view value;
      if (auto status = entries.read(&key); !status.ok()) {
        return Status{StatusCode::InvalidRecord,
                      StrCat("cannot read key-value map key: ", status.message)};
      }
      if (auto status = entries.read(&value); !status.ok()) {
        return Status{StatusCode::InvalidRecord,
                      StrCat("cannot read value for key \"", key, "\": ", status.message)};
      }
      output->emplace(key, value);
    }
    offset_ += 4 + uint64_t(sizeInBytes);
    return StatusCode::Success;
  }

  /**
   * @brief Borrows the next `size` bytes without copying them.
   */
  Status readBytes(uint64_t size, const std::byte** output) {
    if (auto status = require(size, "bytes"); !status.ok()) {
      return status;
    }
    *output = data_ + offset_;
    offset_ += size;
    return StatusCode::Success;
  }

private:
  const std::byte* data_;
  uint64_t size_;
  uint64_t offset_ = 0;

  Status require(uint64_t size, const char* what) const {
    if (remaining() < size) {
      return Status{StatusCode::InvalidRecord, StrCat("cannot read ", what, " (", size,
                                                      " bytes) from ", remaining(), " bytes")};
    }
    return StatusCode::Success;
  }

  Status peekPrefix(uint32_t* size, const char* what) const {
    if (auto status = require(4, what); !status.ok()) {
      return status;
    }
    *size = ParseUint32(data_ + offset_);
    if (uint64_t(*size) > remaining() - 4) {
      return Status{StatusCode::InvalidRecord, StrCat(what, " size ", *size,
                                                      " exceeds remaining bytes ", remaining() - 4)};
    }
    return StatusCode::Success;
  }
};

}  // namespace replay::internal
