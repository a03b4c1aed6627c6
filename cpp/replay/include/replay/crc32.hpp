#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace replay::internal {

// Reflected CRC-32 (IEEE 802.3), one byte per table lookup.
constexpr uint32_t Crc32Polynomial = 0xEDB88320;

constexpr std::array<uint32_t, 256> MakeCrc32Table() {
  std::array<uint32_t, 256> table = {};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t value = i;
    for (int bit = 0; bit < 8; ++bit) {
      value = (value & 1) ? (value >> 1) ^ Crc32Polynomial : value >> 1;
    }
    table[i] = value;
  }
  return table;
}

inline constexpr std::array<uint32_t, 256> Crc32Table = MakeCrc32Table();

constexpr uint32_t CRC32_INIT = 0xffffffff;

/**
 * Feed more bytes into a running checksum. Start from CRC32_INIT and pass the result
 * through crc32Final once all data has been seen.
 */
inline uint32_t crc32Update(uint32_t crc, const std::byte* data, size_t length) {
  for (size_t i = 0; i < length; ++i) {
    crc = Crc32Table[(crc ^ uint32_t(data[i])) & 0xff] ^ (crc >> 8);
  }
  return crc;
}

inline uint32_t crc32Final(uint32_t crc) {
  return crc ^ 0xffffffff;
}

inline uint32_t crc32(const std::byte* data, size_t length) {
  return crc32Final(crc32Update(CRC32_INIT, data, length));
}

}  // namespace replay::internal
