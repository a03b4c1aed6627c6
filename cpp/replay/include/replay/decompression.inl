#include "internal.hpp"
#include <lz4frame.h>
#include <new>
#include <stdexcept>
#include <zstd.h>

namespace replay {

// The LZ4 block format cannot expand input by more than this factor.
constexpr uint64_t Lz4MaxCompressionRatio = 255;

Status DecompressLz4(const std::byte* data, uint64_t size, uint64_t uncompressedSize,
                     ByteArray* output) {
  LZ4F_dctx* context = nullptr;
  const LZ4F_errorCode_t err = LZ4F_createDecompressionContext(&context, LZ4F_VERSION);
  if (LZ4F_isError(err)) {
    return Status{StatusCode::DecompressionFailed,
                  internal::StrCat("failed to create lz4 decompression context: ",
                                   LZ4F_getErrorName(err))};
  }

  // Check the frame header before allocating the output buffer.
  LZ4F_frameInfo_t frameInfo;
  size_t srcSize = size;
  const auto headerResult = LZ4F_getFrameInfo(context, &frameInfo, data, &srcSize);
  if (LZ4F_isError(headerResult)) {
    LZ4F_freeDecompressionContext(context);
    return Status{StatusCode::DecompressionFailed,
                  internal::StrCat("invalid lz4 frame header: ", LZ4F_getErrorName(headerResult))};
  }
  if (frameInfo.contentSize != 0 && frameInfo.contentSize != uncompressedSize) {
    LZ4F_freeDecompressionContext(context);
    return Status{StatusCode::DecompressionSizeMismatch,
                  internal::StrCat("lz4 frame holds ", frameInfo.contentSize, " bytes, expected ",
                                   uncompressedSize)};
  }
  if (uncompressedSize > (size + 1) * Lz4MaxCompressionRatio) {
    LZ4F_freeDecompressionContext(context);
    return Status{StatusCode::DecompressionFailed,
                  internal::StrCat(size, " bytes of lz4 cannot decompress to ", uncompressedSize,
                                   " bytes")};
  }

  output->resize(uncompressedSize);
  size_t dstSize = uncompressedSize;
  const size_t headerSize = srcSize;
  srcSize = size - headerSize;
  const auto result =
    LZ4F_decompress(context, output->data(), &dstSize, data + headerSize, &srcSize, nullptr);
  srcSize += headerSize;
  LZ4F_freeDecompressionContext(context);

  if (LZ4F_isError(result)) {
    output->clear();
    return Status{StatusCode::DecompressionFailed,
                  internal::StrCat("lz4 decompression of ", size, " bytes into ", uncompressedSize,
                                   " bytes failed: ", LZ4F_getErrorName(result))};
  }
  if (result != 0 || srcSize != size) {
    output->clear();
    return Status{StatusCode::DecompressionFailed,
                  internal::StrCat("lz4 frame was not fully decoded: consumed ", srcSize, " of ",
                                   size, " bytes")};
  }
  if (dstSize != uncompressedSize) {
    output->clear();
    return Status{StatusCode::DecompressionSizeMismatch,
                  internal::StrCat("lz4 decompression produced ", dstSize, " bytes, expected ",
                                   uncompressedSize)};
  }
  return StatusCode::Success;
}

Status DecompressZstd(const std::byte* data, uint64_t size, uint64_t uncompressedSize,
                      ByteArray* output) {
  const auto contentSize = ZSTD_getFrameContentSize(data, size);
  if (contentSize == ZSTD_CONTENTSIZE_ERROR) {
    return Status{StatusCode::DecompressionFailed,
                  internal::StrCat("invalid zstd frame header in ", size, " bytes")};
  }
  if (contentSize != ZSTD_CONTENTSIZE_UNKNOWN && contentSize != uncompressedSize) {
    return Status{StatusCode::DecompressionSizeMismatch,
                  internal::StrCat("zstd frame holds ", contentSize, " bytes, expected ",
                                   uncompressedSize)};
  }
  output->resize(uncompressedSize);
  const auto result = ZSTD_decompress(output->data(), uncompressedSize, data, size);
  if (ZSTD_isError(result)) {
    output->clear();
    return Status{StatusCode::DecompressionFailed,
                  internal::StrCat("zstd decompression of ", size, " bytes into ", uncompressedSize,
                                   " bytes failed: ", ZSTD_getErrorName(result))};
  }
  if (result != uncompressedSize) {
    output->clear();
    return Status{StatusCode::DecompressionSizeMismatch,
                  internal::StrCat("zstd decompression produced ", result, " bytes, expected ",
                                   uncompressedSize)};
  }
  return StatusCode::Success;
}

DecompressionRegistry DecompressionRegistry::WithBuiltins() {
  DecompressionRegistry registry;
  registry.registerHandler("lz4", DecompressLz4);
  registry.registerHandler("zstd", DecompressZstd);
  return registry;
}

void DecompressionRegistry::registerHandler(const std::string& name, DecompressHandler handler) {
  handlers_[name] = std::move(handler);
}

bool DecompressionRegistry::contains(const std::string& name) const {
  return name.empty() || handlers_.find(name) != handlers_.end();
}

Status DecompressionRegistry::decompress(const std::string& compression, const std::byte* data,
                                         uint64_t size, uint64_t uncompressedSize,
                                         ByteArray* output) const {
  if (compression.empty()) {
    if (size != uncompressedSize) {
      return Status{StatusCode::DecompressionSizeMismatch,
                    internal::StrCat("uncompressed chunk is ", size, " bytes, header says ",
                                     uncompressedSize)};
    }
    output->assign(data, data + size);
    return StatusCode::Success;
  }

  const auto it = handlers_.find(compression);
  if (it == handlers_.end()) {
    return Status{StatusCode::UnrecognizedCompression,
                  internal::StrCat("unrecognized compression \"", compression, "\"")};
  }
  Status status;
  try {
    status = it->second(data, size, uncompressedSize, output);
  } catch (const std::bad_alloc&) {
    output->clear();
    return Status{StatusCode::DecompressionFailed,
                  internal::StrCat("cannot allocate ", uncompressedSize, " bytes for a ",
                                   compression, " chunk")};
  } catch (const std::length_error&) {
    output->clear();
    return Status{StatusCode::DecompressionFailed,
                  internal::StrCat("cannot allocate ", uncompressedSize, " bytes for a ",
                                   compression, " chunk")};
  }
  if (!status.ok()) {
    return status;
  }
  if (output->size() != uncompressedSize) {
    return Status{StatusCode::DecompressionSizeMismatch,
                  internal::StrCat(compression, " handler produced ", output->size(),
                                   " bytes, expected ", uncompressedSize)};
  }
  return StatusCode::Success;
}

}  // namespace replay
