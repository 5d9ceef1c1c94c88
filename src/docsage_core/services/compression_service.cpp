#include "docsage_core/services/compression_service.hpp"

#include <zstd.h>

namespace docsage_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }

  std::vector<char> frame(ZSTD_compressBound(data.size()));
  const size_t written =
      ZSTD_compress(frame.data(), frame.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw CompressionError("zstd compression failed: " + std::string(ZSTD_getErrorName(written)));
  }

  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long content_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR) {
    throw CompressionError("Buffer is not a zstd frame");
  }
  if (content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("zstd frame does not record its content size");
  }

  std::string text(static_cast<size_t>(content_size), '\0');
  const size_t read =
      ZSTD_decompress(text.data(), text.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(read)) {
    throw CompressionError("zstd decompression failed: " + std::string(ZSTD_getErrorName(read)));
  }
  if (read != content_size) {
    throw CompressionError("zstd frame is truncated: expected " + std::to_string(content_size) +
                           " bytes, got " + std::to_string(read));
  }
  return text;
}

}  // namespace docsage_core
