#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "docsage_core/errors.hpp"

namespace docsage_core {

class CompressionError : public DocsageError {
 public:
  explicit CompressionError(const std::string &message) : DocsageError(message) {}
};

// zstd frames for chunk text at rest. Frames always record their content size.
class CompressionService {
 public:
  /**
   * @brief Compresses a block of text into a single zstd frame.
   * @param data The text to compress. Empty input yields an empty buffer.
   * @param compression_level zstd level, 3 by default.
   * @throw CompressionError if zstd reports an error.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Restores text produced by compress().
   * @throw CompressionError for buffers that are not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace docsage_core
