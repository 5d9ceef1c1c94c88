#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "docsage_core/types/chunk.hpp"

namespace docsage_core {

/**
 * @class RecursiveChunker
 * @brief Splits normalized page text into size-bounded, overlapping chunks.
 *
 * A chunk ends at the last boundary of the coarsest separator that fits inside
 * the size bound (paragraph, then line, then sentence, then word). When none
 * fits, the chunk is cut at the size bound itself. Each chunk after the first
 * starts inside the trailing `chunk_overlap` bytes of its predecessor, snapped
 * forward to the first word start in that window.
 *
 * Sizes and offsets are in bytes. Hard cuts avoid splitting a UTF-8 code point
 * whenever the window leaves room to.
 */
class RecursiveChunker {
 public:
  // "\n\n", "\n", ". ", " " in priority order. Single-byte cuts are the implicit last resort.
  static const std::vector<std::string> &default_separators();

  RecursiveChunker();
  explicit RecursiveChunker(std::vector<std::string> separators);

  // Throws InvalidConfigurationError unless chunk_size > 0 and 0 <= chunk_overlap < chunk_size.
  static void validate(int chunk_size, int chunk_overlap);

  /**
   * @brief Splits one page of text.
   *
   * @param text Normalized page text.
   * @param chunk_size Maximum chunk length in bytes.
   * @param chunk_overlap Maximum bytes shared with the previous chunk.
   * @param source_page_index Page index stamped onto every chunk.
   * @param first_sequence_index Sequence index of the first chunk produced.
   * @return Chunks in text order. Empty for empty text.
   * @throw InvalidConfigurationError on invalid sizes.
   */
  std::vector<Chunk> split(std::string_view text,
                           int chunk_size,
                           int chunk_overlap,
                           int source_page_index = 0,
                           int first_sequence_index = 0) const;

  const std::vector<std::string> &separators() const {
    return separators_;
  }

 private:
  size_t find_chunk_end(std::string_view text, size_t body_start, size_t limit) const;
  static size_t find_overlap_start(std::string_view text,
                                   size_t prev_start,
                                   size_t prev_end,
                                   size_t overlap);

  std::vector<std::string> separators_;
};

}  // namespace docsage_core
