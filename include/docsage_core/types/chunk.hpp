#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docsage_core {

using EmbeddingVector = std::vector<float>;

// A contiguous slice of one page's normalized text.
// Offsets are byte offsets into that page, half-open: [start_offset, end_offset).
struct Chunk {
  std::string content;
  int source_page_index = 0;
  size_t start_offset = 0;
  size_t end_offset = 0;
  int sequence_index = 0;
};

inline bool operator==(const Chunk &lhs, const Chunk &rhs) {
  return lhs.content == rhs.content && lhs.source_page_index == rhs.source_page_index &&
         lhs.start_offset == rhs.start_offset && lhs.end_offset == rhs.end_offset &&
         lhs.sequence_index == rhs.sequence_index;
}

struct IndexEntry {
  Chunk chunk;
  EmbeddingVector vector;
};

struct ScoredChunk {
  Chunk chunk;
  float distance;
};

}  // namespace docsage_core
