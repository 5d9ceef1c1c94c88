#include "docsage_core/chunking/recursive_chunker.hpp"

#include <algorithm>

#include "docsage_core/errors.hpp"

namespace docsage_core {

namespace {

bool is_continuation_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool is_code_point_start(std::string_view text, size_t pos) {
  return pos >= text.size() || !is_continuation_byte(text[pos]);
}

bool is_word_start(std::string_view text, size_t pos) {
  if (pos == 0)
    return true;
  char prev = text[pos - 1];
  return prev == ' ' || prev == '\n';
}

}  // namespace

const std::vector<std::string> &RecursiveChunker::default_separators() {
  static const std::vector<std::string> separators = {"\n\n", "\n", ". ", " "};
  return separators;
}

RecursiveChunker::RecursiveChunker() : separators_(default_separators()) {}

RecursiveChunker::RecursiveChunker(std::vector<std::string> separators)
    : separators_(std::move(separators)) {
  for (const auto &separator : separators_) {
    if (separator.empty()) {
      throw InvalidConfigurationError(
          "Chunk separators must be non-empty; single-byte cuts are always the final fallback");
    }
  }
}

void RecursiveChunker::validate(int chunk_size, int chunk_overlap) {
  if (chunk_size <= 0) {
    throw InvalidConfigurationError("chunk_size must be greater than 0, got " +
                                    std::to_string(chunk_size));
  }
  if (chunk_overlap < 0) {
    throw InvalidConfigurationError("chunk_overlap must not be negative, got " +
                                    std::to_string(chunk_overlap));
  }
  if (chunk_overlap >= chunk_size) {
    throw InvalidConfigurationError("chunk_overlap (" + std::to_string(chunk_overlap) +
                                    ") must be smaller than chunk_size (" +
                                    std::to_string(chunk_size) + ")");
  }
}

std::vector<Chunk> RecursiveChunker::split(std::string_view text,
                                           int chunk_size,
                                           int chunk_overlap,
                                           int source_page_index,
                                           int first_sequence_index) const {
  validate(chunk_size, chunk_overlap);

  std::vector<Chunk> chunks;
  if (text.empty()) {
    return chunks;
  }

  const size_t size = static_cast<size_t>(chunk_size);
  const size_t overlap = static_cast<size_t>(chunk_overlap);
  const size_t n = text.size();

  size_t start = 0;
  size_t body_start = 0;
  int sequence_index = first_sequence_index;

  while (true) {
    const size_t limit = std::min(n, start + size);
    // limit > body_start always holds because overlap < size
    const size_t end = limit == n ? n : find_chunk_end(text, body_start, limit);

    Chunk chunk;
    chunk.content = std::string(text.substr(start, end - start));
    chunk.source_page_index = source_page_index;
    chunk.start_offset = start;
    chunk.end_offset = end;
    chunk.sequence_index = sequence_index++;
    chunks.push_back(std::move(chunk));

    if (end == n) {
      break;
    }

    body_start = end;
    start = overlap > 0 ? find_overlap_start(text, start, end, overlap) : end;
  }

  return chunks;
}

/* Returns the end of the chunk whose new (non-overlap) text begins at body_start.
   The result is in (body_start, limit]. */
size_t RecursiveChunker::find_chunk_end(std::string_view text,
                                        size_t body_start,
                                        size_t limit) const {
  for (const auto &separator : separators_) {
    if (limit < separator.size()) {
      continue;
    }
    size_t pos = text.rfind(separator, limit - separator.size());
    if (pos != std::string_view::npos && pos + separator.size() > body_start) {
      return pos + separator.size();
    }
  }

  // Character fallback: cut at the bound, backing off to a code point start if one is in range
  for (size_t end = limit; end > body_start; --end) {
    if (is_code_point_start(text, end)) {
      return end;
    }
  }
  return limit;
}

/* Returns where the next chunk starts: inside [prev_end - overlap, prev_end),
   never before the previous chunk's own start. */
size_t RecursiveChunker::find_overlap_start(std::string_view text,
                                            size_t prev_start,
                                            size_t prev_end,
                                            size_t overlap) {
  const size_t lower = prev_end - std::min(overlap, prev_end - prev_start);

  for (size_t pos = lower; pos < prev_end; ++pos) {
    if (is_word_start(text, pos)) {
      return pos;
    }
  }
  for (size_t pos = lower; pos < prev_end; ++pos) {
    if (is_code_point_start(text, pos)) {
      return pos;
    }
  }
  return lower;
}

}  // namespace docsage_core
