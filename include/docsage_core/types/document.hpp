#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docsage_core {

/**
 * @class Document
 * @brief Raw document text plus the ordered boundaries of its pages.
 *
 * Produced by a DocumentLoader (or any external extractor) and consumed once
 * by the IndexBuilder. Pages are stored back to back in a single buffer; the
 * boundaries are the start offsets of each page.
 */
class Document {
 public:
  explicit Document(const std::vector<std::string> &pages, std::string source = "");

  size_t page_count() const {
    return page_starts_.size();
  }

  std::string_view page_text(size_t page_index) const;

  std::vector<std::string> pages() const;

  const std::string &text() const {
    return text_;
  }

  const std::string &source() const {
    return source_;
  }

  bool empty() const {
    return text_.empty();
  }

 private:
  std::string text_;
  std::vector<size_t> page_starts_;
  std::string source_;
};

}  // namespace docsage_core
