#include "docsage_core/types.hpp"

#include <stdexcept>
#include <utility>

#include "docsage_core/errors.hpp"

namespace docsage_core {

std::string to_string(DistanceMetric metric) {
  switch (metric) {
    case DistanceMetric::Euclidean:
      return "euclidean";
    case DistanceMetric::Cosine:
      return "cosine";
    default:
      return "unknown";
  }
}

DistanceMetric distance_metric_from_string(const std::string &str) {
  if (str == "euclidean")
    return DistanceMetric::Euclidean;
  if (str == "cosine")
    return DistanceMetric::Cosine;
  throw InvalidConfigurationError("Unknown distance metric: '" + str +
                                  "' (expected 'euclidean' or 'cosine')");
}

Document::Document(const std::vector<std::string> &pages, std::string source)
    : source_(std::move(source)) {
  size_t total = 0;
  for (const auto &page : pages) {
    total += page.size();
  }
  text_.reserve(total);
  page_starts_.reserve(pages.size());
  for (const auto &page : pages) {
    page_starts_.push_back(text_.size());
    text_ += page;
  }
}

std::string_view Document::page_text(size_t page_index) const {
  if (page_index >= page_starts_.size()) {
    throw std::out_of_range("Page index " + std::to_string(page_index) + " out of range (" +
                            std::to_string(page_starts_.size()) + " pages)");
  }
  size_t start = page_starts_[page_index];
  size_t end = page_index + 1 < page_starts_.size() ? page_starts_[page_index + 1] : text_.size();
  return std::string_view(text_).substr(start, end - start);
}

std::vector<std::string> Document::pages() const {
  std::vector<std::string> out;
  out.reserve(page_starts_.size());
  for (size_t i = 0; i < page_starts_.size(); ++i) {
    out.emplace_back(page_text(i));
  }
  return out;
}

}  // namespace docsage_core
