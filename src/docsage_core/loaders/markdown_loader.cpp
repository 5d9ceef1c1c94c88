#include "docsage_core/loaders/markdown_loader.hpp"

#include <regex>

namespace docsage_core {

bool MarkdownLoader::can_handle(const fs::path &file_path) const {
  return file_path.extension() == ".md";
}

std::vector<std::string> MarkdownLoader::split_pages(const std::string &content) {
  std::vector<std::string> pages;
  if (content.empty()) {
    return pages;
  }

  // Top-level headings only; "## " and deeper stay inside their section
  const std::regex heading_regex(R"(^# .*)",
                                 std::regex_constants::ECMAScript | std::regex_constants::multiline);

  std::vector<size_t> split_points;
  auto headings_begin = std::sregex_iterator(content.begin(), content.end(), heading_regex);
  auto headings_end = std::sregex_iterator();
  for (auto it = headings_begin; it != headings_end; ++it) {
    split_points.push_back(static_cast<size_t>(it->position()));
  }

  // Preamble before the first heading
  const size_t first_heading = split_points.empty() ? content.size() : split_points.front();
  if (first_heading > 0) {
    pages.push_back(content.substr(0, first_heading));
  }

  for (size_t i = 0; i < split_points.size(); ++i) {
    size_t start = split_points[i];
    size_t end = i + 1 < split_points.size() ? split_points[i + 1] : content.size();
    pages.push_back(content.substr(start, end - start));
  }
  return pages;
}

Document MarkdownLoader::load(const fs::path &file_path) const {
  return Document(split_pages(read_file(file_path)), file_path.string());
}

}  // namespace docsage_core
