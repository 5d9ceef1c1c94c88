#include "docsage_core/loaders/plaintext_loader.hpp"

namespace docsage_core {

bool PlainTextLoader::can_handle(const fs::path &file_path) const {
  return file_path.extension() == ".txt";
}

std::vector<std::string> PlainTextLoader::split_pages(const std::string &content) {
  std::vector<std::string> pages;
  if (content.empty()) {
    return pages;
  }

  size_t start = 0;
  while (start < content.size()) {
    size_t form_feed = content.find('\f', start);
    if (form_feed == std::string::npos) {
      pages.push_back(content.substr(start));
      break;
    }
    pages.push_back(content.substr(start, form_feed - start));
    start = form_feed + 1;
  }
  return pages;
}

Document PlainTextLoader::load(const fs::path &file_path) const {
  return Document(split_pages(read_file(file_path)), file_path.string());
}

}  // namespace docsage_core
