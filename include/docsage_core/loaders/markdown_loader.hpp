#pragma once
#include "document_loader.hpp"

namespace docsage_core {

// Markdown, one page per top-level "# " section.
class MarkdownLoader : public DocumentLoader {
 public:
  bool can_handle(const fs::path &file_path) const override;
  Document load(const fs::path &file_path) const override;

  static std::vector<std::string> split_pages(const std::string &content);
};

}  // namespace docsage_core
