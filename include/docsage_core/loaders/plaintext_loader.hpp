#pragma once
#include "document_loader.hpp"

namespace docsage_core {

// Plain text, one page per form-feed separated section (pdftotext output
// uses the same convention).
class PlainTextLoader : public DocumentLoader {
 public:
  bool can_handle(const fs::path &file_path) const override;
  Document load(const fs::path &file_path) const override;

  static std::vector<std::string> split_pages(const std::string &content);
};

}  // namespace docsage_core
