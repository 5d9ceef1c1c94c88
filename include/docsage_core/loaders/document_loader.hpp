#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "docsage_core/types/document.hpp"

namespace fs = std::filesystem;

namespace docsage_core {

class DocumentLoader {
 public:
  virtual ~DocumentLoader() = default;

  // Checks if this loader can handle the given file extension
  virtual bool can_handle(const fs::path &file_path) const = 0;

  // Reads the file and splits it into pages. Throws DocumentLoadError.
  virtual Document load(const fs::path &file_path) const = 0;

 protected:
  // Whole file as bytes. Throws DocumentLoadError if it cannot be read.
  static std::string read_file(const fs::path &file_path);
};

using DocumentLoaderPtr = std::unique_ptr<DocumentLoader>;

}  // namespace docsage_core
