#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "document_loader.hpp"

namespace docsage_core {

/**
 * @class DocumentLoaderFactory
 * @brief Picks the DocumentLoader for a path.
 *
 * Markdown is tried first; the plain-text loader is the fallback for every
 * other extension.
 */
class DocumentLoaderFactory {
 public:
  DocumentLoaderFactory();

  // Throws DocumentLoadError if no registered loader accepts the path.
  const DocumentLoader &get_loader_for(const std::filesystem::path &file_path) const;

  // Shorthand for get_loader_for(file_path).load(file_path).
  Document load(const std::filesystem::path &file_path) const;

  DocumentLoaderFactory(const DocumentLoaderFactory &) = delete;
  DocumentLoaderFactory &operator=(const DocumentLoaderFactory &) = delete;

 private:
  std::vector<DocumentLoaderPtr> loaders_;
};

}  // namespace docsage_core
