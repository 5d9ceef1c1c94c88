#include "docsage_core/loaders/document_loader_factory.hpp"

#include "docsage_core/errors.hpp"
#include "docsage_core/loaders/markdown_loader.hpp"
#include "docsage_core/loaders/plaintext_loader.hpp"

namespace docsage_core {

namespace {

// Accepts anything; registered last.
class FallbackTextLoader : public PlainTextLoader {
 public:
  bool can_handle(const fs::path &) const override {
    return true;
  }
};

}  // namespace

DocumentLoaderFactory::DocumentLoaderFactory() {
  loaders_.push_back(std::make_unique<MarkdownLoader>());
  loaders_.push_back(std::make_unique<PlainTextLoader>());
  loaders_.push_back(std::make_unique<FallbackTextLoader>());
}

const DocumentLoader &DocumentLoaderFactory::get_loader_for(
    const std::filesystem::path &file_path) const {
  for (const auto &loader : loaders_) {
    if (loader->can_handle(file_path)) {
      return *loader;
    }
  }
  throw DocumentLoadError("No suitable document loader found for " + file_path.string());
}

Document DocumentLoaderFactory::load(const std::filesystem::path &file_path) const {
  return get_loader_for(file_path).load(file_path);
}

}  // namespace docsage_core
