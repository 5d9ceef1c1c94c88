#include "docsage_core/loaders/document_loader.hpp"

#include <fstream>
#include <sstream>

#include "docsage_core/errors.hpp"

namespace docsage_core {

std::string DocumentLoader::read_file(const fs::path &file_path) {
  std::error_code ec;
  if (!fs::is_regular_file(file_path, ec)) {
    throw DocumentLoadError("Not a readable file: " + file_path.string());
  }

  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentLoadError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw DocumentLoadError("Failed while reading file: " + file_path.string());
  }
  return buffer.str();
}

}  // namespace docsage_core
