#pragma once

#include <string>

#include "docsage_core/types/document.hpp"

namespace docsage_core {

class FingerprintService {
 public:
  // Lowercase hex SHA-256 over the document's pages. Page boundaries are part
  // of the digest, so moving text between pages changes the fingerprint.
  static std::string fingerprint(const Document &document);

  // Lowercase hex SHA-256 of a single buffer.
  static std::string sha256_hex(const std::string &content);
};

}  // namespace docsage_core
