#include "docsage_core/services/fingerprint_service.hpp"

#include <openssl/evp.h>

#include <cstdint>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string_view>

#include "docsage_core/errors.hpp"

namespace docsage_core {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext new_sha256_context() {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw DocsageError("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw DocsageError("Failed to initialize SHA256 digest");
  }
  return ctx;
}

void update(EVP_MD_CTX *ctx, const void *data, size_t length) {
  if (EVP_DigestUpdate(ctx, data, length) != 1) {
    throw DocsageError("Failed to update SHA256 digest");
  }
}

std::string finish_hex(EVP_MD_CTX *ctx) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
    throw DocsageError("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

}  // namespace

std::string FingerprintService::fingerprint(const Document &document) {
  DigestContext ctx = new_sha256_context();
  for (size_t page = 0; page < document.page_count(); ++page) {
    const std::string_view text = document.page_text(page);
    // Length prefix, little endian
    const uint64_t length = text.size();
    unsigned char prefix[8];
    for (int i = 0; i < 8; ++i) {
      prefix[i] = static_cast<unsigned char>((length >> (8 * i)) & 0xff);
    }
    update(ctx.get(), prefix, sizeof(prefix));
    update(ctx.get(), text.data(), text.size());
  }
  return finish_hex(ctx.get());
}

std::string FingerprintService::sha256_hex(const std::string &content) {
  DigestContext ctx = new_sha256_context();
  update(ctx.get(), content.data(), content.length());
  return finish_hex(ctx.get());
}

}  // namespace docsage_core
