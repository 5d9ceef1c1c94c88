#pragma once

#include <string>
#include <vector>

#include "docsage_core/types/chunk.hpp"

namespace docsage_core {
namespace async {
class CancellationToken;
}

/**
 * @class Embedder
 * @brief Uniform front for an embedding model.
 *
 * Every vector an instance produces has the same length for the instance's
 * whole lifetime. Implementations must be safe to call from several threads.
 */
class Embedder {
 public:
  virtual ~Embedder() = default;

  // Throws EmbeddingUnavailableError, DimensionMismatchError or TimeoutError.
  virtual EmbeddingVector embed(const std::string &text) = 0;

  // Results are aligned positionally with `texts`. The default implementation
  // calls embed() once per text, checking `cancel` before each call.
  virtual std::vector<EmbeddingVector> embed_many(const std::vector<std::string> &texts,
                                                  const async::CancellationToken *cancel = nullptr);

  // Vector length, or 0 before the first successful embedding.
  virtual size_t dimension() const = 0;
};

}  // namespace docsage_core
