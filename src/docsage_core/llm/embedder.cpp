#include "docsage_core/llm/embedder.hpp"

#include "docsage_core/async/cancellation_token.hpp"

namespace docsage_core {

std::vector<EmbeddingVector> Embedder::embed_many(const std::vector<std::string> &texts,
                                                  const async::CancellationToken *cancel) {
  std::vector<EmbeddingVector> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    if (cancel) {
      cancel->throw_if_cancelled("Embedding");
    }
    vectors.push_back(embed(text));
  }
  return vectors;
}

}  // namespace docsage_core
