#include "docsage_core/services/retriever.hpp"

#include "docsage_core/errors.hpp"

namespace docsage_core {

Retriever::Retriever(std::shared_ptr<const VectorIndex> index, std::shared_ptr<Embedder> embedder)
    : index_(std::move(index)), embedder_(std::move(embedder)) {
  if (!index_) {
    throw InvalidConfigurationError("Retriever requires a vector index");
  }
  if (!embedder_) {
    throw InvalidConfigurationError("Retriever requires an embedder");
  }
}

std::vector<Chunk> Retriever::retrieve(const std::string &query, int k) const {
  std::vector<ScoredChunk> scored = retrieve_scored(query, k);
  std::vector<Chunk> chunks;
  chunks.reserve(scored.size());
  for (auto &hit : scored) {
    chunks.push_back(std::move(hit.chunk));
  }
  return chunks;
}

std::vector<ScoredChunk> Retriever::retrieve_scored(const std::string &query, int k) const {
  if (k <= 0) {
    throw InvalidConfigurationError("k must be greater than 0, got " + std::to_string(k));
  }
  EmbeddingVector query_vector = embedder_->embed(query);
  return index_->query(query_vector, k);
}

}  // namespace docsage_core
