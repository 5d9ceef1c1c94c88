#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docsage_core/index/vector_index.hpp"
#include "docsage_core/llm/embedder.hpp"

namespace docsage_core {

/**
 * @class Retriever
 * @brief Online half of the pipeline: embeds a query and asks the index.
 *
 * The embedder must be the one (or the same model as the one) the index was
 * built with. A mismatched pairing surfaces as DimensionMismatchError.
 */
class Retriever {
 public:
  Retriever(std::shared_ptr<const VectorIndex> index, std::shared_ptr<Embedder> embedder);

  // Top-k chunks, nearest first. Throws InvalidConfigurationError for k <= 0
  // before anything is embedded.
  std::vector<Chunk> retrieve(const std::string &query, int k) const;

  // Same as retrieve() but keeps the distances.
  std::vector<ScoredChunk> retrieve_scored(const std::string &query, int k) const;

  const VectorIndex &index() const {
    return *index_;
  }

 private:
  std::shared_ptr<const VectorIndex> index_;
  std::shared_ptr<Embedder> embedder_;
};

}  // namespace docsage_core
