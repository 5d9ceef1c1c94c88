#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "docsage_core/chunking/recursive_chunker.hpp"
#include "docsage_core/index/vector_index.hpp"
#include "docsage_core/llm/embedder.hpp"
#include "docsage_core/types/document.hpp"

namespace docsage_core {
namespace async {
class CancellationToken;
}

// Fraction in [0, 1] plus a human readable status line.
using ProgressUpdater = std::function<void(float, const std::string &)>;
using VectorIndexFactory = std::function<std::unique_ptr<VectorIndex>(DistanceMetric)>;

struct IndexBuilderOptions {
  DistanceMetric metric = DistanceMetric::Euclidean;
  // Number of chunks handed to the embedder per embed_many call
  size_t batch_size = 64;
};

/**
 * @class IndexBuilder
 * @brief Turns a Document into a populated VectorIndex.
 *
 * normalize -> chunk -> embed (in batches) -> single add into a fresh index.
 * Nothing is returned unless every chunk was embedded, so a failure or a
 * cancellation never leaves a partially filled index behind.
 */
class IndexBuilder {
 public:
  // A default factory produces FaissVectorIndex instances.
  IndexBuilder(std::shared_ptr<Embedder> embedder,
               const IndexBuilderOptions &options = {},
               VectorIndexFactory index_factory = {});

  std::unique_ptr<VectorIndex> build(const Document &document,
                                     int chunk_size,
                                     int chunk_overlap,
                                     const ProgressUpdater &on_progress = {},
                                     const async::CancellationToken *cancel = nullptr) const;

  // Normalized, chunked pages with sequence indices continuous across the document.
  // Needs no embedder.
  static std::vector<Chunk> chunk_document(const Document &document,
                                           int chunk_size,
                                           int chunk_overlap);

  const IndexBuilderOptions &options() const {
    return options_;
  }

 private:
  std::vector<IndexEntry> embed_in_batches(const std::vector<Chunk> &chunks,
                                           const ProgressUpdater &on_progress,
                                           const async::CancellationToken *cancel) const;

  std::shared_ptr<Embedder> embedder_;
  IndexBuilderOptions options_;
  VectorIndexFactory index_factory_;
};

}  // namespace docsage_core
