#include "docsage_core/services/index_builder.hpp"

#include <algorithm>
#include <iterator>
#include <iostream>

#include "docsage_core/async/cancellation_token.hpp"
#include "docsage_core/errors.hpp"
#include "docsage_core/index/faiss_vector_index.hpp"
#include "docsage_core/text/text_normalizer.hpp"

namespace docsage_core {

IndexBuilder::IndexBuilder(std::shared_ptr<Embedder> embedder,
                           const IndexBuilderOptions &options,
                           VectorIndexFactory index_factory)
    : embedder_(std::move(embedder)), options_(options), index_factory_(std::move(index_factory)) {
  if (!embedder_) {
    throw InvalidConfigurationError("IndexBuilder requires an embedder");
  }
  if (options_.batch_size == 0) {
    throw InvalidConfigurationError("batch_size must be greater than 0");
  }
  if (!index_factory_) {
    index_factory_ = [](DistanceMetric metric) {
      return std::make_unique<FaissVectorIndex>(metric);
    };
  }
}

std::vector<Chunk> IndexBuilder::chunk_document(const Document &document,
                                                int chunk_size,
                                                int chunk_overlap) {
  RecursiveChunker::validate(chunk_size, chunk_overlap);
  const RecursiveChunker chunker;

  std::vector<Chunk> chunks;
  int next_sequence_index = 0;
  for (size_t page = 0; page < document.page_count(); ++page) {
    const std::string normalized = TextNormalizer::normalize(document.page_text(page));
    std::vector<Chunk> page_chunks = chunker.split(
        normalized, chunk_size, chunk_overlap, static_cast<int>(page), next_sequence_index);
    next_sequence_index += static_cast<int>(page_chunks.size());
    std::move(page_chunks.begin(), page_chunks.end(), std::back_inserter(chunks));
  }
  return chunks;
}

std::unique_ptr<VectorIndex> IndexBuilder::build(const Document &document,
                                                 int chunk_size,
                                                 int chunk_overlap,
                                                 const ProgressUpdater &on_progress,
                                                 const async::CancellationToken *cancel) const {
  auto report = [&](float progress, const std::string &message) {
    if (on_progress) {
      on_progress(progress, message);
    }
  };

  RecursiveChunker::validate(chunk_size, chunk_overlap);
  report(0.0f, "Starting build...");

  std::vector<Chunk> chunks = chunk_document(document, chunk_size, chunk_overlap);
  std::cout << "[IndexBuilder] " << document.page_count() << " pages -> " << chunks.size()
            << " chunks" << std::endl;
  report(0.1f, "Chunked " + std::to_string(chunks.size()) + " segments.");

  std::vector<IndexEntry> entries = embed_in_batches(chunks, on_progress, cancel);

  std::unique_ptr<VectorIndex> index = index_factory_(options_.metric);
  if (!index) {
    throw InvalidConfigurationError("Vector index factory returned no index");
  }
  index->add(entries);

  report(1.0f, "Build complete.");
  return index;
}

std::vector<IndexEntry> IndexBuilder::embed_in_batches(
    const std::vector<Chunk> &chunks,
    const ProgressUpdater &on_progress,
    const async::CancellationToken *cancel) const {
  std::vector<IndexEntry> entries;
  entries.reserve(chunks.size());

  for (size_t batch_start = 0; batch_start < chunks.size();
       batch_start += options_.batch_size) {
    if (cancel) {
      cancel->throw_if_cancelled("Index build");
    }

    const size_t batch_end = std::min(chunks.size(), batch_start + options_.batch_size);
    std::vector<std::string> texts;
    texts.reserve(batch_end - batch_start);
    for (size_t i = batch_start; i < batch_end; ++i) {
      texts.push_back(chunks[i].content);
    }

    std::vector<EmbeddingVector> vectors = embedder_->embed_many(texts, cancel);
    if (vectors.size() != texts.size()) {
      throw EmbeddingUnavailableError("Embedder returned " + std::to_string(vectors.size()) +
                                      " vectors for " + std::to_string(texts.size()) + " texts");
    }
    for (size_t i = 0; i < vectors.size(); ++i) {
      entries.push_back({chunks[batch_start + i], std::move(vectors[i])});
    }

    if (on_progress) {
      float progress = 0.1f + (0.85f * (static_cast<float>(batch_end) / chunks.size()));
      on_progress(progress, "Embedded chunk " + std::to_string(batch_end) + " of " +
                                std::to_string(chunks.size()));
    }
  }

  if (cancel) {
    cancel->throw_if_cancelled("Index build");
  }
  return entries;
}

}  // namespace docsage_core
