#include "docsage_core/index/faiss_vector_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <mutex>

#include "docsage_core/errors.hpp"

namespace docsage_core {

FaissVectorIndex::FaissVectorIndex(DistanceMetric metric) : metric_(metric) {}

FaissVectorIndex::~FaissVectorIndex() = default;

void FaissVectorIndex::add(const std::vector<IndexEntry> &entries) {
  if (entries.empty()) {
    return;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  // Validate the whole batch before anything is written
  const size_t expected = dimension_ != 0 ? dimension_ : entries.front().vector.size();
  for (const auto &entry : entries) {
    if (entry.vector.empty() || entry.vector.size() != expected) {
      throw DimensionMismatchError(
          "Index entry for chunk " + std::to_string(entry.chunk.sequence_index), expected,
          entry.vector.size());
    }
  }

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(entries.size() * expected);
  for (const auto &entry : entries) {
    all_vectors_flat.insert(all_vectors_flat.end(), entry.vector.begin(), entry.vector.end());
  }
  if (metric_ == DistanceMetric::Cosine) {
    faiss::fvec_renorm_L2(expected, entries.size(), all_vectors_flat.data());
  }

  // Stage the copies first so nothing after the FAISS add can fail
  std::vector<IndexEntry> staged(entries);
  entries_.reserve(entries_.size() + staged.size());

  try {
    std::unique_ptr<faiss::IndexFlat> fresh_index;
    faiss::IndexFlat *target = faiss_index_.get();
    if (!target) {
      fresh_index = create_base_index(expected);
      target = fresh_index.get();
    }
    target->add(static_cast<faiss::idx_t>(staged.size()), all_vectors_flat.data());
    if (fresh_index) {
      faiss_index_ = std::move(fresh_index);
      dimension_ = expected;
    }
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Faiss add failed: " + std::string(e.what()));
  }

  std::move(staged.begin(), staged.end(), std::back_inserter(entries_));
}

std::vector<ScoredChunk> FaissVectorIndex::query(const EmbeddingVector &vector, int k) const {
  if (k <= 0) {
    throw InvalidConfigurationError("k must be greater than 0, got " + std::to_string(k));
  }

  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (entries_.empty()) {
    return {};
  }
  if (vector.size() != dimension_) {
    throw DimensionMismatchError("Query vector", dimension_, vector.size());
  }

  std::vector<float> query_vector(vector);
  if (metric_ == DistanceMetric::Cosine) {
    faiss::fvec_renorm_L2(dimension_, 1, query_vector.data());
  }

  const int total = static_cast<int>(entries_.size());
  const int wanted = std::min(k, total);
  // One extra hit shows whether the k-th result is tied with anything beyond it
  int fetch = std::min(total, wanted + 1);
  std::vector<float> raw_distances;
  std::vector<faiss::idx_t> labels;

  while (true) {
    raw_distances.assign(fetch, 0.0f);
    labels.assign(fetch, -1);
    search_faiss_index(query_vector.data(), fetch, raw_distances, labels);
    // FAISS does not order equal distances; widen until the last hit is strictly farther
    if (fetch == total || raw_distances[fetch - 1] != raw_distances[wanted - 1]) {
      break;
    }
    fetch = std::min(total, fetch * 2);
  }

  std::vector<ScoredChunk> results;
  results.reserve(fetch);
  for (int i = 0; i < fetch; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    const IndexEntry &entry = entries_[static_cast<size_t>(labels[i])];
    results.push_back({entry.chunk, to_distance(raw_distances[i])});
  }

  std::stable_sort(results.begin(), results.end(), [](const ScoredChunk &a, const ScoredChunk &b) {
    if (a.distance != b.distance) {
      return a.distance < b.distance;
    }
    return a.chunk.sequence_index < b.chunk.sequence_index;
  });
  if (results.size() > static_cast<size_t>(wanted)) {
    results.resize(wanted);
  }
  return results;
}

size_t FaissVectorIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

size_t FaissVectorIndex::dimension() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return dimension_;
}

std::vector<IndexEntry> FaissVectorIndex::entries() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_;
}

std::unique_ptr<faiss::IndexFlat> FaissVectorIndex::create_base_index(size_t dimension) const {
  const auto d = static_cast<faiss::idx_t>(dimension);
  if (metric_ == DistanceMetric::Cosine) {
    return std::make_unique<faiss::IndexFlatIP>(d);
  }
  return std::make_unique<faiss::IndexFlatL2>(d);
}

/* Wrapper for faiss search with error handling */
void FaissVectorIndex::search_faiss_index(const float *query,
                                          int k,
                                          std::vector<float> &distances,
                                          std::vector<faiss::idx_t> &labels) const {
  if (!faiss_index_ || faiss_index_->ntotal == 0) {
    throw VectorIndexError("Faiss index not initialized or empty. Cannot perform search.");
  }
  try {
    faiss_index_->search(1, query, k, distances.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Faiss search failed: " + std::string(e.what()));
  }
}

float FaissVectorIndex::to_distance(float raw) const {
  if (metric_ == DistanceMetric::Cosine) {
    return std::max(0.0f, 1.0f - raw);
  }
  // IndexFlatL2 reports squared distances
  return std::sqrt(std::max(0.0f, raw));
}

}  // namespace docsage_core
