#pragma once

#include <faiss/IndexFlat.h>

#include <memory>
#include <shared_mutex>
#include <vector>

#include "docsage_core/index/vector_index.hpp"

namespace docsage_core {

/**
 * @class FaissVectorIndex
 * @brief In-memory VectorIndex backed by an exact FAISS flat index.
 *
 * Euclidean uses IndexFlatL2 (FAISS reports squared L2; results carry the
 * square root). Cosine stores L2-normalized vectors in IndexFlatIP and reports
 * 1 - inner product. FAISS ids are insertion positions, so a label maps
 * straight back into entries_.
 *
 * Queries take a shared lock and adds an exclusive one, so any number of
 * readers can run alongside a single writer.
 */
class FaissVectorIndex : public VectorIndex {
 public:
  explicit FaissVectorIndex(DistanceMetric metric = DistanceMetric::Euclidean);
  ~FaissVectorIndex() override;

  // Disable copy constructor and assignment
  FaissVectorIndex(const FaissVectorIndex &) = delete;
  FaissVectorIndex &operator=(const FaissVectorIndex &) = delete;

  void add(const std::vector<IndexEntry> &entries) override;
  std::vector<ScoredChunk> query(const EmbeddingVector &vector, int k) const override;

  size_t size() const override;
  size_t dimension() const override;
  DistanceMetric metric() const override {
    return metric_;
  }
  std::vector<IndexEntry> entries() const override;

 private:
  DistanceMetric metric_;
  size_t dimension_ = 0;
  std::unique_ptr<faiss::IndexFlat> faiss_index_;
  std::vector<IndexEntry> entries_;
  mutable std::shared_mutex mutex_;

  // Helper methods
  std::unique_ptr<faiss::IndexFlat> create_base_index(size_t dimension) const;
  void search_faiss_index(const float *query,
                          int k,
                          std::vector<float> &distances,
                          std::vector<faiss::idx_t> &labels) const;
  float to_distance(float raw) const;
};

}  // namespace docsage_core
