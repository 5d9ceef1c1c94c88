#pragma once

#include <vector>

#include "docsage_core/types/chunk.hpp"
#include "docsage_core/types/distance_metric.hpp"

namespace docsage_core {

/**
 * @class VectorIndex
 * @brief Store of (chunk, vector) entries answering k-nearest-neighbour queries.
 *
 * Contract shared by every backend:
 *  - add() inserts a whole batch or nothing; readers never see half a batch;
 *  - query() orders results by increasing distance under metric(), ties by
 *    ascending chunk sequence_index, and returns min(k, size()) results;
 *  - entries are never modified once inserted.
 */
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Throws DimensionMismatchError if any vector disagrees with the stored dimension.
  virtual void add(const std::vector<IndexEntry> &entries) = 0;

  // Throws InvalidConfigurationError for k <= 0, DimensionMismatchError for a wrong-sized query.
  virtual std::vector<ScoredChunk> query(const EmbeddingVector &vector, int k) const = 0;

  virtual size_t size() const = 0;

  // 0 until the first entry is added.
  virtual size_t dimension() const = 0;

  virtual DistanceMetric metric() const = 0;

  // All entries in insertion order.
  virtual std::vector<IndexEntry> entries() const = 0;
};

}  // namespace docsage_core
