#pragma once

#include <mutex>
#include <string>

#include "docsage_core/types/chunk.hpp"

namespace docsage_core {

// Checks model output and pins the dimensionality on the first good vector.
class EmbeddingValidator {
 public:
  /**
   * @throw EmbeddingUnavailableError for an empty vector or non-finite values.
   * @throw DimensionMismatchError when the length differs from the pinned one.
   */
  void validate(const EmbeddingVector &vector, const std::string &context);

  size_t dimension() const;

 private:
  mutable std::mutex mutex_;
  size_t dimension_ = 0;
};

}  // namespace docsage_core
