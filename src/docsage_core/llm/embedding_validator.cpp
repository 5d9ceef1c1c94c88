#include "docsage_core/llm/embedding_validator.hpp"

#include <cmath>

#include "docsage_core/errors.hpp"

namespace docsage_core {

void EmbeddingValidator::validate(const EmbeddingVector &vector, const std::string &context) {
  if (vector.empty()) {
    throw EmbeddingUnavailableError(context + ": model returned an empty embedding");
  }
  for (size_t i = 0; i < vector.size(); ++i) {
    if (!std::isfinite(vector[i])) {
      throw EmbeddingUnavailableError(context + ": non-finite value at position " +
                                      std::to_string(i));
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (dimension_ == 0) {
    dimension_ = vector.size();
  } else if (vector.size() != dimension_) {
    throw DimensionMismatchError(context, dimension_, vector.size());
  }
}

size_t EmbeddingValidator::dimension() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dimension_;
}

}  // namespace docsage_core
