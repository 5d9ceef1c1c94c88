#pragma once

#include <string>

namespace docsage_core {

// Euclidean reports L2 distance; Cosine reports cosine distance (1 - cosine similarity).
// Both are "smaller is closer", so results are always ordered ascending.
enum class DistanceMetric { Euclidean, Cosine };

// Conversion utilities
std::string to_string(DistanceMetric metric);
DistanceMetric distance_metric_from_string(const std::string &str);

}  // namespace docsage_core
