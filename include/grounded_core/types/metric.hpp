#pragma once

#include <string>

namespace grounded_core {

enum class DistanceMetric { Cosine, Euclidean };

// Flat is the exact scan; Hnsw is the approximate graph index.
enum class IndexKind { Flat, Hnsw };

// Conversion utilities
std::string to_string(DistanceMetric metric);
DistanceMetric distance_metric_from_string(const std::string &str);

std::string to_string(IndexKind kind);
IndexKind index_kind_from_string(const std::string &str);

}  // namespace grounded_core
