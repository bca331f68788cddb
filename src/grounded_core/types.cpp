#include "grounded_core/types.hpp"

#include "grounded_core/errors.hpp"

namespace grounded_core {

std::string to_string(DistanceMetric metric) {
  switch (metric) {
    case DistanceMetric::Cosine:
      return "cosine";
    case DistanceMetric::Euclidean:
      return "euclidean";
    default:
      return "unknown";
  }
}

DistanceMetric distance_metric_from_string(const std::string &str) {
  if (str == "cosine")
    return DistanceMetric::Cosine;
  if (str == "euclidean")
    return DistanceMetric::Euclidean;
  throw ConfigurationError("Unknown distance metric: '" + str + "' (expected cosine|euclidean)");
}

std::string to_string(IndexKind kind) {
  switch (kind) {
    case IndexKind::Flat:
      return "flat";
    case IndexKind::Hnsw:
      return "hnsw";
    default:
      return "unknown";
  }
}

IndexKind index_kind_from_string(const std::string &str) {
  if (str == "flat")
    return IndexKind::Flat;
  if (str == "hnsw")
    return IndexKind::Hnsw;
  throw ConfigurationError("Unknown index kind: '" + str + "' (expected flat|hnsw)");
}

std::string to_string(AnswerStatus status) {
  switch (status) {
    case AnswerStatus::Grounded:
      return "grounded";
    case AnswerStatus::InsufficientInformation:
      return "insufficient_information";
    case AnswerStatus::Cancelled:
      return "cancelled";
    default:
      return "unknown";
  }
}

}  // namespace grounded_core
