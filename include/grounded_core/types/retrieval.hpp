#pragma once

#include <vector>

#include "grounded_core/types/chunk.hpp"

namespace grounded_core {

struct ScoredChunk {
  Chunk chunk;
  float score;  // higher is more similar
};

// Ordered by score, highest first. Empty means no chunk cleared the similarity threshold.
struct RetrievalResult {
  std::vector<ScoredChunk> hits;

  bool empty() const {
    return hits.empty();
  }
  size_t size() const {
    return hits.size();
  }
};

}  // namespace grounded_core
