#pragma once

#include <memory>
#include <string>

#include "grounded_core/config.hpp"
#include "grounded_core/index/index_registry.hpp"
#include "grounded_core/llm/embedding_client.hpp"
#include "grounded_core/llm/retry.hpp"
#include "grounded_core/types/retrieval.hpp"

namespace grounded_core {

struct RetrieverOptions {
  double min_similarity_threshold = 0.3;
  size_t overfetch_factor = 3;
  // Fraction of the shorter span two chunks of one document may share before
  // the lower-scoring one is dropped
  double dedup_overlap_threshold = 0.5;
  RetryPolicy retry;

  static RetrieverOptions from_config(const Config &config);
};

class Retriever {
 public:
  Retriever(std::shared_ptr<EmbeddingClient> embedding_client,
            std::shared_ptr<const IndexRegistry> registry,
            RetrieverOptions options = {});

  /**
   * @brief Finds up to k chunks relevant to the query.
   *
   * Over-fetches k * overfetch_factor candidates from the current snapshot,
   * drops those under the similarity threshold, collapses overlapping chunks
   * of one document, then keeps the best-scoring prefix whose text fits in
   * max_context_size bytes. An empty result means nothing relevant was found.
   *
   * @throws EmbeddingUnavailable if the query cannot be embedded after retries.
   * @throws IndexUnavailable if no snapshot is published.
   * @throws DimensionMismatch if the query embedding disagrees with the index.
   */
  RetrievalResult retrieve(const std::string &query, size_t k, size_t max_context_size) const;

  const RetrieverOptions &options() const {
    return options_;
  }

 private:
  std::vector<float> embed_query(const std::string &query) const;

  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<const IndexRegistry> registry_;
  RetrieverOptions options_;
};

}  // namespace grounded_core
