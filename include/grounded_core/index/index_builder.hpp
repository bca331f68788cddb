#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "grounded_core/config.hpp"
#include "grounded_core/index/vector_index.hpp"
#include "grounded_core/llm/embedding_client.hpp"
#include "grounded_core/llm/retry.hpp"
#include "grounded_core/types/document.hpp"

namespace grounded_core {

// Receives a completion fraction in [0, 1] and a human-readable message.
using ProgressUpdater = std::function<void(float, const std::string &)>;

struct IndexBuildOptions {
  size_t chunk_size = 1500;
  size_t chunk_overlap = 150;
  std::string corpus_version;
  DistanceMetric metric = DistanceMetric::Cosine;
  IndexOptions index;
  double min_recall = 0.95;
  size_t num_workers = 4;
  RetryPolicy retry;
  // Stored vectors reused as queries for the HNSW recall check
  size_t recall_sample_queries = 64;
  size_t recall_k = 10;

  static IndexBuildOptions from_config(const Config &config);
};

/**
 * @class IndexBuilder
 * @brief Chunks documents, embeds the chunks and builds a vector index.
 *
 * Embedding runs on a bounded worker pool. Results are placed by chunk
 * position, so rebuilding from unchanged input yields an identical index.
 * An HNSW index is only returned if its recall against the exact index meets
 * min_recall; otherwise the exact index is returned instead.
 */
class IndexBuilder {
 public:
  IndexBuilder(EmbeddingClient &embedding_client, IndexBuildOptions options);

  /**
   * @brief Builds an index over every usable document.
   *
   * Documents with an empty id, a duplicate id or invalid UTF-8 are skipped
   * with a warning.
   *
   * @throws EmptyInput if no document yields a chunk.
   * @throws CapabilityError if embedding still fails after the retries.
   * @throws DimensionMismatch if the embedding capability returns vectors of the wrong size.
   */
  std::shared_ptr<const VectorIndex> build(const std::vector<Document> &documents,
                                           const ProgressUpdater &on_progress = {}) const;

  // Chunks every valid document in input order.
  std::vector<Chunk> chunk_documents(const std::vector<Document> &documents) const;

  const IndexBuildOptions &options() const {
    return options_;
  }

 private:
  std::vector<std::vector<float>> embed_chunks(const std::vector<Chunk> &chunks,
                                               const ProgressUpdater &on_progress) const;
  std::shared_ptr<const VectorIndex> build_trusted_index(std::vector<IndexEntry> entries) const;

  EmbeddingClient &embedding_client_;
  IndexBuildOptions options_;
};

}  // namespace grounded_core
