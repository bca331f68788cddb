#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <faiss/Index.h>

#include "grounded_core/types/chunk.hpp"
#include "grounded_core/types/metric.hpp"
#include "grounded_core/types/retrieval.hpp"

namespace grounded_core {

struct IndexEntry {
  Chunk chunk;
  std::vector<float> embedding;
};

struct IndexOptions {
  IndexKind kind = IndexKind::Flat;
  // Zero means "take the dimension of the first embedding"
  size_t expected_dimension = 0;
  int hnsw_m = 32;
  int hnsw_ef_construction = 100;
  int hnsw_ef_search = 64;
};

// What the caller requires of a persisted index.
struct IndexExpectations {
  size_t dimension = 0;
  DistanceMetric metric = DistanceMetric::Cosine;
  // Empty accepts any corpus version
  std::string corpus_version;
};

/**
 * @class VectorIndex
 * @brief Immutable set of (chunk, embedding) pairs searchable by similarity.
 *
 * Backed by a faiss flat index (exact scan) or an HNSW graph. The distance
 * metric is fixed at build time. Cosine indexes hold L2-normalized vectors in
 * an inner-product index; Euclidean indexes use an L2 index. Scores returned
 * by search() are always higher-is-more-similar: the cosine similarity, or
 * 1 / (1 + distance) for Euclidean.
 *
 * Instances are only handed out as shared_ptr<const VectorIndex>; once built
 * they are safe to search from any number of threads.
 */
class VectorIndex {
 public:
  static constexpr const char *VECTORS_FILE = "vectors.faiss";
  static constexpr const char *METADATA_FILE = "metadata.db";

  /**
   * @brief Builds an index from the given entries.
   * @throws EmptyInput if entries is empty.
   * @throws DimensionMismatch if an embedding disagrees with the index dimension.
   * @throws ConfigurationError if the chunks carry different version tags.
   */
  static std::shared_ptr<const VectorIndex> build(std::vector<IndexEntry> entries,
                                                  DistanceMetric metric,
                                                  const IndexOptions &options = {});

  /**
   * @brief Loads an index written by persist().
   * @throws IncompatibleIndex if dimension, metric or corpus version differ from the expectations.
   * @throws IndexCorruption if files are missing or fail integrity checks.
   */
  static std::shared_ptr<const VectorIndex> load(const std::filesystem::path &path,
                                                 const IndexExpectations &expectations);

  // Returns min(k, size()) hits ordered by score, highest first.
  RetrievalResult search(const std::vector<float> &query_vector, size_t k) const;

  // Writes the index directory. Replaces an existing one only after the new copy is complete.
  void persist(const std::filesystem::path &path) const;

  // Stored vectors in index order (normalized for cosine indexes).
  std::vector<std::vector<float>> vectors() const;

  // Fraction of the reference top-k chunk ids that the candidate also returns.
  static double measure_recall(const VectorIndex &candidate,
                               const VectorIndex &reference,
                               const std::vector<std::vector<float>> &queries,
                               size_t k);

  size_t dimension() const {
    return dimension_;
  }
  size_t size() const {
    return chunks_.size();
  }
  DistanceMetric metric() const {
    return metric_;
  }
  IndexKind kind() const {
    return kind_;
  }
  const std::string &corpus_version() const {
    return corpus_version_;
  }
  const std::vector<Chunk> &chunks() const {
    return chunks_;
  }

  // Disable copy constructor and assignment
  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

 private:
  VectorIndex(std::unique_ptr<faiss::Index> index,
              std::vector<Chunk> chunks,
              DistanceMetric metric,
              IndexKind kind,
              std::string corpus_version);

  float to_score(float raw_distance) const;

  std::unique_ptr<faiss::Index> index_;
  std::vector<Chunk> chunks_;
  size_t dimension_;
  DistanceMetric metric_;
  IndexKind kind_;
  std::string corpus_version_;
};

}  // namespace grounded_core
