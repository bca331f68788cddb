#include "grounded_core/index/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <system_error>
#include <unordered_set>

#include "grounded_core/errors.hpp"
#include "grounded_core/index/sidecar_store.hpp"
#include "grounded_core/util/content_hash.hpp"

namespace grounded_core {

namespace {

faiss::MetricType to_faiss_metric(DistanceMetric metric) {
  return metric == DistanceMetric::Cosine ? faiss::METRIC_INNER_PRODUCT : faiss::METRIC_L2;
}

std::unique_ptr<faiss::Index> create_base_index(size_t dimension,
                                                DistanceMetric metric,
                                                const IndexOptions &options) {
  const int d = static_cast<int>(dimension);
  if (options.kind == IndexKind::Hnsw) {
    auto hnsw_index = std::make_unique<faiss::IndexHNSWFlat>(d, options.hnsw_m, to_faiss_metric(metric));
    hnsw_index->hnsw.efConstruction = options.hnsw_ef_construction;
    hnsw_index->hnsw.efSearch = options.hnsw_ef_search;
    return hnsw_index;
  }
  if (metric == DistanceMetric::Cosine) {
    return std::make_unique<faiss::IndexFlatIP>(d);
  }
  return std::make_unique<faiss::IndexFlatL2>(d);
}

IndexKind kind_of(const faiss::Index *index) {
  return dynamic_cast<const faiss::IndexHNSW *>(index) != nullptr ? IndexKind::Hnsw
                                                                  : IndexKind::Flat;
}

}  // namespace

VectorIndex::VectorIndex(std::unique_ptr<faiss::Index> index,
                         std::vector<Chunk> chunks,
                         DistanceMetric metric,
                         IndexKind kind,
                         std::string corpus_version)
    : index_(std::move(index)),
      chunks_(std::move(chunks)),
      dimension_(static_cast<size_t>(index_->d)),
      metric_(metric),
      kind_(kind),
      corpus_version_(std::move(corpus_version)) {}

std::shared_ptr<const VectorIndex> VectorIndex::build(std::vector<IndexEntry> entries,
                                                      DistanceMetric metric,
                                                      const IndexOptions &options) {
  if (entries.empty()) {
    throw EmptyInput("Cannot build a vector index from an empty input");
  }

  const size_t dimension =
      options.expected_dimension > 0 ? options.expected_dimension : entries.front().embedding.size();
  if (dimension == 0) {
    throw ConfigurationError("Embeddings must have at least one dimension");
  }
  const std::string &version = entries.front().chunk.version;

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(entries.size() * dimension);
  std::vector<Chunk> chunks;
  chunks.reserve(entries.size());

  for (auto &entry : entries) {
    if (entry.embedding.size() != dimension) {
      throw DimensionMismatch(dimension, entry.embedding.size());
    }
    if (entry.chunk.version != version) {
      throw ConfigurationError("Refusing to mix chunk versions '" + version + "' and '" +
                               entry.chunk.version + "' in one index");
    }
    all_vectors_flat.insert(all_vectors_flat.end(), entry.embedding.begin(), entry.embedding.end());
    chunks.push_back(std::move(entry.chunk));
  }

  if (metric == DistanceMetric::Cosine) {
    faiss::fvec_renorm_L2(dimension, chunks.size(), all_vectors_flat.data());
  }

  std::unique_ptr<faiss::Index> index;
  try {
    index = create_base_index(dimension, metric, options);
    // Add all vectors to the Faiss index in one go
    index->add(static_cast<faiss::idx_t>(chunks.size()), all_vectors_flat.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError(std::string("Failed to build faiss index: ") + e.what());
  }

  return std::shared_ptr<const VectorIndex>(
      new VectorIndex(std::move(index), std::move(chunks), metric, options.kind, version));
}

float VectorIndex::to_score(float raw_distance) const {
  if (metric_ == DistanceMetric::Cosine) {
    return raw_distance;
  }
  // faiss reports squared L2 distances
  return 1.0f / (1.0f + std::sqrt(std::max(0.0f, raw_distance)));
}

RetrievalResult VectorIndex::search(const std::vector<float> &query_vector, size_t k) const {
  if (query_vector.size() != dimension_) {
    throw DimensionMismatch(dimension_, query_vector.size());
  }

  RetrievalResult result;
  const size_t actual_k = std::min(k, chunks_.size());
  if (actual_k == 0) {
    return result;
  }

  std::vector<float> query = query_vector;
  if (metric_ == DistanceMetric::Cosine) {
    faiss::fvec_renorm_L2(dimension_, 1, query.data());
  }

  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  try {
    index_->search(1, query.data(), static_cast<faiss::idx_t>(actual_k), distances.data(),
                   labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError(std::string("faiss search failed: ") + e.what());
  }

  result.hits.reserve(actual_k);
  for (size_t i = 0; i < actual_k; ++i) {
    const faiss::idx_t label = labels[i];
    // Graph indexes may come back with fewer than k labels
    if (label < 0 || static_cast<size_t>(label) >= chunks_.size()) {
      continue;
    }
    result.hits.push_back({chunks_[static_cast<size_t>(label)], to_score(distances[i])});
  }
  std::stable_sort(result.hits.begin(), result.hits.end(),
                   [](const ScoredChunk &a, const ScoredChunk &b) { return a.score > b.score; });
  return result;
}

std::vector<std::vector<float>> VectorIndex::vectors() const {
  std::vector<float> flat(chunks_.size() * dimension_);
  if (!chunks_.empty()) {
    index_->reconstruct_n(0, static_cast<faiss::idx_t>(chunks_.size()), flat.data());
  }
  std::vector<std::vector<float>> out;
  out.reserve(chunks_.size());
  for (size_t i = 0; i < chunks_.size(); ++i) {
    out.emplace_back(flat.begin() + i * dimension_, flat.begin() + (i + 1) * dimension_);
  }
  return out;
}

void VectorIndex::persist(const std::filesystem::path &path) const {
  namespace fs = std::filesystem;
  // "dir/index/" and "dir/index" name the same target; staging and backup are its siblings
  fs::path target = path.lexically_normal();
  if (!target.has_filename()) {
    target = target.parent_path();
  }
  if (target.empty() || target.filename() == "." || target.filename() == "..") {
    throw VectorIndexError("Invalid index path: " + path.string());
  }
  const fs::path staging = target.parent_path() / (target.filename().string() + ".tmp");
  const fs::path backup = target.parent_path() / (target.filename().string() + ".old");

  std::error_code ec;
  fs::remove_all(staging, ec);
  fs::create_directories(staging, ec);
  if (ec) {
    throw VectorIndexError("Failed to create index directory " + staging.string() + ": " +
                           ec.message());
  }

  const fs::path vectors_path = staging / VECTORS_FILE;
  try {
    faiss::write_index(index_.get(), vectors_path.c_str());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to write vectors to " + vectors_path.string() + ": " + e.what());
  }

  IndexManifest manifest;
  manifest.schema_version = SidecarStore::SCHEMA_VERSION;
  manifest.dimension = dimension_;
  manifest.metric = metric_;
  manifest.kind = kind_;
  manifest.corpus_version = corpus_version_;
  manifest.vector_count = chunks_.size();
  manifest.vectors_sha256 = sha256_file_hex(vectors_path);
  SidecarStore::write(staging / METADATA_FILE, manifest, chunks_);

  // Swap the finished copy into place. The old index stays recoverable until the swap succeeds.
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
  }
  fs::remove_all(backup, ec);
  const bool replacing = fs::exists(target);
  if (replacing) {
    fs::rename(target, backup, ec);
    if (ec) {
      throw VectorIndexError("Failed to move aside existing index at " + target.string() + ": " +
                             ec.message());
    }
  }
  fs::rename(staging, target, ec);
  if (ec) {
    const std::string reason = ec.message();
    if (replacing) {
      std::error_code restore_ec;
      fs::rename(backup, target, restore_ec);
      if (restore_ec) {
        std::cerr << "Warning: VectorIndex: could not restore previous index from " << backup
                  << ": " << restore_ec.message() << std::endl;
      }
    }
    throw VectorIndexError("Failed to publish index to " + target.string() + ": " + reason);
  }
  if (replacing) {
    fs::remove_all(backup, ec);
    if (ec) {
      std::cerr << "Warning: VectorIndex: could not remove previous index at " << backup << ": "
                << ec.message() << std::endl;
    }
  }
  std::cout << "Persisted index with " << chunks_.size() << " vectors (dimension " << dimension_
            << ", " << to_string(metric_) << ", " << to_string(kind_) << ") to " << target
            << std::endl;
}

std::shared_ptr<const VectorIndex> VectorIndex::load(const std::filesystem::path &path,
                                                     const IndexExpectations &expectations) {
  const std::filesystem::path vectors_path = path / VECTORS_FILE;
  const std::filesystem::path metadata_path = path / METADATA_FILE;
  if (!std::filesystem::exists(vectors_path) || !std::filesystem::exists(metadata_path)) {
    throw IndexCorruption("Index at " + path.string() + " is missing " + VECTORS_FILE + " or " +
                          METADATA_FILE + "; rebuild it");
  }

  SidecarContents sidecar = SidecarStore::read(metadata_path);
  const IndexManifest &manifest = sidecar.manifest;

  if (manifest.dimension != expectations.dimension) {
    throw IncompatibleIndex("Index at " + path.string() + " has dimension " +
                            std::to_string(manifest.dimension) + ", expected " +
                            std::to_string(expectations.dimension));
  }
  if (manifest.metric != expectations.metric) {
    throw IncompatibleIndex("Index at " + path.string() + " uses metric " +
                            to_string(manifest.metric) + ", expected " +
                            to_string(expectations.metric));
  }
  if (!expectations.corpus_version.empty() &&
      manifest.corpus_version != expectations.corpus_version) {
    throw IncompatibleIndex("Index at " + path.string() + " was built for corpus version '" +
                            manifest.corpus_version + "', expected '" +
                            expectations.corpus_version + "'");
  }

  std::string actual_sha;
  try {
    actual_sha = sha256_file_hex(vectors_path);
  } catch (const std::runtime_error &e) {
    throw IndexCorruption(std::string("Cannot read index vectors: ") + e.what());
  }
  if (actual_sha != manifest.vectors_sha256) {
    throw IndexCorruption("Checksum mismatch for " + vectors_path.string() + "; rebuild the index");
  }

  std::unique_ptr<faiss::Index> index;
  try {
    index.reset(faiss::read_index(vectors_path.c_str()));
  } catch (const faiss::FaissException &e) {
    throw IndexCorruption("Failed to read faiss index " + vectors_path.string() + ": " + e.what());
  }

  if (static_cast<size_t>(index->d) != manifest.dimension ||
      index->metric_type != to_faiss_metric(manifest.metric) || kind_of(index.get()) != manifest.kind) {
    throw IndexCorruption("Vectors in " + vectors_path.string() + " disagree with the manifest");
  }
  if (static_cast<size_t>(index->ntotal) != manifest.vector_count ||
      sidecar.chunks.size() != manifest.vector_count) {
    throw IndexCorruption("Index at " + path.string() + " holds " + std::to_string(index->ntotal) +
                          " vectors and " + std::to_string(sidecar.chunks.size()) +
                          " metadata rows, manifest says " + std::to_string(manifest.vector_count));
  }

  return std::shared_ptr<const VectorIndex>(new VectorIndex(std::move(index),
                                                            std::move(sidecar.chunks),
                                                            manifest.metric, manifest.kind,
                                                            manifest.corpus_version));
}

double VectorIndex::measure_recall(const VectorIndex &candidate,
                                   const VectorIndex &reference,
                                   const std::vector<std::vector<float>> &queries,
                                   size_t k) {
  size_t expected = 0;
  size_t found = 0;
  for (const auto &query : queries) {
    RetrievalResult exact = reference.search(query, k);
    RetrievalResult approximate = candidate.search(query, k);

    std::unordered_set<std::string> returned;
    for (const auto &hit : approximate.hits) {
      returned.insert(hit.chunk.id);
    }
    for (const auto &hit : exact.hits) {
      ++expected;
      if (returned.count(hit.chunk.id) > 0) {
        ++found;
      }
    }
  }
  return expected == 0 ? 1.0 : static_cast<double>(found) / static_cast<double>(expected);
}

}  // namespace grounded_core
