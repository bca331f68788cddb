#include "grounded_core/index/index_builder.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <iostream>
#include <unordered_set>

#include "grounded_core/async/worker_pool.hpp"
#include "grounded_core/chunking/text_chunker.hpp"
#include "grounded_core/errors.hpp"

namespace grounded_core {

namespace {

void report(const ProgressUpdater &on_progress, float fraction, const std::string &message) {
  if (on_progress) {
    on_progress(fraction, message);
  }
}

}  // namespace

IndexBuildOptions IndexBuildOptions::from_config(const Config &config) {
  IndexBuildOptions options;
  options.chunk_size = static_cast<size_t>(config.chunk_size);
  options.chunk_overlap = static_cast<size_t>(config.chunk_overlap);
  options.corpus_version = config.corpus_version();
  options.metric = config.distance_metric;
  options.index.kind = config.index_kind;
  options.index.expected_dimension = static_cast<size_t>(config.embedding_dimension);
  options.index.hnsw_m = config.hnsw_m;
  options.index.hnsw_ef_construction = config.hnsw_ef_construction;
  options.index.hnsw_ef_search = config.hnsw_ef_search;
  options.min_recall = config.min_recall;
  options.num_workers = static_cast<size_t>(config.num_workers);
  options.retry.max_retries = config.max_retries;
  options.retry.initial_backoff = std::chrono::milliseconds(config.retry_backoff_ms);
  return options;
}

IndexBuilder::IndexBuilder(EmbeddingClient &embedding_client, IndexBuildOptions options)
    : embedding_client_(embedding_client), options_(std::move(options)) {
  if (options_.chunk_size <= options_.chunk_overlap) {
    throw ConfigurationError("chunk_size must be greater than chunk_overlap");
  }
  if (options_.num_workers == 0) {
    throw ConfigurationError("num_workers must be greater than 0");
  }
}

std::vector<Chunk> IndexBuilder::chunk_documents(const std::vector<Document> &documents) const {
  TextChunker chunker(options_.chunk_size, options_.chunk_overlap, options_.corpus_version);
  std::unordered_set<std::string> seen_ids;
  std::vector<Chunk> chunks;

  for (const auto &document : documents) {
    if (document.id.empty()) {
      std::cerr << "Warning: IndexBuilder: skipping document without an id" << std::endl;
      continue;
    }
    if (!seen_ids.insert(document.id).second) {
      std::cerr << "Warning: IndexBuilder: skipping duplicate document " << document.id
                << std::endl;
      continue;
    }
    try {
      std::vector<Chunk> document_chunks = chunker.chunk(document);
      chunks.insert(chunks.end(), std::make_move_iterator(document_chunks.begin()),
                    std::make_move_iterator(document_chunks.end()));
    } catch (const DataError &e) {
      std::cerr << "Warning: IndexBuilder: skipping document " << document.id << ": " << e.what()
                << std::endl;
    }
  }
  return chunks;
}

std::vector<std::vector<float>> IndexBuilder::embed_chunks(const std::vector<Chunk> &chunks,
                                                           const ProgressUpdater &on_progress) const {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(chunks.size());

  // Set on the first failure so queued jobs return without calling the capability
  std::atomic<bool> aborted{false};
  async::WorkerPool pool(std::min(options_.num_workers, chunks.size()));

  std::vector<std::future<std::vector<float>>> pending;
  pending.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    pending.push_back(pool.submit([this, &chunk, &aborted]() -> std::vector<float> {
      if (aborted.load()) {
        return {};
      }
      return with_retry(options_.retry, "Embedding chunk " + chunk.id,
                        [&]() { return embedding_client_.get_embedding(chunk.text); });
    }));
  }

  for (size_t i = 0; i < pending.size(); ++i) {
    try {
      embeddings.push_back(pending[i].get());
    } catch (const std::exception &) {
      aborted.store(true);
      throw;
    }
    if (embeddings.back().empty()) {
      aborted.store(true);
      throw EmbeddingUnavailable("Received empty embedding for chunk " + chunks[i].id);
    }
    if (i % 10 == 0 || i + 1 == pending.size()) {
      float progress = 0.1f + (0.8f * (static_cast<float>(i + 1) / chunks.size()));
      report(on_progress, progress,
             "Embedding chunk " + std::to_string(i + 1) + " of " + std::to_string(chunks.size()));
    }
  }
  return embeddings;
}

std::shared_ptr<const VectorIndex> IndexBuilder::build(const std::vector<Document> &documents,
                                                       const ProgressUpdater &on_progress) const {
  report(on_progress, 0.0f, "Chunking " + std::to_string(documents.size()) + " documents...");
  std::vector<Chunk> chunks = chunk_documents(documents);
  if (chunks.empty()) {
    throw EmptyInput("No usable documents to index");
  }
  report(on_progress, 0.1f, "Produced " + std::to_string(chunks.size()) + " chunks.");

  std::vector<std::vector<float>> embeddings = embed_chunks(chunks, on_progress);

  std::vector<IndexEntry> entries;
  entries.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    entries.push_back({std::move(chunks[i]), std::move(embeddings[i])});
  }

  report(on_progress, 0.9f, "Building vector index...");
  auto index = build_trusted_index(std::move(entries));
  report(on_progress, 1.0f, "Index ready with " + std::to_string(index->size()) + " vectors.");
  return index;
}

std::shared_ptr<const VectorIndex> IndexBuilder::build_trusted_index(
    std::vector<IndexEntry> entries) const {
  IndexOptions exact_options = options_.index;
  exact_options.kind = IndexKind::Flat;

  if (options_.index.kind == IndexKind::Flat) {
    return VectorIndex::build(std::move(entries), options_.metric, exact_options);
  }

  auto approximate = VectorIndex::build(entries, options_.metric, options_.index);
  auto exact = VectorIndex::build(std::move(entries), options_.metric, exact_options);

  // Query with an evenly spaced sample of the stored vectors
  std::vector<std::vector<float>> stored = exact->vectors();
  const size_t sample_size = std::min(options_.recall_sample_queries, stored.size());
  std::vector<std::vector<float>> queries;
  queries.reserve(sample_size);
  for (size_t i = 0; i < sample_size; ++i) {
    queries.push_back(stored[i * stored.size() / sample_size]);
  }

  const double recall = VectorIndex::measure_recall(*approximate, *exact, queries, options_.recall_k);
  if (recall < options_.min_recall) {
    std::cerr << "Warning: IndexBuilder: HNSW recall " << recall << " is below min_recall "
              << options_.min_recall << "; falling back to the exact index." << std::endl;
    return exact;
  }
  std::cout << "IndexBuilder: HNSW recall " << recall << " accepted." << std::endl;
  return approximate;
}

}  // namespace grounded_core
