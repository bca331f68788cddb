#include "grounded_core/services/retriever.hpp"

#include <algorithm>
#include <stdexcept>

namespace grounded_core {

namespace {

bool is_near_duplicate(const ScoredChunk &candidate,
                       const std::vector<ScoredChunk> &kept,
                       double overlap_threshold) {
  for (const auto &existing : kept) {
    if (existing.chunk.document_id != candidate.chunk.document_id) {
      continue;
    }
    const size_t shorter = std::min(existing.chunk.span.length(), candidate.chunk.span.length());
    if (shorter == 0) {
      continue;
    }
    const double shared = static_cast<double>(span_overlap(existing.chunk.span, candidate.chunk.span)) /
                          static_cast<double>(shorter);
    if (shared > overlap_threshold) {
      return true;
    }
  }
  return false;
}

}  // namespace

RetrieverOptions RetrieverOptions::from_config(const Config &config) {
  RetrieverOptions options;
  options.min_similarity_threshold = config.min_similarity_threshold;
  options.overfetch_factor = static_cast<size_t>(config.retrieval_overfetch_factor);
  options.dedup_overlap_threshold = config.dedup_overlap_threshold;
  options.retry.max_retries = config.max_retries;
  options.retry.initial_backoff = std::chrono::milliseconds(config.retry_backoff_ms);
  return options;
}

Retriever::Retriever(std::shared_ptr<EmbeddingClient> embedding_client,
                     std::shared_ptr<const IndexRegistry> registry,
                     RetrieverOptions options)
    : embedding_client_(std::move(embedding_client)),
      registry_(std::move(registry)),
      options_(options) {
  if (!embedding_client_ || !registry_) {
    throw std::invalid_argument("Retriever requires an embedding client and an index registry");
  }
  if (options_.overfetch_factor == 0) {
    throw ConfigurationError("retrieval_overfetch_factor must be at least 1");
  }
}

std::vector<float> Retriever::embed_query(const std::string &query) const {
  return with_retry(options_.retry, "Embedding query",
                    [&]() { return embedding_client_->get_embedding(query); });
}

RetrievalResult Retriever::retrieve(const std::string &query,
                                    size_t k,
                                    size_t max_context_size) const {
  RetrievalResult result;
  if (k == 0) {
    return result;
  }

  std::vector<float> query_embedding = embed_query(query);
  std::shared_ptr<const VectorIndex> snapshot = registry_->current();
  RetrievalResult candidates = snapshot->search(query_embedding, k * options_.overfetch_factor);

  // Candidates arrive best first, so a duplicate is always the lower scorer
  std::vector<ScoredChunk> kept;
  for (auto &candidate : candidates.hits) {
    if (candidate.score < options_.min_similarity_threshold) {
      continue;
    }
    if (is_near_duplicate(candidate, kept, options_.dedup_overlap_threshold)) {
      continue;
    }
    kept.push_back(std::move(candidate));
    if (kept.size() == k) {
      break;
    }
  }

  size_t context_bytes = 0;
  for (auto &hit : kept) {
    if (context_bytes + hit.chunk.text.size() > max_context_size) {
      break;
    }
    context_bytes += hit.chunk.text.size();
    result.hits.push_back(std::move(hit));
  }
  return result;
}

}  // namespace grounded_core
