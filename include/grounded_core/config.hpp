#pragma once

#include <fstream>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

#include "grounded_core/errors.hpp"
#include "grounded_core/types/metric.hpp"

namespace grounded_core {

class Config {
 public:
  // Capability endpoints
  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;

  // Chunking
  int chunk_size;
  int chunk_overlap;

  // Index
  std::string index_path;
  int embedding_dimension;
  DistanceMetric distance_metric;
  IndexKind index_kind;
  int hnsw_m;
  int hnsw_ef_construction;
  int hnsw_ef_search;
  double min_recall;

  // Retrieval
  int top_k;
  int max_context_size;
  double min_similarity_threshold;
  int retrieval_overfetch_factor;
  double dedup_overlap_threshold;
  int snippet_length;

  // Generation
  int generation_timeout_ms;
  int max_retries;
  int retry_backoff_ms;

  // Concurrency and evaluation
  int num_workers;
  double attribution_min_overlap;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception &e) {
      throw ConfigurationError(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    Config config;
    try {
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
      config.generation_model = json_config.value("generation_model", std::string("llama3.2"));

      config.chunk_size = integer_value(json_config, "chunk_size", 1500);
      config.chunk_overlap = integer_value(json_config, "chunk_overlap", 150);

      config.index_path =
          json_config.value("index_path", std::string("./vector_store/complaint_index"));
      config.embedding_dimension = integer_value(json_config, "embedding_dimension", 384);
      config.distance_metric =
          distance_metric_from_string(json_config.value("distance_metric", std::string("cosine")));
      config.index_kind = index_kind_from_string(json_config.value("index_kind", std::string("flat")));
      config.hnsw_m = integer_value(json_config, "hnsw_m", 32);
      config.hnsw_ef_construction = integer_value(json_config, "hnsw_ef_construction", 100);
      config.hnsw_ef_search = integer_value(json_config, "hnsw_ef_search", 64);
      config.min_recall = json_config.value("min_recall", 0.95);

      config.top_k = integer_value(json_config, "top_k", 5);
      config.max_context_size = integer_value(json_config, "max_context_size", 6000);
      config.min_similarity_threshold = json_config.value("min_similarity_threshold", 0.3);
      config.retrieval_overfetch_factor = integer_value(json_config, "retrieval_overfetch_factor", 3);
      config.dedup_overlap_threshold = json_config.value("dedup_overlap_threshold", 0.5);
      config.snippet_length = integer_value(json_config, "snippet_length", 200);

      config.generation_timeout_ms = integer_value(json_config, "generation_timeout_ms", 30000);
      config.max_retries = integer_value(json_config, "max_retries", 3);
      config.retry_backoff_ms = integer_value(json_config, "retry_backoff_ms", 200);

      config.num_workers = integer_value(json_config, "num_workers", 4);
      config.attribution_min_overlap = json_config.value("attribution_min_overlap", 0.5);
    } catch (const nlohmann::json::type_error &e) {
      // Wrong value types are never coerced
      throw ConfigurationError(std::string("Invalid configuration value: ") + e.what());
    }

    config.validate();
    return config;
  }

  // Version tag shared by every chunk built under these parameters.
  std::string corpus_version() const {
    return "chunk" + std::to_string(chunk_size) + "-overlap" + std::to_string(chunk_overlap) +
           "/" + embedding_model;
  }

 private:
  // Integer keys reject fractional numbers instead of truncating them.
  static int integer_value(const nlohmann::json &json_config, const std::string &key, int default_value) {
    auto it = json_config.find(key);
    if (it == json_config.end()) {
      return default_value;
    }
    if (!it->is_number_integer()) {
      throw ConfigurationError("Invalid configuration value: " + key + " must be an integer, got " +
                               it->dump());
    }
    const bool in_range =
        it->is_number_unsigned()
            ? it->get<unsigned long long>() <= static_cast<unsigned long long>(std::numeric_limits<int>::max())
            : it->get<long long>() >= std::numeric_limits<int>::min() &&
                  it->get<long long>() <= std::numeric_limits<int>::max();
    if (!in_range) {
      throw ConfigurationError("Invalid configuration value: " + key + " is out of range");
    }
    return it->get<int>();
  }

  void validate() const {
    if (ollama_url.empty()) {
      throw ConfigurationError("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw ConfigurationError("embedding_model cannot be empty");
    }
    if (generation_model.empty()) {
      throw ConfigurationError("generation_model cannot be empty");
    }
    if (index_path.empty()) {
      throw ConfigurationError("index_path cannot be empty");
    }
    if (chunk_size <= 0) {
      throw ConfigurationError("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw ConfigurationError("chunk_overlap must satisfy 0 <= chunk_overlap < chunk_size");
    }
    if (embedding_dimension <= 0) {
      throw ConfigurationError("embedding_dimension must be greater than 0");
    }
    if (hnsw_m < 2 || hnsw_ef_construction <= 0 || hnsw_ef_search <= 0) {
      throw ConfigurationError("hnsw parameters must be positive (hnsw_m >= 2)");
    }
    if (min_recall <= 0.0 || min_recall > 1.0) {
      throw ConfigurationError("min_recall must be in (0, 1]");
    }
    if (top_k < 1) {
      throw ConfigurationError("top_k must be at least 1");
    }
    if (max_context_size < chunk_size) {
      throw ConfigurationError("max_context_size must be at least chunk_size so one chunk always fits");
    }
    if (min_similarity_threshold < -1.0 || min_similarity_threshold > 1.0) {
      throw ConfigurationError("min_similarity_threshold must be in [-1, 1]");
    }
    if (retrieval_overfetch_factor < 1) {
      throw ConfigurationError("retrieval_overfetch_factor must be at least 1");
    }
    if (dedup_overlap_threshold < 0.0 || dedup_overlap_threshold > 1.0) {
      throw ConfigurationError("dedup_overlap_threshold must be in [0, 1]");
    }
    if (snippet_length <= 0) {
      throw ConfigurationError("snippet_length must be greater than 0");
    }
    if (generation_timeout_ms < 100) {
      throw ConfigurationError("generation_timeout_ms must be at least 100ms");
    }
    if (max_retries < 0 || retry_backoff_ms < 0) {
      throw ConfigurationError("max_retries and retry_backoff_ms cannot be negative");
    }
    if (num_workers <= 0) {
      throw ConfigurationError("num_workers must be greater than 0");
    }
    if (attribution_min_overlap < 0.0 || attribution_min_overlap > 1.0) {
      throw ConfigurationError("attribution_min_overlap must be in [0, 1]");
    }
  }
};

}  // namespace grounded_core
