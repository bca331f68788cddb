#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

#include "grounded_core/config.hpp"
#include "utilities_test.hpp"

namespace {

using grounded_core::Config;
using grounded_core::ConfigurationError;

nlohmann::json with(const std::string &key, const nlohmann::json &value) {
  nlohmann::json j = nlohmann::json::object();
  j[key] = value;
  return j;
}

}  // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "all-minilm");
  EXPECT_EQ(cfg.chunk_size, 1500);
  EXPECT_EQ(cfg.chunk_overlap, 150);
  EXPECT_EQ(cfg.embedding_dimension, 384);
  EXPECT_EQ(cfg.distance_metric, grounded_core::DistanceMetric::Cosine);
  EXPECT_EQ(cfg.index_kind, grounded_core::IndexKind::Flat);
  EXPECT_EQ(cfg.top_k, 5);
  EXPECT_EQ(cfg.max_context_size, 6000);
  EXPECT_DOUBLE_EQ(cfg.min_similarity_threshold, 0.3);
  EXPECT_EQ(cfg.retrieval_overfetch_factor, 3);
  EXPECT_EQ(cfg.generation_timeout_ms, 30000);
  EXPECT_EQ(cfg.max_retries, 3);
}

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {{"ollama_url", "http://gpu-box:11434"},
                      {"embedding_model", "nomic-embed-text"},
                      {"embedding_dimension", 768},
                      {"distance_metric", "euclidean"},
                      {"index_kind", "hnsw"},
                      {"chunk_size", 800},
                      {"chunk_overlap", 100},
                      {"top_k", 3},
                      {"num_workers", 8}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.ollama_url, "http://gpu-box:11434");
  EXPECT_EQ(cfg.embedding_dimension, 768);
  EXPECT_EQ(cfg.distance_metric, grounded_core::DistanceMetric::Euclidean);
  EXPECT_EQ(cfg.index_kind, grounded_core::IndexKind::Hnsw);
  EXPECT_EQ(cfg.top_k, 3);
  EXPECT_EQ(cfg.num_workers, 8);
  EXPECT_EQ(cfg.corpus_version(), "chunk800-overlap100/nomic-embed-text");
}

TEST(ConfigTest, CorpusVersionChangesWithChunkingParameters) {
  Config a = Config::from_json(with("chunk_overlap", 100));
  Config b = Config::from_json(with("chunk_overlap", 200));
  EXPECT_NE(a.corpus_version(), b.corpus_version());
}

TEST(ConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(Config::from_json(with("ollama_url", "")), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("chunk_overlap", 1500)), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("chunk_size", 0)), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("max_context_size", 100)), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("top_k", 0)), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("min_recall", 1.5)), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("retrieval_overfetch_factor", 0)), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("num_workers", 0)), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("distance_metric", "manhattan")), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("index_kind", "ivf")), ConfigurationError);
}

TEST(ConfigTest, WrongTypesAreNotCoerced) {
  EXPECT_THROW(Config::from_json(with("chunk_size", "big")), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("ollama_url", 42)), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("chunk_size", 1500.7)), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("top_k", 5.0)), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("num_workers", true)), ConfigurationError);
  EXPECT_THROW(Config::from_json(with("max_context_size", 4294967296LL)), ConfigurationError);
}

TEST(ConfigTest, IntegerKeysAcceptParsedIntegers) {
  Config config = Config::from_json(nlohmann::json::parse(R"({"chunk_size": 800, "chunk_overlap": 80})"));
  EXPECT_EQ(config.chunk_size, 800);
  EXPECT_EQ(config.chunk_overlap, 80);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  auto dir = grounded_tests::TestUtilities::create_temp_dir("config");
  auto path = dir / "groundedrc.json";
  std::ofstream(path) << R"JSON({
    "ollama_url": "http://localhost:11434",
    "embedding_model": "all-minilm",
    "index_path": "./store/index",
    "top_k": 4
  })JSON";

  Config cfg = Config::from_file(path.string());
  EXPECT_EQ(cfg.index_path, "./store/index");
  EXPECT_EQ(cfg.top_k, 4);

  std::ofstream(dir / "broken.json") << "{ not json";
  EXPECT_THROW(Config::from_file((dir / "broken.json").string()), ConfigurationError);
  EXPECT_THROW(Config::from_file((dir / "absent.json").string()), ConfigurationError);

  grounded_tests::TestUtilities::cleanup_temp_dir(dir);
}
