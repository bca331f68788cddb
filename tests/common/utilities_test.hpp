#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "grounded_core/index/index_builder.hpp"
#include "grounded_core/index/index_registry.hpp"
#include "grounded_core/index/vector_index.hpp"
#include "grounded_core/llm/embedding_client.hpp"
#include "grounded_core/llm/generation_client.hpp"
#include "grounded_core/types.hpp"

namespace grounded_tests {

/**
 * Deterministic embedder for tests. Each vocabulary word feeds one axis; all
 * other words are ignored, so text without vocabulary words embeds to the
 * zero vector and scores 0 against everything.
 */
class KeywordEmbedder : public grounded_core::EmbeddingClient {
 public:
  static constexpr size_t DEFAULT_DIMENSION = 16;

  explicit KeywordEmbedder(size_t dimension = DEFAULT_DIMENSION) : dimension_(dimension) {}

  std::vector<float> get_embedding(const std::string &text) override;

  int call_count() const {
    return calls_.load();
  }

 private:
  size_t dimension_;
  std::atomic<int> calls_{0};
};

/**
 * TextStream that replays fixed increments. Optionally fails once the
 * increments run out, and records cancellation in a flag shared with the test.
 */
class ScriptedTextStream : public grounded_core::TextStream {
 public:
  explicit ScriptedTextStream(std::vector<std::string> increments,
                              std::shared_ptr<std::atomic<bool>> cancelled_flag = nullptr,
                              bool fail_at_end = false);

  std::optional<std::string> next(std::chrono::milliseconds timeout) override;
  void cancel() override;

 private:
  std::vector<std::string> increments_;
  size_t position_ = 0;
  bool cancelled_ = false;
  bool fail_at_end_;
  std::shared_ptr<std::atomic<bool>> cancelled_flag_;
};

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Filesystem utilities
  static std::filesystem::path create_temp_dir(const std::string &prefix);
  static void cleanup_temp_dir(const std::filesystem::path &dir);

  // Test data creation
  static grounded_core::Document make_document(const std::string &id,
                                               const std::string &product,
                                               const std::string &text,
                                               const std::string &company = "Acme Bank",
                                               const std::string &date = "2023-01-15");

  // "late-fee", "card-fraud" and "transfer-delay" complaints, one chunk each.
  static std::vector<grounded_core::Document> scenario_documents();

  static grounded_core::Chunk make_chunk(const std::string &document_id,
                                         int ordinal,
                                         const std::string &text,
                                         size_t start = 0,
                                         const std::string &version = "test-v1",
                                         const std::string &product = "");

  static std::vector<float> unit_vector(size_t dimension, size_t axis, float value = 1.0f);

  static grounded_core::IndexBuildOptions scenario_build_options(
      size_t dimension = KeywordEmbedder::DEFAULT_DIMENSION);
};

/**
 * Base test fixture that builds the three-complaint index with the keyword
 * embedder and publishes it in a registry.
 */
class ScenarioIndexTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    embedder_ = std::make_shared<KeywordEmbedder>();
    registry_ = std::make_shared<grounded_core::IndexRegistry>();
    grounded_core::IndexBuilder builder(*embedder_, TestUtilities::scenario_build_options());
    index_ = builder.build(TestUtilities::scenario_documents());
    registry_->publish(index_);
  }

  void TearDown() override {
    registry_->teardown();
    index_.reset();
  }

  std::shared_ptr<KeywordEmbedder> embedder_;
  std::shared_ptr<grounded_core::IndexRegistry> registry_;
  std::shared_ptr<const grounded_core::VectorIndex> index_;
};

}  // namespace grounded_tests
