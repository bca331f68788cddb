#pragma once

#include <gmock/gmock.h>

#include <memory>
#include <string>
#include <vector>

#include "grounded_core/llm/embedding_client.hpp"
#include "grounded_core/llm/generation_client.hpp"

namespace grounded_tests {

/**
 * Mock class for the embedding capability
 */
class MockEmbeddingClient : public grounded_core::EmbeddingClient {
 public:
  explicit MockEmbeddingClient(size_t dimension = 16) {
    // Set default behavior to return a valid embedding vector
    std::vector<float> default_embedding(dimension, 0.1f);
    default_embedding[0] = 0.5f;

    ON_CALL(*this, get_embedding(testing::_)).WillByDefault(testing::Return(default_embedding));
  }

  MOCK_METHOD(std::vector<float>, get_embedding, (const std::string &text), (override));
};

/**
 * Mock class for the generation capability. Streaming defaults to a single
 * increment holding whatever generate() returns.
 */
class MockGenerationClient : public grounded_core::GenerationClient {
 public:
  MockGenerationClient() {
    ON_CALL(*this, generate_stream(testing::_))
        .WillByDefault([this](const std::string &prompt) -> std::unique_ptr<grounded_core::TextStream> {
          return std::make_unique<grounded_core::CompletedTextStream>(generate(prompt));
        });
  }

  MOCK_METHOD(std::string, generate, (const std::string &prompt), (override));
  MOCK_METHOD(std::unique_ptr<grounded_core::TextStream>, generate_stream, (const std::string &prompt),
              (override));
};

}  // namespace grounded_tests
