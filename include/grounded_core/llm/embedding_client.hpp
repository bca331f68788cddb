#pragma once

#include <string>
#include <vector>

namespace grounded_core {

// Capability boundary: maps text to a fixed-dimension vector.
class EmbeddingClient {
 public:
  virtual ~EmbeddingClient() = default;

  // Throws CapabilityError (usually EmbeddingUnavailable) when the capability fails.
  virtual std::vector<float> get_embedding(const std::string &text) = 0;

  // Default implementation embeds one text at a time.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts);
};

// Startup check: embeds a sample text and compares its length with the configured
// dimension. Throws DimensionMismatch.
void verify_embedding_dimension(EmbeddingClient &client, size_t expected_dimension);

}  // namespace grounded_core
