#include "grounded_core/llm/embedding_client.hpp"

#include "grounded_core/errors.hpp"

namespace grounded_core {

std::vector<std::vector<float>> EmbeddingClient::get_embeddings(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());
  for (const auto &text : texts) {
    embeddings.push_back(get_embedding(text));
  }
  return embeddings;
}

void verify_embedding_dimension(EmbeddingClient &client, size_t expected_dimension) {
  std::vector<float> sample = client.get_embedding("dimension check");
  if (sample.size() != expected_dimension) {
    throw DimensionMismatch(expected_dimension, sample.size());
  }
}

}  // namespace grounded_core
