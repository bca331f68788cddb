#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "grounded_core/llm/embedding_client.hpp"
#include "grounded_core/llm/generation_client.hpp"

namespace grounded_core {

// Embedding and generation backed by a local Ollama server.
class OllamaClient : public EmbeddingClient, public GenerationClient {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &generation_model,
               std::chrono::milliseconds request_timeout = std::chrono::seconds(30));
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> get_embedding(const std::string &text) override;

  std::string generate(const std::string &prompt) override;
  std::unique_ptr<TextStream> generate_stream(const std::string &prompt) override;

  bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;

  void setup_server_connection(std::chrono::milliseconds request_timeout);
};

}  // namespace grounded_core
