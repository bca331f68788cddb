#include "grounded_core/llm/ollama_client.hpp"

#include <algorithm>

#include "grounded_core/errors.hpp"
#include "grounded_core/llm/queued_text_stream.hpp"
#include "ollama.hpp"

namespace grounded_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &generation_model,
                           std::chrono::milliseconds request_timeout)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      generation_model_(generation_model) {
  setup_server_connection(request_timeout);
}

void OllamaClient::setup_server_connection(std::chrono::milliseconds request_timeout) {
  ollama::setServerURL(ollama_url_);
  const int timeout_seconds =
      std::max(1, static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(request_timeout).count()));
  ollama::setReadTimeout(timeout_seconds);
  ollama::setWriteTimeout(timeout_seconds);

  if (!ollama::is_running()) {
    throw CapabilityError("Ollama server is not running at " + ollama_url_);
  }
}

std::vector<float> OllamaClient::get_embedding(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw EmbeddingUnavailable("Response does not contain embeddings field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw EmbeddingUnavailable("Embeddings field is not a non-empty array");
    }
    if (embeddings[0].is_array()) {
      // Array of arrays - take the first embedding vector
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();

  } catch (const ollama::exception &e) {
    throw EmbeddingUnavailable("Embedding generation failed: " + std::string(e.what()));
  }
}

std::string OllamaClient::generate(const std::string &prompt) {
  try {
    ollama::response response = ollama::generate(generation_model_, prompt);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw GenerationUnavailable("Text generation failed: " + std::string(e.what()));
  }
}

std::unique_ptr<TextStream> OllamaClient::generate_stream(const std::string &prompt) {
  std::string model = generation_model_;
  return std::make_unique<QueuedTextStream>([model, prompt](QueuedTextStream &stream) {
    try {
      // Returning false from the callback asks ollama-hpp to stop streaming
      ollama::generate(model, prompt, [&stream](const ollama::response &response) {
        return stream.push(response.as_simple_string());
      });
    } catch (const ollama::exception &e) {
      throw GenerationUnavailable("Streaming generation failed: " + std::string(e.what()));
    }
  });
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace grounded_core
