#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "grounded_core/config.hpp"
#include "grounded_core/services/answer_service.hpp"
#include "grounded_core/services/retriever.hpp"
#include "grounded_core/types/answer.hpp"

namespace grounded_core {

enum class AskStatus { Answered, NoAnswer, TemporarilyUnavailable };

std::string to_string(AskStatus status);

inline constexpr const char *TEMPORARILY_UNAVAILABLE_ANSWER =
    "The answering service is temporarily unavailable. Please try again shortly.";

// What a caller sees of one cited chunk.
struct Citation {
  std::string document_id;
  TextSpan span;
  std::string snippet;
  float score = 0.0f;
  SourceMetadata source;
};

struct AskResponse {
  AskStatus status = AskStatus::NoAnswer;
  std::string answer;
  std::vector<Citation> citations;
  // Set when status is TemporarilyUnavailable
  std::string error;
};

struct AskStream {
  AskStatus status = AskStatus::NoAnswer;
  std::vector<Citation> citations;
  // Absent when status is TemporarilyUnavailable
  std::optional<AnswerStream> answer;
  std::string error;
};

struct PipelineOptions {
  size_t max_context_size = 6000;
  size_t snippet_length = 200;

  static PipelineOptions from_config(const Config &config);
};

/**
 * @class RagPipeline
 * @brief The question answering entry point.
 *
 * Retrieves context for a question, assembles the prompt and generates a
 * cited answer. A question without relevant context is answered with the
 * insufficient-information text and no citations; a capability outage is
 * reported as TemporarilyUnavailable, never as "no results".
 */
class RagPipeline {
 public:
  RagPipeline(std::shared_ptr<const Retriever> retriever,
              std::shared_ptr<const AnswerService> answer_service,
              PipelineOptions options = {});

  /**
   * @throws std::invalid_argument if k < 1 or the question is blank.
   * @throws IndexUnavailable if no index is published.
   */
  AskResponse ask(const std::string &question, int k) const;

  // Retrieval happens before this returns; generation happens as the stream is read.
  AskStream ask_stream(const std::string &question, int k) const;

  // Full answer with the cited chunks. Capability errors propagate.
  Answer run(const std::string &question, int k) const;

  static Citation make_citation(const ScoredChunk &hit, size_t snippet_length);
  static std::vector<Citation> make_citations(const std::vector<ScoredChunk> &hits,
                                              size_t snippet_length);

  // Longest prefix of text within max_bytes that ends on a code point boundary.
  static std::string snippet(const std::string &text, size_t max_bytes);

  const PipelineOptions &options() const {
    return options_;
  }

 private:
  RetrievalResult retrieve(const std::string &question, int k) const;

  std::shared_ptr<const Retriever> retriever_;
  std::shared_ptr<const AnswerService> answer_service_;
  PipelineOptions options_;
};

}  // namespace grounded_core
