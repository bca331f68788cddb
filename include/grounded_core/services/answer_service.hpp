#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "grounded_core/config.hpp"
#include "grounded_core/llm/generation_client.hpp"
#include "grounded_core/llm/retry.hpp"
#include "grounded_core/services/prompt_assembler.hpp"
#include "grounded_core/types/answer.hpp"

namespace grounded_core {

struct AnswerServiceOptions {
  // Longest wait for any single increment of generated text
  std::chrono::milliseconds generation_timeout{30000};
  RetryPolicy retry;

  static AnswerServiceOptions from_config(const Config &config);
};

/**
 * @class AnswerStream
 * @brief Incremental delivery of one answer.
 *
 * The generator is contacted on the first call to next(). A failure before the
 * first increment arrives is retried with backoff; a failure after that ends
 * the stream with GenerationUnavailable, since a restart would repeat text
 * already handed out. cancel() stops the producer and discards partial text.
 * Not thread-safe: next(), cancel() and finish() belong to one consumer.
 */
class AnswerStream {
 public:
  using StreamFactory = std::function<std::unique_ptr<TextStream>()>;

  // A stream that is already complete; next() yields the answer text once.
  explicit AnswerStream(Answer completed);

  AnswerStream(StreamFactory open,
               std::vector<ScoredChunk> citations,
               std::chrono::milliseconds increment_timeout,
               RetryPolicy retry);

  ~AnswerStream();

  AnswerStream(AnswerStream &&) = default;
  AnswerStream &operator=(AnswerStream &&) = default;
  AnswerStream(const AnswerStream &) = delete;
  AnswerStream &operator=(const AnswerStream &) = delete;

  // Returns the next increment, or std::nullopt at the end. Throws GenerationUnavailable.
  std::optional<std::string> next();

  void cancel();

  // Drains what is left and returns the complete answer. Throws GenerationUnavailable.
  Answer finish();

  bool cancelled() const {
    return cancelled_;
  }
  const std::vector<ScoredChunk> &citations() const {
    return citations_;
  }

 private:
  std::optional<Answer> completed_;
  bool completed_delivered_ = false;

  StreamFactory open_;
  std::unique_ptr<TextStream> stream_;
  std::vector<ScoredChunk> citations_;
  std::chrono::milliseconds increment_timeout_{0};
  RetryPolicy retry_;

  std::string text_;
  int attempt_ = 0;
  bool received_any_ = false;
  bool done_ = false;
  bool cancelled_ = false;
};

// Turns an assembled prompt into an answer citing the prompt's context.
class AnswerService {
 public:
  AnswerService(std::shared_ptr<GenerationClient> generation_client, AnswerServiceOptions options = {});

  /**
   * @brief Generates the complete answer.
   *
   * When the prompt carries no context the generator is never called and the
   * insufficient-information answer is returned with zero citations.
   *
   * @throws GenerationUnavailable after the retries are exhausted or on timeout.
   */
  Answer answer(const Prompt &prompt, const RetrievalResult &context) const;

  // Streaming form of answer(). Same short-circuit and error behaviour.
  AnswerStream stream(const Prompt &prompt, const RetrievalResult &context) const;

 private:
  std::shared_ptr<GenerationClient> generation_client_;
  AnswerServiceOptions options_;
};

}  // namespace grounded_core
