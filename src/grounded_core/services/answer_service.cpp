#include "grounded_core/services/answer_service.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>

#include "grounded_core/errors.hpp"

namespace grounded_core {

AnswerServiceOptions AnswerServiceOptions::from_config(const Config &config) {
  AnswerServiceOptions options;
  options.generation_timeout = std::chrono::milliseconds(config.generation_timeout_ms);
  options.retry.max_retries = config.max_retries;
  options.retry.initial_backoff = std::chrono::milliseconds(config.retry_backoff_ms);
  return options;
}

AnswerStream::AnswerStream(Answer completed) : completed_(std::move(completed)) {}

AnswerStream::AnswerStream(StreamFactory open,
                           std::vector<ScoredChunk> citations,
                           std::chrono::milliseconds increment_timeout,
                           RetryPolicy retry)
    : open_(std::move(open)),
      citations_(std::move(citations)),
      increment_timeout_(increment_timeout),
      retry_(retry) {}

AnswerStream::~AnswerStream() {
  if (stream_) {
    stream_->cancel();
  }
}

std::optional<std::string> AnswerStream::next() {
  if (completed_) {
    if (completed_delivered_ || cancelled_) {
      return std::nullopt;
    }
    completed_delivered_ = true;
    return completed_->text;
  }
  if (done_ || cancelled_) {
    return std::nullopt;
  }

  std::chrono::milliseconds backoff = retry_.initial_backoff;
  while (true) {
    try {
      if (!stream_) {
        stream_ = open_();
      }
      std::optional<std::string> increment = stream_->next(increment_timeout_);
      if (!increment) {
        done_ = true;
        return std::nullopt;
      }
      received_any_ = true;
      text_ += *increment;
      return increment;
    } catch (const CapabilityError &e) {
      if (stream_) {
        stream_->cancel();
        stream_.reset();
      }
      if (received_any_ || attempt_ >= retry_.max_retries) {
        done_ = true;
        throw GenerationUnavailable("Generation failed after " + std::to_string(attempt_ + 1) +
                                    " attempt(s): " + e.what());
      }
      ++attempt_;
      std::cerr << "Warning: Generation failed (attempt " << attempt_ << " of "
                << retry_.max_retries + 1 << "): " << e.what() << ". Retrying in "
                << backoff.count() << "ms." << std::endl;
      std::this_thread::sleep_for(backoff);
      backoff = std::chrono::milliseconds(
          static_cast<long long>(static_cast<double>(backoff.count()) * retry_.backoff_multiplier));
    }
  }
}

void AnswerStream::cancel() {
  if (cancelled_) {
    return;
  }
  cancelled_ = true;
  text_.clear();
  if (stream_) {
    stream_->cancel();
  }
}

Answer AnswerStream::finish() {
  if (cancelled_) {
    Answer answer;
    answer.status = AnswerStatus::Cancelled;
    return answer;
  }
  if (completed_) {
    completed_delivered_ = true;
    return *completed_;
  }
  while (next()) {
  }
  Answer answer;
  answer.text = text_;
  answer.citations = citations_;
  answer.status = AnswerStatus::Grounded;
  return answer;
}

AnswerService::AnswerService(std::shared_ptr<GenerationClient> generation_client,
                             AnswerServiceOptions options)
    : generation_client_(std::move(generation_client)), options_(options) {
  if (!generation_client_) {
    throw std::invalid_argument("AnswerService requires a generation client");
  }
}

AnswerStream AnswerService::stream(const Prompt &prompt, const RetrievalResult &context) const {
  if (!prompt.requires_generation || context.empty()) {
    Answer answer;
    answer.text = prompt.fallback_answer.empty() ? INSUFFICIENT_INFORMATION_ANSWER
                                                 : prompt.fallback_answer;
    answer.status = AnswerStatus::InsufficientInformation;
    return AnswerStream(std::move(answer));
  }

  std::shared_ptr<GenerationClient> client = generation_client_;
  std::string prompt_text = prompt.text;
  return AnswerStream(
      [client, prompt_text]() { return client->generate_stream(prompt_text); }, context.hits,
      options_.generation_timeout, options_.retry);
}

Answer AnswerService::answer(const Prompt &prompt, const RetrievalResult &context) const {
  return stream(prompt, context).finish();
}

}  // namespace grounded_core
