#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace grounded_core {

/**
 * @brief Cancellable lazy sequence of generated text increments.
 *
 * next() blocks for at most `timeout`; it returns std::nullopt once the
 * sequence has completed or been cancelled, and throws CapabilityError when
 * the producer failed or the timeout expired.
 */
class TextStream {
 public:
  virtual ~TextStream() = default;

  virtual std::optional<std::string> next(std::chrono::milliseconds timeout) = 0;

  // Stops the producer. Later calls to next() return std::nullopt.
  virtual void cancel() = 0;
};

// A stream whose whole text is already known.
class CompletedTextStream : public TextStream {
 public:
  explicit CompletedTextStream(std::string text) : text_(std::move(text)) {}

  std::optional<std::string> next(std::chrono::milliseconds) override {
    if (delivered_) {
      return std::nullopt;
    }
    delivered_ = true;
    return text_;
  }

  void cancel() override {
    delivered_ = true;
  }

 private:
  std::string text_;
  bool delivered_ = false;
};

// Capability boundary: prompt in, generated text out.
class GenerationClient {
 public:
  virtual ~GenerationClient() = default;

  virtual std::string generate(const std::string &prompt) = 0;

  // Providers that cannot stream deliver the full text as a single increment.
  virtual std::unique_ptr<TextStream> generate_stream(const std::string &prompt) {
    return std::make_unique<CompletedTextStream>(generate(prompt));
  }
};

}  // namespace grounded_core
