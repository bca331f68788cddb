#include "grounded_core/llm/queued_text_stream.hpp"

#include "grounded_core/errors.hpp"

namespace grounded_core {

QueuedTextStream::QueuedTextStream(Producer producer) {
  thread_ = std::thread(&QueuedTextStream::run, this, std::move(producer));
}

QueuedTextStream::~QueuedTextStream() {
  cancel();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void QueuedTextStream::run(Producer producer) {
  std::exception_ptr error;
  try {
    producer(*this);
  } catch (const CapabilityError &) {
    error = std::current_exception();
  } catch (const std::exception &e) {
    error = std::make_exception_ptr(GenerationUnavailable(std::string("Generation failed: ") + e.what()));
  } catch (...) {
    // done_ is set on every exit path
    error = std::make_exception_ptr(GenerationUnavailable("Generation failed: unknown error"));
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
    done_ = true;
  }
  cv_.notify_all();
}

bool QueuedTextStream::push(std::string increment) {
  if (cancelled_.load()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(increment));
  }
  cv_.notify_all();
  return true;
}

std::optional<std::string> QueuedTextStream::next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  bool ready = cv_.wait_for(lock, timeout, [this] {
    return !pending_.empty() || done_ || cancelled_.load();
  });

  if (cancelled_.load()) {
    return std::nullopt;
  }
  if (!pending_.empty()) {
    std::string increment = std::move(pending_.front());
    pending_.pop_front();
    return increment;
  }
  if (done_) {
    if (error_) {
      std::rethrow_exception(error_);
    }
    return std::nullopt;
  }
  if (!ready) {
    lock.unlock();
    cancel();
    throw GenerationUnavailable("Generation timed out after " + std::to_string(timeout.count()) +
                                "ms without producing text");
  }
  return std::nullopt;
}

void QueuedTextStream::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true);
    pending_.clear();
  }
  cv_.notify_all();
}

}  // namespace grounded_core
