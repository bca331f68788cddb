#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

#include "grounded_core/llm/generation_client.hpp"

namespace grounded_core {

/**
 * @class QueuedTextStream
 * @brief Turns a callback-driven producer into a pull-based TextStream.
 *
 * The producer runs on a thread owned by the stream and hands increments over
 * through push(). The destructor cancels the producer and joins the thread, so
 * no state outlives the stream.
 */
class QueuedTextStream : public TextStream {
 public:
  using Producer = std::function<void(QueuedTextStream &)>;

  explicit QueuedTextStream(Producer producer);
  ~QueuedTextStream() override;

  std::optional<std::string> next(std::chrono::milliseconds timeout) override;
  void cancel() override;

  // Producer side. Returns false once the consumer has cancelled.
  bool push(std::string increment);
  bool cancelled() const {
    return cancelled_.load();
  }

  QueuedTextStream(const QueuedTextStream &) = delete;
  QueuedTextStream &operator=(const QueuedTextStream &) = delete;
  QueuedTextStream(QueuedTextStream &&) = delete;
  QueuedTextStream &operator=(QueuedTextStream &&) = delete;

 private:
  void run(Producer producer);

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> pending_;
  bool done_ = false;
  std::exception_ptr error_;
  std::atomic<bool> cancelled_{false};
  std::thread thread_;
};

}  // namespace grounded_core
