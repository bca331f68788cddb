#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace grounded_core::async {

/**
 * @class WorkerPool
 * @brief Fixed set of threads draining a shared task queue.
 *
 * The pool owns the entire lifecycle of its threads: they start in the
 * constructor and are stopped and joined by the destructor, after the queue
 * has been drained. Work is handed in through submit(), which returns a
 * future for the task's result. Exceptions thrown by a task are delivered
 * through that future.
 */
class WorkerPool {
 public:
  /**
   * @brief Starts the worker threads.
   * @param num_threads The number of worker threads. Must be at least one.
   * @throws std::invalid_argument if num_threads is zero.
   */
  explicit WorkerPool(size_t num_threads);

  /**
   * @brief Finishes queued tasks, then joins all worker threads.
   */
  ~WorkerPool();

  /**
   * @brief Queues a callable and returns a future for its result.
   * @throws std::runtime_error if the pool is shutting down.
   */
  template <typename Fn>
  auto submit(Fn &&fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
    using Result = std::invoke_result_t<std::decay_t<Fn>>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> future = task->get_future();
    enqueue([task]() { (*task)(); });
    return future;
  }

  size_t size() const {
    return m_threads.size();
  }

  // --- Rule of Five: Make the class non-copyable and non-movable ---
  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;
  WorkerPool(WorkerPool &&) = delete;
  WorkerPool &operator=(WorkerPool &&) = delete;

 private:
  void enqueue(std::function<void()> job);

  /**
   * @brief The main loop for a worker thread.
   *
   * Takes jobs off the queue until the pool stops and the queue is empty.
   */
  void run_loop(size_t worker_id);

  std::vector<std::thread> m_threads;
  std::queue<std::function<void()>> m_jobs;
  std::mutex m_mutex;
  std::condition_variable m_cv;
  bool m_stopping = false;
};

}  // namespace grounded_core::async
