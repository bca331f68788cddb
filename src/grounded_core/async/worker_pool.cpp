#include "grounded_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace grounded_core::async {

WorkerPool::WorkerPool(size_t num_threads) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  // Reserve space in the vector for efficiency
  m_threads.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    m_threads.emplace_back(&WorkerPool::run_loop, this, i);
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping = true;
  }
  m_cv.notify_all();
  for (auto &thread : m_threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

void WorkerPool::enqueue(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopping) {
      throw std::runtime_error("WorkerPool is shutting down; cannot accept new work.");
    }
    m_jobs.push(std::move(job));
  }
  m_cv.notify_one();
}

void WorkerPool::run_loop(size_t worker_id) {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_cv.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });
      if (m_jobs.empty()) {
        return;
      }
      job = std::move(m_jobs.front());
      m_jobs.pop();
    }
    // packaged_task stores the task's exception in its future; only
    // failures of the pool machinery itself reach here
    try {
      job();
    } catch (const std::exception &e) {
      std::cerr << "Worker [" << worker_id << "]: job failed: " << e.what() << std::endl;
    }
  }
}

}  // namespace grounded_core::async
