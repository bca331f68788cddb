#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include "grounded_core/async/worker_pool.hpp"

namespace grounded_tests {

using grounded_core::async::WorkerPool;

TEST(WorkerPoolTest, RequiresAtLeastOneThread) {
  EXPECT_THROW(WorkerPool(0), std::invalid_argument);
}

TEST(WorkerPoolTest, FuturesCarryResultsInSubmissionOrder) {
  WorkerPool pool(3);
  EXPECT_EQ(pool.size(), 3u);

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 20; ++i) {
    futures.push_back(pool.submit([i]() { return i * i; }));
  }
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(futures[i].get(), i * i);
  }
}

TEST(WorkerPoolTest, TaskExceptionsSurfaceThroughTheFuture) {
  WorkerPool pool(1);
  auto failing = pool.submit([]() -> std::string { throw std::runtime_error("boom"); });
  auto healthy = pool.submit([]() { return std::string("ok"); });

  EXPECT_THROW(failing.get(), std::runtime_error);
  EXPECT_EQ(healthy.get(), "ok");
}

TEST(WorkerPoolTest, DestructorDrainsQueuedWork) {
  std::atomic<int> completed{0};
  {
    WorkerPool pool(2);
    for (int i = 0; i < 100; ++i) {
      pool.submit([&completed]() { ++completed; });
    }
  }
  EXPECT_EQ(completed.load(), 100);
}

}  // namespace grounded_tests
