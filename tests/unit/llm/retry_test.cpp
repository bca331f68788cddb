#include <gtest/gtest.h>

#include <stdexcept>

#include "grounded_core/errors.hpp"
#include "grounded_core/llm/retry.hpp"

namespace grounded_tests {

using namespace grounded_core;

class RetryTest : public ::testing::Test {
 protected:
  RetryPolicy fast_policy(int max_retries) {
    RetryPolicy policy;
    policy.max_retries = max_retries;
    policy.initial_backoff = std::chrono::milliseconds(1);
    return policy;
  }
};

TEST_F(RetryTest, ReturnsFirstSuccess) {
  int calls = 0;
  int result = with_retry(fast_policy(3), "op", [&]() {
    ++calls;
    return 42;
  });
  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 1);
}

TEST_F(RetryTest, RetriesCapabilityErrorsUntilSuccess) {
  int calls = 0;
  std::string result = with_retry(fast_policy(3), "op", [&]() -> std::string {
    if (++calls < 3) {
      throw EmbeddingUnavailable("busy");
    }
    return "ok";
  });
  EXPECT_EQ(result, "ok");
  EXPECT_EQ(calls, 3);
}

TEST_F(RetryTest, RethrowsAfterRetriesExhausted) {
  int calls = 0;
  EXPECT_THROW(with_retry(fast_policy(2), "op",
                          [&]() -> int {
                            ++calls;
                            throw GenerationUnavailable("down");
                          }),
               GenerationUnavailable);
  EXPECT_EQ(calls, 3);
}

TEST_F(RetryTest, DoesNotRetryOtherErrors) {
  int calls = 0;
  EXPECT_THROW(with_retry(fast_policy(5), "op",
                          [&]() -> int {
                            ++calls;
                            throw DimensionMismatch(384, 256);
                          }),
               DimensionMismatch);
  EXPECT_EQ(calls, 1);
}

}  // namespace grounded_tests
