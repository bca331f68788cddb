#pragma once

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "grounded_core/errors.hpp"

namespace grounded_core {

struct RetryPolicy {
  int max_retries = 3;
  std::chrono::milliseconds initial_backoff{200};
  double backoff_multiplier = 2.0;
};

// Calls fn, retrying CapabilityError with exponential backoff. Any other
// exception propagates immediately; the last CapabilityError is rethrown once
// the retries are exhausted.
template <typename Fn>
auto with_retry(const RetryPolicy &policy, const std::string &operation, Fn &&fn) -> decltype(fn()) {
  std::chrono::milliseconds backoff = policy.initial_backoff;
  for (int attempt = 0;; ++attempt) {
    try {
      return fn();
    } catch (const CapabilityError &e) {
      if (attempt >= policy.max_retries) {
        throw;
      }
      std::cerr << "Warning: " << operation << " failed (attempt " << attempt + 1 << " of "
                << policy.max_retries + 1 << "): " << e.what() << ". Retrying in "
                << backoff.count() << "ms." << std::endl;
      std::this_thread::sleep_for(backoff);
      backoff = std::chrono::milliseconds(
          static_cast<long long>(static_cast<double>(backoff.count()) * policy.backoff_multiplier));
    }
  }
}

}  // namespace grounded_core
