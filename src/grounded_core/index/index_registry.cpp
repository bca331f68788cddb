#include "grounded_core/index/index_registry.hpp"

#include <iostream>
#include <stdexcept>

#include "grounded_core/errors.hpp"

namespace grounded_core {

uint64_t IndexRegistry::publish(std::shared_ptr<const VectorIndex> index) {
  if (!index) {
    throw std::invalid_argument("Cannot publish a null index");
  }
  std::shared_ptr<const VectorIndex> previous;
  uint64_t published_version = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = std::move(current_);
    current_ = std::move(index);
    published_version = ++version_;
  }
  // The old snapshot is released outside the lock
  previous.reset();
  std::cout << "IndexRegistry: published snapshot v" << published_version << std::endl;
  return published_version;
}

std::shared_ptr<const VectorIndex> IndexRegistry::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!current_) {
    throw IndexUnavailable("No index has been built or loaded yet");
  }
  return current_;
}

bool IndexRegistry::has_index() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_ != nullptr;
}

uint64_t IndexRegistry::version() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return version_;
}

void IndexRegistry::teardown() {
  std::shared_ptr<const VectorIndex> previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    previous = std::move(current_);
  }
}

}  // namespace grounded_core
