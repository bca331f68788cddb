#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "grounded_core/index/vector_index.hpp"

namespace grounded_core {

/**
 * @class IndexRegistry
 * @brief Holds the index snapshot that queries read from.
 *
 * publish() swaps in a new snapshot atomically. Readers that already hold the
 * previous snapshot keep it alive until they drop their reference, so a
 * rebuild never disturbs a query in flight.
 */
class IndexRegistry {
 public:
  IndexRegistry() = default;

  // Returns the version number assigned to the published snapshot.
  uint64_t publish(std::shared_ptr<const VectorIndex> index);

  // Throws IndexUnavailable when nothing has been published.
  std::shared_ptr<const VectorIndex> current() const;

  bool has_index() const;

  // 0 until the first publish.
  uint64_t version() const;

  // Drops the registry's reference. Readers holding a snapshot are unaffected.
  void teardown();

  IndexRegistry(const IndexRegistry &) = delete;
  IndexRegistry &operator=(const IndexRegistry &) = delete;

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const VectorIndex> current_;
  uint64_t version_ = 0;
};

}  // namespace grounded_core
