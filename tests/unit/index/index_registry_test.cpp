#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "grounded_core/errors.hpp"
#include "grounded_core/index/index_registry.hpp"
#include "utilities_test.hpp"

namespace grounded_tests {

using namespace grounded_core;

class IndexRegistryTest : public ::testing::Test {
 protected:
  std::shared_ptr<const VectorIndex> make_index(const std::string &document_id) {
    std::vector<IndexEntry> entries;
    entries.push_back({TestUtilities::make_chunk(document_id, 0, "text"), TestUtilities::unit_vector(4, 0)});
    return VectorIndex::build(std::move(entries), DistanceMetric::Cosine);
  }
};

TEST_F(IndexRegistryTest, EmptyRegistryRefusesToServe) {
  IndexRegistry registry;
  EXPECT_FALSE(registry.has_index());
  EXPECT_EQ(registry.version(), 0u);
  EXPECT_THROW(registry.current(), IndexUnavailable);
}

TEST_F(IndexRegistryTest, PublishSwapsSnapshotAndBumpsVersion) {
  IndexRegistry registry;
  EXPECT_EQ(registry.publish(make_index("first")), 1u);
  EXPECT_EQ(registry.current()->chunks().at(0).document_id, "first");

  EXPECT_EQ(registry.publish(make_index("second")), 2u);
  EXPECT_EQ(registry.current()->chunks().at(0).document_id, "second");
  EXPECT_EQ(registry.version(), 2u);
}

TEST_F(IndexRegistryTest, ReadersKeepTheirSnapshotAcrossPublish) {
  IndexRegistry registry;
  registry.publish(make_index("old"));
  std::shared_ptr<const VectorIndex> held = registry.current();

  registry.publish(make_index("new"));
  EXPECT_EQ(held->chunks().at(0).document_id, "old");
  EXPECT_EQ(held->search(TestUtilities::unit_vector(4, 0), 1).size(), 1u);
}

TEST_F(IndexRegistryTest, TeardownLeavesHeldSnapshotsUsable) {
  IndexRegistry registry;
  registry.publish(make_index("only"));
  auto held = registry.current();

  registry.teardown();
  EXPECT_THROW(registry.current(), IndexUnavailable);
  EXPECT_EQ(held->size(), 1u);
}

TEST_F(IndexRegistryTest, RejectsNullPublish) {
  IndexRegistry registry;
  EXPECT_THROW(registry.publish(nullptr), std::invalid_argument);
}

TEST_F(IndexRegistryTest, ConcurrentReadersDuringPublish) {
  IndexRegistry registry;
  registry.publish(make_index("v0"));
  std::atomic<bool> stop{false};
  std::atomic<int> failures{0};

  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i) {
    readers.emplace_back([&]() {
      while (!stop.load()) {
        auto snapshot = registry.current();
        if (snapshot->search(TestUtilities::unit_vector(4, 0), 1).size() != 1u) {
          ++failures;
        }
      }
    });
  }
  for (int v = 1; v <= 20; ++v) {
    registry.publish(make_index("v" + std::to_string(v)));
  }
  stop = true;
  for (auto &reader : readers) {
    reader.join();
  }
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(registry.version(), 21u);
}

}  // namespace grounded_tests
