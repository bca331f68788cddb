#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "grounded_core/types/chunk.hpp"
#include "grounded_core/types/metric.hpp"

namespace grounded_core {

struct IndexManifest {
  int schema_version = 0;
  size_t dimension = 0;
  DistanceMetric metric = DistanceMetric::Cosine;
  IndexKind kind = IndexKind::Flat;
  std::string corpus_version;
  size_t vector_count = 0;
  std::string vectors_sha256;
};

struct SidecarContents {
  IndexManifest manifest;
  std::vector<Chunk> chunks;  // in index order
};

// SQLite file holding the manifest and the chunk metadata that sits beside the
// faiss vectors. Row `position` i describes vector i.
class SidecarStore {
 public:
  static constexpr int SCHEMA_VERSION = 1;

  // Throws VectorIndexError when the file cannot be written.
  static void write(const std::filesystem::path &db_path,
                    const IndexManifest &manifest,
                    const std::vector<Chunk> &chunks);

  // Throws IndexCorruption when the file is unreadable, incomplete or from an
  // unknown schema version.
  static SidecarContents read(const std::filesystem::path &db_path);
};

}  // namespace grounded_core
