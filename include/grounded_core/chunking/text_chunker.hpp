#pragma once

#include <optional>
#include <string>
#include <vector>

#include "grounded_core/types/chunk.hpp"
#include "grounded_core/types/document.hpp"

namespace grounded_core {

/**
 * @brief Lazy, restartable walk over the chunks of one document.
 *
 * Chunks are produced in document order. Consecutive spans overlap by at most
 * the configured overlap, and together they cover every byte of the text.
 * The document must outlive the sequence.
 */
class ChunkSequence {
 public:
  ChunkSequence(const Document &document, size_t max_size, size_t overlap, std::string version);

  // Returns the next chunk, or std::nullopt once the document is exhausted.
  std::optional<Chunk> next();

  // Rewinds to the first chunk.
  void reset();

 private:
  size_t find_cut(size_t start, size_t window_end) const;
  size_t next_start(size_t cut) const;

  const Document &document_;
  size_t max_size_;
  size_t overlap_;
  std::string version_;

  size_t cursor_ = 0;
  int ordinal_ = 0;
  bool exhausted_ = false;
};

class TextChunker {
 public:
  // Sizes are in bytes. Requires max_size > overlap.
  TextChunker(size_t max_size, size_t overlap, std::string version = "");

  ChunkSequence chunk_lazily(const Document &document) const;

  // Eagerly drains chunk_lazily().
  std::vector<Chunk> chunk(const Document &document) const;

  size_t max_size() const {
    return max_size_;
  }
  size_t overlap() const {
    return overlap_;
  }
  const std::string &version() const {
    return version_;
  }

 private:
  size_t max_size_;
  size_t overlap_;
  std::string version_;
};

}  // namespace grounded_core
