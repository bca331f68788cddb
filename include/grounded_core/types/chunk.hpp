#pragma once

#include <cstddef>
#include <string>

#include "grounded_core/types/document.hpp"

namespace grounded_core {

// Byte offsets [start, end) into the owning document's text.
struct TextSpan {
  size_t start = 0;
  size_t end = 0;

  size_t length() const {
    return end - start;
  }
  bool operator==(const TextSpan &other) const = default;
};

struct Chunk {
  std::string id;
  std::string document_id;
  TextSpan span;
  std::string text;
  SourceMetadata source;
  std::string version;
};

// Number of bytes two spans share.
inline size_t span_overlap(const TextSpan &a, const TextSpan &b) {
  size_t lo = a.start > b.start ? a.start : b.start;
  size_t hi = a.end < b.end ? a.end : b.end;
  return hi > lo ? hi - lo : 0;
}

}  // namespace grounded_core
