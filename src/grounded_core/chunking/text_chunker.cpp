#include "grounded_core/chunking/text_chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

#include "grounded_core/errors.hpp"

namespace grounded_core {

namespace {

// Highest priority first: paragraph, line, sentence, word.
constexpr std::array<std::string_view, 6> BOUNDARY_SEPARATORS = {"\n\n", "\n", ". ", "! ", "? ",
                                                                 " "};

bool is_trail_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_blank(const std::string &text) {
  return std::all_of(text.begin(), text.end(), is_space);
}

}  // namespace

ChunkSequence::ChunkSequence(const Document &document,
                             size_t max_size,
                             size_t overlap,
                             std::string version)
    : document_(document), max_size_(max_size), overlap_(overlap), version_(std::move(version)) {
  if (!utf8::is_valid(document_.text.begin(), document_.text.end())) {
    throw DataError("Document " + document_.id + " is not valid UTF-8");
  }
  reset();
}

void ChunkSequence::reset() {
  cursor_ = 0;
  ordinal_ = 0;
  exhausted_ = is_blank(document_.text);
}

std::optional<Chunk> ChunkSequence::next() {
  const std::string &text = document_.text;
  if (exhausted_ || cursor_ >= text.size()) {
    exhausted_ = true;
    return std::nullopt;
  }

  const size_t start = cursor_;
  size_t cut;
  if (text.size() - start <= max_size_) {
    cut = text.size();
    exhausted_ = true;
  } else {
    cut = find_cut(start, start + max_size_);
    cursor_ = next_start(cut);
  }

  Chunk chunk;
  chunk.id = document_.id + "#" + std::to_string(ordinal_++);
  chunk.document_id = document_.id;
  chunk.span = {start, cut};
  chunk.text = text.substr(start, cut - start);
  chunk.source = document_.source;
  chunk.version = version_;
  return chunk;
}

/**
 * @brief Picks the end of the chunk starting at `start`.
 *
 * Tries each separator in priority order, accepting the last occurrence that
 * still leaves the chunk at least half a window long (and longer than the
 * overlap, so the sequence always advances). Falls back to a hard cut at the
 * window end, moved back onto a code point boundary.
 */
size_t ChunkSequence::find_cut(size_t start, size_t window_end) const {
  const std::string &text = document_.text;
  const size_t min_length = std::max(overlap_ + 1, max_size_ / 2);
  const size_t lower_bound = start + min_length;

  for (std::string_view separator : BOUNDARY_SEPARATORS) {
    if (window_end < start + separator.size()) {
      continue;
    }
    size_t pos = text.rfind(separator.data(), window_end - separator.size(), separator.size());
    if (pos != std::string::npos && pos >= start && pos + separator.size() >= lower_bound) {
      return pos + separator.size();
    }
  }

  size_t cut = window_end;
  while (cut > lower_bound && is_trail_byte(text[cut])) {
    --cut;
  }
  // Windows smaller than a code point: step forward instead
  while (cut < text.size() && is_trail_byte(text[cut])) {
    ++cut;
  }
  return cut;
}

size_t ChunkSequence::next_start(size_t cut) const {
  if (overlap_ == 0) {
    return cut;
  }
  const std::string &text = document_.text;
  size_t next = cut - overlap_;
  while (next < cut && is_trail_byte(text[next])) {
    ++next;
  }
  if (next > 0 && is_space(text[next - 1])) {
    return next;
  }
  // Begin the overlap on a word start when the overlap region holds one
  size_t word = next;
  while (word < cut && !is_space(text[word])) {
    ++word;
  }
  while (word < cut && is_space(text[word])) {
    ++word;
  }
  return word < cut ? word : next;
}

TextChunker::TextChunker(size_t max_size, size_t overlap, std::string version)
    : max_size_(max_size), overlap_(overlap), version_(std::move(version)) {
  if (max_size_ == 0 || overlap_ >= max_size_) {
    throw ConfigurationError("Chunker requires max_size > overlap >= 0 (got max_size=" +
                             std::to_string(max_size_) + ", overlap=" + std::to_string(overlap_) +
                             ")");
  }
}

ChunkSequence TextChunker::chunk_lazily(const Document &document) const {
  return ChunkSequence(document, max_size_, overlap_, version_);
}

std::vector<Chunk> TextChunker::chunk(const Document &document) const {
  ChunkSequence sequence = chunk_lazily(document);
  std::vector<Chunk> chunks;
  while (auto chunk = sequence.next()) {
    chunks.push_back(std::move(*chunk));
  }
  return chunks;
}

}  // namespace grounded_core
