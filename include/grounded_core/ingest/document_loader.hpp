#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "grounded_core/types/document.hpp"

namespace grounded_core {

// Reads the cleaned complaint corpus. One JSON object per line:
//   {"complaint_id": "...", "product": "...", "company": "...",
//    "date_received": "...", "narrative": "..."}
// "id" and "text" are accepted as aliases. Malformed lines and empty
// narratives are skipped with a warning.
class DocumentLoader {
 public:
  static std::vector<Document> load_jsonl(const std::filesystem::path &path);
  static std::vector<Document> load_jsonl(std::istream &input, const std::string &source_name);

  // Returns std::nullopt when the record has no usable id or narrative.
  static std::optional<Document> from_json(const nlohmann::json &record);
};

}  // namespace grounded_core
