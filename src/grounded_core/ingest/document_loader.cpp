#include "grounded_core/ingest/document_loader.hpp"

#include <fstream>
#include <iostream>

#include "grounded_core/errors.hpp"

namespace grounded_core {

namespace {

// Ids arrive as numbers or strings depending on the export
std::string id_to_string(const nlohmann::json &value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  return "";
}

std::string first_string(const nlohmann::json &record, const char *key, const char *alias) {
  for (const char *name : {key, alias}) {
    if (name && record.contains(name) && record[name].is_string()) {
      return record[name].get<std::string>();
    }
  }
  return "";
}

}  // namespace

std::optional<Document> DocumentLoader::from_json(const nlohmann::json &record) {
  if (!record.is_object()) {
    return std::nullopt;
  }

  Document document;
  if (record.contains("complaint_id")) {
    document.id = id_to_string(record["complaint_id"]);
  } else if (record.contains("id")) {
    document.id = id_to_string(record["id"]);
  }
  document.text = first_string(record, "narrative", "text");
  document.source.product = first_string(record, "product", nullptr);
  document.source.company = first_string(record, "company", nullptr);
  document.source.submission_date = first_string(record, "date_received", "submission_date");

  if (document.id.empty() ||
      document.text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return std::nullopt;
  }
  return document;
}

std::vector<Document> DocumentLoader::load_jsonl(std::istream &input,
                                                 const std::string &source_name) {
  std::vector<Document> documents;
  std::string line;
  size_t line_number = 0;
  size_t skipped = 0;

  while (std::getline(input, line)) {
    ++line_number;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    try {
      auto document = from_json(nlohmann::json::parse(line));
      if (!document) {
        std::cerr << "Warning: Skipping record at " << source_name << ":" << line_number
                  << " (missing id or empty narrative)." << std::endl;
        ++skipped;
        continue;
      }
      documents.push_back(std::move(*document));
    } catch (const nlohmann::json::parse_error &e) {
      std::cerr << "Warning: Skipping malformed JSON at " << source_name << ":" << line_number
                << ": " << e.what() << std::endl;
      ++skipped;
    }
  }

  std::cout << "Loaded " << documents.size() << " documents from " << source_name << " ("
            << skipped << " skipped)." << std::endl;
  return documents;
}

std::vector<Document> DocumentLoader::load_jsonl(const std::filesystem::path &path) {
  std::ifstream file_stream(path);
  if (!file_stream.is_open()) {
    throw DataError("Could not open corpus file: " + path.string());
  }
  return load_jsonl(file_stream, path.string());
}

}  // namespace grounded_core
