#include "grounded_core/index/sidecar_store.hpp"

#include <map>
#include <utility>

#include <sqlite_modern_cpp.h>

#include "grounded_core/db/sqlite_error_utils.hpp"
#include "grounded_core/db/transaction.hpp"
#include "grounded_core/errors.hpp"

namespace grounded_core {

namespace {

void create_schema(sqlite::database &db) {
  db << "CREATE TABLE IF NOT EXISTS manifest ("
        "key TEXT PRIMARY KEY NOT NULL,"
        "value TEXT NOT NULL);";
  db << "CREATE TABLE IF NOT EXISTS chunks ("
        "position INTEGER PRIMARY KEY NOT NULL,"
        "chunk_id TEXT NOT NULL,"
        "document_id TEXT NOT NULL,"
        "start_offset INTEGER NOT NULL,"
        "end_offset INTEGER NOT NULL,"
        "text TEXT NOT NULL,"
        "product TEXT NOT NULL,"
        "company TEXT NOT NULL,"
        "submission_date TEXT NOT NULL,"
        "version TEXT NOT NULL);";
}

std::vector<std::pair<std::string, std::string>> manifest_to_rows(const IndexManifest &manifest) {
  return {
      {"schema_version", std::to_string(manifest.schema_version)},
      {"dimension", std::to_string(manifest.dimension)},
      {"metric", to_string(manifest.metric)},
      {"index_kind", to_string(manifest.kind)},
      {"corpus_version", manifest.corpus_version},
      {"vector_count", std::to_string(manifest.vector_count)},
      {"vectors_sha256", manifest.vectors_sha256},
  };
}

const std::string &require_key(const std::map<std::string, std::string> &values,
                               const std::string &key) {
  auto it = values.find(key);
  if (it == values.end()) {
    throw IndexCorruption("Index manifest is missing key '" + key + "'");
  }
  return it->second;
}

size_t parse_count(const std::string &key, const std::string &value) {
  try {
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      throw IndexCorruption("Index manifest value for '" + key + "' is not a number: " + value);
    }
    return static_cast<size_t>(parsed);
  } catch (const std::logic_error &) {
    throw IndexCorruption("Index manifest value for '" + key + "' is not a number: " + value);
  }
}

IndexManifest manifest_from_rows(const std::map<std::string, std::string> &values) {
  IndexManifest manifest;
  manifest.schema_version =
      static_cast<int>(parse_count("schema_version", require_key(values, "schema_version")));
  if (manifest.schema_version != SidecarStore::SCHEMA_VERSION) {
    throw IndexCorruption("Unsupported index schema version " +
                          std::to_string(manifest.schema_version) + " (expected " +
                          std::to_string(SidecarStore::SCHEMA_VERSION) + ")");
  }
  manifest.dimension = parse_count("dimension", require_key(values, "dimension"));
  manifest.vector_count = parse_count("vector_count", require_key(values, "vector_count"));
  manifest.corpus_version = require_key(values, "corpus_version");
  manifest.vectors_sha256 = require_key(values, "vectors_sha256");
  try {
    manifest.metric = distance_metric_from_string(require_key(values, "metric"));
    manifest.kind = index_kind_from_string(require_key(values, "index_kind"));
  } catch (const ConfigurationError &e) {
    throw IndexCorruption(std::string("Index manifest is invalid: ") + e.what());
  }
  return manifest;
}

}  // namespace

void SidecarStore::write(const std::filesystem::path &db_path,
                         const IndexManifest &manifest,
                         const std::vector<Chunk> &chunks) {
  try {
    sqlite::database db(db_path.string());
    create_schema(db);

    Transaction transaction(db);
    for (const auto &[key, value] : manifest_to_rows(manifest)) {
      db << "INSERT OR REPLACE INTO manifest (key, value) VALUES (?, ?);" << key << value;
    }

    long long position = 0;
    for (const auto &chunk : chunks) {
      db << "INSERT INTO chunks (position, chunk_id, document_id, start_offset, end_offset, text, "
            "product, company, submission_date, version) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);"
         << position++ << chunk.id << chunk.document_id
         << static_cast<long long>(chunk.span.start) << static_cast<long long>(chunk.span.end)
         << chunk.text << chunk.source.product << chunk.source.company
         << chunk.source.submission_date << chunk.version;
    }
    transaction.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorIndexError(format_db_error("write index metadata", e));
  }
}

SidecarContents SidecarStore::read(const std::filesystem::path &db_path) {
  SidecarContents contents;
  try {
    sqlite::sqlite_config config;
    config.flags = sqlite::OpenFlags::READONLY;
    sqlite::database db(db_path.string(), config);

    std::map<std::string, std::string> values;
    db << "SELECT key, value FROM manifest;" >> [&](std::string key, std::string value) {
      values[key] = value;
    };
    contents.manifest = manifest_from_rows(values);

    bool contiguous = true;
    db << "SELECT position, chunk_id, document_id, start_offset, end_offset, text, product, "
          "company, submission_date, version FROM chunks ORDER BY position;" >>
        [&](long long position, std::string chunk_id, std::string document_id, long long start,
            long long end, std::string text, std::string product, std::string company,
            std::string submission_date, std::string version) {
          if (position != static_cast<long long>(contents.chunks.size()) || start < 0 ||
              end < start) {
            contiguous = false;
          }
          Chunk chunk;
          chunk.id = std::move(chunk_id);
          chunk.document_id = std::move(document_id);
          chunk.span = {static_cast<size_t>(start), static_cast<size_t>(end)};
          chunk.text = std::move(text);
          chunk.source = {std::move(product), std::move(submission_date), std::move(company)};
          chunk.version = std::move(version);
          contents.chunks.push_back(std::move(chunk));
        };
    if (!contiguous) {
      throw IndexCorruption("Index metadata rows are not aligned with vector positions");
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexCorruption(format_db_error("read index metadata", e) +
                          (is_corruption_code(e.get_code()) ? " (file damaged)" : ""));
  }
  return contents;
}

}  // namespace grounded_core
