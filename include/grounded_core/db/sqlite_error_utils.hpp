#pragma once

#include <string>

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

namespace grounded_core {

// True when SQLite reports that the file itself is damaged or not a database.
inline bool is_corruption_code(int primary_code) {
  return primary_code == SQLITE_CORRUPT || primary_code == SQLITE_NOTADB ||
         primary_code == SQLITE_FORMAT;
}

inline std::string format_db_error(const std::string &operation, const sqlite::sqlite_exception &e) {
  std::string msg = operation + " failed: " + e.errstr();
  msg += " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  if (!e.get_sql().empty()) {
    msg += " while executing: " + e.get_sql();
  }
  return msg;
}

}  // namespace grounded_core
