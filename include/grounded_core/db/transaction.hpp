#pragma once

#include <iostream>

#include <sqlite_modern_cpp.h>

namespace grounded_core {

// Rolls back unless commit() was reached.
class Transaction {
 public:
  explicit Transaction(sqlite::database &db) : db_(db), active_(true) {
    db_ << "BEGIN;";
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    if (active_) {
      db_ << "COMMIT;";
      active_ = false;
    }
  }

  ~Transaction() noexcept {
    if (active_) {
      try {
        db_ << "ROLLBACK;";
      } catch (const sqlite::sqlite_exception &e) {
        std::cerr << "Warning: rollback failed: " << e.what() << std::endl;
      }
    }
  }

 private:
  sqlite::database &db_;
  bool active_;
};

}  // namespace grounded_core
