#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>

namespace docsage_core {

// Scoped SQLite transaction: rolls back unless commit() was reached.
class Transaction {
 public:
  explicit Transaction(sqlite::database &db, bool immediate = false) : db_(db) {
    db_ << (immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    active_ = true;
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
    if (!active_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      // SQLite already rolled back on its own for some errors
      std::cerr << "[Transaction] ROLLBACK failed: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database &db_;
  bool active_ = false;
};

}  // namespace docsage_core
