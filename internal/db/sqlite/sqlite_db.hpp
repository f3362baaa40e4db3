#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/util/result.hpp"

namespace hivestate::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction; TxMutex() serializes them
  because SQLite nests nothing on a single connection.
*/
class SqliteDB {
 public:
  enum class Mode { kReadWrite, kReadOnly };

  explicit SqliteDB(std::string path, Mode mode = Mode::kReadWrite);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (pragmas, schema, BEGIN/COMMIT)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Throws util::StoreError unless rc is OK/ROW/DONE.
  void Check(int rc, const char* what) const;

  static util::ErrorCode CodeFor(int rc);

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  Mode        mode_;
  std::mutex  tx_mutex_;
};

// Finalizes on scope exit.
class Stmt {
 public:
  Stmt(SqliteDB& db, const char* sql) : db_(db), st_(db.Prepare(sql)) {
  }
  ~Stmt() {
    sqlite3_finalize(st_);
  }

  Stmt(const Stmt&)            = delete;
  Stmt& operator=(const Stmt&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  // SQLITE_ROW / SQLITE_DONE, throws on anything else.
  int Step() {
    int rc = sqlite3_step(st_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) db_.Check(rc, "sqlite step");
    return rc;
  }

 private:
  SqliteDB&     db_;
  sqlite3_stmt* st_;
};

} // namespace hivestate::db::sqlite
