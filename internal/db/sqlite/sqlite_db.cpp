#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace hivestate::db::sqlite {

util::ErrorCode SqliteDB::CodeFor(int rc) {
  switch (rc & 0xFF) {
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:
      return util::ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return util::ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return util::ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      return util::ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return util::ErrorCode::Corruption;
    case SQLITE_READONLY:
      return util::ErrorCode::Unsupported;
    default:
      return util::ErrorCode::InternalError;
  }
}

void SqliteDB::Check(int rc, const char* what) const {
  const auto code = CodeFor(rc);
  if (code != util::ErrorCode::OK) {
    throw util::StoreError(code, std::string(what) + ": " + sqlite3_errmsg(db_));
  }
}

SqliteDB::SqliteDB(std::string path, Mode mode) : path_(std::move(path)), mode_(mode) {
  const int flags = mode_ == Mode::kReadOnly ? SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX
                                             : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreError(CodeFor(rc), "sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StoreError(CodeFor(rc), msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  Check(rc, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately
  Check(sqlite3_busy_timeout(db_, 5000), "busy_timeout");

  if (mode_ == Mode::kReadOnly) {
    return;
  }

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace hivestate::db::sqlite
