#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace hivestate::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    HIVESTATE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace hivestate::db::sqlite
