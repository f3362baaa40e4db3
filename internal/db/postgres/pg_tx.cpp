#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace hivestate::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  try {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const std::exception& e) {
    throw TranslateError(e);
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    HIVESTATE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    throw TranslateError(e);
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    throw TranslateError(e);
  }
}

}
