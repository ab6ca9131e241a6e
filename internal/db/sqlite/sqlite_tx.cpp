#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace vkyc::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    VKYC_LOG_ERROR("sqlite rollback failed", {vkyc::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("sqlite transaction already finished");
  }
  // a failed COMMIT leaves the transaction open; the destructor rolls it back
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  db_->Exec("ROLLBACK;");
  finished_ = true;
  lock_.unlock();
}

} // namespace vkyc::db::sqlite
