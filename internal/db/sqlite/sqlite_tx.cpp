#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace storykb::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, std::mutex& tx_mutex) : lock_(tx_mutex), db_(std::move(db)) {
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const SqliteError& e) {
    if (e.IsBusy()) throw ConflictError(std::string("sqlite begin: ") + e.what());
    throw;
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    STORYKB_LOG_WARN("sqlite rollback in destructor failed", {storykb::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const SqliteError& e) {
    if (e.IsBusy()) throw ConflictError(std::string("sqlite commit: ") + e.what());
    throw;
  }
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
  lock_.unlock();
}

} // namespace storykb::db::sqlite
