#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace sitely::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, bool immediate)
    : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec(immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (committed_) {
    return;
  }

  // Destructors must not throw; a failed rollback is still reported.
  char* err = nullptr;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    SITELY_LOG_WARN("sqlite rollback failed", {observability::StringField("error", err ? err : "unknown")});
  }
  sqlite3_free(err);
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace sitely::db::sqlite
