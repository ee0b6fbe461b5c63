#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace sitely::db::sqlite {

/*
  SQLite transaction wrapper.

  Writers use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Readers use BEGIN DEFERRED.

  Holds the connection's transaction mutex for its whole lifetime.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, bool immediate);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
};

}
