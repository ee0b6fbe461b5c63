#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace sitely::db::sqlite {

struct SqliteOptions {
  std::uint32_t busy_timeout_ms = 5000;
  // OFF | NORMAL | FULL
  std::string synchronous = "NORMAL";
  // Foreign files (the legacy store) are opened as found: no create, no WAL switch.
  bool create_if_missing = true;
  bool wal               = true;
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection per installation. Transactions on the connection are
  serialized through TxMutex(): sqlite transaction state is per connection,
  so two threads must never interleave BEGIN/COMMIT on it.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
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

  // Execute a SQL string (used for pragmas/DDL)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

/*
  Owns a prepared statement; finalizes on scope exit.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  // false when sqlite3_prepare_v2 failed; Rc() holds the error code
  bool Ok() const {
    return stmt_ != nullptr;
  }

  int Rc() const {
    return prepare_rc_;
  }

  sqlite3_stmt* Get() const {
    return stmt_;
  }

  int Step() {
    return sqlite3_step(stmt_);
  }

 private:
  sqlite3_stmt* stmt_       = nullptr;
  int           prepare_rc_ = SQLITE_OK;
};

} // namespace sitely::db::sqlite
