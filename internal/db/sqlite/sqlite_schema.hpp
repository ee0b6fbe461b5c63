#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace sitely::db::sqlite {

/*
  Schema manager.

  EnsureSchema() is safe to call on every startup:
    - base tables (CREATE TABLE IF NOT EXISTS)
    - additive column migrations, skipped when the column already exists
    - indexes, some of which cover migrated columns

  Everything runs in one BEGIN IMMEDIATE transaction under a process-wide
  mutex. Any failure raises util::SchemaError and leaves the store untouched.
*/
class SchemaManager {
 public:
  explicit SchemaManager(std::shared_ptr<SqliteDB> db);

  // Returns the names of the column migrations applied by this call.
  std::vector<std::string> EnsureSchema();

  bool ColumnExists(const std::string& table, const std::string& column);

 private:
  std::vector<std::string> ApplyColumnMigrations();
  void                     RecordMigration(const char* name);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace sitely::db::sqlite
