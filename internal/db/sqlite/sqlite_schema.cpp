#include "sqlite_schema.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sitely::db::sqlite {

namespace {

std::mutex& SchemaMutex() {
  static std::mutex mutex;
  return mutex;
}

} // namespace

SchemaManager::SchemaManager(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::vector<std::string> SchemaManager::EnsureSchema() {
  std::lock_guard<std::mutex> schema_lock(SchemaMutex());

  std::vector<std::string> applied;
  try {
    SqliteTransaction tx(db_, true);

    for (const char* ddl : sql::kCreateTables) {
      db_->Exec(ddl);
    }

    applied = ApplyColumnMigrations();

    for (const char* ddl : sql::kCreateIndexes) {
      db_->Exec(ddl);
    }

    tx.Commit();
  } catch (const std::exception& e) {
    throw util::SchemaError(std::string("ensure schema failed: ") + e.what());
  }

  SITELY_LOG_INFO("schema ready", {observability::StringField("path", db_->Path()),
                                   observability::IntField("migrations_applied", static_cast<std::int64_t>(applied.size()))});
  return applied;
}

bool SchemaManager::ColumnExists(const std::string& table, const std::string& column) {
  // PRAGMA arguments cannot be bound; table names only come from the fixed migration list.
  const std::string sql = "PRAGMA table_info(" + table + ");";
  Statement         st(db_->Handle(), sql.c_str());
  if (!st.Ok()) {
    throw std::runtime_error("table_info " + table + ": " + sqlite3_errmsg(db_->Handle()));
  }

  int rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    const unsigned char* name = sqlite3_column_text(st.Get(), 1);
    if (name && column == reinterpret_cast<const char*>(name)) {
      return true;
    }
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("table_info " + table + ": " + sqlite3_errmsg(db_->Handle()));
  }
  return false;
}

std::vector<std::string> SchemaManager::ApplyColumnMigrations() {
  std::vector<std::string> applied;

  for (const auto& migration : sql::kColumnMigrations) {
    if (!ColumnExists(migration.table, migration.column)) {
      db_->Exec(std::string("ALTER TABLE ") + migration.table + " ADD COLUMN " + migration.column + " " + migration.definition + ";");
      applied.emplace_back(migration.name);

      SITELY_LOG_INFO("schema migration applied", {observability::StringField("migration", migration.name),
                                                   observability::StringField("table", migration.table),
                                                   observability::StringField("column", migration.column)});
    }
    RecordMigration(migration.name);
  }

  return applied;
}

void SchemaManager::RecordMigration(const char* name) {
  Statement st(db_->Handle(), "INSERT INTO schema_migrations(name,applied_at_ms) VALUES(?,?) ON CONFLICT(name) DO NOTHING;");
  if (!st.Ok()) {
    throw std::runtime_error(std::string("record migration: ") + sqlite3_errmsg(db_->Handle()));
  }

  sqlite3_bind_text(st.Get(), 1, name, -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st.Get(), 2, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));
  if (st.Step() != SQLITE_DONE) {
    throw std::runtime_error(std::string("record migration: ") + sqlite3_errmsg(db_->Handle()));
  }
}

} // namespace sitely::db::sqlite
