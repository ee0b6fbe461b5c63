#include "sqlite_legacy_store.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sitely::legacy {

namespace {

// The table name is interpolated into SQL; keep it to identifier characters.
bool IsIdentifier(const std::string& name) {
  return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isalnum(c) || c == '_'; });
}

[[noreturn]] void ThrowSqlite(sqlite3* db, const std::string& what) {
  throw std::runtime_error("legacy store " + what + ": " + sqlite3_errmsg(db));
}

} // namespace

SqliteLegacyStore::SqliteLegacyStore(std::shared_ptr<db::sqlite::SqliteDB> db, std::string table)
    : db_(std::move(db)), table_(std::move(table)) {
  if (!IsIdentifier(table_)) {
    throw std::invalid_argument("invalid legacy store table name: " + table_);
  }

  db::sqlite::Statement st(db_->Handle(), "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;");
  if (!st.Ok()) ThrowSqlite(db_->Handle(), "open");
  sqlite3_bind_text(st.Get(), 1, table_.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = st.Step();
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) ThrowSqlite(db_->Handle(), "open");
  table_exists_ = rc == SQLITE_ROW;
}

std::optional<std::string> SqliteLegacyStore::GetItem(const std::string& key) {
  if (!table_exists_) {
    return std::nullopt;
  }
  const std::string     sql = "SELECT value FROM " + table_ + " WHERE key=?;";
  db::sqlite::Statement st(db_->Handle(), sql.c_str());
  if (!st.Ok()) ThrowSqlite(db_->Handle(), "get");

  sqlite3_bind_text(st.Get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = st.Step();
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) ThrowSqlite(db_->Handle(), "get");

  const unsigned char* value = sqlite3_column_text(st.Get(), 0);
  return std::string(value ? reinterpret_cast<const char*>(value) : "");
}

void SqliteLegacyStore::SetItem(const std::string& key, const std::string& value) {
  if (!table_exists_) {
    db_->Exec("CREATE TABLE IF NOT EXISTS " + table_ + " (key TEXT PRIMARY KEY, value TEXT NOT NULL);");
    table_exists_ = true;
  }

  const std::string     sql = "INSERT INTO " + table_ + "(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;";
  db::sqlite::Statement st(db_->Handle(), sql.c_str());
  if (!st.Ok()) ThrowSqlite(db_->Handle(), "set");

  sqlite3_bind_text(st.Get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.Get(), 2, value.c_str(), -1, SQLITE_TRANSIENT);
  if (st.Step() != SQLITE_DONE) ThrowSqlite(db_->Handle(), "set");
}

std::vector<std::string> SqliteLegacyStore::Keys() {
  if (!table_exists_) {
    return {};
  }
  const std::string     sql = "SELECT key FROM " + table_ + " ORDER BY key;";
  db::sqlite::Statement st(db_->Handle(), sql.c_str());
  if (!st.Ok()) ThrowSqlite(db_->Handle(), "keys");

  std::vector<std::string> keys;
  int                      rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    const unsigned char* key = sqlite3_column_text(st.Get(), 0);
    keys.emplace_back(key ? reinterpret_cast<const char*>(key) : "");
  }
  if (rc != SQLITE_DONE) ThrowSqlite(db_->Handle(), "keys");
  return keys;
}

} // namespace sitely::legacy
