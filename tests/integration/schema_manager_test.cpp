#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"

namespace {

using sitely::db::sqlite::SchemaManager;
using sitely::db::sqlite::SqliteDB;

std::filesystem::path FreshDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "sitely_schema_manager_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

std::int64_t CountRows(SqliteDB& db, const std::string& sql) {
  sitely::db::sqlite::Statement st(db.Handle(), sql.c_str());
  assert(st.Ok());
  assert(st.Step() == SQLITE_ROW);
  return sqlite3_column_int64(st.Get(), 0);
}

void TestEnsureSchemaIsIdempotent() {
  auto db = std::make_shared<SqliteDB>(FreshDbPath("idempotent").string());

  SchemaManager schema(db);
  auto          first = schema.EnsureSchema();
  assert(first.size() == 6);
  assert(first.front() == "0001_sites_siteCode");

  auto second = schema.EnsureSchema();
  assert(second.empty());

  assert(schema.ColumnExists("sites", "siteCode"));
  assert(schema.ColumnExists("workers", "isActive"));
  assert(!schema.ColumnExists("workers", "nickname"));
  assert(CountRows(*db, "SELECT COUNT(*) FROM schema_migrations;") == 6);
}

void TestOldStoreGainsColumnsAndKeepsRows() {
  const auto path = FreshDbPath("old_store");
  {
    // shape written by the first release
    SqliteDB old(path.string());
    old.Exec(
        "CREATE TABLE sites (id TEXT PRIMARY KEY, name TEXT NOT NULL, type TEXT NOT NULL, location TEXT NOT NULL,"
        " startDate TEXT NOT NULL, endDate TEXT NOT NULL, isRunning INTEGER NOT NULL DEFAULT 1, ownerName TEXT NOT NULL,"
        " contact TEXT NOT NULL, createdAt TEXT NOT NULL);");
    old.Exec(
        "CREATE TABLE payments (id TEXT PRIMARY KEY, siteId TEXT NOT NULL, workerId TEXT NOT NULL, workerName TEXT NOT NULL,"
        " workerCategory TEXT NOT NULL, amount REAL NOT NULL, date TEXT NOT NULL, time TEXT NOT NULL,"
        " FOREIGN KEY(siteId) REFERENCES sites(id) ON DELETE CASCADE);");
    old.Exec("INSERT INTO sites VALUES ('s1','Old Site','shop','Surat','2020-01-01','',1,'Patel','99','2020-01-01T00:00:00.000Z');");
    old.Exec("INSERT INTO payments VALUES ('p1','s1','w1','Ramesh','karigar',300,'2024-06-01','10:00');");
  }

  auto          db = std::make_shared<SqliteDB>(path.string());
  SchemaManager schema(db);
  auto          applied = schema.EnsureSchema();
  assert(applied.size() == 6);

  sitely::db::sqlite::SqliteRepository repository(db);
  auto                                 tx   = repository.BeginRead();
  auto                                 site = repository.GetSite(*tx, "s1");
  assert(site);
  assert(!site->site_code);
  assert(!site->user_id);

  auto payments = repository.ListPayments(*tx, "s1", std::nullopt, "");
  assert(payments.size() == 1);
  assert(payments[0].method == sitely::model::PaymentMethod::kCash);
}

void TestRejectedDdlRaisesSchemaErrorAndRollsBack() {
  auto db = std::make_shared<SqliteDB>(FreshDbPath("rejected").string());
  // a view cannot take the column migrations
  db->Exec("CREATE VIEW sites AS SELECT 1 AS id;");

  bool threw = false;
  try {
    SchemaManager(db).EnsureSchema();
  } catch (const sitely::util::SchemaError&) {
    threw = true;
  }
  assert(threw);
  assert(CountRows(*db, "SELECT COUNT(*) FROM sqlite_master WHERE name='settings';") == 0);
}

} // namespace

int main() {
  TestEnsureSchemaIsIdempotent();
  TestOldStoreGainsColumnsAndKeepsRows();
  TestRejectedDdlRaisesSchemaErrorAndRollsBack();

  std::cout << "sitely_integration_schema_manager: pass\n";
  return 0;
}
