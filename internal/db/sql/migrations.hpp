#pragma once

namespace sitely::db::sql {

/*
  Additive forward migrations, applied in order on every startup.

  A migration only ever adds a column. It is skipped when the column is
  already present, so re-applying is a no-op and the list is append-only:
  never reorder, rename or remove an entry.
*/

struct ColumnMigration {
  const char* name;
  const char* table;
  const char* column;
  const char* definition;
};

static constexpr ColumnMigration kColumnMigrations[] = {
    {"0001_sites_siteCode", "sites", "siteCode", "TEXT DEFAULT NULL"},
    {"0002_sites_userId", "sites", "userId", "TEXT DEFAULT NULL"},
    {"0003_hajari_overtime", "hajari", "overtime", "REAL NOT NULL DEFAULT 0"},
    {"0004_payments_method", "payments", "method", "TEXT NOT NULL DEFAULT 'cash' CHECK(method IN ('cash','upi','bank'))"},
    {"0005_todos_priority", "todos", "priority", "TEXT NOT NULL DEFAULT 'medium' CHECK(priority IN ('high','medium','low'))"},
    {"0006_workers_isActive", "workers", "isActive", "INTEGER NOT NULL DEFAULT 1"},
};

} // namespace sitely::db::sql
