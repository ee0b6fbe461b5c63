#pragma once

namespace sitely::db::sql {

/*
  Base schema. Every statement is idempotent (IF NOT EXISTS).

  Columns added after the first release are NOT listed here; they are applied
  by the additive migrations in migrations.hpp so that stores created by older
  builds converge on the same shape.
*/

static constexpr const char* kCreateTables[] = {
    "CREATE TABLE IF NOT EXISTS settings ("
    " key   TEXT PRIMARY KEY,"
    " value TEXT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS schema_migrations ("
    " name          TEXT PRIMARY KEY,"
    " applied_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS sites ("
    " id        TEXT PRIMARY KEY,"
    " name      TEXT NOT NULL,"
    " type      TEXT NOT NULL CHECK(type IN ('residential','commercial','rowhouse','tenament','shop','other')),"
    " location  TEXT NOT NULL,"
    " startDate TEXT NOT NULL,"
    " endDate   TEXT NOT NULL,"
    " isRunning INTEGER NOT NULL DEFAULT 1,"
    " ownerName TEXT NOT NULL,"
    " contact   TEXT NOT NULL,"
    " createdAt TEXT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS workers ("
    " id          TEXT PRIMARY KEY,"
    " siteId      TEXT NOT NULL,"
    " name        TEXT NOT NULL,"
    " age         TEXT NOT NULL,"
    " contact     TEXT NOT NULL,"
    " village     TEXT NOT NULL,"
    " category    TEXT NOT NULL CHECK(category IN ('karigar','majdur')),"
    " photoUri    TEXT,"
    " joiningDate TEXT NOT NULL,"
    " FOREIGN KEY(siteId) REFERENCES sites(id) ON DELETE CASCADE);",

    // ledger rows keep no worker foreign key: history outlives the worker
    "CREATE TABLE IF NOT EXISTS hajari ("
    " id             TEXT PRIMARY KEY,"
    " siteId         TEXT NOT NULL,"
    " workerId       TEXT NOT NULL,"
    " workerName     TEXT NOT NULL,"
    " workerCategory TEXT NOT NULL,"
    " amount         REAL NOT NULL,"
    " date           TEXT NOT NULL,"
    " time           TEXT NOT NULL,"
    " FOREIGN KEY(siteId) REFERENCES sites(id) ON DELETE CASCADE);",

    "CREATE TABLE IF NOT EXISTS expenses ("
    " id             TEXT PRIMARY KEY,"
    " siteId         TEXT NOT NULL,"
    " workerId       TEXT NOT NULL,"
    " workerName     TEXT NOT NULL,"
    " workerCategory TEXT NOT NULL,"
    " description    TEXT NOT NULL DEFAULT '',"
    " amount         REAL NOT NULL,"
    " date           TEXT NOT NULL,"
    " time           TEXT NOT NULL,"
    " FOREIGN KEY(siteId) REFERENCES sites(id) ON DELETE CASCADE);",

    "CREATE TABLE IF NOT EXISTS payments ("
    " id             TEXT PRIMARY KEY,"
    " siteId         TEXT NOT NULL,"
    " workerId       TEXT NOT NULL,"
    " workerName     TEXT NOT NULL,"
    " workerCategory TEXT NOT NULL,"
    " amount         REAL NOT NULL,"
    " date           TEXT NOT NULL,"
    " time           TEXT NOT NULL,"
    " FOREIGN KEY(siteId) REFERENCES sites(id) ON DELETE CASCADE);",

    "CREATE TABLE IF NOT EXISTS photo_groups ("
    " id        TEXT PRIMARY KEY,"
    " siteId    TEXT NOT NULL,"
    " name      TEXT NOT NULL,"
    " createdAt TEXT NOT NULL,"
    " FOREIGN KEY(siteId) REFERENCES sites(id) ON DELETE CASCADE);",

    "CREATE TABLE IF NOT EXISTS photos ("
    " id          TEXT PRIMARY KEY,"
    " siteId      TEXT NOT NULL,"
    " uri         TEXT NOT NULL,"
    " description TEXT NOT NULL,"
    " date        TEXT NOT NULL,"
    " time        TEXT NOT NULL,"
    " groupId     TEXT,"
    " FOREIGN KEY(siteId) REFERENCES sites(id) ON DELETE CASCADE,"
    " FOREIGN KEY(groupId) REFERENCES photo_groups(id) ON DELETE SET NULL);",

    "CREATE TABLE IF NOT EXISTS materials ("
    " id           TEXT PRIMARY KEY,"
    " siteId       TEXT NOT NULL,"
    " name         TEXT NOT NULL,"
    " vendorName   TEXT NOT NULL DEFAULT '',"
    " vendorPhone  TEXT NOT NULL DEFAULT '',"
    " quantity     REAL NOT NULL DEFAULT 0 CHECK(quantity >= 0),"
    " unit         TEXT NOT NULL CHECK(unit IN ('kg','bag','piece','ton','litre','sqft','cft','nos','other')),"
    " ratePerUnit  REAL NOT NULL DEFAULT 0 CHECK(ratePerUnit >= 0),"
    " totalAmount  REAL NOT NULL DEFAULT 0,"
    " amountPaid   REAL NOT NULL DEFAULT 0 CHECK(amountPaid >= 0),"
    " billPhotoUri TEXT,"
    " purchasedAt  TEXT NOT NULL,"
    " FOREIGN KEY(siteId) REFERENCES sites(id) ON DELETE CASCADE);",

    "CREATE TABLE IF NOT EXISTS material_usages ("
    " id           TEXT PRIMARY KEY,"
    " materialId   TEXT NOT NULL,"
    " siteId       TEXT NOT NULL,"
    " quantityUsed REAL NOT NULL CHECK(quantityUsed >= 0),"
    " description  TEXT NOT NULL DEFAULT '',"
    " date         TEXT NOT NULL,"
    " FOREIGN KEY(materialId) REFERENCES materials(id) ON DELETE CASCADE,"
    " FOREIGN KEY(siteId) REFERENCES sites(id) ON DELETE CASCADE);",

    "CREATE TABLE IF NOT EXISTS todos ("
    " id          TEXT PRIMARY KEY,"
    " title       TEXT NOT NULL,"
    " description TEXT NOT NULL DEFAULT '',"
    " type        TEXT NOT NULL DEFAULT 'daily' CHECK(type IN ('daily','monthly')),"
    " deadline    TEXT,"
    " completed   INTEGER NOT NULL DEFAULT 0,"
    " completedAt TEXT,"
    " siteId      TEXT,"
    " createdAt   TEXT NOT NULL,"
    " FOREIGN KEY(siteId) REFERENCES sites(id) ON DELETE SET NULL);",
};

// Created after the column migrations: some index migrated columns.
static constexpr const char* kCreateIndexes[] = {
    "CREATE INDEX IF NOT EXISTS idx_sites_userId ON sites(userId);",
    "CREATE INDEX IF NOT EXISTS idx_sites_siteCode ON sites(siteCode);",
    "CREATE INDEX IF NOT EXISTS idx_workers_siteId ON workers(siteId);",
    "CREATE INDEX IF NOT EXISTS idx_hajari_site_worker_date ON hajari(siteId, workerId, date);",
    "CREATE INDEX IF NOT EXISTS idx_hajari_date ON hajari(date);",
    "CREATE INDEX IF NOT EXISTS idx_expenses_site_worker_date ON expenses(siteId, workerId, date);",
    "CREATE INDEX IF NOT EXISTS idx_expenses_date ON expenses(date);",
    "CREATE INDEX IF NOT EXISTS idx_payments_site_worker_date ON payments(siteId, workerId, date);",
    "CREATE INDEX IF NOT EXISTS idx_payments_date ON payments(date);",
    "CREATE INDEX IF NOT EXISTS idx_photo_groups_siteId ON photo_groups(siteId);",
    "CREATE INDEX IF NOT EXISTS idx_photos_siteId ON photos(siteId);",
    "CREATE INDEX IF NOT EXISTS idx_photos_groupId ON photos(groupId);",
    "CREATE INDEX IF NOT EXISTS idx_materials_siteId ON materials(siteId);",
    "CREATE INDEX IF NOT EXISTS idx_material_usages_materialId ON material_usages(materialId);",
    "CREATE INDEX IF NOT EXISTS idx_material_usages_siteId ON material_usages(siteId);",
    "CREATE INDEX IF NOT EXISTS idx_todos_type ON todos(type);",
    "CREATE INDEX IF NOT EXISTS idx_todos_siteId ON todos(siteId);",
};

} // namespace sitely::db::sql
