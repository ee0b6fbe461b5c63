#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/ledger_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/legacy/memory_legacy_store.hpp"
#include "internal/migration/migration_engine.hpp"

namespace {

using sitely::migration::MigrationEngine;

sitely::util::TimePoint FixedNow() {
  return sitely::util::TimePoint(std::chrono::seconds(1718452800));
}

std::filesystem::path FreshDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "sitely_migration_engine_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

struct Fixture {
  explicit Fixture(const std::string& name)
      : db(std::make_shared<sitely::db::sqlite::SqliteDB>(FreshDbPath(name).string())),
        legacy(std::make_shared<sitely::legacy::MemoryLegacyStore>()) {
    sitely::db::sqlite::SchemaManager(db).EnsureSchema();
    repository = std::make_shared<sitely::db::sqlite::SqliteRepository>(db);
    store      = std::make_unique<sitely::core::LedgerStore>(repository, FixedNow);
  }

  sitely::migration::MigrationReport Migrate() {
    return MigrationEngine(legacy, repository).MigrateLegacyStore();
  }

  std::int64_t CountRows(const std::string& table) {
    const std::string             sql = "SELECT COUNT(*) FROM " + table + ";";
    sitely::db::sqlite::Statement st(db->Handle(), sql.c_str());
    assert(st.Ok());
    assert(st.Step() == SQLITE_ROW);
    return sqlite3_column_int64(st.Get(), 0);
  }

  std::shared_ptr<sitely::db::sqlite::SqliteDB>         db;
  std::shared_ptr<sitely::legacy::MemoryLegacyStore>    legacy;
  std::shared_ptr<sitely::db::sqlite::SqliteRepository> repository;
  std::unique_ptr<sitely::core::LedgerStore>            store;
};

constexpr const char* kSites =
    R"([{"id":"s1","name":"Shanti Nagar","type":"residential","location":"Surat","startDate":"2023-01-10","endDate":"",
         "isRunning":true,"ownerName":"Patel","contact":"99","createdAt":"2023-01-10T00:00:00.000Z","siteCode":"ab12cd"}])";

constexpr const char* kWorkers =
    R"([{"id":"w1","siteId":"s1","name":"Ramesh","age":"34","contact":"","village":"Navsari","category":"karigar","joiningDate":"2023-02-01"},
        {"id":"w2","siteId":"s1","name":"Suresh","age":"28","contact":"","village":"Bardoli","category":"majdur","joiningDate":"2023-02-01",
         "isActive":false}])";

constexpr const char* kHajari =
    R"([{"id":"h1","siteId":"s1","workerId":"w1","workerName":"Ramesh","workerCategory":"karigar","amount":500,"overtime":50,"date":"2024-06-10","time":"09:00"},
        {"id":"h2","siteId":"s1","workerId":"w2","workerName":"Suresh","workerCategory":"majdur","amount":400,"date":"2024-06-10","time":"09:05"}])";

constexpr const char* kExpenses =
    R"([{"id":"e1","siteId":"s1","workerId":"w1","workerName":"Ramesh","workerCategory":"karigar","amount":100,"description":"advance","date":"2024-06-11","time":"10:00"}])";

constexpr const char* kPayments =
    R"([{"id":"p1","siteId":"s1","workerId":"w1","workerName":"Ramesh","workerCategory":"karigar","amount":300,"date":"2024-06-12","time":"18:00"}])";

constexpr const char* kPhotos =
    R"([{"id":"ph1","siteId":"s1","groupId":"never-existed","uri":"file:///slab.jpg","description":"slab","date":"2024-06-01","time":"11:00"}])";

constexpr const char* kSiteMaterials =
    R"([{"id":"m1","siteId":"s1","name":"Cement","vendorName":"Shree","quantity":10,"unit":"bag","ratePerUnit":380,"totalAmount":3800,
         "amountPaid":1000,"purchasedAt":"2024-06-01T00:00:00.000Z"}])";

constexpr const char* kOrphanMaterials =
    R"([{"id":"m2","siteId":"","name":"Sand","quantity":2,"unit":"ton","ratePerUnit":1200,"purchasedAt":"2024-06-02T00:00:00.000Z"}])";

constexpr const char* kUsages =
    R"([{"id":"u1","materialId":"m1","siteId":"s1","quantityUsed":4,"description":"footing","date":"2024-06-05"}])";

void SeedFullLegacyStore(sitely::legacy::LegacyStore& legacy) {
  legacy.SetItem("@language", "hi");
  legacy.SetItem("@onboarding_done", "true");
  legacy.SetItem("@sites", kSites);
  legacy.SetItem("@workers", kWorkers);
  legacy.SetItem("@hajari", kHajari);
  legacy.SetItem("@expenses", kExpenses);
  legacy.SetItem("@payments", kPayments);
  legacy.SetItem("@photos", kPhotos);
  legacy.SetItem("sitely_materials_s1", kSiteMaterials);
  legacy.SetItem("sitely_materials_", kOrphanMaterials);
  legacy.SetItem("sitely_usage_s1_m1", kUsages);
}

void TestFullMigration() {
  Fixture f("full");
  SeedFullLegacyStore(*f.legacy);

  auto report = f.Migrate();
  assert(!report.already_migrated);
  assert(report.completed);
  assert(report.TotalFailed() == 0);
  assert(report.entities.at("sites").inserted == 1);
  assert(report.entities.at("workers").inserted == 2);
  assert(report.entities.at("hajari").inserted == 2);
  assert(report.entities.at("materials").inserted == 2);
  assert(report.entities.at("material_usages").inserted == 1);
  assert(report.entities.at("settings").inserted == 2);
  assert(f.legacy->GetItem(MigrationEngine::kCompletionKey) == std::optional<std::string>("true"));

  auto site = f.store->GetSite("s1");
  assert(site && site->site_code == std::optional<std::string>("AB12CD"));
  assert(f.store->FindSiteByCode("ab12cd"));

  auto suresh = f.store->GetWorker("w2");
  assert(suresh && !suresh->is_active);

  auto totals = f.store->WorkerTotals("s1", "w1");
  assert(totals.total_wage == 550 && totals.total_expense == 100 && totals.total_paid == 300 && totals.remaining == 150);

  auto payments = f.store->ListPayments("s1");
  assert(payments.size() == 1 && payments[0].method == sitely::model::PaymentMethod::kCash);

  auto photos = f.store->ListPhotos("s1");
  assert(photos.size() == 1 && !photos[0].group_id);

  // the orphan bucket attached to the only site
  assert(f.store->ListMaterials("s1").size() == 2);
  auto stock = f.store->MaterialStock("m1");
  assert(stock.used == 4 && stock.remaining == 6);

  assert(f.store->GetSetting("language") == std::optional<std::string>("hi"));
  assert(f.store->GetSetting("onboarding_done") == std::optional<std::string>("true"));
}

void TestSecondRunIsANoOp() {
  Fixture f("twice");
  SeedFullLegacyStore(*f.legacy);
  assert(f.Migrate().completed);

  auto again = f.Migrate();
  assert(again.already_migrated);
  assert(again.entities.empty());

  // even with the flag cleared, inserts are idempotent
  f.legacy->SetItem(MigrationEngine::kCompletionKey, "false");
  auto forced = f.Migrate();
  assert(forced.completed);
  assert(forced.TotalInserted() == 0);
  assert(forced.entities.at("hajari").skipped == 2);
  assert(f.CountRows("sites") == 1);
  assert(f.CountRows("hajari") == 2);
  assert(f.CountRows("materials") == 2);
  assert(f.CountRows("material_usages") == 1);
}

void TestFailedRecordThenFixedRerunConverges() {
  Fixture f("fix_and_rerun");
  f.legacy->SetItem("@sites", kSites);
  f.legacy->SetItem("@workers", kWorkers);
  f.legacy->SetItem("@hajari",
                    R"([{"id":"h1","siteId":"s1","workerId":"w1","workerName":"Ramesh","workerCategory":"karigar","amount":500,"date":"2024-06-10"},
                        {"id":"h2","siteId":"s1","workerId":"w1","workerName":"Ramesh","workerCategory":"karigar","amount":500,"date":"10 June"},
                        {"id":"h3","siteId":"s1","workerId":"w1","workerName":"Ramesh","workerCategory":"karigar","amount":500,"date":"2024-06-12"}])");

  auto broken = f.Migrate();
  assert(!broken.completed);
  assert(broken.entities.at("hajari").inserted == 2);
  assert(broken.entities.at("hajari").failed == 1);
  assert(!f.legacy->GetItem(MigrationEngine::kCompletionKey));
  assert(f.CountRows("hajari") == 2);

  f.legacy->SetItem("@hajari",
                    R"([{"id":"h1","siteId":"s1","workerId":"w1","workerName":"Ramesh","workerCategory":"karigar","amount":500,"date":"2024-06-10"},
                        {"id":"h2","siteId":"s1","workerId":"w1","workerName":"Ramesh","workerCategory":"karigar","amount":500,"date":"2024-06-11"},
                        {"id":"h3","siteId":"s1","workerId":"w1","workerName":"Ramesh","workerCategory":"karigar","amount":500,"date":"2024-06-12"}])");

  auto fixed = f.Migrate();
  assert(fixed.completed);
  assert(fixed.entities.at("hajari").inserted == 1);
  assert(fixed.entities.at("hajari").skipped == 2);
  assert(fixed.entities.at("sites").skipped == 1);
  assert(f.CountRows("hajari") == 3);
  assert(f.store->WorkerTotals("s1", "w1").total_wage == 1500);
}

void TestUnresolvableRecordsAreCountedAsFailures() {
  Fixture f("unresolvable");
  f.legacy->SetItem("@sites",
                    R"([{"id":"s1","name":"A","type":"shop","location":"","startDate":"2023-01-01","isRunning":true,"ownerName":"","contact":"","createdAt":"2023-01-01"},
                        {"id":"s2","name":"B","type":"villa","location":"","startDate":"2023-01-01","isRunning":true,"ownerName":"","contact":"","createdAt":"2023-01-01"},
                        {"id":"s3","name":"C","type":"other","location":"","startDate":"2023-01-01","isRunning":true,"ownerName":"","contact":"","createdAt":"2023-01-01"}])");
  f.legacy->SetItem("@expenses", R"({"not":"an array"})");
  // two sites exist, so the orphan bucket cannot be placed
  f.legacy->SetItem("sitely_materials_", kOrphanMaterials);
  f.legacy->SetItem("sitely_usage_s1_m9", R"([{"id":"u9","materialId":"m9","quantityUsed":1,"date":"2024-06-01"}])");
  // worker whose site never existed
  f.legacy->SetItem("@workers", R"([{"id":"w9","siteId":"gone","name":"Ghost","category":"majdur","joiningDate":"2024-01-01"}])");

  auto report = f.Migrate();
  assert(!report.completed);
  assert(report.entities.at("sites").inserted == 2);
  assert(report.entities.at("sites").failed == 1);
  assert(report.entities.at("expenses").failed == 1);
  assert(report.entities.at("materials").failed == 1);
  assert(report.entities.at("material_usages").failed == 1);
  assert(report.entities.at("workers").failed == 1);
  assert(report.TotalFailed() == 5);
  assert(!f.legacy->GetItem(MigrationEngine::kCompletionKey));
}

void TestSettingsChangedLaterAreNotOverwritten() {
  Fixture f("settings");
  f.store->SetSetting("language", "gu");
  f.legacy->SetItem("@language", "hi");

  auto report = f.Migrate();
  assert(report.completed);
  assert(report.entities.at("settings").skipped == 1);
  assert(f.store->GetSetting("language") == std::optional<std::string>("gu"));
}

void TestEmptyLegacyStoreCompletes() {
  Fixture f("empty");
  auto    report = f.Migrate();
  assert(report.completed);
  assert(report.TotalInserted() == 0);
  assert(f.Migrate().already_migrated);
}

} // namespace

int main() {
  TestFullMigration();
  TestSecondRunIsANoOp();
  TestFailedRecordThenFixedRerunConverges();
  TestUnresolvableRecordsAreCountedAsFailures();
  TestSettingsChangedLaterAreNotOverwritten();
  TestEmptyLegacyStoreCompletes();

  std::cout << "sitely_integration_migration_engine: pass\n";
  return 0;
}
