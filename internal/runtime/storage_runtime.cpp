#include "storage_runtime.hpp"

#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sitely::runtime {

StorageRuntime::StorageRuntime(StorageOptions options) : options_(std::move(options)) {
  if (!options_.now) {
    options_.now = util::Now;
  }
}

StorageRuntime::~StorageRuntime() {
  // The init thread uses our members; never let it outlive them.
  std::shared_future<void> pending;
  {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (init_future_) {
      pending = *init_future_;
    }
  }
  if (pending.valid()) {
    pending.wait();
  }
}

std::shared_future<void> StorageRuntime::Initialize() {
  std::lock_guard<std::mutex> lock(init_mutex_);
  if (!init_future_) {
    ++startup_runs_;
    init_future_ = std::async(std::launch::async, [this] { RunStartup(); }).share();
  }
  return *init_future_;
}

void StorageRuntime::InitStorage() {
  Initialize().get();
}

const StartupReport& StorageRuntime::Report() {
  InitStorage();
  return report_;
}

core::LedgerStore& StorageRuntime::Ledger() {
  InitStorage();
  return *ledger_;
}

retention::SweepReport StorageRuntime::Sweep() {
  InitStorage();
  return sweeper_->Sweep();
}

int StorageRuntime::StartupRuns() const {
  std::lock_guard<std::mutex> lock(init_mutex_);
  return startup_runs_;
}

void StorageRuntime::RunStartup() {
  SITELY_LOG_INFO("storage init started", {observability::StringField("path", options_.database_path)});

  try {
    db_ = std::make_shared<db::sqlite::SqliteDB>(options_.database_path, options_.sqlite);
  } catch (const std::exception& e) {
    throw util::SchemaError(std::string("open store: ") + e.what());
  }

  db::sqlite::SchemaManager schema(db_);
  report_.schema_migrations = schema.EnsureSchema();

  repository_ = std::make_shared<db::sqlite::SqliteRepository>(db_);

  if (options_.open_legacy_store) {
    auto legacy_store = options_.open_legacy_store();
    if (legacy_store) {
      migration::MigrationEngine engine(std::move(legacy_store), repository_);
      report_.migration = engine.MigrateLegacyStore();
    }
  }

  sweeper_      = std::make_shared<retention::RetentionSweeper>(repository_, options_.now);
  report_.sweep = sweeper_->Sweep();

  ledger_ = std::make_unique<core::LedgerStore>(repository_, options_.now, options_.mirror);

  SITELY_LOG_INFO("storage initialised", {observability::IntField("schema_migrations", static_cast<std::int64_t>(report_.schema_migrations.size())),
                                          observability::IntField("swept", static_cast<std::int64_t>(report_.sweep.Total()))});
}

} // namespace sitely::runtime
