#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/cloud/cloud_mirror.hpp"
#include "internal/core/ledger_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/legacy/legacy_store.hpp"
#include "internal/migration/migration_engine.hpp"
#include "internal/retention/retention_sweeper.hpp"
#include "internal/util/time.hpp"

namespace sitely::runtime {

// Opens the legacy key/value store on the init thread.
using LegacyStoreOpener = std::function<std::shared_ptr<legacy::LegacyStore>()>;

struct StorageOptions {
  std::string               database_path;
  db::sqlite::SqliteOptions sqlite;

  // Unset when the installation has no legacy store; migration is skipped.
  LegacyStoreOpener open_legacy_store;

  util::TimeSource                    now;
  std::shared_ptr<cloud::CloudMirror> mirror;
};

struct StartupReport {
  std::vector<std::string>                  schema_migrations;
  std::optional<migration::MigrationReport> migration;
  retention::SweepReport                    sweep;
};

/*
  StorageRuntime

  Owns the one database handle of the installation and everything threaded
  through it: repository, schema manager, migration engine, sweeper and
  ledger store. Nothing is global.

  Initialize() runs open -> schema -> migration -> sweep exactly once on a
  worker thread. Every caller, concurrent or late, gets the same future and
  sees the same completion or the same exception; a failed start is not
  retried within the process.

  Ledger() and Sweep() wait for initialization first.
*/
class StorageRuntime {
 public:
  explicit StorageRuntime(StorageOptions options);
  ~StorageRuntime();

  StorageRuntime(const StorageRuntime&)            = delete;
  StorageRuntime& operator=(const StorageRuntime&) = delete;

  std::shared_future<void> Initialize();

  // Blocks until initialization finished; rethrows its failure.
  void InitStorage();

  // Valid after InitStorage() returned.
  const StartupReport& Report();

  core::LedgerStore& Ledger();

  retention::SweepReport Sweep();

  // Number of times the startup sequence actually ran (0 or 1).
  int StartupRuns() const;

 private:
  void RunStartup();

  StorageOptions options_;

  mutable std::mutex                      init_mutex_;
  std::optional<std::shared_future<void>> init_future_;
  int                                     startup_runs_ = 0;

  // Written only by the init thread, read after the future is ready.
  std::shared_ptr<db::sqlite::SqliteDB>        db_;
  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<retention::RetentionSweeper> sweeper_;
  std::unique_ptr<core::LedgerStore>           ledger_;
  StartupReport                                report_;
};

} // namespace sitely::runtime
