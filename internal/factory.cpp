#include "factory.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/legacy/sqlite_legacy_store.hpp"
#include "internal/observability/logging.hpp"

namespace sitely::factory {

namespace {

db::sqlite::SqliteOptions BuildSqliteOptions(const sitely::runtime::config::SqliteDatabaseConfig& sqlite) {
  db::sqlite::SqliteOptions options;
  options.busy_timeout_ms = sqlite.busy_timeout_ms();
  options.synchronous     = sqlite.synchronous();
  return options;
}

runtime::LegacyStoreOpener BuildLegacyStoreOpener(const sitely::runtime::config::LegacyStoreConfig& legacy_store) {
  if (!legacy_store.has_sqlite()) {
    return {};
  }

  const std::string path  = legacy_store.sqlite().path();
  const std::string table = legacy_store.sqlite().table();
  if (path.empty()) {
    throw std::runtime_error("legacy_store.sqlite.path is required");
  }

  return [path, table]() -> std::shared_ptr<legacy::LegacyStore> {
    // A fresh install has no legacy file; never create one.
    if (!std::filesystem::exists(path)) {
      SITELY_LOG_INFO("no legacy store", {observability::StringField("path", path)});
      return nullptr;
    }

    db::sqlite::SqliteOptions options;
    options.create_if_missing = false;
    options.wal               = false;
    auto legacy_db            = std::make_shared<db::sqlite::SqliteDB>(path, options);
    return std::make_shared<legacy::SqliteLegacyStore>(std::move(legacy_db), table);
  };
}

} // namespace

std::unique_ptr<runtime::StorageRuntime> BuildStorageRuntime(const sitely::runtime::config::RuntimeConfig& config,
                                                             std::shared_ptr<cloud::CloudMirror>           mirror) {
  const auto& database = config.database();
  if (database.sqlite().path().empty()) {
    throw std::runtime_error("database.sqlite.path is required");
  }

  runtime::StorageOptions options;
  options.database_path     = database.sqlite().path();
  options.sqlite            = BuildSqliteOptions(database.sqlite());
  options.open_legacy_store = BuildLegacyStoreOpener(config.legacy_store());
  options.mirror            = std::move(mirror);

  return std::make_unique<runtime::StorageRuntime>(std::move(options));
}

} // namespace sitely::factory
