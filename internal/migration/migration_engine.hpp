#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/legacy/legacy_store.hpp"

namespace sitely::migration {

struct EntityCounts {
  std::uint64_t inserted = 0;
  std::uint64_t skipped  = 0; // already present
  std::uint64_t failed   = 0;
};

struct MigrationReport {
  // The completion flag was already set; nothing was read.
  bool already_migrated = false;
  // The completion flag was written by this run.
  bool completed = false;

  // Keyed by target table ("sites", "hajari", "settings", ...).
  std::map<std::string, EntityCounts> entities;

  std::uint64_t TotalInserted() const;
  std::uint64_t TotalFailed() const;
};

/*
  One-time transformation of the legacy key/value store into the schema.

  - Every element is inserted insert-if-absent by its legacy id, so a re-run
    after a partial failure converges without duplicates.
  - A failing element is logged and skipped; the rest of its key still lands.
  - The completion flag is written only after a run with zero failures.
  - Each legacy key is migrated in its own transaction.

  Engine errors (store unreachable, sqlite busy) propagate.
*/
class MigrationEngine {
 public:
  static constexpr const char* kCompletionKey   = "@sqlite_migrated";
  static constexpr const char* kCompletionValue = "true";

  MigrationEngine(std::shared_ptr<legacy::LegacyStore> legacy_store, std::shared_ptr<db::Repository> repository);

  MigrationReport MigrateLegacyStore();

 private:
  void MigrateSettings(MigrationReport& report);
  void MigrateSites(MigrationReport& report);
  void MigrateWorkers(MigrationReport& report);
  void MigrateWages(MigrationReport& report);
  void MigrateExpenses(MigrationReport& report);
  void MigratePayments(MigrationReport& report);
  void MigratePhotos(MigrationReport& report);
  void MigrateMaterials(MigrationReport& report);
  void MigrateMaterialUsages(MigrationReport& report);

  std::shared_ptr<legacy::LegacyStore> legacy_store_;
  std::shared_ptr<db::Repository>      repository_;
};

} // namespace sitely::migration
