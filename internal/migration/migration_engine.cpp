#include "migration_engine.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/migration/legacy_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sitely::migration {

namespace {

constexpr const char* kLanguageKey     = "@language";
constexpr const char* kOnboardingKey   = "@onboarding_done";
constexpr const char* kSitesKey        = "@sites";
constexpr const char* kWorkersKey      = "@workers";
constexpr const char* kHajariKey       = "@hajari";
constexpr const char* kExpensesKey     = "@expenses";
constexpr const char* kPaymentsKey     = "@payments";
constexpr const char* kPhotosKey       = "@photos";
constexpr const char* kMaterialsPrefix = "sitely_materials_";
constexpr const char* kUsagePrefix     = "sitely_usage_";

using util::MigrationRecordError;

void LogRecordFailure(const std::string& key, std::int64_t index, const std::string& error) {
  SITELY_LOG_WARN("MigrationRecordError", {observability::StringField("key", key), observability::IntField("index", index),
                                           observability::StringField("error", error)});
}

// Constraint failures belong to the record; anything else is an engine failure.
void CountInsert(const db::Result& result, const std::string& what, EntityCounts& counts) {
  if (!result) {
    if (result.code == db::ErrorCode::ConstraintViolation || result.code == db::ErrorCode::AlreadyExists) {
      throw MigrationRecordError(what + ": " + result.message);
    }
    throw std::runtime_error(what + ": " + result.message);
  }
  if (result.affected_rows > 0) {
    ++counts.inserted;
  } else {
    ++counts.skipped;
  }
}

/*
  Migrates one key holding a JSON array. `migrate` maps and inserts one typed
  element inside the key's transaction and returns the repository result.
*/
template <typename Legacy, typename Migrate>
void MigrateArrayKey(db::Repository& repository, legacy::LegacyStore& store, const std::string& key, EntityCounts& counts, Migrate migrate) {
  auto blob = store.GetItem(key);
  if (!blob || blob->empty()) {
    return;
  }

  std::vector<google::protobuf::Value> elements;
  try {
    elements = ParseJsonArray(*blob);
  } catch (const MigrationRecordError& e) {
    ++counts.failed;
    LogRecordFailure(key, -1, e.what());
    return;
  }

  auto tx = repository.Begin();
  for (size_t i = 0; i < elements.size(); ++i) {
    try {
      Legacy element;
      ParseElement(elements[i], &element);
      CountInsert(migrate(*tx, element), key + "[" + std::to_string(i) + "]", counts);
    } catch (const MigrationRecordError& e) {
      ++counts.failed;
      LogRecordFailure(key, static_cast<std::int64_t>(i), e.what());
    }
  }
  tx->Commit();

  SITELY_LOG_DEBUG("legacy key migrated", {observability::StringField("key", key),
                                           observability::IntField("elements", static_cast<std::int64_t>(elements.size()))});
}

std::vector<std::string> KeysWithPrefix(legacy::LegacyStore& store, const std::string& prefix) {
  std::vector<std::string> keys;
  for (auto& key : store.Keys()) {
    if (key.compare(0, prefix.size(), prefix) == 0) {
      keys.push_back(std::move(key));
    }
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace

std::uint64_t MigrationReport::TotalInserted() const {
  std::uint64_t total = 0;
  for (const auto& [entity, counts] : entities) {
    total += counts.inserted;
  }
  return total;
}

std::uint64_t MigrationReport::TotalFailed() const {
  std::uint64_t total = 0;
  for (const auto& [entity, counts] : entities) {
    total += counts.failed;
  }
  return total;
}

MigrationEngine::MigrationEngine(std::shared_ptr<legacy::LegacyStore> legacy_store, std::shared_ptr<db::Repository> repository)
    : legacy_store_(std::move(legacy_store)), repository_(std::move(repository)) {
}

MigrationReport MigrationEngine::MigrateLegacyStore() {
  MigrationReport report;

  if (legacy_store_->GetItem(kCompletionKey) == std::optional<std::string>(kCompletionValue)) {
    report.already_migrated = true;
    return report;
  }

  // Parents before children so foreign keys resolve.
  MigrateSettings(report);
  MigrateSites(report);
  MigrateWorkers(report);
  MigrateWages(report);
  MigrateExpenses(report);
  MigratePayments(report);
  MigratePhotos(report);
  MigrateMaterials(report);
  MigrateMaterialUsages(report);

  const auto failed = report.TotalFailed();
  if (failed == 0) {
    legacy_store_->SetItem(kCompletionKey, kCompletionValue);
    report.completed = true;
    SITELY_LOG_INFO("legacy migration complete", {observability::IntField("inserted", static_cast<std::int64_t>(report.TotalInserted()))});
  } else {
    SITELY_LOG_WARN("legacy migration incomplete; will retry on next start",
                    {observability::IntField("inserted", static_cast<std::int64_t>(report.TotalInserted())),
                     observability::IntField("failed", static_cast<std::int64_t>(failed))});
  }
  return report;
}

void MigrationEngine::MigrateSettings(MigrationReport& report) {
  auto& counts = report.entities["settings"];

  const std::pair<const char*, const char*> settings[] = {
      {kLanguageKey, "language"},
      {kOnboardingKey, "onboarding_done"},
  };

  auto tx = repository_->Begin();
  for (const auto& [legacy_key, setting] : settings) {
    auto value = legacy_store_->GetItem(legacy_key);
    if (!value || value->empty()) {
      continue;
    }
    // Never overwrite a value changed after an earlier run.
    try {
      CountInsert(repository_->PutSetting(*tx, setting, *value, false), legacy_key, counts);
    } catch (const MigrationRecordError& e) {
      ++counts.failed;
      LogRecordFailure(legacy_key, -1, e.what());
    }
  }
  tx->Commit();
}

void MigrationEngine::MigrateSites(MigrationReport& report) {
  MigrateArrayKey<legacy::v1::LegacySite>(*repository_, *legacy_store_, kSitesKey, report.entities["sites"],
                                          [this](db::Transaction& tx, const legacy::v1::LegacySite& site) {
                                            return repository_->InsertSite(tx, MapSite(site), db::InsertMode::kIgnoreExisting);
                                          });
}

void MigrationEngine::MigrateWorkers(MigrationReport& report) {
  MigrateArrayKey<legacy::v1::LegacyWorker>(*repository_, *legacy_store_, kWorkersKey, report.entities["workers"],
                                            [this](db::Transaction& tx, const legacy::v1::LegacyWorker& worker) {
                                              return repository_->InsertWorker(tx, MapWorker(worker), db::InsertMode::kIgnoreExisting);
                                            });
}

void MigrationEngine::MigrateWages(MigrationReport& report) {
  MigrateArrayKey<legacy::v1::LegacyLedgerEntry>(*repository_, *legacy_store_, kHajariKey, report.entities["hajari"],
                                                 [this](db::Transaction& tx, const legacy::v1::LegacyLedgerEntry& entry) {
                                                   return repository_->InsertWage(tx, MapWage(entry), db::InsertMode::kIgnoreExisting);
                                                 });
}

void MigrationEngine::MigrateExpenses(MigrationReport& report) {
  MigrateArrayKey<legacy::v1::LegacyLedgerEntry>(*repository_, *legacy_store_, kExpensesKey, report.entities["expenses"],
                                                 [this](db::Transaction& tx, const legacy::v1::LegacyLedgerEntry& entry) {
                                                   return repository_->InsertExpense(tx, MapExpense(entry), db::InsertMode::kIgnoreExisting);
                                                 });
}

void MigrationEngine::MigratePayments(MigrationReport& report) {
  MigrateArrayKey<legacy::v1::LegacyLedgerEntry>(*repository_, *legacy_store_, kPaymentsKey, report.entities["payments"],
                                                 [this](db::Transaction& tx, const legacy::v1::LegacyLedgerEntry& entry) {
                                                   return repository_->InsertPayment(tx, MapPayment(entry), db::InsertMode::kIgnoreExisting);
                                                 });
}

void MigrationEngine::MigratePhotos(MigrationReport& report) {
  MigrateArrayKey<legacy::v1::LegacyPhoto>(*repository_, *legacy_store_, kPhotosKey, report.entities["photos"],
                                           [this](db::Transaction& tx, const legacy::v1::LegacyPhoto& photo) {
                                             return repository_->InsertPhoto(tx, MapPhoto(photo), db::InsertMode::kIgnoreExisting);
                                           });
}

void MigrationEngine::MigrateMaterials(MigrationReport& report) {
  auto& counts = report.entities["materials"];

  // Materials saved before a site existed live under the empty site id.
  std::optional<std::string> orphan_site;
  {
    auto tx    = repository_->BeginRead();
    auto sites = repository_->ListSites(*tx, std::nullopt);
    if (sites.size() == 1) {
      orphan_site = sites.front().id;
    }
  }

  const std::string prefix(kMaterialsPrefix);
  for (const auto& key : KeysWithPrefix(*legacy_store_, prefix)) {
    const std::string bucket_site = key.substr(prefix.size());

    MigrateArrayKey<legacy::v1::LegacyMaterial>(
        *repository_, *legacy_store_, key, counts, [&](db::Transaction& tx, const legacy::v1::LegacyMaterial& legacy_material) {
          auto material = MapMaterial(legacy_material);
          if (!bucket_site.empty()) {
            material.site_id = bucket_site;
          } else if (orphan_site) {
            material.site_id = *orphan_site;
          } else {
            throw MigrationRecordError("orphan material " + material.id + ": no single site to attach it to");
          }
          return repository_->InsertMaterial(tx, material, db::InsertMode::kIgnoreExisting);
        });
  }
}

void MigrationEngine::MigrateMaterialUsages(MigrationReport& report) {
  auto& counts = report.entities["material_usages"];

  const std::string prefix(kUsagePrefix);
  for (const auto& key : KeysWithPrefix(*legacy_store_, prefix)) {
    // sitely_usage_<siteId>_<materialId>; ids never contain '_'
    const std::string rest            = key.substr(prefix.size());
    const auto        split           = rest.find('_');
    const std::string bucket_material = split == std::string::npos ? std::string() : rest.substr(split + 1);

    MigrateArrayKey<legacy::v1::LegacyMaterialUsage>(
        *repository_, *legacy_store_, key, counts, [&](db::Transaction& tx, const legacy::v1::LegacyMaterialUsage& legacy_usage) {
          auto usage = MapMaterialUsage(legacy_usage);
          if (usage.material_id.empty()) {
            usage.material_id = bucket_material;
          }

          // The material's site wins; orphan materials were re-homed above.
          auto material = repository_->GetMaterial(tx, usage.material_id);
          if (!material) {
            throw MigrationRecordError("material usage " + usage.id + ": material '" + usage.material_id + "' not migrated");
          }
          usage.site_id = material->site_id;
          return repository_->InsertMaterialUsage(tx, usage, db::InsertMode::kIgnoreExisting);
        });
  }
}

} // namespace sitely::migration
