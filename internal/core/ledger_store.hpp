#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cloud/cloud_mirror.hpp"
#include "internal/core/site_code_generator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace sitely::core {

/*
  LedgerStore

  Application-facing CRUD and aggregation over every site-owned entity.

  - Every mutating call is one transaction; batch inserts are all-or-nothing.
  - Records are validated before any transaction opens. Violations raise
    util::ConstraintViolation and nothing is written.
  - Wage / expense / payment reads and all totals hide rows dated before the
    retention cutoff, whether or not the sweeper has removed them yet.
  - Repository Result codes surface as util exceptions (NotFound,
    AlreadyExists, ConstraintViolation); anything else as std::runtime_error.

  Create* fill an empty id, creation timestamp and date/time fields and
  return the record as stored.
*/
class LedgerStore {
 public:
  explicit LedgerStore(std::shared_ptr<db::Repository> repository, util::TimeSource now = {},
                       std::shared_ptr<cloud::CloudMirror> mirror = nullptr);

  LedgerStore(const LedgerStore&)            = delete;
  LedgerStore& operator=(const LedgerStore&) = delete;

  // ------------------------------------------------------------------
  // Sites
  // ------------------------------------------------------------------

  // Assigns a fresh site code when none is given; codes are stored upper-case.
  db::model::SiteRecord                CreateSite(db::model::SiteRecord site);
  std::optional<db::model::SiteRecord> GetSite(const std::string& id);
  std::optional<db::model::SiteRecord> FindSiteByCode(const std::string& site_code);
  std::vector<db::model::SiteRecord>   ListSites(const std::optional<std::string>& user_id = std::nullopt);
  db::model::SiteRecord                UpdateSite(const std::string& id, db::model::SiteUpdate update);
  void                                 DeleteSite(const std::string& id);

  std::string GenerateUniqueSiteCode();

  // ------------------------------------------------------------------
  // Workers
  // ------------------------------------------------------------------

  db::model::WorkerRecord                CreateWorker(db::model::WorkerRecord worker);
  std::optional<db::model::WorkerRecord> GetWorker(const std::string& id);
  std::vector<db::model::WorkerRecord>   ListWorkers(const std::string& site_id);
  db::model::WorkerRecord                UpdateWorker(const std::string& id, const db::model::WorkerUpdate& update);
  void                                   DeleteWorker(const std::string& id);

  // ------------------------------------------------------------------
  // Ledger rows
  // ------------------------------------------------------------------

  std::vector<db::model::WageRecord>    AddWageRecords(std::vector<db::model::WageRecord> records);
  std::vector<db::model::ExpenseRecord> AddExpenseRecords(std::vector<db::model::ExpenseRecord> records);
  db::model::PaymentRecord              AddPayment(db::model::PaymentRecord record);

  std::vector<db::model::WageRecord>    ListWageRecords(const std::string& site_id);
  std::vector<db::model::ExpenseRecord> ListExpenseRecords(const std::string& site_id);
  std::vector<db::model::PaymentRecord> ListPayments(const std::string& site_id);
  std::vector<db::model::PaymentRecord> ListWorkerPayments(const std::string& site_id, const std::string& worker_id);

  db::model::WorkerTotals                WorkerTotals(const std::string& site_id, const std::string& worker_id);
  std::vector<db::model::WorkerSummary>  SiteWorkerSummaries(const std::string& site_id);

  // ------------------------------------------------------------------
  // Materials
  // ------------------------------------------------------------------

  db::model::MaterialRecord              CreateMaterial(db::model::MaterialRecord material);
  std::vector<db::model::MaterialRecord> ListMaterials(const std::string& site_id);
  db::model::MaterialRecord              UpdateMaterial(const std::string& id, const db::model::MaterialUpdate& update);
  void                                   DeleteMaterial(const std::string& id);

  // site_id is taken from the material.
  db::model::MaterialUsageRecord              AddMaterialUsage(db::model::MaterialUsageRecord usage);
  std::vector<db::model::MaterialUsageRecord> ListMaterialUsages(const std::string& material_id);
  db::model::MaterialStock                    MaterialStock(const std::string& material_id);

  // ------------------------------------------------------------------
  // Photos
  // ------------------------------------------------------------------

  db::model::PhotoGroupRecord              CreatePhotoGroup(db::model::PhotoGroupRecord group);
  std::vector<db::model::PhotoGroupRecord> ListPhotoGroups(const std::string& site_id);
  void                                     DeletePhotoGroup(const std::string& id);

  db::model::PhotoRecord              AddPhoto(db::model::PhotoRecord photo);
  std::vector<db::model::PhotoRecord> ListPhotos(const std::string& site_id);
  std::vector<db::model::PhotoRecord> ListGroupPhotos(const std::string& group_id);
  void                                DeletePhoto(const std::string& id);

  // ------------------------------------------------------------------
  // Todos
  // ------------------------------------------------------------------

  db::model::TodoRecord              CreateTodo(db::model::TodoRecord todo);
  std::vector<db::model::TodoRecord> ListTodos(const std::optional<sitely::model::TodoType>& type = std::nullopt);
  db::model::TodoRecord              UpdateTodo(const std::string& id, const db::model::TodoUpdate& update);
  db::model::TodoRecord              SetTodoCompleted(const std::string& id, bool completed);
  void                               DeleteTodo(const std::string& id);

  // ------------------------------------------------------------------
  // Settings
  // ------------------------------------------------------------------

  std::optional<std::string> GetSetting(const std::string& key);
  void                       SetSetting(const std::string& key, const std::string& value);
  void                       DeleteSetting(const std::string& key);

  // ------------------------------------------------------------------
  // Cloud
  // ------------------------------------------------------------------

  // Empty when no mirror is attached.
  std::vector<cloud::SavedSiteRef> SavedSiteRefs(const std::string& user_id);

  // Current retention cutoff ("YYYY-MM-DD").
  std::string Cutoff() const;

 private:
  void FillSnapshot(db::Transaction& tx, db::model::LedgerRowBase& row);
  void StampLedgerRow(db::model::LedgerRowBase& row) const;

  void MirrorSite(const db::model::SiteRecord& site);
  void MirrorWorker(const db::model::WorkerRecord& worker);

  std::shared_ptr<db::Repository>     repository_;
  util::TimeSource                    now_;
  std::shared_ptr<cloud::CloudMirror> mirror_;
  SiteCodeGenerator                   code_generator_;
};

} // namespace sitely::core
