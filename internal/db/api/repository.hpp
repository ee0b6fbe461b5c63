#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/ledger_record.hpp"
#include "internal/db/model/material_record.hpp"
#include "internal/db/model/photo_record.hpp"
#include "internal/db/model/site_record.hpp"
#include "internal/db/model/todo_record.hpp"
#include "internal/db/model/worker_record.hpp"

namespace sitely::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Site deletion cascades to every site-owned table inside the engine
    (foreign keys), never through application loops
  - Aggregates are computed by the engine, not by pulling rows

  `cutoff` parameters are "YYYY-MM-DD" dates; ledger rows dated before the
  cutoff are excluded. An empty cutoff disables the filter.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Sites
  // ---------------------------------------------------------------------

  virtual Result InsertSite(Transaction&, const model::SiteRecord&, InsertMode) = 0;

  virtual std::optional<model::SiteRecord> GetSite(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::SiteRecord> FindSiteByCode(Transaction&, const std::string& site_code) = 0;

  // user_id == nullopt lists every site; otherwise the user's sites plus
  // legacy sites without an owner.
  virtual std::vector<model::SiteRecord> ListSites(Transaction&, const std::optional<std::string>& user_id) = 0;

  virtual Result UpdateSite(Transaction&, const std::string& id, const model::SiteUpdate&) = 0;

  virtual Result DeleteSite(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Workers
  // ---------------------------------------------------------------------

  virtual Result InsertWorker(Transaction&, const model::WorkerRecord&, InsertMode) = 0;

  virtual std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::WorkerRecord> ListWorkers(Transaction&, const std::string& site_id) = 0;

  virtual Result UpdateWorker(Transaction&, const std::string& id, const model::WorkerUpdate&) = 0;

  virtual Result DeleteWorker(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Ledger rows
  // ---------------------------------------------------------------------

  virtual Result InsertWage(Transaction&, const model::WageRecord&, InsertMode) = 0;

  virtual Result InsertExpense(Transaction&, const model::ExpenseRecord&, InsertMode) = 0;

  virtual Result InsertPayment(Transaction&, const model::PaymentRecord&, InsertMode) = 0;

  virtual std::vector<model::WageRecord> ListWages(Transaction&, const std::string& site_id, const std::string& cutoff) = 0;

  virtual std::vector<model::ExpenseRecord> ListExpenses(Transaction&, const std::string& site_id, const std::string& cutoff) = 0;

  virtual std::vector<model::PaymentRecord> ListPayments(Transaction&, const std::string& site_id, const std::optional<std::string>& worker_id,
                                                         const std::string& cutoff) = 0;

  virtual model::WorkerTotals WorkerTotals(Transaction&, const std::string& site_id, const std::string& worker_id, const std::string& cutoff) = 0;

  virtual std::vector<model::WorkerSummary> SiteWorkerSummaries(Transaction&, const std::string& site_id, const std::string& cutoff) = 0;

  // Hard delete of every row dated before cutoff; affected_rows carries the count.
  virtual Result DeleteLedgerRowsBefore(Transaction&, model::LedgerTable table, const std::string& cutoff) = 0;

  // ---------------------------------------------------------------------
  // Materials
  // ---------------------------------------------------------------------

  virtual Result InsertMaterial(Transaction&, const model::MaterialRecord&, InsertMode) = 0;

  virtual std::optional<model::MaterialRecord> GetMaterial(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::MaterialRecord> ListMaterials(Transaction&, const std::string& site_id) = 0;

  // Recomputes total_amount from the resulting quantity and rate.
  virtual Result UpdateMaterial(Transaction&, const std::string& id, const model::MaterialUpdate&) = 0;

  virtual Result DeleteMaterial(Transaction&, const std::string& id) = 0;

  virtual Result InsertMaterialUsage(Transaction&, const model::MaterialUsageRecord&, InsertMode) = 0;

  virtual std::vector<model::MaterialUsageRecord> ListMaterialUsages(Transaction&, const std::string& material_id) = 0;

  virtual std::optional<model::MaterialStock> GetMaterialStock(Transaction&, const std::string& material_id) = 0;

  // ---------------------------------------------------------------------
  // Photos
  // ---------------------------------------------------------------------

  virtual Result InsertPhotoGroup(Transaction&, const model::PhotoGroupRecord&, InsertMode) = 0;

  virtual std::vector<model::PhotoGroupRecord> ListPhotoGroups(Transaction&, const std::string& site_id) = 0;

  virtual Result DeletePhotoGroup(Transaction&, const std::string& id) = 0;

  virtual Result InsertPhoto(Transaction&, const model::PhotoRecord&, InsertMode) = 0;

  virtual std::vector<model::PhotoRecord> ListPhotos(Transaction&, const std::string& site_id) = 0;

  virtual std::vector<model::PhotoRecord> ListGroupPhotos(Transaction&, const std::string& group_id) = 0;

  virtual Result DeletePhoto(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Todos
  // ---------------------------------------------------------------------

  virtual Result InsertTodo(Transaction&, const model::TodoRecord&, InsertMode) = 0;

  virtual std::optional<model::TodoRecord> GetTodo(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::TodoRecord> ListTodos(Transaction&, const std::optional<sitely::model::TodoType>& type) = 0;

  virtual Result UpdateTodo(Transaction&, const std::string& id, const model::TodoUpdate&) = 0;

  virtual Result SetTodoCompleted(Transaction&, const std::string& id, bool completed, const std::optional<std::string>& completed_at) = 0;

  virtual Result DeleteTodo(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Settings
  // ---------------------------------------------------------------------

  virtual std::optional<std::string> GetSetting(Transaction&, const std::string& key) = 0;

  // overwrite == false keeps an existing value (affected_rows == 0).
  virtual Result PutSetting(Transaction&, const std::string& key, const std::string& value, bool overwrite) = 0;

  virtual Result DeleteSetting(Transaction&, const std::string& key) = 0;
};

} // namespace sitely::db
