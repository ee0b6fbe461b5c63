#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace sitely::db::sqlite {

/*
  Repository over a single SqliteDB connection.

  Writes return Result codes translated from sqlite. Reads throw
  std::runtime_error when the engine fails; an absent row is not a failure.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertSite(Transaction&, const model::SiteRecord&, InsertMode) override;
  std::optional<model::SiteRecord> GetSite(Transaction&, const std::string& id) override;
  std::optional<model::SiteRecord> FindSiteByCode(Transaction&, const std::string& site_code) override;
  std::vector<model::SiteRecord> ListSites(Transaction&, const std::optional<std::string>& user_id) override;
  Result UpdateSite(Transaction&, const std::string& id, const model::SiteUpdate&) override;
  Result DeleteSite(Transaction&, const std::string& id) override;

  Result InsertWorker(Transaction&, const model::WorkerRecord&, InsertMode) override;
  std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string& id) override;
  std::vector<model::WorkerRecord> ListWorkers(Transaction&, const std::string& site_id) override;
  Result UpdateWorker(Transaction&, const std::string& id, const model::WorkerUpdate&) override;
  Result DeleteWorker(Transaction&, const std::string& id) override;

  Result InsertWage(Transaction&, const model::WageRecord&, InsertMode) override;
  Result InsertExpense(Transaction&, const model::ExpenseRecord&, InsertMode) override;
  Result InsertPayment(Transaction&, const model::PaymentRecord&, InsertMode) override;
  std::vector<model::WageRecord> ListWages(Transaction&, const std::string& site_id, const std::string& cutoff) override;
  std::vector<model::ExpenseRecord> ListExpenses(Transaction&, const std::string& site_id, const std::string& cutoff) override;
  std::vector<model::PaymentRecord> ListPayments(Transaction&, const std::string& site_id, const std::optional<std::string>& worker_id,
                                                 const std::string& cutoff) override;
  model::WorkerTotals WorkerTotals(Transaction&, const std::string& site_id, const std::string& worker_id, const std::string& cutoff) override;
  std::vector<model::WorkerSummary> SiteWorkerSummaries(Transaction&, const std::string& site_id, const std::string& cutoff) override;
  Result DeleteLedgerRowsBefore(Transaction&, model::LedgerTable table, const std::string& cutoff) override;

  Result InsertMaterial(Transaction&, const model::MaterialRecord&, InsertMode) override;
  std::optional<model::MaterialRecord> GetMaterial(Transaction&, const std::string& id) override;
  std::vector<model::MaterialRecord> ListMaterials(Transaction&, const std::string& site_id) override;
  Result UpdateMaterial(Transaction&, const std::string& id, const model::MaterialUpdate&) override;
  Result DeleteMaterial(Transaction&, const std::string& id) override;
  Result InsertMaterialUsage(Transaction&, const model::MaterialUsageRecord&, InsertMode) override;
  std::vector<model::MaterialUsageRecord> ListMaterialUsages(Transaction&, const std::string& material_id) override;
  std::optional<model::MaterialStock> GetMaterialStock(Transaction&, const std::string& material_id) override;

  Result InsertPhotoGroup(Transaction&, const model::PhotoGroupRecord&, InsertMode) override;
  std::vector<model::PhotoGroupRecord> ListPhotoGroups(Transaction&, const std::string& site_id) override;
  Result DeletePhotoGroup(Transaction&, const std::string& id) override;
  Result InsertPhoto(Transaction&, const model::PhotoRecord&, InsertMode) override;
  std::vector<model::PhotoRecord> ListPhotos(Transaction&, const std::string& site_id) override;
  std::vector<model::PhotoRecord> ListGroupPhotos(Transaction&, const std::string& group_id) override;
  Result DeletePhoto(Transaction&, const std::string& id) override;

  Result InsertTodo(Transaction&, const model::TodoRecord&, InsertMode) override;
  std::optional<model::TodoRecord> GetTodo(Transaction&, const std::string& id) override;
  std::vector<model::TodoRecord> ListTodos(Transaction&, const std::optional<sitely::model::TodoType>& type) override;
  Result UpdateTodo(Transaction&, const std::string& id, const model::TodoUpdate&) override;
  Result SetTodoCompleted(Transaction&, const std::string& id, bool completed, const std::optional<std::string>& completed_at) override;
  Result DeleteTodo(Transaction&, const std::string& id) override;

  std::optional<std::string> GetSetting(Transaction&, const std::string& key) override;
  Result PutSetting(Transaction&, const std::string& key, const std::string& value, bool overwrite) override;
  Result DeleteSetting(Transaction&, const std::string& key) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  // Steps a prepared write to completion; affected_rows from sqlite3_changes.
  static Result RunWrite(sqlite3* db, Statement& st);

  // Same, but zero affected rows becomes NotFound.
  static Result RunTargetedWrite(sqlite3* db, Statement& st, const std::string& what);

  static Result DeleteById(Transaction& t, const char* sql, const std::string& id, const char* what);
};

}
