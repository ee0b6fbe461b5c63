#include "ledger_store.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/retention/retention_sweeper.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"

namespace sitely::core {

namespace {

using db::InsertMode;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::ConstraintViolation(message);
    default:
      throw std::runtime_error(message);
  }
}

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw util::ConstraintViolation(message);
  }
}

void RequireAmount(double value, const std::string& field) {
  Require(std::isfinite(value) && value >= 0, field + " must be a non-negative number");
}

void RequireAmount(const std::optional<double>& value, const std::string& field) {
  if (value) {
    RequireAmount(*value, field);
  }
}

std::string UpperCase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

// Caller-supplied codes only; the generator's fallback may be longer.
bool IsSiteCode(const std::string& code) {
  if (code.size() != SiteCodeGenerator::kCodeLength) {
    return false;
  }
  return std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isupper(c) || std::isdigit(c); });
}

void ValidateLedgerRow(db::model::LedgerRowBase& row, const char* kind) {
  const std::string prefix(kind);
  Require(!row.site_id.empty(), prefix + ": site id is required");
  Require(!row.worker_id.empty(), prefix + ": worker id is required");
  RequireAmount(row.amount, prefix + " amount");
  Require(util::IsIsoDate(row.date), prefix + ": date must be YYYY-MM-DD, got '" + row.date + "'");
  if (!row.worker_category.empty()) {
    auto category = sitely::model::ParseWorkerCategory(row.worker_category);
    Require(category.has_value(), prefix + ": unknown worker category '" + row.worker_category + "'");
    row.worker_category = std::string(sitely::model::ToString(*category));
  }
}

} // namespace

LedgerStore::LedgerStore(std::shared_ptr<db::Repository> repository, util::TimeSource now, std::shared_ptr<cloud::CloudMirror> mirror)
    : repository_(std::move(repository)), now_(now ? std::move(now) : util::TimeSource(util::Now)), mirror_(std::move(mirror)),
      code_generator_([this](const std::string& code) { return FindSiteByCode(code).has_value(); }, {}, now_) {
}

std::string LedgerStore::Cutoff() const {
  return retention::RetentionCutoff(now_());
}

// ------------------------------------------------------------------
// Sites
// ------------------------------------------------------------------

std::string LedgerStore::GenerateUniqueSiteCode() {
  return code_generator_.Generate();
}

db::model::SiteRecord LedgerStore::CreateSite(db::model::SiteRecord site) {
  Require(!site.name.empty(), "site name is required");
  if (site.site_code) {
    site.site_code = UpperCase(*site.site_code);
    Require(IsSiteCode(*site.site_code), "site code must be 6 characters from [A-Z0-9]");
  } else {
    site.site_code = GenerateUniqueSiteCode();
  }

  const auto now = now_();
  if (site.id.empty()) site.id = util::GenerateId(now);
  if (site.created_at.empty()) site.created_at = util::ToIsoTimestamp(now);
  if (site.is_running) site.end_date.clear();

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertSite(*tx, site, InsertMode::kStrict), "create site " + site.id);
  tx->Commit();

  MirrorSite(site);
  return site;
}

std::optional<db::model::SiteRecord> LedgerStore::GetSite(const std::string& id) {
  auto tx = repository_->BeginRead();
  return repository_->GetSite(*tx, id);
}

std::optional<db::model::SiteRecord> LedgerStore::FindSiteByCode(const std::string& site_code) {
  auto tx = repository_->BeginRead();
  return repository_->FindSiteByCode(*tx, UpperCase(site_code));
}

std::vector<db::model::SiteRecord> LedgerStore::ListSites(const std::optional<std::string>& user_id) {
  auto tx = repository_->BeginRead();
  return repository_->ListSites(*tx, user_id);
}

db::model::SiteRecord LedgerStore::UpdateSite(const std::string& id, db::model::SiteUpdate update) {
  if (update.name) Require(!update.name->empty(), "site name is required");

  auto tx      = repository_->Begin();
  auto current = repository_->GetSite(*tx, id);
  if (!current) {
    throw util::NotFound("site " + id + " not found");
  }

  // A running site carries no end date.
  if (update.is_running.value_or(current->is_running)) {
    update.end_date = std::string();
  }

  ThrowIfDbError(repository_->UpdateSite(*tx, id, update), "update site " + id);
  auto updated = repository_->GetSite(*tx, id);
  tx->Commit();

  if (!updated) {
    throw util::NotFound("site " + id + " not found");
  }
  MirrorSite(*updated);
  return *updated;
}

void LedgerStore::DeleteSite(const std::string& id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteSite(*tx, id), "delete site");
  tx->Commit();

  SITELY_LOG_INFO("site deleted", {observability::StringField("site_id", id)});
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

db::model::WorkerRecord LedgerStore::CreateWorker(db::model::WorkerRecord worker) {
  Require(!worker.site_id.empty(), "worker site id is required");
  Require(!worker.name.empty(), "worker name is required");

  const auto now = now_();
  if (worker.joining_date.empty()) worker.joining_date = util::ToIsoDate(now);
  Require(util::IsIsoDate(worker.joining_date), "worker joining date must be YYYY-MM-DD");
  if (worker.id.empty()) worker.id = util::GenerateId(now);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertWorker(*tx, worker, InsertMode::kStrict), "create worker " + worker.id);
  tx->Commit();

  MirrorWorker(worker);
  return worker;
}

std::optional<db::model::WorkerRecord> LedgerStore::GetWorker(const std::string& id) {
  auto tx = repository_->BeginRead();
  return repository_->GetWorker(*tx, id);
}

std::vector<db::model::WorkerRecord> LedgerStore::ListWorkers(const std::string& site_id) {
  auto tx = repository_->BeginRead();
  return repository_->ListWorkers(*tx, site_id);
}

db::model::WorkerRecord LedgerStore::UpdateWorker(const std::string& id, const db::model::WorkerUpdate& update) {
  if (update.name) Require(!update.name->empty(), "worker name is required");

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateWorker(*tx, id, update), "update worker");
  auto updated = repository_->GetWorker(*tx, id);
  tx->Commit();

  if (!updated) {
    throw util::NotFound("worker " + id + " not found");
  }
  MirrorWorker(*updated);
  return *updated;
}

void LedgerStore::DeleteWorker(const std::string& id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteWorker(*tx, id), "delete worker");
  tx->Commit();
}

// ------------------------------------------------------------------
// Ledger rows
// ------------------------------------------------------------------

void LedgerStore::StampLedgerRow(db::model::LedgerRowBase& row) const {
  const auto now = now_();
  if (row.id.empty()) row.id = util::GenerateId(now);
  if (row.date.empty()) row.date = util::ToIsoDate(now);
  if (row.time.empty()) row.time = util::ToClockTime(now);
}

void LedgerStore::FillSnapshot(db::Transaction& tx, db::model::LedgerRowBase& row) {
  auto worker = repository_->GetWorker(tx, row.worker_id);
  if (!worker) {
    throw util::ConstraintViolation("worker " + row.worker_id + " not found for ledger row " + row.id);
  }
  if (worker->site_id != row.site_id) {
    throw util::ConstraintViolation("worker " + row.worker_id + " does not belong to site " + row.site_id);
  }
  if (row.worker_name.empty()) row.worker_name = worker->name;
  if (row.worker_category.empty()) row.worker_category = std::string(sitely::model::ToString(worker->category));
}

std::vector<db::model::WageRecord> LedgerStore::AddWageRecords(std::vector<db::model::WageRecord> records) {
  for (auto& record : records) {
    StampLedgerRow(record);
    ValidateLedgerRow(record, "hajari");
    RequireAmount(record.overtime, "hajari overtime");
  }

  auto tx = repository_->Begin();
  for (auto& record : records) {
    FillSnapshot(*tx, record);
    ThrowIfDbError(repository_->InsertWage(*tx, record, InsertMode::kStrict), "add hajari " + record.id);
  }
  tx->Commit();
  return records;
}

std::vector<db::model::ExpenseRecord> LedgerStore::AddExpenseRecords(std::vector<db::model::ExpenseRecord> records) {
  for (auto& record : records) {
    StampLedgerRow(record);
    ValidateLedgerRow(record, "expense");
  }

  auto tx = repository_->Begin();
  for (auto& record : records) {
    FillSnapshot(*tx, record);
    ThrowIfDbError(repository_->InsertExpense(*tx, record, InsertMode::kStrict), "add expense " + record.id);
  }
  tx->Commit();
  return records;
}

db::model::PaymentRecord LedgerStore::AddPayment(db::model::PaymentRecord record) {
  StampLedgerRow(record);
  ValidateLedgerRow(record, "payment");

  auto tx = repository_->Begin();
  FillSnapshot(*tx, record);
  ThrowIfDbError(repository_->InsertPayment(*tx, record, InsertMode::kStrict), "add payment " + record.id);
  tx->Commit();
  return record;
}

std::vector<db::model::WageRecord> LedgerStore::ListWageRecords(const std::string& site_id) {
  auto tx = repository_->BeginRead();
  return repository_->ListWages(*tx, site_id, Cutoff());
}

std::vector<db::model::ExpenseRecord> LedgerStore::ListExpenseRecords(const std::string& site_id) {
  auto tx = repository_->BeginRead();
  return repository_->ListExpenses(*tx, site_id, Cutoff());
}

std::vector<db::model::PaymentRecord> LedgerStore::ListPayments(const std::string& site_id) {
  auto tx = repository_->BeginRead();
  return repository_->ListPayments(*tx, site_id, std::nullopt, Cutoff());
}

std::vector<db::model::PaymentRecord> LedgerStore::ListWorkerPayments(const std::string& site_id, const std::string& worker_id) {
  auto tx = repository_->BeginRead();
  return repository_->ListPayments(*tx, site_id, worker_id, Cutoff());
}

db::model::WorkerTotals LedgerStore::WorkerTotals(const std::string& site_id, const std::string& worker_id) {
  auto tx = repository_->BeginRead();
  return repository_->WorkerTotals(*tx, site_id, worker_id, Cutoff());
}

std::vector<db::model::WorkerSummary> LedgerStore::SiteWorkerSummaries(const std::string& site_id) {
  auto tx = repository_->BeginRead();
  return repository_->SiteWorkerSummaries(*tx, site_id, Cutoff());
}

// ------------------------------------------------------------------
// Materials
// ------------------------------------------------------------------

db::model::MaterialRecord LedgerStore::CreateMaterial(db::model::MaterialRecord material) {
  Require(!material.site_id.empty(), "material site id is required");
  Require(!material.name.empty(), "material name is required");
  RequireAmount(material.quantity, "material quantity");
  RequireAmount(material.rate_per_unit, "material rate");
  RequireAmount(material.amount_paid, "material amount paid");

  const auto now = now_();
  if (material.id.empty()) material.id = util::GenerateId(now);
  if (material.purchased_at.empty()) material.purchased_at = util::ToIsoTimestamp(now);
  material.total_amount = material.quantity * material.rate_per_unit;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertMaterial(*tx, material, InsertMode::kStrict), "create material " + material.id);
  tx->Commit();
  return material;
}

std::vector<db::model::MaterialRecord> LedgerStore::ListMaterials(const std::string& site_id) {
  auto tx = repository_->BeginRead();
  return repository_->ListMaterials(*tx, site_id);
}

db::model::MaterialRecord LedgerStore::UpdateMaterial(const std::string& id, const db::model::MaterialUpdate& update) {
  if (update.name) Require(!update.name->empty(), "material name is required");
  RequireAmount(update.quantity, "material quantity");
  RequireAmount(update.rate_per_unit, "material rate");
  RequireAmount(update.amount_paid, "material amount paid");

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateMaterial(*tx, id, update), "update material");
  auto updated = repository_->GetMaterial(*tx, id);
  tx->Commit();

  if (!updated) {
    throw util::NotFound("material " + id + " not found");
  }
  return *updated;
}

void LedgerStore::DeleteMaterial(const std::string& id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteMaterial(*tx, id), "delete material");
  tx->Commit();
}

db::model::MaterialUsageRecord LedgerStore::AddMaterialUsage(db::model::MaterialUsageRecord usage) {
  Require(!usage.material_id.empty(), "material usage material id is required");
  RequireAmount(usage.quantity_used, "material quantity used");

  const auto now = now_();
  if (usage.id.empty()) usage.id = util::GenerateId(now);
  if (usage.date.empty()) usage.date = util::ToIsoDate(now);

  auto tx       = repository_->Begin();
  auto material = repository_->GetMaterial(*tx, usage.material_id);
  if (!material) {
    throw util::ConstraintViolation("material " + usage.material_id + " not found");
  }
  usage.site_id = material->site_id;

  ThrowIfDbError(repository_->InsertMaterialUsage(*tx, usage, InsertMode::kStrict), "add material usage " + usage.id);
  tx->Commit();
  return usage;
}

std::vector<db::model::MaterialUsageRecord> LedgerStore::ListMaterialUsages(const std::string& material_id) {
  auto tx = repository_->BeginRead();
  return repository_->ListMaterialUsages(*tx, material_id);
}

db::model::MaterialStock LedgerStore::MaterialStock(const std::string& material_id) {
  auto tx    = repository_->BeginRead();
  auto stock = repository_->GetMaterialStock(*tx, material_id);
  if (!stock) {
    throw util::NotFound("material " + material_id + " not found");
  }
  return *stock;
}

// ------------------------------------------------------------------
// Photos
// ------------------------------------------------------------------

db::model::PhotoGroupRecord LedgerStore::CreatePhotoGroup(db::model::PhotoGroupRecord group) {
  Require(!group.site_id.empty(), "photo group site id is required");
  Require(!group.name.empty(), "photo group name is required");

  const auto now = now_();
  if (group.id.empty()) group.id = util::GenerateId(now);
  if (group.created_at.empty()) group.created_at = util::ToIsoTimestamp(now);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertPhotoGroup(*tx, group, InsertMode::kStrict), "create photo group " + group.id);
  tx->Commit();
  return group;
}

std::vector<db::model::PhotoGroupRecord> LedgerStore::ListPhotoGroups(const std::string& site_id) {
  auto tx = repository_->BeginRead();
  return repository_->ListPhotoGroups(*tx, site_id);
}

void LedgerStore::DeletePhotoGroup(const std::string& id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeletePhotoGroup(*tx, id), "delete photo group");
  tx->Commit();
}

db::model::PhotoRecord LedgerStore::AddPhoto(db::model::PhotoRecord photo) {
  Require(!photo.site_id.empty(), "photo site id is required");
  Require(!photo.uri.empty(), "photo uri is required");

  const auto now = now_();
  if (photo.id.empty()) photo.id = util::GenerateId(now);
  if (photo.date.empty()) photo.date = util::ToIsoDate(now);
  if (photo.time.empty()) photo.time = util::ToClockTime(now);
  if (photo.group_id && photo.group_id->empty()) photo.group_id.reset();

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertPhoto(*tx, photo, InsertMode::kStrict), "add photo " + photo.id);
  tx->Commit();
  return photo;
}

std::vector<db::model::PhotoRecord> LedgerStore::ListPhotos(const std::string& site_id) {
  auto tx = repository_->BeginRead();
  return repository_->ListPhotos(*tx, site_id);
}

std::vector<db::model::PhotoRecord> LedgerStore::ListGroupPhotos(const std::string& group_id) {
  auto tx = repository_->BeginRead();
  return repository_->ListGroupPhotos(*tx, group_id);
}

void LedgerStore::DeletePhoto(const std::string& id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeletePhoto(*tx, id), "delete photo");
  tx->Commit();
}

// ------------------------------------------------------------------
// Todos
// ------------------------------------------------------------------

db::model::TodoRecord LedgerStore::CreateTodo(db::model::TodoRecord todo) {
  Require(!todo.title.empty(), "todo title is required");

  const auto now = now_();
  if (todo.id.empty()) todo.id = util::GenerateId(now);
  if (todo.created_at.empty()) todo.created_at = util::ToIsoTimestamp(now);
  if (todo.site_id && todo.site_id->empty()) todo.site_id.reset();
  if (todo.is_completed && !todo.completed_at) todo.completed_at = util::ToIsoTimestamp(now);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertTodo(*tx, todo, InsertMode::kStrict), "create todo " + todo.id);
  tx->Commit();
  return todo;
}

std::vector<db::model::TodoRecord> LedgerStore::ListTodos(const std::optional<sitely::model::TodoType>& type) {
  auto tx = repository_->BeginRead();
  return repository_->ListTodos(*tx, type);
}

db::model::TodoRecord LedgerStore::UpdateTodo(const std::string& id, const db::model::TodoUpdate& update) {
  if (update.title) Require(!update.title->empty(), "todo title is required");

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateTodo(*tx, id, update), "update todo");
  auto updated = repository_->GetTodo(*tx, id);
  tx->Commit();

  if (!updated) {
    throw util::NotFound("todo " + id + " not found");
  }
  return *updated;
}

db::model::TodoRecord LedgerStore::SetTodoCompleted(const std::string& id, bool completed) {
  std::optional<std::string> completed_at;
  if (completed) completed_at = util::ToIsoTimestamp(now_());

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->SetTodoCompleted(*tx, id, completed, completed_at), "complete todo");
  auto updated = repository_->GetTodo(*tx, id);
  tx->Commit();

  if (!updated) {
    throw util::NotFound("todo " + id + " not found");
  }
  return *updated;
}

void LedgerStore::DeleteTodo(const std::string& id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteTodo(*tx, id), "delete todo");
  tx->Commit();
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

std::optional<std::string> LedgerStore::GetSetting(const std::string& key) {
  auto tx = repository_->BeginRead();
  return repository_->GetSetting(*tx, key);
}

void LedgerStore::SetSetting(const std::string& key, const std::string& value) {
  Require(!key.empty(), "setting key is required");

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->PutSetting(*tx, key, value, true), "set setting " + key);
  tx->Commit();
}

void LedgerStore::DeleteSetting(const std::string& key) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteSetting(*tx, key), "delete setting");
  tx->Commit();
}

// ------------------------------------------------------------------
// Cloud
// ------------------------------------------------------------------

std::vector<cloud::SavedSiteRef> LedgerStore::SavedSiteRefs(const std::string& user_id) {
  if (!mirror_) {
    return {};
  }
  return mirror_->SavedSiteRefs(user_id);
}

// Mirror failures never undo or fail a committed local write.
void LedgerStore::MirrorSite(const db::model::SiteRecord& site) {
  if (!mirror_) {
    return;
  }
  try {
    mirror_->UpsertSite(site);
  } catch (const std::exception& e) {
    SITELY_LOG_WARN("cloud mirror site push failed",
                    {observability::StringField("site_id", site.id), observability::StringField("error", e.what())});
  }
}

void LedgerStore::MirrorWorker(const db::model::WorkerRecord& worker) {
  if (!mirror_) {
    return;
  }
  try {
    mirror_->UpsertWorker(worker);
  } catch (const std::exception& e) {
    SITELY_LOG_WARN("cloud mirror worker push failed",
                    {observability::StringField("worker_id", worker.id), observability::StringField("error", e.what())});
  }
}

} // namespace sitely::core
