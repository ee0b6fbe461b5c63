#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <functional>
#include <string_view>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace sitely::db::sqlite {

using sitely::db::ErrorCode;
using sitely::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return ColText(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

// Reads never hide engine failures behind an empty result.
void CheckPrepared(sqlite3* db, const Statement& st) {
  if (!st.Ok()) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
}

void CheckDone(sqlite3* db, int rc) {
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite read: ") + sqlite3_errmsg(db));
  }
}

/*
  SET list for partial updates. Only engaged fields contribute a column;
  an update with no engaged field still matches the row, so callers get
  NotFound for a missing id either way.
*/
class SetClause {
 public:
  void Text(const char* column, const std::optional<std::string>& value) {
    if (!value) return;
    Add(column, [v = *value](sqlite3_stmt* st, int idx) { BindText(st, idx, v); });
  }

  // Engaged empty string writes NULL.
  void NullableText(const char* column, const std::optional<std::string>& value) {
    if (!value) return;
    if (value->empty()) {
      Add(column, [](sqlite3_stmt* st, int idx) { sqlite3_bind_null(st, idx); });
      return;
    }
    Text(column, value);
  }

  template <typename Enum>
  void Token(const char* column, const std::optional<Enum>& value) {
    if (!value) return;
    Add(column, [v = *value](sqlite3_stmt* st, int idx) { BindText(st, idx, sitely::model::ToString(v)); });
  }

  void Real(const char* column, const std::optional<double>& value) {
    if (!value) return;
    Add(column, [v = *value](sqlite3_stmt* st, int idx) { BindDouble(st, idx, v); });
  }

  void Flag(const char* column, const std::optional<bool>& value) {
    if (!value) return;
    Add(column, [v = *value](sqlite3_stmt* st, int idx) { BindBool(st, idx, v); });
  }

  std::string Sql(const char* table) const {
    std::string sql = std::string("UPDATE ") + table + " SET ";
    if (columns_.empty()) {
      sql += "id=id";
    }
    for (size_t i = 0; i < columns_.size(); ++i) {
      if (i > 0) sql += ',';
      sql += columns_[i];
      sql += "=?";
    }
    sql += " WHERE id=?;";
    return sql;
  }

  // Binds the SET values, then the id.
  void Bind(sqlite3_stmt* st, const std::string& id) const {
    int idx = 1;
    for (const auto& binder : binders_) {
      binder(st, idx++);
    }
    BindText(st, idx, id);
  }

 private:
  void Add(const char* column, std::function<void(sqlite3_stmt*, int)> binder) {
    columns_.emplace_back(column);
    binders_.push_back(std::move(binder));
  }

  std::vector<std::string>                              columns_;
  std::vector<std::function<void(sqlite3_stmt*, int)>> binders_;
};

std::string InsertSql(const char* insert, InsertMode mode) {
  std::string sql(insert);
  if (mode == InsertMode::kIgnoreExisting) {
    sql += sql::ON_CONFLICT_ID_DO_NOTHING;
  }
  sql += ';';
  return sql;
}

model::SiteRecord ReadSite(sqlite3_stmt* st) {
  model::SiteRecord r;
  r.id         = ColText(st, 0);
  r.name       = ColText(st, 1);
  r.type       = sitely::model::ParseSiteType(ColText(st, 2)).value_or(sitely::model::SiteType::kOther);
  r.location   = ColText(st, 3);
  r.start_date = ColText(st, 4);
  r.end_date   = ColText(st, 5);
  r.is_running = ColBool(st, 6);
  r.owner_name = ColText(st, 7);
  r.contact    = ColText(st, 8);
  r.site_code  = ColOptText(st, 9);
  r.user_id    = ColOptText(st, 10);
  r.created_at = ColText(st, 11);
  return r;
}

model::WorkerRecord ReadWorker(sqlite3_stmt* st) {
  model::WorkerRecord r;
  r.id           = ColText(st, 0);
  r.site_id      = ColText(st, 1);
  r.name         = ColText(st, 2);
  r.age          = ColText(st, 3);
  r.contact      = ColText(st, 4);
  r.village      = ColText(st, 5);
  r.category     = sitely::model::ParseWorkerCategory(ColText(st, 6)).value_or(sitely::model::WorkerCategory::kUnskilled);
  r.photo_uri    = ColOptText(st, 7);
  r.joining_date = ColText(st, 8);
  r.is_active    = ColBool(st, 9);
  return r;
}

// Columns 0..5 are shared by every ledger table; 7 and 8 are date and time.
void ReadLedgerBase(sqlite3_stmt* st, model::LedgerRowBase& r) {
  r.id              = ColText(st, 0);
  r.site_id         = ColText(st, 1);
  r.worker_id       = ColText(st, 2);
  r.worker_name     = ColText(st, 3);
  r.worker_category = ColText(st, 4);
  r.amount          = ColDouble(st, 5);
  r.date            = ColText(st, 7);
  r.time            = ColText(st, 8);
}

void BindLedgerBase(sqlite3_stmt* st, const model::LedgerRowBase& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.site_id);
  BindText(st, 3, r.worker_id);
  BindText(st, 4, r.worker_name);
  BindText(st, 5, r.worker_category);
  BindDouble(st, 6, r.amount);
  BindText(st, 8, r.date);
  BindText(st, 9, r.time);
}

model::MaterialRecord ReadMaterial(sqlite3_stmt* st) {
  model::MaterialRecord r;
  r.id             = ColText(st, 0);
  r.site_id        = ColText(st, 1);
  r.name           = ColText(st, 2);
  r.vendor_name    = ColText(st, 3);
  r.vendor_phone   = ColText(st, 4);
  r.quantity       = ColDouble(st, 5);
  r.unit           = sitely::model::ParseMaterialUnit(ColText(st, 6)).value_or(sitely::model::MaterialUnit::kOther);
  r.rate_per_unit  = ColDouble(st, 7);
  r.total_amount   = ColDouble(st, 8);
  r.amount_paid    = ColDouble(st, 9);
  r.bill_photo_uri = ColOptText(st, 10);
  r.purchased_at   = ColText(st, 11);
  return r;
}

model::MaterialUsageRecord ReadMaterialUsage(sqlite3_stmt* st) {
  model::MaterialUsageRecord r;
  r.id            = ColText(st, 0);
  r.material_id   = ColText(st, 1);
  r.site_id       = ColText(st, 2);
  r.quantity_used = ColDouble(st, 3);
  r.description   = ColText(st, 4);
  r.date          = ColText(st, 5);
  return r;
}

model::PhotoRecord ReadPhoto(sqlite3_stmt* st) {
  model::PhotoRecord r;
  r.id          = ColText(st, 0);
  r.site_id     = ColText(st, 1);
  r.group_id    = ColOptText(st, 2);
  r.uri         = ColText(st, 3);
  r.description = ColText(st, 4);
  r.date        = ColText(st, 5);
  r.time        = ColText(st, 6);
  return r;
}

model::TodoRecord ReadTodo(sqlite3_stmt* st) {
  model::TodoRecord r;
  r.id           = ColText(st, 0);
  r.title        = ColText(st, 1);
  r.description  = ColText(st, 2);
  r.type         = sitely::model::ParseTodoType(ColText(st, 3)).value_or(sitely::model::TodoType::kDaily);
  r.priority     = sitely::model::ParseTodoPriority(ColText(st, 4)).value_or(sitely::model::TodoPriority::kMedium);
  r.deadline     = ColOptText(st, 5);
  r.is_completed = ColBool(st, 6);
  r.completed_at = ColOptText(st, 7);
  r.site_id      = ColOptText(st, 8);
  r.created_at   = ColText(st, 9);
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> ReadAll(sqlite3* db, Statement& st, Reader read) {
  std::vector<Record> out;
  int                 rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    out.push_back(read(st.Get()));
  }
  CheckDone(db, rc);
  return out;
}

template <typename Record, typename Reader>
std::optional<Record> ReadOne(sqlite3* db, Statement& st, Reader read) {
  int rc = st.Step();
  if (rc == SQLITE_ROW) {
    return read(st.Get());
  }
  CheckDone(db, rc);
  return std::nullopt;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, true);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, false);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::RunWrite(sqlite3* db, Statement& st) {
  int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  return Result::Ok(static_cast<std::uint64_t>(sqlite3_changes(db)));
}

Result SqliteRepository::RunTargetedWrite(sqlite3* db, Statement& st, const std::string& what) {
  auto r = RunWrite(db, st);
  if (r && r.affected_rows == 0) {
    return Result::Err(ErrorCode::NotFound, what + " not found");
  }
  return r;
}

Result SqliteRepository::DeleteById(Transaction& t, const char* sql, const std::string& id, const char* what) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql);
  if (!st.Ok()) return Translate(db, st.Rc());

  BindText(st.Get(), 1, id);
  return RunTargetedWrite(db, st, std::string(what) + " " + id);
}

// ------------------------------------------------------------------
// Sites
// ------------------------------------------------------------------

Result SqliteRepository::InsertSite(Transaction& t, const model::SiteRecord& r, InsertMode mode) {
  auto*     db  = TX(t).Handle();
  auto      sql = InsertSql(sql::INSERT_SITE, mode);
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  BindText(st.Get(), 1, r.id);
  BindText(st.Get(), 2, r.name);
  BindText(st.Get(), 3, sitely::model::ToString(r.type));
  BindText(st.Get(), 4, r.location);
  BindText(st.Get(), 5, r.start_date);
  BindText(st.Get(), 6, r.end_date);
  BindBool(st.Get(), 7, r.is_running);
  BindText(st.Get(), 8, r.owner_name);
  BindText(st.Get(), 9, r.contact);
  BindOptText(st.Get(), 10, r.site_code);
  BindOptText(st.Get(), 11, r.user_id);
  BindText(st.Get(), 12, r.created_at);

  return RunWrite(db, st);
}

std::optional<model::SiteRecord> SqliteRepository::GetSite(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_SITE);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, id);
  return ReadOne<model::SiteRecord>(db, st, ReadSite);
}

std::optional<model::SiteRecord> SqliteRepository::FindSiteByCode(Transaction& t, const std::string& site_code) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_SITE_BY_CODE);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, site_code);
  return ReadOne<model::SiteRecord>(db, st, ReadSite);
}

std::vector<model::SiteRecord> SqliteRepository::ListSites(Transaction& t, const std::optional<std::string>& user_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, user_id ? sql::SELECT_USER_SITES : sql::SELECT_ALL_SITES);
  CheckPrepared(db, st);

  if (user_id) BindText(st.Get(), 1, *user_id);
  return ReadAll<model::SiteRecord>(db, st, ReadSite);
}

Result SqliteRepository::UpdateSite(Transaction& t, const std::string& id, const model::SiteUpdate& u) {
  SetClause set;
  set.Text("name", u.name);
  set.Token("type", u.type);
  set.Text("location", u.location);
  set.Text("startDate", u.start_date);
  set.Text("endDate", u.end_date);
  set.Flag("isRunning", u.is_running);
  set.Text("ownerName", u.owner_name);
  set.Text("contact", u.contact);

  auto*     db  = TX(t).Handle();
  auto      sql = set.Sql("sites");
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  set.Bind(st.Get(), id);
  return RunTargetedWrite(db, st, "site " + id);
}

Result SqliteRepository::DeleteSite(Transaction& t, const std::string& id) {
  return DeleteById(t, sql::DELETE_SITE, id, "site");
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result SqliteRepository::InsertWorker(Transaction& t, const model::WorkerRecord& r, InsertMode mode) {
  auto*     db  = TX(t).Handle();
  auto      sql = InsertSql(sql::INSERT_WORKER, mode);
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  BindText(st.Get(), 1, r.id);
  BindText(st.Get(), 2, r.site_id);
  BindText(st.Get(), 3, r.name);
  BindText(st.Get(), 4, r.age);
  BindText(st.Get(), 5, r.contact);
  BindText(st.Get(), 6, r.village);
  BindText(st.Get(), 7, sitely::model::ToString(r.category));
  BindOptText(st.Get(), 8, r.photo_uri);
  BindText(st.Get(), 9, r.joining_date);
  BindBool(st.Get(), 10, r.is_active);

  return RunWrite(db, st);
}

std::optional<model::WorkerRecord> SqliteRepository::GetWorker(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_WORKER);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, id);
  return ReadOne<model::WorkerRecord>(db, st, ReadWorker);
}

std::vector<model::WorkerRecord> SqliteRepository::ListWorkers(Transaction& t, const std::string& site_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_SITE_WORKERS);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, site_id);
  return ReadAll<model::WorkerRecord>(db, st, ReadWorker);
}

Result SqliteRepository::UpdateWorker(Transaction& t, const std::string& id, const model::WorkerUpdate& u) {
  SetClause set;
  set.Text("name", u.name);
  set.Text("age", u.age);
  set.Text("contact", u.contact);
  set.Text("village", u.village);
  set.Token("category", u.category);
  set.NullableText("photoUri", u.photo_uri);
  set.Flag("isActive", u.is_active);

  auto*     db  = TX(t).Handle();
  auto      sql = set.Sql("workers");
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  set.Bind(st.Get(), id);
  return RunTargetedWrite(db, st, "worker " + id);
}

Result SqliteRepository::DeleteWorker(Transaction& t, const std::string& id) {
  return DeleteById(t, sql::DELETE_WORKER, id, "worker");
}

// ------------------------------------------------------------------
// Ledger rows
// ------------------------------------------------------------------

Result SqliteRepository::InsertWage(Transaction& t, const model::WageRecord& r, InsertMode mode) {
  auto*     db  = TX(t).Handle();
  auto      sql = InsertSql(sql::INSERT_WAGE, mode);
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  BindLedgerBase(st.Get(), r);
  BindDouble(st.Get(), 7, r.overtime);
  return RunWrite(db, st);
}

Result SqliteRepository::InsertExpense(Transaction& t, const model::ExpenseRecord& r, InsertMode mode) {
  auto*     db  = TX(t).Handle();
  auto      sql = InsertSql(sql::INSERT_EXPENSE, mode);
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  BindLedgerBase(st.Get(), r);
  BindText(st.Get(), 7, r.description);
  return RunWrite(db, st);
}

Result SqliteRepository::InsertPayment(Transaction& t, const model::PaymentRecord& r, InsertMode mode) {
  auto*     db  = TX(t).Handle();
  auto      sql = InsertSql(sql::INSERT_PAYMENT, mode);
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  BindLedgerBase(st.Get(), r);
  BindText(st.Get(), 7, sitely::model::ToString(r.method));
  return RunWrite(db, st);
}

std::vector<model::WageRecord> SqliteRepository::ListWages(Transaction& t, const std::string& site_id, const std::string& cutoff) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_WAGES);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, site_id);
  BindText(st.Get(), 2, cutoff);
  return ReadAll<model::WageRecord>(db, st, [](sqlite3_stmt* s) {
    model::WageRecord r;
    ReadLedgerBase(s, r);
    r.overtime = ColDouble(s, 6);
    return r;
  });
}

std::vector<model::ExpenseRecord> SqliteRepository::ListExpenses(Transaction& t, const std::string& site_id, const std::string& cutoff) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_EXPENSES);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, site_id);
  BindText(st.Get(), 2, cutoff);
  return ReadAll<model::ExpenseRecord>(db, st, [](sqlite3_stmt* s) {
    model::ExpenseRecord r;
    ReadLedgerBase(s, r);
    r.description = ColText(s, 6);
    return r;
  });
}

std::vector<model::PaymentRecord> SqliteRepository::ListPayments(Transaction& t, const std::string& site_id,
                                                                 const std::optional<std::string>& worker_id, const std::string& cutoff) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_PAYMENTS);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, site_id);
  BindText(st.Get(), 2, cutoff);
  BindOptText(st.Get(), 3, worker_id);
  return ReadAll<model::PaymentRecord>(db, st, [](sqlite3_stmt* s) {
    model::PaymentRecord r;
    ReadLedgerBase(s, r);
    r.method = sitely::model::ParsePaymentMethod(ColText(s, 6)).value_or(sitely::model::PaymentMethod::kCash);
    return r;
  });
}

model::WorkerTotals SqliteRepository::WorkerTotals(Transaction& t, const std::string& site_id, const std::string& worker_id,
                                                   const std::string& cutoff) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_WORKER_TOTALS);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, site_id);
  BindText(st.Get(), 2, worker_id);
  BindText(st.Get(), 3, cutoff);

  model::WorkerTotals totals;
  int                 rc = st.Step();
  if (rc != SQLITE_ROW) {
    CheckDone(db, rc);
    return totals;
  }
  totals.total_wage    = ColDouble(st.Get(), 0);
  totals.total_expense = ColDouble(st.Get(), 1);
  totals.total_paid    = ColDouble(st.Get(), 2);
  totals.remaining     = totals.total_wage - totals.total_expense - totals.total_paid;
  return totals;
}

std::vector<model::WorkerSummary> SqliteRepository::SiteWorkerSummaries(Transaction& t, const std::string& site_id, const std::string& cutoff) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_SITE_WORKER_SUMMARIES);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, site_id);
  BindText(st.Get(), 2, cutoff);
  return ReadAll<model::WorkerSummary>(db, st, [](sqlite3_stmt* s) {
    model::WorkerSummary r;
    r.worker_id              = ColText(s, 0);
    r.worker_name            = ColText(s, 1);
    r.worker_category        = ColText(s, 2);
    r.totals.total_wage      = ColDouble(s, 3);
    r.totals.total_expense   = ColDouble(s, 4);
    r.totals.total_paid      = ColDouble(s, 5);
    r.totals.remaining       = r.totals.total_wage - r.totals.total_expense - r.totals.total_paid;
    r.last_payment_date      = ColOptText(s, 6);
    return r;
  });
}

Result SqliteRepository::DeleteLedgerRowsBefore(Transaction& t, model::LedgerTable table, const std::string& cutoff) {
  auto*     db  = TX(t).Handle();
  auto      sql = std::string("DELETE FROM ") + model::TableName(table) + " WHERE date < ?;";
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  BindText(st.Get(), 1, cutoff);
  return RunWrite(db, st);
}

// ------------------------------------------------------------------
// Materials
// ------------------------------------------------------------------

Result SqliteRepository::InsertMaterial(Transaction& t, const model::MaterialRecord& r, InsertMode mode) {
  auto*     db  = TX(t).Handle();
  auto      sql = InsertSql(sql::INSERT_MATERIAL, mode);
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  BindText(st.Get(), 1, r.id);
  BindText(st.Get(), 2, r.site_id);
  BindText(st.Get(), 3, r.name);
  BindText(st.Get(), 4, r.vendor_name);
  BindText(st.Get(), 5, r.vendor_phone);
  BindDouble(st.Get(), 6, r.quantity);
  BindText(st.Get(), 7, sitely::model::ToString(r.unit));
  BindDouble(st.Get(), 8, r.rate_per_unit);
  // total is always derived at write time
  BindDouble(st.Get(), 9, r.quantity * r.rate_per_unit);
  BindDouble(st.Get(), 10, r.amount_paid);
  BindOptText(st.Get(), 11, r.bill_photo_uri);
  BindText(st.Get(), 12, r.purchased_at);

  return RunWrite(db, st);
}

std::optional<model::MaterialRecord> SqliteRepository::GetMaterial(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_MATERIAL);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, id);
  return ReadOne<model::MaterialRecord>(db, st, ReadMaterial);
}

std::vector<model::MaterialRecord> SqliteRepository::ListMaterials(Transaction& t, const std::string& site_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_SITE_MATERIALS);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, site_id);
  return ReadAll<model::MaterialRecord>(db, st, ReadMaterial);
}

Result SqliteRepository::UpdateMaterial(Transaction& t, const std::string& id, const model::MaterialUpdate& u) {
  SetClause set;
  set.Text("name", u.name);
  set.Text("vendorName", u.vendor_name);
  set.Text("vendorPhone", u.vendor_phone);
  set.Real("quantity", u.quantity);
  set.Token("unit", u.unit);
  set.Real("ratePerUnit", u.rate_per_unit);
  set.Real("amountPaid", u.amount_paid);
  set.NullableText("billPhotoUri", u.bill_photo_uri);

  auto* db  = TX(t).Handle();
  auto  sql = set.Sql("materials");
  {
    Statement st(db, sql.c_str());
    if (!st.Ok()) return Translate(db, st.Rc());

    set.Bind(st.Get(), id);
    auto r = RunTargetedWrite(db, st, "material " + id);
    if (!r || (!u.quantity && !u.rate_per_unit)) return r;
  }

  // SET expressions see pre-update values, so the total is a second pass.
  Statement st(db, "UPDATE materials SET totalAmount=quantity*ratePerUnit WHERE id=?;");
  if (!st.Ok()) return Translate(db, st.Rc());

  BindText(st.Get(), 1, id);
  return RunTargetedWrite(db, st, "material " + id);
}

Result SqliteRepository::DeleteMaterial(Transaction& t, const std::string& id) {
  return DeleteById(t, sql::DELETE_MATERIAL, id, "material");
}

Result SqliteRepository::InsertMaterialUsage(Transaction& t, const model::MaterialUsageRecord& r, InsertMode mode) {
  auto*     db  = TX(t).Handle();
  auto      sql = InsertSql(sql::INSERT_MATERIAL_USAGE, mode);
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  BindText(st.Get(), 1, r.id);
  BindText(st.Get(), 2, r.material_id);
  BindText(st.Get(), 3, r.site_id);
  BindDouble(st.Get(), 4, r.quantity_used);
  BindText(st.Get(), 5, r.description);
  BindText(st.Get(), 6, r.date);

  return RunWrite(db, st);
}

std::vector<model::MaterialUsageRecord> SqliteRepository::ListMaterialUsages(Transaction& t, const std::string& material_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_MATERIAL_USAGES);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, material_id);
  return ReadAll<model::MaterialUsageRecord>(db, st, ReadMaterialUsage);
}

std::optional<model::MaterialStock> SqliteRepository::GetMaterialStock(Transaction& t, const std::string& material_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_MATERIAL_STOCK);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, material_id);
  return ReadOne<model::MaterialStock>(db, st, [](sqlite3_stmt* s) {
    model::MaterialStock stock;
    stock.material_id   = ColText(s, 0);
    stock.quantity      = ColDouble(s, 1);
    stock.used          = ColDouble(s, 2);
    stock.raw_remaining = stock.quantity - stock.used;
    stock.remaining     = stock.raw_remaining < 0 ? 0 : stock.raw_remaining;
    return stock;
  });
}

// ------------------------------------------------------------------
// Photos
// ------------------------------------------------------------------

Result SqliteRepository::InsertPhotoGroup(Transaction& t, const model::PhotoGroupRecord& r, InsertMode mode) {
  auto*     db  = TX(t).Handle();
  auto      sql = InsertSql(sql::INSERT_PHOTO_GROUP, mode);
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  BindText(st.Get(), 1, r.id);
  BindText(st.Get(), 2, r.site_id);
  BindText(st.Get(), 3, r.name);
  BindText(st.Get(), 4, r.created_at);

  return RunWrite(db, st);
}

std::vector<model::PhotoGroupRecord> SqliteRepository::ListPhotoGroups(Transaction& t, const std::string& site_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_PHOTO_GROUPS);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, site_id);
  return ReadAll<model::PhotoGroupRecord>(db, st, [](sqlite3_stmt* s) {
    model::PhotoGroupRecord r;
    r.id         = ColText(s, 0);
    r.site_id    = ColText(s, 1);
    r.name       = ColText(s, 2);
    r.created_at = ColText(s, 3);
    return r;
  });
}

Result SqliteRepository::DeletePhotoGroup(Transaction& t, const std::string& id) {
  return DeleteById(t, sql::DELETE_PHOTO_GROUP, id, "photo group");
}

Result SqliteRepository::InsertPhoto(Transaction& t, const model::PhotoRecord& r, InsertMode mode) {
  auto*     db  = TX(t).Handle();
  auto      sql = InsertSql(sql::INSERT_PHOTO, mode);
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  BindText(st.Get(), 1, r.id);
  BindText(st.Get(), 2, r.site_id);
  BindOptText(st.Get(), 3, r.group_id);
  BindText(st.Get(), 4, r.uri);
  BindText(st.Get(), 5, r.description);
  BindText(st.Get(), 6, r.date);
  BindText(st.Get(), 7, r.time);

  return RunWrite(db, st);
}

std::vector<model::PhotoRecord> SqliteRepository::ListPhotos(Transaction& t, const std::string& site_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_SITE_PHOTOS);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, site_id);
  return ReadAll<model::PhotoRecord>(db, st, ReadPhoto);
}

std::vector<model::PhotoRecord> SqliteRepository::ListGroupPhotos(Transaction& t, const std::string& group_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_GROUP_PHOTOS);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, group_id);
  return ReadAll<model::PhotoRecord>(db, st, ReadPhoto);
}

Result SqliteRepository::DeletePhoto(Transaction& t, const std::string& id) {
  return DeleteById(t, sql::DELETE_PHOTO, id, "photo");
}

// ------------------------------------------------------------------
// Todos
// ------------------------------------------------------------------

Result SqliteRepository::InsertTodo(Transaction& t, const model::TodoRecord& r, InsertMode mode) {
  auto*     db  = TX(t).Handle();
  auto      sql = InsertSql(sql::INSERT_TODO, mode);
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  BindText(st.Get(), 1, r.id);
  BindText(st.Get(), 2, r.title);
  BindText(st.Get(), 3, r.description);
  BindText(st.Get(), 4, sitely::model::ToString(r.type));
  BindText(st.Get(), 5, sitely::model::ToString(r.priority));
  BindOptText(st.Get(), 6, r.deadline);
  BindBool(st.Get(), 7, r.is_completed);
  BindOptText(st.Get(), 8, r.completed_at);
  BindOptText(st.Get(), 9, r.site_id);
  BindText(st.Get(), 10, r.created_at);

  return RunWrite(db, st);
}

std::optional<model::TodoRecord> SqliteRepository::GetTodo(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_TODO);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, id);
  return ReadOne<model::TodoRecord>(db, st, ReadTodo);
}

std::vector<model::TodoRecord> SqliteRepository::ListTodos(Transaction& t, const std::optional<sitely::model::TodoType>& type) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_TODOS);
  CheckPrepared(db, st);

  if (type) {
    BindText(st.Get(), 1, sitely::model::ToString(*type));
  } else {
    sqlite3_bind_null(st.Get(), 1);
  }
  return ReadAll<model::TodoRecord>(db, st, ReadTodo);
}

Result SqliteRepository::UpdateTodo(Transaction& t, const std::string& id, const model::TodoUpdate& u) {
  SetClause set;
  set.Text("title", u.title);
  set.Text("description", u.description);
  set.Token("type", u.type);
  set.Token("priority", u.priority);
  set.NullableText("deadline", u.deadline);

  auto*     db  = TX(t).Handle();
  auto      sql = set.Sql("todos");
  Statement st(db, sql.c_str());
  if (!st.Ok()) return Translate(db, st.Rc());

  set.Bind(st.Get(), id);
  return RunTargetedWrite(db, st, "todo " + id);
}

Result SqliteRepository::SetTodoCompleted(Transaction& t, const std::string& id, bool completed,
                                          const std::optional<std::string>& completed_at) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_TODO_COMPLETED);
  if (!st.Ok()) return Translate(db, st.Rc());

  BindBool(st.Get(), 1, completed);
  BindOptText(st.Get(), 2, completed_at);
  BindText(st.Get(), 3, id);
  return RunTargetedWrite(db, st, "todo " + id);
}

Result SqliteRepository::DeleteTodo(Transaction& t, const std::string& id) {
  return DeleteById(t, sql::DELETE_TODO, id, "todo");
}

// ------------------------------------------------------------------
// Settings
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::GetSetting(Transaction& t, const std::string& key) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_SETTING);
  CheckPrepared(db, st);

  BindText(st.Get(), 1, key);
  return ReadOne<std::string>(db, st, [](sqlite3_stmt* s) { return ColText(s, 0); });
}

Result SqliteRepository::PutSetting(Transaction& t, const std::string& key, const std::string& value, bool overwrite) {
  auto*     db = TX(t).Handle();
  Statement st(db, overwrite ? sql::UPSERT_SETTING : sql::INSERT_SETTING_IF_ABSENT);
  if (!st.Ok()) return Translate(db, st.Rc());

  BindText(st.Get(), 1, key);
  BindText(st.Get(), 2, value);
  return RunWrite(db, st);
}

Result SqliteRepository::DeleteSetting(Transaction& t, const std::string& key) {
  return DeleteById(t, sql::DELETE_SETTING, key, "setting");
}

} // namespace sitely::db::sqlite
