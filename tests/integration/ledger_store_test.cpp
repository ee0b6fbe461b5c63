#include <cassert>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cloud/cloud_mirror.hpp"
#include "internal/core/ledger_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace sitely::db::model;
using sitely::core::LedgerStore;
using sitely::model::WorkerCategory;

// 2024-06-15T12:00:00Z; retention cutoff is 2021-06-15
sitely::util::TimePoint FixedNow() {
  return sitely::util::TimePoint(std::chrono::seconds(1718452800));
}

std::filesystem::path FreshDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "sitely_ledger_store_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

class RecordingMirror final : public sitely::cloud::CloudMirror {
 public:
  void UpsertSite(const SiteRecord& site) override {
    site_pushes.push_back(site.id);
    if (fail) throw std::runtime_error("mirror offline");
  }

  void UpsertWorker(const WorkerRecord& worker) override {
    worker_pushes.push_back(worker.id);
    if (fail) throw std::runtime_error("mirror offline");
  }

  std::vector<sitely::cloud::SavedSiteRef> SavedSiteRefs(const std::string& user_id) override {
    return {{"site-" + user_id, "ABC123", "2024-06-01T00:00:00.000Z"}};
  }

  bool                     fail = false;
  std::vector<std::string> site_pushes;
  std::vector<std::string> worker_pushes;
};

struct Fixture {
  explicit Fixture(const std::string& name, std::shared_ptr<sitely::cloud::CloudMirror> mirror = nullptr)
      : db(std::make_shared<sitely::db::sqlite::SqliteDB>(FreshDbPath(name).string())) {
    sitely::db::sqlite::SchemaManager(db).EnsureSchema();
    repository = std::make_shared<sitely::db::sqlite::SqliteRepository>(db);
    store      = std::make_unique<LedgerStore>(repository, FixedNow, std::move(mirror));
  }

  std::shared_ptr<sitely::db::sqlite::SqliteDB>         db;
  std::shared_ptr<sitely::db::sqlite::SqliteRepository> repository;
  std::unique_ptr<LedgerStore>                          store;
};

SiteRecord NewSite(const std::string& name) {
  SiteRecord site;
  site.name       = name;
  site.location   = "Surat";
  site.start_date = "2024-01-01";
  site.owner_name = "Patel";
  site.contact    = "9800000000";
  return site;
}

WorkerRecord NewWorker(const std::string& site_id, const std::string& name) {
  WorkerRecord worker;
  worker.site_id  = site_id;
  worker.name     = name;
  worker.age      = "30";
  worker.village  = "Navsari";
  worker.category = WorkerCategory::kSkilled;
  return worker;
}

WageRecord Wage(const std::string& site_id, const std::string& worker_id, double amount, double overtime, const std::string& date) {
  WageRecord r;
  r.site_id   = site_id;
  r.worker_id = worker_id;
  r.amount    = amount;
  r.overtime  = overtime;
  r.date      = date;
  return r;
}

ExpenseRecord Expense(const std::string& site_id, const std::string& worker_id, double amount, const std::string& date) {
  ExpenseRecord r;
  r.site_id     = site_id;
  r.worker_id   = worker_id;
  r.amount      = amount;
  r.date        = date;
  r.description = "advance";
  return r;
}

PaymentRecord Payment(const std::string& site_id, const std::string& worker_id, double amount, const std::string& date) {
  PaymentRecord r;
  r.site_id   = site_id;
  r.worker_id = worker_id;
  r.amount    = amount;
  r.date      = date;
  r.method    = sitely::model::PaymentMethod::kUpi;
  return r;
}

template <typename Error, typename Fn>
bool Throws(Fn fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestWorkerTotalsScenario() {
  Fixture f("totals_scenario");
  auto    site   = f.store->CreateSite(NewSite("Shanti Nagar"));
  auto    worker = f.store->CreateWorker(NewWorker(site.id, "Ramesh"));

  f.store->AddWageRecords({Wage(site.id, worker.id, 500, 50, "2024-06-10")});
  f.store->AddExpenseRecords({Expense(site.id, worker.id, 100, "2024-06-11")});
  f.store->AddPayment(Payment(site.id, worker.id, 300, "2024-06-12"));

  auto totals = f.store->WorkerTotals(site.id, worker.id);
  assert(totals.total_wage == 550);
  assert(totals.total_expense == 100);
  assert(totals.total_paid == 300);
  assert(totals.remaining == 150);

  auto summaries = f.store->SiteWorkerSummaries(site.id);
  assert(summaries.size() == 1);
  assert(summaries[0].worker_id == worker.id);
  assert(summaries[0].totals.remaining == 150);
  assert(summaries[0].last_payment_date == std::optional<std::string>("2024-06-12"));

  // snapshot filled from the worker
  auto wages = f.store->ListWageRecords(site.id);
  assert(wages.size() == 1);
  assert(wages[0].worker_name == "Ramesh");
  assert(wages[0].worker_category == "karigar");
  assert(!wages[0].time.empty());
}

void TestTotalsIgnoreInsertionOrder() {
  Fixture f("totals_order");
  auto    site_a   = f.store->CreateSite(NewSite("A"));
  auto    site_b   = f.store->CreateSite(NewSite("B"));
  auto    worker_a = f.store->CreateWorker(NewWorker(site_a.id, "Ramesh"));
  auto    worker_b = f.store->CreateWorker(NewWorker(site_b.id, "Ramesh"));

  f.store->AddWageRecords({Wage(site_a.id, worker_a.id, 400, 0, "2024-06-01"), Wage(site_a.id, worker_a.id, 450, 25, "2024-06-02")});
  f.store->AddExpenseRecords({Expense(site_a.id, worker_a.id, 75.5, "2024-06-03")});
  f.store->AddPayment(Payment(site_a.id, worker_a.id, 200, "2024-06-04"));
  f.store->AddPayment(Payment(site_a.id, worker_a.id, 100, "2024-06-05"));

  f.store->AddPayment(Payment(site_b.id, worker_b.id, 100, "2024-06-05"));
  f.store->AddExpenseRecords({Expense(site_b.id, worker_b.id, 75.5, "2024-06-03")});
  f.store->AddPayment(Payment(site_b.id, worker_b.id, 200, "2024-06-04"));
  f.store->AddWageRecords({Wage(site_b.id, worker_b.id, 450, 25, "2024-06-02")});
  f.store->AddWageRecords({Wage(site_b.id, worker_b.id, 400, 0, "2024-06-01")});

  auto a = f.store->WorkerTotals(site_a.id, worker_a.id);
  auto b = f.store->WorkerTotals(site_b.id, worker_b.id);
  assert(a.remaining == b.remaining);
  assert(a.remaining == 875 - 75.5 - 300);
}

void TestRowsBeforeCutoffAreHidden() {
  Fixture f("cutoff_hidden");
  auto    site   = f.store->CreateSite(NewSite("Old"));
  auto    worker = f.store->CreateWorker(NewWorker(site.id, "Ramesh"));

  f.store->AddWageRecords({Wage(site.id, worker.id, 100, 0, "2021-06-14"), Wage(site.id, worker.id, 200, 0, "2021-06-15")});
  f.store->AddPayment(Payment(site.id, worker.id, 50, "2021-06-14"));

  assert(f.store->Cutoff() == "2021-06-15");
  auto wages = f.store->ListWageRecords(site.id);
  assert(wages.size() == 1);
  assert(wages[0].date == "2021-06-15");
  assert(f.store->ListPayments(site.id).empty());

  auto totals = f.store->WorkerTotals(site.id, worker.id);
  assert(totals.total_wage == 200);
  assert(totals.total_paid == 0);
}

void TestSiteDeleteCascadesAndIsolates() {
  Fixture f("cascade");
  auto    doomed   = f.store->CreateSite(NewSite("Doomed"));
  auto    survivor = f.store->CreateSite(NewSite("Survivor"));

  std::string doomed_worker;
  for (const auto* site : {&doomed, &survivor}) {
    auto worker = f.store->CreateWorker(NewWorker(site->id, "Ramesh"));
    if (site == &doomed) doomed_worker = worker.id;

    f.store->AddWageRecords({Wage(site->id, worker.id, 500, 50, "2024-06-10")});
    f.store->AddExpenseRecords({Expense(site->id, worker.id, 100, "2024-06-11")});
    f.store->AddPayment(Payment(site->id, worker.id, 300, "2024-06-12"));

    MaterialRecord material;
    material.site_id       = site->id;
    material.name          = "Cement";
    material.quantity      = 10;
    material.unit          = sitely::model::MaterialUnit::kBag;
    material.rate_per_unit = 380;
    auto created           = f.store->CreateMaterial(material);

    MaterialUsageRecord usage;
    usage.material_id   = created.id;
    usage.quantity_used = 3;
    f.store->AddMaterialUsage(usage);

    PhotoGroupRecord group;
    group.site_id = site->id;
    group.name    = "Foundation";
    auto g        = f.store->CreatePhotoGroup(group);

    PhotoRecord photo;
    photo.site_id  = site->id;
    photo.group_id = g.id;
    photo.uri      = "file:///photo.jpg";
    f.store->AddPhoto(photo);
  }

  TodoRecord todo;
  todo.title   = "Order steel";
  todo.site_id = doomed.id;
  auto linked  = f.store->CreateTodo(todo);

  f.store->DeleteSite(doomed.id);

  assert(!f.store->GetSite(doomed.id));
  assert(!f.store->GetWorker(doomed_worker));
  assert(f.store->ListWorkers(doomed.id).empty());
  assert(f.store->ListWageRecords(doomed.id).empty());
  assert(f.store->ListExpenseRecords(doomed.id).empty());
  assert(f.store->ListPayments(doomed.id).empty());
  assert(f.store->ListMaterials(doomed.id).empty());
  assert(f.store->ListPhotos(doomed.id).empty());
  assert(f.store->ListPhotoGroups(doomed.id).empty());
  assert(f.store->SiteWorkerSummaries(doomed.id).empty());

  auto zero = f.store->WorkerTotals(doomed.id, doomed_worker);
  assert(zero.total_wage == 0 && zero.total_expense == 0 && zero.total_paid == 0 && zero.remaining == 0);

  // the todo survives, unlinked
  auto todos = f.store->ListTodos();
  assert(todos.size() == 1);
  assert(todos[0].id == linked.id);
  assert(!todos[0].site_id);

  assert(f.store->ListWorkers(survivor.id).size() == 1);
  assert(f.store->ListWageRecords(survivor.id).size() == 1);
  assert(f.store->ListExpenseRecords(survivor.id).size() == 1);
  assert(f.store->ListPayments(survivor.id).size() == 1);
  assert(f.store->ListMaterials(survivor.id).size() == 1);
  assert(f.store->ListPhotos(survivor.id).size() == 1);
  assert(f.store->ListPhotoGroups(survivor.id).size() == 1);

  assert(Throws<sitely::util::NotFound>([&] { f.store->DeleteSite(doomed.id); }));
}

void TestWorkerEditsKeepLedgerSnapshots() {
  Fixture f("snapshots");
  auto    site   = f.store->CreateSite(NewSite("Snap"));
  auto    worker = f.store->CreateWorker(NewWorker(site.id, "Ramesh"));
  f.store->AddWageRecords({Wage(site.id, worker.id, 500, 0, "2024-06-10")});

  WorkerUpdate rename;
  rename.name     = "Ramesh Kumar";
  rename.category = WorkerCategory::kUnskilled;
  auto updated    = f.store->UpdateWorker(worker.id, rename);
  assert(updated.name == "Ramesh Kumar");

  auto wages = f.store->ListWageRecords(site.id);
  assert(wages[0].worker_name == "Ramesh");
  assert(wages[0].worker_category == "karigar");

  // history outlives the worker
  f.store->DeleteWorker(worker.id);
  assert(f.store->ListWageRecords(site.id).size() == 1);
  assert(Throws<sitely::util::NotFound>([&] { f.store->DeleteWorker(worker.id); }));
}

void TestLedgerValidationAndAtomicBatches() {
  Fixture f("validation");
  auto    site   = f.store->CreateSite(NewSite("Checks"));
  auto    worker = f.store->CreateWorker(NewWorker(site.id, "Ramesh"));

  assert(Throws<sitely::util::ConstraintViolation>([&] { f.store->AddPayment(Payment(site.id, worker.id, -1, "2024-06-01")); }));
  assert(Throws<sitely::util::ConstraintViolation>([&] { f.store->AddPayment(Payment(site.id, worker.id, 10, "01/06/2024")); }));
  assert(Throws<sitely::util::ConstraintViolation>([&] { f.store->AddPayment(Payment(site.id, "no-such-worker", 10, "2024-06-01")); }));

  // second row references a missing site: nothing from the batch lands
  auto orphan            = Wage("no-such-site", worker.id, 100, 0, "2024-06-02");
  orphan.worker_name     = "Ramesh";
  orphan.worker_category = "karigar";
  assert(Throws<sitely::util::ConstraintViolation>(
      [&] { f.store->AddWageRecords({Wage(site.id, worker.id, 100, 0, "2024-06-01"), orphan}); }));
  assert(f.store->ListWageRecords(site.id).empty());

  auto payment = f.store->AddPayment(Payment(site.id, worker.id, 10, "2024-06-01"));
  auto again   = Payment(site.id, worker.id, 10, "2024-06-01");
  again.id     = payment.id;
  assert(Throws<sitely::util::AlreadyExists>([&] { f.store->AddPayment(again); }));

  auto bad_worker = NewWorker("no-such-site", "Ghost");
  assert(Throws<sitely::util::ConstraintViolation>([&] { f.store->CreateWorker(bad_worker); }));
}

void TestLedgerRowsNeedAWorkerOfTheSameSite() {
  Fixture f("worker_refs");
  auto    site_a = f.store->CreateSite(NewSite("A"));
  auto    site_b = f.store->CreateSite(NewSite("B"));
  auto    worker = f.store->CreateWorker(NewWorker(site_a.id, "Ramesh"));

  assert(Throws<sitely::util::ConstraintViolation>([&] { f.store->AddWageRecords({Wage(site_b.id, worker.id, 500, 0, "2024-06-10")}); }));
  assert(Throws<sitely::util::ConstraintViolation>([&] { f.store->AddPayment(Payment(site_b.id, worker.id, 100, "2024-06-10")); }));

  // a supplied snapshot does not stand in for the worker row
  auto ghost            = Expense(site_a.id, "no-such-worker", 50, "2024-06-10");
  ghost.worker_name     = "Nobody";
  ghost.worker_category = "majdur";
  assert(Throws<sitely::util::ConstraintViolation>([&] { f.store->AddExpenseRecords({ghost}); }));

  auto supplied            = Wage(site_a.id, worker.id, 500, 0, "2024-06-10");
  supplied.worker_name     = "Ramesh K";
  supplied.worker_category = "skilled";
  f.store->AddWageRecords({supplied});

  auto wages = f.store->ListWageRecords(site_a.id);
  assert(wages.size() == 1);
  assert(wages[0].worker_name == "Ramesh K");
  assert(wages[0].worker_category == "karigar");

  f.store->DeleteSite(site_a.id);
  assert(f.store->ListWageRecords(site_b.id).empty());
  assert(f.store->ListPayments(site_b.id).empty());
  assert(f.store->WorkerTotals(site_b.id, worker.id).total_wage == 0);
}

void TestSiteCodesAndUpdates() {
  Fixture f("site_codes");

  auto site = f.store->CreateSite(NewSite("Coded"));
  assert(site.site_code && site.site_code->size() == 6);

  std::string lower = *site.site_code;
  for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  auto found = f.store->FindSiteByCode(lower);
  assert(found && found->id == site.id);

  auto explicit_code      = NewSite("Explicit");
  explicit_code.site_code = "ab12cd";
  assert(f.store->CreateSite(explicit_code).site_code == std::optional<std::string>("AB12CD"));

  auto bad_code      = NewSite("Bad");
  bad_code.site_code = "ab-1";
  assert(Throws<sitely::util::ConstraintViolation>([&] { f.store->CreateSite(bad_code); }));

  auto long_code      = NewSite("Long");
  long_code.site_code = "ABCDEFGHIJKL";
  assert(Throws<sitely::util::ConstraintViolation>([&] { f.store->CreateSite(long_code); }));

  SiteUpdate close;
  close.is_running = false;
  close.end_date   = "2024-06-30";
  auto closed      = f.store->UpdateSite(site.id, close);
  assert(!closed.is_running);
  assert(closed.end_date == "2024-06-30");

  SiteUpdate reopen;
  reopen.is_running = true;
  auto reopened     = f.store->UpdateSite(site.id, reopen);
  assert(reopened.is_running);
  assert(reopened.end_date.empty());

  assert(Throws<sitely::util::NotFound>([&] { f.store->UpdateSite("missing", reopen); }));
}

void TestThousandSitesNeverReuseACode() {
  Fixture f("thousand_codes");

  std::set<std::string> codes;
  for (int i = 0; i < 1000; ++i) {
    auto site      = NewSite("Site " + std::to_string(i));
    site.site_code = f.store->GenerateUniqueSiteCode();
    auto created   = f.store->CreateSite(site);
    assert(codes.insert(*created.site_code).second);
  }
  assert(f.store->ListSites().size() == 1000);
}

void TestSitesVisibleToUser() {
  Fixture f("user_sites");

  auto mine      = NewSite("Mine");
  mine.user_id   = "u1";
  auto theirs    = NewSite("Theirs");
  theirs.user_id = "u2";
  f.store->CreateSite(mine);
  f.store->CreateSite(theirs);
  f.store->CreateSite(NewSite("Legacy"));

  assert(f.store->ListSites(std::string("u1")).size() == 2);
  assert(f.store->ListSites().size() == 3);
}

void TestMaterialStockAndTotals() {
  Fixture f("materials");
  auto    site = f.store->CreateSite(NewSite("Stock"));

  MaterialRecord material;
  material.site_id       = site.id;
  material.name          = "Sand";
  material.quantity      = 10;
  material.unit          = sitely::model::MaterialUnit::kTon;
  material.rate_per_unit = 1200;
  material.total_amount  = 1; // ignored
  auto created           = f.store->CreateMaterial(material);
  assert(created.total_amount == 12000);

  MaterialUsageRecord usage;
  usage.material_id   = created.id;
  usage.quantity_used = 4;
  auto first          = f.store->AddMaterialUsage(usage);
  assert(first.site_id == site.id);
  usage.quantity_used = 8;
  f.store->AddMaterialUsage(usage);

  auto stock = f.store->MaterialStock(created.id);
  assert(stock.used == 12);
  assert(stock.raw_remaining == -2);
  assert(stock.remaining == 0);
  assert(stock.OverConsumed());
  assert(f.store->ListMaterialUsages(created.id).size() == 2);

  MaterialUpdate more;
  more.quantity = 20;
  auto updated  = f.store->UpdateMaterial(created.id, more);
  assert(updated.total_amount == 24000);
  assert(f.store->MaterialStock(created.id).remaining == 8);

  MaterialUpdate negative;
  negative.rate_per_unit = -5;
  assert(Throws<sitely::util::ConstraintViolation>([&] { f.store->UpdateMaterial(created.id, negative); }));

  usage.material_id = "missing";
  assert(Throws<sitely::util::ConstraintViolation>([&] { f.store->AddMaterialUsage(usage); }));
  assert(Throws<sitely::util::NotFound>([&] { f.store->MaterialStock("missing"); }));

  f.store->DeleteMaterial(created.id);
  assert(f.store->ListMaterials(site.id).empty());
}

void TestPhotoGroupDeleteUngroupsPhotos() {
  Fixture f("photos");
  auto    site = f.store->CreateSite(NewSite("Photos"));

  PhotoGroupRecord group;
  group.site_id = site.id;
  group.name    = "Slab";
  auto g        = f.store->CreatePhotoGroup(group);

  PhotoRecord photo;
  photo.site_id  = site.id;
  photo.group_id = g.id;
  photo.uri      = "file:///slab.jpg";
  auto p         = f.store->AddPhoto(photo);
  assert(f.store->ListGroupPhotos(g.id).size() == 1);

  f.store->DeletePhotoGroup(g.id);
  auto photos = f.store->ListPhotos(site.id);
  assert(photos.size() == 1);
  assert(!photos[0].group_id);

  f.store->DeletePhoto(p.id);
  assert(f.store->ListPhotos(site.id).empty());
}

void TestTodosAndSettings() {
  Fixture f("todos_settings");

  TodoRecord daily;
  daily.title = "Check attendance";
  TodoRecord monthly;
  monthly.title    = "Pay vendors";
  monthly.type     = sitely::model::TodoType::kMonthly;
  monthly.priority = sitely::model::TodoPriority::kHigh;
  auto d           = f.store->CreateTodo(daily);
  f.store->CreateTodo(monthly);

  assert(f.store->ListTodos().size() == 2);
  auto only_monthly = f.store->ListTodos(sitely::model::TodoType::kMonthly);
  assert(only_monthly.size() == 1);
  assert(only_monthly[0].priority == sitely::model::TodoPriority::kHigh);

  auto done = f.store->SetTodoCompleted(d.id, true);
  assert(done.is_completed);
  assert(done.completed_at == std::optional<std::string>("2024-06-15T12:00:00.000Z"));
  auto undone = f.store->SetTodoCompleted(d.id, false);
  assert(!undone.is_completed);
  assert(!undone.completed_at);

  TodoUpdate retitle;
  retitle.title = "Check attendance twice";
  assert(f.store->UpdateTodo(d.id, retitle).title == "Check attendance twice");
  assert(Throws<sitely::util::NotFound>([&] { f.store->SetTodoCompleted("missing", true); }));

  f.store->DeleteTodo(d.id);
  assert(f.store->ListTodos().size() == 1);

  assert(!f.store->GetSetting("language"));
  f.store->SetSetting("language", "hi");
  f.store->SetSetting("language", "gu");
  assert(f.store->GetSetting("language") == std::optional<std::string>("gu"));
  f.store->DeleteSetting("language");
  assert(!f.store->GetSetting("language"));
}

void TestMirrorFailuresNeverFailLocalWrites() {
  auto mirror  = std::make_shared<RecordingMirror>();
  mirror->fail = true;
  Fixture f("mirror", mirror);

  auto site   = f.store->CreateSite(NewSite("Mirrored"));
  auto worker = f.store->CreateWorker(NewWorker(site.id, "Ramesh"));
  assert(f.store->GetSite(site.id));
  assert(f.store->GetWorker(worker.id));
  assert(mirror->site_pushes.size() == 1);
  assert(mirror->worker_pushes.size() == 1);

  auto refs = f.store->SavedSiteRefs("u1");
  assert(refs.size() == 1);
  assert(refs[0].site_id == "site-u1");

  Fixture no_mirror("no_mirror");
  assert(no_mirror.store->SavedSiteRefs("u1").empty());
}

} // namespace

int main() {
  TestWorkerTotalsScenario();
  TestTotalsIgnoreInsertionOrder();
  TestRowsBeforeCutoffAreHidden();
  TestSiteDeleteCascadesAndIsolates();
  TestWorkerEditsKeepLedgerSnapshots();
  TestLedgerValidationAndAtomicBatches();
  TestLedgerRowsNeedAWorkerOfTheSameSite();
  TestSiteCodesAndUpdates();
  TestThousandSitesNeverReuseACode();
  TestSitesVisibleToUser();
  TestMaterialStockAndTotals();
  TestPhotoGroupDeleteUngroupsPhotos();
  TestTodosAndSettings();
  TestMirrorFailuresNeverFailLocalWrites();

  std::cout << "sitely_integration_ledger_store: pass\n";
  return 0;
}
