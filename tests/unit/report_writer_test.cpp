#include "internal/report/report_writer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace sitely::db::model;
using sitely::model::WorkerCategory;

WorkerRecord Worker(const std::string& id, const std::string& name, WorkerCategory category) {
  WorkerRecord w;
  w.id       = id;
  w.site_id  = "site-1";
  w.name     = name;
  w.category = category;
  return w;
}

WageRecord Wage(const std::string& worker_id, double amount, double overtime) {
  WageRecord r;
  r.worker_id = worker_id;
  r.amount    = amount;
  r.overtime  = overtime;
  r.date      = "2024-06-01";
  return r;
}

ExpenseRecord Expense(const std::string& worker_id, double amount) {
  ExpenseRecord r;
  r.worker_id = worker_id;
  r.amount    = amount;
  r.date      = "2024-06-02";
  return r;
}

PaymentRecord Payment(const std::string& worker_id, const std::string& name, double amount, const std::string& date) {
  PaymentRecord r;
  r.worker_id       = worker_id;
  r.worker_name     = name;
  r.worker_category = "karigar";
  r.amount          = amount;
  r.date            = date;
  r.time            = "10:15:00";
  return r;
}

void TestWorkerSummaryCsv() {
  std::vector<WorkerRecord> workers = {Worker("w1", "Ramesh", WorkerCategory::kSkilled), Worker("w2", "Suresh \"Bhai\"", WorkerCategory::kUnskilled)};
  std::vector<WageRecord>   wages   = {Wage("w1", 500, 50), Wage("w2", 300, 0)};
  std::vector<ExpenseRecord> expenses = {Expense("w1", 100)};
  std::vector<PaymentRecord> payments = {Payment("w1", "Ramesh", 300, "2024-06-03")};

  const auto csv = sitely::report::WorkerSummaryCsv(workers, wages, expenses, payments);
  assert(csv ==
         "Worker Name,Category,Total Hajari,Total Expense,Total Paid,Remaining\n"
         "\"Ramesh\",karigar,550,100,300,150\n"
         "\"Suresh \"\"Bhai\"\"\",majdur,300,0,0,300");
}

void TestEmptySiteProducesHeaderOnly() {
  assert(sitely::report::WorkerSummaryCsv({}, {}, {}, {}) == "Worker Name,Category,Total Hajari,Total Expense,Total Paid,Remaining");
  assert(sitely::report::PaymentHistoryCsv({}) == "No.,Worker Name,Category,Amount,Date,Time");
}

void TestPaymentHistoryIsOneBased() {
  std::vector<PaymentRecord> payments = {Payment("w1", "Ramesh", 250.5, "2024-06-05"), Payment("w1", "Ramesh", 300, "2024-06-03")};

  const auto csv = sitely::report::PaymentHistoryCsv(payments);
  assert(csv ==
         "No.,Worker Name,Category,Amount,Date,Time\n"
         "1,\"Ramesh\",karigar,250.5,2024-06-05,10:15:00\n"
         "2,\"Ramesh\",karigar,300,2024-06-03,10:15:00");
}

void TestSummaryTracksLastPaymentDate() {
  std::vector<WorkerRecord>  workers  = {Worker("w1", "Ramesh", WorkerCategory::kSkilled), Worker("w2", "Mahesh", WorkerCategory::kSkilled)};
  std::vector<PaymentRecord> payments = {Payment("w1", "Ramesh", 10, "2024-05-01"), Payment("w1", "Ramesh", 10, "2024-06-09"),
                                         Payment("w1", "Ramesh", 10, "2024-05-20")};

  const auto rows = sitely::report::SummarizeWorkers(workers, {}, {}, payments);
  assert(rows.size() == 2);
  assert(rows[0].last_payment_date == std::optional<std::string>("2024-06-09"));
  assert(rows[0].totals.total_paid == 30);
  assert(rows[0].totals.remaining == -30);
  assert(!rows[1].last_payment_date);
}

void TestFormatAmount() {
  assert(sitely::report::FormatAmount(550) == "550");
  assert(sitely::report::FormatAmount(12.5) == "12.5");
  assert(sitely::report::FormatAmount(-0.0) == "0");
  assert(sitely::report::FormatAmount(-150) == "-150");
}

} // namespace

int main() {
  TestWorkerSummaryCsv();
  TestEmptySiteProducesHeaderOnly();
  TestPaymentHistoryIsOneBased();
  TestSummaryTracksLastPaymentDate();
  TestFormatAmount();

  std::cout << "sitely_unit_report_writer: pass\n";
  return 0;
}
