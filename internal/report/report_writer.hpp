#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/ledger_record.hpp"
#include "internal/db/model/worker_record.hpp"

namespace sitely::report {

/*
  Pure export helpers over rows already fetched from the ledger store.
  Nothing here touches storage or applies the retention filter; callers
  pass rows that are already within the window.

  Lines are joined with '\n' without a trailing newline.
*/

struct WorkerReportRow {
  db::model::WorkerRecord    worker;
  db::model::WorkerTotals    totals;
  std::optional<std::string> last_payment_date;
};

// One entry per worker, in input order. Wages include overtime.
std::vector<WorkerReportRow> SummarizeWorkers(const std::vector<db::model::WorkerRecord>&  workers,
                                              const std::vector<db::model::WageRecord>&    wages,
                                              const std::vector<db::model::ExpenseRecord>& expenses,
                                              const std::vector<db::model::PaymentRecord>& payments);

// Header: Worker Name,Category,Total Hajari,Total Expense,Total Paid,Remaining
std::string WorkerSummaryCsv(const std::vector<db::model::WorkerRecord>&  workers,
                             const std::vector<db::model::WageRecord>&    wages,
                             const std::vector<db::model::ExpenseRecord>& expenses,
                             const std::vector<db::model::PaymentRecord>& payments);

// Header: No.,Worker Name,Category,Amount,Date,Time. Rows keep input order.
std::string PaymentHistoryCsv(const std::vector<db::model::PaymentRecord>& payments);

// Shortest decimal form: 550 -> "550", 12.5 -> "12.5".
std::string FormatAmount(double amount);

// Wraps in double quotes, doubling embedded quotes.
std::string QuoteField(const std::string& value);

} // namespace sitely::report
