#include "report_writer.hpp"

#include <iomanip>
#include <sstream>

namespace sitely::report {

namespace {

constexpr const char* kWorkerSummaryHeader  = "Worker Name,Category,Total Hajari,Total Expense,Total Paid,Remaining";
constexpr const char* kPaymentHistoryHeader = "No.,Worker Name,Category,Amount,Date,Time";

} // namespace

std::string FormatAmount(double amount) {
  if (amount == 0) {
    return "0"; // also folds -0
  }
  std::ostringstream out;
  out << std::setprecision(15) << amount;
  return out.str();
}

std::string QuoteField(const std::string& value) {
  std::string quoted;
  quoted.reserve(value.size() + 2);
  quoted.push_back('"');
  for (char c : value) {
    if (c == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

std::vector<WorkerReportRow> SummarizeWorkers(const std::vector<db::model::WorkerRecord>&  workers,
                                              const std::vector<db::model::WageRecord>&    wages,
                                              const std::vector<db::model::ExpenseRecord>& expenses,
                                              const std::vector<db::model::PaymentRecord>& payments) {
  std::vector<WorkerReportRow> rows;
  rows.reserve(workers.size());

  for (const auto& worker : workers) {
    WorkerReportRow row;
    row.worker = worker;

    for (const auto& wage : wages) {
      if (wage.worker_id == worker.id) {
        row.totals.total_wage += wage.amount + wage.overtime;
      }
    }
    for (const auto& expense : expenses) {
      if (expense.worker_id == worker.id) {
        row.totals.total_expense += expense.amount;
      }
    }
    for (const auto& payment : payments) {
      if (payment.worker_id != worker.id) {
        continue;
      }
      row.totals.total_paid += payment.amount;
      if (!row.last_payment_date || payment.date > *row.last_payment_date) {
        row.last_payment_date = payment.date;
      }
    }

    row.totals.remaining = row.totals.total_wage - row.totals.total_expense - row.totals.total_paid;
    rows.push_back(std::move(row));
  }
  return rows;
}

std::string WorkerSummaryCsv(const std::vector<db::model::WorkerRecord>&  workers,
                             const std::vector<db::model::WageRecord>&    wages,
                             const std::vector<db::model::ExpenseRecord>& expenses,
                             const std::vector<db::model::PaymentRecord>& payments) {
  std::string csv = kWorkerSummaryHeader;
  for (const auto& row : SummarizeWorkers(workers, wages, expenses, payments)) {
    csv += '\n';
    csv += QuoteField(row.worker.name);
    csv += ',';
    csv += sitely::model::ToString(row.worker.category);
    csv += ',' + FormatAmount(row.totals.total_wage);
    csv += ',' + FormatAmount(row.totals.total_expense);
    csv += ',' + FormatAmount(row.totals.total_paid);
    csv += ',' + FormatAmount(row.totals.remaining);
  }
  return csv;
}

std::string PaymentHistoryCsv(const std::vector<db::model::PaymentRecord>& payments) {
  std::string csv = kPaymentHistoryHeader;
  for (size_t i = 0; i < payments.size(); ++i) {
    const auto& p = payments[i];
    csv += '\n';
    csv += std::to_string(i + 1);
    csv += ',' + QuoteField(p.worker_name);
    csv += ',' + p.worker_category;
    csv += ',' + FormatAmount(p.amount);
    csv += ',' + p.date;
    csv += ',' + p.time;
  }
  return csv;
}

} // namespace sitely::report
