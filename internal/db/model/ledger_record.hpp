#pragma once

#include <optional>
#include <string>

#include "internal/model/enums.hpp"

namespace sitely::db::model {

/*
  Ledger rows: the three append-only financial event streams.

  worker_name / worker_category are snapshots taken when the row is written.
  Editing or deleting the worker later must not change them.
*/

struct LedgerRowBase {
  std::string id;
  std::string site_id;
  std::string worker_id;
  std::string worker_name;
  std::string worker_category;
  double      amount = 0;
  std::string date; // YYYY-MM-DD
  std::string time; // HH:MM[:SS]
};

// Daily attendance ("hajari").
struct WageRecord : LedgerRowBase {
  double overtime = 0;
};

// Money advanced against a worker's earnings.
struct ExpenseRecord : LedgerRowBase {
  std::string description;
};

// Money actually disbursed.
struct PaymentRecord : LedgerRowBase {
  sitely::model::PaymentMethod method = sitely::model::PaymentMethod::kCash;
};

enum class LedgerTable {
  kWage,
  kExpense,
  kPayment,
};

constexpr const char* TableName(LedgerTable table) {
  switch (table) {
    case LedgerTable::kWage:
      return "hajari";
    case LedgerTable::kExpense:
      return "expenses";
    case LedgerTable::kPayment:
    default:
      return "payments";
  }
}

// remaining = total_wage - total_expense - total_paid; never stored.
struct WorkerTotals {
  double total_wage    = 0;
  double total_expense = 0;
  double total_paid    = 0;
  double remaining     = 0;
};

struct WorkerSummary {
  std::string                worker_id;
  std::string                worker_name;
  std::string                worker_category;
  WorkerTotals               totals;
  std::optional<std::string> last_payment_date;
};

} // namespace sitely::db::model
