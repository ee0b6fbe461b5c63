#include "retention_sweeper.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace sitely::retention {

namespace {

std::uint64_t DeleteBefore(db::Repository& repository, db::Transaction& tx, db::model::LedgerTable table, const std::string& cutoff) {
  auto result = repository.DeleteLedgerRowsBefore(tx, table, cutoff);
  if (!result) {
    throw std::runtime_error(std::string("retention sweep on ") + db::model::TableName(table) + ": " + result.message);
  }
  return result.affected_rows;
}

} // namespace

std::string RetentionCutoff(util::TimePoint now) {
  return util::DateYearsBefore(now, kRetentionYears);
}

RetentionSweeper::RetentionSweeper(std::shared_ptr<db::Repository> repository, util::TimeSource now)
    : repository_(std::move(repository)), now_(now ? std::move(now) : util::TimeSource(util::Now)) {
}

SweepReport RetentionSweeper::Sweep() {
  SweepReport report;
  report.cutoff = RetentionCutoff(now_());

  auto tx = repository_->Begin();
  report.wages_deleted    = DeleteBefore(*repository_, *tx, db::model::LedgerTable::kWage, report.cutoff);
  report.expenses_deleted = DeleteBefore(*repository_, *tx, db::model::LedgerTable::kExpense, report.cutoff);
  report.payments_deleted = DeleteBefore(*repository_, *tx, db::model::LedgerTable::kPayment, report.cutoff);
  tx->Commit();

  SITELY_LOG_INFO("retention sweep complete", {observability::StringField("cutoff", report.cutoff),
                                               observability::IntField("hajari", static_cast<std::int64_t>(report.wages_deleted)),
                                               observability::IntField("expenses", static_cast<std::int64_t>(report.expenses_deleted)),
                                               observability::IntField("payments", static_cast<std::int64_t>(report.payments_deleted))});
  return report;
}

} // namespace sitely::retention
