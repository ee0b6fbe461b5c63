#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace sitely::retention {

// Ledger rows older than this many years are hidden from reads and swept.
constexpr int kRetentionYears = 3;

// "YYYY-MM-DD"; rows with date < cutoff are outside the horizon.
std::string RetentionCutoff(util::TimePoint now);

struct SweepReport {
  std::string   cutoff;
  std::uint64_t wages_deleted    = 0;
  std::uint64_t expenses_deleted = 0;
  std::uint64_t payments_deleted = 0;

  std::uint64_t Total() const {
    return wages_deleted + expenses_deleted + payments_deleted;
  }
};

/*
  Hard-deletes wage, expense and payment rows dated before the retention
  cutoff, all three tables in one transaction. Re-running without new old
  data deletes nothing.
*/
class RetentionSweeper {
 public:
  explicit RetentionSweeper(std::shared_ptr<db::Repository> repository, util::TimeSource now = {});

  SweepReport Sweep();

 private:
  std::shared_ptr<db::Repository> repository_;
  util::TimeSource                now_;
};

} // namespace sitely::retention
