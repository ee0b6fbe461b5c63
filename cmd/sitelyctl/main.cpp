#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/report_writer.hpp"

using sitely::factory::BuildStorageRuntime;
using sitely::report::FormatAmount;

static void Usage() {
  std::cout << "Usage:\n"
            << "  sitelyctl --config <config.yaml> init\n"
            << "  sitelyctl --config <config.yaml> sites [user_id]\n"
            << "  sitelyctl --config <config.yaml> workers <site_id>\n"
            << "  sitelyctl --config <config.yaml> totals <site_id> <worker_id>\n"
            << "  sitelyctl --config <config.yaml> report <site_id>\n"
            << "  sitelyctl --config <config.yaml> payments <site_id>\n"
            << "  sitelyctl --config <config.yaml> sweep\n"
            << "  sitelyctl --config <config.yaml> new-code\n";
}

static void PrintMigration(const sitely::migration::MigrationReport& report) {
  if (report.already_migrated) {
    std::cout << "migration: already complete\n";
    return;
  }
  for (const auto& [entity, counts] : report.entities) {
    std::cout << "migration " << entity << ": inserted=" << counts.inserted << " skipped=" << counts.skipped << " failed=" << counts.failed << "\n";
  }
  std::cout << "migration: " << (report.completed ? "complete" : "incomplete") << "\n";
}

static void PrintSweep(const sitely::retention::SweepReport& sweep) {
  std::cout << "sweep cutoff=" << sweep.cutoff << " hajari=" << sweep.wages_deleted << " expenses=" << sweep.expenses_deleted
            << " payments=" << sweep.payments_deleted << "\n";
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  auto need = [&](size_t n) {
    if (args.size() < n) {
      Usage();
      return false;
    }
    return true;
  };

  try {
    auto config = sitely::config::ConfigLoader::LoadFromYaml(config_path);
    sitely::observability::InitializeLogging(config);

    auto runtime = BuildStorageRuntime(config);

    // ------------------------------------------------------------

    if (cmd == "init") {
      const auto& report = runtime->Report();
      for (const auto& name : report.schema_migrations) {
        std::cout << "schema migration applied: " << name << "\n";
      }
      if (report.migration) {
        PrintMigration(*report.migration);
      } else {
        std::cout << "migration: no legacy store configured\n";
      }
      PrintSweep(report.sweep);
    }

    // ------------------------------------------------------------

    else if (cmd == "sites") {
      std::optional<std::string> user_id;
      if (!args.empty()) user_id = args[0];

      for (const auto& site : runtime->Ledger().ListSites(user_id)) {
        std::cout << site.id << "\t" << site.site_code.value_or("-") << "\t" << sitely::model::ToString(site.type) << "\t" << site.name
                  << (site.is_running ? "" : "\t(closed)") << "\n";
      }
    }

    // ------------------------------------------------------------

    else if (cmd == "workers") {
      if (!need(1)) return 1;

      for (const auto& worker : runtime->Ledger().ListWorkers(args[0])) {
        std::cout << worker.id << "\t" << sitely::model::ToString(worker.category) << "\t" << worker.name
                  << (worker.is_active ? "" : "\t(inactive)") << "\n";
      }
    }

    // ------------------------------------------------------------

    else if (cmd == "totals") {
      if (!need(2)) return 1;

      auto totals = runtime->Ledger().WorkerTotals(args[0], args[1]);
      std::cout << "total_wage=" << FormatAmount(totals.total_wage) << "\n"
                << "total_expense=" << FormatAmount(totals.total_expense) << "\n"
                << "total_paid=" << FormatAmount(totals.total_paid) << "\n"
                << "remaining=" << FormatAmount(totals.remaining) << "\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "report") {
      if (!need(1)) return 1;

      auto& ledger = runtime->Ledger();
      std::cout << sitely::report::WorkerSummaryCsv(ledger.ListWorkers(args[0]), ledger.ListWageRecords(args[0]),
                                                    ledger.ListExpenseRecords(args[0]), ledger.ListPayments(args[0]))
                << "\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "payments") {
      if (!need(1)) return 1;

      std::cout << sitely::report::PaymentHistoryCsv(runtime->Ledger().ListPayments(args[0])) << "\n";
    }

    // ------------------------------------------------------------

    else if (cmd == "sweep") {
      PrintSweep(runtime->Sweep());
    }

    // ------------------------------------------------------------

    else if (cmd == "new-code") {
      std::cout << runtime->Ledger().GenerateUniqueSiteCode() << "\n";
    }

    else {
      Usage();
      return 1;
    }
  } catch (const std::exception& e) {
    SITELY_LOG_ERROR("Fatal error", {sitely::observability::StringField("error", e.what())});
    sitely::observability::ShutdownLogging();
    return 2;
  }

  sitely::observability::ShutdownLogging();
  return 0;
}
