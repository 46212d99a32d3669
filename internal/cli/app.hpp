#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "internal/cli/command.hpp"
#include "internal/core/runner.hpp"
#include "internal/db/api/execution_ledger.hpp"
#include "internal/migration/migration.hpp"
#include "internal/migration/naming.hpp"
#include "internal/migration/registry.hpp"

namespace strata::cli {

// Everything a command needs, wired by the composition root.
struct AppContext {
  std::shared_ptr<const migration::Registry> registry;
  std::shared_ptr<db::ExecutionLedger>       ledger;
  core::RunnerOptions                        runner_options;

  // Target of `blank`. Empty disables the command.
  std::filesystem::path   migrations_directory;
  migration::NamingScheme naming;

  migration::Context run_context;
};

/*
  Command-line front end.

  Exit status:
    0  success
    1  usage error
    2  halted run, lock conflict, storage failure or inconsistent state
*/
class App {
 public:
  static constexpr int kExitOk      = 0;
  static constexpr int kExitUsage   = 1;
  static constexpr int kExitFailure = 2;

  App(AppContext context, std::ostream& out, std::ostream& err);

  int Run(const std::vector<std::string>& args);

  void PrintUsage(std::ostream& os) const;

 private:
  int Dispatch(const Command& command);
  int Blank();
  int PrintStats(const core::StatsReport& stats);
  int PrintReport(const core::RunReport& report);

  AppContext    context_;
  std::ostream& out_;
  std::ostream& err_;
};

} // namespace strata::cli
