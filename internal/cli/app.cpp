#include "internal/cli/app.hpp"

#include <exception>
#include <ostream>
#include <utility>

#include "internal/migration/scaffold.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace strata::cli {

App::App(AppContext context, std::ostream& out, std::ostream& err)
    : context_(std::move(context)), out_(out), err_(err) {
}

void App::PrintUsage(std::ostream& os) const {
  os << "Usage:\n"
     << "  up [--steps=N|all]        apply pending migrations (default: all)\n"
     << "  down [--steps=N|all]      revert applied migrations (default: 1)\n"
     << "  force:up --version=V      run Up() of V regardless of recorded state\n"
     << "  force:down --version=V    run Down() of V regardless of recorded state\n"
     << "  blank                     create an empty migration file\n"
     << "  stats                     show registered, executed and pending counts\n"
     << "  help                      show this message\n";
}

int App::Run(const std::vector<std::string>& args) {
  Command command;
  try {
    command = ParseCommand(args);
  } catch (const UsageError& e) {
    err_ << e.what() << "\n";
    PrintUsage(err_);
    return kExitUsage;
  }

  if (command.kind == CommandKind::kHelp) {
    PrintUsage(out_);
    return kExitOk;
  }

  if (command.kind == CommandKind::kBlank) {
    return Blank();
  }

  if (!context_.registry || !context_.ledger) {
    err_ << "no registry or execution ledger configured\n";
    return kExitFailure;
  }

  auto init = context_.ledger->Init();
  if (!init) {
    err_ << "failed to initialize execution ledger: " << util::Describe(init) << "\n";
    return kExitFailure;
  }

  try {
    return Dispatch(command);
  } catch (const std::exception& e) {
    err_ << e.what() << "\n";
    return kExitFailure;
  }
}

int App::Dispatch(const Command& command) {
  core::Runner runner(context_.registry, context_.ledger, context_.runner_options);
  const auto&  ctx = context_.run_context;

  switch (command.kind) {
    case CommandKind::kUp:
      return PrintReport(runner.Up(command.steps, ctx));
    case CommandKind::kDown:
      return PrintReport(runner.Down(command.steps, ctx));
    case CommandKind::kForceUp:
      return PrintReport(runner.ForceUp(command.version, ctx));
    case CommandKind::kForceDown:
      return PrintReport(runner.ForceDown(command.version, ctx));
    case CommandKind::kStats:
      return PrintStats(runner.Stats());
    case CommandKind::kBlank:
    case CommandKind::kHelp:
      break;
  }
  return kExitUsage;
}

int App::Blank() {
  if (context_.migrations_directory.empty()) {
    err_ << "no migrations directory configured\n";
    return kExitFailure;
  }

  try {
    auto version = util::ToUnixSeconds(util::Now());
    auto path    = migration::CreateBlankMigration(context_.migrations_directory, context_.naming, version);
    STRATA_LOG_INFO("created blank migration", {observability::UintField("version", version),
                                                observability::StringField("path", path.string())});
    out_ << path.string() << "\n"
         << "register MakeMigration" << version << "() in your migration list (e.g. migrations/migrations.hpp)\n";
    return kExitOk;
  } catch (const std::exception& e) {
    err_ << e.what() << "\n";
    return kExitFailure;
  }
}

int App::PrintStats(const core::StatsReport& stats) {
  out_ << "registered:   " << stats.registered << "\n"
       << "executed:     " << stats.executed << "\n"
       << "pending up:   " << stats.pending_up << "\n"
       << "pending down: " << stats.pending_down << "\n"
       << "consistent:   " << (stats.consistent ? "yes" : "no") << "\n";

  if (!stats.consistent) {
    out_ << "orphaned:    ";
    for (auto version : stats.orphaned) {
      out_ << " " << version;
    }
    out_ << "\n";
  }
  return kExitOk;
}

int App::PrintReport(const core::RunReport& report) {
  const char* verb = report.direction == core::Direction::kUp ? "applied" : "reverted";

  for (const auto& step : report.completed) {
    out_ << verb << " " << step.version << " (" << (step.finished_at_ms - step.executed_at_ms) << " ms)\n";
  }

  if (!report.Ok()) {
    err_ << "halted at migration " << report.failed_version.value_or(0) << ": " << util::Describe(report.cause)
         << "\n";
    return kExitFailure;
  }

  if (report.completed.empty()) {
    out_ << "nothing to do\n";
  }
  return kExitOk;
}

} // namespace strata::cli
