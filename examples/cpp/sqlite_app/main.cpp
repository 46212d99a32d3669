#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "examples/cpp/sqlite_app/migrations/migrations.hpp"
#include "internal/cli/app.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/migration/directory_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace {

std::atomic<bool> g_cancelled{false};

void HandleSignal(int) {
  g_cancelled.store(true, std::memory_order_release);
}

// blank and help work without a valid registry
bool NeedsRegistry(const std::vector<std::string>& args) {
  if (args.empty()) return false;
  const auto& command = args[0];
  return command != "blank" && command != "help" && command != "--help" && command != "-h";
}

void Shutdown() {
  strata::observability::ShutdownTracing();
  strata::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: strata-sqlite-example <config.yaml> <command> [options]" << std::endl;
    return 1;
  }

  const std::string              config_path = argv[1];
  const std::vector<std::string> args(argv + 2, argv + argc);

  strata::runtime::config::RuntimeConfig config;
  try {
    config = strata::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << "invalid config " << config_path << ": " << e.what() << std::endl;
    return 1;
  }

  strata::observability::InitializeLogging(config);
  strata::observability::InitializeTracing(config);

  // an interrupted run stops before its next step
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  int rc = strata::cli::App::kExitFailure;
  try {
    auto deps = strata::factory::Build(config);
    if (!deps.sqlite) {
      throw std::runtime_error("this example needs a sqlite ledger; set ledger.sqlite in " + config_path);
    }

    strata::cli::AppContext ctx;
    ctx.ledger               = deps.ledger;
    ctx.runner_options       = deps.runner_options;
    ctx.migrations_directory = deps.migrations_directory;
    ctx.naming               = deps.naming;
    ctx.run_context          = strata::migration::Context(
        std::shared_ptr<const std::atomic<bool>>(&g_cancelled, [](const std::atomic<bool>*) {}));

    if (NeedsRegistry(args)) {
      ctx.registry =
          strata::migration::DirectoryRegistry::Build(deps.migrations_directory, deps.naming, migrations::All(deps.sqlite));
    }

    strata::cli::App app(std::move(ctx), std::cout, std::cerr);
    rc = app.Run(args);
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR("Fatal error", {strata::observability::StringField("error", e.what())});
    std::cerr << e.what() << std::endl;
  }

  Shutdown();
  return rc;
}
