#pragma once

#include <filesystem>
#include <memory>

#include "config/config.pb.h"

#include "internal/core/runner.hpp"
#include "internal/db/api/execution_ledger.hpp"
#include "internal/migration/naming.hpp"

#if STRATA_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#endif

namespace strata::factory {

/*
  RuntimeDependencies

  Long-lived objects resolved from the runtime config. Migrations are not
  part of it: the application registers its own list (see
  migration::DirectoryRegistry::Build).
*/
struct RuntimeDependencies {
  std::shared_ptr<db::ExecutionLedger> ledger;

#if STRATA_DB_SQLITE
  // Set when the ledger is sqlite-backed, so migrations can share the
  // connection with it.
  std::shared_ptr<db::sqlite::SqliteDB> sqlite;
#endif

  core::RunnerOptions     runner_options;
  migration::NamingScheme naming;
  std::filesystem::path   migrations_directory;
};

/*
  Build

  NOTE:
  This is the composition root of the library.
  It is the ONLY place allowed to know concrete ledger types.

  Throws std::runtime_error when the config asks for a backend that was not
  enabled at build time, std::invalid_argument for an invalid table name.
*/
RuntimeDependencies Build(const strata::runtime::config::RuntimeConfig& config);

migration::NamingScheme ResolveNaming(const strata::runtime::config::MigrationsConfig& config);
core::RunnerOptions     ResolveRunnerOptions(const strata::runtime::config::LockConfig& config);

} // namespace strata::factory
