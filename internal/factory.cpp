#include "internal/factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/memory/memory_ledger.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#if STRATA_DB_SQLITE
#include "internal/db/sqlite/sqlite_ledger.hpp"
#endif
#if STRATA_DB_POSTGRES
#include "internal/db/postgres/pg_ledger.hpp"
#endif

namespace strata::factory {

namespace {

std::string ResolveTableName(const strata::runtime::config::LedgerConfig& config) {
  auto table = config.table_name().empty() ? std::string(db::sql::kDefaultTableName) : config.table_name();
  db::sql::RequireValidTableName(table);
  return table;
}

void BuildLedger(const strata::runtime::config::LedgerConfig& config, RuntimeDependencies& deps) {
  auto table = ResolveTableName(config);

  if (config.has_sqlite()) {
#if STRATA_DB_SQLITE
    deps.sqlite = std::make_shared<db::sqlite::SqliteDB>(config.sqlite().path(), config.sqlite().wal_mode());
    deps.ledger = std::make_shared<db::sqlite::SqliteLedger>(deps.sqlite, table);
    STRATA_LOG_INFO("using sqlite execution ledger", {observability::StringField("path", config.sqlite().path()),
                                                      observability::StringField("table", table)});
    return;
#else
    throw std::runtime_error("sqlite ledger requested but not enabled at build time");
#endif
  }

  if (config.has_postgres()) {
#if STRATA_DB_POSTGRES
    deps.ledger = std::make_shared<db::postgres::PgLedger>(config.postgres().connection_uri(), table);
    STRATA_LOG_INFO("using postgres execution ledger", {observability::StringField("table", table)});
    return;
#else
    throw std::runtime_error("postgres ledger requested but not enabled at build time");
#endif
  }

  STRATA_LOG_WARN("using in-memory execution ledger; executions are not persisted");
  deps.ledger = std::make_shared<db::memory::MemoryLedger>();
}

} // namespace

migration::NamingScheme ResolveNaming(const strata::runtime::config::MigrationsConfig& config) {
  migration::NamingScheme naming;
  if (!config.file_prefix().empty()) {
    naming.prefix = config.file_prefix();
  }
  if (!config.file_separator().empty()) {
    naming.separator = config.file_separator();
  }
  if (!config.file_suffix().empty()) {
    naming.suffix = config.file_suffix();
  }
  return naming;
}

core::RunnerOptions ResolveRunnerOptions(const strata::runtime::config::LockConfig& config) {
  core::RunnerOptions options;
  options.exclusive = config.exclusive();
  if (!config.directory().empty()) {
    options.lock_directory = config.directory();
  }
  if (!config.name().empty()) {
    options.lock_name = config.name();
  }
  return options;
}

RuntimeDependencies Build(const strata::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  BuildLedger(config.ledger(), deps);

  deps.runner_options       = ResolveRunnerOptions(config.lock());
  deps.naming               = ResolveNaming(config.migrations());
  deps.migrations_directory = config.migrations().directory();

  return deps;
}

} // namespace strata::factory
