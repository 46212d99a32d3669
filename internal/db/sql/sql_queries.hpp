#pragma once

#include <string>
#include <string_view>

namespace strata::db::sql {

/*
  Canonical ledger SQL shared by the relational backends.

  Layout (same on every backend):
    version         unsigned 64-bit, primary key
    executed_at_ms  unsigned 64-bit
    finished_at_ms  unsigned 64-bit

  Table names are interpolated, so they must pass IsValidTableName().
  Placeholders differ per dialect (SQLite "?", Postgres "$1").
*/

enum class Dialect {
  kSqlite,
  kPostgres,
};

inline constexpr std::string_view kDefaultTableName = "migration_executions";

// [A-Za-z_][A-Za-z0-9_]*
bool IsValidTableName(std::string_view name);

// Throws std::invalid_argument for names rejected by IsValidTableName().
void RequireValidTableName(std::string_view name);

std::string CreateExecutionsTable(std::string_view table, Dialect dialect);

std::string SelectExecutions(std::string_view table);

std::string SelectExecution(std::string_view table, Dialect dialect);

std::string UpsertExecution(std::string_view table, Dialect dialect);

std::string DeleteExecution(std::string_view table, Dialect dialect);

} // namespace strata::db::sql
