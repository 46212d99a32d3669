#include "internal/db/sql/sql_queries.hpp"

#include <stdexcept>

namespace strata::db::sql {

namespace {

std::string Quote(std::string_view table) {
  return "\"" + std::string(table) + "\"";
}

const char* Param(Dialect dialect, int index) {
  if (dialect == Dialect::kSqlite) return "?";
  switch (index) {
    case 1:
      return "$1";
    case 2:
      return "$2";
    default:
      return "$3";
  }
}

} // namespace

bool IsValidTableName(std::string_view name) {
  if (name.empty()) return false;

  for (std::size_t i = 0; i < name.size(); ++i) {
    const char c      = name[i];
    const bool alpha  = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    const bool digit  = c >= '0' && c <= '9';
    if (!alpha && !(digit && i > 0)) return false;
  }
  return true;
}

void RequireValidTableName(std::string_view name) {
  if (!IsValidTableName(name)) {
    throw std::invalid_argument("invalid ledger table name: '" + std::string(name) + "'");
  }
}

std::string CreateExecutionsTable(std::string_view table, Dialect dialect) {
  const char* type = dialect == Dialect::kSqlite ? "INTEGER" : "BIGINT";
  return std::string("CREATE TABLE IF NOT EXISTS ") + Quote(table) + " (" +
         "version " + type + " NOT NULL PRIMARY KEY, " +
         "executed_at_ms " + type + " NOT NULL, " +
         "finished_at_ms " + type + " NOT NULL);";
}

std::string SelectExecutions(std::string_view table) {
  return "SELECT version,executed_at_ms,finished_at_ms FROM " + Quote(table) + ";";
}

std::string SelectExecution(std::string_view table, Dialect dialect) {
  return "SELECT version,executed_at_ms,finished_at_ms FROM " + Quote(table) + " WHERE version=" + Param(dialect, 1) + ";";
}

std::string UpsertExecution(std::string_view table, Dialect dialect) {
  return "INSERT INTO " + Quote(table) + "(version,executed_at_ms,finished_at_ms) VALUES(" + Param(dialect, 1) + "," +
         Param(dialect, 2) + "," + Param(dialect, 3) +
         ") ON CONFLICT(version) DO UPDATE SET"
         " executed_at_ms=excluded.executed_at_ms,"
         " finished_at_ms=excluded.finished_at_ms;";
}

std::string DeleteExecution(std::string_view table, Dialect dialect) {
  return "DELETE FROM " + Quote(table) + " WHERE version=" + Param(dialect, 1) + ";";
}

} // namespace strata::db::sql
