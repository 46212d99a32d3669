#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/execution_ledger.hpp"

namespace strata::db::postgres {

/*
  PgLedger

  Execution ledger on a dedicated PostgreSQL connection.

  Design notes:
  -------------
  - One connection, owned by the ledger. The runner issues one call at a
    time, so a pool buys nothing; do not share the connection with the
    migrations themselves (their sessions may hold locks or open
    transactions).
  - libpqxx connections are NOT thread-safe -> every call takes mutex_.
  - Each call is its own pqxx::work, committed before returning, so a
    successful Save()/Remove() is durable.
*/

class PgLedger final : public db::ExecutionLedger {
 public:
  // Throws std::invalid_argument for an unusable table name and
  // pqxx::broken_connection if the server can't be reached.
  PgLedger(const std::string& conninfo, std::string table_name);

  Result Init() override;
  Result LoadExecutions(std::vector<model::MigrationExecution>& out) override;
  Result Save(const model::MigrationExecution& execution) override;
  Result Remove(const model::MigrationExecution& execution) override;
  Result FindOne(uint64_t version, std::optional<model::MigrationExecution>& out) override;

  const std::string& TableName() const {
    return table_;
  }

 private:
  static Result Translate(const std::exception& e);

  std::mutex       mutex_;
  pqxx::connection conn_;
  std::string      table_;
};

} // namespace strata::db::postgres
