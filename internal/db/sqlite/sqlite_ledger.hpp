#pragma once

#include <memory>
#include <string>

#include "internal/db/api/execution_ledger.hpp"
#include "sqlite_db.hpp"

namespace strata::db::sqlite {

/*
  Execution ledger stored in one table of a SqliteDB.

  Values are kept as INTEGER, so anything above INT64_MAX is rejected on
  Save (Unsupported) and reported absent by FindOne/Remove.
*/
class SqliteLedger final : public db::ExecutionLedger {
 public:
  // Throws std::invalid_argument for an unusable table name.
  SqliteLedger(std::shared_ptr<SqliteDB> db, std::string table_name);

  Result Init() override;
  Result LoadExecutions(std::vector<model::MigrationExecution>& out) override;
  Result Save(const model::MigrationExecution& execution) override;
  Result Remove(const model::MigrationExecution& execution) override;
  Result FindOne(uint64_t version, std::optional<model::MigrationExecution>& out) override;

  const std::string& TableName() const {
    return table_;
  }

 private:
  static Result Translate(int rc, const std::string& message);
  Result        Fail(int rc) const;

  std::shared_ptr<SqliteDB> db_;
  std::string               table_;
};

} // namespace strata::db::sqlite
