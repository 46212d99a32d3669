#pragma once

#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/execution_ledger.hpp"

namespace strata::db::memory {

/*
  Process-local ledger. Nothing survives the process; useful for tests and
  for dry runs against migrations that keep their own state.
*/
class MemoryLedger final : public db::ExecutionLedger {
public:
  MemoryLedger();

  Result Init() override;
  Result LoadExecutions(std::vector<model::MigrationExecution>& out) override;
  Result Save(const model::MigrationExecution& execution) override;
  Result Remove(const model::MigrationExecution& execution) override;
  Result FindOne(uint64_t version, std::optional<model::MigrationExecution>& out) override;

private:
  mutable std::mutex mutex_;
  std::unordered_map<uint64_t, model::MigrationExecution> executions_;
};

}
