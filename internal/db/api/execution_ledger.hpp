#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/db/model/migration_execution.hpp"
#include "internal/util/result.hpp"

namespace strata::db {

using util::ErrorCode;
using util::Result;

/*
  Execution ledger abstraction.

  The persisted record of which migrations have been applied. The core
  reads and writes it only through this port.

  CONTRACT (all backends):

  - Init() is idempotent: existing storage is a no-op success.
  - LoadExecutions() appends every record, in any order. On failure the
    rows decoded before the failure are still appended; callers must treat
    a non-OK result as "output may be partial".
  - Save() is an upsert keyed by version.
  - Remove() deletes by version; an absent record is not an error.
  - FindOne() leaves `out` empty with an OK result when absent.
  - Every call may fail with a storage error.
*/

class ExecutionLedger {
 public:
  virtual ~ExecutionLedger() = default;

  virtual Result Init() = 0;

  virtual Result LoadExecutions(std::vector<model::MigrationExecution>& out) = 0;

  virtual Result Save(const model::MigrationExecution& execution) = 0;

  virtual Result Remove(const model::MigrationExecution& execution) = 0;

  virtual Result FindOne(uint64_t version, std::optional<model::MigrationExecution>& out) = 0;
};

} // namespace strata::db
