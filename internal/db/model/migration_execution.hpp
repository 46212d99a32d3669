#pragma once

#include <cstdint>

namespace strata::db::model {

/*
  Persistent execution row: one completed application of a migration.

  - version is the unique key.
  - executed_at_ms <= finished_at_ms (unix milliseconds).
  - Created when Up() succeeds, removed when Down() succeeds.
*/

struct MigrationExecution {
  uint64_t version = 0;

  uint64_t executed_at_ms = 0;
  uint64_t finished_at_ms = 0;

  bool operator==(const MigrationExecution&) const = default;
};

} // namespace strata::db::model
