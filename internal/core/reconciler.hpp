#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "internal/db/model/migration_execution.hpp"
#include "internal/migration/registry.hpp"

namespace strata::core {

/*
  Plan

  Difference between the registry and the ledger.

  - pending_up:   registered, no execution record. Ascending version.
  - pending_down: registered, with an execution record. Descending version
                  (last applied is first reverted).
  - orphaned:     execution records whose version is not registered.
                  Ascending. Their Down() is unavailable, so ordered runs
                  must refuse to proceed while this is non-empty.
*/
struct Plan {
  std::vector<std::shared_ptr<migration::Migration>> pending_up;
  std::vector<std::shared_ptr<migration::Migration>> pending_down;
  std::vector<uint64_t>                              orphaned;

  // Execution record for each entry of pending_down, same order.
  std::vector<db::model::MigrationExecution> applied;

  bool Consistent() const {
    return orphaned.empty();
  }
};

// Pure function of its inputs; never touches storage.
Plan Reconcile(const migration::Registry& registry, const std::vector<db::model::MigrationExecution>& executions);

} // namespace strata::core
