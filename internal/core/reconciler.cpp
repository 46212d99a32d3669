#include "internal/core/reconciler.hpp"

#include <algorithm>
#include <unordered_map>

namespace strata::core {

Plan Reconcile(const migration::Registry& registry, const std::vector<db::model::MigrationExecution>& executions) {
  std::unordered_map<uint64_t, db::model::MigrationExecution> executed;
  executed.reserve(executions.size());
  for (const auto& execution : executions) {
    executed.emplace(execution.version, execution);
  }

  Plan plan;

  for (const auto& migration : registry.OrderedMigrations()) {
    auto it = executed.find(migration->Version());
    if (it == executed.end()) {
      plan.pending_up.push_back(migration);
      continue;
    }
    plan.pending_down.push_back(migration);
    plan.applied.push_back(it->second);
    executed.erase(it);
  }

  std::reverse(plan.pending_down.begin(), plan.pending_down.end());
  std::reverse(plan.applied.begin(), plan.applied.end());

  // whatever is left has no registered migration
  plan.orphaned.reserve(executed.size());
  for (const auto& [version, _] : executed) {
    plan.orphaned.push_back(version);
  }
  std::sort(plan.orphaned.begin(), plan.orphaned.end());

  return plan;
}

} // namespace strata::core
