#include "memory_ledger.hpp"

namespace strata::db::memory {

MemoryLedger::MemoryLedger() = default;

Result MemoryLedger::Init() {
  return Result::Ok();
}

Result MemoryLedger::LoadExecutions(std::vector<model::MigrationExecution>& out) {
  std::scoped_lock lock(mutex_);
  out.reserve(out.size() + executions_.size());
  for (const auto& [_, execution] : executions_) {
    out.push_back(execution);
  }
  return Result::Ok();
}

Result MemoryLedger::Save(const model::MigrationExecution& execution) {
  std::scoped_lock lock(mutex_);
  executions_[execution.version] = execution;
  return Result::Ok();
}

Result MemoryLedger::Remove(const model::MigrationExecution& execution) {
  std::scoped_lock lock(mutex_);
  executions_.erase(execution.version);
  return Result::Ok();
}

Result MemoryLedger::FindOne(uint64_t version, std::optional<model::MigrationExecution>& out) {
  std::scoped_lock lock(mutex_);
  auto it = executions_.find(version);
  if (it == executions_.end()) {
    out.reset();
  } else {
    out = it->second;
  }
  return Result::Ok();
}

} // namespace strata::db::memory
