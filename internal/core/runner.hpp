#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/reconciler.hpp"
#include "internal/db/api/execution_ledger.hpp"
#include "internal/migration/migration.hpp"
#include "internal/migration/registry.hpp"

namespace strata::runtime {
class ScopedRunLock;
}

namespace strata::core {

enum class Direction {
  kUp,
  kDown,
};

const char* DirectionName(Direction direction);

// Step budget for an ordered run: a count, or every pending migration.
struct Steps {
  std::optional<std::size_t> count;

  static Steps All() {
    return {};
  }
  static Steps Count(std::size_t n) {
    return {n};
  }

  bool IsAll() const {
    return !count.has_value();
  }
};

/*
  Per-run state machine:

    Idle -> Reconciling -> Applying(i) -> { Idle | Halted }

  Forced runs skip Reconciling.
*/
enum class RunState {
  kIdle,
  kReconciling,
  kApplying,
  kHalted,
};

enum class RunOutcome {
  kCompleted,
  kHalted,
};

struct RunReport {
  Direction  direction = Direction::kUp;
  RunOutcome outcome   = RunOutcome::kCompleted;

  // Steps that finished and were persisted, in execution order. Timestamps
  // are the step's own start/finish.
  std::vector<db::model::MigrationExecution> completed;

  // Set when outcome == kHalted.
  std::optional<uint64_t> failed_version;
  util::Result            cause;

  bool Ok() const {
    return outcome == RunOutcome::kCompleted;
  }
};

struct StatsReport {
  std::size_t registered   = 0;
  std::size_t executed     = 0;
  std::size_t pending_up   = 0;
  std::size_t pending_down = 0;

  // false when the ledger holds executions for unregistered versions;
  // ordered Up/Down refuse to run until that is resolved.
  bool                  consistent = true;
  std::vector<uint64_t> orphaned;
};

struct RunnerOptions {
  // Take the host-local run lock around every command.
  bool exclusive = false;

  // Defaults to the system temp directory.
  std::filesystem::path lock_directory;

  std::string lock_name = "strata-migrations";
};

/*
  Runner

  Applies and reverts migrations one at a time, persisting each step before
  the next one starts. Stops at the first failure without compensating: the
  failed migration and every earlier success in the run stay as they are.

  Throws before any step is taken when:
    - util::LockConflict        another process holds the run lock
    - util::StorageError        the ledger can't be read
    - util::InconsistentLedger  ordered run with orphaned executions
    - util::NotFound            forced run on an unregistered version
  Step failures (including a failed ledger write) are reported through
  RunReport instead.

  Not thread-safe; one runner drives one run at a time.
*/
class Runner {
 public:
  Runner(std::shared_ptr<const migration::Registry> registry, std::shared_ptr<db::ExecutionLedger> ledger,
         RunnerOptions options = {});
  ~Runner();

  Runner(const Runner&)            = delete;
  Runner& operator=(const Runner&) = delete;

  // Pending migrations in ascending version order, at most `steps` of them.
  RunReport Up(Steps steps, const migration::Context& ctx = {});

  // Applied migrations in descending version order, at most `steps` of them.
  RunReport Down(Steps steps, const migration::Context& ctx = {});

  // DESTRUCTIVE: run Up()/Down() of one registered version regardless of
  // what the ledger says. Can apply a migration twice or revert one that
  // was never applied. Skips the consistency check.
  RunReport ForceUp(uint64_t version, const migration::Context& ctx = {});
  RunReport ForceDown(uint64_t version, const migration::Context& ctx = {});

  // Read-only.
  StatsReport Stats();

  RunState State() const {
    return state_;
  }

  const RunnerOptions& Options() const {
    return options_;
  }

 private:
  std::unique_ptr<runtime::ScopedRunLock> AcquireLock() const;

  // Reads the ledger and diffs it against the registry. Throws StorageError.
  Plan LoadPlan();

  // Throws InconsistentLedger when the plan has orphaned executions.
  void RequireConsistent(const Plan& plan, Direction direction);

  RunReport RunOrdered(Direction direction, Steps steps, const migration::Context& ctx);
  RunReport RunForced(Direction direction, uint64_t version, const migration::Context& ctx);

  // One step. Returns false (and fills report) if the run must halt.
  bool Step(Direction direction, migration::Migration& migration, const migration::Context& ctx, RunReport& report);

  std::shared_ptr<const migration::Registry> registry_;
  std::shared_ptr<db::ExecutionLedger>       ledger_;
  RunnerOptions                              options_;
  RunState                                   state_ = RunState::kIdle;
};

} // namespace strata::core
