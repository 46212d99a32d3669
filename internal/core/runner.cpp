#include "internal/core/runner.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <sstream>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/run_lock.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace strata::core {

using db::model::MigrationExecution;
using util::ErrorCode;
using util::Result;

namespace {

std::string JoinVersions(const std::vector<uint64_t>& versions) {
  std::ostringstream out;
  for (std::size_t i = 0; i < versions.size(); ++i) {
    if (i != 0) {
      out << ", ";
    }
    out << versions[i];
  }
  return out.str();
}

std::size_t Budget(Steps steps, std::size_t available) {
  if (steps.IsAll()) {
    return available;
  }
  return std::min(*steps.count, available);
}

// Migrations report failure through Result; an escaped exception is treated
// the same way so the run still halts cleanly.
Result Invoke(Direction direction, migration::Migration& migration, const migration::Context& ctx) {
  try {
    return direction == Direction::kUp ? migration.Up(ctx) : migration.Down(ctx);
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, std::string("migration threw: ") + e.what());
  } catch (...) {
    return Result::Err(ErrorCode::InternalError, "migration threw a non-standard exception");
  }
}

} // namespace

const char* DirectionName(Direction direction) {
  return direction == Direction::kUp ? "up" : "down";
}

Runner::Runner(std::shared_ptr<const migration::Registry> registry, std::shared_ptr<db::ExecutionLedger> ledger,
               RunnerOptions options)
    : registry_(std::move(registry)), ledger_(std::move(ledger)), options_(std::move(options)) {
  if (!registry_) {
    throw std::invalid_argument("runner requires a registry");
  }
  if (!ledger_) {
    throw std::invalid_argument("runner requires an execution ledger");
  }
  if (options_.lock_directory.empty()) {
    options_.lock_directory = std::filesystem::temp_directory_path();
  }
}

Runner::~Runner() = default;

RunReport Runner::Up(Steps steps, const migration::Context& ctx) {
  return RunOrdered(Direction::kUp, steps, ctx);
}

RunReport Runner::Down(Steps steps, const migration::Context& ctx) {
  return RunOrdered(Direction::kDown, steps, ctx);
}

RunReport Runner::ForceUp(uint64_t version, const migration::Context& ctx) {
  return RunForced(Direction::kUp, version, ctx);
}

RunReport Runner::ForceDown(uint64_t version, const migration::Context& ctx) {
  return RunForced(Direction::kDown, version, ctx);
}

StatsReport Runner::Stats() {
  auto lock = AcquireLock();
  auto plan = LoadPlan();
  state_    = RunState::kIdle;

  StatsReport stats;
  stats.registered   = registry_->Count();
  stats.executed     = plan.applied.size() + plan.orphaned.size();
  stats.pending_up   = plan.pending_up.size();
  stats.pending_down = plan.pending_down.size();
  stats.consistent   = plan.Consistent();
  stats.orphaned     = std::move(plan.orphaned);

  if (!stats.consistent) {
    STRATA_LOG_WARN("execution ledger references unregistered migrations",
                    {observability::StringField("orphaned", JoinVersions(stats.orphaned))});
  }
  return stats;
}

std::unique_ptr<runtime::ScopedRunLock> Runner::AcquireLock() const {
  if (!options_.exclusive) {
    return nullptr;
  }

  try {
    return std::make_unique<runtime::ScopedRunLock>(options_.lock_directory, options_.lock_name);
  } catch (const util::LockConflict& e) {
    STRATA_LOG_ERROR("could not acquire migrations run lock", {observability::StringField("error", e.what())});
    throw;
  }
}

Plan Runner::LoadPlan() {
  state_ = RunState::kReconciling;

  std::vector<MigrationExecution> executions;
  auto loaded = ledger_->LoadExecutions(executions);
  if (!loaded) {
    state_ = RunState::kIdle;
    STRATA_LOG_ERROR("failed to load migration executions",
                     {observability::StringField("error", util::Describe(loaded))});
    throw util::StorageError(loaded, "failed to load migration executions: " + util::Describe(loaded));
  }

  auto plan = Reconcile(*registry_, executions);
  STRATA_LOG_DEBUG("execution plan loaded", {observability::UintField("executions", executions.size()),
                                             observability::UintField("pending_up", plan.pending_up.size()),
                                             observability::UintField("pending_down", plan.pending_down.size()),
                                             observability::BoolField("consistent", plan.Consistent())});
  return plan;
}

void Runner::RequireConsistent(const Plan& plan, Direction direction) {
  if (plan.Consistent()) {
    return;
  }

  state_ = RunState::kIdle;
  auto orphaned = JoinVersions(plan.orphaned);
  STRATA_LOG_ERROR("refusing to run: execution ledger references unregistered migrations",
                   {observability::StringField("direction", DirectionName(direction)),
                    observability::StringField("orphaned", orphaned)});
  throw util::InconsistentLedger(plan.orphaned, "execution ledger references migrations that are not registered: " +
                                                    orphaned + ". Register them or remove their executions first");
}

RunReport Runner::RunOrdered(Direction direction, Steps steps, const migration::Context& ctx) {
  observability::SpanScope span(direction == Direction::kUp ? observability::kRunUpSpan : observability::kRunDownSpan);

  auto lock = AcquireLock();
  auto plan = LoadPlan();
  RequireConsistent(plan, direction);

  const auto& candidates = direction == Direction::kUp ? plan.pending_up : plan.pending_down;
  auto        budget     = Budget(steps, candidates.size());

  STRATA_LOG_INFO("migration run started",
                  {observability::StringField("direction", DirectionName(direction)),
                   observability::UintField("pending", candidates.size()), observability::UintField("steps", budget)});
  span.SetAttribute(observability::kStepsAttr, static_cast<std::uint64_t>(budget));

  RunReport report;
  report.direction = direction;
  state_           = RunState::kApplying;

  for (std::size_t i = 0; i < budget; ++i) {
    if (!Step(direction, *candidates[i], ctx, report)) {
      span.Fail(util::Describe(report.cause));
      return report;
    }
  }

  state_ = RunState::kIdle;
  span.SetAttribute(observability::kCompletedAttr, static_cast<std::uint64_t>(report.completed.size()));
  STRATA_LOG_INFO("migration run finished", {observability::StringField("direction", DirectionName(direction)),
                                             observability::UintField("applied", report.completed.size())});
  return report;
}

RunReport Runner::RunForced(Direction direction, uint64_t version, const migration::Context& ctx) {
  observability::SpanScope span(direction == Direction::kUp ? observability::kRunForceUpSpan
                                                            : observability::kRunForceDownSpan);
  span.SetAttribute(observability::kVersionAttr, version);

  auto lock      = AcquireLock();
  auto migration = registry_->Get(version);
  if (!migration) {
    STRATA_LOG_ERROR("forced run on unregistered migration", {observability::UintField("version", version)});
    throw util::NotFound("migration " + std::to_string(version) + " is not registered");
  }

  STRATA_LOG_WARN("forced migration run; the execution ledger is not consulted",
                  {observability::StringField("direction", DirectionName(direction)),
                   observability::UintField("version", version)});

  RunReport report;
  report.direction = direction;
  state_           = RunState::kApplying;

  if (!Step(direction, *migration, ctx, report)) {
    span.Fail(util::Describe(report.cause));
    return report;
  }

  state_ = RunState::kIdle;
  return report;
}

bool Runner::Step(Direction direction, migration::Migration& migration, const migration::Context& ctx,
                  RunReport& report) {
  const auto version = migration.Version();

  observability::SpanScope span(observability::kStepSpan);
  span.SetAttribute(observability::kVersionAttr, version);
  span.SetAttribute(observability::kDirectionAttr, DirectionName(direction));

  auto halt = [&](Result cause) {
    state_                = RunState::kHalted;
    report.outcome        = RunOutcome::kHalted;
    report.failed_version = version;
    report.cause          = std::move(cause);
    span.Fail(util::Describe(report.cause));
    STRATA_LOG_ERROR("migration run halted", {observability::StringField("direction", DirectionName(direction)),
                                              observability::UintField("version", version),
                                              observability::StringField("error", util::Describe(report.cause))});
    return false;
  };

  if (ctx.Cancelled()) {
    return halt(Result::Err(ErrorCode::Cancelled, "run cancelled before migration " + std::to_string(version)));
  }

  STRATA_LOG_INFO("migration step started", {observability::StringField("direction", DirectionName(direction)),
                                             observability::UintField("version", version)});

  const auto started = util::ToUnixMillis(util::Now());

  auto result = Invoke(direction, migration, ctx);
  if (!result) {
    return halt(std::move(result));
  }

  // the wall clock may step backwards; keep finished >= executed
  const auto finished = std::max(started, util::ToUnixMillis(util::Now()));

  MigrationExecution execution{.version = version, .executed_at_ms = started, .finished_at_ms = finished};

  auto persisted = direction == Direction::kUp ? ledger_->Save(execution) : ledger_->Remove(execution);
  if (!persisted) {
    return halt(persisted.WithContext(direction == Direction::kUp
                                          ? "migration applied but the execution ledger could not be updated"
                                          : "migration reverted but the execution ledger could not be updated"));
  }

  report.completed.push_back(execution);
  STRATA_LOG_INFO("migration step finished", {observability::StringField("direction", DirectionName(direction)),
                                              observability::UintField("version", version),
                                              observability::UintField("duration_ms", finished - started)});
  return true;
}

} // namespace strata::core
