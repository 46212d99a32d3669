#include "internal/core/runner.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "internal/db/memory/memory_ledger.hpp"
#include "internal/runtime/run_lock.hpp"
#include "internal/util/errors.hpp"

namespace {

using strata::core::Runner;
using strata::core::RunnerOptions;
using strata::core::RunOutcome;
using strata::core::RunState;
using strata::core::Steps;
using strata::db::ExecutionLedger;
using strata::db::memory::MemoryLedger;
using strata::db::model::MigrationExecution;
using strata::migration::Context;
using strata::migration::Migration;
using strata::migration::Registry;
using strata::util::ErrorCode;
using strata::util::Result;

using Journal = std::vector<std::string>;

class RecordingMigration final : public Migration {
 public:
  RecordingMigration(uint64_t version, std::shared_ptr<Journal> journal) : version_(version), journal_(std::move(journal)) {
  }

  uint64_t Version() const override {
    return version_;
  }

  Result Up(const Context&) override {
    journal_->push_back("up:" + std::to_string(version_));
    if (on_up) on_up();
    if (throw_up) throw std::runtime_error("exploded");
    return fail_up ? Result::Err(ErrorCode::IOError, "up failed") : Result::Ok();
  }

  Result Down(const Context&) override {
    journal_->push_back("down:" + std::to_string(version_));
    return fail_down ? Result::Err(ErrorCode::IOError, "down failed") : Result::Ok();
  }

  bool                  fail_up   = false;
  bool                  fail_down = false;
  bool                  throw_up  = false;
  std::function<void()> on_up;

 private:
  uint64_t                 version_;
  std::shared_ptr<Journal> journal_;
};

// MemoryLedger with injectable failures.
class FlakyLedger final : public ExecutionLedger {
 public:
  Result Init() override {
    return inner_.Init();
  }

  Result LoadExecutions(std::vector<MigrationExecution>& out) override {
    if (fail_load) return Result::Err(ErrorCode::IOError, "disk on fire");
    return inner_.LoadExecutions(out);
  }

  Result Save(const MigrationExecution& execution) override {
    if (fail_save_version == execution.version) return Result::Err(ErrorCode::IOError, "write refused");
    return inner_.Save(execution);
  }

  Result Remove(const MigrationExecution& execution) override {
    ++remove_calls[execution.version];
    if (fail_remove_version == execution.version) return Result::Err(ErrorCode::IOError, "delete refused");
    return inner_.Remove(execution);
  }

  Result FindOne(uint64_t version, std::optional<MigrationExecution>& out) override {
    return inner_.FindOne(version, out);
  }

  bool                    fail_load = false;
  std::optional<uint64_t> fail_save_version;
  std::optional<uint64_t> fail_remove_version;
  std::map<uint64_t, int> remove_calls;

 private:
  MemoryLedger inner_;
};

struct Fixture {
  std::shared_ptr<Journal>                         journal  = std::make_shared<Journal>();
  std::shared_ptr<Registry>                        registry = std::make_shared<Registry>();
  std::shared_ptr<FlakyLedger>                     ledger   = std::make_shared<FlakyLedger>();
  std::vector<std::shared_ptr<RecordingMigration>> migrations;

  explicit Fixture(const std::vector<uint64_t>& versions) {
    for (auto version : versions) {
      auto migration = std::make_shared<RecordingMigration>(version, journal);
      migrations.push_back(migration);
      registry->Register(migration);
    }
  }

  std::shared_ptr<RecordingMigration> Get(uint64_t version) const {
    for (const auto& migration : migrations) {
      if (migration->Version() == version) return migration;
    }
    return nullptr;
  }

  bool Recorded(uint64_t version) const {
    std::optional<MigrationExecution> found;
    auto                              result = ledger->FindOne(version, found);
    assert(result);
    return found.has_value();
  }

  std::size_t RecordCount() const {
    std::vector<MigrationExecution> executions;
    auto                            result = ledger->LoadExecutions(executions);
    assert(result);
    return executions.size();
  }
};

void TestUpAppliesLowestPendingFirst() {
  Fixture f({5, 9, 2});
  Runner  runner(f.registry, f.ledger);

  auto report = runner.Up(Steps::Count(1));
  assert(report.Ok());
  assert(report.completed.size() == 1);
  assert(report.completed[0].version == 2);
  assert((*f.journal == Journal{"up:2"}));
  assert(f.Recorded(2));
  assert(!f.Recorded(5));
  assert(runner.State() == RunState::kIdle);
}

void TestDownAllRevertsInDescendingOrder() {
  Fixture f({5, 9, 2});
  Runner  runner(f.registry, f.ledger);

  assert(runner.Up(Steps::All()).Ok());
  f.journal->clear();

  auto report = runner.Down(Steps::All());
  assert(report.Ok());
  assert((*f.journal == Journal{"down:9", "down:5", "down:2"}));
  assert(report.completed.size() == 3);
  assert(report.completed[0].version == 9);
  assert(f.RecordCount() == 0);
}

void TestUpIsIdempotentOnceEverythingIsApplied() {
  Fixture f({1, 2});
  Runner  runner(f.registry, f.ledger);

  assert(runner.Up(Steps::All()).Ok());
  auto again = runner.Up(Steps::All());
  assert(again.Ok());
  assert(again.completed.empty());
  assert(f.journal->size() == 2);
}

void TestStepTimingIsRecorded() {
  Fixture f({7});
  Runner  runner(f.registry, f.ledger);

  auto report = runner.Up(Steps::All());
  assert(report.Ok());

  std::optional<MigrationExecution> stored;
  assert(f.ledger->FindOne(7, stored));
  assert(stored.has_value());
  assert(stored->executed_at_ms > 0);
  assert(stored->executed_at_ms <= stored->finished_at_ms);
  assert(*stored == report.completed[0]);
}

void TestFailedStepHaltsRun() {
  Fixture f({1, 2, 3});
  f.Get(2)->fail_up = true;
  Runner runner(f.registry, f.ledger);

  auto report = runner.Up(Steps::All());
  assert(!report.Ok());
  assert(report.outcome == RunOutcome::kHalted);
  assert(report.failed_version == 2u);
  assert(report.cause.code == ErrorCode::IOError);
  assert(report.completed.size() == 1);
  assert((*f.journal == Journal{"up:1", "up:2"}));
  assert(f.Recorded(1));
  assert(!f.Recorded(2));
  assert(!f.Recorded(3));
  assert(runner.State() == RunState::kHalted);
}

void TestFailedDownKeepsRecord() {
  Fixture f({1, 2});
  Runner  runner(f.registry, f.ledger);
  assert(runner.Up(Steps::All()).Ok());

  f.Get(2)->fail_down = true;
  auto report          = runner.Down(Steps::All());
  assert(!report.Ok());
  assert(report.failed_version == 2u);
  assert(report.completed.empty());
  assert(f.Recorded(1));
  assert(f.Recorded(2));
}

void TestThrowingMigrationIsReportedAsInternalError() {
  Fixture f({1, 2});
  f.Get(1)->throw_up = true;
  Runner runner(f.registry, f.ledger);

  auto report = runner.Up(Steps::All());
  assert(!report.Ok());
  assert(report.failed_version == 1u);
  assert(report.cause.code == ErrorCode::InternalError);
  assert(report.cause.message.find("exploded") != std::string::npos);
  assert(f.RecordCount() == 0);
}

void TestSaveFailureHaltsAtThatStep() {
  Fixture f({1, 2, 3});
  f.ledger->fail_save_version = 2;
  Runner runner(f.registry, f.ledger);

  auto report = runner.Up(Steps::All());
  assert(!report.Ok());
  assert(report.failed_version == 2u);
  assert(report.cause.code == ErrorCode::IOError);
  assert(report.cause.message == "migration applied but the execution ledger could not be updated: write refused");
  assert((*f.journal == Journal{"up:1", "up:2"}));
  assert(f.Recorded(1));
  assert(!f.Recorded(2));
  assert(!f.Recorded(3));
}

void TestLoadFailureThrowsBeforeAnyStep() {
  Fixture f({1});
  f.ledger->fail_load = true;
  Runner runner(f.registry, f.ledger);

  bool threw = false;
  try {
    runner.Up(Steps::All());
  } catch (const strata::util::StorageError& e) {
    threw = true;
    assert(e.result().code == ErrorCode::IOError);
  }
  assert(threw);
  assert(f.journal->empty());
  assert(runner.State() == RunState::kIdle);

  threw = false;
  try {
    runner.Stats();
  } catch (const strata::util::StorageError&) {
    threw = true;
  }
  assert(threw);
}

void TestOrphanedExecutionsBlockOrderedRuns() {
  Fixture f({1, 2});
  assert(f.ledger->Save({.version = 99, .executed_at_ms = 1, .finished_at_ms = 2}));
  Runner runner(f.registry, f.ledger);

  bool threw = false;
  try {
    runner.Up(Steps::All());
  } catch (const strata::util::InconsistentLedger& e) {
    threw = true;
    assert((e.orphaned() == std::vector<uint64_t>{99}));
  }
  assert(threw);

  threw = false;
  try {
    runner.Down(Steps::Count(1));
  } catch (const strata::util::InconsistentLedger&) {
    threw = true;
  }
  assert(threw);
  assert(f.journal->empty());

  auto stats = runner.Stats();
  assert(!stats.consistent);
  assert((stats.orphaned == std::vector<uint64_t>{99}));
  assert(stats.executed == 1);

  // forced runs skip the consistency check
  assert(runner.ForceUp(1).Ok());
  assert((*f.journal == Journal{"up:1"}));
}

void TestForceDownWithoutRecordStillRunsDown() {
  Fixture f({42});
  Runner  runner(f.registry, f.ledger);

  auto report = runner.ForceDown(42);
  assert(report.Ok());
  assert((*f.journal == Journal{"down:42"}));
  assert(f.ledger->remove_calls[42] == 1);
  assert(!f.Recorded(42));
}

void TestRemoveFailureHaltsDown() {
  Fixture f({1, 2, 3});
  Runner  runner(f.registry, f.ledger);
  assert(runner.Up(Steps::All()).Ok());

  f.ledger->fail_remove_version = 3;
  auto report = runner.Down(Steps::All());
  assert(!report.Ok());
  assert(report.outcome == RunOutcome::kHalted);
  assert(report.failed_version == 3u);
  assert(report.completed.empty());
  assert(report.cause.code == ErrorCode::IOError);
  assert(report.cause.message == "migration reverted but the execution ledger could not be updated: delete refused");
  assert(runner.State() == RunState::kHalted);

  // down:3 ran, but nothing after it was attempted and every record is still there
  assert((*f.journal == Journal{"up:1", "up:2", "up:3", "down:3"}));
  assert(f.ledger->remove_calls[3] == 1);
  assert(f.ledger->remove_calls.count(2) == 0);
  assert(f.RecordCount() == 3);
}

void TestForceUpReappliesAppliedMigration() {
  Fixture f({3});
  Runner  runner(f.registry, f.ledger);

  assert(runner.Up(Steps::All()).Ok());
  auto report = runner.ForceUp(3);
  assert(report.Ok());
  assert((*f.journal == Journal{"up:3", "up:3"}));
  assert(f.RecordCount() == 1);
}

void TestForceOnUnknownVersionThrows() {
  Fixture f({1});
  Runner  runner(f.registry, f.ledger);

  bool threw = false;
  try {
    runner.ForceUp(77);
  } catch (const strata::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    runner.ForceDown(77);
  } catch (const strata::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(f.journal->empty());
}

void TestStatsIsReadOnly() {
  Fixture f({1, 2, 3});
  Runner  runner(f.registry, f.ledger);
  assert(runner.Up(Steps::Count(2)).Ok());
  f.journal->clear();

  auto first  = runner.Stats();
  auto second = runner.Stats();
  assert(first.registered == 3);
  assert(first.executed == 2);
  assert(first.pending_up == 1);
  assert(first.pending_down == 2);
  assert(first.consistent);
  assert(first.orphaned.empty());
  assert(second.executed == first.executed);
  assert(second.pending_up == first.pending_up);
  assert(f.journal->empty());
  assert(f.RecordCount() == 2);
}

void TestCancellationStopsBeforeNextStep() {
  Fixture f({1, 2, 3});
  auto    cancelled = std::make_shared<std::atomic<bool>>(false);
  f.Get(1)->on_up = [cancelled] { cancelled->store(true); };
  Runner runner(f.registry, f.ledger);

  auto report = runner.Up(Steps::All(), Context(cancelled));
  assert(!report.Ok());
  assert(report.cause.code == ErrorCode::Cancelled);
  assert(report.failed_version == 2u);
  assert(report.completed.size() == 1);
  assert((*f.journal == Journal{"up:1"}));
  assert(f.Recorded(1));
  assert(!f.Recorded(2));
}

void TestExclusiveRunnerHonorsRunLock() {
  Fixture f({1});

  RunnerOptions options;
  options.exclusive      = true;
  options.lock_directory = std::filesystem::temp_directory_path();
  options.lock_name      = "strata-runner-test-" + std::to_string(::getpid());
  Runner runner(f.registry, f.ledger, options);

  {
    strata::runtime::ScopedRunLock held(options.lock_directory, options.lock_name);

    bool threw = false;
    try {
      runner.Up(Steps::All());
    } catch (const strata::util::LockConflict&) {
      threw = true;
    }
    assert(threw);
    assert(f.journal->empty());
  }

  assert(runner.Up(Steps::All()).Ok());
  assert(f.Recorded(1));

  std::filesystem::remove(options.lock_directory / (options.lock_name + ".lock"));
}

} // namespace

int main() {
  TestUpAppliesLowestPendingFirst();
  TestDownAllRevertsInDescendingOrder();
  TestUpIsIdempotentOnceEverythingIsApplied();
  TestStepTimingIsRecorded();
  TestFailedStepHaltsRun();
  TestFailedDownKeepsRecord();
  TestThrowingMigrationIsReportedAsInternalError();
  TestSaveFailureHaltsAtThatStep();
  TestLoadFailureThrowsBeforeAnyStep();
  TestOrphanedExecutionsBlockOrderedRuns();
  TestForceDownWithoutRecordStillRunsDown();
  TestRemoveFailureHaltsDown();
  TestForceUpReappliesAppliedMigration();
  TestForceOnUnknownVersionThrows();
  TestStatsIsReadOnly();
  TestCancellationStopsBeforeNextStep();
  TestExclusiveRunnerHonorsRunLock();

  std::cout << "runner_test: pass" << std::endl;
  return 0;
}
