#include "internal/db/sqlite/sqlite_ledger.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "internal/core/runner.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/migration/registry.hpp"

namespace {

using strata::db::model::MigrationExecution;
using strata::db::sqlite::SqliteDB;
using strata::db::sqlite::SqliteLedger;
using strata::util::ErrorCode;
using strata::util::Result;

std::filesystem::path DbPath(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "strata_sqlite_ledger_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (test_name + "-" + std::to_string(::getpid()) + ".db");
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
  return path;
}

void TestRecordsSurviveReopen() {
  const auto path = DbPath("reopen");
  {
    auto         db = std::make_shared<SqliteDB>(path.string());
    SqliteLedger ledger(db, "migration_executions");
    assert(ledger.Init());
    assert(ledger.Save({.version = 1712953077, .executed_at_ms = 100, .finished_at_ms = 150}));
  }

  auto         db = std::make_shared<SqliteDB>(path.string());
  SqliteLedger ledger(db, "migration_executions");
  assert(ledger.Init());

  std::optional<MigrationExecution> found;
  assert(ledger.FindOne(1712953077, found));
  assert(found.has_value());
  assert(found->executed_at_ms == 100);
  assert(found->finished_at_ms == 150);
}

void TestInvalidTableNameIsRejected() {
  auto db = std::make_shared<SqliteDB>(DbPath("bad_table").string());
  for (const std::string name : {"", "1table", "bad-name", "x; DROP TABLE y", "\"quoted\""}) {
    bool threw = false;
    try {
      SqliteLedger ledger(db, name);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  SqliteLedger ok(db, "_Custom_table_2");
  assert(ok.TableName() == "_Custom_table_2");
}

void TestTablesAreIsolated() {
  auto         db = std::make_shared<SqliteDB>(DbPath("isolated").string());
  SqliteLedger a(db, "ledger_a");
  SqliteLedger b(db, "ledger_b");
  assert(a.Init());
  assert(b.Init());

  assert(a.Save({.version = 1, .executed_at_ms = 1, .finished_at_ms = 2}));

  std::vector<MigrationExecution> rows;
  assert(b.LoadExecutions(rows));
  assert(rows.empty());
}

void TestMalformedRowReturnsPartialResult() {
  auto         db = std::make_shared<SqliteDB>(DbPath("malformed").string());
  SqliteLedger ledger(db, "migration_executions");
  assert(ledger.Init());

  db->Exec("INSERT INTO migration_executions(version,executed_at_ms,finished_at_ms) VALUES(1,10,20);");
  db->Exec("INSERT INTO migration_executions(version,executed_at_ms,finished_at_ms) VALUES(2,'yesterday',20);");
  db->Exec("INSERT INTO migration_executions(version,executed_at_ms,finished_at_ms) VALUES(3,10,-5);");

  std::vector<MigrationExecution> rows;
  auto                            result = ledger.LoadExecutions(rows);
  assert(!result);
  assert(result.code == ErrorCode::Corruption);
  assert(rows.size() == 1);
  assert(rows[0].version == 1);

  std::optional<MigrationExecution> found;
  result = ledger.FindOne(3, found);
  assert(result.code == ErrorCode::Corruption);
  assert(!found.has_value());
}

void TestValuesBeyondSqliteRange() {
  auto         db = std::make_shared<SqliteDB>(DbPath("range").string());
  SqliteLedger ledger(db, "migration_executions");
  assert(ledger.Init());

  const uint64_t huge = 18446744073709551615u;

  auto saved = ledger.Save({.version = huge, .executed_at_ms = 1, .finished_at_ms = 2});
  assert(saved.code == ErrorCode::Unsupported);

  std::optional<MigrationExecution> found;
  assert(ledger.FindOne(huge, found));
  assert(!found.has_value());
  assert(ledger.Remove({.version = huge}));
}

void TestMissingTableIsReported() {
  auto         db = std::make_shared<SqliteDB>(DbPath("no_init").string());
  SqliteLedger ledger(db, "never_created");

  std::vector<MigrationExecution> rows;
  auto                            result = ledger.LoadExecutions(rows);
  assert(!result);
  assert(!result.message.empty());
}

// Migrations and the ledger share one connection.
class CreateTableMigration final : public strata::migration::Migration {
 public:
  explicit CreateTableMigration(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  }

  uint64_t Version() const override {
    return 1;
  }

  Result Up(const strata::migration::Context&) override {
    db_->Exec("CREATE TABLE widgets (id INTEGER PRIMARY KEY);");
    return Result::Ok();
  }

  Result Down(const strata::migration::Context&) override {
    db_->Exec("DROP TABLE widgets;");
    return Result::Ok();
  }

 private:
  std::shared_ptr<SqliteDB> db_;
};

void TestRunnerOverSharedConnection() {
  auto db       = std::make_shared<SqliteDB>(DbPath("runner").string());
  auto ledger   = std::make_shared<SqliteLedger>(db, "migration_executions");
  auto registry = std::make_shared<strata::migration::Registry>();
  registry->Register(std::make_shared<CreateTableMigration>(db));
  assert(ledger->Init());

  strata::core::Runner runner(registry, ledger);
  assert(runner.Up(strata::core::Steps::All()).Ok());
  db->Exec("SELECT id FROM widgets LIMIT 1;");

  auto stats = runner.Stats();
  assert(stats.executed == 1);
  assert(stats.pending_up == 0);

  assert(runner.Down(strata::core::Steps::Count(1)).Ok());
  assert(runner.Stats().executed == 0);
}

void TestFailedTransactionRollsBack() {
  auto db = std::make_shared<SqliteDB>(DbPath("rollback").string());
  db->Exec("CREATE TABLE accounts (id INTEGER PRIMARY KEY);");

  bool threw = false;
  try {
    db->ExecInTransaction("INSERT INTO accounts(id) VALUES(1); INSERT INTO missing(id) VALUES(2);");
  } catch (const strata::db::sqlite::SqliteError& e) {
    threw = true;
    assert(!e.Busy());
  }
  assert(threw);

  // the first insert went away with the transaction
  strata::db::sqlite::Statement st;
  assert(db->Prepare("SELECT COUNT(*) FROM accounts;", st) == SQLITE_OK);
  assert(sqlite3_step(st.get()) == SQLITE_ROW);
  assert(sqlite3_column_int64(st.get(), 0) == 0);

  // connection is usable again
  db->ExecInTransaction("INSERT INTO accounts(id) VALUES(3);");
}

} // namespace

int main() {
  TestRecordsSurviveReopen();
  TestInvalidTableNameIsRejected();
  TestTablesAreIsolated();
  TestMalformedRowReturnsPartialResult();
  TestValuesBeyondSqliteRange();
  TestMissingTableIsReported();
  TestRunnerOverSharedConnection();
  TestFailedTransactionRollsBack();

  std::filesystem::remove_all(std::filesystem::temp_directory_path() / "strata_sqlite_ledger_tests");

  std::cout << "sqlite_ledger_test: pass" << std::endl;
  return 0;
}
