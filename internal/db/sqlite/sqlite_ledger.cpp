#include "sqlite_ledger.hpp"

#include <limits>

#include "internal/db/sql/sql_queries.hpp"

namespace strata::db::sqlite {

using sql::Dialect;

namespace {

constexpr auto kMaxStored = static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max());

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// Integer column holding a non-negative value, or nullopt for anything else.
std::optional<uint64_t> ColU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) != SQLITE_INTEGER) return std::nullopt;
  auto v = sqlite3_column_int64(st, col);
  if (v < 0) return std::nullopt;
  return static_cast<uint64_t>(v);
}

std::optional<model::MigrationExecution> ReadRow(sqlite3_stmt* st) {
  auto version  = ColU64(st, 0);
  auto executed = ColU64(st, 1);
  auto finished = ColU64(st, 2);
  if (!version || !executed || !finished) return std::nullopt;

  return model::MigrationExecution{.version = *version, .executed_at_ms = *executed, .finished_at_ms = *finished};
}

bool Representable(const model::MigrationExecution& e) {
  return e.version <= kMaxStored && e.executed_at_ms <= kMaxStored && e.finished_at_ms <= kMaxStored;
}

} // namespace

SqliteLedger::SqliteLedger(std::shared_ptr<SqliteDB> db, std::string table_name)
    : db_(std::move(db)), table_(std::move(table_name)) {
  sql::RequireValidTableName(table_);
}

Result SqliteLedger::Translate(int rc, const std::string& message) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, message);
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, message);
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, message);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, message);
    default:
      return Result::Err(ErrorCode::InternalError, message);
  }
}

Result SqliteLedger::Fail(int rc) const {
  return Translate(rc, db_->LastError());
}

Result SqliteLedger::Init() {
  try {
    db_->Exec(sql::CreateExecutionsTable(table_, Dialect::kSqlite));
  } catch (const SqliteError& e) {
    return Translate(e.Code(), e.what());
  }
  return Result::Ok();
}

Result SqliteLedger::LoadExecutions(std::vector<model::MigrationExecution>& out) {
  Statement st;
  int       rc = db_->Prepare(sql::SelectExecutions(table_), st);
  if (rc != SQLITE_OK) return Fail(rc);

  std::size_t row = 0;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto execution = ReadRow(st.get());
    if (!execution) {
      return Result::Err(ErrorCode::Corruption, "malformed execution row " + std::to_string(row) + " in table " + table_);
    }
    out.push_back(*execution);
    ++row;
  }
  return Fail(rc);
}

Result SqliteLedger::Save(const model::MigrationExecution& e) {
  if (!Representable(e)) {
    return Result::Err(ErrorCode::Unsupported, "execution values exceed the sqlite integer range");
  }

  Statement st;
  int       rc = db_->Prepare(sql::UpsertExecution(table_, Dialect::kSqlite), st);
  if (rc != SQLITE_OK) return Fail(rc);

  BindU64(st.get(), 1, e.version);
  BindU64(st.get(), 2, e.executed_at_ms);
  BindU64(st.get(), 3, e.finished_at_ms);
  return Fail(sqlite3_step(st.get()));
}

Result SqliteLedger::Remove(const model::MigrationExecution& e) {
  // nothing can be stored under a version sqlite can't represent
  if (e.version > kMaxStored) return Result::Ok();

  Statement st;
  int       rc = db_->Prepare(sql::DeleteExecution(table_, Dialect::kSqlite), st);
  if (rc != SQLITE_OK) return Fail(rc);

  BindU64(st.get(), 1, e.version);
  return Fail(sqlite3_step(st.get()));
}

Result SqliteLedger::FindOne(uint64_t version, std::optional<model::MigrationExecution>& out) {
  out.reset();
  if (version > kMaxStored) return Result::Ok();

  Statement st;
  int       rc = db_->Prepare(sql::SelectExecution(table_, Dialect::kSqlite), st);
  if (rc != SQLITE_OK) return Fail(rc);

  BindU64(st.get(), 1, version);

  rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return Result::Ok();
  if (rc != SQLITE_ROW) return Fail(rc);

  auto execution = ReadRow(st.get());
  if (!execution) {
    return Result::Err(ErrorCode::Corruption,
                       "malformed execution row for version " + std::to_string(version) + " in table " + table_);
  }
  out = *execution;
  return Result::Ok();
}

} // namespace strata::db::sqlite
