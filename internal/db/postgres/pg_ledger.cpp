#include "pg_ledger.hpp"

#include <cstdint>
#include <limits>

#include "internal/db/sql/sql_queries.hpp"

namespace strata::db::postgres {

using sql::Dialect;

namespace {

constexpr auto kMaxStored = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

bool Representable(const model::MigrationExecution& e) {
  return e.version <= kMaxStored && e.executed_at_ms <= kMaxStored && e.finished_at_ms <= kMaxStored;
}

std::optional<uint64_t> FieldU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  auto v = f.as<int64_t>();
  if (v < 0) return std::nullopt;
  return static_cast<uint64_t>(v);
}

// Throws pqxx::conversion_error for non-integer text.
std::optional<model::MigrationExecution> ReadRow(const pqxx::row& row) {
  auto version  = FieldU64(row[0]);
  auto executed = FieldU64(row[1]);
  auto finished = FieldU64(row[2]);
  if (!version || !executed || !finished) return std::nullopt;

  model::MigrationExecution e;
  e.version        = *version;
  e.executed_at_ms = *executed;
  e.finished_at_ms = *finished;
  return e;
}

} // namespace

PgLedger::PgLedger(const std::string& conninfo, std::string table_name) : conn_(conninfo), table_(std::move(table_name)) {
  sql::RequireValidTableName(table_);
}

Result PgLedger::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::conversion_error*>(&e)) {
    return Result::Err(ErrorCode::Corruption, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgLedger::Init() {
  std::scoped_lock lock(mutex_);
  try {
    pqxx::work tx(conn_);
    tx.exec(sql::CreateExecutionsTable(table_, Dialect::kPostgres));
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgLedger::LoadExecutions(std::vector<model::MigrationExecution>& out) {
  std::scoped_lock lock(mutex_);

  pqxx::result res;
  try {
    pqxx::work tx(conn_);
    res = tx.exec(sql::SelectExecutions(table_));
    tx.commit();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  out.reserve(out.size() + res.size());
  std::size_t index = 0;
  for (const auto& row : res) {
    std::optional<model::MigrationExecution> execution;
    try {
      execution = ReadRow(row);
    } catch (const std::exception& e) {
      return Result::Err(ErrorCode::Corruption,
                         "malformed execution row " + std::to_string(index) + " in table " + table_ + ": " + e.what());
    }
    if (!execution) {
      return Result::Err(ErrorCode::Corruption, "malformed execution row " + std::to_string(index) + " in table " + table_);
    }
    out.push_back(*execution);
    ++index;
  }
  return Result::Ok();
}

Result PgLedger::Save(const model::MigrationExecution& e) {
  if (!Representable(e)) {
    return Result::Err(ErrorCode::Unsupported, "execution values exceed the BIGINT range");
  }

  std::scoped_lock lock(mutex_);
  try {
    pqxx::work tx(conn_);
    tx.exec_params(sql::UpsertExecution(table_, Dialect::kPostgres), static_cast<int64_t>(e.version),
                   static_cast<int64_t>(e.executed_at_ms), static_cast<int64_t>(e.finished_at_ms));
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& ex) {
    return Translate(ex);
  }
}

Result PgLedger::Remove(const model::MigrationExecution& e) {
  // nothing stored under a version BIGINT can't represent
  if (e.version > kMaxStored) return Result::Ok();

  std::scoped_lock lock(mutex_);
  try {
    pqxx::work tx(conn_);
    tx.exec_params(sql::DeleteExecution(table_, Dialect::kPostgres), static_cast<int64_t>(e.version));
    tx.commit();
    return Result::Ok();
  } catch (const std::exception& ex) {
    return Translate(ex);
  }
}

Result PgLedger::FindOne(uint64_t version, std::optional<model::MigrationExecution>& out) {
  out.reset();

  if (version > kMaxStored) return Result::Ok();

  std::scoped_lock lock(mutex_);
  try {
    pqxx::work tx(conn_);
    auto       res = tx.exec_params(sql::SelectExecution(table_, Dialect::kPostgres), static_cast<int64_t>(version));
    tx.commit();

    if (res.empty()) return Result::Ok();

    auto execution = ReadRow(res[0]);
    if (!execution) {
      return Result::Err(ErrorCode::Corruption, "malformed execution row for version " + std::to_string(version) + " in table " + table_);
    }
    out = *execution;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace strata::db::postgres
