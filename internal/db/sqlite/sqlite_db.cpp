#include "sqlite_db.hpp"

#include <utility>

namespace strata::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = "cannot open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, message);
  }
  sqlite3_extended_result_codes(db_, 1);

  try {
    Configure(wal_mode);
  } catch (const SqliteError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw SqliteError(rc, message);
}

void SqliteDB::ExecInTransaction(const std::string& sql) {
  Exec("BEGIN IMMEDIATE;");
  try {
    Exec(sql);
    Exec("COMMIT;");
  } catch (const SqliteError& e) {
    // some errors roll the transaction back on their own
    if (sqlite3_get_autocommit(db_)) {
      throw;
    }
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
      std::string message = std::string(e.what()) + " (rollback failed: " + (err ? err : "unknown error") + ")";
      sqlite3_free(err);
      throw SqliteError(e.Code(), message);
    }
    throw;
  }
}

int SqliteDB::Prepare(const std::string& sql, Statement& stmt) {
  sqlite3_stmt* raw = nullptr;
  const int     rc  = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
  stmt.reset(rc == SQLITE_OK ? raw : nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(raw);
  }
  return rc;
}

std::string SqliteDB::LastError() const {
  return sqlite3_errmsg(db_);
}

void SqliteDB::Configure(bool wal_mode) {
  // lets the application keep reading while a migration writes
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // a ledger row must be durable before the next step starts
  Exec("PRAGMA synchronous=FULL;");
  Exec("PRAGMA foreign_keys=ON;");

  const int rc = sqlite3_busy_timeout(db_, kBusyTimeoutMs);
  if (rc != SQLITE_OK) {
    throw SqliteError(rc, "busy_timeout: " + LastError());
  }
}

} // namespace strata::db::sqlite
