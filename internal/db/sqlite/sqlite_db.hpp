#pragma once

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace strata::db::sqlite {

// sqlite failure carrying the extended result code.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& message) : std::runtime_error(message), code_(code) {
  }

  int Code() const {
    return code_;
  }

  // SQLITE_BUSY or SQLITE_LOCKED
  bool Busy() const {
    return (code_ & 0xff) == SQLITE_BUSY || (code_ & 0xff) == SQLITE_LOCKED;
  }

 private:
  int code_;
};

struct StatementFinalizer {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

/*
  Owns one sqlite3 connection.

  Shared between the execution ledger and the migrations that work on the
  same database file, so a migration and its ledger row go through the
  same connection.
*/
class SqliteDB {
 public:
  // Opens (creating if needed) and configures the database. Throws SqliteError.
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements. Throws SqliteError.
  void Exec(const std::string& sql);

  // Runs sql between BEGIN IMMEDIATE and COMMIT, rolling back if it throws.
  void ExecInTransaction(const std::string& sql);

  // Returns the sqlite result code; stmt is only set on SQLITE_OK.
  int Prepare(const std::string& sql, Statement& stmt);

  // Message for the most recent failure on this connection.
  std::string LastError() const;

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace strata::db::sqlite
