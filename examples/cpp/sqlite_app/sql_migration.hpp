#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/migration/migration.hpp"

namespace migrations {

/*
  Migration made of two SQL scripts, each run inside its own transaction on
  the shared database.
*/
class SqlMigration : public strata::migration::Migration {
 public:
  SqlMigration(std::shared_ptr<strata::db::sqlite::SqliteDB> db, std::uint64_t version, std::string up_sql,
               std::string down_sql)
      : db_(std::move(db)), version_(version), up_sql_(std::move(up_sql)), down_sql_(std::move(down_sql)) {
  }

  std::uint64_t Version() const override {
    return version_;
  }

  strata::util::Result Up(const strata::migration::Context&) override {
    return Run(up_sql_);
  }

  strata::util::Result Down(const strata::migration::Context&) override {
    return Run(down_sql_);
  }

 private:
  strata::util::Result Run(const std::string& sql) {
    try {
      db_->ExecInTransaction(sql);
      return strata::util::Result::Ok();
    } catch (const strata::db::sqlite::SqliteError& e) {
      auto code = e.Busy() ? strata::util::ErrorCode::Busy : strata::util::ErrorCode::IOError;
      return strata::util::Result::Err(code, e.what());
    }
  }

  std::shared_ptr<strata::db::sqlite::SqliteDB> db_;
  std::uint64_t                                 version_;
  std::string                                   up_sql_;
  std::string                                   down_sql_;
};

} // namespace migrations
