#pragma once

#include <memory>
#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/migration/migration.hpp"

namespace migrations {

std::shared_ptr<strata::migration::Migration> MakeMigration1712953077(std::shared_ptr<strata::db::sqlite::SqliteDB> db);
std::shared_ptr<strata::migration::Migration> MakeMigration1712953080(std::shared_ptr<strata::db::sqlite::SqliteDB> db);
std::shared_ptr<strata::migration::Migration> MakeMigration1712953095(std::shared_ptr<strata::db::sqlite::SqliteDB> db);

// Every migration of this application. Add new ones here after `blank`.
inline std::vector<std::shared_ptr<strata::migration::Migration>> All(
    const std::shared_ptr<strata::db::sqlite::SqliteDB>& db) {
  return {
      MakeMigration1712953077(db),
      MakeMigration1712953080(db),
      MakeMigration1712953095(db),
  };
}

} // namespace migrations
