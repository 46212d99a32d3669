#include <memory>
#include <utility>

#include "examples/cpp/sqlite_app/migrations/migrations.hpp"
#include "examples/cpp/sqlite_app/sql_migration.hpp"

namespace migrations {

// DROP COLUMN needs SQLite >= 3.35
std::shared_ptr<strata::migration::Migration> MakeMigration1712953080(std::shared_ptr<strata::db::sqlite::SqliteDB> db) {
  return std::make_shared<SqlMigration>(std::move(db), 1712953080, "ALTER TABLE users ADD COLUMN email TEXT;",
                                        "ALTER TABLE users DROP COLUMN email;");
}

} // namespace migrations
