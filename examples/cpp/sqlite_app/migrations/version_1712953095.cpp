#include <memory>
#include <utility>

#include "examples/cpp/sqlite_app/migrations/migrations.hpp"
#include "examples/cpp/sqlite_app/sql_migration.hpp"

namespace migrations {

std::shared_ptr<strata::migration::Migration> MakeMigration1712953095(std::shared_ptr<strata::db::sqlite::SqliteDB> db) {
  return std::make_shared<SqlMigration>(std::move(db), 1712953095,
                                        "CREATE UNIQUE INDEX users_email_idx ON users(email);",
                                        "DROP INDEX users_email_idx;");
}

} // namespace migrations
