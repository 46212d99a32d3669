#include <memory>
#include <utility>

#include "examples/cpp/sqlite_app/migrations/migrations.hpp"
#include "examples/cpp/sqlite_app/sql_migration.hpp"

namespace migrations {

std::shared_ptr<strata::migration::Migration> MakeMigration1712953077(std::shared_ptr<strata::db::sqlite::SqliteDB> db) {
  return std::make_shared<SqlMigration>(std::move(db), 1712953077,
                                        "CREATE TABLE users ("
                                        "  id INTEGER PRIMARY KEY,"
                                        "  name TEXT NOT NULL,"
                                        "  created_at_ms INTEGER NOT NULL"
                                        ");",
                                        "DROP TABLE users;");
}

} // namespace migrations
