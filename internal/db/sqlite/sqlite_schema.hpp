#pragma once

#include <cstdint>

#include "internal/db/sql/migrations.hpp"
#include "sqlite_db.hpp"

namespace activity::db::sqlite {

/*
  MigrationExecutor over a SqliteDB. Version bookkeeping lives in the
  schema_migrations table.
*/
class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db);

  void     ExecuteSQL(const std::string& sql) override;
  uint32_t AppliedVersion() override;
  void     RecordVersion(uint32_t version) override;

 private:
  SqliteDB& db_;
};

// Brings the database up to the latest history schema. Returns the
// number of migrations applied.
uint32_t BootstrapSchema(SqliteDB& db);

} // namespace activity::db::sqlite
