#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace activity::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and the version bookkeeping.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest applied migration, 0 when none.
  virtual uint32_t AppliedVersion() = 0;

  virtual void RecordVersion(uint32_t version) = 0;
};

/*
  Runs migrations in order. Migration i (1-based) is applied only if
  the executor reports a lower applied version.

  Returns the number of migrations applied.
*/

uint32_t RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Schema of the history store, SQLite-compatible.
const std::vector<std::string>& HistorySchemaMigrations();

} // namespace activity::db::sql
